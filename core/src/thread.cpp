#include "thread.hpp"

#include <algorithm>
#include <atomic>

namespace vmpilot {

std::optional<signal_t> monitor_t::monitor(const time_point_t &due) {
  wlock_t lk(*m_);
  if (!cv_->wait_until(lk, due, [&] { return !q_.empty(); }))
    return std::nullopt;
  auto rv = std::move(q_.front());
  q_.pop_front();
  return rv;
}

std::optional<signal_t> monitor_t::monitor_for(const std::string &what,
                                               const time_point_t &due) {
  wlock_t lk(*m_);
  auto match = [&] {
    return std::find_if(q_.begin(), q_.end(),
                        [&](const signal_t &s) { return s.what == what; });
  };
  if (!cv_->wait_until(lk, due, [&] { return match() != q_.end(); }))
    return std::nullopt;
  auto it = match();
  auto rv = std::move(*it);
  q_.erase(q_.begin(), std::next(it));
  return rv;
}

size_t monitor_t::pending() const {
  rlock_t lk(*m_);
  return q_.size();
}

std::string notify_t::new_name() {
  static std::atomic_size_t next_id = 0;
  return std::to_string(next_id++);
}

void notify_t::notify(const std::string &what) {
  std::shared_ptr<monitor_t> monitor = monitor_.lock();
  if (!monitor)
    return;
  {
    wlock_t lk(*monitor->m_);
    monitor->q_.emplace_back(myname, what);
  }
  monitor->cv_->notify_all();
}

void notify_t::set_monitor(std::shared_ptr<monitor_t> monitor) {
  monitor_ = monitor;
}

} // namespace vmpilot
