/**
 * @file thread.hpp
 * @brief Basic building blocks for multithreading
 * @details
 *
 * ## `signal_t`, `monitor_t`, `notify_t`
 *
 * A class of type `notify_t` can generate signals, e.g. a guest agent coming
 * up or going away. When such a signal occurs, `notify_t` pushes it to the
 * attached `monitor_t`, which wakes up any thread waiting on it.
 *
 * ```cpp
 * {
 *   auto monitor = vmpilot::create<monitor_t>();
 *   auto notify = vmpilot::create<my_notifier_t>();
 *   notify->set_monitor(monitor);
 * }
 * ```
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <optional>
#include <shared_mutex>
#include <string>

#include "object.hpp"

namespace vmpilot {

using mutex_t = std::shared_mutex;

using condition_variable_t = std::condition_variable_any;

using wlock_t = std::unique_lock<mutex_t>;

using rlock_t = std::shared_lock<mutex_t>;

using time_point_t = std::chrono::steady_clock::time_point;

using duration_t = std::chrono::steady_clock::duration;

constexpr duration_t timeout_default = std::chrono::milliseconds(1000);

inline time_point_t now() { return std::chrono::steady_clock::now(); }

/**
 * @brief A simple signal structure representing an event occurrence
 * @details
 * `who` is the name of the emitting `notify_t`, `what` describes the event.
 */
struct signal_t {
  signal_t(const std::string &who, const std::string &what)
      : who(who), what(what) {}
  std::string who;
  std::string what;
};

class notify_t;

/**
 * @brief A monitor that listens for `signal_t` events from attached `notify_t`
 * @details
 * `monitor()` blocks until either a signal is received or the deadline
 * expires. It is thread-safe for multiple `notify_t` to emit signals
 * concurrently.
 */
class monitor_t : public object_t {
public:
  monitor_t()
      : m_(std::make_unique<mutex_t>()),
        cv_(std::make_unique<condition_variable_t>()), q_() {}

  monitor_t(const monitor_t &) = delete;

  monitor_t(monitor_t &&) = default;

  /**
   * @brief Waits for a signal until the specified deadline
   * @return A signal if one is received before the deadline, `std::nullopt`
   * otherwise
   */
  std::optional<signal_t> monitor(const time_point_t &due);

  std::optional<signal_t> monitor(const duration_t &due) {
    return monitor(now() + due);
  }

  /**
   * @brief Waits for a signal whose `what` equals `what`
   * @details Signals queued before the match are discarded with it.
   */
  std::optional<signal_t> monitor_for(const std::string &what,
                                      const time_point_t &due);

  size_t pending() const;

private:
  friend class notify_t;

  std::unique_ptr<mutex_t> m_;

  std::unique_ptr<condition_variable_t> cv_;

  std::deque<signal_t> q_;
};

/**
 * @brief Base class that emits `signal_t` to an attached `monitor_t`
 * @details
 * `myname` is used as `signal_t::who`. Unnamed instances get a unique
 * numeric name.
 */
class notify_t : public object_t {
public:
  notify_t() : myname(new_name()) {}

  explicit notify_t(const std::string &name)
      : myname(name.empty() ? new_name() : name) {}

  notify_t(std::shared_ptr<monitor_t> monitor)
      : myname(new_name()), monitor_(monitor) {}

  notify_t(const notify_t &) = delete;

  virtual ~notify_t() = default;

  /**
   * @brief Emits a `signal_t` to the associated monitor
   * @note Does nothing when no monitor is attached or it has expired
   */
  void notify(const std::string &what);

  /**
   * @note This will overwrite any previously set monitor
   */
  void set_monitor(std::shared_ptr<monitor_t> monitor);

  const std::string myname;

private:
  static std::string new_name();

  std::weak_ptr<monitor_t> monitor_;
};

} // namespace vmpilot
