/**
 * @file channel.hpp
 * @brief FIFO channels between threads
 * @details
 *
 * A channel is a mutex-guarded deque shared by any number of `sender_t` and
 * exactly one `receiver_t`.
 *
 * - A channel with a `limit` rejects items while `limit` items are pending.
 *   `unbounded` disables the limit.
 * - When every sender is gone, the receiver still drains the pending items and
 *   then sees the channel as closed.
 * - When the receiver is gone, pending items are dropped and every `send`
 *   returns `send_result_t::closed`.
 *
 * ```cpp
 * auto [tx, rx] = vmpilot::make_channel<int>(vmpilot::mailbox_limit);
 * tx.send(1);
 * auto v = rx.recv(std::chrono::seconds(1));
 * ```
 */
#pragma once

#include <deque>
#include <memory>
#include <optional>
#include <utility>

#include "thread.hpp"

namespace vmpilot {

/**
 * @brief Default maximum number of pending items of a bounded channel
 */
constexpr size_t mailbox_limit = 128;

constexpr size_t unbounded = 0;

enum class send_result_t { ok, full, closed };

template <typename T> struct channel_state_t {
  channel_state_t(size_t limit) : limit(limit) {}

  const size_t limit;

  mutex_t m;

  condition_variable_t cv;

  std::deque<T> q;

  size_t senders = 1;

  bool receiver_alive = true;
};

template <typename T> class sender_t {
public:
  sender_t() = default;

  explicit sender_t(std::shared_ptr<channel_state_t<T>> state)
      : state_(std::move(state)) {}

  sender_t(const sender_t &other) : state_(other.state_) { acquire(); }

  sender_t(sender_t &&other) noexcept : state_(std::move(other.state_)) {}

  sender_t &operator=(const sender_t &other) {
    if (this != &other) {
      release();
      state_ = other.state_;
      acquire();
    }
    return *this;
  }

  sender_t &operator=(sender_t &&other) noexcept {
    if (this != &other) {
      release();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  ~sender_t() { release(); }

  /**
   * @brief Enqueues an item without blocking
   */
  send_result_t send(T item) {
    if (!state_)
      return send_result_t::closed;
    {
      wlock_t lk(state_->m);
      if (!state_->receiver_alive)
        return send_result_t::closed;
      if (state_->limit != unbounded && state_->q.size() >= state_->limit)
        return send_result_t::full;
      state_->q.push_back(std::move(item));
    }
    state_->cv.notify_all();
    return send_result_t::ok;
  }

  /**
   * @brief Gives up this sender; the channel closes with its last sender
   */
  void release() noexcept {
    if (!state_)
      return;
    {
      wlock_t lk(state_->m);
      state_->senders--;
    }
    state_->cv.notify_all();
    state_.reset();
  }

  bool is_closed() const {
    if (!state_)
      return true;
    rlock_t lk(state_->m);
    return !state_->receiver_alive;
  }

  explicit operator bool() const { return state_ != nullptr; }

private:
  void acquire() {
    if (!state_)
      return;
    wlock_t lk(state_->m);
    state_->senders++;
  }

  std::shared_ptr<channel_state_t<T>> state_;
};

template <typename T> class receiver_t {
public:
  receiver_t() = default;

  explicit receiver_t(std::shared_ptr<channel_state_t<T>> state)
      : state_(std::move(state)) {}

  receiver_t(const receiver_t &) = delete;

  receiver_t(receiver_t &&other) noexcept : state_(std::move(other.state_)) {}

  receiver_t &operator=(const receiver_t &) = delete;

  receiver_t &operator=(receiver_t &&other) noexcept {
    if (this != &other) {
      release();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  ~receiver_t() { release(); }

  /**
   * @brief Blocks until an item arrives
   * @return `std::nullopt` once every sender is gone and the queue is drained
   */
  std::optional<T> recv() {
    if (!state_)
      return std::nullopt;
    wlock_t lk(state_->m);
    state_->cv.wait(lk, [&] { return ready(); });
    return pop();
  }

  /**
   * @brief Blocks until an item arrives or `timeout` elapses
   */
  std::optional<T> recv(const duration_t &timeout) {
    if (!state_)
      return std::nullopt;
    wlock_t lk(state_->m);
    if (!state_->cv.wait_until(lk, now() + timeout, [&] { return ready(); }))
      return std::nullopt;
    return pop();
  }

  std::optional<T> try_recv() {
    if (!state_)
      return std::nullopt;
    wlock_t lk(state_->m);
    return pop();
  }

  /**
   * @brief True when nothing is pending and no sender is left
   */
  bool is_closed() const {
    if (!state_)
      return true;
    rlock_t lk(state_->m);
    return state_->q.empty() && state_->senders == 0;
  }

  size_t pending() const {
    if (!state_)
      return 0;
    rlock_t lk(state_->m);
    return state_->q.size();
  }

  void release() noexcept {
    if (!state_)
      return;
    std::deque<T> dropped;
    {
      wlock_t lk(state_->m);
      state_->receiver_alive = false;
      dropped.swap(state_->q);
    }
    state_.reset();
  }

  explicit operator bool() const { return state_ != nullptr; }

private:
  bool ready() const { return !state_->q.empty() || state_->senders == 0; }

  std::optional<T> pop() {
    if (state_->q.empty())
      return std::nullopt;
    T rv = std::move(state_->q.front());
    state_->q.pop_front();
    return rv;
  }

  std::shared_ptr<channel_state_t<T>> state_;
};

template <typename T>
std::pair<sender_t<T>, receiver_t<T>> make_channel(size_t limit = unbounded) {
  auto state = std::make_shared<channel_state_t<T>>(limit);
  return std::make_pair(sender_t<T>(state), receiver_t<T>(state));
}

} // namespace vmpilot
