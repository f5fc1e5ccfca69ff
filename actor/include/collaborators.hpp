/**
 * @file collaborators.hpp
 * @brief Pluggable parts a VM actor delegates to
 * @details
 *
 * - `agent_signal_t` tells whether the guest agent of a VM is reachable.
 * - `test_evaluator_t` provides the text typed for a test case and judges the
 *   result.
 */
#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "guest_agent.hpp"
#include "key_compiler.hpp"
#include "thread.hpp"

namespace vmpilot {

class agent_signal_t {
public:
  virtual ~agent_signal_t() = default;

  /**
   * @brief Blocks until the agent is connected or `timeout` elapses
   * @return Whether the agent is connected
   */
  virtual bool wait_connected(const duration_t &timeout) = 0;

  virtual bool is_connected() const = 0;
};

/**
 * @brief Agent signal driven by whoever watches the agent channel
 * @details `set_connected()` and `set_disconnected()` may be called from any
 * thread. Waiters are woken through a `monitor_t`.
 */
class agent_presence_t : public agent_signal_t, public notify_t {
public:
  explicit agent_presence_t(const std::string &vm_name = "");

  void set_connected();

  void set_disconnected();

  bool wait_connected(const duration_t &timeout) override;

  bool is_connected() const override { return connected_; }

private:
  std::shared_ptr<monitor_t> monitor_;

  std::atomic_bool connected_ = false;
};

/**
 * @brief Agent signal that probes the guest agent with `guest-ping`
 */
class guest_ping_signal_t : public agent_signal_t {
public:
  guest_ping_signal_t(std::unique_ptr<qga::guest_agent_t> agent);

  bool wait_connected(const duration_t &timeout) override;

  bool is_connected() const override;

private:
  bool ping() const;

  std::unique_ptr<qga::guest_agent_t> agent_;
};

class test_evaluator_t {
public:
  virtual ~test_evaluator_t() = default;

  /**
   * @brief Text to type for the test case
   */
  virtual std::string script(const std::string &test_id) = 0;

  /**
   * @brief Verdict after `typed` was sent to the VM
   */
  virtual bool evaluate(const std::string &test_id,
                        const key_sequence_t &typed) = 0;
};

/**
 * @brief Types a fixed text for every test case and passes when the whole
 * text was sent
 */
class typed_text_evaluator_t : public test_evaluator_t {
public:
  typed_text_evaluator_t(std::shared_ptr<const key_compiler_t> compiler,
                         std::string text = "Hello World");

  std::string script(const std::string &test_id) override;

  bool evaluate(const std::string &test_id,
                const key_sequence_t &typed) override;

private:
  std::shared_ptr<const key_compiler_t> compiler_;

  std::string text_;
};

} // namespace vmpilot
