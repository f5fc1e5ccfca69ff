#include "collaborators.hpp"

#include <thread>

#include "exception.hpp"
#include "logging.hpp"

namespace vmpilot {

agent_presence_t::agent_presence_t(const std::string &vm_name)
    : notify_t(vm_name.empty() ? std::string() : "agent:" + vm_name),
      monitor_(create<monitor_t>()) {
  set_monitor(monitor_);
}

void agent_presence_t::set_connected() {
  connected_ = true;
  notify("connected");
}

void agent_presence_t::set_disconnected() {
  connected_ = false;
  notify("disconnected");
}

bool agent_presence_t::wait_connected(const duration_t &timeout) {
  auto due = now() + timeout;
  while (!connected_) {
    auto signal = monitor_->monitor_for("connected", due);
    if (!signal.has_value())
      return connected_;
    debug("[Agent] {} connected", signal->who);
  }
  return true;
}

guest_ping_signal_t::guest_ping_signal_t(
    std::unique_ptr<qga::guest_agent_t> agent)
    : agent_(std::move(agent)) {
  if (!agent_)
    throw exception<value_error>("guest_ping_signal_t", "agent is null");
}

bool guest_ping_signal_t::wait_connected(const duration_t &timeout) {
  auto due = now() + timeout;
  while (!ping()) {
    if (now() + agent_->options().poll_interval >= due)
      return false;
    std::this_thread::sleep_for(agent_->options().poll_interval);
  }
  return true;
}

bool guest_ping_signal_t::is_connected() const { return ping(); }

bool guest_ping_signal_t::ping() const {
  try {
    agent_->ping();
    return true;
  } catch (const exception_t<guest_agent_error> &e) {
    debug("[Agent] no answer: {}", e.message());
    return false;
  }
}

typed_text_evaluator_t::typed_text_evaluator_t(
    std::shared_ptr<const key_compiler_t> compiler, std::string text)
    : compiler_(std::move(compiler)), text_(std::move(text)) {}

std::string typed_text_evaluator_t::script(const std::string &) {
  return text_;
}

bool typed_text_evaluator_t::evaluate(const std::string &test_id,
                                      const key_sequence_t &typed) {
  bool passed = typed == compiler_->compile(text_);
  debug("[Evaluator] {}: {} key operations, {}", test_id, typed.size(),
        passed ? "passed" : "failed");
  return passed;
}

} // namespace vmpilot
