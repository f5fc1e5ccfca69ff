#include "vm_actor.hpp"

#include <thread>

#include <magic_enum/magic_enum.hpp>

#include "exception.hpp"
#include "logging.hpp"

namespace vmpilot {

std::pair<vm_actor_handle_t, vm_actor_endpoints_t>
make_actor_channels(const std::string &name, size_t mailbox_size) {
  auto [command_tx, command_rx] = make_channel<vm_command_t>(mailbox_size);
  auto [event_tx, event_rx] = make_channel<vm_event_t>(unbounded);
  return std::make_pair(
      vm_actor_handle_t{name, std::move(command_tx), std::move(event_rx)},
      vm_actor_endpoints_t{std::move(command_rx), std::move(event_tx)});
}

vm_actor_t::vm_actor_t(std::string name,
                       std::unique_ptr<monitor_session_t> session,
                       std::shared_ptr<const key_compiler_t> compiler,
                       receiver_t<vm_command_t> commands,
                       sender_t<vm_event_t> events,
                       actor_collaborators_t collaborators,
                       const actor_options_t &options)
    : name_(std::move(name)), session_(std::move(session)),
      compiler_(std::move(compiler)), commands_(std::move(commands)),
      events_(std::move(events)), collaborators_(std::move(collaborators)),
      options_(options) {
  if (!session_)
    throw exception<value_error>("vm_actor_t", "session is null");
  if (!compiler_)
    throw exception<value_error>("vm_actor_t", "compiler is null");
}

void vm_actor_t::run() {
  emit(started_t{name_});
  set_state(actor_state_t::running);

  while (state_ == actor_state_t::running) {
    auto command = commands_.recv();
    if (!command.has_value()) {
      info("[Actor {}] mailbox closed", name_);
      set_state(actor_state_t::stopping);
      break;
    }
    dispatch(command.value());
  }

  // Whatever is still queued behind the shutdown is dropped here
  size_t dropped = commands_.pending();
  commands_.release();
  if (dropped > 0)
    info("[Actor {}] dropped {} queued commands", name_, dropped);
  session_->close();
  session_.reset();

  set_state(actor_state_t::stopped);
  emit(stopped_t{});
  events_.release();
}

void vm_actor_t::dispatch(const vm_command_t &command) {
  debug("[Actor {}] {}", name_, command_name(command));
  try {
    std::visit([this](const auto &cmd) { handle(cmd); }, command);
  } catch (const exception_base_t &e) {
    warn("[Actor {}] {} failed: {}", name_, command_origin(command),
         e.message());
    emit(command_error_t{e.message(), command_origin(command)});
  } catch (const std::exception &e) {
    warn("[Actor {}] {} failed: {}", name_, command_origin(command), e.what());
    emit(command_error_t{e.what(), command_origin(command)});
  }
  check_agent();
}

void vm_actor_t::handle(const send_keys_t &cmd) {
  for (size_t i = 0; i < cmd.codes.size(); i++) {
    if (i > 0)
      std::this_thread::sleep_for(options_.key_delay);
    session_->send_key(cmd.codes[i]);
  }
  emit(keys_sent_t{cmd.codes.size()});
}

void vm_actor_t::handle(const send_text_t &cmd) {
  auto ops = type_text(cmd.text);
  emit(keys_sent_t{ops.size()});
}

void vm_actor_t::handle(const query_status_t &) {
  auto status = session_->query_status();
  emit(status_reported_t{status.status, status.running});
}

void vm_actor_t::handle(const wait_for_agent_t &cmd) {
  if (!collaborators_.agent_signal)
    throw exception<runtime_error>("no guest agent signal for " + name_);
  if (!collaborators_.agent_signal->wait_connected(cmd.timeout))
    throw exception<timeout>(fmt::format(
        "guest agent of {} not connected within {} ms", name_,
        std::chrono::duration_cast<std::chrono::milliseconds>(cmd.timeout)
            .count()));
  agent_connected_ = true;
  info("[Actor {}] guest agent connected", name_);
  emit(agent_connected_t{});
}

void vm_actor_t::handle(const run_test_case_t &cmd) {
  if (!collaborators_.evaluator)
    throw exception<runtime_error>("no test evaluator for " + name_);
  info("[Actor {}] running test case {}", name_, cmd.test_id);
  auto typed = type_text(collaborators_.evaluator->script(cmd.test_id));
  bool passed = collaborators_.evaluator->evaluate(cmd.test_id, typed);
  info("[Actor {}] test case {} {}", name_, cmd.test_id,
       passed ? "passed" : "failed");
  emit(test_case_completed_t{cmd.test_id, passed, cmd.run});
}

void vm_actor_t::handle(const exec_shell_command_t &cmd) {
  auto status = guest_agent().exec_shell(cmd.command);
  int exit_code = status.exit_code.value_or(-1);
  if (!status.exit_code.has_value() && status.signal.has_value())
    exit_code = 128 + status.signal.value();
  emit(shell_command_completed_t{cmd.command, exit_code, std::move(status.out),
                                 std::move(status.err)});
}

void vm_actor_t::handle(const read_guest_file_t &cmd) {
  auto content = guest_agent().read_file(cmd.path);
  emit(file_read_completed_t{cmd.path, std::move(content)});
}

void vm_actor_t::handle(const write_guest_file_t &cmd) {
  guest_agent().write_file(cmd.path, cmd.content);
  emit(file_write_completed_t{cmd.path});
}

void vm_actor_t::handle(const get_guest_os_info_t &) {
  emit(guest_os_info_received_t{guest_agent().os_info()});
}

void vm_actor_t::handle(const shutdown_t &) {
  info("[Actor {}] shutting down", name_);
  set_state(actor_state_t::stopping);
}

key_sequence_t vm_actor_t::type_text(const std::string &text) {
  // Compile first so that an unsupported character presses nothing
  auto ops = compiler_->compile(text);
  for (size_t i = 0; i < ops.size(); i++) {
    if (i > 0)
      std::this_thread::sleep_for(options_.key_delay);
    session_->send_key_event(ops[i]);
  }
  return ops;
}

qga::guest_agent_t &vm_actor_t::guest_agent() {
  if (!collaborators_.guest_agent)
    throw exception<guest_agent_error>("no guest agent channel for " + name_);
  return *collaborators_.guest_agent;
}

void vm_actor_t::check_agent() {
  if (!agent_connected_ || !collaborators_.agent_signal)
    return;
  if (collaborators_.agent_signal->is_connected())
    return;
  agent_connected_ = false;
  warn("[Actor {}] guest agent disconnected", name_);
  emit(agent_disconnected_t{});
}

void vm_actor_t::emit(vm_event_t event) {
  auto kind = event_name(event);
  if (events_.send(std::move(event)) != send_result_t::ok)
    debug("[Actor {}] {} not delivered, no listener", name_, kind);
}

void vm_actor_t::set_state(actor_state_t state) {
  debug("[Actor {}] {} -> {}", name_, magic_enum::enum_name(state_.load()),
        magic_enum::enum_name(state));
  state_ = state;
}

} // namespace vmpilot
