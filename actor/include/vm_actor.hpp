/**
 * @file vm_actor.hpp
 * @brief One worker per VM
 * @details
 *
 * A `vm_actor_t` owns the monitor session of one VM and serves the commands
 * arriving on its mailbox one by one. Each command produces exactly one
 * terminal event on the event channel; failures become `command_error_t`
 * events and the actor keeps running.
 *
 * ```cpp
 * auto [handle, endpoints] = vmpilot::make_actor_channels("vm1");
 * vmpilot::vm_actor_t actor("vm1", std::move(session), compiler,
 *                           std::move(endpoints.commands),
 *                           std::move(endpoints.events));
 * std::thread t([&] { actor.run(); });
 * handle.commands.send(vmpilot::send_text_t{"ls\n"});
 * ```
 *
 * The actor stops on `shutdown_t` or when every command sender is gone, and
 * `stopped_t` is always its last event.
 */
#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "channel.hpp"
#include "collaborators.hpp"
#include "guest_agent.hpp"
#include "key_compiler.hpp"
#include "monitor_session.hpp"
#include "vm_message.hpp"

namespace vmpilot {

enum class actor_state_t { starting, running, stopping, stopped };

struct actor_options_t {
  /**
   * @brief Pause between two keys
   */
  duration_t key_delay = std::chrono::milliseconds(50);
};

/**
 * @brief Optional parts; a command that needs a missing one fails
 */
struct actor_collaborators_t {
  std::shared_ptr<agent_signal_t> agent_signal;

  std::shared_ptr<test_evaluator_t> evaluator;

  std::unique_ptr<qga::guest_agent_t> guest_agent;
};

/**
 * @brief The orchestrator's side of an actor
 */
struct vm_actor_handle_t {
  std::string name;

  sender_t<vm_command_t> commands;

  receiver_t<vm_event_t> events;
};

/**
 * @brief The actor's side of its channels
 */
struct vm_actor_endpoints_t {
  receiver_t<vm_command_t> commands;

  sender_t<vm_event_t> events;
};

/**
 * @brief Creates a bounded mailbox and an unbounded event channel
 */
std::pair<vm_actor_handle_t, vm_actor_endpoints_t>
make_actor_channels(const std::string &name,
                    size_t mailbox_size = mailbox_limit);

class vm_actor_t {
public:
  vm_actor_t(std::string name, std::unique_ptr<monitor_session_t> session,
             std::shared_ptr<const key_compiler_t> compiler,
             receiver_t<vm_command_t> commands, sender_t<vm_event_t> events,
             actor_collaborators_t collaborators = {},
             const actor_options_t &options = {});

  vm_actor_t(const vm_actor_t &) = delete;

  vm_actor_t &operator=(const vm_actor_t &) = delete;

  /**
   * @brief Serves commands until shutdown; call once
   */
  void run();

  const std::string &name() const { return name_; }

  actor_state_t state() const { return state_; }

private:
  void dispatch(const vm_command_t &command);

  void handle(const send_keys_t &cmd);

  void handle(const send_text_t &cmd);

  void handle(const query_status_t &cmd);

  void handle(const wait_for_agent_t &cmd);

  void handle(const run_test_case_t &cmd);

  void handle(const exec_shell_command_t &cmd);

  void handle(const read_guest_file_t &cmd);

  void handle(const write_guest_file_t &cmd);

  void handle(const get_guest_os_info_t &cmd);

  void handle(const shutdown_t &cmd);

  /**
   * @brief Types `text` key by key
   * @return The operations sent
   */
  key_sequence_t type_text(const std::string &text);

  qga::guest_agent_t &guest_agent();

  void check_agent();

  void emit(vm_event_t event);

  void set_state(actor_state_t state);

  std::string name_;

  std::unique_ptr<monitor_session_t> session_;

  std::shared_ptr<const key_compiler_t> compiler_;

  receiver_t<vm_command_t> commands_;

  sender_t<vm_event_t> events_;

  actor_collaborators_t collaborators_;

  actor_options_t options_;

  std::atomic<actor_state_t> state_ = actor_state_t::starting;

  bool agent_connected_ = false;
};

} // namespace vmpilot
