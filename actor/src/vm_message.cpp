#include "vm_message.hpp"

#include <type_traits>

#include <fmt/format.h>

namespace vmpilot {

template <typename> inline constexpr bool false_type_v = false;

std::string_view command_name(const vm_command_t &command) {
  return std::visit(
      [](const auto &cmd) -> std::string_view {
        using T = std::decay_t<decltype(cmd)>;
        if constexpr (std::is_same_v<T, send_keys_t>)
          return "send_keys";
        else if constexpr (std::is_same_v<T, send_text_t>)
          return "send_text";
        else if constexpr (std::is_same_v<T, query_status_t>)
          return "query_status";
        else if constexpr (std::is_same_v<T, wait_for_agent_t>)
          return "wait_for_agent";
        else if constexpr (std::is_same_v<T, run_test_case_t>)
          return "run_test_case";
        else if constexpr (std::is_same_v<T, exec_shell_command_t>)
          return "exec_shell_command";
        else if constexpr (std::is_same_v<T, read_guest_file_t>)
          return "read_guest_file";
        else if constexpr (std::is_same_v<T, write_guest_file_t>)
          return "write_guest_file";
        else if constexpr (std::is_same_v<T, get_guest_os_info_t>)
          return "get_guest_os_info";
        else if constexpr (std::is_same_v<T, shutdown_t>)
          return "shutdown";
        else
          static_assert(false_type_v<T>, "unnamed command");
      },
      command);
}

std::string command_origin(const vm_command_t &command) {
  if (auto *run = std::get_if<run_test_case_t>(&command)) {
    if (run->run == 0)
      return "run_test_case:" + run->test_id;
    return fmt::format("run_test_case:{}#{}", run->test_id, run->run);
  }
  return std::string(command_name(command));
}

std::string_view event_name(const vm_event_t &event) {
  return std::visit(
      [](const auto &evt) -> std::string_view {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, started_t>)
          return "started";
        else if constexpr (std::is_same_v<T, agent_connected_t>)
          return "agent_connected";
        else if constexpr (std::is_same_v<T, agent_disconnected_t>)
          return "agent_disconnected";
        else if constexpr (std::is_same_v<T, keys_sent_t>)
          return "keys_sent";
        else if constexpr (std::is_same_v<T, status_reported_t>)
          return "status_reported";
        else if constexpr (std::is_same_v<T, test_case_completed_t>)
          return "test_case_completed";
        else if constexpr (std::is_same_v<T, shell_command_completed_t>)
          return "shell_command_completed";
        else if constexpr (std::is_same_v<T, file_read_completed_t>)
          return "file_read_completed";
        else if constexpr (std::is_same_v<T, file_write_completed_t>)
          return "file_write_completed";
        else if constexpr (std::is_same_v<T, guest_os_info_received_t>)
          return "guest_os_info_received";
        else if constexpr (std::is_same_v<T, command_error_t>)
          return "command_error";
        else if constexpr (std::is_same_v<T, stopped_t>)
          return "stopped";
        else
          static_assert(false_type_v<T>, "unnamed event");
      },
      event);
}

} // namespace vmpilot
