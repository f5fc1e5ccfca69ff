/**
 * @file vm_message.hpp
 * @brief Commands accepted and events emitted by a VM actor
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "guest_agent.hpp"
#include "thread.hpp"

namespace vmpilot {

/*
 * Commands
 */

/**
 * @brief Presses each qcode in turn
 */
struct send_keys_t {
  std::vector<std::string> codes;
};

/**
 * @brief Types UTF-8 text through the key compiler
 */
struct send_text_t {
  std::string text;
};

struct query_status_t {};

struct wait_for_agent_t {
  duration_t timeout;
};

/**
 * @brief Types and evaluates a test case
 * @details A non-zero `run` tags one submission; it comes back in the verdict
 * and in the error origin ("run_test_case:T1#7").
 */
struct run_test_case_t {
  std::string test_id;
  uint64_t run = 0;
};

struct exec_shell_command_t {
  std::string command;
};

struct read_guest_file_t {
  std::string path;
};

struct write_guest_file_t {
  std::string path;
  std::string content;
};

struct get_guest_os_info_t {};

/**
 * @brief Stops the actor; commands queued behind it are dropped
 */
struct shutdown_t {};

using vm_command_t =
    std::variant<send_keys_t, send_text_t, query_status_t, wait_for_agent_t,
                 run_test_case_t, exec_shell_command_t, read_guest_file_t,
                 write_guest_file_t, get_guest_os_info_t, shutdown_t>;

/*
 * Events
 */

struct started_t {
  std::string vm_name;
};

struct agent_connected_t {};

struct agent_disconnected_t {};

struct keys_sent_t {
  size_t count;
};

struct status_reported_t {
  std::string status;
  bool running;
};

struct test_case_completed_t {
  std::string test_id;
  bool passed;
  uint64_t run = 0;
};

struct shell_command_completed_t {
  std::string command;
  int exit_code;
  std::string out;
  std::string err;
};

struct file_read_completed_t {
  std::string path;
  std::string content;
};

struct file_write_completed_t {
  std::string path;
};

struct guest_os_info_received_t {
  qga::os_info_t os_info;
};

/**
 * @brief A command failed
 * @details `origin` names the command, e.g. "send_text" or
 * "run_test_case:T1".
 */
struct command_error_t {
  std::string message;
  std::string origin;
};

/**
 * @brief Always the last event of an actor
 */
struct stopped_t {};

using vm_event_t =
    std::variant<started_t, agent_connected_t, agent_disconnected_t,
                 keys_sent_t, status_reported_t, test_case_completed_t,
                 shell_command_completed_t, file_read_completed_t,
                 file_write_completed_t, guest_os_info_received_t,
                 command_error_t, stopped_t>;

std::string_view command_name(const vm_command_t &command);

std::string command_origin(const vm_command_t &command);

std::string_view event_name(const vm_event_t &event);

} // namespace vmpilot
