/**
 * @file guest_agent.hpp
 * @brief QEMU guest agent (QGA) client
 * @details
 *
 * The guest agent is a daemon inside the VM that answers JSON commands
 * (`guest-exec`, `guest-file-open`, ...). Commands travel over a
 * `guest_channel_t`, typically libvirt's agent pass-through.
 *
 * Binary payloads (process output, file contents) are base64 on the wire;
 * `guest_agent_t` encodes and decodes them, so callers see plain bytes.
 *
 * Failures reported by the agent or its channel are thrown as
 * `exception_t<guest_agent_error>`.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "thread.hpp"

namespace vmpilot {
namespace qga {

using json_t = nlohmann::json;

/**
 * @brief Transport carrying one agent request and its response
 */
class guest_channel_t {
public:
  virtual ~guest_channel_t() = default;

  /**
   * @return The raw JSON response line
   * @throw exception_t<guest_agent_error> if the agent cannot be reached
   */
  virtual std::string transact(const std::string &request,
                               const duration_t &timeout) = 0;
};

struct guest_options_t {
  duration_t command_timeout = std::chrono::seconds(30);

  /**
   * @brief Interval between `guest-exec-status` polls
   */
  duration_t poll_interval = std::chrono::milliseconds(500);

  /**
   * @brief Maximum run time of a process started by `exec_and_wait`
   */
  duration_t exec_timeout = std::chrono::seconds(300);

  size_t read_chunk = 4096;
};

struct exec_command_t {
  std::string path;
  std::vector<std::string> args;
  std::vector<std::string> env;
  std::optional<std::string> input;
  bool capture_output = true;
};

struct exec_status_t {
  bool exited = false;
  std::optional<int> exit_code;
  std::optional<int> signal;
  std::string out;
  std::string err;
  bool out_truncated = false;
  bool err_truncated = false;
};

struct os_info_t {
  std::optional<std::string> id;
  std::optional<std::string> name;
  std::optional<std::string> version;
  std::optional<std::string> version_id;
  std::optional<std::string> pretty_name;
  std::optional<std::string> kernel_version;
  std::optional<std::string> kernel_release;
  std::optional<std::string> machine;

  bool is_windows() const;
};

struct command_info_t {
  std::string name;
  bool enabled;
  bool success_response;
};

struct guest_info_t {
  std::string version;
  std::vector<command_info_t> supported_commands;
};

struct file_chunk_t {
  std::string data;
  int64_t count;
  bool eof;
};

std::string base64_encode(std::string_view data);

/**
 * @throw exception_t<value_error> on malformed input
 */
std::string base64_decode(std::string_view data);

class guest_agent_t {
public:
  guest_agent_t(std::unique_ptr<guest_channel_t> channel,
                const guest_options_t &options = {});

  /**
   * @return The `return` payload of the agent's reply
   */
  json_t execute(const std::string &command,
                 const std::optional<json_t> &arguments = std::nullopt);

  void ping();

  guest_info_t info();

  os_info_t os_info();

  /**
   * @return pid of the started process
   */
  int64_t exec(const exec_command_t &command);

  exec_status_t exec_status(int64_t pid);

  /**
   * @brief Starts a process and polls until it exits
   * @throw exception_t<timeout> after `exec_timeout`
   */
  exec_status_t exec_and_wait(const exec_command_t &command);

  /**
   * @brief Runs a command line with the guest's shell (`cmd.exe /c` on
   * Windows guests, `/bin/sh -c` otherwise)
   */
  exec_status_t exec_shell(const std::string &command_line);

  int64_t file_open(const std::string &path,
                    const std::optional<std::string> &mode = std::nullopt);

  file_chunk_t file_read(int64_t handle,
                         std::optional<int64_t> count = std::nullopt);

  int64_t file_write(int64_t handle, std::string_view data);

  void file_close(int64_t handle);

  std::string read_file(const std::string &path);

  void write_file(const std::string &path, std::string_view content);

  const guest_options_t &options() const { return options_; }

private:
  /**
   * @brief Closes a handle while another error is propagating
   */
  void close_quietly(int64_t handle) noexcept;

  std::unique_ptr<guest_channel_t> channel_;

  guest_options_t options_;
};

} // namespace qga
} // namespace vmpilot
