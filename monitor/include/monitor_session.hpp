/**
 * @file monitor_session.hpp
 * @brief One QMP connection to one VM
 * @details
 *
 * `monitor_session_t` owns the stream to a VM's monitor socket. It reads the
 * greeting and negotiates capabilities once, then executes one command at a
 * time. A session is owned by exactly one thread, so there is never more than
 * one request in flight.
 *
 * ```cpp
 * auto session = vmpilot::monitor_session_t::connect_unix(
 *     "/var/lib/libvirt/qemu/domain-1-vm1/monitor.sock");
 * auto status = session->query_status();
 * session->send_keys({"ctrl", "alt", "delete"});
 * ```
 *
 * Errors are thrown as `exception_t<handshake_failed>`,
 * `exception_t<command_failed>`, `exception_t<parse_error>`,
 * `exception_t<disconnected>` and `exception_t<timeout>`.
 */
#pragma once

#include <deque>
#include <memory>
#include <string>

#include "line_stream.hpp"
#include "protocol.hpp"

namespace vmpilot {

struct session_options_t {
  /**
   * @brief Maximum wait for the greeting
   */
  duration_t handshake_timeout = std::chrono::seconds(5);

  /**
   * @brief Maximum wait for the response of each command
   */
  duration_t command_timeout = std::chrono::seconds(10);
};

struct vm_status_t {
  std::string status;
  bool running;
};

class monitor_session_t {
  struct private_t {
    explicit private_t() = default;
  };

public:
  /**
   * @brief Most abandoned request ids remembered; older ones are forgotten
   */
  static constexpr size_t max_abandoned = 32;

  monitor_session_t(private_t, std::unique_ptr<line_stream_t> stream,
                    const session_options_t &options);

  /**
   * @brief Performs the handshake over an already connected stream
   * @throw exception_t<handshake_failed>
   */
  static std::unique_ptr<monitor_session_t>
  connect(std::unique_ptr<line_stream_t> stream,
          const session_options_t &options = {});

  /**
   * @throw exception_t<disconnected> if the socket cannot be reached
   * @throw exception_t<handshake_failed>
   */
  static std::unique_ptr<monitor_session_t>
  connect_unix(const std::string &path, const session_options_t &options = {});

  monitor_session_t(const monitor_session_t &) = delete;

  monitor_session_t &operator=(const monitor_session_t &) = delete;

  ~monitor_session_t();

  /**
   * @brief Sends one request and waits for its response
   * @return The `return` payload
   */
  qmp::json_t execute(const std::string &command,
                      const std::optional<qmp::json_t> &arguments = std::nullopt);

  /**
   * @brief Presses the keys together with one `send-key`
   */
  void send_keys(const std::vector<std::string> &codes,
                 std::optional<uint32_t> hold_time_ms = std::nullopt);

  void send_key(const std::string &code) { send_keys({code}); }

  /**
   * @brief Sends a single key down or up with `input-send-event`
   */
  void send_key_event(const key_op_t &op);

  vm_status_t query_status();

  qmp::version_t query_version();

  /**
   * @brief Takes the asynchronous events received so far, oldest first
   */
  std::vector<qmp::event_t> drain_events();

  const qmp::greeting_t &greeting() const { return greeting_; }

  const session_options_t &options() const { return options_; }

  bool is_open() const { return stream_ && stream_->is_open(); }

  /**
   * @brief Closes the stream and forgets abandoned requests
   */
  void close() noexcept;

  size_t abandoned() const { return abandoned_.size(); }

private:

  void handshake();

  qmp::response_t await_response(const std::string &id, const time_point_t &due);

  std::unique_ptr<line_stream_t> stream_;

  session_options_t options_;

  qmp::greeting_t greeting_;

  size_t next_id_ = 0;

  /**
   * @brief Ids of requests given up on; their late responses are discarded
   */
  std::deque<std::string> abandoned_;

  std::deque<qmp::event_t> events_;
};

} // namespace vmpilot
