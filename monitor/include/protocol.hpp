/**
 * @file protocol.hpp
 * @brief QEMU Machine Protocol (QMP) messages
 * @details
 *
 * QMP is newline-delimited JSON. On connect the server sends a greeting:
 *
 * ```json
 * {"QMP": {"version": {"qemu": {"major": 8, "minor": 2, "micro": 0},
 *                      "package": ""},
 *          "capabilities": ["oob"]}}
 * ```
 *
 * After that, every request `{"execute": ..., "arguments": ..., "id": ...}` is
 * answered by exactly one `{"return": ...}` or
 * `{"error": {"class": ..., "desc": ...}}` carrying the same id. Asynchronous
 * `{"event": ...}` messages may be interleaved at any time.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "key_compiler.hpp"

namespace vmpilot {
namespace qmp {

using json_t = nlohmann::json;

struct request_t {
  std::string command;
  std::optional<json_t> arguments;
  std::optional<std::string> id;
};

struct error_info_t {
  std::string error_class;
  std::string description;
};

/**
 * @brief Reply to a request; exactly one of `result` and `error` is set
 */
struct response_t {
  bool is_error() const { return error.has_value(); }

  std::optional<json_t> result;
  std::optional<error_info_t> error;
  std::optional<json_t> id;
};

struct timestamp_t {
  int64_t seconds;
  int64_t microseconds;
};

struct event_t {
  std::string name;
  json_t data;
  std::optional<timestamp_t> timestamp;
};

struct version_t {
  int major;
  int minor;
  int micro;
  std::string package;
};

struct greeting_t {
  version_t version;
  std::vector<std::string> capabilities;
};

using message_t = std::variant<response_t, event_t>;

std::string dump_request(const request_t &request);

/**
 * @brief Parses one line read after the greeting
 * @throw exception_t<parse_error> if the line is neither a response nor an
 * event
 */
message_t load_message(std::string_view line);

/**
 * @throw exception_t<handshake_failed> if the line is not a QMP greeting
 */
greeting_t load_greeting(std::string_view line);

version_t load_version(const json_t &j);

/**
 * @brief `{"type": "qcode", "data": code}`
 */
json_t qcode_key(const std::string &code);

/**
 * @brief Arguments of `send-key`
 */
json_t send_key_arguments(const std::vector<std::string> &codes,
                          std::optional<uint32_t> hold_time_ms = std::nullopt);

/**
 * @brief Arguments of `input-send-event` carrying a single key event
 */
json_t key_event_arguments(const key_op_t &op);

} // namespace qmp
} // namespace vmpilot
