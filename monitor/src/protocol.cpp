#include "protocol.hpp"

#include "exception.hpp"

namespace vmpilot {
namespace qmp {

std::string dump_request(const request_t &request) {
  json_t j = {{"execute", request.command}};
  if (request.arguments.has_value())
    j["arguments"] = request.arguments.value();
  if (request.id.has_value())
    j["id"] = request.id.value();
  return j.dump();
}

static json_t parse_object(std::string_view line) {
  json_t j = json_t::parse(line, nullptr, false);
  if (j.is_discarded())
    throw exception<parse_error>(fmt::format("not a JSON: {}", line));
  if (!j.is_object())
    throw exception<parse_error>(fmt::format("not a JSON object: {}", line));
  return j;
}

static event_t load_event(const json_t &j) {
  if (!j["event"].is_string())
    throw exception<parse_error>("event name is not a string");
  event_t rv{j["event"].get<std::string>(), json_t::object(), std::nullopt};
  if (j.contains("data"))
    rv.data = j["data"];
  if (j.contains("timestamp")) {
    const auto &ts = j["timestamp"];
    if (ts.is_object() && ts.contains("seconds") &&
        ts["seconds"].is_number_integer() && ts.contains("microseconds") &&
        ts["microseconds"].is_number_integer())
      rv.timestamp = timestamp_t{ts["seconds"].get<int64_t>(),
                                 ts["microseconds"].get<int64_t>()};
  }
  return rv;
}

message_t load_message(std::string_view line) {
  json_t j = parse_object(line);

  if (j.contains("event"))
    return load_event(j);

  bool has_return = j.contains("return");
  bool has_error = j.contains("error");
  if (has_return && has_error)
    throw exception<parse_error>("both return and error in a response");
  if (!has_return && !has_error)
    throw exception<parse_error>(
        fmt::format("neither return nor error in a response: {}", line));

  response_t rv;
  if (j.contains("id"))
    rv.id = j["id"];
  if (has_return) {
    rv.result = j["return"];
    return rv;
  }

  const auto &err = j["error"];
  if (!err.is_object() || !err.contains("class") || !err["class"].is_string() ||
      !err.contains("desc") || !err["desc"].is_string())
    throw exception<parse_error>(fmt::format("malformed error: {}", line));
  rv.error = error_info_t{err["class"].get<std::string>(),
                          err["desc"].get<std::string>()};
  return rv;
}

version_t load_version(const json_t &j) {
  if (!j.is_object() || !j.contains("qemu") || !j["qemu"].is_object())
    throw exception<parse_error>("version without qemu");
  const auto &qemu = j["qemu"];
  for (auto key : {"major", "minor", "micro"}) {
    if (!qemu.contains(key) || !qemu[key].is_number_integer())
      throw exception<parse_error>(fmt::format("version without {}", key));
  }
  version_t rv{qemu["major"].get<int>(), qemu["minor"].get<int>(),
               qemu["micro"].get<int>(), ""};
  if (j.contains("package") && j["package"].is_string())
    rv.package = j["package"].get<std::string>();
  return rv;
}

greeting_t load_greeting(std::string_view line) {
  json_t j = json_t::parse(line, nullptr, false);
  if (j.is_discarded() || !j.is_object())
    throw exception<handshake_failed>(
        fmt::format("greeting is not a JSON object: {}", line));
  if (!j.contains("QMP") || !j["QMP"].is_object())
    throw exception<handshake_failed>(
        fmt::format("greeting without QMP banner: {}", line));

  const auto &qmp = j["QMP"];
  if (!qmp.contains("capabilities") || !qmp["capabilities"].is_array())
    throw exception<handshake_failed>("greeting without capabilities");
  if (!qmp.contains("version"))
    throw exception<handshake_failed>("greeting without version");

  greeting_t rv;
  try {
    rv.version = load_version(qmp["version"]);
  } catch (const exception_t<parse_error> &e) {
    throw exception<handshake_failed>(e.message());
  }
  for (const auto &cap : qmp["capabilities"]) {
    if (!cap.is_string())
      throw exception<handshake_failed>("capability is not a string");
    rv.capabilities.push_back(cap.get<std::string>());
  }
  return rv;
}

json_t qcode_key(const std::string &code) {
  return {{"type", "qcode"}, {"data", code}};
}

json_t send_key_arguments(const std::vector<std::string> &codes,
                          std::optional<uint32_t> hold_time_ms) {
  json_t keys = json_t::array();
  for (const auto &code : codes)
    keys.push_back(qcode_key(code));
  json_t rv = {{"keys", keys}};
  if (hold_time_ms.has_value())
    rv["hold-time"] = hold_time_ms.value();
  return rv;
}

json_t key_event_arguments(const key_op_t &op) {
  json_t event = {
      {"type", "key"},
      {"data", {{"key", qcode_key(op.code)}, {"down", op.pressed}}},
  };
  return {{"events", json_t::array({event})}};
}

} // namespace qmp
} // namespace vmpilot
