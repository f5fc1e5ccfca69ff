#include "monitor_session.hpp"

#include <algorithm>

#include "exception.hpp"
#include "logging.hpp"

namespace vmpilot {

monitor_session_t::monitor_session_t(private_t,
                                     std::unique_ptr<line_stream_t> stream,
                                     const session_options_t &options)
    : stream_(std::move(stream)), options_(options) {}

monitor_session_t::~monitor_session_t() { close(); }

std::unique_ptr<monitor_session_t>
monitor_session_t::connect(std::unique_ptr<line_stream_t> stream,
                           const session_options_t &options) {
  if (!stream)
    throw exception<handshake_failed>("no stream");
  auto session = std::make_unique<monitor_session_t>(
      private_t{}, std::move(stream), options);
  session->handshake();
  return session;
}

std::unique_ptr<monitor_session_t>
monitor_session_t::connect_unix(const std::string &path,
                                const session_options_t &options) {
  return connect(connect_unix_stream(path), options);
}

void monitor_session_t::handshake() {
  std::optional<std::string> line;
  try {
    line = stream_->read_line(options_.handshake_timeout);
  } catch (const exception_t<disconnected> &e) {
    throw exception<handshake_failed>(
        fmt::format("no greeting: {}", e.message()));
  }
  if (!line.has_value())
    throw exception<handshake_failed>("no greeting within the deadline");

  greeting_ = qmp::load_greeting(line.value());
  debug("[Session] QEMU {}.{}.{} {}", greeting_.version.major,
        greeting_.version.minor, greeting_.version.micro,
        greeting_.version.package);

  try {
    execute("qmp_capabilities");
  } catch (const exception_base_t &e) {
    throw exception<handshake_failed>(
        fmt::format("capability negotiation: {}", e.message()));
  }
}

qmp::json_t monitor_session_t::execute(const std::string &command,
                                       const std::optional<qmp::json_t> &arguments) {
  if (!is_open())
    throw exception<disconnected>("session closed");

  std::string id = fmt::format("vmpilot-{}", next_id_++);
  qmp::request_t request{command, arguments, id};
  auto due = now() + options_.command_timeout;

  debug("[Session] -> {} ({})", command, id);
  stream_->write_line(qmp::dump_request(request));

  auto response = await_response(id, due);
  if (response.is_error()) {
    const auto &err = response.error.value();
    debug("[Session] <- {} ({}): {} {}", command, id, err.error_class,
          err.description);
    throw exception<command_failed>(err.error_class, err.description);
  }
  debug("[Session] <- {} ({})", command, id);
  return response.result.value();
}

qmp::response_t monitor_session_t::await_response(const std::string &id,
                                                  const time_point_t &due) {
  while (true) {
    auto remaining = due - now();
    std::optional<std::string> line;
    if (remaining > duration_t::zero())
      line = stream_->read_line(remaining);
    if (!line.has_value()) {
      abandoned_.push_back(id);
      if (abandoned_.size() > max_abandoned)
        abandoned_.pop_front();
      throw exception<timeout>(fmt::format("no response to {}", id));
    }
    if (line->empty())
      continue;

    auto message = qmp::load_message(line.value());
    if (std::holds_alternative<qmp::event_t>(message)) {
      auto &event = std::get<qmp::event_t>(message);
      debug("[Session] event {}", event.name);
      events_.push_back(std::move(event));
      continue;
    }

    auto &response = std::get<qmp::response_t>(message);
    if (response.id.has_value() && response.id.value() != qmp::json_t(id)) {
      if (response.id->is_string()) {
        auto it = std::find(abandoned_.begin(), abandoned_.end(),
                            response.id->get<std::string>());
        if (it != abandoned_.end()) {
          abandoned_.erase(it);
          debug("[Session] dropping late response {}", response.id->dump());
          continue;
        }
      }
      throw exception<parse_error>(fmt::format(
          "response id {} does not match request {}", response.id->dump(), id));
    }
    return std::move(response);
  }
}

void monitor_session_t::send_keys(const std::vector<std::string> &codes,
                                  std::optional<uint32_t> hold_time_ms) {
  execute("send-key", qmp::send_key_arguments(codes, hold_time_ms));
}

void monitor_session_t::send_key_event(const key_op_t &op) {
  execute("input-send-event", qmp::key_event_arguments(op));
}

vm_status_t monitor_session_t::query_status() {
  auto result = execute("query-status");
  if (!result.is_object() || !result.contains("status") ||
      !result["status"].is_string() || !result.contains("running") ||
      !result["running"].is_boolean())
    throw exception<parse_error>(
        fmt::format("malformed query-status result: {}", result.dump()));
  return vm_status_t{result["status"].get<std::string>(),
                     result["running"].get<bool>()};
}

qmp::version_t monitor_session_t::query_version() {
  return qmp::load_version(execute("query-version"));
}

std::vector<qmp::event_t> monitor_session_t::drain_events() {
  std::vector<qmp::event_t> rv(std::make_move_iterator(events_.begin()),
                               std::make_move_iterator(events_.end()));
  events_.clear();
  return rv;
}

void monitor_session_t::close() noexcept {
  if (stream_)
    stream_->close();
  abandoned_.clear();
}

} // namespace vmpilot
