#include "guest_agent.hpp"

#include <thread>

#include "exception.hpp"
#include "logging.hpp"

namespace vmpilot {
namespace qga {

static std::optional<std::string> optional_string(const json_t &j,
                                                  const char *key) {
  if (j.contains(key) && j[key].is_string())
    return j[key].get<std::string>();
  return std::nullopt;
}

static std::optional<int> optional_int(const json_t &j, const char *key) {
  if (j.contains(key) && j[key].is_number_integer())
    return j[key].get<int>();
  return std::nullopt;
}

static bool optional_bool(const json_t &j, const char *key) {
  return j.contains(key) && j[key].is_boolean() && j[key].get<bool>();
}

template <typename T>
static T required(const json_t &j, const char *key, const std::string &command) {
  if (!j.is_object() || !j.contains(key))
    throw exception<guest_agent_error>(
        fmt::format("{}: missing '{}' in {}", command, key, j.dump()));
  try {
    return j[key].get<T>();
  } catch (const json_t::type_error &e) {
    throw exception<guest_agent_error>(
        fmt::format("{}: '{}' has a wrong type: {}", command, key, e.what()));
  }
}

static std::string decode_payload(const std::string &data,
                                  const std::string &command) {
  try {
    return base64_decode(data);
  } catch (const exception_t<value_error> &e) {
    throw exception<guest_agent_error>(
        fmt::format("{}: {}", command, e.message()));
  }
}

bool os_info_t::is_windows() const {
  if (id.has_value() && id.value() == "mswindows")
    return true;
  if (id.has_value() && id.value() == "windows")
    return true;
  return name.has_value() && name->find("Windows") != std::string::npos;
}

guest_agent_t::guest_agent_t(std::unique_ptr<guest_channel_t> channel,
                             const guest_options_t &options)
    : channel_(std::move(channel)), options_(options) {
  if (!channel_)
    throw exception<guest_agent_error>("no channel");
}

json_t guest_agent_t::execute(const std::string &command,
                              const std::optional<json_t> &arguments) {
  json_t request = {{"execute", command}};
  if (arguments.has_value())
    request["arguments"] = arguments.value();

  debug("[Guest] -> {}", command);
  std::string raw = channel_->transact(request.dump(), options_.command_timeout);

  json_t response = json_t::parse(raw, nullptr, false);
  if (response.is_discarded() || !response.is_object())
    throw exception<guest_agent_error>(
        fmt::format("{}: malformed response: {}", command, raw));
  if (response.contains("error")) {
    const auto &err = response["error"];
    throw exception<guest_agent_error>(fmt::format(
        "{}: {}: {}", command, optional_string(err, "class").value_or("Unknown"),
        optional_string(err, "desc").value_or("")));
  }
  if (!response.contains("return"))
    throw exception<guest_agent_error>(
        fmt::format("{}: no return in response", command));
  debug("[Guest] <- {}", command);
  return response["return"];
}

void guest_agent_t::ping() { execute("guest-ping"); }

guest_info_t guest_agent_t::info() {
  auto ret = execute("guest-info");
  guest_info_t rv{required<std::string>(ret, "version", "guest-info"), {}};
  if (ret.contains("supported_commands") &&
      ret["supported_commands"].is_array()) {
    for (const auto &cmd : ret["supported_commands"]) {
      rv.supported_commands.push_back(
          {required<std::string>(cmd, "name", "guest-info"),
           optional_bool(cmd, "enabled"),
           optional_bool(cmd, "success-response")});
    }
  }
  return rv;
}

os_info_t guest_agent_t::os_info() {
  auto ret = execute("guest-get-osinfo");
  if (!ret.is_object())
    throw exception<guest_agent_error>("guest-get-osinfo: not an object");
  return os_info_t{
      optional_string(ret, "id"),
      optional_string(ret, "name"),
      optional_string(ret, "version"),
      optional_string(ret, "version-id"),
      optional_string(ret, "pretty-name"),
      optional_string(ret, "kernel-version"),
      optional_string(ret, "kernel-release"),
      optional_string(ret, "machine"),
  };
}

int64_t guest_agent_t::exec(const exec_command_t &command) {
  json_t args = {{"path", command.path},
                 {"capture-output", command.capture_output}};
  if (!command.args.empty())
    args["arg"] = command.args;
  if (!command.env.empty())
    args["env"] = command.env;
  if (command.input.has_value())
    args["input-data"] = base64_encode(command.input.value());

  auto pid = required<int64_t>(execute("guest-exec", args), "pid", "guest-exec");
  vmpilot::info("[Guest] started {} (pid {})", command.path, pid);
  return pid;
}

exec_status_t guest_agent_t::exec_status(int64_t pid) {
  auto ret = execute("guest-exec-status", json_t{{"pid", pid}});
  exec_status_t rv;
  rv.exited = required<bool>(ret, "exited", "guest-exec-status");
  rv.exit_code = optional_int(ret, "exitcode");
  rv.signal = optional_int(ret, "signal");
  if (auto out = optional_string(ret, "out-data"))
    rv.out = decode_payload(out.value(), "guest-exec-status");
  if (auto err = optional_string(ret, "err-data"))
    rv.err = decode_payload(err.value(), "guest-exec-status");
  rv.out_truncated = optional_bool(ret, "out-truncated");
  rv.err_truncated = optional_bool(ret, "err-truncated");
  return rv;
}

exec_status_t guest_agent_t::exec_and_wait(const exec_command_t &command) {
  auto pid = exec(command);
  auto due = now() + options_.exec_timeout;
  while (true) {
    auto status = exec_status(pid);
    if (status.exited) {
      vmpilot::info("[Guest] pid {} exited with {}", pid, status.exit_code.value_or(-1));
      return status;
    }
    if (now() >= due)
      throw exception<timeout>(
          fmt::format("guest process {} ({}) still running", pid, command.path));
    std::this_thread::sleep_for(options_.poll_interval);
  }
}

exec_status_t guest_agent_t::exec_shell(const std::string &command_line) {
  bool windows = false;
  try {
    windows = os_info().is_windows();
  } catch (const exception_t<guest_agent_error> &e) {
    warn("[Guest] cannot tell the guest OS, assuming a POSIX shell: {}",
         e.message());
  }

  exec_command_t command;
  if (windows)
    command = {"C:\\Windows\\System32\\cmd.exe", {"/c", command_line}};
  else
    command = {"/bin/sh", {"-c", command_line}};
  return exec_and_wait(command);
}

int64_t guest_agent_t::file_open(const std::string &path,
                                 const std::optional<std::string> &mode) {
  json_t args = {{"path", path}};
  if (mode.has_value())
    args["mode"] = mode.value();
  return required<int64_t>(execute("guest-file-open", args), "handle",
                           "guest-file-open");
}

file_chunk_t guest_agent_t::file_read(int64_t handle,
                                      std::optional<int64_t> count) {
  json_t args = {{"handle", handle}};
  if (count.has_value())
    args["count"] = count.value();
  auto ret = execute("guest-file-read", args);
  return file_chunk_t{
      decode_payload(required<std::string>(ret, "buf-b64", "guest-file-read"),
                     "guest-file-read"),
      required<int64_t>(ret, "count", "guest-file-read"),
      required<bool>(ret, "eof", "guest-file-read"),
  };
}

int64_t guest_agent_t::file_write(int64_t handle, std::string_view data) {
  json_t args = {{"handle", handle}, {"buf-b64", base64_encode(data)}};
  return required<int64_t>(execute("guest-file-write", args), "count",
                           "guest-file-write");
}

void guest_agent_t::file_close(int64_t handle) {
  execute("guest-file-close", json_t{{"handle", handle}});
}

void guest_agent_t::close_quietly(int64_t handle) noexcept {
  try {
    file_close(handle);
  } catch (const exception_base_t &e) {
    warn("[Guest] guest-file-close {}: {}", handle, e.message());
  } catch (const std::exception &e) {
    warn("[Guest] guest-file-close {}: {}", handle, e.what());
  }
}

std::string guest_agent_t::read_file(const std::string &path) {
  auto handle = file_open(path, "r");
  std::string rv;
  try {
    while (true) {
      auto chunk = file_read(handle, static_cast<int64_t>(options_.read_chunk));
      rv += chunk.data;
      if (chunk.eof || chunk.count == 0)
        break;
    }
  } catch (const exception_base_t &) {
    close_quietly(handle);
    throw;
  }
  file_close(handle);
  debug("[Guest] read {} bytes from {}", rv.size(), path);
  return rv;
}

void guest_agent_t::write_file(const std::string &path,
                               std::string_view content) {
  auto handle = file_open(path, "w");
  try {
    size_t written = 0;
    while (written < content.size()) {
      auto n = file_write(handle, content.substr(written));
      if (n <= 0)
        throw exception<guest_agent_error>(
            fmt::format("guest-file-write: no progress on {}", path));
      written += static_cast<size_t>(n);
    }
  } catch (const exception_base_t &) {
    close_quietly(handle);
    throw;
  }
  file_close(handle);
  debug("[Guest] wrote {} bytes to {}", content.size(), path);
}

} // namespace qga
} // namespace vmpilot
