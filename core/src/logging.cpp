#include "logging.hpp"

#include <algorithm>
#include <cstdlib>
#include <optional>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace vmpilot {

static std::optional<spdlog::level::level_enum>
parse_level(const std::string &level) {
  std::string lvl = level;
  std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::tolower);
  if (lvl == "trace")
    return spdlog::level::trace;
  else if (lvl == "debug")
    return spdlog::level::debug;
  else if (lvl == "info")
    return spdlog::level::info;
  else if (lvl == "warn" || lvl == "warning")
    return spdlog::level::warn;
  else if (lvl == "error")
    return spdlog::level::err;
  else if (lvl == "critical")
    return spdlog::level::critical;
  else if (lvl == "off")
    return spdlog::level::off;
  return std::nullopt;
}

std::shared_ptr<spdlog::logger> get_logger() {
  static std::shared_ptr<spdlog::logger> logger = [] {
    auto logger = spdlog::stdout_color_mt("VMPILOT");

    // `set_log_level` goes through `get_logger`, so the env level is applied
    // here directly
    if (const char *env = std::getenv("VMPILOT_LOG_LEVEL")) {
      auto lvl = parse_level(env);
      if (lvl.has_value())
        logger->set_level(lvl.value());
      else
        logger->warn("Unknown log level: {}", env);
    }
    return logger;
  }();
  return logger;
}

void set_log_level(const std::string &level) {
  auto lvl = parse_level(level);
  if (lvl.has_value())
    get_logger()->set_level(lvl.value());
  else
    get_logger()->warn("Unknown log level: {}", level);
}

void set_log_format(const std::string &fmt) { get_logger()->set_pattern(fmt); }

void debug(const std::string &msg) { get_logger()->debug(msg); }

void info(const std::string &msg) { get_logger()->info(msg); }

void warn(const std::string &msg) { get_logger()->warn(msg); }

void error(const std::string &msg) { get_logger()->error(msg); }

void critical(const std::string &msg) { get_logger()->critical(msg); }

} // namespace vmpilot
