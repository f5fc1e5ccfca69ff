#pragma once

#include <string>

#include <fmt/format.h>

namespace vmpilot {

void set_log_level(const std::string &level);

void set_log_format(const std::string &fmt);

void debug(const std::string &msg);

template <typename... args_t>
inline void debug(fmt::format_string<args_t...> fmt, args_t &&...args) {
  return debug(fmt::format(fmt, std::forward<args_t>(args)...));
}

void info(const std::string &msg);

template <typename... args_t>
inline void info(fmt::format_string<args_t...> fmt, args_t &&...args) {
  return info(fmt::format(fmt, std::forward<args_t>(args)...));
}

void warn(const std::string &msg);

template <typename... args_t>
inline void warn(fmt::format_string<args_t...> fmt, args_t &&...args) {
  return warn(fmt::format(fmt, std::forward<args_t>(args)...));
}

void error(const std::string &msg);

template <typename... args_t>
inline void error(fmt::format_string<args_t...> fmt, args_t &&...args) {
  return error(fmt::format(fmt, std::forward<args_t>(args)...));
}

void critical(const std::string &msg);

template <typename... args_t>
inline void critical(fmt::format_string<args_t...> fmt, args_t &&...args) {
  return critical(fmt::format(fmt, std::forward<args_t>(args)...));
}

} // namespace vmpilot
