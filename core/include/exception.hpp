/**
 * @file exception.hpp
 * @brief Error reasons and the exception type that carries them
 * @details
 *
 * Every error raised by vmpilot is an `exception_t<reason_t>`, where
 * `reason_t` is a small struct describing what went wrong. The reason is kept
 * inside the exception, so handlers can read structured fields back:
 *
 * ```cpp
 * try {
 *   session->execute("query-status");
 * } catch (const vmpilot::exception_t<vmpilot::command_failed> &e) {
 *   std::cout << e.reason().error_class << std::endl;
 * }
 * ```
 *
 * `what()` additionally carries a stack trace of the throw site, while
 * `message()` returns the plain reason text.
 */
#pragma once

#include <concepts>
#include <exception>
#include <string>

#include <fmt/format.h>

namespace vmpilot {

std::string build_errstr(const char *what);

template <typename T>
concept is_exception_reason = requires(T t) {
  requires noexcept(t.what());
  { t.what() } -> std::same_as<const char *>;
};

struct runtime_error {
  runtime_error() : errstr_("Internal error") {}

  runtime_error(const std::string &what) : errstr_(what) {}

  const char *what() const noexcept { return errstr_.c_str(); }

  operator std::string() const { return errstr_; }

  std::string errstr_;
};

static_assert(is_exception_reason<runtime_error>);

struct value_error {
  value_error() : value_error("Value error") {}

  value_error(const std::string &what) : errstr_(what) {}

  value_error(const std::string &context, const std::string &name)
      : errstr_(fmt::format("[{}] Value error: {}", context, name)) {}

  value_error(const std::string &context, const std::string &name,
              const std::string &expected, const std::string &actual)
      : errstr_(fmt::format(
            "[{}] Value error:\n - name: {}\n - expected: {}\n - actual: {}",
            context, name, expected, actual)) {}

  const char *what() const noexcept { return errstr_.c_str(); }

  operator std::string() const { return errstr_; }

  std::string errstr_;
};

static_assert(is_exception_reason<value_error>);

/*
 * Monitor protocol
 */

struct handshake_failed {
  handshake_failed(const std::string &what)
      : errstr_(fmt::format("Handshake failed: {}", what)) {}

  const char *what() const noexcept { return errstr_.c_str(); }

  std::string errstr_;
};

static_assert(is_exception_reason<handshake_failed>);

/**
 * @brief The peer answered a request with an error object
 * @details `error_class` and `description` are the peer's fields verbatim.
 */
struct command_failed {
  command_failed(const std::string &error_class, const std::string &description)
      : error_class(error_class), description(description),
        errstr_(fmt::format("Command failed: {}: {}", error_class,
                            description)) {}

  const char *what() const noexcept { return errstr_.c_str(); }

  std::string error_class;
  std::string description;
  std::string errstr_;
};

static_assert(is_exception_reason<command_failed>);

struct parse_error {
  parse_error(const std::string &what)
      : errstr_(fmt::format("Parse error: {}", what)) {}

  const char *what() const noexcept { return errstr_.c_str(); }

  std::string errstr_;
};

static_assert(is_exception_reason<parse_error>);

struct disconnected {
  disconnected() : errstr_("Disconnected") {}

  disconnected(const std::string &what)
      : errstr_(fmt::format("Disconnected: {}", what)) {}

  const char *what() const noexcept { return errstr_.c_str(); }

  std::string errstr_;
};

static_assert(is_exception_reason<disconnected>);

struct timeout {
  timeout(const std::string &what)
      : errstr_(fmt::format("Timeout: {}", what)) {}

  const char *what() const noexcept { return errstr_.c_str(); }

  std::string errstr_;
};

static_assert(is_exception_reason<timeout>);

/*
 * Key compilation
 */

struct unsupported_character {
  unsupported_character(char32_t character, const std::string &utf8)
      : character(character),
        errstr_(fmt::format("Unsupported character: '{}' (U+{:04X})", utf8,
                            static_cast<uint32_t>(character))) {}

  const char *what() const noexcept { return errstr_.c_str(); }

  char32_t character;
  std::string errstr_;
};

static_assert(is_exception_reason<unsupported_character>);

/*
 * Guest agent
 */

struct guest_agent_error {
  guest_agent_error(const std::string &what)
      : errstr_(fmt::format("Guest agent error: {}", what)) {}

  const char *what() const noexcept { return errstr_.c_str(); }

  std::string errstr_;
};

static_assert(is_exception_reason<guest_agent_error>);

/*
 * Orchestrator
 */

struct vm_not_found {
  vm_not_found(const std::string &name)
      : name(name), errstr_(fmt::format("VM not found: {}", name)) {}

  vm_not_found(const std::string &name, const std::string &detail)
      : name(name), errstr_(fmt::format("VM not found: {} ({})", name, detail)) {
  }

  const char *what() const noexcept { return errstr_.c_str(); }

  std::string name;
  std::string errstr_;
};

static_assert(is_exception_reason<vm_not_found>);

struct actor_not_found {
  actor_not_found(const std::string &name)
      : name(name), errstr_(fmt::format("Actor not found: {}", name)) {}

  const char *what() const noexcept { return errstr_.c_str(); }

  std::string name;
  std::string errstr_;
};

static_assert(is_exception_reason<actor_not_found>);

struct actor_already_exists {
  actor_already_exists(const std::string &name)
      : name(name), errstr_(fmt::format("Actor already exists: {}", name)) {}

  const char *what() const noexcept { return errstr_.c_str(); }

  std::string name;
  std::string errstr_;
};

static_assert(is_exception_reason<actor_already_exists>);

struct command_rejected {
  command_rejected(const std::string &name, const std::string &why)
      : name(name),
        errstr_(fmt::format("Command rejected by {}: {}", name, why)) {}

  const char *what() const noexcept { return errstr_.c_str(); }

  std::string name;
  std::string errstr_;
};

static_assert(is_exception_reason<command_rejected>);

/**
 * @brief Common base of every `exception_t`
 */
class exception_base_t : public std::exception {
public:
  /**
   * @brief Reason text without the stack trace
   */
  virtual const char *message() const noexcept = 0;
};

template <typename T = runtime_error>
  requires is_exception_reason<T>
class exception_t : public exception_base_t {
public:
  template <typename... TArgs>
    requires std::constructible_from<T, TArgs...>
  exception_t(TArgs... args)
      : exception_base_t(), reason_(args...),
        errstr_(build_errstr(reason_.what())) {}

  const char *what() const noexcept override { return errstr_.c_str(); }

  const char *message() const noexcept override { return reason_.what(); }

  const T &reason() const noexcept { return reason_; }

private:
  T reason_;
  std::string errstr_;
};

template <typename T = runtime_error, typename... TArgs>
exception_t<T> exception(TArgs... args) {
  return exception_t<T>{args...};
}

} // namespace vmpilot
