#pragma once

#include <memory>
#include <optional>
#include <string>

#include "thread.hpp"

namespace vmpilot {

/**
 * @brief A byte stream carrying newline-delimited messages
 */
class line_stream_t {
public:
  virtual ~line_stream_t() = default;

  /**
   * @brief Writes `line` followed by a newline and flushes
   * @throw exception_t<disconnected> if the peer is gone
   */
  virtual void write_line(const std::string &line) = 0;

  /**
   * @brief Reads one line without its trailing newline
   * @return `std::nullopt` if no complete line arrived within `timeout`
   * @throw exception_t<disconnected> on end of stream
   */
  virtual std::optional<std::string> read_line(const duration_t &timeout) = 0;

  virtual void close() noexcept = 0;

  virtual bool is_open() const = 0;
};

/**
 * @brief Connects to a Unix domain stream socket
 * @throw exception_t<disconnected> if the connection cannot be established
 */
std::unique_ptr<line_stream_t> connect_unix_stream(const std::string &path);

} // namespace vmpilot
