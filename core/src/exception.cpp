#include "exception.hpp"

#include <cpptrace/cpptrace.hpp>

namespace vmpilot {

std::string build_errstr(const char *what) {
  auto trace = cpptrace::generate_trace();
  auto &frames = trace.frames;
  while (true) {
    if (frames.empty())
      break;
    auto front_symbol = frames.at(0).symbol;
    if (front_symbol.starts_with("vmpilot::build_errstr") ||
        front_symbol.starts_with("vmpilot::exception_t"))
      frames.erase(frames.begin());
    else
      break;
  }
  return fmt::format("\033[1;31m{}\033[0m\n{}", what, trace.to_string(true));
}

} // namespace vmpilot
