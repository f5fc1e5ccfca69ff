#pragma once

#include <memory>
#include <type_traits>

namespace vmpilot {

class object_t : public std::enable_shared_from_this<object_t> {
public:
  object_t() = default;

  object_t(const object_t &) = default;

  object_t(object_t &&) = default;

  virtual ~object_t() = default;

  template <typename derived_t>
    requires std::is_base_of_v<object_t, derived_t>
  std::shared_ptr<derived_t> as() {
    return std::dynamic_pointer_cast<derived_t>(shared_from_this());
  }
};

template <typename t, typename... args_t>
std::shared_ptr<t> create(args_t... args) {
  return std::make_shared<t>(std::forward<args_t>(args)...);
}

} // namespace vmpilot
