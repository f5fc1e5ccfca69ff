/**
 * @file key_compiler.hpp
 * @brief Text to key-code operations
 * @details
 *
 * `key_compiler_t` turns UTF-8 text into an ordered list of `key_op_t`, the
 * press/release operations a keyboard would generate to type it. Key codes are
 * QEMU qcodes ("a", "shift", "ret", ...).
 *
 * Characters that need a modifier are wrapped individually:
 *
 * ```
 * 'H' -> press(shift) press(h) release(h) release(shift)
 * ```
 *
 * so that no modifier is left pressed between characters.
 *
 * The mapping table is built once in the constructor and never mutated, so a
 * single `std::shared_ptr<const key_compiler_t>` can be shared between threads.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace vmpilot {

enum class keyboard_layout_t { en_us, en_gb, zh_cn };

/**
 * @brief Parses "en-us"/"us", "en-gb"/"uk", "zh-cn"/"cn" (case-insensitive)
 */
std::optional<keyboard_layout_t> parse_keyboard_layout(std::string_view name);

/**
 * @return "en-US", "en-GB" or "zh-CN"
 */
std::string_view layout_name(keyboard_layout_t layout);

struct key_op_t {
  static key_op_t press(const std::string &code) { return {code, true}; }

  static key_op_t release(const std::string &code) { return {code, false}; }

  bool operator==(const key_op_t &other) const = default;

  std::string code;

  bool pressed;
};

using key_sequence_t = std::vector<key_op_t>;

using key_mapping_t = std::unordered_map<char32_t, key_sequence_t>;

/**
 * @brief Builds the character table of a layout
 * @note Only en-US has its own table; other layouts currently share it.
 */
key_mapping_t build_key_mapping(keyboard_layout_t layout);

class key_compiler_t {
public:
  explicit key_compiler_t(
      keyboard_layout_t layout = keyboard_layout_t::en_us);

  /**
   * @brief Compiles UTF-8 text
   * @throw exception_t<unsupported_character> on the first unmapped character
   * or invalid UTF-8. Nothing is returned in that case.
   */
  key_sequence_t compile(std::string_view text) const;

  /**
   * @throw exception_t<unsupported_character>
   */
  key_sequence_t compile_char(char32_t ch) const;

  bool supports(char32_t ch) const { return mapping_.contains(ch); }

  keyboard_layout_t layout() const { return layout_; }

  const key_mapping_t &mapping() const { return mapping_; }

  /**
   * @brief Resolves a human key name ("Enter", "esc", "PageUp") to a qcode
   */
  static std::optional<std::string> map_named_key(std::string_view name);

  /**
   * @brief Codes of the press operations, in press order
   */
  static std::vector<std::string> pressed_codes(const key_sequence_t &ops);

private:
  keyboard_layout_t layout_;

  key_mapping_t mapping_;
};

} // namespace vmpilot
