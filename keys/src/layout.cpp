#include <algorithm>
#include <utility>

#include "key_compiler.hpp"

namespace vmpilot {

static const std::pair<char32_t, const char *> direct_keys[] = {
    {U' ', "spc"},           {U'\n', "ret"},          {U'\t', "tab"},
    {U'.', "dot"},           {U',', "comma"},         {U'/', "slash"},
    {U';', "semicolon"},     {U'\'', "apostrophe"},   {U'[', "bracket_left"},
    {U']', "bracket_right"}, {U'\\', "backslash"},    {U'-', "minus"},
    {U'=', "equal"},         {U'`', "grave_accent"},
};

// Characters typed with shift held on a US keyboard
static const std::pair<char32_t, const char *> shifted_keys[] = {
    {U'!', "1"},
    {U'@', "2"},
    {U'#', "3"},
    {U'$', "4"},
    {U'%', "5"},
    {U'^', "6"},
    {U'&', "7"},
    {U'*', "8"},
    {U'(', "9"},
    {U')', "0"},
    {U'_', "minus"},
    {U'+', "equal"},
    {U'~', "grave_accent"},
    {U'{', "bracket_left"},
    {U'}', "bracket_right"},
    {U'|', "backslash"},
    {U':', "semicolon"},
    {U'"', "apostrophe"},
    {U'<', "comma"},
    {U'>', "dot"},
    {U'?', "slash"},
};

static key_sequence_t tap(const std::string &code) {
  return {key_op_t::press(code), key_op_t::release(code)};
}

static key_sequence_t shift_tap(const std::string &code) {
  return {key_op_t::press("shift"), key_op_t::press(code),
          key_op_t::release(code), key_op_t::release("shift")};
}

static key_mapping_t build_us_mapping() {
  key_mapping_t rv;
  for (char c = 'a'; c <= 'z'; c++) {
    std::string code(1, c);
    rv.emplace(static_cast<char32_t>(c), tap(code));
    rv.emplace(static_cast<char32_t>(c - 'a' + 'A'), shift_tap(code));
  }
  for (char c = '0'; c <= '9'; c++)
    rv.emplace(static_cast<char32_t>(c), tap(std::string(1, c)));
  for (const auto &[ch, code] : direct_keys)
    rv.emplace(ch, tap(code));
  for (const auto &[ch, code] : shifted_keys)
    rv.emplace(ch, shift_tap(code));
  return rv;
}

std::optional<keyboard_layout_t> parse_keyboard_layout(std::string_view name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
  if (lower == "en-us" || lower == "us")
    return keyboard_layout_t::en_us;
  else if (lower == "en-gb" || lower == "uk")
    return keyboard_layout_t::en_gb;
  else if (lower == "zh-cn" || lower == "cn")
    return keyboard_layout_t::zh_cn;
  return std::nullopt;
}

std::string_view layout_name(keyboard_layout_t layout) {
  switch (layout) {
  case keyboard_layout_t::en_us:
    return "en-US";
  case keyboard_layout_t::en_gb:
    return "en-GB";
  case keyboard_layout_t::zh_cn:
    return "zh-CN";
  }
  return "unknown";
}

key_mapping_t build_key_mapping(keyboard_layout_t layout) {
  switch (layout) {
  case keyboard_layout_t::en_us:
    return build_us_mapping();
  default:
    // TODO: dedicated tables for en-GB (`"` and `@` swapped, `#` key) and
    // zh-CN
    return build_us_mapping();
  }
}

} // namespace vmpilot
