#include "key_compiler.hpp"

#include <algorithm>

#include <magic_enum/magic_enum.hpp>

#include "exception.hpp"
#include "logging.hpp"

namespace vmpilot {

static std::string encode_utf8(char32_t cp) {
  std::string rv;
  if (cp < 0x80) {
    rv.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    rv.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    rv.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    rv.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    rv.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    rv.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    rv.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    rv.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    rv.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    rv.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
  return rv;
}

/**
 * @brief Decodes one code point starting at `pos` and advances `pos`
 * @throw exception_t<unsupported_character> on a malformed sequence
 */
static char32_t decode_utf8(std::string_view text, size_t &pos) {
  auto invalid = [&](size_t len) {
    std::string raw(text.substr(pos, std::max<size_t>(len, 1)));
    return exception<unsupported_character>(U'\uFFFD', raw);
  };

  unsigned char lead = static_cast<unsigned char>(text[pos]);
  size_t len;
  char32_t cp;
  if (lead < 0x80) {
    pos++;
    return lead;
  } else if (lead == 0xC0 || lead == 0xC1 || lead > 0xF4) {
    throw invalid(1);
  } else if ((lead & 0xE0) == 0xC0) {
    len = 2;
    cp = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    len = 3;
    cp = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    len = 4;
    cp = lead & 0x07;
  } else
    throw invalid(1);

  if (pos + len > text.size())
    throw invalid(text.size() - pos);
  for (size_t i = 1; i < len; i++) {
    unsigned char c = static_cast<unsigned char>(text[pos + i]);
    if ((c & 0xC0) != 0x80)
      throw invalid(i + 1);
    cp = (cp << 6) | (c & 0x3F);
  }
  // overlong forms, surrogates and code points past U+10FFFF
  static constexpr char32_t min_cp[] = {0, 0, 0x80, 0x800, 0x10000};
  if (cp < min_cp[len] || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
    throw invalid(len);
  pos += len;
  return cp;
}

key_compiler_t::key_compiler_t(keyboard_layout_t layout)
    : layout_(layout), mapping_(build_key_mapping(layout)) {
  debug("[KeyCompiler] {} layout with {} characters",
        magic_enum::enum_name(layout_), mapping_.size());
}

key_sequence_t key_compiler_t::compile(std::string_view text) const {
  key_sequence_t rv;
  size_t pos = 0;
  while (pos < text.size()) {
    char32_t ch = decode_utf8(text, pos);
    auto it = mapping_.find(ch);
    if (it == mapping_.end())
      throw exception<unsupported_character>(ch, encode_utf8(ch));
    rv.insert(rv.end(), it->second.begin(), it->second.end());
  }
  return rv;
}

key_sequence_t key_compiler_t::compile_char(char32_t ch) const {
  auto it = mapping_.find(ch);
  if (it == mapping_.end())
    throw exception<unsupported_character>(ch, encode_utf8(ch));
  return it->second;
}

std::optional<std::string>
key_compiler_t::map_named_key(std::string_view name) {
  static const std::unordered_map<std::string, std::string> named_keys = {
      {"enter", "ret"},       {"return", "ret"},     {"space", "spc"},
      {"tab", "tab"},         {"backspace", "backspace"},
      {"delete", "delete"},   {"escape", "esc"},     {"esc", "esc"},
      {"shift", "shift"},     {"ctrl", "ctrl"},      {"control", "ctrl"},
      {"alt", "alt"},         {"meta", "meta_l"},    {"super", "meta_l"},
      {"win", "meta_l"},      {"up", "up"},          {"down", "down"},
      {"left", "left"},       {"right", "right"},    {"home", "home"},
      {"end", "end"},         {"pageup", "pgup"},    {"pagedown", "pgdn"},
      {"insert", "insert"},
  };
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
  auto it = named_keys.find(lower);
  if (it == named_keys.end())
    return std::nullopt;
  return it->second;
}

std::vector<std::string>
key_compiler_t::pressed_codes(const key_sequence_t &ops) {
  std::vector<std::string> rv;
  for (const auto &op : ops) {
    if (op.pressed)
      rv.push_back(op.code);
  }
  return rv;
}

} // namespace vmpilot
