#include <map>

#include <gtest/gtest.h>

#include "exception.hpp"
#include "key_compiler.hpp"

using vmpilot::key_op_t;

TEST(VmpilotKeyCompilerTest, LowercaseLetters) {
  vmpilot::key_compiler_t compiler;
  for (char32_t c = U'a'; c <= U'z'; c++) {
    std::string code(1, static_cast<char>(c));
    auto ops = compiler.compile_char(c);
    ASSERT_EQ(ops.size(), 2);
    ASSERT_EQ(ops[0], key_op_t::press(code));
    ASSERT_EQ(ops[1], key_op_t::release(code));
  }
}

TEST(VmpilotKeyCompilerTest, UppercaseLettersWrapShift) {
  vmpilot::key_compiler_t compiler;
  for (char32_t c = U'A'; c <= U'Z'; c++) {
    std::string lower(1, static_cast<char>(c - U'A' + U'a'));
    auto ops = compiler.compile_char(c);
    ASSERT_EQ(ops.size(), 4);
    ASSERT_EQ(ops[0], key_op_t::press("shift"));
    ASSERT_EQ(ops[1], key_op_t::press(lower));
    ASSERT_EQ(ops[2], key_op_t::release(lower));
    ASSERT_EQ(ops[3], key_op_t::release("shift"));
  }
}

TEST(VmpilotKeyCompilerTest, HiBang) {
  vmpilot::key_compiler_t compiler;
  auto ops = compiler.compile("Hi!");
  ASSERT_EQ(ops.size(), 10);

  vmpilot::key_sequence_t expected = {
      key_op_t::press("shift"), key_op_t::press("h"),
      key_op_t::release("h"),   key_op_t::release("shift"),
      key_op_t::press("i"),     key_op_t::release("i"),
      key_op_t::press("shift"), key_op_t::press("1"),
      key_op_t::release("1"),   key_op_t::release("shift"),
  };
  ASSERT_EQ(ops, expected);

  // Nothing may stay pressed at the end
  std::map<std::string, int> held;
  for (const auto &op : ops)
    held[op.code] += op.pressed ? 1 : -1;
  for (const auto &[code, count] : held)
    ASSERT_EQ(count, 0) << code;
}

TEST(VmpilotKeyCompilerTest, PunctuationAndWhitespace) {
  vmpilot::key_compiler_t compiler;
  ASSERT_EQ(compiler.compile_char(U' ')[0].code, "spc");
  ASSERT_EQ(compiler.compile_char(U'\n')[0].code, "ret");
  ASSERT_EQ(compiler.compile_char(U'\t')[0].code, "tab");
  ASSERT_EQ(compiler.compile_char(U'`')[0].code, "grave_accent");
  ASSERT_EQ(compiler.compile_char(U'/')[0].code, "slash");

  auto question = compiler.compile_char(U'?');
  ASSERT_EQ(question.size(), 4);
  ASSERT_EQ(question[1].code, "slash");
  auto quote = compiler.compile_char(U'"');
  ASSERT_EQ(quote.size(), 4);
  ASSERT_EQ(quote[1].code, "apostrophe");
}

TEST(VmpilotKeyCompilerTest, UnsupportedCharacter) {
  vmpilot::key_compiler_t compiler;
  ASSERT_FALSE(compiler.supports(U'\u00E9'));
  try {
    compiler.compile_char(U'\u00E9');
    FAIL();
  } catch (const vmpilot::exception_t<vmpilot::unsupported_character> &e) {
    ASSERT_EQ(static_cast<uint32_t>(e.reason().character), 0xE9u);
  }

  // The whole text fails, even when the prefix is typeable
  ASSERT_THROW(compiler.compile("abc\xc3\xa9"),
               vmpilot::exception_t<vmpilot::unsupported_character>);
  ASSERT_THROW(compiler.compile("ab\xe4\xbd\xa0"),
               vmpilot::exception_t<vmpilot::unsupported_character>);
}

TEST(VmpilotKeyCompilerTest, InvalidUtf8) {
  vmpilot::key_compiler_t compiler;
  ASSERT_THROW(compiler.compile("a\xff"),
               vmpilot::exception_t<vmpilot::unsupported_character>);
  ASSERT_THROW(compiler.compile("a\xc3"),
               vmpilot::exception_t<vmpilot::unsupported_character>);
}

TEST(VmpilotKeyCompilerTest, OverlongAndSurrogateUtf8) {
  vmpilot::key_compiler_t compiler;
  for (const char *text :
       {"\xC0\xA0", "\xC1\x81", "\xE0\x80\xA0", "\xF0\x80\x80\xA0",
        "\xED\xA0\x80", "\xF5\x80\x80\x80", "\xF4\x90\x80\x80"}) {
    try {
      compiler.compile(text);
      FAIL() << "accepted " << ::testing::PrintToString(std::string(text));
    } catch (const vmpilot::exception_t<vmpilot::unsupported_character> &e) {
      ASSERT_EQ(e.reason().character, U'\uFFFD');
    }
  }
  // shortest forms still decode
  ASSERT_EQ(compiler.compile("\x20").size(), 2u);
}

TEST(VmpilotKeyCompilerTest, EmptyText) {
  vmpilot::key_compiler_t compiler;
  ASSERT_TRUE(compiler.compile("").empty());
}

TEST(VmpilotKeyCompilerTest, NamedKeys) {
  using vmpilot::key_compiler_t;
  ASSERT_EQ(key_compiler_t::map_named_key("Enter").value_or(""), "ret");
  ASSERT_EQ(key_compiler_t::map_named_key("return").value_or(""), "ret");
  ASSERT_EQ(key_compiler_t::map_named_key("ESC").value_or(""), "esc");
  ASSERT_EQ(key_compiler_t::map_named_key("win").value_or(""), "meta_l");
  ASSERT_EQ(key_compiler_t::map_named_key("PageDown").value_or(""), "pgdn");
  ASSERT_FALSE(key_compiler_t::map_named_key("hyper").has_value());
}

TEST(VmpilotKeyCompilerTest, PressedCodes) {
  vmpilot::key_compiler_t compiler;
  auto codes = vmpilot::key_compiler_t::pressed_codes(compiler.compile("Ab"));
  std::vector<std::string> expected = {"shift", "a", "b"};
  ASSERT_EQ(codes, expected);
}

TEST(VmpilotKeyCompilerTest, Layouts) {
  ASSERT_EQ(vmpilot::parse_keyboard_layout("US").value(),
            vmpilot::keyboard_layout_t::en_us);
  ASSERT_EQ(vmpilot::parse_keyboard_layout("en-gb").value(),
            vmpilot::keyboard_layout_t::en_gb);
  ASSERT_EQ(vmpilot::parse_keyboard_layout("cn").value(),
            vmpilot::keyboard_layout_t::zh_cn);
  ASSERT_FALSE(vmpilot::parse_keyboard_layout("dvorak").has_value());
  ASSERT_EQ(vmpilot::layout_name(vmpilot::keyboard_layout_t::en_gb), "en-GB");

  vmpilot::key_compiler_t uk(vmpilot::keyboard_layout_t::en_gb);
  ASSERT_EQ(uk.layout(), vmpilot::keyboard_layout_t::en_gb);
  ASSERT_EQ(uk.compile("a").size(), 2);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
