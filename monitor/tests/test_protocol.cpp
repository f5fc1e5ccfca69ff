#include <gtest/gtest.h>

#include "exception.hpp"
#include "protocol.hpp"

using namespace vmpilot;

TEST(VmpilotProtocolTest, DumpRequest) {
  auto line = qmp::dump_request({"query-status", std::nullopt, "vmpilot-3"});
  auto j = qmp::json_t::parse(line);
  ASSERT_EQ(j["execute"], "query-status");
  ASSERT_EQ(j["id"], "vmpilot-3");
  ASSERT_FALSE(j.contains("arguments"));
  ASSERT_EQ(line.find('\n'), std::string::npos);

  auto bare = qmp::json_t::parse(
      qmp::dump_request({"qmp_capabilities", std::nullopt, std::nullopt}));
  ASSERT_EQ(bare, qmp::json_t({{"execute", "qmp_capabilities"}}));
}

TEST(VmpilotProtocolTest, LoadReturn) {
  auto msg = qmp::load_message(R"({"return": {"status": "paused"}, "id": "x"})");
  ASSERT_TRUE(std::holds_alternative<qmp::response_t>(msg));
  auto &res = std::get<qmp::response_t>(msg);
  ASSERT_FALSE(res.is_error());
  ASSERT_EQ(res.result.value()["status"], "paused");
  ASSERT_EQ(res.id.value(), "x");
}

TEST(VmpilotProtocolTest, LoadError) {
  auto msg = qmp::load_message(
      R"({"error": {"class": "DeviceNotFound", "desc": "Device 'x' not found"}})");
  auto &res = std::get<qmp::response_t>(msg);
  ASSERT_TRUE(res.is_error());
  ASSERT_EQ(res.error->error_class, "DeviceNotFound");
  ASSERT_EQ(res.error->description, "Device 'x' not found");
  ASSERT_FALSE(res.id.has_value());
}

TEST(VmpilotProtocolTest, LoadEvent) {
  auto msg = qmp::load_message(
      R"({"event": "STOP", "timestamp": {"seconds": 1700000000, "microseconds": 42}})");
  ASSERT_TRUE(std::holds_alternative<qmp::event_t>(msg));
  auto &event = std::get<qmp::event_t>(msg);
  ASSERT_EQ(event.name, "STOP");
  ASSERT_EQ(event.timestamp->seconds, 1700000000);
  ASSERT_EQ(event.timestamp->microseconds, 42);
}

TEST(VmpilotProtocolTest, MalformedMessages) {
  using parse_error_t = exception_t<parse_error>;
  ASSERT_THROW(qmp::load_message("not json"), parse_error_t);
  ASSERT_THROW(qmp::load_message("[1, 2]"), parse_error_t);
  ASSERT_THROW(qmp::load_message(R"({"id": "a"})"), parse_error_t);
  ASSERT_THROW(
      qmp::load_message(R"({"return": {}, "error": {"class": "a", "desc": "b"}})"),
      parse_error_t);
  ASSERT_THROW(qmp::load_message(R"({"error": {"class": "GenericError"}})"),
               parse_error_t);
  ASSERT_THROW(qmp::load_message(R"({"error": "boom"})"), parse_error_t);
}

TEST(VmpilotProtocolTest, Greeting) {
  auto greeting = qmp::load_greeting(
      R"({"QMP": {"version": {"qemu": {"micro": 1, "minor": 2, "major": 7}, "package": "v7.2.1"}, "capabilities": ["oob"]}})");
  ASSERT_EQ(greeting.version.major, 7);
  ASSERT_EQ(greeting.version.minor, 2);
  ASSERT_EQ(greeting.version.micro, 1);
  ASSERT_EQ(greeting.version.package, "v7.2.1");
  ASSERT_EQ(greeting.capabilities, std::vector<std::string>{"oob"});
}

TEST(VmpilotProtocolTest, BadGreeting) {
  using handshake_t = exception_t<handshake_failed>;
  ASSERT_THROW(qmp::load_greeting("hello"), handshake_t);
  ASSERT_THROW(qmp::load_greeting(R"({"return": {}})"), handshake_t);
  ASSERT_THROW(
      qmp::load_greeting(
          R"({"QMP": {"version": {"qemu": {"micro": 0, "minor": 2, "major": 8}, "package": ""}}})"),
      handshake_t);
  ASSERT_THROW(qmp::load_greeting(R"({"QMP": {"capabilities": []}})"),
               handshake_t);
  ASSERT_THROW(
      qmp::load_greeting(
          R"({"QMP": {"version": {"qemu": {"major": 8}}, "capabilities": []}})"),
      handshake_t);
}

TEST(VmpilotProtocolTest, KeyArguments) {
  auto args = qmp::send_key_arguments({"ctrl", "alt", "delete"}, 100);
  ASSERT_EQ(args["keys"].size(), 3);
  ASSERT_EQ(args["keys"][0], qmp::json_t({{"type", "qcode"}, {"data", "ctrl"}}));
  ASSERT_EQ(args["hold-time"], 100);
  ASSERT_FALSE(qmp::send_key_arguments({"a"}).contains("hold-time"));

  auto event = qmp::key_event_arguments(key_op_t::release("shift"));
  auto expected = qmp::json_t::parse(
      R"({"events": [{"type": "key", "data": {"key": {"type": "qcode", "data": "shift"}, "down": false}}]})");
  ASSERT_EQ(event, expected);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
