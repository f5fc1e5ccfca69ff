#include <gtest/gtest.h>

#include "exception.hpp"
#include "fake_qemu.hpp"
#include "monitor_session.hpp"

using namespace std::chrono_literals;
using namespace vmpilot;

static session_options_t quick_options() {
  session_options_t options;
  options.handshake_timeout = 200ms;
  options.command_timeout = 200ms;
  return options;
}

TEST(VmpilotMonitorSessionTest, HandshakeNegotiatesFirst) {
  auto qemu = std::make_shared<fake::fake_qemu_t>();
  auto session = monitor_session_t::connect(fake::make_stream(qemu));
  ASSERT_EQ(qemu->commands(), std::vector<std::string>{"qmp_capabilities"});
  ASSERT_EQ(session->greeting().version.major, 8);
  ASSERT_EQ(session->greeting().capabilities, std::vector<std::string>{"oob"});

  session->query_status();
  auto commands = qemu->commands();
  ASSERT_EQ(commands.size(), 2);
  ASSERT_EQ(commands[0], "qmp_capabilities");
  ASSERT_EQ(commands[1], "query-status");
}

TEST(VmpilotMonitorSessionTest, GreetingWithoutCapabilities) {
  auto qemu = std::make_shared<fake::fake_qemu_t>();
  qemu->greeting =
      R"({"QMP": {"version": {"qemu": {"micro": 0, "minor": 2, "major": 8}, "package": ""}}})";
  ASSERT_THROW(monitor_session_t::connect(fake::make_stream(qemu), quick_options()),
               exception_t<handshake_failed>);
  ASSERT_EQ(qemu->count("qmp_capabilities"), 0);
}

TEST(VmpilotMonitorSessionTest, GarbageGreeting) {
  auto qemu = std::make_shared<fake::fake_qemu_t>();
  qemu->greeting = "SSH-2.0-OpenSSH_9.6";
  ASSERT_THROW(monitor_session_t::connect(fake::make_stream(qemu), quick_options()),
               exception_t<handshake_failed>);
}

TEST(VmpilotMonitorSessionTest, NoGreeting) {
  auto qemu = std::make_shared<fake::fake_qemu_t>();
  qemu->greeting = "";
  ASSERT_THROW(monitor_session_t::connect(fake::make_stream(qemu), quick_options()),
               exception_t<handshake_failed>);
}

TEST(VmpilotMonitorSessionTest, NegotiationRejected) {
  auto qemu = std::make_shared<fake::fake_qemu_t>();
  qemu->fail("qmp_capabilities", "CommandNotFound",
             "Capabilities negotiation is already complete");
  ASSERT_THROW(monitor_session_t::connect(fake::make_stream(qemu), quick_options()),
               exception_t<handshake_failed>);
}

TEST(VmpilotMonitorSessionTest, CommandFailedFieldsVerbatim) {
  auto qemu = std::make_shared<fake::fake_qemu_t>();
  auto session = monitor_session_t::connect(fake::make_stream(qemu));
  qemu->fail("send-key", "GenericError", "Parameter 'keys.0' is missing: \"data\"");
  try {
    session->send_key("a");
    FAIL();
  } catch (const exception_t<command_failed> &e) {
    ASSERT_EQ(e.reason().error_class, "GenericError");
    ASSERT_EQ(e.reason().description, "Parameter 'keys.0' is missing: \"data\"");
  }
  // The session stays usable
  ASSERT_TRUE(session->query_status().running);
}

TEST(VmpilotMonitorSessionTest, MalformedResponse) {
  auto qemu = std::make_shared<fake::fake_qemu_t>();
  auto session = monitor_session_t::connect(fake::make_stream(qemu));
  qemu->script("query-status", std::string("{oops"));
  ASSERT_THROW(session->query_status(), exception_t<parse_error>);

  qemu->script("query-status", {{"greeting", "hi"}});
  ASSERT_THROW(session->query_status(), exception_t<parse_error>);

  qemu->script("query-status", {{"return", {{"status", "running"}}}});
  ASSERT_THROW(session->query_status(), exception_t<parse_error>);
}

TEST(VmpilotMonitorSessionTest, IdMismatch) {
  auto qemu = std::make_shared<fake::fake_qemu_t>();
  auto session = monitor_session_t::connect(fake::make_stream(qemu));
  qemu->script("query-status", {{"return", qmp::json_t::object()}, {"id", "someone-else"}});
  ASSERT_THROW(session->query_status(), exception_t<parse_error>);
}

TEST(VmpilotMonitorSessionTest, EventsAreSetAside) {
  auto qemu = std::make_shared<fake::fake_qemu_t>();
  auto session = monitor_session_t::connect(fake::make_stream(qemu));
  qemu->emit_before("query-status", {{"event", "RESUME"},
                                     {"timestamp", {{"seconds", 1}, {"microseconds", 2}}}});
  qemu->emit_before("query-status", {{"event", "POWERDOWN"}, {"data", qmp::json_t::object()}});

  auto status = session->query_status();
  ASSERT_EQ(status.status, "running");
  ASSERT_TRUE(status.running);

  auto events = session->drain_events();
  ASSERT_EQ(events.size(), 2);
  ASSERT_EQ(events[0].name, "RESUME");
  ASSERT_EQ(events[1].name, "POWERDOWN");
  ASSERT_TRUE(session->drain_events().empty());
}

TEST(VmpilotMonitorSessionTest, TimeoutThenLateResponse) {
  auto qemu = std::make_shared<fake::fake_qemu_t>();
  auto session = monitor_session_t::connect(fake::make_stream(qemu), quick_options());
  qemu->mute("human-monitor-command");
  qmp::json_t args = {{"command-line", "info status"}};
  ASSERT_THROW(session->execute("human-monitor-command", args),
               exception_t<timeout>);

  // The late answer of the abandoned request must not be taken for the next one
  qemu->push_line(R"({"return": "late", "id": "vmpilot-1"})");
  auto status = session->query_status();
  ASSERT_EQ(status.status, "running");
  ASSERT_EQ(session->abandoned(), 0u);
}

TEST(VmpilotMonitorSessionTest, AbandonedRequestsAreBounded) {
  auto qemu = std::make_shared<fake::fake_qemu_t>();
  session_options_t options;
  options.command_timeout = 1ms;
  auto session = monitor_session_t::connect(fake::make_stream(qemu), options);
  qemu->mute("query-status");

  for (size_t i = 0; i < monitor_session_t::max_abandoned + 8; i++)
    ASSERT_THROW(session->query_status(), exception_t<timeout>);
  ASSERT_EQ(session->abandoned(), monitor_session_t::max_abandoned);

  session->close();
  ASSERT_EQ(session->abandoned(), 0u);
  ASSERT_THROW(session->query_status(), exception_t<disconnected>);
}

TEST(VmpilotMonitorSessionTest, HangUp) {
  auto qemu = std::make_shared<fake::fake_qemu_t>();
  auto session = monitor_session_t::connect(fake::make_stream(qemu));
  qemu->hang_up();
  ASSERT_THROW(session->query_status(), exception_t<disconnected>);
}

TEST(VmpilotMonitorSessionTest, Close) {
  auto qemu = std::make_shared<fake::fake_qemu_t>();
  auto session = monitor_session_t::connect(fake::make_stream(qemu));
  session->close();
  ASSERT_FALSE(session->is_open());
  ASSERT_THROW(session->query_status(), exception_t<disconnected>);
}

TEST(VmpilotMonitorSessionTest, KeyRequests) {
  auto qemu = std::make_shared<fake::fake_qemu_t>();
  auto session = monitor_session_t::connect(fake::make_stream(qemu));
  session->send_keys({"ctrl", "alt", "delete"}, 200);
  session->send_key_event(key_op_t::press("shift"));

  auto send_key = qemu->requests_of("send-key");
  ASSERT_EQ(send_key.size(), 1);
  ASSERT_EQ(send_key[0]["arguments"]["keys"].size(), 3);
  ASSERT_EQ(send_key[0]["arguments"]["keys"][2]["data"], "delete");
  ASSERT_EQ(send_key[0]["arguments"]["hold-time"], 200);

  auto input = qemu->requests_of("input-send-event");
  ASSERT_EQ(input.size(), 1);
  auto &event = input[0]["arguments"]["events"][0];
  ASSERT_EQ(event["type"], "key");
  ASSERT_EQ(event["data"]["key"]["data"], "shift");
  ASSERT_EQ(event["data"]["down"], true);
}

TEST(VmpilotMonitorSessionTest, QueryVersion) {
  auto qemu = std::make_shared<fake::fake_qemu_t>();
  auto session = monitor_session_t::connect(fake::make_stream(qemu));
  auto version = session->query_version();
  ASSERT_EQ(version.major, 8);
  ASSERT_EQ(version.minor, 2);
  ASSERT_EQ(version.package, "Debian 1:8.2.0");
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
