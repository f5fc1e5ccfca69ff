#include <cstdio>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <gtest/gtest.h>
#include <unistd.h>

#include "exception.hpp"
#include "fake_qemu.hpp"
#include "monitor_session.hpp"

using namespace std::chrono_literals;
using namespace vmpilot;
namespace asio = boost::asio;

static std::string socket_path(const std::string &name) {
  return fmt::format("/tmp/vmpilot-test-{}-{}.sock", ::getpid(), name);
}

/**
 * @brief Accepts one client and answers every request with an empty return,
 * after sending a greeting
 */
class qemu_server_t {
public:
  qemu_server_t(const std::string &path, bool answer = true)
      : path_(path), acceptor_(io_) {
    ::unlink(path_.c_str());
    asio::local::stream_protocol::endpoint ep(path_);
    acceptor_.open(ep.protocol());
    acceptor_.bind(ep);
    acceptor_.listen();
    thread_ = std::thread([this, answer] { serve(answer); });
  }

  ~qemu_server_t() {
    thread_.join();
    ::unlink(path_.c_str());
  }

private:
  void serve(bool answer) {
    asio::local::stream_protocol::socket sock(io_);
    acceptor_.accept(sock);
    asio::write(sock, asio::buffer(fake::default_greeting + "\r\n"));
    if (!answer) {
      std::this_thread::sleep_for(300ms);
      return;
    }

    asio::streambuf buf;
    boost::system::error_code ec;
    while (true) {
      asio::read_until(sock, buf, '\n', ec);
      if (ec)
        break;
      std::istream is(&buf);
      std::string line;
      std::getline(is, line);
      auto req = qmp::json_t::parse(line);
      qmp::json_t reply = {{"return", qmp::json_t::object()}};
      if (req["execute"] == "query-status")
        reply["return"] = {{"status", "paused"}, {"running", false}};
      if (req["execute"] == "quit") {
        sock.close();
        break;
      }
      reply["id"] = req["id"];
      // Event and reply in one write, split across lines
      std::string out = R"({"event": "RESUME"})" "\n" + reply.dump() + "\n";
      asio::write(sock, asio::buffer(out));
    }
  }

  std::string path_;

  asio::io_context io_;

  asio::local::stream_protocol::acceptor acceptor_;

  std::thread thread_;
};

TEST(VmpilotUnixLineStreamTest, HandshakeAndCommand) {
  auto path = socket_path("handshake");
  qemu_server_t server(path);

  auto session = monitor_session_t::connect_unix(path);
  ASSERT_EQ(session->greeting().version.major, 8);

  auto status = session->query_status();
  ASSERT_EQ(status.status, "paused");
  ASSERT_FALSE(status.running);

  // One RESUME per request so far: qmp_capabilities and query-status
  ASSERT_EQ(session->drain_events().size(), 2);

  ASSERT_THROW(session->execute("quit"), exception_t<disconnected>);
}

TEST(VmpilotUnixLineStreamTest, ReadTimeout) {
  auto path = socket_path("timeout");
  qemu_server_t server(path, false);

  auto stream = connect_unix_stream(path);
  auto greeting = stream->read_line(1s);
  ASSERT_TRUE(greeting.has_value());
  ASSERT_EQ(greeting.value(), fake::default_greeting);

  auto begin = now();
  ASSERT_FALSE(stream->read_line(50ms).has_value());
  ASSERT_GE(now() - begin, 50ms);

  // Server closes after a while
  ASSERT_THROW(stream->read_line(2s), exception_t<disconnected>);
}

TEST(VmpilotUnixLineStreamTest, NoSuchSocket) {
  ASSERT_THROW(connect_unix_stream(socket_path("missing")),
               exception_t<disconnected>);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
