#include <istream>
#include <utility>

#include <boost/asio.hpp>

#include "exception.hpp"
#include "line_stream.hpp"
#include "logging.hpp"

namespace asio = boost::asio;

namespace vmpilot {

class unix_line_stream_t : public line_stream_t {
public:
  unix_line_stream_t(const std::string &path) : io_(), socket_(io_), path_(path) {
    boost::system::error_code ec;
    socket_.connect(asio::local::stream_protocol::endpoint(path), ec);
    if (ec)
      throw exception<disconnected>(
          fmt::format("cannot connect to {}: {}", path, ec.message()));
    debug("[Transport] connected to {}", path_);
  }

  ~unix_line_stream_t() override { close(); }

  void write_line(const std::string &line) override {
    if (!socket_.is_open())
      throw exception<disconnected>("stream closed");
    std::string data = line + "\n";
    boost::system::error_code ec;
    asio::write(socket_, asio::buffer(data), ec);
    if (ec)
      throw exception<disconnected>(ec.message());
  }

  std::optional<std::string> read_line(const duration_t &timeout) override {
    if (!socket_.is_open())
      throw exception<disconnected>("stream closed");

    bool done = false;
    boost::system::error_code ec;
    asio::async_read_until(socket_, buf_, '\n',
                           [&](const boost::system::error_code &e, size_t) {
                             ec = e;
                             done = true;
                           });
    io_.restart();
    io_.run_for(timeout);
    if (!done) {
      // Deadline passed; cancel and let the handler run
      boost::system::error_code cancel_ec;
      socket_.cancel(cancel_ec);
      if (cancel_ec)
        warn("[Transport] cancel {}: {}", path_, cancel_ec.message());
      io_.restart();
      while (!done)
        io_.run_one();
      if (ec == asio::error::operation_aborted)
        return std::nullopt;
    }

    if (ec == asio::error::eof)
      throw exception<disconnected>("end of stream");
    else if (ec)
      throw exception<disconnected>(ec.message());

    std::istream is(&buf_);
    std::string line;
    std::getline(is, line);
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    return line;
  }

  void close() noexcept override {
    if (!socket_.is_open())
      return;
    boost::system::error_code ec;
    socket_.shutdown(asio::local::stream_protocol::socket::shutdown_both, ec);
    socket_.close(ec);
    if (ec)
      debug("[Transport] close {}: {}", path_, ec.message());
  }

  bool is_open() const override { return socket_.is_open(); }

private:
  asio::io_context io_;

  asio::local::stream_protocol::socket socket_;

  asio::streambuf buf_;

  std::string path_;
};

std::unique_ptr<line_stream_t> connect_unix_stream(const std::string &path) {
  return std::make_unique<unix_line_stream_t>(path);
}

} // namespace vmpilot
