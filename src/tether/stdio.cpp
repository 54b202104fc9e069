#include "stdio.hpp"

#include <unistd.h>

#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <memory>

#include "logger.hpp"
#include "tether/connection.hpp"
#include "tether/jsonrpc.hpp"

namespace tether {

namespace net = boost::asio;

/// Connection

struct stdio_connection : connection {
  explicit stdio_connection(net::io_context& io)
      : connection{io.get_executor()}, out{io, ::dup(STDOUT_FILENO)} {}

  net::awaitable<void> write_frame(const json::object& msg) override {
    co_await jsonrpc::write_message(out, msg, framing);
  }

  net::posix::stream_descriptor out;
  jsonrpc::framing framing{jsonrpc::framing::content_length};
};

/// Server loop

net::awaitable<void> serve_stdio(net::io_context& io, coordinator& coord, dispatcher& disp) {
  net::posix::stream_descriptor in{io, ::dup(STDIN_FILENO)};
  jsonrpc::message_reader reader{in};

  auto conn = std::make_shared<stdio_connection>(io);
  conn->set_client_id(coord.register_client(conn));
  LOG_INFO("tether --stdio: serving {}", conn->client_id());

  for (;;) {
    std::optional<std::string> body;
    try {
      body = co_await reader.read();
    } catch (const std::exception& e) {
      LOG_ERROR("stdio: {}", e.what());
      break;
    }
    if (!body) break;
    if (auto f = reader.detected()) conn->framing = *f;
    if (!disp.handle_frame(conn, *body)) break;
  }

  coord.unregister_client(conn->client_id(), false);
  conn->close();

  // Let the writer flush the last replies before the descriptor goes
  net::steady_timer timer{io};
  for (int i = 0; i < 100 && !conn->idle(); ++i) {
    timer.expires_after(std::chrono::milliseconds{10});
    co_await timer.async_wait(net::use_awaitable);
  }
  LOG_INFO("stdio session ended");
}

}  // namespace tether
