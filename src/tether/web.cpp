#include "web.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/json.hpp>
#include <memory>
#include <string>
#include <string_view>

#include "logger.hpp"
#include "tether/connection.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace tether {

namespace {

constexpr auto as_tuple_awaitable = net::as_tuple(net::use_awaitable);

struct ws_connection : connection {
  using stream_t = websocket::stream<beast::tcp_stream>;

  ws_connection(net::io_context& io, beast::tcp_stream stream)
      : connection{io.get_executor()}, ws{std::move(stream)} {}

  net::awaitable<void> write_frame(const json::object& msg) override {
    auto text = json::serialize(msg);
    co_await ws.async_write(net::buffer(text), net::use_awaitable);
  }

  stream_t ws;
};

/// Helpers

http::response<http::string_body> make_json_response(
    http::status status_code, const json::value& body,
    unsigned int http_version, bool keep_alive) {
  http::response<http::string_body> res{status_code, http_version};
  res.set(http::field::content_type, "application/json");
  res.set(http::field::access_control_allow_origin, "*");
  res.keep_alive(keep_alive);
  res.body() = json::serialize(body);
  res.prepare_payload();
  return res;
}

http::response<http::string_body> make_error(
    http::status status_code, std::string_view message,
    unsigned int http_version, bool keep_alive) {
  json::object obj;
  obj["error"] = message;
  return make_json_response(status_code, obj, http_version, keep_alive);
}

/// Request dispatch

http::response<http::string_body> dispatch(
    const http::request<http::string_body>& req, const dispatcher& disp) {
  const auto version = req.version();
  const bool keep_alive = req.keep_alive();
  const std::string_view target = req.target();

  if (target == "/api/status") {
    if (req.method() != http::verb::get)
      return make_error(
          http::status::method_not_allowed, "use GET", version, keep_alive);
    return make_json_response(http::status::ok, disp.status(), version, keep_alive);
  }
  if (target == "/ws")
    return make_error(
        http::status::upgrade_required, "/ws expects a WebSocket upgrade", version,
        keep_alive);
  return make_error(http::status::not_found, "not found", version, keep_alive);
}

/// WebSocket session

net::awaitable<void> run_ws_session(
    net::io_context& io, coordinator& coord, dispatcher& disp,
    beast::tcp_stream stream, http::request<http::string_body> req,
    std::chrono::seconds idle_timeout) {
  auto conn = std::make_shared<ws_connection>(io, std::move(stream));
  auto& ws = conn->ws;

  websocket::stream_base::timeout opt{};
  opt.handshake_timeout = std::chrono::seconds{30};
  opt.idle_timeout = idle_timeout.count() > 0
                         ? websocket::stream_base::duration{idle_timeout}
                         : websocket::stream_base::none();
  opt.keep_alive_pings = false;
  ws.set_option(opt);
  ws.text(true);

  auto [aec] = co_await ws.async_accept(req, as_tuple_awaitable);
  if (aec) {
    LOG_INFO("ws handshake failed: {}", aec.message());
    co_return;
  }

  conn->set_client_id(coord.register_client(conn));
  LOG_INFO("ws session started: {}", conn->client_id());

  bool shutdown_requested{false};
  for (;;) {
    beast::flat_buffer buf{};
    auto [ec, n] = co_await ws.async_read(buf, as_tuple_awaitable);
    if (ec == beast::error::timeout) {
      LOG_INFO("{}: idle for {}s, closing", conn->client_id(), idle_timeout.count());
      break;
    }
    if (ec) {
      if (ec != websocket::error::closed)
        LOG_INFO("{}: read: {}", conn->client_id(), ec.message());
      break;
    }
    if (!disp.handle_frame(conn, beast::buffers_to_string(buf.data()))) {
      shutdown_requested = true;
      break;
    }
  }

  // A client that asked to shut down will not come back
  coord.unregister_client(conn->client_id(), !shutdown_requested);
  conn->close();

  if (shutdown_requested && ws.is_open()) {
    net::steady_timer timer{io};
    for (int i = 0; i < 100 && !conn->idle(); ++i) {
      timer.expires_after(std::chrono::milliseconds{10});
      co_await timer.async_wait(net::use_awaitable);
    }
    auto [cec] = co_await ws.async_close(websocket::close_code::normal, as_tuple_awaitable);
    if (cec) LOG_DEBUG("{}: close: {}", conn->client_id(), cec.message());
  }
  LOG_INFO("ws session ended: {}", conn->client_id());
}

/// Connection handler

net::awaitable<void> handle_connection(
    net::io_context& io, coordinator& coord, dispatcher& disp, tcp::socket socket,
    std::chrono::seconds idle_timeout) {
  beast::tcp_stream stream{std::move(socket)};
  beast::flat_buffer buffer;

  for (;;) {
    http::request<http::string_body> req;
    stream.expires_after(std::chrono::seconds{30});
    auto [ec, n] = co_await http::async_read(stream, buffer, req, as_tuple_awaitable);
    if (ec) break;

    LOG_INFO(
        "{} {}", std::string_view{req.method_string()}, std::string_view{req.target()});

    if (websocket::is_upgrade(req) && req.target() == "/ws") {
      stream.expires_never();
      co_await run_ws_session(io, coord, disp, std::move(stream), std::move(req), idle_timeout);
      co_return;
    }

    auto res = dispatch(req, disp);
    LOG_INFO("→ {}", static_cast<unsigned>(res.result_int()));
    auto [wec, wn] = co_await http::async_write(stream, res, as_tuple_awaitable);
    if (wec || !req.keep_alive()) break;
  }

  beast::error_code ec;
  stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

}  // namespace

/// Server loop

net::awaitable<void> serve_web(
    net::io_context& io, coordinator& coord, dispatcher& disp, web_options opts) {
  tcp::acceptor acceptor{io};
  acceptor.open(opts.endpoint.protocol());
  acceptor.set_option(net::socket_base::reuse_address{true});
  acceptor.bind(opts.endpoint);
  acceptor.listen();

  for (;;) {
    auto [ec, socket] = co_await acceptor.async_accept(as_tuple_awaitable);
    if (ec) {
      LOG_INFO("acceptor stopped: {}", ec.message());
      break;
    }

    boost::system::error_code ec2;
    auto remote = socket.remote_endpoint(ec2);
    LOG_INFO(
        "connection from {}:{}", ec2 ? "?" : remote.address().to_string(),
        ec2 ? 0 : remote.port());

    net::co_spawn(
        io, handle_connection(io, coord, disp, std::move(socket), opts.idle_timeout),
        [](std::exception_ptr e) {
          if (!e) return;
          try {
            std::rethrow_exception(e);
          } catch (const std::exception& ex) {
            LOG_WARN("connection failed: {}", ex.what());
          }
        });
  }
}

}  // namespace tether
