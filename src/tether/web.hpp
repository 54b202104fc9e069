#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>

#include "tether/coordinator.hpp"
#include "tether/dispatcher.hpp"

namespace tether {

struct web_options {
  boost::asio::ip::tcp::endpoint endpoint;
  // Zero keeps idle WebSocket connections open forever
  std::chrono::seconds idle_timeout{300};
};

// Accept HTTP connections until the acceptor fails or the io_context
// stops.  GET /api/status answers with the dispatcher's summary and /ws
// upgrades to a WebSocket carrying one JSONRPC message per text frame.
// A WebSocket client that drops keeps its sessions for the grace period.
boost::asio::awaitable<void> serve_web(
    boost::asio::io_context& io, coordinator& coord, dispatcher& disp,
    web_options opts);

}  // namespace tether
