#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include "tether/coordinator.hpp"
#include "tether/dispatcher.hpp"

namespace tether {

// Serve one client on stdin/stdout.  The framing is taken from the first
// message the client sends.  Completes when the client sends "shutdown"
// or stdin reaches EOF; the client's sessions are dropped then.
boost::asio::awaitable<void> serve_stdio(
    boost::asio::io_context& io, coordinator& coord, dispatcher& disp);

}  // namespace tether
