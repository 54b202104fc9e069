#pragma once

/**
 * @file client.hpp
 * @brief The capability a driving client offers to the agent.
 *
 * Everything the agent needs from the other end of a connection goes
 * through this interface: streaming @c session_update notifications,
 * reading and writing files in the client's workspace, and running
 * commands in client-managed terminals.  Transports implement it by
 * sending JSONRPC requests to the peer; tests and the local runner
 * implement it directly.
 *
 * Request-style operations return a @ref pending: a future for the
 * eventual result plus a hook that abandons the request.  Both are
 * meant to be used by @ref host_bridge, which invokes these methods on
 * the protocol thread and waits on the future from a worker thread.
 */

#include <boost/json.hpp>
#include <functional>
#include <future>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tether {

namespace json = boost::json;

template <typename T>
struct pending {
  std::future<T> result;
  std::function<void()> cancel{};
};

struct terminal_exit {
  std::optional<int> exit_code{};
  std::optional<std::string> signal{};
};

struct terminal_output {
  std::string output;
  bool truncated{false};
  std::optional<terminal_exit> exit_status{};
};

struct command_spec {
  std::string command;
  std::vector<std::string> args{};
  std::optional<std::string> cwd{};
};

/// The peer answered a request with a JSONRPC error.
struct client_error : std::runtime_error {
  client_error(int code, const std::string& message)
      : std::runtime_error{message}, code{code} {}
  int code;
};

class client {
 public:
  client() = default;
  client(const client&) = delete;
  client(client&&) = delete;
  client& operator=(const client&) = delete;
  client& operator=(client&&) = delete;
  virtual ~client() = default;

  /// Fire-and-forget notification, delivered in call order.
  virtual void session_update(
      const std::string& session_id, json::object update) = 0;

  virtual pending<std::string> read_text_file(
      const std::string& session_id, const std::string& path) = 0;

  virtual pending<void> write_text_file(
      const std::string& session_id, const std::string& path,
      const std::string& content) = 0;

  /// Returns the terminal id.
  virtual pending<std::string> create_terminal(
      const std::string& session_id, const command_spec& cmd) = 0;

  virtual pending<terminal_exit> wait_for_terminal_exit(
      const std::string& session_id, const std::string& terminal_id) = 0;

  virtual pending<terminal_output> read_terminal_output(
      const std::string& session_id, const std::string& terminal_id) = 0;

  virtual pending<void> release_terminal(
      const std::string& session_id, const std::string& terminal_id) = 0;

  virtual pending<void> kill_terminal(
      const std::string& session_id, const std::string& terminal_id) = 0;
};

/// Wrap an already-known value as a completed @ref pending.
template <typename T>
pending<T> ready(T value) {
  std::promise<T> p;
  p.set_value(std::move(value));
  return {p.get_future()};
}

inline pending<void> ready() {
  std::promise<void> p;
  p.set_value();
  return {p.get_future()};
}

template <typename T, typename Exception>
pending<T> failed(Exception e) {
  std::promise<T> p;
  p.set_exception(std::make_exception_ptr(std::move(e)));
  return {p.get_future()};
}

}  // namespace tether
