#pragma once

/**
 * @file connection.hpp
 * @brief A client reached over a JSONRPC transport.
 *
 * A @ref connection turns the @ref client capability into JSONRPC
 * traffic: notifications become @c session_update messages and every
 * request-style call becomes a request whose response later resolves an
 * entry of the pending map.  Outgoing messages are queued and written by
 * a single writer coroutine on the connection's executor, so any thread
 * may send and per-connection order is preserved.
 *
 * Transports derive from it and provide @ref write_frame.
 */

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/json.hpp>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "tether/client.hpp"

namespace tether {

namespace json = boost::json;
namespace net = boost::asio;

/// Client side method names
namespace client_methods {
inline constexpr std::string_view read_text_file{"fs_read_text_file"};
inline constexpr std::string_view write_text_file{"fs_write_text_file"};
inline constexpr std::string_view terminal_create{"terminal_create"};
inline constexpr std::string_view terminal_output{"terminal_output"};
inline constexpr std::string_view terminal_release{"terminal_release"};
inline constexpr std::string_view terminal_wait_for_exit{"terminal_wait_for_exit"};
inline constexpr std::string_view terminal_kill{"terminal_kill"};
}  // namespace client_methods

class connection : public client, public std::enable_shared_from_this<connection> {
 public:
  using executor_type = net::io_context::executor_type;

  explicit connection(executor_type executor) : executor_{executor} {}

  /// Queue @p msg for the peer.  Callable from any thread; messages
  /// queued after @ref close are dropped.
  void send(json::object msg);

  /// Resolve the pending request named by the response's @c id.
  /// Returns false when nothing was waiting for it.
  bool handle_response(const json::object& msg);

  /// Fail every outstanding request with @p why.
  void abort_pending(const std::string& why);

  /// Refuse further messages and abort whatever is pending.  Messages
  /// already queued are still written.
  void close();

  [[nodiscard]] bool closed() const;

  /// Nothing queued and no write in flight.
  [[nodiscard]] bool idle() const;
  [[nodiscard]] std::size_t pending_count() const;

  void set_client_id(std::string id);
  [[nodiscard]] std::string client_id() const;

  [[nodiscard]] executor_type get_executor() const { return executor_; }

  /// client

  void session_update(const std::string& session_id, json::object update) override;

  pending<std::string> read_text_file(
      const std::string& session_id, const std::string& path) override;

  pending<void> write_text_file(
      const std::string& session_id, const std::string& path,
      const std::string& content) override;

  pending<std::string> create_terminal(
      const std::string& session_id, const command_spec& cmd) override;

  pending<terminal_exit> wait_for_terminal_exit(
      const std::string& session_id, const std::string& terminal_id) override;

  pending<terminal_output> read_terminal_output(
      const std::string& session_id, const std::string& terminal_id) override;

  pending<void> release_terminal(
      const std::string& session_id, const std::string& terminal_id) override;

  pending<void> kill_terminal(
      const std::string& session_id, const std::string& terminal_id) override;

 protected:
  /// Write one message to the peer.  Only ever called from the writer
  /// coroutine, one call at a time.
  virtual net::awaitable<void> write_frame(const json::object& msg) = 0;

 private:
  /// Called with the result, or with an exception from the peer or from
  /// @ref abort_pending.
  using completer = std::function<void(const json::value*, std::exception_ptr)>;

  template <typename T, typename Convert>
  pending<T> request(std::string_view method, json::object params, Convert convert);

  void drop_pending(std::int64_t id);
  net::awaitable<void> drain();

  executor_type executor_;

  mutable std::mutex mutex_;
  std::string client_id_;
  std::deque<json::object> outbox_;
  bool writing_{false};
  bool closed_{false};

  mutable std::mutex pending_mutex_;
  std::int64_t next_id_{0};
  std::map<std::int64_t, completer> pending_;
};

}  // namespace tether
