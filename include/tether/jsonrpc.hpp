// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file jsonrpc.hpp
 * @brief JSONRPC 2.0 message shapes and framing over async byte streams.
 *
 * Two framings are understood on byte streams.  The default is the
 * Language Server Protocol convention: each message is preceded by a
 * header block of the form @c "Content-Length: N\r\n\r\n" followed by
 * exactly @c N bytes of UTF-8 JSON text.  A peer that starts talking with
 * a bare JSON document (first non-blank byte is @c '{' or @c '[') is
 * assumed to speak newline-delimited JSON instead, one document per line,
 * and replies are framed the same way.  WebSocket transports carry the
 * same JSON text in text frames and need no framing at all.
 */

#include <boost/asio/awaitable.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/json.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace tether::jsonrpc {

namespace json = boost::json;

/// Value of the @c jsonrpc member every request must carry
inline constexpr std::string_view version{"2.0"};

/// Largest message body a reader accepts, in either framing
inline constexpr std::size_t max_message_size{64U << 20U};

/// Error codes

inline constexpr int parse_error{-32700};
inline constexpr int invalid_request{-32600};
inline constexpr int method_not_found{-32601};
inline constexpr int invalid_params{-32602};
inline constexpr int internal_error{-32603};

/// Message builders

json::object make_result(const json::value& id, json::value result);

json::object make_error(
    const json::value& id, int code, std::string_view message,
    std::optional<json::value> data = std::nullopt);

json::object make_notification(std::string_view method, json::object params);

json::object make_request(
    const json::value& id, std::string_view method, json::object params);

/// Message classification

/// A response carries @c result or @c error and no @c method.
bool is_response(const json::object& msg);

/// Framing

enum class framing { content_length, newline };

/// Serialise @p msg into one complete frame.
std::string frame(const json::object& msg, framing f);

/** @brief Reads framed JSONRPC messages from one stream.
 *
 * Keeps its own buffer between calls so that several messages arriving
 * in one read are all delivered.  The framing is detected from the first
 * message and then fixed for the lifetime of the reader.
 */
class message_reader {
 public:
  explicit message_reader(boost::asio::posix::stream_descriptor& stream)
      : stream_{&stream} {}

  /** @brief Read the next message body.
   *
   * Returns the raw JSON text, or an empty optional on EOF.  Throws
   * std::runtime_error if a header block lacks @c Content-Length or a
   * body would exceed @ref max_message_size.
   */
  boost::asio::awaitable<std::optional<std::string>> read();

  /// The detected framing, once the first message has been seen.
  [[nodiscard]] std::optional<framing> detected() const { return mode_; }

 private:
  boost::asio::awaitable<std::optional<std::string>> read_line_framed();
  boost::asio::awaitable<std::optional<std::string>> read_header_framed();

  boost::asio::posix::stream_descriptor* stream_;
  boost::asio::streambuf buf_{max_message_size};
  std::optional<framing> mode_;
};

/// Write one framed message to @p stream.
boost::asio::awaitable<void> write_message(
    boost::asio::posix::stream_descriptor& stream, const json::object& msg,
    framing f = framing::content_length);

}  // namespace tether::jsonrpc
