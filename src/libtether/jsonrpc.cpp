// SPDX-License-Identifier: MIT
#include "tether/jsonrpc.hpp"

#include <fmt/format.h>
#include <re2/re2.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/completion_condition.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/system_error.hpp>
#include <stdexcept>

#include "utils.hpp"

namespace tether::jsonrpc {

namespace asio = boost::asio;
namespace sys = boost::system;

json::object make_result(const json::value& id, json::value result) {
  json::object msg{};
  msg["jsonrpc"] = "2.0";
  msg["id"] = id;
  msg["result"] = std::move(result);
  return msg;
}

json::object make_error(
    const json::value& id, int code, std::string_view message,
    std::optional<json::value> data) {
  json::object err{};
  err["code"] = code;
  err["message"] = message;
  if (data) err["data"] = std::move(*data);
  json::object msg{};
  msg["jsonrpc"] = "2.0";
  msg["id"] = id;
  msg["error"] = std::move(err);
  return msg;
}

json::object make_notification(std::string_view method, json::object params) {
  json::object msg{};
  msg["jsonrpc"] = "2.0";
  msg["method"] = method;
  msg["params"] = std::move(params);
  return msg;
}

json::object make_request(
    const json::value& id, std::string_view method, json::object params) {
  json::object msg{};
  msg["jsonrpc"] = "2.0";
  msg["id"] = id;
  msg["method"] = method;
  msg["params"] = std::move(params);
  return msg;
}

bool is_response(const json::object& msg) {
  return !msg.contains("method") &&
         (msg.contains("result") || msg.contains("error"));
}

std::string frame(const json::object& msg, framing f) {
  std::string json_str{json::serialize(msg)};
  if (f == framing::newline) return json_str + "\n";
  return fmt::format("Content-Length: {}\r\n\r\n{}", json_str.size(), json_str);
}

/// Reader

namespace {

std::string take(asio::streambuf& buf, std::size_t n) {
  auto begin = asio::buffers_begin(buf.data());
  std::string out{begin, begin + static_cast<std::ptrdiff_t>(n)};
  buf.consume(n);
  return out;
}

bool is_blank(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

}  // namespace

asio::awaitable<std::optional<std::string>> message_reader::read() {
  try {
    // Skip blank bytes until the first significant one tells us the framing
    while (!mode_) {
      while (buf_.size() > 0 && !mode_) {
        char c{*asio::buffers_begin(buf_.data())};
        if (is_blank(c)) {
          buf_.consume(1);
          continue;
        }
        mode_ = (c == '{' || c == '[') ? framing::newline
                                       : framing::content_length;
      }
      if (mode_) break;
      auto n = co_await stream_->async_read_some(
          buf_.prepare(4096), asio::use_awaitable);
      buf_.commit(n);
    }

    if (*mode_ == framing::newline) co_return co_await read_line_framed();
    co_return co_await read_header_framed();

  } catch (const sys::system_error& e) {
    if (e.code() == asio::error::eof) {
      co_return std::nullopt;
    }
    throw;
  }
}

asio::awaitable<std::optional<std::string>> message_reader::read_line_framed() {
  for (;;) {
    std::size_t n{0};
    bool at_eof{false};
    try {
      n = co_await asio::async_read_until(
          *stream_, buf_, '\n', asio::use_awaitable);
    } catch (const sys::system_error& e) {
      if (e.code() != asio::error::eof || buf_.size() == 0) throw;
      at_eof = true;
    }
    // A final unterminated line still counts as a message
    if (at_eof) n = buf_.size();

    auto line = take(buf_, n);
    auto body = utils::trim(line);
    if (!body.empty()) co_return std::string{body};
  }
}

asio::awaitable<std::optional<std::string>>
message_reader::read_header_framed() {
  // Read headers until \r\n\r\n
  auto header_len = co_await asio::async_read_until(
      *stream_, buf_, "\r\n\r\n", asio::use_awaitable);
  auto headers = take(buf_, header_len);

  // Parse Content-Length header
  static const RE2 content_length_re{R"((?i)Content-Length:\s*(\d+))"};
  std::size_t content_length{0};
  if (!RE2::PartialMatch(headers, content_length_re, &content_length)) {
    throw std::runtime_error{"Missing Content-Length header"};
  }
  if (content_length > max_message_size) {
    throw std::runtime_error{fmt::format(
        "Content-Length {} exceeds the {} byte limit", content_length,
        max_message_size)};
  }

  // Then read whatever part of the body is not yet buffered
  if (buf_.size() < content_length) {
    co_await asio::async_read(
        *stream_, buf_, asio::transfer_exactly(content_length - buf_.size()),
        asio::use_awaitable);
  }

  co_return take(buf_, content_length);
}

asio::awaitable<void> write_message(
    asio::posix::stream_descriptor& stream, const json::object& msg,
    framing f) {
  std::string full_msg{frame(msg, f)};

  co_await asio::async_write(
      stream, asio::buffer(full_msg), asio::use_awaitable);
}

}  // namespace tether::jsonrpc
