// SPDX-License-Identifier: MIT
#include <doctest/doctest.h>
#include <unistd.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "tether/jsonrpc.hpp"

namespace asio = boost::asio;
namespace json = boost::json;
namespace jsonrpc = tether::jsonrpc;

namespace {

struct pipe_pair {
  pipe_pair() { REQUIRE(::pipe(fds) == 0); }
  int fds[2]{-1, -1};
};

// Write @p raw into a pipe, close it and read back every message.
std::vector<std::string> read_all(const std::string& raw, std::optional<jsonrpc::framing>* seen = nullptr) {
  pipe_pair p;
  REQUIRE(::write(p.fds[1], raw.data(), raw.size()) == static_cast<ssize_t>(raw.size()));
  ::close(p.fds[1]);

  asio::io_context io;
  asio::posix::stream_descriptor in{io, p.fds[0]};
  jsonrpc::message_reader reader{in};
  std::vector<std::string> out;
  asio::co_spawn(
      io,
      [&]() -> asio::awaitable<void> {
        while (auto body = co_await reader.read()) out.push_back(*body);
      },
      asio::detached);
  io.run();
  if (seen) *seen = reader.detected();
  return out;
}

}  // namespace

TEST_CASE("jsonrpc-builders") {
  auto r = jsonrpc::make_result(7, json::object{{"ok", true}});
  CHECK(r.at("jsonrpc") == "2.0");
  CHECK(r.at("id") == 7);
  CHECK(r.at("result").as_object().at("ok") == true);
  CHECK(jsonrpc::is_response(r));

  auto e = jsonrpc::make_error(nullptr, jsonrpc::parse_error, "Parse error");
  CHECK(e.at("id").is_null());
  CHECK(e.at("error").as_object().at("code") == -32700);
  CHECK(e.at("error").as_object().at("message") == "Parse error");
  CHECK_FALSE(e.at("error").as_object().contains("data"));
  CHECK(jsonrpc::is_response(e));

  auto with_data = jsonrpc::make_error(1, -32001, "gone", json::value{"SessionNotFound"});
  CHECK(with_data.at("error").as_object().at("data") == "SessionNotFound");

  auto n = jsonrpc::make_notification("session_update", {{"session_id", "session-1"}});
  CHECK_FALSE(n.contains("id"));
  CHECK_FALSE(jsonrpc::is_response(n));

  auto q = jsonrpc::make_request(3, "fs_read_text_file", {{"path", "a.py"}});
  CHECK(q.at("method") == "fs_read_text_file");
  CHECK_FALSE(jsonrpc::is_response(q));
}

TEST_CASE("jsonrpc-frame-content-length") {
  json::object msg{{"jsonrpc", "2.0"}, {"id", 1}, {"result", nullptr}};
  auto text = json::serialize(msg);
  CHECK(jsonrpc::frame(msg, jsonrpc::framing::content_length) ==
        "Content-Length: " + std::to_string(text.size()) + "\r\n\r\n" + text);
  CHECK(jsonrpc::frame(msg, jsonrpc::framing::newline) == text + "\n");
}

TEST_CASE("jsonrpc-read-content-length-through-pipe") {
  auto a = jsonrpc::make_request(1, "initialize", {{"protocol_version", 1}});
  auto b = jsonrpc::make_request(2, "new_session", {{"cwd", "/tmp/é"}});
  std::string raw = jsonrpc::frame(a, jsonrpc::framing::content_length) +
                    jsonrpc::frame(b, jsonrpc::framing::content_length);

  std::optional<jsonrpc::framing> seen;
  auto got = read_all(raw, &seen);
  REQUIRE(got.size() == 2);
  CHECK(json::parse(got[0]) == a);
  CHECK(json::parse(got[1]) == b);
  REQUIRE(seen.has_value());
  CHECK(*seen == jsonrpc::framing::content_length);
}

TEST_CASE("jsonrpc-read-newline-delimited") {
  std::string raw =
      "\n{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\"}\n"
      "\n"
      "{\"jsonrpc\":\"2.0\",\"method\":\"cancel\"}";  // no trailing newline

  std::optional<jsonrpc::framing> seen;
  auto got = read_all(raw, &seen);
  REQUIRE(got.size() == 2);
  CHECK(json::parse(got[0]).as_object().at("id") == 1);
  CHECK(json::parse(got[1]).as_object().at("method") == "cancel");
  CHECK(*seen == jsonrpc::framing::newline);
}

TEST_CASE("jsonrpc-write-then-read") {
  pipe_pair p;
  asio::io_context io;
  asio::posix::stream_descriptor out{io, p.fds[1]};
  asio::posix::stream_descriptor in{io, p.fds[0]};
  jsonrpc::message_reader reader{in};

  auto msg = jsonrpc::make_notification("session_update", {{"session_id", "session-9"}});
  std::optional<std::string> body;
  asio::co_spawn(
      io,
      [&]() -> asio::awaitable<void> {
        co_await jsonrpc::write_message(out, msg);
        out.close();
        body = co_await reader.read();
      },
      asio::detached);
  io.run();
  REQUIRE(body.has_value());
  CHECK(json::parse(*body) == msg);
}

TEST_CASE("jsonrpc-missing-content-length") {
  pipe_pair p;
  std::string raw = "Content-Type: text/plain\r\n\r\n{}";
  REQUIRE(::write(p.fds[1], raw.data(), raw.size()) == static_cast<ssize_t>(raw.size()));
  ::close(p.fds[1]);

  asio::io_context io;
  asio::posix::stream_descriptor in{io, p.fds[0]};
  jsonrpc::message_reader reader{in};
  bool threw{false};
  asio::co_spawn(
      io,
      [&]() -> asio::awaitable<void> {
        try {
          co_await reader.read();
        } catch (const std::runtime_error&) {
          threw = true;
        }
      },
      asio::detached);
  io.run();
  CHECK(threw);
}

TEST_CASE("jsonrpc-oversized-content-length") {
  pipe_pair p;
  std::string raw = "Content-Length: 999999999999\r\n\r\n{}";
  REQUIRE(::write(p.fds[1], raw.data(), raw.size()) == static_cast<ssize_t>(raw.size()));
  ::close(p.fds[1]);

  asio::io_context io;
  asio::posix::stream_descriptor in{io, p.fds[0]};
  jsonrpc::message_reader reader{in};
  std::string error;
  asio::co_spawn(
      io,
      [&]() -> asio::awaitable<void> {
        try {
          co_await reader.read();
        } catch (const std::runtime_error& e) {
          error = e.what();
        }
      },
      asio::detached);
  io.run();
  CHECK(error.find("exceeds") != std::string::npos);
}
