#include "tether/model.hpp"

#include <fmt/format.h>
#include <re2/re2.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/version.hpp>
#include <boost/system/system_error.hpp>
#include <chrono>

#include "json_helpers.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace tether {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

/// Echo

std::string echo_model::complete(const json::array& messages, const cancel_token& token) {
  if (token.requested()) throw model_error{"cancelled"};
  if (messages.empty()) return "Nothing to echo.";
  const auto* last = messages.back().if_object();
  auto content = last ? get_string(*last, "content") : std::nullopt;
  return content ? *content : std::string{};
}

/// OpenAI-compatible

openai_model::openai_model(openai_config config) : config_{std::move(config)} {
  static const RE2 url_re{R"(http://([^/:]+)(?::(\d+))?(/[^?#]*)?)"};
  std::string port;
  std::string path;
  if (!RE2::FullMatch(config_.base_url, url_re, &host_, &port, &path))
    utils::throwf<std::invalid_argument>(
        "unsupported model URL '{}', expected http://host[:port][/prefix]",
        config_.base_url);
  port_ = port.empty() ? "80" : port;
  while (!path.empty() && path.back() == '/') path.pop_back();
  // Accept both ".../v1" and a bare server root
  path_ = path.ends_with("/v1") ? path + "/chat/completions" : path + "/v1/chat/completions";
}

std::string openai_model::name() const {
  return fmt::format("openai:{}", config_.model);
}

json::object openai_model::make_request_body(const json::array& messages) const {
  json::array msgs;
  for (const auto& m : messages) {
    const auto* o = m.if_object();
    if (!o) continue;
    json::object clean;
    clean["role"] = get_string(*o, "role").value_or("user");
    clean["content"] = get_string(*o, "content").value_or("");
    msgs.push_back(std::move(clean));
  }
  json::object body;
  body["model"] = config_.model;
  body["messages"] = std::move(msgs);
  body["temperature"] = config_.temperature;
  body["stream"] = false;
  return body;
}

std::string openai_model::parse_response_body(std::string_view body) {
  std::error_code ec;
  auto parsed = json::parse(body, ec);
  if (ec) throw model_error{fmt::format("model reply is not JSON: {}", ec.message())};
  const auto* root = parsed.if_object();
  if (!root) throw model_error{"model reply is not an object"};

  if (const auto* err = get_object(*root, "error"))
    throw model_error{get_string(*err, "message").value_or("model returned an error")};

  const auto* choices = get_array(*root, "choices");
  if (!choices || choices->empty()) throw model_error{"model reply has no choices"};
  const auto* choice = choices->front().if_object();
  const auto* message = choice ? get_object(*choice, "message") : nullptr;
  if (!message) throw model_error{"model reply has no message"};
  return get_string(*message, "content").value_or("");
}

namespace {

net::awaitable<http::response<http::string_body>> exchange(
    std::string host, std::string port, http::request<http::string_body> req,
    std::chrono::seconds timeout) {
  auto ex = co_await net::this_coro::executor;
  tcp::resolver resolver{ex};
  beast::tcp_stream stream{ex};

  auto endpoints = co_await resolver.async_resolve(host, port, net::use_awaitable);
  stream.expires_after(timeout);
  co_await stream.async_connect(endpoints, net::use_awaitable);

  stream.expires_after(timeout);
  co_await http::async_write(stream, req, net::use_awaitable);

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  co_await http::async_read(stream, buffer, res, net::use_awaitable);

  beast::error_code ignored;
  stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
  co_return res;
}

}  // namespace

std::string openai_model::complete(const json::array& messages, const cancel_token& token) {
  using namespace std::chrono_literals;
  if (token.requested()) throw model_error{"cancelled"};

  http::request<http::string_body> req{http::verb::post, path_, 11};
  req.set(http::field::host, host_);
  req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
  req.set(http::field::content_type, "application/json");
  if (!config_.api_key.empty())
    req.set(http::field::authorization, fmt::format("Bearer {}", config_.api_key));
  req.body() = json::serialize(make_request_body(messages));
  req.prepare_payload();

  LOG_DEBUG("POST {}:{}{} ({} messages)", host_, port_, path_, messages.size());

  // A private loop: this runs on a turn thread, never on the protocol one
  net::io_context ioc;
  auto reply = net::co_spawn(
      ioc, exchange(host_, port_, std::move(req), config_.timeout), net::use_future);
  while (!ioc.stopped()) {
    ioc.run_for(100ms);
    if (token.requested()) ioc.stop();
  }
  if (token.requested()) throw model_error{"cancelled"};

  http::response<http::string_body> res;
  try {
    res = reply.get();
  } catch (const boost::system::system_error& e) {
    throw model_error{fmt::format("{}:{}: {}", host_, port_, e.code().message())};
  }

  if (res.result() != http::status::ok) {
    LOG_WARN("model endpoint answered {}: {}", res.result_int(), res.body());
    throw model_error{fmt::format("model endpoint answered HTTP {}", res.result_int())};
  }
  return parse_response_body(res.body());
}

/// Factory

std::shared_ptr<model> make_model(const model_options& opts) {
  if (opts.kind == "echo") return std::make_shared<echo_model>();
  if (opts.kind == "openai") return std::make_shared<openai_model>(opts.openai);
  utils::throwf<std::invalid_argument>("unknown model '{}', expected echo or openai", opts.kind);
}

}  // namespace tether
