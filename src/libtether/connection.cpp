#include "tether/connection.hpp"

#include <fmt/format.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <future>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include "json_helpers.hpp"
#include "logger.hpp"
#include "tether/jsonrpc.hpp"
#include "utils.hpp"

namespace tether {

/// Outgoing queue

void connection::send(json::object msg) {
  {
    std::lock_guard lock{mutex_};
    if (closed_) {
      LOG_DEBUG("{}: dropping message on closed connection", client_id_);
      return;
    }
    outbox_.push_back(std::move(msg));
    if (writing_) return;
    writing_ = true;
  }
  net::co_spawn(executor_, [self = shared_from_this()] { return self->drain(); },
                net::detached);
}

net::awaitable<void> connection::drain() {
  for (;;) {
    json::object msg;
    {
      std::lock_guard lock{mutex_};
      if (outbox_.empty()) {
        writing_ = false;
        co_return;
      }
      msg = std::move(outbox_.front());
      outbox_.pop_front();
    }
    try {
      co_await write_frame(msg);
    } catch (const std::exception& e) {
      LOG_WARN("{}: write failed: {}", client_id(), e.what());
      close();
      std::lock_guard lock{mutex_};
      outbox_.clear();
      writing_ = false;
      co_return;
    }
  }
}

void connection::close() {
  {
    std::lock_guard lock{mutex_};
    if (closed_) return;
    closed_ = true;
  }
  abort_pending("connection closed");
}

bool connection::idle() const {
  std::lock_guard lock{mutex_};
  return outbox_.empty() && !writing_;
}

bool connection::closed() const {
  std::lock_guard lock{mutex_};
  return closed_;
}

void connection::set_client_id(std::string id) {
  std::lock_guard lock{mutex_};
  client_id_ = std::move(id);
}

std::string connection::client_id() const {
  std::lock_guard lock{mutex_};
  return client_id_;
}

/// Pending requests

template <typename T, typename Convert>
pending<T> connection::request(
    std::string_view method, json::object params, Convert convert) {
  auto promise = std::make_shared<std::promise<T>>();
  auto result = promise->get_future();

  completer done = [promise, convert, method = std::string{method}](
                       const json::value* value, std::exception_ptr error) {
    if (error) {
      promise->set_exception(error);
      return;
    }
    try {
      if constexpr (std::is_void_v<T>) {
        convert(*value);
        promise->set_value();
      } else {
        promise->set_value(convert(*value));
      }
    } catch (const std::exception& e) {
      promise->set_exception(std::make_exception_ptr(std::runtime_error{
        fmt::format("malformed {} response: {}", method, e.what())}));
    }
  };

  std::int64_t id{0};
  {
    std::lock_guard lock{pending_mutex_};
    id = ++next_id_;
    pending_.emplace(id, std::move(done));
  }
  if (closed()) {
    abort_pending("connection closed");
  } else {
    send(jsonrpc::make_request(id, method, std::move(params)));
  }

  std::weak_ptr<connection> weak = weak_from_this();
  return {std::move(result), [weak, id] {
            if (auto self = weak.lock()) self->drop_pending(id);
          }};
}

void connection::drop_pending(std::int64_t id) {
  std::lock_guard lock{pending_mutex_};
  if (pending_.erase(id)) LOG_DEBUG("request {} abandoned", id);
}

bool connection::handle_response(const json::object& msg) {
  auto id = get_int(msg, "id");
  if (!id) {
    LOG_WARN("{}: response without a usable id", client_id());
    return false;
  }

  completer done;
  {
    std::lock_guard lock{pending_mutex_};
    auto it = pending_.find(*id);
    if (it == pending_.end()) {
      LOG_DEBUG("{}: late or unknown response {}", client_id(), *id);
      return false;
    }
    done = std::move(it->second);
    pending_.erase(it);
  }

  if (auto* err = get_object(msg, "error")) {
    auto code = get_int(*err, "code").value_or(jsonrpc::internal_error);
    auto message = get_string(*err, "message").value_or("request failed");
    done(nullptr, std::make_exception_ptr(
                      client_error{static_cast<int>(code), message}));
    return true;
  }
  static const json::value null_result{};
  auto* result = find_value(msg, "result");
  done(result ? result : &null_result, nullptr);
  return true;
}

void connection::abort_pending(const std::string& why) {
  std::map<std::int64_t, completer> doomed;
  {
    std::lock_guard lock{pending_mutex_};
    doomed.swap(pending_);
  }
  for (auto& [id, done] : doomed)
    done(nullptr, std::make_exception_ptr(std::runtime_error{why}));
}

std::size_t connection::pending_count() const {
  std::lock_guard lock{pending_mutex_};
  return pending_.size();
}

/// client

namespace {

const json::object& as_object(const json::value& v) {
  if (auto* o = v.if_object()) return *o;
  throw std::runtime_error{"expected an object"};
}

std::string required_string(const json::value& v, std::string_view key) {
  auto s = get_string(as_object(v), key);
  if (!s) utils::throwf("missing '{}'", key);
  return *s;
}

terminal_exit exit_from_json(const json::object& o) {
  terminal_exit e;
  if (auto code = get_int(o, "exit_code")) e.exit_code = static_cast<int>(*code);
  e.signal = get_string(o, "signal");
  return e;
}

json::object session_params(const std::string& session_id) {
  json::object params;
  params["session_id"] = session_id;
  return params;
}

}  // namespace

void connection::session_update(const std::string& session_id, json::object update) {
  auto params = session_params(session_id);
  params["update"] = std::move(update);
  send(jsonrpc::make_notification("session_update", std::move(params)));
}

pending<std::string> connection::read_text_file(
    const std::string& session_id, const std::string& path) {
  auto params = session_params(session_id);
  params["path"] = path;
  return request<std::string>(
      client_methods::read_text_file, std::move(params),
      [](const json::value& v) { return required_string(v, "content"); });
}

pending<void> connection::write_text_file(
    const std::string& session_id, const std::string& path,
    const std::string& content) {
  auto params = session_params(session_id);
  params["path"] = path;
  params["content"] = content;
  return request<void>(
      client_methods::write_text_file, std::move(params),
      [](const json::value&) {});
}

pending<std::string> connection::create_terminal(
    const std::string& session_id, const command_spec& cmd) {
  auto params = session_params(session_id);
  params["command"] = cmd.command;
  json::array args;
  for (const auto& a : cmd.args) args.emplace_back(a);
  params["args"] = std::move(args);
  if (cmd.cwd) params["cwd"] = *cmd.cwd;
  return request<std::string>(
      client_methods::terminal_create, std::move(params),
      [](const json::value& v) { return required_string(v, "terminal_id"); });
}

pending<terminal_exit> connection::wait_for_terminal_exit(
    const std::string& session_id, const std::string& terminal_id) {
  auto params = session_params(session_id);
  params["terminal_id"] = terminal_id;
  return request<terminal_exit>(
      client_methods::terminal_wait_for_exit, std::move(params),
      [](const json::value& v) { return exit_from_json(as_object(v)); });
}

pending<terminal_output> connection::read_terminal_output(
    const std::string& session_id, const std::string& terminal_id) {
  auto params = session_params(session_id);
  params["terminal_id"] = terminal_id;
  return request<terminal_output>(
      client_methods::terminal_output, std::move(params),
      [](const json::value& v) {
        const auto& o = as_object(v);
        terminal_output out;
        out.output = required_string(v, "output");
        if (auto* t = find_value(o, "truncated"); t && t->is_bool())
          out.truncated = t->as_bool();
        if (auto* s = get_object(o, "exit_status")) out.exit_status = exit_from_json(*s);
        return out;
      });
}

pending<void> connection::release_terminal(
    const std::string& session_id, const std::string& terminal_id) {
  auto params = session_params(session_id);
  params["terminal_id"] = terminal_id;
  return request<void>(
      client_methods::terminal_release, std::move(params),
      [](const json::value&) {});
}

pending<void> connection::kill_terminal(
    const std::string& session_id, const std::string& terminal_id) {
  auto params = session_params(session_id);
  params["terminal_id"] = terminal_id;
  return request<void>(
      client_methods::terminal_kill, std::move(params),
      [](const json::value&) {});
}

}  // namespace tether
