#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/json.hpp>
#include <condition_variable>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "tether/client.hpp"
#include "tether/connection.hpp"

namespace json = boost::json;

// In-memory client: files live in a map, terminals replay canned output
// picked by command line, and session updates are recorded.
struct fake_client : tether::client {
  struct canned {
    std::string output;
    int exit_code{0};
  };

  void session_update(const std::string& session_id, json::object update) override {
    {
      std::lock_guard lock{mutex};
      updates.emplace_back(session_id, std::move(update));
    }
    cv.notify_all();
  }

  tether::pending<std::string> read_text_file(
      const std::string&, const std::string& path) override {
    std::lock_guard lock{mutex};
    auto it = files.find(path);
    if (it == files.end())
      return tether::failed<std::string>(std::runtime_error{"no such file: " + path});
    return tether::ready(it->second);
  }

  tether::pending<void> write_text_file(
      const std::string&, const std::string& path, const std::string& content) override {
    std::lock_guard lock{mutex};
    files[path] = content;
    return tether::ready();
  }

  tether::pending<std::string> create_terminal(
      const std::string&, const tether::command_spec& cmd) override {
    std::lock_guard lock{mutex};
    auto line = cmd.command;
    for (const auto& a : cmd.args) line += " " + a;
    commands.push_back(line);
    auto id = "term-" + std::to_string(commands.size());
    canned c{"", 127};
    for (const auto& [prefix, reply] : scripts)
      if (line.starts_with(prefix)) c = reply;
    terminals[id] = c;
    return tether::ready(id);
  }

  tether::pending<tether::terminal_exit> wait_for_terminal_exit(
      const std::string&, const std::string& id) override {
    std::lock_guard lock{mutex};
    return tether::ready(tether::terminal_exit{terminals.at(id).exit_code, std::nullopt});
  }

  tether::pending<tether::terminal_output> read_terminal_output(
      const std::string&, const std::string& id) override {
    std::lock_guard lock{mutex};
    const auto& t = terminals.at(id);
    return tether::ready(tether::terminal_output{
      t.output, false, tether::terminal_exit{t.exit_code, std::nullopt}});
  }

  tether::pending<void> release_terminal(const std::string&, const std::string& id) override {
    std::lock_guard lock{mutex};
    released.push_back(id);
    return tether::ready();
  }

  tether::pending<void> kill_terminal(const std::string&, const std::string&) override {
    return tether::ready();
  }

  /// Updates of one kind ("tool_call", "agent_message_chunk", ...)
  std::vector<json::object> updates_of(std::string_view kind) {
    std::lock_guard lock{mutex};
    std::vector<json::object> out;
    for (const auto& [sid, u] : updates)
      if (u.at("sessionUpdate").as_string() == kind) out.push_back(u);
    return out;
  }

  std::size_t update_count() {
    std::lock_guard lock{mutex};
    return updates.size();
  }

  std::mutex mutex;
  std::condition_variable cv;
  std::map<std::string, std::string> files;
  std::vector<std::pair<std::string, canned>> scripts;
  std::map<std::string, canned> terminals;
  std::vector<std::string> commands;
  std::vector<std::string> released;
  std::vector<std::pair<std::string, json::object>> updates;
};

// Runs an io_context on a background thread for host_bridge calls.
struct io_thread {
  io_thread() : work{boost::asio::make_work_guard(io)}, thread{[this] { io.run(); }} {}
  io_thread(const io_thread&) = delete;
  io_thread& operator=(const io_thread&) = delete;
  ~io_thread() {
    work.reset();
    io.stop();
    thread.join();
  }

  boost::asio::io_context io;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work;
  std::thread thread;
};

/// Poll @p pred for up to @p limit.
inline bool eventually(
    const std::function<bool()>& pred,
    std::chrono::milliseconds limit = std::chrono::seconds{5}) {
  auto until = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < until) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds{5});
  }
  return pred();
}

// Keeps every frame written to the peer
class recording_connection : public tether::connection {
 public:
  using connection::connection;

  std::vector<json::object> frames() const {
    std::lock_guard lock{mutex_};
    return frames_;
  }

  /// Responses carrying @p id.
  std::vector<json::object> responses_to(std::int64_t id) const {
    std::vector<json::object> out;
    for (const auto& f : frames()) {
      const auto* v = f.if_contains("id");
      if (v && v->is_int64() && v->as_int64() == id && !f.contains("method")) out.push_back(f);
    }
    return out;
  }

  std::vector<json::object> notifications() const {
    std::vector<json::object> out;
    for (const auto& f : frames())
      if (f.contains("method") && f.at("method") == "session_update") out.push_back(f);
    return out;
  }

 protected:
  boost::asio::awaitable<void> write_frame(const json::object& msg) override {
    std::lock_guard lock{mutex_};
    frames_.push_back(msg);
    co_return;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<json::object> frames_;
};
