#include <doctest/doctest.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/json.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <stdexcept>
#include <thread>
#include <vector>

#include "fake_client.hpp"
#include "tether/agent.hpp"
#include "tether/bridge.hpp"
#include "tether/coordinator.hpp"
#include "tether/toolset.hpp"

using namespace std::chrono_literals;

namespace {

const std::string three_errors = R"([
  {"file": "src/a.py", "line": 1, "column": 1, "severity": "error", "code": "invalid-assignment", "message": "m1"},
  {"file": "src/a.py", "line": 2, "column": 1, "severity": "error", "code": "invalid-argument-type", "message": "m2"},
  {"file": "src/b.py", "line": 7, "column": 3, "severity": "error", "code": "unresolved-import", "message": "m3"}
])";

struct session_fixture {
  io_thread loop;
  tether::coordinator coord;
  std::shared_ptr<fake_client> client{std::make_shared<fake_client>()};
  std::string client_id{coord.register_client(client)};
  tether::new_session_result session{coord.new_session("/work", client_id)};

  tether::toolset_context context(tether::cancel_token token = {}) {
    auto sid = session.session_id;
    return {
      session.state,
      [this, sid] { return coord.route(sid); },
      tether::host_bridge{loop.io.get_executor(), 2s, token},
      nullptr,
    };
  }

  tether::sandbox::execution_result execute(const std::string& code) {
    tether::sandbox::executor ex{};
    return ex.execute(code, tether::make_toolset(context()));
  }
};

// Replays canned replies, repeating the last one
struct scripted_model : tether::model {
  explicit scripted_model(std::vector<std::string> replies) : replies{std::move(replies)} {}

  [[nodiscard]] std::string name() const override { return "scripted"; }

  std::string complete(const json::array& messages, const tether::cancel_token&) override {
    std::lock_guard lock{mutex};
    seen.push_back(messages);
    auto i = std::min(calls++, replies.size() - 1);
    return replies[i];
  }

  std::mutex mutex;
  std::vector<std::string> replies;
  std::vector<json::array> seen;
  std::size_t calls{0};
};

// Blocks until the turn is cancelled
struct stuck_model : tether::model {
  [[nodiscard]] std::string name() const override { return "stuck"; }
  std::string complete(const json::array&, const tether::cancel_token& token) override {
    started.store(true);
    while (!token.requested()) std::this_thread::sleep_for(5ms);
    throw tether::model_error{"request cancelled"};
  }
  std::atomic_bool started{false};
};

std::string prompt_and_wait(
    tether::agent& ag, const std::string& sid, const std::string& cid, const std::string& text) {
  auto done = std::make_shared<std::promise<std::string>>();
  ag.prompt(sid, cid, text, [done](std::string reason, std::exception_ptr e) {
    if (e)
      done->set_exception(e);
    else
      done->set_value(std::move(reason));
  });
  auto f = done->get_future();
  REQUIRE(f.wait_for(10s) == std::future_status::ready);
  return f.get();
}

std::vector<std::string> statuses(fake_client& c) {
  std::vector<std::string> out;
  for (const auto& u : c.updates_of("tool_call")) out.emplace_back(u.at("status").as_string());
  for (const auto& u : c.updates_of("tool_call_update"))
    out.emplace_back(u.at("status").as_string());
  return out;
}

}  // namespace

TEST_CASE_FIXTURE(session_fixture, "toolset-typecheck-reports-error-count") {
  client->scripts.push_back({"ty check", {three_errors, 1}});

  auto r = execute("result = typecheck('src/')\nprint(result.error_count)");
  CHECK(r.success);
  CHECK(r.error.empty());
  CHECK(r.output == "3\n");

  REQUIRE(client->commands.size() == 1);
  CHECK(client->commands[0] == "ty check src/ --output-format json");
  CHECK(client->released == std::vector<std::string>{"term-1"});

  auto calls = client->updates_of("tool_call");
  REQUIRE(calls.size() == 1);
  CHECK(calls[0].at("title") == "typecheck(src/)");
  CHECK(statuses(*client) == std::vector<std::string>{"pending", "in_progress", "completed"});
}

TEST_CASE_FIXTURE(session_fixture, "toolset-files-and-commands") {
  client->scripts.push_back({"ls", {"a.py\nb.py\n", 0}});
  auto r = execute(
      "write_file('notes.txt', 'hello')\n"
      "print(read_file('notes.txt'))\n"
      "print(run_command('ls', ['-1']))\n");
  CHECK(r.success);
  CHECK(client->files.at("notes.txt") == "hello");
  CHECK(r.output.starts_with("hello\na.py\nb.py\n"));
  CHECK(r.output.find("[exit code") == std::string::npos);

  client->scripts.push_back({"false", {"", 1}});
  auto failing = execute("print(run_command('false'))");
  CHECK(failing.success);
  CHECK(failing.output.find("[exit code 1]") != std::string::npos);
}

TEST_CASE_FIXTURE(session_fixture, "toolset-failures-surface-as-failed-calls") {
  auto missing = execute("read_file('nope.py')");
  CHECK_FALSE(missing.success);
  CHECK(missing.kind == tether::sandbox::error_kind::runtime);
  CHECK(missing.error.find("nope.py") != std::string::npos);

  auto nav = execute("r = goto_definition('a.py', 1, 1, 'f')\nprint(r.success, r.parse_error)");
  CHECK(nav.success);
  CHECK(nav.output.starts_with("False "));
  CHECK(nav.output.find("language server") != std::string::npos);

  auto s = statuses(*client);
  CHECK(std::count(s.begin(), s.end(), "failed") == 2);
}

TEST_CASE_FIXTURE(session_fixture, "toolset-owner-gone") {
  coord.unregister_client(client_id);
  auto r = execute("r = git_status()\nprint(r.success)\nprint(r.parse_error)");
  CHECK(r.success);
  CHECK(r.output.starts_with("False\nFailed to run git status"));
  CHECK(client->update_count() == 0);
}

// A client that accepts requests but never answers them
struct silent_client_fixture {
  io_thread loop;
  tether::coordinator coord;
  std::shared_ptr<recording_connection> conn{
    std::make_shared<recording_connection>(loop.io.get_executor())};
  std::string client_id{register_conn()};
  tether::new_session_result session{coord.new_session("/work", client_id)};

  std::string register_conn() {
    auto id = coord.register_client(conn);
    conn->set_client_id(id);
    return id;
  }

  bool saw_update_status(std::string_view kind, std::string_view status) const {
    for (const auto& n : conn->notifications()) {
      const auto& u = n.at("params").as_object().at("update").as_object();
      if (u.at("sessionUpdate") == kind && u.at("status") == status) return true;
    }
    return false;
  }
};

TEST_CASE_FIXTURE(silent_client_fixture, "toolset-host-call-timeout") {
  auto sid = session.session_id;
  tether::toolset_context ctx{
    session.state,
    [this, sid] { return coord.route(sid); },
    tether::host_bridge{loop.io.get_executor(), 100ms},
    nullptr,
  };
  tether::sandbox::executor ex{};

  auto r = ex.execute("print('asking')\nread_file('never.txt')", tether::make_toolset(ctx));
  CHECK_FALSE(r.success);
  CHECK(r.kind == tether::sandbox::error_kind::timeout);
  CHECK(r.timed_out);
  CHECK(r.output == "asking\n");
  CHECK(r.error.find("host call timed out after 100ms") != std::string::npos);

  // The request went out and was dropped once the call gave up
  CHECK(eventually([&] {
    for (const auto& f : conn->frames())
      if (f.contains("method") && f.at("method") == "fs_read_text_file") return true;
    return false;
  }));
  CHECK(eventually([&] { return conn->pending_count() == 0; }));
  CHECK(eventually([&] { return saw_update_status("tool_call_update", "failed"); }));
}

TEST_CASE_FIXTURE(silent_client_fixture, "agent-wall-clock-stops-a-waiting-host-call") {
  auto model = std::make_shared<scripted_model>(std::vector<std::string>{
    "```python\nwrite_file('late.txt', 'x')\n```",
    "It did not answer.",
  });
  tether::agent_config cfg{};
  cfg.limits.wall_clock = 200ms;
  cfg.host_call_timeout = 30s;
  cfg.cancel_grace = 5s;
  tether::agent ag{loop.io.get_executor(), coord, model, cfg};

  auto started = std::chrono::steady_clock::now();
  CHECK(prompt_and_wait(ag, session.session_id, client_id, "write it") == "end_turn");
  // Well before the host call deadline or the cancel grace
  CHECK(std::chrono::steady_clock::now() - started < 3s);

  CHECK(eventually([&] { return conn->pending_count() == 0; }));
  const auto& feedback = model->seen.at(1).back().as_object();
  CHECK(std::string{feedback.at("content").as_string()}.find("Timeout") != std::string::npos);
}

TEST_CASE("host-bridge-refuses-the-loop-thread") {
  io_thread loop;
  tether::host_bridge bridge{loop.io.get_executor(), 1s};
  auto refused = std::make_shared<std::promise<bool>>();
  boost::asio::post(loop.io, [bridge, refused] {
    try {
      bridge.call<void>([] { return tether::ready(); });
      refused->set_value(false);
    } catch (const std::logic_error&) {
      refused->set_value(true);
    }
  });
  auto f = refused->get_future();
  REQUIRE(f.wait_for(5s) == std::future_status::ready);
  CHECK(f.get());
}

TEST_CASE("host-bridge-skips-a-request-it-gave-up-on") {
  // Nothing runs the loop until the call has given up
  boost::asio::io_context io;
  int submits{0};
  auto submit = [&] {
    ++submits;
    return tether::ready(std::string{"late"});
  };

  tether::host_bridge bridge{io.get_executor(), 100ms};
  CHECK_THROWS_AS(bridge.call<std::string>(submit), tether::sandbox::execution_timeout);

  tether::cancel_token token;
  token.request();
  tether::host_bridge cancelled{io.get_executor(), 5s, token};
  CHECK_THROWS_AS(cancelled.call<std::string>(submit), tether::sandbox::execution_cancelled);

  io.poll();
  CHECK(submits == 0);
}

TEST_CASE("agent-extract-code") {
  auto blocks = tether::agent::extract_code(
      "Let me check.\n"
      "<tool_call><function=execute_code><parameter=code>\n"
      "print(1)\n"
      "</parameter></function></tool_call>\n"
      "and also\n"
      "```python\nprint(2)\n```\n"
      "<tool_call>\nprint(3)\n</tool_call>\n");
  REQUIRE(blocks.size() == 3);
  CHECK(blocks[0] == "print(1)");
  CHECK(blocks[1] == "print(3)");
  CHECK(blocks[2] == "print(2)");

  CHECK(tether::agent::extract_code("No code here, just ```text\nfoo\n```").empty());
}

TEST_CASE_FIXTURE(session_fixture, "agent-turn-runs-code-and-answers") {
  client->scripts.push_back({"ty check", {three_errors, 1}});
  auto model = std::make_shared<scripted_model>(std::vector<std::string>{
    "```python\nprint(typecheck('src/').error_count)\n```",
    "There are 3 type errors.",
  });
  tether::agent ag{loop.io.get_executor(), coord, model};

  auto reason = prompt_and_wait(ag, session.session_id, client_id, "How many type errors?");
  CHECK(reason == "end_turn");
  CHECK(model->calls == 2);

  // The second request saw the execution output
  const auto& second = model->seen.at(1);
  CHECK(second.at(0).as_object().at("role") == "system");
  const auto& feedback = second.back().as_object();
  CHECK(feedback.at("role") == "user");
  CHECK(std::string{feedback.at("content").as_string()}.find("3") != std::string::npos);

  auto chunks = client->updates_of("agent_message_chunk");
  REQUIRE(chunks.size() >= 3);
  auto first_text = std::string{chunks[0].at("content").as_object().at("text").as_string()};
  CHECK(first_text.find("scripted") != std::string::npos);

  auto calls = client->updates_of("tool_call");
  REQUIRE(calls.size() == 2);
  CHECK(calls[0].at("title") == "execute_code");
  CHECK(calls[1].at("title") == "typecheck(src/)");

  // Greeting only once per session
  prompt_and_wait(ag, session.session_id, client_id, "again");
  auto greetings = 0;
  for (const auto& c : client->updates_of("agent_message_chunk"))
    if (std::string{c.at("content").as_object().at("text").as_string()}.starts_with("Hello, this is tether"))
      ++greetings;
  CHECK(greetings == 1);
}

TEST_CASE_FIXTURE(session_fixture, "agent-step-limit") {
  auto model = std::make_shared<scripted_model>(std::vector<std::string>{"```python\nprint('again')\n```"});
  tether::agent_config cfg{};
  cfg.max_steps = 3;
  tether::agent ag{loop.io.get_executor(), coord, model, cfg};

  CHECK(prompt_and_wait(ag, session.session_id, client_id, "loop") == "max_turn_requests");
  CHECK(model->calls == 3);
}

TEST_CASE_FIXTURE(session_fixture, "agent-echo-model") {
  tether::agent ag{loop.io.get_executor(), coord, std::make_shared<tether::echo_model>()};
  CHECK(prompt_and_wait(ag, session.session_id, client_id, "just say this") == "end_turn");
  bool echoed{false};
  for (const auto& c : client->updates_of("agent_message_chunk"))
    if (c.at("content").as_object().at("text") == "just say this") echoed = true;
  CHECK(echoed);
}

TEST_CASE_FIXTURE(session_fixture, "agent-cancel-and-concurrent-prompt") {
  auto model = std::make_shared<stuck_model>();
  tether::agent ag{loop.io.get_executor(), coord, model};

  auto done = std::make_shared<std::promise<std::string>>();
  ag.prompt(session.session_id, client_id, "hang", [done](std::string r, std::exception_ptr) {
    done->set_value(std::move(r));
  });
  REQUIRE(eventually([&] { return model->started.load(); }));

  CHECK_THROWS_AS(
      ag.prompt(session.session_id, client_id, "second", [](std::string, std::exception_ptr) {}),
      tether::turn_in_progress);

  // Only the owner may cancel
  auto other = coord.register_client(std::make_shared<fake_client>());
  CHECK_THROWS_AS(ag.cancel(session.session_id, other), tether::session_error);

  CHECK(ag.cancel(session.session_id, client_id));
  auto f = done->get_future();
  REQUIRE(f.wait_for(10s) == std::future_status::ready);
  CHECK(f.get() == "cancelled");
  CHECK_FALSE(ag.cancel(session.session_id, client_id));
}
