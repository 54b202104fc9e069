#include <doctest/doctest.h>
#include <fmt/format.h>

#include <boost/asio/awaitable.hpp>
#include <boost/json.hpp>
#include <algorithm>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "fake_client.hpp"
#include "tether/agent.hpp"
#include "tether/connection.hpp"
#include "tether/coordinator.hpp"
#include "tether/dispatcher.hpp"

using namespace std::chrono_literals;

namespace {

struct dispatcher_fixture {
  io_thread loop;
  tether::coordinator coord;
  tether::agent ag{loop.io.get_executor(), coord, std::make_shared<tether::echo_model>()};
  tether::dispatcher disp{coord, ag};

  std::shared_ptr<recording_connection> connect() {
    auto c = std::make_shared<recording_connection>(loop.io.get_executor());
    c->set_client_id(coord.register_client(c));
    return c;
  }

  /// Send @p text and wait for the response to @p id.
  json::object call(
      const std::shared_ptr<recording_connection>& c, std::int64_t id, std::string_view text) {
    disp.handle_frame(c, text);
    REQUIRE(eventually([&] { return !c->responses_to(id).empty(); }));
    return c->responses_to(id).front();
  }

  std::string new_session(const std::shared_ptr<recording_connection>& c, std::int64_t id) {
    auto r = call(
        c, id,
        fmt::format(
            R"({{"jsonrpc":"2.0","id":{},"method":"new_session","params":{{"cwd":"/work"}}}})",
            id));
    return std::string{r.at("result").as_object().at("session_id").as_string()};
  }
};

std::int64_t error_code(const json::object& response) {
  return response.at("error").as_object().at("code").as_int64();
}

}  // namespace

TEST_CASE_FIXTURE(dispatcher_fixture, "dispatcher-initialize") {
  auto c = connect();
  auto r = call(
      c, 1, R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocol_version":1}})");
  const auto& result = r.at("result").as_object();
  CHECK(result.at("protocol_version") == 1);
  CHECK(result.at("agent_info").as_object().at("name") == "tether");
  CHECK(result.at("agent_capabilities").as_object().at("resume_session") == true);
  CHECK(result.at("model") == "echo");
}

TEST_CASE_FIXTURE(dispatcher_fixture, "dispatcher-sessions") {
  auto c = connect();
  auto sid = new_session(c, 1);
  CHECK(sid.starts_with("session-"));

  auto listed = call(c, 2, R"({"jsonrpc":"2.0","id":2,"method":"list_sessions"})");
  const auto& sessions = listed.at("result").as_object().at("sessions").as_array();
  REQUIRE(sessions.size() == 1);
  CHECK(sessions[0].as_object().at("session_id") == sid);

  auto mode = call(
      c, 3,
      fmt::format(
          R"({{"jsonrpc":"2.0","id":3,"method":"set_session_mode","params":{{"session_id":"{}","mode_id":"plan"}}}})",
          sid));
  CHECK(mode.contains("result"));
  CHECK(coord.list_sessions(c->client_id()).front().mode_id == "plan");

  auto cancel = call(
      c, 4,
      fmt::format(
          R"({{"jsonrpc":"2.0","id":4,"method":"cancel","params":{{"session_id":"{}"}}}})", sid));
  CHECK(cancel.at("result").as_object().at("cancelled") == false);
}

TEST_CASE_FIXTURE(dispatcher_fixture, "dispatcher-errors-keep-the-connection") {
  auto c = connect();

  CHECK(disp.handle_frame(c, "{not json"));
  REQUIRE(eventually([&] { return c->frames().size() == 1; }));
  auto parse = c->frames().front();
  CHECK(error_code(parse) == tether::jsonrpc::parse_error);
  CHECK(parse.at("id").is_null());

  CHECK(disp.handle_frame(c, "[1, 2]"));
  REQUIRE(eventually([&] { return c->frames().size() == 2; }));
  CHECK(error_code(c->frames().back()) == tether::jsonrpc::invalid_request);

  auto no_method = call(c, 7, R"({"jsonrpc":"2.0","id":7,"params":{}})");
  CHECK(error_code(no_method) == tether::jsonrpc::invalid_request);

  auto missing = call(c, 8, R"({"jsonrpc":"2.0","id":8,"method":"new_session","params":{}})");
  CHECK(error_code(missing) == tether::jsonrpc::invalid_params);

  auto unknown = call(c, 9, R"({"jsonrpc":"2.0","id":9,"method":"frobnicate"})");
  CHECK(error_code(unknown) == tether::jsonrpc::internal_error);
  CHECK(unknown.at("error").as_object().at("message") == "Unknown method: frobnicate");

  auto not_found = call(
      c, 10,
      R"({"jsonrpc":"2.0","id":10,"method":"prompt","params":{"session_id":"session-999","prompt":"hi"}})");
  CHECK(error_code(not_found) == -32001);
  CHECK(not_found.at("error").as_object().at("data").as_object().at("kind") == "SessionNotFound");

  // Still serving after all of the above
  auto ok = call(c, 11, R"({"jsonrpc":"2.0","id":11,"method":"initialize"})");
  CHECK(ok.contains("result"));
  CHECK_FALSE(c->closed());
}

TEST_CASE_FIXTURE(dispatcher_fixture, "dispatcher-requires-jsonrpc-2") {
  auto c = connect();

  auto missing = call(c, 1, R"({"id":1,"method":"initialize"})");
  CHECK(error_code(missing) == tether::jsonrpc::invalid_request);
  CHECK_FALSE(missing.contains("result"));

  auto wrong = call(c, 2, R"({"jsonrpc":"1.0","id":2,"method":"initialize"})");
  CHECK(error_code(wrong) == tether::jsonrpc::invalid_request);

  auto not_a_string = call(c, 3, R"({"jsonrpc":2.0,"id":3,"method":"list_sessions"})");
  CHECK(error_code(not_a_string) == tether::jsonrpc::invalid_request);

  auto ok = call(c, 4, R"({"jsonrpc":"2.0","id":4,"method":"initialize"})");
  CHECK(ok.contains("result"));
  CHECK_FALSE(c->closed());
}

TEST_CASE_FIXTURE(dispatcher_fixture, "dispatcher-notifications-get-no-reply") {
  auto c = connect();
  disp.handle_frame(c, R"({"jsonrpc":"2.0","method":"frobnicate"})");
  disp.handle_frame(c, R"({"jsonrpc":"2.0","method":"initialize"})");
  auto ok = call(c, 1, R"({"jsonrpc":"2.0","id":1,"method":"initialize"})");
  CHECK(ok.contains("result"));
  CHECK(c->frames().size() == 1);
}

TEST_CASE_FIXTURE(dispatcher_fixture, "dispatcher-sessions-belong-to-their-connection") {
  auto a = connect();
  auto b = connect();
  auto sid = new_session(a, 1);

  auto denied = call(
      b, 2,
      fmt::format(
          R"({{"jsonrpc":"2.0","id":2,"method":"prompt","params":{{"session_id":"{}","prompt":"hi"}}}})",
          sid));
  CHECK(error_code(denied) == -32005);
  CHECK(denied.at("error").as_object().at("data").as_object().at("kind") == "AccessDenied");
}

TEST_CASE_FIXTURE(dispatcher_fixture, "dispatcher-concurrent-prompts-stay-apart") {
  auto a = connect();
  auto b = connect();
  auto sa = new_session(a, 1);
  auto sb = new_session(b, 1);

  disp.handle_frame(
      a, fmt::format(
             R"({{"jsonrpc":"2.0","id":2,"method":"prompt","params":{{"session_id":"{}","prompt":"from a"}}}})",
             sa));
  disp.handle_frame(
      b, fmt::format(
             R"({{"jsonrpc":"2.0","id":2,"method":"prompt","params":{{"session_id":"{}","prompt":[{{"type":"text","text":"from b"}}]}}}})",
             sb));

  REQUIRE(eventually([&] { return !a->responses_to(2).empty() && !b->responses_to(2).empty(); }));
  CHECK(a->responses_to(2).front().at("result").as_object().at("stop_reason") == "end_turn");
  CHECK(b->responses_to(2).front().at("result").as_object().at("stop_reason") == "end_turn");

  auto texts = [](const recording_connection& c, const std::string& sid) {
    std::vector<std::string> out;
    for (const auto& n : c.notifications()) {
      const auto& params = n.at("params").as_object();
      CHECK(params.at("session_id") == sid);
      const auto& update = params.at("update").as_object();
      if (update.at("sessionUpdate") == "agent_message_chunk")
        out.emplace_back(update.at("content").as_object().at("text").as_string());
    }
    return out;
  };
  auto ta = texts(*a, sa);
  auto tb = texts(*b, sb);
  CHECK(std::find(ta.begin(), ta.end(), "from a") != ta.end());
  CHECK(std::find(ta.begin(), ta.end(), "from b") == ta.end());
  CHECK(std::find(tb.begin(), tb.end(), "from b") != tb.end());
  CHECK(std::find(tb.begin(), tb.end(), "from a") == tb.end());

  // Greeting, then the reply, in production order
  REQUIRE(ta.size() == 2);
  CHECK(ta[0].starts_with("Hello, this is tether"));
  CHECK(ta[1] == "from a");
}

TEST_CASE_FIXTURE(dispatcher_fixture, "dispatcher-resume-on-a-new-connection") {
  auto first = connect();
  auto r = call(
      first, 1, R"({"jsonrpc":"2.0","id":1,"method":"new_session","params":{"cwd":"/work"}})");
  auto sid = std::string{r.at("result").as_object().at("session_id").as_string()};
  auto token = std::string{r.at("result").as_object().at("resume_token").as_string()};

  coord.unregister_client(first->client_id());
  auto second = connect();
  auto resumed = call(
      second, 1,
      fmt::format(
          R"({{"jsonrpc":"2.0","id":1,"method":"resume_session","params":{{"session_id":"{}","resume_token":"{}"}}}})",
          sid, token));
  CHECK(resumed.at("result").as_object().at("resumed") == true);
  CHECK(resumed.at("result").as_object().at("cwd") == "/work");
  CHECK(coord.route(sid) == second);
}

TEST_CASE_FIXTURE(dispatcher_fixture, "dispatcher-shutdown") {
  auto c = connect();
  CHECK_FALSE(disp.handle_frame(c, R"({"jsonrpc":"2.0","id":5,"method":"shutdown"})"));
  REQUIRE(eventually([&] { return !c->responses_to(5).empty(); }));
  CHECK(c->responses_to(5).front().at("result").is_null());

  auto status = disp.status();
  CHECK(status.at("clients") == 1);
  CHECK(status.at("sessions") == 0);
}

TEST_CASE_FIXTURE(dispatcher_fixture, "dispatcher-routes-client-responses") {
  auto c = connect();
  auto sid = new_session(c, 1);

  auto pending = c->read_text_file(sid, "a.py");
  REQUIRE(eventually([&] { return c->frames().size() == 2; }));
  auto request = c->frames().back();
  CHECK(request.at("method") == "fs_read_text_file");
  auto id = request.at("id").as_int64();

  disp.handle_frame(
      c, fmt::format(R"({{"jsonrpc":"2.0","id":{},"result":{{"content":"x = 1\n"}}}})", id));
  REQUIRE(pending.result.wait_for(5s) == std::future_status::ready);
  CHECK(pending.result.get() == "x = 1\n");
  CHECK(c->pending_count() == 0);
}
