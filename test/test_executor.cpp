#include <doctest/doctest.h>

#include <atomic>
#include <boost/json.hpp>
#include <chrono>
#include <thread>

#include "tether/sandbox.hpp"

namespace json = boost::json;
namespace sandbox = tether::sandbox;
using namespace std::chrono_literals;

namespace {
const sandbox::external_functions none{};
}  // namespace

TEST_CASE("executor-success-and-errors-as-data") {
  sandbox::executor ex{};

  auto ok = ex.execute("print('hi')", none);
  CHECK(ok.success);
  CHECK(ok.output == "hi\n");
  CHECK(ok.kind == sandbox::error_kind::none);

  auto syntax = ex.execute("print(", none);
  CHECK_FALSE(syntax.success);
  CHECK(syntax.kind == sandbox::error_kind::syntax);
  CHECK(syntax.error.starts_with("Syntax error: "));

  auto violation = ex.execute("import os", none);
  CHECK_FALSE(violation.success);
  CHECK(violation.kind == sandbox::error_kind::violation);

  auto runtime = ex.execute("print('before')\nprint(1 / 0)", none);
  CHECK_FALSE(runtime.success);
  CHECK(runtime.kind == sandbox::error_kind::runtime);
  CHECK(runtime.output == "before\n");
  CHECK(runtime.error.find("ZeroDivisionError") != std::string::npos);

  auto o = sandbox::to_json(runtime);
  CHECK(o.at("success") == false);
  CHECK(o.at("kind") == "runtime");
  CHECK(o.at("output") == "before\n");
}

TEST_CASE("executor-wall-clock") {
  sandbox::limits lim{};
  lim.wall_clock = 100ms;
  sandbox::executor ex{lim, 1s};

  auto r = ex.execute("while True:\n    pass", none);
  CHECK_FALSE(r.success);
  CHECK(r.kind == sandbox::error_kind::timeout);
  CHECK(r.timed_out);
}

TEST_CASE("executor-cancel") {
  sandbox::executor ex{{}, 1s};
  tether::cancel_token token;
  std::thread canceller{[token] {
    std::this_thread::sleep_for(50ms);
    token.request();
  }};
  auto r = ex.execute("while True:\n    pass", none, token);
  canceller.join();
  CHECK_FALSE(r.success);
  CHECK(r.kind == sandbox::error_kind::cancelled);
  CHECK_FALSE(r.timed_out);
}

TEST_CASE("executor-abandons-stuck-worker") {
  // A host call that ignores cancellation keeps the worker busy
  auto release = std::make_shared<std::atomic_bool>(false);
  sandbox::external_functions fns{{
    {"block", [release](const sandbox::call_args&) -> json::value {
       while (!release->load()) std::this_thread::sleep_for(5ms);
       return nullptr;
     }},
  }};

  sandbox::limits lim{};
  lim.wall_clock = 50ms;
  sandbox::executor ex{lim, 50ms};

  auto started = std::chrono::steady_clock::now();
  auto r = ex.execute("block()", fns);
  auto took = std::chrono::steady_clock::now() - started;

  CHECK_FALSE(r.success);
  CHECK(r.kind == sandbox::error_kind::timeout);
  CHECK(r.error.find("abandoned") != std::string::npos);
  CHECK(took < 2s);

  release->store(true);
  // Let the detached worker finish before the functions go away
  std::this_thread::sleep_for(50ms);
}

TEST_CASE("executor-hands-its-token-to-host-functions") {
  // The bundle watches the execution's own token, which trips at the
  // deadline even though the caller never cancels
  sandbox::executor::functions_factory make = [](tether::cancel_token token) {
    return sandbox::external_functions{{
      {"wait_for_stop", [token](const sandbox::call_args&) -> json::value {
         while (!token.requested()) std::this_thread::sleep_for(5ms);
         throw sandbox::execution_cancelled{"host call cancelled"};
       }},
    }};
  };

  sandbox::limits lim{};
  lim.wall_clock = 100ms;
  sandbox::executor ex{lim, 5s};

  auto started = std::chrono::steady_clock::now();
  auto r = ex.execute("wait_for_stop()", make);
  auto took = std::chrono::steady_clock::now() - started;

  CHECK_FALSE(r.success);
  CHECK(r.kind == sandbox::error_kind::timeout);
  CHECK(r.timed_out);
  CHECK(r.error.find("abandoned") == std::string::npos);
  CHECK(took < 2s);

  tether::cancel_token turn;
  turn.request();
  auto cancelled = ex.execute("wait_for_stop()", make, turn);
  CHECK(cancelled.kind == sandbox::error_kind::cancelled);
  CHECK_FALSE(cancelled.timed_out);
}
