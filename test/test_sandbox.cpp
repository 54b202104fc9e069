#include <doctest/doctest.h>

#include <boost/json.hpp>
#include <string>

#include "tether/sandbox.hpp"

namespace json = boost::json;
namespace sandbox = tether::sandbox;

namespace {

std::string run(std::string_view code, const sandbox::external_functions& fns = {}) {
  return sandbox::run(code, fns);
}

}  // namespace

TEST_CASE("sandbox-basics") {
  CHECK(run("print(1 + 2 * 3)") == "7\n");
  CHECK(run("x = [3, 1, 2]\nprint(sorted(x), len(x))") == "[1, 2, 3] 3\n");
  CHECK(run("print(True, None, 'a' + 'b')") == "True None ab\n");
  CHECK(run("n = 4\nprint(f'{n} items, {n * 2} halves')") == "4 items, 8 halves\n");
  CHECK(run("print([i * i for i in range(4) if i % 2 == 0])") == "[0, 4]\n");
  CHECK(run("d = {'a': 1}\nd['b'] = 2\nprint(sorted(d.keys()))") == "['a', 'b']\n");
}

TEST_CASE("sandbox-control-flow") {
  const auto code = R"(
total = 0
for i in range(10):
    if i == 7:
        break
    if i % 2:
        continue
    total += i
while total > 5:
    total -= 5
print(total)
)";
  CHECK(run(code) == "2\n");
}

TEST_CASE("sandbox-try-except") {
  const auto code = R"(
try:
    x = {}['missing']
except LookupError:
    print('caught')
try:
    1 / 0
except ZeroDivisionError:
    print('div')
)";
  CHECK(run(code) == "caught\ndiv\n");
}

TEST_CASE("sandbox-json-module") {
  CHECK(run("print(json.loads('{\"a\": [1, 2]}')['a'][1])") == "2\n");
  CHECK(run("print(json.dumps({'k': 'v'}))") == "{\"k\": \"v\"}\n");
}

TEST_CASE("sandbox-uncaught-errors") {
  CHECK_THROWS_AS(run("print(undefined_name)"), sandbox::code_execution_error);
  try {
    run("x = 1\ny = x + nope");
    FAIL("expected NameError");
  } catch (const sandbox::code_execution_error& e) {
    CHECK(std::string{e.what()}.starts_with("NameError"));
  }
  CHECK_THROWS_AS(run("print(9223372036854775807 + 1)"), sandbox::code_execution_error);
}

TEST_CASE("sandbox-rejects-before-running") {
  int calls{0};
  sandbox::external_functions fns{{
    {"touch", [&](const sandbox::call_args&) -> json::value {
       ++calls;
       return nullptr;
     }},
  }};

  // The host function must not run when a later line is forbidden
  CHECK_THROWS_AS(run("touch()\nimport os", fns), sandbox::sandbox_violation);
  CHECK_THROWS_AS(run("touch()\ndef f():\n    pass", fns), sandbox::sandbox_violation);
  CHECK_THROWS_AS(run("touch()\nf = lambda: 1", fns), sandbox::sandbox_violation);
  CHECK_THROWS_AS(run("touch()\nopen('/etc/passwd')", fns), sandbox::sandbox_violation);
  CHECK_THROWS_AS(run("touch()\nx = 'a'.__class__", fns), sandbox::sandbox_violation);
  CHECK_THROWS_AS(run("touch()\ngetattr(1, 'real')", fns), sandbox::sandbox_violation);
  CHECK(calls == 0);

  CHECK_THROWS_AS(sandbox::check("exec('1')"), sandbox::sandbox_violation);
  CHECK_THROWS_AS(sandbox::check("x = = 1"), sandbox::syntax_error);
  CHECK_NOTHROW(sandbox::check("x = [1, 2]\nprint(x)"));
}

TEST_CASE("sandbox-host-functions") {
  sandbox::external_functions fns{{
    {"add", [](const sandbox::call_args& a) -> json::value {
       return a.int_arg(0, "a", 0) + a.int_arg(1, "b", 0);
     }},
    {"describe", [](const sandbox::call_args& a) -> json::value {
       json::object o;
       o["path"] = a.string_arg(0, "path");
       o["ok"] = true;
       return o;
     }},
    {"explode", [](const sandbox::call_args&) -> json::value {
       throw std::runtime_error{"disk on fire"};
     }},
  }};

  CHECK(run("print(add(2, b=40))", fns) == "42\n");
  CHECK(run("r = describe('src/')\nprint(r.path, r.ok)", fns) == "src/ True\n");
  CHECK_THROWS_AS(run("describe()", fns), sandbox::code_execution_error);

  try {
    run("explode()", fns);
    FAIL("expected RuntimeError");
  } catch (const sandbox::code_execution_error& e) {
    CHECK(std::string{e.what()}.find("disk on fire") != std::string::npos);
  }
  CHECK(run("try:\n    explode()\nexcept Exception:\n    print('handled')", fns) ==
        "handled\n");
}

TEST_CASE("sandbox-limits") {
  sandbox::limits lim{};
  lim.max_steps = 10'000;
  std::string out;
  CHECK_THROWS_AS(
      sandbox::run("while True:\n    pass", {}, out, lim), sandbox::execution_timeout);

  lim = {};
  lim.max_output = 8;
  out.clear();
  CHECK_THROWS_AS(
      sandbox::run("for i in range(100):\n    print(i)", {}, out, lim),
      sandbox::execution_timeout);
  CHECK(out.size() == 8);

  tether::cancel_token token;
  token.request();
  CHECK_THROWS_AS(
      sandbox::run("while True:\n    pass", {}, out, {}, token), sandbox::execution_cancelled);
}

TEST_CASE("sandbox-memory-limit") {
  sandbox::limits lim{};
  lim.max_memory = 1U << 20U;
  std::string out;

  // Every statement doubles the value; the copies are counted as they are made
  try {
    sandbox::run("a = []\nfor i in range(40):\n    a = [a, a]", {}, out, lim);
    FAIL("expected MemoryError");
  } catch (const sandbox::code_execution_error& e) {
    CHECK(std::string{e.what()}.starts_with("MemoryError"));
  }

  try {
    sandbox::run("a = [0] * 1000\nb = [a] * 100000", {}, out, lim);
    FAIL("expected MemoryError");
  } catch (const sandbox::code_execution_error& e) {
    CHECK(std::string{e.what()}.starts_with("MemoryError"));
  }

  CHECK(
      sandbox::run(
          "try:\n    a = [0] * 1000\n    b = [a] * 100000\nexcept MemoryError:\n"
          "    print('too big')",
          {}, lim) == "too big\n");

  // Memory is returned when values are dropped
  CHECK(
      sandbox::run(
          "for i in range(50):\n    a = [0] * 10000\nprint(len(a))", {}, lim) ==
      "10000\n");
}

TEST_CASE("sandbox-nesting-limit") {
  try {
    run("a = []\nfor i in range(200):\n    a = [a]");
    FAIL("expected RecursionError");
  } catch (const sandbox::code_execution_error& e) {
    CHECK(std::string{e.what()}.starts_with("RecursionError"));
  }

  CHECK_THROWS_AS(
      run("a = []\nfor i in range(200):\n    a.append(a)"),
      sandbox::code_execution_error);
  CHECK_THROWS_AS(
      run("d = {}\nfor i in range(200):\n    d = {'next': d}"),
      sandbox::code_execution_error);
  CHECK_THROWS_AS(
      run("a = [1]\nfor i in range(200):\n    a = list(enumerate(a))"),
      sandbox::code_execution_error);

  sandbox::limits lim{};
  lim.max_depth = 3;
  CHECK(sandbox::run("print([[[1]]])", {}, lim) == "[[[1]]]\n");
  CHECK_THROWS_AS(sandbox::run("x = [[[[1]]]]", {}, lim), sandbox::code_execution_error);
}

TEST_CASE("sandbox-range-extremes") {
  CHECK(
      run("print(list(range(9223372036854775807 - 2, 9223372036854775807)))") ==
      "[9223372036854775805, 9223372036854775806]\n");
  CHECK(
      run("r = range(-9223372036854775807 - 1, 9223372036854775807, "
          "4611686018427387904)\nprint(len(r), r[0], r[-1])") ==
      "4 -9223372036854775808 4611686018427387904\n");
  CHECK(run("print(list(range(5, -5, -4)))") == "[5, 1, -3]\n");

  try {
    run("range(-9223372036854775807 - 1, 9223372036854775807)");
    FAIL("expected MemoryError");
  } catch (const sandbox::code_execution_error& e) {
    CHECK(std::string{e.what()}.starts_with("MemoryError"));
  }
}
