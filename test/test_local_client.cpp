#include <doctest/doctest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <string>
#include <vector>

#include <unistd.h>

#include "tether/local_client.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

// A fresh directory under the system temp dir, removed afterwards
struct scratch_dir {
  scratch_dir() {
    path = fs::temp_directory_path() / ("tether-test-" + std::to_string(::getpid()) + "-" +
                                        std::to_string(counter++));
    fs::create_directories(path);
    path = fs::canonical(path);
  }
  scratch_dir(const scratch_dir&) = delete;
  scratch_dir& operator=(const scratch_dir&) = delete;
  ~scratch_dir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }

  fs::path path;
  static inline int counter{0};
};

template <typename T>
T get(tether::pending<T> p) {
  REQUIRE(p.result.wait_for(10s) == std::future_status::ready);
  return p.result.get();
}

void get(tether::pending<void> p) {
  REQUIRE(p.result.wait_for(10s) == std::future_status::ready);
  p.result.get();
}

}  // namespace

TEST_CASE("local-client-workspace-boundary") {
  scratch_dir ws;
  tether::local_client c{ws.path};

  CHECK(c.resolve("src/a.py") == ws.path / "src" / "a.py");
  CHECK(c.resolve("./src/../b.py") == ws.path / "b.py");
  CHECK(c.resolve(ws.path.string()) == ws.path);
  CHECK_THROWS_AS((void)c.resolve("../outside.txt"), tether::workspace_error);
  CHECK_THROWS_AS((void)c.resolve("/etc/passwd"), tether::workspace_error);

  // A sibling sharing the prefix is still outside
  auto sibling = ws.path.string() + "2/x.py";
  CHECK_THROWS_AS((void)c.resolve(sibling), tether::workspace_error);
}

TEST_CASE("local-client-files") {
  scratch_dir ws;
  tether::local_client c{ws.path};

  get(c.write_text_file("s", "pkg/mod.py", "x = 1\n"));
  CHECK(fs::exists(ws.path / "pkg" / "mod.py"));
  CHECK(get(c.read_text_file("s", "pkg/mod.py")) == "x = 1\n");

  CHECK_THROWS_AS(get(c.read_text_file("s", "missing.py")), std::runtime_error);
  CHECK_THROWS_AS(get(c.write_text_file("s", "../escape.py", "")), std::runtime_error);
  CHECK_FALSE(fs::exists(ws.path.parent_path() / "escape.py"));
}

TEST_CASE("local-client-terminal-merges-output") {
  scratch_dir ws;
  tether::local_client c{ws.path};

  auto id = get(c.create_terminal("s", {"sh", {"-c", "echo hi; echo err >&2; exit 3"}}));
  CHECK(id == "term-1");
  CHECK(c.terminal_count() == 1);

  auto exit = get(c.wait_for_terminal_exit("s", id));
  REQUIRE(exit.exit_code);
  CHECK(*exit.exit_code == 3);
  CHECK_FALSE(exit.signal);

  auto out = get(c.read_terminal_output("s", id));
  CHECK(out.output == "hi\nerr\n");
  CHECK_FALSE(out.truncated);
  REQUIRE(out.exit);
  CHECK(out.exit->exit_code == 3);

  get(c.release_terminal("s", id));
  CHECK(c.terminal_count() == 0);
  CHECK_THROWS_AS(get(c.read_terminal_output("s", id)), std::runtime_error);
}

TEST_CASE("local-client-terminal-cwd-and-limits") {
  scratch_dir ws;
  fs::create_directories(ws.path / "sub");
  tether::local_client c{ws.path, {}, 8};

  auto id = get(c.create_terminal("s", {"pwd", {}, std::string{"sub"}}));
  get(c.wait_for_terminal_exit("s", id));
  auto out = get(c.read_terminal_output("s", id));
  CHECK(out.output.size() == 8);
  CHECK(out.truncated);
  CHECK((ws.path / "sub").string().starts_with(out.output));

  CHECK_THROWS_AS(
      get(c.create_terminal("s", {"pwd", {}, std::string{"../.."}})), std::runtime_error);
  CHECK_THROWS_WITH_AS(
      get(c.create_terminal("s", {"no-such-program-tether", {}})),
      "no-such-program-tether: command not found", std::runtime_error);
}

TEST_CASE("local-client-kill-terminal") {
  scratch_dir ws;
  tether::local_client c{ws.path};

  auto id = get(c.create_terminal("s", {"sleep", {"30"}}));
  auto waiting = c.wait_for_terminal_exit("s", id);
  CHECK(waiting.result.wait_for(100ms) == std::future_status::timeout);

  get(c.kill_terminal("s", id));
  REQUIRE(waiting.result.wait_for(10s) == std::future_status::ready);
  auto exit = waiting.result.get();
  CHECK_FALSE(exit.exit_code);
  REQUIRE(exit.signal);
  CHECK(*exit.signal == "SIGKILL");
}

TEST_CASE("local-client-release-kills-running-terminal") {
  scratch_dir ws;
  tether::local_client c{ws.path};

  auto id = get(c.create_terminal("s", {"sleep", {"30"}}));
  auto started = std::chrono::steady_clock::now();
  get(c.release_terminal("s", id));
  CHECK(std::chrono::steady_clock::now() - started < 10s);
  CHECK(c.terminal_count() == 0);
}

TEST_CASE("local-client-session-updates-go-to-the-sink") {
  scratch_dir ws;
  std::vector<std::string> seen;
  tether::local_client c{ws.path, [&](const std::string& sid, const tether::json::object& u) {
                           seen.push_back(sid + ":" + std::string{u.at("sessionUpdate").as_string()});
                         }};
  tether::json::object update;
  update["sessionUpdate"] = "agent_message_chunk";
  c.session_update("session-1", update);
  CHECK(seen == std::vector<std::string>{"session-1:agent_message_chunk"});
}
