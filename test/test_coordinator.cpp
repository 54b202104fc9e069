#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "fake_client.hpp"
#include "tether/coordinator.hpp"

using tether::coordinator;
using tether::session_errc;
using tether::session_error;
using namespace std::chrono_literals;

namespace {

// Coordinator whose clock only moves when told to
struct coordinator_fixture {
  coordinator::clock::time_point now{coordinator::clock::now()};
  coordinator coord{tether::coordinator_config{300s, 60s}, [this] { return now; }};

  std::shared_ptr<fake_client> a{std::make_shared<fake_client>()};
  std::shared_ptr<fake_client> b{std::make_shared<fake_client>()};
};

session_errc code_of(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const session_error& e) {
    return e.code();
  }
  FAIL("expected a session_error");
  return {};
}

}  // namespace

TEST_CASE_FIXTURE(coordinator_fixture, "coordinator-resume-within-grace") {
  auto id_a = coord.register_client(a);
  auto s1 = coord.new_session("/work", id_a);
  CHECK(s1.session_id.starts_with("session-"));
  CHECK(s1.resume_token.size() >= 40);
  CHECK(coord.route(s1.session_id) == a);

  coord.unregister_client(id_a);
  CHECK(coord.route(s1.session_id) == nullptr);
  CHECK(coord.stats().disconnected == 1);

  now += 299s;
  auto id_b = coord.register_client(b);
  auto state = coord.resume_session(s1.session_id, s1.resume_token, id_b);
  CHECK(state == s1.state);
  CHECK(coord.route(s1.session_id) == b);
  CHECK(coord.stats().disconnected == 0);

  // Ownership moved: A's id no longer passes the check, B's does
  CHECK(code_of([&] { coord.authorize(s1.session_id, id_a); }) == session_errc::access_denied);
  CHECK(coord.authorize(s1.session_id, id_b) == s1.state);

  // Nothing left to sweep later on
  now += 1h;
  CHECK(coord.sweep_expired() == 0);
  CHECK(coord.route(s1.session_id) == b);
}

TEST_CASE_FIXTURE(coordinator_fixture, "coordinator-resume-after-grace") {
  auto id_a = coord.register_client(a);
  auto s1 = coord.new_session("/work", id_a);
  coord.unregister_client(id_a);

  now += 301s;
  auto id_b = coord.register_client(b);
  CHECK(code_of([&] { coord.resume_session(s1.session_id, s1.resume_token, id_b); }) ==
        session_errc::grace_period_expired);

  CHECK(coord.find_session(s1.session_id) == nullptr);
  CHECK(code_of([&] { coord.resume_session(s1.session_id, s1.resume_token, id_b); }) ==
        session_errc::session_not_found);
  CHECK(coord.stats().sessions == 0);
  CHECK(coord.stats().disconnected == 0);
}

TEST_CASE_FIXTURE(coordinator_fixture, "coordinator-failed-resume-changes-nothing") {
  auto id_a = coord.register_client(a);
  auto s1 = coord.new_session("/work", id_a);
  auto id_b = coord.register_client(b);

  // Owner still connected
  CHECK(code_of([&] { coord.resume_session(s1.session_id, s1.resume_token, id_b); }) ==
        session_errc::not_disconnected);
  CHECK(coord.route(s1.session_id) == a);

  coord.unregister_client(id_a);
  auto wrong = s1.resume_token;
  wrong.back() = wrong.back() == 'A' ? 'B' : 'A';
  CHECK(code_of([&] { coord.resume_session(s1.session_id, wrong, id_b); }) ==
        session_errc::invalid_token);
  CHECK(code_of([&] { coord.resume_session("session-999", s1.resume_token, id_b); }) ==
        session_errc::session_not_found);
  CHECK(code_of([&] { coord.resume_session(s1.session_id, s1.resume_token, "client-999"); }) ==
        session_errc::unknown_client);

  CHECK(coord.route(s1.session_id) == nullptr);
  CHECK(coord.stats().disconnected == 1);
  CHECK(coord.resume_session(s1.session_id, s1.resume_token, id_b) == s1.state);
}

TEST_CASE_FIXTURE(coordinator_fixture, "coordinator-unknown-and-gone-clients") {
  CHECK(code_of([&] { coord.new_session("/w", "client-42"); }) == session_errc::unknown_client);

  auto id_a = coord.register_client(a);
  auto s1 = coord.new_session("/w", id_a);
  coord.unregister_client(id_a, false);
  CHECK(coord.find_session(s1.session_id) == nullptr);
  CHECK_FALSE(coord.is_registered(id_a));
  CHECK(code_of([&] { coord.new_session("/w", id_a); }) == session_errc::unknown_client);

  // Unknown ids are ignored
  CHECK_NOTHROW(coord.unregister_client("client-1234"));
}

TEST_CASE_FIXTURE(coordinator_fixture, "coordinator-drop-trips-running-turn") {
  auto id_a = coord.register_client(a);
  auto s1 = coord.new_session("/w", id_a);
  tether::cancel_token turn;
  {
    std::lock_guard lock{s1.state->mutex};
    s1.state->turn = turn;
  }
  coord.unregister_client(id_a, false);
  CHECK(turn.requested());
}

TEST_CASE_FIXTURE(coordinator_fixture, "coordinator-sweep") {
  auto id_a = coord.register_client(a);
  coord.new_session("/w", id_a);
  coord.new_session("/w", id_a);
  coord.unregister_client(id_a);

  now += 200s;
  CHECK(coord.sweep_expired() == 0);
  now += 200s;
  CHECK(coord.sweep_expired() == 2);
  CHECK(coord.sweep_expired() == 0);
  CHECK(coord.stats().sessions == 0);
}

TEST_CASE_FIXTURE(coordinator_fixture, "coordinator-resume-races-sweep") {
  for (int round = 0; round < 50; ++round) {
    auto id_a = coord.register_client(a);
    auto s = coord.new_session("/w", id_a);
    coord.unregister_client(id_a);
    auto id_b = coord.register_client(b);

    // Right at the edge: either side may win, but only one
    now += 300s;
    if (round % 2) now += 1s;

    std::atomic_bool resumed{false};
    std::atomic_bool expired_on_resume{false};
    std::atomic<std::size_t> swept{0};
    std::thread resumer{[&] {
      try {
        coord.resume_session(s.session_id, s.resume_token, id_b);
        resumed = true;
      } catch (const session_error& e) {
        if (e.code() == session_errc::grace_period_expired) expired_on_resume = true;
      }
    }};
    std::thread sweeper{[&] { swept = coord.sweep_expired(); }};
    resumer.join();
    sweeper.join();

    int outcomes = (resumed ? 1 : 0) + (expired_on_resume ? 1 : 0) + static_cast<int>(swept);
    CHECK(outcomes == 1);
    CHECK((coord.find_session(s.session_id) != nullptr) == resumed.load());

    coord.unregister_client(id_b, false);
  }
}

TEST_CASE_FIXTURE(coordinator_fixture, "coordinator-ids-unique") {
  std::set<std::string> ids;
  std::vector<std::thread> threads;
  std::mutex m;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 50; ++i) {
        auto id = coord.register_client(std::make_shared<fake_client>());
        std::lock_guard lock{m};
        ids.insert(id);
      }
    });
  }
  for (auto& t : threads) t.join();
  CHECK(ids.size() == 400);

  // Not reused after unregistering either
  auto first = *ids.begin();
  coord.unregister_client(first, false);
  CHECK(ids.count(coord.register_client(a)) == 0);
}

TEST_CASE_FIXTURE(coordinator_fixture, "coordinator-sessions-and-modes") {
  auto id_a = coord.register_client(a);
  auto id_b = coord.register_client(b);
  auto s1 = coord.new_session("/one", id_a);
  auto s2 = coord.new_session("/two", id_a);
  coord.new_session("/three", id_b);

  auto mine = coord.list_sessions(id_a);
  REQUIRE(mine.size() == 2);
  CHECK(mine[0].session_id != mine[1].session_id);
  CHECK(s1.resume_token != s2.resume_token);

  coord.set_session_mode(s1.session_id, id_a, "plan");
  {
    std::lock_guard lock{s1.state->mutex};
    CHECK(s1.state->mode_id == "plan");
  }
  CHECK(code_of([&] { coord.set_session_mode(s1.session_id, id_b, "plan"); }) ==
        session_errc::access_denied);
}

TEST_CASE("session-error-codes") {
  session_error e{session_errc::grace_period_expired, "late"};
  CHECK(e.rpc_code() == -32004);
  CHECK(e.kind() == "GracePeriodExpired");
  CHECK(tether::to_string(session_errc::unknown_client) == "UnknownClient");
}
