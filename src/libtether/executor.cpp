#include <fmt/format.h>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "logger.hpp"
#include "tether/sandbox.hpp"

namespace tether::sandbox {

using namespace std::chrono_literals;

std::string_view to_string(error_kind k) {
  switch (k) {
    case error_kind::none: return "none";
    case error_kind::syntax: return "syntax";
    case error_kind::runtime: return "runtime";
    case error_kind::violation: return "violation";
    case error_kind::timeout: return "timeout";
    case error_kind::cancelled: return "cancelled";
  }
  return "unknown";
}

json::object to_json(const execution_result& r) {
  json::object o;
  o["success"] = r.success;
  o["output"] = r.output;
  o["error"] = r.error;
  o["kind"] = to_string(r.kind);
  o["timed_out"] = r.timed_out;
  return o;
}

namespace {

struct worker_state {
  std::mutex mutex;
  std::condition_variable cv;
  bool done{false};
  execution_result result;
};

execution_result failure(error_kind kind, std::string_view prefix, const std::exception& e) {
  execution_result r;
  r.success = false;
  r.kind = kind;
  r.timed_out = kind == error_kind::timeout;
  r.error = std::string{prefix} + e.what();
  return r;
}

execution_result run_to_result(
    const std::string& code, const external_functions& functions,
    const limits& lim, const cancel_token& token) {
  execution_result r;
  std::string output;
  try {
    run(code, functions, output, lim, token);
  } catch (const syntax_error& e) {
    r = failure(error_kind::syntax, "Syntax error: ", e);
  } catch (const sandbox_violation& e) {
    r = failure(error_kind::violation, "Sandbox violation: ", e);
  } catch (const execution_timeout& e) {
    r = failure(error_kind::timeout, "Timeout: ", e);
  } catch (const execution_cancelled& e) {
    r = failure(error_kind::cancelled, "Cancelled: ", e);
  } catch (const std::exception& e) {
    r = failure(error_kind::runtime, "Runtime error: ", e);
  }
  r.output = std::move(output);
  return r;
}

}  // namespace

execution_result executor::execute(
    std::string code, external_functions functions, cancel_token token) const {
  return execute(
      std::move(code),
      [&functions](const cancel_token&) { return functions; },
      std::move(token));
}

execution_result executor::execute(
    std::string code, const functions_factory& make_functions,
    cancel_token token) const {
  auto state = std::make_shared<worker_state>();
  cancel_token inner;
  auto functions = make_functions(inner);

  std::thread worker{[state, code = std::move(code),
                      functions = std::move(functions), lim = limits_, inner] {
    auto r = run_to_result(code, functions, lim, inner);
    {
      std::lock_guard lock{state->mutex};
      state->result = std::move(r);
      state->done = true;
    }
    state->cv.notify_all();
  }};

  using clock = std::chrono::steady_clock;
  auto started = clock::now();
  auto soft_deadline = started + limits_.wall_clock;
  std::optional<clock::time_point> abandon_at;
  bool cancelled{false};

  std::unique_lock lock{state->mutex};
  while (!state->done) {
    auto now = clock::now();
    if (!abandon_at && token.requested()) {
      cancelled = true;
      inner.request();
      abandon_at = now + cancel_grace_;
    } else if (!abandon_at && now >= soft_deadline) {
      inner.request();
      abandon_at = now + cancel_grace_;
    }
    if (abandon_at && now >= *abandon_at) break;
    state->cv.wait_for(lock, 50ms, [&] { return state->done; });
  }

  if (!state->done) {
    lock.unlock();
    worker.detach();
    LOG_WARN(
        "sandbox worker did not stop within {}ms, abandoning it",
        cancel_grace_.count());
    execution_result r;
    r.success = false;
    if (cancelled) {
      r.kind = error_kind::cancelled;
      r.error = "Cancelled: execution did not stop in time and was abandoned";
    } else {
      r.kind = error_kind::timeout;
      r.timed_out = true;
      r.error = fmt::format(
          "Timeout: execution exceeded {}ms and was abandoned",
          limits_.wall_clock.count());
    }
    return r;
  }

  auto r = std::move(state->result);
  lock.unlock();
  worker.join();

  // The inner token was tripped by the deadline, not by the caller
  if (r.kind == error_kind::cancelled && !cancelled) {
    r.kind = error_kind::timeout;
    r.timed_out = true;
    r.error = fmt::format(
        "Timeout: execution exceeded {}ms", limits_.wall_clock.count());
  }
  LOG_DEBUG(
      "sandbox execution finished: {} ({}ms)", to_string(r.kind),
      std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - started)
          .count());
  return r;
}

}  // namespace tether::sandbox
