#pragma once

/**
 * @file bridge.hpp
 * @brief Synchronous host calls from sandbox workers into the event loop.
 *
 * Sandboxed code runs on its own thread but every client capability
 * lives on the protocol @c io_context.  A @ref host_bridge posts the
 * request onto that loop, then blocks the worker on a single-use
 * promise until the client answers, the per-call deadline passes, or its
 * token trips.  On expiry the outstanding request is dropped.
 */

#include <fmt/format.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>

#include "tether/cancellation.hpp"
#include "tether/client.hpp"
#include "tether/sandbox.hpp"

namespace tether {

namespace net = boost::asio;

class host_bridge {
 public:
  using clock = std::chrono::steady_clock;

  host_bridge(
      net::io_context::executor_type executor,
      std::chrono::milliseconds timeout, cancel_token token = {})
      : executor_{executor}, timeout_{timeout}, token_{std::move(token)} {}

  /** @brief Run @p submit on the event loop and wait for its result.
   *
   * Throws sandbox::execution_timeout or sandbox::execution_cancelled
   * when the wait is abandoned, and whatever the pending result holds
   * otherwise.  An abandoned request is cancelled even when @p submit
   * only runs after the wait gave up.  Refuses to run on the event-loop
   * thread, which would deadlock.
   */
  template <typename T>
  T call(std::function<pending<T>()> submit) const {
    if (executor_.running_in_this_thread())
      throw std::logic_error{"host_bridge::call from the event loop thread"};

    auto state = std::make_shared<handoff<T>>();
    auto submitted = state->promise.get_future();
    net::post(executor_, [state, submit = std::move(submit)] {
      {
        std::lock_guard lock{state->mutex};
        if (state->abandoned) return;
      }
      try {
        auto p = submit();
        std::unique_lock lock{state->mutex};
        if (!state->abandoned) {
          state->promise.set_value(std::move(p));
          return;
        }
        lock.unlock();
        if (p.cancel) p.cancel();
      } catch (...) {
        state->promise.set_exception(std::current_exception());
      }
    });

    auto deadline = clock::now() + timeout_;
    if (!wait(submitted, deadline)) {
      std::lock_guard lock{state->mutex};
      if (submitted.wait_for(std::chrono::seconds{0}) != std::future_status::ready) {
        state->abandoned = true;
        expired();
      }
    }
    auto p = submitted.get();
    if (!wait(p.result, deadline)) {
      if (p.cancel) net::post(executor_, p.cancel);
      expired();
    }
    return p.result.get();
  }

  /// Queue @p fn on the event loop without waiting for it.
  void post(std::function<void()> fn) const { net::post(executor_, std::move(fn)); }

  [[nodiscard]] std::chrono::milliseconds timeout() const { return timeout_; }
  [[nodiscard]] const cancel_token& token() const { return token_; }

 private:
  /// Between the caller and the submit posted for it
  template <typename T>
  struct handoff {
    std::mutex mutex;
    bool abandoned{false};
    std::promise<pending<T>> promise;
  };

  /// False once the token trips or @p deadline passes.
  template <typename Future>
  bool wait(Future& f, clock::time_point deadline) const {
    using namespace std::chrono_literals;
    while (f.wait_for(50ms) != std::future_status::ready)
      if (token_.requested() || clock::now() >= deadline) return false;
    return true;
  }

  [[noreturn]] void expired() const {
    if (token_.requested()) throw sandbox::execution_cancelled{"host call cancelled"};
    throw sandbox::execution_timeout{
      fmt::format("host call timed out after {}ms", timeout_.count())};
  }

  net::io_context::executor_type executor_;
  std::chrono::milliseconds timeout_;
  cancel_token token_;
};

}  // namespace tether
