#pragma once

/**
 * @file sandbox.hpp
 * @brief Restricted interpreter for model-authored code.
 *
 * The sandbox runs a small Python-flavoured language: assignments,
 * @c if / @c for / @c while / @c try, expressions, comprehensions,
 * f-strings and a handful of safe builtins plus the @c json module.
 * Values are @c boost::json values; attribute access on an object reads
 * its key, which is how tool results are inspected.
 *
 * Everything outside the language comes from an @ref external_functions
 * bundle injected per execution.  Module loading, function and class
 * definitions, reflection builtins and dunder names are rejected by a
 * static pass before any statement runs.
 *
 * @ref run throws; @ref executor::execute never does and is what the
 * agent uses.
 */

#include <boost/json.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tether/cancellation.hpp"

namespace tether::sandbox {

namespace json = boost::json;

/// Errors

struct sandbox_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct syntax_error : sandbox_error {
  syntax_error(int line, const std::string& what)
      : sandbox_error{what}, line{line} {}
  int line;
};

/// Disallowed construct, raised before execution starts.
struct sandbox_violation : sandbox_error {
  using sandbox_error::sandbox_error;
};

/// Uncaught error inside sandboxed code, e.g. "NameError: name 'x' ...".
struct code_execution_error : sandbox_error {
  using sandbox_error::sandbox_error;
};

/// Wall clock, step budget or a host call deadline was exceeded.
struct execution_timeout : sandbox_error {
  using sandbox_error::sandbox_error;
};

struct execution_cancelled : sandbox_error {
  using sandbox_error::sandbox_error;
};

/// Host functions

struct call_args {
  std::vector<json::value> positional;
  std::vector<std::pair<std::string, json::value>> keywords;

  /// Positional argument @p index, or keyword @p name, or nullptr.
  [[nodiscard]] const json::value* get(
      std::size_t index, std::string_view name) const;

  /// Required string argument; throws code_execution_error otherwise.
  [[nodiscard]] std::string string_arg(
      std::size_t index, std::string_view name) const;

  [[nodiscard]] std::optional<std::string> optional_string(
      std::size_t index, std::string_view name) const;

  [[nodiscard]] std::int64_t int_arg(
      std::size_t index, std::string_view name, std::int64_t fallback) const;

  [[nodiscard]] bool bool_arg(
      std::size_t index, std::string_view name, bool fallback) const;
};

using host_function = std::function<json::value(const call_args&)>;

/// Immutable name -> host function bundle for one execution.
class external_functions {
 public:
  using map_type = std::map<std::string, host_function, std::less<>>;

  external_functions() : fns_{std::make_shared<const map_type>()} {}
  explicit external_functions(map_type fns)
      : fns_{std::make_shared<const map_type>(std::move(fns))} {}

  [[nodiscard]] const host_function* find(std::string_view name) const {
    auto it = fns_->find(name);
    return it == fns_->end() ? nullptr : &it->second;
  }

  [[nodiscard]] std::vector<std::string> names() const {
    std::vector<std::string> out;
    for (const auto& [name, fn] : *fns_) out.push_back(name);
    return out;
  }

 private:
  std::shared_ptr<const map_type> fns_;
};

/// Running

struct limits {
  std::chrono::milliseconds wall_clock{std::chrono::seconds{60}};
  std::size_t max_steps{5'000'000};
  std::size_t max_output{1U << 20U};
  std::size_t max_collection{1'000'000};
  /// Bytes of live values one execution may hold, copies included.
  std::size_t max_memory{256U << 20U};
  /// Deepest list/dict nesting code may build.
  std::size_t max_depth{100};
};

/// Parse and statically validate @p code without running it.
/// Throws syntax_error or sandbox_violation.
void check(std::string_view code);

/// Run @p code, appending printed text to @p output.  Throws any of the
/// sandbox_error subclasses; @p output keeps what was printed so far.
void run(
    std::string_view code, const external_functions& functions,
    std::string& output, const limits& lim = {}, cancel_token token = {});

/// Convenience overload returning the printed text.
std::string run(
    std::string_view code, const external_functions& functions,
    const limits& lim = {}, cancel_token token = {});

/// Executor

enum class error_kind { none, syntax, runtime, violation, timeout, cancelled };

std::string_view to_string(error_kind k);

struct execution_result {
  bool success{true};
  std::string output;
  std::string error;
  error_kind kind{error_kind::none};
  bool timed_out{false};
};

json::object to_json(const execution_result& r);

/** @brief Runs code blocks on dedicated worker threads.
 *
 * @ref execute blocks the calling thread until the worker finishes, the
 * hard deadline passes, or @p token is tripped and the worker fails to
 * wind down within the cancel grace.  A worker that does not stop in
 * time is abandoned: it is detached and left to observe its own
 * cancellation, and the caller gets a timeout or cancelled result.
 */
class executor {
 public:
  explicit executor(
      limits lim = {},
      std::chrono::milliseconds cancel_grace = std::chrono::seconds{5})
      : limits_{lim}, cancel_grace_{cancel_grace} {}

  /// Builds the bundle for one execution.  The token trips when that
  /// execution is cancelled or runs out of time, so host calls made
  /// through the bundle can give up with it.
  using functions_factory = std::function<external_functions(cancel_token)>;

  execution_result execute(
      std::string code, external_functions functions,
      cancel_token token = {}) const;

  execution_result execute(
      std::string code, const functions_factory& make_functions,
      cancel_token token = {}) const;

  [[nodiscard]] const limits& get_limits() const { return limits_; }

 private:
  limits limits_;
  std::chrono::milliseconds cancel_grace_;
};

}  // namespace tether::sandbox
