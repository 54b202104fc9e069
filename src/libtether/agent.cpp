#include "tether/agent.hpp"

#include <fmt/format.h>
#include <re2/re2.h>

#include <boost/asio/post.hpp>
#include <utility>

#include "logger.hpp"
#include "utils.hpp"

namespace tether {

json::object user_message(std::string_view text) {
  json::object m;
  m["role"] = "user";
  m["content"] = text;
  return m;
}

namespace {

json::object assistant_message(std::string_view text) {
  json::object m;
  m["role"] = "assistant";
  m["content"] = text;
  return m;
}

json::object system_message(std::string_view text) {
  json::object m;
  m["role"] = "system";
  m["content"] = text;
  return m;
}

std::string feedback_for(const sandbox::execution_result& r) {
  if (r.success)
    return r.output.empty() ? "Execution result: (no output)\n"
                            : fmt::format("Execution result:\n{}", r.output);
  if (r.output.empty()) return fmt::format("Execution failed: {}\n", r.error);
  return fmt::format("Execution failed: {}\nOutput before the failure:\n{}", r.error, r.output);
}

}  // namespace

agent::agent(
    net::io_context::executor_type io, coordinator& coord, std::shared_ptr<model> m,
    agent_config config, std::shared_ptr<code_navigator> navigator)
    : io_{io},
      coord_{coord},
      link_{std::make_shared<route_link>(coord)},
      model_{std::move(m)},
      config_{config},
      navigator_{std::move(navigator)},
      executor_{config.limits, config.cancel_grace},
      pool_{config.turn_threads} {}

agent::~agent() { shutdown(); }

std::shared_ptr<client> agent::route_link::route(const std::string& session_id) {
  std::lock_guard lock{mutex};
  if (!coord) return nullptr;
  return coord->route(session_id);
}

void agent::route_link::close() {
  std::lock_guard lock{mutex};
  coord = nullptr;
}

/// Code extraction

std::vector<std::string> agent::extract_code(std::string_view reply) {
  static const RE2 tool_call_re{R"((?s)<tool_call>(.*?)</tool_call>)"};
  static const RE2 parameter_re{R"((?s)<parameter=code>\s*(.*?)\s*</parameter>)"};
  static const RE2 fenced_re{R"((?s)```python[ \t]*\r?\n(.*?)```)"};

  std::vector<std::string> blocks;

  re2::StringPiece input{reply.data(), reply.size()};
  std::string raw;
  while (RE2::FindAndConsume(&input, tool_call_re, &raw)) {
    std::string code;
    if (RE2::PartialMatch(raw, parameter_re, &code)) {
      code = std::string{utils::trim(code)};
    } else {
      auto cleaned = utils::trim(raw);
      // Some other envelope we do not understand
      if (cleaned.empty() || cleaned.front() == '<') continue;
      code = std::string{cleaned};
    }
    if (!code.empty()) blocks.push_back(std::move(code));
  }

  input = re2::StringPiece{reply.data(), reply.size()};
  while (RE2::FindAndConsume(&input, fenced_re, &raw)) {
    auto code = utils::trim(raw);
    if (!code.empty()) blocks.emplace_back(code);
  }
  return blocks;
}

std::string agent::system_prompt() {
  return fmt::format(
      "You are tether, a coding assistant working inside the user's project.\n"
      "\n"
      "To act on the project, write Python code and wrap it as\n"
      "<tool_call><function=execute_code><parameter=code>\n"
      "...\n"
      "</parameter></function></tool_call>\n"
      "The code runs in a sandbox: no imports, no def, class or lambda.\n"
      "Call the functions below, inspect their results as attributes and\n"
      "print what you want to see; the printed output comes back to you.\n"
      "When you have the answer, reply without any code.\n"
      "\n"
      "Available functions:\n"
      "```python\n{}```\n",
      toolset_stubs());
}

/// Turns

void agent::prompt(
    const std::string& session_id, const std::string& client_id, std::string text,
    done_fn done) {
  auto session = coord_.authorize(session_id, client_id);

  cancel_token token;
  {
    std::lock_guard lock{session->mutex};
    if (session->turn)
      throw turn_in_progress{fmt::format("Session {} already has a turn running", session_id)};
    session->turn = token;
  }
  {
    std::lock_guard lock{active_mutex_};
    if (stopped_) {
      std::lock_guard slock{session->mutex};
      session->turn.reset();
      throw std::runtime_error{"agent is shutting down"};
    }
    active_.emplace(session_id, token);
  }

  LOG_INFO("{}: turn started by {}", session_id, client_id);
  net::post(pool_, [this, session, text = std::move(text), token, done = std::move(done)] {
    std::string reason;
    std::exception_ptr error;
    try {
      reason = run_turn(session, text, token);
    } catch (const std::exception& e) {
      LOG_ERROR("{}: turn failed: {}", session->id, e.what());
      error = std::current_exception();
    }
    {
      std::lock_guard lock{session->mutex};
      session->turn.reset();
    }
    {
      std::lock_guard lock{active_mutex_};
      active_.erase(session->id);
    }
    LOG_INFO("{}: turn ended ({})", session->id, error ? "error" : reason);
    done(std::move(reason), error);
  });
}

bool agent::cancel(const std::string& session_id, const std::string& client_id) {
  auto session = coord_.authorize(session_id, client_id);
  std::lock_guard lock{session->mutex};
  if (!session->turn) return false;
  session->turn->request();
  LOG_INFO("{}: cancel requested by {}", session_id, client_id);
  return true;
}

std::string agent::run_turn(
    const std::shared_ptr<session_state>& session, const std::string& text,
    const cancel_token& token) {
  auto sid = session->id;
  tool_call_reporter reporter{session, [&coord = coord_, sid] { return coord.route(sid); }};

  bool greet{false};
  {
    std::lock_guard lock{session->mutex};
    greet = !session->greeted;
    session->greeted = true;
    session->history.push_back(user_message(text));
  }
  if (greet)
    reporter.message_chunk(fmt::format(
        "Hello, this is tether running the {} model. Working in {}.\n", model_->name(),
        session->cwd));

  for (std::size_t step = 0; step < config_.max_steps; ++step) {
    if (token.requested()) return std::string{stop_reason::cancelled};

    json::array messages;
    messages.push_back(system_message(system_prompt()));
    {
      std::lock_guard lock{session->mutex};
      for (const auto& m : session->history) messages.push_back(m);
    }

    std::string reply;
    try {
      reply = model_->complete(messages, token);
    } catch (const model_error& e) {
      if (token.requested()) return std::string{stop_reason::cancelled};
      LOG_WARN("{}: model failed: {}", sid, e.what());
      reporter.message_chunk(fmt::format("The model failed to answer: {}\n", e.what()));
      return std::string{stop_reason::end_turn};
    }

    {
      std::lock_guard lock{session->mutex};
      session->history.push_back(assistant_message(reply));
    }
    if (!reply.empty()) reporter.message_chunk(reply);

    auto blocks = extract_code(reply);
    if (blocks.empty()) return std::string{stop_reason::end_turn};

    std::string feedback;
    bool cancelled{false};
    for (const auto& code : blocks) {
      execute_block(session, reporter, code, token, feedback, cancelled);
      if (cancelled) break;
    }
    {
      std::lock_guard lock{session->mutex};
      session->history.push_back(user_message(feedback));
    }
    if (cancelled) return std::string{stop_reason::cancelled};
  }
  LOG_INFO("{}: turn stopped after {} model requests", sid, config_.max_steps);
  return std::string{stop_reason::max_turn_requests};
}

void agent::execute_block(
    const std::shared_ptr<session_state>& session, tool_call_reporter& reporter,
    const std::string& code, const cancel_token& token, std::string& feedback,
    bool& cancelled) {
  json::object input;
  input["code"] = code;
  auto id = reporter.start("execute_code", "execute", std::move(input));
  reporter.in_progress(id);

  auto sid = session->id;
  auto make_functions = [&](cancel_token execution) {
    return make_toolset(toolset_context{
      session,
      [link = link_, sid] { return link->route(sid); },
      host_bridge{io_, config_.host_call_timeout, std::move(execution)},
      navigator_,
    });
  };
  auto result = executor_.execute(code, make_functions, token);

  if (result.success) {
    reporter.completed(id, sandbox::to_json(result));
  } else {
    reporter.failed(id, result.error);
  }
  feedback += feedback_for(result);
  cancelled = result.kind == sandbox::error_kind::cancelled;
}

void agent::shutdown() {
  {
    std::lock_guard lock{active_mutex_};
    if (stopped_) return;
    stopped_ = true;
    for (auto& [sid, token] : active_) token.request();
  }
  pool_.join();
  link_->close();
}

}  // namespace tether
