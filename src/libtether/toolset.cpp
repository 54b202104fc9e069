#include "tether/toolset.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <utility>
#include <vector>

#include "logger.hpp"
#include "tether/tools.hpp"

namespace tether {

using sandbox::call_args;
using sandbox::host_function;

/// Reporter

void tool_call_reporter::emit(json::object update) {
  auto owner = owner_();
  if (!owner) {
    LOG_DEBUG("{}: no owner, dropping session update", session_->id);
    return;
  }
  owner->session_update(session_->id, std::move(update));
}

std::string tool_call_reporter::start(
    std::string_view title, std::string_view kind, json::value raw_input) {
  std::string id;
  {
    std::lock_guard lock{session_->mutex};
    id = fmt::format("call-{}", ++session_->tool_calls);
  }
  json::object u;
  u["sessionUpdate"] = "tool_call";
  u["toolCallId"] = id;
  u["title"] = title;
  u["kind"] = kind;
  u["status"] = "pending";
  u["rawInput"] = std::move(raw_input);
  emit(std::move(u));
  return id;
}

void tool_call_reporter::in_progress(const std::string& id) {
  json::object u;
  u["sessionUpdate"] = "tool_call_update";
  u["toolCallId"] = id;
  u["status"] = "in_progress";
  emit(std::move(u));
}

void tool_call_reporter::completed(const std::string& id, json::value raw_output) {
  json::object u;
  u["sessionUpdate"] = "tool_call_update";
  u["toolCallId"] = id;
  u["status"] = "completed";
  u["rawOutput"] = std::move(raw_output);
  emit(std::move(u));
}

void tool_call_reporter::failed(const std::string& id, std::string_view message) {
  json::object u;
  u["sessionUpdate"] = "tool_call_update";
  u["toolCallId"] = id;
  u["status"] = "failed";
  json::object out;
  out["error"] = message;
  u["rawOutput"] = std::move(out);
  emit(std::move(u));
}

void tool_call_reporter::message_chunk(std::string_view text) {
  json::object content;
  content["type"] = "text";
  content["text"] = text;
  json::object u;
  u["sessionUpdate"] = "agent_message_chunk";
  u["content"] = std::move(content);
  emit(std::move(u));
}

namespace {

/// Plumbing

json::value args_to_json(const call_args& args) {
  json::object o;
  json::array positional;
  for (const auto& v : args.positional) positional.push_back(v);
  o["args"] = std::move(positional);
  for (const auto& [k, v] : args.keywords) o[k] = v;
  return o;
}

std::string describe(std::string_view name, const call_args& args) {
  if (!args.positional.empty()) {
    if (const auto* s = args.positional.front().if_string())
      return fmt::format("{}({})", name, std::string_view{*s});
  }
  return fmt::format("{}()", name);
}

bool reports_failure(const json::value& out) {
  const auto* o = out.if_object();
  if (!o) return false;
  auto it = o->find("parse_error");
  return it != o->end() && !it->value().is_null();
}

/// Wrap @p fn so that each call is reported as a tool call.
host_function tracked(
    const toolset_context& ctx, std::string name, std::string kind,
    host_function fn) {
  tool_call_reporter reporter{ctx.session, ctx.owner};
  return [reporter, name = std::move(name), kind = std::move(kind),
          fn = std::move(fn)](const call_args& args) mutable {
    auto id = reporter.start(describe(name, args), kind, args_to_json(args));
    reporter.in_progress(id);
    try {
      auto out = fn(args);
      if (reports_failure(out)) {
        reporter.failed(id, out.as_object().at("parse_error").as_string());
      } else {
        reporter.completed(id, out);
      }
      return out;
    } catch (const std::exception& e) {
      reporter.failed(id, e.what());
      throw;
    }
  };
}

/// Resolves the owner on the event loop, per request.
struct owner_lookup {
  owner_fn owner;
  std::shared_ptr<client> operator()() const {
    auto c = owner();
    if (!c) throw std::runtime_error{"session owner is disconnected"};
    return c;
  }
};

struct command_outcome {
  terminal_exit exit;
  std::string output;
  bool truncated{false};
};

command_outcome run_in_terminal(const toolset_context& ctx, command_spec cmd) {
  auto sid = ctx.session->id;
  owner_lookup owner{ctx.owner};
  if (!cmd.cwd && !ctx.session->cwd.empty()) cmd.cwd = ctx.session->cwd;

  auto tid = ctx.bridge.call<std::string>(
      [=] { return owner()->create_terminal(sid, cmd); });
  try {
    command_outcome out;
    out.exit = ctx.bridge.call<terminal_exit>(
        [=] { return owner()->wait_for_terminal_exit(sid, tid); });
    auto o = ctx.bridge.call<terminal_output>(
        [=] { return owner()->read_terminal_output(sid, tid); });
    out.output = std::move(o.output);
    out.truncated = o.truncated;
    ctx.bridge.call<void>([=] { return owner()->release_terminal(sid, tid); });
    return out;
  } catch (const std::exception& e) {
    LOG_DEBUG("{}: terminal {} abandoned: {}", sid, tid, e.what());
    ctx.bridge.post([owner = ctx.owner, sid, tid] {
      if (auto c = owner()) {
        c->kill_terminal(sid, tid);
        c->release_terminal(sid, tid);
      }
    });
    throw;
  }
}

/// A typed tool that failed to run still answers with a result.
template <typename Result>
json::value not_run(std::string_view tool, std::string_view why) {
  Result r;
  r.success = false;
  r.parse_error = fmt::format("Failed to run {}: {}", tool, why);
  return tools::to_json(r);
}

template <typename Result, typename Parse>
host_function command_tool(
    const toolset_context& ctx, std::string tool,
    std::function<command_spec(const call_args&)> make_cmd, Parse parse) {
  return [ctx, tool = std::move(tool), make_cmd = std::move(make_cmd),
          parse](const call_args& args) -> json::value {
    auto cmd = make_cmd(args);
    command_outcome out;
    try {
      out = run_in_terminal(ctx, std::move(cmd));
    } catch (const sandbox::sandbox_error&) {
      throw;
    } catch (const std::exception& e) {
      return not_run<Result>(tool, e.what());
    }
    return tools::to_json(parse(out.output));
  };
}

/// Navigation

template <typename Result>
json::value no_navigator(std::string_view what) {
  Result r;
  r.success = false;
  r.parse_error = fmt::format("{} needs a language server and none is configured", what);
  return tools::to_json(r);
}

template <typename Result, typename Query>
json::value navigate(
    const std::shared_ptr<code_navigator>& nav, std::string_view what, Query query) {
  if (!nav) return no_navigator<Result>(what);
  try {
    return tools::to_json(query(*nav));
  } catch (const std::exception& e) {
    return not_run<Result>(what, e.what());
  }
}

struct position_args {
  std::string file;
  int line;
  int column;
  std::string symbol;
};

position_args positions(const call_args& args) {
  return {
    args.string_arg(0, "file_path"),
    static_cast<int>(args.int_arg(1, "line", 1)),
    static_cast<int>(args.int_arg(2, "column", 1)),
    args.optional_string(3, "symbol").value_or(""),
  };
}

}  // namespace

/// Toolset

sandbox::external_functions make_toolset(const toolset_context& ctx) {
  sandbox::external_functions::map_type fns;
  auto sid = ctx.session->id;
  owner_lookup owner{ctx.owner};

  fns["read_file"] = tracked(ctx, "read_file", "read", [ctx, sid, owner](const call_args& a) {
    auto path = a.string_arg(0, "path");
    json::value out = json::string{ctx.bridge.call<std::string>(
        [=] { return owner()->read_text_file(sid, path); })};
    return out;
  });

  fns["write_file"] = tracked(ctx, "write_file", "edit", [ctx, sid, owner](const call_args& a) {
    auto path = a.string_arg(0, "path");
    auto content = a.string_arg(1, "content");
    ctx.bridge.call<void>([=] { return owner()->write_text_file(sid, path, content); });
    json::value out = json::string{fmt::format("Wrote {} bytes to {}", content.size(), path)};
    return out;
  });

  fns["run_command"] = tracked(ctx, "run_command", "execute", [ctx](const call_args& a) {
    command_spec cmd{a.string_arg(0, "command")};
    if (const auto* args = a.get(1, "args"); args && !args->is_null()) {
      const auto* arr = args->if_array();
      if (!arr) throw sandbox::code_execution_error{"TypeError: args must be a list of strings"};
      for (const auto& v : *arr) {
        const auto* s = v.if_string();
        if (!s) throw sandbox::code_execution_error{"TypeError: args must be a list of strings"};
        cmd.args.emplace_back(*s);
      }
    }
    cmd.cwd = a.optional_string(2, "cwd");
    auto out = run_in_terminal(ctx, std::move(cmd));
    auto text = std::move(out.output);
    if (out.exit.exit_code && *out.exit.exit_code != 0)
      text += fmt::format("\n[exit code {}]", *out.exit.exit_code);
    else if (out.exit.signal)
      text += fmt::format("\n[killed by {}]", *out.exit.signal);
    json::value result = json::string{text};
    return result;
  });

  fns["typecheck"] = tracked(
      ctx, "typecheck", "search",
      command_tool<tools::type_check_result>(
          ctx, "ty",
          [](const call_args& a) {
            return command_spec{"ty", {"check", a.string_arg(0, "path"), "--output-format", "json"}};
          },
          [](std::string_view s) { return tools::parse_ty_output(s); }));

  fns["ruff_check"] = tracked(
      ctx, "ruff_check", "search",
      command_tool<tools::lint_result>(
          ctx, "ruff",
          [](const call_args& a) {
            return command_spec{"ruff", {"check", a.string_arg(0, "path")}};
          },
          [](std::string_view s) { return tools::parse_ruff_output(s); }));

  fns["pytest_run"] = tracked(
      ctx, "pytest_run", "execute",
      command_tool<tools::test_result>(
          ctx, "pytest",
          [](const call_args& a) {
            return command_spec{
              "python", {"-m", "pytest", a.string_arg(0, "path"), "-v", "--tb=short"}};
          },
          [](std::string_view s) { return tools::parse_pytest_output(s); }));

  fns["git_status"] = tracked(
      ctx, "git_status", "search",
      command_tool<tools::git_status_result>(
          ctx, "git status",
          [](const call_args& a) {
            auto path = a.optional_string(0, "path").value_or(".");
            return command_spec{"git", {"status", "--porcelain", "--", path}};
          },
          [](std::string_view s) { return tools::parse_git_status_output(s); }));

  fns["git_diff"] = tracked(
      ctx, "git_diff", "search",
      command_tool<tools::git_diff_result>(
          ctx, "git diff",
          [](const call_args& a) {
            auto path = a.optional_string(0, "path").value_or(".");
            command_spec cmd{"git", {"diff"}};
            if (a.bool_arg(1, "staged", false)) cmd.args.emplace_back("--staged");
            cmd.args.emplace_back("--");
            cmd.args.push_back(std::move(path));
            return cmd;
          },
          [](std::string_view s) { return tools::parse_git_diff_output(s); }));

  fns["git_log"] = tracked(
      ctx, "git_log", "search",
      command_tool<tools::git_log_result>(
          ctx, "git log",
          [](const call_args& a) {
            auto path = a.optional_string(0, "path").value_or(".");
            auto count = a.int_arg(1, "count", 10);
            return command_spec{
              "git",
              {"log", "-n", std::to_string(count),
               fmt::format("--format={}", tools::git_log_format), "--", path}};
          },
          [](std::string_view s) { return tools::parse_git_log_output(s); }));

  auto nav = ctx.navigator;

  fns["goto_definition"] = tracked(ctx, "goto_definition", "search", [nav](const call_args& a) {
    auto p = positions(a);
    return navigate<tools::goto_definition_result>(nav, "goto_definition", [&](code_navigator& n) {
      return tools::parse_definition_response(n.definition(p.file, p.line, p.column), p.symbol);
    });
  });

  fns["find_references"] = tracked(ctx, "find_references", "search", [nav](const call_args& a) {
    auto p = positions(a);
    return navigate<tools::find_references_result>(nav, "find_references", [&](code_navigator& n) {
      return tools::parse_references_response(n.references(p.file, p.line, p.column), p.symbol);
    });
  });

  fns["hover"] = tracked(ctx, "hover", "search", [nav](const call_args& a) {
    auto p = positions(a);
    return navigate<tools::hover_result>(nav, "hover", [&](code_navigator& n) {
      return tools::parse_hover_response(n.hover(p.file, p.line, p.column), p.symbol);
    });
  });

  fns["document_symbols"] = tracked(ctx, "document_symbols", "search", [nav](const call_args& a) {
    auto file = a.string_arg(0, "file_path");
    return navigate<tools::document_symbols_result>(nav, "document_symbols", [&](code_navigator& n) {
      return tools::parse_document_symbols_response(n.document_symbols(file), file);
    });
  });

  fns["workspace_symbols"] = tracked(ctx, "workspace_symbols", "search", [nav](const call_args& a) {
    auto query = a.string_arg(0, "query");
    return navigate<tools::workspace_symbols_result>(nav, "workspace_symbols", [&](code_navigator& n) {
      return tools::parse_workspace_symbols_response(n.workspace_symbols(query), query);
    });
  });

  return sandbox::external_functions{std::move(fns)};
}

std::string_view toolset_stubs() {
  return R"(def read_file(path: str) -> str:
    """Read a text file from the workspace."""

def write_file(path: str, content: str) -> str:
    """Write a text file in the workspace."""

def run_command(command: str, args: list[str] | None = None, cwd: str | None = None) -> str:
    """Run a command and return its combined output."""

def typecheck(path: str) -> TypeCheckResult:
    """Run ty on a file or directory.
    Fields: success, error_count, warning_count, errors[file, line, column, severity, code, message]"""

def ruff_check(path: str) -> LintResult:
    """Run ruff on a file or directory.
    Fields: success, violation_count, fixable_count, violations[file, line, column, code, message, fixable]"""

def pytest_run(path: str) -> TestResult:
    """Run pytest on a file or directory.
    Fields: success, passed, failed, errors, skipped, duration, tests[name, outcome, duration, message]"""

def goto_definition(file_path: str, line: int, column: int, symbol: str) -> GotoDefinitionResult:
    """Find where a symbol is defined.  Fields: success, symbol, locations[file, line, column, end_line, end_column]"""

def find_references(file_path: str, line: int, column: int, symbol: str) -> FindReferencesResult:
    """Find the uses of a symbol.  Fields: success, symbol, reference_count, references[...]"""

def hover(file_path: str, line: int, column: int, symbol: str) -> HoverResult:
    """Type and documentation of a symbol.  Fields: success, symbol, content, language"""

def document_symbols(file_path: str) -> DocumentSymbolsResult:
    """Outline of a file.  Fields: success, file_path, symbol_count, symbols[name, kind, line, end_line, children]"""

def workspace_symbols(query: str) -> WorkspaceSymbolsResult:
    """Search symbols by name.  Fields: success, query, symbol_count, symbols[name, kind, file, line, container_name]"""

def git_status(path: str = ".") -> GitStatusResult:
    """Working tree status.  Fields: success, clean, file_count, files[file, status, staged]"""

def git_diff(path: str = ".", staged: bool = False) -> GitDiffResult:
    """Changes as a diff.  Fields: success, file_count, additions, deletions, files[file, additions, deletions, hunks]"""

def git_log(path: str = ".", count: int = 10) -> GitLogResult:
    """Recent commits.  Fields: success, commit_count, commits[hash, author, date, message]"""
)";
}

}  // namespace tether
