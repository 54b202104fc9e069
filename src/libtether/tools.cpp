#include "tether/tools.hpp"

#include <fmt/format.h>
#include <re2/re2.h>

#include <cctype>
#include <functional>

#include "json_helpers.hpp"
#include "utils.hpp"

namespace tether::tools {

namespace {

/// Split on '\n', dropping a trailing '\r' but keeping leading blanks
std::vector<std::string_view> split_lines(std::string_view text) {
  std::vector<std::string_view> lines;
  while (!text.empty()) {
    auto nl = text.find('\n');
    auto line = text.substr(0, nl);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    lines.push_back(line);
    if (nl == std::string_view::npos) break;
    text.remove_prefix(nl + 1);
  }
  return lines;
}

bool blank(std::string_view s) { return utils::trim(s).empty(); }

std::string_view kind_name(const json::value& v) {
  switch (v.kind()) {
    case json::kind::null: return "null";
    case json::kind::bool_: return "bool";
    case json::kind::int64:
    case json::kind::uint64:
    case json::kind::double_: return "number";
    case json::kind::string: return "string";
    case json::kind::array: return "array";
    case json::kind::object: return "object";
  }
  return "unknown";
}

int int_or(const json::object& obj, std::string_view key, int fallback) {
  if (auto i = get_int(obj, key)) return static_cast<int>(*i);
  return fallback;
}

/// LSP position {line, character} -> 1-based (line, column)
bool read_position(const json::object* pos, int& line, int& column) {
  if (!pos) return false;
  auto l = get_int(*pos, "line");
  auto c = get_int(*pos, "character");
  if (!l || !c) return false;
  line = static_cast<int>(*l) + 1;
  column = static_cast<int>(*c) + 1;
  return true;
}

std::optional<location> read_location(const json::value& v) {
  const auto* obj = v.if_object();
  if (!obj) return std::nullopt;

  // Location or LocationLink
  auto uri = get_string(*obj, "uri");
  const json::object* range = get_object(*obj, "range");
  if (!uri) {
    uri = get_string(*obj, "targetUri");
    range = get_object(*obj, "targetSelectionRange");
    if (!range) range = get_object(*obj, "targetRange");
  }
  if (!uri || !range) return std::nullopt;

  location loc{};
  loc.file = uri_to_path(*uri);
  if (!read_position(get_object(*range, "start"), loc.line, loc.column) ||
      !read_position(get_object(*range, "end"), loc.end_line, loc.end_column))
    return std::nullopt;
  return loc;
}

/// Pull the @c result member out of a full LSP response.  Returns nullptr
/// and sets @p error when the response itself is unusable.
const json::value* lsp_result(
    const json::value& response, std::optional<std::string>& error) {
  const auto* obj = response.if_object();
  if (!obj) {
    error = fmt::format(
        "Unexpected response type: {}", kind_name(response));
    return nullptr;
  }
  if (const auto* err = get_object(*obj, "error")) {
    error = fmt::format(
        "LSP error: {}", get_string(*err, "message").value_or("unknown"));
    return nullptr;
  }
  const auto* result = find_value(*obj, "result");
  if (!result) error = "LSP response has no 'result'";
  return result;
}

/// Shared by goto_definition and find_references
std::optional<std::string> read_locations(
    const json::value& response, std::vector<location>& out) {
  std::optional<std::string> error;
  const auto* result = lsp_result(response, error);
  if (!result) return error;
  if (result->is_null()) return std::nullopt;

  if (result->is_object()) {
    auto loc = read_location(*result);
    if (!loc) return "Malformed location in result";
    out.push_back(std::move(*loc));
    return std::nullopt;
  }
  if (const auto* arr = result->if_array()) {
    for (const auto& v : *arr) {
      auto loc = read_location(v);
      if (!loc) {
        out.clear();
        return "Malformed location in result";
      }
      out.push_back(std::move(*loc));
    }
    return std::nullopt;
  }
  return fmt::format("Unexpected result type: {}", kind_name(*result));
}

std::optional<std::string> read_document_symbol(
    const json::object& obj, document_symbol& out) {
  auto name = get_string(obj, "name");
  auto kind = get_int(obj, "kind");
  if (!name || !kind) return "Symbol missing 'name' or 'kind'";
  out.name = *name;
  out.kind = static_cast<int>(*kind);

  // SymbolInformation carries a location, DocumentSymbol a range
  const json::object* range = get_object(obj, "range");
  if (const auto* loc = get_object(obj, "location"))
    range = get_object(*loc, "range");
  if (range) {
    int col{0};
    read_position(get_object(*range, "start"), out.line, col);
    read_position(get_object(*range, "end"), out.end_line, col);
  }

  if (const auto* children = get_array(obj, "children")) {
    for (const auto& c : *children) {
      const auto* cobj = c.if_object();
      if (!cobj) return "Symbol child is not an object";
      document_symbol child{};
      if (auto err = read_document_symbol(*cobj, child)) return err;
      out.children.push_back(std::move(child));
    }
  }
  return std::nullopt;
}

int count_symbols(const std::vector<document_symbol>& symbols) {
  int n{0};
  for (const auto& s : symbols) n += 1 + count_symbols(s.children);
  return n;
}

json::array locations_to_json(const std::vector<location>& locs) {
  json::array arr;
  for (const auto& l : locs) {
    json::object o;
    o["file"] = l.file;
    o["line"] = l.line;
    o["column"] = l.column;
    o["end_line"] = l.end_line;
    o["end_column"] = l.end_column;
    arr.push_back(std::move(o));
  }
  return arr;
}

json::array symbols_to_json(const std::vector<document_symbol>& symbols) {
  json::array arr;
  for (const auto& s : symbols) {
    json::object o;
    o["name"] = s.name;
    o["kind"] = s.kind;
    o["line"] = s.line;
    o["end_line"] = s.end_line;
    o["children"] = symbols_to_json(s.children);
    arr.push_back(std::move(o));
  }
  return arr;
}

}  // namespace

std::string uri_to_path(std::string_view uri) {
  constexpr std::string_view scheme{"file://"};
  if (!uri.starts_with(scheme)) return std::string{uri};
  uri.remove_prefix(scheme.size());

  auto hex = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };
  std::string out;
  out.reserve(uri.size());
  for (std::size_t i = 0; i < uri.size(); ++i) {
    if (uri[i] == '%' && i + 2 < uri.size()) {
      int hi = hex(uri[i + 1]), lo = hex(uri[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out += static_cast<char>(hi * 16 + lo);
        i += 2;
        continue;
      }
    }
    out += uri[i];
  }
  return out;
}

/// ty

type_check_result parse_ty_output(std::string_view output) {
  type_check_result res{};
  if (blank(output)) return res;

  auto fail = [&](std::string why) {
    type_check_result bad{};
    bad.success = false;
    bad.parse_error = fmt::format("Failed to parse ty output: {}", why);
    return bad;
  };

  std::error_code ec;
  auto doc = json::parse(output, ec);
  if (ec) return fail(ec.message());
  const auto* arr = doc.if_array();
  if (!arr) return fail("expected a JSON array of diagnostics");

  for (std::size_t i = 0; i < arr->size(); ++i) {
    const auto* d = (*arr)[i].if_object();
    if (!d) return fail(fmt::format("diagnostic {} is not an object", i));
    auto file = get_string(*d, "file");
    auto line = get_int(*d, "line");
    auto message = get_string(*d, "message");
    if (!file || !line || !message)
      return fail(fmt::format(
          "diagnostic {} lacks 'file', 'line' or 'message'", i));

    type_check_error e{
      .file = *file,
      .line = static_cast<int>(*line),
      .column = int_or(*d, "column", 0),
      .severity = get_string(*d, "severity").value_or("error"),
      .code = get_string(*d, "code").value_or("unknown"),
      .message = *message};
    if (e.severity == "error") ++res.error_count;
    else if (e.severity == "warning") ++res.warning_count;
    res.errors.push_back(std::move(e));
  }
  res.success = res.error_count == 0;
  return res;
}

/// ruff

lint_result parse_ruff_output(std::string_view output) {
  lint_result res{};
  if (blank(output)) return res;

  static const RE2 violation_re{
    R"((.+?):(\d+):(\d+):\s+([A-Z]+\d+)\s+(\[\*\]\s+)?(.+))"};

  int unrecognized{0};
  for (auto raw : split_lines(output)) {
    auto line = utils::trim(raw);
    if (line.empty() || line.starts_with("Found ") ||
        line.starts_with("No ") || line.starts_with("All checks passed") ||
        line.starts_with("[*] "))
      continue;

    lint_violation v{};
    std::string fixable_marker, message;
    if (RE2::FullMatch(
            line, violation_re, &v.file, &v.line, &v.column, &v.code,
            &fixable_marker, &message)) {
      v.message = std::string{utils::trim(message)};
      v.fixable = !fixable_marker.empty();
      if (v.fixable) ++res.fixable_count;
      res.violations.push_back(std::move(v));
    } else {
      ++unrecognized;
    }
  }

  res.violation_count = static_cast<int>(res.violations.size());
  if (res.violations.empty() && unrecognized > 0) {
    res.parse_error = fmt::format(
        "Ruff produced {} unrecognized line(s) and no violations; "
        "possible output format change",
        unrecognized);
  }
  res.success = res.violations.empty() && !res.parse_error;
  return res;
}

/// pytest

test_result parse_pytest_output(std::string_view output) {
  test_result res{};
  if (blank(output)) return res;

  static const RE2 test_re{R"(^(.+?)\s+(PASSED|FAILED|ERROR|SKIPPED))"};
  static const RE2 duration_re{R"(\[(\d+\.\d+)s\])"};
  static const RE2 summary_re{R"(^=+.*\bin\s+(\d+(?:\.\d+)?)s)"};
  static const RE2 failed_re{R"((\d+)\s+failed)"};
  static const RE2 passed_re{R"((\d+)\s+passed)"};
  static const RE2 error_re{R"((\d+)\s+errors?\b)"};
  static const RE2 skipped_re{R"((\d+)\s+skipped)"};

  bool summary_seen{false};
  for (auto line : split_lines(output)) {
    std::string name, outcome;
    if (RE2::PartialMatch(line, test_re, &name, &outcome)) {
      test_case tc{};
      tc.name = std::string{utils::trim(name)};
      for (auto c : outcome)
        tc.outcome += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      RE2::PartialMatch(line, duration_re, &tc.duration);
      if (tc.outcome == "passed") ++res.passed;
      else if (tc.outcome == "failed") ++res.failed;
      else if (tc.outcome == "error") ++res.errors;
      else if (tc.outcome == "skipped") ++res.skipped;
      res.tests.push_back(std::move(tc));
      continue;
    }

    double duration{0.0};
    if (!summary_seen && RE2::PartialMatch(line, summary_re, &duration)) {
      summary_seen = true;
      res.duration = duration;
      RE2::PartialMatch(line, failed_re, &res.failed);
      RE2::PartialMatch(line, passed_re, &res.passed);
      RE2::PartialMatch(line, error_re, &res.errors);
      RE2::PartialMatch(line, skipped_re, &res.skipped);
    }
  }

  if (res.tests.empty() && !summary_seen) {
    res.parse_error =
        "pytest output could not be parsed: no test results or summary line";
  }
  res.success = res.failed == 0 && res.errors == 0 && !res.parse_error;
  return res;
}

/// LSP

goto_definition_result parse_definition_response(
    const json::value& response, std::string_view symbol) {
  goto_definition_result res{};
  res.symbol = symbol;
  res.parse_error = read_locations(response, res.locations);
  res.success = !res.parse_error && !res.locations.empty();
  return res;
}

find_references_result parse_references_response(
    const json::value& response, std::string_view symbol) {
  find_references_result res{};
  res.symbol = symbol;
  res.parse_error = read_locations(response, res.references);
  res.reference_count = static_cast<int>(res.references.size());
  res.success = !res.parse_error && !res.references.empty();
  return res;
}

hover_result parse_hover_response(
    const json::value& response, std::string_view symbol) {
  hover_result res{};
  res.symbol = symbol;

  const auto* result = lsp_result(response, res.parse_error);
  if (!result || result->is_null()) return res;

  const auto* hover = result->if_object();
  if (!hover) {
    res.parse_error =
        fmt::format("Unexpected result type: {}", kind_name(*result));
    return res;
  }
  const auto* contents = find_value(*hover, "contents");
  if (!contents) {
    res.parse_error = "Hover result has no 'contents'";
    return res;
  }

  // MarkupContent, MarkedString, plain string, or an array of the latter two
  auto read_part = [&](const json::value& part, std::string& text,
                       std::optional<std::string>& lang) -> bool {
    if (const auto* s = part.if_string()) {
      text = *s;
      return true;
    }
    if (const auto* o = part.if_object()) {
      auto value = get_string(*o, "value");
      if (!value) return false;
      text = *value;
      if (auto kind = get_string(*o, "kind")) lang = kind;
      else if (auto language = get_string(*o, "language")) lang = language;
      return true;
    }
    return false;
  };

  std::string text;
  std::optional<std::string> lang;
  if (const auto* parts = contents->if_array()) {
    for (const auto& p : *parts) {
      std::string piece;
      std::optional<std::string> plang;
      if (!read_part(p, piece, plang)) {
        res.parse_error = "Malformed hover contents";
        return res;
      }
      if (!text.empty() && !piece.empty()) text += "\n\n";
      text += piece;
      if (!lang) lang = plang;
    }
  } else if (!read_part(*contents, text, lang)) {
    res.parse_error = "Malformed hover contents";
    return res;
  }

  res.content = text;
  res.language = lang.value_or("plaintext");
  res.success = !text.empty();
  return res;
}

document_symbols_result parse_document_symbols_response(
    const json::value& response, std::string_view file_path) {
  document_symbols_result res{};
  res.file_path = file_path;

  const auto* result = lsp_result(response, res.parse_error);
  if (!result || result->is_null()) return res;

  const auto* arr = result->if_array();
  if (!arr) {
    res.parse_error =
        fmt::format("Unexpected result type: {}", kind_name(*result));
    return res;
  }
  for (const auto& v : *arr) {
    const auto* obj = v.if_object();
    document_symbol sym{};
    std::optional<std::string> err{"Symbol is not an object"};
    if (obj) err = read_document_symbol(*obj, sym);
    if (err) {
      res.symbols.clear();
      res.parse_error = std::move(err);
      return res;
    }
    res.symbols.push_back(std::move(sym));
  }
  res.symbol_count = count_symbols(res.symbols);
  res.success = !res.symbols.empty();
  return res;
}

workspace_symbols_result parse_workspace_symbols_response(
    const json::value& response, std::string_view query) {
  workspace_symbols_result res{};
  res.query = query;

  const auto* result = lsp_result(response, res.parse_error);
  if (!result || result->is_null()) return res;

  const auto* arr = result->if_array();
  if (!arr) {
    res.parse_error =
        fmt::format("Unexpected result type: {}", kind_name(*result));
    return res;
  }
  for (const auto& v : *arr) {
    const auto* obj = v.if_object();
    auto name = obj ? get_string(*obj, "name") : std::nullopt;
    auto kind = obj ? get_int(*obj, "kind") : std::nullopt;
    const auto* loc = obj ? get_object(*obj, "location") : nullptr;
    auto uri = loc ? get_string(*loc, "uri") : std::nullopt;
    if (!name || !kind || !uri) {
      res.symbols.clear();
      res.parse_error = "Malformed workspace symbol";
      return res;
    }
    workspace_symbol sym{};
    sym.name = *name;
    sym.kind = static_cast<int>(*kind);
    sym.file = uri_to_path(*uri);
    if (const auto* range = get_object(*loc, "range")) {
      int col{0};
      read_position(get_object(*range, "start"), sym.line, col);
    }
    sym.container_name = get_string(*obj, "containerName");
    res.symbols.push_back(std::move(sym));
  }
  res.symbol_count = static_cast<int>(res.symbols.size());
  res.success = !res.symbols.empty();
  return res;
}

/// git

git_status_result parse_git_status_output(std::string_view output) {
  git_status_result res{};
  if (blank(output)) return res;

  auto status_name = [](char c) -> std::string_view {
    // clang-format off
    switch (c) {
    case 'M': return "modified";
    case 'A': return "added";
    case 'D': return "deleted";
    case 'R': return "renamed";
    case 'C': return "copied";
    case 'U': return "unmerged";
    case 'T': return "typechange";
    default:  return {};
    }
    // clang-format on
  };

  int unrecognized{0};
  for (auto line : split_lines(output)) {
    if (blank(line)) continue;
    if (line.size() < 4 || line[2] != ' ') {
      ++unrecognized;
      continue;
    }
    char x = line[0], y = line[1];
    std::string_view path = line.substr(3);
    if (auto arrow = path.find(" -> "); arrow != std::string_view::npos)
      path = path.substr(arrow + 4);

    git_file_status f{};
    f.file = path;
    if (x == '?' && y == '?') {
      f.status = "untracked";
    } else if (x == '!' && y == '!') {
      f.status = "ignored";
    } else {
      f.staged = x != ' ';
      auto name = status_name(f.staged ? x : y);
      if (name.empty()) {
        ++unrecognized;
        continue;
      }
      f.status = name;
    }
    res.files.push_back(std::move(f));
  }

  res.file_count = static_cast<int>(res.files.size());
  res.clean = res.files.empty();
  if (unrecognized > 0) {
    res.parse_error = fmt::format(
        "{} git status line(s) could not be parsed", unrecognized);
    res.success = !res.files.empty();
  }
  return res;
}

git_diff_result parse_git_diff_output(std::string_view output) {
  git_diff_result res{};
  if (blank(output)) return res;

  static const RE2 header_re{R"(diff --git a/(.+) b/(.+))"};

  diff_file* current{nullptr};
  bool in_hunk{false};
  for (auto line : split_lines(output)) {
    std::string a, b;
    if (RE2::FullMatch(line, header_re, &a, &b)) {
      res.files.push_back(diff_file{.file = b});
      current = &res.files.back();
      in_hunk = false;
      continue;
    }
    if (!current) continue;
    if (line.starts_with("@@")) {
      current->hunks.emplace_back(line);
      in_hunk = true;
      continue;
    }
    // Before the first hunk we are still in the file header
    if (!in_hunk) continue;
    if (line.starts_with("+")) ++current->additions;
    else if (line.starts_with("-")) ++current->deletions;
  }

  if (res.files.empty()) {
    res.success = false;
    res.parse_error = "git diff output could not be parsed: no file headers";
    return res;
  }
  for (const auto& f : res.files) {
    res.additions += f.additions;
    res.deletions += f.deletions;
  }
  res.file_count = static_cast<int>(res.files.size());
  return res;
}

git_log_result parse_git_log_output(std::string_view output) {
  git_log_result res{};
  if (blank(output)) return res;

  static const RE2 oneline_re{R"(([0-9a-f]{7,40})\s+(.*))"};

  int unrecognized{0};
  for (auto raw : split_lines(output)) {
    auto line = utils::trim(raw);
    if (line.empty()) continue;

    // hash|author|date|message, where the message may itself contain '|'
    std::vector<std::string_view> fields;
    std::string_view rest = line;
    while (fields.size() < 3) {
      auto bar = rest.find('|');
      if (bar == std::string_view::npos) break;
      fields.push_back(rest.substr(0, bar));
      rest.remove_prefix(bar + 1);
    }
    if (fields.size() == 3) {
      res.commits.push_back(git_commit{
        .hash = std::string{fields[0]},
        .author = std::string{fields[1]},
        .date = std::string{fields[2]},
        .message = std::string{rest}});
      continue;
    }

    git_commit c{};
    if (RE2::FullMatch(line, oneline_re, &c.hash, &c.message)) {
      res.commits.push_back(std::move(c));
    } else {
      ++unrecognized;
    }
  }

  res.commit_count = static_cast<int>(res.commits.size());
  if (res.commits.empty() && unrecognized > 0) {
    res.success = false;
    res.parse_error = fmt::format(
        "git log output could not be parsed ({} line(s) unrecognized)",
        unrecognized);
  }
  return res;
}

/// JSON forms

json::object to_json(const type_check_result& r) {
  json::object o;
  o["success"] = r.success;
  o["error_count"] = r.error_count;
  o["warning_count"] = r.warning_count;
  json::array errors;
  for (const auto& e : r.errors) {
    json::object eo;
    eo["file"] = e.file;
    eo["line"] = e.line;
    eo["column"] = e.column;
    eo["severity"] = e.severity;
    eo["code"] = e.code;
    eo["message"] = e.message;
    errors.push_back(std::move(eo));
  }
  o["errors"] = std::move(errors);
  o["parse_error"] = optional_to_json(r.parse_error);
  return o;
}

json::object to_json(const lint_result& r) {
  json::object o;
  o["success"] = r.success;
  o["violation_count"] = r.violation_count;
  o["fixable_count"] = r.fixable_count;
  json::array violations;
  for (const auto& v : r.violations) {
    json::object vo;
    vo["file"] = v.file;
    vo["line"] = v.line;
    vo["column"] = v.column;
    vo["code"] = v.code;
    vo["message"] = v.message;
    vo["fixable"] = v.fixable;
    violations.push_back(std::move(vo));
  }
  o["violations"] = std::move(violations);
  o["parse_error"] = optional_to_json(r.parse_error);
  return o;
}

json::object to_json(const test_result& r) {
  json::object o;
  o["success"] = r.success;
  o["passed"] = r.passed;
  o["failed"] = r.failed;
  o["errors"] = r.errors;
  o["skipped"] = r.skipped;
  o["duration"] = r.duration;
  json::array tests;
  for (const auto& t : r.tests) {
    json::object to;
    to["name"] = t.name;
    to["outcome"] = t.outcome;
    to["duration"] = t.duration;
    to["message"] = optional_to_json(t.message);
    tests.push_back(std::move(to));
  }
  o["tests"] = std::move(tests);
  o["parse_error"] = optional_to_json(r.parse_error);
  return o;
}

json::object to_json(const goto_definition_result& r) {
  json::object o;
  o["success"] = r.success;
  o["symbol"] = r.symbol;
  o["locations"] = locations_to_json(r.locations);
  o["parse_error"] = optional_to_json(r.parse_error);
  return o;
}

json::object to_json(const find_references_result& r) {
  json::object o;
  o["success"] = r.success;
  o["symbol"] = r.symbol;
  o["reference_count"] = r.reference_count;
  o["references"] = locations_to_json(r.references);
  o["parse_error"] = optional_to_json(r.parse_error);
  return o;
}

json::object to_json(const hover_result& r) {
  json::object o;
  o["success"] = r.success;
  o["symbol"] = r.symbol;
  o["content"] = optional_to_json(r.content);
  o["language"] = optional_to_json(r.language);
  o["parse_error"] = optional_to_json(r.parse_error);
  return o;
}

json::object to_json(const document_symbols_result& r) {
  json::object o;
  o["success"] = r.success;
  o["file_path"] = r.file_path;
  o["symbols"] = symbols_to_json(r.symbols);
  o["symbol_count"] = r.symbol_count;
  o["parse_error"] = optional_to_json(r.parse_error);
  return o;
}

json::object to_json(const workspace_symbols_result& r) {
  json::object o;
  o["success"] = r.success;
  o["query"] = r.query;
  json::array symbols;
  for (const auto& s : r.symbols) {
    json::object so;
    so["name"] = s.name;
    so["kind"] = s.kind;
    so["file"] = s.file;
    so["line"] = s.line;
    so["container_name"] = optional_to_json(s.container_name);
    symbols.push_back(std::move(so));
  }
  o["symbols"] = std::move(symbols);
  o["symbol_count"] = r.symbol_count;
  o["parse_error"] = optional_to_json(r.parse_error);
  return o;
}

json::object to_json(const git_status_result& r) {
  json::object o;
  o["success"] = r.success;
  o["clean"] = r.clean;
  o["file_count"] = r.file_count;
  json::array files;
  for (const auto& f : r.files) {
    json::object fo;
    fo["file"] = f.file;
    fo["status"] = f.status;
    fo["staged"] = f.staged;
    files.push_back(std::move(fo));
  }
  o["files"] = std::move(files);
  o["parse_error"] = optional_to_json(r.parse_error);
  return o;
}

json::object to_json(const git_diff_result& r) {
  json::object o;
  o["success"] = r.success;
  o["file_count"] = r.file_count;
  o["additions"] = r.additions;
  o["deletions"] = r.deletions;
  json::array files;
  for (const auto& f : r.files) {
    json::object fo;
    fo["file"] = f.file;
    fo["additions"] = f.additions;
    fo["deletions"] = f.deletions;
    fo["hunks"] = json::array(f.hunks.begin(), f.hunks.end());
    files.push_back(std::move(fo));
  }
  o["files"] = std::move(files);
  o["parse_error"] = optional_to_json(r.parse_error);
  return o;
}

json::object to_json(const git_log_result& r) {
  json::object o;
  o["success"] = r.success;
  o["commit_count"] = r.commit_count;
  json::array commits;
  for (const auto& c : r.commits) {
    json::object co;
    co["hash"] = c.hash;
    co["author"] = c.author;
    co["date"] = c.date;
    co["message"] = c.message;
    commits.push_back(std::move(co));
  }
  o["commits"] = std::move(commits);
  o["parse_error"] = optional_to_json(r.parse_error);
  return o;
}

}  // namespace tether::tools
