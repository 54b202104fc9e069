#pragma once

/**
 * @file tools.hpp
 * @brief Typed results for the host tools exposed to sandboxed code.
 *
 * Every result carries a @c success flag and an optional @c parse_error.
 * The parsers turn raw tool output (text or JSON) into these structures
 * and never throw: output that cannot be understood yields
 * @c success=false with @c parse_error explaining why.  Parsing the same
 * input twice yields equal results.
 *
 * The field names here are the ones sandboxed code reads, e.g.
 * @c result.error_count, so they are part of the stable tool surface.
 */

#include <boost/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tether::tools {

namespace json = boost::json;

/// Type checker (ty, JSON diagnostics)

struct type_check_error {
  std::string file;
  int line{0};
  int column{0};
  std::string severity;
  std::string code;
  std::string message;
  bool operator==(const type_check_error&) const = default;
};

struct type_check_result {
  bool success{true};
  int error_count{0};
  int warning_count{0};
  std::vector<type_check_error> errors;
  std::optional<std::string> parse_error;
  bool operator==(const type_check_result&) const = default;
};

type_check_result parse_ty_output(std::string_view output);

/// Linter (ruff, text)

struct lint_violation {
  std::string file;
  int line{0};
  int column{0};
  std::string code;
  std::string message;
  bool fixable{false};
  bool operator==(const lint_violation&) const = default;
};

struct lint_result {
  bool success{true};
  int violation_count{0};
  int fixable_count{0};
  std::vector<lint_violation> violations;
  std::optional<std::string> parse_error;
  bool operator==(const lint_result&) const = default;
};

lint_result parse_ruff_output(std::string_view output);

/// Test runner (pytest -v)

struct test_case {
  std::string name;
  std::string outcome;
  double duration{0.0};
  std::optional<std::string> message;
  bool operator==(const test_case&) const = default;
};

struct test_result {
  bool success{true};
  int passed{0};
  int failed{0};
  int errors{0};
  int skipped{0};
  double duration{0.0};
  std::vector<test_case> tests;
  std::optional<std::string> parse_error;
  bool operator==(const test_result&) const = default;
};

test_result parse_pytest_output(std::string_view output);

/// Code navigation (LSP responses)
///
/// Positions are converted from LSP's 0-based lines and characters to
/// 1-based lines and columns.

struct location {
  std::string file;
  int line{0};
  int column{0};
  int end_line{0};
  int end_column{0};
  bool operator==(const location&) const = default;
};

struct goto_definition_result {
  bool success{false};
  std::string symbol;
  std::vector<location> locations;
  std::optional<std::string> parse_error;
  bool operator==(const goto_definition_result&) const = default;
};

struct find_references_result {
  bool success{false};
  std::string symbol;
  int reference_count{0};
  std::vector<location> references;
  std::optional<std::string> parse_error;
  bool operator==(const find_references_result&) const = default;
};

struct hover_result {
  bool success{false};
  std::string symbol;
  std::optional<std::string> content;
  std::optional<std::string> language;
  std::optional<std::string> parse_error;
  bool operator==(const hover_result&) const = default;
};

struct document_symbol {
  std::string name;
  int kind{0};
  int line{0};
  int end_line{0};
  std::vector<document_symbol> children;
  bool operator==(const document_symbol&) const = default;
};

struct document_symbols_result {
  bool success{false};
  std::string file_path;
  std::vector<document_symbol> symbols;
  int symbol_count{0};
  std::optional<std::string> parse_error;
  bool operator==(const document_symbols_result&) const = default;
};

struct workspace_symbol {
  std::string name;
  int kind{0};
  std::string file;
  int line{0};
  std::optional<std::string> container_name;
  bool operator==(const workspace_symbol&) const = default;
};

struct workspace_symbols_result {
  bool success{false};
  std::string query;
  std::vector<workspace_symbol> symbols;
  int symbol_count{0};
  std::optional<std::string> parse_error;
  bool operator==(const workspace_symbols_result&) const = default;
};

goto_definition_result parse_definition_response(
    const json::value& response, std::string_view symbol);
find_references_result parse_references_response(
    const json::value& response, std::string_view symbol);
hover_result parse_hover_response(
    const json::value& response, std::string_view symbol);
document_symbols_result parse_document_symbols_response(
    const json::value& response, std::string_view file_path);
workspace_symbols_result parse_workspace_symbols_response(
    const json::value& response, std::string_view query);

/// Version control (git)

struct git_file_status {
  std::string file;
  std::string status;
  bool staged{false};
  bool operator==(const git_file_status&) const = default;
};

struct git_status_result {
  bool success{true};
  bool clean{true};
  int file_count{0};
  std::vector<git_file_status> files;
  std::optional<std::string> parse_error;
  bool operator==(const git_status_result&) const = default;
};

struct diff_file {
  std::string file;
  int additions{0};
  int deletions{0};
  std::vector<std::string> hunks;
  bool operator==(const diff_file&) const = default;
};

struct git_diff_result {
  bool success{true};
  int file_count{0};
  int additions{0};
  int deletions{0};
  std::vector<diff_file> files;
  std::optional<std::string> parse_error;
  bool operator==(const git_diff_result&) const = default;
};

struct git_commit {
  std::string hash;
  std::string author;
  std::string date;
  std::string message;
  bool operator==(const git_commit&) const = default;
};

struct git_log_result {
  bool success{true};
  int commit_count{0};
  std::vector<git_commit> commits;
  std::optional<std::string> parse_error;
  bool operator==(const git_log_result&) const = default;
};

git_status_result parse_git_status_output(std::string_view output);
git_diff_result parse_git_diff_output(std::string_view output);
git_log_result parse_git_log_output(std::string_view output);

/// Git log format the parser expects
inline constexpr std::string_view git_log_format{"%h|%an|%ad|%s"};

/// JSON forms, as seen by sandboxed code

json::object to_json(const type_check_result& r);
json::object to_json(const lint_result& r);
json::object to_json(const test_result& r);
json::object to_json(const goto_definition_result& r);
json::object to_json(const find_references_result& r);
json::object to_json(const hover_result& r);
json::object to_json(const document_symbols_result& r);
json::object to_json(const workspace_symbols_result& r);
json::object to_json(const git_status_result& r);
json::object to_json(const git_diff_result& r);
json::object to_json(const git_log_result& r);

/// Convert a @c file:// URI to a filesystem path.  Other strings are
/// returned unchanged.
std::string uri_to_path(std::string_view uri);

}  // namespace tether::tools
