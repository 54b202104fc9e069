#include <doctest/doctest.h>

#include <boost/json.hpp>
#include <string>

#include "tether/tools.hpp"

namespace json = boost::json;
namespace tools = tether::tools;

TEST_CASE("ty-diagnostics") {
  const std::string out = R"([
    {"file": "src/app.py", "line": 3, "column": 5, "severity": "error",
     "code": "unresolved-reference", "message": "Name `x` used when not defined"},
    {"file": "src/app.py", "line": 9, "column": 1, "severity": "warning",
     "code": "possibly-unbound", "message": "Name `y` may be unbound"},
    {"file": "src/util.py", "line": 12, "message": "Object of type `None` is not callable"}
  ])";

  auto r = tools::parse_ty_output(out);
  CHECK_FALSE(r.success);
  CHECK(r.error_count == 2);
  CHECK(r.warning_count == 1);
  REQUIRE(r.errors.size() == 3);
  CHECK(r.errors[0].code == "unresolved-reference");
  CHECK(r.errors[2].severity == "error");
  CHECK(r.errors[2].code == "unknown");
  CHECK_FALSE(r.parse_error);

  // Same input, same result
  CHECK(tools::parse_ty_output(out) == r);
}

TEST_CASE("ty-clean-and-garbage") {
  auto clean = tools::parse_ty_output("  \n");
  CHECK(clean.success);
  CHECK(clean.error_count == 0);

  auto empty_list = tools::parse_ty_output("[]");
  CHECK(empty_list.success);

  auto garbage = tools::parse_ty_output("error: ty crashed");
  CHECK_FALSE(garbage.success);
  REQUIRE(garbage.parse_error);
  CHECK(garbage.parse_error->starts_with("Failed to parse ty output"));

  auto bad_entry = tools::parse_ty_output(R"([{"file": "a.py"}])");
  CHECK_FALSE(bad_entry.success);
  CHECK(bad_entry.parse_error);
}

TEST_CASE("ruff-violations") {
  const std::string out =
      "src/app.py:1:8: F401 [*] `os` imported but unused\n"
      "src/app.py:14:80: E501 Line too long (92 > 79)\n"
      "Found 2 errors.\n"
      "[*] 1 fixable with the `--fix` option.\n";

  auto r = tools::parse_ruff_output(out);
  CHECK_FALSE(r.success);
  CHECK(r.violation_count == 2);
  CHECK(r.fixable_count == 1);
  REQUIRE(r.violations.size() == 2);
  CHECK(r.violations[0].file == "src/app.py");
  CHECK(r.violations[0].line == 1);
  CHECK(r.violations[0].column == 8);
  CHECK(r.violations[0].code == "F401");
  CHECK(r.violations[0].fixable);
  CHECK(r.violations[1].message == "Line too long (92 > 79)");
  CHECK_FALSE(r.violations[1].fixable);

  CHECK(tools::parse_ruff_output("All checks passed!\n").success);

  auto unknown = tools::parse_ruff_output("ruff 9.0: some brand new layout\n");
  CHECK_FALSE(unknown.success);
  CHECK(unknown.parse_error);
}

TEST_CASE("pytest-verbose") {
  const std::string out =
      "============================= test session starts ==============================\n"
      "collected 3 items\n"
      "\n"
      "tests/test_math.py::test_add PASSED                                       [ 33%]\n"
      "tests/test_math.py::test_div FAILED                                       [ 66%]\n"
      "tests/test_math.py::test_slow SKIPPED (needs network)                     [100%]\n"
      "\n"
      "=================================== FAILURES ===================================\n"
      "=========================== short test summary info ============================\n"
      "FAILED tests/test_math.py::test_div - ZeroDivisionError: division by zero\n"
      "==================== 1 failed, 1 passed, 1 skipped in 0.12s ====================\n";

  auto r = tools::parse_pytest_output(out);
  CHECK_FALSE(r.success);
  CHECK(r.passed == 1);
  CHECK(r.failed == 1);
  CHECK(r.skipped == 1);
  CHECK(r.errors == 0);
  CHECK(r.duration == doctest::Approx(0.12));
  REQUIRE(r.tests.size() >= 3);
  CHECK(r.tests[0].name == "tests/test_math.py::test_add");
  CHECK(r.tests[0].outcome == "passed");
  CHECK(r.tests[1].outcome == "failed");

  auto none = tools::parse_pytest_output("ModuleNotFoundError: No module named pytest\n");
  CHECK_FALSE(none.success);
  CHECK(none.parse_error);
}

TEST_CASE("git-status-porcelain") {
  const std::string out =
      "M  src/staged.py\n"
      " M src/unstaged.py\n"
      "?? notes.txt\n"
      "R  old.py -> new.py\n";

  auto r = tools::parse_git_status_output(out);
  CHECK(r.success);
  CHECK_FALSE(r.clean);
  CHECK(r.file_count == 4);
  REQUIRE(r.files.size() == 4);
  CHECK(r.files[0].status == "modified");
  CHECK(r.files[0].staged);
  CHECK(r.files[1].status == "modified");
  CHECK_FALSE(r.files[1].staged);
  CHECK(r.files[2].status == "untracked");
  CHECK(r.files[3].file == "new.py");
  CHECK(r.files[3].status == "renamed");

  auto clean = tools::parse_git_status_output("");
  CHECK(clean.success);
  CHECK(clean.clean);
}

TEST_CASE("git-diff-counts") {
  const std::string out =
      "diff --git a/src/app.py b/src/app.py\n"
      "index 3b18e51..a9c2d4f 100644\n"
      "--- a/src/app.py\n"
      "+++ b/src/app.py\n"
      "@@ -1,3 +1,4 @@\n"
      " import sys\n"
      "-import os\n"
      "+import json\n"
      "+import re\n"
      "diff --git a/README b/README\n"
      "--- a/README\n"
      "+++ b/README\n"
      "@@ -1 +1 @@\n"
      "-hello\n"
      "+hello world\n";

  auto r = tools::parse_git_diff_output(out);
  CHECK(r.success);
  CHECK(r.file_count == 2);
  CHECK(r.additions == 3);
  CHECK(r.deletions == 2);
  REQUIRE(r.files.size() == 2);
  CHECK(r.files[0].file == "src/app.py");
  CHECK(r.files[0].hunks.size() == 1);

  auto bogus = tools::parse_git_diff_output("fatal: not a git repository\n");
  CHECK_FALSE(bogus.success);
  CHECK(bogus.parse_error);
}

TEST_CASE("git-log-formats") {
  auto r = tools::parse_git_log_output(
      "a1b2c3d|Ada|Mon Jan 1 10:00:00 2024|Fix parser | handle pipes\n"
      "e4f5a6b|Bob|Tue Jan 2 11:00:00 2024|Initial commit\n");
  CHECK(r.success);
  REQUIRE(r.commit_count == 2);
  CHECK(r.commits[0].author == "Ada");
  CHECK(r.commits[0].message == "Fix parser | handle pipes");

  auto oneline = tools::parse_git_log_output("deadbeef Tidy up\n");
  REQUIRE(oneline.commits.size() == 1);
  CHECK(oneline.commits[0].hash == "deadbeef");
  CHECK(oneline.commits[0].message == "Tidy up");
}

TEST_CASE("lsp-definition-and-references") {
  auto def = json::parse(R"({"jsonrpc": "2.0", "id": 1, "result": {
    "uri": "file:///work/my%20proj/app.py",
    "range": {"start": {"line": 9, "character": 4}, "end": {"line": 9, "character": 10}}}})");
  auto d = tools::parse_definition_response(def, "main");
  CHECK(d.success);
  REQUIRE(d.locations.size() == 1);
  CHECK(d.locations[0].file == "/work/my proj/app.py");
  CHECK(d.locations[0].line == 10);
  CHECK(d.locations[0].column == 5);

  auto refs = json::parse(R"({"result": [
    {"uri": "file:///a.py", "range": {"start": {"line": 0, "character": 0}, "end": {"line": 0, "character": 3}}},
    {"uri": "file:///b.py", "range": {"start": {"line": 4, "character": 2}, "end": {"line": 4, "character": 5}}}]})");
  auto r = tools::parse_references_response(refs, "foo");
  CHECK(r.success);
  CHECK(r.reference_count == 2);

  auto nothing = tools::parse_definition_response(json::parse(R"({"result": null})"), "x");
  CHECK_FALSE(nothing.success);
  CHECK_FALSE(nothing.parse_error);

  auto err = tools::parse_definition_response(
      json::parse(R"({"error": {"code": -32601, "message": "no"}})"), "x");
  CHECK_FALSE(err.success);
  REQUIRE(err.parse_error);
  CHECK(*err.parse_error == "LSP error: no");
}

TEST_CASE("lsp-hover-and-symbols") {
  auto h = tools::parse_hover_response(
      json::parse(R"({"result": {"contents": {"kind": "markdown", "value": "def f() -> int"}}})"),
      "f");
  CHECK(h.success);
  CHECK(h.content == "def f() -> int");
  CHECK(h.language == "markdown");

  auto syms = tools::parse_document_symbols_response(json::parse(R"({"result": [
    {"name": "Shape", "kind": 5,
     "range": {"start": {"line": 0, "character": 0}, "end": {"line": 20, "character": 0}},
     "children": [
       {"name": "area", "kind": 6,
        "range": {"start": {"line": 3, "character": 4}, "end": {"line": 5, "character": 0}}}]}]})"),
      "shapes.py");
  CHECK(syms.success);
  REQUIRE(syms.symbols.size() == 1);
  CHECK(syms.symbols[0].children.size() == 1);
  CHECK(syms.symbol_count == 2);

  auto ws = tools::parse_workspace_symbols_response(json::parse(R"({"result": [
    {"name": "Shape", "kind": 5, "containerName": "shapes",
     "location": {"uri": "file:///w/shapes.py",
                  "range": {"start": {"line": 0, "character": 6}, "end": {"line": 0, "character": 11}}}}]})"),
      "Sha");
  CHECK(ws.success);
  REQUIRE(ws.symbols.size() == 1);
  CHECK(ws.symbols[0].file == "/w/shapes.py");
  CHECK(ws.symbols[0].line == 1);
  CHECK(ws.symbols[0].container_name == "shapes");
}

TEST_CASE("tool-results-as-json") {
  auto r = tools::parse_ruff_output("a.py:1:1: F401 [*] `os` imported but unused\n");
  auto o = tools::to_json(r);
  CHECK(o.at("success") == false);
  CHECK(o.at("violation_count") == 1);
  CHECK(o.at("parse_error").is_null());
  CHECK(o.at("violations").as_array().size() == 1);
}
