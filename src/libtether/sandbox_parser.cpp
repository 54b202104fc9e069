#include "sandbox_parser.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>

#include "sandbox_lexer.hpp"
#include "tether/sandbox.hpp"

namespace tether::sandbox {

namespace {

constexpr std::array<std::string_view, 35> keywords{
  "False", "None",   "True",     "and",    "as",     "assert", "async",
  "await", "break",  "class",    "continue", "def",  "del",    "elif",
  "else",  "except", "finally",  "for",    "from",   "global", "if",
  "import", "in",    "is",       "lambda", "nonlocal", "not",  "or",
  "pass",  "raise",  "return",   "try",    "while",  "with",   "yield"};

// Statements and expressions that would reach outside the sandbox
constexpr std::array<std::string_view, 7> forbidden_keywords{
  "import", "from", "def", "class", "global", "nonlocal", "lambda"};

constexpr std::array<std::string_view, 24> forbidden_names{
  "open",       "eval",       "exec",         "compile",  "__import__",
  "getattr",    "setattr",    "delattr",      "globals",  "locals",
  "vars",       "type",       "input",        "breakpoint", "exit",
  "quit",       "help",       "dir",          "super",    "object",
  "memoryview", "classmethod", "staticmethod", "property"};

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& arr, std::string_view s) {
  return std::find(arr.begin(), arr.end(), s) != arr.end();
}

bool is_keyword(std::string_view s) { return contains(keywords, s); }

constexpr int max_nesting{200};

class parser {
 public:
  explicit parser(std::vector<token> tokens, int line_offset = 0)
      : tokens_{std::move(tokens)}, line_offset_{line_offset} {}

  block program() {
    block out;
    while (peek().kind != token_kind::end) {
      if (peek().kind == token_kind::newline) {
        advance();
        continue;
      }
      statement(out);
    }
    return out;
  }

  /// A lone expression, as found inside an f-string field
  expr_ptr lone_expression() {
    auto e = test();
    while (peek().kind == token_kind::newline) advance();
    if (peek().kind != token_kind::end) fail("invalid syntax in f-string");
    return e;
  }

 private:
  /// Token helpers

  [[nodiscard]] const token& peek(std::size_t ahead = 0) const {
    auto i = std::min(pos_ + ahead, tokens_.size() - 1);
    return tokens_[i];
  }

  const token& advance() {
    const auto& t = tokens_[pos_];
    if (pos_ + 1 < tokens_.size()) ++pos_;
    return t;
  }

  [[nodiscard]] int line() const { return peek().line + line_offset_; }

  [[noreturn]] void fail(std::string_view what) const {
    throw syntax_error{line(), fmt::format("line {}: {}", line(), what)};
  }

  [[noreturn]] void forbid(std::string_view word) const {
    throw sandbox_violation{fmt::format(
        "line {}: '{}' is not allowed in sandboxed code", line(), word)};
  }

  [[nodiscard]] bool at_op(std::string_view op, std::size_t ahead = 0) const {
    const auto& t = peek(ahead);
    return t.kind == token_kind::op && t.text == op;
  }

  [[nodiscard]] bool at_keyword(std::string_view kw) const {
    const auto& t = peek();
    return t.kind == token_kind::name && t.text == kw;
  }

  void expect_op(std::string_view op) {
    if (!at_op(op)) fail(fmt::format("expected '{}'", op));
    advance();
  }

  void expect_keyword(std::string_view kw) {
    if (!at_keyword(kw)) fail(fmt::format("expected '{}'", kw));
    advance();
  }

  void expect_newline() {
    if (peek().kind == token_kind::end) return;
    if (peek().kind != token_kind::newline) fail("invalid syntax");
    advance();
  }

  [[nodiscard]] bool starts_expression() const {
    const auto& t = peek();
    switch (t.kind) {
      case token_kind::number:
      case token_kind::string:
      case token_kind::fstring: return true;
      case token_kind::name:
        return !is_keyword(t.text) || t.text == "None" || t.text == "True" ||
               t.text == "False" || t.text == "not" || t.text == "lambda";
      case token_kind::op:
        return t.text == "(" || t.text == "[" || t.text == "{" ||
               t.text == "-" || t.text == "+";
      default: return false;
    }
  }

  /// Statements

  void statement(block& out) {
    const auto& t = peek();
    if (t.kind == token_kind::indent) fail("unexpected indent");
    if (t.kind == token_kind::name) {
      if (contains(forbidden_keywords, t.text)) forbid(t.text);
      if (t.text == "if") return out.push_back(if_statement());
      if (t.text == "while") return out.push_back(while_statement());
      if (t.text == "for") return out.push_back(for_statement());
      if (t.text == "try") return out.push_back(try_statement());
      if (t.text == "with" || t.text == "async" || t.text == "await" ||
          t.text == "yield" || t.text == "return" || t.text == "del" ||
          t.text == "assert" || t.text == "raise")
        fail(fmt::format("'{}' is not supported", t.text));
    }
    simple_statements(out);
  }

  void simple_statements(block& out) {
    for (;;) {
      out.push_back(small_statement());
      if (!at_op(";")) break;
      advance();
      if (peek().kind == token_kind::newline || peek().kind == token_kind::end)
        break;
    }
    expect_newline();
  }

  stmt_ptr small_statement() {
    int ln = line();
    if (at_keyword("pass")) {
      advance();
      return make_stmt(ln, stmt::pass{});
    }
    if (at_keyword("break")) {
      advance();
      return make_stmt(ln, stmt::brk{});
    }
    if (at_keyword("continue")) {
      advance();
      return make_stmt(ln, stmt::cont{});
    }

    auto first = testlist();

    // Annotated assignment: the annotation is parsed and dropped
    if (at_op(":") && std::holds_alternative<expr::name>(first->node)) {
      advance();
      test();
      if (!at_op("=")) return make_stmt(ln, stmt::pass{});
      advance();
      check_target(*first);
      return make_stmt(ln, stmt::assign{{first}, testlist()});
    }

    if (at_op("=")) {
      std::vector<expr_ptr> chain{first};
      while (at_op("=")) {
        advance();
        chain.push_back(testlist());
      }
      auto value = chain.back();
      chain.pop_back();
      for (const auto& t : chain) check_target(*t);
      return make_stmt(ln, stmt::assign{std::move(chain), value});
    }

    static constexpr std::array<std::pair<std::string_view, binary_op>, 7>
        aug_ops{{
          {"+=", binary_op::add},
          {"-=", binary_op::sub},
          {"*=", binary_op::mul},
          {"/=", binary_op::div},
          {"//=", binary_op::floor_div},
          {"%=", binary_op::mod},
          {"**=", binary_op::pow},
        }};
    for (const auto& [text, op] : aug_ops) {
      if (at_op(text)) {
        advance();
        if (std::holds_alternative<expr::tuple>(first->node))
          fail("illegal expression for augmented assignment");
        check_target(*first);
        return make_stmt(ln, stmt::aug_assign{first, op, testlist()});
      }
    }

    return make_stmt(ln, stmt::expression{first});
  }

  void check_target(const expr& e) const {
    if (std::holds_alternative<expr::name>(e.node) ||
        std::holds_alternative<expr::subscript>(e.node) ||
        std::holds_alternative<expr::attribute>(e.node))
      return;
    if (const auto* t = std::get_if<expr::tuple>(&e.node)) {
      for (const auto& el : t->elements) check_target(*el);
      return;
    }
    if (const auto* l = std::get_if<expr::list>(&e.node)) {
      for (const auto& el : l->elements) check_target(*el);
      return;
    }
    throw syntax_error{
      e.line + line_offset_,
      fmt::format("line {}: cannot assign to expression", e.line)};
  }

  block suite() {
    expect_op(":");
    block body;
    if (peek().kind != token_kind::newline) {
      simple_statements(body);
      return body;
    }
    advance();
    if (peek().kind != token_kind::indent) fail("expected an indented block");
    advance();
    while (peek().kind != token_kind::dedent && peek().kind != token_kind::end)
      statement(body);
    if (peek().kind == token_kind::dedent) advance();
    return body;
  }

  stmt_ptr if_statement() {
    int ln = line();
    advance();
    stmt::if_else node{};
    auto cond = test();
    node.branches.emplace_back(cond, suite());
    while (at_keyword("elif")) {
      advance();
      auto c = test();
      node.branches.emplace_back(c, suite());
    }
    if (at_keyword("else")) {
      advance();
      node.orelse = suite();
    }
    return make_stmt(ln, std::move(node));
  }

  stmt_ptr while_statement() {
    int ln = line();
    advance();
    auto cond = test();
    auto body = suite();
    if (at_keyword("else")) fail("while/else is not supported");
    return make_stmt(ln, stmt::while_loop{cond, std::move(body)});
  }

  stmt_ptr for_statement() {
    int ln = line();
    advance();
    auto target = target_list();
    expect_keyword("in");
    auto iter = testlist();
    auto body = suite();
    if (at_keyword("else")) fail("for/else is not supported");
    return make_stmt(ln, stmt::for_loop{target, iter, std::move(body)});
  }

  stmt_ptr try_statement() {
    int ln = line();
    advance();
    stmt::try_except node{};
    node.body = suite();
    while (at_keyword("except")) {
      advance();
      stmt::handler h{};
      if (!at_op(":")) {
        if (peek().kind != token_kind::name) fail("expected exception name");
        h.type_name = advance().text;
        // Qualified names keep the last component
        while (at_op(".")) {
          advance();
          if (peek().kind != token_kind::name) fail("expected name");
          h.type_name = advance().text;
        }
        if (at_keyword("as")) {
          advance();
          if (peek().kind != token_kind::name) fail("expected name after 'as'");
          h.binding = advance().text;
        }
      }
      h.body = suite();
      node.handlers.push_back(std::move(h));
    }
    if (at_keyword("finally")) fail("'finally' is not supported");
    if (at_keyword("else")) fail("try/else is not supported");
    if (node.handlers.empty()) fail("expected 'except'");
    return make_stmt(ln, std::move(node));
  }

  /// Expressions

  expr_ptr testlist() {
    int ln = line();
    auto first = test();
    if (!at_op(",")) return first;
    std::vector<expr_ptr> elements{first};
    while (at_op(",")) {
      advance();
      if (!starts_expression()) break;
      elements.push_back(test());
    }
    return make_expr(ln, expr::tuple{std::move(elements)});
  }

  /// for-loop and comprehension targets stop short of 'in'
  expr_ptr target_list() {
    int ln = line();
    auto first = arith();
    if (!at_op(",")) {
      check_target(*first);
      return first;
    }
    std::vector<expr_ptr> elements{first};
    while (at_op(",")) {
      advance();
      if (at_keyword("in")) break;
      elements.push_back(arith());
    }
    auto t = make_expr(ln, expr::tuple{std::move(elements)});
    check_target(*t);
    return t;
  }

  struct nesting_guard {
    explicit nesting_guard(parser& p) : p_{p} {
      if (++p_.nesting_ > max_nesting) p_.fail("expression is nested too deeply");
    }
    ~nesting_guard() { --p_.nesting_; }
    nesting_guard(const nesting_guard&) = delete;
    nesting_guard& operator=(const nesting_guard&) = delete;

   private:
    parser& p_;
  };

  expr_ptr test() {
    nesting_guard guard{*this};
    if (at_keyword("lambda")) forbid("lambda");
    int ln = line();
    auto body = or_test();
    if (!at_keyword("if")) return body;
    advance();
    auto cond = or_test();
    expect_keyword("else");
    auto orelse = test();
    return make_expr(ln, expr::conditional{cond, body, orelse});
  }

  expr_ptr or_test() {
    int ln = line();
    auto lhs = and_test();
    while (at_keyword("or")) {
      advance();
      lhs = make_expr(ln, expr::logical{false, lhs, and_test()});
    }
    return lhs;
  }

  expr_ptr and_test() {
    int ln = line();
    auto lhs = not_test();
    while (at_keyword("and")) {
      advance();
      lhs = make_expr(ln, expr::logical{true, lhs, not_test()});
    }
    return lhs;
  }

  expr_ptr not_test() {
    nesting_guard guard{*this};
    int ln = line();
    if (at_keyword("not")) {
      advance();
      return make_expr(ln, expr::unary{unary_op::logical_not, not_test()});
    }
    return comparison();
  }

  std::optional<compare_op> comparison_operator() {
    const auto& t = peek();
    if (t.kind == token_kind::op) {
      static constexpr std::array<std::pair<std::string_view, compare_op>, 6>
          ops{{
            {"==", compare_op::eq},
            {"!=", compare_op::ne},
            {"<", compare_op::lt},
            {"<=", compare_op::le},
            {">", compare_op::gt},
            {">=", compare_op::ge},
          }};
      for (const auto& [text, op] : ops) {
        if (t.text == text) {
          advance();
          return op;
        }
      }
      return std::nullopt;
    }
    if (t.kind != token_kind::name) return std::nullopt;
    if (t.text == "in") {
      advance();
      return compare_op::in;
    }
    if (t.text == "not" && peek(1).kind == token_kind::name &&
        peek(1).text == "in") {
      advance();
      advance();
      return compare_op::not_in;
    }
    if (t.text == "is") {
      advance();
      if (at_keyword("not")) {
        advance();
        return compare_op::is_not;
      }
      return compare_op::is;
    }
    return std::nullopt;
  }

  expr_ptr comparison() {
    int ln = line();
    auto first = arith();
    expr::compare node{first, {}};
    while (auto op = comparison_operator()) node.rest.emplace_back(*op, arith());
    if (node.rest.empty()) return first;
    return make_expr(ln, std::move(node));
  }

  expr_ptr arith() {
    int ln = line();
    auto lhs = term();
    for (;;) {
      if (at_op("+")) {
        advance();
        lhs = make_expr(ln, expr::binary{binary_op::add, lhs, term()});
      } else if (at_op("-")) {
        advance();
        lhs = make_expr(ln, expr::binary{binary_op::sub, lhs, term()});
      } else {
        return lhs;
      }
    }
  }

  expr_ptr term() {
    int ln = line();
    auto lhs = factor();
    for (;;) {
      std::optional<binary_op> op;
      if (at_op("*")) op = binary_op::mul;
      else if (at_op("/")) op = binary_op::div;
      else if (at_op("//")) op = binary_op::floor_div;
      else if (at_op("%")) op = binary_op::mod;
      if (!op) return lhs;
      advance();
      lhs = make_expr(ln, expr::binary{*op, lhs, factor()});
    }
  }

  expr_ptr factor() {
    nesting_guard guard{*this};
    int ln = line();
    if (at_op("-")) {
      advance();
      return make_expr(ln, expr::unary{unary_op::minus, factor()});
    }
    if (at_op("+")) {
      advance();
      return make_expr(ln, expr::unary{unary_op::plus, factor()});
    }
    return power();
  }

  expr_ptr power() {
    int ln = line();
    auto base = primary();
    if (!at_op("**")) return base;
    advance();
    return make_expr(ln, expr::binary{binary_op::pow, base, factor()});
  }

  expr_ptr primary() {
    auto e = atom();
    for (;;) {
      int ln = line();
      if (at_op("(")) {
        advance();
        e = call_arguments(e, ln);
      } else if (at_op("[")) {
        advance();
        auto index = subscript_index();
        expect_op("]");
        e = make_expr(ln, expr::subscript{e, index});
      } else if (at_op(".")) {
        advance();
        if (peek().kind != token_kind::name) fail("expected attribute name");
        e = make_expr(ln, expr::attribute{e, advance().text});
      } else {
        return e;
      }
    }
  }

  expr_ptr call_arguments(expr_ptr func, int ln) {
    expr::call node{std::move(func), {}, {}};
    while (!at_op(")")) {
      if (at_op("*") || at_op("**")) fail("argument unpacking is not supported");
      if (peek().kind == token_kind::name && at_op("=", 1)) {
        std::string kw = advance().text;
        advance();
        node.keywords.emplace_back(std::move(kw), test());
      } else {
        if (!node.keywords.empty())
          fail("positional argument follows keyword argument");
        int aln = line();
        auto arg = test();
        // f(x for x in xs)
        if (at_keyword("for")) {
          if (!node.args.empty()) fail("generator argument must be alone");
          expr::comprehension comp{nullptr, arg, comprehension_clauses()};
          arg = make_expr(aln, std::move(comp));
        }
        node.args.push_back(arg);
      }
      if (!at_op(",")) break;
      advance();
    }
    expect_op(")");
    return make_expr(ln, std::move(node));
  }

  expr_ptr subscript_index() {
    int ln = line();
    expr_ptr lower;
    if (!at_op(":")) {
      lower = test();
      if (!at_op(":")) {
        if (at_op(",")) fail("tuple indices are not supported");
        return lower;
      }
    }
    expr::slice s{lower, nullptr, nullptr};
    advance();
    if (!at_op("]") && !at_op(":")) s.upper = test();
    if (at_op(":")) {
      advance();
      if (!at_op("]")) s.step = test();
    }
    return make_expr(ln, std::move(s));
  }

  std::vector<comp_clause> comprehension_clauses() {
    std::vector<comp_clause> clauses;
    while (at_keyword("for")) {
      advance();
      comp_clause c{};
      c.target = target_list();
      expect_keyword("in");
      c.iter = or_test();
      while (at_keyword("if")) {
        advance();
        c.conditions.push_back(or_test());
      }
      clauses.push_back(std::move(c));
    }
    return clauses;
  }

  expr_ptr atom() {
    int ln = line();
    const auto& t = peek();
    switch (t.kind) {
      case token_kind::name: {
        if (t.text == "None") {
          advance();
          return make_expr(ln, expr::constant{nullptr});
        }
        if (t.text == "True" || t.text == "False") {
          bool v = t.text == "True";
          advance();
          return make_expr(ln, expr::constant{v});
        }
        if (contains(forbidden_keywords, t.text)) forbid(t.text);
        if (is_keyword(t.text)) fail("invalid syntax");
        return make_expr(ln, expr::name{advance().text});
      }
      case token_kind::number: return number(advance().text, ln);
      case token_kind::string:
      case token_kind::fstring: return strings(ln);
      case token_kind::op: break;
      default: fail("invalid syntax");
    }

    if (at_op("(")) {
      advance();
      if (at_op(")")) {
        advance();
        return make_expr(ln, expr::tuple{});
      }
      auto first = test();
      if (at_keyword("for")) {
        expr::comprehension comp{nullptr, first, comprehension_clauses()};
        expect_op(")");
        return make_expr(ln, std::move(comp));
      }
      if (!at_op(",")) {
        expect_op(")");
        return first;
      }
      std::vector<expr_ptr> elements{first};
      while (at_op(",")) {
        advance();
        if (at_op(")")) break;
        elements.push_back(test());
      }
      expect_op(")");
      return make_expr(ln, expr::tuple{std::move(elements)});
    }

    if (at_op("[")) {
      advance();
      expr::list node{};
      if (!at_op("]")) {
        auto first = test();
        if (at_keyword("for")) {
          expr::comprehension comp{nullptr, first, comprehension_clauses()};
          expect_op("]");
          return make_expr(ln, std::move(comp));
        }
        node.elements.push_back(first);
        while (at_op(",")) {
          advance();
          if (at_op("]")) break;
          node.elements.push_back(test());
        }
      }
      expect_op("]");
      return make_expr(ln, std::move(node));
    }

    if (at_op("{")) {
      advance();
      expr::dict node{};
      if (!at_op("}")) {
        auto key = test();
        if (!at_op(":")) fail("set literals are not supported");
        advance();
        auto value = test();
        if (at_keyword("for")) {
          expr::comprehension comp{key, value, comprehension_clauses()};
          expect_op("}");
          return make_expr(ln, std::move(comp));
        }
        node.items.emplace_back(key, value);
        while (at_op(",")) {
          advance();
          if (at_op("}")) break;
          auto k = test();
          expect_op(":");
          node.items.emplace_back(k, test());
        }
      }
      expect_op("}");
      return make_expr(ln, std::move(node));
    }

    fail("invalid syntax");
  }

  expr_ptr number(std::string text, int ln) {
    std::erase(text, '_');
    bool is_float =
        text.find_first_of(".eE") != std::string::npos &&
        !(text.size() > 1 && text[0] == '0' &&
          (text[1] == 'x' || text[1] == 'X'));
    if (is_float) {
      double d{0.0};
      auto [p, ec] = std::from_chars(text.data(), text.data() + text.size(), d);
      if (ec != std::errc{} || p != text.data() + text.size())
        fail("invalid number literal");
      return make_expr(ln, expr::constant{d});
    }
    int base{10};
    std::string_view digits{text};
    if (digits.size() > 1 && digits[0] == '0') {
      char b = static_cast<char>(std::tolower(static_cast<unsigned char>(digits[1])));
      if (b == 'x') base = 16;
      else if (b == 'o') base = 8;
      else if (b == 'b') base = 2;
      if (base != 10) digits.remove_prefix(2);
    }
    std::int64_t v{0};
    auto [p, ec] =
        std::from_chars(digits.data(), digits.data() + digits.size(), v, base);
    if (ec == std::errc::result_out_of_range) fail("integer literal too large");
    if (ec != std::errc{} || p != digits.data() + digits.size())
      fail("invalid number literal");
    return make_expr(ln, expr::constant{v});
  }

  /// Adjacent string literals concatenate; any f-string makes the whole
  /// run an f-string
  expr_ptr strings(int ln) {
    expr::fstring node{};
    bool formatted{false};
    std::string literal;
    while (peek().kind == token_kind::string ||
           peek().kind == token_kind::fstring) {
      const auto& t = advance();
      if (t.kind == token_kind::string) {
        literal += t.text;
        continue;
      }
      formatted = true;
      fstring_parts(t.text, t.line + line_offset_, literal, node.parts);
    }
    if (!formatted) return make_expr(ln, expr::constant{json::string{literal}});
    if (!literal.empty()) node.parts.emplace_back(std::move(literal));
    return make_expr(ln, std::move(node));
  }

  void fstring_parts(
      std::string_view body, int ln, std::string& literal,
      std::vector<std::variant<std::string, expr::format_field>>& parts) {
    auto bad = [&](std::string_view what) {
      throw syntax_error{ln, fmt::format("line {}: f-string: {}", ln, what)};
    };
    std::size_t i{0};
    while (i < body.size()) {
      char c = body[i];
      if (c == '}') {
        if (i + 1 < body.size() && body[i + 1] == '}') {
          literal += '}';
          i += 2;
          continue;
        }
        bad("single '}' is not allowed");
      }
      if (c != '{') {
        literal += c;
        ++i;
        continue;
      }
      if (i + 1 < body.size() && body[i + 1] == '{') {
        literal += '{';
        i += 2;
        continue;
      }

      // Find the end of the field, noting top-level '!' and ':'
      std::size_t j{i + 1};
      int depth{0};
      char quote{0};
      std::size_t conv_pos{std::string_view::npos};
      std::size_t spec_pos{std::string_view::npos};
      for (; j < body.size(); ++j) {
        char ch = body[j];
        if (spec_pos != std::string_view::npos) {
          if (ch == '}') break;
          if (ch == '{') bad("nested replacement fields are not supported");
          continue;
        }
        if (quote) {
          if (ch == quote) quote = 0;
          continue;
        }
        if (ch == '\'' || ch == '"') quote = ch;
        else if (ch == '(' || ch == '[' || ch == '{') ++depth;
        else if (ch == ')' || ch == ']' || (ch == '}' && depth > 0)) --depth;
        else if (ch == '}') break;
        else if (depth == 0 && ch == '!' && j + 1 < body.size() &&
                 body[j + 1] != '=')
          conv_pos = j;
        else if (depth == 0 && ch == ':')
          spec_pos = j;
      }
      if (j >= body.size()) bad("expecting '}'");

      std::size_t expr_end = std::min({conv_pos, spec_pos, j});
      auto source = body.substr(i + 1, expr_end - i - 1);

      expr::format_field field{};
      if (conv_pos != std::string_view::npos) {
        if (conv_pos + 2 > std::min(spec_pos, j) ||
            (body[conv_pos + 1] != 'r' && body[conv_pos + 1] != 's' &&
             body[conv_pos + 1] != 'a'))
          bad("invalid conversion character");
        field.conversion = body[conv_pos + 1];
      }
      if (spec_pos != std::string_view::npos)
        field.spec = std::string{body.substr(spec_pos + 1, j - spec_pos - 1)};

      bool empty{true};
      for (char ch : source)
        if (ch != ' ' && ch != '\t') empty = false;
      if (empty) bad("empty expression not allowed");

      parser sub{tokenize(source), ln - 1};
      field.value = sub.lone_expression();

      if (!literal.empty()) parts.emplace_back(std::move(literal));
      literal.clear();
      parts.emplace_back(std::move(field));
      i = j + 1;
    }
  }

  std::vector<token> tokens_;
  std::size_t pos_{0};
  int line_offset_;
  int nesting_{0};
};

/// Static validation

class validator {
 public:
  void check_block(const block& b) {
    for (const auto& s : b) {
      line_ = s->line;
      std::visit(*this, s->node);
    }
  }

  void check(const expr_ptr& e) {
    if (!e) return;
    line_ = e->line;
    std::visit(*this, e->node);
  }

  void check_name(std::string_view id) const {
    if (is_forbidden_name(id) || id.starts_with("__"))
      throw sandbox_violation{fmt::format(
          "line {}: name '{}' is not allowed in sandboxed code", line_, id)};
  }

  /// Statements

  void operator()(const stmt::expression& s) { check(s.value); }
  void operator()(const stmt::assign& s) {
    for (const auto& t : s.targets) check(t);
    check(s.value);
  }
  void operator()(const stmt::aug_assign& s) {
    check(s.target);
    check(s.value);
  }
  void operator()(const stmt::if_else& s) {
    for (const auto& [cond, body] : s.branches) {
      check(cond);
      check_block(body);
    }
    check_block(s.orelse);
  }
  void operator()(const stmt::while_loop& s) {
    check(s.test);
    ++loop_depth_;
    check_block(s.body);
    --loop_depth_;
  }
  void operator()(const stmt::for_loop& s) {
    check(s.target);
    check(s.iter);
    ++loop_depth_;
    check_block(s.body);
    --loop_depth_;
  }
  void operator()(const stmt::try_except& s) {
    check_block(s.body);
    for (const auto& h : s.handlers) {
      if (h.binding) check_name(*h.binding);
      check_block(h.body);
    }
  }
  void operator()(const stmt::pass&) {}
  void operator()(const stmt::brk&) const { outside_loop("break"); }
  void operator()(const stmt::cont&) const { outside_loop("continue"); }

  void outside_loop(std::string_view word) const {
    if (loop_depth_ == 0)
      throw syntax_error{
        line_, fmt::format("line {}: '{}' outside loop", line_, word)};
  }

  /// Expressions

  void operator()(const expr::constant&) {}
  void operator()(const expr::name& e) { check_name(e.id); }
  void operator()(const expr::fstring& e) {
    for (const auto& p : e.parts)
      if (const auto* f = std::get_if<expr::format_field>(&p)) check(f->value);
  }
  void operator()(const expr::list& e) {
    for (const auto& el : e.elements) check(el);
  }
  void operator()(const expr::tuple& e) {
    for (const auto& el : e.elements) check(el);
  }
  void operator()(const expr::dict& e) {
    for (const auto& [k, v] : e.items) {
      check(k);
      check(v);
    }
  }
  void operator()(const expr::unary& e) { check(e.operand); }
  void operator()(const expr::binary& e) {
    check(e.lhs);
    check(e.rhs);
  }
  void operator()(const expr::logical& e) {
    check(e.lhs);
    check(e.rhs);
  }
  void operator()(const expr::compare& e) {
    check(e.first);
    for (const auto& [op, rhs] : e.rest) check(rhs);
  }
  void operator()(const expr::conditional& e) {
    check(e.test);
    check(e.body);
    check(e.orelse);
  }
  void operator()(const expr::attribute& e) {
    if (e.name.starts_with("__"))
      throw sandbox_violation{fmt::format(
          "line {}: attribute '{}' is not allowed in sandboxed code", line_,
          e.name)};
    check(e.object);
  }
  void operator()(const expr::subscript& e) {
    check(e.object);
    check(e.index);
  }
  void operator()(const expr::slice& e) {
    check(e.lower);
    check(e.upper);
    check(e.step);
  }
  void operator()(const expr::call& e) {
    check(e.func);
    for (const auto& a : e.args) check(a);
    for (const auto& [kw, v] : e.keywords) {
      if (kw.starts_with("__")) check_name(kw);
      check(v);
    }
  }
  void operator()(const expr::comprehension& e) {
    check(e.key);
    check(e.element);
    for (const auto& c : e.clauses) {
      check(c.target);
      check(c.iter);
      for (const auto& cond : c.conditions) check(cond);
    }
  }

 private:
  int line_{0};
  int loop_depth_{0};
};

}  // namespace

bool is_forbidden_name(std::string_view id) {
  return contains(forbidden_names, id);
}

block parse_program(std::string_view source) {
  return parser{tokenize(source)}.program();
}

void validate(const block& program) { validator{}.check_block(program); }

}  // namespace tether::sandbox
