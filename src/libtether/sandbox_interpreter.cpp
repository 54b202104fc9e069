#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <functional>
#include <limits>
#include <map>
#include <string>

#include "sandbox_ast.hpp"
#include "sandbox_memory.hpp"
#include "sandbox_parser.hpp"
#include "sandbox_value.hpp"
#include "tether/sandbox.hpp"
#include "utils.hpp"

namespace tether::sandbox {

namespace {

using value::raise;
using clock = std::chrono::steady_clock;

enum class flow { normal, brk, cont };

constexpr std::string_view whitespace{" \t\n\r\f\v"};

constexpr std::array<std::string_view, 23> builtin_names{
  "print", "len",   "range",    "str",       "repr",       "int",
  "float", "bool",  "list",     "tuple",     "dict",       "sorted",
  "sum",   "min",   "max",      "abs",       "round",      "enumerate",
  "zip",   "any",   "all",      "reversed",  "isinstance"};

bool is_builtin(std::string_view name) {
  return std::find(builtin_names.begin(), builtin_names.end(), name) !=
         builtin_names.end();
}

/// Parent classes for except clauses
std::string_view parent_of(std::string_view type) {
  if (type == "KeyError" || type == "IndexError") return "LookupError";
  if (type == "ZeroDivisionError" || type == "OverflowError")
    return "ArithmeticError";
  if (type == "JSONDecodeError") return "ValueError";
  return {};
}

bool handler_matches(
    const std::optional<std::string>& handler, std::string_view raised) {
  if (!handler || *handler == "Exception" || *handler == "BaseException")
    return true;
  for (auto t = raised; !t.empty(); t = parent_of(t))
    if (t == *handler) return true;
  return false;
}

std::size_t code_point_count(std::string_view s) {
  std::size_t n{0};
  for (unsigned char c : s)
    if ((c & 0xC0) != 0x80) ++n;
  return n;
}

std::optional<std::int64_t> parse_int(std::string_view text, int base) {
  auto s = utils::trim(text);
  bool negative{false};
  if (!s.empty() && (s[0] == '+' || s[0] == '-')) {
    negative = s[0] == '-';
    s.remove_prefix(1);
  }
  if (s.size() > 2 && s[0] == '0') {
    char p = static_cast<char>(std::tolower(static_cast<unsigned char>(s[1])));
    if ((p == 'x' && base == 16) || (p == 'o' && base == 8) ||
        (p == 'b' && base == 2))
      s.remove_prefix(2);
  }
  std::string digits;
  for (char c : s)
    if (c != '_') digits += c;
  if (digits.empty()) return std::nullopt;
  std::uint64_t v{0};
  auto [p, ec] =
      std::from_chars(digits.data(), digits.data() + digits.size(), v, base);
  if (ec != std::errc{} || p != digits.data() + digits.size())
    return std::nullopt;
  auto limit = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
  if (v > limit + (negative ? 1 : 0)) raise("OverflowError", "int too large");
  if (negative) return static_cast<std::int64_t>(0 - v);
  return static_cast<std::int64_t>(v);
}

std::optional<double> parse_float(std::string_view text) {
  auto s = std::string{utils::trim(text)};
  std::string lower;
  for (char c : s)
    lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  std::string_view body{lower};
  double sign{1.0};
  if (!body.empty() && (body[0] == '+' || body[0] == '-')) {
    sign = body[0] == '-' ? -1.0 : 1.0;
    body.remove_prefix(1);
  }
  if (body == "inf" || body == "infinity")
    return sign * std::numeric_limits<double>::infinity();
  if (body == "nan") return std::numeric_limits<double>::quiet_NaN();
  std::erase(s, '_');
  double d{0.0};
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), d);
  if (ec != std::errc{} || p != s.data() + s.size() || s.empty())
    return std::nullopt;
  return d;
}

std::string dedent(std::string_view code) {
  std::vector<std::string_view> lines;
  for (std::size_t start = 0;;) {
    auto nl = code.find('\n', start);
    lines.push_back(code.substr(start, nl == std::string_view::npos
                                           ? std::string_view::npos
                                           : nl - start));
    if (nl == std::string_view::npos) break;
    start = nl + 1;
  }
  std::size_t common{std::string_view::npos};
  for (auto l : lines) {
    auto first = l.find_first_not_of(" \t\r");
    if (first == std::string_view::npos) continue;
    common = std::min(common, first);
  }
  if (common == 0 || common == std::string_view::npos) return std::string{code};
  std::string out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    auto l = lines[i];
    if (l.find_first_not_of(" \t\r") != std::string_view::npos)
      out.append(l.substr(common));
    if (i + 1 < lines.size()) out += '\n';
  }
  return out;
}

class interpreter {
 public:
  interpreter(
      const external_functions& functions, std::string& output,
      const limits& lim, cancel_token token)
      : functions_{functions},
        output_{output},
        limits_{lim},
        token_{std::move(token)},
        deadline_{clock::now() + lim.wall_clock},
        sp_{json::make_shared_resource<counting_resource>(lim.max_memory)} {}

  void execute(const block& program) {
    try {
      exec_block(program);
    } catch (const code_execution_error& e) {
      throw code_execution_error{fmt::format("{} (line {})", e.what(), line_)};
    } catch (const sandbox_error&) {
      throw;
    } catch (const std::bad_alloc&) {
      throw code_execution_error{
        fmt::format("MemoryError: out of memory (line {})", line_)};
    } catch (const std::exception& e) {
      throw code_execution_error{
        fmt::format("RuntimeError: {} (line {})", e.what(), line_)};
    }
  }

 private:
  /// Budgets

  void tick() {
    if (++steps_ > limits_.max_steps)
      throw execution_timeout{
        fmt::format("step limit of {} exceeded", limits_.max_steps)};
    if (token_.requested()) throw execution_cancelled{"execution cancelled"};
    if ((steps_ & 0xFF) == 1 && clock::now() > deadline_)
      throw execution_timeout{fmt::format(
          "wall clock limit of {}ms exceeded", limits_.wall_clock.count())};
  }

  void emit(std::string_view text) {
    if (output_.size() + text.size() > limits_.max_output) {
      output_.append(text.substr(0, limits_.max_output - output_.size()));
      throw execution_timeout{
        fmt::format("output limit of {} bytes exceeded", limits_.max_output)};
    }
    output_.append(text);
  }

  void check_size(std::size_t n) const {
    if (n > limits_.max_collection)
      raise("MemoryError", "collection size limit exceeded");
  }

  /// @p v is about to become an element of a list or dict.
  void check_nesting(const json::value& v) const {
    if (value::depth(v, limits_.max_depth) >= limits_.max_depth)
      raise(
          "RecursionError",
          fmt::format("maximum nesting depth of {} exceeded", limits_.max_depth));
  }

  json::value nest(json::value v) const {
    check_nesting(v);
    return v;
  }

  /// Variables live in the execution's counted storage; reading one
  /// copies into the same storage.
  void bind(const std::string& name, json::value v) {
    json::value stored(std::move(v), sp_);
    if (auto it = vars_.find(name); it != vars_.end())
      it->second = std::move(stored);
    else
      vars_.emplace(name, std::move(stored));
  }

  /// Statements

  flow exec_block(const block& b) {
    for (const auto& s : b) {
      tick();
      line_ = s->line;
      auto f = std::visit([this](const auto& node) { return exec(node); }, s->node);
      if (f != flow::normal) return f;
    }
    return flow::normal;
  }

  flow exec(const stmt::expression& s) {
    eval(s.value);
    return flow::normal;
  }

  flow exec(const stmt::assign& s) {
    auto v = eval(s.value);
    for (const auto& target : s.targets) assign(target, v);
    return flow::normal;
  }

  flow exec(const stmt::aug_assign& s) {
    auto rhs = eval(s.value);
    json::value& target = lvalue(s.target);
    target = value::arithmetic(s.op, target, rhs, limits_.max_collection);
    return flow::normal;
  }

  flow exec(const stmt::if_else& s) {
    for (const auto& [cond, body] : s.branches)
      if (value::truthy(eval(cond))) return exec_block(body);
    return exec_block(s.orelse);
  }

  flow exec(const stmt::while_loop& s) {
    while (value::truthy(eval(s.test))) {
      tick();
      if (exec_block(s.body) == flow::brk) break;
    }
    return flow::normal;
  }

  flow exec(const stmt::for_loop& s) {
    auto items = value::iterate(eval(s.iter));
    for (auto& item : items) {
      tick();
      assign(s.target, std::move(item));
      if (exec_block(s.body) == flow::brk) break;
    }
    return flow::normal;
  }

  flow exec(const stmt::try_except& s) {
    try {
      return exec_block(s.body);
    } catch (const code_execution_error& e) {
      std::string_view what{e.what()};
      auto colon = what.find(": ");
      auto type = what.substr(0, colon);
      auto detail =
          colon == std::string_view::npos ? what : what.substr(colon + 2);
      for (const auto& h : s.handlers) {
        if (!handler_matches(h.type_name, type)) continue;
        if (h.binding) bind(*h.binding, json::string{detail});
        return exec_block(h.body);
      }
      throw;
    }
  }

  flow exec(const stmt::pass&) { return flow::normal; }
  flow exec(const stmt::brk&) { return flow::brk; }
  flow exec(const stmt::cont&) { return flow::cont; }

  /// Assignment

  void assign(const expr_ptr& target, json::value v) {
    if (const auto* n = std::get_if<expr::name>(&target->node)) {
      bind(n->id, std::move(v));
      return;
    }
    const std::vector<expr_ptr>* elements{nullptr};
    if (const auto* t = std::get_if<expr::tuple>(&target->node))
      elements = &t->elements;
    else if (const auto* l = std::get_if<expr::list>(&target->node))
      elements = &l->elements;
    if (elements) {
      auto items = value::iterate(v);
      if (items.size() < elements->size())
        raise(
            "ValueError",
            fmt::format("not enough values to unpack (expected {}, got {})",
                        elements->size(), items.size()));
      if (items.size() > elements->size())
        raise(
            "ValueError", fmt::format("too many values to unpack (expected {})",
                                      elements->size()));
      for (std::size_t i = 0; i < elements->size(); ++i)
        assign((*elements)[i], std::move(items[i]));
      return;
    }
    if (const auto* s = std::get_if<expr::subscript>(&target->node)) {
      if (std::holds_alternative<expr::slice>(s->index->node))
        raise("TypeError", "slice assignment is not supported");
      auto key = eval(s->index);
      check_nesting(v);
      json::value& container = lvalue(s->object);
      set_item(container, key, std::move(v));
      return;
    }
    if (const auto* a = std::get_if<expr::attribute>(&target->node)) {
      check_nesting(v);
      json::value& obj = lvalue(a->object);
      if (!obj.is_object())
        raise(
            "AttributeError",
            fmt::format("'{}' object attribute '{}' is read-only",
                        value::type_name(obj), a->name));
      obj.as_object()[a->name] = std::move(v);
      return;
    }
    raise("SyntaxError", "cannot assign to expression");
  }

  void set_item(json::value& container, const json::value& key, json::value v) {
    if (container.is_array()) {
      auto& arr = container.as_array();
      auto i = value::to_int(key);
      if (i < 0) i += static_cast<std::int64_t>(arr.size());
      if (i < 0 || i >= static_cast<std::int64_t>(arr.size()))
        raise("IndexError", "list assignment index out of range");
      arr[static_cast<std::size_t>(i)] = std::move(v);
      return;
    }
    if (container.is_object()) {
      auto& obj = container.as_object();
      check_size(obj.size() + 1);
      obj[value::dict_key(key)] = std::move(v);
      return;
    }
    raise(
        "TypeError", fmt::format("'{}' object does not support item assignment",
                                 value::type_name(container)));
  }

  static bool is_lvalue(const expr& e) {
    if (std::holds_alternative<expr::name>(e.node)) return true;
    if (const auto* s = std::get_if<expr::subscript>(&e.node))
      return !std::holds_alternative<expr::slice>(s->index->node) &&
             is_lvalue(*s->object);
    if (const auto* a = std::get_if<expr::attribute>(&e.node))
      return is_lvalue(*a->object);
    return false;
  }

  /// Storage behind an assignable expression.  No evaluation happens after
  /// the returned reference is formed.
  json::value& lvalue(const expr_ptr& e) {
    if (const auto* n = std::get_if<expr::name>(&e->node)) {
      auto it = vars_.find(n->id);
      if (it == vars_.end())
        raise("NameError", fmt::format("name '{}' is not defined", n->id));
      return it->second;
    }
    if (const auto* s = std::get_if<expr::subscript>(&e->node)) {
      auto key = eval(s->index);
      json::value& c = lvalue(s->object);
      if (c.is_array()) {
        auto& arr = c.as_array();
        auto i = value::to_int(key);
        if (i < 0) i += static_cast<std::int64_t>(arr.size());
        if (i < 0 || i >= static_cast<std::int64_t>(arr.size()))
          raise("IndexError", "list index out of range");
        return arr[static_cast<std::size_t>(i)];
      }
      if (c.is_object()) {
        auto* found = c.as_object().if_contains(value::dict_key(key));
        if (!found) raise("KeyError", value::repr(key));
        return *found;
      }
      raise(
          "TypeError", fmt::format("'{}' object does not support item assignment",
                                   value::type_name(c)));
    }
    if (const auto* a = std::get_if<expr::attribute>(&e->node)) {
      json::value& obj = lvalue(a->object);
      if (obj.is_object()) {
        if (auto* found = obj.as_object().if_contains(a->name)) return *found;
      }
      raise(
          "AttributeError", fmt::format("'{}' object has no attribute '{}'",
                                        value::type_name(obj), a->name));
    }
    raise("SyntaxError", "cannot assign to expression");
  }

  /// Expressions

  json::value eval(const expr_ptr& e) {
    return std::visit([this](const auto& node) { return evaluate(node); }, e->node);
  }

  json::value evaluate(const expr::constant& c) { return c.value; }

  json::value evaluate(const expr::name& n) {
    auto it = vars_.find(n.id);
    if (it != vars_.end()) return it->second;
    if (is_builtin(n.id) || functions_.find(n.id) || n.id == "json")
      raise(
          "TypeError",
          fmt::format("'{}' can only be called, not used as a value", n.id));
    raise("NameError", fmt::format("name '{}' is not defined", n.id));
  }

  json::value evaluate(const expr::fstring& f) {
    std::string out;
    for (const auto& part : f.parts) {
      if (const auto* lit = std::get_if<std::string>(&part)) {
        out += *lit;
        continue;
      }
      const auto& field = std::get<expr::format_field>(part);
      auto v = eval(field.value);
      if (field.conversion == 'r' || field.conversion == 'a')
        v = json::string{value::repr(v)};
      else if (field.conversion == 's')
        v = json::string{value::str(v)};
      out += value::format(v, field.spec);
      check_size(out.size());
    }
    return json::string{out};
  }

  json::value evaluate(const expr::list& l) {
    json::array out(sp_);
    for (const auto& el : l.elements) out.push_back(nest(eval(el)));
    return out;
  }

  json::value evaluate(const expr::tuple& t) {
    json::array out(sp_);
    for (const auto& el : t.elements) out.push_back(nest(eval(el)));
    return out;
  }

  json::value evaluate(const expr::dict& d) {
    json::object out(sp_);
    for (const auto& [k, v] : d.items) {
      auto key = value::dict_key(eval(k));
      out[key] = nest(eval(v));
    }
    return out;
  }

  json::value evaluate(const expr::unary& u) {
    auto v = eval(u.operand);
    switch (u.op) {
      case unary_op::logical_not: return !value::truthy(v);
      case unary_op::minus: return value::negate(v);
      case unary_op::plus:
        if (!value::is_number(v))
          raise(
              "TypeError", fmt::format("bad operand type for unary +: '{}'",
                                       value::type_name(v)));
        if (v.is_bool()) return value::to_int(v);
        return v;
    }
    return nullptr;
  }

  json::value evaluate(const expr::binary& b) {
    auto lhs = eval(b.lhs);
    auto rhs = eval(b.rhs);
    return value::arithmetic(b.op, lhs, rhs, limits_.max_collection);
  }

  json::value evaluate(const expr::logical& l) {
    auto lhs = eval(l.lhs);
    if (l.is_and != value::truthy(lhs)) return lhs;
    return eval(l.rhs);
  }

  static bool compare_one(
      compare_op op, const json::value& a, const json::value& b) {
    switch (op) {
      case compare_op::eq: return value::equal(a, b);
      case compare_op::ne: return !value::equal(a, b);
      case compare_op::lt: return value::compare(a, b, "<") < 0;
      case compare_op::le: return value::compare(a, b, "<=") <= 0;
      case compare_op::gt: return value::compare(a, b, ">") > 0;
      case compare_op::ge: return value::compare(a, b, ">=") >= 0;
      case compare_op::in: return value::contains(b, a);
      case compare_op::not_in: return !value::contains(b, a);
      case compare_op::is: return same(a, b);
      case compare_op::is_not: return !same(a, b);
    }
    return false;
  }

  /// Identity: exact for None and booleans, equal scalars otherwise
  static bool same(const json::value& a, const json::value& b) {
    if (a.is_null() || b.is_null()) return a.is_null() && b.is_null();
    if (a.is_bool() || b.is_bool()) return a.is_bool() && b.is_bool() && a == b;
    if (a.is_array() || a.is_object()) return false;
    return a.kind() == b.kind() && value::equal(a, b);
  }

  json::value evaluate(const expr::compare& c) {
    auto lhs = eval(c.first);
    for (const auto& [op, rhs_expr] : c.rest) {
      auto rhs = eval(rhs_expr);
      if (!compare_one(op, lhs, rhs)) return false;
      lhs = std::move(rhs);
    }
    return true;
  }

  json::value evaluate(const expr::conditional& c) {
    return value::truthy(eval(c.test)) ? eval(c.body) : eval(c.orelse);
  }

  json::value evaluate(const expr::attribute& a) {
    auto obj = eval(a.object);
    if (obj.is_object()) {
      if (const auto* found = obj.as_object().if_contains(a.name)) return *found;
    }
    raise(
        "AttributeError", fmt::format("'{}' object has no attribute '{}'",
                                      value::type_name(obj), a.name));
  }

  std::optional<std::int64_t> slice_bound(const expr_ptr& e) {
    if (!e) return std::nullopt;
    auto v = eval(e);
    if (v.is_null()) return std::nullopt;
    return value::to_int(v, "slice index");
  }

  json::value evaluate(const expr::subscript& s) {
    auto obj = eval(s.object);
    if (const auto* sl = std::get_if<expr::slice>(&s.index->node)) {
      auto lower = slice_bound(sl->lower);
      auto upper = slice_bound(sl->upper);
      auto step = slice_bound(sl->step);
      return value::slice(obj, lower, upper, step);
    }
    return value::index(obj, eval(s.index));
  }

  json::value evaluate(const expr::slice&) {
    raise("SyntaxError", "slice outside of a subscript");
  }

  json::value evaluate(const expr::comprehension& c) {
    // Comprehension variables do not leak into the enclosing scope
    std::vector<std::string> bound;
    for (const auto& clause : c.clauses) collect_names(*clause.target, bound);
    std::vector<std::pair<std::string, std::optional<json::value>>> saved;
    for (const auto& name : bound) {
      auto it = vars_.find(name);
      saved.emplace_back(
          name, it == vars_.end() ? std::nullopt
                                  : std::optional<json::value>{it->second});
    }
    struct restore {
      interpreter& self;
      std::vector<std::pair<std::string, std::optional<json::value>>>& saved;
      ~restore() {
        for (auto& [name, v] : saved) {
          if (v) self.bind(name, std::move(*v));
          else self.vars_.erase(name);
        }
      }
    } guard{*this, saved};

    if (c.key) {
      json::object out(sp_);
      comprehend(c, 0, [&] {
        auto k = value::dict_key(eval(c.key));
        out[k] = nest(eval(c.element));
        check_size(out.size());
      });
      return out;
    }
    json::array out(sp_);
    comprehend(c, 0, [&] {
      out.push_back(nest(eval(c.element)));
      check_size(out.size());
    });
    return out;
  }

  static void collect_names(const expr& target, std::vector<std::string>& out) {
    if (const auto* n = std::get_if<expr::name>(&target.node)) {
      out.push_back(n->id);
    } else if (const auto* t = std::get_if<expr::tuple>(&target.node)) {
      for (const auto& el : t->elements) collect_names(*el, out);
    } else if (const auto* l = std::get_if<expr::list>(&target.node)) {
      for (const auto& el : l->elements) collect_names(*el, out);
    }
  }

  void comprehend(
      const expr::comprehension& c, std::size_t depth,
      const std::function<void()>& produce) {
    if (depth == c.clauses.size()) {
      produce();
      return;
    }
    const auto& clause = c.clauses[depth];
    auto items = value::iterate(eval(clause.iter));
    for (auto& item : items) {
      tick();
      assign(clause.target, std::move(item));
      bool keep = std::all_of(
          clause.conditions.begin(), clause.conditions.end(),
          [this](const expr_ptr& cond) { return value::truthy(eval(cond)); });
      if (keep) comprehend(c, depth + 1, produce);
    }
  }

  /// Calls

  call_args eval_args(const expr::call& c) {
    call_args args;
    for (const auto& a : c.args) args.positional.push_back(eval(a));
    for (const auto& [kw, v] : c.keywords) args.keywords.emplace_back(kw, eval(v));
    return args;
  }

  json::value evaluate(const expr::call& c) {
    if (const auto* n = std::get_if<expr::name>(&c.func->node)) {
      if (vars_.contains(n->id))
        raise(
            "TypeError", fmt::format("'{}' object is not callable",
                                     value::type_name(vars_.find(n->id)->second)));
      if (n->id == "isinstance") return isinstance(c);
      auto args = eval_args(c);
      if (const auto* fn = functions_.find(n->id))
        return call_host(n->id, *fn, args);
      return call_builtin(n->id, args);
    }

    if (const auto* a = std::get_if<expr::attribute>(&c.func->node)) {
      const auto* module = std::get_if<expr::name>(&a->object->node);
      if (module && module->id == "json" && !vars_.contains("json"))
        return call_json(a->name, eval_args(c));
      auto args = eval_args(c);
      if (is_lvalue(*a->object)) return call_method(lvalue(a->object), a->name, args);
      auto temp = eval(a->object);
      return call_method(temp, a->name, args);
    }

    auto callee = eval(c.func);
    raise(
        "TypeError", fmt::format("'{}' object is not callable",
                                 value::type_name(callee)));
  }

  json::value call_host(
      std::string_view name, const host_function& fn, const call_args& args) {
    json::value result;
    try {
      result = fn(args);
    } catch (const sandbox_error&) {
      throw;
    } catch (const std::exception& e) {
      raise("RuntimeError", fmt::format("{}: {}", name, e.what()));
    }
    if (token_.requested()) throw execution_cancelled{"execution cancelled"};
    return result;
  }

  json::value isinstance(const expr::call& c) {
    if (c.args.size() != 2 || !c.keywords.empty())
      raise("TypeError", "isinstance expected 2 arguments");
    auto v = eval(c.args[0]);
    std::vector<std::string_view> types;
    auto add_type = [&](const expr& e) {
      const auto* n = std::get_if<expr::name>(&e.node);
      if (!n)
        raise("TypeError", "isinstance() arg 2 must be a type or tuple of types");
      types.push_back(n->id);
    };
    if (const auto* t = std::get_if<expr::tuple>(&c.args[1]->node)) {
      for (const auto& el : t->elements) add_type(*el);
    } else {
      add_type(*c.args[1]);
    }
    for (auto t : types) {
      if (t == "str" && v.is_string()) return true;
      if (t == "int" && value::is_int(v)) return true;
      if (t == "float" && v.is_double()) return true;
      if (t == "bool" && v.is_bool()) return true;
      if ((t == "list" || t == "tuple") && v.is_array()) return true;
      if (t == "dict" && v.is_object()) return true;
      if (t != "str" && t != "int" && t != "float" && t != "bool" &&
          t != "list" && t != "tuple" && t != "dict")
        raise("TypeError", fmt::format("'{}' is not a supported type", t));
    }
    return false;
  }

  static void arity(
      std::string_view name, const call_args& a, std::size_t min,
      std::size_t max) {
    auto n = a.positional.size();
    if (n < min || n > max) {
      if (min == max)
        raise(
            "TypeError",
            fmt::format("{}() takes exactly {} argument(s) ({} given)", name,
                        min, n));
      raise(
          "TypeError",
          fmt::format("{}() takes from {} to {} arguments ({} given)", name,
                      min, max, n));
    }
  }

  static const json::value* keyword(const call_args& a, std::string_view name) {
    for (const auto& [k, v] : a.keywords)
      if (k == name) return &v;
    return nullptr;
  }

  json::value call_builtin(const std::string& name, const call_args& a) {
    if (name == "print") {
      std::string sep{" "};
      std::string end{"\n"};
      if (const auto* s = keyword(a, "sep"); s && !s->is_null()) sep = value::str(*s);
      if (const auto* e = keyword(a, "end"); e && !e->is_null()) end = value::str(*e);
      std::string line;
      for (std::size_t i = 0; i < a.positional.size(); ++i) {
        if (i > 0) line += sep;
        line += value::str(a.positional[i]);
      }
      line += end;
      emit(line);
      return nullptr;
    }
    if (name == "len") {
      arity(name, a, 1, 1);
      return static_cast<std::int64_t>(value::length(a.positional[0]));
    }
    if (name == "range") return range(a);
    if (name == "str") {
      arity(name, a, 0, 1);
      return json::string{a.positional.empty() ? "" : value::str(a.positional[0])};
    }
    if (name == "repr") {
      arity(name, a, 1, 1);
      return json::string{value::repr(a.positional[0])};
    }
    if (name == "int") return to_int(a);
    if (name == "float") {
      arity(name, a, 0, 1);
      if (a.positional.empty()) return 0.0;
      const auto& v = a.positional[0];
      if (v.is_string()) {
        auto d = parse_float(v.get_string());
        if (!d)
          raise(
              "ValueError", fmt::format("could not convert string to float: {}",
                                        value::repr(v)));
        return *d;
      }
      return value::to_double(v);
    }
    if (name == "bool") {
      arity(name, a, 0, 1);
      return !a.positional.empty() && value::truthy(a.positional[0]);
    }
    if (name == "list" || name == "tuple") {
      arity(name, a, 0, 1);
      if (a.positional.empty()) return json::array{};
      return value::iterate(a.positional[0]);
    }
    if (name == "dict") return to_dict(a);
    if (name == "sorted") {
      arity(name, a, 1, 1);
      if (keyword(a, "key")) raise("TypeError", "key functions are not supported");
      auto items = value::iterate(a.positional[0]);
      const auto* rev = keyword(a, "reverse");
      sort(items, rev && value::truthy(*rev));
      return items;
    }
    if (name == "sum") {
      arity(name, a, 1, 2);
      json::value acc = a.positional.size() > 1 ? a.positional[1] : json::value(0);
      if (const auto* s = keyword(a, "start")) acc = *s;
      if (acc.is_string())
        raise("TypeError", "sum() can't sum strings [use ''.join(seq) instead]");
      for (const auto& el : value::iterate(a.positional[0]))
        acc = value::arithmetic(binary_op::add, acc, el, limits_.max_collection);
      return acc;
    }
    if (name == "min" || name == "max") return extreme(name, a);
    if (name == "abs") {
      arity(name, a, 1, 1);
      const auto& v = a.positional[0];
      if (v.is_double()) return std::fabs(v.get_double());
      if (value::is_int(v)) {
        auto n = value::to_int(v);
        return n < 0 ? value::negate(json::value(n)) : json::value(n);
      }
      raise(
          "TypeError", fmt::format("bad operand type for abs(): '{}'",
                                   value::type_name(v)));
    }
    if (name == "round") return round(a);
    if (name == "enumerate") {
      arity(name, a, 1, 2);
      std::int64_t i = a.positional.size() > 1 ? value::to_int(a.positional[1]) : 0;
      if (const auto* s = keyword(a, "start")) i = value::to_int(*s);
      json::array out(sp_);
      for (auto& el : value::iterate(a.positional[0])) {
        json::array pair(sp_);
        pair.emplace_back(i++);
        pair.push_back(nest(std::move(el)));
        out.push_back(std::move(pair));
      }
      return out;
    }
    if (name == "zip") {
      std::vector<json::array> seqs;
      std::size_t n{std::numeric_limits<std::size_t>::max()};
      for (const auto& p : a.positional) {
        seqs.push_back(value::iterate(p));
        n = std::min(n, seqs.back().size());
      }
      json::array out(sp_);
      if (seqs.empty()) return out;
      for (std::size_t i = 0; i < n; ++i) {
        json::array row(sp_);
        for (auto& s : seqs) row.push_back(nest(s[i]));
        out.push_back(std::move(row));
      }
      return out;
    }
    if (name == "any" || name == "all") {
      arity(name, a, 1, 1);
      bool want = name == "any";
      for (const auto& el : value::iterate(a.positional[0]))
        if (value::truthy(el) == want) return want;
      return !want;
    }
    if (name == "reversed") {
      arity(name, a, 1, 1);
      auto items = value::iterate(a.positional[0]);
      std::reverse(items.begin(), items.end());
      return items;
    }
    raise("NameError", fmt::format("name '{}' is not defined", name));
  }

  json::value range(const call_args& a) {
    arity("range", a, 1, 3);
    std::int64_t start{0};
    std::int64_t stop{0};
    std::int64_t step{1};
    if (a.positional.size() == 1) {
      stop = value::to_int(a.positional[0]);
    } else {
      start = value::to_int(a.positional[0]);
      stop = value::to_int(a.positional[1]);
      if (a.positional.size() == 3) step = value::to_int(a.positional[2]);
    }
    if (step == 0) raise("ValueError", "range() arg 3 must not be zero");
    // Unsigned arithmetic: the span of two int64 bounds may not fit int64
    auto first = static_cast<std::uint64_t>(start);
    auto last = static_cast<std::uint64_t>(stop);
    auto stride = static_cast<std::uint64_t>(step);
    std::uint64_t count{0};
    if (step > 0 && start < stop)
      count = (last - first - 1) / stride + 1;
    else if (step < 0 && start > stop)
      count = (first - last - 1) / (0 - stride) + 1;
    if (count > limits_.max_collection)
      raise("MemoryError", "range() result too large");
    json::array out(sp_);
    out.reserve(static_cast<std::size_t>(count));
    for (std::uint64_t i = 0; i < count; ++i)
      out.push_back(static_cast<std::int64_t>(first + i * stride));
    return out;
  }

  json::value to_int(const call_args& a) {
    arity("int", a, 0, 2);
    if (a.positional.empty()) return 0;
    const auto& v = a.positional[0];
    int base{10};
    if (a.positional.size() > 1) base = static_cast<int>(value::to_int(a.positional[1]));
    if (const auto* b = keyword(a, "base")) base = static_cast<int>(value::to_int(*b));
    if (v.is_string()) {
      if (base < 2 || base > 36) raise("ValueError", "int() base must be >= 2 and <= 36");
      auto n = parse_int(v.get_string(), base);
      if (!n)
        raise(
            "ValueError",
            fmt::format("invalid literal for int() with base {}: {}", base,
                        value::repr(v)));
      return *n;
    }
    if (v.is_double()) {
      double d = std::trunc(v.get_double());
      if (std::isnan(d)) raise("ValueError", "cannot convert float NaN to integer");
      if (std::isinf(d))
        raise("OverflowError", "cannot convert float infinity to integer");
      if (d >= 9.2233720368547758e18 || d < -9.2233720368547758e18)
        raise("OverflowError", "int too large");
      return static_cast<std::int64_t>(d);
    }
    return value::to_int(v);
  }

  json::value to_dict(const call_args& a) {
    arity("dict", a, 0, 1);
    json::object out(sp_);
    if (!a.positional.empty()) {
      const auto& src = a.positional[0];
      if (src.is_object()) {
        out = src.get_object();
      } else {
        for (const auto& pair : value::iterate(src)) {
          auto kv = value::iterate(pair);
          if (kv.size() != 2)
            raise(
                "ValueError",
                fmt::format("dictionary update sequence element has length {}; "
                            "2 is required",
                            kv.size()));
          out[value::dict_key(kv[0])] = kv[1];
        }
      }
    }
    for (const auto& [k, v] : a.keywords) out[k] = nest(v);
    return out;
  }

  json::value extreme(const std::string& name, const call_args& a) {
    json::array items;
    if (a.positional.size() == 1) items = value::iterate(a.positional[0]);
    else for (const auto& p : a.positional) items.push_back(p);
    if (keyword(a, "key")) raise("TypeError", "key functions are not supported");
    if (items.empty()) {
      if (const auto* d = keyword(a, "default")) return *d;
      raise("ValueError", fmt::format("{}() arg is an empty sequence", name));
    }
    bool want_max = name == "max";
    std::size_t best{0};
    for (std::size_t i = 1; i < items.size(); ++i) {
      int c = value::compare(items[i], items[best], want_max ? ">" : "<");
      if (want_max ? c > 0 : c < 0) best = i;
    }
    return items[best];
  }

  json::value round(const call_args& a) {
    arity("round", a, 1, 2);
    const auto& v = a.positional[0];
    std::optional<std::int64_t> digits;
    if (a.positional.size() > 1 && !a.positional[1].is_null())
      digits = value::to_int(a.positional[1]);
    if (const auto* d = keyword(a, "ndigits"); d && !d->is_null())
      digits = value::to_int(*d);
    if (value::is_int(v)) return value::to_int(v);
    double x = value::to_double(v);
    if (!digits) {
      if (!std::isfinite(x)) raise("OverflowError", "cannot convert float to integer");
      double r = std::nearbyint(x);
      if (r >= 9.2233720368547758e18 || r < -9.2233720368547758e18)
        raise("OverflowError", "int too large");
      return static_cast<std::int64_t>(r);
    }
    double scale = std::pow(10.0, static_cast<double>(*digits));
    return std::nearbyint(x * scale) / scale;
  }

  static void sort(json::array& items, bool reverse) {
    std::stable_sort(
        items.begin(), items.end(),
        [reverse](const json::value& l, const json::value& r) {
          return reverse ? value::compare(r, l, "<") < 0
                         : value::compare(l, r, "<") < 0;
        });
  }

  /// json module

  json::value call_json(const std::string& fn, const call_args& a) {
    if (fn == "loads") {
      arity("loads", a, 1, 1);
      if (!a.positional[0].is_string())
        raise(
            "TypeError",
            fmt::format("the JSON object must be str, not {}",
                        value::type_name(a.positional[0])));
      boost::system::error_code ec;
      auto parsed = json::parse(a.positional[0].get_string(), ec, sp_);
      if (ec) raise("JSONDecodeError", ec.message());
      return parsed;
    }
    if (fn == "dumps") {
      arity("dumps", a, 1, 1);
      std::optional<int> indent;
      if (const auto* i = keyword(a, "indent"); i && !i->is_null())
        indent = static_cast<int>(std::clamp<std::int64_t>(value::to_int(*i), 0, 16));
      const auto* sk = keyword(a, "sort_keys");
      return json::string{
        value::dumps(a.positional[0], indent, sk && value::truthy(*sk))};
    }
    raise("AttributeError", fmt::format("module 'json' has no attribute '{}'", fn));
  }

  /// Methods

  json::value call_method(
      json::value& self, const std::string& name, const call_args& a) {
    if (self.is_string()) return string_method(std::string{self.get_string()}, name, a);
    if (self.is_array()) return list_method(self.as_array(), name, a);
    if (self.is_object()) return dict_method(self.as_object(), name, a);
    raise(
        "AttributeError", fmt::format("'{}' object has no attribute '{}'",
                                      value::type_name(self), name));
  }

  static std::string str_arg(
      const call_args& a, std::size_t i, std::string_view method) {
    const auto& v = a.positional[i];
    if (!v.is_string())
      raise(
          "TypeError", fmt::format("{}() argument must be str, not {}", method,
                                   value::type_name(v)));
    return std::string{v.get_string()};
  }

  json::value string_method(
      const std::string& s, const std::string& name, const call_args& a) {
    if (name == "split") return split(s, a);
    if (name == "strip" || name == "lstrip" || name == "rstrip") {
      arity(name, a, 0, 1);
      std::string chars{whitespace};
      if (!a.positional.empty() && !a.positional[0].is_null())
        chars = str_arg(a, 0, name);
      std::string_view v{s};
      if (name != "rstrip") {
        auto p = v.find_first_not_of(chars);
        v = p == std::string_view::npos ? std::string_view{} : v.substr(p);
      }
      if (name != "lstrip") {
        auto p = v.find_last_not_of(chars);
        v = p == std::string_view::npos ? std::string_view{} : v.substr(0, p + 1);
      }
      return json::string{v};
    }
    if (name == "join") {
      arity(name, a, 1, 1);
      std::string out;
      std::size_t i{0};
      for (const auto& el : value::iterate(a.positional[0])) {
        if (!el.is_string())
          raise(
              "TypeError",
              fmt::format("sequence item {}: expected str instance, {} found", i,
                          value::type_name(el)));
        if (i++ > 0) out += s;
        out += el.get_string();
        check_size(out.size());
      }
      return json::string{out};
    }
    if (name == "startswith" || name == "endswith") {
      arity(name, a, 1, 1);
      json::array candidates;
      if (a.positional[0].is_array()) candidates = a.positional[0].get_array();
      else candidates.push_back(a.positional[0]);
      for (const auto& c : candidates) {
        if (!c.is_string())
          raise("TypeError", fmt::format("{} arg must be str or a tuple of str", name));
        std::string_view needle = c.get_string();
        if (name == "startswith" ? s.starts_with(needle) : s.ends_with(needle))
          return true;
      }
      return false;
    }
    if (name == "lower" || name == "upper") {
      arity(name, a, 0, 0);
      std::string out{s};
      for (auto& c : out) {
        auto u = static_cast<unsigned char>(c);
        c = static_cast<char>(name == "lower" ? std::tolower(u) : std::toupper(u));
      }
      return json::string{out};
    }
    if (name == "replace") {
      arity(name, a, 2, 3);
      auto from = str_arg(a, 0, name);
      auto to = str_arg(a, 1, name);
      std::int64_t count = a.positional.size() > 2 ? value::to_int(a.positional[2]) : -1;
      return json::string{replace(s, from, to, count)};
    }
    if (name == "splitlines") {
      arity(name, a, 0, 0);
      json::array out;
      std::size_t start{0};
      for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\n' && s[i] != '\r') continue;
        out.emplace_back(json::string{std::string_view{s}.substr(start, i - start)});
        if (s[i] == '\r' && i + 1 < s.size() && s[i + 1] == '\n') ++i;
        start = i + 1;
      }
      if (start < s.size()) out.emplace_back(json::string{std::string_view{s}.substr(start)});
      return out;
    }
    if (name == "find") {
      arity(name, a, 1, 1);
      auto pos = s.find(str_arg(a, 0, name));
      if (pos == std::string::npos) return -1;
      return static_cast<std::int64_t>(code_point_count(std::string_view{s}.substr(0, pos)));
    }
    if (name == "count") {
      arity(name, a, 1, 1);
      auto needle = str_arg(a, 0, name);
      if (needle.empty()) return static_cast<std::int64_t>(code_point_count(s) + 1);
      std::int64_t n{0};
      for (auto pos = s.find(needle); pos != std::string::npos;
           pos = s.find(needle, pos + needle.size()))
        ++n;
      return n;
    }
    if (name == "isdigit" || name == "isalpha" || name == "isspace" ||
        name == "isalnum") {
      arity(name, a, 0, 0);
      if (s.empty()) return false;
      return std::all_of(s.begin(), s.end(), [&](char ch) {
        auto c = static_cast<unsigned char>(ch);
        if (name == "isdigit") return std::isdigit(c) != 0;
        if (name == "isalpha") return std::isalpha(c) != 0;
        if (name == "isspace") return std::isspace(c) != 0;
        return std::isalnum(c) != 0;
      });
    }
    raise("AttributeError", fmt::format("'str' object has no attribute '{}'", name));
  }

  json::value split(const std::string& s, const call_args& a) {
    arity("split", a, 0, 2);
    std::optional<std::string> sep;
    if (!a.positional.empty() && !a.positional[0].is_null()) sep = str_arg(a, 0, "split");
    if (const auto* k = keyword(a, "sep"); k && !k->is_null()) {
      if (!k->is_string()) raise("TypeError", "must be str or None");
      sep = std::string{k->get_string()};
    }
    std::int64_t maxsplit = a.positional.size() > 1 ? value::to_int(a.positional[1]) : -1;
    if (const auto* k = keyword(a, "maxsplit")) maxsplit = value::to_int(*k);

    json::array out;
    std::string_view rest{s};
    if (!sep) {
      for (;;) {
        auto p = rest.find_first_not_of(whitespace);
        if (p == std::string_view::npos) break;
        rest.remove_prefix(p);
        if (maxsplit >= 0 && static_cast<std::int64_t>(out.size()) == maxsplit) {
          auto end = rest.find_last_not_of(whitespace);
          out.emplace_back(json::string{rest.substr(0, end + 1)});
          break;
        }
        auto q = rest.find_first_of(whitespace);
        out.emplace_back(json::string{rest.substr(0, q)});
        if (q == std::string_view::npos) break;
        rest.remove_prefix(q);
      }
      return out;
    }
    if (sep->empty()) raise("ValueError", "empty separator");
    for (;;) {
      auto p = rest.find(*sep);
      if (p == std::string_view::npos ||
          (maxsplit >= 0 && static_cast<std::int64_t>(out.size()) == maxsplit)) {
        out.emplace_back(json::string{rest});
        break;
      }
      out.emplace_back(json::string{rest.substr(0, p)});
      rest.remove_prefix(p + sep->size());
    }
    return out;
  }

  std::string replace(
      const std::string& s, const std::string& from, const std::string& to,
      std::int64_t count) {
    std::string out;
    if (from.empty()) {
      // Insert between every character, as Python does
      std::int64_t done{0};
      for (const auto& ch : value::iterate(json::string{s})) {
        if (count < 0 || done < count) {
          out += to;
          ++done;
        }
        out += ch.get_string();
      }
      if (count < 0 || done < count) out += to;
      check_size(out.size());
      return out;
    }
    std::size_t pos{0};
    std::int64_t done{0};
    for (;;) {
      auto hit = s.find(from, pos);
      if (hit == std::string::npos || (count >= 0 && done >= count)) break;
      out.append(s, pos, hit - pos);
      out += to;
      check_size(out.size());
      pos = hit + from.size();
      ++done;
    }
    out.append(s, pos);
    return out;
  }

  json::value list_method(
      json::array& self, const std::string& name, const call_args& a) {
    if (name == "append") {
      arity(name, a, 1, 1);
      check_size(self.size() + 1);
      self.push_back(nest(a.positional[0]));
      return nullptr;
    }
    if (name == "extend") {
      arity(name, a, 1, 1);
      auto items = value::iterate(a.positional[0]);
      check_size(self.size() + items.size());
      for (const auto& el : items) check_nesting(el);
      for (auto& el : items) self.push_back(std::move(el));
      return nullptr;
    }
    if (name == "pop") {
      arity(name, a, 0, 1);
      if (self.empty()) raise("IndexError", "pop from empty list");
      std::int64_t i = a.positional.empty() ? -1 : value::to_int(a.positional[0]);
      if (i < 0) i += static_cast<std::int64_t>(self.size());
      if (i < 0 || i >= static_cast<std::int64_t>(self.size()))
        raise("IndexError", "pop index out of range");
      auto it = self.begin() + i;
      json::value out = *it;
      self.erase(it);
      return out;
    }
    if (name == "insert") {
      arity(name, a, 2, 2);
      check_size(self.size() + 1);
      auto n = static_cast<std::int64_t>(self.size());
      std::int64_t i = value::to_int(a.positional[0]);
      if (i < 0) i = std::max<std::int64_t>(0, i + n);
      i = std::min(i, n);
      self.insert(self.begin() + i, nest(a.positional[1]));
      return nullptr;
    }
    if (name == "index" || name == "remove") {
      arity(name, a, 1, 1);
      for (std::size_t i = 0; i < self.size(); ++i) {
        if (!value::equal(self[i], a.positional[0])) continue;
        if (name == "index") return static_cast<std::int64_t>(i);
        self.erase(self.begin() + static_cast<std::ptrdiff_t>(i));
        return nullptr;
      }
      raise(
          "ValueError", fmt::format("{} is not in list", value::repr(a.positional[0])));
    }
    if (name == "count") {
      arity(name, a, 1, 1);
      return static_cast<std::int64_t>(std::count_if(
          self.begin(), self.end(),
          [&](const json::value& el) { return value::equal(el, a.positional[0]); }));
    }
    if (name == "sort") {
      arity(name, a, 0, 0);
      if (keyword(a, "key")) raise("TypeError", "key functions are not supported");
      const auto* rev = keyword(a, "reverse");
      sort(self, rev && value::truthy(*rev));
      return nullptr;
    }
    if (name == "reverse") {
      arity(name, a, 0, 0);
      std::reverse(self.begin(), self.end());
      return nullptr;
    }
    if (name == "clear") {
      self.clear();
      return nullptr;
    }
    if (name == "copy") return self;
    raise("AttributeError", fmt::format("'list' object has no attribute '{}'", name));
  }

  json::value dict_method(
      json::object& self, const std::string& name, const call_args& a) {
    if (name == "get") {
      arity(name, a, 1, 2);
      if (const auto* v = self.if_contains(value::dict_key(a.positional[0]))) return *v;
      return a.positional.size() > 1 ? a.positional[1] : json::value{};
    }
    if (name == "keys") {
      json::array out(sp_);
      for (const auto& kv : self) out.emplace_back(json::string{kv.key()});
      return out;
    }
    if (name == "values") {
      json::array out(sp_);
      for (const auto& kv : self) out.push_back(kv.value());
      return out;
    }
    if (name == "items") {
      json::array out(sp_);
      for (const auto& kv : self) {
        json::array pair(sp_);
        pair.emplace_back(kv.key());
        pair.push_back(nest(kv.value()));
        out.push_back(std::move(pair));
      }
      return out;
    }
    if (name == "pop") {
      arity(name, a, 1, 2);
      auto key = value::dict_key(a.positional[0]);
      auto it = self.find(key);
      if (it == self.end()) {
        if (a.positional.size() > 1) return a.positional[1];
        raise("KeyError", value::repr(a.positional[0]));
      }
      json::value out = it->value();
      self.erase(it);
      return out;
    }
    if (name == "update") {
      arity(name, a, 0, 1);
      if (!a.positional.empty()) {
        auto other = to_dict(call_args{{a.positional[0]}, {}});
        for (const auto& kv : other.get_object()) self[kv.key()] = kv.value();
      }
      for (const auto& [k, v] : a.keywords) self[k] = nest(v);
      check_size(self.size());
      return nullptr;
    }
    if (name == "setdefault") {
      arity(name, a, 1, 2);
      auto key = value::dict_key(a.positional[0]);
      if (const auto* v = self.if_contains(key)) return *v;
      json::value fallback = a.positional.size() > 1 ? a.positional[1] : json::value{};
      check_size(self.size() + 1);
      self[key] = nest(fallback);
      return fallback;
    }
    if (name == "copy") return self;
    if (name == "clear") {
      self.clear();
      return nullptr;
    }
    raise("AttributeError", fmt::format("'dict' object has no attribute '{}'", name));
  }

  const external_functions& functions_;
  std::string& output_;
  const limits& limits_;
  cancel_token token_;
  clock::time_point deadline_;
  json::storage_ptr sp_;
  std::size_t steps_{0};
  int line_{0};
  std::map<std::string, json::value, std::less<>> vars_;
};

}  // namespace

/// call_args

const json::value* call_args::get(std::size_t index, std::string_view name) const {
  if (index < positional.size()) return &positional[index];
  for (const auto& [k, v] : keywords)
    if (k == name) return &v;
  return nullptr;
}

std::string call_args::string_arg(std::size_t index, std::string_view name) const {
  const auto* v = get(index, name);
  if (!v) raise("TypeError", fmt::format("missing required argument '{}'", name));
  if (!v->is_string())
    raise(
        "TypeError", fmt::format("argument '{}' must be str, not {}", name,
                                 value::type_name(*v)));
  return std::string{v->get_string()};
}

std::optional<std::string> call_args::optional_string(
    std::size_t index, std::string_view name) const {
  const auto* v = get(index, name);
  if (!v || v->is_null()) return std::nullopt;
  return string_arg(index, name);
}

std::int64_t call_args::int_arg(
    std::size_t index, std::string_view name, std::int64_t fallback) const {
  const auto* v = get(index, name);
  if (!v || v->is_null()) return fallback;
  return value::to_int(*v);
}

bool call_args::bool_arg(
    std::size_t index, std::string_view name, bool fallback) const {
  const auto* v = get(index, name);
  if (!v || v->is_null()) return fallback;
  return value::truthy(*v);
}

/// Entry points

void check(std::string_view code) {
  auto program = parse_program(dedent(code));
  validate(program);
}

void run(
    std::string_view code, const external_functions& functions,
    std::string& output, const limits& lim, cancel_token token) {
  auto program = parse_program(dedent(code));
  validate(program);
  interpreter{functions, output, lim, std::move(token)}.execute(program);
}

std::string run(
    std::string_view code, const external_functions& functions,
    const limits& lim, cancel_token token) {
  std::string output;
  run(code, functions, output, lim, std::move(token));
  return output;
}

}  // namespace tether::sandbox
