#include "sandbox_value.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <vector>

#include "tether/sandbox.hpp"

namespace tether::sandbox::value {

namespace {

std::size_t sequence_length(unsigned char lead) {
  if (lead < 0x80) return 1;
  if ((lead >> 5) == 0x6) return 2;
  if ((lead >> 4) == 0xE) return 3;
  if ((lead >> 3) == 0x1E) return 4;
  return 1;
}

std::vector<std::string_view> code_points(std::string_view s) {
  std::vector<std::string_view> out;
  for (std::size_t i = 0; i < s.size();) {
    auto n = std::min(sequence_length(static_cast<unsigned char>(s[i])),
                      s.size() - i);
    out.push_back(s.substr(i, n));
    i += n;
  }
  return out;
}

std::size_t display_width(std::string_view s) {
  std::size_t n{0};
  for (unsigned char c : s)
    if ((c & 0xC0) != 0x80) ++n;
  return n;
}

std::string float_repr(double d) {
  if (std::isnan(d)) return "nan";
  if (std::isinf(d)) return d > 0 ? "inf" : "-inf";
  auto s = fmt::format("{}", d);
  if (s.find_first_of(".en") == std::string::npos) s += ".0";
  return s;
}

std::string quote(std::string_view s) {
  char q = s.find('\'') != std::string_view::npos &&
                   s.find('"') == std::string_view::npos
               ? '"'
               : '\'';
  std::string out(1, q);
  for (char ch : s) {
    auto c = static_cast<unsigned char>(ch);
    if (ch == q || ch == '\\') {
      out += '\\';
      out += ch;
    } else if (ch == '\n') {
      out += "\\n";
    } else if (ch == '\r') {
      out += "\\r";
    } else if (ch == '\t') {
      out += "\\t";
    } else if (c < 0x20 || c == 0x7F) {
      out += fmt::format("\\x{:02x}", c);
    } else {
      out += ch;
    }
  }
  out += q;
  return out;
}

std::string json_quote(std::string_view s) {
  std::string out{"\""};
  for (char ch : s) {
    auto c = static_cast<unsigned char>(ch);
    switch (ch) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      default:
        if (c < 0x20) out += fmt::format("\\u{:04x}", c);
        else out += ch;
    }
  }
  out += '"';
  return out;
}

std::string_view op_symbol(binary_op op) {
  switch (op) {
    case binary_op::add: return "+";
    case binary_op::sub: return "-";
    case binary_op::mul: return "*";
    case binary_op::div: return "/";
    case binary_op::floor_div: return "//";
    case binary_op::mod: return "%";
    case binary_op::pow: return "** or pow()";
  }
  return "?";
}

[[noreturn]] void unsupported(
    binary_op op, const json::value& a, const json::value& b) {
  raise(
      "TypeError", fmt::format(
                       "unsupported operand type(s) for {}: '{}' and '{}'",
                       op_symbol(op), type_name(a), type_name(b)));
}

[[noreturn]] void int_overflow() {
  raise("OverflowError", "integer result out of range");
}

json::value int_arithmetic(binary_op op, std::int64_t a, std::int64_t b) {
  std::int64_t r{0};
  switch (op) {
    case binary_op::add:
      if (__builtin_add_overflow(a, b, &r)) int_overflow();
      return r;
    case binary_op::sub:
      if (__builtin_sub_overflow(a, b, &r)) int_overflow();
      return r;
    case binary_op::mul:
      if (__builtin_mul_overflow(a, b, &r)) int_overflow();
      return r;
    case binary_op::div:
      if (b == 0) raise("ZeroDivisionError", "division by zero");
      return static_cast<double>(a) / static_cast<double>(b);
    case binary_op::floor_div: {
      if (b == 0)
        raise("ZeroDivisionError", "integer division or modulo by zero");
      if (a == std::numeric_limits<std::int64_t>::min() && b == -1)
        int_overflow();
      std::int64_t q = a / b;
      if (a % b != 0 && ((a < 0) != (b < 0))) --q;
      return q;
    }
    case binary_op::mod: {
      if (b == 0)
        raise("ZeroDivisionError", "integer division or modulo by zero");
      if (b == -1) return std::int64_t{0};
      r = a % b;
      if (r != 0 && ((r < 0) != (b < 0))) r += b;
      return r;
    }
    case binary_op::pow: {
      if (b < 0) {
        if (a == 0)
          raise("ZeroDivisionError", "0.0 cannot be raised to a negative power");
        return std::pow(static_cast<double>(a), static_cast<double>(b));
      }
      std::int64_t result{1};
      std::int64_t base{a};
      while (b > 0) {
        if (b & 1) {
          if (__builtin_mul_overflow(result, base, &result)) int_overflow();
        }
        b >>= 1;
        if (b > 0 && __builtin_mul_overflow(base, base, &base)) int_overflow();
      }
      return result;
    }
  }
  return nullptr;
}

json::value float_arithmetic(binary_op op, double a, double b) {
  switch (op) {
    case binary_op::add: return a + b;
    case binary_op::sub: return a - b;
    case binary_op::mul: return a * b;
    case binary_op::div:
      if (b == 0.0) raise("ZeroDivisionError", "float division by zero");
      return a / b;
    case binary_op::floor_div:
      if (b == 0.0) raise("ZeroDivisionError", "float floor division by zero");
      return std::floor(a / b);
    case binary_op::mod: {
      if (b == 0.0) raise("ZeroDivisionError", "float modulo");
      double r = std::fmod(a, b);
      if (r != 0.0 && ((r < 0) != (b < 0))) r += b;
      return r;
    }
    case binary_op::pow: {
      if (a == 0.0 && b < 0)
        raise("ZeroDivisionError", "0.0 cannot be raised to a negative power");
      double r = std::pow(a, b);
      if (std::isinf(r) && !std::isinf(a) && !std::isinf(b))
        raise("OverflowError", "(34, 'Numerical result out of range')");
      if (std::isnan(r) && !std::isnan(a) && !std::isnan(b))
        raise("ValueError", "math domain error");
      return r;
    }
  }
  return nullptr;
}

json::value repeat(
    const json::value& seq, std::int64_t n, std::size_t max_collection) {
  if (seq.is_string()) {
    std::string_view s = seq.get_string();
    if (n <= 0 || s.empty()) return json::string{};
    if (static_cast<std::uint64_t>(n) > max_collection / s.size())
      raise("MemoryError", "repetition result too large");
    json::string out;
    out.reserve(s.size() * static_cast<std::size_t>(n));
    for (std::int64_t i = 0; i < n; ++i) out.append(s);
    return out;
  }
  const auto& arr = seq.get_array();
  if (n <= 0 || arr.empty()) return json::array(arr.storage());
  if (static_cast<std::uint64_t>(n) > max_collection / arr.size())
    raise("MemoryError", "repetition result too large");
  json::array out(arr.storage());
  out.reserve(arr.size() * static_cast<std::size_t>(n));
  for (std::int64_t i = 0; i < n; ++i)
    for (const auto& el : arr) out.push_back(el);
  return out;
}

void dump(
    std::string& out, const json::value& v, std::optional<int> indent,
    bool sort_keys, int level) {
  auto newline = [&](int depth) {
    out += '\n';
    out.append(static_cast<std::size_t>(*indent * depth), ' ');
  };
  switch (v.kind()) {
    case json::kind::null: out += "null"; return;
    case json::kind::bool_: out += v.get_bool() ? "true" : "false"; return;
    case json::kind::int64: out += fmt::format("{}", v.get_int64()); return;
    case json::kind::uint64: out += fmt::format("{}", v.get_uint64()); return;
    case json::kind::double_: {
      double d = v.get_double();
      if (std::isnan(d)) out += "NaN";
      else if (std::isinf(d)) out += d > 0 ? "Infinity" : "-Infinity";
      else out += float_repr(d);
      return;
    }
    case json::kind::string: out += json_quote(v.get_string()); return;
    case json::kind::array: {
      const auto& arr = v.get_array();
      if (arr.empty()) {
        out += "[]";
        return;
      }
      out += '[';
      bool first{true};
      for (const auto& el : arr) {
        if (!first) out += indent ? "," : ", ";
        first = false;
        if (indent) newline(level + 1);
        dump(out, el, indent, sort_keys, level + 1);
      }
      if (indent) newline(level);
      out += ']';
      return;
    }
    case json::kind::object: {
      const auto& obj = v.get_object();
      if (obj.empty()) {
        out += "{}";
        return;
      }
      std::vector<const json::key_value_pair*> entries;
      for (const auto& kv : obj) entries.push_back(&kv);
      if (sort_keys)
        std::sort(entries.begin(), entries.end(), [](auto* l, auto* r) {
          return l->key() < r->key();
        });
      out += '{';
      bool first{true};
      for (const auto* kv : entries) {
        if (!first) out += indent ? "," : ", ";
        first = false;
        if (indent) newline(level + 1);
        out += json_quote(kv->key());
        out += ": ";
        dump(out, kv->value(), indent, sort_keys, level + 1);
      }
      if (indent) newline(level);
      out += '}';
      return;
    }
  }
}

/// [[fill]align][sign][#][0][width][,|_][.precision][type]
struct format_spec {
  char fill{' '};
  char align{0};
  char sign{0};
  bool alternate{false};
  bool zero{false};
  std::size_t width{0};
  char grouping{0};
  std::optional<int> precision;
  char type{0};
};

format_spec parse_spec(std::string_view s) {
  auto is_align = [](char c) {
    return c == '<' || c == '>' || c == '^' || c == '=';
  };
  auto invalid = [&] {
    raise("ValueError", fmt::format("Invalid format specifier '{}'", s));
  };
  format_spec spec;
  std::size_t i{0};
  if (s.size() >= 2 && is_align(s[1])) {
    spec.fill = s[0];
    spec.align = s[1];
    i = 2;
  } else if (!s.empty() && is_align(s[0])) {
    spec.align = s[0];
    i = 1;
  }
  if (i < s.size() && (s[i] == '+' || s[i] == '-' || s[i] == ' '))
    spec.sign = s[i++];
  if (i < s.size() && s[i] == '#') {
    spec.alternate = true;
    ++i;
  }
  if (i < s.size() && s[i] == '0') {
    spec.zero = true;
    ++i;
  }
  while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
    spec.width = spec.width * 10 + static_cast<std::size_t>(s[i] - '0');
    if (spec.width > 10'000) invalid();
    ++i;
  }
  if (i < s.size() && (s[i] == ',' || s[i] == '_')) spec.grouping = s[i++];
  if (i < s.size() && s[i] == '.') {
    ++i;
    int p{0};
    bool any{false};
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
      p = p * 10 + (s[i] - '0');
      if (p > 1000) invalid();
      any = true;
      ++i;
    }
    if (!any) invalid();
    spec.precision = p;
  }
  if (i < s.size()) spec.type = s[i++];
  if (i != s.size()) invalid();
  return spec;
}

void group_digits(std::string& body, char sep) {
  auto start = body.find_first_of("0123456789");
  if (start == std::string::npos) return;
  auto end = body.find_first_not_of("0123456789", start);
  if (end == std::string::npos) end = body.size();
  std::string digits = body.substr(start, end - start);
  std::string grouped;
  for (std::size_t i = 0; i < digits.size(); ++i) {
    if (i > 0 && (digits.size() - i) % 3 == 0) grouped += sep;
    grouped += digits[i];
  }
  body.replace(start, end - start, grouped);
}

std::string pad(std::string body, const format_spec& spec, bool numeric) {
  char fill = spec.fill;
  char align = spec.align;
  if (!align) {
    if (numeric && spec.zero) {
      fill = '0';
      align = '=';
    } else {
      align = numeric ? '>' : '<';
    }
  }
  auto n = display_width(body);
  if (spec.width <= n) return body;
  std::size_t gap = spec.width - n;
  switch (align) {
    case '<': return body + std::string(gap, fill);
    case '^': {
      std::size_t left = gap / 2;
      return std::string(left, fill) + body + std::string(gap - left, fill);
    }
    case '=': {
      std::size_t prefix{0};
      if (!body.empty() && (body[0] == '+' || body[0] == '-' || body[0] == ' '))
        prefix = 1;
      if (body.size() >= prefix + 2 && body[prefix] == '0' &&
          std::isalpha(static_cast<unsigned char>(body[prefix + 1])))
        prefix += 2;
      return body.substr(0, prefix) + std::string(gap, fill) +
             body.substr(prefix);
    }
    default: return std::string(gap, fill) + body;
  }
}

std::string format_float(double d, const format_spec& spec) {
  std::string body;
  if (!spec.type && !spec.precision) {
    body = float_repr(d);
    if (spec.sign == '+' && !std::signbit(d)) body.insert(0, 1, '+');
    if (spec.sign == ' ' && !std::signbit(d)) body.insert(0, 1, ' ');
  } else {
    char type = spec.type ? spec.type : 'g';
    bool percent = type == '%';
    if (percent) {
      d *= 100.0;
      type = 'f';
    }
    if (std::string_view{"eEfFgG"}.find(type) == std::string_view::npos)
      raise(
          "ValueError",
          fmt::format("Unknown format code '{}' for object of type 'float'",
                      type));
    std::string core{"{:"};
    if (spec.sign) core += spec.sign;
    if (spec.alternate) core += '#';
    if (spec.precision) core += fmt::format(".{}", *spec.precision);
    core += type;
    core += '}';
    try {
      body = fmt::format(fmt::runtime(core), d);
    } catch (const fmt::format_error& e) {
      raise("ValueError", e.what());
    }
    if (percent) body += '%';
  }
  if (spec.grouping) group_digits(body, spec.grouping);
  return pad(std::move(body), spec, true);
}

std::string format_int(std::int64_t n, const format_spec& spec) {
  if (spec.precision)
    raise("ValueError", "Precision not allowed in integer format specifier");
  char type = spec.type ? spec.type : 'd';
  if (std::string_view{"dxXobc"}.find(type) == std::string_view::npos)
    raise(
        "ValueError",
        fmt::format("Unknown format code '{}' for object of type 'int'", type));
  std::string core{"{:"};
  if (spec.sign) core += spec.sign;
  if (spec.alternate) core += '#';
  core += type;
  core += '}';
  std::string body;
  try {
    body = fmt::format(fmt::runtime(core), n);
  } catch (const fmt::format_error& e) {
    raise("ValueError", e.what());
  }
  if (spec.grouping && type == 'd') group_digits(body, spec.grouping);
  return pad(std::move(body), spec, true);
}

}  // namespace

void raise(std::string_view type, std::string_view message) {
  throw code_execution_error{fmt::format("{}: {}", type, message)};
}

std::string_view type_name(const json::value& v) {
  switch (v.kind()) {
    case json::kind::null: return "NoneType";
    case json::kind::bool_: return "bool";
    case json::kind::int64:
    case json::kind::uint64: return "int";
    case json::kind::double_: return "float";
    case json::kind::string: return "str";
    case json::kind::array: return "list";
    case json::kind::object: return "dict";
  }
  return "object";
}

bool is_number(const json::value& v) {
  return v.is_int64() || v.is_uint64() || v.is_double() || v.is_bool();
}

bool is_int(const json::value& v) {
  return v.is_int64() || v.is_uint64() || v.is_bool();
}

std::int64_t to_int(const json::value& v, std::string_view what) {
  if (v.is_int64()) return v.get_int64();
  if (v.is_bool()) return v.get_bool() ? 1 : 0;
  if (v.is_uint64()) {
    if (v.get_uint64() >
        static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
      int_overflow();
    return static_cast<std::int64_t>(v.get_uint64());
  }
  raise(
      "TypeError",
      fmt::format("'{}' object cannot be interpreted as an {}", type_name(v),
                  what));
}

double to_double(const json::value& v) {
  if (v.is_double()) return v.get_double();
  if (v.is_uint64()) return static_cast<double>(v.get_uint64());
  if (is_int(v)) return static_cast<double>(to_int(v));
  raise("TypeError", fmt::format("must be real number, not {}", type_name(v)));
}

bool truthy(const json::value& v) {
  switch (v.kind()) {
    case json::kind::null: return false;
    case json::kind::bool_: return v.get_bool();
    case json::kind::int64: return v.get_int64() != 0;
    case json::kind::uint64: return v.get_uint64() != 0;
    case json::kind::double_: return v.get_double() != 0.0;
    case json::kind::string: return !v.get_string().empty();
    case json::kind::array: return !v.get_array().empty();
    case json::kind::object: return !v.get_object().empty();
  }
  return false;
}

std::string str(const json::value& v) {
  if (v.is_string()) return std::string{v.get_string()};
  return repr(v);
}

std::string repr(const json::value& v) {
  switch (v.kind()) {
    case json::kind::null: return "None";
    case json::kind::bool_: return v.get_bool() ? "True" : "False";
    case json::kind::int64: return fmt::format("{}", v.get_int64());
    case json::kind::uint64: return fmt::format("{}", v.get_uint64());
    case json::kind::double_: return float_repr(v.get_double());
    case json::kind::string: return quote(v.get_string());
    case json::kind::array: {
      std::string out{"["};
      bool first{true};
      for (const auto& el : v.get_array()) {
        if (!first) out += ", ";
        first = false;
        out += repr(el);
      }
      return out + "]";
    }
    case json::kind::object: {
      std::string out{"{"};
      bool first{true};
      for (const auto& kv : v.get_object()) {
        if (!first) out += ", ";
        first = false;
        out += quote(kv.key());
        out += ": ";
        out += repr(kv.value());
      }
      return out + "}";
    }
  }
  return {};
}

bool equal(const json::value& a, const json::value& b) {
  if (is_number(a) && is_number(b)) {
    if (is_int(a) && is_int(b)) {
      if (a.is_uint64() || b.is_uint64()) {
        auto as_unsigned = [](const json::value& v) -> std::optional<std::uint64_t> {
          if (v.is_uint64()) return v.get_uint64();
          auto n = v.is_bool() ? std::int64_t{v.get_bool()} : v.get_int64();
          if (n < 0) return std::nullopt;
          return static_cast<std::uint64_t>(n);
        };
        auto x = as_unsigned(a);
        auto y = as_unsigned(b);
        return x && y && *x == *y;
      }
      return to_int(a) == to_int(b);
    }
    return to_double(a) == to_double(b);
  }
  if (a.kind() != b.kind()) return false;
  switch (a.kind()) {
    case json::kind::null: return true;
    case json::kind::string: return a.get_string() == b.get_string();
    case json::kind::array: {
      const auto& x = a.get_array();
      const auto& y = b.get_array();
      if (x.size() != y.size()) return false;
      for (std::size_t i = 0; i < x.size(); ++i)
        if (!equal(x[i], y[i])) return false;
      return true;
    }
    case json::kind::object: {
      const auto& x = a.get_object();
      const auto& y = b.get_object();
      if (x.size() != y.size()) return false;
      for (const auto& kv : x) {
        const auto* other = y.if_contains(kv.key());
        if (!other || !equal(kv.value(), *other)) return false;
      }
      return true;
    }
    default: return false;
  }
}

int compare(const json::value& a, const json::value& b, std::string_view op) {
  if (is_number(a) && is_number(b)) {
    if (is_int(a) && is_int(b) && !a.is_uint64() && !b.is_uint64()) {
      auto x = to_int(a);
      auto y = to_int(b);
      return x < y ? -1 : x > y ? 1 : 0;
    }
    double x = to_double(a);
    double y = to_double(b);
    return x < y ? -1 : x > y ? 1 : 0;
  }
  if (a.is_string() && b.is_string()) {
    std::string_view x = a.get_string();
    std::string_view y = b.get_string();
    auto c = x.compare(y);
    return c < 0 ? -1 : c > 0 ? 1 : 0;
  }
  if (a.is_array() && b.is_array()) {
    const auto& x = a.get_array();
    const auto& y = b.get_array();
    for (std::size_t i = 0; i < x.size() && i < y.size(); ++i) {
      if (equal(x[i], y[i])) continue;
      return compare(x[i], y[i], op);
    }
    return x.size() < y.size() ? -1 : x.size() > y.size() ? 1 : 0;
  }
  raise(
      "TypeError",
      fmt::format("'{}' not supported between instances of '{}' and '{}'", op,
                  type_name(a), type_name(b)));
}

bool contains(const json::value& container, const json::value& item) {
  switch (container.kind()) {
    case json::kind::string: {
      if (!item.is_string())
        raise(
            "TypeError",
            fmt::format("'in <string>' requires string as left operand, not {}",
                        type_name(item)));
      std::string_view hay = container.get_string();
      return hay.find(std::string_view{item.get_string()}) !=
             std::string_view::npos;
    }
    case json::kind::array:
      return std::any_of(
          container.get_array().begin(), container.get_array().end(),
          [&](const json::value& el) { return equal(el, item); });
    case json::kind::object:
      return container.get_object().contains(dict_key(item));
    default:
      raise(
          "TypeError", fmt::format("argument of type '{}' is not iterable",
                                   type_name(container)));
  }
}

json::value arithmetic(
    binary_op op, const json::value& a, const json::value& b,
    std::size_t max_collection) {
  if (is_number(a) && is_number(b)) {
    if (is_int(a) && is_int(b)) return int_arithmetic(op, to_int(a), to_int(b));
    return float_arithmetic(op, to_double(a), to_double(b));
  }
  if (op == binary_op::add) {
    if (a.is_string() && b.is_string()) {
      json::string out{a.get_string()};
      out.append(b.get_string());
      if (out.size() > max_collection)
        raise("MemoryError", "string result too large");
      return out;
    }
    if (a.is_array() && b.is_array()) {
      if (a.get_array().size() + b.get_array().size() > max_collection)
        raise("MemoryError", "list result too large");
      json::array out(a.get_array(), a.storage());
      for (const auto& el : b.get_array()) out.push_back(el);
      return out;
    }
    if (a.is_string() && !b.is_string())
      raise(
          "TypeError", fmt::format("can only concatenate str (not \"{}\") to str",
                                   type_name(b)));
    if (a.is_array() && !b.is_array())
      raise(
          "TypeError",
          fmt::format("can only concatenate list (not \"{}\") to list",
                      type_name(b)));
  }
  if (op == binary_op::mul) {
    if ((a.is_string() || a.is_array()) && is_int(b))
      return repeat(a, to_int(b), max_collection);
    if (is_int(a) && (b.is_string() || b.is_array()))
      return repeat(b, to_int(a), max_collection);
  }
  if (op == binary_op::mod && a.is_string())
    raise("TypeError", "printf-style formatting is not supported, use f-strings");
  unsupported(op, a, b);
}

json::value negate(const json::value& v) {
  if (v.is_double()) return -v.get_double();
  if (is_int(v)) {
    auto n = to_int(v);
    if (n == std::numeric_limits<std::int64_t>::min()) int_overflow();
    return -n;
  }
  raise(
      "TypeError",
      fmt::format("bad operand type for unary -: '{}'", type_name(v)));
}

std::size_t depth(const json::value& v, std::size_t cap) {
  std::size_t deepest{0};
  if (v.is_array()) {
    if (cap == 0) return 1;
    for (const auto& el : v.get_array())
      deepest = std::max(deepest, depth(el, cap - 1));
    return deepest + 1;
  }
  if (v.is_object()) {
    if (cap == 0) return 1;
    for (const auto& kv : v.get_object())
      deepest = std::max(deepest, depth(kv.value(), cap - 1));
    return deepest + 1;
  }
  return 0;
}

std::size_t length(const json::value& v) {
  switch (v.kind()) {
    case json::kind::string: return display_width(v.get_string());
    case json::kind::array: return v.get_array().size();
    case json::kind::object: return v.get_object().size();
    default:
      raise(
          "TypeError",
          fmt::format("object of type '{}' has no len()", type_name(v)));
  }
}

json::array iterate(const json::value& v) {
  switch (v.kind()) {
    case json::kind::array: return json::array(v.get_array(), v.storage());
    case json::kind::string: {
      json::array out(v.storage());
      for (auto cp : code_points(v.get_string())) out.emplace_back(json::string{cp});
      return out;
    }
    case json::kind::object: {
      json::array out(v.storage());
      for (const auto& kv : v.get_object()) out.emplace_back(json::string{kv.key()});
      return out;
    }
    default:
      raise(
          "TypeError",
          fmt::format("'{}' object is not iterable", type_name(v)));
  }
}

std::size_t normalize_index(std::int64_t i, std::size_t size) {
  auto n = static_cast<std::int64_t>(size);
  if (i < 0) i += n;
  if (i < 0 || i >= n) raise("IndexError", "index out of range");
  return static_cast<std::size_t>(i);
}

json::value index(const json::value& obj, const json::value& key) {
  switch (obj.kind()) {
    case json::kind::array: {
      if (!is_int(key))
        raise(
            "TypeError",
            fmt::format("list indices must be integers or slices, not {}",
                        type_name(key)));
      const auto& arr = obj.get_array();
      auto i = to_int(key) + (to_int(key) < 0 ? static_cast<std::int64_t>(arr.size()) : 0);
      if (i < 0 || i >= static_cast<std::int64_t>(arr.size()))
        raise("IndexError", "list index out of range");
      return arr[static_cast<std::size_t>(i)];
    }
    case json::kind::string: {
      if (!is_int(key))
        raise(
            "TypeError",
            fmt::format("string indices must be integers, not '{}'",
                        type_name(key)));
      auto cps = code_points(obj.get_string());
      auto i = to_int(key) + (to_int(key) < 0 ? static_cast<std::int64_t>(cps.size()) : 0);
      if (i < 0 || i >= static_cast<std::int64_t>(cps.size()))
        raise("IndexError", "string index out of range");
      return json::string{cps[static_cast<std::size_t>(i)]};
    }
    case json::kind::object: {
      const auto* found = obj.get_object().if_contains(dict_key(key));
      if (!found) raise("KeyError", repr(key));
      return *found;
    }
    default:
      raise(
          "TypeError",
          fmt::format("'{}' object is not subscriptable", type_name(obj)));
  }
}

json::value slice(
    const json::value& obj, std::optional<std::int64_t> lower,
    std::optional<std::int64_t> upper, std::optional<std::int64_t> step) {
  std::int64_t st = step.value_or(1);
  if (st == 0) raise("ValueError", "slice step cannot be zero");

  std::vector<std::string_view> cps;
  std::int64_t len{0};
  if (obj.is_string()) {
    cps = code_points(obj.get_string());
    len = static_cast<std::int64_t>(cps.size());
  } else if (obj.is_array()) {
    len = static_cast<std::int64_t>(obj.get_array().size());
  } else {
    raise(
        "TypeError",
        fmt::format("'{}' object is not subscriptable", type_name(obj)));
  }

  auto adjust = [&](std::optional<std::int64_t> v, std::int64_t fallback) {
    if (!v) return fallback;
    std::int64_t x = *v;
    if (x < 0) {
      x += len;
      if (x < 0) x = st < 0 ? -1 : 0;
    } else if (x >= len) {
      x = st < 0 ? len - 1 : len;
    }
    return x;
  };
  std::int64_t start = adjust(lower, st > 0 ? 0 : len - 1);
  std::int64_t stop = adjust(upper, st > 0 ? len : -1);

  if (obj.is_string()) {
    json::string out;
    for (std::int64_t i = start; st > 0 ? i < stop : i > stop; i += st)
      out.append(cps[static_cast<std::size_t>(i)]);
    return out;
  }
  const auto& arr = obj.get_array();
  json::array out(obj.storage());
  for (std::int64_t i = start; st > 0 ? i < stop : i > stop; i += st)
    out.push_back(arr[static_cast<std::size_t>(i)]);
  return out;
}

std::string dict_key(const json::value& key) {
  if (key.is_array() || key.is_object())
    raise("TypeError", fmt::format("unhashable type: '{}'", type_name(key)));
  return str(key);
}

std::string dumps(
    const json::value& v, std::optional<int> indent, bool sort_keys) {
  std::string out;
  dump(out, v, indent, sort_keys, 0);
  return out;
}

std::string format(const json::value& v, std::string_view spec_text) {
  if (spec_text.empty()) return str(v);
  auto spec = parse_spec(spec_text);

  if (v.is_string()) {
    if (spec.type && spec.type != 's')
      raise(
          "ValueError",
          fmt::format("Unknown format code '{}' for object of type 'str'",
                      spec.type));
    if (spec.sign) raise("ValueError", "Sign not allowed in string format specifier");
    std::string body{v.get_string()};
    if (spec.precision) {
      auto cps = code_points(body);
      if (cps.size() > static_cast<std::size_t>(*spec.precision)) {
        std::string cut;
        for (int i = 0; i < *spec.precision; ++i) cut.append(cps[static_cast<std::size_t>(i)]);
        body = std::move(cut);
      }
    }
    return pad(std::move(body), spec, false);
  }
  if (v.is_double()) return format_float(v.get_double(), spec);
  if (is_int(v)) {
    if (spec.type && std::string_view{"eEfFgG%"}.find(spec.type) !=
                         std::string_view::npos)
      return format_float(to_double(v), spec);
    return format_int(to_int(v), spec);
  }
  raise(
      "TypeError",
      fmt::format("unsupported format string passed to {}.__format__",
                  type_name(v)));
}

}  // namespace tether::sandbox::value
