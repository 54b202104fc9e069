#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "sandbox_ast.hpp"

/// Python-flavoured semantics over boost::json values.  Lists and tuples
/// are both arrays; dict keys are strings.
namespace tether::sandbox::value {

namespace json = boost::json;

/// Throw code_execution_error as "Type: message", the form except
/// clauses match against.
[[noreturn]] void raise(std::string_view type, std::string_view message);

std::string_view type_name(const json::value& v);

bool is_number(const json::value& v);
bool is_int(const json::value& v);

/// Integer value of an int or bool; TypeError otherwise.
std::int64_t to_int(const json::value& v, std::string_view what = "integer");
double to_double(const json::value& v);

bool truthy(const json::value& v);

/// str() and repr()
std::string str(const json::value& v);
std::string repr(const json::value& v);

bool equal(const json::value& a, const json::value& b);

/// -1, 0 or 1.  TypeError for unorderable operands.
int compare(const json::value& a, const json::value& b, std::string_view op);

/// The "in" operator
bool contains(const json::value& container, const json::value& item);

json::value arithmetic(
    binary_op op, const json::value& a, const json::value& b,
    std::size_t max_collection);

json::value negate(const json::value& v);

/// Nesting depth: 0 for scalars, 1 for a flat list or dict.  Stops
/// descending past @p cap, so the result is at most cap + 1.
std::size_t depth(const json::value& v, std::size_t cap);

/// len(); strings count code points
std::size_t length(const json::value& v);

/// Elements produced by iterating @p v: list items, characters of a
/// string, keys of a dict.  TypeError otherwise.
json::array iterate(const json::value& v);

/// obj[key] for str, list and dict
json::value index(const json::value& obj, const json::value& key);

/// Resolve a possibly negative index; IndexError when out of range.
std::size_t normalize_index(std::int64_t i, std::size_t size);

json::value slice(
    const json::value& obj, std::optional<std::int64_t> lower,
    std::optional<std::int64_t> upper, std::optional<std::int64_t> step);

/// Key under which @p key is stored in a dict
std::string dict_key(const json::value& key);

/// json.dumps with Python's default separators
std::string dumps(
    const json::value& v, std::optional<int> indent = std::nullopt,
    bool sort_keys = false);

/// format(v, spec) for the format mini-language used in f-strings
std::string format(const json::value& v, std::string_view spec);

}  // namespace tether::sandbox::value
