#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>


namespace tether {

namespace json = boost::json;

template <typename T>
json::value optional_to_json(const std::optional<T>& v) {
  if (!v) return nullptr;
  return json::value_from(*v);
}

/// Lenient accessors for JSON objects coming from peers

inline const json::value* find_value(
    const json::object& obj, std::string_view key) {
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : &it->value();
}

inline std::optional<std::string> get_string(
    const json::object& obj, std::string_view key) {
  if (auto* v = find_value(obj, key)) {
    if (auto* s = v->if_string()) return std::string{*s};
  }
  return std::nullopt;
}

inline std::optional<std::int64_t> get_int(
    const json::object& obj, std::string_view key) {
  if (auto* v = find_value(obj, key)) {
    if (auto* i = v->if_int64()) return *i;
    if (auto* u = v->if_uint64()) return static_cast<std::int64_t>(*u);
  }
  return std::nullopt;
}

inline const json::object* get_object(
    const json::object& obj, std::string_view key) {
  if (auto* v = find_value(obj, key)) return v->if_object();
  return nullptr;
}

inline const json::array* get_array(
    const json::object& obj, std::string_view key) {
  if (auto* v = find_value(obj, key)) return v->if_array();
  return nullptr;
}

}  // namespace tether
