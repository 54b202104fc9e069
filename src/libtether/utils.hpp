#pragma once

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace tether::utils {

template <typename Exception = std::runtime_error, typename... Args>
[[noreturn]] void throwf(
    fmt::format_string<Args...> format_str, Args&&... args) {
  throw Exception(fmt::format(format_str, std::forward<Args>(args)...));
}

inline std::string_view trim(std::string_view s) {
  constexpr std::string_view ws{" \t\r\n\f\v"};
  auto b = s.find_first_not_of(ws);
  if (b == std::string_view::npos) return {};
  auto e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

}  // namespace tether::utils
