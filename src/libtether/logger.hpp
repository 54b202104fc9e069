#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <format>
#include <mutex>
#include <print>
#include <source_location>
#include <string>
#include <string_view>

// Logs go to stderr: stdout may be carrying the stdio transport.

namespace tether::logger {

enum class level : uint8_t { fatal, error, warning, info, debug, trace };

inline std::string_view level_to_string(level level) {
  // clang-format off
  switch (level) {
  case level::trace:   return "TRACE";
  case level::debug:   return "DEBUG";
  case level::info:    return "INFO";
  case level::warning: return "WARNING";
  case level::error:   return "ERROR";
  case level::fatal:   return "FATAL";
  default: return "UNKNOWN";
  }
  // clang-format on
}

inline level global_level = level::info;  // NOLINT
inline void set_level(level level) { global_level = level; }
inline bool enabled(level level) { return level <= global_level; }

inline std::mutex& sink_mutex() {
  static std::mutex m;
  return m;
}

inline std::string get_current_timestamp() {
  using namespace std::chrono;

  auto now = system_clock::now();
  auto ymd = year_month_day{floor<days>(now)};
  auto hms = hh_mm_ss{floor<milliseconds>(now - floor<days>(now))};

  return std::format("{} {}", ymd, hms);
}

// Core logging function
template <typename... Args>
inline void log(
    level level, const std::source_location& location,
    std::format_string<Args...> fmt, Args&&... args) {
  if (!enabled(level)) return;

  auto line = std::format(
      "{} {}:{} {}: {}", get_current_timestamp(),
      std::filesystem::path{location.file_name()}.filename().string(),
      location.line(), level_to_string(level),
      std::format(fmt, std::forward<Args>(args)...));

  std::lock_guard lock{sink_mutex()};
  std::println(stderr, "{}", line);
}

}  // namespace tether::logger

// NOLINTBEGIN
#define LOG_TRACE(...)                                               \
  tether::logger::log(                                               \
      tether::logger::level::trace, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_DEBUG(...)                                               \
  tether::logger::log(                                               \
      tether::logger::level::debug, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_INFO(...)                                               \
  tether::logger::log(                                              \
      tether::logger::level::info, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_WARN(...)                                                  \
  tether::logger::log(                                                 \
      tether::logger::level::warning, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_ERROR(...)                                               \
  tether::logger::log(                                               \
      tether::logger::level::error, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_FATAL(...)                                               \
  tether::logger::log(                                               \
      tether::logger::level::fatal, std::source_location::current(), \
      __VA_ARGS__)
// NOLINTEND
