// Copyright (c) MMK Team.
// Licensed under the MIT License.

#pragma once

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

namespace mmk {

enum class LogLevel {  // NOLINT
  kInfo = 0,
  kWarn = 1,
  kError = 2,
  kFatal = 3,
  kAssert = 4,
};

// "info", "warn", "error", "fatal", "assert"
std::optional<LogLevel> str2LogLevel(const std::string& str);

class Logger {
 public:
  static LogLevel& level() { return level_; }

 private:
  static LogLevel level_;
};

#define MMK_INFO(...)                                                        \
  if (mmk::Logger::level() <= mmk::LogLevel::kInfo) {                        \
    fmt::print(fg(fmt::color::green) | fmt::emphasis::bold, "[INFO]");       \
    fmt::print(" {}:{} {}\n", __FILE__, __LINE__, fmt::format(__VA_ARGS__)); \
  }

#define MMK_WARN(...)                                                         \
  if (mmk::Logger::level() <= mmk::LogLevel::kWarn) {                         \
    fmt::print(fg(fmt::color::green_yellow) | fmt::emphasis::bold, "[WARN]"); \
    fmt::print(" {}:{} {}\n", __FILE__, __LINE__, fmt::format(__VA_ARGS__));  \
  }

#define MMK_ERROR(...)                                                       \
  if (mmk::Logger::level() <= mmk::LogLevel::kError) {                       \
    fmt::print(fg(fmt::color::red) | fmt::emphasis::bold, "[ERROR]");        \
    fmt::print(" {}:{} {}\n", __FILE__, __LINE__, fmt::format(__VA_ARGS__)); \
  }

#define MMK_ERROR_EXIT(code, ...)                                            \
  if (mmk::Logger::level() <= mmk::LogLevel::kError) {                       \
    fmt::print(fg(fmt::color::red) | fmt::emphasis::bold, "[ERROR]");        \
    fmt::print(" {}:{} {}\n", __FILE__, __LINE__, fmt::format(__VA_ARGS__)); \
  }                                                                          \
  std::exit((int32_t)(code))

#define MMK_ASSERT_EXIT(code, ...)                                           \
  if (mmk::Logger::level() <= mmk::LogLevel::kAssert) {                      \
    fmt::print(fg(fmt::color::red) | fmt::emphasis::bold, "[ASSERT]");       \
    fmt::print(" {}:{} {}\n", __FILE__, __LINE__, fmt::format(__VA_ARGS__)); \
  }                                                                          \
  std::fflush(stdout);                                                       \
  (void)(code);                                                              \
  std::abort()

}  // namespace mmk
