// Copyright (c) MMK Team.
// Licensed under the MIT License.

#include <unordered_map>

#include "mmk/utils/Log.hpp"

namespace mmk {

LogLevel Logger::level_ = LogLevel::kInfo;

std::optional<LogLevel> str2LogLevel(const std::string& str) {
  static const std::unordered_map<std::string, LogLevel> map = {{"info", LogLevel::kInfo},
                                                                {"warn", LogLevel::kWarn},
                                                                {"error", LogLevel::kError},
                                                                {"fatal", LogLevel::kFatal},
                                                                {"assert", LogLevel::kAssert}};

  auto it = map.find(str);
  if (it != map.end()) return it->second;
  return std::nullopt;
}

}  // namespace mmk
