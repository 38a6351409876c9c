// Copyright (c) MMK Team.
// Licensed under the MIT License.

#include "mmk/engine/MatMulConfig.hpp"
#include "mmk/utils/Common.hpp"

namespace mmk {

MatMulOptions loadMatMulOptions(const ConfigFile& config) {
  auto options = MatMulOptions::defaults();
  const auto& json = config.data();

  if (json.contains("log_level")) {
    const auto& node = json["log_level"];
    if (!node.is_string()) { MMK_ERROR_EXIT(ExitCode::kConfigError, "log_level must be a string, got {}", node.dump()); }
    auto level = str2LogLevel(node.get<std::string>());
    if (!level) { MMK_ERROR_EXIT(ExitCode::kConfigError, "Unknown log_level: {}", node.get<std::string>()); }
    Logger::level() = *level;
  }

  if (!json.contains("matmul")) return options;
  const auto& section = json["matmul"];
  if (!section.is_object()) { MMK_ERROR_EXIT(ExitCode::kConfigError, "matmul must be an object, got {}", section.dump()); }

  if (section.contains("variant")) {
    const auto& node = section["variant"];
    if (!node.is_string()) { MMK_ERROR_EXIT(ExitCode::kConfigError, "matmul.variant must be a string, got {}", node.dump()); }
    auto type = str2MatMulOpType(node.get<std::string>());
    if (!type) { MMK_ERROR_EXIT(ExitCode::kConfigError, "Unknown matmul.variant: {}", node.get<std::string>()); }
    options.type = *type;
  }

  if (section.contains("thread_count")) {
    const auto& node = section["thread_count"];
    if (!node.is_number_integer()) {
      MMK_ERROR_EXIT(ExitCode::kConfigError, "matmul.thread_count must be an integer, got {}", node.dump());
    }
    auto thread_count = node.get<int>();
    if (thread_count < 1) {
      MMK_WARN("matmul.thread_count = {} is not positive, using 1", thread_count);
      thread_count = 1;
    }
    options.thread_count = thread_count;
  }

  return options;
}

void storeMatMulOptions(ConfigFile& config, const MatMulOptions& options) {
  auto& section = config.data()["matmul"];
  section["variant"] = MatMulOpType2Str(options.type);
  section["thread_count"] = options.thread_count;
}

}  // namespace mmk
