// Copyright (c) MMK Team.
// Licensed under the MIT License.

#include <fstream>
#include <stdexcept>

#include "mmk/utils/Common.hpp"
#include "mmk/engine/ConfigFile.hpp"

namespace mmk {

ConfigFile::ConfigFile(const std::string& file_path) { load(file_path); }

void ConfigFile::load(const std::string& file_path) {
  std::ifstream file(file_path);
  if (!file.is_open()) { MMK_ERROR_EXIT(ExitCode::kIOError, "Failed to open config file: {}", file_path); }

  try {
    file >> json_;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("JSON parse error in file " + file_path + ": " + e.what());
  }
}

void ConfigFile::loadString(const std::string& json_str) {
  try {
    json_ = nlohmann::json::parse(json_str);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("JSON parse error in string: " + std::string(e.what()));
  }
}

std::string ConfigFile::dump() const { return json_.dump(4); }

void ConfigFile::save(const std::string& file_path) const {
  std::ofstream file(file_path);
  if (!file.is_open()) { throw std::runtime_error("Failed to open file for saving: " + file_path); }
  file << dump();
}

}  // namespace mmk
