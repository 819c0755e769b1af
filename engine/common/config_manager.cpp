#include "config_manager.hpp"
#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <vector>

namespace docgate {
namespace engine {
namespace common {

bool ConfigManager::LoadFromFile(const std::string& config_path) {
  std::ifstream file(config_path);
  if (!file.is_open()) {
    SPDLOG_WARN("Failed to open config file: {}", config_path);
    return false;
  }

  try {
    config_root_ = nlohmann::json::parse(file);
  } catch (const nlohmann::json::exception& e) {
    SPDLOG_WARN("Failed to parse config from {}: {}", config_path, e.what());
    config_root_ = nlohmann::json();
    return false;
  }
  return AcceptRoot(config_path);
}

bool ConfigManager::LoadFromString(const std::string& json_text) {
  try {
    config_root_ = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::exception& e) {
    SPDLOG_WARN("Failed to parse inline config: {}", e.what());
    config_root_ = nlohmann::json();
    return false;
  }
  return AcceptRoot("<inline>");
}

bool ConfigManager::AcceptRoot(const std::string& source) {
  if (!config_root_.is_object()) {
    SPDLOG_WARN("Config {} loaded but root is not an object", source);
    config_root_ = nlohmann::json();
    return false;
  }

  SPDLOG_INFO("Loaded config from: {} (has {} top-level keys)", source, config_root_.size());
  std::string keys;
  for (auto it = config_root_.begin(); it != config_root_.end(); ++it) {
    if (!keys.empty()) keys += ", ";
    keys += it.key();
  }
  SPDLOG_TRACE("Config top-level keys: {}", keys);
  return true;
}

void ConfigManager::PrintAllConfig() const {
  SPDLOG_INFO("Active configuration:\n{}", config_root_.dump(2));
  for (const auto& entry : overrides_) {
    SPDLOG_INFO("  override {} = {}", entry.first, entry.second);
  }
}

std::string ConfigManager::GetConfigDir() {
  const char* env = std::getenv("DOCGATE_CONFIG_DIR");
  return env ? std::string(env) : "config";
}

bool ConfigManager::HasKey(const std::string& key) const {
  return overrides_.count(key) > 0 || !GetNode(key).is_null();
}

std::string ConfigManager::GetString(const std::string& key, const std::string& default_value) const {
  // Check overrides first
  auto it = overrides_.find(key);
  if (it != overrides_.end()) {
    SPDLOG_TRACE("GetString('{}'): found in overrides: {}", key, it->second);
    return it->second;
  }

  nlohmann::json node = GetNode(key);
  if (node.is_string()) {
    return node.get<std::string>();
  }

  SPDLOG_TRACE("GetString('{}'): not found, using default: {}", key, default_value);
  return default_value;
}

int ConfigManager::GetInt(const std::string& key, int default_value) const {
  auto it = overrides_.find(key);
  if (it != overrides_.end()) {
    try {
      return std::stoi(it->second);
    } catch (const std::exception& e) {
      SPDLOG_WARN("GetInt('{}'): override '{}' is not an integer ({}), using default {}",
                  key, it->second, e.what(), default_value);
      return default_value;
    }
  }

  nlohmann::json node = GetNode(key);
  if (!node.is_number_integer()) {
    SPDLOG_TRACE("GetInt('{}'): node not an integer, using default {}", key, default_value);
    return default_value;
  }
  return node.get<int>();
}

double ConfigManager::GetDouble(const std::string& key, double default_value) const {
  auto it = overrides_.find(key);
  if (it != overrides_.end()) {
    try {
      return std::stod(it->second);
    } catch (const std::exception& e) {
      SPDLOG_WARN("GetDouble('{}'): override '{}' is not a number ({}), using default {}",
                  key, it->second, e.what(), default_value);
      return default_value;
    }
  }

  nlohmann::json node = GetNode(key);
  if (!node.is_number()) {
    return default_value;
  }
  return node.get<double>();
}

bool ConfigManager::GetBool(const std::string& key, bool default_value) const {
  auto it = overrides_.find(key);
  if (it != overrides_.end()) {
    const std::string& val = it->second;
    if (val == "true" || val == "1" || val == "yes") return true;
    if (val == "false" || val == "0" || val == "no") return false;
    return default_value;
  }

  nlohmann::json node = GetNode(key);
  if (!node.is_boolean()) {
    return default_value;
  }
  return node.get<bool>();
}

std::chrono::milliseconds ConfigManager::GetMilliseconds(const std::string& key,
                                                         std::chrono::milliseconds default_value) const {
  int64_t fallback = static_cast<int64_t>(default_value.count());
  auto it = overrides_.find(key);
  if (it != overrides_.end()) {
    try {
      return std::chrono::milliseconds(std::stoll(it->second));
    } catch (const std::exception& e) {
      SPDLOG_WARN("GetMilliseconds('{}'): override '{}' is not an integer ({}), using default {}",
                  key, it->second, e.what(), fallback);
      return default_value;
    }
  }

  nlohmann::json node = GetNode(key);
  if (!node.is_number_integer()) {
    return default_value;
  }
  return std::chrono::milliseconds(node.get<int64_t>());
}

nlohmann::json ConfigManager::GetNodeValue(const std::string& key) const {
  return GetNode(key);
}

void ConfigManager::SetString(const std::string& key, const std::string& value) {
  overrides_[key] = value;
}

void ConfigManager::SetInt(const std::string& key, int value) {
  overrides_[key] = std::to_string(value);
}

void ConfigManager::SetBool(const std::string& key, bool value) {
  overrides_[key] = value ? "true" : "false";
}

nlohmann::json ConfigManager::GetNode(const std::string& key) const {
  // Dot notation: "submission.endpoint_url"
  std::vector<std::string> parts;
  std::string current;
  for (char c : key) {
    if (c == '.') {
      if (!current.empty()) {
        parts.push_back(current);
        current.clear();
      }
    } else {
      current += c;
    }
  }
  if (!current.empty()) {
    parts.push_back(current);
  }

  if (config_root_.is_null()) {
    return nlohmann::json();  // Config not loaded
  }

  const nlohmann::json* node = &config_root_;
  for (const auto& part : parts) {
    if (!node->is_object()) {
      SPDLOG_DEBUG("GetNode('{}'): node is not an object at part '{}'", key, part);
      return nlohmann::json();
    }
    auto found = node->find(part);
    if (found == node->end()) {
      SPDLOG_DEBUG("GetNode('{}'): key '{}' not found", key, part);
      return nlohmann::json();
    }
    node = &(*found);
  }

  return *node;
}

}  // namespace common
}  // namespace engine
}  // namespace docgate
