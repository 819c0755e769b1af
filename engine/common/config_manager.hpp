#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <unordered_map>

namespace docgate {
namespace engine {
namespace common {

// JSON configuration with dot-notation lookups ("throttle.request_limit")
// and string overrides that take precedence over the loaded file.
class ConfigManager {
 public:
  ConfigManager() = default;
  ~ConfigManager() = default;

  // Load configuration from JSON file
  bool LoadFromFile(const std::string& config_path);

  // Load configuration from an in-memory JSON document
  bool LoadFromString(const std::string& json_text);

  // Log the loaded document
  void PrintAllConfig() const;

  // Directory holding app configs ($DOCGATE_CONFIG_DIR, default "config")
  static std::string GetConfigDir();

  bool HasKey(const std::string& key) const;

  std::string GetString(const std::string& key, const std::string& default_value = "") const;
  int GetInt(const std::string& key, int default_value = 0) const;
  double GetDouble(const std::string& key, double default_value = 0.0) const;
  bool GetBool(const std::string& key, bool default_value = false) const;

  // Integer number of milliseconds stored under key
  std::chrono::milliseconds GetMilliseconds(const std::string& key,
                                            std::chrono::milliseconds default_value) const;

  // Any node (object, array, string, number, etc.); null when absent
  nlohmann::json GetNodeValue(const std::string& key) const;

  // Set value (for command-line overrides)
  void SetString(const std::string& key, const std::string& value);
  void SetInt(const std::string& key, int value);
  void SetBool(const std::string& key, bool value);

 private:
  nlohmann::json config_root_;
  std::unordered_map<std::string, std::string> overrides_;

  bool AcceptRoot(const std::string& source);
  nlohmann::json GetNode(const std::string& key) const;
};

}  // namespace common
}  // namespace engine
}  // namespace docgate
