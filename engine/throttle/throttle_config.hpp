#pragma once

#include <chrono>
#include <string>

namespace docgate {

namespace engine {
namespace common {
class ConfigManager;
}  // namespace common
}  // namespace engine

// Window length and admission budget of a ThrottledGate
struct ThrottleConfig {
  std::chrono::milliseconds period{std::chrono::minutes(1)};
  int limit = 100;

  // Throws ValidationError unless period > 0 and limit > 0
  void Validate() const;

  std::string ToString() const;

  /**
   * @brief Read "throttle.*" keys
   *
   * throttle.period_ms wins when positive; otherwise the window is one
   * throttle.time_unit (default "minutes"). throttle.request_limit defaults
   * to 100. The result is validated.
   */
  static ThrottleConfig FromConfig(const engine::common::ConfigManager& config);
};

}  // namespace docgate
