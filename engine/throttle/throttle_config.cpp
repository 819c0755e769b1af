#include "throttle_config.hpp"
#include "engine/common/config_manager.hpp"
#include "engine/common/errors.hpp"
#include "engine/common/util.hpp"

namespace docgate {

void ThrottleConfig::Validate() const {
  if (limit <= 0) {
    throw ValidationError("Request limit must be positive, got " + std::to_string(limit));
  }
  if (period <= std::chrono::milliseconds::zero()) {
    throw ValidationError("Throttle period must be positive, got " +
                          std::to_string(period.count()) + "ms");
  }
}

std::string ThrottleConfig::ToString() const {
  return std::to_string(limit) + " per " + std::to_string(period.count()) + "ms";
}

ThrottleConfig ThrottleConfig::FromConfig(const engine::common::ConfigManager& config) {
  ThrottleConfig result;
  auto period = config.GetMilliseconds("throttle.period_ms", std::chrono::milliseconds::zero());
  if (period > std::chrono::milliseconds::zero()) {
    result.period = period;
  } else {
    result.period = engine::common::ParseTimeUnit(config.GetString("throttle.time_unit", "minutes"));
  }
  result.limit = config.GetInt("throttle.request_limit", 100);
  result.Validate();
  return result;
}

}  // namespace docgate
