#include <gtest/gtest.h>
#include "engine/common/config_manager.hpp"
#include "engine/common/errors.hpp"
#include "engine/throttle/throttle_config.hpp"

using namespace docgate;
using docgate::engine::common::ConfigManager;
using namespace std::chrono_literals;

TEST(ThrottleConfigTest, Defaults) {
  ThrottleConfig config;
  EXPECT_EQ(config.period, std::chrono::minutes(1));
  EXPECT_EQ(config.limit, 100);
  EXPECT_NO_THROW(config.Validate());
  EXPECT_EQ(config.ToString(), "100 per 60000ms");
}

TEST(ThrottleConfigTest, Validate_RejectsNonPositiveValues) {
  ThrottleConfig config;
  config.limit = 0;
  EXPECT_THROW(config.Validate(), ValidationError);

  config.limit = 1;
  config.period = 0ms;
  EXPECT_THROW(config.Validate(), ValidationError);

  config.period = -5ms;
  EXPECT_THROW(config.Validate(), ValidationError);
}

TEST(ThrottleConfigTest, FromConfig_TimeUnit) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromString(R"({"throttle": {"time_unit": "seconds", "request_limit": 5}})"));

  auto throttle = ThrottleConfig::FromConfig(config);
  EXPECT_EQ(throttle.period, 1000ms);
  EXPECT_EQ(throttle.limit, 5);
}

TEST(ThrottleConfigTest, FromConfig_PeriodMsTakesPrecedence) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromString(
      R"({"throttle": {"time_unit": "hours", "period_ms": 250, "request_limit": 2}})"));

  auto throttle = ThrottleConfig::FromConfig(config);
  EXPECT_EQ(throttle.period, 250ms);
  EXPECT_EQ(throttle.limit, 2);
}

TEST(ThrottleConfigTest, FromConfig_EmptySectionUsesDefaults) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromString("{}"));

  auto throttle = ThrottleConfig::FromConfig(config);
  EXPECT_EQ(throttle.period, std::chrono::minutes(1));
  EXPECT_EQ(throttle.limit, 100);
}

TEST(ThrottleConfigTest, FromConfig_RejectsInvalidValues) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromString(R"({"throttle": {"request_limit": 0}})"));
  EXPECT_THROW(ThrottleConfig::FromConfig(config), ValidationError);

  ASSERT_TRUE(config.LoadFromString(R"({"throttle": {"time_unit": "weeks"}})"));
  EXPECT_THROW(ThrottleConfig::FromConfig(config), ValidationError);
}
