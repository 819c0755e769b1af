#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "engine/common/config_manager.hpp"

using namespace docgate::engine::common;
using namespace std::chrono_literals;

class ConfigManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_config_path_ = std::filesystem::temp_directory_path() / "docgate_test_config.json";

    nlohmann::json config = {
      {"app", {
        {"log", {
          {"file", "test.log"},
          {"level", "debug"}
        }}
      }},
      {"submission", {
        {"endpoint_url", "http://127.0.0.1:8080/api/v3/lk/documents/create"},
        {"connect_timeout_ms", 2500},
        {"verify_tls", false}
      }},
      {"throttle", {
        {"time_unit", "seconds"},
        {"request_limit", 5}
      }},
      {"test_double", 3.14},
      {"test_string", "hello"}
    };

    std::ofstream file(test_config_path_);
    file << config.dump(2);
    file.close();
  }

  void TearDown() override {
    if (std::filesystem::exists(test_config_path_)) {
      std::filesystem::remove(test_config_path_);
    }
  }

  std::filesystem::path test_config_path_;
};

TEST_F(ConfigManagerTest, LoadFromFile_Success) {
  ConfigManager config;
  EXPECT_TRUE(config.LoadFromFile(test_config_path_.string()));
}

TEST_F(ConfigManagerTest, LoadFromFile_NonExistent) {
  ConfigManager config;
  EXPECT_FALSE(config.LoadFromFile("/nonexistent/file.json"));
}

TEST_F(ConfigManagerTest, LoadFromString_RejectsMalformedAndNonObject) {
  ConfigManager config;
  EXPECT_FALSE(config.LoadFromString("{not json"));
  EXPECT_FALSE(config.LoadFromString("[1, 2, 3]"));
  EXPECT_FALSE(config.HasKey("0"));
  EXPECT_TRUE(config.LoadFromString(R"({"throttle": {"request_limit": 7}})"));
  EXPECT_EQ(config.GetInt("throttle.request_limit"), 7);
}

TEST_F(ConfigManagerTest, GetString_ExistingKey) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_EQ(config.GetString("test_string"), "hello");
  EXPECT_EQ(config.GetString("app.log.file"), "test.log");
  EXPECT_EQ(config.GetString("throttle.time_unit"), "seconds");
}

TEST_F(ConfigManagerTest, GetString_NonExistentKey) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_EQ(config.GetString("nonexistent"), "");
  EXPECT_EQ(config.GetString("nonexistent", "default"), "default");
  // Walking through a non-object node
  EXPECT_EQ(config.GetString("test_string.deeper", "default"), "default");
}

TEST_F(ConfigManagerTest, GetInt_ExistingKey) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_EQ(config.GetInt("throttle.request_limit"), 5);
}

TEST_F(ConfigManagerTest, GetInt_WrongTypeUsesDefault) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_EQ(config.GetInt("nonexistent", 99), 99);
  EXPECT_EQ(config.GetInt("test_string", 99), 99);
}

TEST_F(ConfigManagerTest, GetDouble) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_DOUBLE_EQ(config.GetDouble("test_double"), 3.14);
  EXPECT_DOUBLE_EQ(config.GetDouble("nonexistent", 9.9), 9.9);
}

TEST_F(ConfigManagerTest, GetBool) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_FALSE(config.GetBool("submission.verify_tls", true));
  EXPECT_TRUE(config.GetBool("nonexistent", true));
}

TEST_F(ConfigManagerTest, GetMilliseconds) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_EQ(config.GetMilliseconds("submission.connect_timeout_ms", 10000ms), 2500ms);
  EXPECT_EQ(config.GetMilliseconds("submission.request_timeout_ms", 30000ms), 30000ms);
}

TEST_F(ConfigManagerTest, HasKey) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_TRUE(config.HasKey("submission"));
  EXPECT_TRUE(config.HasKey("submission.endpoint_url"));
  EXPECT_FALSE(config.HasKey("submission.missing"));

  config.SetString("server.address", "127.0.0.1");
  EXPECT_TRUE(config.HasKey("server.address"));
}

TEST_F(ConfigManagerTest, GetNodeValue_ExistingKey) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  auto node = config.GetNodeValue("throttle");
  EXPECT_TRUE(node.is_object());
  EXPECT_TRUE(node.contains("request_limit"));
  EXPECT_TRUE(config.GetNodeValue("nonexistent").is_null());
}

TEST_F(ConfigManagerTest, SetString_Override) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  config.SetString("test_string", "overridden");
  EXPECT_EQ(config.GetString("test_string"), "overridden");
}

TEST_F(ConfigManagerTest, SetInt_Override) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  config.SetInt("throttle.request_limit", 999);
  EXPECT_EQ(config.GetInt("throttle.request_limit"), 999);
  EXPECT_EQ(config.GetMilliseconds("throttle.request_limit", 0ms), 999ms);
}

TEST_F(ConfigManagerTest, SetString_NonNumericOverrideUsesDefault) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  config.SetString("throttle.request_limit", "lots");
  EXPECT_EQ(config.GetInt("throttle.request_limit", 3), 3);
}

TEST_F(ConfigManagerTest, SetBool_Override) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  config.SetBool("submission.verify_tls", true);
  EXPECT_TRUE(config.GetBool("submission.verify_tls"));
}

TEST_F(ConfigManagerTest, GetConfigDir) {
  std::string dir = ConfigManager::GetConfigDir();
  EXPECT_FALSE(dir.empty());
}

TEST_F(ConfigManagerTest, PrintAllConfig) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  // Should not throw
  config.PrintAllConfig();
}
