// Repository: Mapcycle-enforcer
// Component: Enforcer Configuration tests
// Purpose: Defaults, precedence between config file and environment, validation.
// Copyright (c) 2026 RetroVue

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "mapcycle/runtime/EnforcerConfig.hpp"
#include "mapcycle/util/ConfigError.hpp"
#include "mapcycle/util/Logger.hpp"

namespace mapcycle::runtime {
namespace {

using util::ConfigError;
using util::LogLevel;
using util::Logger;

class EnforcerConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    env_["CRCON_HTTP_BASE_URL"] = "http://crcon.local:8010";
    env_["CRCON_HTTP_BEARER_TOKEN"] = "token-123";
  }

  void TearDown() override {
    Logger::SetSink(nullptr);
    for (const auto& path : files_) std::remove(path.c_str());
  }

  EnvLookup Env() const {
    return [env = env_](const std::string& name) -> std::optional<std::string> {
      auto it = env.find(name);
      if (it == env.end()) return std::nullopt;
      return it->second;
    };
  }

  std::string WriteConfigFile(const std::string& name, const std::string& json) {
    const std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << json;
    files_.push_back(path);
    return path;
  }

  std::map<std::string, std::string> env_;
  std::vector<std::string> files_;
};

// -----------------------------------------------------------------------------
// Defaults and required settings
// -----------------------------------------------------------------------------

TEST_F(EnforcerConfigTest, DefaultsApplyWhenOnlyPrimaryIsSet) {
  const auto config = LoadEnforcerConfig(Env());
  EXPECT_EQ(config.schedule_path, kDefaultSchedulePath);
  EXPECT_EQ(config.timezone, "UTC");
  EXPECT_EQ(config.log_level, LogLevel::kInfo);
  EXPECT_EQ(config.primary.base_url, "http://crcon.local:8010");
  EXPECT_EQ(config.primary.api_root, "/api/");
  EXPECT_EQ(config.primary.transport.bearer_token, "token-123");
  EXPECT_EQ(config.primary.transport.timeout, std::chrono::seconds(10));
  EXPECT_FALSE(config.primary.transport.verify_tls);
  EXPECT_FALSE(config.fallback.has_value());
  EXPECT_EQ(config.enforce_interval, std::chrono::seconds(60));
  EXPECT_EQ(config.tick_timeout, std::chrono::seconds(45));
  EXPECT_TRUE(config.follow_block_transitions);
  EXPECT_FALSE(config.resolver.forced_rotation.has_value());
  EXPECT_TRUE(config.control_listen_address.empty());
}

TEST_F(EnforcerConfigTest, PrimaryUrlAndTokenAreRequired) {
  env_.erase("CRCON_HTTP_BASE_URL");
  EXPECT_THROW(LoadEnforcerConfig(Env()), ConfigError);

  SetUp();
  env_["CRCON_HTTP_BEARER_TOKEN"] = "";  // empty counts as unset
  EXPECT_THROW(LoadEnforcerConfig(Env()), ConfigError);
}

// -----------------------------------------------------------------------------
// Parsing
// -----------------------------------------------------------------------------

TEST_F(EnforcerConfigTest, ParsesOverridesAndFallback) {
  env_["ROTATION_NAME"] = "b";
  env_["ROTATION_CYCLE_ANCHOR"] = "2025-01-06";
  env_["CRCON_HTTP_TIMEOUT"] = "2.5";
  env_["CRCON_HTTP_VERIFY"] = "yes";
  env_["RCON_HOST"] = "10.0.0.5";
  env_["RCON_PORT"] = "28016";
  env_["RCON_PASSWORD"] = "s3cret";
  env_["RCON_TIMEOUT"] = "0.75";
  env_["ENFORCE_INTERVAL_SECONDS"] = "30";
  env_["TICK_TIMEOUT_SECONDS"] = "20";
  env_["FOLLOW_BLOCK_TRANSITIONS"] = "off";
  env_["LOG_LEVEL"] = "debug";

  const auto config = LoadEnforcerConfig(Env());
  EXPECT_EQ(config.resolver.forced_rotation.value_or(""), "b");
  ASSERT_TRUE(config.resolver.anchor_override.has_value());
  EXPECT_EQ(*config.resolver.anchor_override, (schedule::CivilDate{2025, 1, 6}));
  EXPECT_EQ(config.primary.transport.timeout, std::chrono::milliseconds(2500));
  EXPECT_TRUE(config.primary.transport.verify_tls);
  ASSERT_TRUE(config.fallback.has_value());
  EXPECT_EQ(config.fallback->host, "10.0.0.5");
  EXPECT_EQ(config.fallback->port, 28016);
  EXPECT_EQ(config.fallback->password, "s3cret");
  EXPECT_EQ(config.fallback->timeout, std::chrono::milliseconds(750));
  EXPECT_EQ(config.enforce_interval, std::chrono::seconds(30));
  EXPECT_EQ(config.tick_timeout, std::chrono::seconds(20));
  EXPECT_FALSE(config.follow_block_transitions);
  EXPECT_EQ(config.log_level, LogLevel::kDebug);
}

TEST_F(EnforcerConfigTest, PartialFallbackIsRejected) {
  env_["RCON_HOST"] = "10.0.0.5";
  env_["RCON_PASSWORD"] = "s3cret";
  EXPECT_THROW(LoadEnforcerConfig(Env()), ConfigError);
}

TEST_F(EnforcerConfigTest, MalformedValuesAreRejected) {
  const std::vector<std::pair<std::string, std::string>> bad = {
      {"ENFORCE_INTERVAL_SECONDS", "0"},
      {"ENFORCE_INTERVAL_SECONDS", "ten"},
      {"TICK_TIMEOUT_SECONDS", "5s"},
      {"CRCON_HTTP_TIMEOUT", "-1"},
      {"CRCON_HTTP_VERIFY", "maybe"},
      {"FOLLOW_BLOCK_TRANSITIONS", "2"},
      {"ROTATION_CYCLE_ANCHOR", "2025-13-01"},
  };
  for (const auto& [name, value] : bad) {
    SetUp();
    env_[name] = value;
    EXPECT_THROW(LoadEnforcerConfig(Env()), ConfigError) << name << "=" << value;
    env_.erase(name);
  }

  env_["RCON_HOST"] = "h";
  env_["RCON_PASSWORD"] = "p";
  env_["RCON_PORT"] = "70000";
  EXPECT_THROW(LoadEnforcerConfig(Env()), ConfigError);
}

TEST_F(EnforcerConfigTest, UnknownLogLevelWarnsAndUsesInfo) {
  std::vector<std::string> warnings;
  Logger::SetSink([&](LogLevel level, const std::string& line) {
    if (level == LogLevel::kWarn) warnings.push_back(line);
  });
  env_["LOG_LEVEL"] = "chatty";

  const auto config = LoadEnforcerConfig(Env());
  Logger::SetSink(nullptr);
  EXPECT_EQ(config.log_level, LogLevel::kInfo);
  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_NE(warnings[0].find("chatty"), std::string::npos);
}

// -----------------------------------------------------------------------------
// Config file layer
// -----------------------------------------------------------------------------

TEST_F(EnforcerConfigTest, EnvironmentOverridesConfigFile) {
  env_["CONFIG_PATH"] = WriteConfigFile("mapcycle_config_precedence.json", R"({
    "WEEKLY_ROTATION_PATH": "/etc/mapcycle/rotation.json",
    "TIMEZONE": "Europe/Berlin",
    "ENFORCE_INTERVAL_SECONDS": 120,
    "FOLLOW_BLOCK_TRANSITIONS": false,
    "CRCON_HTTP_BASE_URL": "http://from-file"
  })");
  env_["TIMEZONE"] = "America/New_York";

  const auto config = LoadEnforcerConfig(Env());
  EXPECT_EQ(config.schedule_path, "/etc/mapcycle/rotation.json");  // file only
  EXPECT_EQ(config.timezone, "America/New_York");                 // env wins
  EXPECT_EQ(config.primary.base_url, "http://crcon.local:8010");   // env wins
  EXPECT_EQ(config.enforce_interval, std::chrono::seconds(120));   // number in file
  EXPECT_FALSE(config.follow_block_transitions);                   // bool in file
}

TEST_F(EnforcerConfigTest, UnknownFileKeysAreIgnored) {
  const auto path = WriteConfigFile("mapcycle_config_unknown.json", R"({
    "TIMEZONE": "UTC",
    "SOMETHING_ELSE": "x"
  })");
  const auto values = ReadConfigFile(path);
  EXPECT_EQ(values.size(), 1u);
  EXPECT_EQ(values.at("TIMEZONE"), "UTC");
}

TEST_F(EnforcerConfigTest, UnreadableOrInvalidConfigFileIsFatal) {
  env_["CONFIG_PATH"] = "/nonexistent/mapcycle/config.json";
  EXPECT_THROW(LoadEnforcerConfig(Env()), ConfigError);

  env_["CONFIG_PATH"] = WriteConfigFile("mapcycle_config_invalid.json", "[\"not\", \"object\"]");
  EXPECT_THROW(LoadEnforcerConfig(Env()), ConfigError);

  env_["CONFIG_PATH"] = WriteConfigFile("mapcycle_config_nested.json",
                                        R"({ "TIMEZONE": { "name": "UTC" } })");
  EXPECT_THROW(LoadEnforcerConfig(Env()), ConfigError);
}

TEST_F(EnforcerConfigTest, ParserLimitsInConfigFileAreConfigErrors) {
  env_["CONFIG_PATH"] = WriteConfigFile("mapcycle_config_deep.json",
                                        std::string(2000, '[') + std::string(2000, ']'));
  EXPECT_THROW(LoadEnforcerConfig(Env()), ConfigError);

  env_["CONFIG_PATH"] = WriteConfigFile("mapcycle_config_huge.json",
                                        R"({ "ENFORCE_INTERVAL_SECONDS": 18446744073709551615 })");
  try {
    LoadEnforcerConfig(Env());
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_NE(std::string(e.what()).find("ENFORCE_INTERVAL_SECONDS"), std::string::npos);
  }
}

TEST_F(EnforcerConfigTest, DescribeRedactsSecrets) {
  env_["RCON_HOST"] = "10.0.0.5";
  env_["RCON_PORT"] = "28016";
  env_["RCON_PASSWORD"] = "s3cret";
  const auto text = LoadEnforcerConfig(Env()).Describe();
  EXPECT_EQ(text.find("token-123"), std::string::npos);
  EXPECT_EQ(text.find("s3cret"), std::string::npos);
  EXPECT_NE(text.find("fallback=10.0.0.5:28016"), std::string::npos);
}

}  // namespace
}  // namespace mapcycle::runtime
