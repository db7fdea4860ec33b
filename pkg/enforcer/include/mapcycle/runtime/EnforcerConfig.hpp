// Repository: Mapcycle-enforcer
// Component: Enforcer Configuration
// Purpose: Immutable service settings from defaults, a config file and the environment.
// Copyright (c) 2026 RetroVue

#ifndef MAPCYCLE_RUNTIME_ENFORCER_CONFIG_HPP_
#define MAPCYCLE_RUNTIME_ENFORCER_CONFIG_HPP_

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>

#include "mapcycle/channel/CurlHttpTransport.hpp"
#include "mapcycle/channel/RconClient.hpp"
#include "mapcycle/schedule/ScheduleResolver.hpp"
#include "mapcycle/util/Logger.hpp"

namespace mapcycle::runtime {

constexpr char kDefaultSchedulePath[] = "./weekly_rotation.json";
constexpr char kDefaultTimeZone[] = "UTC";
constexpr int kDefaultEnforceIntervalSeconds = 60;
constexpr int kDefaultTickTimeoutSeconds = 45;
constexpr int kDefaultHttpTimeoutSeconds = 10;
constexpr int kDefaultRconTimeoutSeconds = 5;

struct PrimaryChannelConfig {
  std::string base_url;
  std::string api_root = "/api/";
  channel::CurlTransportSettings transport;
};

struct EnforcerConfig {
  std::string schedule_path = kDefaultSchedulePath;
  std::string timezone = kDefaultTimeZone;
  util::LogLevel log_level = util::LogLevel::kInfo;
  schedule::ResolverOptions resolver;

  PrimaryChannelConfig primary;
  std::optional<channel::RconSettings> fallback;

  std::chrono::seconds enforce_interval{kDefaultEnforceIntervalSeconds};
  std::chrono::seconds tick_timeout{kDefaultTickTimeoutSeconds};
  bool follow_block_transitions = true;

  // host:port for the gRPC control service; empty disables it.
  std::string control_listen_address;

  // One line per setting, secrets redacted.
  std::string Describe() const;
};

// Returns the value of an environment variable, or nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// getenv-backed lookup.
EnvLookup ProcessEnvironment();

// Builds the configuration.
//
// Precedence, lowest first:
//   1. built-in defaults
//   2. the JSON file named by CONFIG_PATH: a flat object whose keys are the
//      variable names below (values may be strings, numbers or booleans)
//   3. the environment
//
// Variables: WEEKLY_ROTATION_PATH, TIMEZONE, LOG_LEVEL, ROTATION_NAME,
// ROTATION_CYCLE_ANCHOR, CRCON_HTTP_BASE_URL, CRCON_HTTP_BEARER_TOKEN,
// CRCON_HTTP_API_ROOT, CRCON_HTTP_TIMEOUT, CRCON_HTTP_VERIFY, RCON_HOST,
// RCON_PORT, RCON_PASSWORD, RCON_TIMEOUT, ENFORCE_INTERVAL_SECONDS,
// TICK_TIMEOUT_SECONDS, FOLLOW_BLOCK_TRANSITIONS, CONTROL_LISTEN_ADDRESS.
//
// Throws util::ConfigError on a missing primary URL or token, malformed
// numbers/dates/booleans, an unreadable config file, or a partial fallback
// block. An unknown LOG_LEVEL falls back to INFO with a warning.
EnforcerConfig LoadEnforcerConfig(const EnvLookup& env);

// Lower layer used by LoadEnforcerConfig; exposed for tests.
std::map<std::string, std::string> ReadConfigFile(const std::string& path);

}  // namespace mapcycle::runtime

#endif  // MAPCYCLE_RUNTIME_ENFORCER_CONFIG_HPP_
