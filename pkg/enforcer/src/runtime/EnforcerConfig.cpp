// Repository: Mapcycle-enforcer
// Component: Enforcer Configuration
// Purpose: Immutable service settings from defaults, a config file and the environment.
// Copyright (c) 2026 RetroVue

#include "mapcycle/runtime/EnforcerConfig.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <json/json.h>

#include "mapcycle/schedule/CivilTime.hpp"
#include "mapcycle/util/ConfigError.hpp"

namespace mapcycle::runtime {

using util::ConfigError;
using util::Logger;

namespace {

// Settings layer: variable name -> raw value. File values are written
// first, environment values overwrite them.
using RawSettings = std::map<std::string, std::string>;

constexpr const char* kKnownVariables[] = {
    "WEEKLY_ROTATION_PATH", "TIMEZONE",           "LOG_LEVEL",
    "ROTATION_NAME",        "ROTATION_CYCLE_ANCHOR",
    "CRCON_HTTP_BASE_URL",  "CRCON_HTTP_BEARER_TOKEN", "CRCON_HTTP_API_ROOT",
    "CRCON_HTTP_TIMEOUT",   "CRCON_HTTP_VERIFY",
    "RCON_HOST",            "RCON_PORT",          "RCON_PASSWORD",
    "RCON_TIMEOUT",         "ENFORCE_INTERVAL_SECONDS", "TICK_TIMEOUT_SECONDS",
    "FOLLOW_BLOCK_TRANSITIONS", "CONTROL_LISTEN_ADDRESS",
};

bool IsKnownVariable(const std::string& name) {
  return std::find_if(std::begin(kKnownVariables), std::end(kKnownVariables),
                      [&](const char* v) { return name == v; }) != std::end(kKnownVariables);
}

std::optional<std::string> Get(const RawSettings& raw, const char* name) {
  auto it = raw.find(name);
  if (it == raw.end() || it->second.empty()) return std::nullopt;
  return it->second;
}

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool ParseBool(const char* name, const std::string& value) {
  const std::string v = Lower(value);
  if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
  if (v == "false" || v == "0" || v == "no" || v == "off") return false;
  throw ConfigError(std::string(name) + "='" + value + "' is not a boolean");
}

int64_t ParseInteger(const char* name, const std::string& value, int64_t min, int64_t max) {
  char* end = nullptr;
  errno = 0;
  const long long parsed = std::strtoll(value.c_str(), &end, 10);
  if (errno != 0 || end == value.c_str() || *end != '\0' || parsed < min || parsed > max) {
    throw ConfigError(std::string(name) + "='" + value + "' must be an integer in [" +
                      std::to_string(min) + ", " + std::to_string(max) + "]");
  }
  return parsed;
}

// Positive seconds, fractions allowed.
std::chrono::milliseconds ParseSeconds(const char* name, const std::string& value) {
  char* end = nullptr;
  errno = 0;
  const double parsed = std::strtod(value.c_str(), &end);
  if (errno != 0 || end == value.c_str() || *end != '\0' || !std::isfinite(parsed) ||
      parsed <= 0.0 || parsed > 3600.0) {
    throw ConfigError(std::string(name) + "='" + value + "' must be a positive number of seconds");
  }
  return std::chrono::milliseconds(static_cast<int64_t>(std::llround(parsed * 1000.0)));
}

std::string JsonScalarToString(const std::string& key, const Json::Value& v,
                               const std::string& path) {
  if (v.isString()) return v.asString();
  if (v.isBool()) return v.asBool() ? "true" : "false";
  if (v.isInt64()) return std::to_string(v.asInt64());
  if (v.isUInt64()) return std::to_string(v.asUInt64());
  if (v.isDouble()) {
    std::ostringstream out;
    out << v.asDouble();
    return out.str();
  }
  throw ConfigError(path + ": " + key + " must be a string, number or boolean");
}

}  // namespace

EnvLookup ProcessEnvironment() {
  return [](const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) return std::nullopt;
    return std::string(value);
  };
}

std::map<std::string, std::string> ReadConfigFile(const std::string& path) {
  std::ifstream file(path, std::ifstream::binary);
  if (!file.is_open()) {
    throw ConfigError("config file '" + path + "' cannot be opened");
  }

  Json::Value root;
  Json::CharReaderBuilder builder;
  std::string errs;
  bool parsed = false;
  try {
    parsed = Json::parseFromStream(builder, file, &root, &errs);
  } catch (const Json::Exception& e) {
    errs = e.what();
  }
  if (!parsed) {
    throw ConfigError("config file '" + path + "' is not valid JSON: " + errs);
  }
  if (!root.isObject()) {
    throw ConfigError("config file '" + path + "' must contain a JSON object");
  }

  std::map<std::string, std::string> values;
  for (const auto& key : root.getMemberNames()) {
    if (!IsKnownVariable(key)) {
      Logger::Warn("[EnforcerConfig] " + path + ": unknown setting '" + key + "' ignored");
      continue;
    }
    if (root[key].isNull()) continue;
    values[key] = JsonScalarToString(key, root[key], path);
  }
  return values;
}

EnforcerConfig LoadEnforcerConfig(const EnvLookup& env) {
  RawSettings raw;

  if (auto config_path = env("CONFIG_PATH"); config_path.has_value() && !config_path->empty()) {
    raw = ReadConfigFile(*config_path);
    Logger::Info("[EnforcerConfig] Loaded settings from " + *config_path);
  }
  for (const char* name : kKnownVariables) {
    if (auto value = env(name); value.has_value()) raw[name] = *value;
  }

  EnforcerConfig config;

  if (auto v = Get(raw, "WEEKLY_ROTATION_PATH")) config.schedule_path = *v;
  if (auto v = Get(raw, "TIMEZONE")) config.timezone = *v;

  if (auto v = Get(raw, "LOG_LEVEL")) {
    auto level = util::ParseLogLevel(*v);
    if (level.has_value()) {
      config.log_level = *level;
    } else {
      Logger::Warn("[EnforcerConfig] LOG_LEVEL='" + *v + "' not recognized, using INFO");
    }
  }

  if (auto v = Get(raw, "ROTATION_NAME")) config.resolver.forced_rotation = *v;
  if (auto v = Get(raw, "ROTATION_CYCLE_ANCHOR")) {
    auto anchor = schedule::ParseIsoDate(*v);
    if (!anchor.has_value()) {
      throw ConfigError("ROTATION_CYCLE_ANCHOR='" + *v + "' is not an ISO date");
    }
    config.resolver.anchor_override = *anchor;
  }

  // Primary channel: required.
  auto base_url = Get(raw, "CRCON_HTTP_BASE_URL");
  if (!base_url.has_value()) throw ConfigError("CRCON_HTTP_BASE_URL is required");
  auto token = Get(raw, "CRCON_HTTP_BEARER_TOKEN");
  if (!token.has_value()) throw ConfigError("CRCON_HTTP_BEARER_TOKEN is required");
  config.primary.base_url = *base_url;
  config.primary.transport.bearer_token = *token;
  if (auto v = Get(raw, "CRCON_HTTP_API_ROOT")) config.primary.api_root = *v;
  config.primary.transport.timeout = std::chrono::seconds(kDefaultHttpTimeoutSeconds);
  if (auto v = Get(raw, "CRCON_HTTP_TIMEOUT")) {
    config.primary.transport.timeout = ParseSeconds("CRCON_HTTP_TIMEOUT", *v);
  }
  if (auto v = Get(raw, "CRCON_HTTP_VERIFY")) {
    config.primary.transport.verify_tls = ParseBool("CRCON_HTTP_VERIFY", *v);
  }

  // Fallback channel: all or nothing.
  auto host = Get(raw, "RCON_HOST");
  auto port = Get(raw, "RCON_PORT");
  auto password = Get(raw, "RCON_PASSWORD");
  const int present = (host ? 1 : 0) + (port ? 1 : 0) + (password ? 1 : 0);
  if (present == 3) {
    channel::RconSettings rcon;
    rcon.host = *host;
    rcon.port = static_cast<uint16_t>(ParseInteger("RCON_PORT", *port, 1, 65535));
    rcon.password = *password;
    rcon.timeout = std::chrono::seconds(kDefaultRconTimeoutSeconds);
    if (auto v = Get(raw, "RCON_TIMEOUT")) rcon.timeout = ParseSeconds("RCON_TIMEOUT", *v);
    config.fallback = rcon;
  } else if (present != 0) {
    throw ConfigError(
        "fallback channel needs RCON_HOST, RCON_PORT and RCON_PASSWORD together");
  }

  if (auto v = Get(raw, "ENFORCE_INTERVAL_SECONDS")) {
    config.enforce_interval =
        std::chrono::seconds(ParseInteger("ENFORCE_INTERVAL_SECONDS", *v, 1, 86400));
  }
  if (auto v = Get(raw, "TICK_TIMEOUT_SECONDS")) {
    config.tick_timeout =
        std::chrono::seconds(ParseInteger("TICK_TIMEOUT_SECONDS", *v, 1, 3600));
  }
  if (auto v = Get(raw, "FOLLOW_BLOCK_TRANSITIONS")) {
    config.follow_block_transitions = ParseBool("FOLLOW_BLOCK_TRANSITIONS", *v);
  }
  if (auto v = Get(raw, "CONTROL_LISTEN_ADDRESS")) config.control_listen_address = *v;

  return config;
}

std::string EnforcerConfig::Describe() const {
  std::ostringstream out;
  out << "schedule_path=" << schedule_path << "\n"
      << "timezone=" << timezone << "\n"
      << "log_level=" << util::LogLevelName(log_level) << "\n"
      << "rotation_name=" << resolver.forced_rotation.value_or("<cycle>") << "\n"
      << "cycle_anchor="
      << (resolver.anchor_override ? schedule::FormatIsoDate(*resolver.anchor_override)
                                   : std::string("<document>"))
      << "\n"
      << "primary=" << primary.base_url << " api_root=" << primary.api_root
      << " timeout_ms=" << primary.transport.timeout.count()
      << " verify_tls=" << (primary.transport.verify_tls ? "true" : "false")
      << " token=<redacted>\n";
  if (fallback.has_value()) {
    out << "fallback=" << fallback->host << ":" << fallback->port
        << " timeout_ms=" << fallback->timeout.count() << " password=<redacted>\n";
  } else {
    out << "fallback=<disabled>\n";
  }
  out << "enforce_interval_s=" << enforce_interval.count() << "\n"
      << "tick_timeout_s=" << tick_timeout.count() << "\n"
      << "follow_block_transitions=" << (follow_block_transitions ? "true" : "false") << "\n"
      << "control_listen_address="
      << (control_listen_address.empty() ? std::string("<disabled>") : control_listen_address);
  return out.str();
}

}  // namespace mapcycle::runtime
