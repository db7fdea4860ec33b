// Repository: Mapcycle-enforcer
// Component: Zoned Clock
// Purpose: Convert UTC instants into the configured local time.
// Copyright (c) 2026 RetroVue

#include "mapcycle/runtime/ZonedClock.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <utility>

#include <unistd.h>

#include "mapcycle/util/ConfigError.hpp"
#include "mapcycle/util/Logger.hpp"

namespace mapcycle::runtime {

using util::ConfigError;
using util::Logger;

namespace {

constexpr char kDefaultZoneInfoDir[] = "/usr/share/zoneinfo";

bool IsUtcAlias(const std::string& zone) {
  return zone == "UTC" || zone == "Etc/UTC" || zone == "GMT" || zone == "Z";
}

bool ZoneFileExists(const std::string& zone) {
  if (zone.empty() || zone[0] == '/' || zone.find("..") != std::string::npos) return false;
  const char* tzdir = std::getenv("TZDIR");
  const std::string dir = (tzdir != nullptr && *tzdir != '\0') ? tzdir : kDefaultZoneInfoDir;
  return ::access((dir + "/" + zone).c_str(), R_OK) == 0;
}

}  // namespace

void ApplyProcessTimeZone(const std::string& zone) {
  if (IsUtcAlias(zone)) {
    ::setenv("TZ", "UTC", 1);
  } else if (ZoneFileExists(zone)) {
    // Leading ':' selects the tz database file rather than a POSIX TZ rule.
    ::setenv("TZ", (":" + zone).c_str(), 1);
  } else {
    throw ConfigError("TIMEZONE '" + zone + "' is not a known time zone");
  }
  ::tzset();
  Logger::Info("[ZonedClock] Time zone set to " + zone);
}

int64_t SystemUtcInstantSource::NowUtcMs() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

ZonedClock::ZonedClock() : source_(std::make_shared<SystemUtcInstantSource>()) {}

ZonedClock::ZonedClock(std::shared_ptr<const IUtcInstantSource> source)
    : source_(std::move(source)) {}

schedule::LocalDateTime ZonedClock::At(int64_t utc_ms) const {
  const std::time_t secs = static_cast<std::time_t>(schedule::FloorDiv(utc_ms, 1000));
  std::tm local{};
  if (::localtime_r(&secs, &local) == nullptr) {
    return schedule::LocalDateTimeFromUtcMs(utc_ms, 0);
  }
  return schedule::LocalDateTimeFromUtcMs(utc_ms, static_cast<int32_t>(local.tm_gmtoff));
}

}  // namespace mapcycle::runtime
