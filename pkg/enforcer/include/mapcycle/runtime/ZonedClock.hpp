// Repository: Mapcycle-enforcer
// Component: Zoned Clock
// Purpose: Convert UTC instants into the configured local time.
// Copyright (c) 2026 RetroVue

#ifndef MAPCYCLE_RUNTIME_ZONED_CLOCK_HPP_
#define MAPCYCLE_RUNTIME_ZONED_CLOCK_HPP_

#include <cstdint>
#include <memory>
#include <string>

#include "mapcycle/schedule/CivilTime.hpp"

namespace mapcycle::runtime {

// Installs `zone` (IANA name, e.g. "Europe/Berlin") as the process time zone
// via TZ/tzset. Call once at startup, before any thread starts. Throws
// util::ConfigError when the zone is unknown to the system tz database.
void ApplyProcessTimeZone(const std::string& zone);

// Where ZonedClock reads "now", in milliseconds since the Unix epoch.
// Tests substitute a manually advanced instant.
class IUtcInstantSource {
 public:
  virtual ~IUtcInstantSource() = default;
  virtual int64_t NowUtcMs() const = 0;
};

// std::chrono::system_clock.
class SystemUtcInstantSource final : public IUtcInstantSource {
 public:
  int64_t NowUtcMs() const override;
};

// Local time in the process time zone (see ApplyProcessTimeZone). DST
// transitions follow the tz database.
class ZonedClock {
 public:
  // Reads the system clock.
  ZonedClock();
  explicit ZonedClock(std::shared_ptr<const IUtcInstantSource> source);

  int64_t NowUtcMs() const { return source_->NowUtcMs(); }

  schedule::LocalDateTime Now() const { return At(NowUtcMs()); }
  schedule::LocalDateTime At(int64_t utc_ms) const;

 private:
  std::shared_ptr<const IUtcInstantSource> source_;
};

}  // namespace mapcycle::runtime

#endif  // MAPCYCLE_RUNTIME_ZONED_CLOCK_HPP_
