// Repository: Mapcycle-enforcer
// Component: Schedule Types
// Purpose: Schedule document model, time blocks, active selection, resolution errors.
// Copyright (c) 2026 RetroVue

#ifndef MAPCYCLE_SCHEDULE_TYPES_HPP_
#define MAPCYCLE_SCHEDULE_TYPES_HPP_

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "mapcycle/schedule/CivilTime.hpp"

namespace mapcycle::schedule {

// =============================================================================
// Schedule Content
// =============================================================================

using MapList = std::vector<std::string>;            // ordered; order is significant
using BlockMaps = std::map<std::string, MapList>;    // time-block name → maps
using WeeklyMaps = std::map<Weekday, BlockMaps>;     // weekday → blocks

// Rotation keys may be written with or without this prefix in overrides and
// in rotation_order.
constexpr char kRotationKeyPrefix[] = "rotation_";

// Rotation name reported for selections made in explicit-schedule mode.
constexpr char kExplicitScheduleName[] = "schedule";

// =============================================================================
// Time Blocks
// =============================================================================

// A named window of the day. Both bounds are minutes of day and inclusive:
// the block covers every minute from start_minute through end_minute.
// start_minute > end_minute means the block wraps past midnight.
struct TimeBlock {
  std::string name;
  int32_t start_minute = 0;
  int32_t end_minute = 0;

  bool Wraps() const { return start_minute > end_minute; }

  bool Contains(int32_t minute_of_day) const {
    if (Wraps()) return minute_of_day >= start_minute || minute_of_day <= end_minute;
    return minute_of_day >= start_minute && minute_of_day <= end_minute;
  }

  bool operator==(const TimeBlock& other) const {
    return name == other.name && start_minute == other.start_minute &&
           end_minute == other.end_minute;
  }
};

constexpr char kOffPeakBlock[] = "off_peak";
constexpr char kPeakBlock[] = "peak";

// off_peak 00:00–14:30, peak 14:31–23:59.
std::vector<TimeBlock> DefaultTimeBlocks();

// 2025-01-01.
CivilDate DefaultCycleAnchor();

// =============================================================================
// Schedule Document
// =============================================================================

// Immutable after loading (see ScheduleDocumentLoader).
struct ScheduleDocument {
  int32_t cycle_length_weeks = 1;
  std::optional<CivilDate> cycle_anchor;

  // Normalized to declared rotation keys. Empty → lexical order of rotations.
  std::vector<std::string> rotation_order;

  // Explicit time-block table. Empty → DefaultTimeBlocks().
  std::vector<TimeBlock> time_blocks;

  // Declared rotations, keyed by their document key.
  std::map<std::string, WeeklyMaps> rotations;

  // Escape hatch: a single fixed weekly schedule.
  std::optional<WeeklyMaps> explicit_schedule;

  // Explicit mode applies when a schedule is present together with an
  // explicit block table, or when it is the only content.
  bool UsesExplicitSchedule() const {
    return explicit_schedule.has_value() && (!time_blocks.empty() || rotations.empty());
  }

  // The block table the resolver classifies with.
  std::vector<TimeBlock> EffectiveTimeBlocks() const {
    return time_blocks.empty() ? DefaultTimeBlocks() : time_blocks;
  }

  // rotation_order if set, else the rotation keys in lexical order.
  std::vector<std::string> RotationSequence() const;

  // Exact key, else kRotationKeyPrefix + name. nullopt when neither exists.
  std::optional<std::string> FindRotation(const std::string& name) const;

  CivilDate EffectiveAnchor() const {
    return cycle_anchor.value_or(DefaultCycleAnchor());
  }
};

// =============================================================================
// Active Selection
// =============================================================================

// Recomputed on every tick; never persisted.
struct ActiveSelection {
  std::string rotation_name;
  Weekday weekday = Weekday::kMonday;
  std::string block_name;
  MapList desired_maps;

  // "rotation_a/monday/peak", used in log lines.
  std::string Describe() const;

  bool operator==(const ActiveSelection& other) const {
    return rotation_name == other.rotation_name && weekday == other.weekday &&
           block_name == other.block_name && desired_maps == other.desired_maps;
  }
  bool operator!=(const ActiveSelection& other) const { return !(*this == other); }
};

// =============================================================================
// Resolution Errors
// =============================================================================

enum class ResolutionFailure {
  // The instant falls outside every block of an explicit table.
  kUnresolvedTimeBlock,
  // Forced rotation does not exist in the document.
  kUnknownRotation,
  // rotation/weekday/block key path is absent.
  kScheduleLookupMiss,
};

const char* ResolutionFailureName(ResolutionFailure failure);

// Tick-local: the loop logs it and skips the tick.
class ScheduleResolutionError : public std::runtime_error {
 public:
  ScheduleResolutionError(ResolutionFailure failure, const std::string& detail)
      : std::runtime_error(std::string(ResolutionFailureName(failure)) + ": " + detail),
        failure_(failure) {}

  ResolutionFailure failure() const { return failure_; }

 private:
  ResolutionFailure failure_;
};

}  // namespace mapcycle::schedule

#endif  // MAPCYCLE_SCHEDULE_TYPES_HPP_
