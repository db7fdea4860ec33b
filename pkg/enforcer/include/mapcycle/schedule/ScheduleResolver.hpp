// Repository: Mapcycle-enforcer
// Component: Schedule Resolver
// Purpose: Pure mapping from (local time, schedule document) to the active map list.
// Copyright (c) 2026 RetroVue

#ifndef MAPCYCLE_SCHEDULE_RESOLVER_HPP_
#define MAPCYCLE_SCHEDULE_RESOLVER_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "mapcycle/schedule/CivilTime.hpp"
#include "mapcycle/schedule/ScheduleTypes.hpp"

namespace mapcycle::schedule {

// Operator overrides taken from the environment at startup.
struct ResolverOptions {
  // ROTATION_NAME: bypasses cycle arithmetic. Must name a declared rotation.
  std::optional<std::string> forced_rotation;
  // ROTATION_CYCLE_ANCHOR: replaces the document's cycle_anchor.
  std::optional<CivilDate> anchor_override;
};

// =============================================================================
// ScheduleResolver
// =============================================================================
//
// Stateless. Resolve() is deterministic: the same (now, doc, options) always
// yields the same ActiveSelection.
//
// Rotation arithmetic:
//   weeks_since_anchor = floor((now.date - anchor) / 7)
//   week_in_cycle      = weeks_since_anchor mod cycle_length_weeks   (>= 0)
//   rotation_index     = week_in_cycle / (cycle_length_weeks / N)
// where N is the length of the rotation sequence. Each rotation therefore
// owns a contiguous, equal run of weeks inside every cycle.
//
// Time-of-day classification truncates to the whole minute; a block covers
// its start minute through its end minute inclusive. Under the default
// windows the 14:30 minute belongs to off_peak.
class ScheduleResolver {
 public:
  static ActiveSelection Resolve(const LocalDateTime& now,
                                 const ScheduleDocument& doc,
                                 const ResolverOptions& options = {});

  // Name of the block covering minute_of_day. Throws
  // ScheduleResolutionError(kUnresolvedTimeBlock) when no block covers it.
  static std::string ClassifyTimeBlock(int32_t minute_of_day,
                                       const std::vector<TimeBlock>& blocks);

  // Rotation key active on `date`. Throws kUnknownRotation for a forced
  // rotation that is not declared.
  static std::string SelectRotation(const CivilDate& date,
                                    const ScheduleDocument& doc,
                                    const ResolverOptions& options);

  // week_in_cycle for `date`; always in [0, cycle_length_weeks).
  static int64_t WeekInCycle(const CivilDate& date, const CivilDate& anchor,
                             int32_t cycle_length_weeks);

  // Seconds from `now` until the next block start (1..86400). Used by the
  // enforcement loop to wake right after a block boundary.
  static int64_t SecondsUntilNextTransition(const LocalDateTime& now,
                                            const ScheduleDocument& doc);
};

}  // namespace mapcycle::schedule

#endif  // MAPCYCLE_SCHEDULE_RESOLVER_HPP_
