// Repository: Mapcycle-enforcer
// Component: Schedule Resolver
// Purpose: Pure mapping from (local time, schedule document) to the active map list.
// Copyright (c) 2026 RetroVue

#include "mapcycle/schedule/ScheduleResolver.hpp"

#include <algorithm>

namespace mapcycle::schedule {

namespace {

const MapList& LookupMaps(const WeeklyMaps& weekly,
                          const std::string& rotation_name,
                          Weekday weekday,
                          const std::string& block_name) {
  auto day_it = weekly.find(weekday);
  if (day_it == weekly.end()) {
    throw ScheduleResolutionError(
        ResolutionFailure::kScheduleLookupMiss,
        rotation_name + "." + WeekdayName(weekday) + " is not declared");
  }
  auto block_it = day_it->second.find(block_name);
  if (block_it == day_it->second.end()) {
    throw ScheduleResolutionError(
        ResolutionFailure::kScheduleLookupMiss,
        rotation_name + "." + WeekdayName(weekday) + "." + block_name + " is not declared");
  }
  return block_it->second;
}

}  // namespace

ActiveSelection ScheduleResolver::Resolve(const LocalDateTime& now,
                                          const ScheduleDocument& doc,
                                          const ResolverOptions& options) {
  ActiveSelection selection;
  selection.weekday = now.weekday;
  selection.block_name = ClassifyTimeBlock(now.MinuteOfDay(), doc.EffectiveTimeBlocks());

  if (doc.UsesExplicitSchedule()) {
    // Rotations, cycle arithmetic and the forced rotation do not apply.
    selection.rotation_name = kExplicitScheduleName;
    selection.desired_maps = LookupMaps(*doc.explicit_schedule, selection.rotation_name,
                                        now.weekday, selection.block_name);
    return selection;
  }

  selection.rotation_name = SelectRotation(now.date, doc, options);
  const auto& weekly = doc.rotations.at(selection.rotation_name);
  selection.desired_maps =
      LookupMaps(weekly, selection.rotation_name, now.weekday, selection.block_name);
  return selection;
}

std::string ScheduleResolver::ClassifyTimeBlock(int32_t minute_of_day,
                                                const std::vector<TimeBlock>& blocks) {
  for (const auto& block : blocks) {
    if (block.Contains(minute_of_day)) return block.name;
  }
  throw ScheduleResolutionError(
      ResolutionFailure::kUnresolvedTimeBlock,
      "no time block covers " + FormatClockMinute(minute_of_day));
}

std::string ScheduleResolver::SelectRotation(const CivilDate& date,
                                             const ScheduleDocument& doc,
                                             const ResolverOptions& options) {
  if (options.forced_rotation.has_value()) {
    auto key = doc.FindRotation(*options.forced_rotation);
    if (!key.has_value()) {
      throw ScheduleResolutionError(
          ResolutionFailure::kUnknownRotation,
          "forced rotation '" + *options.forced_rotation + "' is not declared");
    }
    return *key;
  }

  const auto sequence = doc.RotationSequence();
  if (sequence.empty()) {
    throw ScheduleResolutionError(ResolutionFailure::kUnknownRotation,
                                  "document declares no rotations");
  }

  const CivilDate anchor = options.anchor_override.value_or(doc.EffectiveAnchor());
  const int32_t cycle = std::max<int32_t>(1, doc.cycle_length_weeks);
  const int64_t week_in_cycle = WeekInCycle(date, anchor, cycle);

  // The loader guarantees cycle is a multiple of the sequence length; the
  // clamp keeps a hand-built document from indexing past the end.
  const int64_t weeks_per_rotation =
      std::max<int64_t>(1, cycle / static_cast<int64_t>(sequence.size()));
  const size_t index = std::min(static_cast<size_t>(week_in_cycle / weeks_per_rotation),
                                sequence.size() - 1);
  return sequence[index];
}

int64_t ScheduleResolver::WeekInCycle(const CivilDate& date, const CivilDate& anchor,
                                      int32_t cycle_length_weeks) {
  const int64_t days = DaysFromCivil(date) - DaysFromCivil(anchor);
  const int64_t weeks_since_anchor = FloorDiv(days, 7);
  return FloorMod(weeks_since_anchor, std::max<int32_t>(1, cycle_length_weeks));
}

int64_t ScheduleResolver::SecondsUntilNextTransition(const LocalDateTime& now,
                                                     const ScheduleDocument& doc) {
  const int64_t now_sod = now.SecondOfDay();
  int64_t best = kSecondsPerDay;
  for (const auto& block : doc.EffectiveTimeBlocks()) {
    int64_t delta = static_cast<int64_t>(block.start_minute) * 60 - now_sod;
    if (delta <= 0) delta += kSecondsPerDay;
    best = std::min(best, delta);
  }
  return best;
}

}  // namespace mapcycle::schedule
