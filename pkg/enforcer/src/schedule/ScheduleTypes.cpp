// Repository: Mapcycle-enforcer
// Component: Schedule Types
// Purpose: Schedule document model, time blocks, active selection, resolution errors.
// Copyright (c) 2026 RetroVue

#include "mapcycle/schedule/ScheduleTypes.hpp"

namespace mapcycle::schedule {

std::vector<TimeBlock> DefaultTimeBlocks() {
  return {
      TimeBlock{kOffPeakBlock, 0, 14 * 60 + 30},
      TimeBlock{kPeakBlock, 14 * 60 + 31, 23 * 60 + 59},
  };
}

CivilDate DefaultCycleAnchor() {
  return CivilDate{2025, 1, 1};
}

std::vector<std::string> ScheduleDocument::RotationSequence() const {
  if (!rotation_order.empty()) return rotation_order;
  std::vector<std::string> names;
  names.reserve(rotations.size());
  for (const auto& [name, weekly] : rotations) {
    names.push_back(name);
  }
  return names;
}

std::optional<std::string> ScheduleDocument::FindRotation(const std::string& name) const {
  if (name.empty()) return std::nullopt;
  if (rotations.count(name) > 0) return name;
  const std::string prefixed = std::string(kRotationKeyPrefix) + name;
  if (rotations.count(prefixed) > 0) return prefixed;
  return std::nullopt;
}

std::string ActiveSelection::Describe() const {
  return rotation_name + "/" + WeekdayName(weekday) + "/" + block_name;
}

const char* ResolutionFailureName(ResolutionFailure failure) {
  switch (failure) {
    case ResolutionFailure::kUnresolvedTimeBlock: return "UnresolvedTimeBlock";
    case ResolutionFailure::kUnknownRotation:     return "UnknownRotation";
    case ResolutionFailure::kScheduleLookupMiss:  return "ScheduleLookupMiss";
  }
  return "Unknown";
}

}  // namespace mapcycle::schedule
