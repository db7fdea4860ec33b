// Repository: Mapcycle-enforcer
// Component: Schedule Document Loader
// Purpose: Parse and validate the weekly rotation JSON document.
// Copyright (c) 2026 RetroVue

#ifndef MAPCYCLE_SCHEDULE_DOCUMENT_LOADER_HPP_
#define MAPCYCLE_SCHEDULE_DOCUMENT_LOADER_HPP_

#include <string>

#include "mapcycle/schedule/ScheduleTypes.hpp"

namespace mapcycle::schedule {

// Document layout:
//
//   {
//     "cycle_length_weeks": 4,
//     "cycle_anchor": "2025-01-06",
//     "rotation_order": ["a", "rotation_b"],
//     "time_blocks": { "off_peak": {"from": "00:00", "to": "14:30"}, ... },
//     "rotation_a": { "monday": { "off_peak": ["map1", ...], "peak": [...] }, ... },
//     "rotation_b": { ... },
//     "schedule":   { "monday": { ... } }          // optional escape hatch
//   }
//
// Every top-level object that is not a reserved key is a rotation. Keys
// starting with '_' or '$' are treated as metadata and skipped.
//
// All failures throw util::ConfigError naming the origin and the offending
// key path.
class ScheduleDocumentLoader {
 public:
  static ScheduleDocument LoadFile(const std::string& path);
  static ScheduleDocument LoadString(const std::string& json_text,
                                     const std::string& origin = "<inline>");

  // Structural invariants. Called by the Load* functions; exposed for
  // documents assembled in code.
  static void Validate(const ScheduleDocument& doc, const std::string& origin);
};

}  // namespace mapcycle::schedule

#endif  // MAPCYCLE_SCHEDULE_DOCUMENT_LOADER_HPP_
