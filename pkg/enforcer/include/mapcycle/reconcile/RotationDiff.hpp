// Repository: Mapcycle-enforcer
// Component: Rotation Diff
// Purpose: Plan the removals and additions that turn a live queue into the desired one.
// Copyright (c) 2026 RetroVue

#ifndef MAPCYCLE_RECONCILE_ROTATION_DIFF_HPP_
#define MAPCYCLE_RECONCILE_ROTATION_DIFF_HPP_

#include <string>
#include <vector>

namespace mapcycle::reconcile {

using MapList = std::vector<std::string>;

struct RotationPlan {
  MapList removals;   // issued first, in this order
  MapList additions;  // appended after removals, in this order
  bool full_replace = false;

  bool IsNoOp() const { return removals.empty() && additions.empty(); }
};

// Keeps the longest prefix of `desired` that appears as an in-order
// subsequence of `live` (earliest matching slots), removes every other live
// slot, and appends the rest of `desired`. Duplicate identifiers are
// independent slots.
//
// The plan is checked with SimulatePlan; when the channel semantics would
// not reproduce `desired` exactly, the plan degrades to a full replacement.
RotationPlan ComputeRotationPlan(const MapList& live, const MapList& desired);

// Applies `plan` to `live` the way a channel does: each removal deletes the
// first occurrence of that identifier (no-op when absent), each addition
// appends.
MapList SimulatePlan(const MapList& live, const RotationPlan& plan);

}  // namespace mapcycle::reconcile

#endif  // MAPCYCLE_RECONCILE_ROTATION_DIFF_HPP_
