// Repository: Mapcycle-enforcer
// Component: Rotation Diff
// Purpose: Plan the removals and additions that turn a live queue into the desired one.
// Copyright (c) 2026 RetroVue

#include "mapcycle/reconcile/RotationDiff.hpp"

#include <algorithm>

namespace mapcycle::reconcile {

MapList SimulatePlan(const MapList& live, const RotationPlan& plan) {
  MapList queue = live;
  for (const auto& map : plan.removals) {
    auto it = std::find(queue.begin(), queue.end(), map);
    if (it != queue.end()) queue.erase(it);
  }
  queue.insert(queue.end(), plan.additions.begin(), plan.additions.end());
  return queue;
}

RotationPlan ComputeRotationPlan(const MapList& live, const MapList& desired) {
  std::vector<bool> kept(live.size(), false);
  size_t cursor = 0;
  size_t prefix = 0;
  for (; prefix < desired.size(); ++prefix) {
    auto it = std::find(live.begin() + static_cast<std::ptrdiff_t>(cursor), live.end(),
                        desired[prefix]);
    if (it == live.end()) break;
    const size_t slot = static_cast<size_t>(it - live.begin());
    kept[slot] = true;
    cursor = slot + 1;
  }

  RotationPlan plan;
  for (size_t i = 0; i < live.size(); ++i) {
    if (!kept[i]) plan.removals.push_back(live[i]);
  }
  plan.additions.assign(desired.begin() + static_cast<std::ptrdiff_t>(prefix), desired.end());

  if (SimulatePlan(live, plan) == desired) return plan;

  RotationPlan replace;
  replace.removals = live;
  replace.additions = desired;
  replace.full_replace = true;
  return replace;
}

}  // namespace mapcycle::reconcile
