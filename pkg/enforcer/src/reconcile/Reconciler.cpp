// Repository: Mapcycle-enforcer
// Component: Reconciler
// Purpose: Drive the live rotation to the desired list, failing over to the fallback channel.
// Copyright (c) 2026 RetroVue

#include "mapcycle/reconcile/Reconciler.hpp"

#include <utility>

#include "mapcycle/channel/ChannelError.hpp"
#include "mapcycle/util/Logger.hpp"

namespace mapcycle::reconcile {

using channel::ChannelError;
using channel::IRotationChannel;
using channel::PrimaryChannelError;
using util::Logger;

namespace {

constexpr char kNoFallbackConfigured[] = "no fallback channel configured";

void CheckDeadline(std::chrono::steady_clock::time_point deadline,
                   const std::string& next_operation) {
  if (std::chrono::steady_clock::now() >= deadline) {
    throw TickDeadlineExceeded(next_operation);
  }
}

std::string JoinMaps(const MapList& maps) {
  std::string out = "[";
  for (size_t i = 0; i < maps.size(); ++i) {
    if (i > 0) out += ", ";
    out += maps[i];
  }
  return out + "]";
}

}  // namespace

const char* ChannelUsedName(ChannelUsed used) {
  switch (used) {
    case ChannelUsed::kNone:     return "none";
    case ChannelUsed::kPrimary:  return "primary";
    case ChannelUsed::kFallback: return "fallback";
  }
  return "unknown";
}

std::string EnforcementResult::Summary() const {
  std::string out = ChannelUsedName(channel_used);
  if (!succeeded) {
    out += ": failed";
    if (primary_error.has_value()) out += " (primary: " + *primary_error + ")";
    if (fallback_error.has_value()) out += " (fallback: " + *fallback_error + ")";
    return out;
  }
  if (no_op) return out + ": no change";
  out += ": -" + std::to_string(removed.size()) + " +" + std::to_string(added.size());
  if (full_replace) out += " (full replace)";
  return out;
}

Reconciler::Reconciler(std::shared_ptr<IRotationChannel> primary,
                       channel::RotationChannelFactory fallback_factory)
    : primary_(std::move(primary)), fallback_factory_(std::move(fallback_factory)) {}

EnforcementResult Reconciler::Enforce(const schedule::ActiveSelection& selection,
                                      std::chrono::steady_clock::time_point deadline) {
  EnforcementResult result;

  try {
    result.channel_used = ChannelUsed::kPrimary;
    ApplyOn(*primary_, selection.desired_maps, deadline, result);
    result.succeeded = true;
    return result;
  } catch (const PrimaryChannelError& e) {
    result.primary_error = e.what();
    Logger::Warn("[Reconciler] " + selection.Describe() + ": " + e.what() +
                 (e.transient() ? " (transient)" : ""));
  }

  if (!HasFallback()) {
    result.fallback_error = kNoFallbackConfigured;
    Logger::Error("[Reconciler] " + selection.Describe() +
                  ": primary failed and no fallback channel is configured");
    return result;
  }

  CheckDeadline(deadline, "fallback connect (primary: " + *result.primary_error + ")");
  result.channel_used = ChannelUsed::kFallback;
  Logger::Info("[Reconciler] " + selection.Describe() + ": switching to fallback channel");
  try {
    std::unique_ptr<IRotationChannel> fallback = fallback_factory_();
    ApplyOn(*fallback, selection.desired_maps, deadline, result);
    result.succeeded = true;
  } catch (const ChannelError& e) {
    result.fallback_error = e.what();
    Logger::Error("[Reconciler] " + selection.Describe() + ": " + e.what());
  }
  return result;
}

void Reconciler::ApplyOn(IRotationChannel& channel, const MapList& desired,
                         std::chrono::steady_clock::time_point deadline,
                         EnforcementResult& result) {
  result.removed.clear();
  result.added.clear();
  result.no_op = false;
  result.full_replace = false;

  channel.SetDeadline(deadline);
  CheckDeadline(deadline, std::string(channel.Name()) + " list");
  const MapList live = channel.ListRotation();

  const RotationPlan plan = ComputeRotationPlan(live, desired);
  if (plan.IsNoOp()) {
    result.no_op = true;
    Logger::Debug(std::string("[Reconciler] ") + channel.Name() + ": rotation already " +
                  JoinMaps(desired));
    return;
  }
  result.full_replace = plan.full_replace;
  Logger::Info(std::string("[Reconciler] ") + channel.Name() + ": live " + JoinMaps(live) +
               " -> desired " + JoinMaps(desired) + " (remove " + JoinMaps(plan.removals) +
               ", add " + JoinMaps(plan.additions) + ")");

  if (!plan.removals.empty()) {
    CheckDeadline(deadline, std::string(channel.Name()) + " remove");
    channel.RemoveMaps(plan.removals);
    result.removed = plan.removals;
  }
  if (!plan.additions.empty()) {
    CheckDeadline(deadline, std::string(channel.Name()) + " add");
    channel.AddMaps(plan.additions);
    result.added = plan.additions;
  }
  // A batch that ran past the deadline still fails the tick.
  CheckDeadline(deadline, std::string(channel.Name()) + " reported success");
}

}  // namespace mapcycle::reconcile
