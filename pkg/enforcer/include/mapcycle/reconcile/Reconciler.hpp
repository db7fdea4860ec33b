// Repository: Mapcycle-enforcer
// Component: Reconciler
// Purpose: Drive the live rotation to the desired list, failing over to the fallback channel.
// Copyright (c) 2026 RetroVue

#ifndef MAPCYCLE_RECONCILE_RECONCILER_HPP_
#define MAPCYCLE_RECONCILE_RECONCILER_HPP_

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "mapcycle/channel/IRotationChannel.hpp"
#include "mapcycle/reconcile/RotationDiff.hpp"
#include "mapcycle/schedule/ScheduleTypes.hpp"

namespace mapcycle::reconcile {

enum class ChannelUsed { kNone, kPrimary, kFallback };

const char* ChannelUsedName(ChannelUsed used);

// Outcome of one Enforce() call.
struct EnforcementResult {
  ChannelUsed channel_used = ChannelUsed::kNone;
  bool succeeded = false;
  bool no_op = false;              // live already matched desired
  bool full_replace = false;
  MapList removed;                 // removals issued on channel_used
  MapList added;                   // additions issued on channel_used
  std::optional<std::string> primary_error;
  std::optional<std::string> fallback_error;

  // "primary: no change", "fallback: -2 +3", ...
  std::string Summary() const;
};

// The tick deadline passed between remote operations.
class TickDeadlineExceeded : public std::runtime_error {
 public:
  explicit TickDeadlineExceeded(const std::string& next_operation)
      : std::runtime_error("tick deadline exceeded before " + next_operation),
        next_operation_(next_operation) {}

  const std::string& next_operation() const { return next_operation_; }

 private:
  std::string next_operation_;
};

// =============================================================================
// Reconciler
// =============================================================================
//
// Per attempt: list -> plan -> removals -> additions, all on one channel.
// Any PrimaryChannelError moves the whole attempt to a freshly opened
// fallback channel. A fallback failure ends the call with succeeded=false.
// Channel errors never escape Enforce(); TickDeadlineExceeded does.
//
// Not thread-safe. The enforcement loop serializes calls.
class Reconciler {
 public:
  // fallback_factory may be empty: primary failures then end the call.
  Reconciler(std::shared_ptr<channel::IRotationChannel> primary,
             channel::RotationChannelFactory fallback_factory);

  EnforcementResult Enforce(const schedule::ActiveSelection& selection,
                            std::chrono::steady_clock::time_point deadline);

  bool HasFallback() const { return static_cast<bool>(fallback_factory_); }

 private:
  void ApplyOn(channel::IRotationChannel& channel, const MapList& desired,
               std::chrono::steady_clock::time_point deadline, EnforcementResult& result);

  std::shared_ptr<channel::IRotationChannel> primary_;
  channel::RotationChannelFactory fallback_factory_;
};

}  // namespace mapcycle::reconcile

#endif  // MAPCYCLE_RECONCILE_RECONCILER_HPP_
