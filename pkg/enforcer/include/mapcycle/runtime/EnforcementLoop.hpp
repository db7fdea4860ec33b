// Repository: Mapcycle-enforcer
// Component: Enforcement Loop
// Purpose: Periodic resolve-then-enforce driver with cooperative cancellation.
// Copyright (c) 2026 RetroVue

#ifndef MAPCYCLE_RUNTIME_ENFORCEMENT_LOOP_HPP_
#define MAPCYCLE_RUNTIME_ENFORCEMENT_LOOP_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "mapcycle/reconcile/Reconciler.hpp"
#include "mapcycle/runtime/ZonedClock.hpp"
#include "mapcycle/schedule/ScheduleResolver.hpp"
#include "mapcycle/schedule/ScheduleTypes.hpp"

namespace mapcycle::runtime {

enum class TickOutcome {
  kNoChange,
  kApplied,
  kResolutionFailed,
  kChannelFailed,
  kDeadlineExceeded,
};

const char* TickOutcomeName(TickOutcome outcome);

struct TickReport {
  uint64_t sequence = 0;
  int64_t started_utc_ms = 0;
  int64_t finished_utc_ms = 0;
  TickOutcome outcome = TickOutcome::kNoChange;
  std::optional<schedule::ActiveSelection> selection;
  std::optional<reconcile::EnforcementResult> result;
  std::string detail;

  bool ok() const {
    return outcome == TickOutcome::kNoChange || outcome == TickOutcome::kApplied;
  }
};

struct LoopCounters {
  uint64_t ticks = 0;
  uint64_t applied = 0;
  uint64_t no_change = 0;
  uint64_t resolution_failures = 0;
  uint64_t channel_failures = 0;
  uint64_t deadline_failures = 0;
  uint64_t fallback_ticks = 0;  // ticks that ended on the fallback channel
};

struct EnforcementLoopOptions {
  std::chrono::milliseconds interval{std::chrono::seconds(60)};
  std::chrono::milliseconds tick_timeout{std::chrono::seconds(45)};
  // Shorten the wait so a tick runs just after each block boundary.
  bool follow_block_transitions = true;
};

// =============================================================================
// EnforcementLoop
// =============================================================================
//
// Start() spawns one worker thread that runs a tick, then waits for the
// next interval, a stop request or an immediate-tick request.
//
// Ticks never overlap: RunTick() holds the tick mutex, whether it is called
// by the worker, by the control service, or directly (--once mode).
// RunTick() never throws; every failure becomes a TickReport.
//
// RequestStop() stops scheduling new ticks. An in-flight tick completes
// (bounded by tick_timeout) before the worker exits.
class EnforcementLoop {
 public:
  EnforcementLoop(std::shared_ptr<const schedule::ScheduleDocument> document,
                  schedule::ResolverOptions resolver_options,
                  std::shared_ptr<ZonedClock> clock,
                  std::shared_ptr<reconcile::Reconciler> reconciler,
                  EnforcementLoopOptions options);
  ~EnforcementLoop();

  EnforcementLoop(const EnforcementLoop&) = delete;
  EnforcementLoop& operator=(const EnforcementLoop&) = delete;

  void Start();
  void RequestStop();
  void Join();
  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  // Wakes the worker early. No-op while stopped.
  void RequestImmediateTick();

  TickReport RunTick();

  // Resolves the selection for an arbitrary instant without touching the
  // server. Throws schedule::ScheduleResolutionError.
  schedule::ActiveSelection Preview(int64_t utc_ms) const;

  int64_t NowUtcMs() const { return clock_->NowUtcMs(); }

  std::optional<TickReport> LastReport() const;
  LoopCounters Counters() const;

  // Wait before the next scheduled tick, measured from now.
  std::chrono::milliseconds NextWait() const;

 private:
  void Run();
  void Record(const TickReport& report);

  std::shared_ptr<const schedule::ScheduleDocument> document_;
  schedule::ResolverOptions resolver_options_;
  std::shared_ptr<ZonedClock> clock_;
  std::shared_ptr<reconcile::Reconciler> reconciler_;
  EnforcementLoopOptions options_;

  std::mutex tick_mutex_;
  uint64_t next_sequence_ = 1;  // guarded by tick_mutex_

  mutable std::mutex state_mutex_;
  std::condition_variable wake_cv_;
  bool stop_requested_ = false;   // guarded by state_mutex_
  bool tick_requested_ = false;   // guarded by state_mutex_
  std::optional<TickReport> last_report_;
  LoopCounters counters_;

  std::atomic<bool> running_{false};
  std::thread worker_;
};

}  // namespace mapcycle::runtime

#endif  // MAPCYCLE_RUNTIME_ENFORCEMENT_LOOP_HPP_
