// Repository: Mapcycle-enforcer
// Component: Enforcement Loop
// Purpose: Periodic resolve-then-enforce driver with cooperative cancellation.
// Copyright (c) 2026 RetroVue

#include "mapcycle/runtime/EnforcementLoop.hpp"

#include <algorithm>
#include <utility>

#include "mapcycle/util/Logger.hpp"

namespace mapcycle::runtime {

using reconcile::ChannelUsed;
using reconcile::TickDeadlineExceeded;
using schedule::ScheduleResolutionError;
using schedule::ScheduleResolver;
using util::Logger;

namespace {

// Wake slightly after a block boundary so the new block is in effect.
constexpr std::chrono::milliseconds kTransitionGrace{1000};

std::string DescribeInstant(const schedule::LocalDateTime& t) {
  return schedule::FormatIsoDate(t.date) + " " + schedule::WeekdayName(t.weekday) + " " +
         schedule::FormatClockMinute(t.MinuteOfDay());
}

}  // namespace

const char* TickOutcomeName(TickOutcome outcome) {
  switch (outcome) {
    case TickOutcome::kNoChange:          return "NO_CHANGE";
    case TickOutcome::kApplied:           return "APPLIED";
    case TickOutcome::kResolutionFailed:  return "RESOLUTION_FAILED";
    case TickOutcome::kChannelFailed:     return "CHANNEL_FAILED";
    case TickOutcome::kDeadlineExceeded:  return "DEADLINE_EXCEEDED";
  }
  return "UNKNOWN";
}

EnforcementLoop::EnforcementLoop(std::shared_ptr<const schedule::ScheduleDocument> document,
                                 schedule::ResolverOptions resolver_options,
                                 std::shared_ptr<ZonedClock> clock,
                                 std::shared_ptr<reconcile::Reconciler> reconciler,
                                 EnforcementLoopOptions options)
    : document_(std::move(document)),
      resolver_options_(std::move(resolver_options)),
      clock_(std::move(clock)),
      reconciler_(std::move(reconciler)),
      options_(options) {}

EnforcementLoop::~EnforcementLoop() {
  RequestStop();
  Join();
}

void EnforcementLoop::Start() {
  if (worker_.joinable()) return;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    stop_requested_ = false;
    tick_requested_ = false;
  }
  running_.store(true, std::memory_order_release);
  worker_ = std::thread([this] { Run(); });
  Logger::Info("[EnforcementLoop] Started (interval " +
               std::to_string(options_.interval.count()) + " ms)");
}

void EnforcementLoop::RequestStop() {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    stop_requested_ = true;
  }
  wake_cv_.notify_all();
}

void EnforcementLoop::Join() {
  if (worker_.joinable()) worker_.join();
}

void EnforcementLoop::RequestImmediateTick() {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (stop_requested_) return;
    tick_requested_ = true;
  }
  wake_cv_.notify_all();
}

void EnforcementLoop::Run() {
  while (true) {
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      if (stop_requested_) break;
      tick_requested_ = false;
    }

    RunTick();

    const auto wait = NextWait();
    std::unique_lock<std::mutex> lock(state_mutex_);
    wake_cv_.wait_for(lock, wait, [this] { return stop_requested_ || tick_requested_; });
    if (stop_requested_) break;
  }
  running_.store(false, std::memory_order_release);
  Logger::Info("[EnforcementLoop] Stopped");
}

std::chrono::milliseconds EnforcementLoop::NextWait() const {
  auto wait = options_.interval;
  if (options_.follow_block_transitions) {
    const auto now = clock_->Now();
    const auto to_boundary =
        std::chrono::seconds(ScheduleResolver::SecondsUntilNextTransition(now, *document_));
    wait = std::min<std::chrono::milliseconds>(wait, to_boundary + kTransitionGrace);
  }
  return wait;
}

schedule::ActiveSelection EnforcementLoop::Preview(int64_t utc_ms) const {
  return ScheduleResolver::Resolve(clock_->At(utc_ms), *document_, resolver_options_);
}

TickReport EnforcementLoop::RunTick() {
  std::lock_guard<std::mutex> tick_lock(tick_mutex_);

  TickReport report;
  report.sequence = next_sequence_++;
  report.started_utc_ms = clock_->NowUtcMs();
  const auto deadline = std::chrono::steady_clock::now() + options_.tick_timeout;
  const std::string tag = "[EnforcementLoop] tick " + std::to_string(report.sequence);

  const auto now = clock_->At(report.started_utc_ms);
  try {
    report.selection = ScheduleResolver::Resolve(now, *document_, resolver_options_);
  } catch (const ScheduleResolutionError& e) {
    report.outcome = TickOutcome::kResolutionFailed;
    report.detail = e.what();
    Logger::Error(tag + ": cannot resolve selection for " + DescribeInstant(now) + ": " +
                  e.what());
    report.finished_utc_ms = clock_->NowUtcMs();
    Record(report);
    return report;
  }

  const auto& selection = *report.selection;
  try {
    report.result = reconciler_->Enforce(selection, deadline);
    const auto& result = *report.result;
    report.detail = result.Summary();
    if (!result.succeeded) {
      report.outcome = TickOutcome::kChannelFailed;
      Logger::Error(tag + ": " + selection.Describe() + " not enforced via " +
                    reconcile::ChannelUsedName(result.channel_used) + ": " + report.detail);
    } else if (result.no_op) {
      report.outcome = TickOutcome::kNoChange;
      Logger::Debug(tag + ": " + selection.Describe() + " already in place (" +
                    report.detail + ")");
    } else {
      report.outcome = TickOutcome::kApplied;
      Logger::Info(tag + ": " + selection.Describe() + " enforced (" + report.detail + ")");
    }
  } catch (const TickDeadlineExceeded& e) {
    report.outcome = TickOutcome::kDeadlineExceeded;
    report.detail = e.what();
    Logger::Error(tag + ": " + selection.Describe() + ": " + e.what());
  } catch (const std::exception& e) {
    report.outcome = TickOutcome::kChannelFailed;
    report.detail = std::string("unexpected error: ") + e.what();
    Logger::Error(tag + ": " + selection.Describe() + ": " + report.detail);
  }

  report.finished_utc_ms = clock_->NowUtcMs();
  Record(report);
  return report;
}

void EnforcementLoop::Record(const TickReport& report) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  last_report_ = report;
  ++counters_.ticks;
  switch (report.outcome) {
    case TickOutcome::kNoChange:         ++counters_.no_change; break;
    case TickOutcome::kApplied:          ++counters_.applied; break;
    case TickOutcome::kResolutionFailed: ++counters_.resolution_failures; break;
    case TickOutcome::kChannelFailed:    ++counters_.channel_failures; break;
    case TickOutcome::kDeadlineExceeded: ++counters_.deadline_failures; break;
  }
  if (report.result.has_value() && report.result->channel_used == ChannelUsed::kFallback &&
      report.result->succeeded) {
    ++counters_.fallback_ticks;
  }
}

std::optional<TickReport> EnforcementLoop::LastReport() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return last_report_;
}

LoopCounters EnforcementLoop::Counters() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return counters_;
}

}  // namespace mapcycle::runtime
