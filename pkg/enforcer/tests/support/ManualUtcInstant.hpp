#pragma once

#include <atomic>
#include <cstdint>

#include "mapcycle/runtime/ZonedClock.hpp"

namespace mapcycle::tests {

// "Now" only moves when a test moves it. Atomic: the loop thread reads it
// while the test thread sets it.
class ManualUtcInstant : public runtime::IUtcInstantSource {
 public:
  explicit ManualUtcInstant(int64_t start_ms = 0) : now_ms_(start_ms) {}

  int64_t NowUtcMs() const override { return now_ms_.load(std::memory_order_acquire); }

  void SetMs(int64_t utc_ms) { now_ms_.store(utc_ms, std::memory_order_release); }
  void AdvanceMs(int64_t delta_ms) { now_ms_.fetch_add(delta_ms, std::memory_order_acq_rel); }

 private:
  std::atomic<int64_t> now_ms_;
};

}  // namespace mapcycle::tests
