// Repository: Retrovue-wavecast
// Component: Stop Signal
// Purpose: Combines caller cancellation with an attempt deadline into the one
//          predicate every suspension point polls.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_TIMING_STOP_SIGNAL_HPP_
#define WAVECAST_TIMING_STOP_SIGNAL_HPP_

#include <atomic>
#include <cstdint>
#include <limits>

#include "wavecast/timing/ITimeSource.hpp"
#include "wavecast/timing/IWaitStrategy.hpp"

namespace wavecast::timing {

// StopSignal is a cheap, copyable view over:
//   - an optional caller-owned cancel flag (set from any thread), and
//   - an optional deadline on an ITimeSource (the attempt timeout).
// A default-constructed StopSignal never fires.
//
// The pointed-to flag and clock must outlive every copy.
class StopSignal {
 public:
  static constexpr int64_t kNoDeadline = std::numeric_limits<int64_t>::max();

  StopSignal() = default;
  StopSignal(const std::atomic<bool>* cancel_flag,
             const ITimeSource* clock,
             int64_t deadline_ms)
      : cancel_flag_(cancel_flag), clock_(clock), deadline_ms_(deadline_ms) {}

  bool Cancelled() const {
    return cancel_flag_ != nullptr &&
           cancel_flag_->load(std::memory_order_acquire);
  }

  bool DeadlineExpired() const {
    return clock_ != nullptr && deadline_ms_ != kNoDeadline &&
           clock_->NowMs() >= deadline_ms_;
  }

  bool StopRequested() const { return Cancelled() || DeadlineExpired(); }

  // Waits until wake_ms in slices of at most slice_ms, returning early when a
  // stop is requested. Returns true if the full wait elapsed.
  bool SleepUntil(IWaitStrategy& wait, const ITimeSource& clock,
                  int64_t wake_ms, int64_t slice_ms = 10) const {
    for (;;) {
      if (StopRequested()) return false;
      const int64_t now = clock.NowMs();
      if (now >= wake_ms) return true;
      int64_t next = now + slice_ms;
      if (next > wake_ms) next = wake_ms;
      wait.WaitUntilMs(next);
    }
  }

 private:
  const std::atomic<bool>* cancel_flag_ = nullptr;
  const ITimeSource* clock_ = nullptr;
  int64_t deadline_ms_ = kNoDeadline;
};

// now_ms + delay_ms, saturating at StopSignal::kNoDeadline. A negative delay
// counts as zero.
inline int64_t DeadlineAfter(int64_t now_ms, int64_t delay_ms) {
  if (delay_ms <= 0) return now_ms;
  if (now_ms > StopSignal::kNoDeadline - delay_ms) return StopSignal::kNoDeadline;
  return now_ms + delay_ms;
}

}  // namespace wavecast::timing

#endif  // WAVECAST_TIMING_STOP_SIGNAL_HPP_
