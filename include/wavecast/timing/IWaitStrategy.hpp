// Repository: Retrovue-wavecast
// Component: Wait Strategy Interface
// Purpose: Decouple sleeping from deadline math in readiness polling and
//          retry backoff.
//          Production: RealtimeWaitStrategy sleeps until the deadline.
//          Tests: a deterministic strategy advances virtual time, no sleep.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_TIMING_IWAIT_STRATEGY_HPP_
#define WAVECAST_TIMING_IWAIT_STRATEGY_HPP_

#include <chrono>
#include <cstdint>
#include <thread>

#include "wavecast/timing/ITimeSource.hpp"

namespace wavecast::timing {

class IWaitStrategy {
 public:
  // deadline_ms is expressed in the clock of the ITimeSource paired with
  // this strategy.
  virtual void WaitUntilMs(int64_t deadline_ms) = 0;
  virtual ~IWaitStrategy() = default;
};

class RealtimeWaitStrategy : public IWaitStrategy {
 public:
  explicit RealtimeWaitStrategy(const ITimeSource& clock) : clock_(clock) {}

  void WaitUntilMs(int64_t deadline_ms) override {
    const int64_t remaining = deadline_ms - clock_.NowMs();
    if (remaining > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(remaining));
    }
  }

 private:
  const ITimeSource& clock_;
};

}  // namespace wavecast::timing

#endif  // WAVECAST_TIMING_IWAIT_STRATEGY_HPP_
