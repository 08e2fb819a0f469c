// Repository: Retrovue-wavecast
// Component: Deterministic Wait Strategy (test only)
// Purpose: Jumps the DeterministicTimeSource to each requested deadline and
//          records the waits. No sleep, no wall-clock drift.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_TESTS_SUPPORT_DETERMINISTIC_WAIT_STRATEGY_HPP_
#define WAVECAST_TESTS_SUPPORT_DETERMINISTIC_WAIT_STRATEGY_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "DeterministicTimeSource.hpp"
#include "wavecast/timing/IWaitStrategy.hpp"

namespace wavecast::timing {

class DeterministicWaitStrategy : public IWaitStrategy {
 public:
  explicit DeterministicWaitStrategy(std::shared_ptr<DeterministicTimeSource> ts)
      : ts_(std::move(ts)) {}

  void WaitUntilMs(int64_t deadline_ms) override {
    std::function<void(int64_t)> hook;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      const int64_t now = ts_->NowMs();
      const int64_t delta = deadline_ms > now ? deadline_ms - now : 0;
      waits_.push_back(delta);
      total_waited_ms_ += delta;
      if (delta > 0) ts_->SetMs(deadline_ms);
      hook = on_wait_;
    }
    if (hook) hook(deadline_ms);
  }

  // Individual wait lengths in ms, in call order.
  std::vector<int64_t> Waits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waits_;
  }

  int64_t TotalWaitedMs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_waited_ms_;
  }

  // Called after every wait with the requested deadline.
  void SetOnWait(std::function<void(int64_t)> hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_wait_ = std::move(hook);
  }

 private:
  std::shared_ptr<DeterministicTimeSource> ts_;
  mutable std::mutex mutex_;
  std::vector<int64_t> waits_;
  int64_t total_waited_ms_ = 0;
  std::function<void(int64_t)> on_wait_;
};

}  // namespace wavecast::timing

#endif  // WAVECAST_TESTS_SUPPORT_DETERMINISTIC_WAIT_STRATEGY_HPP_
