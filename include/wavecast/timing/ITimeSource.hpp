// Repository: Retrovue-wavecast
// Component: Time Source Interface
// Purpose: Monotonic millisecond clock injected into deadline and backoff code.
//          Production: SystemTimeSource. Tests: a virtual clock advanced by
//          the wait strategy.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_TIMING_ITIME_SOURCE_HPP_
#define WAVECAST_TIMING_ITIME_SOURCE_HPP_

#include <chrono>
#include <cstdint>

namespace wavecast::timing {

class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowMs() const = 0;
};

class SystemTimeSource : public ITimeSource {
 public:
  int64_t NowMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        steady_clock::now().time_since_epoch()).count();
  }
};

}  // namespace wavecast::timing

#endif  // WAVECAST_TIMING_ITIME_SOURCE_HPP_
