// Repository: Retrovue-wavecast
// Component: Rational Frame Rate
// Purpose: Exact frame-rate arithmetic for presentation times and frame counts.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_TIMING_RATIONAL_FPS_HPP_
#define WAVECAST_TIMING_RATIONAL_FPS_HPP_

#include <cstdint>
#include <numeric>

namespace wavecast::timing {

constexpr int64_t kMicrosPerSecond = 1000000;

// Frame rate as num/den frames per second, kept in lowest terms. Anything
// that is not strictly positive collapses to 0/1, which IsValid() rejects and
// every conversion maps to zero.
struct RationalFps {
  int64_t num = 0;
  int64_t den = 1;

  constexpr RationalFps() = default;
  constexpr RationalFps(int64_t n, int64_t d) {
    if (n > 0 && d > 0) {
      const int64_t g = std::gcd(n, d);
      num = n / g;
      den = d / g;
    } else if (n < 0 && d < 0) {
      const int64_t g = std::gcd(-n, -d);
      num = -n / g;
      den = -d / g;
    }
  }

  constexpr bool IsValid() const { return num > 0 && den > 0; }

  constexpr double ToDouble() const {
    return IsValid() ? static_cast<double>(num) / static_cast<double>(den) : 0.0;
  }

  // Whole frames in one second, rounded half up. Used for the keyframe interval.
  constexpr int64_t FramesPerSecondRounded() const {
    return IsValid() ? (2 * num + den) / (2 * den) : 0;
  }

  // Presentation time of frame N: N * den / num seconds.
  constexpr double FrameIndexToSeconds(int64_t frame_index) const {
    return IsValid() ? static_cast<double>(frame_index) * static_cast<double>(den) /
                           static_cast<double>(num)
                     : 0.0;
  }

  // floor(duration_us * num / (den * 1e6)), in integers.
  constexpr int64_t FramesFromDurationFloorUs(int64_t duration_us) const {
    return IsValid() && duration_us > 0 ? (duration_us * num) / (den * kMicrosPerSecond) : 0;
  }

  friend constexpr bool operator==(const RationalFps& a, const RationalFps& b) {
    return a.num == b.num && a.den == b.den;
  }
  friend constexpr bool operator!=(const RationalFps& a, const RationalFps& b) {
    return !(a == b);
  }
};

// Tier rates.
constexpr RationalFps FPS_15{15, 1};
constexpr RationalFps FPS_24{24, 1};
constexpr RationalFps FPS_30{30, 1};

}  // namespace wavecast::timing

#endif  // WAVECAST_TIMING_RATIONAL_FPS_HPP_
