// Repository: Retrovue-wavecast
// Component: Waveform Types
// Purpose: Waveform points and the fixed-length waveform produced by analysis.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_ANALYSIS_WAVEFORM_TYPES_HPP_
#define WAVECAST_ANALYSIS_WAVEFORM_TYPES_HPP_

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace wavecast::analysis {

constexpr uint32_t kMinWaveformPoints = 1;
constexpr uint32_t kMaxWaveformPoints = 500;
constexpr uint32_t kDefaultWaveformPoints = 200;

constexpr uint32_t ClampPointCount(uint32_t requested) {
  return requested < kMinWaveformPoints   ? kMinWaveformPoints
         : requested > kMaxWaveformPoints ? kMaxWaveformPoints
                                          : requested;
}

// Longest source the pipeline will size itself from, whether the length comes
// from the container or from a caller's hint.
constexpr double kMaxSourceDurationSec = 24.0 * 60.0 * 60.0;

inline bool IsUsableDuration(double seconds) {
  return std::isfinite(seconds) && seconds > 0.0 && seconds <= kMaxSourceDurationSec;
}

struct WaveformPoint {
  float timestamp = 0.0f;  // seconds
  float amplitude = 0.0f;  // RMS, [0, 1]
  float peak = 0.0f;       // [0, 1]
};

// WaveformData is allocated once with its final point count and filled in
// place by WaveformAnalyzer; the count never changes afterwards. A
// default-constructed instance has no points and drives the synthesizer's
// placeholder animation.
class WaveformData {
 public:
  WaveformData() = default;
  WaveformData(uint32_t point_count, double duration_sec, int sample_rate)
      : points_(ClampPointCount(point_count)),
        duration_sec_(duration_sec),
        sample_rate_(sample_rate) {}

  const std::vector<WaveformPoint>& points() const { return points_; }
  size_t PointCount() const { return points_.size(); }
  bool Empty() const { return points_.empty(); }
  double DurationSec() const { return duration_sec_; }
  int SampleRate() const { return sample_rate_; }

  // Writers (analysis only).
  WaveformPoint& MutablePoint(size_t index) { return points_[index]; }

 private:
  std::vector<WaveformPoint> points_;
  double duration_sec_ = 0.0;
  int sample_rate_ = 0;
};

}  // namespace wavecast::analysis

#endif  // WAVECAST_ANALYSIS_WAVEFORM_TYPES_HPP_
