// Repository: Retrovue-wavecast
// Component: Live Level Meter
// Purpose: Per-buffer RMS, peak and spectrum bands for recording previews.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_ANALYSIS_LIVE_LEVEL_METER_HPP_
#define WAVECAST_ANALYSIS_LIVE_LEVEL_METER_HPP_

#include <cstddef>
#include <vector>

namespace wavecast::analysis {

struct LiveLevels {
  float rms = 0.0f;
  float peak = 0.0f;
  std::vector<float> bins;  // bin_count values in [0, 1]
};

struct LiveLevelMeterConfig {
  size_t fft_size = 1024;
  size_t bin_count = 32;
};

// Stateless apart from its configuration; safe to share across threads.
class LiveLevelMeter {
 public:
  explicit LiveLevelMeter(const LiveLevelMeterConfig& config = LiveLevelMeterConfig());

  // bins are computed over the first fft_size samples; shorter buffers yield
  // all-zero bins but still report rms and peak.
  LiveLevels Process(const std::vector<float>& samples) const;

  const LiveLevelMeterConfig& config() const { return config_; }

 private:
  LiveLevelMeterConfig config_;
};

}  // namespace wavecast::analysis

#endif  // WAVECAST_ANALYSIS_LIVE_LEVEL_METER_HPP_
