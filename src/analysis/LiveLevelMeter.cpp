// Repository: Retrovue-wavecast
// Component: Live Level Meter
// Purpose: Per-buffer RMS, peak and spectrum bands for recording previews.
// Copyright (c) 2025 RetroVue

#include "wavecast/analysis/LiveLevelMeter.hpp"

#include <algorithm>

#include "wavecast/analysis/SpectralOps.hpp"

namespace wavecast::analysis {

LiveLevelMeter::LiveLevelMeter(const LiveLevelMeterConfig& config) : config_(config) {}

LiveLevels LiveLevelMeter::Process(const std::vector<float>& samples) const {
  LiveLevels levels;
  const RmsPeak rp = RmsAndPeak(samples);
  levels.rms = std::min(1.0f, rp.rms);
  levels.peak = std::min(1.0f, rp.peak);
  levels.bins = FrequencyBins(samples, config_.fft_size, config_.bin_count);
  return levels;
}

}  // namespace wavecast::analysis
