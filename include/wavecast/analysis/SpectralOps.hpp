// Repository: Retrovue-wavecast
// Component: Spectral Ops
// Purpose: RMS/peak reduction and windowed FFT band energies over float PCM.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_ANALYSIS_SPECTRAL_OPS_HPP_
#define WAVECAST_ANALYSIS_SPECTRAL_OPS_HPP_

#include <cstddef>
#include <vector>

namespace wavecast::analysis {

struct RmsPeak {
  float rms = 0.0f;
  float peak = 0.0f;
};

// RMS = sqrt(mean(x^2)), peak = max(|x|). Empty input gives {0, 0}.
RmsPeak RmsAndPeak(const float* samples, size_t count);
RmsPeak RmsAndPeak(const std::vector<float>& samples);

// Hann window coefficients of length n.
std::vector<float> HannWindow(size_t n);

bool IsPowerOfTwo(size_t n);

// Windowed FFT over the first fft_size samples, reduced to bin_count
// contiguous bands of averaged power, normalized to the loudest band and
// compressed with log10(v * 9 + 1). Every value lies in [0, 1].
//
// Returns bin_count zeros when samples.size() < fft_size, when fft_size is
// not a power of two (or < 2), or when the window is silent.
std::vector<float> FrequencyBins(const std::vector<float>& samples,
                                 size_t fft_size,
                                 size_t bin_count);

}  // namespace wavecast::analysis

#endif  // WAVECAST_ANALYSIS_SPECTRAL_OPS_HPP_
