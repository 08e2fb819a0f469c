// Repository: Retrovue-wavecast
// Component: Spectral Ops
// Purpose: RMS/peak reduction and windowed FFT band energies over float PCM.
// Copyright (c) 2025 RetroVue

#include "wavecast/analysis/SpectralOps.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <mutex>

#include <fftw3.h>

namespace wavecast::analysis {

namespace {

constexpr double kPi = 3.14159265358979323846;

// The FFTW planner is not re-entrant; plan creation and destruction are
// serialized. fftwf_execute on distinct plans is safe concurrently.
std::mutex& PlannerMutex() {
  static std::mutex mutex;
  return mutex;
}

struct FftwFree {
  void operator()(void* p) const { fftwf_free(p); }
};

class ScopedPlan {
 public:
  ScopedPlan(int n, float* in, fftwf_complex* out) {
    std::lock_guard<std::mutex> lock(PlannerMutex());
    // FFTW_ESTIMATE leaves the input untouched and picks the same plan every
    // time, which keeps results bit-identical across calls.
    plan_ = fftwf_plan_dft_r2c_1d(n, in, out, FFTW_ESTIMATE);
  }
  ~ScopedPlan() {
    if (plan_) {
      std::lock_guard<std::mutex> lock(PlannerMutex());
      fftwf_destroy_plan(plan_);
    }
  }
  ScopedPlan(const ScopedPlan&) = delete;
  ScopedPlan& operator=(const ScopedPlan&) = delete;

  bool valid() const { return plan_ != nullptr; }
  void Execute() const { fftwf_execute(plan_); }

 private:
  fftwf_plan plan_ = nullptr;
};

}  // namespace

RmsPeak RmsAndPeak(const float* samples, size_t count) {
  RmsPeak result;
  if (samples == nullptr || count == 0) {
    return result;
  }
  double sum_squares = 0.0;
  float peak = 0.0f;
  for (size_t i = 0; i < count; ++i) {
    const float v = samples[i];
    sum_squares += static_cast<double>(v) * static_cast<double>(v);
    peak = std::max(peak, std::fabs(v));
  }
  result.rms = static_cast<float>(std::sqrt(sum_squares / static_cast<double>(count)));
  result.peak = peak;
  return result;
}

RmsPeak RmsAndPeak(const std::vector<float>& samples) {
  return RmsAndPeak(samples.data(), samples.size());
}

std::vector<float> HannWindow(size_t n) {
  std::vector<float> window(n, 1.0f);
  if (n < 2) {
    return window;
  }
  const double denom = static_cast<double>(n - 1);
  for (size_t i = 0; i < n; ++i) {
    window[i] = static_cast<float>(0.5 * (1.0 - std::cos(2.0 * kPi * static_cast<double>(i) / denom)));
  }
  return window;
}

bool IsPowerOfTwo(size_t n) {
  return n >= 2 && (n & (n - 1)) == 0;
}

std::vector<float> FrequencyBins(const std::vector<float>& samples,
                                 size_t fft_size,
                                 size_t bin_count) {
  std::vector<float> bins(bin_count, 0.0f);
  if (bin_count == 0 || !IsPowerOfTwo(fft_size) || samples.size() < fft_size) {
    return bins;
  }

  std::unique_ptr<float, FftwFree> in(fftwf_alloc_real(fft_size));
  std::unique_ptr<fftwf_complex, FftwFree> out(fftwf_alloc_complex(fft_size / 2 + 1));
  if (!in || !out) {
    return bins;
  }

  ScopedPlan plan(static_cast<int>(fft_size), in.get(), out.get());
  if (!plan.valid()) {
    return bins;
  }

  const std::vector<float> window = HannWindow(fft_size);
  for (size_t i = 0; i < fft_size; ++i) {
    in.get()[i] = samples[i] * window[i];
  }
  plan.Execute();

  // Power spectrum of the positive-frequency half (DC .. Nyquist-1).
  const size_t half = fft_size / 2;
  std::vector<float> power(half);
  for (size_t k = 0; k < half; ++k) {
    const float re = out.get()[k][0];
    const float im = out.get()[k][1];
    power[k] = re * re + im * im;
  }

  // Average contiguous runs of the spectrum into bins. When there are more
  // bins than spectrum lines the trailing bins stay zero.
  const size_t per_bin = std::max<size_t>(1, half / bin_count);
  for (size_t b = 0; b < bin_count; ++b) {
    const size_t start = b * per_bin;
    const size_t end = std::min(start + per_bin, half);
    if (start >= end) {
      continue;
    }
    double sum = 0.0;
    for (size_t k = start; k < end; ++k) {
      sum += power[k];
    }
    bins[b] = static_cast<float>(sum / static_cast<double>(end - start));
  }

  const float max_bin = *std::max_element(bins.begin(), bins.end());
  if (max_bin <= 0.0f) {
    std::fill(bins.begin(), bins.end(), 0.0f);
    return bins;
  }
  for (float& v : bins) {
    v = std::log10(v / max_bin * 9.0f + 1.0f);
  }
  return bins;
}

}  // namespace wavecast::analysis
