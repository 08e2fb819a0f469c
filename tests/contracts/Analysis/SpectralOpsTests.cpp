// Repository: Retrovue-wavecast
// Component: Spectral Ops Tests
// Purpose: RMS/peak, Hann window, frequency binning and the live level meter.
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "wavecast/analysis/LiveLevelMeter.hpp"
#include "wavecast/analysis/SpectralOps.hpp"

namespace wavecast::analysis::testing {
namespace {

constexpr double kPi = 3.14159265358979323846;

std::vector<float> Sine(size_t n, double cycles_per_sample, float amplitude) {
  std::vector<float> out(n);
  for (size_t i = 0; i < n; ++i) {
    out[i] = amplitude * static_cast<float>(std::sin(2.0 * kPi * cycles_per_sample *
                                                     static_cast<double>(i)));
  }
  return out;
}

// =============================================================================
// RmsAndPeak
// =============================================================================

TEST(SpectralOpsTest, RmsAndPeakOfEmptyInputIsZero) {
  const RmsPeak rp = RmsAndPeak(std::vector<float>{});
  EXPECT_FLOAT_EQ(rp.rms, 0.0f);
  EXPECT_FLOAT_EQ(rp.peak, 0.0f);
}

TEST(SpectralOpsTest, RmsAndPeakOfSilenceIsZero) {
  const RmsPeak rp = RmsAndPeak(std::vector<float>{0.0f, 0.0f, 0.0f});
  EXPECT_FLOAT_EQ(rp.rms, 0.0f);
  EXPECT_FLOAT_EQ(rp.peak, 0.0f);
}

TEST(SpectralOpsTest, RmsAndPeakOfFullScaleSquareIsOne) {
  const RmsPeak rp = RmsAndPeak(std::vector<float>{1.0f, -1.0f, 1.0f, -1.0f});
  EXPECT_FLOAT_EQ(rp.rms, 1.0f);
  EXPECT_FLOAT_EQ(rp.peak, 1.0f);
}

TEST(SpectralOpsTest, PeakUsesMagnitude) {
  const RmsPeak rp = RmsAndPeak(std::vector<float>{0.1f, -0.8f, 0.3f});
  EXPECT_FLOAT_EQ(rp.peak, 0.8f);
  EXPECT_NEAR(rp.rms, std::sqrt((0.01 + 0.64 + 0.09) / 3.0), 1e-6);
}

TEST(SpectralOpsTest, SineRmsIsAmplitudeOverRootTwo) {
  const std::vector<float> s = Sine(44100, 440.0 / 44100.0, 0.8f);
  const RmsPeak rp = RmsAndPeak(s);
  EXPECT_NEAR(rp.rms, 0.8 / std::sqrt(2.0), 1e-3);
  EXPECT_NEAR(rp.peak, 0.8, 1e-3);
}

// =============================================================================
// Hann window
// =============================================================================

TEST(SpectralOpsTest, HannWindowIsZeroAtEdgesAndOneInTheMiddle) {
  const std::vector<float> w = HannWindow(9);
  ASSERT_EQ(w.size(), 9u);
  EXPECT_NEAR(w[0], 0.0f, 1e-6);
  EXPECT_NEAR(w[8], 0.0f, 1e-6);
  EXPECT_NEAR(w[4], 1.0f, 1e-6);
  EXPECT_NEAR(w[2], w[6], 1e-6);
}

TEST(SpectralOpsTest, PowerOfTwoDetection) {
  EXPECT_TRUE(IsPowerOfTwo(2));
  EXPECT_TRUE(IsPowerOfTwo(1024));
  EXPECT_FALSE(IsPowerOfTwo(0));
  EXPECT_FALSE(IsPowerOfTwo(1));
  EXPECT_FALSE(IsPowerOfTwo(1000));
}

// =============================================================================
// FrequencyBins
// =============================================================================

TEST(SpectralOpsTest, PureToneLandsInItsBand) {
  // Line 100 of a 1024-point FFT; 32 bands of 16 lines puts it in band 6.
  const std::vector<float> s = Sine(1024, 100.0 / 1024.0, 0.5f);
  const std::vector<float> bins = FrequencyBins(s, 1024, 32);
  ASSERT_EQ(bins.size(), 32u);
  EXPECT_NEAR(bins[6], 1.0f, 1e-5);
  for (size_t i = 0; i < bins.size(); ++i) {
    EXPECT_GE(bins[i], 0.0f);
    EXPECT_LE(bins[i], 1.0f);
    if (i != 6) EXPECT_LT(bins[i], bins[6]) << "band " << i;
  }
}

TEST(SpectralOpsTest, ShortInputGivesZeroBins) {
  const std::vector<float> bins = FrequencyBins(std::vector<float>(100, 0.5f), 1024, 32);
  ASSERT_EQ(bins.size(), 32u);
  for (float b : bins) EXPECT_FLOAT_EQ(b, 0.0f);
}

TEST(SpectralOpsTest, NonPowerOfTwoSizeGivesZeroBins) {
  const std::vector<float> s = Sine(1000, 0.1, 0.5f);
  const std::vector<float> bins = FrequencyBins(s, 1000, 16);
  ASSERT_EQ(bins.size(), 16u);
  for (float b : bins) EXPECT_FLOAT_EQ(b, 0.0f);
}

TEST(SpectralOpsTest, SilenceGivesZeroBins) {
  const std::vector<float> bins = FrequencyBins(std::vector<float>(1024, 0.0f), 1024, 32);
  for (float b : bins) EXPECT_FLOAT_EQ(b, 0.0f);
}

TEST(SpectralOpsTest, BinningIsDeterministic) {
  const std::vector<float> s = Sine(2048, 0.037, 0.7f);
  EXPECT_EQ(FrequencyBins(s, 1024, 32), FrequencyBins(s, 1024, 32));
}

// =============================================================================
// LiveLevelMeter
// =============================================================================

TEST(LiveLevelMeterTest, ReportsLevelsAndBins) {
  const LiveLevelMeter meter;
  const LiveLevels levels = meter.Process(Sine(1024, 100.0 / 1024.0, 0.5f));
  EXPECT_NEAR(levels.peak, 0.5f, 1e-2);
  EXPECT_NEAR(levels.rms, 0.5f / std::sqrt(2.0f), 1e-2);
  ASSERT_EQ(levels.bins.size(), 32u);
  EXPECT_NEAR(levels.bins[6], 1.0f, 1e-5);
}

TEST(LiveLevelMeterTest, ShortBufferStillReportsRms) {
  const LiveLevelMeter meter;
  const LiveLevels levels = meter.Process(std::vector<float>{1.0f, -1.0f});
  EXPECT_FLOAT_EQ(levels.rms, 1.0f);
  EXPECT_FLOAT_EQ(levels.peak, 1.0f);
  ASSERT_EQ(levels.bins.size(), 32u);
  for (float b : levels.bins) EXPECT_FLOAT_EQ(b, 0.0f);
}

TEST(LiveLevelMeterTest, LevelsAreClampedToUnitRange) {
  const LiveLevelMeter meter;
  const LiveLevels levels = meter.Process(std::vector<float>{3.0f, -3.0f});
  EXPECT_LE(levels.rms, 1.0f);
  EXPECT_LE(levels.peak, 1.0f);
}

}  // namespace
}  // namespace wavecast::analysis::testing
