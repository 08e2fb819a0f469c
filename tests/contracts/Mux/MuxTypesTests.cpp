// Repository: Retrovue-wavecast
// Component: Mux Types Tests
// Purpose: Duration tiers, bitrate floor, keyframe interval and frame count.
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include "wavecast/mux/MuxTypes.hpp"

namespace wavecast::mux::testing {
namespace {

// =============================================================================
// Tier selection
// =============================================================================

TEST(MuxTypesTest, MidTierForTwoMinuteClip) {
  const VideoTrackConfig v = SelectVideoTier(130.0);
  EXPECT_EQ(v.tier, QualityTier::kMid);
  EXPECT_EQ(v.width, 960);
  EXPECT_EQ(v.height, 540);
  EXPECT_EQ(v.fps, timing::FPS_24);
  EXPECT_EQ(v.gop_size, 24);
}

TEST(MuxTypesTest, HighTierForShortClip) {
  const VideoTrackConfig v = SelectVideoTier(45.0);
  EXPECT_EQ(v.tier, QualityTier::kHigh);
  EXPECT_EQ(v.width, 1280);
  EXPECT_EQ(v.height, 720);
  EXPECT_EQ(v.fps, timing::FPS_30);
  EXPECT_EQ(v.gop_size, 30);
}

TEST(MuxTypesTest, LowTierAboveThreeMinutes) {
  const VideoTrackConfig v = SelectVideoTier(181.0);
  EXPECT_EQ(v.tier, QualityTier::kLow);
  EXPECT_EQ(v.width, 640);
  EXPECT_EQ(v.height, 360);
  EXPECT_EQ(v.fps, timing::FPS_15);
}

TEST(MuxTypesTest, TierBoundariesAreInclusiveForMid) {
  EXPECT_EQ(SelectVideoTier(180.0).tier, QualityTier::kMid);
  EXPECT_EQ(SelectVideoTier(60.0).tier, QualityTier::kMid);
  EXPECT_EQ(SelectVideoTier(59.999).tier, QualityTier::kHigh);
}

// =============================================================================
// Bitrate
// =============================================================================

TEST(MuxTypesTest, BitrateScalesWithPixelsAndFps) {
  EXPECT_EQ(VideoBitrateFor(1280, 720, timing::FPS_30), 2764800);
  EXPECT_EQ(VideoBitrateFor(960, 540, timing::FPS_24), 1244160);
}

TEST(MuxTypesTest, BitrateNeverBelowFloor) {
  EXPECT_EQ(VideoBitrateFor(640, 360, timing::FPS_15), kMinVideoBitrate);
  EXPECT_EQ(SelectVideoTier(600.0).bitrate, kMinVideoBitrate);
}

// =============================================================================
// Frame count
// =============================================================================

TEST(MuxTypesTest, TotalFramesIsFloorOfDurationTimesFps) {
  EXPECT_EQ(TotalFramesFor(1.0, timing::FPS_30), 30u);
  EXPECT_EQ(TotalFramesFor(0.1, timing::FPS_30), 3u);
  EXPECT_EQ(TotalFramesFor(2.5, timing::FPS_24), 60u);
  EXPECT_EQ(TotalFramesFor(1.99, timing::FPS_15), 29u);
}

TEST(MuxTypesTest, TotalFramesIsAtLeastOne) {
  EXPECT_EQ(TotalFramesFor(0.001, timing::FPS_30), 1u);
  EXPECT_EQ(TotalFramesFor(0.0, timing::FPS_30), 1u);
}

}  // namespace
}  // namespace wavecast::mux::testing
