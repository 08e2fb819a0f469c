// Repository: Retrovue-wavecast
// Component: Mux Types
// Purpose: Quality tier selection, bitrate and frame-count rules.
// Copyright (c) 2025 RetroVue

#include "wavecast/mux/MuxTypes.hpp"

#include <cmath>

namespace wavecast::mux {

const char* QualityTierToString(QualityTier tier) {
  switch (tier) {
    case QualityTier::kLow: return "Low";
    case QualityTier::kMid: return "Mid";
    case QualityTier::kHigh: return "High";
  }
  return "Unknown";
}

const char* MuxErrorToString(MuxError error) {
  switch (error) {
    case MuxError::kNone: return "None";
    case MuxError::kWriterSetupFailed: return "WriterSetupFailed";
    case MuxError::kNotReady: return "NotReady";
    case MuxError::kOutOfOrder: return "OutOfOrder";
    case MuxError::kFrameAppendFailed: return "FrameAppendFailed";
    case MuxError::kWritingFailed: return "WritingFailed";
    case MuxError::kIncomplete: return "Incomplete";
    case MuxError::kCancelled: return "Cancelled";
    case MuxError::kInvalidState: return "InvalidState";
  }
  return "Unknown";
}

int64_t VideoBitrateFor(int width, int height, const timing::RationalFps& fps) {
  const double bits = static_cast<double>(width) * static_cast<double>(height) *
                      fps.ToDouble() * kBitsPerPixelPerFrame;
  const int64_t bitrate = static_cast<int64_t>(bits);
  return bitrate < kMinVideoBitrate ? kMinVideoBitrate : bitrate;
}

VideoTrackConfig SelectVideoTier(double duration_sec) {
  VideoTrackConfig config;
  if (duration_sec > kLowTierAboveSec) {
    config.tier = QualityTier::kLow;
    config.width = 640;
    config.height = 360;
    config.fps = timing::FPS_15;
  } else if (duration_sec >= kHighTierBelowSec) {
    config.tier = QualityTier::kMid;
    config.width = 960;
    config.height = 540;
    config.fps = timing::FPS_24;
  } else {
    config.tier = QualityTier::kHigh;
    config.width = 1280;
    config.height = 720;
    config.fps = timing::FPS_30;
  }
  config.bitrate = VideoBitrateFor(config.width, config.height, config.fps);
  config.gop_size = static_cast<int>(config.fps.FramesPerSecondRounded());
  if (config.gop_size < 1) config.gop_size = 1;
  return config;
}

uint32_t TotalFramesFor(double duration_sec, const timing::RationalFps& fps) {
  if (!std::isfinite(duration_sec) || !(duration_sec > 0.0) || !fps.IsValid()) return 1;
  if (duration_sec * fps.ToDouble() >= static_cast<double>(UINT32_MAX)) return UINT32_MAX;
  // Exact rational floor on microseconds avoids 0.1 * 30 = 2.9999 artifacts.
  const int64_t duration_us = static_cast<int64_t>(
      std::llround(duration_sec * static_cast<double>(timing::kMicrosPerSecond)));
  const int64_t frames = fps.FramesFromDurationFloorUs(duration_us);
  if (frames < 1) return 1;
  if (frames > static_cast<int64_t>(UINT32_MAX)) return UINT32_MAX;
  return static_cast<uint32_t>(frames);
}

}  // namespace wavecast::mux
