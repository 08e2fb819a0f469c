// Repository: Retrovue-wavecast
// Component: Mux Types
// Purpose: Track configuration, quality tiers and typed results for the
//          output container session.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_MUX_MUX_TYPES_HPP_
#define WAVECAST_MUX_MUX_TYPES_HPP_

#include <cstdint>
#include <string>

#include "wavecast/timing/RationalFps.hpp"

namespace wavecast::mux {

// Duration tiers (seconds). Longer clips get smaller, slower video.
constexpr double kLowTierAboveSec = 180.0;
constexpr double kHighTierBelowSec = 60.0;
constexpr int64_t kMinVideoBitrate = 500000;
constexpr double kBitsPerPixelPerFrame = 0.1;

enum class QualityTier {
  kLow,   // > 180 s: 640x360 @ 15
  kMid,   // 60..180 s: 960x540 @ 24
  kHigh,  // < 60 s: 1280x720 @ 30
};

const char* QualityTierToString(QualityTier tier);

// VideoTrackConfig holds configuration for the H.264 track.
struct VideoTrackConfig {
  QualityTier tier = QualityTier::kHigh;
  int width = 1280;
  int height = 720;
  timing::RationalFps fps = timing::FPS_30;
  int64_t bitrate = 2764800;  // bits/s
  int gop_size = 30;          // one second of frames

  // Encoder name tried first; the default H.264 encoder is the fallback.
  std::string codec_name = "libx264";
  std::string preset = "veryfast";
};

// AudioTrackConfig holds configuration for the AAC track.
struct AudioTrackConfig {
  int sample_rate = 44100;
  int channels = 1;
  int64_t bitrate = 128000;
  std::string codec_name = "aac";
};

// w * h * fps * 0.1, never below 500 kbps.
int64_t VideoBitrateFor(int width, int height, const timing::RationalFps& fps);

// Picks the tier for a clip duration and fills the derived fields.
VideoTrackConfig SelectVideoTier(double duration_sec);

// floor(duration * fps), at least 1.
uint32_t TotalFramesFor(double duration_sec, const timing::RationalFps& fps);

enum class MuxError {
  kNone = 0,
  kWriterSetupFailed,   // Container/encoder could not be opened
  kNotReady,            // Readiness did not arrive in time
  kOutOfOrder,          // Frame index not strictly increasing from 0
  kFrameAppendFailed,   // Video encoder rejected a frame
  kWritingFailed,       // Audio path or packet write failed
  kIncomplete,          // Finish could not complete the container
  kCancelled,           // Stop requested
  kInvalidState,        // Operation not valid in the current session state
};

const char* MuxErrorToString(MuxError error);

struct MuxResult {
  bool ok;
  MuxError error;
  std::string detail;

  static MuxResult Success() { return {true, MuxError::kNone, ""}; }

  static MuxResult Failure(MuxError err, const std::string& detail = "") {
    return {false, err, detail};
  }
};

// OutputHandle describes a finalized container.
struct OutputHandle {
  std::string path;
  uint64_t video_frames = 0;
  uint64_t audio_frames = 0;  // sample frames
};

}  // namespace wavecast::mux

#endif  // WAVECAST_MUX_MUX_TYPES_HPP_
