// Repository: Retrovue-wavecast
// Component: Generation Types
// Purpose: Request, progress and result types exchanged with callers.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_PIPELINE_GENERATION_TYPES_HPP_
#define WAVECAST_PIPELINE_GENERATION_TYPES_HPP_

#include <cstdint>
#include <functional>
#include <string>

#include "wavecast/avatar/AvatarLoader.hpp"
#include "wavecast/pipeline/GenerationError.hpp"
#include "wavecast/pipeline/PipelineState.hpp"
#include "wavecast/render/PixelBuffer.hpp"

namespace wavecast::pipeline {

struct GenerationRequest {
  std::string job_id;        // Optional; assigned by the worker when empty
  std::string input_uri;     // Anything libavformat can open
  std::string output_path;   // Final MP4 path
  std::string username;
  render::Rgba accent{0x1d, 0x9b, 0xf0, 255};
  avatar::AvatarSource avatar;
  double duration_hint_sec = 0.0;  // Used when the container reports none
  uint32_t waveform_points = 0;    // 0 = PipelineConfig default
};

struct ProgressUpdate {
  double progress = 0.0;  // [0, 1], non-decreasing within an attempt
  PipelineState state = PipelineState::kIdle;
  int attempt = 0;
};

using ProgressCallback = std::function<void(const ProgressUpdate&)>;

struct GenerationResult {
  bool success;
  std::string output_path;
  GenerationError error;
  GenerationError underlying;  // Equals error unless error wraps another
  std::string detail;
  int attempts;

  static GenerationResult Success(const std::string& path, int attempts) {
    return {true, path, GenerationError::kNone, GenerationError::kNone, "", attempts};
  }

  static GenerationResult Failure(GenerationError err, GenerationError underlying,
                                  const std::string& detail, int attempts) {
    return {false, "", err, underlying, detail, attempts};
  }
};

}  // namespace wavecast::pipeline

#endif  // WAVECAST_PIPELINE_GENERATION_TYPES_HPP_
