// Repository: Retrovue-wavecast
// Component: Generation Error
// Purpose: Final error classification for one generation request.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_PIPELINE_GENERATION_ERROR_HPP_
#define WAVECAST_PIPELINE_GENERATION_ERROR_HPP_

namespace wavecast::pipeline {

enum class GenerationError {
  kNone = 0,
  kNoAudioTrack,
  kAnalysisFailed,
  kWriterSetupFailed,
  kWritingFailed,
  kFrameRenderFailed,
  kFrameAppendFailed,
  kDiskExhausted,
  kMemoryExhausted,
  kResourceCheckFailed,  // Disk or memory could not be measured
  kTimeout,
  kCancelled,
  kMaxRetriesExceeded,  // Wraps the last underlying error
  kInvalidRequest,
};

const char* GenerationErrorToString(GenerationError error);

// Whether a fresh attempt may succeed where this one failed.
bool IsRetryable(GenerationError error);

}  // namespace wavecast::pipeline

#endif  // WAVECAST_PIPELINE_GENERATION_ERROR_HPP_
