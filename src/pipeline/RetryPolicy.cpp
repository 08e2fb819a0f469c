// Repository: Retrovue-wavecast
// Component: Retry Policy
// Purpose: Error classification, retry/abort decision and backoff schedule.
// Copyright (c) 2025 RetroVue

#include "wavecast/pipeline/RetryPolicy.hpp"

#include <limits>

namespace wavecast::pipeline {

const char* GenerationErrorToString(GenerationError error) {
  switch (error) {
    case GenerationError::kNone: return "None";
    case GenerationError::kNoAudioTrack: return "NoAudioTrack";
    case GenerationError::kAnalysisFailed: return "AnalysisFailed";
    case GenerationError::kWriterSetupFailed: return "WriterSetupFailed";
    case GenerationError::kWritingFailed: return "WritingFailed";
    case GenerationError::kFrameRenderFailed: return "FrameRenderFailed";
    case GenerationError::kFrameAppendFailed: return "FrameAppendFailed";
    case GenerationError::kDiskExhausted: return "DiskExhausted";
    case GenerationError::kMemoryExhausted: return "MemoryExhausted";
    case GenerationError::kResourceCheckFailed: return "ResourceCheckFailed";
    case GenerationError::kTimeout: return "Timeout";
    case GenerationError::kCancelled: return "Cancelled";
    case GenerationError::kMaxRetriesExceeded: return "MaxRetriesExceeded";
    case GenerationError::kInvalidRequest: return "InvalidRequest";
  }
  return "Unknown";
}

bool IsRetryable(GenerationError error) {
  switch (error) {
    case GenerationError::kAnalysisFailed:
    case GenerationError::kWriterSetupFailed:
    case GenerationError::kWritingFailed:
    case GenerationError::kFrameRenderFailed:
    case GenerationError::kFrameAppendFailed:
    case GenerationError::kMemoryExhausted:
    case GenerationError::kResourceCheckFailed:
    case GenerationError::kTimeout:
      return true;
    case GenerationError::kNone:
    case GenerationError::kNoAudioTrack:
    case GenerationError::kDiskExhausted:
    case GenerationError::kCancelled:
    case GenerationError::kMaxRetriesExceeded:
    case GenerationError::kInvalidRequest:
      return false;
  }
  return false;
}

const char* RetryActionToString(RetryAction action) {
  switch (action) {
    case RetryAction::kRetry: return "Retry";
    case RetryAction::kAbort: return "Abort";
    case RetryAction::kExhausted: return "Exhausted";
  }
  return "Unknown";
}

RetryAction ClassifyFailure(GenerationError error, int attempt, int max_attempts) {
  if (!IsRetryable(error)) return RetryAction::kAbort;
  if (attempt >= max_attempts) return RetryAction::kExhausted;
  return RetryAction::kRetry;
}

int64_t BackoffDelayBeforeAttempt(int attempt, int64_t base_delay_ms) {
  if (attempt < 2 || base_delay_ms <= 0) return 0;
  int64_t delay = base_delay_ms;
  for (int i = 2; i < attempt; ++i) {
    if (delay > std::numeric_limits<int64_t>::max() / 2) {
      return std::numeric_limits<int64_t>::max();
    }
    delay *= 2;
  }
  return delay;
}

}  // namespace wavecast::pipeline
