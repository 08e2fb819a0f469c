// Repository: Retrovue-wavecast
// Component: Retry Policy
// Purpose: Pure retry/abort decision and exponential backoff schedule.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_PIPELINE_RETRY_POLICY_HPP_
#define WAVECAST_PIPELINE_RETRY_POLICY_HPP_

#include <cstdint>

#include "wavecast/pipeline/GenerationError.hpp"

namespace wavecast::pipeline {

struct RetryPolicyConfig {
  int max_attempts = 3;
  int64_t base_delay_ms = 1000;
};

enum class RetryAction {
  kRetry,      // Retryable and attempts remain
  kAbort,      // Not retryable; propagate the error as-is
  kExhausted,  // Retryable but this was the last attempt
};

const char* RetryActionToString(RetryAction action);

// attempt is 1-based and refers to the attempt that just failed.
RetryAction ClassifyFailure(GenerationError error, int attempt, int max_attempts);

// Delay slept before attempt n: base * 2^(n-2) for n >= 2, 0 for the first
// attempt.
int64_t BackoffDelayBeforeAttempt(int attempt, int64_t base_delay_ms);

}  // namespace wavecast::pipeline

#endif  // WAVECAST_PIPELINE_RETRY_POLICY_HPP_
