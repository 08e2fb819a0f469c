// Repository: Retrovue-wavecast
// Component: Generation Session
// Purpose: Per-request state owned by the controller for the lifetime of one
//          generation: state machine, progress, attempt counter and the
//          session-scoped avatar cache and pixel pool.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_PIPELINE_GENERATION_SESSION_HPP_
#define WAVECAST_PIPELINE_GENERATION_SESSION_HPP_

#include <cstddef>
#include <memory>
#include <mutex>

#include "wavecast/avatar/AvatarCache.hpp"
#include "wavecast/pipeline/GenerationTypes.hpp"
#include "wavecast/pipeline/PipelineState.hpp"
#include "wavecast/render/PixelBufferPool.hpp"

namespace wavecast::pipeline {

class GenerationSession {
 public:
  GenerationSession(const GenerationRequest& request, ProgressCallback on_progress);

  GenerationSession(const GenerationSession&) = delete;
  GenerationSession& operator=(const GenerationSession&) = delete;

  // Enters kIdle for attempt number `attempt` (1-based) and resets progress
  // to 0. Legal from kIdle before the first attempt or from kFailed.
  bool BeginAttempt(int attempt);

  // Returns false (and leaves the state unchanged) for an illegal transition.
  bool Transition(PipelineState to);

  // Raises progress to `progress`. Values below the current progress are
  // ignored; values above kProgressAudioEnd are held there until Complete().
  void ReportProgress(double progress);

  // Finalizing -> Completed, progress pinned to 1.0.
  bool Complete();

  // Current state -> Failed, recording the error. No-op when terminal.
  void Fail(GenerationError error);

  PipelineState state() const;
  double progress() const;
  int attempt() const;
  GenerationError last_error() const;
  const GenerationRequest& request() const { return request_; }

  avatar::AvatarCache& avatar_cache() { return avatar_cache_; }

  // Returns the pool for width x height, creating (or replacing a pool of a
  // different size) as needed.
  render::PixelBufferPool& EnsurePixelPool(int width, int height, size_t capacity);
  render::PixelBufferPool* pixel_pool() { return pixel_pool_.get(); }
  void ReleasePixelPool();

 private:
  void Publish(const ProgressUpdate& update);

  GenerationRequest request_;
  ProgressCallback on_progress_;

  mutable std::mutex mutex_;
  PipelineState state_ = PipelineState::kIdle;
  double progress_ = 0.0;
  int attempt_ = 0;
  GenerationError last_error_ = GenerationError::kNone;

  avatar::AvatarCache avatar_cache_;
  std::unique_ptr<render::PixelBufferPool> pixel_pool_;
};

}  // namespace wavecast::pipeline

#endif  // WAVECAST_PIPELINE_GENERATION_SESSION_HPP_
