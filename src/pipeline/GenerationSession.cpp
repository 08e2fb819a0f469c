// Repository: Retrovue-wavecast
// Component: Generation Session
// Purpose: State machine bookkeeping and progress publication for one request.
// Copyright (c) 2025 RetroVue

#include "wavecast/pipeline/GenerationSession.hpp"

#include <sstream>
#include <utility>

#include "wavecast/util/Logger.hpp"

namespace wavecast::pipeline {

using util::Logger;

GenerationSession::GenerationSession(const GenerationRequest& request,
                                     ProgressCallback on_progress)
    : request_(request), on_progress_(std::move(on_progress)) {}

bool GenerationSession::BeginAttempt(int attempt) {
  ProgressUpdate update;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool first = state_ == PipelineState::kIdle && attempt_ == 0;
    if (!first && !IsLegalTransition(state_, PipelineState::kIdle)) {
      std::ostringstream oss;
      oss << "[GenerationSession] job=" << request_.job_id << " cannot begin attempt "
          << attempt << " from " << PipelineStateToString(state_);
      Logger::Error(oss.str());
      return false;
    }
    state_ = PipelineState::kIdle;
    attempt_ = attempt;
    progress_ = 0.0;
    update = {progress_, state_, attempt_};
  }
  Publish(update);
  return true;
}

bool GenerationSession::Transition(PipelineState to) {
  ProgressUpdate update;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!IsLegalTransition(state_, to)) {
      std::ostringstream oss;
      oss << "[GenerationSession] job=" << request_.job_id << " illegal transition "
          << PipelineStateToString(state_) << " -> " << PipelineStateToString(to);
      Logger::Error(oss.str());
      return false;
    }
    state_ = to;
    update = {progress_, state_, attempt_};
  }

  std::ostringstream oss;
  oss << "[GenerationSession] job=" << request_.job_id << " attempt=" << update.attempt
      << " state=" << PipelineStateToString(update.state);
  Logger::Debug(oss.str());
  Publish(update);
  return true;
}

void GenerationSession::ReportProgress(double progress) {
  ProgressUpdate update;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (IsTerminal(state_)) return;
    if (progress > kProgressAudioEnd) progress = kProgressAudioEnd;
    if (!(progress > progress_)) return;
    progress_ = progress;
    update = {progress_, state_, attempt_};
  }
  Publish(update);
}

bool GenerationSession::Complete() {
  ProgressUpdate update;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!IsLegalTransition(state_, PipelineState::kCompleted)) {
      std::ostringstream oss;
      oss << "[GenerationSession] job=" << request_.job_id << " cannot complete from "
          << PipelineStateToString(state_);
      Logger::Error(oss.str());
      return false;
    }
    state_ = PipelineState::kCompleted;
    progress_ = kProgressFinalizeEnd;
    update = {progress_, state_, attempt_};
  }
  Publish(update);
  return true;
}

void GenerationSession::Fail(GenerationError error) {
  ProgressUpdate update;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (IsTerminal(state_)) return;
    state_ = PipelineState::kFailed;
    last_error_ = error;
    update = {progress_, state_, attempt_};
  }
  Publish(update);
}

PipelineState GenerationSession::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

double GenerationSession::progress() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return progress_;
}

int GenerationSession::attempt() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return attempt_;
}

GenerationError GenerationSession::last_error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_error_;
}

render::PixelBufferPool& GenerationSession::EnsurePixelPool(int width, int height,
                                                            size_t capacity) {
  if (!pixel_pool_ || pixel_pool_->width() != width || pixel_pool_->height() != height ||
      pixel_pool_->Capacity() != capacity) {
    pixel_pool_ = std::make_unique<render::PixelBufferPool>(width, height, capacity);
  }
  return *pixel_pool_;
}

void GenerationSession::ReleasePixelPool() {
  if (pixel_pool_) {
    pixel_pool_->Drain();
    pixel_pool_.reset();
  }
}

// Called without mutex_ held so callbacks may query the session.
void GenerationSession::Publish(const ProgressUpdate& update) {
  if (on_progress_) on_progress_(update);
}

}  // namespace wavecast::pipeline
