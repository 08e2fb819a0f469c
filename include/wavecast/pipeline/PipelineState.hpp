// Repository: Retrovue-wavecast
// Component: Pipeline State
// Purpose: Generation state machine states, legal transitions and progress
//          weights.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_PIPELINE_PIPELINE_STATE_HPP_
#define WAVECAST_PIPELINE_PIPELINE_STATE_HPP_

namespace wavecast::pipeline {

enum class PipelineState {
  kIdle = 0,
  kAnalyzing = 1,
  kRenderingFrames = 2,
  kMuxingAudio = 3,
  kFinalizing = 4,
  kCompleted = 5,
  kFailed = 6,
};

const char* PipelineStateToString(PipelineState state);

bool IsTerminal(PipelineState state);

// Forward along Idle -> Analyzing -> RenderingFrames -> MuxingAudio ->
// Finalizing -> Completed; any non-terminal state -> Failed; Failed -> Idle
// when a new attempt begins.
bool IsLegalTransition(PipelineState from, PipelineState to);

// Cumulative progress at the end of each phase.
constexpr double kProgressAnalysisEnd = 0.2;
constexpr double kProgressSetupEnd = 0.4;
constexpr double kProgressFramesEnd = 0.8;
constexpr double kProgressAudioEnd = 0.9;
constexpr double kProgressFinalizeEnd = 1.0;

}  // namespace wavecast::pipeline

#endif  // WAVECAST_PIPELINE_PIPELINE_STATE_HPP_
