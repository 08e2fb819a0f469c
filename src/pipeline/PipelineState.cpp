// Repository: Retrovue-wavecast
// Component: Pipeline State
// Purpose: State names and the legal-transition table.
// Copyright (c) 2025 RetroVue

#include "wavecast/pipeline/PipelineState.hpp"

namespace wavecast::pipeline {

const char* PipelineStateToString(PipelineState state) {
  switch (state) {
    case PipelineState::kIdle: return "Idle";
    case PipelineState::kAnalyzing: return "Analyzing";
    case PipelineState::kRenderingFrames: return "RenderingFrames";
    case PipelineState::kMuxingAudio: return "MuxingAudio";
    case PipelineState::kFinalizing: return "Finalizing";
    case PipelineState::kCompleted: return "Completed";
    case PipelineState::kFailed: return "Failed";
  }
  return "Unknown";
}

bool IsTerminal(PipelineState state) {
  return state == PipelineState::kCompleted || state == PipelineState::kFailed;
}

bool IsLegalTransition(PipelineState from, PipelineState to) {
  if (to == PipelineState::kFailed) return !IsTerminal(from);
  switch (from) {
    case PipelineState::kIdle: return to == PipelineState::kAnalyzing;
    case PipelineState::kAnalyzing: return to == PipelineState::kRenderingFrames;
    case PipelineState::kRenderingFrames: return to == PipelineState::kMuxingAudio;
    case PipelineState::kMuxingAudio: return to == PipelineState::kFinalizing;
    case PipelineState::kFinalizing: return to == PipelineState::kCompleted;
    case PipelineState::kCompleted: return false;
    case PipelineState::kFailed: return to == PipelineState::kIdle;
  }
  return false;
}

}  // namespace wavecast::pipeline
