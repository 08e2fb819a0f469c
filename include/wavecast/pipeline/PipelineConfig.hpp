// Repository: Retrovue-wavecast
// Component: Pipeline Config
// Purpose: Tunables for the generation pipeline, populated from flags by the
//          executables.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_PIPELINE_PIPELINE_CONFIG_HPP_
#define WAVECAST_PIPELINE_PIPELINE_CONFIG_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

#include "wavecast/analysis/WaveformTypes.hpp"
#include "wavecast/decode/AudioTypes.hpp"
#include "wavecast/mux/MuxSession.hpp"
#include "wavecast/mux/MuxTypes.hpp"
#include "wavecast/pipeline/RetryPolicy.hpp"
#include "wavecast/render/FrameSynthesizer.hpp"
#include "wavecast/render/PixelBufferPool.hpp"
#include "wavecast/resource/ResourceGuard.hpp"

namespace wavecast::pipeline {

struct PipelineConfig {
  RetryPolicyConfig retry;

  // Per-attempt deadline, armed when the attempt starts.
  int64_t attempt_timeout_ms = 300000;

  resource::ResourceLimits resource_limits;

  uint32_t waveform_points = analysis::kDefaultWaveformPoints;
  int decoder_chunk_frames = decode::kDefaultChunkFrames;
  size_t pixel_pool_capacity = render::kDefaultPoolCapacity;

  // Output is written to output_path + temp_suffix and renamed on success.
  std::string temp_suffix = ".partial";

  render::SynthesizerStyle style;
  mux::AudioTrackConfig audio_track;
  mux::MuxSessionOptions mux_options;
};

}  // namespace wavecast::pipeline

#endif  // WAVECAST_PIPELINE_PIPELINE_CONFIG_HPP_
