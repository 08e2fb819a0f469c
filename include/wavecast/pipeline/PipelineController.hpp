// Repository: Retrovue-wavecast
// Component: Pipeline Controller
// Purpose: Runs one generation request: analysis, frame loop, audio copy and
//          finalize inside a resource-checked, deadline-bounded retry loop.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_PIPELINE_PIPELINE_CONTROLLER_HPP_
#define WAVECAST_PIPELINE_PIPELINE_CONTROLLER_HPP_

#include <atomic>
#include <functional>
#include <memory>
#include <string>

#include "wavecast/decode/IAudioDecoder.hpp"
#include "wavecast/mux/IFrameEncoder.hpp"
#include "wavecast/pipeline/GenerationSession.hpp"
#include "wavecast/pipeline/GenerationTypes.hpp"
#include "wavecast/pipeline/PipelineConfig.hpp"
#include "wavecast/resource/ResourceGuard.hpp"
#include "wavecast/timing/ITimeSource.hpp"
#include "wavecast/timing/IWaitStrategy.hpp"
#include "wavecast/timing/StopSignal.hpp"

namespace wavecast::pipeline {

using DecoderFactory =
    std::function<std::unique_ptr<decode::IAudioDecoder>(const decode::DecoderConfig&)>;
using EncoderFactory = std::function<std::unique_ptr<mux::IFrameEncoder>()>;

// Backends and clocks the controller runs against. Production wires FFmpeg and
// the system clock (MakeProductionDependencies); tests inject fakes.
struct PipelineDependencies {
  DecoderFactory make_decoder;
  EncoderFactory make_encoder;
  std::shared_ptr<resource::IResourceReader> resource_reader;
  std::shared_ptr<const timing::ITimeSource> clock;
  std::shared_ptr<timing::IWaitStrategy> wait;
};

PipelineDependencies MakeProductionDependencies();

class PipelineController {
 public:
  PipelineController(PipelineDependencies deps, const PipelineConfig& config);

  // Blocks until the request completes, fails terminally, or `cancel` is set.
  // Progress updates are delivered on the calling thread.
  GenerationResult Run(const GenerationRequest& request,
                       const std::atomic<bool>& cancel,
                       const ProgressCallback& on_progress = nullptr);

  const PipelineConfig& config() const { return config_; }

  // Returns an empty string when the request is acceptable.
  static std::string ValidateRequest(const GenerationRequest& request);

  static std::string TempPathFor(const std::string& output_path,
                                 const std::string& suffix);

 private:
  struct AttemptOutcome {
    bool ok;
    GenerationError error;
    std::string detail;
  };

  AttemptOutcome RunAttempt(GenerationSession& session,
                            const timing::StopSignal& stop,
                            const std::string& temp_path);

  static AttemptOutcome Stopped(const timing::StopSignal& stop, const char* where);
  static AttemptOutcome FromMux(const mux::MuxResult& result,
                                const timing::StopSignal& stop);

  void DiscardPartial(const std::string& temp_path) const;

  PipelineDependencies deps_;
  PipelineConfig config_;
};

}  // namespace wavecast::pipeline

#endif  // WAVECAST_PIPELINE_PIPELINE_CONTROLLER_HPP_
