// Repository: Retrovue-wavecast
// Component: Pipeline Controller
// Purpose: Attempt sequencing, failure classification, backoff and temp-file
//          promotion for one generation request.
// Copyright (c) 2025 RetroVue

#include "wavecast/pipeline/PipelineController.hpp"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <sstream>
#include <utility>

#include <unistd.h>

#include "wavecast/analysis/WaveformAnalyzer.hpp"
#include "wavecast/decode/FFmpegAudioDecoder.hpp"
#include "wavecast/mux/FFmpegFrameEncoder.hpp"
#include "wavecast/mux/MuxSession.hpp"
#include "wavecast/render/FrameSynthesizer.hpp"
#include "wavecast/render/FrameTypes.hpp"
#include "wavecast/util/Logger.hpp"

namespace wavecast::pipeline {

using mux::MuxError;
using mux::MuxResult;
using timing::StopSignal;
using util::Logger;

namespace {

GenerationError FromResourceCheck(resource::ResourceCheck check) {
  switch (check) {
    case resource::ResourceCheck::kOk: return GenerationError::kNone;
    case resource::ResourceCheck::kDiskExhausted: return GenerationError::kDiskExhausted;
    case resource::ResourceCheck::kMemoryExhausted: return GenerationError::kMemoryExhausted;
    case resource::ResourceCheck::kReadFailed: return GenerationError::kResourceCheckFailed;
  }
  return GenerationError::kResourceCheckFailed;
}

}  // namespace

PipelineDependencies MakeProductionDependencies() {
  PipelineDependencies deps;
  deps.make_decoder = [](const decode::DecoderConfig& config) {
    return std::unique_ptr<decode::IAudioDecoder>(
        std::make_unique<decode::FFmpegAudioDecoder>(config));
  };
  deps.make_encoder = []() {
    return std::unique_ptr<mux::IFrameEncoder>(std::make_unique<mux::FFmpegFrameEncoder>());
  };
  deps.resource_reader = std::make_shared<resource::SystemResourceReader>();
  auto clock = std::make_shared<timing::SystemTimeSource>();
  deps.wait = std::make_shared<timing::RealtimeWaitStrategy>(*clock);
  deps.clock = clock;
  return deps;
}

PipelineController::PipelineController(PipelineDependencies deps, const PipelineConfig& config)
    : deps_(std::move(deps)), config_(config) {
  if (config_.retry.max_attempts < 1) config_.retry.max_attempts = 1;
  if (config_.pixel_pool_capacity < 1) config_.pixel_pool_capacity = 1;
}

std::string PipelineController::ValidateRequest(const GenerationRequest& request) {
  if (request.input_uri.empty()) return "input_uri is empty";
  if (request.output_path.empty()) return "output_path is empty";
  if (request.output_path == request.input_uri) return "output_path equals input_uri";
  if (!std::isfinite(request.duration_hint_sec)) return "duration_hint_sec is not finite";
  if (request.duration_hint_sec < 0.0) return "duration_hint_sec is negative";
  if (request.duration_hint_sec > analysis::kMaxSourceDurationSec) {
    std::ostringstream oss;
    oss << "duration_hint_sec exceeds " << analysis::kMaxSourceDurationSec << "s";
    return oss.str();
  }
  return "";
}

std::string PipelineController::TempPathFor(const std::string& output_path,
                                            const std::string& suffix) {
  return output_path + (suffix.empty() ? std::string(".partial") : suffix);
}

PipelineController::AttemptOutcome PipelineController::Stopped(const StopSignal& stop,
                                                               const char* where) {
  if (stop.Cancelled()) {
    return {false, GenerationError::kCancelled, std::string("cancelled during ") + where};
  }
  return {false, GenerationError::kTimeout, std::string("attempt deadline expired during ") + where};
}

PipelineController::AttemptOutcome PipelineController::FromMux(const MuxResult& result,
                                                               const StopSignal& stop) {
  std::string detail = std::string(mux::MuxErrorToString(result.error));
  if (!result.detail.empty()) detail += ": " + result.detail;
  switch (result.error) {
    case MuxError::kCancelled:
      return {false, stop.Cancelled() ? GenerationError::kCancelled : GenerationError::kTimeout,
              detail};
    case MuxError::kWriterSetupFailed:
      return {false, GenerationError::kWriterSetupFailed, detail};
    case MuxError::kOutOfOrder:
    case MuxError::kFrameAppendFailed:
      return {false, GenerationError::kFrameAppendFailed, detail};
    case MuxError::kNone:
    case MuxError::kNotReady:
    case MuxError::kWritingFailed:
    case MuxError::kIncomplete:
    case MuxError::kInvalidState:
      break;
  }
  return {false, GenerationError::kWritingFailed, detail};
}

void PipelineController::DiscardPartial(const std::string& temp_path) const {
  if (::unlink(temp_path.c_str()) != 0 && errno != ENOENT) {
    std::ostringstream oss;
    oss << "[PipelineController] Could not remove " << temp_path << ": " << std::strerror(errno);
    Logger::Warn(oss.str());
  }
}

GenerationResult PipelineController::Run(const GenerationRequest& request,
                                         const std::atomic<bool>& cancel,
                                         const ProgressCallback& on_progress) {
  const std::string invalid = ValidateRequest(request);
  if (!invalid.empty()) {
    Logger::Error("[PipelineController] Rejected request: " + invalid);
    return GenerationResult::Failure(GenerationError::kInvalidRequest,
                                     GenerationError::kInvalidRequest, invalid, 0);
  }

  const timing::ITimeSource& clock = *deps_.clock;
  timing::IWaitStrategy& wait = *deps_.wait;
  const std::string temp_path = TempPathFor(request.output_path, config_.temp_suffix);
  const StopSignal cancel_only(&cancel, nullptr, StopSignal::kNoDeadline);
  resource::ResourceGuard guard(deps_.resource_reader, config_.resource_limits);
  GenerationSession session(request, on_progress);

  for (int attempt = 1;; ++attempt) {
    if (attempt > 1) {
      const int64_t delay = BackoffDelayBeforeAttempt(attempt, config_.retry.base_delay_ms);
      std::ostringstream oss;
      oss << "[PipelineController] job=" << request.job_id << " backing off " << delay
          << "ms before attempt " << attempt;
      Logger::Info(oss.str());
      if (!cancel_only.SleepUntil(wait, clock, timing::DeadlineAfter(clock.NowMs(), delay))) {
        return GenerationResult::Failure(GenerationError::kCancelled, GenerationError::kCancelled,
                                         "cancelled during retry backoff", attempt - 1);
      }
    } else if (cancel_only.Cancelled()) {
      return GenerationResult::Failure(GenerationError::kCancelled, GenerationError::kCancelled,
                                       "cancelled before first attempt", 0);
    }

    session.BeginAttempt(attempt);

    AttemptOutcome outcome{false, GenerationError::kNone, ""};
    const resource::ResourceCheckResult check = guard.Check(request.output_path);
    if (!check.ok()) {
      outcome = {false, FromResourceCheck(check.status), check.detail};
    } else {
      const int64_t deadline = config_.attempt_timeout_ms > 0
                                   ? timing::DeadlineAfter(clock.NowMs(), config_.attempt_timeout_ms)
                                   : StopSignal::kNoDeadline;
      const StopSignal stop(&cancel, &clock, deadline);
      outcome = RunAttempt(session, stop, temp_path);
    }

    if (outcome.ok) {
      std::ostringstream oss;
      oss << "[PipelineController] job=" << request.job_id << " completed " << request.output_path
          << " attempts=" << attempt;
      Logger::Info(oss.str());
      return GenerationResult::Success(request.output_path, attempt);
    }

    session.Fail(outcome.error);
    DiscardPartial(temp_path);
    session.avatar_cache().Evict();
    session.ReleasePixelPool();

    const RetryAction action = ClassifyFailure(outcome.error, attempt, config_.retry.max_attempts);
    {
      std::ostringstream oss;
      oss << "[PipelineController] job=" << request.job_id << " attempt=" << attempt
          << " failed: " << GenerationErrorToString(outcome.error) << " (" << outcome.detail
          << ") action=" << RetryActionToString(action);
      Logger::Error(oss.str());
    }

    if (action == RetryAction::kAbort) {
      return GenerationResult::Failure(outcome.error, outcome.error, outcome.detail, attempt);
    }
    if (action == RetryAction::kExhausted) {
      return GenerationResult::Failure(GenerationError::kMaxRetriesExceeded, outcome.error,
                                       outcome.detail, attempt);
    }
  }
}

PipelineController::AttemptOutcome PipelineController::RunAttempt(GenerationSession& session,
                                                                  const StopSignal& stop,
                                                                  const std::string& temp_path) {
  const GenerationRequest& request = session.request();

  // ===========================================================================
  // Analysis (0 -> 0.2)
  // ===========================================================================
  session.Transition(PipelineState::kAnalyzing);

  decode::DecoderConfig decoder_config;
  decoder_config.input_uri = request.input_uri;
  decoder_config.chunk_frames = config_.decoder_chunk_frames;

  analysis::AnalysisResult analyzed = analysis::AnalysisResult::Failure(
      analysis::AnalysisError::kReaderFailure, "no decoder backend");
  {
    std::unique_ptr<decode::IAudioDecoder> decoder = deps_.make_decoder(decoder_config);
    if (decoder) {
      analysis::AnalyzerConfig analyzer_config;
      analyzer_config.target_points =
          request.waveform_points > 0 ? request.waveform_points : config_.waveform_points;
      analyzer_config.duration_hint_sec = request.duration_hint_sec;
      analyzed = analysis::WaveformAnalyzer(analyzer_config).Analyze(*decoder, stop);
    }
  }
  if (!analyzed.ok) {
    switch (analyzed.error) {
      case analysis::AnalysisError::kNoAudioTrack:
        return {false, GenerationError::kNoAudioTrack, analyzed.detail};
      case analysis::AnalysisError::kCancelled:
        return Stopped(stop, "analysis");
      case analysis::AnalysisError::kNone:
      case analysis::AnalysisError::kReaderFailure:
        break;
    }
    return {false, GenerationError::kAnalysisFailed, analyzed.detail};
  }
  session.ReportProgress(kProgressAnalysisEnd);

  const double duration = analyzed.waveform.DurationSec();
  if (!(duration > 0.0)) {
    return {false, GenerationError::kNoAudioTrack, "source has zero duration"};
  }

  // ===========================================================================
  // Setup (0.2 -> 0.4): tier, overlay assets, pool, writer
  // ===========================================================================
  const mux::VideoTrackConfig video = mux::SelectVideoTier(duration);
  const uint32_t total_frames = mux::TotalFramesFor(duration, video.fps);
  {
    std::ostringstream oss;
    oss << "[PipelineController] job=" << request.job_id << " attempt=" << session.attempt()
        << " duration=" << duration << "s tier=" << mux::QualityTierToString(video.tier)
        << " " << video.width << "x" << video.height << "@" << video.fps.ToDouble()
        << " frames=" << total_frames << " points=" << analyzed.waveform.PointCount();
    Logger::Info(oss.str());
  }

  render::OverlayAssets overlay;
  overlay.username = request.username;
  overlay.accent = request.accent;
  overlay.avatar = session.avatar_cache().Get(request.avatar, stop);
  if (stop.StopRequested()) return Stopped(stop, "avatar load");

  render::PixelBufferPool& pool =
      session.EnsurePixelPool(video.width, video.height, config_.pixel_pool_capacity);

  std::unique_ptr<mux::IFrameEncoder> encoder = deps_.make_encoder();
  if (!encoder) return {false, GenerationError::kWriterSetupFailed, "no encoder backend"};

  std::unique_ptr<mux::MuxSession> muxer;
  MuxResult r = mux::MuxSession::Create(temp_path, video, config_.audio_track, std::move(encoder),
                                        *deps_.clock, *deps_.wait, stop, &muxer,
                                        config_.mux_options);
  if (!r.ok) return FromMux(r, stop);
  session.ReportProgress(kProgressSetupEnd);

  // ===========================================================================
  // Frame loop (0.4 -> 0.8): one pooled buffer per ready signal
  // ===========================================================================
  session.Transition(PipelineState::kRenderingFrames);
  const render::FrameSynthesizer synthesizer(config_.style);
  const double frame_span = kProgressFramesEnd - kProgressSetupEnd;

  for (uint32_t i = 0; i < total_frames; ++i) {
    if (stop.StopRequested()) {
      muxer->Abort();
      return Stopped(stop, "frame loop");
    }
    r = muxer->AwaitVideoReady();
    if (!r.ok) {
      muxer->Abort();
      return FromMux(r, stop);
    }

    render::PixelBufferPool::Handle buffer = pool.Acquire();
    if (!buffer) {
      muxer->Abort();
      std::ostringstream oss;
      oss << "pixel pool exhausted at frame " << i << " (" << pool.Outstanding()
          << " outstanding)";
      return {false, GenerationError::kFrameRenderFailed, oss.str()};
    }

    const render::FrameRequest frame_request{i, video.fps};
    synthesizer.RenderInto(frame_request.PresentationTimeSec(), duration, analyzed.waveform,
                           overlay, *buffer);
    r = muxer->AppendFrame(render::RenderedFrame(frame_request, std::move(buffer)));
    if (!r.ok) {
      muxer->Abort();
      return FromMux(r, stop);
    }
    session.ReportProgress(kProgressSetupEnd +
                           frame_span * static_cast<double>(i + 1) /
                               static_cast<double>(total_frames));
  }

  // ===========================================================================
  // Audio copy (0.8 -> 0.9)
  // ===========================================================================
  session.Transition(PipelineState::kMuxingAudio);

  decode::DecoderConfig audio_config = decoder_config;
  audio_config.output_sample_rate = config_.audio_track.sample_rate;
  audio_config.output_channels = config_.audio_track.channels;
  std::unique_ptr<decode::IAudioDecoder> audio_source = deps_.make_decoder(audio_config);
  if (!audio_source) {
    muxer->Abort();
    return {false, GenerationError::kWritingFailed, "no decoder backend for audio copy"};
  }

  const double audio_span = kProgressAudioEnd - kProgressFramesEnd;
  r = muxer->AppendAudio(*audio_source, duration, [&session, audio_span](double fraction) {
    session.ReportProgress(kProgressFramesEnd + audio_span * fraction);
  });
  if (!r.ok) {
    muxer->Abort();
    return FromMux(r, stop);
  }

  // ===========================================================================
  // Finalize (0.9 -> 1.0)
  // ===========================================================================
  session.Transition(PipelineState::kFinalizing);
  if (stop.StopRequested()) {
    muxer->Abort();
    return Stopped(stop, "finalize");
  }

  mux::OutputHandle handle;
  r = muxer->Finish(&handle);
  if (!r.ok) return FromMux(r, stop);
  muxer.reset();

  if (std::rename(temp_path.c_str(), request.output_path.c_str()) != 0) {
    return {false, GenerationError::kWritingFailed,
            "rename " + temp_path + " -> " + request.output_path + ": " + std::strerror(errno)};
  }

  session.Complete();
  return {true, GenerationError::kNone, ""};
}

}  // namespace wavecast::pipeline
