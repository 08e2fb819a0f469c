// Repository: Retrovue-wavecast
// Component: VisualizerControl gRPC Service Implementation
// Purpose: Request conversion, job event relay and preview levels.
// Copyright (c) 2025 RetroVue

#include "visualizer_service.h"

#include <chrono>
#include <cmath>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <sstream>
#include <utility>
#include <vector>

#include "wavecast/analysis/LiveLevelMeter.hpp"
#include "wavecast/analysis/SpectralOps.hpp"
#include "wavecast/analysis/WaveformTypes.hpp"
#include "wavecast/util/Logger.hpp"

namespace wavecast {
namespace service {

using util::Logger;

const char kApiVersion[] = "1.0.0";

namespace {

// Events produced on the worker thread and drained by the RPC thread.
struct EventChannel {
  std::mutex mutex;
  std::condition_variable cv;
  std::deque<GenerationEvent> events;
  bool finished = false;

  void Push(GenerationEvent event, bool last) {
    {
      std::lock_guard<std::mutex> lock(mutex);
      events.push_back(std::move(event));
      if (last) finished = true;
    }
    cv.notify_one();
  }
};

constexpr auto kEventPollInterval = std::chrono::milliseconds(100);

}  // namespace

bool ToGenerationRequest(const GenerateVideoRequest& in, pipeline::GenerationRequest* out,
                         std::string* error) {
  if (in.input_uri().empty()) {
    *error = "input_uri is required";
    return false;
  }
  if (in.output_path().empty()) {
    *error = "output_path is required";
    return false;
  }
  const double hint = in.duration_hint_sec();
  if (!std::isfinite(hint) || hint < 0.0 || hint > analysis::kMaxSourceDurationSec) {
    std::ostringstream oss;
    oss << "duration_hint_sec must be finite and within [0, "
        << analysis::kMaxSourceDurationSec << "]";
    *error = oss.str();
    return false;
  }

  out->job_id = in.job_id();
  out->input_uri = in.input_uri();
  out->output_path = in.output_path();
  out->username = in.username();
  if (in.accent_rgba() != 0) {
    const uint32_t c = in.accent_rgba();
    out->accent = render::Rgba(static_cast<uint8_t>(c >> 24), static_cast<uint8_t>(c >> 16),
                               static_cast<uint8_t>(c >> 8), static_cast<uint8_t>(c));
  }
  if (in.has_avatar()) {
    if (in.avatar().source_case() == AvatarSource::kUri) {
      out->avatar.uri = in.avatar().uri();
    } else if (in.avatar().source_case() == AvatarSource::kImage) {
      const std::string& bytes = in.avatar().image();
      out->avatar.bytes.assign(bytes.begin(), bytes.end());
    }
  }
  out->duration_hint_sec = in.duration_hint_sec();
  out->waveform_points = in.waveform_points();
  return true;
}

PipelineState ToProtoState(pipeline::PipelineState state) {
  switch (state) {
    case pipeline::PipelineState::kIdle: return PIPELINE_STATE_IDLE;
    case pipeline::PipelineState::kAnalyzing: return PIPELINE_STATE_ANALYZING;
    case pipeline::PipelineState::kRenderingFrames: return PIPELINE_STATE_RENDERING_FRAMES;
    case pipeline::PipelineState::kMuxingAudio: return PIPELINE_STATE_MUXING_AUDIO;
    case pipeline::PipelineState::kFinalizing: return PIPELINE_STATE_FINALIZING;
    case pipeline::PipelineState::kCompleted: return PIPELINE_STATE_COMPLETED;
    case pipeline::PipelineState::kFailed: return PIPELINE_STATE_FAILED;
  }
  return PIPELINE_STATE_IDLE;
}

GenerationError ToProtoError(pipeline::GenerationError error) {
  using E = pipeline::GenerationError;
  switch (error) {
    case E::kNone: return GENERATION_ERROR_NONE;
    case E::kNoAudioTrack: return GENERATION_ERROR_NO_AUDIO_TRACK;
    case E::kAnalysisFailed: return GENERATION_ERROR_ANALYSIS_FAILED;
    case E::kWriterSetupFailed: return GENERATION_ERROR_WRITER_SETUP_FAILED;
    case E::kWritingFailed: return GENERATION_ERROR_WRITING_FAILED;
    case E::kFrameRenderFailed: return GENERATION_ERROR_FRAME_RENDER_FAILED;
    case E::kFrameAppendFailed: return GENERATION_ERROR_FRAME_APPEND_FAILED;
    case E::kDiskExhausted: return GENERATION_ERROR_DISK_EXHAUSTED;
    case E::kMemoryExhausted: return GENERATION_ERROR_MEMORY_EXHAUSTED;
    case E::kResourceCheckFailed: return GENERATION_ERROR_RESOURCE_CHECK_FAILED;
    case E::kTimeout: return GENERATION_ERROR_TIMEOUT;
    case E::kCancelled: return GENERATION_ERROR_CANCELLED;
    case E::kMaxRetriesExceeded: return GENERATION_ERROR_MAX_RETRIES_EXCEEDED;
    case E::kInvalidRequest: return GENERATION_ERROR_INVALID_REQUEST;
  }
  return GENERATION_ERROR_NONE;
}

VisualizerControlImpl::VisualizerControlImpl(std::shared_ptr<pipeline::GenerationWorker> worker)
    : worker_(std::move(worker)) {
  Logger::Info(std::string("[VisualizerControlImpl] Service initialized (API version: ") +
               kApiVersion + ")");
}

VisualizerControlImpl::~VisualizerControlImpl() {
  Logger::Info("[VisualizerControlImpl] Service shutting down");
}

grpc::Status VisualizerControlImpl::GenerateVideo(grpc::ServerContext* context,
                                                  const GenerateVideoRequest* request,
                                                  grpc::ServerWriter<GenerationEvent>* writer) {
  pipeline::GenerationRequest generation;
  std::string error;
  if (!ToGenerationRequest(*request, &generation, &error)) {
    Logger::Warn("[GenerateVideo] Invalid request: " + error);
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, error);
  }

  auto channel = std::make_shared<EventChannel>();
  pipeline::JobCallbacks callbacks;
  callbacks.on_progress = [channel](const pipeline::ProgressUpdate& update) {
    GenerationEvent event;
    GenerationProgress* progress = event.mutable_progress();
    progress->set_progress(update.progress);
    progress->set_state(ToProtoState(update.state));
    progress->set_attempt(update.attempt);
    channel->Push(std::move(event), false);
  };
  callbacks.on_complete = [channel](const std::string& job_id,
                                    const pipeline::GenerationResult& result) {
    GenerationEvent event;
    event.set_job_id(job_id);
    GenerationResult* out = event.mutable_result();
    out->set_success(result.success);
    out->set_output_path(result.output_path);
    out->set_error(ToProtoError(result.error));
    out->set_underlying_error(ToProtoError(result.underlying));
    out->set_detail(result.detail);
    out->set_attempts(result.attempts);
    channel->Push(std::move(event), true);
  };

  std::string job_id;
  const pipeline::SubmitStatus status = worker_->Submit(generation, callbacks, &job_id);
  switch (status) {
    case pipeline::SubmitStatus::kAccepted:
      break;
    case pipeline::SubmitStatus::kDuplicateOutput:
      return grpc::Status(grpc::StatusCode::ALREADY_EXISTS,
                          "a job for " + generation.output_path + " is already queued or running");
    case pipeline::SubmitStatus::kQueueFull:
      return grpc::Status(grpc::StatusCode::RESOURCE_EXHAUSTED, "generation queue is full");
    case pipeline::SubmitStatus::kInvalidRequest:
      return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "invalid generation request");
    case pipeline::SubmitStatus::kShuttingDown:
      return grpc::Status(grpc::StatusCode::UNAVAILABLE, "server is shutting down");
  }

  Logger::Info("[GenerateVideo] Accepted job=" + job_id + " output=" + generation.output_path);

  bool cancel_sent = false;
  for (;;) {
    std::deque<GenerationEvent> batch;
    bool finished = false;
    {
      std::unique_lock<std::mutex> lock(channel->mutex);
      channel->cv.wait_for(lock, kEventPollInterval,
                           [&channel]() { return !channel->events.empty() || channel->finished; });
      batch.swap(channel->events);
      finished = channel->finished;
    }

    if (context->IsCancelled()) {
      if (!cancel_sent) {
        Logger::Info("[GenerateVideo] Client went away, cancelling job=" + job_id);
        worker_->Cancel(job_id);
        cancel_sent = true;
      }
      if (finished) return grpc::Status::CANCELLED;
      continue;
    }

    for (GenerationEvent& event : batch) {
      event.set_job_id(job_id);
      if (!writer->Write(event) && !cancel_sent) {
        Logger::Warn("[GenerateVideo] Stream write failed, cancelling job=" + job_id);
        worker_->Cancel(job_id);
        cancel_sent = true;
      }
    }
    if (finished) return grpc::Status::OK;
  }
}

grpc::Status VisualizerControlImpl::CancelGeneration(grpc::ServerContext* context,
                                                     const CancelGenerationRequest* request,
                                                     CancelGenerationResponse* response) {
  (void)context;
  const bool found = worker_->Cancel(request->job_id());
  response->set_found(found);
  Logger::Info("[CancelGeneration] job=" + request->job_id() +
               (found ? " cancelled" : " not found"));
  if (!found) {
    return grpc::Status(grpc::StatusCode::NOT_FOUND, "no such job: " + request->job_id());
  }
  return grpc::Status::OK;
}

grpc::Status VisualizerControlImpl::PreviewLevels(grpc::ServerContext* context,
                                                  const PreviewLevelsRequest* request,
                                                  PreviewLevelsResponse* response) {
  (void)context;
  analysis::LiveLevelMeterConfig config;
  if (request->fft_size() != 0) config.fft_size = request->fft_size();
  if (request->bin_count() != 0) config.bin_count = request->bin_count();

  if (!analysis::IsPowerOfTwo(config.fft_size)) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "fft_size must be a power of two");
  }
  if (config.bin_count > config.fft_size / 2) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                        "bin_count must not exceed fft_size / 2");
  }
  if (static_cast<size_t>(request->samples_size()) > kMaxPreviewSamples) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "too many samples");
  }

  const std::vector<float> samples(request->samples().begin(), request->samples().end());
  const analysis::LiveLevels levels = analysis::LiveLevelMeter(config).Process(samples);
  response->set_rms(levels.rms);
  response->set_peak(levels.peak);
  for (float bin : levels.bins) response->add_bins(bin);
  return grpc::Status::OK;
}

grpc::Status VisualizerControlImpl::GetVersion(grpc::ServerContext* context,
                                               const ApiVersionRequest* request,
                                               ApiVersion* response) {
  (void)context;
  (void)request;
  response->set_version(kApiVersion);
  return grpc::Status::OK;
}

}  // namespace service
}  // namespace wavecast
