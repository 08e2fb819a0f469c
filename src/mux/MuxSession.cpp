// Repository: Retrovue-wavecast
// Component: Mux Session
// Purpose: One output container session: readiness-gated frame appends in
//          presentation order, streamed audio copy and finalization.
// Copyright (c) 2025 RetroVue

#include "wavecast/mux/MuxSession.hpp"

#include <algorithm>
#include <sstream>

#include "wavecast/util/Logger.hpp"

namespace wavecast::mux {

using decode::ChunkStatus;
using util::Logger;

const char* MuxSessionStateToString(MuxSession::State state) {
  switch (state) {
    case MuxSession::State::kOpen: return "Open";
    case MuxSession::State::kAudio: return "Audio";
    case MuxSession::State::kFinished: return "Finished";
    case MuxSession::State::kAborted: return "Aborted";
  }
  return "Unknown";
}

MuxResult MuxSession::Create(const std::string& output_path,
                             const VideoTrackConfig& video,
                             const AudioTrackConfig& audio,
                             std::unique_ptr<IFrameEncoder> encoder,
                             const timing::ITimeSource& clock,
                             timing::IWaitStrategy& wait,
                             const timing::StopSignal& stop,
                             std::unique_ptr<MuxSession>* out,
                             const MuxSessionOptions& options) {
  if (!encoder || out == nullptr) {
    return MuxResult::Failure(MuxError::kWriterSetupFailed, "no encoder supplied");
  }
  if (stop.StopRequested()) {
    return MuxResult::Failure(MuxError::kCancelled, "stopped before writer setup");
  }

  encoder->SetInterruptCallback([stop]() { return stop.StopRequested(); });
  MuxResult r = encoder->Open(output_path, video, audio);
  if (!r.ok) {
    if (stop.StopRequested()) {
      return MuxResult::Failure(MuxError::kCancelled, "stopped during writer setup");
    }
    if (r.error != MuxError::kWriterSetupFailed) {
      r.error = MuxError::kWriterSetupFailed;
    }
    return r;
  }

  *out = std::make_unique<MuxSession>(CreateKey(), output_path, video, audio, std::move(encoder),
                                      clock, wait, stop, options);
  return MuxResult::Success();
}

MuxSession::MuxSession(CreateKey, const std::string& output_path, const VideoTrackConfig& video,
                       const AudioTrackConfig& audio, std::unique_ptr<IFrameEncoder> encoder,
                       const timing::ITimeSource& clock, timing::IWaitStrategy& wait,
                       const timing::StopSignal& stop, const MuxSessionOptions& options)
    : output_path_(output_path),
      video_(video),
      audio_(audio),
      encoder_(std::move(encoder)),
      clock_(clock),
      wait_(wait),
      stop_(stop),
      options_(options) {
  if (options_.ready_poll_ms < 1) options_.ready_poll_ms = 1;
}

MuxSession::~MuxSession() {
  Abort();
}

MuxResult MuxSession::StoppedResult(const char* where) const {
  std::string detail = stop_.Cancelled() ? "cancelled" : "deadline expired";
  detail += " during ";
  detail += where;
  return MuxResult::Failure(MuxError::kCancelled, detail);
}

MuxResult MuxSession::AwaitReady(const std::function<bool()>& ready, const char* what) {
  const int64_t start = clock_.NowMs();
  for (;;) {
    if (stop_.StopRequested()) return StoppedResult(what);
    if (ready()) return MuxResult::Success();
    const int64_t now = clock_.NowMs();
    if (options_.ready_timeout_ms > 0 && now - start >= options_.ready_timeout_ms) {
      std::ostringstream oss;
      oss << what << " not ready after " << (now - start) << "ms";
      Logger::Warn("[MuxSession] " + oss.str());
      return MuxResult::Failure(MuxError::kNotReady, oss.str());
    }
    wait_.WaitUntilMs(now + options_.ready_poll_ms);
  }
}

MuxResult MuxSession::AwaitVideoReady() {
  if (state_ != State::kOpen) {
    return MuxResult::Failure(MuxError::kInvalidState,
                              std::string("video wait in state ") + MuxSessionStateToString(state_));
  }
  MuxResult r = AwaitReady([this]() { return encoder_->IsReadyForVideo(); }, "video");
  video_ready_ = r.ok;
  return r;
}

MuxResult MuxSession::AppendFrame(render::RenderedFrame frame) {
  if (state_ != State::kOpen) {
    return MuxResult::Failure(MuxError::kInvalidState,
                              std::string("frame append in state ") + MuxSessionStateToString(state_));
  }
  if (!frame.Valid()) {
    return MuxResult::Failure(MuxError::kFrameAppendFailed, "frame has no pixel buffer");
  }
  if (!video_ready_) {
    return MuxResult::Failure(MuxError::kNotReady, "AppendFrame without AwaitVideoReady");
  }

  const int64_t index = static_cast<int64_t>(frame.request.index);
  if ((last_index_ < 0 && index != 0) || index <= last_index_) {
    std::ostringstream oss;
    oss << "frame index " << index << " after " << last_index_;
    Logger::Error("[MuxSession] Out of order: " + oss.str());
    return MuxResult::Failure(MuxError::kOutOfOrder, oss.str());
  }

  video_ready_ = false;
  MuxResult r = encoder_->AppendVideo(*frame.buffer, index);
  if (!r.ok) {
    if (stop_.StopRequested()) return StoppedResult("frame append");
    if (r.error != MuxError::kInvalidState) r.error = MuxError::kFrameAppendFailed;
    return r;
  }
  last_index_ = index;
  frames_appended_++;
  return MuxResult::Success();
}

MuxResult MuxSession::AwaitAudioReady() {
  if (state_ != State::kOpen && state_ != State::kAudio) {
    return MuxResult::Failure(MuxError::kInvalidState,
                              std::string("audio wait in state ") + MuxSessionStateToString(state_));
  }
  return AwaitReady([this]() { return encoder_->IsReadyForAudio(); }, "audio");
}

MuxResult MuxSession::AppendAudio(decode::IAudioDecoder& decoder,
                                  double expected_duration_sec,
                                  const std::function<void(double)>& on_progress) {
  if (state_ != State::kOpen && state_ != State::kAudio) {
    return MuxResult::Failure(MuxError::kInvalidState,
                              std::string("audio append in state ") + MuxSessionStateToString(state_));
  }
  state_ = State::kAudio;
  if (stop_.StopRequested()) return StoppedResult("audio open");

  const timing::StopSignal stop = stop_;
  decoder.SetInterruptCallback([stop]() { return stop.StopRequested(); });
  if (!decoder.IsOpen()) {
    decode::AudioOpenResult open = decoder.Open();
    if (!open.ok) {
      if (stop_.StopRequested()) return StoppedResult("audio open");
      return MuxResult::Failure(MuxError::kWritingFailed,
                                std::string("audio source: ") +
                                    decode::AudioDecodeErrorToString(open.error) + " " + open.detail);
    }
  }

  const double expected_frames = expected_duration_sec * static_cast<double>(audio_.sample_rate);
  uint64_t skipped = 0;
  decode::PcmChunk chunk;
  for (;;) {
    if (stop_.StopRequested()) {
      decoder.Close();
      return StoppedResult("audio copy");
    }

    const ChunkStatus status = decoder.ReadChunk(chunk);
    switch (status) {
      case ChunkStatus::kData: {
        MuxResult r = AwaitAudioReady();
        if (!r.ok) {
          decoder.Close();
          return r;
        }
        r = encoder_->AppendAudio(chunk);
        if (!r.ok) {
          decoder.Close();
          if (stop_.StopRequested()) return StoppedResult("audio append");
          if (r.error != MuxError::kInvalidState) r.error = MuxError::kWritingFailed;
          return r;
        }
        audio_frames_appended_ += static_cast<uint64_t>(chunk.frames);
        if (on_progress && expected_frames > 0.0) {
          on_progress(std::min(1.0, static_cast<double>(audio_frames_appended_) / expected_frames));
        }
        break;
      }
      case ChunkStatus::kSkipped:
        skipped++;
        break;
      case ChunkStatus::kEndOfStream: {
        decoder.Close();
        if (skipped > 0) {
          std::ostringstream oss;
          oss << "[MuxSession] Audio copy skipped " << skipped << " corrupt chunk(s)";
          Logger::Warn(oss.str());
        }
        if (on_progress) on_progress(1.0);
        return MuxResult::Success();
      }
      case ChunkStatus::kInterrupted:
        decoder.Close();
        return StoppedResult("audio read");
      case ChunkStatus::kFailed:
        decoder.Close();
        return MuxResult::Failure(MuxError::kWritingFailed, "audio source read failed");
    }
  }
}

MuxResult MuxSession::Finish(OutputHandle* handle) {
  if (state_ != State::kOpen && state_ != State::kAudio) {
    return MuxResult::Failure(MuxError::kInvalidState,
                              std::string("Finish in state ") + MuxSessionStateToString(state_));
  }
  if (frames_appended_ == 0) {
    Abort();
    return MuxResult::Failure(MuxError::kIncomplete, "no video frames were appended");
  }

  MuxResult r = encoder_->Finish();
  if (!r.ok) {
    state_ = State::kAborted;
    if (r.error != MuxError::kInvalidState) r.error = MuxError::kIncomplete;
    return r;
  }
  state_ = State::kFinished;

  if (handle != nullptr) {
    handle->path = output_path_;
    handle->video_frames = frames_appended_;
    handle->audio_frames = audio_frames_appended_;
  }

  std::ostringstream oss;
  oss << "[MuxSession] Finished " << output_path_ << " frames=" << frames_appended_
      << " audio_frames=" << audio_frames_appended_;
  Logger::Info(oss.str());
  return MuxResult::Success();
}

void MuxSession::Abort() {
  if (state_ == State::kOpen || state_ == State::kAudio) {
    encoder_->Abort();
    state_ = State::kAborted;
  }
}

}  // namespace wavecast::mux
