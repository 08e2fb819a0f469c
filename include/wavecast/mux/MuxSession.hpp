// Repository: Retrovue-wavecast
// Component: Mux Session
// Purpose: One output container session: readiness-gated frame appends in
//          presentation order, streamed audio copy and finalization.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_MUX_MUX_SESSION_HPP_
#define WAVECAST_MUX_MUX_SESSION_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "wavecast/decode/IAudioDecoder.hpp"
#include "wavecast/mux/IFrameEncoder.hpp"
#include "wavecast/mux/MuxTypes.hpp"
#include "wavecast/render/FrameTypes.hpp"
#include "wavecast/timing/ITimeSource.hpp"
#include "wavecast/timing/IWaitStrategy.hpp"
#include "wavecast/timing/StopSignal.hpp"

namespace wavecast::mux {

struct MuxSessionOptions {
  int64_t ready_poll_ms = 10;
  // Longest a single readiness wait may take before kNotReady. 0 = no limit
  // (the stop signal still applies).
  int64_t ready_timeout_ms = 30000;
};

// MuxSession drives an IFrameEncoder through one output.
//
//   Create -> (AwaitVideoReady, AppendFrame)* -> AppendAudio -> Finish
//                                                 \-> Abort (any time)
//
// Frame indices start at 0 and strictly increase. Every AppendFrame must be
// preceded by a successful AwaitVideoReady. Dropping the session without
// Finish aborts the encoder.
class MuxSession {
  // Only Create can mint one, so the public constructor is Create-only.
  struct CreateKey {
    explicit CreateKey() = default;
  };

 public:
  enum class State { kOpen, kAudio, kFinished, kAborted };

  static MuxResult Create(const std::string& output_path,
                          const VideoTrackConfig& video,
                          const AudioTrackConfig& audio,
                          std::unique_ptr<IFrameEncoder> encoder,
                          const timing::ITimeSource& clock,
                          timing::IWaitStrategy& wait,
                          const timing::StopSignal& stop,
                          std::unique_ptr<MuxSession>* out,
                          const MuxSessionOptions& options = MuxSessionOptions());

  MuxSession(CreateKey, const std::string& output_path, const VideoTrackConfig& video,
             const AudioTrackConfig& audio, std::unique_ptr<IFrameEncoder> encoder,
             const timing::ITimeSource& clock, timing::IWaitStrategy& wait,
             const timing::StopSignal& stop, const MuxSessionOptions& options);
  ~MuxSession();

  MuxSession(const MuxSession&) = delete;
  MuxSession& operator=(const MuxSession&) = delete;

  MuxResult AwaitVideoReady();
  MuxResult AppendFrame(render::RenderedFrame frame);

  MuxResult AwaitAudioReady();

  // Opens (if needed) and drains decoder into the audio track, polling
  // readiness before every chunk. on_progress receives the fraction of
  // expected_duration_sec copied so far.
  MuxResult AppendAudio(decode::IAudioDecoder& decoder,
                        double expected_duration_sec = 0.0,
                        const std::function<void(double)>& on_progress = nullptr);

  MuxResult Finish(OutputHandle* handle);
  void Abort();

  State state() const { return state_; }
  uint64_t FramesAppended() const { return frames_appended_; }
  uint64_t AudioFramesAppended() const { return audio_frames_appended_; }
  const VideoTrackConfig& video_config() const { return video_; }
  const AudioTrackConfig& audio_config() const { return audio_; }
  const std::string& output_path() const { return output_path_; }

 private:
  // Polls ready() every ready_poll_ms until true, stop, or ready_timeout_ms.
  MuxResult AwaitReady(const std::function<bool()>& ready, const char* what);
  MuxResult StoppedResult(const char* where) const;

  std::string output_path_;
  VideoTrackConfig video_;
  AudioTrackConfig audio_;
  std::unique_ptr<IFrameEncoder> encoder_;
  const timing::ITimeSource& clock_;
  timing::IWaitStrategy& wait_;
  timing::StopSignal stop_;
  MuxSessionOptions options_;

  State state_ = State::kOpen;
  bool video_ready_ = false;
  int64_t last_index_ = -1;
  uint64_t frames_appended_ = 0;
  uint64_t audio_frames_appended_ = 0;
};

const char* MuxSessionStateToString(MuxSession::State state);

}  // namespace wavecast::mux

#endif  // WAVECAST_MUX_MUX_SESSION_HPP_
