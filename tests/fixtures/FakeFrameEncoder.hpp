// Repository: Retrovue-wavecast
// Component: Fake Frame Encoder (test only)
// Purpose: IFrameEncoder that records every append and writes a small
//          placeholder file, with scripted readiness and failures.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_TESTS_FIXTURES_FAKE_FRAME_ENCODER_HPP_
#define WAVECAST_TESTS_FIXTURES_FAKE_FRAME_ENCODER_HPP_

#include <cstdint>
#include <cstdio>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "wavecast/mux/IFrameEncoder.hpp"

namespace wavecast::tests::fixtures {

struct FakeEncoderScript {
  std::set<int> fail_open_on;     // 1-based Open() call numbers (across encoders)
  int64_t fail_video_at = -1;     // frame_index whose append fails
  bool fail_finish = false;
  int video_not_ready_polls = 0;  // IsReadyForVideo() == false this many times per frame
  int audio_not_ready_polls = 0;

  // Called after every accepted video frame with its index.
  std::function<void(int64_t)> on_video;
};

// Shared between a test and every encoder a factory creates.
struct FakeEncoderLog {
  std::mutex mutex;
  int opens = 0;
  int finishes = 0;
  int aborts = 0;
  std::vector<std::string> paths;
  mux::VideoTrackConfig last_video;
  std::vector<int64_t> video_indices;  // Of the most recent Open()
  uint64_t audio_frames = 0;           // Of the most recent Open()
  int max_video_not_ready_polls = 0;
};

class FakeFrameEncoder : public mux::IFrameEncoder {
 public:
  FakeFrameEncoder(std::shared_ptr<FakeEncoderScript> script, std::shared_ptr<FakeEncoderLog> log)
      : script_(std::move(script)), log_(std::move(log)) {}

  ~FakeFrameEncoder() override {
    if (file_ != nullptr) std::fclose(file_);
  }

  mux::MuxResult Open(const std::string& output_path, const mux::VideoTrackConfig& video,
                      const mux::AudioTrackConfig& audio) override {
    int open_number = 0;
    {
      std::lock_guard<std::mutex> lock(log_->mutex);
      open_number = ++log_->opens;
      log_->paths.push_back(output_path);
      log_->last_video = video;
      log_->video_indices.clear();
      log_->audio_frames = 0;
    }
    if (script_->fail_open_on.count(open_number) > 0) {
      return mux::MuxResult::Failure(mux::MuxError::kWriterSetupFailed, "scripted open failure");
    }
    file_ = std::fopen(output_path.c_str(), "wb");
    if (file_ == nullptr) {
      return mux::MuxResult::Failure(mux::MuxError::kWriterSetupFailed, "cannot create file");
    }
    video_ = video;
    audio_ = audio;
    return mux::MuxResult::Success();
  }

  bool IsReadyForVideo() const override {
    if (video_polls_ < script_->video_not_ready_polls) {
      video_polls_++;
      return false;
    }
    return file_ != nullptr;
  }

  bool IsReadyForAudio() const override {
    if (audio_polls_ < script_->audio_not_ready_polls) {
      audio_polls_++;
      return false;
    }
    return file_ != nullptr;
  }

  mux::MuxResult AppendVideo(const render::PixelBuffer& frame, int64_t frame_index) override {
    if (file_ == nullptr) return mux::MuxResult::Failure(mux::MuxError::kInvalidState, "not open");
    if (frame.width != video_.width || frame.height != video_.height) {
      return mux::MuxResult::Failure(mux::MuxError::kFrameAppendFailed, "size mismatch");
    }
    if (frame_index == script_->fail_video_at) {
      return mux::MuxResult::Failure(mux::MuxError::kFrameAppendFailed, "scripted append failure");
    }
    {
      std::lock_guard<std::mutex> lock(log_->mutex);
      log_->video_indices.push_back(frame_index);
      if (video_polls_ > log_->max_video_not_ready_polls) {
        log_->max_video_not_ready_polls = video_polls_;
      }
    }
    video_polls_ = 0;
    std::fputc('v', file_);
    if (script_->on_video) script_->on_video(frame_index);
    return mux::MuxResult::Success();
  }

  mux::MuxResult AppendAudio(const decode::PcmChunk& chunk) override {
    if (file_ == nullptr) return mux::MuxResult::Failure(mux::MuxError::kInvalidState, "not open");
    if (chunk.sample_rate != audio_.sample_rate || chunk.channels != audio_.channels) {
      return mux::MuxResult::Failure(mux::MuxError::kWritingFailed, "format mismatch");
    }
    std::lock_guard<std::mutex> lock(log_->mutex);
    log_->audio_frames += static_cast<uint64_t>(chunk.frames);
    audio_polls_ = 0;
    return mux::MuxResult::Success();
  }

  mux::MuxResult Finish() override {
    if (file_ == nullptr) return mux::MuxResult::Failure(mux::MuxError::kInvalidState, "not open");
    if (script_->fail_finish) {
      Abort();
      return mux::MuxResult::Failure(mux::MuxError::kIncomplete, "scripted finish failure");
    }
    std::fputs("FAKEMP4", file_);
    std::fclose(file_);
    file_ = nullptr;
    std::lock_guard<std::mutex> lock(log_->mutex);
    log_->finishes++;
    return mux::MuxResult::Success();
  }

  void Abort() override {
    if (file_ == nullptr) return;
    std::fclose(file_);
    file_ = nullptr;
    std::lock_guard<std::mutex> lock(log_->mutex);
    log_->aborts++;
  }

  void SetInterruptCallback(std::function<bool()> should_interrupt) override {
    interrupt_ = std::move(should_interrupt);
  }

 private:
  std::shared_ptr<FakeEncoderScript> script_;
  std::shared_ptr<FakeEncoderLog> log_;
  std::FILE* file_ = nullptr;
  mux::VideoTrackConfig video_;
  mux::AudioTrackConfig audio_;
  std::function<bool()> interrupt_;
  mutable int video_polls_ = 0;
  mutable int audio_polls_ = 0;
};

}  // namespace wavecast::tests::fixtures

#endif  // WAVECAST_TESTS_FIXTURES_FAKE_FRAME_ENCODER_HPP_
