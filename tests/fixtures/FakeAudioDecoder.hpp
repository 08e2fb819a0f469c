// Repository: Retrovue-wavecast
// Component: Fake Audio Decoder (test only)
// Purpose: Scripted IAudioDecoder producing synthetic PCM with injectable
//          open failures, corrupt chunks, read failures and virtual time cost.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_TESTS_FIXTURES_FAKE_AUDIO_DECODER_HPP_
#define WAVECAST_TESTS_FIXTURES_FAKE_AUDIO_DECODER_HPP_

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "../support/DeterministicTimeSource.hpp"
#include "wavecast/decode/IAudioDecoder.hpp"

namespace wavecast::tests::fixtures {

struct FakeAudioScript {
  uint64_t total_frames = 44100;

  // < 0: report total_frames / sample_rate. 0: report no duration.
  double reported_duration_sec = -1.0;

  // Sample value for frame n (same on every channel).
  std::function<float(uint64_t)> signal = [](uint64_t n) { return (n % 2 == 0) ? 0.5f : -0.5f; };

  decode::AudioDecodeError open_error = decode::AudioDecodeError::kNone;
  std::set<int> skip_chunks;   // 0-based chunk numbers returned as kSkipped
  int fail_at_chunk = -1;      // Chunk number that returns kFailed

  // Virtual time consumed by each ReadChunk.
  std::shared_ptr<timing::DeterministicTimeSource> clock;
  int64_t ms_per_chunk = 0;
};

// Shared between a test and every decoder a factory creates.
struct FakeDecoderLog {
  std::mutex mutex;
  int created = 0;
  int opens = 0;
  int closes = 0;
  uint64_t frames_delivered = 0;
};

class FakeAudioDecoder : public decode::IAudioDecoder {
 public:
  FakeAudioDecoder(const decode::DecoderConfig& config, FakeAudioScript script,
                   std::shared_ptr<FakeDecoderLog> log = nullptr)
      : config_(config), script_(std::move(script)), log_(std::move(log)) {
    if (log_) {
      std::lock_guard<std::mutex> lock(log_->mutex);
      log_->created++;
    }
  }

  decode::AudioOpenResult Open() override {
    if (log_) {
      std::lock_guard<std::mutex> lock(log_->mutex);
      log_->opens++;
    }
    if (script_.open_error != decode::AudioDecodeError::kNone) {
      return decode::AudioOpenResult::Failure(script_.open_error, "scripted open failure");
    }
    info_.uri = config_.input_uri;
    info_.sample_rate = config_.output_sample_rate;
    info_.channels = config_.output_channels;
    info_.duration_sec =
        script_.reported_duration_sec < 0.0
            ? static_cast<double>(script_.total_frames) / static_cast<double>(config_.output_sample_rate)
            : script_.reported_duration_sec;
    position_ = 0;
    chunk_number_ = 0;
    open_ = true;
    return decode::AudioOpenResult::Success(info_);
  }

  decode::ChunkStatus ReadChunk(decode::PcmChunk& out) override {
    out.Clear();
    if (!open_) return decode::ChunkStatus::kFailed;
    if (script_.clock && script_.ms_per_chunk > 0) script_.clock->AdvanceMs(script_.ms_per_chunk);
    if (interrupt_ && interrupt_()) return decode::ChunkStatus::kInterrupted;

    const int number = chunk_number_++;
    if (number == script_.fail_at_chunk) return decode::ChunkStatus::kFailed;
    if (script_.skip_chunks.count(number) > 0) {
      stats_.skipped_packets++;
      return decode::ChunkStatus::kSkipped;
    }
    if (position_ >= script_.total_frames) return decode::ChunkStatus::kEndOfStream;

    const uint64_t frames = std::min<uint64_t>(static_cast<uint64_t>(config_.chunk_frames),
                                               script_.total_frames - position_);
    out.sample_rate = config_.output_sample_rate;
    out.channels = config_.output_channels;
    out.frames = static_cast<int>(frames);
    out.samples.reserve(frames * static_cast<uint64_t>(config_.output_channels));
    for (uint64_t f = 0; f < frames; ++f) {
      const float v = script_.signal(position_ + f);
      for (int c = 0; c < config_.output_channels; ++c) out.samples.push_back(v);
    }
    position_ += frames;
    stats_.chunks_delivered++;
    stats_.frames_delivered += frames;
    if (log_) {
      std::lock_guard<std::mutex> lock(log_->mutex);
      log_->frames_delivered += frames;
    }
    return decode::ChunkStatus::kData;
  }

  void Close() override {
    if (open_ && log_) {
      std::lock_guard<std::mutex> lock(log_->mutex);
      log_->closes++;
    }
    open_ = false;
  }

  bool IsOpen() const override { return open_; }
  const decode::AudioSourceInfo& Info() const override { return info_; }
  const decode::DecoderConfig& Config() const override { return config_; }
  const decode::DecoderStats& Stats() const override { return stats_; }

  void SetInterruptCallback(std::function<bool()> should_interrupt) override {
    interrupt_ = std::move(should_interrupt);
  }

 private:
  decode::DecoderConfig config_;
  FakeAudioScript script_;
  std::shared_ptr<FakeDecoderLog> log_;
  decode::AudioSourceInfo info_;
  decode::DecoderStats stats_;
  std::function<bool()> interrupt_;
  uint64_t position_ = 0;
  int chunk_number_ = 0;
  bool open_ = false;
};

}  // namespace wavecast::tests::fixtures

#endif  // WAVECAST_TESTS_FIXTURES_FAKE_AUDIO_DECODER_HPP_
