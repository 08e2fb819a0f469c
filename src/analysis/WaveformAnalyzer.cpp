// Repository: Retrovue-wavecast
// Component: Waveform Analyzer
// Purpose: Streams an audio track through bounded chunks and reduces it to a
//          fixed number of RMS/peak points.
// Copyright (c) 2025 RetroVue

#include "wavecast/analysis/WaveformAnalyzer.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <vector>

#include "wavecast/analysis/SpectralOps.hpp"
#include "wavecast/util/Logger.hpp"

namespace wavecast::analysis {

using decode::AudioDecodeError;
using decode::ChunkStatus;
using util::Logger;

const char* AnalysisErrorToString(AnalysisError error) {
  switch (error) {
    case AnalysisError::kNone: return "None";
    case AnalysisError::kNoAudioTrack: return "NoAudioTrack";
    case AnalysisError::kReaderFailure: return "ReaderFailure";
    case AnalysisError::kCancelled: return "Cancelled";
  }
  return "Unknown";
}

namespace {

// The rolling window grows on demand past this; a long point must not
// allocate its whole span up front.
constexpr uint64_t kMaxWindowReserve = 1u << 16;

// 2^53, the largest integer a double carries exactly.
constexpr double kMaxSamplesPerPoint = 9007199254740992.0;

float Clamp01(float v) {
  return std::min(1.0f, std::max(0.0f, v));
}

AnalysisResult FromOpenFailure(const decode::AudioOpenResult& open) {
  if (open.error == AudioDecodeError::kNoAudioTrack) {
    return AnalysisResult::Failure(AnalysisError::kNoAudioTrack, open.detail);
  }
  return AnalysisResult::Failure(
      AnalysisError::kReaderFailure,
      std::string(decode::AudioDecodeErrorToString(open.error)) + ": " + open.detail);
}

// Appends the chunk to the rolling window, averaging channels down to mono.
void AppendMono(const decode::PcmChunk& chunk, std::vector<float>& out,
                size_t begin_frame, size_t end_frame) {
  const int channels = std::max(1, chunk.channels);
  for (size_t f = begin_frame; f < end_frame; ++f) {
    if (channels == 1) {
      out.push_back(chunk.samples[f]);
      continue;
    }
    float sum = 0.0f;
    for (int c = 0; c < channels; ++c) {
      sum += chunk.samples[f * static_cast<size_t>(channels) + static_cast<size_t>(c)];
    }
    out.push_back(sum / static_cast<float>(channels));
  }
}

}  // namespace

WaveformAnalyzer::WaveformAnalyzer(const AnalyzerConfig& config) : config_(config) {}

uint64_t WaveformAnalyzer::SamplesPerPoint(int sample_rate, double duration_sec,
                                           uint32_t target_points) {
  if (sample_rate <= 0 || !std::isfinite(duration_sec) || !(duration_sec > 0.0) ||
      target_points == 0) {
    return 1;
  }
  const double spp = std::floor(static_cast<double>(sample_rate) * duration_sec /
                                static_cast<double>(target_points));
  if (spp < 1.0) return 1;
  return spp >= kMaxSamplesPerPoint ? static_cast<uint64_t>(kMaxSamplesPerPoint)
                                    : static_cast<uint64_t>(spp);
}

bool WaveformAnalyzer::CountFrames(decode::IAudioDecoder& decoder,
                                   const timing::StopSignal& stop,
                                   uint64_t* frames,
                                   AnalysisResult* failure) const {
  decode::PcmChunk chunk;
  *frames = 0;
  for (;;) {
    if (stop.StopRequested()) {
      *failure = AnalysisResult::Failure(AnalysisError::kCancelled, "stopped while sizing");
      return false;
    }
    switch (decoder.ReadChunk(chunk)) {
      case ChunkStatus::kData:
        *frames += static_cast<uint64_t>(chunk.frames);
        break;
      case ChunkStatus::kSkipped:
        break;
      case ChunkStatus::kEndOfStream:
        return true;
      case ChunkStatus::kInterrupted:
        *failure = AnalysisResult::Failure(AnalysisError::kCancelled, "decode interrupted");
        return false;
      case ChunkStatus::kFailed:
        *failure = AnalysisResult::Failure(AnalysisError::kReaderFailure, "read failed while sizing");
        return false;
    }
  }
}

AnalysisResult WaveformAnalyzer::Analyze(decode::IAudioDecoder& decoder,
                                         const timing::StopSignal& stop) const {
  const uint32_t point_count = ClampPointCount(config_.target_points);

  if (stop.StopRequested()) {
    return AnalysisResult::Failure(AnalysisError::kCancelled, "stopped before open");
  }
  decoder.SetInterruptCallback([stop]() { return stop.StopRequested(); });

  decode::AudioOpenResult open = decoder.Open();
  if (!open.ok) {
    return FromOpenFailure(open);
  }

  const int sample_rate = decoder.Config().output_sample_rate;
  double duration = 0.0;
  if (IsUsableDuration(open.info.duration_sec)) {
    duration = open.info.duration_sec;
  } else if (IsUsableDuration(config_.duration_hint_sec)) {
    duration = config_.duration_hint_sec;
  } else if (open.info.duration_sec != 0.0 || config_.duration_hint_sec != 0.0) {
    std::ostringstream oss;
    oss << "[WaveformAnalyzer] Ignoring unusable duration (container="
        << open.info.duration_sec << "s hint=" << config_.duration_hint_sec << "s)";
    Logger::Warn(oss.str());
  }

  if (!(duration > 0.0)) {
    // Unknown length: size the track with a counting pass, then start over.
    uint64_t frames = 0;
    AnalysisResult failure = AnalysisResult::Failure(AnalysisError::kNone);
    const bool counted = CountFrames(decoder, stop, &frames, &failure);
    decoder.Close();
    if (!counted) {
      return failure;
    }
    if (frames == 0 || sample_rate <= 0) {
      return AnalysisResult::Failure(AnalysisError::kNoAudioTrack,
                                     "source produced no samples: " + open.info.uri);
    }
    duration = static_cast<double>(frames) / static_cast<double>(sample_rate);
    {
      std::ostringstream oss;
      oss << "[WaveformAnalyzer] No container duration; measured " << duration << "s";
      Logger::Info(oss.str());
    }
    open = decoder.Open();
    if (!open.ok) {
      return FromOpenFailure(open);
    }
  }

  const uint64_t samples_per_point = SamplesPerPoint(sample_rate, duration, point_count);
  WaveformData data(point_count, duration, sample_rate);

  std::vector<float> window;
  window.reserve(static_cast<size_t>(std::min<uint64_t>(samples_per_point, kMaxWindowReserve)));

  uint32_t emitted = 0;
  uint64_t total_frames = 0;
  uint64_t skipped_chunks = 0;

  auto emit = [&]() {
    const RmsPeak rp = RmsAndPeak(window);
    WaveformPoint& point = data.MutablePoint(emitted);
    point.timestamp = static_cast<float>(static_cast<double>(emitted) /
                                         static_cast<double>(point_count) * duration);
    point.amplitude = Clamp01(rp.rms);
    point.peak = Clamp01(rp.peak);
    ++emitted;
    window.clear();  // capacity retained
  };

  decode::PcmChunk chunk;
  bool done = false;
  while (!done && emitted < point_count) {
    if (stop.StopRequested()) {
      decoder.Close();
      return AnalysisResult::Failure(AnalysisError::kCancelled, "stopped between chunks");
    }

    switch (decoder.ReadChunk(chunk)) {
      case ChunkStatus::kData: {
        total_frames += static_cast<uint64_t>(chunk.frames);
        size_t frame = 0;
        const size_t frames = static_cast<size_t>(chunk.frames);
        while (frame < frames && emitted < point_count) {
          const size_t room = static_cast<size_t>(samples_per_point) - window.size();
          const size_t take = std::min(room, frames - frame);
          AppendMono(chunk, window, frame, frame + take);
          frame += take;
          if (window.size() == samples_per_point) {
            emit();
          }
        }
        break;
      }
      case ChunkStatus::kSkipped:
        ++skipped_chunks;
        break;
      case ChunkStatus::kEndOfStream:
        done = true;
        break;
      case ChunkStatus::kInterrupted:
        decoder.Close();
        return AnalysisResult::Failure(AnalysisError::kCancelled, "decode interrupted");
      case ChunkStatus::kFailed: {
        decoder.Close();
        std::ostringstream oss;
        oss << "read failed after " << total_frames << " frames";
        Logger::Error("[WaveformAnalyzer] " + oss.str());
        return AnalysisResult::Failure(AnalysisError::kReaderFailure, oss.str());
      }
    }
  }
  decoder.Close();

  if (total_frames == 0) {
    return AnalysisResult::Failure(AnalysisError::kNoAudioTrack,
                                   "source produced no samples: " + open.info.uri);
  }

  if (!window.empty() && emitted < point_count) {
    emit();
  }

  if (emitted < point_count) {
    std::ostringstream oss;
    oss << "[WaveformAnalyzer] Stream ended early: points=" << emitted << "/" << point_count
        << " skipped_chunks=" << skipped_chunks << ", padding with silence";
    Logger::Warn(oss.str());
    for (uint32_t i = emitted; i < point_count; ++i) {
      WaveformPoint& point = data.MutablePoint(i);
      point.timestamp = static_cast<float>(static_cast<double>(i) /
                                           static_cast<double>(point_count) * duration);
      point.amplitude = 0.0f;
      point.peak = 0.0f;
    }
  }

  std::ostringstream oss;
  oss << "[WaveformAnalyzer] points=" << point_count << " duration=" << duration
      << "s samples_per_point=" << samples_per_point << " frames=" << total_frames;
  Logger::Debug(oss.str());

  return AnalysisResult::Success(std::move(data), skipped_chunks);
}

}  // namespace wavecast::analysis
