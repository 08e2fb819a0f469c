// Repository: Retrovue-wavecast
// Component: Audio Decode Types
// Purpose: Source description, PCM chunk and decoder configuration shared by
//          the analyzer, the muxer's audio copy and decoder backends.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_DECODE_AUDIO_TYPES_HPP_
#define WAVECAST_DECODE_AUDIO_TYPES_HPP_

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace wavecast::decode {

// Analysis reads mono float PCM at this rate.
constexpr int kAnalysisSampleRate = 44100;
constexpr int kAnalysisChannels = 1;

// Default chunk size in sample frames (per channel).
constexpr int kDefaultChunkFrames = 4096;

// AudioSourceInfo describes the decodable audio track of an input.
// duration_sec is 0 when the container does not report one.
struct AudioSourceInfo {
  std::string uri;
  double duration_sec = 0.0;
  int sample_rate = 0;  // Native rate of the source stream
  int channels = 0;     // Native channel count of the source stream
};

// PcmChunk carries interleaved 32-bit float samples in [-1, 1] at the
// decoder's configured output rate and channel count.
struct PcmChunk {
  int sample_rate = 0;
  int channels = 0;
  int frames = 0;  // Sample frames (samples per channel)
  std::vector<float> samples;

  void Clear() {
    frames = 0;
    samples.clear();  // capacity retained
  }
};

// DecoderConfig holds configuration for chunked PCM decoding.
struct DecoderConfig {
  std::string input_uri;
  int output_sample_rate = kAnalysisSampleRate;
  int output_channels = kAnalysisChannels;
  int chunk_frames = kDefaultChunkFrames;
};

enum class AudioDecodeError {
  kNone = 0,
  kOpenFailed,        // Container could not be opened or inspected
  kNoAudioTrack,      // No audio stream, or its codec is unavailable
  kResamplerFailed,   // Output format conversion could not be set up
  kNotOpen,           // ReadChunk before a successful Open
};

const char* AudioDecodeErrorToString(AudioDecodeError error);

struct AudioOpenResult {
  bool ok;
  AudioDecodeError error;
  std::string detail;
  AudioSourceInfo info;

  static AudioOpenResult Success(AudioSourceInfo info) {
    return {true, AudioDecodeError::kNone, "", std::move(info)};
  }

  static AudioOpenResult Failure(AudioDecodeError err, const std::string& detail = "") {
    return {false, err, detail, {}};
  }
};

// Outcome of one ReadChunk call.
enum class ChunkStatus {
  kData,         // out holds >= 1 frame
  kSkipped,      // A corrupt packet was dropped; caller may continue
  kEndOfStream,  // No more data; out is empty
  kFailed,       // Terminal read failure
  kInterrupted,  // Stop requested through the interrupt callback
};

const char* ChunkStatusToString(ChunkStatus status);

// DecoderStats tracks decode progress and tolerated errors.
struct DecoderStats {
  uint64_t chunks_delivered = 0;
  uint64_t frames_delivered = 0;
  uint64_t skipped_packets = 0;
};

}  // namespace wavecast::decode

#endif  // WAVECAST_DECODE_AUDIO_TYPES_HPP_
