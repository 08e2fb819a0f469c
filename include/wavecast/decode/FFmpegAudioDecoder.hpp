// Repository: Retrovue-wavecast
// Component: FFmpeg Audio Decoder
// Purpose: Chunked float PCM decoding of a single audio track using
//          libavformat/libavcodec/libswresample.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_DECODE_FFMPEG_AUDIO_DECODER_HPP_
#define WAVECAST_DECODE_FFMPEG_AUDIO_DECODER_HPP_

#include <cstddef>
#include <functional>
#include <vector>

#include "wavecast/decode/IAudioDecoder.hpp"

// Forward declarations for FFmpeg types (avoids pulling in FFmpeg headers here)
struct AVFormatContext;
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwrContext;

namespace wavecast::decode {

// FFmpegAudioDecoder decodes the first audio stream of any container
// libavformat can open and converts it to interleaved float PCM at the
// configured rate and channel count.
//
// Memory is bounded by one chunk plus one decoded frame: packets are read
// only while fewer than chunk_frames converted frames are pending.
//
// Error Handling:
// - A packet the codec rejects as corrupt is dropped, counted in
//   Stats().skipped_packets and reported as ChunkStatus::kSkipped when the
//   chunk would otherwise be empty.
// - Any other demux error is terminal (kFailed).
// - The interrupt predicate is installed as the AVIOInterruptCB so blocking
//   reads return promptly (kInterrupted).
class FFmpegAudioDecoder : public IAudioDecoder {
 public:
  explicit FFmpegAudioDecoder(const DecoderConfig& config);
  ~FFmpegAudioDecoder() override;

  FFmpegAudioDecoder(const FFmpegAudioDecoder&) = delete;
  FFmpegAudioDecoder& operator=(const FFmpegAudioDecoder&) = delete;

  AudioOpenResult Open() override;
  ChunkStatus ReadChunk(PcmChunk& out) override;
  void Close() override;

  bool IsOpen() const override { return opened_; }
  const AudioSourceInfo& Info() const override { return info_; }
  const DecoderConfig& Config() const override { return config_; }
  const DecoderStats& Stats() const override { return stats_; }

  void SetInterruptCallback(std::function<bool()> should_interrupt) override;

 private:
  static int InterruptThunk(void* opaque);

  bool FindAudioStream();
  bool InitializeAudioCodec();
  bool InitializeResampler();

  // Receives every frame the codec has ready. Returns false on a conversion
  // failure; corrupt frames are counted and skipped.
  bool ReceiveFrames();
  bool ConvertAudioFrame(AVFrame* av_frame);
  bool FlushResampler();

  int PendingFrames() const;
  void TakePending(PcmChunk& out, int max_frames);

  DecoderConfig config_;
  AudioSourceInfo info_;
  DecoderStats stats_;

  AVFormatContext* format_ctx_ = nullptr;
  AVCodecContext* codec_ctx_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  SwrContext* swr_ctx_ = nullptr;
  int audio_stream_index_ = -1;

  bool opened_ = false;
  bool demux_eof_ = false;
  bool decoder_drained_ = false;

  // Converted samples not yet handed out (interleaved, output format).
  std::vector<float> pending_;
  size_t pending_read_ = 0;

  std::function<bool()> should_interrupt_;
};

}  // namespace wavecast::decode

#endif  // WAVECAST_DECODE_FFMPEG_AUDIO_DECODER_HPP_
