// Repository: Retrovue-wavecast
// Component: FFmpeg Frame Encoder
// Purpose: Owns FFmpeg encoder/muxer handles for one MP4 output (H.264 video
//          from RGBA frames, AAC audio from float PCM).
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_MUX_FFMPEG_FRAME_ENCODER_HPP_
#define WAVECAST_MUX_FFMPEG_FRAME_ENCODER_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "wavecast/mux/IFrameEncoder.hpp"

struct AVFormatContext;
struct AVCodecContext;
struct AVStream;
struct AVFrame;
struct AVPacket;
struct SwsContext;

namespace wavecast::mux {

// FFmpegFrameEncoder writes an MP4 through libavformat. The container format
// is fixed to mp4 so the output path may carry any suffix (".partial").
//
// Timestamps: video pts = frame index in 1/fps; audio pts = samples encoded
// in 1/sample_rate. Per-stream DTS/PTS are forced monotonic before muxing.
//
// Audio chunks are re-blocked into encoder frame_size frames; the remainder
// is carried to the next chunk and flushed (padded) by Finish().
class FFmpegFrameEncoder : public IFrameEncoder {
 public:
  FFmpegFrameEncoder();
  ~FFmpegFrameEncoder() override;

  FFmpegFrameEncoder(const FFmpegFrameEncoder&) = delete;
  FFmpegFrameEncoder& operator=(const FFmpegFrameEncoder&) = delete;

  MuxResult Open(const std::string& output_path,
                 const VideoTrackConfig& video,
                 const AudioTrackConfig& audio) override;

  bool IsReadyForVideo() const override;
  bool IsReadyForAudio() const override;

  MuxResult AppendVideo(const render::PixelBuffer& frame, int64_t frame_index) override;
  MuxResult AppendAudio(const decode::PcmChunk& chunk) override;
  MuxResult Finish() override;
  void Abort() override;

  void SetInterruptCallback(std::function<bool()> should_interrupt) override;

  // True when both the configured (or fallback) H.264 encoder and the AAC
  // encoder are available in this libavcodec build.
  static bool EncodersAvailable(const VideoTrackConfig& video = VideoTrackConfig(),
                                const AudioTrackConfig& audio = AudioTrackConfig());

 private:
  static int InterruptThunk(void* opaque);

  MuxResult OpenVideoEncoder();
  MuxResult OpenAudioEncoder();
  MuxResult SetupFailure(const std::string& what, int ret);

  // Receives every packet ctx has ready and writes it to stream.
  bool DrainEncoder(AVCodecContext* ctx, AVStream* stream);
  bool EncodeAudioFrame(int nb_samples);
  void FreeContexts();

  int PendingAudioFrames() const;

  std::string path_;
  VideoTrackConfig video_config_;
  AudioTrackConfig audio_config_;

  AVFormatContext* format_ctx_ = nullptr;
  AVCodecContext* video_ctx_ = nullptr;
  AVCodecContext* audio_ctx_ = nullptr;
  AVStream* video_stream_ = nullptr;
  AVStream* audio_stream_ = nullptr;
  AVFrame* video_frame_ = nullptr;
  AVFrame* audio_frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  SwsContext* sws_ctx_ = nullptr;

  int audio_frame_size_ = 1024;
  bool audio_planar_ = true;
  std::vector<float> audio_pending_;  // interleaved
  size_t audio_pending_read_ = 0;
  int64_t audio_samples_encoded_ = 0;

  bool opened_ = false;
  bool finished_ = false;
  bool failed_ = false;

  std::function<bool()> should_interrupt_;
};

}  // namespace wavecast::mux

#endif  // WAVECAST_MUX_FFMPEG_FRAME_ENCODER_HPP_
