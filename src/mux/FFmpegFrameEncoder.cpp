// Repository: Retrovue-wavecast
// Component: FFmpeg Frame Encoder
// Purpose: Owns FFmpeg encoder/muxer handles for one MP4 output (H.264 video
//          from RGBA frames, AAC audio from float PCM).
// Copyright (c) 2025 RetroVue

#include "wavecast/mux/FFmpegFrameEncoder.hpp"

#include <algorithm>
#include <cstring>
#include <sstream>

#include "wavecast/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/log.h>
#include <libavutil/opt.h>
#include <libavutil/samplefmt.h>
#include <libswscale/swscale.h>
}

namespace wavecast::mux {

using util::Logger;

namespace {

std::string AvErrorString(int err) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(err, errbuf, sizeof(errbuf));
  return errbuf;
}

const AVCodec* FindVideoEncoder(const VideoTrackConfig& video) {
  const AVCodec* codec = nullptr;
  if (!video.codec_name.empty()) {
    codec = avcodec_find_encoder_by_name(video.codec_name.c_str());
  }
  if (!codec) {
    codec = avcodec_find_encoder(AV_CODEC_ID_H264);
  }
  return codec;
}

const AVCodec* FindAudioEncoder(const AudioTrackConfig& audio) {
  const AVCodec* codec = nullptr;
  if (!audio.codec_name.empty()) {
    codec = avcodec_find_encoder_by_name(audio.codec_name.c_str());
  }
  if (!codec) {
    codec = avcodec_find_encoder(AV_CODEC_ID_AAC);
  }
  return codec;
}

}  // namespace

FFmpegFrameEncoder::FFmpegFrameEncoder() = default;

FFmpegFrameEncoder::~FFmpegFrameEncoder() {
  if (opened_ && !finished_) {
    Abort();
  }
  FreeContexts();
}

bool FFmpegFrameEncoder::EncodersAvailable(const VideoTrackConfig& video,
                                           const AudioTrackConfig& audio) {
  return FindVideoEncoder(video) != nullptr && FindAudioEncoder(audio) != nullptr;
}

int FFmpegFrameEncoder::InterruptThunk(void* opaque) {
  auto* self = static_cast<FFmpegFrameEncoder*>(opaque);
  if (self->should_interrupt_ && self->should_interrupt_()) return 1;
  return 0;
}

void FFmpegFrameEncoder::SetInterruptCallback(std::function<bool()> should_interrupt) {
  should_interrupt_ = std::move(should_interrupt);
}

MuxResult FFmpegFrameEncoder::SetupFailure(const std::string& what, int ret) {
  std::ostringstream oss;
  oss << what;
  if (ret < 0) oss << ": " << AvErrorString(ret);
  Logger::Error("[FFmpegFrameEncoder] " + oss.str());
  FreeContexts();
  return MuxResult::Failure(MuxError::kWriterSetupFailed, oss.str());
}

MuxResult FFmpegFrameEncoder::Open(const std::string& output_path,
                                   const VideoTrackConfig& video,
                                   const AudioTrackConfig& audio) {
  if (opened_ || finished_) {
    return MuxResult::Failure(MuxError::kInvalidState, "encoder already used");
  }
  if (video.width <= 0 || video.height <= 0 || (video.width % 2) != 0 ||
      (video.height % 2) != 0 || !video.fps.IsValid()) {
    return MuxResult::Failure(MuxError::kWriterSetupFailed, "invalid video track config");
  }
  if (audio.sample_rate <= 0 || audio.channels <= 0) {
    return MuxResult::Failure(MuxError::kWriterSetupFailed, "invalid audio track config");
  }

  path_ = output_path;
  video_config_ = video;
  audio_config_ = audio;

  av_log_set_level(AV_LOG_ERROR);

  int ret = avformat_alloc_output_context2(&format_ctx_, nullptr, "mp4", path_.c_str());
  if (ret < 0 || !format_ctx_) {
    return SetupFailure("Failed to allocate output context", ret);
  }
  format_ctx_->interrupt_callback.callback = &FFmpegFrameEncoder::InterruptThunk;
  format_ctx_->interrupt_callback.opaque = this;

  MuxResult r = OpenVideoEncoder();
  if (!r.ok) return r;
  r = OpenAudioEncoder();
  if (!r.ok) return r;

  packet_ = av_packet_alloc();
  if (!packet_) {
    return SetupFailure("Failed to allocate packet", 0);
  }

  if (!(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
    ret = avio_open2(&format_ctx_->pb, path_.c_str(), AVIO_FLAG_WRITE,
                     &format_ctx_->interrupt_callback, nullptr);
    if (ret < 0) {
      return SetupFailure("Failed to open " + path_, ret);
    }
  }

  AVDictionary* muxer_opts = nullptr;
  av_dict_set(&muxer_opts, "movflags", "+faststart", 0);
  ret = avformat_write_header(format_ctx_, &muxer_opts);
  av_dict_free(&muxer_opts);
  if (ret < 0) {
    return SetupFailure("Failed to write header", ret);
  }

  opened_ = true;

  std::ostringstream oss;
  oss << "[FFmpegFrameEncoder] Opened " << path_ << " video=" << video_config_.width << "x"
      << video_config_.height << "@" << video_config_.fps.num << "/" << video_config_.fps.den
      << " " << video_ctx_->codec->name << " " << video_config_.bitrate << "bps"
      << " audio=" << audio_ctx_->codec->name << " " << audio_config_.sample_rate << "Hz/"
      << audio_config_.channels << "ch frame_size=" << audio_frame_size_;
  Logger::Info(oss.str());
  return MuxResult::Success();
}

MuxResult FFmpegFrameEncoder::OpenVideoEncoder() {
  const AVCodec* codec = FindVideoEncoder(video_config_);
  if (!codec) {
    return SetupFailure("No H.264 encoder available", 0);
  }

  video_stream_ = avformat_new_stream(format_ctx_, nullptr);
  if (!video_stream_) {
    return SetupFailure("Failed to create video stream", 0);
  }
  video_stream_->id = static_cast<int>(format_ctx_->nb_streams) - 1;

  video_ctx_ = avcodec_alloc_context3(codec);
  if (!video_ctx_) {
    return SetupFailure("Failed to allocate video codec context", 0);
  }

  const timing::RationalFps& fps = video_config_.fps;
  video_ctx_->codec_id = codec->id;
  video_ctx_->codec_type = AVMEDIA_TYPE_VIDEO;
  video_ctx_->width = video_config_.width;
  video_ctx_->height = video_config_.height;
  video_ctx_->pix_fmt = AV_PIX_FMT_YUV420P;
  video_ctx_->bit_rate = video_config_.bitrate;
  video_ctx_->gop_size = video_config_.gop_size;
  video_ctx_->max_b_frames = 0;
  video_ctx_->time_base.num = static_cast<int>(fps.den);
  video_ctx_->time_base.den = static_cast<int>(fps.num);
  video_ctx_->framerate.num = static_cast<int>(fps.num);
  video_ctx_->framerate.den = static_cast<int>(fps.den);
  if (format_ctx_->oformat->flags & AVFMT_GLOBALHEADER) {
    video_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
  }
  if (!video_config_.preset.empty()) {
    // Only x264-family encoders know "preset"; others ignore the miss.
    av_opt_set(video_ctx_->priv_data, "preset", video_config_.preset.c_str(), 0);
  }

  int ret = avcodec_open2(video_ctx_, codec, nullptr);
  if (ret < 0) {
    return SetupFailure(std::string("Failed to open video encoder ") + codec->name, ret);
  }
  ret = avcodec_parameters_from_context(video_stream_->codecpar, video_ctx_);
  if (ret < 0) {
    return SetupFailure("Failed to copy video codec parameters", ret);
  }
  video_stream_->time_base = video_ctx_->time_base;
  video_stream_->avg_frame_rate = video_ctx_->framerate;

  video_frame_ = av_frame_alloc();
  if (!video_frame_) {
    return SetupFailure("Failed to allocate video frame", 0);
  }
  video_frame_->format = AV_PIX_FMT_YUV420P;
  video_frame_->width = video_config_.width;
  video_frame_->height = video_config_.height;
  ret = av_frame_get_buffer(video_frame_, 32);
  if (ret < 0) {
    return SetupFailure("Failed to allocate video frame buffer", ret);
  }

  sws_ctx_ = sws_getContext(video_config_.width, video_config_.height, AV_PIX_FMT_RGBA,
                            video_config_.width, video_config_.height, AV_PIX_FMT_YUV420P,
                            SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!sws_ctx_) {
    return SetupFailure("Failed to create RGBA->YUV420P scaler", 0);
  }
  return MuxResult::Success();
}

MuxResult FFmpegFrameEncoder::OpenAudioEncoder() {
  const AVCodec* codec = FindAudioEncoder(audio_config_);
  if (!codec) {
    return SetupFailure("No AAC encoder available", 0);
  }

  audio_stream_ = avformat_new_stream(format_ctx_, nullptr);
  if (!audio_stream_) {
    return SetupFailure("Failed to create audio stream", 0);
  }
  audio_stream_->id = static_cast<int>(format_ctx_->nb_streams) - 1;

  audio_ctx_ = avcodec_alloc_context3(codec);
  if (!audio_ctx_) {
    return SetupFailure("Failed to allocate audio codec context", 0);
  }

  // Prefer planar float (native AAC); accept packed float.
  AVSampleFormat sample_fmt = AV_SAMPLE_FMT_NONE;
  if (codec->sample_fmts) {
    for (const AVSampleFormat* f = codec->sample_fmts; *f != AV_SAMPLE_FMT_NONE; ++f) {
      if (*f == AV_SAMPLE_FMT_FLTP) {
        sample_fmt = *f;
        break;
      }
      if (*f == AV_SAMPLE_FMT_FLT && sample_fmt == AV_SAMPLE_FMT_NONE) {
        sample_fmt = *f;
      }
    }
  } else {
    sample_fmt = AV_SAMPLE_FMT_FLTP;
  }
  if (sample_fmt == AV_SAMPLE_FMT_NONE) {
    return SetupFailure(std::string("Audio encoder ") + codec->name +
                            " does not accept float samples", 0);
  }
  audio_planar_ = (sample_fmt == AV_SAMPLE_FMT_FLTP);

  audio_ctx_->codec_id = codec->id;
  audio_ctx_->codec_type = AVMEDIA_TYPE_AUDIO;
  audio_ctx_->sample_fmt = sample_fmt;
  audio_ctx_->sample_rate = audio_config_.sample_rate;
  av_channel_layout_default(&audio_ctx_->ch_layout, audio_config_.channels);
  audio_ctx_->bit_rate = audio_config_.bitrate;
  audio_ctx_->time_base.num = 1;
  audio_ctx_->time_base.den = audio_config_.sample_rate;
  if (format_ctx_->oformat->flags & AVFMT_GLOBALHEADER) {
    audio_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
  }

  int ret = avcodec_open2(audio_ctx_, codec, nullptr);
  if (ret < 0) {
    return SetupFailure(std::string("Failed to open audio encoder ") + codec->name, ret);
  }
  ret = avcodec_parameters_from_context(audio_stream_->codecpar, audio_ctx_);
  if (ret < 0) {
    return SetupFailure("Failed to copy audio codec parameters", ret);
  }
  audio_stream_->time_base = audio_ctx_->time_base;

  audio_frame_size_ = audio_ctx_->frame_size > 0 ? audio_ctx_->frame_size : 1024;

  audio_frame_ = av_frame_alloc();
  if (!audio_frame_) {
    return SetupFailure("Failed to allocate audio frame", 0);
  }
  audio_frame_->format = audio_ctx_->sample_fmt;
  audio_frame_->sample_rate = audio_ctx_->sample_rate;
  audio_frame_->nb_samples = audio_frame_size_;
  ret = av_channel_layout_copy(&audio_frame_->ch_layout, &audio_ctx_->ch_layout);
  if (ret < 0) {
    return SetupFailure("Failed to copy audio channel layout", ret);
  }
  ret = av_frame_get_buffer(audio_frame_, 0);
  if (ret < 0) {
    return SetupFailure("Failed to allocate audio frame buffer", ret);
  }
  return MuxResult::Success();
}

bool FFmpegFrameEncoder::IsReadyForVideo() const {
  return opened_ && !finished_ && !failed_;
}

bool FFmpegFrameEncoder::IsReadyForAudio() const {
  return opened_ && !finished_ && !failed_;
}

bool FFmpegFrameEncoder::DrainEncoder(AVCodecContext* ctx, AVStream* stream) {
  for (;;) {
    int ret = avcodec_receive_packet(ctx, packet_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
      return true;
    }
    if (ret < 0) {
      Logger::Error("[FFmpegFrameEncoder] receive_packet failed: " + AvErrorString(ret));
      return false;
    }
    packet_->stream_index = stream->index;
    av_packet_rescale_ts(packet_, ctx->time_base, stream->time_base);
    // av_interleaved_write_frame takes ownership and unrefs the packet.
    ret = av_interleaved_write_frame(format_ctx_, packet_);
    if (ret < 0) {
      Logger::Error("[FFmpegFrameEncoder] write_frame failed: " + AvErrorString(ret));
      return false;
    }
  }
}

MuxResult FFmpegFrameEncoder::AppendVideo(const render::PixelBuffer& frame, int64_t frame_index) {
  if (!IsReadyForVideo()) {
    return MuxResult::Failure(MuxError::kInvalidState, "encoder not accepting video");
  }
  if (frame.width != video_config_.width || frame.height != video_config_.height ||
      frame.data.size() < static_cast<size_t>(frame.stride) * static_cast<size_t>(frame.height)) {
    std::ostringstream oss;
    oss << "frame " << frame.width << "x" << frame.height << " does not match track "
        << video_config_.width << "x" << video_config_.height;
    return MuxResult::Failure(MuxError::kFrameAppendFailed, oss.str());
  }

  int ret = av_frame_make_writable(video_frame_);
  if (ret < 0) {
    failed_ = true;
    return MuxResult::Failure(MuxError::kFrameAppendFailed,
                              "av_frame_make_writable: " + AvErrorString(ret));
  }

  const uint8_t* src[1] = {frame.data.data()};
  const int src_stride[1] = {frame.stride};
  sws_scale(sws_ctx_, src, src_stride, 0, frame.height, video_frame_->data,
            video_frame_->linesize);
  video_frame_->pts = frame_index;
  video_frame_->pict_type = AV_PICTURE_TYPE_NONE;

  ret = avcodec_send_frame(video_ctx_, video_frame_);
  if (ret == AVERROR(EAGAIN)) {
    if (!DrainEncoder(video_ctx_, video_stream_)) {
      failed_ = true;
      return MuxResult::Failure(MuxError::kFrameAppendFailed, "video drain failed");
    }
    ret = avcodec_send_frame(video_ctx_, video_frame_);
  }
  if (ret < 0) {
    failed_ = true;
    return MuxResult::Failure(MuxError::kFrameAppendFailed,
                              "send_frame: " + AvErrorString(ret));
  }
  if (!DrainEncoder(video_ctx_, video_stream_)) {
    failed_ = true;
    return MuxResult::Failure(MuxError::kFrameAppendFailed, "video packet write failed");
  }
  return MuxResult::Success();
}

int FFmpegFrameEncoder::PendingAudioFrames() const {
  const size_t channels = static_cast<size_t>(audio_config_.channels);
  return static_cast<int>((audio_pending_.size() - audio_pending_read_) / channels);
}

bool FFmpegFrameEncoder::EncodeAudioFrame(int nb_samples) {
  int ret = av_frame_make_writable(audio_frame_);
  if (ret < 0) {
    Logger::Error("[FFmpegFrameEncoder] audio make_writable: " + AvErrorString(ret));
    return false;
  }

  const int channels = audio_config_.channels;
  const float* src = audio_pending_.data() + audio_pending_read_;
  audio_frame_->nb_samples = nb_samples;
  if (audio_planar_) {
    for (int c = 0; c < channels; ++c) {
      auto* dst = reinterpret_cast<float*>(audio_frame_->data[c]);
      for (int i = 0; i < nb_samples; ++i) {
        dst[i] = src[static_cast<size_t>(i) * channels + c];
      }
    }
  } else {
    std::memcpy(audio_frame_->data[0], src,
                static_cast<size_t>(nb_samples) * static_cast<size_t>(channels) * sizeof(float));
  }
  audio_pending_read_ += static_cast<size_t>(nb_samples) * static_cast<size_t>(channels);

  audio_frame_->pts = audio_samples_encoded_;
  audio_samples_encoded_ += nb_samples;

  ret = avcodec_send_frame(audio_ctx_, audio_frame_);
  if (ret == AVERROR(EAGAIN)) {
    if (!DrainEncoder(audio_ctx_, audio_stream_)) return false;
    ret = avcodec_send_frame(audio_ctx_, audio_frame_);
  }
  if (ret < 0) {
    Logger::Error("[FFmpegFrameEncoder] audio send_frame: " + AvErrorString(ret));
    return false;
  }
  return DrainEncoder(audio_ctx_, audio_stream_);
}

MuxResult FFmpegFrameEncoder::AppendAudio(const decode::PcmChunk& chunk) {
  if (!IsReadyForAudio()) {
    return MuxResult::Failure(MuxError::kInvalidState, "encoder not accepting audio");
  }
  if (chunk.frames <= 0) {
    return MuxResult::Success();
  }
  if (chunk.sample_rate != audio_config_.sample_rate ||
      chunk.channels != audio_config_.channels) {
    std::ostringstream oss;
    oss << "chunk " << chunk.sample_rate << "Hz/" << chunk.channels
        << "ch does not match track " << audio_config_.sample_rate << "Hz/"
        << audio_config_.channels << "ch";
    return MuxResult::Failure(MuxError::kWritingFailed, oss.str());
  }

  // Compact consumed samples before appending.
  if (audio_pending_read_ > 0) {
    audio_pending_.erase(audio_pending_.begin(),
                         audio_pending_.begin() + static_cast<std::ptrdiff_t>(audio_pending_read_));
    audio_pending_read_ = 0;
  }
  audio_pending_.insert(audio_pending_.end(), chunk.samples.begin(),
                        chunk.samples.begin() +
                            static_cast<std::ptrdiff_t>(chunk.frames) * chunk.channels);

  while (PendingAudioFrames() >= audio_frame_size_) {
    if (!EncodeAudioFrame(audio_frame_size_)) {
      failed_ = true;
      return MuxResult::Failure(MuxError::kWritingFailed, "audio encode failed");
    }
  }
  return MuxResult::Success();
}

MuxResult FFmpegFrameEncoder::Finish() {
  if (!opened_ || finished_) {
    return MuxResult::Failure(MuxError::kInvalidState, "Finish without an open writer");
  }
  if (failed_) {
    Abort();
    return MuxResult::Failure(MuxError::kIncomplete, "writer failed earlier");
  }

  // Partial last audio frame; the encoder pads it.
  const int leftover = PendingAudioFrames();
  if (leftover > 0 && !EncodeAudioFrame(leftover)) {
    Abort();
    return MuxResult::Failure(MuxError::kIncomplete, "audio tail encode failed");
  }

  int ret = avcodec_send_frame(video_ctx_, nullptr);
  if (ret < 0 && ret != AVERROR_EOF) {
    Logger::Warn("[FFmpegFrameEncoder] video flush: " + AvErrorString(ret));
  }
  bool ok = DrainEncoder(video_ctx_, video_stream_);

  ret = avcodec_send_frame(audio_ctx_, nullptr);
  if (ret < 0 && ret != AVERROR_EOF) {
    Logger::Warn("[FFmpegFrameEncoder] audio flush: " + AvErrorString(ret));
  }
  ok = DrainEncoder(audio_ctx_, audio_stream_) && ok;
  if (!ok) {
    Abort();
    return MuxResult::Failure(MuxError::kIncomplete, "encoder flush failed");
  }

  ret = av_write_trailer(format_ctx_);
  if (ret < 0) {
    const std::string detail = "write_trailer: " + AvErrorString(ret);
    Logger::Error("[FFmpegFrameEncoder] " + detail);
    Abort();
    return MuxResult::Failure(MuxError::kIncomplete, detail);
  }

  if (!(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
    ret = avio_closep(&format_ctx_->pb);
    if (ret < 0) {
      const std::string detail = "close: " + AvErrorString(ret);
      FreeContexts();
      opened_ = false;
      return MuxResult::Failure(MuxError::kIncomplete, detail);
    }
  }

  finished_ = true;
  FreeContexts();

  std::ostringstream oss;
  oss << "[FFmpegFrameEncoder] Finalized " << path_ << " audio_samples=" << audio_samples_encoded_;
  Logger::Info(oss.str());
  return MuxResult::Success();
}

void FFmpegFrameEncoder::Abort() {
  if (!format_ctx_) {
    opened_ = false;
    return;
  }
  Logger::Warn("[FFmpegFrameEncoder] Aborting " + path_ + " without trailer");
  if (format_ctx_->pb && !(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
    avio_closep(&format_ctx_->pb);
  }
  FreeContexts();
  opened_ = false;
  failed_ = true;
}

void FFmpegFrameEncoder::FreeContexts() {
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
  if (video_frame_) av_frame_free(&video_frame_);
  if (audio_frame_) av_frame_free(&audio_frame_);
  if (packet_) av_packet_free(&packet_);
  if (video_ctx_) avcodec_free_context(&video_ctx_);
  if (audio_ctx_) avcodec_free_context(&audio_ctx_);
  if (format_ctx_) {
    if (format_ctx_->pb && !(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
      avio_closep(&format_ctx_->pb);
    }
    avformat_free_context(format_ctx_);
    format_ctx_ = nullptr;
  }
  video_stream_ = nullptr;
  audio_stream_ = nullptr;
  audio_pending_.clear();
  audio_pending_read_ = 0;
}

}  // namespace wavecast::mux
