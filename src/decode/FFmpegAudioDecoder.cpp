// Repository: Retrovue-wavecast
// Component: FFmpeg Audio Decoder
// Purpose: Chunked float PCM decoding of a single audio track using
//          libavformat/libavcodec/libswresample.
// Copyright (c) 2025 RetroVue

#include "wavecast/decode/FFmpegAudioDecoder.hpp"

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
#include <libavutil/mathematics.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

namespace wavecast::decode {

using util::Logger;

namespace {

std::string AvErrorString(int err) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(err, errbuf, sizeof(errbuf));
  return errbuf;
}

}  // namespace

const char* AudioDecodeErrorToString(AudioDecodeError error) {
  switch (error) {
    case AudioDecodeError::kNone: return "None";
    case AudioDecodeError::kOpenFailed: return "OpenFailed";
    case AudioDecodeError::kNoAudioTrack: return "NoAudioTrack";
    case AudioDecodeError::kResamplerFailed: return "ResamplerFailed";
    case AudioDecodeError::kNotOpen: return "NotOpen";
  }
  return "Unknown";
}

const char* ChunkStatusToString(ChunkStatus status) {
  switch (status) {
    case ChunkStatus::kData: return "Data";
    case ChunkStatus::kSkipped: return "Skipped";
    case ChunkStatus::kEndOfStream: return "EndOfStream";
    case ChunkStatus::kFailed: return "Failed";
    case ChunkStatus::kInterrupted: return "Interrupted";
  }
  return "Unknown";
}

FFmpegAudioDecoder::FFmpegAudioDecoder(const DecoderConfig& config)
    : config_(config) {
  info_.uri = config_.input_uri;
}

FFmpegAudioDecoder::~FFmpegAudioDecoder() {
  Close();
}

int FFmpegAudioDecoder::InterruptThunk(void* opaque) {
  auto* self = static_cast<FFmpegAudioDecoder*>(opaque);
  if (self->should_interrupt_ && self->should_interrupt_()) return 1;
  return 0;
}

void FFmpegAudioDecoder::SetInterruptCallback(std::function<bool()> should_interrupt) {
  should_interrupt_ = std::move(should_interrupt);
}

AudioOpenResult FFmpegAudioDecoder::Open() {
  if (opened_) {
    return AudioOpenResult::Success(info_);
  }
  if (config_.output_sample_rate <= 0 || config_.output_channels <= 0 ||
      config_.chunk_frames <= 0) {
    return AudioOpenResult::Failure(AudioDecodeError::kResamplerFailed,
                                    "invalid output format in DecoderConfig");
  }

  Logger::Debug("[FFmpegAudioDecoder] Opening: " + config_.input_uri);

  // Suppress FFmpeg warnings but keep errors visible
  av_log_set_level(AV_LOG_ERROR);

  format_ctx_ = avformat_alloc_context();
  if (!format_ctx_) {
    return AudioOpenResult::Failure(AudioDecodeError::kOpenFailed,
                                    "failed to allocate format context");
  }
  format_ctx_->interrupt_callback.callback = &FFmpegAudioDecoder::InterruptThunk;
  format_ctx_->interrupt_callback.opaque = this;

  int ret = avformat_open_input(&format_ctx_, config_.input_uri.c_str(), nullptr, nullptr);
  if (ret < 0) {
    // avformat_open_input frees the context on failure.
    format_ctx_ = nullptr;
    std::ostringstream oss;
    oss << "open_input failed uri=" << config_.input_uri << " err=" << AvErrorString(ret);
    Logger::Error("[FFmpegAudioDecoder] " + oss.str());
    return AudioOpenResult::Failure(AudioDecodeError::kOpenFailed, oss.str());
  }

  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) {
    std::ostringstream oss;
    oss << "find_stream_info failed uri=" << config_.input_uri << " err=" << AvErrorString(ret);
    Logger::Error("[FFmpegAudioDecoder] " + oss.str());
    Close();
    return AudioOpenResult::Failure(AudioDecodeError::kOpenFailed, oss.str());
  }

  if (!FindAudioStream()) {
    Logger::Warn("[FFmpegAudioDecoder] No audio stream in " + config_.input_uri);
    Close();
    return AudioOpenResult::Failure(AudioDecodeError::kNoAudioTrack,
                                    "no audio stream in " + config_.input_uri);
  }

  if (!InitializeAudioCodec()) {
    Close();
    return AudioOpenResult::Failure(AudioDecodeError::kNoAudioTrack,
                                    "audio codec unavailable for " + config_.input_uri);
  }

  if (!InitializeResampler()) {
    Close();
    return AudioOpenResult::Failure(AudioDecodeError::kResamplerFailed,
                                    "failed to initialize resampler");
  }

  packet_ = av_packet_alloc();
  if (!packet_) {
    Close();
    return AudioOpenResult::Failure(AudioDecodeError::kOpenFailed, "packet_alloc failed");
  }

  AVStream* stream = format_ctx_->streams[audio_stream_index_];
  if (format_ctx_->duration != AV_NOPTS_VALUE && format_ctx_->duration > 0) {
    info_.duration_sec = static_cast<double>(format_ctx_->duration) / AV_TIME_BASE;
  } else if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
    info_.duration_sec = static_cast<double>(stream->duration) * av_q2d(stream->time_base);
  } else {
    info_.duration_sec = 0.0;
  }
  info_.sample_rate = codec_ctx_->sample_rate;
  info_.channels = codec_ctx_->ch_layout.nb_channels;

  opened_ = true;
  demux_eof_ = false;
  decoder_drained_ = false;
  pending_.clear();
  pending_read_ = 0;

  std::ostringstream oss;
  oss << "[FFmpegAudioDecoder] Opened uri=" << config_.input_uri
      << " duration=" << info_.duration_sec << "s"
      << " source=" << info_.sample_rate << "Hz/" << info_.channels << "ch"
      << " output=" << config_.output_sample_rate << "Hz/" << config_.output_channels << "ch";
  Logger::Debug(oss.str());
  return AudioOpenResult::Success(info_);
}

bool FFmpegAudioDecoder::FindAudioStream() {
  for (unsigned int i = 0; i < format_ctx_->nb_streams; i++) {
    if (format_ctx_->streams[i]->codecpar->codec_type == AVMEDIA_TYPE_AUDIO) {
      audio_stream_index_ = static_cast<int>(i);
      return true;
    }
  }
  return false;
}

bool FFmpegAudioDecoder::InitializeAudioCodec() {
  AVCodecParameters* codecpar = format_ctx_->streams[audio_stream_index_]->codecpar;

  const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
  if (!codec) {
    std::ostringstream oss;
    oss << "[FFmpegAudioDecoder] Audio codec not found: " << codecpar->codec_id;
    Logger::Error(oss.str());
    return false;
  }

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    Logger::Error("[FFmpegAudioDecoder] Failed to allocate audio codec context");
    return false;
  }

  if (avcodec_parameters_to_context(codec_ctx_, codecpar) < 0) {
    Logger::Error("[FFmpegAudioDecoder] Failed to copy audio codec parameters");
    return false;
  }

  int ret = avcodec_open2(codec_ctx_, codec, nullptr);
  if (ret < 0) {
    Logger::Error("[FFmpegAudioDecoder] Failed to open audio codec: " + AvErrorString(ret));
    return false;
  }

  frame_ = av_frame_alloc();
  if (!frame_) {
    Logger::Error("[FFmpegAudioDecoder] Failed to allocate audio frame");
    return false;
  }
  return true;
}

bool FFmpegAudioDecoder::InitializeResampler() {
  AVChannelLayout src_ch_layout;
  std::memset(&src_ch_layout, 0, sizeof(src_ch_layout));
  if (codec_ctx_->ch_layout.nb_channels <= 0) {
    Logger::Error("[FFmpegAudioDecoder] Invalid channel count");
    return false;
  }
  if (codec_ctx_->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC) {
    av_channel_layout_default(&src_ch_layout, codec_ctx_->ch_layout.nb_channels);
  } else if (av_channel_layout_copy(&src_ch_layout, &codec_ctx_->ch_layout) < 0) {
    Logger::Error("[FFmpegAudioDecoder] Failed to copy source channel layout");
    return false;
  }

  AVChannelLayout dst_ch_layout;
  std::memset(&dst_ch_layout, 0, sizeof(dst_ch_layout));
  av_channel_layout_default(&dst_ch_layout, config_.output_channels);

  int ret = swr_alloc_set_opts2(&swr_ctx_,
                                &dst_ch_layout, AV_SAMPLE_FMT_FLT, config_.output_sample_rate,
                                &src_ch_layout, codec_ctx_->sample_fmt, codec_ctx_->sample_rate,
                                0, nullptr);
  // swr_alloc_set_opts2 copies the layouts.
  av_channel_layout_uninit(&src_ch_layout);
  av_channel_layout_uninit(&dst_ch_layout);
  if (ret < 0 || !swr_ctx_) {
    Logger::Error("[FFmpegAudioDecoder] Failed to set resampler options: " + AvErrorString(ret));
    return false;
  }

  ret = swr_init(swr_ctx_);
  if (ret < 0) {
    Logger::Error("[FFmpegAudioDecoder] Failed to initialize resampler: " + AvErrorString(ret));
    swr_free(&swr_ctx_);
    return false;
  }
  return true;
}

ChunkStatus FFmpegAudioDecoder::ReadChunk(PcmChunk& out) {
  out.Clear();
  out.sample_rate = config_.output_sample_rate;
  out.channels = config_.output_channels;
  if (!opened_) {
    return ChunkStatus::kFailed;
  }

  while (PendingFrames() < config_.chunk_frames && !decoder_drained_) {
    if (should_interrupt_ && should_interrupt_()) {
      return ChunkStatus::kInterrupted;
    }

    if (!demux_eof_) {
      int ret = av_read_frame(format_ctx_, packet_);
      if (ret == AVERROR_EOF) {
        demux_eof_ = true;
        avcodec_send_packet(codec_ctx_, nullptr);  // enter draining mode
      } else if (ret == AVERROR_EXIT) {
        return ChunkStatus::kInterrupted;
      } else if (ret < 0) {
        Logger::Error("[FFmpegAudioDecoder] read_frame failed: " + AvErrorString(ret));
        return ChunkStatus::kFailed;
      } else {
        if (packet_->stream_index != audio_stream_index_) {
          av_packet_unref(packet_);
          continue;
        }
        ret = avcodec_send_packet(codec_ctx_, packet_);
        if (ret == AVERROR(EAGAIN)) {
          if (!ReceiveFrames()) {
            av_packet_unref(packet_);
            return ChunkStatus::kFailed;
          }
          ret = avcodec_send_packet(codec_ctx_, packet_);
        }
        av_packet_unref(packet_);
        if (ret < 0) {
          stats_.skipped_packets++;
          Logger::Debug("[FFmpegAudioDecoder] Dropped corrupt packet: " + AvErrorString(ret));
          if (PendingFrames() == 0) {
            return ChunkStatus::kSkipped;
          }
          continue;
        }
      }
    }

    if (!ReceiveFrames()) {
      return ChunkStatus::kFailed;
    }
  }

  if (PendingFrames() == 0) {
    return ChunkStatus::kEndOfStream;
  }

  TakePending(out, config_.chunk_frames);
  stats_.chunks_delivered++;
  stats_.frames_delivered += static_cast<uint64_t>(out.frames);
  return ChunkStatus::kData;
}

bool FFmpegAudioDecoder::ReceiveFrames() {
  for (;;) {
    int ret = avcodec_receive_frame(codec_ctx_, frame_);
    if (ret == AVERROR(EAGAIN)) {
      return true;
    }
    if (ret == AVERROR_EOF) {
      decoder_drained_ = true;
      return FlushResampler();
    }
    if (ret < 0) {
      stats_.skipped_packets++;
      Logger::Debug("[FFmpegAudioDecoder] Dropped undecodable frame: " + AvErrorString(ret));
      return true;
    }
    const bool converted = ConvertAudioFrame(frame_);
    av_frame_unref(frame_);
    if (!converted) {
      return false;
    }
  }
}

bool FFmpegAudioDecoder::ConvertAudioFrame(AVFrame* av_frame) {
  const int channels = config_.output_channels;
  const int64_t delay = swr_get_delay(swr_ctx_, av_frame->sample_rate);
  const int64_t out_samples = av_rescale_rnd(delay + av_frame->nb_samples,
                                             config_.output_sample_rate,
                                             av_frame->sample_rate, AV_ROUND_UP);
  if (out_samples <= 0) {
    return true;
  }

  const size_t base = pending_.size();
  pending_.resize(base + static_cast<size_t>(out_samples) * channels);
  uint8_t* out_data[1] = {reinterpret_cast<uint8_t*>(pending_.data() + base)};

  const int converted = swr_convert(swr_ctx_, out_data, static_cast<int>(out_samples),
                                    const_cast<const uint8_t**>(av_frame->extended_data),
                                    av_frame->nb_samples);
  if (converted < 0) {
    pending_.resize(base);
    Logger::Error("[FFmpegAudioDecoder] Audio resampling failed: " + AvErrorString(converted));
    return false;
  }
  pending_.resize(base + static_cast<size_t>(converted) * channels);
  return true;
}

bool FFmpegAudioDecoder::FlushResampler() {
  const int channels = config_.output_channels;
  const int64_t delay = swr_get_delay(swr_ctx_, config_.output_sample_rate);
  if (delay <= 0) {
    return true;
  }
  const size_t base = pending_.size();
  pending_.resize(base + static_cast<size_t>(delay) * channels);
  uint8_t* out_data[1] = {reinterpret_cast<uint8_t*>(pending_.data() + base)};
  const int converted = swr_convert(swr_ctx_, out_data, static_cast<int>(delay), nullptr, 0);
  if (converted < 0) {
    pending_.resize(base);
    Logger::Error("[FFmpegAudioDecoder] Resampler flush failed: " + AvErrorString(converted));
    return false;
  }
  pending_.resize(base + static_cast<size_t>(converted) * channels);
  return true;
}

int FFmpegAudioDecoder::PendingFrames() const {
  return static_cast<int>((pending_.size() - pending_read_) /
                          static_cast<size_t>(config_.output_channels));
}

void FFmpegAudioDecoder::TakePending(PcmChunk& out, int max_frames) {
  const int frames = std::min(max_frames, PendingFrames());
  const size_t count = static_cast<size_t>(frames) * config_.output_channels;
  out.samples.assign(pending_.begin() + static_cast<std::ptrdiff_t>(pending_read_),
                     pending_.begin() + static_cast<std::ptrdiff_t>(pending_read_ + count));
  out.frames = frames;
  pending_read_ += count;

  // Compact once the consumed prefix dominates the buffer.
  if (pending_read_ >= pending_.size() / 2) {
    pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(pending_read_));
    pending_read_ = 0;
  }
}

void FFmpegAudioDecoder::Close() {
  if (swr_ctx_) {
    swr_free(&swr_ctx_);
  }
  if (frame_) {
    av_frame_free(&frame_);
  }
  if (packet_) {
    av_packet_free(&packet_);
  }
  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }
  if (format_ctx_) {
    avformat_close_input(&format_ctx_);
  }
  audio_stream_index_ = -1;
  opened_ = false;
  pending_.clear();
  pending_read_ = 0;
}

}  // namespace wavecast::decode
