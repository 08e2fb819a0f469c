// Repository: Retrovue-wavecast
// Component: Frame Encoder Interface
// Purpose: Push-with-backpressure sink for RGBA frames and PCM chunks.
//          Production: FFmpegFrameEncoder. Tests: fakes in tests/fixtures.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_MUX_IFRAME_ENCODER_HPP_
#define WAVECAST_MUX_IFRAME_ENCODER_HPP_

#include <cstdint>
#include <functional>
#include <string>

#include "wavecast/decode/AudioTypes.hpp"
#include "wavecast/mux/MuxTypes.hpp"
#include "wavecast/render/PixelBuffer.hpp"

namespace wavecast::mux {

// IFrameEncoder writes one video and one audio track to a container.
//
// Lifecycle: Open -> AppendVideo* -> AppendAudio* -> Finish, or Abort at any
// point. Appends are only legal while the matching IsReadyFor*() is true.
// Not thread-safe.
class IFrameEncoder {
 public:
  virtual ~IFrameEncoder() = default;

  virtual MuxResult Open(const std::string& output_path,
                         const VideoTrackConfig& video,
                         const AudioTrackConfig& audio) = 0;

  virtual bool IsReadyForVideo() const = 0;
  virtual bool IsReadyForAudio() const = 0;

  // frame must match the configured video dimensions. frame_index is the
  // presentation index in units of 1/fps.
  virtual MuxResult AppendVideo(const render::PixelBuffer& frame, int64_t frame_index) = 0;

  // chunk must match the configured audio rate and channel count.
  virtual MuxResult AppendAudio(const decode::PcmChunk& chunk) = 0;

  // Flushes both encoders, writes the trailer and closes the file.
  virtual MuxResult Finish() = 0;

  // Closes without finalizing. The partial file is left for the caller.
  virtual void Abort() = 0;

  // Polled from blocking output I/O; returning true aborts the write.
  virtual void SetInterruptCallback(std::function<bool()> should_interrupt) = 0;
};

}  // namespace wavecast::mux

#endif  // WAVECAST_MUX_IFRAME_ENCODER_HPP_
