// Repository: Retrovue-wavecast
// Component: Audio Decoder Interface
// Purpose: Chunked PCM pull capability. Production: FFmpegAudioDecoder.
//          Tests: synthetic decoders from tests/fixtures.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_DECODE_IAUDIO_DECODER_HPP_
#define WAVECAST_DECODE_IAUDIO_DECODER_HPP_

#include <functional>

#include "wavecast/decode/AudioTypes.hpp"

namespace wavecast::decode {

// IAudioDecoder pulls a single audio track as fixed-size PCM chunks.
//
// Lifecycle:
// 1. Construct with a DecoderConfig
// 2. Open() inspects the input and prepares output conversion
// 3. ReadChunk() until kEndOfStream, kFailed or kInterrupted
// 4. Close() or destructor
//
// Not thread-safe: use from the generation worker only. The interrupt
// predicate may be evaluated from inside blocking I/O.
class IAudioDecoder {
 public:
  virtual ~IAudioDecoder() = default;

  virtual AudioOpenResult Open() = 0;

  // Fills out with up to chunk_frames frames. out is cleared first.
  virtual ChunkStatus ReadChunk(PcmChunk& out) = 0;

  virtual void Close() = 0;

  virtual bool IsOpen() const = 0;
  virtual const AudioSourceInfo& Info() const = 0;
  virtual const DecoderConfig& Config() const = 0;
  virtual const DecoderStats& Stats() const = 0;

  // Returns true to abort the current read as soon as possible.
  virtual void SetInterruptCallback(std::function<bool()> should_interrupt) = 0;
};

}  // namespace wavecast::decode

#endif  // WAVECAST_DECODE_IAUDIO_DECODER_HPP_
