// Repository: Retrovue-wavecast
// Component: Frame Types
// Purpose: Frame request and rendered frame passed from the frame loop to
//          the muxer.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_RENDER_FRAME_TYPES_HPP_
#define WAVECAST_RENDER_FRAME_TYPES_HPP_

#include <cstdint>
#include <utility>

#include "wavecast/render/PixelBufferPool.hpp"
#include "wavecast/timing/RationalFps.hpp"

namespace wavecast::render {

// Presentation time is index / fps, kept rational until it is needed in
// seconds.
struct FrameRequest {
  uint32_t index = 0;
  timing::RationalFps fps;

  double PresentationTimeSec() const {
    return fps.FrameIndexToSeconds(static_cast<int64_t>(index));
  }
};

// A rendered frame owns its pooled raster. Moving the frame into the muxer
// transfers that ownership; destroying it returns the raster to its pool.
struct RenderedFrame {
  FrameRequest request;
  PixelBufferPool::Handle buffer;

  RenderedFrame() = default;
  RenderedFrame(FrameRequest req, PixelBufferPool::Handle buf)
      : request(req), buffer(std::move(buf)) {}

  bool Valid() const { return buffer != nullptr; }
};

}  // namespace wavecast::render

#endif  // WAVECAST_RENDER_FRAME_TYPES_HPP_
