// Repository: Retrovue-wavecast
// Component: Pixel Buffer
// Purpose: RGBA8 raster storage shared by the synthesizer, the rasterizer and
//          the video encoder.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_RENDER_PIXEL_BUFFER_HPP_
#define WAVECAST_RENDER_PIXEL_BUFFER_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace wavecast::render {

constexpr int kBytesPerPixel = 4;

// Straight (non-premultiplied) 8-bit RGBA color.
struct Rgba {
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;
  uint8_t a = 255;

  constexpr Rgba() = default;
  constexpr Rgba(uint8_t r_, uint8_t g_, uint8_t b_, uint8_t a_ = 255)
      : r(r_), g(g_), b(b_), a(a_) {}

  // Same color with alpha scaled by opacity in [0, 1].
  Rgba WithOpacity(float opacity) const {
    if (opacity <= 0.0f) return Rgba(r, g, b, 0);
    if (opacity >= 1.0f) return *this;
    return Rgba(r, g, b, static_cast<uint8_t>(static_cast<float>(a) * opacity + 0.5f));
  }

  bool operator==(const Rgba& o) const {
    return r == o.r && g == o.g && b == o.b && a == o.a;
  }
  bool operator!=(const Rgba& o) const { return !(*this == o); }
};

// PixelBuffer is a tightly packed RGBA8 raster (stride == width * 4).
struct PixelBuffer {
  int width = 0;
  int height = 0;
  int stride = 0;  // bytes per row
  std::vector<uint8_t> data;

  PixelBuffer() = default;
  PixelBuffer(int w, int h) { Allocate(w, h); }

  void Allocate(int w, int h) {
    width = w > 0 ? w : 0;
    height = h > 0 ? h : 0;
    stride = width * kBytesPerPixel;
    data.assign(static_cast<size_t>(stride) * static_cast<size_t>(height), 0);
  }

  bool Empty() const { return width == 0 || height == 0; }
  size_t SizeBytes() const { return data.size(); }

  uint8_t* Pixel(int x, int y) {
    return data.data() + static_cast<size_t>(y) * static_cast<size_t>(stride) +
           static_cast<size_t>(x) * kBytesPerPixel;
  }
  const uint8_t* Pixel(int x, int y) const {
    return data.data() + static_cast<size_t>(y) * static_cast<size_t>(stride) +
           static_cast<size_t>(x) * kBytesPerPixel;
  }
};

// Decoded still image (avatars). Same layout as PixelBuffer.
using RgbaImage = PixelBuffer;

}  // namespace wavecast::render

#endif  // WAVECAST_RENDER_PIXEL_BUFFER_HPP_
