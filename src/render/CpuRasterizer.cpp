// Repository: Retrovue-wavecast
// Component: CPU Rasterizer
// Purpose: Software implementation of IRasterizer over a PixelBuffer.
// Copyright (c) 2025 RetroVue

#include "wavecast/render/CpuRasterizer.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

#include "wavecast/render/BitmapFont.hpp"

namespace wavecast::render {

namespace {

float Clamp01(float v) {
  return std::min(1.0f, std::max(0.0f, v));
}

int FloorToInt(float v) { return static_cast<int>(std::floor(v)); }
int CeilToInt(float v) { return static_cast<int>(std::ceil(v)); }
int RoundToInt(float v) { return static_cast<int>(std::lround(v)); }

}  // namespace

CpuRasterizer::CpuRasterizer(PixelBuffer& target) : target_(target) {}

void CpuRasterizer::BlendPixel(int x, int y, Rgba color, float coverage) {
  if (x < 0 || y < 0 || x >= target_.width || y >= target_.height) return;
  const float alpha = (static_cast<float>(color.a) / 255.0f) * Clamp01(coverage);
  if (alpha <= 0.0f) return;

  uint8_t* px = target_.Pixel(x, y);
  if (alpha >= 1.0f) {
    px[0] = color.r;
    px[1] = color.g;
    px[2] = color.b;
    px[3] = 255;
    return;
  }
  const float inv = 1.0f - alpha;
  px[0] = static_cast<uint8_t>(static_cast<float>(color.r) * alpha + static_cast<float>(px[0]) * inv + 0.5f);
  px[1] = static_cast<uint8_t>(static_cast<float>(color.g) * alpha + static_cast<float>(px[1]) * inv + 0.5f);
  px[2] = static_cast<uint8_t>(static_cast<float>(color.b) * alpha + static_cast<float>(px[2]) * inv + 0.5f);
  const float dst_a = static_cast<float>(px[3]) / 255.0f;
  px[3] = static_cast<uint8_t>((alpha + dst_a * inv) * 255.0f + 0.5f);
}

void CpuRasterizer::Clear(Rgba color) {
  if (target_.Empty()) return;
  uint8_t* row0 = target_.Pixel(0, 0);
  for (int x = 0; x < target_.width; ++x) {
    uint8_t* px = row0 + static_cast<size_t>(x) * kBytesPerPixel;
    px[0] = color.r;
    px[1] = color.g;
    px[2] = color.b;
    px[3] = color.a;
  }
  for (int y = 1; y < target_.height; ++y) {
    std::memcpy(target_.Pixel(0, y), row0, static_cast<size_t>(target_.stride));
  }
}

void CpuRasterizer::FillRect(float x, float y, float w, float h, Rgba color) {
  if (w <= 0.0f || h <= 0.0f) return;
  const int x0 = std::max(0, RoundToInt(x));
  const int y0 = std::max(0, RoundToInt(y));
  const int x1 = std::min(target_.width, RoundToInt(x + w));
  const int y1 = std::min(target_.height, RoundToInt(y + h));
  for (int py = y0; py < y1; ++py) {
    for (int px = x0; px < x1; ++px) {
      BlendPixel(px, py, color, 1.0f);
    }
  }
}

void CpuRasterizer::FillCircle(float cx, float cy, float radius, Rgba color) {
  if (radius <= 0.0f) return;
  const int x0 = std::max(0, FloorToInt(cx - radius - 1.0f));
  const int y0 = std::max(0, FloorToInt(cy - radius - 1.0f));
  const int x1 = std::min(target_.width, CeilToInt(cx + radius + 1.0f));
  const int y1 = std::min(target_.height, CeilToInt(cy + radius + 1.0f));
  for (int py = y0; py < y1; ++py) {
    const float dy = static_cast<float>(py) + 0.5f - cy;
    for (int px = x0; px < x1; ++px) {
      const float dx = static_cast<float>(px) + 0.5f - cx;
      const float d = std::sqrt(dx * dx + dy * dy);
      BlendPixel(px, py, color, radius - d + 0.5f);
    }
  }
}

void CpuRasterizer::StrokeCircle(float cx, float cy, float radius, float thickness,
                                 Rgba color) {
  if (radius <= 0.0f || thickness <= 0.0f) return;
  const float outer = radius + thickness * 0.5f;
  const float inner = std::max(0.0f, radius - thickness * 0.5f);
  const int x0 = std::max(0, FloorToInt(cx - outer - 1.0f));
  const int y0 = std::max(0, FloorToInt(cy - outer - 1.0f));
  const int x1 = std::min(target_.width, CeilToInt(cx + outer + 1.0f));
  const int y1 = std::min(target_.height, CeilToInt(cy + outer + 1.0f));
  for (int py = y0; py < y1; ++py) {
    const float dy = static_cast<float>(py) + 0.5f - cy;
    for (int px = x0; px < x1; ++px) {
      const float dx = static_cast<float>(px) + 0.5f - cx;
      const float d = std::sqrt(dx * dx + dy * dy);
      const float coverage = std::min(outer - d, d - inner) + 0.5f;
      BlendPixel(px, py, color, coverage);
    }
  }
}

void CpuRasterizer::DrawImageInCircle(const RgbaImage& image, float cx, float cy,
                                      float radius) {
  if (radius <= 0.0f || image.Empty()) return;
  const float side = radius * 2.0f;
  const float scale = std::max(side / static_cast<float>(image.width),
                               side / static_cast<float>(image.height));

  const int x0 = std::max(0, FloorToInt(cx - radius - 1.0f));
  const int y0 = std::max(0, FloorToInt(cy - radius - 1.0f));
  const int x1 = std::min(target_.width, CeilToInt(cx + radius + 1.0f));
  const int y1 = std::min(target_.height, CeilToInt(cy + radius + 1.0f));
  for (int py = y0; py < y1; ++py) {
    const float dy = static_cast<float>(py) + 0.5f - cy;
    for (int px = x0; px < x1; ++px) {
      const float dx = static_cast<float>(px) + 0.5f - cx;
      const float edge = radius - std::sqrt(dx * dx + dy * dy) + 0.5f;
      if (edge <= 0.0f) continue;

      // Nearest-neighbour sample, image centered on the circle.
      int sx = FloorToInt(dx / scale + static_cast<float>(image.width) * 0.5f);
      int sy = FloorToInt(dy / scale + static_cast<float>(image.height) * 0.5f);
      sx = std::min(image.width - 1, std::max(0, sx));
      sy = std::min(image.height - 1, std::max(0, sy));
      const uint8_t* src = image.Pixel(sx, sy);
      BlendPixel(px, py, Rgba(src[0], src[1], src[2], src[3]), edge);
    }
  }
}

void CpuRasterizer::DrawText(int x, int y, const std::string& text, int scale,
                             Rgba color) {
  const int s = scale > 0 ? scale : 1;
  const std::string ascii = AsciiSanitize(text);
  int pen_x = x;
  for (char c : ascii) {
    const uint8_t* columns = GlyphFor(c);
    for (int col = 0; col < kGlyphWidth; ++col) {
      const uint8_t bits = columns[col];
      for (int row = 0; row < kGlyphHeight; ++row) {
        if ((bits & (1u << row)) == 0) continue;
        const int bx = pen_x + col * s;
        const int by = y + row * s;
        for (int yy = 0; yy < s; ++yy) {
          for (int xx = 0; xx < s; ++xx) {
            BlendPixel(bx + xx, by + yy, color, 1.0f);
          }
        }
      }
    }
    pen_x += kGlyphAdvance * s;
  }
}

}  // namespace wavecast::render
