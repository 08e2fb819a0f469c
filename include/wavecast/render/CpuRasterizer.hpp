// Repository: Retrovue-wavecast
// Component: CPU Rasterizer
// Purpose: Software implementation of IRasterizer over a PixelBuffer.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_RENDER_CPU_RASTERIZER_HPP_
#define WAVECAST_RENDER_CPU_RASTERIZER_HPP_

#include "wavecast/render/IRasterizer.hpp"

namespace wavecast::render {

// CpuRasterizer writes straight into a caller-owned PixelBuffer. Circles get
// a one-pixel anti-aliased edge; rectangles are snapped to whole pixels.
// Output depends only on the call sequence, never on prior instances.
class CpuRasterizer : public IRasterizer {
 public:
  explicit CpuRasterizer(PixelBuffer& target);

  int Width() const override { return target_.width; }
  int Height() const override { return target_.height; }

  void Clear(Rgba color) override;
  void FillRect(float x, float y, float w, float h, Rgba color) override;
  void FillCircle(float cx, float cy, float radius, Rgba color) override;
  void StrokeCircle(float cx, float cy, float radius, float thickness,
                    Rgba color) override;
  void DrawImageInCircle(const RgbaImage& image, float cx, float cy,
                         float radius) override;
  void DrawText(int x, int y, const std::string& text, int scale,
                Rgba color) override;

 private:
  // Source-over blend of color at coverage in [0, 1].
  void BlendPixel(int x, int y, Rgba color, float coverage);

  PixelBuffer& target_;
};

}  // namespace wavecast::render

#endif  // WAVECAST_RENDER_CPU_RASTERIZER_HPP_
