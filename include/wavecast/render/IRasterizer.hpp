// Repository: Retrovue-wavecast
// Component: Rasterizer Interface
// Purpose: 2D drawing primitives used by FrameSynthesizer. Production:
//          CpuRasterizer. Tests: recording rasterizers.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_RENDER_IRASTERIZER_HPP_
#define WAVECAST_RENDER_IRASTERIZER_HPP_

#include <string>

#include "wavecast/render/PixelBuffer.hpp"

namespace wavecast::render {

// IRasterizer draws onto one fixed-size canvas. Coordinates are in pixels
// with the origin at the top-left corner; colors are blended source-over
// using their alpha. Geometry falling outside the canvas is clipped.
class IRasterizer {
 public:
  virtual ~IRasterizer() = default;

  virtual int Width() const = 0;
  virtual int Height() const = 0;

  // Overwrites every pixel (no blending).
  virtual void Clear(Rgba color) = 0;

  virtual void FillRect(float x, float y, float w, float h, Rgba color) = 0;
  virtual void FillCircle(float cx, float cy, float radius, Rgba color) = 0;
  virtual void StrokeCircle(float cx, float cy, float radius, float thickness,
                            Rgba color) = 0;

  // Scales image to cover the circle's bounding square (center crop) and
  // draws it clipped to the circle.
  virtual void DrawImageInCircle(const RgbaImage& image, float cx, float cy,
                                 float radius) = 0;

  // Draws 5x7 bitmap text with its top-left corner at (x, y), each font
  // pixel scaled to scale x scale canvas pixels.
  virtual void DrawText(int x, int y, const std::string& text, int scale,
                        Rgba color) = 0;
};

}  // namespace wavecast::render

#endif  // WAVECAST_RENDER_IRASTERIZER_HPP_
