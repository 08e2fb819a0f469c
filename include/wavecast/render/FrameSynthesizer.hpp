// Repository: Retrovue-wavecast
// Component: Frame Synthesizer
// Purpose: Draws one visualization frame (bars, avatar, timer, handle) as a
//          pure function of time, waveform and overlay assets.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_RENDER_FRAME_SYNTHESIZER_HPP_
#define WAVECAST_RENDER_FRAME_SYNTHESIZER_HPP_

#include <memory>
#include <string>

#include "wavecast/analysis/WaveformTypes.hpp"
#include "wavecast/render/IRasterizer.hpp"
#include "wavecast/render/PixelBuffer.hpp"

namespace wavecast::render {

// OverlayAssets are the per-request inputs that do not change per frame.
struct OverlayAssets {
  std::string username;                  // Drawn as "@username"
  Rgba accent{0x1d, 0x9b, 0xf0, 255};    // Background fill
  std::shared_ptr<const RgbaImage> avatar;  // nullptr -> placeholder disc
};

// SynthesizerStyle holds every visual constant. Lengths marked "ref px" are
// pixels at the 720-line reference design and scale with canvas height.
struct SynthesizerStyle {
  // Bars
  int bar_count = 50;
  float min_visible_floor = 0.05f;
  float bars_center_y = 0.78f;          // fraction of height
  float max_bar_height = 0.20f;         // fraction of height
  float base_bar_height = 0.011f;       // fraction of height
  float bar_area_width = 0.80f;         // fraction of width
  float bar_fill_ratio = 0.60f;         // bar width / slot width
  Rgba bar_color{255, 255, 255, 255};
  float played_opacity = 1.0f;
  float unplayed_opacity = 0.4f;

  // Placeholder animation: sin(t * k + i * phase) * a + b
  float placeholder_k = 3.0f;
  float placeholder_phase = 0.35f;
  float placeholder_a = 0.3f;
  float placeholder_b = 0.5f;

  // Avatar
  float avatar_center_y = 0.40f;        // fraction of height
  float avatar_diameter_ref = 200.0f;   // ref px
  float avatar_border_ref = 4.0f;       // ref px
  Rgba avatar_border_color{255, 255, 255, 255};
  Rgba placeholder_fill{128, 128, 128, 255};

  // Text
  float margin_ref = 40.0f;             // ref px
  float text_height_ref = 40.0f;        // ref px
  float shadow_offset_ref = 2.0f;       // ref px
  Rgba text_color{255, 255, 255, 230};  // white at 0.9
  Rgba shadow_color{0, 0, 0, 128};      // black at 0.5

  float reference_height = 720.0f;
};

// FrameSynthesizer is stateless apart from its style: the same arguments
// always produce byte-identical pixels, and instances may be shared across
// threads.
class FrameSynthesizer {
 public:
  explicit FrameSynthesizer(const SynthesizerStyle& style = SynthesizerStyle());

  // Allocates and returns a width x height frame.
  PixelBuffer Render(double time_sec, double duration_sec,
                     const analysis::WaveformData& waveform,
                     const OverlayAssets& overlay, int width, int height) const;

  // Renders into an existing buffer (typically pooled); every pixel is
  // overwritten.
  void RenderInto(double time_sec, double duration_sec,
                  const analysis::WaveformData& waveform,
                  const OverlayAssets& overlay, PixelBuffer& target) const;

  // Issues the frame's draw calls against any rasterizer.
  void Draw(double time_sec, double duration_sec,
            const analysis::WaveformData& waveform,
            const OverlayAssets& overlay, IRasterizer& raster) const;

  // Normalized height driver of bar i in [0, 1] before the visible floor.
  float BarAmplitude(int bar, double time_sec,
                     const analysis::WaveformData& waveform) const;
  float PlaceholderAmplitude(int bar, double time_sec) const;

  // True when bar i lies in the played portion at time_sec.
  bool IsBarPlayed(int bar, double time_sec, double duration_sec) const;

  // Remaining time as m:ss.
  static std::string FormatRemaining(double time_sec, double duration_sec);

  const SynthesizerStyle& style() const { return style_; }

 private:
  void DrawBars(double time_sec, double duration_sec,
                const analysis::WaveformData& waveform, IRasterizer& raster) const;
  void DrawAvatar(const OverlayAssets& overlay, IRasterizer& raster) const;
  void DrawShadowedText(int x, int y, const std::string& text, int scale,
                        int shadow, IRasterizer& raster) const;
  void DrawLabels(double time_sec, double duration_sec,
                  const OverlayAssets& overlay, IRasterizer& raster) const;

  SynthesizerStyle style_;
};

}  // namespace wavecast::render

#endif  // WAVECAST_RENDER_FRAME_SYNTHESIZER_HPP_
