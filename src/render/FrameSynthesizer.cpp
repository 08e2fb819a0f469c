// Repository: Retrovue-wavecast
// Component: Frame Synthesizer
// Purpose: Draws one visualization frame (bars, avatar, timer, handle) as a
//          pure function of time, waveform and overlay assets.
// Copyright (c) 2025 RetroVue

#include "wavecast/render/FrameSynthesizer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

#include "wavecast/render/BitmapFont.hpp"
#include "wavecast/render/CpuRasterizer.hpp"

namespace wavecast::render {

namespace {

int ScaledPx(float ref_px, float unit) {
  return std::max(1, static_cast<int>(std::lround(ref_px * unit)));
}

}  // namespace

FrameSynthesizer::FrameSynthesizer(const SynthesizerStyle& style) : style_(style) {
  if (style_.bar_count < 1) style_.bar_count = 1;
  if (style_.reference_height <= 0.0f) style_.reference_height = 720.0f;
}

PixelBuffer FrameSynthesizer::Render(double time_sec, double duration_sec,
                                     const analysis::WaveformData& waveform,
                                     const OverlayAssets& overlay, int width,
                                     int height) const {
  PixelBuffer frame(width, height);
  RenderInto(time_sec, duration_sec, waveform, overlay, frame);
  return frame;
}

void FrameSynthesizer::RenderInto(double time_sec, double duration_sec,
                                  const analysis::WaveformData& waveform,
                                  const OverlayAssets& overlay,
                                  PixelBuffer& target) const {
  CpuRasterizer raster(target);
  Draw(time_sec, duration_sec, waveform, overlay, raster);
}

void FrameSynthesizer::Draw(double time_sec, double duration_sec,
                            const analysis::WaveformData& waveform,
                            const OverlayAssets& overlay,
                            IRasterizer& raster) const {
  if (raster.Width() <= 0 || raster.Height() <= 0) return;
  Rgba background = overlay.accent;
  background.a = 255;
  raster.Clear(background);
  DrawBars(time_sec, duration_sec, waveform, raster);
  DrawAvatar(overlay, raster);
  DrawLabels(time_sec, duration_sec, overlay, raster);
}

float FrameSynthesizer::PlaceholderAmplitude(int bar, double time_sec) const {
  const double v = std::sin(time_sec * style_.placeholder_k +
                            static_cast<double>(bar) * style_.placeholder_phase) *
                       style_.placeholder_a +
                   style_.placeholder_b;
  return static_cast<float>(std::min(1.0, std::max(0.0, v)));
}

float FrameSynthesizer::BarAmplitude(int bar, double time_sec,
                                     const analysis::WaveformData& waveform) const {
  if (waveform.Empty()) {
    return PlaceholderAmplitude(bar, time_sec);
  }
  const size_t count = waveform.PointCount();
  size_t index = static_cast<size_t>(static_cast<double>(bar) /
                                     static_cast<double>(style_.bar_count) *
                                     static_cast<double>(count));
  if (index >= count) index = count - 1;
  return waveform.points()[index].amplitude;
}

bool FrameSynthesizer::IsBarPlayed(int bar, double time_sec, double duration_sec) const {
  if (!(duration_sec > 0.0)) return false;
  const double position = (static_cast<double>(bar) + 0.5) /
                          static_cast<double>(style_.bar_count);
  return position <= time_sec / duration_sec;
}

std::string FrameSynthesizer::FormatRemaining(double time_sec, double duration_sec) {
  double remaining = duration_sec - time_sec;
  if (!(remaining > 0.0)) remaining = 0.0;
  const int total = static_cast<int>(remaining);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%d:%02d", total / 60, total % 60);
  return buf;
}

void FrameSynthesizer::DrawBars(double time_sec, double duration_sec,
                                const analysis::WaveformData& waveform,
                                IRasterizer& raster) const {
  const float w = static_cast<float>(raster.Width());
  const float h = static_cast<float>(raster.Height());
  const float area = w * style_.bar_area_width;
  const float left = (w - area) * 0.5f;
  const float slot = area / static_cast<float>(style_.bar_count);
  const float bar_w = std::max(1.0f, slot * style_.bar_fill_ratio);
  const float center_y = h * style_.bars_center_y;
  const float max_h = h * style_.max_bar_height;
  const float base_h = h * style_.base_bar_height;

  for (int i = 0; i < style_.bar_count; ++i) {
    const float amplitude = std::max(BarAmplitude(i, time_sec, waveform),
                                     style_.min_visible_floor);
    const float bar_h = amplitude * max_h + base_h;
    const float x = left + slot * static_cast<float>(i) + (slot - bar_w) * 0.5f;
    const float opacity = IsBarPlayed(i, time_sec, duration_sec)
                              ? style_.played_opacity
                              : style_.unplayed_opacity;
    raster.FillRect(x, center_y - bar_h * 0.5f, bar_w, bar_h,
                    style_.bar_color.WithOpacity(opacity));
  }
}

void FrameSynthesizer::DrawAvatar(const OverlayAssets& overlay, IRasterizer& raster) const {
  const float unit = static_cast<float>(raster.Height()) / style_.reference_height;
  const float cx = static_cast<float>(raster.Width()) * 0.5f;
  const float cy = static_cast<float>(raster.Height()) * style_.avatar_center_y;
  const float radius = style_.avatar_diameter_ref * unit * 0.5f;
  const float border = std::max(1.0f, style_.avatar_border_ref * unit);

  if (overlay.avatar && !overlay.avatar->Empty()) {
    raster.DrawImageInCircle(*overlay.avatar, cx, cy, radius);
  } else {
    raster.FillCircle(cx, cy, radius, style_.placeholder_fill);
    char initial = '?';
    for (char c : overlay.username) {
      if (c == '@') continue;
      initial = c;
      break;
    }
    if (static_cast<unsigned char>(initial) < 128) {
      initial = static_cast<char>(std::toupper(static_cast<unsigned char>(initial)));
    }
    const std::string letter(1, initial);
    const int scale = std::max(1, static_cast<int>(std::lround(radius * 0.8f /
                                                              kGlyphHeight)));
    const int tx = static_cast<int>(std::lround(cx)) - MeasureTextWidth(letter, scale) / 2;
    const int ty = static_cast<int>(std::lround(cy)) - MeasureTextHeight(scale) / 2;
    raster.DrawText(tx, ty, letter, scale, style_.text_color);
  }
  // Border sits just outside the image edge.
  raster.StrokeCircle(cx, cy, radius + border * 0.5f, border, style_.avatar_border_color);
}

void FrameSynthesizer::DrawShadowedText(int x, int y, const std::string& text, int scale,
                                        int shadow, IRasterizer& raster) const {
  raster.DrawText(x + shadow, y + shadow, text, scale, style_.shadow_color);
  raster.DrawText(x, y, text, scale, style_.text_color);
}

void FrameSynthesizer::DrawLabels(double time_sec, double duration_sec,
                                  const OverlayAssets& overlay, IRasterizer& raster) const {
  const float unit = static_cast<float>(raster.Height()) / style_.reference_height;
  const int margin = ScaledPx(style_.margin_ref, unit);
  const int shadow = ScaledPx(style_.shadow_offset_ref, unit);
  const int scale = std::max(1, static_cast<int>(std::lround(
                                    style_.text_height_ref * unit / kGlyphHeight)));

  DrawShadowedText(margin, margin, FormatRemaining(time_sec, duration_sec), scale,
                   shadow, raster);

  if (!overlay.username.empty()) {
    const std::string handle = overlay.username.front() == '@'
                                   ? overlay.username
                                   : "@" + overlay.username;
    const int x = raster.Width() - margin - MeasureTextWidth(AsciiSanitize(handle), scale);
    DrawShadowedText(x, margin, handle, scale, shadow, raster);
  }
}

}  // namespace wavecast::render
