// Repository: Retrovue-wavecast
// Component: Bitmap Font
// Purpose: Built-in 5x7 ASCII glyphs for overlay text.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_RENDER_BITMAP_FONT_HPP_
#define WAVECAST_RENDER_BITMAP_FONT_HPP_

#include <cstdint>
#include <string>

namespace wavecast::render {

// Glyph cell geometry in font units (scaled by an integer factor at draw time).
constexpr int kGlyphWidth = 5;
constexpr int kGlyphHeight = 7;
constexpr int kGlyphAdvance = 6;  // glyph width plus one column of spacing

// Column-major glyph for a printable ASCII character: 5 columns, bit n of a
// column is row n (top row = bit 0). Characters outside 32..126 map to '?'.
const uint8_t* GlyphFor(char c);

// Replaces every byte outside printable ASCII with '?'. UTF-8 sequences
// therefore become one '?' per byte.
std::string AsciiSanitize(const std::string& text);

// Pixel width of text at the given scale (no trailing spacing column).
int MeasureTextWidth(const std::string& text, int scale);

inline int MeasureTextHeight(int scale) { return kGlyphHeight * (scale > 0 ? scale : 1); }

}  // namespace wavecast::render

#endif  // WAVECAST_RENDER_BITMAP_FONT_HPP_
