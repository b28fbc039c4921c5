// text.h - anti-aliased text from LVGL fonts, anchored on the baseline.
#pragma once

#include <cstdint>

#include "obd_dash/gfx/color565.h"
#include "obd_dash/gfx/frame_buffer.h"

namespace obd_dash {
namespace gfx {

// Body, title and value fonts. See gfx/fonts.h for the faces.
enum class FontSize : uint8_t {
  kSmall = 0,
  kMedium,
  kLarge,
};

enum class TextAlign : uint8_t {
  kLeft = 0,
  kCenter,
  kRight,
};

// Sum of glyph advances, kerning included.
int16_t textWidth(const char* text, FontSize size);
// Line box height above the baseline.
int16_t textAscent(FontSize size);
int16_t lineHeight(FontSize size);

// Ink box of the rendered glyphs. Empty for empty or blank text.
Rect textBounds(int16_t x, int16_t baseline_y, const char* text, FontSize size, TextAlign align);

void drawText(DrawTarget& target,
              int16_t x,
              int16_t baseline_y,
              const char* text,
              Color565 color,
              FontSize size,
              TextAlign align = TextAlign::kLeft);

}  // namespace gfx
}  // namespace obd_dash
