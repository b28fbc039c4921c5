#include "obd_dash/gfx/text.h"

#include "obd_dash/gfx/fonts.h"

namespace obd_dash {
namespace gfx {

namespace {

int16_t alignedLeft(int16_t x, int16_t width, TextAlign align) {
  switch (align) {
    case TextAlign::kCenter:
      return static_cast<int16_t>(x - width / 2);
    case TextAlign::kRight:
      return static_cast<int16_t>(x - width);
    case TextAlign::kLeft:
      break;
  }
  return x;
}

// Walks the UTF-8 text with one letter of lookahead for kerning.
class LetterCursor {
 public:
  explicit LetterCursor(const char* text) : text_(text) { current_ = decode(&index_); }

  bool done() const { return current_ == 0U; }
  uint32_t letter() const { return current_; }
  uint32_t peek() const {
    uint32_t lookahead = index_;
    return decode(&lookahead);
  }
  void advance() { current_ = decode(&index_); }

 private:
  uint32_t decode(uint32_t* index) const { return (text_ == nullptr) ? 0U : _lv_txt_encoded_next(text_, index); }

  const char* text_;
  uint32_t index_ = 0U;
  uint32_t current_ = 0U;
};

// Coverage of one glyph pixel scaled to 0..255. Rows are packed with no padding.
uint8_t coverageAt(const uint8_t* bitmap, uint32_t pixel, uint8_t bpp) {
  const uint32_t bit = pixel * bpp;
  const uint32_t byte = bit >> 3;
  const uint32_t shift = bit & 7U;
  const uint32_t mask = (1U << bpp) - 1U;
  uint32_t window = static_cast<uint32_t>(bitmap[byte]) << 8;
  if (shift + bpp > 8U) {
    window |= bitmap[byte + 1U];
  }
  const uint32_t value = (window >> (16U - bpp - shift)) & mask;
  return static_cast<uint8_t>((value * 255U) / mask);
}

void drawGlyph(DrawTarget& target,
               const lv_font_t* font,
               const lv_font_glyph_dsc_t& glyph,
               uint32_t letter,
               int16_t pen_x,
               int16_t baseline_y,
               Color565 color) {
  if (glyph.box_w == 0U || glyph.box_h == 0U || glyph.bpp == 0U || glyph.bpp > 8U) {
    return;
  }
  const uint8_t* bitmap = lv_font_get_glyph_bitmap(font, letter);
  if (bitmap == nullptr) {
    return;
  }
  const int16_t left = static_cast<int16_t>(pen_x + glyph.ofs_x);
  const int16_t top = static_cast<int16_t>(baseline_y - glyph.ofs_y - glyph.box_h);
  uint32_t pixel = 0U;
  for (uint16_t row = 0U; row < glyph.box_h; ++row) {
    for (uint16_t col = 0U; col < glyph.box_w; ++col, ++pixel) {
      const uint8_t alpha = coverageAt(bitmap, pixel, glyph.bpp);
      if (alpha != 0U) {
        target.blendPixel(static_cast<int16_t>(left + col), static_cast<int16_t>(top + row), color, alpha);
      }
    }
  }
}

}  // namespace

int16_t textWidth(const char* text, FontSize size) {
  const lv_font_t* font = fonts::fontFor(size);
  int32_t width = 0;
  for (LetterCursor cursor(text); !cursor.done(); cursor.advance()) {
    width += lv_font_get_glyph_width(font, cursor.letter(), cursor.peek());
  }
  return static_cast<int16_t>(width);
}

int16_t textAscent(FontSize size) {
  const lv_font_t* font = fonts::fontFor(size);
  return static_cast<int16_t>(font->line_height - font->base_line);
}

int16_t lineHeight(FontSize size) {
  return static_cast<int16_t>(fonts::fontFor(size)->line_height);
}

Rect textBounds(int16_t x, int16_t baseline_y, const char* text, FontSize size, TextAlign align) {
  const lv_font_t* font = fonts::fontFor(size);
  int16_t pen_x = alignedLeft(x, textWidth(text, size), align);
  Rect out;
  out.x = pen_x;
  out.y = baseline_y;
  int16_t right = pen_x;
  int16_t bottom = baseline_y;
  bool inked = false;
  for (LetterCursor cursor(text); !cursor.done(); cursor.advance()) {
    lv_font_glyph_dsc_t glyph = {};
    const bool found = lv_font_get_glyph_dsc(font, &glyph, cursor.letter(), cursor.peek());
    if (found && glyph.box_w > 0U && glyph.box_h > 0U) {
      const int16_t gx = static_cast<int16_t>(pen_x + glyph.ofs_x);
      const int16_t gy = static_cast<int16_t>(baseline_y - glyph.ofs_y - glyph.box_h);
      const int16_t gr = static_cast<int16_t>(gx + glyph.box_w);
      const int16_t gb = static_cast<int16_t>(baseline_y - glyph.ofs_y);
      if (!inked) {
        out.x = gx;
        out.y = gy;
        right = gr;
        bottom = gb;
        inked = true;
      } else {
        out.x = (gx < out.x) ? gx : out.x;
        out.y = (gy < out.y) ? gy : out.y;
        right = (gr > right) ? gr : right;
        bottom = (gb > bottom) ? gb : bottom;
      }
    }
    pen_x = static_cast<int16_t>(pen_x + glyph.adv_w);
  }
  out.w = static_cast<int16_t>(right - out.x);
  out.h = static_cast<int16_t>(bottom - out.y);
  return out;
}

void drawText(DrawTarget& target,
              int16_t x,
              int16_t baseline_y,
              const char* text,
              Color565 color,
              FontSize size,
              TextAlign align) {
  if (text == nullptr) {
    return;
  }
  const lv_font_t* font = fonts::fontFor(size);
  int16_t pen_x = alignedLeft(x, textWidth(text, size), align);
  for (LetterCursor cursor(text); !cursor.done(); cursor.advance()) {
    lv_font_glyph_dsc_t glyph = {};
    if (lv_font_get_glyph_dsc(font, &glyph, cursor.letter(), cursor.peek())) {
      drawGlyph(target, font, glyph, cursor.letter(), pen_x, baseline_y, color);
    }
    pen_x = static_cast<int16_t>(pen_x + glyph.adv_w);
  }
}

}  // namespace gfx
}  // namespace obd_dash
