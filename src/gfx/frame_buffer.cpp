#include "obd_dash/gfx/frame_buffer.h"

#include <cstdlib>
#include <cstring>

namespace obd_dash {
namespace gfx {

namespace {

alignas(4) uint8_t g_frame_a[config::kFrameBufferBytes];
alignas(4) uint8_t g_frame_b[config::kFrameBufferBytes];

uint32_t packPixelPair(Color565 color) {
  const uint8_t hi = static_cast<uint8_t>(color >> 8);
  const uint8_t lo = static_cast<uint8_t>(color & 0xFFU);
  const uint8_t pattern[4] = {hi, lo, hi, lo};
  uint32_t word = 0U;
  std::memcpy(&word, pattern, sizeof(word));
  return word;
}

inline void storePixel(uint8_t* at, Color565 color) {
  at[0] = static_cast<uint8_t>(color >> 8);
  at[1] = static_cast<uint8_t>(color & 0xFFU);
}

}  // namespace

void DrawTarget::blendPixel(int16_t x, int16_t y, Color565 color, uint8_t alpha) {
  if (alpha == 0U || x < 0 || y < 0 || x >= width() || y >= height()) {
    return;
  }
  setPixel(x, y, (alpha == 255U) ? color : blend565(color, pixelAt(x, y), alpha));
}

void DrawTarget::drawPixels(const Pixel* pixels, size_t count) {
  if (pixels == nullptr) {
    return;
  }
  for (size_t index = 0U; index < count; ++index) {
    setPixel(pixels[index].x, pixels[index].y, pixels[index].color);
  }
}

void DrawTarget::drawHLine(int16_t x, int16_t y, int16_t w, Color565 color) {
  fillSolid(Rect{x, y, w, 1}, color);
}

void DrawTarget::drawVLine(int16_t x, int16_t y, int16_t h, Color565 color) {
  fillSolid(Rect{x, y, 1, h}, color);
}

void DrawTarget::drawLine(int16_t x0, int16_t y0, int16_t x1, int16_t y1, Color565 color) {
  int32_t x = x0;
  int32_t y = y0;
  const int32_t dx = std::abs(static_cast<int32_t>(x1) - x0);
  const int32_t dy = -std::abs(static_cast<int32_t>(y1) - y0);
  const int32_t sx = (x0 < x1) ? 1 : -1;
  const int32_t sy = (y0 < y1) ? 1 : -1;
  int32_t err = dx + dy;
  for (;;) {
    setPixel(static_cast<int16_t>(x), static_cast<int16_t>(y), color);
    if (x == x1 && y == y1) {
      break;
    }
    const int32_t e2 = 2 * err;
    if (e2 >= dy) {
      err += dy;
      x += sx;
    }
    if (e2 <= dx) {
      err += dx;
      y += sy;
    }
  }
}

void DrawTarget::drawRectOutline(const Rect& rect, int16_t thickness, Color565 color) {
  if (thickness <= 0 || rect.w <= 0 || rect.h <= 0) {
    return;
  }
  fillSolid(Rect{rect.x, rect.y, rect.w, thickness}, color);
  fillSolid(Rect{rect.x, static_cast<int16_t>(rect.y + rect.h - thickness), rect.w, thickness}, color);
  fillSolid(Rect{rect.x, rect.y, thickness, rect.h}, color);
  fillSolid(Rect{static_cast<int16_t>(rect.x + rect.w - thickness), rect.y, thickness, rect.h}, color);
}

FrameBufferTarget::FrameBufferTarget(uint8_t* data, int16_t width, int16_t height)
    : data_(data), width_(width), height_(height) {}

size_t FrameBufferTarget::sizeBytes() const {
  return static_cast<size_t>(width_) * static_cast<size_t>(height_) * 2U;
}

void FrameBufferTarget::clear(Color565 color) {
  if (data_ == nullptr) {
    return;
  }
  const uint32_t word = packPixelPair(color);
  const size_t bytes = sizeBytes();
  for (size_t offset = 0U; offset + 4U <= bytes; offset += 4U) {
    std::memcpy(data_ + offset, &word, sizeof(word));
  }
  if ((bytes & 3U) != 0U) {
    storePixel(data_ + bytes - 2U, color);
  }
}

bool FrameBufferTarget::clip(const Rect& rect, Rect* out) const {
  if (out == nullptr || rect.w <= 0 || rect.h <= 0) {
    return false;
  }
  const int32_t x0 = (rect.x < 0) ? 0 : rect.x;
  const int32_t y0 = (rect.y < 0) ? 0 : rect.y;
  int32_t x1 = static_cast<int32_t>(rect.x) + rect.w;
  int32_t y1 = static_cast<int32_t>(rect.y) + rect.h;
  if (x1 > width_) {
    x1 = width_;
  }
  if (y1 > height_) {
    y1 = height_;
  }
  if (x0 >= x1 || y0 >= y1) {
    return false;
  }
  out->x = static_cast<int16_t>(x0);
  out->y = static_cast<int16_t>(y0);
  out->w = static_cast<int16_t>(x1 - x0);
  out->h = static_cast<int16_t>(y1 - y0);
  return true;
}

void FrameBufferTarget::fillRow(size_t first_pixel, int16_t count, Color565 color) {
  uint8_t* at = data_ + first_pixel * 2U;
  int16_t remaining = count;
  // Odd pixel index means the row starts mid-word.
  if ((first_pixel & 1U) != 0U && remaining > 0) {
    storePixel(at, color);
    at += 2;
    --remaining;
  }
  const uint32_t word = packPixelPair(color);
  while (remaining >= 2) {
    std::memcpy(at, &word, sizeof(word));
    at += 4;
    remaining = static_cast<int16_t>(remaining - 2);
  }
  if (remaining == 1) {
    storePixel(at, color);
  }
}

void FrameBufferTarget::fillSolid(const Rect& rect, Color565 color) {
  Rect area;
  if (data_ == nullptr || !clip(rect, &area)) {
    return;
  }
  for (int16_t row = 0; row < area.h; ++row) {
    const size_t first = static_cast<size_t>(area.y + row) * static_cast<size_t>(width_) + area.x;
    fillRow(first, area.w, color);
  }
}

void FrameBufferTarget::fillContiguous(const Rect& rect, const Color565* colors, size_t count) {
  if (data_ == nullptr || colors == nullptr || rect.w <= 0 || rect.h <= 0) {
    return;
  }
  // Colors index the unclipped rect, so skipped pixels still consume input.
  size_t index = 0U;
  for (int16_t row = 0; row < rect.h && index < count; ++row) {
    for (int16_t col = 0; col < rect.w && index < count; ++col, ++index) {
      setPixel(static_cast<int16_t>(rect.x + col), static_cast<int16_t>(rect.y + row), colors[index]);
    }
  }
}

void FrameBufferTarget::setPixel(int16_t x, int16_t y, Color565 color) {
  if (data_ == nullptr || x < 0 || y < 0 || x >= width_ || y >= height_) {
    return;
  }
  const size_t pixel = static_cast<size_t>(y) * static_cast<size_t>(width_) + static_cast<size_t>(x);
  storePixel(data_ + pixel * 2U, color);
}

Color565 FrameBufferTarget::pixelAt(int16_t x, int16_t y) const {
  if (data_ == nullptr || x < 0 || y < 0 || x >= width_ || y >= height_) {
    return color::kBlack;
  }
  const size_t pixel = static_cast<size_t>(y) * static_cast<size_t>(width_) + static_cast<size_t>(x);
  return static_cast<Color565>((static_cast<uint16_t>(data_[pixel * 2U]) << 8) | data_[pixel * 2U + 1U]);
}

DoubleBuffer::DoubleBuffer(uint8_t* first, uint8_t* second, int16_t width, int16_t height)
    : targets_{FrameBufferTarget(first, width, height), FrameBufferTarget(second, width, height)} {}

uint8_t DoubleBuffer::swap() {
  const uint8_t completed = render_index_;
  render_index_ = static_cast<uint8_t>(render_index_ ^ 1U);
  return completed;
}

DoubleBuffer& frameBuffers() {
  static DoubleBuffer buffers(g_frame_a, g_frame_b, config::kScreenWidth, config::kScreenHeight);
  return buffers;
}

}  // namespace gfx
}  // namespace obd_dash
