// frame_buffer.h - RGB565 draw targets over owned byte buffers.
#pragma once

#include <cstddef>
#include <cstdint>

#include "obd_dash/config/layout_config.h"
#include "obd_dash/gfx/color565.h"

namespace obd_dash {
namespace gfx {

struct Rect {
  int16_t x = 0;
  int16_t y = 0;
  int16_t w = 0;
  int16_t h = 0;
};

struct Pixel {
  int16_t x = 0;
  int16_t y = 0;
  Color565 color = color::kBlack;
};

// Drawing capability consumed by widgets and pages. Out-of-bounds writes are
// clipped, never reported.
class DrawTarget {
 public:
  virtual ~DrawTarget() = default;

  virtual int16_t width() const = 0;
  virtual int16_t height() const = 0;
  virtual void clear(Color565 color) = 0;
  virtual void fillSolid(const Rect& rect, Color565 color) = 0;
  // Writes `count` colors row-major into the clipped area of `rect`.
  virtual void fillContiguous(const Rect& rect, const Color565* colors, size_t count) = 0;
  virtual void setPixel(int16_t x, int16_t y, Color565 color) = 0;
  // Black outside the target.
  virtual Color565 pixelAt(int16_t x, int16_t y) const = 0;

  // Anti-aliased write: mixes `color` over what is already there.
  void blendPixel(int16_t x, int16_t y, Color565 color, uint8_t alpha);
  void drawPixels(const Pixel* pixels, size_t count);
  void drawHLine(int16_t x, int16_t y, int16_t w, Color565 color);
  void drawVLine(int16_t x, int16_t y, int16_t h, Color565 color);
  void drawLine(int16_t x0, int16_t y0, int16_t x1, int16_t y1, Color565 color);
  void drawRectOutline(const Rect& rect, int16_t thickness, Color565 color);
};

// Big-endian RGB565 buffer of exactly width*height*2 bytes, 4-byte aligned.
class FrameBufferTarget final : public DrawTarget {
 public:
  FrameBufferTarget(uint8_t* data, int16_t width, int16_t height);

  int16_t width() const override { return width_; }
  int16_t height() const override { return height_; }
  void clear(Color565 color) override;
  void fillSolid(const Rect& rect, Color565 color) override;
  void fillContiguous(const Rect& rect, const Color565* colors, size_t count) override;
  void setPixel(int16_t x, int16_t y, Color565 color) override;

  Color565 pixelAt(int16_t x, int16_t y) const override;
  const uint8_t* data() const { return data_; }
  size_t sizeBytes() const;

 private:
  bool clip(const Rect& rect, Rect* out) const;
  void fillRow(size_t first_pixel, int16_t count, Color565 color);

  uint8_t* data_;
  int16_t width_;
  int16_t height_;
};

// Two screen-sized buffers. One is labeled render (renderer writes it), the
// other flush (flusher reads it). swap() flips the labels.
class DoubleBuffer {
 public:
  DoubleBuffer(uint8_t* first, uint8_t* second, int16_t width, int16_t height);

  uint8_t renderIndex() const { return render_index_; }
  uint8_t flushIndex() const { return static_cast<uint8_t>(render_index_ ^ 1U); }
  DrawTarget& renderTarget() { return targets_[render_index_]; }
  FrameBufferTarget& target(uint8_t index) { return targets_[index & 1U]; }
  const uint8_t* frameData(uint8_t index) const { return targets_[index & 1U].data(); }
  size_t frameBytes() const { return targets_[0].sizeBytes(); }

  // Hands the finished render buffer over and returns its index.
  uint8_t swap();

 private:
  FrameBufferTarget targets_[2];
  uint8_t render_index_ = 0U;
};

// Statically allocated screen buffers.
DoubleBuffer& frameBuffers();

}  // namespace gfx
}  // namespace obd_dash
