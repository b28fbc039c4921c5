// animations.h - per-cell color transitions, shake and blink phase.
#pragma once

#include <cstdint>

#include "obd_dash/gfx/color565.h"
#include "obd_dash/sensors/sensor_samples.h"

namespace obd_dash {
namespace ui {

constexpr uint8_t kCellCount = sensors::kSensorCount;
static_assert(kCellCount <= 8U, "changed-cell mask is 8 bits wide");

// Moves each cell's background toward its target by a bounded step per
// channel every frame. Cells start black.
class ColorTransitions {
 public:
  // Returns true when the target actually changed.
  bool setTarget(uint8_t cell, gfx::Color565 target);
  gfx::Color565 current(uint8_t cell) const;
  gfx::Color565 target(uint8_t cell) const;
  bool settled(uint8_t cell) const;
  // Advances all cells one frame; bit i set when cell i changed.
  uint8_t update();

  static gfx::Color565 stepToward(gfx::Color565 from, gfx::Color565 to, uint8_t step);

 private:
  gfx::Color565 current_[kCellCount] = {};
  gfx::Color565 target_[kCellCount] = {};
};

// Horizontal jitter for critical cells, zero otherwise.
int16_t shakeOffset(uint32_t frame, bool critical);

// True for the first half of each blink period.
bool blinkOn(uint32_t frame);

}  // namespace ui
}  // namespace obd_dash
