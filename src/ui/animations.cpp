#include "obd_dash/ui/animations.h"

#include <cmath>

#include "obd_dash/config/layout_config.h"

namespace obd_dash {
namespace ui {

namespace {

uint8_t approach(uint8_t from, uint8_t to, uint8_t step) {
  if (from < to) {
    const uint8_t gap = static_cast<uint8_t>(to - from);
    return static_cast<uint8_t>(from + ((gap < step) ? gap : step));
  }
  const uint8_t gap = static_cast<uint8_t>(from - to);
  return static_cast<uint8_t>(from - ((gap < step) ? gap : step));
}

}  // namespace

gfx::Color565 ColorTransitions::stepToward(gfx::Color565 from, gfx::Color565 to, uint8_t step) {
  return gfx::pack565(approach(gfx::red5(from), gfx::red5(to), step),
                      approach(gfx::green6(from), gfx::green6(to), step),
                      approach(gfx::blue5(from), gfx::blue5(to), step));
}

bool ColorTransitions::setTarget(uint8_t cell, gfx::Color565 target) {
  if (cell >= kCellCount || target_[cell] == target) {
    return false;
  }
  target_[cell] = target;
  return true;
}

gfx::Color565 ColorTransitions::current(uint8_t cell) const {
  return (cell < kCellCount) ? current_[cell] : gfx::color::kBlack;
}

gfx::Color565 ColorTransitions::target(uint8_t cell) const {
  return (cell < kCellCount) ? target_[cell] : gfx::color::kBlack;
}

bool ColorTransitions::settled(uint8_t cell) const {
  return cell < kCellCount && current_[cell] == target_[cell];
}

uint8_t ColorTransitions::update() {
  uint8_t changed = 0U;
  for (uint8_t cell = 0U; cell < kCellCount; ++cell) {
    if (current_[cell] == target_[cell]) {
      continue;
    }
    current_[cell] = stepToward(current_[cell], target_[cell], config::kColorStep);
    changed = static_cast<uint8_t>(changed | (1U << cell));
  }
  return changed;
}

int16_t shakeOffset(uint32_t frame, bool critical) {
  if (!critical) {
    return 0;
  }
  const float phase = static_cast<float>(frame) * config::kShakeOmega;
  return static_cast<int16_t>(std::lround(std::sin(phase) * config::kShakeAmplitudePx));
}

bool blinkOn(uint32_t frame) {
  return ((frame / config::kBlinkHalfPeriodFrames) % 2U) == 0U;
}

}  // namespace ui
}  // namespace obd_dash
