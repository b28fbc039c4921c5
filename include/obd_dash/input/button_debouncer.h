// button_debouncer.h - press-edge detection for one active-low button.
#pragma once

#include <cstdint>

namespace obd_dash {
namespace input {

class ButtonDebouncer {
 public:
  // Accepts a level change only once the debounce window since the last
  // accepted change has passed. True on an accepted press edge.
  bool justPressed(bool level_low, uint32_t now_ms);

  bool pressed() const { return pressed_; }

 private:
  bool pressed_ = false;
  bool has_changed_ = false;
  uint32_t last_change_ms_ = 0U;
};

}  // namespace input
}  // namespace obd_dash
