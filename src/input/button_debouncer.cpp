#include "obd_dash/input/button_debouncer.h"

#include "obd_dash/config/layout_config.h"

namespace obd_dash {
namespace input {

bool ButtonDebouncer::justPressed(bool level_low, uint32_t now_ms) {
  if (level_low == pressed_) {
    return false;
  }
  if (has_changed_ && static_cast<uint32_t>(now_ms - last_change_ms_) < config::kDebounceMs) {
    return false;
  }
  pressed_ = level_low;
  has_changed_ = true;
  last_change_ms_ = now_ms;
  return pressed_;
}

}  // namespace input
}  // namespace obd_dash
