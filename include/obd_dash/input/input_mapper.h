// input_mapper.h - button edges to dashboard actions.
#pragma once

#include <cstdint>

#include "obd_dash/input/button_debouncer.h"
#include "obd_dash/ui/render_state.h"

namespace obd_dash {
namespace input {

// Raw line levels, true while the button pulls its pin low.
struct ButtonLevels {
  bool a_low = false;
  bool b_low = false;
  bool x_low = false;
  bool y_low = false;
};

struct InputActions {
  bool cycle_fps_mode = false;     // X
  bool cycle_page = false;         // Y
  bool toggle_boost_unit = false;  // A
  bool request_reset = false;      // B

  bool any() const { return cycle_fps_mode || cycle_page || toggle_boost_unit || request_reset; }
};

class InputMapper {
 public:
  // Evaluated once per frame in X, Y, A, B order. X, A and B only act on
  // the dashboard; their edges are still consumed elsewhere.
  InputActions poll(const ButtonLevels& levels, uint32_t now_ms, ui::Page page);

 private:
  ButtonDebouncer x_;
  ButtonDebouncer y_;
  ButtonDebouncer a_;
  ButtonDebouncer b_;
};

}  // namespace input
}  // namespace obd_dash
