// gpio_buttons.h - the four active-low dashboard buttons.
#pragma once

#include "obd_dash/input/input_mapper.h"

namespace obd_dash {
namespace drivers {
namespace input {

class GpioButtons {
 public:
  void begin();
  obd_dash::input::ButtonLevels read() const;
};

}  // namespace input
}  // namespace drivers
}  // namespace obd_dash
