#include "obd_dash/drivers/input/gpio_buttons.h"

#include <Arduino.h>

#include "obd_dash/config/layout_config.h"

namespace obd_dash {
namespace drivers {
namespace input {

namespace {

bool pinLow(int pin) {
  return pin >= 0 && digitalRead(pin) == LOW;
}

}  // namespace

void GpioButtons::begin() {
  const int pins[] = {config::kPinButtonA, config::kPinButtonB, config::kPinButtonX, config::kPinButtonY};
  for (const int pin : pins) {
    if (pin >= 0) {
      pinMode(pin, INPUT_PULLUP);
    }
  }
  Serial.printf("[BTN] ready a=%d b=%d x=%d y=%d\n", config::kPinButtonA, config::kPinButtonB, config::kPinButtonX,
                config::kPinButtonY);
}

obd_dash::input::ButtonLevels GpioButtons::read() const {
  obd_dash::input::ButtonLevels levels;
  levels.a_low = pinLow(config::kPinButtonA);
  levels.b_low = pinLow(config::kPinButtonB);
  levels.x_low = pinLow(config::kPinButtonX);
  levels.y_low = pinLow(config::kPinButtonY);
  return levels;
}

}  // namespace input
}  // namespace drivers
}  // namespace obd_dash
