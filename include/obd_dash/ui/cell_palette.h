// cell_palette.h - threshold buckets to background colors.
#pragma once

#include "obd_dash/gfx/color565.h"
#include "obd_dash/sensors/sensor_samples.h"

namespace obd_dash {
namespace ui {

gfx::Color565 oilDsgBackground(float temp_c);
gfx::Color565 coolantBackground(float temp_c);
gfx::Color565 iatBackground(float temp_c);
gfx::Color565 egtBackground(float temp_c);
gfx::Color565 batteryBackground(float volts);
gfx::Color565 afrBackground(float afr);
// "RICH AF", "RICH", "OPTIMAL", "LEAN" or "LEAN AF".
const char* afrStatus(float afr);

// Target background of a dashboard cell for the given value.
gfx::Color565 cellBackground(sensors::SensorId id, float value);
// Critical cells blink and shake.
bool isCritical(sensors::SensorId id, float value);

bool isOilLow(float temp_c);
bool isEgtDanger(float temp_c);
bool isBoostEasterEgg(float boost_bar, bool show_psi);

}  // namespace ui
}  // namespace obd_dash
