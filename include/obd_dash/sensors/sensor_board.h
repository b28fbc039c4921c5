// sensor_board.h - one SensorState per dashboard sensor.
#pragma once

#include <cstdint>

#include "obd_dash/sensors/sensor_samples.h"
#include "obd_dash/sensors/sensor_state.h"

namespace obd_dash {
namespace sensors {

class SensorBoard {
 public:
  // Tracks extremes and updates every sensor. Returns how many sensors are
  // in peak hold afterwards.
  uint8_t update(const SensorSamples& samples, uint32_t now_ms);

  // Re-seeds min/max/avg of every sensor from `samples` and clears graphs.
  void resetAll(const SensorSamples& samples);

  SensorState& state(SensorId id) { return states_[index(id)]; }
  const SensorState& state(SensorId id) const { return states_[index(id)]; }

  static ExtremeMode extremeModeFor(SensorId id);

 private:
  static uint8_t index(SensorId id) {
    const uint8_t raw = static_cast<uint8_t>(id);
    return (raw < kSensorCount) ? raw : 0U;
  }

  SensorState states_[kSensorCount];
};

}  // namespace sensors
}  // namespace obd_dash
