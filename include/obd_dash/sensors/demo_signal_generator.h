// demo_signal_generator.h - synthetic sensor values for bench runs without a car.
#pragma once

#include <cstdint>

#include "obd_dash/sensors/sensor_samples.h"

namespace obd_dash {
namespace sensors {

class DemoSignalGenerator {
 public:
  SensorSamples sample(uint32_t now_ms);
  uint32_t boostCycles() const { return boost_cycles_; }

  // Sine between lo and hi.
  static float wave(float t, float lo, float hi, float freq);
  // Like wave() but holds the top for part of every cycle, as a real spool does.
  static float boostWave(float t, float lo, float hi, float freq);

 private:
  uint32_t boost_cycles_ = 0U;
  bool boost_was_low_ = true;
};

}  // namespace sensors
}  // namespace obd_dash
