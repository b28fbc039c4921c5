#include "obd_dash/sensors/demo_signal_generator.h"

#include <cmath>

namespace obd_dash {
namespace sensors {

namespace {

constexpr float kTwoPi = 6.28318530718f;
// Signal time advances 2.5 units per second.
constexpr float kTimeScalePerMs = 0.0025f;
constexpr float kBoostPlateauStart = 1.2f;
constexpr float kBoostPlateauEnd = 1.9f;
constexpr float kBoostLowBar = 0.3f;
constexpr float kBoostHighBar = 1.5f;

}  // namespace

float DemoSignalGenerator::wave(float t, float lo, float hi, float freq) {
  const float normalized = std::sin(t * freq) * 0.5f + 0.5f;
  return lo + normalized * (hi - lo);
}

float DemoSignalGenerator::boostWave(float t, float lo, float hi, float freq) {
  const float cycle = std::fmod(t * freq, kTwoPi);
  float normalized = 1.0f;
  if (cycle <= kBoostPlateauStart || cycle >= kBoostPlateauEnd) {
    normalized = std::sin(cycle) * 0.5f + 0.5f;
  }
  return lo + normalized * (hi - lo);
}

SensorSamples DemoSignalGenerator::sample(uint32_t now_ms) {
  const float t = static_cast<float>(now_ms) * kTimeScalePerMs;
  // Every third pull goes past the easter egg threshold.
  const float boost_top = ((boost_cycles_ % 3U) == 2U) ? 2.0f : 1.8f;
  const float boost = boostWave(t, 0.0f, boost_top, 0.08f);
  if (boost < kBoostLowBar) {
    boost_was_low_ = true;
  } else if (boost_was_low_ && boost > kBoostHighBar) {
    boost_was_low_ = false;
    ++boost_cycles_;
  }

  SensorSamples out;
  out.set(SensorId::kBoost, boost);
  out.set(SensorId::kAfr, wave(t, 10.0f, 18.0f, 0.09f));
  out.set(SensorId::kBattery, wave(t, 10.0f, 15.0f, 0.06f));
  out.set(SensorId::kCoolant, wave(t, 30.0f, 95.0f, 0.10f));
  out.set(SensorId::kOil, wave(t, 30.0f, 115.0f, 0.08f));
  out.set(SensorId::kDsg, wave(t, 30.0f, 115.0f, 0.07f));
  out.set(SensorId::kIat, wave(t, -10.0f, 70.0f, 0.05f));
  out.set(SensorId::kEgt, wave(t, 200.0f, 900.0f, 0.04f));
  return out;
}

}  // namespace sensors
}  // namespace obd_dash
