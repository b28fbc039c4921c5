#include "obd_dash/sensors/sensor_board.h"

namespace obd_dash {
namespace sensors {

ExtremeMode SensorBoard::extremeModeFor(SensorId id) {
  switch (id) {
    case SensorId::kAfr:
      return ExtremeMode::kNone;
    case SensorId::kBattery:
      return ExtremeMode::kMinMax;
    case SensorId::kBoost:
    case SensorId::kCoolant:
    case SensorId::kOil:
    case SensorId::kDsg:
    case SensorId::kIat:
    case SensorId::kEgt:
      return ExtremeMode::kMax;
    case SensorId::kCount:
      break;
  }
  return ExtremeMode::kNone;
}

uint8_t SensorBoard::update(const SensorSamples& samples, uint32_t now_ms) {
  uint8_t peaks = 0U;
  for (uint8_t raw = 0U; raw < kSensorCount; ++raw) {
    const SensorId id = static_cast<SensorId>(raw);
    const float value = samples.get(id);
    SensorState& sensor = states_[raw];
    const bool beaten = sensor.trackExtremes(value, extremeModeFor(id));
    sensor.update(value, beaten, now_ms);
    if (sensor.isPeak(now_ms)) {
      ++peaks;
    }
  }
  return peaks;
}

void SensorBoard::resetAll(const SensorSamples& samples) {
  for (uint8_t raw = 0U; raw < kSensorCount; ++raw) {
    states_[raw].reset(samples.get(static_cast<SensorId>(raw)));
  }
}

}  // namespace sensors
}  // namespace obd_dash
