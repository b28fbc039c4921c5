// sensor_samples.h - decoded sensor values and the last-value register.
#pragma once

#include <atomic>
#include <cstdint>

#include "obd_dash/runtime/rtos/critical_section.h"

namespace obd_dash {
namespace sensors {

// Ordered as the dashboard grid, left to right then top to bottom.
enum class SensorId : uint8_t {
  kBoost = 0,  // bar, relative
  kAfr,        // air/fuel ratio
  kBattery,    // volts
  kCoolant,    // deg C
  kOil,
  kDsg,
  kIat,
  kEgt,
  kCount,
};

constexpr uint8_t kSensorCount = static_cast<uint8_t>(SensorId::kCount);

struct SensorSamples {
  float values[kSensorCount] = {};

  float get(SensorId id) const { return values[static_cast<uint8_t>(id)]; }
  void set(SensorId id, float value) { values[static_cast<uint8_t>(id)] = value; }
};

const char* sensorLabel(SensorId id);

// Written by the acquisition side, read once per frame by the renderer.
class SampleRegister {
 public:
  void publish(const SensorSamples& samples);
  void publishOne(SensorId id, float value);
  SensorSamples snapshot() const;
  uint32_t publishCount() const { return publish_count_.load(std::memory_order_relaxed); }

 private:
  SensorSamples samples_ = {};
  std::atomic<uint32_t> publish_count_{0U};
  mutable runtime::rtos::CriticalSection section_;
};

SampleRegister& sampleRegister();

}  // namespace sensors
}  // namespace obd_dash
