#include "obd_dash/sensors/sensor_samples.h"

namespace obd_dash {
namespace sensors {

namespace {

SampleRegister g_sample_register;

}  // namespace

const char* sensorLabel(SensorId id) {
  switch (id) {
    case SensorId::kBoost:
      return "BOOST";
    case SensorId::kAfr:
      return "AFR";
    case SensorId::kBattery:
      return "BATT";
    case SensorId::kCoolant:
      return "COOLANT";
    case SensorId::kOil:
      return "OIL";
    case SensorId::kDsg:
      return "DSG";
    case SensorId::kIat:
      return "IAT";
    case SensorId::kEgt:
      return "EGT";
    case SensorId::kCount:
      break;
  }
  return "?";
}

void SampleRegister::publish(const SensorSamples& samples) {
  {
    runtime::rtos::ScopedCriticalSection guard(section_);
    samples_ = samples;
  }
  publish_count_.fetch_add(1U, std::memory_order_relaxed);
}

void SampleRegister::publishOne(SensorId id, float value) {
  if (id == SensorId::kCount) {
    return;
  }
  {
    runtime::rtos::ScopedCriticalSection guard(section_);
    samples_.set(id, value);
  }
  publish_count_.fetch_add(1U, std::memory_order_relaxed);
}

SensorSamples SampleRegister::snapshot() const {
  runtime::rtos::ScopedCriticalSection guard(section_);
  return samples_;
}

SampleRegister& sampleRegister() {
  return g_sample_register;
}

}  // namespace sensors
}  // namespace obd_dash
