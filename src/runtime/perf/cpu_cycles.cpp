#include "obd_dash/runtime/perf/cpu_cycles.h"

#if defined(ARDUINO_ARCH_ESP32)
#include <Arduino.h>
#endif

#include "obd_dash/config/layout_config.h"

namespace obd_dash {
namespace runtime {
namespace perf {

namespace {

CycleCounter g_cycle_counter;

}  // namespace

uint32_t CycleCounter::clampFrequency(uint32_t cpu_freq_hz) {
  if (cpu_freq_hz < config::kCpuFreqMinHz || cpu_freq_hz > config::kCpuFreqMaxHz) {
    return config::kCpuFreqDefaultHz;
  }
  return cpu_freq_hz;
}

void CycleCounter::begin(uint32_t cpu_freq_hz) {
  freq_hz_ = clampFrequency(cpu_freq_hz);
}

uint32_t CycleCounter::read() {
#if defined(ARDUINO_ARCH_ESP32)
  return ESP.getCycleCount();
#else
  return 0U;
#endif
}

uint32_t CycleCounter::elapsed(uint32_t start, uint32_t end) {
  const uint32_t span = end - start;
  if (span > config::kCycleSanityMax) {
    return 0U;
  }
  return span;
}

uint32_t CycleCounter::utilPercent(uint32_t cycles_used, uint32_t frame_time_us, uint32_t cpu_freq_hz) {
  if (frame_time_us == 0U || cycles_used == 0U || cpu_freq_hz == 0U) {
    return 0U;
  }
  const uint64_t expected = static_cast<uint64_t>(cpu_freq_hz) * frame_time_us / 1000000ULL;
  if (expected == 0ULL) {
    return 0U;
  }
  const uint64_t util = static_cast<uint64_t>(cycles_used) * 100ULL / expected;
  return (util > 100ULL) ? 100U : static_cast<uint32_t>(util);
}

CycleCounter& cycleCounter() {
  return g_cycle_counter;
}

}  // namespace perf
}  // namespace runtime
}  // namespace obd_dash
