// cpu_cycles.h - hardware cycle counter and utilization math.
#pragma once

#include <cstdint>

namespace obd_dash {
namespace runtime {
namespace perf {

class CycleCounter {
 public:
  // Stores the clock used for utilization. Out-of-range values fall back to
  // a safe default.
  void begin(uint32_t cpu_freq_hz);
  uint32_t frequencyHz() const { return freq_hz_; }
  uint32_t frequencyMhz() const { return freq_hz_ / 1000000UL; }

  // Free-running 32-bit counter. Host builds report 0.
  static uint32_t read();

  // Wrapping difference. Returns 0 when the span is too long to be real.
  static uint32_t elapsed(uint32_t start, uint32_t end);

  // Share of the frame spent busy, 0..100.
  static uint32_t utilPercent(uint32_t cycles_used, uint32_t frame_time_us, uint32_t cpu_freq_hz);
  uint32_t utilPercent(uint32_t cycles_used, uint32_t frame_time_us) const {
    return utilPercent(cycles_used, frame_time_us, freq_hz_);
  }

  static uint32_t clampFrequency(uint32_t cpu_freq_hz);

 private:
  uint32_t freq_hz_ = 0U;
};

CycleCounter& cycleCounter();

}  // namespace perf
}  // namespace runtime
}  // namespace obd_dash
