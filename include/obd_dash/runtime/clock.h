// clock.h - monotonic time source for pacing, popups, peak hold and debounce.
#pragma once

#include <cstdint>

namespace obd_dash {
namespace runtime {

class Clock {
 public:
  virtual ~Clock() = default;
  virtual uint32_t nowMs() const = 0;
  virtual uint32_t nowUs() const = 0;
  virtual void sleepMs(uint32_t duration_ms) = 0;
};

// millis()/micros() on the board, steady_clock on the host.
class SystemClock final : public Clock {
 public:
  uint32_t nowMs() const override;
  uint32_t nowUs() const override;
  void sleepMs(uint32_t duration_ms) override;
};

// Time only moves when told to. Used by the host simulation and tests.
class ManualClock final : public Clock {
 public:
  explicit ManualClock(uint32_t start_ms = 0U) : now_us_(static_cast<uint64_t>(start_ms) * 1000ULL) {}

  uint32_t nowMs() const override { return static_cast<uint32_t>(now_us_ / 1000ULL); }
  uint32_t nowUs() const override { return static_cast<uint32_t>(now_us_); }
  void sleepMs(uint32_t duration_ms) override { advanceMs(duration_ms); }

  void advanceMs(uint32_t delta_ms) { now_us_ += static_cast<uint64_t>(delta_ms) * 1000ULL; }
  void advanceUs(uint32_t delta_us) { now_us_ += delta_us; }
  void setMs(uint32_t now_ms) { now_us_ = static_cast<uint64_t>(now_ms) * 1000ULL; }

 private:
  uint64_t now_us_;
};

SystemClock& systemClock();

}  // namespace runtime
}  // namespace obd_dash
