// critical_section.h - short spinlock sections for data shared between cores.
#pragma once

#include <cstdint>

#if defined(ARDUINO_ARCH_ESP32)
#include <freertos/FreeRTOS.h>
#else
#include <atomic>
#endif

namespace obd_dash {
namespace runtime {
namespace rtos {

/**
 * portMUX spinlock on the board, an atomic_flag spinlock on the host.
 * Only copies of a few words may run inside. Not reentrant.
 */
class CriticalSection {
 public:
  CriticalSection() = default;

  CriticalSection(const CriticalSection&) = delete;
  CriticalSection& operator=(const CriticalSection&) = delete;

  void enter();
  void exit();
  bool held() const { return depth_ != 0U; }

 private:
#if defined(ARDUINO_ARCH_ESP32)
  portMUX_TYPE mux_ = portMUX_INITIALIZER_UNLOCKED;
#else
  std::atomic_flag flag_ = ATOMIC_FLAG_INIT;
#endif
  uint8_t depth_ = 0U;
};

class ScopedCriticalSection {
 public:
  explicit ScopedCriticalSection(CriticalSection& section) : section_(section) { section_.enter(); }
  ~ScopedCriticalSection() { section_.exit(); }

  ScopedCriticalSection(const ScopedCriticalSection&) = delete;
  ScopedCriticalSection& operator=(const ScopedCriticalSection&) = delete;
  ScopedCriticalSection(ScopedCriticalSection&&) = delete;
  ScopedCriticalSection& operator=(ScopedCriticalSection&&) = delete;

 private:
  CriticalSection& section_;
};

#if defined(ARDUINO_ARCH_ESP32)
inline void CriticalSection::enter() {
  portENTER_CRITICAL(&mux_);
  ++depth_;
}

inline void CriticalSection::exit() {
  --depth_;
  portEXIT_CRITICAL(&mux_);
}
#else
inline void CriticalSection::enter() {
  while (flag_.test_and_set(std::memory_order_acquire)) {
  }
  ++depth_;
}

inline void CriticalSection::exit() {
  --depth_;
  flag_.clear(std::memory_order_release);
}
#endif

}  // namespace rtos
}  // namespace runtime
}  // namespace obd_dash
