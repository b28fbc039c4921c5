#include "obd_dash/runtime/clock.h"

#if defined(ARDUINO_ARCH_ESP32)
#include <Arduino.h>
#else
#include <chrono>
#include <thread>
#endif

namespace obd_dash {
namespace runtime {

namespace {

SystemClock g_system_clock;

#if !defined(ARDUINO_ARCH_ESP32)
uint64_t hostMicros() {
  static const std::chrono::steady_clock::time_point origin = std::chrono::steady_clock::now();
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - origin).count());
}
#endif

}  // namespace

uint32_t SystemClock::nowMs() const {
#if defined(ARDUINO_ARCH_ESP32)
  return millis();
#else
  return static_cast<uint32_t>(hostMicros() / 1000ULL);
#endif
}

uint32_t SystemClock::nowUs() const {
#if defined(ARDUINO_ARCH_ESP32)
  return micros();
#else
  return static_cast<uint32_t>(hostMicros());
#endif
}

void SystemClock::sleepMs(uint32_t duration_ms) {
#if defined(ARDUINO_ARCH_ESP32)
  vTaskDelay(pdMS_TO_TICKS(duration_ms));
#else
  std::this_thread::sleep_for(std::chrono::milliseconds(duration_ms));
#endif
}

SystemClock& systemClock() {
  return g_system_clock;
}

}  // namespace runtime
}  // namespace obd_dash
