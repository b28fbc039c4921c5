#include "obd_dash/system/boot_report.h"

#if defined(ARDUINO_ARCH_ESP32)
#include <esp_heap_caps.h>
#include <esp_system.h>
#endif

#include "obd_dash/runtime/log/log_buffer.h"

namespace obd_dash {
namespace system {

const char* bootResetReasonLabel(uint32_t reset_reason_code) {
#if defined(ARDUINO_ARCH_ESP32)
  switch (static_cast<esp_reset_reason_t>(reset_reason_code)) {
    case ESP_RST_POWERON:
      return "power_on";
    case ESP_RST_EXT:
      return "external";
    case ESP_RST_SW:
      return "software";
    case ESP_RST_PANIC:
      return "panic";
    case ESP_RST_INT_WDT:
    case ESP_RST_TASK_WDT:
    case ESP_RST_WDT:
      return "watchdog";
    case ESP_RST_BROWNOUT:
      return "brownout";
    default:
      break;
  }
#else
  (void)reset_reason_code;
#endif
  return "unknown";
}

uint32_t bootResetReasonCode() {
#if defined(ARDUINO_ARCH_ESP32)
  return static_cast<uint32_t>(esp_reset_reason());
#else
  return 0U;
#endif
}

BootHeapSnapshot bootCaptureHeapSnapshot() {
  BootHeapSnapshot snapshot = {};
#if defined(ARDUINO_ARCH_ESP32)
  snapshot.heap_internal_free = static_cast<uint32_t>(heap_caps_get_free_size(MALLOC_CAP_INTERNAL));
  snapshot.heap_internal_largest = static_cast<uint32_t>(heap_caps_get_largest_free_block(MALLOC_CAP_INTERNAL));
  snapshot.heap_psram_free = static_cast<uint32_t>(heap_caps_get_free_size(MALLOC_CAP_SPIRAM));
  snapshot.psram_total = static_cast<uint32_t>(ESP.getPsramSize());
  snapshot.psram_found = snapshot.psram_total > 0U;
#endif
  return snapshot;
}

void bootPrintReport(const char* firmware_name, const char* firmware_version) {
  const char* safe_name = (firmware_name != nullptr && firmware_name[0] != '\0') ? firmware_name : "obd_dash";
  const char* safe_version = (firmware_version != nullptr && firmware_version[0] != '\0') ? firmware_version : "dev";
  const uint32_t reset_reason = bootResetReasonCode();
  const BootHeapSnapshot heap = bootCaptureHeapSnapshot();

  Serial.printf("[BOOT] fw=%s version=%s build=%s\n", safe_name, safe_version, __DATE__ " " __TIME__);
  Serial.printf("[BOOT] reset_reason=%lu (%s)\n",
                static_cast<unsigned long>(reset_reason),
                bootResetReasonLabel(reset_reason));
  Serial.printf("[BOOT] heap_internal_free=%lu heap_internal_largest=%lu psram_found=%u psram_free=%lu\n",
                static_cast<unsigned long>(heap.heap_internal_free),
                static_cast<unsigned long>(heap.heap_internal_largest),
                heap.psram_found ? 1U : 0U,
                static_cast<unsigned long>(heap.heap_psram_free));
  runtime::log::logBuffer().pushf(runtime::log::LogLevel::kInfo, millis(), "Boot %s (%s)", safe_version,
                                  bootResetReasonLabel(reset_reason));
}

}  // namespace system
}  // namespace obd_dash
