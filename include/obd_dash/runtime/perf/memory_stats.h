// memory_stats.h - RAM budget figures for the debug page.
#pragma once

#include <cstdint>

namespace obd_dash {
namespace runtime {
namespace perf {

struct MemoryStats {
  uint32_t total_ram = 0U;
  uint32_t framebuffer_bytes = 0U;  // both buffers
  uint32_t static_bytes = 0U;
  uint32_t stack_total = 0U;
  uint32_t stack_used = 0U;

  uint32_t stackPercent() const;
  uint32_t staticPercent() const;
};

// Budget from compile-time sizes plus the measured renderer stack use.
MemoryStats collectMemoryStats(uint32_t stack_used_bytes);

}  // namespace perf
}  // namespace runtime
}  // namespace obd_dash
