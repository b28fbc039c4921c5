#include "obd_dash/runtime/perf/memory_stats.h"

#include "obd_dash/config/layout_config.h"

namespace obd_dash {
namespace runtime {
namespace perf {

namespace {

uint32_t percentOf(uint32_t part, uint32_t whole) {
  if (whole == 0U) {
    return 0U;
  }
  const uint64_t pct = static_cast<uint64_t>(part) * 100ULL / whole;
  return (pct > 100ULL) ? 100U : static_cast<uint32_t>(pct);
}

}  // namespace

uint32_t MemoryStats::stackPercent() const {
  return percentOf(stack_used, stack_total);
}

uint32_t MemoryStats::staticPercent() const {
  return percentOf(static_bytes, total_ram);
}

MemoryStats collectMemoryStats(uint32_t stack_used_bytes) {
  MemoryStats stats;
  stats.total_ram = config::kTotalRamBytes;
  stats.framebuffer_bytes = static_cast<uint32_t>(config::kFrameBufferBytes * 2U);
  stats.static_bytes = stats.framebuffer_bytes + config::kStaticReserveBytes;
  stats.stack_total = (stats.total_ram > stats.static_bytes) ? stats.total_ram - stats.static_bytes : 0U;
  stats.stack_used = (stack_used_bytes > stats.stack_total) ? stats.stack_total : stack_used_bytes;
  return stats;
}

}  // namespace perf
}  // namespace runtime
}  // namespace obd_dash
