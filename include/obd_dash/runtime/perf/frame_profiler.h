// frame_profiler.h - per-section frame timing counters.
#pragma once

#include <cstddef>
#include <cstdint>

namespace obd_dash {
namespace runtime {
namespace perf {

enum class FrameSection : uint8_t {
  kFrame = 0,
  kRender,
  kFlush,
  kCount,
};

struct FrameSectionStats {
  uint32_t count = 0U;
  uint64_t total_us = 0ULL;
  uint32_t max_us = 0U;
  uint32_t last_us = 0U;

  uint32_t averageUs() const;
};

struct FrameSnapshot {
  FrameSectionStats frame = {};
  FrameSectionStats render = {};
  FrameSectionStats flush = {};
  uint32_t render_cycles = 0U;
  uint32_t util_percent = 0U;
};

class FrameProfiler {
 public:
  void reset();
  void noteSection(FrameSection section, uint32_t elapsed_us);
  void noteRenderCycles(uint32_t cycles, uint32_t util_percent);
  FrameSnapshot snapshot() const;
  uint32_t lastUs(FrameSection section) const;
  // One line per section, e.g. "render n=50 avg=4200us max=5100us".
  size_t formatStatus(char* out, size_t out_size) const;
  // Prints the status lines to the console with the [PERF] tag.
  void dumpStatus() const;

  static uint32_t elapsedUs(uint32_t started_us, uint32_t ended_us);
  static const char* sectionLabel(FrameSection section);

 private:
  FrameSectionStats sections_[static_cast<uint8_t>(FrameSection::kCount)] = {};
  uint32_t render_cycles_ = 0U;
  uint32_t util_percent_ = 0U;
};

FrameProfiler& frameProfiler();

}  // namespace perf
}  // namespace runtime
}  // namespace obd_dash
