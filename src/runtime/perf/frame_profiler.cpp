#include "obd_dash/runtime/perf/frame_profiler.h"

#include <cstdio>

#if defined(ARDUINO_ARCH_ESP32)
#include <Arduino.h>
#endif

namespace obd_dash {
namespace runtime {
namespace perf {

namespace {

FrameProfiler g_frame_profiler;

}  // namespace

uint32_t FrameSectionStats::averageUs() const {
  if (count == 0U) {
    return 0U;
  }
  return static_cast<uint32_t>(total_us / count);
}

const char* FrameProfiler::sectionLabel(FrameSection section) {
  switch (section) {
    case FrameSection::kFrame:
      return "frame";
    case FrameSection::kRender:
      return "render";
    case FrameSection::kFlush:
      return "flush";
    case FrameSection::kCount:
      break;
  }
  return "unknown";
}

uint32_t FrameProfiler::elapsedUs(uint32_t started_us, uint32_t ended_us) {
  return ended_us - started_us;
}

void FrameProfiler::reset() {
  for (uint8_t index = 0U; index < static_cast<uint8_t>(FrameSection::kCount); ++index) {
    sections_[index] = {};
  }
  render_cycles_ = 0U;
  util_percent_ = 0U;
}

void FrameProfiler::noteSection(FrameSection section, uint32_t elapsed_us) {
  if (section == FrameSection::kCount) {
    return;
  }
  FrameSectionStats& stats = sections_[static_cast<uint8_t>(section)];
  ++stats.count;
  stats.total_us += elapsed_us;
  stats.last_us = elapsed_us;
  if (elapsed_us > stats.max_us) {
    stats.max_us = elapsed_us;
  }
}

void FrameProfiler::noteRenderCycles(uint32_t cycles, uint32_t util_percent) {
  render_cycles_ = cycles;
  util_percent_ = util_percent;
}

FrameSnapshot FrameProfiler::snapshot() const {
  FrameSnapshot out = {};
  out.frame = sections_[static_cast<uint8_t>(FrameSection::kFrame)];
  out.render = sections_[static_cast<uint8_t>(FrameSection::kRender)];
  out.flush = sections_[static_cast<uint8_t>(FrameSection::kFlush)];
  out.render_cycles = render_cycles_;
  out.util_percent = util_percent_;
  return out;
}

uint32_t FrameProfiler::lastUs(FrameSection section) const {
  if (section == FrameSection::kCount) {
    return 0U;
  }
  return sections_[static_cast<uint8_t>(section)].last_us;
}

size_t FrameProfiler::formatStatus(char* out, size_t out_size) const {
  if (out == nullptr || out_size == 0U) {
    return 0U;
  }
  out[0] = '\0';
  size_t used = 0U;
  for (uint8_t index = 0U; index < static_cast<uint8_t>(FrameSection::kCount); ++index) {
    const FrameSectionStats& stats = sections_[index];
    const int written = std::snprintf(out + used,
                                      out_size - used,
                                      "%s n=%lu avg=%luus max=%luus\n",
                                      sectionLabel(static_cast<FrameSection>(index)),
                                      static_cast<unsigned long>(stats.count),
                                      static_cast<unsigned long>(stats.averageUs()),
                                      static_cast<unsigned long>(stats.max_us));
    if (written < 0) {
      break;
    }
    used += static_cast<size_t>(written);
    if (used >= out_size) {
      used = out_size - 1U;
      break;
    }
  }
  return used;
}

void FrameProfiler::dumpStatus() const {
#if defined(ARDUINO_ARCH_ESP32)
  for (uint8_t index = 0U; index < static_cast<uint8_t>(FrameSection::kCount); ++index) {
    const FrameSectionStats& stats = sections_[index];
    Serial.printf("[PERF] %s n=%lu avg=%luus max=%luus last=%luus\n",
                  sectionLabel(static_cast<FrameSection>(index)),
                  static_cast<unsigned long>(stats.count),
                  static_cast<unsigned long>(stats.averageUs()),
                  static_cast<unsigned long>(stats.max_us),
                  static_cast<unsigned long>(stats.last_us));
  }
  Serial.printf("[PERF] cycles=%lu util=%lu%%\n",
                static_cast<unsigned long>(render_cycles_),
                static_cast<unsigned long>(util_percent_));
#endif
}

FrameProfiler& frameProfiler() {
  return g_frame_profiler;
}

}  // namespace perf
}  // namespace runtime
}  // namespace obd_dash
