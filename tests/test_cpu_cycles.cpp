#include <unity.h>

#include <cstring>

#include "obd_dash/config/layout_config.h"
#include "obd_dash/runtime/perf/cpu_cycles.h"
#include "obd_dash/runtime/perf/frame_profiler.h"
#include "obd_dash/runtime/perf/memory_stats.h"

namespace {

namespace config = obd_dash::config;
using obd_dash::runtime::perf::CycleCounter;
using obd_dash::runtime::perf::FrameProfiler;
using obd_dash::runtime::perf::FrameSection;

}  // namespace

void setUp() {}

void tearDown() {}

void test_elapsed_wraps() {
  TEST_ASSERT_EQUAL_UINT32(100U, CycleCounter::elapsed(1000U, 1100U));
  TEST_ASSERT_EQUAL_UINT32(0x20U, CycleCounter::elapsed(0xFFFFFFF0UL, 0x10U));
}

void test_elapsed_beyond_sanity_is_zero() {
  TEST_ASSERT_EQUAL_UINT32(config::kCycleSanityMax, CycleCounter::elapsed(0U, config::kCycleSanityMax));
  TEST_ASSERT_EQUAL_UINT32(0U, CycleCounter::elapsed(0U, config::kCycleSanityMax + 1U));
  // A start sample taken after the end sample looks like a huge span.
  TEST_ASSERT_EQUAL_UINT32(0U, CycleCounter::elapsed(5000U, 4000U));
}

void test_util_percent() {
  // 150 MHz for 20 ms is 3M cycles.
  TEST_ASSERT_EQUAL_UINT32(50U, CycleCounter::utilPercent(1500000U, 20000U, 150000000UL));
  TEST_ASSERT_EQUAL_UINT32(100U, CycleCounter::utilPercent(9000000U, 20000U, 150000000UL));
  TEST_ASSERT_EQUAL_UINT32(0U, CycleCounter::utilPercent(0U, 20000U, 150000000UL));
  TEST_ASSERT_EQUAL_UINT32(0U, CycleCounter::utilPercent(1000U, 0U, 150000000UL));
  // Large products must not overflow 32 bits.
  TEST_ASSERT_EQUAL_UINT32(10U, CycleCounter::utilPercent(37500000U, 1000000U, 375000000UL));
}

void test_frequency_clamped_to_supported_range() {
  CycleCounter counter;
  counter.begin(250000000UL);
  TEST_ASSERT_EQUAL_UINT32(250U, counter.frequencyMhz());
  counter.begin(1000U);
  TEST_ASSERT_EQUAL_UINT32(config::kCpuFreqDefaultHz, counter.frequencyHz());
  counter.begin(900000000UL);
  TEST_ASSERT_EQUAL_UINT32(config::kCpuFreqDefaultHz, counter.frequencyHz());
  counter.begin(150000000UL);
  TEST_ASSERT_EQUAL_UINT32(50U, counter.utilPercent(1500000U, 20000U));
}

void test_profiler_tracks_sections() {
  FrameProfiler profiler;
  profiler.noteSection(FrameSection::kRender, 1000U);
  profiler.noteSection(FrameSection::kRender, 3000U);
  profiler.noteSection(FrameSection::kFlush, 7000U);
  profiler.noteRenderCycles(123456U, 42U);
  const obd_dash::runtime::perf::FrameSnapshot snapshot = profiler.snapshot();
  TEST_ASSERT_EQUAL_UINT32(2U, snapshot.render.count);
  TEST_ASSERT_EQUAL_UINT32(2000U, snapshot.render.averageUs());
  TEST_ASSERT_EQUAL_UINT32(3000U, snapshot.render.max_us);
  TEST_ASSERT_EQUAL_UINT32(3000U, profiler.lastUs(FrameSection::kRender));
  TEST_ASSERT_EQUAL_UINT32(7000U, snapshot.flush.last_us);
  TEST_ASSERT_EQUAL_UINT32(42U, snapshot.util_percent);
  TEST_ASSERT_EQUAL_UINT32(0U, snapshot.frame.averageUs());

  char status[160];
  TEST_ASSERT_TRUE(profiler.formatStatus(status, sizeof(status)) > 0U);
  TEST_ASSERT_NOT_NULL(std::strstr(status, "render n=2 avg=2000us max=3000us"));

  profiler.reset();
  TEST_ASSERT_EQUAL_UINT32(0U, profiler.snapshot().render.count);
}

void test_memory_stats_percentages() {
  const obd_dash::runtime::perf::MemoryStats stats = obd_dash::runtime::perf::collectMemoryStats(16U * 1024U);
  TEST_ASSERT_EQUAL_UINT32(config::kFrameBufferBytes * 2U, stats.framebuffer_bytes);
  TEST_ASSERT_TRUE(stats.static_bytes > stats.framebuffer_bytes);
  TEST_ASSERT_EQUAL_UINT32(stats.total_ram - stats.static_bytes, stats.stack_total);
  TEST_ASSERT_EQUAL_UINT32(16U * 1024U, stats.stack_used);
  TEST_ASSERT_TRUE(stats.stackPercent() <= 100U);
  TEST_ASSERT_EQUAL_UINT32(stats.static_bytes * 100ULL / stats.total_ram, stats.staticPercent());
  TEST_ASSERT_EQUAL_UINT32(stats.stack_total,
                           obd_dash::runtime::perf::collectMemoryStats(0xFFFFFFFFUL).stack_used);
}

int main() {
  UNITY_BEGIN();
  RUN_TEST(test_elapsed_wraps);
  RUN_TEST(test_elapsed_beyond_sanity_is_zero);
  RUN_TEST(test_util_percent);
  RUN_TEST(test_frequency_clamped_to_supported_range);
  RUN_TEST(test_profiler_tracks_sections);
  RUN_TEST(test_memory_stats_percentages);
  return UNITY_END();
}
