#include <unity.h>

#include <cstring>
#include <thread>

#include "obd_dash/gfx/frame_buffer.h"
#include "obd_dash/runtime/clock.h"
#include "obd_dash/runtime/log/log_buffer.h"
#include "obd_dash/runtime/pipeline/frame_pipeline.h"

namespace {

using obd_dash::gfx::DoubleBuffer;
using obd_dash::runtime::ManualClock;
using obd_dash::runtime::log::LogBuffer;
using obd_dash::runtime::log::LogLevel;
using obd_dash::runtime::pipeline::CooperativeFlushLink;
using obd_dash::runtime::pipeline::FlushWorker;
using obd_dash::runtime::pipeline::FramePacer;
using obd_dash::runtime::pipeline::FramePipeline;
using obd_dash::runtime::pipeline::InlineFlushLink;
using obd_dash::runtime::pipeline::PipelineStats;

constexpr int16_t kW = 8;
constexpr int16_t kH = 4;
constexpr uint32_t kMaxRecords = 256U;

alignas(4) uint8_t g_a[kW * kH * 2];
alignas(4) uint8_t g_b[kW * kH * 2];

// Records the frame stamp found in pixel (0,0) of every flushed buffer.
class RecordingTarget final : public obd_dash::runtime::pipeline::FlushTarget {
 public:
  bool flushFrame(const uint8_t* data, size_t size_bytes) override {
    if (data == nullptr || size_bytes != sizeof(g_a)) {
      return false;
    }
    if (count_ < kMaxRecords) {
      stamps_[count_] = static_cast<uint16_t>((data[0] << 8) | data[1]);
      buffers_[count_] = (data == g_a) ? 0U : 1U;
    }
    ++count_;
    return !fail_;
  }

  uint32_t count() const { return count_; }
  uint16_t stamp(uint32_t index) const { return stamps_[index]; }
  uint8_t buffer(uint32_t index) const { return buffers_[index]; }
  void setFail(bool fail) { fail_ = fail; }

 private:
  uint16_t stamps_[kMaxRecords] = {};
  uint8_t buffers_[kMaxRecords] = {};
  uint32_t count_ = 0U;
  bool fail_ = false;
};

struct Rig {
  Rig() : buffers(g_a, g_b, kW, kH), clock(0U), worker(buffers, target, clock, log, stats) {}

  DoubleBuffer buffers;
  ManualClock clock;
  LogBuffer log;
  PipelineStats stats;
  RecordingTarget target;
  FlushWorker worker;
};

void renderStamp(DoubleBuffer& buffers, uint16_t stamp) {
  buffers.renderTarget().clear(0U);
  buffers.renderTarget().setPixel(0, 0, stamp);
}

}  // namespace

void setUp() {
  std::memset(g_a, 0, sizeof(g_a));
  std::memset(g_b, 0, sizeof(g_b));
}

void tearDown() {}

void test_inline_link_flushes_each_frame_in_order() {
  Rig rig;
  InlineFlushLink link(rig.worker);
  FramePipeline pipeline(rig.buffers, link, rig.stats);
  const uint16_t frames = 40U;
  for (uint16_t frame = 1U; frame <= frames; ++frame) {
    renderStamp(rig.buffers, frame);
    TEST_ASSERT_TRUE(pipeline.submitFrame());
  }
  TEST_ASSERT_TRUE(pipeline.drain());
  TEST_ASSERT_EQUAL_UINT32(frames, rig.stats.buffer_swaps.load());
  TEST_ASSERT_EQUAL_UINT32(frames, rig.target.count());
  TEST_ASSERT_EQUAL_UINT32(0U, rig.stats.buffer_waits.load());
  for (uint32_t i = 0U; i < frames; ++i) {
    TEST_ASSERT_EQUAL_UINT16(i + 1U, rig.target.stamp(i));
    TEST_ASSERT_EQUAL_UINT8(i % 2U, rig.target.buffer(i));
  }
}

void test_cooperative_link_fast_flusher_never_waits() {
  Rig rig;
  CooperativeFlushLink link(rig.worker, rig.clock, 5U);
  FramePipeline pipeline(rig.buffers, link, rig.stats);
  for (uint16_t frame = 1U; frame <= 30U; ++frame) {
    renderStamp(rig.buffers, frame);
    TEST_ASSERT_TRUE(pipeline.submitFrame());
    rig.clock.advanceMs(20U);
  }
  TEST_ASSERT_TRUE(pipeline.drain());
  TEST_ASSERT_EQUAL_UINT32(0U, rig.stats.buffer_waits.load());
  TEST_ASSERT_EQUAL_UINT32(30U, rig.target.count());
  for (uint32_t i = 0U; i < 30U; ++i) {
    TEST_ASSERT_EQUAL_UINT16(i + 1U, rig.target.stamp(i));
  }
}

void test_slow_flusher_applies_back_pressure() {
  Rig rig;
  CooperativeFlushLink link(rig.worker, rig.clock, 40U);
  FramePipeline pipeline(rig.buffers, link, rig.stats);
  FramePacer pacer(20U);
  pacer.begin(rig.clock.nowMs());
  const uint16_t frames = 50U;
  for (uint16_t frame = 1U; frame <= frames; ++frame) {
    renderStamp(rig.buffers, frame);
    TEST_ASSERT_TRUE(pipeline.submitFrame());
    TEST_ASSERT_EQUAL_UINT32(frame - 1U, rig.stats.buffer_waits.load());
    rig.clock.advanceMs(pacer.delayUntilNext(rig.clock.nowMs()));
  }
  const uint32_t elapsed_ms = rig.clock.nowMs();
  // Each frame costs one 40 ms flush instead of the 20 ms period.
  TEST_ASSERT_UINT32_WITHIN(40U, frames * 40U, elapsed_ms);
  TEST_ASSERT_TRUE(pipeline.drain());
  TEST_ASSERT_EQUAL_UINT32(frames, rig.stats.buffer_swaps.load());
  TEST_ASSERT_EQUAL_UINT32(frames, rig.target.count());
  for (uint32_t i = 0U; i < frames; ++i) {
    TEST_ASSERT_EQUAL_UINT16(i + 1U, rig.target.stamp(i));
  }
}

void test_flush_error_is_logged_and_acknowledged() {
  Rig rig;
  InlineFlushLink link(rig.worker);
  FramePipeline pipeline(rig.buffers, link, rig.stats);
  rig.target.setFail(true);
  renderStamp(rig.buffers, 7U);
  TEST_ASSERT_TRUE(pipeline.submitFrame());
  renderStamp(rig.buffers, 8U);
  TEST_ASSERT_TRUE(pipeline.submitFrame());
  TEST_ASSERT_EQUAL_UINT32(2U, rig.stats.flush_errors.load());
  TEST_ASSERT_EQUAL_UINT32(2U, rig.stats.buffer_swaps.load());

  LogBuffer::Reader reader(rig.log);
  TEST_ASSERT_EQUAL_UINT32(2U, reader.size());
  TEST_ASSERT_EQUAL(LogLevel::kError, reader.at(0U).level);
  TEST_ASSERT_EQUAL_STRING("DMA submit failed buf=0", reader.at(0U).message);
  TEST_ASSERT_EQUAL_STRING("DMA submit failed buf=1", reader.at(1U).message);
}

void test_signal_refused_keeps_render_buffer() {
  Rig rig;
  CooperativeFlushLink link(rig.worker, rig.clock, 40U);
  FramePipeline pipeline(rig.buffers, link, rig.stats);
  // A stale request occupies the link, as if another producer raced us.
  TEST_ASSERT_TRUE(link.signalReady(1U));
  renderStamp(rig.buffers, 3U);
  TEST_ASSERT_FALSE(pipeline.submitFrame());
  TEST_ASSERT_EQUAL_UINT32(1U, rig.stats.signal_failures.load());
  TEST_ASSERT_EQUAL_UINT32(0U, rig.stats.buffer_swaps.load());
  TEST_ASSERT_EQUAL_UINT8(0U, rig.buffers.renderIndex());
  TEST_ASSERT_FALSE(pipeline.flushInFlight());
}

void test_pacer_sleeps_to_deadline_and_skips_on_overrun() {
  FramePacer pacer(20U);
  pacer.begin(1000U);
  TEST_ASSERT_EQUAL_UINT32(15U, pacer.delayUntilNext(1005U));
  TEST_ASSERT_EQUAL_UINT32(0U, pacer.delayUntilNext(1070U));
  TEST_ASSERT_EQUAL_UINT32(1U, pacer.overruns());
  // No catch-up: the next deadline is one period after the overrun.
  TEST_ASSERT_EQUAL_UINT32(20U, pacer.delayUntilNext(1070U));
}

void test_stats_read_while_flusher_thread_counts() {
  Rig rig;
  const uint32_t flushes = 4000U;
  std::thread flusher([&rig, flushes]() {
    for (uint32_t i = 0U; i < flushes; ++i) {
      rig.worker.service(static_cast<uint8_t>(i & 1U));
    }
  });
  uint32_t last_seen = 0U;
  bool monotonic = true;
  while (last_seen < flushes) {
    const uint32_t seen = rig.stats.flushes.load(std::memory_order_acquire);
    monotonic = monotonic && seen >= last_seen;
    last_seen = seen;
  }
  flusher.join();
  TEST_ASSERT_TRUE(monotonic);
  TEST_ASSERT_EQUAL_UINT32(flushes, rig.stats.flushes.load());
  TEST_ASSERT_EQUAL_UINT32(0U, rig.stats.flush_errors.load());
  TEST_ASSERT_EQUAL_UINT8(1U, rig.stats.last_flushed_index.load());
  TEST_ASSERT_EQUAL_UINT32(flushes, rig.target.count());
}

int main() {
  UNITY_BEGIN();
  RUN_TEST(test_inline_link_flushes_each_frame_in_order);
  RUN_TEST(test_cooperative_link_fast_flusher_never_waits);
  RUN_TEST(test_slow_flusher_applies_back_pressure);
  RUN_TEST(test_flush_error_is_logged_and_acknowledged);
  RUN_TEST(test_signal_refused_keeps_render_buffer);
  RUN_TEST(test_pacer_sleeps_to_deadline_and_skips_on_overrun);
  RUN_TEST(test_stats_read_while_flusher_thread_counts);
  return UNITY_END();
}
