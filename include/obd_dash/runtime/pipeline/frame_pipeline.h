// frame_pipeline.h - renderer/flusher handshake over the double buffer.
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

#include "obd_dash/gfx/frame_buffer.h"
#include "obd_dash/runtime/clock.h"
#include "obd_dash/runtime/log/log_buffer.h"
#include "obd_dash/runtime/pipeline/flush_target.h"

namespace obd_dash {
namespace runtime {
namespace pipeline {

// Written by the flusher and the renderer, read by the debug page.
struct PipelineStats {
  std::atomic<uint32_t> buffer_swaps{0U};
  std::atomic<uint32_t> buffer_waits{0U};
  std::atomic<uint32_t> signal_failures{0U};
  std::atomic<uint32_t> flushes{0U};
  std::atomic<uint32_t> flush_errors{0U};
  std::atomic<uint32_t> last_flush_us{0U};
  std::atomic<uint8_t> last_flushed_index{0U};
};

// Renderer side of the handshake.
class FlushLink {
 public:
  virtual ~FlushLink() = default;

  // Hands buffer `index` to the flusher. False if the signal could not be posted.
  virtual bool signalReady(uint8_t index) = 0;
  // Consumes the flush-done ack if it is already there. Never blocks.
  virtual bool pollFlushDone() = 0;
  // Blocks until the flush-done ack arrives and consumes it.
  virtual bool waitFlushDone() = 0;
};

// Flusher side: streams one buffer and records the outcome. A failed
// transfer is logged and still treated as complete so the handshake
// keeps moving.
class FlushWorker {
 public:
  FlushWorker(gfx::DoubleBuffer& buffers, FlushTarget& target, Clock& clock, log::LogBuffer& log, PipelineStats& stats)
      : buffers_(buffers), target_(target), clock_(clock), log_(log), stats_(stats) {}

  void service(uint8_t index);

 private:
  gfx::DoubleBuffer& buffers_;
  FlushTarget& target_;
  Clock& clock_;
  log::LogBuffer& log_;
  PipelineStats& stats_;
};

class FramePipeline {
 public:
  FramePipeline(gfx::DoubleBuffer& buffers, FlushLink& link, PipelineStats& stats)
      : buffers_(buffers), link_(link), stats_(stats) {}

  // Waits out an in-flight flush if needed, signals the finished render
  // buffer and swaps. On failure the render buffer is kept and nothing is
  // counted as swapped.
  bool submitFrame();

  bool flushInFlight() const { return in_flight_; }
  // Blocks until the last submitted buffer is flushed.
  bool drain();

 private:
  gfx::DoubleBuffer& buffers_;
  FlushLink& link_;
  PipelineStats& stats_;
  bool in_flight_ = false;
};

// Flushes inline on signal. Used when no flusher task could be started.
class InlineFlushLink final : public FlushLink {
 public:
  explicit InlineFlushLink(FlushWorker& worker) : worker_(worker) {}

  bool signalReady(uint8_t index) override;
  bool pollFlushDone() override;
  bool waitFlushDone() override;

 private:
  FlushWorker& worker_;
  bool ack_pending_ = false;
};

// Single-threaded stand-in for the flusher task. A signalled buffer
// completes `flush_duration_ms` later on the manual clock; waiting moves the
// clock forward to that point.
class CooperativeFlushLink final : public FlushLink {
 public:
  CooperativeFlushLink(FlushWorker& worker, ManualClock& clock, uint32_t flush_duration_ms)
      : worker_(worker), clock_(clock), flush_duration_ms_(flush_duration_ms) {}

  bool signalReady(uint8_t index) override;
  bool pollFlushDone() override;
  bool waitFlushDone() override;

  void setFlushDurationMs(uint32_t duration_ms) { flush_duration_ms_ = duration_ms; }
  bool pending() const { return pending_; }

 private:
  void complete();

  FlushWorker& worker_;
  ManualClock& clock_;
  uint32_t flush_duration_ms_;
  bool pending_ = false;
  uint8_t pending_index_ = 0U;
  uint32_t done_at_ms_ = 0U;
};

// Sleep needed to hit fixed frame deadlines. An overrun skips the sleep
// and restarts the schedule from now.
class FramePacer {
 public:
  explicit FramePacer(uint32_t period_ms) : period_ms_(period_ms) {}

  void begin(uint32_t now_ms);
  uint32_t delayUntilNext(uint32_t now_ms);
  uint32_t overruns() const { return overruns_; }

 private:
  uint32_t period_ms_;
  uint32_t next_deadline_ms_ = 0U;
  bool armed_ = false;
  uint32_t overruns_ = 0U;
};

}  // namespace pipeline
}  // namespace runtime
}  // namespace obd_dash
