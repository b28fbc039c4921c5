#include "obd_dash/runtime/pipeline/frame_pipeline.h"

namespace obd_dash {
namespace runtime {
namespace pipeline {

void FlushWorker::service(uint8_t index) {
  const uint32_t started_us = clock_.nowUs();
  const bool ok = target_.flushFrame(buffers_.frameData(index), buffers_.frameBytes());
  stats_.last_flush_us.store(clock_.nowUs() - started_us, std::memory_order_relaxed);
  stats_.last_flushed_index.store(index, std::memory_order_relaxed);
  // Release pairs with the renderer's acquire on the flush count.
  stats_.flushes.fetch_add(1U, std::memory_order_release);
  if (!ok) {
    stats_.flush_errors.fetch_add(1U, std::memory_order_relaxed);
    log_.pushf(log::LogLevel::kError, clock_.nowMs(), "DMA submit failed buf=%u", static_cast<unsigned>(index));
  }
}

bool FramePipeline::submitFrame() {
  if (in_flight_) {
    if (!link_.pollFlushDone()) {
      stats_.buffer_waits.fetch_add(1U, std::memory_order_relaxed);
      if (!link_.waitFlushDone()) {
        return false;
      }
    }
    in_flight_ = false;
  }
  const uint8_t finished = buffers_.renderIndex();
  if (!link_.signalReady(finished)) {
    stats_.signal_failures.fetch_add(1U, std::memory_order_relaxed);
    return false;
  }
  buffers_.swap();
  stats_.buffer_swaps.fetch_add(1U, std::memory_order_relaxed);
  in_flight_ = true;
  return true;
}

bool FramePipeline::drain() {
  if (!in_flight_) {
    return true;
  }
  if (!link_.pollFlushDone() && !link_.waitFlushDone()) {
    return false;
  }
  in_flight_ = false;
  return true;
}

bool InlineFlushLink::signalReady(uint8_t index) {
  worker_.service(index);
  ack_pending_ = true;
  return true;
}

bool InlineFlushLink::pollFlushDone() {
  const bool was_pending = ack_pending_;
  ack_pending_ = false;
  return was_pending;
}

bool InlineFlushLink::waitFlushDone() {
  // The flush already ran inside signalReady.
  ack_pending_ = false;
  return true;
}

bool CooperativeFlushLink::signalReady(uint8_t index) {
  if (pending_) {
    return false;
  }
  pending_ = true;
  pending_index_ = index;
  done_at_ms_ = clock_.nowMs() + flush_duration_ms_;
  return true;
}

void CooperativeFlushLink::complete() {
  worker_.service(pending_index_);
  pending_ = false;
}

bool CooperativeFlushLink::pollFlushDone() {
  if (!pending_) {
    return false;
  }
  if (static_cast<int32_t>(clock_.nowMs() - done_at_ms_) < 0) {
    return false;
  }
  complete();
  return true;
}

bool CooperativeFlushLink::waitFlushDone() {
  if (!pending_) {
    return false;
  }
  const int32_t remaining = static_cast<int32_t>(done_at_ms_ - clock_.nowMs());
  if (remaining > 0) {
    clock_.advanceMs(static_cast<uint32_t>(remaining));
  }
  complete();
  return true;
}

void FramePacer::begin(uint32_t now_ms) {
  next_deadline_ms_ = now_ms + period_ms_;
  armed_ = true;
}

uint32_t FramePacer::delayUntilNext(uint32_t now_ms) {
  if (!armed_) {
    begin(now_ms);
    return period_ms_;
  }
  const int32_t remaining = static_cast<int32_t>(next_deadline_ms_ - now_ms);
  if (remaining <= 0) {
    ++overruns_;
    next_deadline_ms_ = now_ms + period_ms_;
    return 0U;
  }
  const uint32_t sleep_ms = static_cast<uint32_t>(remaining);
  next_deadline_ms_ += period_ms_;
  return sleep_ms;
}

}  // namespace pipeline
}  // namespace runtime
}  // namespace obd_dash
