// queue_flush_link.h - buffer-ready / flush-done handshake over two FreeRTOS queues.
#pragma once

#include <cstdint>

#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

#include "obd_dash/runtime/pipeline/frame_pipeline.h"

namespace obd_dash {
namespace runtime {
namespace pipeline {

// The renderer owns the FramePipeline side, the flusher task runs serve().
class QueueFlushLink final : public FlushLink {
 public:
  explicit QueueFlushLink(FlushWorker& worker) : worker_(worker) {}

  bool begin();
  bool signalReady(uint8_t index) override;
  bool pollFlushDone() override;
  bool waitFlushDone() override;

  // Flusher task body, never returns.
  void serve();
  static void flusherTask(void* context);

 private:
  FlushWorker& worker_;
  QueueHandle_t ready_queue_ = nullptr;
  QueueHandle_t done_queue_ = nullptr;
};

}  // namespace pipeline
}  // namespace runtime
}  // namespace obd_dash
