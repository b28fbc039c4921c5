#include "obd_dash/runtime/pipeline/queue_flush_link.h"

#include <Arduino.h>

namespace obd_dash {
namespace runtime {
namespace pipeline {

namespace {

constexpr UBaseType_t kQueueDepth = 1U;

}  // namespace

bool QueueFlushLink::begin() {
  if (ready_queue_ == nullptr) {
    ready_queue_ = xQueueCreate(kQueueDepth, sizeof(uint8_t));
  }
  if (done_queue_ == nullptr) {
    done_queue_ = xQueueCreate(kQueueDepth, sizeof(uint8_t));
  }
  if (ready_queue_ == nullptr || done_queue_ == nullptr) {
    Serial.println("[PIPE] queue alloc failed");
    return false;
  }
  return true;
}

bool QueueFlushLink::signalReady(uint8_t index) {
  if (ready_queue_ == nullptr) {
    return false;
  }
  return xQueueSend(ready_queue_, &index, 0) == pdTRUE;
}

bool QueueFlushLink::pollFlushDone() {
  if (done_queue_ == nullptr) {
    return false;
  }
  uint8_t index = 0U;
  return xQueueReceive(done_queue_, &index, 0) == pdTRUE;
}

bool QueueFlushLink::waitFlushDone() {
  if (done_queue_ == nullptr) {
    return false;
  }
  uint8_t index = 0U;
  return xQueueReceive(done_queue_, &index, portMAX_DELAY) == pdTRUE;
}

void QueueFlushLink::serve() {
  for (;;) {
    uint8_t index = 0U;
    if (xQueueReceive(ready_queue_, &index, portMAX_DELAY) != pdTRUE) {
      continue;
    }
    worker_.service(index);
    // Acknowledge even a failed transfer so the renderer never stalls.
    xQueueSend(done_queue_, &index, portMAX_DELAY);
  }
}

void QueueFlushLink::flusherTask(void* context) {
  QueueFlushLink* link = static_cast<QueueFlushLink*>(context);
  if (link == nullptr) {
    return;
  }
  link->serve();
}

}  // namespace pipeline
}  // namespace runtime
}  // namespace obd_dash
