#include "obd_dash/system/task_topology.h"

#if defined(ARDUINO_ARCH_ESP32)
#include <Arduino.h>
#endif

namespace obd_dash {
namespace system {

TaskTopology& TaskTopology::instance() {
  static TaskTopology topology;
  return topology;
}

#if defined(ARDUINO_ARCH_ESP32)
void TaskTopology::taskThunk(void* arg) {
  TaskSpec* launch = static_cast<TaskSpec*>(arg);
  if (launch != nullptr && launch->fn != nullptr) {
    launch->fn(launch->context);
  }
  vTaskDelete(nullptr);
}
#endif

bool TaskTopology::begin(const Callbacks& callbacks) {
  if (running_) {
    return true;
  }

#if defined(ARDUINO_ARCH_ESP32)
  renderer_launch_ = callbacks.renderer;
  flusher_launch_ = callbacks.flusher;
  sensor_launch_ = callbacks.sensors;

  auto create_task = [](TaskSpec* launch,
                        const char* name,
                        const uint32_t stack_depth,
                        const TaskPriority priority,
                        TaskHandle_t* handle,
                        const CoreId core) -> bool {
    if (launch->fn == nullptr) {
      return true;
    }
    return xTaskCreatePinnedToCore(taskThunk, name, stack_depth, launch, priority, handle, core) == pdPASS;
  };

  // The flusher comes up first so the first buffer-ready signal has a reader.
  if (!create_task(&flusher_launch_,
                   "flush_task",
                   kFlusherStackDepth,
                   kFlusherPriority,
                   &flusher_task_,
                   kFlusherCore) ||
      !create_task(&sensor_launch_,
                   "sensor_task",
                   kSensorStackDepth,
                   kSensorPriority,
                   &sensor_task_,
                   kSensorCore) ||
      !create_task(&renderer_launch_,
                   "render_task",
                   kRendererStackDepth,
                   kRendererPriority,
                   &renderer_task_,
                   kRendererCore)) {
    stop();
    Serial.println("[TASK] topology init failed");
    return false;
  }

  running_ = true;
  Serial.printf("[TASK] topology started renderer=%u flusher=%u sensors=%u\n",
                callbacks.renderer.fn != nullptr ? 1U : 0U,
                callbacks.flusher.fn != nullptr ? 1U : 0U,
                callbacks.sensors.fn != nullptr ? 1U : 0U);
  return true;
#else
  (void)callbacks;
  return false;
#endif
}

void TaskTopology::stop() {
#if defined(ARDUINO_ARCH_ESP32)
  if (renderer_task_ != nullptr) {
    vTaskDelete(renderer_task_);
    renderer_task_ = nullptr;
  }
  if (flusher_task_ != nullptr) {
    vTaskDelete(flusher_task_);
    flusher_task_ = nullptr;
  }
  if (sensor_task_ != nullptr) {
    vTaskDelete(sensor_task_);
    sensor_task_ = nullptr;
  }
#endif
  running_ = false;
}

uint32_t TaskTopology::rendererStackUsedBytes() const {
#if defined(ARDUINO_ARCH_ESP32)
  if (renderer_task_ == nullptr) {
    return 0U;
  }
  const uint32_t free_bytes = static_cast<uint32_t>(uxTaskGetStackHighWaterMark(renderer_task_));
  return (free_bytes < kRendererStackDepth) ? kRendererStackDepth - free_bytes : 0U;
#else
  return 0U;
#endif
}

}  // namespace system
}  // namespace obd_dash
