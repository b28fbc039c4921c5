// task_topology.h - renderer, flusher and sensor tasks pinned to cores.
#pragma once

#include <cstdint>

#if defined(ARDUINO_ARCH_ESP32)
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#endif

namespace obd_dash {
namespace system {

#if defined(ARDUINO_ARCH_ESP32)
using TaskPriority = UBaseType_t;
using CoreId = BaseType_t;
#else
using TaskPriority = uint32_t;
using CoreId = int32_t;
#endif

class TaskTopology {
 public:
  using TaskEntry = void (*)(void* context);

  struct TaskSpec {
    TaskEntry fn = nullptr;
    void* context = nullptr;
  };

  struct Callbacks {
    TaskSpec renderer = {};
    TaskSpec flusher = {};
    TaskSpec sensors = {};
  };

  // ESP-IDF counts stack depth in bytes.
  static constexpr uint32_t kRendererStackDepth = 8192U;
  static constexpr uint32_t kFlusherStackDepth = 4096U;
  static constexpr uint32_t kSensorStackDepth = 3072U;

  static constexpr TaskPriority kRendererPriority = 4U;
  static constexpr TaskPriority kFlusherPriority = 5U;
  static constexpr TaskPriority kSensorPriority = 3U;

  static constexpr CoreId kRendererCore = 1;
  static constexpr CoreId kFlusherCore = 0;
  static constexpr CoreId kSensorCore = 0;

  static TaskTopology& instance();

  bool begin(const Callbacks& callbacks);
  void stop();
  bool running() const { return running_; }

  // Peak stack use of the renderer task, 0 when unknown.
  uint32_t rendererStackUsedBytes() const;

  TaskTopology(const TaskTopology&) = delete;
  TaskTopology& operator=(const TaskTopology&) = delete;

 private:
  TaskTopology() = default;

#if defined(ARDUINO_ARCH_ESP32)
  static void taskThunk(void* arg);

  TaskHandle_t renderer_task_ = nullptr;
  TaskHandle_t flusher_task_ = nullptr;
  TaskHandle_t sensor_task_ = nullptr;

  TaskSpec renderer_launch_ = {};
  TaskSpec flusher_launch_ = {};
  TaskSpec sensor_launch_ = {};
#endif

  bool running_ = false;
};

}  // namespace system
}  // namespace obd_dash
