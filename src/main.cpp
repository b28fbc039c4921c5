// main.cpp - firmware entry: boot, wire the pipeline, start the tasks.
#include <Arduino.h>

#include "obd_dash/app/renderer_loop.h"
#include "obd_dash/app/system_context.h"
#include "obd_dash/config/layout_config.h"
#include "obd_dash/drivers/display/st7789_display.h"
#include "obd_dash/drivers/input/gpio_buttons.h"
#include "obd_dash/gfx/fonts.h"
#include "obd_dash/runtime/pipeline/queue_flush_link.h"
#include "obd_dash/sensors/demo_signal_generator.h"
#include "obd_dash/system/boot_report.h"
#include "obd_dash/system/task_topology.h"

namespace {

using obd_dash::app::RendererLoop;
using obd_dash::runtime::log::LogBuffer;
using obd_dash::runtime::log::LogEntry;
using obd_dash::system::TaskTopology;

constexpr const char* kFirmwareName = "obd_dash";
constexpr const char* kFirmwareVersion = "1.0.0";
constexpr uint32_t kHeartbeatPeriodMs = 1000U;
constexpr uint32_t kIdleLoopDelayMs = 1000U;

obd_dash::app::SystemContext& g_ctx = obd_dash::app::systemContext();
obd_dash::drivers::display::St7789Display g_display;
obd_dash::drivers::input::GpioButtons g_buttons;
obd_dash::runtime::pipeline::FlushWorker g_flush_worker(g_ctx.buffers,
                                                        g_display,
                                                        g_ctx.clock,
                                                        g_ctx.log,
                                                        g_ctx.pipeline_stats);
obd_dash::runtime::pipeline::QueueFlushLink g_queue_link(g_flush_worker);
obd_dash::runtime::pipeline::InlineFlushLink g_inline_link(g_flush_worker);
obd_dash::sensors::DemoSignalGenerator g_demo;

RendererLoop* g_renderer = nullptr;
bool g_inline_mode = false;
bool g_led_on = false;
uint32_t g_last_heartbeat_ms = 0U;

void mirrorLog(const LogEntry& entry) {
  Serial.printf("[LOG] %c %lu %s\n",
                LogBuffer::levelChar(entry.level),
                static_cast<unsigned long>(entry.timestamp_ms),
                entry.message);
}

uint32_t rendererStackUsed() {
  return TaskTopology::instance().rendererStackUsedBytes();
}

void heartbeat(uint32_t now_ms) {
  if (obd_dash::config::kPinStatusLed < 0 || now_ms - g_last_heartbeat_ms < kHeartbeatPeriodMs) {
    return;
  }
  g_last_heartbeat_ms = now_ms;
  g_led_on = !g_led_on;
  digitalWrite(obd_dash::config::kPinStatusLed, g_led_on ? HIGH : LOW);
}

void publishDemoSamples() {
  if (obd_dash::config::kDemoSignals) {
    g_ctx.samples.publish(g_demo.sample(millis()));
  }
}

void renderOnce() {
  const uint32_t sleep_ms = g_renderer->runFrame(g_buttons.read());
  heartbeat(millis());
  if (sleep_ms > 0U) {
    g_ctx.clock.sleepMs(sleep_ms);
  } else {
    yield();
  }
}

void rendererTask(void* context) {
  (void)context;
  for (;;) {
    renderOnce();
  }
}

void sensorTask(void* context) {
  (void)context;
  for (;;) {
    publishDemoSamples();
    vTaskDelay(pdMS_TO_TICKS(obd_dash::config::kFramePeriodMs));
  }
}

void startInlineFallback() {
  static RendererLoop inline_renderer(g_ctx, g_inline_link);
  g_renderer = &inline_renderer;
  g_renderer->setStackQuery(&rendererStackUsed);
  g_renderer->begin();
  g_inline_mode = true;
  Serial.println("[PIPE] inline flush fallback");
  g_ctx.log.push(obd_dash::runtime::log::LogLevel::kWarn, millis(), "Inline flush mode");
}

}  // namespace

void setup() {
  Serial.begin(115200);
  g_ctx.log.setMirror(&mirrorLog);
  obd_dash::system::bootPrintReport(kFirmwareName, kFirmwareVersion);

  g_ctx.cycles.begin(static_cast<uint32_t>(getCpuFrequencyMhz()) * 1000000UL);
  if (obd_dash::config::kPinStatusLed >= 0) {
    pinMode(obd_dash::config::kPinStatusLed, OUTPUT);
  }
  g_buttons.begin();
  obd_dash::gfx::fonts::init();
  if (!g_display.begin()) {
    g_ctx.log.push(obd_dash::runtime::log::LogLevel::kError, millis(), "Display DMA unavailable");
  }
  publishDemoSamples();

  if (!g_queue_link.begin()) {
    startInlineFallback();
    return;
  }

  static RendererLoop threaded_renderer(g_ctx, g_queue_link);
  g_renderer = &threaded_renderer;
  g_renderer->setStackQuery(&rendererStackUsed);
  g_renderer->begin();

  TaskTopology::Callbacks callbacks;
  callbacks.renderer.fn = &rendererTask;
  callbacks.flusher.fn = &obd_dash::runtime::pipeline::QueueFlushLink::flusherTask;
  callbacks.flusher.context = &g_queue_link;
  if (obd_dash::config::kDemoSignals) {
    callbacks.sensors.fn = &sensorTask;
  }
  if (!TaskTopology::instance().begin(callbacks)) {
    startInlineFallback();
  }
}

void loop() {
  if (!g_inline_mode) {
    vTaskDelay(pdMS_TO_TICKS(kIdleLoopDelayMs));
    return;
  }
  publishDemoSamples();
  renderOnce();
}
