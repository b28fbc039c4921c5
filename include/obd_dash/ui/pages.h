// pages.h - full-screen renderers for the dashboard, debug and logs pages.
#pragma once

#include <cstdint>

#include "obd_dash/gfx/frame_buffer.h"
#include "obd_dash/runtime/log/log_buffer.h"
#include "obd_dash/runtime/perf/memory_stats.h"
#include "obd_dash/sensors/sensor_board.h"
#include "obd_dash/ui/animations.h"
#include "obd_dash/ui/popup.h"
#include "obd_dash/ui/render_state.h"
#include "obd_dash/ui/widgets/chrome.h"

namespace obd_dash {
namespace ui {

gfx::Rect cellRect(uint8_t cell);

struct DashboardFrame {
  const sensors::SensorBoard* board = nullptr;
  const sensors::SensorSamples* samples = nullptr;
  const ColorTransitions* transitions = nullptr;
  uint32_t frame = 0U;
  uint32_t now_ms = 0U;
  bool show_psi = false;
  bool boost_easter_egg = false;
  bool draw_header = false;
  const char* title = "OBD DASH";
  const char* fps_text = "";
  bool draw_dividers = false;
  PopupKind popup = PopupKind::kNone;
  widgets::PopupContext popup_context = {};
};

struct DashboardResult {
  // Background each cell actually painted this frame.
  gfx::Color565 painted[kCellCount] = {};
};

void drawDashboard(gfx::DrawTarget& target, const DashboardFrame& frame, DashboardResult* out_result);

struct DebugPageData {
  float fps = 0.0f;
  float average_fps = 0.0f;
  uint32_t frame_us = 0U;
  uint32_t render_us = 0U;
  uint32_t flush_us = 0U;
  uint32_t buffer_swaps = 0U;
  uint32_t buffer_waits = 0U;
  uint8_t render_index = 0U;
  uint8_t flush_index = 1U;
  runtime::perf::MemoryStats memory = {};
  uint32_t cpu_mhz = 0U;
  uint32_t expected_cpu_mhz = 0U;
  uint32_t spi_mhz = 0U;
  uint32_t util_percent = 0U;
  uint32_t cycles_per_frame = 0U;
};

void drawDebugPage(gfx::DrawTarget& target, const DebugPageData& data);

// Returns false when the log ring was busy and nothing was listed.
bool drawLogsPage(gfx::DrawTarget& target, runtime::log::LogBuffer& log);

gfx::Color565 logLevelColor(runtime::log::LogLevel level);

}  // namespace ui
}  // namespace obd_dash
