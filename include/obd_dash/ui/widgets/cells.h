// cells.h - dashboard sensor cells.
#pragma once

#include <cstdint>

#include "obd_dash/gfx/frame_buffer.h"
#include "obd_dash/sensors/sensor_state.h"

namespace obd_dash {
namespace ui {
namespace widgets {

struct CellInput {
  gfx::Rect rect;
  const sensors::SensorState* state = nullptr;
  float value = 0.0f;
  // Current transition color of the cell background.
  gfx::Color565 background = gfx::color::kBlack;
  bool critical = false;
  bool blink_on = true;
  int16_t shake_x = 0;
  uint32_t now_ms = 0U;
};

struct TempCellOptions {
  const char* label = "";
  // Oil only: LOW badge while cold.
  bool low_warning = false;
  // Stored max sits in the critical bucket.
  bool max_critical = false;
};

// Background color actually painted: black while a critical cell blinks off.
gfx::Color565 effectiveBackground(const CellInput& input);

// Each draw function returns the background it painted.
gfx::Color565 drawBoostCell(gfx::DrawTarget& target, const CellInput& input, bool show_psi, bool easter_egg);
gfx::Color565 drawAfrCell(gfx::DrawTarget& target, const CellInput& input);
gfx::Color565 drawBatteryCell(gfx::DrawTarget& target, const CellInput& input);
gfx::Color565 drawTempCell(gfx::DrawTarget& target, const CellInput& input, const TempCellOptions& options);

}  // namespace widgets
}  // namespace ui
}  // namespace obd_dash
