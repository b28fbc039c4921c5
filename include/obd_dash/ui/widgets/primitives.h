// primitives.h - shared drawing blocks for dashboard cells.
#pragma once

#include <cstdint>

#include "obd_dash/gfx/frame_buffer.h"
#include "obd_dash/gfx/text.h"
#include "obd_dash/sensors/sensor_state.h"

namespace obd_dash {
namespace ui {
namespace widgets {

// Fills the cell minus a 2 px border, which stays page background and
// forms the grid dividers.
void drawCellBackground(gfx::DrawTarget& target, const gfx::Rect& cell, gfx::Color565 background);

// Nine pixel tall arrow centered on (x, y).
void drawTrendArrow(gfx::DrawTarget& target, int16_t x, int16_t y, bool rising, gfx::Color565 color);

// Sparkline of the sensor's graph ring, auto-scaled to its own min/max.
void drawMiniGraph(gfx::DrawTarget& target,
                   const gfx::Rect& area,
                   const sensors::SensorState& state,
                   gfx::Color565 color);

// Text with a contrasting outline so it reads on any background.
void drawValueWithOutline(gfx::DrawTarget& target,
                          int16_t x,
                          int16_t baseline_y,
                          const char* text,
                          gfx::Color565 color,
                          gfx::FontSize size,
                          gfx::TextAlign align);

// Solid box behind text, padded by `pad` pixels.
void drawTextBadge(gfx::DrawTarget& target,
                   int16_t x,
                   int16_t baseline_y,
                   const char* text,
                   gfx::Color565 text_color,
                   gfx::Color565 badge_color,
                   gfx::FontSize size,
                   gfx::TextAlign align,
                   int16_t pad);

}  // namespace widgets
}  // namespace ui
}  // namespace obd_dash
