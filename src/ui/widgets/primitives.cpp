#include "obd_dash/ui/widgets/primitives.h"

#include "obd_dash/config/layout_config.h"

namespace obd_dash {
namespace ui {
namespace widgets {

namespace {

struct Offset {
  int8_t dx;
  int8_t dy;
};

#if defined(OBD_DASH_SIMPLE_OUTLINE) && OBD_DASH_SIMPLE_OUTLINE
constexpr Offset kOutlineOffsets[] = {{1, 1}, {1, 0}};
#else
constexpr Offset kOutlineOffsets[] = {{-1, -1}, {0, -1}, {1, -1}, {-1, 0}, {1, 0}, {-1, 1}, {0, 1}, {1, 1}};
#endif

constexpr int16_t kGraphPad = 2;
constexpr size_t kGraphSampleStep = 2U;

}  // namespace

void drawCellBackground(gfx::DrawTarget& target, const gfx::Rect& cell, gfx::Color565 background) {
  const int16_t inset = config::kCellInset;
  if (cell.w < 2 * inset || cell.h < 2 * inset) {
    return;
  }
  target.fillSolid(gfx::Rect{static_cast<int16_t>(cell.x + inset),
                             static_cast<int16_t>(cell.y + inset),
                             static_cast<int16_t>(cell.w - 2 * inset),
                             static_cast<int16_t>(cell.h - 2 * inset)},
                   background);
}

void drawTrendArrow(gfx::DrawTarget& target, int16_t x, int16_t y, bool rising, gfx::Color565 color) {
  const int16_t tip = static_cast<int16_t>(rising ? y - 4 : y + 4);
  const int16_t tail = static_cast<int16_t>(rising ? y + 4 : y - 4);
  const int16_t wing = static_cast<int16_t>(rising ? y - 1 : y + 1);
  target.drawLine(x, tail, x, tip, color);
  target.drawLine(static_cast<int16_t>(x - 3), wing, x, tip, color);
  target.drawLine(static_cast<int16_t>(x + 3), wing, x, tip, color);
}

void drawMiniGraph(gfx::DrawTarget& target,
                   const gfx::Rect& area,
                   const sensors::SensorState& state,
                   gfx::Color565 color) {
  const size_t count = state.graphCount();
  if (count < 2U || area.w < 5 || area.h < 5) {
    return;
  }
  const int16_t graph_w = static_cast<int16_t>(area.w - 2 * kGraphPad);
  const int16_t graph_h = static_cast<int16_t>(area.h - 2 * kGraphPad);
  const int16_t left = static_cast<int16_t>(area.x + kGraphPad);
  const int16_t top = static_cast<int16_t>(area.y + kGraphPad);
  const int16_t right = static_cast<int16_t>(left + graph_w - 1);
  const int16_t bottom = static_cast<int16_t>(top + graph_h - 1);

  const float lo = state.graphMin();
  const float range = state.graphMax() - lo;
  const bool flat = range <= config::kGraphFlatEpsilon;
  const float y_scale = flat ? 0.0f : static_cast<float>(graph_h - 1) / range;
  const float x_step = static_cast<float>(graph_w - 1) / static_cast<float>(count - 1U);

  int16_t prev_x = 0;
  int16_t prev_y = 0;
  bool first = true;
  for (size_t index = 0U; index < count; index += kGraphSampleStep) {
    int16_t px = static_cast<int16_t>(left + static_cast<int16_t>(static_cast<float>(index) * x_step));
    if (px > right) {
      px = right;
    }
    int16_t py = static_cast<int16_t>(top + (graph_h - 1) / 2);
    if (!flat) {
      const int16_t rise = static_cast<int16_t>((state.graphAt(index) - lo) * y_scale);
      py = static_cast<int16_t>(bottom - rise);
      if (py < top) {
        py = top;
      } else if (py > bottom) {
        py = bottom;
      }
    }
    if (!first) {
      target.drawLine(prev_x, prev_y, px, py, color);
    }
    prev_x = px;
    prev_y = py;
    first = false;
  }
}

void drawValueWithOutline(gfx::DrawTarget& target,
                          int16_t x,
                          int16_t baseline_y,
                          const char* text,
                          gfx::Color565 color,
                          gfx::FontSize size,
                          gfx::TextAlign align) {
  const gfx::Color565 outline = gfx::outlineColorFor(color);
  for (const Offset& offset : kOutlineOffsets) {
    gfx::drawText(target,
                  static_cast<int16_t>(x + offset.dx),
                  static_cast<int16_t>(baseline_y + offset.dy),
                  text,
                  outline,
                  size,
                  align);
  }
  gfx::drawText(target, x, baseline_y, text, color, size, align);
}

void drawTextBadge(gfx::DrawTarget& target,
                   int16_t x,
                   int16_t baseline_y,
                   const char* text,
                   gfx::Color565 text_color,
                   gfx::Color565 badge_color,
                   gfx::FontSize size,
                   gfx::TextAlign align,
                   int16_t pad) {
  const gfx::Rect bounds = gfx::textBounds(x, baseline_y, text, size, align);
  target.fillSolid(gfx::Rect{static_cast<int16_t>(bounds.x - pad),
                             static_cast<int16_t>(bounds.y - pad),
                             static_cast<int16_t>(bounds.w + 2 * pad),
                             static_cast<int16_t>(bounds.h + 2 * pad)},
                   badge_color);
  gfx::drawText(target, x, baseline_y, text, text_color, size, align);
}

}  // namespace widgets
}  // namespace ui
}  // namespace obd_dash
