#include "obd_dash/ui/widgets/cells.h"

#include <cstdio>

#include "obd_dash/config/sensor_thresholds.h"
#include "obd_dash/gfx/text.h"
#include "obd_dash/ui/cell_palette.h"
#include "obd_dash/ui/widgets/primitives.h"

namespace obd_dash {
namespace ui {
namespace widgets {

namespace color = gfx::color;
using gfx::Color565;
using gfx::FontSize;
using gfx::Rect;
using gfx::TextAlign;

namespace {

constexpr int16_t kLabelBaseline = 14;
constexpr int16_t kArrowY = 10;
constexpr int16_t kArrowGap = 8;
constexpr int16_t kLowBadgeX = 9;
constexpr int16_t kLowBadgeY = 4;
constexpr int16_t kLowBadgeW = 32;
constexpr int16_t kLowBadgeH = 14;
constexpr int16_t kLowLabelShift = 12;
constexpr int16_t kGraphMarginX = 8;

int16_t centerX(const Rect& r) {
  return static_cast<int16_t>(r.x + r.w / 2);
}

int16_t centerY(const Rect& r) {
  return static_cast<int16_t>(r.y + r.h / 2);
}

void drawTrendFor(gfx::DrawTarget& target, const CellInput& input, int16_t x, Color565 color) {
  if (input.state == nullptr) {
    return;
  }
  const sensors::Trend trend = input.state->trend();
  if (trend == sensors::Trend::kFlat) {
    return;
  }
  drawTrendArrow(target, x, static_cast<int16_t>(input.rect.y + kArrowY), trend == sensors::Trend::kRising, color);
}

bool peakActive(const CellInput& input) {
  return input.state != nullptr && input.state->isPeak(input.now_ms);
}

// Secondary text: black on light cells, white on critical, orange otherwise.
Color565 statsColor(Color565 base_text, bool critical) {
  if (base_text == color::kBlack) {
    return color::kBlack;
  }
  return critical ? color::kWhite : color::kOrange;
}

void drawLowBadge(gfx::DrawTarget& target, const Rect& cell, bool blink_on) {
  const Color565 badge = blink_on ? color::kRed : color::kWhite;
  const Color565 text = blink_on ? color::kWhite : color::kBlack;
  const Rect box{static_cast<int16_t>(cell.x + kLowBadgeX),
                 static_cast<int16_t>(cell.y + kLowBadgeY),
                 kLowBadgeW,
                 kLowBadgeH};
  target.fillSolid(box, badge);
  target.drawRectOutline(
      Rect{static_cast<int16_t>(box.x - 1), static_cast<int16_t>(box.y - 1), static_cast<int16_t>(box.w + 2),
           static_cast<int16_t>(box.h + 2)},
      1,
      text);
  gfx::drawText(target,
                static_cast<int16_t>(box.x + box.w / 2),
                static_cast<int16_t>(box.y + 11),
                "LOW",
                text,
                FontSize::kSmall,
                TextAlign::kCenter);
}

}  // namespace

Color565 effectiveBackground(const CellInput& input) {
  if (input.critical && !input.blink_on) {
    return color::kBlack;
  }
  return input.background;
}

Color565 drawBoostCell(gfx::DrawTarget& target, const CellInput& input, bool show_psi, bool easter_egg) {
  const Rect& r = input.rect;
  drawCellBackground(target, r, color::kBlack);
  const int16_t cx = centerX(r);
  const int16_t cy = centerY(r);
  const int16_t value_x = static_cast<int16_t>(cx + input.shake_x);

  gfx::drawText(target, cx, static_cast<int16_t>(r.y + kLabelBaseline), "BOOST REL", color::kWhite,
                FontSize::kSmall, TextAlign::kCenter);

  const float bar = input.value;
  const float psi = bar * config::kBarToPsi;
  char text[24];
  if (show_psi) {
    std::snprintf(text, sizeof(text), "%.1f", static_cast<double>(psi));
  } else {
    std::snprintf(text, sizeof(text), "%.2f", static_cast<double>(bar));
  }
  Color565 value_color = color::kWhite;
  if (easter_egg) {
    value_color = input.blink_on ? color::kPink : color::kWhite;
  } else if (peakActive(input)) {
    value_color = color::kYellow;
  }
  drawValueWithOutline(target, value_x, static_cast<int16_t>(cy - 2), text, value_color, FontSize::kLarge,
                       TextAlign::kCenter);

  gfx::drawText(target, cx, static_cast<int16_t>(cy + 10), show_psi ? "PSI" : "BAR", color::kWhite,
                FontSize::kSmall, TextAlign::kCenter);
  if (show_psi) {
    std::snprintf(text, sizeof(text), "%.2f bar", static_cast<double>(bar));
  } else {
    std::snprintf(text, sizeof(text), "%.1f psi", static_cast<double>(psi));
  }
  gfx::drawText(target, cx, static_cast<int16_t>(cy + 22), text, color::kGray, FontSize::kSmall, TextAlign::kCenter);

  const int16_t footer_y = static_cast<int16_t>(r.y + r.h - 8);
  if (easter_egg) {
    gfx::drawText(target, cx, footer_y, "Fast AF Boi!", input.blink_on ? color::kWhite : color::kPink,
                  FontSize::kSmall, TextAlign::kCenter);
  } else if (input.state != nullptr && input.state->hasExtremes()) {
    const float max_bar = input.state->maxValue();
    if (show_psi) {
      std::snprintf(text, sizeof(text), "MAX %.1f", static_cast<double>(max_bar * config::kBarToPsi));
    } else {
      std::snprintf(text, sizeof(text), "MAX %.2f", static_cast<double>(max_bar));
    }
    gfx::drawText(target, cx, footer_y, text, color::kOrange, FontSize::kSmall, TextAlign::kCenter);
  }
  return color::kBlack;
}

Color565 drawAfrCell(gfx::DrawTarget& target, const CellInput& input) {
  const Rect& r = input.rect;
  const Color565 bg = effectiveBackground(input);
  drawCellBackground(target, r, bg);
  const Color565 text_color = gfx::textColorFor(bg);
  const int16_t cx = centerX(r);
  const int16_t cy = centerY(r);
  const int16_t value_x = static_cast<int16_t>(cx + input.shake_x);

  gfx::drawText(target, cx, static_cast<int16_t>(r.y + kLabelBaseline), "AFR/LAMBDA", text_color, FontSize::kSmall,
                TextAlign::kCenter);

  char text[24];
  std::snprintf(text, sizeof(text), "%.1f", static_cast<double>(input.value));
  drawValueWithOutline(target, value_x, static_cast<int16_t>(cy - 6), text, text_color, FontSize::kLarge,
                       TextAlign::kCenter);

  std::snprintf(text, sizeof(text), "L %.2f", static_cast<double>(input.value / config::kAfrStoich));
  gfx::drawText(target, value_x, static_cast<int16_t>(cy + 6), text, text_color, FontSize::kSmall, TextAlign::kCenter);

  if (input.state != nullptr) {
    drawMiniGraph(target,
                  Rect{static_cast<int16_t>(r.x + kGraphMarginX), static_cast<int16_t>(cy + 10),
                       static_cast<int16_t>(r.w - 2 * kGraphMarginX), 16},
                  *input.state, text_color);
  }
  gfx::drawText(target, cx, static_cast<int16_t>(r.y + r.h - 8), afrStatus(input.value), text_color,
                FontSize::kSmall, TextAlign::kCenter);
  return bg;
}

Color565 drawBatteryCell(gfx::DrawTarget& target, const CellInput& input) {
  const Rect& r = input.rect;
  const Color565 bg = effectiveBackground(input);
  drawCellBackground(target, r, bg);
  const Color565 base_text = gfx::textColorFor(bg);
  const int16_t cx = centerX(r);
  const int16_t cy = centerY(r);
  const int16_t value_x = static_cast<int16_t>(cx + input.shake_x);

  gfx::drawText(target, cx, static_cast<int16_t>(r.y + kLabelBaseline), "BATT", base_text, FontSize::kSmall,
                TextAlign::kCenter);
  drawTrendFor(target, input, static_cast<int16_t>(cx + 20), base_text);

  char text[24];
  std::snprintf(text, sizeof(text), "%.1fV", static_cast<double>(input.value));
  const Color565 value_color = peakActive(input) ? gfx::peakHighlightFor(base_text) : base_text;
  drawValueWithOutline(target, value_x, static_cast<int16_t>(cy - 3), text, value_color, FontSize::kMedium,
                       TextAlign::kCenter);

  if (input.state == nullptr) {
    return bg;
  }
  drawMiniGraph(target,
                Rect{static_cast<int16_t>(r.x + kGraphMarginX), static_cast<int16_t>(cy + 2),
                     static_cast<int16_t>(r.w - 2 * kGraphMarginX), 20},
                *input.state, base_text);
  if (input.state->hasExtremes()) {
    const Color565 stats = statsColor(base_text, input.critical);
    std::snprintf(text, sizeof(text), "MIN %.1fV", static_cast<double>(input.state->minValue()));
    gfx::drawText(target, cx, static_cast<int16_t>(r.y + r.h - 16), text, stats, FontSize::kSmall,
                  TextAlign::kCenter);
    std::snprintf(text, sizeof(text), "MAX %.1fV", static_cast<double>(input.state->maxValue()));
    gfx::drawText(target, cx, static_cast<int16_t>(r.y + r.h - 5), text, stats, FontSize::kSmall,
                  TextAlign::kCenter);
  }
  return bg;
}

Color565 drawTempCell(gfx::DrawTarget& target, const CellInput& input, const TempCellOptions& options) {
  const Rect& r = input.rect;
  const Color565 bg = effectiveBackground(input);
  drawCellBackground(target, r, bg);
  if (options.low_warning) {
    drawLowBadge(target, r, input.blink_on);
  }

  const Color565 base_text = gfx::textColorFor(bg);
  const int16_t cx = centerX(r);
  const int16_t cy = centerY(r);
  const int16_t value_x = static_cast<int16_t>(cx + input.shake_x);
  const int16_t label_x = static_cast<int16_t>(options.low_warning ? cx + kLowLabelShift : cx);
  const char* label = (options.label != nullptr) ? options.label : "";

  gfx::drawText(target, label_x, static_cast<int16_t>(r.y + kLabelBaseline), label, base_text, FontSize::kSmall,
                TextAlign::kCenter);
  const int16_t label_half = static_cast<int16_t>(gfx::textWidth(label, FontSize::kSmall) / 2);
  drawTrendFor(target, input, static_cast<int16_t>(label_x + label_half + kArrowGap), base_text);

  char text[24];
  std::snprintf(text, sizeof(text), "%.0fC", static_cast<double>(input.value));
  const bool large_value = input.value >= config::kTempLargeValue;
  const Color565 value_color = peakActive(input) ? gfx::peakHighlightFor(base_text) : base_text;
  drawValueWithOutline(target, value_x, static_cast<int16_t>(large_value ? cy - 2 : cy + 2), text, value_color,
                       large_value ? FontSize::kMedium : FontSize::kLarge, TextAlign::kCenter);

  if (input.state == nullptr) {
    return bg;
  }
  drawMiniGraph(target,
                Rect{static_cast<int16_t>(r.x + kGraphMarginX), static_cast<int16_t>(cy + 6),
                     static_cast<int16_t>(r.w - 2 * kGraphMarginX), 20},
                *input.state, base_text);

  float average = 0.0f;
  if (input.state->average(&average)) {
    std::snprintf(text, sizeof(text), "AVG %.0fC", static_cast<double>(average));
    gfx::drawText(target, cx, static_cast<int16_t>(r.y + r.h - 14), text, statsColor(base_text, input.critical),
                  FontSize::kSmall, TextAlign::kCenter);
  }
  if (input.state->hasExtremes()) {
    std::snprintf(text, sizeof(text), "MAX %.0fC", static_cast<double>(input.state->maxValue()));
    const int16_t max_y = static_cast<int16_t>(r.y + r.h - 4);
    if (options.max_critical && !input.critical) {
      drawTextBadge(target, cx, max_y, text, color::kRed, color::kBlack, FontSize::kSmall, TextAlign::kCenter, 1);
    } else {
      const Color565 max_color = options.max_critical ? color::kWhite : statsColor(base_text, input.critical);
      gfx::drawText(target, cx, max_y, text, max_color, FontSize::kSmall, TextAlign::kCenter);
    }
  }
  return bg;
}

}  // namespace widgets
}  // namespace ui
}  // namespace obd_dash
