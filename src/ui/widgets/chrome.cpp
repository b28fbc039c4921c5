#include "obd_dash/ui/widgets/chrome.h"

#include "obd_dash/config/layout_config.h"
#include "obd_dash/gfx/text.h"

namespace obd_dash {
namespace ui {
namespace widgets {

namespace color = gfx::color;
using gfx::Color565;
using gfx::FontSize;
using gfx::Rect;
using gfx::TextAlign;

namespace {

constexpr int16_t kHeaderBaseline = 17;
constexpr int16_t kHeaderFpsRight = config::kScreenWidth - 5;
constexpr int16_t kPopupBorder = 3;

Rect centeredBox(int16_t w, int16_t h) {
  return Rect{static_cast<int16_t>(config::kCenterX - w / 2), static_cast<int16_t>(config::kCenterY - h / 2), w, h};
}

void drawPopupFrame(gfx::DrawTarget& target, const Rect& box, Color565 fill, Color565 border) {
  target.fillSolid(box, fill);
  target.drawRectOutline(box, kPopupBorder, border);
}

void drawCenteredLine(gfx::DrawTarget& target, int16_t dy, const char* text, Color565 color, FontSize size) {
  gfx::drawText(target, config::kCenterX, static_cast<int16_t>(config::kCenterY + dy), text, color, size,
                TextAlign::kCenter);
}

}  // namespace

void drawHeader(gfx::DrawTarget& target, const char* title, const char* fps_text) {
  target.fillSolid(Rect{0, 0, config::kScreenWidth, config::kHeaderHeight}, color::kRed);
  gfx::drawText(target, config::kCenterX, kHeaderBaseline, title, color::kWhite, FontSize::kMedium,
                TextAlign::kCenter);
  if (fps_text != nullptr && fps_text[0] != '\0') {
    gfx::drawText(target, kHeaderFpsRight, kHeaderBaseline, fps_text, color::kWhite, FontSize::kSmall,
                  TextAlign::kRight);
  }
}

void drawDividers(gfx::DrawTarget& target) {
  const int16_t grid_h = static_cast<int16_t>(config::kScreenHeight - config::kHeaderHeight);
  for (int16_t col = 1; col < config::kGridColumns; ++col) {
    target.drawVLine(static_cast<int16_t>(col * config::kColWidth), config::kHeaderHeight, grid_h, color::kGray);
  }
  target.drawHLine(0, config::kRowSplitY, config::kScreenWidth, color::kGray);
}

void drawPopup(gfx::DrawTarget& target, PopupKind kind, const PopupContext& context) {
  switch (kind) {
    case PopupKind::kReset:
      drawPopupFrame(target, centeredBox(180, 60), color::kRed, color::kWhite);
      drawCenteredLine(target, -5, "MIN/AVG/MAX", color::kWhite, FontSize::kMedium);
      drawCenteredLine(target, 15, "RESET", color::kWhite, FontSize::kMedium);
      break;
    case PopupKind::kFps:
      drawPopupFrame(target, centeredBox(140, 50), color::kRed, color::kWhite);
      drawCenteredLine(target, 7, fpsModeLabel(context.fps_mode), color::kWhite, FontSize::kMedium);
      break;
    case PopupKind::kBoostUnit:
      drawPopupFrame(target, centeredBox(140, 50), color::kRed, color::kWhite);
      drawCenteredLine(target, 7, context.show_psi ? "BOOST: PSI" : "BOOST: BAR", color::kWhite, FontSize::kMedium);
      break;
    case PopupKind::kWarning: {
      const Color565 fill = context.blink_on ? color::kRed : color::kWhite;
      const Color565 ink = context.blink_on ? color::kWhite : color::kRed;
      drawPopupFrame(target, centeredBox(210, 70), fill, ink);
      drawCenteredLine(target, -8, "WARNING", ink, FontSize::kMedium);
      drawCenteredLine(target, 15, "DANGER TO MANIFOLD", ink, FontSize::kSmall);
      break;
    }
    case PopupKind::kNone:
      break;
  }
}

}  // namespace widgets
}  // namespace ui
}  // namespace obd_dash
