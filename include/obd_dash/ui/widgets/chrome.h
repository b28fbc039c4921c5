// chrome.h - header bar, grid dividers and popups.
#pragma once

#include "obd_dash/gfx/frame_buffer.h"
#include "obd_dash/ui/popup.h"
#include "obd_dash/ui/render_state.h"

namespace obd_dash {
namespace ui {
namespace widgets {

// `fps_text` may be empty when FPS display is off.
void drawHeader(gfx::DrawTarget& target, const char* title, const char* fps_text);
void drawDividers(gfx::DrawTarget& target);

struct PopupContext {
  FpsMode fps_mode = FpsMode::kOff;
  bool show_psi = false;
  bool blink_on = true;
};

void drawPopup(gfx::DrawTarget& target, PopupKind kind, const PopupContext& context);

}  // namespace widgets
}  // namespace ui
}  // namespace obd_dash
