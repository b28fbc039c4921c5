// render_state.h - page/FPS modes and conditional redraw bookkeeping.
#pragma once

#include <cstddef>
#include <cstdint>

#include "obd_dash/ui/popup.h"

namespace obd_dash {
namespace ui {

enum class FpsMode : uint8_t {
  kOff = 0,
  kInstant,
  kAverage,
  kCombined,
};

enum class Page : uint8_t {
  kDashboard = 0,
  kDebug,
  kLogs,
};

FpsMode nextFpsMode(FpsMode mode);
Page nextPage(Page page);
bool fpsVisible(FpsMode mode);
// Popup text for the mode, e.g. "FPS: AVG".
const char* fpsModeLabel(FpsMode mode);
const char* pageName(Page page);

// Header FPS text: "N FPS", "N AVG" or "A/B FPS". Empty when off.
size_t formatFps(FpsMode mode, float instant_fps, float average_fps, char* out, size_t out_size);

class RenderState {
 public:
  bool isFirstFrame() const { return first_frame_; }
  bool needDividers() const { return !dividers_drawn_ || first_frame_ || display_cleared_; }
  void markDividersDrawn() { dividers_drawn_ = true; }

  // True when the header must be repainted this frame. Remembers what was shown.
  bool checkHeaderDirty(FpsMode mode, float instant_fps, float average_fps);

  void updatePopup(PopupKind visible_kind);
  bool popupJustClosed() const { return popup_just_closed_; }

  void markDisplayCleared();
  bool displayCleared() const { return display_cleared_; }

  // Resets per-frame flags. Call once after the frame is rendered.
  void endFrame();

  // Consecutive dirty frames count as one repaint burst.
  uint32_t headerRepaintBursts() const { return header_bursts_; }

 private:
  bool first_frame_ = true;
  bool dividers_drawn_ = false;
  bool display_cleared_ = false;
  bool popup_just_closed_ = false;
  PopupKind last_popup_ = PopupKind::kNone;
  FpsMode last_fps_mode_ = FpsMode::kOff;
  uint32_t last_instant_shown_ = 0U;
  uint32_t last_average_shown_ = 0U;
  bool header_dirty_now_ = false;
  bool header_dirty_prev_ = false;
  uint32_t header_bursts_ = 0U;
};

}  // namespace ui
}  // namespace obd_dash
