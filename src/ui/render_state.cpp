#include "obd_dash/ui/render_state.h"

#include <cmath>
#include <cstdio>

namespace obd_dash {
namespace ui {

namespace {

uint32_t roundedFps(float fps) {
  if (!(fps > 0.0f)) {
    return 0U;
  }
  return static_cast<uint32_t>(std::lround(fps));
}

}  // namespace

FpsMode nextFpsMode(FpsMode mode) {
  switch (mode) {
    case FpsMode::kOff:
      return FpsMode::kInstant;
    case FpsMode::kInstant:
      return FpsMode::kAverage;
    case FpsMode::kAverage:
      return FpsMode::kCombined;
    case FpsMode::kCombined:
      break;
  }
  return FpsMode::kOff;
}

Page nextPage(Page page) {
  switch (page) {
    case Page::kDashboard:
      return Page::kDebug;
    case Page::kDebug:
      return Page::kLogs;
    case Page::kLogs:
      break;
  }
  return Page::kDashboard;
}

bool fpsVisible(FpsMode mode) {
  return mode != FpsMode::kOff;
}

const char* fpsModeLabel(FpsMode mode) {
  switch (mode) {
    case FpsMode::kOff:
      return "FPS OFF";
    case FpsMode::kInstant:
      return "FPS: INST";
    case FpsMode::kAverage:
      return "FPS: AVG";
    case FpsMode::kCombined:
      return "FPS: BOTH";
  }
  return "FPS";
}

const char* pageName(Page page) {
  switch (page) {
    case Page::kDashboard:
      return "dashboard";
    case Page::kDebug:
      return "debug";
    case Page::kLogs:
      return "logs";
  }
  return "?";
}

size_t formatFps(FpsMode mode, float instant_fps, float average_fps, char* out, size_t out_size) {
  if (out == nullptr || out_size == 0U) {
    return 0U;
  }
  int written = 0;
  switch (mode) {
    case FpsMode::kOff:
      out[0] = '\0';
      return 0U;
    case FpsMode::kInstant:
      written = std::snprintf(out, out_size, "%lu FPS", static_cast<unsigned long>(roundedFps(instant_fps)));
      break;
    case FpsMode::kAverage:
      written = std::snprintf(out, out_size, "%lu AVG", static_cast<unsigned long>(roundedFps(average_fps)));
      break;
    case FpsMode::kCombined:
      written = std::snprintf(out,
                              out_size,
                              "%lu/%lu FPS",
                              static_cast<unsigned long>(roundedFps(instant_fps)),
                              static_cast<unsigned long>(roundedFps(average_fps)));
      break;
  }
  if (written < 0) {
    out[0] = '\0';
    return 0U;
  }
  return (static_cast<size_t>(written) < out_size) ? static_cast<size_t>(written) : out_size - 1U;
}

bool RenderState::checkHeaderDirty(FpsMode mode, float instant_fps, float average_fps) {
  const uint32_t instant_shown = roundedFps(instant_fps);
  const uint32_t average_shown = roundedFps(average_fps);
  bool value_changed = false;
  switch (mode) {
    case FpsMode::kOff:
      break;
    case FpsMode::kInstant:
      value_changed = instant_shown != last_instant_shown_;
      break;
    case FpsMode::kAverage:
      value_changed = average_shown != last_average_shown_;
      break;
    case FpsMode::kCombined:
      value_changed = instant_shown != last_instant_shown_ || average_shown != last_average_shown_;
      break;
  }
  const bool dirty = first_frame_ || popup_just_closed_ || display_cleared_ || mode != last_fps_mode_ ||
                     value_changed;
  last_fps_mode_ = mode;
  last_instant_shown_ = instant_shown;
  last_average_shown_ = average_shown;

  if (dirty && !header_dirty_prev_) {
    ++header_bursts_;
  }
  header_dirty_now_ = header_dirty_now_ || dirty;
  return dirty;
}

void RenderState::updatePopup(PopupKind visible_kind) {
  const bool was_visible = last_popup_ != PopupKind::kNone;
  const bool changed = visible_kind != last_popup_;
  last_popup_ = visible_kind;
  if (changed && was_visible) {
    popup_just_closed_ = true;
    dividers_drawn_ = false;
  }
}

void RenderState::markDisplayCleared() {
  display_cleared_ = true;
  dividers_drawn_ = false;
}

void RenderState::endFrame() {
  first_frame_ = false;
  popup_just_closed_ = false;
  display_cleared_ = false;
  header_dirty_prev_ = header_dirty_now_;
  header_dirty_now_ = false;
}

}  // namespace ui
}  // namespace obd_dash
