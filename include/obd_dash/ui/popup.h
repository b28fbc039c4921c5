// popup.h - time-limited overlay slot.
#pragma once

#include <cstdint>

namespace obd_dash {
namespace ui {

enum class PopupKind : uint8_t {
  kReset = 0,
  kFps,
  kBoostUnit,
  kWarning,
  kNone,
};

// Holds at most one popup. A new trigger replaces the current one.
class PopupSlot {
 public:
  void show(PopupKind kind, uint32_t now_ms);
  void clear();

  PopupKind kind() const { return kind_; }
  bool active() const { return kind_ != PopupKind::kNone; }
  uint32_t shownAtMs() const { return shown_at_ms_; }
  bool isExpired(uint32_t now_ms) const;
  // Clears the slot once its time is up. Returns true on the expiring call.
  bool expireIfDue(uint32_t now_ms);

 private:
  PopupKind kind_ = PopupKind::kNone;
  uint32_t shown_at_ms_ = 0U;
};

// Popup actually drawn this frame: a user popup wins over the EGT warning.
PopupKind visiblePopup(const PopupSlot& user_popup, bool egt_danger);

}  // namespace ui
}  // namespace obd_dash
