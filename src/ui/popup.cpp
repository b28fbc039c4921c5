#include "obd_dash/ui/popup.h"

#include "obd_dash/config/layout_config.h"

namespace obd_dash {
namespace ui {

void PopupSlot::show(PopupKind kind, uint32_t now_ms) {
  kind_ = kind;
  shown_at_ms_ = now_ms;
}

void PopupSlot::clear() {
  kind_ = PopupKind::kNone;
  shown_at_ms_ = 0U;
}

bool PopupSlot::isExpired(uint32_t now_ms) const {
  if (!active()) {
    return false;
  }
  return static_cast<uint32_t>(now_ms - shown_at_ms_) >= config::kPopupTtlMs;
}

bool PopupSlot::expireIfDue(uint32_t now_ms) {
  if (!isExpired(now_ms)) {
    return false;
  }
  clear();
  return true;
}

PopupKind visiblePopup(const PopupSlot& user_popup, bool egt_danger) {
  if (user_popup.active()) {
    return user_popup.kind();
  }
  return egt_danger ? PopupKind::kWarning : PopupKind::kNone;
}

}  // namespace ui
}  // namespace obd_dash
