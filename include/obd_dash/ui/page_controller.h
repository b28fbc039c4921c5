// page_controller.h - current page and per-page render dispatch.
#pragma once

#include <cstdint>

#include "obd_dash/gfx/frame_buffer.h"
#include "obd_dash/ui/pages.h"
#include "obd_dash/ui/render_state.h"

namespace obd_dash {
namespace ui {

// Only the entry for the current page is read.
struct PageSources {
  const DashboardFrame* dashboard = nullptr;
  const DebugPageData* debug = nullptr;
  runtime::log::LogBuffer* log = nullptr;
};

class PageController {
 public:
  Page page() const { return page_; }
  bool onDashboard() const { return page_ == Page::kDashboard; }

  // Moves to the next page and returns it.
  Page cycle();
  uint32_t dashboardEntries() const { return dashboard_entries_; }

  // False when the current page had nothing to draw from.
  bool render(gfx::DrawTarget& target, const PageSources& sources, DashboardResult* out_dashboard) const;

 private:
  Page page_ = Page::kDashboard;
  uint32_t dashboard_entries_ = 0U;
};

}  // namespace ui
}  // namespace obd_dash
