#include "obd_dash/ui/page_controller.h"

namespace obd_dash {
namespace ui {

Page PageController::cycle() {
  page_ = nextPage(page_);
  if (page_ == Page::kDashboard) {
    ++dashboard_entries_;
  }
  return page_;
}

bool PageController::render(gfx::DrawTarget& target, const PageSources& sources, DashboardResult* out_dashboard) const {
  switch (page_) {
    case Page::kDashboard:
      if (sources.dashboard == nullptr) {
        return false;
      }
      drawDashboard(target, *sources.dashboard, out_dashboard);
      return true;
    case Page::kDebug:
      if (sources.debug == nullptr) {
        return false;
      }
      drawDebugPage(target, *sources.debug);
      return true;
    case Page::kLogs:
      if (sources.log == nullptr) {
        return false;
      }
      drawLogsPage(target, *sources.log);
      return true;
  }
  return false;
}

}  // namespace ui
}  // namespace obd_dash
