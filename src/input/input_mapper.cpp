#include "obd_dash/input/input_mapper.h"

namespace obd_dash {
namespace input {

InputActions InputMapper::poll(const ButtonLevels& levels, uint32_t now_ms, ui::Page page) {
  const bool on_dashboard = (page == ui::Page::kDashboard);
  InputActions actions;
  const bool x_edge = x_.justPressed(levels.x_low, now_ms);
  const bool y_edge = y_.justPressed(levels.y_low, now_ms);
  const bool a_edge = a_.justPressed(levels.a_low, now_ms);
  const bool b_edge = b_.justPressed(levels.b_low, now_ms);
  actions.cycle_fps_mode = x_edge && on_dashboard;
  actions.cycle_page = y_edge;
  actions.toggle_boost_unit = a_edge && on_dashboard;
  actions.request_reset = b_edge && on_dashboard;
  return actions;
}

}  // namespace input
}  // namespace obd_dash
