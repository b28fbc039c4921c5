// renderer_loop.h - one dashboard frame: input, sensors, draw, hand-off.
#pragma once

#include <cstdint>

#include "obd_dash/app/fps_counter.h"
#include "obd_dash/app/system_context.h"
#include "obd_dash/input/input_mapper.h"
#include "obd_dash/runtime/pipeline/frame_pipeline.h"
#include "obd_dash/sensors/sensor_board.h"
#include "obd_dash/ui/animations.h"
#include "obd_dash/ui/page_controller.h"
#include "obd_dash/ui/popup.h"
#include "obd_dash/ui/render_state.h"

namespace obd_dash {
namespace app {

class RendererLoop {
 public:
  using StackQuery = uint32_t (*)();

  RendererLoop(SystemContext& context, runtime::pipeline::FlushLink& link);

  void begin();
  // Renders and submits one frame. Returns the sleep before the next one.
  uint32_t runFrame(const input::ButtonLevels& levels);

  void setStackQuery(StackQuery query) { stack_query_ = query; }

  ui::Page page() const { return pages_.page(); }
  ui::FpsMode fpsMode() const { return fps_mode_; }
  bool showPsi() const { return show_psi_; }
  ui::PopupKind popupKind() const { return popup_.kind(); }
  uint32_t frameIndex() const { return frame_; }
  uint32_t resetCount() const { return resets_; }
  uint8_t peakCount() const { return peaks_; }
  bool boostEasterEgg() const { return easter_egg_; }
  const sensors::SensorBoard& board() const { return board_; }
  const ui::RenderState& renderState() const { return render_state_; }
  const ui::DashboardResult& lastDashboard() const { return last_dashboard_; }
  const ui::ColorTransitions& transitions() const { return transitions_; }
  const FpsCounter& fps() const { return fps_; }
  const ui::PageController& pages() const { return pages_; }
  runtime::pipeline::FramePipeline& pipeline() { return pipeline_; }

 private:
  void applyInput(const input::InputActions& actions, uint32_t now_ms);
  void updateColorTargets(const sensors::SensorSamples& samples);
  void noteAlerts(const sensors::SensorSamples& samples, uint32_t now_ms);
  void prepareTarget(gfx::DrawTarget& target);
  ui::DebugPageData collectDebugData() const;
  void logProfile(uint32_t now_ms);

  SystemContext& ctx_;
  runtime::pipeline::FramePipeline pipeline_;
  runtime::pipeline::FramePacer pacer_;
  input::InputMapper input_;
  sensors::SensorBoard board_;
  ui::ColorTransitions transitions_;
  ui::RenderState render_state_;
  ui::PageController pages_;
  ui::PopupSlot popup_;
  ui::DashboardResult last_dashboard_;
  FpsCounter fps_;
  StackQuery stack_query_ = nullptr;

  ui::FpsMode fps_mode_ = ui::FpsMode::kOff;
  bool show_psi_ = false;
  bool reset_pending_ = false;
  bool seeded_ = false;
  bool easter_egg_ = false;
  bool egt_danger_ = false;
  bool signal_failing_ = false;
  uint8_t clear_frames_ = config::kClearFramesOnTransition;
  uint8_t header_repaints_ = 0U;
  uint8_t peaks_ = 0U;
  uint8_t critical_mask_ = 0U;
  uint32_t frame_ = 0U;
  uint32_t resets_ = 0U;
  uint32_t last_profile_log_ms_ = 0U;
  uint32_t last_flush_count_ = 0U;
};

}  // namespace app
}  // namespace obd_dash
