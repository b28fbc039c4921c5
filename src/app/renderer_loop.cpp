#include "obd_dash/app/renderer_loop.h"

#include "obd_dash/config/layout_config.h"
#include "obd_dash/gfx/color565.h"
#include "obd_dash/runtime/perf/memory_stats.h"
#include "obd_dash/ui/cell_palette.h"
#include "obd_dash/ui/pages.h"

namespace obd_dash {
namespace app {

using runtime::log::LogLevel;
using runtime::perf::CycleCounter;
using runtime::perf::FrameProfiler;
using runtime::perf::FrameSection;
using sensors::SensorId;

namespace {

// A dirty header is painted into both buffers.
constexpr uint8_t kHeaderRepaintFrames = 2U;

}  // namespace

RendererLoop::RendererLoop(SystemContext& context, runtime::pipeline::FlushLink& link)
    : ctx_(context),
      pipeline_(context.buffers, link, context.pipeline_stats),
      pacer_(config::kFramePeriodMs) {}

void RendererLoop::begin() {
  const uint32_t now_ms = ctx_.clock.nowMs();
  pacer_.begin(now_ms);
  last_profile_log_ms_ = now_ms;
  ctx_.profiler.reset();
  ctx_.log.pushf(LogLevel::kInfo, now_ms, "Dashboard ready %lux%lu", static_cast<unsigned long>(config::kScreenWidth),
                 static_cast<unsigned long>(config::kScreenHeight));
}

void RendererLoop::applyInput(const input::InputActions& actions, uint32_t now_ms) {
  if (actions.cycle_fps_mode) {
    fps_mode_ = ui::nextFpsMode(fps_mode_);
    popup_.show(ui::PopupKind::kFps, now_ms);
    clear_frames_ = config::kClearFramesOnTransition;
    ctx_.log.pushf(LogLevel::kInfo, now_ms, "FPS mode: %s", ui::fpsModeLabel(fps_mode_));
  }
  if (actions.cycle_page) {
    const ui::Page page = pages_.cycle();
    clear_frames_ = config::kClearFramesOnTransition;
    popup_.clear();
    fps_.resetAverage();
    ctx_.log.pushf(LogLevel::kInfo, now_ms, "Page: %s", ui::pageName(page));
  }
  if (actions.toggle_boost_unit) {
    show_psi_ = !show_psi_;
    popup_.show(ui::PopupKind::kBoostUnit, now_ms);
    ctx_.log.pushf(LogLevel::kInfo, now_ms, "Boost unit: %s", show_psi_ ? "PSI" : "BAR");
  }
  if (actions.request_reset) {
    reset_pending_ = true;
    popup_.show(ui::PopupKind::kReset, now_ms);
  }
}

void RendererLoop::updateColorTargets(const sensors::SensorSamples& samples) {
  for (uint8_t cell = 0U; cell < ui::kCellCount; ++cell) {
    const SensorId id = static_cast<SensorId>(cell);
    transitions_.setTarget(cell, ui::cellBackground(id, samples.get(id)));
  }
  transitions_.update();
}

void RendererLoop::noteAlerts(const sensors::SensorSamples& samples, uint32_t now_ms) {
  uint8_t mask = 0U;
  for (uint8_t cell = 0U; cell < ui::kCellCount; ++cell) {
    const SensorId id = static_cast<SensorId>(cell);
    if (!ui::isCritical(id, samples.get(id))) {
      continue;
    }
    mask = static_cast<uint8_t>(mask | (1U << cell));
    if ((critical_mask_ & (1U << cell)) == 0U) {
      ctx_.log.pushf(LogLevel::kWarn, now_ms, "%s critical %.1f", sensors::sensorLabel(id),
                     static_cast<double>(samples.get(id)));
    }
  }
  critical_mask_ = mask;

  const float egt = samples.get(SensorId::kEgt);
  const bool danger = ui::isEgtDanger(egt);
  if (danger && !egt_danger_) {
    ctx_.log.pushf(LogLevel::kError, now_ms, "EGT danger %.0fC", static_cast<double>(egt));
  }
  egt_danger_ = danger;
}

void RendererLoop::prepareTarget(gfx::DrawTarget& target) {
  if (!pages_.onDashboard()) {
    // Text pages are repainted from scratch.
    target.clear(gfx::color::kBlack);
    return;
  }
  const bool popup_closed = render_state_.popupJustClosed();
  if (!render_state_.isFirstFrame() && !popup_closed && clear_frames_ == 0U) {
    return;
  }
  target.clear(gfx::color::kBlack);
  render_state_.markDisplayCleared();
  if (popup_closed && clear_frames_ == 0U) {
    // The other buffer still holds the popup.
    clear_frames_ = 1U;
  } else if (clear_frames_ > 0U) {
    --clear_frames_;
  }
}

ui::DebugPageData RendererLoop::collectDebugData() const {
  const runtime::perf::FrameSnapshot snapshot = ctx_.profiler.snapshot();
  ui::DebugPageData data;
  data.fps = fps_.instant();
  data.average_fps = fps_.average();
  data.frame_us = snapshot.frame.last_us;
  data.render_us = snapshot.render.last_us;
  data.flush_us = ctx_.pipeline_stats.last_flush_us.load(std::memory_order_relaxed);
  data.buffer_swaps = ctx_.pipeline_stats.buffer_swaps.load(std::memory_order_relaxed);
  data.buffer_waits = ctx_.pipeline_stats.buffer_waits.load(std::memory_order_relaxed);
  data.render_index = ctx_.buffers.renderIndex();
  data.flush_index = ctx_.buffers.flushIndex();
  data.memory = runtime::perf::collectMemoryStats((stack_query_ != nullptr) ? stack_query_() : 0U);
  data.cpu_mhz = ctx_.cycles.frequencyMhz();
  data.expected_cpu_mhz = config::kCpuFreqHz / 1000000UL;
  data.spi_mhz = config::kSpiHz / 1000000UL;
  data.util_percent = snapshot.util_percent;
  data.cycles_per_frame = snapshot.render_cycles;
  return data;
}

void RendererLoop::logProfile(uint32_t now_ms) {
  if (now_ms - last_profile_log_ms_ < config::kProfileLogPeriodMs) {
    return;
  }
  last_profile_log_ms_ = now_ms;
  const runtime::perf::FrameSnapshot snapshot = ctx_.profiler.snapshot();
  const uint32_t render_us = snapshot.render.last_us;
  const uint32_t flush_us = snapshot.flush.last_us;
  ctx_.log.pushf(LogLevel::kInfo, now_ms, "PROF r=%lu f=%lu t=%lu fps=%lu", static_cast<unsigned long>(render_us),
                 static_cast<unsigned long>(flush_us), static_cast<unsigned long>(render_us + flush_us),
                 static_cast<unsigned long>(fps_.instant() + 0.5f));
  ctx_.profiler.dumpStatus();
}

uint32_t RendererLoop::runFrame(const input::ButtonLevels& levels) {
  const uint32_t now_ms = ctx_.clock.nowMs();
  const uint32_t frame_started_us = ctx_.clock.nowUs();
  const sensors::SensorSamples samples = ctx_.samples.snapshot();

  applyInput(input_.poll(levels, now_ms, pages_.page()), now_ms);
  if (popup_.expireIfDue(now_ms)) {
    clear_frames_ = config::kClearFramesOnTransition;
  }

  if (!seeded_ || reset_pending_) {
    board_.resetAll(samples);
    if (seeded_) {
      ++resets_;
      ctx_.log.push(LogLevel::kInfo, now_ms, "MIN/AVG/MAX Reset");
    }
    seeded_ = true;
    reset_pending_ = false;
  }
  peaks_ = board_.update(samples, now_ms);
  easter_egg_ = ui::isBoostEasterEgg(samples.get(SensorId::kBoost), show_psi_);
  noteAlerts(samples, now_ms);
  fps_.frame(now_ms);
  updateColorTargets(samples);

  render_state_.updatePopup(ui::visiblePopup(popup_, egt_danger_));

  gfx::DrawTarget& target = ctx_.buffers.renderTarget();
  prepareTarget(target);

  ui::DashboardFrame dashboard;
  char fps_text[24] = {};
  ui::DebugPageData debug;
  ui::PageSources sources;
  if (pages_.onDashboard()) {
    if (render_state_.checkHeaderDirty(fps_mode_, fps_.instant(), fps_.average())) {
      header_repaints_ = kHeaderRepaintFrames;
    }
    ui::formatFps(fps_mode_, fps_.instant(), fps_.average(), fps_text, sizeof(fps_text));
    dashboard.board = &board_;
    dashboard.samples = &samples;
    dashboard.transitions = &transitions_;
    dashboard.frame = frame_;
    dashboard.now_ms = now_ms;
    dashboard.show_psi = show_psi_;
    dashboard.boost_easter_egg = easter_egg_;
    dashboard.draw_header = header_repaints_ > 0U;
    dashboard.fps_text = fps_text;
    dashboard.draw_dividers = render_state_.needDividers();
    dashboard.popup = ui::visiblePopup(popup_, egt_danger_);
    dashboard.popup_context.fps_mode = fps_mode_;
    dashboard.popup_context.show_psi = show_psi_;
    dashboard.popup_context.blink_on = ui::blinkOn(frame_);
    sources.dashboard = &dashboard;
    if (header_repaints_ > 0U) {
      --header_repaints_;
    }
  } else {
    debug = collectDebugData();
    sources.debug = &debug;
    sources.log = &ctx_.log;
  }

  const uint32_t render_started_us = ctx_.clock.nowUs();
  const uint32_t cycles_started = CycleCounter::read();
  pages_.render(target, sources, &last_dashboard_);
  const uint32_t render_cycles = CycleCounter::elapsed(cycles_started, CycleCounter::read());
  ctx_.profiler.noteSection(FrameSection::kRender, FrameProfiler::elapsedUs(render_started_us, ctx_.clock.nowUs()));
  if (dashboard.draw_dividers) {
    render_state_.markDividersDrawn();
  }

  if (pipeline_.submitFrame()) {
    signal_failing_ = false;
  } else if (!signal_failing_) {
    signal_failing_ = true;
    ctx_.log.push(LogLevel::kError, now_ms, "Frame hand-off failed");
  }
  const uint32_t flushes = ctx_.pipeline_stats.flushes.load(std::memory_order_acquire);
  if (flushes != last_flush_count_) {
    last_flush_count_ = flushes;
    ctx_.profiler.noteSection(FrameSection::kFlush, ctx_.pipeline_stats.last_flush_us.load(std::memory_order_relaxed));
  }

  const uint32_t frame_us = FrameProfiler::elapsedUs(frame_started_us, ctx_.clock.nowUs());
  ctx_.profiler.noteSection(FrameSection::kFrame, frame_us);
  ctx_.profiler.noteRenderCycles(render_cycles, ctx_.cycles.utilPercent(render_cycles, frame_us));

  const uint32_t end_ms = ctx_.clock.nowMs();
  logProfile(end_ms);
  render_state_.endFrame();
  ++frame_;
  return pacer_.delayUntilNext(end_ms);
}

}  // namespace app
}  // namespace obd_dash
