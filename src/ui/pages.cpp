#include "obd_dash/ui/pages.h"

#include <cstdio>

#include "obd_dash/config/layout_config.h"
#include "obd_dash/gfx/text.h"
#include "obd_dash/ui/cell_palette.h"
#include "obd_dash/ui/widgets/cells.h"

namespace obd_dash {
namespace ui {

namespace color = gfx::color;
using gfx::Color565;
using gfx::FontSize;
using gfx::TextAlign;
using sensors::SensorId;

namespace {

constexpr int16_t kCol1X = 4;
constexpr int16_t kCol2X = 164;
constexpr int16_t kLineStep = 14;
constexpr int16_t kFirstLineY = 12;
constexpr int16_t kFooterY = 223;
constexpr int16_t kLogMessageX = 84;
constexpr int16_t kLogFirstY = 28;
constexpr int16_t kLogLastY = 210;
constexpr int16_t kLogEmptyY = 120;
constexpr uint32_t kUtilAttentionPercent = 80U;

// Text cursor over one column of label/value lines.
class Column {
 public:
  Column(gfx::DrawTarget& target, int16_t x, int16_t y) : target_(target), x_(x), y_(y) {}

  void header(const char* text) { line(text, color::kGreen); }

  void line(const char* text, Color565 ink) {
    // y_ is the top of the line, the font draws from its baseline.
    gfx::drawText(target_, x_, static_cast<int16_t>(y_ + gfx::textAscent(FontSize::kSmall)), text, ink,
                  FontSize::kSmall);
    y_ = static_cast<int16_t>(y_ + kLineStep);
  }

  void linef(Color565 ink, const char* format, unsigned long value) {
    char text[32];
    std::snprintf(text, sizeof(text), format, value);
    line(text, ink);
  }

  void gap() { y_ = static_cast<int16_t>(y_ + kLineStep); }

 private:
  gfx::DrawTarget& target_;
  int16_t x_;
  int16_t y_;
};

void drawFooter(gfx::DrawTarget& target, const char* text) {
  gfx::drawText(target, kCol1X, static_cast<int16_t>(kFooterY + gfx::textAscent(FontSize::kSmall)), text,
                color::kGray, FontSize::kSmall);
}

widgets::CellInput makeCellInput(const DashboardFrame& frame, SensorId id) {
  const uint8_t cell = static_cast<uint8_t>(id);
  widgets::CellInput input;
  input.rect = cellRect(cell);
  input.state = &frame.board->state(id);
  input.value = frame.samples->get(id);
  input.background = frame.transitions->current(cell);
  input.critical = isCritical(id, input.value);
  input.blink_on = blinkOn(frame.frame);
  input.shake_x = shakeOffset(frame.frame, input.critical);
  input.now_ms = frame.now_ms;
  return input;
}

bool maxIsCritical(SensorId id, const sensors::SensorState& state) {
  return state.hasExtremes() && isCritical(id, state.maxValue());
}

}  // namespace

gfx::Rect cellRect(uint8_t cell) {
  const int16_t col = static_cast<int16_t>(cell % config::kGridColumns);
  const int16_t row = static_cast<int16_t>(cell / config::kGridColumns);
  return gfx::Rect{static_cast<int16_t>(col * config::kColWidth),
                   static_cast<int16_t>(config::kHeaderHeight + row * config::kRowHeight),
                   config::kColWidth,
                   config::kRowHeight};
}

void drawDashboard(gfx::DrawTarget& target, const DashboardFrame& frame, DashboardResult* out_result) {
  if (frame.board == nullptr || frame.samples == nullptr || frame.transitions == nullptr) {
    return;
  }
  DashboardResult painted;
  if (frame.draw_header) {
    widgets::drawHeader(target, frame.title, frame.fps_text);
  }

  for (uint8_t cell = 0U; cell < kCellCount; ++cell) {
    const SensorId id = static_cast<SensorId>(cell);
    const widgets::CellInput input = makeCellInput(frame, id);
    switch (id) {
      case SensorId::kBoost:
        painted.painted[cell] = widgets::drawBoostCell(target, input, frame.show_psi, frame.boost_easter_egg);
        break;
      case SensorId::kAfr:
        painted.painted[cell] = widgets::drawAfrCell(target, input);
        break;
      case SensorId::kBattery:
        painted.painted[cell] = widgets::drawBatteryCell(target, input);
        break;
      case SensorId::kCoolant:
      case SensorId::kOil:
      case SensorId::kDsg:
      case SensorId::kIat:
      case SensorId::kEgt: {
        widgets::TempCellOptions options;
        options.label = sensors::sensorLabel(id);
        options.low_warning = (id == SensorId::kOil) && isOilLow(input.value);
        options.max_critical = maxIsCritical(id, *input.state);
        painted.painted[cell] = widgets::drawTempCell(target, input, options);
        break;
      }
      case SensorId::kCount:
        break;
    }
  }

  if (frame.draw_dividers) {
    widgets::drawDividers(target);
  }
  if (frame.popup != PopupKind::kNone) {
    widgets::drawPopup(target, frame.popup, frame.popup_context);
  }
  if (out_result != nullptr) {
    *out_result = painted;
  }
}

void drawDebugPage(gfx::DrawTarget& target, const DebugPageData& data) {
  char text[32];
  const uint32_t total_us = data.render_us + data.flush_us;

  Column left(target, kCol1X, kFirstLineY);
  left.header("TIMING");
  std::snprintf(text, sizeof(text), "FPS: %.1f", static_cast<double>(data.fps));
  left.line(text, color::kWhite);
  std::snprintf(text, sizeof(text), "Avg: %.1f", static_cast<double>(data.average_fps));
  left.line(text, color::kWhite);
  left.linef(color::kWhite, "Frame: %luus", static_cast<unsigned long>(data.frame_us));
  left.linef(color::kWhite, "Render: %luus", static_cast<unsigned long>(data.render_us));
  left.linef(color::kWhite, "Flush: %luus", static_cast<unsigned long>(data.flush_us));
  left.linef(color::kWhite, "Total: %luus", static_cast<unsigned long>(total_us));
  left.linef(color::kWhite, "Max: %lu FPS", static_cast<unsigned long>((total_us > 0U) ? 1000000UL / total_us : 0UL));
  left.gap();
  left.header("BUFFERS");
  left.linef(color::kWhite, "Swaps: %lu", static_cast<unsigned long>(data.buffer_swaps));
  left.linef((data.buffer_waits > 0U) ? color::kYellow : color::kWhite, "Waits: %lu",
             static_cast<unsigned long>(data.buffer_waits));
  left.linef(color::kWhite, "Render: buf%lu", static_cast<unsigned long>(data.render_index));
  left.linef(color::kWhite, "Flush:  buf%lu", static_cast<unsigned long>(data.flush_index));

  Column right(target, kCol2X, kFirstLineY);
  right.header("MEMORY");
  std::snprintf(text, sizeof(text), "Stack: %luK/%luK", static_cast<unsigned long>(data.memory.stack_used / 1024U),
                static_cast<unsigned long>(data.memory.stack_total / 1024U));
  right.line(text, color::kWhite);
  right.linef(color::kWhite, "(%lu%%)", static_cast<unsigned long>(data.memory.stackPercent()));
  right.linef(color::kWhite, "Static: %luK", static_cast<unsigned long>(data.memory.static_bytes / 1024U));
  right.linef(color::kWhite, "RAM: %luK total", static_cast<unsigned long>(data.memory.total_ram / 1024U));
  right.gap();
  right.header("SYSTEM");
  const bool clock_mismatch = data.expected_cpu_mhz != 0U && data.cpu_mhz != data.expected_cpu_mhz;
  right.linef(clock_mismatch ? color::kYellow : color::kWhite, "CPU: %lu MHz", static_cast<unsigned long>(data.cpu_mhz));
  right.linef(color::kWhite, "SPI: %lu MHz", static_cast<unsigned long>(data.spi_mhz));
  right.linef(color::kWhite, "FB: 2x%luK", static_cast<unsigned long>(data.memory.framebuffer_bytes / 2U / 1024U));
  right.gap();
  right.header("CPU UTIL");
  right.linef((data.util_percent > kUtilAttentionPercent) ? color::kYellow : color::kWhite, "Util: %lu%%",
              static_cast<unsigned long>(data.util_percent));
  right.linef(color::kWhite, "Cycles: %luK", static_cast<unsigned long>(data.cycles_per_frame / 1000U));

  drawFooter(target, "Press Y for Logs");
}

Color565 logLevelColor(runtime::log::LogLevel level) {
  switch (level) {
    case runtime::log::LogLevel::kTrace:
    case runtime::log::LogLevel::kDebug:
      return color::kGray;
    case runtime::log::LogLevel::kInfo:
      return color::kGreen;
    case runtime::log::LogLevel::kWarn:
      return color::kYellow;
    case runtime::log::LogLevel::kError:
      return color::kRed;
  }
  return color::kWhite;
}

bool drawLogsPage(gfx::DrawTarget& target, runtime::log::LogBuffer& log) {
  const int16_t ascent = gfx::textAscent(FontSize::kSmall);
  gfx::drawText(target, kCol1X, static_cast<int16_t>(kFirstLineY + ascent), "LOGS", color::kGreen, FontSize::kSmall);
  drawFooter(target, "Press Y for Dashboard");

  runtime::log::LogBuffer::Reader reader(log);
  if (!reader.locked()) {
    gfx::drawText(target, kCol1X, kLogEmptyY, "Log buffer busy...", color::kYellow, FontSize::kSmall);
    return false;
  }
  if (reader.size() == 0U) {
    gfx::drawText(target, kCol1X, kLogEmptyY, "No log entries", color::kGray, FontSize::kSmall);
    return true;
  }

  int16_t y = kLogFirstY;
  char prefix[16];
  for (size_t index = 0U; index < reader.size(); ++index) {
    if (y > kLogLastY) {
      break;
    }
    const runtime::log::LogEntry& entry = reader.at(index);
    std::snprintf(prefix, sizeof(prefix), "[%c] %05lu", runtime::log::LogBuffer::levelChar(entry.level),
                  static_cast<unsigned long>(entry.timestamp_ms % 100000UL));
    const int16_t baseline = static_cast<int16_t>(y + ascent);
    gfx::drawText(target, kCol1X, baseline, prefix, logLevelColor(entry.level), FontSize::kSmall);
    gfx::drawText(target, kLogMessageX, baseline, entry.message, color::kWhite, FontSize::kSmall);
    y = static_cast<int16_t>(y + kLineStep);
  }
  return true;
}

}  // namespace ui
}  // namespace obd_dash
