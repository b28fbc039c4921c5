#include "obd_dash/drivers/display/st7789_protocol.h"

namespace obd_dash {
namespace drivers {
namespace display {
namespace st7789 {

namespace {

void sendRange(PanelBus& bus, uint8_t cmd, uint16_t first, uint16_t last) {
  bus.command(cmd);
  bus.data(static_cast<uint8_t>(first >> 8U));
  bus.data(static_cast<uint8_t>(first & 0xFFU));
  bus.data(static_cast<uint8_t>(last >> 8U));
  bus.data(static_cast<uint8_t>(last & 0xFFU));
}

}  // namespace

void setWindow(PanelBus& bus, uint16_t x0, uint16_t y0, uint16_t x1, uint16_t y1) {
  sendRange(bus, kCmdColumnSet, x0, x1);
  sendRange(bus, kCmdRowSet, y0, y1);
}

void sendInit(PanelBus& bus, uint16_t width, uint16_t height) {
  bus.command(kCmdSoftReset);
  bus.delayMs(150U);
  bus.command(kCmdSleepOut);
  bus.delayMs(10U);
  bus.command(kCmdPixelFormat);
  bus.data(kPixelFormat16Bit);
  bus.command(kCmdMemoryAccess);
  bus.data(kMadctlLandscape);
  bus.command(kCmdInvertOn);
  bus.delayMs(10U);
  bus.command(kCmdNormalOn);
  bus.delayMs(10U);
  bus.command(kCmdDisplayOn);
  bus.delayMs(10U);
  if (width == 0U || height == 0U) {
    return;
  }
  setWindow(bus, 0U, 0U, static_cast<uint16_t>(width - 1U), static_cast<uint16_t>(height - 1U));
}

void beginFrame(PanelBus& bus, uint16_t width, uint16_t height) {
  if (width != 0U && height != 0U) {
    setWindow(bus, 0U, 0U, static_cast<uint16_t>(width - 1U), static_cast<uint16_t>(height - 1U));
  }
  bus.command(kCmdMemoryWrite);
}

bool awaitTransfer(DmaPort& port, const runtime::Clock& clock, uint32_t timeout_us) {
  const uint32_t started_us = clock.nowUs();
  while (port.busy()) {
    if ((clock.nowUs() - started_us) >= timeout_us) {
      port.drain();
      return false;
    }
    port.idle();
  }
  return true;
}

}  // namespace st7789
}  // namespace display
}  // namespace drivers
}  // namespace obd_dash
