// st7789_protocol.h - ST7789 command sequences and DMA completion, independent of the SPI driver.
#pragma once

#include <cstdint>

#include "obd_dash/runtime/clock.h"

namespace obd_dash {
namespace drivers {
namespace display {

// Byte-level access to the panel controller.
class PanelBus {
 public:
  virtual ~PanelBus() = default;
  virtual void command(uint8_t cmd) = 0;
  virtual void data(uint8_t value) = 0;
  virtual void delayMs(uint32_t duration_ms) = 0;
};

// A pixel transfer that runs in the background once submitted.
class DmaPort {
 public:
  virtual ~DmaPort() = default;
  virtual bool busy() = 0;
  // Called between polls while the transfer runs.
  virtual void idle() = 0;
  // Blocks until the transfer has fully drained.
  virtual void drain() = 0;
};

namespace st7789 {

constexpr uint8_t kCmdSoftReset = 0x01U;
constexpr uint8_t kCmdSleepOut = 0x11U;
constexpr uint8_t kCmdNormalOn = 0x13U;
constexpr uint8_t kCmdInvertOn = 0x21U;
constexpr uint8_t kCmdDisplayOn = 0x29U;
constexpr uint8_t kCmdColumnSet = 0x2AU;
constexpr uint8_t kCmdRowSet = 0x2BU;
constexpr uint8_t kCmdMemoryWrite = 0x2CU;
constexpr uint8_t kCmdMemoryAccess = 0x36U;
constexpr uint8_t kCmdPixelFormat = 0x3AU;

constexpr uint8_t kPixelFormat16Bit = 0x55U;
// Row/column exchange for landscape, RGB order.
constexpr uint8_t kMadctlLandscape = 0x60U;

// Reset, 16-bit color, landscape, inversion, display on, then the full window.
void sendInit(PanelBus& bus, uint16_t width, uint16_t height);

void setWindow(PanelBus& bus, uint16_t x0, uint16_t y0, uint16_t x1, uint16_t y1);

// Re-arms the full-screen window before every memory write, so nothing
// that moved the window since the last frame can shear the image.
void beginFrame(PanelBus& bus, uint16_t width, uint16_t height);

// Polls until the transfer ends. On timeout the transfer is drained before
// returning false, so the caller never releases the bus under a live DMA.
bool awaitTransfer(DmaPort& port, const runtime::Clock& clock, uint32_t timeout_us);

}  // namespace st7789

}  // namespace display
}  // namespace drivers
}  // namespace obd_dash
