#include "obd_dash/drivers/display/st7789_display.h"

#include <Arduino.h>

#include "obd_dash/config/layout_config.h"

namespace obd_dash {
namespace drivers {
namespace display {

namespace {

constexpr uint32_t kDmaTimeoutUs = 50000U;

}  // namespace

void St7789Display::TftBus::command(uint8_t cmd) {
  tft_.writecommand(cmd);
}

void St7789Display::TftBus::data(uint8_t value) {
  tft_.writedata(value);
}

void St7789Display::TftBus::delayMs(uint32_t duration_ms) {
  delay(duration_ms);
}

bool St7789Display::TftDma::busy() {
  return tft_.dmaBusy();
}

void St7789Display::TftDma::idle() {
  yield();
}

void St7789Display::TftDma::drain() {
  tft_.dmaWait();
}

St7789Display::St7789Display()
    : tft_(config::kScreenHeight, config::kScreenWidth), bus_(tft_), dma_(tft_) {}

bool St7789Display::begin() {
  tft_.init();
  st7789::sendInit(bus_, static_cast<uint16_t>(config::kScreenWidth), static_cast<uint16_t>(config::kScreenHeight));
  // Frame buffers already hold big-endian pixels.
  tft_.setSwapBytes(false);
  dma_ready_ = tft_.initDMA();
  ready_ = true;
  Serial.printf("[DISPLAY] st7789 %dx%d dma=%u spi_hz=%lu\n",
                static_cast<int>(config::kScreenWidth),
                static_cast<int>(config::kScreenHeight),
                dma_ready_ ? 1U : 0U,
                static_cast<unsigned long>(config::kSpiHz));
  return dma_ready_;
}

bool St7789Display::flushFrame(const uint8_t* data, size_t size_bytes) {
  if (!ready_ || data == nullptr || size_bytes < 2U) {
    return false;
  }
  uint16_t* pixels = reinterpret_cast<uint16_t*>(const_cast<uint8_t*>(data));
  const uint32_t pixel_count = static_cast<uint32_t>(size_bytes / 2U);

  // Chip select stays low from the window setup to the end of the burst.
  tft_.startWrite();
  st7789::beginFrame(bus_, static_cast<uint16_t>(config::kScreenWidth), static_cast<uint16_t>(config::kScreenHeight));
  bool ok = true;
  if (dma_ready_) {
    tft_.pushPixelsDMA(pixels, pixel_count);
    ok = st7789::awaitTransfer(dma_, runtime::systemClock(), kDmaTimeoutUs);
  } else {
    tft_.pushPixels(pixels, pixel_count);
  }
  tft_.endWrite();
  if (!ok) {
    ++dma_overruns_;
    Serial.printf("[DISPLAY] dma overran %lu us (count=%lu)\n",
                  static_cast<unsigned long>(kDmaTimeoutUs),
                  static_cast<unsigned long>(dma_overruns_));
  }
  return ok;
}

}  // namespace display
}  // namespace drivers
}  // namespace obd_dash
