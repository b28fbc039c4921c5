// st7789_display.h - ST7789 panel behind TFT_eSPI, flushed with one DMA burst per frame.
#pragma once

#include <TFT_eSPI.h>

#include <cstddef>
#include <cstdint>

#include "obd_dash/drivers/display/st7789_protocol.h"
#include "obd_dash/runtime/pipeline/flush_target.h"

namespace obd_dash {
namespace drivers {
namespace display {

class St7789Display final : public runtime::pipeline::FlushTarget {
 public:
  St7789Display();

  bool begin();
  bool flushFrame(const uint8_t* data, size_t size_bytes) override;
  bool ready() const { return ready_; }

 private:
  class TftBus final : public PanelBus {
   public:
    explicit TftBus(TFT_eSPI& tft) : tft_(tft) {}
    void command(uint8_t cmd) override;
    void data(uint8_t value) override;
    void delayMs(uint32_t duration_ms) override;

   private:
    TFT_eSPI& tft_;
  };

  class TftDma final : public DmaPort {
   public:
    explicit TftDma(TFT_eSPI& tft) : tft_(tft) {}
    bool busy() override;
    void idle() override;
    void drain() override;

   private:
    TFT_eSPI& tft_;
  };

  TFT_eSPI tft_;
  TftBus bus_;
  TftDma dma_;
  bool ready_ = false;
  bool dma_ready_ = false;
  uint32_t dma_overruns_ = 0U;
};

}  // namespace display
}  // namespace drivers
}  // namespace obd_dash
