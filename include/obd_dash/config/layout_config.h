// layout_config.h - compile-time layout, timing and engine constants.
#pragma once

#include <cstddef>
#include <cstdint>

namespace obd_dash {
namespace config {

// Panel geometry (landscape).
constexpr int16_t kScreenWidth = 320;
constexpr int16_t kScreenHeight = 240;
constexpr size_t kFrameBufferBytes =
    static_cast<size_t>(kScreenWidth) * static_cast<size_t>(kScreenHeight) * 2U;
static_assert(kFrameBufferBytes % 4U == 0U, "framebuffer must be word aligned");

// Dashboard grid: header bar then 4 columns x 2 rows.
constexpr int16_t kHeaderHeight = 26;
constexpr int16_t kGridColumns = 4;
constexpr int16_t kGridRows = 2;
constexpr int16_t kColWidth = kScreenWidth / kGridColumns;
constexpr int16_t kRowHeight = (kScreenHeight - kHeaderHeight) / kGridRows;
constexpr int16_t kRowSplitY = kHeaderHeight + kRowHeight;
constexpr int16_t kCenterX = kScreenWidth / 2;
constexpr int16_t kCenterY = kScreenHeight / 2;
constexpr int16_t kCellInset = 2;
static_assert(kHeaderHeight + kRowHeight * kGridRows <= kScreenHeight, "grid overflows panel");

// Sensor engine.
constexpr size_t kTrendHistory = 50U;
constexpr size_t kTrendWindow = 10U;
constexpr size_t kTrendMinSamples = 2U * kTrendWindow;
constexpr float kTrendEpsilon = 0.5f;
constexpr size_t kAvgRingSize = 60U;
constexpr uint32_t kAvgStrideFrames = 250U;
constexpr size_t kGraphRingSize = 60U;
constexpr uint32_t kGraphStrideFrames = 100U;
constexpr uint32_t kPeakHoldMs = 500U;
constexpr float kGraphFlatEpsilon = 0.1f;
static_assert(kTrendMinSamples <= kTrendHistory, "trend window exceeds history");

// Animation.
constexpr uint8_t kColorStep = 2U;
constexpr uint32_t kBlinkHalfPeriodFrames = 6U;
constexpr float kShakeAmplitudePx = 2.0f;
constexpr float kShakeOmega = 0.5f;

// Timing.
#ifdef OBD_DASH_DEBOUNCE_MS
constexpr uint32_t kDebounceMs = OBD_DASH_DEBOUNCE_MS;
#else
constexpr uint32_t kDebounceMs = 50U;
#endif
constexpr uint32_t kPopupTtlMs = 3000U;
#ifdef OBD_DASH_FRAME_PERIOD_MS
constexpr uint32_t kFramePeriodMs = OBD_DASH_FRAME_PERIOD_MS;
#else
constexpr uint32_t kFramePeriodMs = 20U;
#endif
constexpr uint32_t kFpsWindowMs = 1000U;
constexpr uint32_t kProfileLogPeriodMs = 2000U;
constexpr uint8_t kClearFramesOnTransition = 2U;

// Log ring.
constexpr size_t kLogCapacity = 14U;
constexpr size_t kLogMessageLen = 40U;  // includes terminator

// CPU / memory budget of the target board.
#ifdef OBD_DASH_CPU_FREQ_HZ
constexpr uint32_t kCpuFreqHz = OBD_DASH_CPU_FREQ_HZ;
#else
constexpr uint32_t kCpuFreqHz = 240000000UL;
#endif
constexpr uint32_t kCpuFreqMinHz = 100000000UL;
constexpr uint32_t kCpuFreqMaxHz = 500000000UL;
constexpr uint32_t kCpuFreqDefaultHz = 150000000UL;
constexpr uint32_t kCycleSanityMax = 200000000UL;
constexpr uint32_t kTotalRamBytes = 512U * 1024U;
constexpr uint32_t kStaticReserveBytes = 32U * 1024U;

// Board wiring.
#ifdef OBD_DASH_PIN_BTN_A
constexpr int kPinButtonA = OBD_DASH_PIN_BTN_A;
#else
constexpr int kPinButtonA = 12;
#endif
#ifdef OBD_DASH_PIN_BTN_B
constexpr int kPinButtonB = OBD_DASH_PIN_BTN_B;
#else
constexpr int kPinButtonB = 13;
#endif
#ifdef OBD_DASH_PIN_BTN_X
constexpr int kPinButtonX = OBD_DASH_PIN_BTN_X;
#else
constexpr int kPinButtonX = 14;
#endif
#ifdef OBD_DASH_PIN_BTN_Y
constexpr int kPinButtonY = OBD_DASH_PIN_BTN_Y;
#else
constexpr int kPinButtonY = 15;
#endif
#ifdef OBD_DASH_PIN_STATUS_LED
constexpr int kPinStatusLed = OBD_DASH_PIN_STATUS_LED;
#else
constexpr int kPinStatusLed = 2;
#endif
#ifdef OBD_DASH_SPI_HZ
constexpr uint32_t kSpiHz = OBD_DASH_SPI_HZ;
#else
constexpr uint32_t kSpiHz = 62500000UL;
#endif

#ifdef OBD_DASH_DEMO_SIGNALS
constexpr bool kDemoSignals = (OBD_DASH_DEMO_SIGNALS != 0);
#else
constexpr bool kDemoSignals = true;
#endif

}  // namespace config
}  // namespace obd_dash
