#include "obd_dash/app/fps_counter.h"

#include "obd_dash/config/layout_config.h"

namespace obd_dash {
namespace app {

bool FpsCounter::frame(uint32_t now_ms) {
  if (!started_) {
    started_ = true;
    window_start_ms_ = now_ms;
    window_frames_ = 0U;
  }
  ++window_frames_;
  const uint32_t elapsed_ms = now_ms - window_start_ms_;
  if (elapsed_ms < config::kFpsWindowMs) {
    return false;
  }
  instant_ = static_cast<float>(window_frames_) * 1000.0f / static_cast<float>(elapsed_ms);
  average_sum_ += instant_;
  ++average_samples_;
  window_start_ms_ = now_ms;
  window_frames_ = 0U;
  return true;
}

float FpsCounter::average() const {
  if (average_samples_ == 0U) {
    return instant_;
  }
  return average_sum_ / static_cast<float>(average_samples_);
}

void FpsCounter::resetAverage() {
  average_sum_ = 0.0f;
  average_samples_ = 0U;
}

}  // namespace app
}  // namespace obd_dash
