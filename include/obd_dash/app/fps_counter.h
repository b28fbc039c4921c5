// fps_counter.h - wall-clock frame rate over one second windows.
#pragma once

#include <cstdint>

namespace obd_dash {
namespace app {

class FpsCounter {
 public:
  // Counts one rendered frame. Returns true when a window closed and the
  // instant value was refreshed.
  bool frame(uint32_t now_ms);

  float instant() const { return instant_; }
  // Mean of the window values since the last reset.
  float average() const;
  void resetAverage();

 private:
  bool started_ = false;
  uint32_t window_start_ms_ = 0U;
  uint32_t window_frames_ = 0U;
  float instant_ = 0.0f;
  float average_sum_ = 0.0f;
  uint32_t average_samples_ = 0U;
};

}  // namespace app
}  // namespace obd_dash
