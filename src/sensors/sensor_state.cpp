#include "obd_dash/sensors/sensor_state.h"

#include <cmath>

namespace obd_dash {
namespace sensors {

bool SensorState::trackExtremes(float sample, ExtremeMode mode) {
  if (!has_extremes_) {
    min_ = sample;
    max_ = sample;
    has_extremes_ = true;
    return false;
  }
  bool beaten = false;
  if (sample > max_) {
    max_ = sample;
    beaten = (mode != ExtremeMode::kNone);
  }
  if (sample < min_) {
    min_ = sample;
    beaten = beaten || (mode == ExtremeMode::kMinMax);
  }
  return beaten;
}

void SensorState::update(float sample, bool extreme_updated, uint32_t now_ms) {
  history_[history_index_] = sample;
  history_index_ = (history_index_ + 1U) % kHistorySize;
  if (history_count_ < kHistorySize) {
    ++history_count_;
  }

  ++avg_frames_;
  if (avg_frames_ >= config::kAvgStrideFrames) {
    avg_frames_ = 0U;
    addAvgSample(sample);
  }

  if (extreme_updated) {
    peak_armed_ = true;
    peak_since_ms_ = now_ms;
  }

  ++graph_frames_;
  if (graph_frames_ >= config::kGraphStrideFrames) {
    graph_frames_ = 0U;
    addGraphSample(sample);
  }
}

void SensorState::addAvgSample(float sample) {
  if (avg_count_ >= kAvgSize) {
    avg_sum_ -= avg_ring_[avg_index_];
  } else {
    ++avg_count_;
  }
  avg_ring_[avg_index_] = sample;
  avg_sum_ += sample;
  avg_index_ = (avg_index_ + 1U) % kAvgSize;
}

void SensorState::addGraphSample(float sample) {
  graph_[(graphStart() + graph_count_) % kGraphSize] = sample;
  graph_index_ = (graph_index_ + 1U) % kGraphSize;
  if (graph_count_ < kGraphSize) {
    ++graph_count_;
  }
  recomputeGraphRange();
}

void SensorState::recomputeGraphRange() {
  if (graph_count_ == 0U) {
    graph_min_ = 0.0f;
    graph_max_ = 0.0f;
    return;
  }
  float lo = graph_[0];
  float hi = graph_[0];
  for (size_t index = 1U; index < graph_count_; ++index) {
    if (graph_[index] < lo) {
      lo = graph_[index];
    }
    if (graph_[index] > hi) {
      hi = graph_[index];
    }
  }
  graph_min_ = lo;
  graph_max_ = hi;
}

float SensorState::graphAt(size_t index) const {
  if (index >= graph_count_) {
    return 0.0f;
  }
  return graph_[(graphStart() + index) % kGraphSize];
}

Trend SensorState::trend() const {
  if (history_count_ < config::kTrendMinSamples) {
    return Trend::kFlat;
  }
  const size_t window = config::kTrendWindow;
  float recent_sum = 0.0f;
  for (size_t i = 0U; i < window; ++i) {
    recent_sum += history_[(history_index_ + kHistorySize - 1U - i) % kHistorySize];
  }
  const size_t oldest = (history_count_ < kHistorySize) ? 0U : history_index_;
  float older_sum = 0.0f;
  for (size_t i = 0U; i < window; ++i) {
    older_sum += history_[(oldest + i) % kHistorySize];
  }
  const float diff = (recent_sum - older_sum) / static_cast<float>(window);
  if (std::fabs(diff) < config::kTrendEpsilon) {
    return Trend::kFlat;
  }
  return (diff > 0.0f) ? Trend::kRising : Trend::kFalling;
}

bool SensorState::isPeak(uint32_t now_ms) const {
  return peak_armed_ && static_cast<uint32_t>(now_ms - peak_since_ms_) < config::kPeakHoldMs;
}

bool SensorState::average(float* out_average) const {
  if (out_average == nullptr || avg_count_ == 0U) {
    return false;
  }
  *out_average = avg_sum_ / static_cast<float>(avg_count_);
  return true;
}

void SensorState::resetAverage() {
  for (float& slot : avg_ring_) {
    slot = 0.0f;
  }
  avg_index_ = 0U;
  avg_count_ = 0U;
  avg_sum_ = 0.0f;
  avg_frames_ = 0U;
}

void SensorState::resetGraph() {
  for (float& slot : graph_) {
    slot = 0.0f;
  }
  graph_index_ = 0U;
  graph_count_ = 0U;
  graph_frames_ = 0U;
  recomputeGraphRange();
}

void SensorState::resetPeak() {
  peak_armed_ = false;
  peak_since_ms_ = 0U;
}

void SensorState::reset(float seed) {
  resetGraph();
  resetPeak();
  resetAverage();
  addAvgSample(seed);
  min_ = seed;
  max_ = seed;
  has_extremes_ = true;
}

}  // namespace sensors
}  // namespace obd_dash
