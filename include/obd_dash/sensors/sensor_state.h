// sensor_state.h - per-sensor history, trend, peak hold, average and graph ring.
#pragma once

#include <cstddef>
#include <cstdint>

#include "obd_dash/config/layout_config.h"

namespace obd_dash {
namespace sensors {

enum class Trend : uint8_t {
  kFlat = 0,
  kRising,
  kFalling,
};

// Which extremes raise the peak flag when beaten.
enum class ExtremeMode : uint8_t {
  kNone = 0,
  kMax,
  kMinMax,
};

class SensorState {
 public:
  static constexpr size_t kHistorySize = config::kTrendHistory;
  static constexpr size_t kAvgSize = config::kAvgRingSize;
  static constexpr size_t kGraphSize = config::kGraphRingSize;

  SensorState() = default;

  // Updates min/max and returns true when `sample` beats a tracked extreme.
  // The very first sample only seeds the extremes.
  bool trackExtremes(float sample, ExtremeMode mode);

  void update(float sample, bool extreme_updated, uint32_t now_ms);

  Trend trend() const;
  bool isPeak(uint32_t now_ms) const;
  bool average(float* out_average) const;

  bool hasExtremes() const { return has_extremes_; }
  float minValue() const { return min_; }
  float maxValue() const { return max_; }

  size_t historyLength() const { return history_count_; }
  size_t avgSampleCount() const { return avg_count_; }

  size_t graphCount() const { return graph_count_; }
  size_t graphStart() const { return (graph_count_ < kGraphSize) ? 0U : graph_index_; }
  // i-th graph sample, oldest first.
  float graphAt(size_t index) const;
  float graphMin() const { return graph_min_; }
  float graphMax() const { return graph_max_; }

  void resetAverage();
  void resetGraph();
  void resetPeak();
  // Clears graph and peak, re-seeds min/max/avg with `seed`. History is kept.
  void reset(float seed);

 private:
  void addAvgSample(float sample);
  void addGraphSample(float sample);
  void recomputeGraphRange();

  float history_[kHistorySize] = {};
  size_t history_index_ = 0U;
  size_t history_count_ = 0U;

  bool peak_armed_ = false;
  uint32_t peak_since_ms_ = 0U;

  float avg_ring_[kAvgSize] = {};
  size_t avg_index_ = 0U;
  size_t avg_count_ = 0U;
  float avg_sum_ = 0.0f;
  uint32_t avg_frames_ = 0U;

  float graph_[kGraphSize] = {};
  size_t graph_index_ = 0U;
  size_t graph_count_ = 0U;
  uint32_t graph_frames_ = 0U;
  float graph_min_ = 0.0f;
  float graph_max_ = 0.0f;

  bool has_extremes_ = false;
  float min_ = 0.0f;
  float max_ = 0.0f;
};

}  // namespace sensors
}  // namespace obd_dash
