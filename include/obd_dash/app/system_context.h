// system_context.h - process-wide services shared by the renderer and flusher.
#pragma once

#include "obd_dash/gfx/frame_buffer.h"
#include "obd_dash/runtime/clock.h"
#include "obd_dash/runtime/log/log_buffer.h"
#include "obd_dash/runtime/perf/cpu_cycles.h"
#include "obd_dash/runtime/perf/frame_profiler.h"
#include "obd_dash/runtime/pipeline/frame_pipeline.h"
#include "obd_dash/sensors/sensor_samples.h"

namespace obd_dash {
namespace app {

struct SystemContext {
  runtime::Clock& clock;
  gfx::DoubleBuffer& buffers;
  runtime::log::LogBuffer& log;
  runtime::perf::CycleCounter& cycles;
  runtime::perf::FrameProfiler& profiler;
  sensors::SampleRegister& samples;
  runtime::pipeline::PipelineStats& pipeline_stats;
};

// The board's singletons wired together.
SystemContext& systemContext();

}  // namespace app
}  // namespace obd_dash
