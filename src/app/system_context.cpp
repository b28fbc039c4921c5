#include "obd_dash/app/system_context.h"

namespace obd_dash {
namespace app {

namespace {

runtime::pipeline::PipelineStats g_pipeline_stats;

}  // namespace

SystemContext& systemContext() {
  static SystemContext context{runtime::systemClock(),
                               gfx::frameBuffers(),
                               runtime::log::logBuffer(),
                               runtime::perf::cycleCounter(),
                               runtime::perf::frameProfiler(),
                               sensors::sampleRegister(),
                               g_pipeline_stats};
  return context;
}

}  // namespace app
}  // namespace obd_dash
