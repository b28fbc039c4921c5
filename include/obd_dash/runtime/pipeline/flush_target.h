// flush_target.h - sink that streams a finished framebuffer to the panel.
#pragma once

#include <cstddef>
#include <cstdint>

namespace obd_dash {
namespace runtime {
namespace pipeline {

class FlushTarget {
 public:
  virtual ~FlushTarget() = default;

  // Sends one whole frame and returns once the transfer has completed.
  // False when the transfer could not be submitted.
  virtual bool flushFrame(const uint8_t* data, size_t bytes) = 0;
};

}  // namespace pipeline
}  // namespace runtime
}  // namespace obd_dash
