// log_buffer.h - fixed ring of on-screen log entries.
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

#include "obd_dash/config/layout_config.h"
#include "obd_dash/runtime/rtos/try_lock.h"

namespace obd_dash {
namespace runtime {
namespace log {

enum class LogLevel : uint8_t {
  kTrace = 0,
  kDebug,
  kInfo,
  kWarn,
  kError,
};

struct LogEntry {
  LogLevel level = LogLevel::kInfo;
  uint32_t timestamp_ms = 0U;
  char message[config::kLogMessageLen] = {};
};

// Oldest entries are overwritten once full. Writers never wait: a push
// that finds the ring busy is dropped and counted.
class LogBuffer {
 public:
  using MirrorFn = void (*)(const LogEntry& entry);

  static constexpr size_t kCapacity = config::kLogCapacity;
  static constexpr size_t kMaxMessageBytes = config::kLogMessageLen - 1U;

  // Locked view for readers, oldest entry first.
  class Reader {
   public:
    explicit Reader(LogBuffer& buffer) : buffer_(buffer), guard_(buffer.lock_) {}

    bool locked() const { return guard_.isLocked(); }
    size_t size() const;
    const LogEntry& at(size_t index) const;

   private:
    LogBuffer& buffer_;
    rtos::ScopedTryLock guard_;
  };

  bool push(LogLevel level, uint32_t now_ms, const char* message);
  bool pushf(LogLevel level, uint32_t now_ms, const char* format, ...)
#if defined(__GNUC__)
      __attribute__((format(printf, 4, 5)))
#endif
      ;

  // Called after each accepted push, outside the lock.
  void setMirror(MirrorFn mirror) { mirror_ = mirror; }

  size_t size() const { return count_.load(std::memory_order_relaxed); }
  uint32_t droppedCount() const { return dropped_.load(std::memory_order_relaxed); }
  void clear();

  // Copies at most dst_size-1 bytes without splitting a UTF-8 sequence.
  static size_t copyTruncatedUtf8(const char* src, char* dst, size_t dst_size);
  static char levelChar(LogLevel level);

 private:
  LogEntry entries_[kCapacity] = {};
  size_t head_ = 0U;
  // Atomic so size() and droppedCount() can be read without the lock.
  std::atomic<uint32_t> count_{0U};
  std::atomic<uint32_t> dropped_{0U};
  MirrorFn mirror_ = nullptr;
  rtos::TryLock lock_;
};

LogBuffer& logBuffer();

}  // namespace log
}  // namespace runtime
}  // namespace obd_dash
