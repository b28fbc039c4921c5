#include "obd_dash/runtime/log/log_buffer.h"

#include <cstdarg>
#include <cstdio>

namespace obd_dash {
namespace runtime {
namespace log {

namespace {

constexpr size_t kFormatScratchBytes = 96U;

bool isContinuationByte(unsigned char byte) {
  return (byte & 0xC0U) == 0x80U;
}

}  // namespace

size_t LogBuffer::Reader::size() const {
  return locked() ? buffer_.count_.load(std::memory_order_relaxed) : 0U;
}

const LogEntry& LogBuffer::Reader::at(size_t index) const {
  const size_t start = (buffer_.count_.load(std::memory_order_relaxed) < kCapacity) ? 0U : buffer_.head_;
  return buffer_.entries_[(start + index) % kCapacity];
}

size_t LogBuffer::copyTruncatedUtf8(const char* src, char* dst, size_t dst_size) {
  if (dst == nullptr || dst_size == 0U) {
    return 0U;
  }
  if (src == nullptr) {
    dst[0] = '\0';
    return 0U;
  }
  size_t length = 0U;
  while (src[length] != '\0' && length < dst_size - 1U) {
    ++length;
  }
  // Step back to the start of a sequence cut in half.
  if (src[length] != '\0') {
    while (length > 0U && isContinuationByte(static_cast<unsigned char>(src[length]))) {
      --length;
    }
  }
  for (size_t index = 0U; index < length; ++index) {
    dst[index] = src[index];
  }
  dst[length] = '\0';
  return length;
}

char LogBuffer::levelChar(LogLevel level) {
  switch (level) {
    case LogLevel::kTrace:
      return 'T';
    case LogLevel::kDebug:
      return 'D';
    case LogLevel::kInfo:
      return 'I';
    case LogLevel::kWarn:
      return 'W';
    case LogLevel::kError:
      return 'E';
  }
  return '?';
}

bool LogBuffer::push(LogLevel level, uint32_t now_ms, const char* message) {
  LogEntry copy;
  {
    rtos::ScopedTryLock guard(lock_);
    if (!guard) {
      dropped_.fetch_add(1U, std::memory_order_relaxed);
      return false;
    }
    LogEntry& slot = entries_[head_];
    slot.level = level;
    slot.timestamp_ms = now_ms;
    copyTruncatedUtf8(message, slot.message, sizeof(slot.message));
    head_ = (head_ + 1U) % kCapacity;
    const uint32_t count = count_.load(std::memory_order_relaxed);
    if (count < kCapacity) {
      count_.store(count + 1U, std::memory_order_relaxed);
    }
    copy = slot;
  }
  if (mirror_ != nullptr) {
    mirror_(copy);
  }
  return true;
}

bool LogBuffer::pushf(LogLevel level, uint32_t now_ms, const char* format, ...) {
  if (format == nullptr) {
    return false;
  }
  char scratch[kFormatScratchBytes];
  va_list args;
  va_start(args, format);
  const int written = std::vsnprintf(scratch, sizeof(scratch), format, args);
  va_end(args);
  if (written < 0) {
    return false;
  }
  return push(level, now_ms, scratch);
}

void LogBuffer::clear() {
  rtos::ScopedTryLock guard(lock_);
  if (!guard) {
    return;
  }
  head_ = 0U;
  count_.store(0U, std::memory_order_relaxed);
}

LogBuffer& logBuffer() {
  static LogBuffer buffer;
  return buffer;
}

}  // namespace log
}  // namespace runtime
}  // namespace obd_dash
