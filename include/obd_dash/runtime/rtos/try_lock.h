// try_lock.h - non-blocking lock for paths that must never stall.
#pragma once

#if defined(ARDUINO_ARCH_ESP32)
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#else
#include <atomic>
#endif

namespace obd_dash {
namespace runtime {
namespace rtos {

/**
 * Mutex that is only ever taken with a zero timeout.
 * Host builds use an atomic busy flag so threaded tests see the same contract.
 */
class TryLock {
 public:
  TryLock();
  ~TryLock();

  TryLock(const TryLock&) = delete;
  TryLock& operator=(const TryLock&) = delete;

  bool tryAcquire();
  void release();

 private:
#if defined(ARDUINO_ARCH_ESP32)
  SemaphoreHandle_t handle_;
#else
  std::atomic<bool> busy_;
#endif
};

/**
 * RAII guard over TryLock. Check it before touching the guarded data.
 */
class ScopedTryLock {
 public:
  explicit ScopedTryLock(TryLock& lock) : lock_(lock), locked_(lock.tryAcquire()) {}

  ~ScopedTryLock() {
    if (locked_) {
      lock_.release();
    }
  }

  ScopedTryLock(const ScopedTryLock&) = delete;
  ScopedTryLock& operator=(const ScopedTryLock&) = delete;
  ScopedTryLock(ScopedTryLock&&) = delete;
  ScopedTryLock& operator=(ScopedTryLock&&) = delete;

  explicit operator bool() const { return locked_; }
  bool isLocked() const { return locked_; }

 private:
  TryLock& lock_;
  bool locked_;
};

#if defined(ARDUINO_ARCH_ESP32)
inline TryLock::TryLock() : handle_(xSemaphoreCreateMutex()) {}

inline TryLock::~TryLock() {
  if (handle_ != nullptr) {
    vSemaphoreDelete(handle_);
  }
}

inline bool TryLock::tryAcquire() {
  return handle_ != nullptr && xSemaphoreTake(handle_, 0) == pdTRUE;
}

inline void TryLock::release() {
  if (handle_ != nullptr) {
    xSemaphoreGive(handle_);
  }
}
#else
inline TryLock::TryLock() : busy_(false) {}

inline TryLock::~TryLock() = default;

inline bool TryLock::tryAcquire() {
  return !busy_.exchange(true, std::memory_order_acquire);
}

inline void TryLock::release() {
  busy_.store(false, std::memory_order_release);
}
#endif

}  // namespace rtos
}  // namespace runtime
}  // namespace obd_dash
