#include <unity.h>

#include <atomic>
#include <thread>

#include "obd_dash/runtime/log/log_buffer.h"
#include "obd_dash/runtime/rtos/critical_section.h"
#include "obd_dash/runtime/rtos/try_lock.h"
#include "obd_dash/sensors/sensor_samples.h"

namespace {

using obd_dash::runtime::log::LogBuffer;
using obd_dash::runtime::log::LogLevel;
using obd_dash::runtime::rtos::CriticalSection;
using obd_dash::runtime::rtos::ScopedCriticalSection;
using obd_dash::runtime::rtos::ScopedTryLock;
using obd_dash::runtime::rtos::TryLock;
using obd_dash::sensors::SampleRegister;
using obd_dash::sensors::SensorId;
using obd_dash::sensors::SensorSamples;
using obd_dash::sensors::kSensorCount;

constexpr uint32_t kPushesPerWriter = 5000U;

SensorSamples uniform(float value) {
  SensorSamples samples;
  for (uint8_t index = 0U; index < kSensorCount; ++index) {
    samples.values[index] = value;
  }
  return samples;
}

bool isUniform(const SensorSamples& samples) {
  for (uint8_t index = 1U; index < kSensorCount; ++index) {
    if (samples.values[index] != samples.values[0]) {
      return false;
    }
  }
  return true;
}

uint32_t pushMany(LogBuffer& log, uint32_t writer) {
  uint32_t accepted = 0U;
  for (uint32_t i = 0U; i < kPushesPerWriter; ++i) {
    if (log.pushf(LogLevel::kDebug, i, "w%lu %lu", static_cast<unsigned long>(writer), static_cast<unsigned long>(i))) {
      ++accepted;
    }
  }
  return accepted;
}

}  // namespace

void setUp() {}

void tearDown() {}

void test_critical_section_released_at_scope_exit() {
  CriticalSection section;
  TEST_ASSERT_FALSE(section.held());
  {
    ScopedCriticalSection guard(section);
    TEST_ASSERT_TRUE(section.held());
  }
  TEST_ASSERT_FALSE(section.held());
  // A second entry after release must not spin.
  {
    ScopedCriticalSection guard(section);
    TEST_ASSERT_TRUE(section.held());
  }
  TEST_ASSERT_FALSE(section.held());
}

void test_register_snapshot_never_torn() {
  SampleRegister samples;
  samples.publish(uniform(0.0f));
  std::atomic<bool> stop{false};
  std::thread writer([&samples, &stop]() {
    for (uint32_t i = 1U; i <= 20000U; ++i) {
      samples.publish(uniform(static_cast<float>(i)));
    }
    stop.store(true);
  });
  uint32_t torn = 0U;
  while (!stop.load()) {
    if (!isUniform(samples.snapshot())) {
      ++torn;
    }
  }
  writer.join();
  TEST_ASSERT_EQUAL_UINT32(0U, torn);
  TEST_ASSERT_EQUAL_FLOAT(20000.0f, samples.snapshot().get(SensorId::kEgt));
}

void test_register_publish_count_exact_across_writers() {
  SampleRegister samples;
  std::thread first([&samples]() {
    for (uint32_t i = 0U; i < 10000U; ++i) {
      samples.publishOne(SensorId::kBoost, 1.0f);
    }
  });
  std::thread second([&samples]() {
    for (uint32_t i = 0U; i < 10000U; ++i) {
      samples.publishOne(SensorId::kAfr, 14.7f);
    }
  });
  first.join();
  second.join();
  TEST_ASSERT_EQUAL_UINT32(20000U, samples.publishCount());
  TEST_ASSERT_EQUAL_FLOAT(1.0f, samples.snapshot().get(SensorId::kBoost));
  TEST_ASSERT_EQUAL_FLOAT(14.7f, samples.snapshot().get(SensorId::kAfr));
}

void test_try_lock_admits_one_thread() {
  TryLock lock;
  std::atomic<uint32_t> inside{0U};
  std::atomic<uint32_t> overlap{0U};
  auto worker = [&lock, &inside, &overlap]() {
    for (uint32_t i = 0U; i < 20000U; ++i) {
      ScopedTryLock guard(lock);
      if (!guard) {
        continue;
      }
      if (inside.fetch_add(1U) != 0U) {
        overlap.fetch_add(1U);
      }
      inside.fetch_sub(1U);
    }
  };
  std::thread first(worker);
  std::thread second(worker);
  first.join();
  second.join();
  TEST_ASSERT_EQUAL_UINT32(0U, overlap.load());
  ScopedTryLock after(lock);
  TEST_ASSERT_TRUE(after.isLocked());
}

void test_log_accounts_every_push_across_writers() {
  LogBuffer log;
  uint32_t accepted_a = 0U;
  uint32_t accepted_b = 0U;
  std::thread first([&log, &accepted_a]() { accepted_a = pushMany(log, 1U); });
  std::thread second([&log, &accepted_b]() { accepted_b = pushMany(log, 2U); });
  // Readers holding the ring make writers drop instead of wait.
  for (uint32_t i = 0U; i < 2000U; ++i) {
    LogBuffer::Reader reader(log);
    if (reader.locked() && reader.size() > 0U) {
      TEST_ASSERT_TRUE(reader.size() <= LogBuffer::kCapacity);
    }
  }
  first.join();
  second.join();

  const uint32_t accepted = accepted_a + accepted_b;
  TEST_ASSERT_EQUAL_UINT32(2U * kPushesPerWriter, accepted + log.droppedCount());
  const uint32_t expected_size =
      (accepted < LogBuffer::kCapacity) ? accepted : static_cast<uint32_t>(LogBuffer::kCapacity);
  TEST_ASSERT_EQUAL_UINT32(expected_size, static_cast<uint32_t>(log.size()));
}

int main() {
  UNITY_BEGIN();
  RUN_TEST(test_critical_section_released_at_scope_exit);
  RUN_TEST(test_register_snapshot_never_torn);
  RUN_TEST(test_register_publish_count_exact_across_writers);
  RUN_TEST(test_try_lock_admits_one_thread);
  RUN_TEST(test_log_accounts_every_push_across_writers);
  return UNITY_END();
}
