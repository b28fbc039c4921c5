#include <unity.h>

#include "obd_dash/config/sensor_thresholds.h"
#include "obd_dash/gfx/color565.h"
#include "obd_dash/sensors/demo_signal_generator.h"
#include "obd_dash/ui/cell_palette.h"

namespace {

namespace config = obd_dash::config;
namespace color = obd_dash::gfx::color;
using obd_dash::sensors::SensorId;

}  // namespace

void setUp() {}

void tearDown() {}

void test_oil_buckets_inclusive_lower_bound() {
  TEST_ASSERT_EQUAL_HEX16(color::kBlack, obd_dash::ui::oilDsgBackground(config::kOilDsgElevated - 0.1f));
  TEST_ASSERT_EQUAL_HEX16(color::kYellow, obd_dash::ui::oilDsgBackground(config::kOilDsgElevated));
  TEST_ASSERT_EQUAL_HEX16(color::kOrange, obd_dash::ui::oilDsgBackground(config::kOilDsgHigh));
  TEST_ASSERT_EQUAL_HEX16(color::kRed, obd_dash::ui::oilDsgBackground(config::kOilDsgCritical));
}

void test_coolant_buckets() {
  TEST_ASSERT_EQUAL_HEX16(color::kOrange, obd_dash::ui::coolantBackground(60.0f));
  TEST_ASSERT_EQUAL_HEX16(color::kGreen, obd_dash::ui::coolantBackground(config::kCoolantColdMax));
  TEST_ASSERT_EQUAL_HEX16(color::kGreen, obd_dash::ui::coolantBackground(config::kCoolantCritical));
  TEST_ASSERT_EQUAL_HEX16(color::kRed, obd_dash::ui::coolantBackground(config::kCoolantCritical + 1.0f));
  TEST_ASSERT_TRUE(obd_dash::ui::isCritical(SensorId::kCoolant, config::kCoolantCritical + 1.0f));
  TEST_ASSERT_FALSE(obd_dash::ui::isCritical(SensorId::kCoolant, config::kCoolantCritical));
}

void test_iat_and_egt_buckets() {
  TEST_ASSERT_EQUAL_HEX16(color::kBlue, obd_dash::ui::iatBackground(-5.0f));
  TEST_ASSERT_EQUAL_HEX16(color::kGreen, obd_dash::ui::iatBackground(10.0f));
  TEST_ASSERT_EQUAL_HEX16(color::kYellow, obd_dash::ui::iatBackground(30.0f));
  TEST_ASSERT_EQUAL_HEX16(color::kOrange, obd_dash::ui::iatBackground(50.0f));
  TEST_ASSERT_EQUAL_HEX16(color::kRed, obd_dash::ui::iatBackground(60.0f));
  TEST_ASSERT_TRUE(obd_dash::ui::isCritical(SensorId::kIat, -25.0f));

  TEST_ASSERT_EQUAL_HEX16(color::kBlue, obd_dash::ui::egtBackground(200.0f));
  TEST_ASSERT_EQUAL_HEX16(color::kGreen, obd_dash::ui::egtBackground(300.0f));
  TEST_ASSERT_EQUAL_HEX16(color::kYellow, obd_dash::ui::egtBackground(600.0f));
  TEST_ASSERT_EQUAL_HEX16(color::kOrange, obd_dash::ui::egtBackground(800.0f));
  TEST_ASSERT_EQUAL_HEX16(color::kRed, obd_dash::ui::egtBackground(850.0f));
  TEST_ASSERT_FALSE(obd_dash::ui::isEgtDanger(1099.0f));
  TEST_ASSERT_TRUE(obd_dash::ui::isEgtDanger(1100.0f));
}

void test_battery_and_afr() {
  TEST_ASSERT_EQUAL_HEX16(color::kRed, obd_dash::ui::batteryBackground(11.9f));
  TEST_ASSERT_EQUAL_HEX16(color::kOrange, obd_dash::ui::batteryBackground(12.2f));
  TEST_ASSERT_EQUAL_HEX16(color::kBlack, obd_dash::ui::batteryBackground(13.8f));

  TEST_ASSERT_EQUAL_STRING("RICH AF", obd_dash::ui::afrStatus(11.0f));
  TEST_ASSERT_EQUAL_STRING("RICH", obd_dash::ui::afrStatus(13.0f));
  TEST_ASSERT_EQUAL_STRING("OPTIMAL", obd_dash::ui::afrStatus(config::kAfrStoich));
  TEST_ASSERT_EQUAL_STRING("LEAN", obd_dash::ui::afrStatus(15.5f));
  TEST_ASSERT_EQUAL_STRING("LEAN AF", obd_dash::ui::afrStatus(16.0f));
  TEST_ASSERT_EQUAL_HEX16(color::kGreen, obd_dash::ui::cellBackground(SensorId::kAfr, 14.7f));
  TEST_ASSERT_TRUE(obd_dash::ui::isCritical(SensorId::kAfr, 16.0f));
  TEST_ASSERT_EQUAL_HEX16(color::kBlack, obd_dash::ui::cellBackground(SensorId::kBoost, 2.0f));
}

void test_boost_easter_egg_threshold_per_unit() {
  TEST_ASSERT_FALSE(obd_dash::ui::isBoostEasterEgg(1.94f, false));
  TEST_ASSERT_TRUE(obd_dash::ui::isBoostEasterEgg(1.95f, false));
  TEST_ASSERT_FALSE(obd_dash::ui::isBoostEasterEgg(1.99f, true));
  TEST_ASSERT_TRUE(obd_dash::ui::isBoostEasterEgg(2.0f, true));
}

void test_oil_low_warning() {
  TEST_ASSERT_TRUE(obd_dash::ui::isOilLow(60.0f));
  TEST_ASSERT_FALSE(obd_dash::ui::isOilLow(config::kOilLowTemp));
}

void test_demo_signals_stay_in_range() {
  obd_dash::sensors::DemoSignalGenerator generator;
  bool reached_top = false;
  for (uint32_t now = 0U; now < 60000U; now += 20U) {
    const obd_dash::sensors::SensorSamples samples = generator.sample(now);
    const float boost = samples.get(SensorId::kBoost);
    TEST_ASSERT_TRUE(boost >= -0.001f && boost <= 2.01f);
    reached_top = reached_top || obd_dash::ui::isBoostEasterEgg(boost, false);
    TEST_ASSERT_TRUE(samples.get(SensorId::kBattery) >= 10.0f);
    TEST_ASSERT_TRUE(samples.get(SensorId::kEgt) < config::kEgtDangerManifold);
  }
  TEST_ASSERT_TRUE(reached_top);
  TEST_ASSERT_TRUE(generator.boostCycles() > 0U);
}

int main() {
  UNITY_BEGIN();
  RUN_TEST(test_oil_buckets_inclusive_lower_bound);
  RUN_TEST(test_coolant_buckets);
  RUN_TEST(test_iat_and_egt_buckets);
  RUN_TEST(test_battery_and_afr);
  RUN_TEST(test_boost_easter_egg_threshold_per_unit);
  RUN_TEST(test_oil_low_warning);
  RUN_TEST(test_demo_signals_stay_in_range);
  return UNITY_END();
}
