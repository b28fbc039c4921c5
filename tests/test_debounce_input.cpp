#include <unity.h>

#include "obd_dash/config/layout_config.h"
#include "obd_dash/input/button_debouncer.h"
#include "obd_dash/input/input_mapper.h"

namespace {

namespace config = obd_dash::config;
using obd_dash::input::ButtonDebouncer;
using obd_dash::input::ButtonLevels;
using obd_dash::input::InputActions;
using obd_dash::input::InputMapper;
using obd_dash::ui::Page;

ButtonLevels onlyX() {
  ButtonLevels levels;
  levels.x_low = true;
  return levels;
}

ButtonLevels allPressed() {
  ButtonLevels levels;
  levels.a_low = true;
  levels.b_low = true;
  levels.x_low = true;
  levels.y_low = true;
  return levels;
}

}  // namespace

void setUp() {}

void tearDown() {}

void test_press_edge_reported_once_through_bounces() {
  const uint32_t t = 1000U;
  ButtonDebouncer button;
  uint32_t presses = 0U;
  // Contact bounce: level toggles every 3 ms for the whole window.
  for (uint32_t dt = 0U; dt < config::kDebounceMs; dt += 3U) {
    const bool low = ((dt / 3U) % 2U) == 0U;
    if (button.justPressed(low, t + dt)) {
      ++presses;
    }
  }
  TEST_ASSERT_EQUAL_UINT32(1U, presses);
}

void test_first_press_accepted_immediately() {
  ButtonDebouncer button;
  TEST_ASSERT_TRUE(button.justPressed(true, 0U));
  TEST_ASSERT_TRUE(button.pressed());
}

void test_held_button_does_not_repeat() {
  ButtonDebouncer button;
  TEST_ASSERT_TRUE(button.justPressed(true, 100U));
  for (uint32_t t = 120U; t < 5000U; t += 20U) {
    TEST_ASSERT_FALSE(button.justPressed(true, t));
  }
}

void test_release_then_press_after_window() {
  ButtonDebouncer button;
  TEST_ASSERT_TRUE(button.justPressed(true, 0U));
  TEST_ASSERT_FALSE(button.justPressed(false, config::kDebounceMs));
  TEST_ASSERT_FALSE(button.pressed());
  TEST_ASSERT_FALSE(button.justPressed(true, config::kDebounceMs + 10U));
  TEST_ASSERT_TRUE(button.justPressed(true, 2U * config::kDebounceMs));
}

void test_dashboard_maps_all_buttons() {
  InputMapper mapper;
  const InputActions actions = mapper.poll(allPressed(), 0U, Page::kDashboard);
  TEST_ASSERT_TRUE(actions.cycle_fps_mode);
  TEST_ASSERT_TRUE(actions.cycle_page);
  TEST_ASSERT_TRUE(actions.toggle_boost_unit);
  TEST_ASSERT_TRUE(actions.request_reset);
}

void test_other_pages_only_cycle_page() {
  InputMapper mapper;
  const InputActions actions = mapper.poll(allPressed(), 0U, Page::kDebug);
  TEST_ASSERT_FALSE(actions.cycle_fps_mode);
  TEST_ASSERT_TRUE(actions.cycle_page);
  TEST_ASSERT_FALSE(actions.toggle_boost_unit);
  TEST_ASSERT_FALSE(actions.request_reset);
}

void test_key_repeat_ignored() {
  InputMapper mapper;
  uint32_t fps_cycles = 0U;
  for (uint32_t t = 0U; t < 2000U; t += 20U) {
    if (mapper.poll(onlyX(), t, Page::kDashboard).cycle_fps_mode) {
      ++fps_cycles;
    }
  }
  TEST_ASSERT_EQUAL_UINT32(1U, fps_cycles);
  TEST_ASSERT_FALSE(mapper.poll(ButtonLevels(), 2000U, Page::kDashboard).any());
  TEST_ASSERT_TRUE(mapper.poll(onlyX(), 2100U, Page::kDashboard).cycle_fps_mode);
}

int main() {
  UNITY_BEGIN();
  RUN_TEST(test_press_edge_reported_once_through_bounces);
  RUN_TEST(test_first_press_accepted_immediately);
  RUN_TEST(test_held_button_does_not_repeat);
  RUN_TEST(test_release_then_press_after_window);
  RUN_TEST(test_dashboard_maps_all_buttons);
  RUN_TEST(test_other_pages_only_cycle_page);
  RUN_TEST(test_key_repeat_ignored);
  return UNITY_END();
}
