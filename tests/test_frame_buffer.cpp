#include <unity.h>

#include <cstring>

#include "obd_dash/gfx/fonts.h"
#include "obd_dash/gfx/frame_buffer.h"
#include "obd_dash/gfx/text.h"

namespace {

using obd_dash::gfx::Color565;
using obd_dash::gfx::DoubleBuffer;
using obd_dash::gfx::FrameBufferTarget;
using obd_dash::gfx::Rect;
namespace color = obd_dash::gfx::color;

constexpr int16_t kW = 17;
constexpr int16_t kH = 9;
constexpr Color565 kBackdrop = 0x1234U;

alignas(4) uint8_t g_small[kW * kH * 2 + 2];
alignas(4) uint8_t g_a[kW * kH * 2 + 2];
alignas(4) uint8_t g_b[kW * kH * 2 + 2];

constexpr int16_t kTextW = 64;
constexpr int16_t kTextH = 32;
alignas(4) uint8_t g_text[kTextW * kTextH * 2];

bool inside(const Rect& r, int16_t x, int16_t y) {
  return x >= r.x && y >= r.y && x < r.x + r.w && y < r.y + r.h;
}

void checkFill(const Rect& rect, Color565 fill) {
  FrameBufferTarget target(g_small, kW, kH);
  target.clear(kBackdrop);
  target.fillSolid(rect, fill);
  for (int16_t y = 0; y < kH; ++y) {
    for (int16_t x = 0; x < kW; ++x) {
      const Color565 expected = inside(rect, x, y) ? fill : kBackdrop;
      TEST_ASSERT_EQUAL_HEX16(expected, target.pixelAt(x, y));
    }
  }
}

}  // namespace

void setUp() {
  std::memset(g_small, 0, sizeof(g_small));
}

void tearDown() {}

void test_clear_fills_every_pixel_big_endian() {
  FrameBufferTarget target(g_small, kW, kH);
  target.clear(0xF81FU);
  TEST_ASSERT_EQUAL_HEX8(0xF8U, g_small[0]);
  TEST_ASSERT_EQUAL_HEX8(0x1FU, g_small[1]);
  TEST_ASSERT_EQUAL_HEX16(0xF81FU, target.pixelAt(kW - 1, kH - 1));
  TEST_ASSERT_EQUAL_HEX16(0xF81FU, target.pixelAt(3, 4));
}

void test_fill_solid_even_and_odd_edges() {
  checkFill(Rect{0, 0, 4, 2}, color::kRed);
  checkFill(Rect{1, 1, 4, 3}, color::kGreen);
  checkFill(Rect{3, 2, 5, 4}, color::kBlue);
  checkFill(Rect{2, 0, 1, kH}, color::kWhite);
}

void test_fill_solid_clips_to_bounds() {
  checkFill(Rect{-3, -2, 6, 5}, color::kYellow);
  checkFill(Rect{kW - 2, kH - 3, 10, 10}, color::kOrange);
  checkFill(Rect{-5, -5, kW + 10, kH + 10}, color::kPink);
}

void test_fill_solid_outside_or_empty_is_noop() {
  FrameBufferTarget target(g_small, kW, kH);
  target.clear(kBackdrop);
  target.fillSolid(Rect{kW, 0, 4, 4}, color::kRed);
  target.fillSolid(Rect{0, -6, 4, 6}, color::kRed);
  target.fillSolid(Rect{2, 2, 0, 3}, color::kRed);
  for (int16_t y = 0; y < kH; ++y) {
    for (int16_t x = 0; x < kW; ++x) {
      TEST_ASSERT_EQUAL_HEX16(kBackdrop, target.pixelAt(x, y));
    }
  }
}

void test_fill_contiguous_row_major_with_clipping() {
  FrameBufferTarget target(g_small, kW, kH);
  target.clear(color::kBlack);
  const Color565 colors[6] = {1U, 2U, 3U, 4U, 5U, 6U};
  target.fillContiguous(Rect{-1, 0, 3, 2}, colors, 6U);
  TEST_ASSERT_EQUAL_HEX16(2U, target.pixelAt(0, 0));
  TEST_ASSERT_EQUAL_HEX16(3U, target.pixelAt(1, 0));
  TEST_ASSERT_EQUAL_HEX16(5U, target.pixelAt(0, 1));
  TEST_ASSERT_EQUAL_HEX16(6U, target.pixelAt(1, 1));
  TEST_ASSERT_EQUAL_HEX16(color::kBlack, target.pixelAt(2, 0));
}

void test_set_pixel_out_of_bounds_dropped() {
  FrameBufferTarget target(g_small, kW, kH);
  target.clear(kBackdrop);
  target.setPixel(-1, 0, color::kRed);
  target.setPixel(kW, 0, color::kRed);
  target.setPixel(0, kH, color::kRed);
  target.setPixel(0, 0, color::kRed);
  TEST_ASSERT_EQUAL_HEX16(color::kRed, target.pixelAt(0, 0));
  TEST_ASSERT_EQUAL_HEX16(kBackdrop, target.pixelAt(kW - 1, 0));
  TEST_ASSERT_EQUAL_HEX8(0U, g_small[kW * kH * 2]);
}

void test_rect_outline_leaves_interior() {
  FrameBufferTarget target(g_small, kW, kH);
  target.clear(kBackdrop);
  target.drawRectOutline(Rect{1, 1, 6, 5}, 1, color::kWhite);
  TEST_ASSERT_EQUAL_HEX16(color::kWhite, target.pixelAt(1, 1));
  TEST_ASSERT_EQUAL_HEX16(color::kWhite, target.pixelAt(6, 5));
  TEST_ASSERT_EQUAL_HEX16(kBackdrop, target.pixelAt(3, 3));
}

void test_line_endpoints_drawn() {
  FrameBufferTarget target(g_small, kW, kH);
  target.clear(color::kBlack);
  target.drawLine(0, 0, 8, 4, color::kGreen);
  TEST_ASSERT_EQUAL_HEX16(color::kGreen, target.pixelAt(0, 0));
  TEST_ASSERT_EQUAL_HEX16(color::kGreen, target.pixelAt(8, 4));
}

void test_double_buffer_swap_alternates() {
  DoubleBuffer buffers(g_a, g_b, kW, kH);
  TEST_ASSERT_EQUAL_UINT8(0U, buffers.renderIndex());
  TEST_ASSERT_EQUAL_UINT8(1U, buffers.flushIndex());
  buffers.renderTarget().clear(color::kRed);
  TEST_ASSERT_EQUAL_UINT8(0U, buffers.swap());
  TEST_ASSERT_EQUAL_UINT8(1U, buffers.renderIndex());
  TEST_ASSERT_EQUAL_PTR(g_a, buffers.frameData(buffers.flushIndex()));
  TEST_ASSERT_EQUAL_HEX16(color::kRed, buffers.target(0U).pixelAt(0, 0));
  TEST_ASSERT_EQUAL_UINT32(static_cast<uint32_t>(kW * kH * 2), static_cast<uint32_t>(buffers.frameBytes()));
}

void test_blend_pixel_mixes_over_existing_color() {
  TEST_ASSERT_EQUAL_HEX16(color::kWhite, obd_dash::gfx::blend565(color::kWhite, color::kBlack, 255U));
  TEST_ASSERT_EQUAL_HEX16(color::kBlack, obd_dash::gfx::blend565(color::kWhite, color::kBlack, 0U));
  TEST_ASSERT_EQUAL_HEX16(0x8410U, obd_dash::gfx::blend565(color::kWhite, color::kBlack, 128U));

  FrameBufferTarget target(g_small, kW, kH);
  target.clear(color::kBlack);
  target.blendPixel(1, 1, color::kWhite, 128U);
  target.blendPixel(2, 1, color::kRed, 255U);
  target.blendPixel(3, 1, color::kWhite, 0U);
  target.blendPixel(-1, 1, color::kWhite, 255U);
  TEST_ASSERT_EQUAL_HEX16(0x8410U, target.pixelAt(1, 1));
  TEST_ASSERT_EQUAL_HEX16(color::kRed, target.pixelAt(2, 1));
  TEST_ASSERT_EQUAL_HEX16(color::kBlack, target.pixelAt(3, 1));
}

void test_text_width_follows_font_advances() {
  using obd_dash::gfx::FontSize;
  const lv_font_t* small = obd_dash::gfx::fonts::fontFor(FontSize::kSmall);
  const int32_t expected = lv_font_get_glyph_width(small, 'A', 'B') + lv_font_get_glyph_width(small, 'B', 0U);
  TEST_ASSERT_EQUAL_INT16(expected, obd_dash::gfx::textWidth("AB", FontSize::kSmall));
  TEST_ASSERT_EQUAL_INT16(0, obd_dash::gfx::textWidth("", FontSize::kSmall));
  TEST_ASSERT_EQUAL_INT16(0, obd_dash::gfx::textWidth(nullptr, FontSize::kSmall));
  TEST_ASSERT_TRUE(obd_dash::gfx::textWidth("88", FontSize::kLarge) > obd_dash::gfx::textWidth("88", FontSize::kMedium));
  TEST_ASSERT_TRUE(obd_dash::gfx::textWidth("88", FontSize::kMedium) > obd_dash::gfx::textWidth("88", FontSize::kSmall));
  TEST_ASSERT_EQUAL_INT16(small->line_height - small->base_line, obd_dash::gfx::textAscent(FontSize::kSmall));
  TEST_ASSERT_EQUAL_INT16(small->line_height, obd_dash::gfx::lineHeight(FontSize::kSmall));
}

void test_text_draws_inside_its_bounds() {
  using obd_dash::gfx::FontSize;
  using obd_dash::gfx::TextAlign;
  FrameBufferTarget target(g_text, kTextW, kTextH);
  target.clear(color::kBlack);
  const int16_t baseline = 24;
  obd_dash::gfx::drawText(target, 32, baseline, "H1", color::kWhite, FontSize::kMedium, TextAlign::kCenter);
  const Rect ink = obd_dash::gfx::textBounds(32, baseline, "H1", FontSize::kMedium, TextAlign::kCenter);
  TEST_ASSERT_TRUE(ink.w > 0);
  TEST_ASSERT_TRUE(ink.h > 0);
  TEST_ASSERT_TRUE(ink.y + ink.h <= baseline);
  TEST_ASSERT_TRUE(ink.x < 32 && ink.x + ink.w > 32);

  uint32_t solid = 0U;
  for (int16_t y = 0; y < kTextH; ++y) {
    for (int16_t x = 0; x < kTextW; ++x) {
      const Color565 px = target.pixelAt(x, y);
      if (px == color::kBlack) {
        continue;
      }
      TEST_ASSERT_TRUE(inside(ink, x, y));
      solid += (px == color::kWhite) ? 1U : 0U;
    }
  }
  TEST_ASSERT_TRUE(solid > 0U);
}

void test_blank_text_has_empty_bounds() {
  using obd_dash::gfx::FontSize;
  using obd_dash::gfx::TextAlign;
  const Rect none = obd_dash::gfx::textBounds(10, 20, "", FontSize::kSmall, TextAlign::kLeft);
  TEST_ASSERT_EQUAL_INT16(0, none.w);
  TEST_ASSERT_EQUAL_INT16(0, none.h);
  const Rect spaces = obd_dash::gfx::textBounds(10, 20, "   ", FontSize::kSmall, TextAlign::kLeft);
  TEST_ASSERT_EQUAL_INT16(0, spaces.w);
  TEST_ASSERT_EQUAL_INT16(0, spaces.h);
}

int main() {
  UNITY_BEGIN();
  RUN_TEST(test_clear_fills_every_pixel_big_endian);
  RUN_TEST(test_fill_solid_even_and_odd_edges);
  RUN_TEST(test_fill_solid_clips_to_bounds);
  RUN_TEST(test_fill_solid_outside_or_empty_is_noop);
  RUN_TEST(test_fill_contiguous_row_major_with_clipping);
  RUN_TEST(test_set_pixel_out_of_bounds_dropped);
  RUN_TEST(test_rect_outline_leaves_interior);
  RUN_TEST(test_line_endpoints_drawn);
  RUN_TEST(test_double_buffer_swap_alternates);
  RUN_TEST(test_blend_pixel_mixes_over_existing_color);
  RUN_TEST(test_text_width_follows_font_advances);
  RUN_TEST(test_text_draws_inside_its_bounds);
  RUN_TEST(test_blank_text_has_empty_bounds);
  return UNITY_END();
}
