// color565.h - RGB565 palette and contrast helpers.
#pragma once

#include <cstdint>

namespace obd_dash {
namespace gfx {

using Color565 = uint16_t;

namespace color {
constexpr Color565 kBlack = 0x0000U;
constexpr Color565 kWhite = 0xFFFFU;
constexpr Color565 kRed = 0xF800U;
constexpr Color565 kGreen = 0x07E0U;
constexpr Color565 kBlue = 0x001FU;
constexpr Color565 kYellow = 0xFFE0U;
constexpr Color565 kPink = 0xF81FU;
constexpr Color565 kOrange = 0xFC00U;
constexpr Color565 kGray = 0x4208U;
constexpr Color565 kDarkTeal = 0x028AU;
}  // namespace color

constexpr uint8_t red5(Color565 c) { return static_cast<uint8_t>((c >> 11) & 0x1FU); }
constexpr uint8_t green6(Color565 c) { return static_cast<uint8_t>((c >> 5) & 0x3FU); }
constexpr uint8_t blue5(Color565 c) { return static_cast<uint8_t>(c & 0x1FU); }

constexpr Color565 pack565(uint8_t r5, uint8_t g6, uint8_t b5) {
  return static_cast<Color565>(((r5 & 0x1FU) << 11) | ((g6 & 0x3FU) << 5) | (b5 & 0x1FU));
}

// BT.601 luma (0..255) after expanding channels to 8 bits.
uint32_t luminance(Color565 c);

// White text on dark backgrounds, black on light.
Color565 textColorFor(Color565 background);

// Yellow on dark text styles, black otherwise.
Color565 peakHighlightFor(Color565 base_text);

// Outline opposite to the fill so text stays readable on any background.
Color565 outlineColorFor(Color565 text);

// `fg` over `bg` with coverage 0..255. 255 returns `fg` unchanged.
Color565 blend565(Color565 fg, Color565 bg, uint8_t alpha);

}  // namespace gfx
}  // namespace obd_dash
