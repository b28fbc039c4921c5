#include "obd_dash/gfx/color565.h"

namespace obd_dash {
namespace gfx {

namespace {

constexpr uint32_t kLumaDarkThreshold = 128U;

uint32_t expand5(uint8_t v) { return (static_cast<uint32_t>(v) << 3) | (static_cast<uint32_t>(v) >> 2); }
uint32_t expand6(uint8_t v) { return (static_cast<uint32_t>(v) << 2) | (static_cast<uint32_t>(v) >> 4); }

uint8_t mixChannel(uint8_t fg, uint8_t bg, uint32_t alpha) {
  return static_cast<uint8_t>((fg * alpha + bg * (255U - alpha) + 127U) / 255U);
}

}  // namespace

uint32_t luminance(Color565 c) {
  const uint32_t r = expand5(red5(c));
  const uint32_t g = expand6(green6(c));
  const uint32_t b = expand5(blue5(c));
  return (r * 77U + g * 150U + b * 29U) >> 8;
}

Color565 textColorFor(Color565 background) {
  return (luminance(background) < kLumaDarkThreshold) ? color::kWhite : color::kBlack;
}

Color565 peakHighlightFor(Color565 base_text) {
  return (base_text == color::kWhite) ? color::kYellow : color::kBlack;
}

Color565 outlineColorFor(Color565 text) {
  return (luminance(text) < kLumaDarkThreshold) ? color::kWhite : color::kBlack;
}

Color565 blend565(Color565 fg, Color565 bg, uint8_t alpha) {
  if (alpha == 255U) {
    return fg;
  }
  if (alpha == 0U) {
    return bg;
  }
  return pack565(mixChannel(red5(fg), red5(bg), alpha),
                 mixChannel(green6(fg), green6(bg), alpha),
                 mixChannel(blue5(fg), blue5(bg), alpha));
}

}  // namespace gfx
}  // namespace obd_dash
