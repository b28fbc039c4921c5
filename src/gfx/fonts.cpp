#include "obd_dash/gfx/fonts.h"

namespace obd_dash {
namespace gfx {
namespace fonts {

namespace {

bool g_inited = false;

}  // namespace

void init() {
  if (g_inited) {
    return;
  }
  lv_init();
  g_inited = true;
}

const lv_font_t* fontBody() {
  return &lv_font_montserrat_12;
}

const lv_font_t* fontTitle() {
  return &lv_font_montserrat_16;
}

const lv_font_t* fontValue() {
  return &lv_font_montserrat_28;
}

const lv_font_t* fontFor(FontSize size) {
  switch (size) {
    case FontSize::kSmall:
      return fontBody();
    case FontSize::kMedium:
      return fontTitle();
    case FontSize::kLarge:
      return fontValue();
  }
  return fontBody();
}

}  // namespace fonts
}  // namespace gfx
}  // namespace obd_dash
