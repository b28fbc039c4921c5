// fonts.h - LVGL font registry for the dashboard faces.
#pragma once

#include <lvgl.h>

#include "obd_dash/gfx/text.h"

namespace obd_dash {
namespace gfx {
namespace fonts {

// Brings up the LVGL core once. Glyph lookups on the built-in fonts work
// before this, the call only has to happen before any LVGL allocation.
void init();

const lv_font_t* fontBody();   // labels, secondary lines, debug and log pages
const lv_font_t* fontTitle();  // header, popups
const lv_font_t* fontValue();  // main sensor values

const lv_font_t* fontFor(FontSize size);

}  // namespace fonts
}  // namespace gfx
}  // namespace obd_dash
