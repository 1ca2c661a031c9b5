// Copyright (C) 2026 TipCalc Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <lvgl.h>

namespace tipcalc::ui {

/**
 * @brief Colors for one display mode
 */
struct ThemePalette {
    lv_color_t screen_bg; ///< Window background
    lv_color_t card_bg;   ///< Result/history cards
    lv_color_t control;   ///< Buttons and inputs
    lv_color_t text;      ///< Primary text
    lv_color_t primary;   ///< Accent (slider indicator, focus)
    lv_color_t secondary; ///< Checkbox tick, selected history row
};

/**
 * @brief Palette for light or dark mode
 *
 * Dark mode uses a #2e2e2e background, white text and #444444 controls.
 */
ThemePalette theme_palette(bool is_dark);

/**
 * @brief Apply the LVGL default theme in the given mode to @p display
 *
 * Re-initializing the default theme refreshes existing widgets in place.
 * The active screen's background and text colors are set from the palette.
 *
 * @param display Target display (nullptr = default display)
 * @param is_dark true for dark mode
 * @return Applied theme, or nullptr if there is no display
 */
lv_theme_t* theme_apply(lv_display_t* display, bool is_dark);

/**
 * @brief Style a card container (result, history) for the given mode
 */
void theme_style_card(lv_obj_t* card, bool is_dark);

} // namespace tipcalc::ui
