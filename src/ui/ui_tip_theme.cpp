// Copyright (C) 2026 TipCalc Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui/ui_tip_theme.h"

#include <spdlog/spdlog.h>

namespace tipcalc::ui {

ThemePalette theme_palette(bool is_dark) {
    ThemePalette palette;
    if (is_dark) {
        palette.screen_bg = lv_color_hex(0x2E2E2E);
        palette.card_bg = lv_color_hex(0x383838);
        palette.control = lv_color_hex(0x444444);
        palette.text = lv_color_hex(0xFFFFFF);
    } else {
        palette.screen_bg = lv_color_hex(0xF5F5F5);
        palette.card_bg = lv_color_hex(0xFFFFFF);
        palette.control = lv_color_hex(0xE0E0E0);
        palette.text = lv_color_hex(0x212121);
    }
    palette.primary = lv_color_hex(0x2196F3);
    palette.secondary = lv_color_hex(0x4CAF50);
    return palette;
}

lv_theme_t* theme_apply(lv_display_t* display, bool is_dark) {
    if (display == nullptr) {
        display = lv_display_get_default();
    }
    if (display == nullptr) {
        spdlog::warn("[Theme] No display - cannot apply theme");
        return nullptr;
    }

    ThemePalette palette = theme_palette(is_dark);
    lv_theme_t* theme =
        lv_theme_default_init(display, palette.primary, palette.secondary, is_dark, LV_FONT_DEFAULT);
    lv_display_set_theme(display, theme);

    lv_obj_t* screen = lv_display_get_screen_active(display);
    if (screen != nullptr) {
        lv_obj_set_style_bg_color(screen, palette.screen_bg, 0);
        lv_obj_set_style_bg_opa(screen, LV_OPA_COVER, 0);
        lv_obj_set_style_text_color(screen, palette.text, 0);
    }

    spdlog::debug("[Theme] Applied {} mode", is_dark ? "dark" : "light");
    return theme;
}

void theme_style_card(lv_obj_t* card, bool is_dark) {
    if (card == nullptr) {
        return;
    }
    ThemePalette palette = theme_palette(is_dark);
    lv_obj_set_style_bg_color(card, palette.card_bg, 0);
    lv_obj_set_style_bg_opa(card, LV_OPA_COVER, 0);
    lv_obj_set_style_border_color(card, palette.control, 0);
    lv_obj_set_style_text_color(card, palette.text, 0);
}

} // namespace tipcalc::ui
