// Copyright (C) 2026 TipCalc Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui/ui_tip_theme.h"

#include "../lvgl_test_fixture.h"

#include <catch2/catch_test_macros.hpp>

using namespace tipcalc::ui;

TEST_CASE("theme_palette: light and dark colours", "[ui][theme]") {
    ThemePalette light = theme_palette(false);
    ThemePalette dark = theme_palette(true);

    REQUIRE(lv_color_eq(light.screen_bg, lv_color_hex(0xF5F5F5)));
    REQUIRE(lv_color_eq(light.card_bg, lv_color_hex(0xFFFFFF)));
    REQUIRE(lv_color_eq(light.text, lv_color_hex(0x212121)));

    REQUIRE(lv_color_eq(dark.screen_bg, lv_color_hex(0x2E2E2E)));
    REQUIRE(lv_color_eq(dark.card_bg, lv_color_hex(0x383838)));
    REQUIRE(lv_color_eq(dark.text, lv_color_hex(0xFFFFFF)));

    // Accents do not change with the mode
    REQUIRE(lv_color_eq(light.primary, dark.primary));
    REQUIRE(lv_color_eq(light.secondary, dark.secondary));
}

TEST_CASE_METHOD(LVGLTestFixture, "theme_apply: styles the active screen", "[ui][theme]") {
    REQUIRE(theme_apply(nullptr, true) != nullptr);
    REQUIRE(lv_color_eq(lv_obj_get_style_bg_color(test_screen(), LV_PART_MAIN),
                        lv_color_hex(0x2E2E2E)));

    REQUIRE(theme_apply(nullptr, false) != nullptr);
    REQUIRE(lv_color_eq(lv_obj_get_style_bg_color(test_screen(), LV_PART_MAIN),
                        lv_color_hex(0xF5F5F5)));
    REQUIRE(lv_color_eq(lv_obj_get_style_text_color(test_screen(), LV_PART_MAIN),
                        lv_color_hex(0x212121)));
}

TEST_CASE_METHOD(LVGLTestFixture, "theme_style_card", "[ui][theme]") {
    lv_obj_t* card = lv_obj_create(test_screen());

    theme_style_card(card, true);
    REQUIRE(lv_color_eq(lv_obj_get_style_bg_color(card, LV_PART_MAIN), lv_color_hex(0x383838)));

    theme_style_card(card, false);
    REQUIRE(lv_color_eq(lv_obj_get_style_bg_color(card, LV_PART_MAIN), lv_color_hex(0xFFFFFF)));

    // Null card is ignored
    theme_style_card(nullptr, true);
}
