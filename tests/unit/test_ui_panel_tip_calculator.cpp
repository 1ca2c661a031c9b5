// Copyright (C) 2026 TipCalc Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_panel_tip_calculator.h"

#include "../lvgl_test_fixture.h"
#include "../test_helpers.h"
#include "clipboard_backend_mock.h"
#include "tip_calculator_controller.h"
#include "tip_history.h"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>

using namespace tipcalc;
using tipcalc::ui::TipCalculatorPanel;

// ============================================================================
// Test Fixture
// ============================================================================

namespace {

std::string label_text(lv_obj_t* label) {
    return label ? lv_label_get_text(label) : "";
}

void click(lv_obj_t* obj) {
    REQUIRE(obj != nullptr);
    LVGLTestFixture::send_event(obj, LV_EVENT_CLICKED);
}

} // namespace

class PanelFixture : public LVGLTestFixture {
  protected:
    TempDir dir;
    ClipboardBackendMock clipboard;
    HistoryStore store{dir.file("history.json")};
    TipCalculatorPanel panel;
    std::unique_ptr<TipCalculatorController> controller;

    PanelFixture() {
        REQUIRE(panel.create(test_screen()) != nullptr);
        controller = std::make_unique<TipCalculatorController>(
            panel, store, clipboard, TipCalculatorController::Options{});
        controller->set_clock([] { return int64_t{1700000000}; });
        panel.bind(controller.get());
        controller->attach();
    }

    ~PanelFixture() override {
        panel.bind(nullptr);
        panel.cleanup();
    }
};

// ============================================================================
// Construction
// ============================================================================

TEST_CASE_METHOD(LVGLTestFixture, "TipCalculatorPanel: create needs a parent", "[ui][panel]") {
    TipCalculatorPanel panel;
    LogCapture log;
    REQUIRE(panel.create(nullptr) == nullptr);
    REQUIRE(log.contains("error: [TipCalculatorPanel]"));
}

TEST_CASE_METHOD(LVGLTestFixture, "TipCalculatorPanel: create twice is rejected", "[ui][panel]") {
    TipCalculatorPanel panel;
    REQUIRE(panel.create(test_screen()) != nullptr);
    REQUIRE(panel.create(test_screen()) == nullptr);
    panel.cleanup();
    REQUIRE(panel.root() == nullptr);
    panel.cleanup();
}

TEST_CASE_METHOD(PanelFixture, "TipCalculatorPanel: initial state", "[ui][panel]") {
    REQUIRE(panel.bill_text() == "0.00");
    REQUIRE(panel.party_size_text() == "1");
    REQUIRE(panel.currency_text() == "$");
    REQUIRE_FALSE(panel.round_up());
    REQUIRE(label_text(panel.result_label()) == "No calculation yet");
    REQUIRE(label_text(panel.tip_label()) == "Tip: 15.0%");
    REQUIRE(lv_slider_get_value(panel.tip_slider()) == 150);
    REQUIRE(lv_obj_get_child_count(panel.history_list()) == 0);
    REQUIRE(panel.active_dialog() == nullptr);
}

// ============================================================================
// Tip controls
// ============================================================================

TEST_CASE_METHOD(PanelFixture, "TipCalculatorPanel: preset buttons", "[ui][panel]") {
    click(panel.preset_button(0));
    REQUIRE(controller->tip_percent() == 10.0);
    REQUIRE(label_text(panel.tip_label()) == "Tip: 10.0%");
    REQUIRE(lv_slider_get_value(panel.tip_slider()) == 100);

    click(panel.preset_button(1));
    REQUIRE(controller->tip_percent() == 12.0);

    click(panel.preset_button(2));
    REQUIRE(controller->tip_percent() == 15.0);

    REQUIRE(panel.preset_button(3) == nullptr);
}

TEST_CASE_METHOD(PanelFixture, "TipCalculatorPanel: slider moves in tenths", "[ui][panel]") {
    lv_slider_set_value(panel.tip_slider(), 225, LV_ANIM_OFF);
    LVGLTestFixture::send_event(panel.tip_slider(), LV_EVENT_VALUE_CHANGED);

    REQUIRE(controller->tip_percent() == 22.5);
    REQUIRE(label_text(panel.tip_label()) == "Tip: 22.5%");
}

TEST_CASE_METHOD(PanelFixture, "TipCalculatorPanel: out-of-range tip shows clamped slider",
                 "[ui][panel]") {
    controller->set_tip(80.0);
    REQUIRE(lv_slider_get_value(panel.tip_slider()) == 500);
    REQUIRE(label_text(panel.tip_label()) == "Tip: 80.0%");
    REQUIRE(controller->tip_percent() == 80.0);
}

// ============================================================================
// Party size stepper
// ============================================================================

TEST_CASE_METHOD(PanelFixture, "TipCalculatorPanel: party size stepper", "[ui][panel]") {
    SECTION("minus stops at one") {
        click(panel.party_minus_button());
        REQUIRE(panel.party_size_text() == "1");
    }

    SECTION("plus and minus") {
        click(panel.party_plus_button());
        click(panel.party_plus_button());
        REQUIRE(panel.party_size_text() == "3");
        click(panel.party_minus_button());
        REQUIRE(panel.party_size_text() == "2");
    }

    SECTION("plus stops at the maximum") {
        panel.set_party_size_text("100");
        click(panel.party_plus_button());
        REQUIRE(panel.party_size_text() == "100");
    }

    SECTION("garbage resets to one") {
        panel.set_party_size_text("lots");
        click(panel.party_plus_button());
        REQUIRE(panel.party_size_text() == "1");
    }
}

// ============================================================================
// Calculate, history and dialogs
// ============================================================================

TEST_CASE_METHOD(PanelFixture, "TipCalculatorPanel: calculate fills result and history",
                 "[ui][panel]") {
    panel.set_bill_text("50");
    panel.set_party_size_text("2");
    click(panel.calculate_button());

    REQUIRE(label_text(panel.result_label()) == "Bill: $50.00\n"
                                                "Tip (15.0%): $7.50\n"
                                                "Total: $57.50\n"
                                                "Each (x2): $28.75");
    REQUIRE(lv_obj_get_child_count(panel.history_list()) == 1);
    REQUIRE(panel.active_dialog() == nullptr);
}

TEST_CASE_METHOD(PanelFixture, "TipCalculatorPanel: invalid input opens an error dialog",
                 "[ui][panel]") {
    panel.set_bill_text("abc");
    click(panel.calculate_button());

    REQUIRE(panel.active_dialog() != nullptr);
    REQUIRE(label_text(panel.result_label()) == "No calculation yet");
    REQUIRE(lv_obj_get_child_count(panel.history_list()) == 0);

    lv_msgbox_close(panel.active_dialog());
    REQUIRE(panel.active_dialog() == nullptr);
}

TEST_CASE_METHOD(PanelFixture, "TipCalculatorPanel: select and load a history row",
                 "[ui][panel]") {
    panel.set_bill_text("50");
    panel.set_party_size_text("2");
    click(panel.calculate_button());

    panel.set_bill_text("12");
    panel.set_party_size_text("4");
    click(panel.preset_button(0));
    click(panel.calculate_button());
    REQUIRE(lv_obj_get_child_count(panel.history_list()) == 2);

    SECTION("load without selection does nothing") {
        click(panel.load_button());
        REQUIRE(panel.bill_text() == "12");
    }

    SECTION("load the older row") {
        lv_obj_t* row = lv_obj_get_child(panel.history_list(), 1);
        click(row);
        REQUIRE(panel.selected_history_index() == 1);
        REQUIRE(lv_obj_has_state(row, LV_STATE_CHECKED));
        REQUIRE_FALSE(lv_obj_has_state(lv_obj_get_child(panel.history_list(), 0),
                                       LV_STATE_CHECKED));

        click(panel.load_button());
        REQUIRE(panel.bill_text() == "50.00");
        REQUIRE(panel.party_size_text() == "2");
        REQUIRE(controller->tip_percent() == 15.0);
    }
}

TEST_CASE_METHOD(PanelFixture, "TipCalculatorPanel: new dialog replaces the open one",
                 "[ui][panel]") {
    controller->show_about();
    lv_obj_t* first = panel.active_dialog();
    REQUIRE(first != nullptr);

    controller->show_about();
    REQUIRE(panel.active_dialog() != nullptr);
    REQUIRE(panel.active_dialog() != first);
}

TEST_CASE_METHOD(PanelFixture, "TipCalculatorPanel: dark mode restyles the screen",
                 "[ui][panel]") {
    controller->toggle_theme();
    REQUIRE(lv_color_eq(lv_obj_get_style_bg_color(test_screen(), LV_PART_MAIN),
                        lv_color_hex(0x2E2E2E)));

    controller->toggle_theme();
    REQUIRE(lv_color_eq(lv_obj_get_style_bg_color(test_screen(), LV_PART_MAIN),
                        lv_color_hex(0xF5F5F5)));
}

TEST_CASE_METHOD(PanelFixture, "TipCalculatorPanel: clear resets the widgets", "[ui][panel]") {
    panel.set_bill_text("50");
    panel.set_round_up(true);
    click(panel.preset_button(0));
    click(panel.calculate_button());

    controller->clear_inputs();

    REQUIRE(panel.bill_text() == "0.00");
    REQUIRE(panel.party_size_text() == "1");
    REQUIRE_FALSE(panel.round_up());
    REQUIRE(lv_slider_get_value(panel.tip_slider()) == 150);
    REQUIRE(label_text(panel.result_label()) == "No calculation yet");
    REQUIRE(lv_obj_get_child_count(panel.history_list()) == 1);
}
