// Copyright (C) 2026 TipCalc Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_panel_tip_calculator.h"

#include "ui/ui_cleanup_helpers.h"
#include "ui/ui_tip_theme.h"

#include "tip_calculator.h"
#include "tip_calculator_controller.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iterator>

namespace tipcalc::ui {

// Constants
static constexpr int PRESET_PERCENTS[3] = {10, 12, 15};
static constexpr int32_t FIELD_WIDTH = 140;
static constexpr int32_t SMALL_FIELD_WIDTH = 70;
static constexpr int32_t PAD = 8;

// ============================================================================
// Construction / Destruction
// ============================================================================

TipCalculatorPanel::~TipCalculatorPanel() {
    cleanup();
}

lv_obj_t* TipCalculatorPanel::create(lv_obj_t* parent) {
    if (!parent) {
        spdlog::error("[TipCalculatorPanel] Cannot create panel without a parent");
        return nullptr;
    }
    if (root_) {
        spdlog::warn("[TipCalculatorPanel] Already created, call cleanup() first");
        return nullptr;
    }

    root_ = lv_obj_create(parent);
    lv_obj_set_size(root_, LV_PCT(100), LV_PCT(100));
    lv_obj_set_style_pad_all(root_, PAD, 0);
    lv_obj_set_style_pad_row(root_, PAD, 0);
    lv_obj_set_style_bg_opa(root_, LV_OPA_TRANSP, 0);
    lv_obj_set_style_border_width(root_, 0, 0);
    lv_obj_set_flex_flow(root_, LV_FLEX_FLOW_COLUMN);
    lv_obj_add_event_cb(root_, on_root_deleted_cb, LV_EVENT_DELETE, this);

    // Bill and currency
    lv_obj_t* row = create_row(root_);
    create_label(row, "Bill amount:");
    bill_ta_ = create_textarea(row, "0.00", FIELD_WIDTH, true);

    row = create_row(root_);
    create_label(row, "Currency symbol/text:");
    currency_ta_ = create_textarea(row, "$", SMALL_FIELD_WIDTH, false);
    lv_textarea_set_max_length(currency_ta_, 6);

    // Tip presets
    row = create_row(root_);
    create_label(row, "Tip (%):");
    for (size_t i = 0; i < 3; i++) {
        char text[8];
        lv_snprintf(text, sizeof(text), "%d%%", PRESET_PERCENTS[i]);
        preset_buttons_[i] = create_button(row, text, on_preset_cb, this);
        lv_obj_set_user_data(preset_buttons_[i],
                             reinterpret_cast<void*>(static_cast<intptr_t>(PRESET_PERCENTS[i])));
    }

    // Slider (tenths of a percent) and live label
    tip_slider_ = lv_slider_create(root_);
    lv_obj_set_width(tip_slider_, LV_PCT(90));
    lv_slider_set_range(tip_slider_, 0, SLIDER_MAX_PERCENT * 10);
    lv_obj_add_event_cb(tip_slider_, on_slider_changed_cb, LV_EVENT_VALUE_CHANGED, this);
    lv_obj_set_style_margin_top(tip_slider_, PAD, 0);

    tip_label_ = lv_label_create(root_);
    lv_label_set_text(tip_label_, "");
    lv_obj_set_width(tip_label_, LV_PCT(100));
    lv_obj_set_style_text_align(tip_label_, LV_TEXT_ALIGN_CENTER, 0);

    // Direct entry
    row = create_row(root_);
    create_label(row, "Custom tip (%):");
    custom_tip_ta_ = create_textarea(row, "", SMALL_FIELD_WIDTH, true);
    lv_obj_add_event_cb(custom_tip_ta_, on_custom_tip_cb, LV_EVENT_READY, this);
    create_button(row, "Set", on_custom_tip_cb, this);

    // Party size with stepper
    row = create_row(root_);
    create_label(row, "Split between (# people):");
    btn_party_minus_ = create_button(row, LV_SYMBOL_MINUS, on_party_minus_cb, this);
    party_ta_ = create_textarea(row, "1", SMALL_FIELD_WIDTH, true);
    btn_party_plus_ = create_button(row, LV_SYMBOL_PLUS, on_party_plus_cb, this);

    round_cb_ = lv_checkbox_create(root_);
    lv_checkbox_set_text(round_cb_, "Round up per person");

    // Actions
    row = create_row(root_);
    btn_calculate_ = create_button(row, "Calculate", on_calculate_cb, this);
    create_button(row, LV_SYMBOL_COPY " Copy Result", on_copy_cb, this);
    create_button(row, "Clear", on_clear_cb, this);

    // Result card
    result_card_ = lv_obj_create(root_);
    lv_obj_set_size(result_card_, LV_PCT(100), LV_SIZE_CONTENT);
    lv_obj_set_flex_flow(result_card_, LV_FLEX_FLOW_COLUMN);
    create_label(result_card_, "Result");
    result_label_ = lv_label_create(result_card_);
    lv_label_set_text(result_label_, "");
    lv_obj_set_width(result_label_, LV_PCT(100));
    lv_label_set_long_mode(result_label_, LV_LABEL_LONG_WRAP);

    // History card
    history_card_ = lv_obj_create(root_);
    lv_obj_set_size(history_card_, LV_PCT(100), LV_SIZE_CONTENT);
    lv_obj_set_flex_flow(history_card_, LV_FLEX_FLOW_COLUMN);
    create_label(history_card_, "History");
    history_list_ = lv_list_create(history_card_);
    lv_obj_set_size(history_list_, LV_PCT(100), 160);
    btn_load_ = create_button(history_card_, "Load Selected", on_load_selected_cb, this);

    // Bottom controls
    row = create_row(root_);
    create_button(row, "Toggle Theme", on_toggle_theme_cb, this);
    create_button(row, "About", on_about_cb, this);

    create_keyboard(lv_layer_top());
    set_dark_mode(dark_mode_);

    spdlog::debug("[TipCalculatorPanel] Created");
    return root_;
}

void TipCalculatorPanel::cleanup() {
    if (dialog_ && lv_is_initialized()) {
        lv_msgbox_close(dialog_);
    }
    dialog_ = nullptr;

    if (lv_is_initialized()) {
        safe_delete_obj(keyboard_);
        safe_delete_obj(root_); // on_root_deleted_cb clears the child references
    }
    keyboard_ = nullptr;
    root_ = nullptr;
    selected_history_ = -1;
}

// ============================================================================
// Layout Helpers
// ============================================================================

lv_obj_t* TipCalculatorPanel::create_row(lv_obj_t* parent) {
    lv_obj_t* row = lv_obj_create(parent);
    lv_obj_set_size(row, LV_PCT(100), LV_SIZE_CONTENT);
    lv_obj_set_style_pad_all(row, 0, 0);
    lv_obj_set_style_pad_column(row, PAD, 0);
    lv_obj_set_style_bg_opa(row, LV_OPA_TRANSP, 0);
    lv_obj_set_style_border_width(row, 0, 0);
    lv_obj_remove_flag(row, LV_OBJ_FLAG_SCROLLABLE);
    lv_obj_set_flex_flow(row, LV_FLEX_FLOW_ROW);
    lv_obj_set_flex_align(row, LV_FLEX_ALIGN_START, LV_FLEX_ALIGN_CENTER, LV_FLEX_ALIGN_CENTER);
    return row;
}

lv_obj_t* TipCalculatorPanel::create_label(lv_obj_t* parent, const char* text) {
    lv_obj_t* label = lv_label_create(parent);
    lv_label_set_text(label, text);
    return label;
}

lv_obj_t* TipCalculatorPanel::create_button(lv_obj_t* parent, const char* text, lv_event_cb_t cb,
                                            void* user_data) {
    lv_obj_t* btn = lv_button_create(parent);
    lv_obj_t* label = lv_label_create(btn);
    lv_label_set_text(label, text);
    lv_obj_center(label);
    lv_obj_add_event_cb(btn, cb, LV_EVENT_CLICKED, user_data);
    return btn;
}

lv_obj_t* TipCalculatorPanel::create_textarea(lv_obj_t* parent, const char* initial, int32_t width,
                                              bool numeric) {
    lv_obj_t* ta = lv_textarea_create(parent);
    lv_textarea_set_one_line(ta, true);
    lv_textarea_set_text(ta, initial);
    lv_obj_set_width(ta, width);

    // user_data marks which keyboard layout to show
    lv_obj_set_user_data(ta, reinterpret_cast<void*>(static_cast<intptr_t>(numeric ? 1 : 0)));
    lv_obj_add_event_cb(ta, on_textarea_focus_cb, LV_EVENT_FOCUSED, this);
    lv_obj_add_event_cb(ta, on_textarea_focus_cb, LV_EVENT_DEFOCUSED, this);

    // Physical keyboard input
    lv_group_t* group = lv_group_get_default();
    if (group) {
        lv_group_add_obj(group, ta);
    }
    return ta;
}

void TipCalculatorPanel::create_keyboard(lv_obj_t* parent) {
    keyboard_ = lv_keyboard_create(parent);
    lv_obj_set_size(keyboard_, LV_PCT(100), LV_PCT(40));
    lv_obj_align(keyboard_, LV_ALIGN_BOTTOM_MID, 0, 0);
    lv_obj_add_flag(keyboard_, LV_OBJ_FLAG_HIDDEN);
    lv_obj_add_event_cb(keyboard_, on_keyboard_done_cb, LV_EVENT_READY, this);
    lv_obj_add_event_cb(keyboard_, on_keyboard_done_cb, LV_EVENT_CANCEL, this);
    lv_obj_add_event_cb(keyboard_, on_keyboard_deleted_cb, LV_EVENT_DELETE, this);
}

void TipCalculatorPanel::show_dialog(const std::string& title, const std::string& message) {
    if (dialog_) {
        lv_msgbox_close(dialog_);
        dialog_ = nullptr;
    }

    dialog_ = lv_msgbox_create(nullptr);
    lv_msgbox_add_title(dialog_, title.c_str());
    lv_msgbox_add_text(dialog_, message.c_str());
    lv_msgbox_add_close_button(dialog_);
    lv_obj_add_event_cb(dialog_, on_dialog_deleted_cb, LV_EVENT_DELETE, this);
}

void TipCalculatorPanel::select_history_row(int index) {
    if (!history_list_) {
        return;
    }

    uint32_t count = lv_obj_get_child_count(history_list_);
    for (uint32_t i = 0; i < count; i++) {
        lv_obj_t* child = lv_obj_get_child(history_list_, static_cast<int32_t>(i));
        if (static_cast<int>(i) == index) {
            lv_obj_add_state(child, LV_STATE_CHECKED);
        } else {
            lv_obj_remove_state(child, LV_STATE_CHECKED);
        }
    }
    selected_history_ = (index >= 0 && static_cast<uint32_t>(index) < count) ? index : -1;
}

void TipCalculatorPanel::step_party_size(int delta) {
    int current = PARTY_SIZE_MIN;
    if (parse_party_size(party_size_text(), current) != CalcError::NONE) {
        current = PARTY_SIZE_MIN;
        delta = 0;
    }
    int next = std::clamp(current + delta, PARTY_SIZE_MIN, PARTY_SIZE_MAX);
    set_party_size_text(std::to_string(next));
}

// ============================================================================
// TipCalculatorView
// ============================================================================

std::string TipCalculatorPanel::bill_text() const {
    return bill_ta_ ? lv_textarea_get_text(bill_ta_) : "";
}

std::string TipCalculatorPanel::party_size_text() const {
    return party_ta_ ? lv_textarea_get_text(party_ta_) : "";
}

bool TipCalculatorPanel::round_up() const {
    return round_cb_ && lv_obj_has_state(round_cb_, LV_STATE_CHECKED);
}

std::string TipCalculatorPanel::currency_text() const {
    return currency_ta_ ? lv_textarea_get_text(currency_ta_) : "";
}

void TipCalculatorPanel::set_currency_text(const std::string& text) {
    if (currency_ta_) {
        lv_textarea_set_text(currency_ta_, text.c_str());
    }
}

void TipCalculatorPanel::set_bill_text(const std::string& text) {
    if (bill_ta_) {
        lv_textarea_set_text(bill_ta_, text.c_str());
    }
}

void TipCalculatorPanel::set_party_size_text(const std::string& text) {
    if (party_ta_) {
        lv_textarea_set_text(party_ta_, text.c_str());
    }
}

void TipCalculatorPanel::set_round_up(bool enabled) {
    if (!round_cb_) {
        return;
    }
    if (enabled) {
        lv_obj_add_state(round_cb_, LV_STATE_CHECKED);
    } else {
        lv_obj_remove_state(round_cb_, LV_STATE_CHECKED);
    }
}

void TipCalculatorPanel::set_tip_percent(double percent) {
    if (!tip_slider_) {
        return;
    }
    double clamped = std::clamp(percent, 0.0, static_cast<double>(SLIDER_MAX_PERCENT));
    lv_slider_set_value(tip_slider_, static_cast<int32_t>(std::lround(clamped * 10.0)),
                        LV_ANIM_OFF);
}

void TipCalculatorPanel::set_tip_label(const std::string& text) {
    if (tip_label_) {
        lv_label_set_text(tip_label_, text.c_str());
    }
}

void TipCalculatorPanel::set_result_text(const std::string& text) {
    if (result_label_) {
        lv_label_set_text(result_label_, text.c_str());
    }
}

void TipCalculatorPanel::set_history_entries(const std::vector<std::string>& lines) {
    if (!history_list_) {
        return;
    }

    lv_obj_clean(history_list_);
    for (const auto& line : lines) {
        lv_obj_t* btn = lv_list_add_button(history_list_, nullptr, line.c_str());
        lv_obj_add_event_cb(btn, on_history_row_cb, LV_EVENT_CLICKED, this);
    }
    selected_history_ = -1;
    spdlog::trace("[TipCalculatorPanel] History list: {} rows", lines.size());
}

void TipCalculatorPanel::set_dark_mode(bool dark) {
    dark_mode_ = dark;
    if (!root_) {
        return;
    }
    theme_apply(lv_obj_get_display(root_), dark);
    theme_style_card(result_card_, dark);
    theme_style_card(history_card_, dark);
}

void TipCalculatorPanel::show_error(const std::string& title, const std::string& message) {
    show_dialog(title, message);
}

void TipCalculatorPanel::show_info(const std::string& title, const std::string& message) {
    show_dialog(title, message);
}

// ============================================================================
// Static Callbacks
// ============================================================================

TipCalculatorPanel* TipCalculatorPanel::get_instance_from_event(lv_event_t* e) {
    auto* self = static_cast<TipCalculatorPanel*>(lv_event_get_user_data(e));
    if (!self) {
        spdlog::warn("[TipCalculatorPanel] Event without panel instance");
    }
    return self;
}

void TipCalculatorPanel::on_preset_cb(lv_event_t* e) {
    auto* self = get_instance_from_event(e);
    auto* btn = static_cast<lv_obj_t*>(lv_event_get_target(e));
    if (!self || !self->controller_ || !btn) {
        return;
    }
    auto percent = static_cast<int>(reinterpret_cast<intptr_t>(lv_obj_get_user_data(btn)));
    self->controller_->set_tip(static_cast<double>(percent));
}

void TipCalculatorPanel::on_slider_changed_cb(lv_event_t* e) {
    auto* self = get_instance_from_event(e);
    if (!self || !self->controller_) {
        return;
    }
    int32_t tenths = lv_slider_get_value(self->tip_slider_);
    self->controller_->set_tip(static_cast<double>(tenths) / 10.0);
}

void TipCalculatorPanel::on_custom_tip_cb(lv_event_t* e) {
    auto* self = get_instance_from_event(e);
    if (!self || !self->controller_ || !self->custom_tip_ta_) {
        return;
    }
    if (self->controller_->set_custom_tip(lv_textarea_get_text(self->custom_tip_ta_))) {
        lv_textarea_set_text(self->custom_tip_ta_, "");
    }
}

void TipCalculatorPanel::on_party_minus_cb(lv_event_t* e) {
    auto* self = get_instance_from_event(e);
    if (self) {
        self->step_party_size(-1);
    }
}

void TipCalculatorPanel::on_party_plus_cb(lv_event_t* e) {
    auto* self = get_instance_from_event(e);
    if (self) {
        self->step_party_size(1);
    }
}

void TipCalculatorPanel::on_calculate_cb(lv_event_t* e) {
    auto* self = get_instance_from_event(e);
    if (self && self->controller_) {
        self->controller_->calculate();
    }
}

void TipCalculatorPanel::on_copy_cb(lv_event_t* e) {
    auto* self = get_instance_from_event(e);
    if (self && self->controller_) {
        self->controller_->copy_result();
    }
}

void TipCalculatorPanel::on_clear_cb(lv_event_t* e) {
    auto* self = get_instance_from_event(e);
    if (self && self->controller_) {
        self->controller_->clear_inputs();
    }
}

void TipCalculatorPanel::on_history_row_cb(lv_event_t* e) {
    auto* self = get_instance_from_event(e);
    auto* row = static_cast<lv_obj_t*>(lv_event_get_target(e));
    if (!self || !row) {
        return;
    }
    self->select_history_row(static_cast<int>(lv_obj_get_index(row)));
}

void TipCalculatorPanel::on_load_selected_cb(lv_event_t* e) {
    auto* self = get_instance_from_event(e);
    if (self && self->controller_) {
        self->controller_->load_selected_history(self->selected_history_);
    }
}

void TipCalculatorPanel::on_toggle_theme_cb(lv_event_t* e) {
    auto* self = get_instance_from_event(e);
    if (self && self->controller_) {
        self->controller_->toggle_theme();
    }
}

void TipCalculatorPanel::on_about_cb(lv_event_t* e) {
    auto* self = get_instance_from_event(e);
    if (self && self->controller_) {
        self->controller_->show_about();
    }
}

void TipCalculatorPanel::on_textarea_focus_cb(lv_event_t* e) {
    auto* self = get_instance_from_event(e);
    auto* ta = static_cast<lv_obj_t*>(lv_event_get_target(e));
    if (!self || !self->keyboard_ || !ta) {
        return;
    }

    if (lv_event_get_code(e) == LV_EVENT_FOCUSED) {
        bool numeric = reinterpret_cast<intptr_t>(lv_obj_get_user_data(ta)) != 0;
        lv_keyboard_set_mode(self->keyboard_,
                             numeric ? LV_KEYBOARD_MODE_NUMBER : LV_KEYBOARD_MODE_TEXT_LOWER);
        lv_keyboard_set_textarea(self->keyboard_, ta);
        lv_obj_remove_flag(self->keyboard_, LV_OBJ_FLAG_HIDDEN);
    } else {
        lv_keyboard_set_textarea(self->keyboard_, nullptr);
        lv_obj_add_flag(self->keyboard_, LV_OBJ_FLAG_HIDDEN);
    }
}

void TipCalculatorPanel::on_keyboard_done_cb(lv_event_t* e) {
    auto* self = get_instance_from_event(e);
    if (!self || !self->keyboard_) {
        return;
    }
    lv_obj_t* ta = lv_keyboard_get_textarea(self->keyboard_);
    if (ta) {
        lv_obj_remove_state(ta, LV_STATE_FOCUSED);
    }
    lv_keyboard_set_textarea(self->keyboard_, nullptr);
    lv_obj_add_flag(self->keyboard_, LV_OBJ_FLAG_HIDDEN);
}

void TipCalculatorPanel::on_keyboard_deleted_cb(lv_event_t* e) {
    auto* self = get_instance_from_event(e);
    if (self) {
        self->keyboard_ = nullptr;
    }
}

void TipCalculatorPanel::on_dialog_deleted_cb(lv_event_t* e) {
    auto* self = get_instance_from_event(e);
    if (self && lv_event_get_target(e) == self->dialog_) {
        self->dialog_ = nullptr;
    }
}

void TipCalculatorPanel::on_root_deleted_cb(lv_event_t* e) {
    auto* self = get_instance_from_event(e);
    if (!self) {
        return;
    }

    // Children are gone with the root; keyboard and dialog live on the top layer
    self->root_ = nullptr;
    self->bill_ta_ = nullptr;
    self->currency_ta_ = nullptr;
    std::fill(std::begin(self->preset_buttons_), std::end(self->preset_buttons_), nullptr);
    self->tip_slider_ = nullptr;
    self->tip_label_ = nullptr;
    self->custom_tip_ta_ = nullptr;
    self->party_ta_ = nullptr;
    self->btn_party_minus_ = nullptr;
    self->btn_party_plus_ = nullptr;
    self->round_cb_ = nullptr;
    self->btn_calculate_ = nullptr;
    self->result_card_ = nullptr;
    self->result_label_ = nullptr;
    self->history_card_ = nullptr;
    self->history_list_ = nullptr;
    self->btn_load_ = nullptr;
    self->selected_history_ = -1;
}

} // namespace tipcalc::ui
