// Copyright (C) 2026 TipCalc Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tip_calculator_view.h"

#include <cstddef>
#include <lvgl.h>
#include <string>
#include <vector>

namespace tipcalc {
class TipCalculatorController;
}

namespace tipcalc::ui {

/**
 * @file ui_panel_tip_calculator.h
 * @brief LVGL form for the tip calculator
 *
 * Builds every widget in code:
 * - Bill and currency fields
 * - Tip presets (10/12/15 %), 0-50 % slider with live label, direct entry
 * - Party size field with -/+ stepper
 * - Round-up checkbox
 * - Calculate / Copy Result / Clear
 * - Result card, history list with Load Selected
 * - Toggle Theme / About
 * - On-screen keyboard shown while a field is focused
 *
 * Button events are forwarded to the bound controller; the controller writes
 * back through the TipCalculatorView interface.
 *
 * ## Usage:
 * @code
 * tipcalc::ui::TipCalculatorPanel panel;
 * panel.create(lv_screen_active());
 * TipCalculatorController controller(panel, store, *clipboard, options);
 * panel.bind(&controller);
 * controller.attach();
 * @endcode
 */
class TipCalculatorPanel : public TipCalculatorView {
  public:
    static constexpr int SLIDER_MAX_PERCENT = 50;
    static constexpr int PARTY_SIZE_MIN = 1;
    static constexpr int PARTY_SIZE_MAX = 100;

    TipCalculatorPanel() = default;
    ~TipCalculatorPanel() override;

    // Non-copyable, non-movable (widgets hold 'this' as event user data)
    TipCalculatorPanel(const TipCalculatorPanel&) = delete;
    TipCalculatorPanel& operator=(const TipCalculatorPanel&) = delete;
    TipCalculatorPanel(TipCalculatorPanel&&) = delete;
    TipCalculatorPanel& operator=(TipCalculatorPanel&&) = delete;

    /**
     * @brief Build the widget tree under @p parent
     * @return Root container, or nullptr if @p parent is null or already created
     */
    lv_obj_t* create(lv_obj_t* parent);

    /**
     * @brief Route button events to @p controller (nullptr detaches)
     */
    void bind(TipCalculatorController* controller) {
        controller_ = controller;
    }

    /**
     * @brief Delete the widget tree
     *
     * Safe to call multiple times. Called by the destructor.
     */
    void cleanup();

    /**
     * @brief Prefill the currency field (before the controller attaches)
     */
    void set_currency_text(const std::string& text);

    // === TipCalculatorView ===
    [[nodiscard]] std::string bill_text() const override;
    [[nodiscard]] std::string party_size_text() const override;
    [[nodiscard]] bool round_up() const override;
    [[nodiscard]] std::string currency_text() const override;

    void set_bill_text(const std::string& text) override;
    void set_party_size_text(const std::string& text) override;
    void set_round_up(bool enabled) override;
    void set_tip_percent(double percent) override;

    void set_tip_label(const std::string& text) override;
    void set_result_text(const std::string& text) override;
    void set_history_entries(const std::vector<std::string>& lines) override;
    void set_dark_mode(bool dark) override;

    void show_error(const std::string& title, const std::string& message) override;
    void show_info(const std::string& title, const std::string& message) override;

    // === Widget access (tests, keyboard navigation) ===
    [[nodiscard]] lv_obj_t* root() const {
        return root_;
    }
    [[nodiscard]] lv_obj_t* tip_slider() const {
        return tip_slider_;
    }
    [[nodiscard]] lv_obj_t* tip_label() const {
        return tip_label_;
    }
    [[nodiscard]] lv_obj_t* result_label() const {
        return result_label_;
    }
    [[nodiscard]] lv_obj_t* history_list() const {
        return history_list_;
    }
    [[nodiscard]] lv_obj_t* calculate_button() const {
        return btn_calculate_;
    }
    [[nodiscard]] lv_obj_t* load_button() const {
        return btn_load_;
    }
    [[nodiscard]] lv_obj_t* preset_button(size_t index) const {
        return index < 3 ? preset_buttons_[index] : nullptr;
    }
    [[nodiscard]] lv_obj_t* party_minus_button() const {
        return btn_party_minus_;
    }
    [[nodiscard]] lv_obj_t* party_plus_button() const {
        return btn_party_plus_;
    }
    /// Open message box, or nullptr
    [[nodiscard]] lv_obj_t* active_dialog() const {
        return dialog_;
    }
    /// Row selected in the history list, -1 if none
    [[nodiscard]] int selected_history_index() const {
        return selected_history_;
    }

  private:
    // === Layout helpers ===
    lv_obj_t* create_row(lv_obj_t* parent);
    lv_obj_t* create_label(lv_obj_t* parent, const char* text);
    lv_obj_t* create_button(lv_obj_t* parent, const char* text, lv_event_cb_t cb,
                            void* user_data);
    lv_obj_t* create_textarea(lv_obj_t* parent, const char* initial, int32_t width,
                              bool numeric);
    void create_keyboard(lv_obj_t* parent);
    void show_dialog(const std::string& title, const std::string& message);
    void select_history_row(int index);
    void step_party_size(int delta);

    // === Widget References ===
    lv_obj_t* root_ = nullptr;
    lv_obj_t* bill_ta_ = nullptr;
    lv_obj_t* currency_ta_ = nullptr;
    lv_obj_t* preset_buttons_[3] = {nullptr, nullptr, nullptr};
    lv_obj_t* tip_slider_ = nullptr;
    lv_obj_t* tip_label_ = nullptr;
    lv_obj_t* custom_tip_ta_ = nullptr;
    lv_obj_t* party_ta_ = nullptr;
    lv_obj_t* btn_party_minus_ = nullptr;
    lv_obj_t* btn_party_plus_ = nullptr;
    lv_obj_t* round_cb_ = nullptr;
    lv_obj_t* btn_calculate_ = nullptr;
    lv_obj_t* result_card_ = nullptr;
    lv_obj_t* result_label_ = nullptr;
    lv_obj_t* history_card_ = nullptr;
    lv_obj_t* history_list_ = nullptr;
    lv_obj_t* btn_load_ = nullptr;
    lv_obj_t* keyboard_ = nullptr;
    lv_obj_t* dialog_ = nullptr;

    TipCalculatorController* controller_ = nullptr;
    int selected_history_ = -1;
    bool dark_mode_ = false;

    // === Static Callbacks ===
    static void on_preset_cb(lv_event_t* e);
    static void on_slider_changed_cb(lv_event_t* e);
    static void on_custom_tip_cb(lv_event_t* e);
    static void on_party_minus_cb(lv_event_t* e);
    static void on_party_plus_cb(lv_event_t* e);
    static void on_calculate_cb(lv_event_t* e);
    static void on_copy_cb(lv_event_t* e);
    static void on_clear_cb(lv_event_t* e);
    static void on_history_row_cb(lv_event_t* e);
    static void on_load_selected_cb(lv_event_t* e);
    static void on_toggle_theme_cb(lv_event_t* e);
    static void on_about_cb(lv_event_t* e);
    static void on_textarea_focus_cb(lv_event_t* e);
    static void on_keyboard_done_cb(lv_event_t* e);
    static void on_keyboard_deleted_cb(lv_event_t* e);
    static void on_dialog_deleted_cb(lv_event_t* e);
    static void on_root_deleted_cb(lv_event_t* e);

    static TipCalculatorPanel* get_instance_from_event(lv_event_t* e);
};

} // namespace tipcalc::ui
