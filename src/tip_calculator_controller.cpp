// Copyright (C) 2026 TipCalc Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "tip_calculator_controller.h"

#include "clipboard_backend.h"
#include "format_utils.h"
#include "tip_calculator_view.h"

#include <spdlog/spdlog.h>

#include <ctime>
#include <vector>

namespace tipcalc {

namespace {

constexpr const char* INPUT_ERROR_TITLE = "Input error";
constexpr const char* DEFAULT_BILL_TEXT = "0.00";
constexpr const char* DEFAULT_PARTY_SIZE_TEXT = "1";

constexpr const char* ABOUT_TEXT = "Tip Calculator\n"
                                   "Built with LVGL.\n"
                                   "Features: presets, slider, split, history, theme, copy.";

int64_t wall_clock_seconds() {
    return static_cast<int64_t>(std::time(nullptr));
}

} // namespace

TipCalculatorController::TipCalculatorController(TipCalculatorView& view, HistoryStore& history,
                                                 ClipboardBackend& clipboard, Options options)
    : view_(view), history_(history), clipboard_(clipboard), options_(options),
      tip_percent_(options.default_tip_percent), dark_mode_(options.dark_mode),
      result_text_(fmt::NO_RESULT_TEXT), clock_(wall_clock_seconds) {}

void TipCalculatorController::attach() {
    view_.set_dark_mode(dark_mode_);
    view_.set_result_text(result_text_);
    update_tip_display();
    refresh_history_list();
    spdlog::debug("[TipCalculator] Attached (tip {}%, clipboard {})", tip_percent_,
                  clipboard_.name());
}

// ============================================================================
// Actions
// ============================================================================

bool TipCalculatorController::calculate() {
    CalcOutcome outcome =
        compute(view_.bill_text(), tip_percent_, view_.party_size_text(), view_.round_up());
    if (!outcome.ok()) {
        view_.show_error(INPUT_ERROR_TITLE, calc_error_message(outcome.error));
        return false;
    }

    last_result_ = outcome.result;
    result_text_ = fmt::result_text(outcome.result, view_.currency_text());
    view_.set_result_text(result_text_);

    HistoryError error = history_.append(HistoryRecord::from_result(outcome.result, clock_()));
    if (!error.success()) {
        spdlog::warn("[TipCalculator] Result not saved to history: {}", error.detail);
    }
    refresh_history_list();
    return true;
}

void TipCalculatorController::load_selected_history(int index) {
    if (index < 0) {
        return;
    }

    auto record = history_.select(static_cast<size_t>(index));
    if (!record) {
        spdlog::debug("[TipCalculator] History index {} out of range ({} entries)", index,
                      history_.entries().size());
        return;
    }

    view_.set_bill_text(fmt::amount(record->bill));
    view_.set_party_size_text(std::to_string(record->party_size));
    set_tip(record->tip_percent);
}

bool TipCalculatorController::copy_result() {
    if (!last_result_) {
        return false;
    }

    if (!clipboard_.set_text(result_text_)) {
        view_.show_error("Copy failed", "Could not copy to clipboard.");
        return false;
    }

    view_.show_info("Copied", "Result copied to clipboard.");
    return true;
}

void TipCalculatorController::clear_inputs() {
    view_.set_bill_text(DEFAULT_BILL_TEXT);
    view_.set_party_size_text(DEFAULT_PARTY_SIZE_TEXT);
    view_.set_round_up(false);
    set_tip(options_.default_tip_percent);

    last_result_.reset();
    result_text_ = fmt::NO_RESULT_TEXT;
    view_.set_result_text(result_text_);
}

void TipCalculatorController::set_tip(double percent) {
    tip_percent_ = percent;
    update_tip_display();
}

bool TipCalculatorController::set_custom_tip(const std::string& text) {
    double percent = 0.0;
    CalcError error = parse_tip_percent(text, percent);
    if (error != CalcError::NONE) {
        view_.show_error(INPUT_ERROR_TITLE, calc_error_message(error));
        return false;
    }
    set_tip(percent);
    return true;
}

void TipCalculatorController::toggle_theme() {
    dark_mode_ = !dark_mode_;
    view_.set_dark_mode(dark_mode_);
    spdlog::debug("[TipCalculator] Theme: {}", dark_mode_ ? "dark" : "light");
    if (theme_changed_) {
        theme_changed_(dark_mode_);
    }
}

void TipCalculatorController::show_about() {
    view_.show_info("About", ABOUT_TEXT);
}

void TipCalculatorController::refresh_history_list() {
    std::string currency = view_.currency_text();
    std::vector<std::string> lines;
    for (const auto& record : history_.load_all()) {
        lines.push_back(fmt::history_line(record, currency));
    }
    view_.set_history_entries(lines);
}

void TipCalculatorController::update_tip_display() {
    view_.set_tip_percent(tip_percent_);
    view_.set_tip_label(fmt::tip_label(tip_percent_));
}

} // namespace tipcalc
