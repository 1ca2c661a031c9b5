// Copyright (C) 2026 TipCalc Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>
#include <vector>

namespace tipcalc {

/**
 * @brief Widgets the controller reads from and writes to
 *
 * Implemented by ui::TipCalculatorPanel on top of LVGL, and by a recording
 * fake in the unit tests. Getters return raw, unvalidated text.
 */
class TipCalculatorView {
  public:
    virtual ~TipCalculatorView() = default;

    // === Inputs ===
    [[nodiscard]] virtual std::string bill_text() const = 0;
    [[nodiscard]] virtual std::string party_size_text() const = 0;
    [[nodiscard]] virtual bool round_up() const = 0;
    [[nodiscard]] virtual std::string currency_text() const = 0;

    virtual void set_bill_text(const std::string& text) = 0;
    virtual void set_party_size_text(const std::string& text) = 0;
    virtual void set_round_up(bool enabled) = 0;

    /**
     * @brief Move the tip slider
     *
     * Values outside the slider range are shown clamped; the controller keeps
     * the exact value.
     */
    virtual void set_tip_percent(double percent) = 0;

    // === Outputs ===
    virtual void set_tip_label(const std::string& text) = 0;
    virtual void set_result_text(const std::string& text) = 0;
    virtual void set_history_entries(const std::vector<std::string>& lines) = 0;
    virtual void set_dark_mode(bool dark) = 0;

    // === Dialogs ===
    virtual void show_error(const std::string& title, const std::string& message) = 0;
    virtual void show_info(const std::string& title, const std::string& message) = 0;
};

} // namespace tipcalc
