// Copyright (C) 2026 TipCalc Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tip_calculator.h"
#include "tip_history.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

class ClipboardBackend;

namespace tipcalc {

class TipCalculatorView;

/**
 * @brief Wires user actions to the calculator and the history store
 *
 * Owns the tip percentage (set by presets, slider, direct entry or history
 * reload) and the last formatted result. Everything else is read from the
 * view at the moment an action runs. All methods run on the UI thread.
 *
 * @code
 * TipCalculatorController controller(panel, store, *clipboard, options);
 * controller.attach();
 * // button callbacks:
 * controller.calculate();
 * controller.load_selected_history(2);
 * @endcode
 */
class TipCalculatorController {
  public:
    struct Options {
        double default_tip_percent = 15.0;
        bool dark_mode = false;
    };

    using Clock = std::function<int64_t()>;
    using ThemeChangedCallback = std::function<void(bool dark)>;

    TipCalculatorController(TipCalculatorView& view, HistoryStore& history,
                            ClipboardBackend& clipboard, Options options);

    // Non-copyable (holds references)
    TipCalculatorController(const TipCalculatorController&) = delete;
    TipCalculatorController& operator=(const TipCalculatorController&) = delete;

    /**
     * @brief Push initial state to the view and load history
     */
    void attach();

    // === Actions ===

    /**
     * @brief Validate inputs, show the result and append it to history
     *
     * On a validation error the message is shown and neither history nor the
     * displayed result change.
     *
     * @return true if a result was produced
     */
    bool calculate();

    /**
     * @brief Copy bill, tip and party size from a history entry into the inputs
     *
     * Rounding and the result display are left alone. Out-of-range indices
     * are ignored.
     *
     * @param index Row in the history list (negative = nothing selected)
     */
    void load_selected_history(int index);

    /**
     * @brief Copy the last result text to the clipboard
     * @return false if there is no result yet or the clipboard refused it
     */
    bool copy_result();

    void clear_inputs();

    /**
     * @brief Set tip from a preset button or the slider
     */
    void set_tip(double percent);

    /**
     * @brief Set tip from the direct-entry field
     * @return false (and an error dialog) if the text is not a number >= 0
     */
    bool set_custom_tip(const std::string& text);

    void toggle_theme();
    void show_about();

    /**
     * @brief Reload history from disk and redraw the list
     */
    void refresh_history_list();

    // === State ===

    [[nodiscard]] double tip_percent() const {
        return tip_percent_;
    }
    [[nodiscard]] bool is_dark() const {
        return dark_mode_;
    }
    [[nodiscard]] const std::optional<CalculationResult>& last_result() const {
        return last_result_;
    }
    [[nodiscard]] const std::string& result_text() const {
        return result_text_;
    }

    void set_clock(Clock clock) {
        clock_ = std::move(clock);
    }
    void set_theme_changed_callback(ThemeChangedCallback callback) {
        theme_changed_ = std::move(callback);
    }

  private:
    void update_tip_display();

    TipCalculatorView& view_;
    HistoryStore& history_;
    ClipboardBackend& clipboard_;
    Options options_;

    double tip_percent_;
    bool dark_mode_;
    std::optional<CalculationResult> last_result_;
    std::string result_text_;

    Clock clock_;
    ThemeChangedCallback theme_changed_;
};

} // namespace tipcalc
