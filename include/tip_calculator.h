// Copyright (C) 2026 TipCalc Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace tipcalc {

/**
 * @brief Input validation failures reported by the calculator
 *
 * Each value maps to a distinct user-facing message via calc_error_message().
 * None of these are fatal: the caller shows the message and lets the user retry.
 */
enum class CalcError {
    NONE,                ///< Inputs valid
    INVALID_BILL,        ///< Bill text is not a finite number
    NEGATIVE_BILL,       ///< Bill parsed but is below zero
    INVALID_PARTY_SIZE,  ///< Party size is not an integer >= 1
    INVALID_TIP_PERCENT, ///< Direct-entry tip is not a number >= 0
};

/**
 * @brief Validated calculator inputs
 */
struct CalculationInput {
    double bill = 0.0;
    double tip_percent = 15.0;
    int party_size = 1;
    bool round_up = false;
};

/**
 * @brief Values derived from a CalculationInput
 *
 * per_person is rounded up to the cent when CalculationInput::round_up is set.
 */
struct CalculationResult {
    double bill = 0.0;
    double tip_percent = 0.0;
    int party_size = 1;
    double tip_amount = 0.0;
    double total = 0.0;
    double per_person = 0.0;
};

/**
 * @brief Outcome of a validating compute() call
 */
struct CalcOutcome {
    CalcError error = CalcError::NONE;
    CalculationResult result;

    [[nodiscard]] bool ok() const {
        return error == CalcError::NONE;
    }
};

/**
 * @brief User-facing message for a validation error
 * @return Empty string for CalcError::NONE
 */
const char* calc_error_message(CalcError error);

/**
 * @brief Parse raw bill text
 *
 * Leading/trailing whitespace is ignored. Anything that is not a complete,
 * finite decimal number yields INVALID_BILL; a negative number yields NEGATIVE_BILL.
 *
 * @param text Raw text from the bill field
 * @param out Parsed value (only written on success)
 */
CalcError parse_bill(const std::string& text, double& out);

/**
 * @brief Parse raw party size text (integer >= 1)
 */
CalcError parse_party_size(const std::string& text, int& out);

/**
 * @brief Parse a directly entered tip percentage (number >= 0)
 */
CalcError parse_tip_percent(const std::string& text, double& out);

/**
 * @brief Round a value up to the next cent
 *
 * Any real fraction of a cent goes up. Only binary floating-point noise a few
 * ULPs above a whole cent (e.g. 0.07 * 3 = 0.21000000000000002) is treated as
 * that whole cent.
 */
double round_up_to_cent(double value);

/**
 * @brief Round a value to the nearest cent (half away from zero)
 */
double round_to_cent(double value);

/**
 * @brief Pure arithmetic on already-validated inputs
 *
 * tip = bill * tip_percent / 100, total = bill + tip, per_person = total / party_size,
 * then ceiling at the cent when round_up is set.
 */
CalculationResult compute(const CalculationInput& input);

/**
 * @brief Validate raw inputs and compute
 *
 * Validation order: bill parse, bill sign, party size. tip_percent is not
 * re-validated here; the slider and the direct-entry path own its range.
 */
CalcOutcome compute(const std::string& bill_text, double tip_percent,
                    const std::string& party_size_text, bool round_up);

} // namespace tipcalc
