// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026 TipCalc Authors

#pragma once

#include "tip_calculator.h"
#include "tip_history.h"

#include <cstdint>
#include <string>

namespace tipcalc::fmt {

/// Shown in the result area until the first successful calculation
constexpr const char* NO_RESULT_TEXT = "No calculation yet";

/// Used when the currency field is left empty
constexpr const char* DEFAULT_CURRENCY = "$";

/**
 * @brief Currency label to display, falling back to "$" when empty
 */
std::string currency_or_default(const std::string& currency);

/**
 * @brief Two-decimal text for an amount, e.g. "50.00"
 *
 * No digits are dropped however large the value is.
 */
std::string amount(double value);

/**
 * @brief Format an amount with currency prefix and two decimals
 *
 * Produces output like:
 * - "$50.00"
 * - "EUR7.50" (no separator is inserted)
 *
 * @param amount Amount in currency units
 * @param currency Currency label (empty uses "$")
 * @return Formatted string
 */
std::string currency(double amount, const std::string& currency);

/**
 * @brief Format a percentage with one decimal, e.g. "15.0%"
 */
std::string percent(double value);

/**
 * @brief Live label shown beside the tip slider, e.g. "Tip: 15.0%"
 */
std::string tip_label(double tip_percent);

/**
 * @brief Four-line result block
 *
 * Produces output like:
 * @code
 * Bill: $50.00
 * Tip (15.0%): $7.50
 * Total: $57.50
 * Each (x2): $28.75
 * @endcode
 *
 * @param result Calculation to format
 * @param currency Currency label (empty uses "$")
 */
std::string result_text(const CalculationResult& result, const std::string& currency);

/**
 * @brief Local date/time in "YYYY-MM-DD HH:MM:SS" form
 * @param timestamp Seconds since epoch
 */
std::string timestamp(int64_t timestamp);

/**
 * @brief One history list line
 *
 * Produces output like "2025-01-01 12:00:00 - $50.00 +15.0% -> $28.75/pp"
 */
std::string history_line(const HistoryRecord& record, const std::string& currency);

} // namespace tipcalc::fmt
