// Copyright (C) 2026 TipCalc Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "tip_calculator.h"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace tipcalc {

namespace {

// Binary noise allowed above a whole cent, in ULPs of the scaled value
constexpr double CENT_NOISE_ULPS = 8.0;

std::string trim(const std::string& text) {
    size_t start = 0;
    size_t end = text.size();
    while (start < end && std::isspace(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(start, end - start);
}

// Whole-string decimal parse; rejects trailing garbage, inf and nan
bool parse_finite_double(const std::string& text, double& out) {
    std::string s = trim(text);
    if (s.empty()) {
        return false;
    }

    const char* begin = s.c_str();
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE || !std::isfinite(value)) {
        return false;
    }

    out = value;
    return true;
}

} // namespace

const char* calc_error_message(CalcError error) {
    switch (error) {
    case CalcError::INVALID_BILL:
        return "Please enter a valid bill amount.";
    case CalcError::NEGATIVE_BILL:
        return "Bill amount cannot be negative.";
    case CalcError::INVALID_PARTY_SIZE:
        return "Please enter a valid number of people (>=1).";
    case CalcError::INVALID_TIP_PERCENT:
        return "Please enter a valid tip percentage (>=0).";
    case CalcError::NONE:
    default:
        return "";
    }
}

CalcError parse_bill(const std::string& text, double& out) {
    double value = 0.0;
    if (!parse_finite_double(text, value)) {
        return CalcError::INVALID_BILL;
    }
    if (value < 0.0) {
        return CalcError::NEGATIVE_BILL;
    }
    out = value;
    return CalcError::NONE;
}

CalcError parse_party_size(const std::string& text, int& out) {
    std::string s = trim(text);
    if (s.empty()) {
        return CalcError::INVALID_PARTY_SIZE;
    }

    const char* begin = s.c_str();
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(begin, &end, 10);
    if (end == begin || *end != '\0' || errno == ERANGE) {
        return CalcError::INVALID_PARTY_SIZE;
    }
    if (value < 1 || value > INT_MAX) {
        return CalcError::INVALID_PARTY_SIZE;
    }

    out = static_cast<int>(value);
    return CalcError::NONE;
}

CalcError parse_tip_percent(const std::string& text, double& out) {
    double value = 0.0;
    if (!parse_finite_double(text, value) || value < 0.0) {
        return CalcError::INVALID_TIP_PERCENT;
    }
    out = value;
    return CalcError::NONE;
}

double round_up_to_cent(double value) {
    double scaled = value * 100.0;
    double nearest = std::nearbyint(scaled);
    double noise = CENT_NOISE_ULPS * std::numeric_limits<double>::epsilon() * std::fabs(scaled);

    double cents = (std::fabs(scaled - nearest) <= noise) ? nearest : std::ceil(scaled);
    if (cents == 0.0) {
        return 0.0; // no -0.0
    }
    return cents / 100.0;
}

double round_to_cent(double value) {
    return std::round(value * 100.0) / 100.0;
}

CalculationResult compute(const CalculationInput& input) {
    CalculationResult result;
    result.bill = input.bill;
    result.tip_percent = input.tip_percent;
    result.party_size = input.party_size;
    result.tip_amount = input.bill * (input.tip_percent / 100.0);
    result.total = input.bill + result.tip_amount;
    result.per_person = result.total / input.party_size;
    if (input.round_up) {
        result.per_person = round_up_to_cent(result.per_person);
    }
    return result;
}

CalcOutcome compute(const std::string& bill_text, double tip_percent,
                    const std::string& party_size_text, bool round_up) {
    CalcOutcome outcome;
    CalculationInput input;
    input.tip_percent = tip_percent;
    input.round_up = round_up;

    outcome.error = parse_bill(bill_text, input.bill);
    if (!outcome.ok()) {
        return outcome;
    }

    outcome.error = parse_party_size(party_size_text, input.party_size);
    if (!outcome.ok()) {
        return outcome;
    }

    outcome.result = compute(input);
    return outcome;
}

} // namespace tipcalc
