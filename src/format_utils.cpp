// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026 TipCalc Authors

#include "format_utils.h"

#include <cstdio>
#include <ctime>

namespace tipcalc::fmt {

std::string currency_or_default(const std::string& currency) {
    return currency.empty() ? std::string(DEFAULT_CURRENCY) : currency;
}

namespace {

// printf-style fixed-point text sized to fit, so very large values keep every digit
std::string fixed(const char* format, double value) {
    int len = std::snprintf(nullptr, 0, format, value);
    if (len <= 0) {
        return {};
    }
    std::string text(static_cast<size_t>(len), '\0');
    std::snprintf(&text[0], text.size() + 1, format, value);
    return text;
}

} // namespace

std::string amount(double value) {
    return fixed("%.2f", value);
}

std::string currency(double value, const std::string& currency) {
    return currency_or_default(currency) + amount(value);
}

std::string percent(double value) {
    return fixed("%.1f", value) + "%";
}

std::string tip_label(double tip_percent) {
    return "Tip: " + percent(tip_percent);
}

std::string result_text(const CalculationResult& result, const std::string& currency_label) {
    std::string c = currency_or_default(currency_label);

    std::string text;
    text += "Bill: " + currency(result.bill, c) + "\n";
    text += "Tip (" + percent(result.tip_percent) + "): " + currency(result.tip_amount, c) + "\n";
    text += "Total: " + currency(result.total, c) + "\n";
    text += "Each (x" + std::to_string(result.party_size) + "): " + currency(result.per_person, c);
    return text;
}

std::string timestamp(int64_t timestamp) {
    std::time_t t = static_cast<std::time_t>(timestamp);
    std::tm local{};
    if (localtime_r(&t, &local) == nullptr) {
        return "????-??-?? ??:??:??";
    }

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
    return std::string(buf);
}

std::string history_line(const HistoryRecord& record, const std::string& currency_label) {
    std::string c = currency_or_default(currency_label);
    return timestamp(record.timestamp) + " - " + currency(record.bill, c) + " +" +
           percent(record.tip_percent) + " -> " + currency(record.per_person, c) + "/pp";
}

} // namespace tipcalc::fmt
