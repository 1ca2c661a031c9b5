// Copyright (C) 2026 TipCalc Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "tip_history.h"

#include <spdlog/spdlog.h>

#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <utility>

using json = nlohmann::json;

namespace tipcalc {

namespace {

// Field names in the backing file
constexpr const char* KEY_TIME = "time";
constexpr const char* KEY_BILL = "bill";
constexpr const char* KEY_TIP_PERCENT = "tip_percent";
constexpr const char* KEY_PEOPLE = "people";
constexpr const char* KEY_PER_PERSON = "per_person";
constexpr const char* KEY_TOTAL = "total";

json record_to_json(const HistoryRecord& record) {
    return json{{KEY_TIME, record.timestamp},         {KEY_BILL, record.bill},
                {KEY_TIP_PERCENT, record.tip_percent}, {KEY_PEOPLE, record.party_size},
                {KEY_PER_PERSON, record.per_person},   {KEY_TOTAL, record.total}};
}

// Integer field within [min, max]; floats and out-of-range values are rejected
bool read_integer(const json& value, int64_t min, int64_t max, int64_t& out) {
    if (value.is_number_unsigned()) {
        uint64_t u = value.get<uint64_t>();
        if (u > static_cast<uint64_t>(max)) {
            return false;
        }
        out = static_cast<int64_t>(u);
    } else if (value.is_number_integer()) {
        out = value.get<int64_t>();
    } else {
        return false;
    }
    return out >= min && out <= max;
}

std::optional<HistoryRecord> record_from_json(const json& item) {
    if (!item.is_object()) {
        return std::nullopt;
    }

    auto is_number = [&](const char* key) {
        return item.contains(key) && item[key].is_number();
    };
    if (!is_number(KEY_BILL) || !is_number(KEY_TIP_PERCENT) || !is_number(KEY_PER_PERSON) ||
        !is_number(KEY_TOTAL) || !item.contains(KEY_PEOPLE)) {
        return std::nullopt;
    }

    HistoryRecord record;

    int64_t people = 0;
    if (!read_integer(item[KEY_PEOPLE], 1, std::numeric_limits<int>::max(), people)) {
        return std::nullopt;
    }
    record.party_size = static_cast<int>(people);

    // Entries without a time load with timestamp 0
    if (item.contains(KEY_TIME) &&
        !read_integer(item[KEY_TIME], std::numeric_limits<int64_t>::min(),
                      std::numeric_limits<int64_t>::max(), record.timestamp)) {
        return std::nullopt;
    }

    record.bill = item[KEY_BILL].get<double>();
    record.tip_percent = item[KEY_TIP_PERCENT].get<double>();
    record.per_person = item[KEY_PER_PERSON].get<double>();
    record.total = item[KEY_TOTAL].get<double>();
    return record;
}

} // namespace

// ============================================================================
// HistoryRecord
// ============================================================================

HistoryRecord HistoryRecord::from_result(const CalculationResult& result, int64_t timestamp) {
    HistoryRecord record;
    record.timestamp = timestamp;
    record.bill = round_to_cent(result.bill);
    record.tip_percent = round_to_cent(result.tip_percent);
    record.party_size = result.party_size;
    record.per_person = round_to_cent(result.per_person);
    record.total = round_to_cent(result.total);
    return record;
}

bool HistoryRecord::operator==(const HistoryRecord& other) const {
    return timestamp == other.timestamp && bill == other.bill &&
           tip_percent == other.tip_percent && party_size == other.party_size &&
           per_person == other.per_person && total == other.total;
}

// ============================================================================
// HistoryStore
// ============================================================================

HistoryStore::HistoryStore(std::string path) : path_(std::move(path)) {
    spdlog::debug("[HistoryStore] Using {}", path_);
}

std::vector<HistoryRecord> HistoryStore::load_all() {
    entries_ = read_file();
    return entries_;
}

HistoryError HistoryStore::append(const HistoryRecord& record) {
    std::vector<HistoryRecord> records = read_file();
    records.insert(records.begin(), record);
    if (records.size() > MAX_ENTRIES) {
        records.resize(MAX_ENTRIES);
    }

    HistoryError error = write_file(records);
    if (error.success()) {
        entries_ = std::move(records);
    } else {
        spdlog::warn("[HistoryStore] Failed to save history to {}: {}", path_, error.detail);
        entries_ = read_file();
    }
    return error;
}

std::optional<HistoryRecord> HistoryStore::select(size_t index) const {
    if (index >= entries_.size()) {
        return std::nullopt;
    }
    return entries_[index];
}

std::vector<HistoryRecord> HistoryStore::read_file() const {
    std::vector<HistoryRecord> records;

    std::ifstream in(path_);
    if (!in) {
        spdlog::debug("[HistoryStore] No history file at {}", path_);
        return records;
    }

    json data;
    try {
        data = json::parse(in);
    } catch (const json::parse_error& e) {
        spdlog::warn("[HistoryStore] Ignoring unreadable history file {}: {}", path_, e.what());
        return records;
    }
    if (!data.is_array()) {
        spdlog::warn("[HistoryStore] Ignoring history file {}: not a list", path_);
        return records;
    }

    for (const auto& item : data) {
        if (records.size() >= MAX_ENTRIES) {
            break;
        }
        auto record = record_from_json(item);
        if (!record) {
            spdlog::debug("[HistoryStore] Skipping malformed entry: {}", item.dump());
            continue;
        }
        records.push_back(*record);
    }

    spdlog::trace("[HistoryStore] Loaded {} entries", records.size());
    return records;
}

HistoryError HistoryStore::write_file(const std::vector<HistoryRecord>& records) const {
    json data = json::array();
    for (const auto& record : records) {
        data.push_back(record_to_json(record));
    }

    std::ofstream out(path_, std::ios::out | std::ios::trunc);
    if (!out) {
        return {HistoryResult::OPEN_FAILED, "cannot open " + path_ + " for writing"};
    }

    out << data.dump(2) << '\n';
    out.flush();
    if (!out) {
        return {HistoryResult::WRITE_FAILED, "write to " + path_ + " did not complete"};
    }

    spdlog::trace("[HistoryStore] Wrote {} entries", records.size());
    return HistoryError::ok();
}

} // namespace tipcalc
