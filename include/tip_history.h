// Copyright (C) 2026 TipCalc Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tip_calculator.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tipcalc {

/**
 * @brief Snapshot of one completed calculation
 *
 * Currency values are rounded to the cent when created with from_result().
 *
 * ## File format (one array element)
 *
 * ```json
 * {
 *   "time": 1735689600,
 *   "bill": 50.0,
 *   "tip_percent": 15.0,
 *   "people": 2,
 *   "per_person": 28.75,
 *   "total": 57.5
 * }
 * ```
 */
struct HistoryRecord {
    int64_t timestamp = 0; ///< Seconds since epoch
    double bill = 0.0;
    double tip_percent = 0.0;
    int party_size = 1;
    double per_person = 0.0;
    double total = 0.0;

    /**
     * @brief Build a record from a calculation result
     * @param result Completed calculation
     * @param timestamp Seconds since epoch
     */
    static HistoryRecord from_result(const CalculationResult& result, int64_t timestamp);

    bool operator==(const HistoryRecord& other) const;
};

enum class HistoryResult {
    SUCCESS,
    OPEN_FAILED,  ///< Backing file could not be opened for writing
    WRITE_FAILED, ///< Open succeeded but the write did not complete
};

/**
 * @brief Outcome of a history write
 *
 * Write failures are never surfaced to the user; the caller logs them and
 * carries on showing the calculation.
 */
struct HistoryError {
    HistoryResult result = HistoryResult::SUCCESS;
    std::string detail;

    [[nodiscard]] bool success() const {
        return result == HistoryResult::SUCCESS;
    }

    static HistoryError ok() {
        return {};
    }
};

/**
 * @brief Bounded, most-recent-first calculation log backed by a JSON file
 *
 * A missing, unreadable or corrupt file reads as an empty log. Every append
 * rewrites the whole file with at most MAX_ENTRIES records.
 *
 * Single-instance, single-threaded use only; concurrent writers get
 * last-writer-wins behaviour.
 *
 * @code
 * HistoryStore store("tip_history.json");
 * auto records = store.load_all();
 * HistoryError err = store.append(HistoryRecord::from_result(result, std::time(nullptr)));
 * if (!err.success()) {
 *     spdlog::warn("History not saved: {}", err.detail);
 * }
 * @endcode
 */
class HistoryStore {
  public:
    static constexpr size_t MAX_ENTRIES = 20;

    explicit HistoryStore(std::string path);

    /**
     * @brief Read the backing file
     *
     * Also replaces the cached log used by select().
     *
     * @return Records, most recent first, at most MAX_ENTRIES; empty on any read failure
     */
    std::vector<HistoryRecord> load_all();

    /**
     * @brief Insert a record at the front, truncate, and rewrite the file
     *
     * The file is re-read first so records written by a previous session are kept.
     */
    HistoryError append(const HistoryRecord& record);

    /**
     * @brief Record at @p index in the most recently loaded log
     * @return std::nullopt if the index is out of range
     */
    [[nodiscard]] std::optional<HistoryRecord> select(size_t index) const;

    /**
     * @brief Log as of the last load_all() or successful append()
     */
    [[nodiscard]] const std::vector<HistoryRecord>& entries() const {
        return entries_;
    }

    [[nodiscard]] const std::string& path() const {
        return path_;
    }

  private:
    std::vector<HistoryRecord> read_file() const;
    HistoryError write_file(const std::vector<HistoryRecord>& records) const;

    std::string path_;
    std::vector<HistoryRecord> entries_;
};

} // namespace tipcalc
