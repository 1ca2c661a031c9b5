// Copyright (C) 2026 TipCalc Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "../test_helpers.h"
#include "tip_history.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>

using namespace tipcalc;
using Catch::Approx;

// ============================================================================
// Test Helpers
// ============================================================================

namespace {

HistoryRecord make_record(int64_t ts, double bill, double tip = 15.0, int people = 1) {
    CalculationInput input;
    input.bill = bill;
    input.tip_percent = tip;
    input.party_size = people;
    return HistoryRecord::from_result(compute(input), ts);
}

} // namespace

// ============================================================================
// HistoryRecord
// ============================================================================

TEST_CASE("HistoryRecord::from_result stores values rounded to the cent", "[history]") {
    CalculationInput input;
    input.bill = 100.0;
    input.tip_percent = 10.0;
    input.party_size = 3;

    HistoryRecord record = HistoryRecord::from_result(compute(input), 1700000000);

    REQUIRE(record.timestamp == 1700000000);
    REQUIRE(record.bill == Approx(100.0));
    REQUIRE(record.tip_percent == Approx(10.0));
    REQUIRE(record.party_size == 3);
    REQUIRE(record.per_person == Approx(36.67));
    REQUIRE(record.total == Approx(110.0));
}

// ============================================================================
// Loading
// ============================================================================

TEST_CASE("HistoryStore: missing file reads as empty", "[history]") {
    TempDir dir;
    HistoryStore store(dir.file("none.json"));

    REQUIRE(store.load_all().empty());
    REQUIRE(store.entries().empty());
    REQUIRE_FALSE(store.select(0).has_value());
}

TEST_CASE("HistoryStore: unreadable file reads as empty", "[history]") {
    TempDir dir;
    std::string path = dir.file("history.json");

    SECTION("not JSON") {
        write_file(path, "this is not json {");
    }
    SECTION("JSON but not a list") {
        write_file(path, R"({"bill": 10})");
    }
    SECTION("empty file") {
        write_file(path, "");
    }

    HistoryStore store(path);
    REQUIRE(store.load_all().empty());
}

TEST_CASE("HistoryStore: malformed entries are skipped", "[history]") {
    TempDir dir;
    std::string path = dir.file("history.json");
    write_file(path, R"([
        {"time": 1, "bill": 10.0, "tip_percent": 15.0, "people": 1, "per_person": 11.5, "total": 11.5},
        "garbage",
        {"time": 2, "bill": "ten", "tip_percent": 15.0, "people": 1, "per_person": 11.5, "total": 11.5},
        {"time": 3, "bill": 20.0, "tip_percent": 10.0, "per_person": 22.0, "total": 22.0},
        {"time": 4, "bill": 30.0, "tip_percent": 10.0, "people": 2, "per_person": 16.5, "total": 33.0}
    ])");

    HistoryStore store(path);
    auto records = store.load_all();

    REQUIRE(records.size() == 2);
    REQUIRE(records[0].timestamp == 1);
    REQUIRE(records[1].timestamp == 4);
    REQUIRE(records[1].party_size == 2);
}

TEST_CASE("HistoryStore: out-of-range integer fields are skipped", "[history]") {
    TempDir dir;
    std::string path = dir.file("history.json");

    auto entry = [](const std::string& time, const std::string& people) {
        return R"({"time": )" + time + R"(, "bill": 10.0, "tip_percent": 15.0, "people": )" +
               people + R"(, "per_person": 11.5, "total": 11.5})";
    };

    std::string bad;
    SECTION("time too large for a float-to-int conversion") {
        bad = entry("1e300", "1");
    }
    SECTION("fractional time") {
        bad = entry("1.5", "1");
    }
    SECTION("time above int64 range") {
        bad = entry("18446744073709551615", "1");
    }
    SECTION("people above int range") {
        bad = entry("2", "5000000000");
    }
    SECTION("zero people") {
        bad = entry("2", "0");
    }
    SECTION("negative people") {
        bad = entry("2", "-1");
    }
    SECTION("fractional people") {
        bad = entry("2", "2.5");
    }

    write_file(path, "[" + entry("1", "1") + ", " + bad + ", " + entry("3", "4") + "]");

    HistoryStore store(path);
    auto records = store.load_all();

    REQUIRE(records.size() == 2);
    REQUIRE(records[0].timestamp == 1);
    REQUIRE(records[1].timestamp == 3);
    REQUIRE(records[1].party_size == 4);
}

TEST_CASE("HistoryStore: integer fields at their limits load", "[history]") {
    TempDir dir;
    std::string path = dir.file("history.json");
    write_file(path, R"([
        {"time": 9223372036854775807, "bill": 10.0, "tip_percent": 15.0, "people": 2147483647, "per_person": 0.01, "total": 11.5},
        {"bill": 10.0, "tip_percent": 15.0, "people": 1, "per_person": 11.5, "total": 11.5}
    ])");

    HistoryStore store(path);
    auto records = store.load_all();

    REQUIRE(records.size() == 2);
    REQUIRE(records[0].timestamp == INT64_MAX);
    REQUIRE(records[0].party_size == INT32_MAX);
    // Entries without a time still load
    REQUIRE(records[1].timestamp == 0);
}

TEST_CASE("HistoryStore: load caps at MAX_ENTRIES", "[history]") {
    TempDir dir;
    std::string path = dir.file("history.json");

    nlohmann::json data = nlohmann::json::array();
    for (int i = 0; i < 25; i++) {
        data.push_back({{"time", i},
                        {"bill", 10.0},
                        {"tip_percent", 15.0},
                        {"people", 1},
                        {"per_person", 11.5},
                        {"total", 11.5}});
    }
    write_file(path, data.dump());

    HistoryStore store(path);
    auto records = store.load_all();
    REQUIRE(records.size() == HistoryStore::MAX_ENTRIES);
    REQUIRE(records.front().timestamp == 0);
    REQUIRE(records.back().timestamp == 19);
}

// ============================================================================
// Appending
// ============================================================================

TEST_CASE("HistoryStore: append puts newest first and persists", "[history]") {
    TempDir dir;
    std::string path = dir.file("history.json");

    {
        HistoryStore store(path);
        REQUIRE(store.append(make_record(100, 10.0)).success());
        REQUIRE(store.append(make_record(200, 20.0)).success());

        REQUIRE(store.entries().size() == 2);
        REQUIRE(store.entries()[0].timestamp == 200);
        REQUIRE(store.entries()[1].timestamp == 100);
    }

    // A fresh store sees the same list
    HistoryStore reopened(path);
    auto records = reopened.load_all();
    REQUIRE(records.size() == 2);
    REQUIRE(records[0] == make_record(200, 20.0));
    REQUIRE(records[1] == make_record(100, 10.0));
}

TEST_CASE("HistoryStore: file uses the documented field names", "[history]") {
    TempDir dir;
    std::string path = dir.file("history.json");

    HistoryStore store(path);
    REQUIRE(store.append(make_record(1700000000, 50.0, 15.0, 2)).success());

    auto data = nlohmann::json::parse(read_file(path));
    REQUIRE(data.is_array());
    REQUIRE(data.size() == 1);
    const auto& entry = data[0];
    REQUIRE(entry["time"] == 1700000000);
    REQUIRE(entry["bill"].get<double>() == Approx(50.0));
    REQUIRE(entry["tip_percent"].get<double>() == Approx(15.0));
    REQUIRE(entry["people"] == 2);
    REQUIRE(entry["per_person"].get<double>() == Approx(28.75));
    REQUIRE(entry["total"].get<double>() == Approx(57.5));
}

TEST_CASE("HistoryStore: 21 appends keep the 20 newest", "[history]") {
    TempDir dir;
    HistoryStore store(dir.file("history.json"));

    for (int i = 1; i <= 21; i++) {
        REQUIRE(store.append(make_record(i, static_cast<double>(i))).success());
    }

    auto records = store.load_all();
    REQUIRE(records.size() == 20);
    REQUIRE(records.front().timestamp == 21);
    REQUIRE(records.back().timestamp == 2);
}

TEST_CASE("HistoryStore: append picks up changes made by another writer", "[history]") {
    TempDir dir;
    std::string path = dir.file("history.json");

    HistoryStore first(path);
    HistoryStore second(path);
    REQUIRE(first.append(make_record(1, 10.0)).success());
    REQUIRE(second.append(make_record(2, 20.0)).success());

    auto records = first.load_all();
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].timestamp == 2);
}

TEST_CASE("HistoryStore: append over a corrupt file starts a new list", "[history]") {
    TempDir dir;
    std::string path = dir.file("history.json");
    write_file(path, "[{ broken");

    HistoryStore store(path);
    REQUIRE(store.append(make_record(5, 12.0)).success());
    REQUIRE(store.load_all().size() == 1);
}

TEST_CASE("HistoryStore: write failure is reported and logged", "[history]") {
    TempDir dir;
    // Parent directory does not exist
    HistoryStore store(dir.file("missing_dir/history.json"));

    LogCapture log;
    HistoryError error = store.append(make_record(1, 10.0));

    REQUIRE_FALSE(error.success());
    REQUIRE(error.result == HistoryResult::OPEN_FAILED);
    REQUIRE_FALSE(error.detail.empty());
    REQUIRE(log.contains("warning: [HistoryStore] Failed to save history"));
    REQUIRE(store.entries().empty());
}

// ============================================================================
// Selection
// ============================================================================

TEST_CASE("HistoryStore::select reads from the last loaded list", "[history]") {
    TempDir dir;
    HistoryStore store(dir.file("history.json"));
    REQUIRE(store.append(make_record(1, 10.0)).success());
    REQUIRE(store.append(make_record(2, 20.0)).success());

    auto first = store.select(0);
    REQUIRE(first.has_value());
    REQUIRE(first->timestamp == 2);
    REQUIRE(first->bill == Approx(20.0));

    REQUIRE(store.select(1).has_value());
    REQUIRE_FALSE(store.select(2).has_value());
}
