// Copyright (C) 2026 TipCalc Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <fstream>

namespace tipcalc {

Config::Config() : data(default_document()) {}

json Config::default_document() {
    return {{"currency", "$"},
            {"default_tip_percent", 15.0},
            {"dark_mode", false},
            {"history_file", DEFAULT_HISTORY_FILE},
            {"log_level", "warn"},
            {"display", {{"width", 480}, {"height", 800}}}};
}

bool Config::load(const std::string& path) {
    path_ = path;
    data = default_document();
    load_failed_ = false;

    std::ifstream in(path);
    if (!in) {
        spdlog::info("[Config] {} not found, creating with defaults", path);
        if (!save()) {
            spdlog::warn("[Config] Could not create {}", path);
        }
        return true;
    }

    json loaded;
    try {
        loaded = json::parse(in);
    } catch (const json::parse_error& e) {
        spdlog::warn("[Config] Cannot parse {}, using defaults: {}", path, e.what());
        load_failed_ = true;
        return false;
    }
    if (!loaded.is_object()) {
        spdlog::warn("[Config] {} is not a JSON object, using defaults", path);
        load_failed_ = true;
        return false;
    }

    data.merge_patch(loaded);
    spdlog::debug("[Config] Loaded {}", path);
    return true;
}

bool Config::save() {
    if (path_.empty()) {
        spdlog::error("[Config] Cannot save - no path loaded");
        return false;
    }
    if (load_failed_) {
        spdlog::warn("[Config] Not overwriting unreadable {}", path_);
        return false;
    }

    std::ofstream out(path_, std::ios::out | std::ios::trunc);
    if (!out) {
        spdlog::error("[Config] Cannot open {} for writing", path_);
        return false;
    }

    out << data.dump(2) << '\n';
    out.flush();
    if (!out) {
        spdlog::error("[Config] Write to {} failed", path_);
        return false;
    }

    spdlog::debug("[Config] Saved {}", path_);
    return true;
}

} // namespace tipcalc
