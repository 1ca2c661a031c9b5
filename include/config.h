// Copyright (C) 2026 TipCalc Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

class ConfigTestFixture;

/**
 * @brief JSON pointer paths into tipcalcconfig.json
 */
namespace ConfigPaths {
constexpr const char* CURRENCY = "/currency";
constexpr const char* DEFAULT_TIP_PERCENT = "/default_tip_percent";
constexpr const char* DARK_MODE = "/dark_mode";
constexpr const char* HISTORY_FILE = "/history_file";
constexpr const char* LOG_LEVEL = "/log_level";
constexpr const char* DISPLAY_WIDTH = "/display/width";
constexpr const char* DISPLAY_HEIGHT = "/display/height";
} // namespace ConfigPaths

namespace tipcalc {

constexpr const char* DEFAULT_CONFIG_FILE = "tipcalcconfig.json";
constexpr const char* DEFAULT_HISTORY_FILE = "tip_history.json";

/**
 * @brief Persistent user settings stored as a JSON document
 *
 * Values are addressed by JSON pointer (see ConfigPaths). A missing file is
 * created from defaults; an unreadable file leaves the defaults in memory and
 * the file untouched.
 *
 * ## Config Format (tipcalcconfig.json)
 *
 * ```json
 * {
 *   "currency": "$",
 *   "default_tip_percent": 15.0,
 *   "dark_mode": false,
 *   "history_file": "tip_history.json",
 *   "log_level": "warn",
 *   "display": { "width": 480, "height": 800 }
 * }
 * ```
 *
 * One instance is created by Application and handed to whatever needs it.
 */
class Config {
  public:
    Config();

    /**
     * @brief Load settings from @p path
     *
     * Keys absent from the file keep their default values.
     *
     * @return true if the file was read (or created), false if defaults are in use
     *         because the file could not be parsed
     */
    bool load(const std::string& path);

    /**
     * @brief Write the current document back to the loaded path
     *
     * Refused after load() rejected the file, so a hand-edited file with a typo
     * is never replaced by defaults.
     *
     * @return true if save succeeded
     */
    bool save();

    /**
     * @brief Get value at JSON pointer (throws if missing or wrong type)
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].get<T>();
    }

    /**
     * @brief Get value at JSON pointer, or @p default_value if absent, null or mistyped
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        try {
            json::json_pointer ptr(json_ptr);
            if (!data.contains(ptr) || data[ptr].is_null()) {
                return default_value;
            }
            return data[ptr].get<T>();
        } catch (const json::exception& e) {
            spdlog::warn("[Config] Bad value at {}: {}", json_ptr, e.what());
            return default_value;
        }
    }

    template <typename T> void set(const std::string& json_ptr, const T& value) {
        data[json::json_pointer(json_ptr)] = value;
    }

    [[nodiscard]] const std::string& path() const {
        return path_;
    }

    /**
     * @brief Document used when no config file exists
     */
    static json default_document();

  protected:
    json data;
    std::string path_;
    bool load_failed_ = false;

    friend class ::ConfigTestFixture;
};

} // namespace tipcalc
