// Copyright (C) 2026 TipCalc Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/common.h>

#include <optional>
#include <string>

namespace tipcalc {

class Config;

/**
 * @brief Settings that come from the command line for a single run
 *
 * Anything left unset here falls through to the environment, then to Config.
 */
struct RuntimeConfig {
    std::string config_path;        ///< --config (empty = tipcalcconfig.json)
    std::string history_path;       ///< --history (empty = not given)
    std::optional<bool> dark_mode;  ///< --dark / --light
    int verbosity = 0;              ///< -v = debug, -vv = trace
    int width = 0;                  ///< --width (0 = from config)
    int height = 0;                 ///< --height (0 = from config)
};

enum class ParseResult {
    OK,
    HELP,  ///< -h/--help given; print usage and exit 0
    ERROR, ///< Unknown or malformed argument; print usage and exit 2
};

/**
 * @brief Parse argv into @p out
 * @param error Set to a one-line description when ERROR is returned
 */
ParseResult parse_command_line(int argc, const char* const* argv, RuntimeConfig& out,
                               std::string& error);

/**
 * @brief Usage text for --help
 */
std::string usage(const char* program);

/**
 * @brief History file path
 *
 * Priority: --history, then TIPCALC_HISTORY_FILE, then /history_file in config,
 * then tip_history.json.
 */
std::string resolve_history_path(const RuntimeConfig& runtime, Config& config);

/**
 * @brief Log level
 *
 * Priority: -v/-vv, then /log_level in config, then warn.
 */
spdlog::level::level_enum resolve_log_level(const RuntimeConfig& runtime, Config& config);

} // namespace tipcalc
