// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026 TipCalc Authors

#include "runtime_config.h"

#include "config.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace tipcalc {

namespace {

bool parse_dimension(const char* text, int& out) {
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE || value <= 0 || value > 8192) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

} // namespace

ParseResult parse_command_line(int argc, const char* const* argv, RuntimeConfig& out,
                               std::string& error) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        // Options that take a value
        auto next_value = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                error = std::string(name) + " requires a value";
                return nullptr;
            }
            return argv[++i];
        };

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            return ParseResult::HELP;
        } else if (std::strcmp(arg, "-v") == 0) {
            out.verbosity = std::max(out.verbosity, 1);
        } else if (std::strcmp(arg, "-vv") == 0) {
            out.verbosity = 2;
        } else if (std::strcmp(arg, "--dark") == 0) {
            out.dark_mode = true;
        } else if (std::strcmp(arg, "--light") == 0) {
            out.dark_mode = false;
        } else if (std::strcmp(arg, "--config") == 0) {
            const char* value = next_value("--config");
            if (!value) {
                return ParseResult::ERROR;
            }
            out.config_path = value;
        } else if (std::strcmp(arg, "--history") == 0) {
            const char* value = next_value("--history");
            if (!value) {
                return ParseResult::ERROR;
            }
            out.history_path = value;
        } else if (std::strcmp(arg, "--width") == 0 || std::strcmp(arg, "--height") == 0) {
            bool is_width = std::strcmp(arg, "--width") == 0;
            const char* value = next_value(arg);
            if (!value) {
                return ParseResult::ERROR;
            }
            if (!parse_dimension(value, is_width ? out.width : out.height)) {
                error = std::string("invalid ") + arg + " value '" + value + "'";
                return ParseResult::ERROR;
            }
        } else {
            error = std::string("unknown argument '") + arg + "'";
            return ParseResult::ERROR;
        }
    }
    return ParseResult::OK;
}

std::string usage(const char* program) {
    std::string text = "Usage: ";
    text += program ? program : "tip-calculator";
    text += " [options]\n"
            "\n"
            "Options:\n"
            "  --config PATH    Settings file (default: tipcalcconfig.json)\n"
            "  --history PATH   History file (overrides TIPCALC_HISTORY_FILE and config)\n"
            "  --dark           Start in dark mode\n"
            "  --light          Start in light mode\n"
            "  --width N        Window width in pixels\n"
            "  --height N       Window height in pixels\n"
            "  -v, -vv          Debug / trace logging\n"
            "  -h, --help       Show this help\n";
    return text;
}

std::string resolve_history_path(const RuntimeConfig& runtime, Config& config) {
    if (!runtime.history_path.empty()) {
        spdlog::debug("[RuntimeConfig] History path from command line: {}", runtime.history_path);
        return runtime.history_path;
    }

    const char* env = std::getenv("TIPCALC_HISTORY_FILE");
    if (env != nullptr && env[0] != '\0') {
        spdlog::debug("[RuntimeConfig] History path from env var: {}", env);
        return env;
    }

    std::string path =
        config.get<std::string>(ConfigPaths::HISTORY_FILE, DEFAULT_HISTORY_FILE);
    if (path.empty()) {
        return DEFAULT_HISTORY_FILE;
    }
    return path;
}

spdlog::level::level_enum resolve_log_level(const RuntimeConfig& runtime, Config& config) {
    if (runtime.verbosity >= 2) {
        return spdlog::level::trace;
    }
    if (runtime.verbosity == 1) {
        return spdlog::level::debug;
    }

    std::string name = config.get<std::string>(ConfigPaths::LOG_LEVEL, "warn");
    spdlog::level::level_enum level = spdlog::level::from_str(name);
    // from_str() maps unknown names to off; only honour "off" when asked for
    if (level == spdlog::level::off && name != "off") {
        spdlog::warn("[RuntimeConfig] Unknown log_level '{}', using warn", name);
        return spdlog::level::warn;
    }
    return level;
}

} // namespace tipcalc
