// Copyright (C) 2026 TipCalc Authors
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file application.cpp
 * @brief Application lifecycle
 *
 * @threading Main thread only
 * @gotchas The controller and panel must be destroyed before DisplayManager calls lv_deinit()
 */

#include "application.h"

#include "ui_panel_tip_calculator.h"

#include "clipboard_backend.h"
#include "display_manager.h"
#include "tip_calculator_controller.h"
#include "tip_history.h"

#include <spdlog/spdlog.h>

#include <cstdio>

namespace tipcalc {

namespace {
constexpr uint32_t LOOP_DELAY_MS = 5;
}

Application::Application() = default;

Application::~Application() {
    shutdown();
}

int Application::run(int argc, char** argv) {
    std::string error;
    switch (parse_command_line(argc, argv, m_runtime, error)) {
    case ParseResult::HELP:
        std::fputs(usage(argv[0]).c_str(), stdout);
        return 0;
    case ParseResult::ERROR:
        std::fprintf(stderr, "%s: %s\n\n%s", argv[0], error.c_str(), usage(argv[0]).c_str());
        return 2;
    case ParseResult::OK:
        break;
    }

    if (!init_config()) {
        spdlog::warn("[Application] Continuing with default settings");
    }
    init_logging();

    m_history = std::make_unique<HistoryStore>(resolve_history_path(m_runtime, m_config));
    spdlog::info("[Application] History file: {}", m_history->path());

    if (!init_display()) {
        return 1;
    }

    create_ui();
    main_loop();
    shutdown();
    return 0;
}

bool Application::init_config() {
    std::string path = m_runtime.config_path.empty() ? DEFAULT_CONFIG_FILE : m_runtime.config_path;
    return m_config.load(path);
}

void Application::init_logging() {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(resolve_log_level(m_runtime, m_config));
}

bool Application::init_display() {
    DisplayManager::Config config;
    config.width = m_runtime.width > 0
                       ? m_runtime.width
                       : m_config.get<int>(ConfigPaths::DISPLAY_WIDTH, config.width);
    config.height = m_runtime.height > 0
                        ? m_runtime.height
                        : m_config.get<int>(ConfigPaths::DISPLAY_HEIGHT, config.height);

    m_display = std::make_unique<DisplayManager>();
    if (!m_display->init(config)) {
        spdlog::error("[Application] Failed to initialize display");
        m_display.reset();
        return false;
    }

    // Window close deletes the display
    lv_display_add_event_cb(m_display->display(), on_display_deleted_cb, LV_EVENT_DELETE,
                            this);
    return true;
}

void Application::create_ui() {
    m_clipboard = ClipboardBackend::create();

    TipCalculatorController::Options options;
    options.default_tip_percent =
        m_config.get<double>(ConfigPaths::DEFAULT_TIP_PERCENT, options.default_tip_percent);
    if (options.default_tip_percent < 0.0) {
        spdlog::warn("[Application] Ignoring negative default_tip_percent {}",
                     options.default_tip_percent);
        options.default_tip_percent = 15.0;
    }
    options.dark_mode = m_runtime.dark_mode.value_or(
        m_config.get<bool>(ConfigPaths::DARK_MODE, options.dark_mode));

    m_panel = std::make_unique<ui::TipCalculatorPanel>();
    m_panel->create(lv_screen_active());
    m_panel->set_currency_text(m_config.get<std::string>(ConfigPaths::CURRENCY, "$"));

    m_controller =
        std::make_unique<TipCalculatorController>(*m_panel, *m_history, *m_clipboard, options);
    m_controller->set_theme_changed_callback([this](bool dark) {
        m_config.set(ConfigPaths::DARK_MODE, dark);
        if (!m_config.save()) {
            spdlog::warn("[Application] Theme preference not saved");
        }
    });
    m_panel->bind(m_controller.get());
    m_controller->attach();

    spdlog::info("[Application] Ready ({} history entries, clipboard {})",
                 m_history->entries().size(), m_clipboard->name());
}

void Application::main_loop() {
    m_running = true;
    while (m_running) {
        uint32_t idle_ms = lv_timer_handler();
        DisplayManager::delay(idle_ms < LOOP_DELAY_MS ? idle_ms : LOOP_DELAY_MS);
    }
    spdlog::debug("[Application] Main loop exited");
}

void Application::shutdown() {
    if (m_panel) {
        m_panel->bind(nullptr);
    }
    m_controller.reset();
    m_panel.reset();
    m_display.reset();
    m_clipboard.reset();
}

void Application::on_display_deleted_cb(lv_event_t* e) {
    auto* self = static_cast<Application*>(lv_event_get_user_data(e));
    if (self) {
        self->m_running = false;
    }
}

} // namespace tipcalc
