// Copyright (C) 2026 TipCalc Authors
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file display_manager.cpp
 * @brief LVGL display and input device lifecycle on top of the SDL driver
 *
 * @threading Main thread only
 * @gotchas NEVER call lv_display_delete/lv_group_delete manually - lv_deinit() handles all cleanup
 */

#include "display_manager.h"

#include <spdlog/spdlog.h>

#include <SDL.h>

DisplayManager::DisplayManager() = default;

DisplayManager::~DisplayManager() {
    shutdown();
}

bool DisplayManager::init(const Config& config) {
    if (m_initialized) {
        spdlog::warn("[DisplayManager] Already initialized, call shutdown() first");
        return false;
    }

    if (config.width <= 0 || config.height <= 0) {
        spdlog::error("[DisplayManager] Invalid window size {}x{}", config.width, config.height);
        return false;
    }

    m_width = config.width;
    m_height = config.height;

    lv_init();
    lv_tick_set_cb(get_ticks);

    m_display = lv_sdl_window_create(m_width, m_height);
    if (!m_display) {
        spdlog::error("[DisplayManager] Failed to create SDL window: {}", SDL_GetError());
        lv_deinit();
        m_width = 0;
        m_height = 0;
        return false;
    }
    lv_sdl_window_set_title(m_display, "Tip Calculator");

    // Mouse is optional on desktop
    m_pointer = lv_sdl_mouse_create();
    if (m_pointer) {
        configure_scroll(config.scroll_throw, config.scroll_limit);
    } else {
        spdlog::warn("[DisplayManager] No pointer input device created - mouse disabled");
    }

    m_keyboard = lv_sdl_keyboard_create();
    if (m_keyboard) {
        setup_keyboard_group();
        spdlog::debug("[DisplayManager] Physical keyboard input enabled");
    }

    spdlog::debug("[DisplayManager] Initialized: {}x{}", m_width, m_height);
    m_initialized = true;
    return true;
}

void DisplayManager::shutdown() {
    if (!m_initialized) {
        return;
    }

    spdlog::debug("[DisplayManager] Shutting down");

    // lv_deinit() clears groups, input devices and displays
    m_input_group = nullptr;
    m_keyboard = nullptr;
    m_pointer = nullptr;
    m_display = nullptr;

    lv_deinit();

    m_width = 0;
    m_height = 0;
    m_initialized = false;
}

void DisplayManager::configure_scroll(int scroll_throw, int scroll_limit) {
    if (!m_pointer) {
        return;
    }

    lv_indev_set_scroll_throw(m_pointer, static_cast<uint8_t>(scroll_throw));
    lv_indev_set_scroll_limit(m_pointer, static_cast<uint8_t>(scroll_limit));
    spdlog::debug("[DisplayManager] Scroll config: throw={}, limit={}", scroll_throw, scroll_limit);
}

void DisplayManager::setup_keyboard_group() {
    if (!m_keyboard) {
        return;
    }

    m_input_group = lv_group_create();
    lv_group_set_default(m_input_group);
    lv_indev_set_group(m_keyboard, m_input_group);
    spdlog::debug("[DisplayManager] Created default input group for keyboard");
}

// ============================================================================
// Static Timing Functions
// ============================================================================

uint32_t DisplayManager::get_ticks() {
    return SDL_GetTicks();
}

void DisplayManager::delay(uint32_t ms) {
    SDL_Delay(ms);
}
