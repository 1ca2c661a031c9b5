// Copyright (C) 2026 TipCalc Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <lvgl.h>

/**
 * @brief Owns LVGL initialization and the SDL window
 *
 * Lifecycle:
 * 1. Create DisplayManager instance
 * 2. Call init() with desired configuration
 * 3. Use display(), pointer_input(), keyboard_input() as needed
 * 4. Call shutdown() or let destructor clean up
 *
 * Thread safety: All methods should be called from the main thread.
 *
 * @code
 * DisplayManager display_mgr;
 * DisplayManager::Config config;
 * config.width = 480;
 * config.height = 800;
 *
 * if (!display_mgr.init(config)) {
 *     spdlog::error("Failed to initialize display");
 *     return 1;
 * }
 * @endcode
 */
class DisplayManager {
  public:
    struct Config {
        int width = 480;       ///< Window width in pixels
        int height = 800;      ///< Window height in pixels
        int scroll_throw = 25; ///< Scroll momentum decay (1-99, higher = faster decay)
        int scroll_limit = 5;  ///< Pixels before scrolling starts
    };

    DisplayManager();
    ~DisplayManager();

    // Non-copyable, non-movable (owns unique resources)
    DisplayManager(const DisplayManager&) = delete;
    DisplayManager& operator=(const DisplayManager&) = delete;
    DisplayManager(DisplayManager&&) = delete;
    DisplayManager& operator=(DisplayManager&&) = delete;

    /**
     * @brief Initialize LVGL, open the window and create input devices
     *
     * @param config Display configuration
     * @return true on success, false on failure (logs error details)
     */
    bool init(const Config& config);

    /**
     * @brief Shutdown display and release resources
     *
     * Safe to call multiple times. Called automatically by destructor.
     */
    void shutdown();

    bool is_initialized() const {
        return m_initialized;
    }

    /// Display pointer, or nullptr if not initialized
    lv_display_t* display() const {
        return m_display;
    }

    lv_indev_t* pointer_input() const {
        return m_pointer;
    }

    lv_indev_t* keyboard_input() const {
        return m_keyboard;
    }

    int width() const {
        return m_width;
    }

    int height() const {
        return m_height;
    }

    // ========================================================================
    // Static Timing Functions
    // ========================================================================

    /**
     * @brief Milliseconds since SDL initialization (wraps at ~49 days)
     */
    static uint32_t get_ticks();

    static void delay(uint32_t ms);

  private:
    bool m_initialized = false;
    int m_width = 0;
    int m_height = 0;

    lv_display_t* m_display = nullptr;
    lv_indev_t* m_pointer = nullptr;
    lv_indev_t* m_keyboard = nullptr;
    lv_group_t* m_input_group = nullptr;

    void configure_scroll(int scroll_throw, int scroll_limit);
    void setup_keyboard_group();
};
