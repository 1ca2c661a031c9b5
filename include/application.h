// Copyright (C) 2026 TipCalc Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "config.h"
#include "runtime_config.h"

#include <lvgl.h>
#include <memory>

class ClipboardBackend;
class DisplayManager;

namespace tipcalc {

class HistoryStore;
class TipCalculatorController;

namespace ui {
class TipCalculatorPanel;
}

/**
 * @brief Startup, main loop and shutdown for the tip calculator
 *
 * Startup order:
 * 1. Parse command line (--help exits 0, bad arguments exit 2)
 * 2. Load settings and configure logging
 * 3. Open the history store
 * 4. Open the window and build the form
 * 5. Run the LVGL loop until the window closes
 */
class Application {
  public:
    Application();
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @return Process exit code
     */
    int run(int argc, char** argv);

  private:
    bool init_config();
    void init_logging();
    bool init_display();
    void create_ui();
    void main_loop();
    void shutdown();

    static void on_display_deleted_cb(lv_event_t* e);

    RuntimeConfig m_runtime;
    Config m_config;

    std::unique_ptr<HistoryStore> m_history;
    std::unique_ptr<ClipboardBackend> m_clipboard;
    std::unique_ptr<DisplayManager> m_display;
    std::unique_ptr<ui::TipCalculatorPanel> m_panel;
    std::unique_ptr<TipCalculatorController> m_controller;

    bool m_running = false;
};

} // namespace tipcalc
