// Copyright (C) 2026 TipCalc Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "lvgl_test_fixture.h"

#include <chrono>
#include <thread>

std::once_flag LVGLTestFixture::s_init_flag;
bool LVGLTestFixture::s_initialized = false;
lv_display_t* LVGLTestFixture::s_display = nullptr;

// Partial rendering buffer, ten lines
static lv_color_t s_display_buf[TEST_DISPLAY_WIDTH * 10];

static void test_display_flush_cb(lv_display_t* disp, const lv_area_t* /*area*/,
                                  uint8_t* /*px_map*/) {
    lv_display_flush_ready(disp);
}

LVGLTestFixture::LVGLTestFixture() : m_test_screen(nullptr) {
    ensure_lvgl_initialized();
    m_test_screen = create_test_screen();
}

LVGLTestFixture::~LVGLTestFixture() {
    if (m_test_screen != nullptr) {
        // Never delete the active screen
        if (lv_screen_active() == m_test_screen) {
            lv_screen_load(lv_obj_create(nullptr));
        }
        lv_obj_delete(m_test_screen);
        m_test_screen = nullptr;
    }
    // Dialogs and keyboards left on the top layer
    lv_obj_clean(lv_layer_top());
}

void LVGLTestFixture::ensure_lvgl_initialized() {
    std::call_once(s_init_flag, []() {
        lv_init();

        s_display = lv_display_create(TEST_DISPLAY_WIDTH, TEST_DISPLAY_HEIGHT);
        if (s_display != nullptr) {
            lv_display_set_buffers(s_display, s_display_buf, nullptr, sizeof(s_display_buf),
                                   LV_DISPLAY_RENDER_MODE_PARTIAL);
            lv_display_set_flush_cb(s_display, test_display_flush_cb);
        }

        s_initialized = true;
    });
}

lv_obj_t* LVGLTestFixture::create_test_screen() {
    lv_obj_t* screen = lv_obj_create(nullptr);
    if (screen != nullptr) {
        lv_screen_load(screen);
    }
    return screen;
}

void LVGLTestFixture::process_lvgl(int ms) {
    constexpr int tick_interval_ms = 5;
    for (int elapsed = 0; elapsed < ms; elapsed += tick_interval_ms) {
        lv_tick_inc(tick_interval_ms);
        lv_timer_handler();
        if (ms > 50) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
}

void LVGLTestFixture::send_event(lv_obj_t* obj, lv_event_code_t code) {
    lv_obj_send_event(obj, code, nullptr);
}
