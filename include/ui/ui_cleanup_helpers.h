// Copyright (C) 2026 TipCalc Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file ui_cleanup_helpers.h
 * @brief Null-safe deletion for widgets owned outside the panel tree
 *
 * @code{.cpp}
 * safe_delete_obj(keyboard_); // keyboard_ == nullptr afterwards
 * @endcode
 */

#include <lvgl.h>

namespace tipcalc::ui {

/**
 * @brief Delete an LVGL object and null the pointer
 *
 * No-op for nullptr.
 */
inline void safe_delete_obj(lv_obj_t*& obj) {
    if (obj) {
        lv_obj_delete(obj);
        obj = nullptr;
    }
}

} // namespace tipcalc::ui
