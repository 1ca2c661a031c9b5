// Copyright (C) 2026 TipCalc Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "clipboard_backend.h"

/**
 * @brief Desktop clipboard via SDL2
 *
 * Requires the SDL video subsystem, which the LVGL SDL driver initializes
 * when the window is created.
 */
class ClipboardBackendSdl : public ClipboardBackend {
  public:
    ClipboardBackendSdl() = default;
    ~ClipboardBackendSdl() override = default;

    bool set_text(const std::string& text) override;
    [[nodiscard]] std::string get_text() const override;
    [[nodiscard]] const char* name() const override {
        return "SDL";
    }
};
