// Copyright (C) 2026 TipCalc Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "clipboard_backend.h"

/**
 * @brief In-memory clipboard for testing
 *
 * set_fail(true) makes set_text() report failure without changing contents.
 */
class ClipboardBackendMock : public ClipboardBackend {
  public:
    ClipboardBackendMock() = default;
    ~ClipboardBackendMock() override = default;

    bool set_text(const std::string& text) override;
    [[nodiscard]] std::string get_text() const override;
    [[nodiscard]] const char* name() const override {
        return "Mock";
    }

    void set_fail(bool fail) {
        fail_ = fail;
    }

    /// Number of successful set_text() calls
    [[nodiscard]] int set_count() const {
        return set_count_;
    }

  private:
    std::string text_;
    bool fail_ = false;
    int set_count_ = 0;
};
