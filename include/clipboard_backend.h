// Copyright (C) 2026 TipCalc Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <memory>
#include <string>

/**
 * @brief Abstract system clipboard
 *
 * The SDL implementation talks to the desktop clipboard; the mock keeps the
 * text in memory for tests and headless runs.
 */
class ClipboardBackend {
  public:
    virtual ~ClipboardBackend() = default;

    /**
     * @brief Replace clipboard contents
     * @return true if the clipboard accepted the text
     */
    virtual bool set_text(const std::string& text) = 0;

    /**
     * @brief Current clipboard contents (empty if none or unavailable)
     */
    [[nodiscard]] virtual std::string get_text() const = 0;

    [[nodiscard]] virtual const char* name() const = 0;

    /**
     * @brief Create the best available backend
     *
     * Uses SDL when its video subsystem is running, otherwise falls back to
     * the in-memory mock.
     */
    static std::unique_ptr<ClipboardBackend> create();
};
