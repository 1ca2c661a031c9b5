// Copyright (C) 2026 TipCalc Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "clipboard_backend_mock.h"

#include <spdlog/spdlog.h>

bool ClipboardBackendMock::set_text(const std::string& text) {
    if (fail_) {
        spdlog::debug("[ClipboardMock] Simulated failure");
        return false;
    }
    text_ = text;
    ++set_count_;
    spdlog::trace("[ClipboardMock] Stored {} bytes", text.size());
    return true;
}

std::string ClipboardBackendMock::get_text() const {
    return text_;
}
