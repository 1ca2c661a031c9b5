// Copyright (C) 2026 TipCalc Authors
// SPDX-License-Identifier: GPL-3.0-or-later

#include "clipboard_backend.h"

#include "clipboard_backend_mock.h"
#include "clipboard_backend_sdl.h"

#include <SDL.h>
#include <spdlog/spdlog.h>

std::unique_ptr<ClipboardBackend> ClipboardBackend::create() {
    if (SDL_WasInit(SDL_INIT_VIDEO) != 0) {
        spdlog::debug("[ClipboardBackend] Using SDL clipboard");
        return std::make_unique<ClipboardBackendSdl>();
    }

    spdlog::warn("[ClipboardBackend] SDL video not initialized - using in-memory clipboard");
    return std::make_unique<ClipboardBackendMock>();
}

// ============================================================================
// ClipboardBackendSdl
// ============================================================================

bool ClipboardBackendSdl::set_text(const std::string& text) {
    if (SDL_SetClipboardText(text.c_str()) != 0) {
        spdlog::warn("[ClipboardBackend] SDL_SetClipboardText failed: {}", SDL_GetError());
        return false;
    }
    return true;
}

std::string ClipboardBackendSdl::get_text() const {
    char* raw = SDL_GetClipboardText();
    if (raw == nullptr) {
        return {};
    }
    std::string text(raw);
    SDL_free(raw);
    return text;
}
