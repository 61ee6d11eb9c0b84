// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 chip8vm Contributors
//
// Platform Abstraction Layer - Common Types

#pragma once

#include <cstdint>

namespace pal {

/// Status returned by every fallible PAL call
enum class Result {
    Success = 0,
    NotInitialized,      // Service not opened, or platform not initialized
    AlreadyInitialized,  // open()/initialize() called twice
    InvalidParameter,
    NotSupported,        // Backend not compiled in, or host call refused
    DeviceNotFound,      // No display or audio device
    OutOfMemory,
    QueueFull,           // Audio queue would exceed its frame limit
    FrameInProgress,     // beginFrame() while a frame is open
    NoFrameInProgress    // endFrame() without beginFrame()
};

/// Compiled-in service providers
enum class Backend {
    None = 0,
    SDL2,
    Headless
};

/// Framebuffer pixel, packed 0xAARRGGBB (SDL_PIXELFORMAT_ARGB8888)
using Pixel = uint32_t;

constexpr Pixel packPixel(uint8_t r, uint8_t g, uint8_t b) noexcept {
    return 0xFF000000u |
           (static_cast<Pixel>(r) << 16) |
           (static_cast<Pixel>(g) << 8) |
           static_cast<Pixel>(b);
}

constexpr const char* toString(Result r) noexcept {
    switch (r) {
        case Result::Success:            return "Success";
        case Result::NotInitialized:     return "NotInitialized";
        case Result::AlreadyInitialized: return "AlreadyInitialized";
        case Result::InvalidParameter:   return "InvalidParameter";
        case Result::NotSupported:       return "NotSupported";
        case Result::DeviceNotFound:     return "DeviceNotFound";
        case Result::OutOfMemory:        return "OutOfMemory";
        case Result::QueueFull:          return "QueueFull";
        case Result::FrameInProgress:    return "FrameInProgress";
        case Result::NoFrameInProgress:  return "NoFrameInProgress";
    }
    return "Unknown";
}

constexpr const char* toString(Backend backend) noexcept {
    switch (backend) {
        case Backend::None:     return "None";
        case Backend::SDL2:     return "SDL2";
        case Backend::Headless: return "Headless";
    }
    return "Unknown";
}

constexpr bool succeeded(Result r) noexcept {
    return r == Result::Success;
}

constexpr bool failed(Result r) noexcept {
    return r != Result::Success;
}

} // namespace pal
