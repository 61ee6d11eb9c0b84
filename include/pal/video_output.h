// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 chip8vm Contributors
//
// Platform Abstraction Layer - Video Output Interface

#pragma once

#include "pal/types.h"
#include <cstddef>
#include <cstdint>

namespace pal {

/// Window and framebuffer geometry
///
/// The framebuffer has one Pixel per emulated pixel; the window is
/// frame_width * scale by frame_height * scale and every framebuffer
/// pixel is presented as a scale x scale block.
struct VideoConfig {
    const char* title = "CHIP-8";
    uint32_t frame_width = 64;
    uint32_t frame_height = 32;
    uint32_t scale = 10;
};

/// Writable view of the framebuffer, valid between beginFrame() and endFrame()
struct FrameBuffer {
    Pixel* pixels = nullptr;
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t stride = 0;   // Pixels per row (>= width)

    Pixel& at(uint32_t x, uint32_t y) noexcept {
        return pixels[static_cast<size_t>(y) * stride + x];
    }
};

/// Scaled framebuffer window
class IVideoOutput {
public:
    virtual ~IVideoOutput() = default;

    // ═══════════════════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════════════════

    /// Open the window and allocate the framebuffer
    /// @return Success, InvalidParameter (zero size or scale), AlreadyInitialized,
    ///         DeviceNotFound
    virtual Result open(const VideoConfig& config) = 0;

    /// Close the window (safe to call if not open)
    virtual void close() = 0;

    virtual bool isOpen() const = 0;

    /// @return Success, NotInitialized, InvalidParameter (null title)
    virtual Result setTitle(const char* title) = 0;

    /// Window size in host pixels; 0x0 when closed
    virtual void getWindowSize(uint32_t& width, uint32_t& height) const = 0;

    // ═══════════════════════════════════════════════════════════════════════
    // Frames
    // ═══════════════════════════════════════════════════════════════════════

    /// Map the framebuffer for writing. Contents are unspecified; callers
    /// redraw every pixel.
    /// @return Success, NotInitialized, FrameInProgress
    virtual Result beginFrame(FrameBuffer& frame) = 0;

    /// Unmap the framebuffer and present it scaled to the window
    /// @return Success, NotInitialized, NoFrameInProgress
    virtual Result endFrame() = 0;

    virtual bool isFrameInProgress() const = 0;
};

} // namespace pal
