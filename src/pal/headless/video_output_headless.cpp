// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 chip8vm Contributors
//
// Platform Abstraction Layer - Headless Video Output Implementation

#include "pal/headless.h"
#include <new>

namespace pal {
namespace headless {

Result VideoOutputHeadless::open(const VideoConfig& config) {
    if (open_) {
        return Result::AlreadyInitialized;
    }
    if (config.frame_width == 0 || config.frame_height == 0 || config.scale == 0) {
        return Result::InvalidParameter;
    }

    const size_t count = static_cast<size_t>(config.frame_width) * config.frame_height;
    try {
        back_.assign(count, 0);
        presented_.clear();
    } catch (const std::bad_alloc&) {
        return Result::OutOfMemory;
    }

    config_ = config;
    title_ = config.title ? config.title : "";
    present_count_ = 0;
    in_frame_ = false;
    open_ = true;
    return Result::Success;
}

void VideoOutputHeadless::close() {
    back_.clear();
    presented_.clear();
    title_.clear();
    in_frame_ = false;
    open_ = false;
}

Result VideoOutputHeadless::setTitle(const char* title) {
    if (!open_) {
        return Result::NotInitialized;
    }
    if (title == nullptr) {
        return Result::InvalidParameter;
    }
    title_ = title;
    return Result::Success;
}

void VideoOutputHeadless::getWindowSize(uint32_t& width, uint32_t& height) const {
    width = open_ ? config_.frame_width * config_.scale : 0;
    height = open_ ? config_.frame_height * config_.scale : 0;
}

Result VideoOutputHeadless::beginFrame(FrameBuffer& frame) {
    if (!open_) {
        return Result::NotInitialized;
    }
    if (in_frame_) {
        return Result::FrameInProgress;
    }

    frame.pixels = back_.data();
    frame.width = config_.frame_width;
    frame.height = config_.frame_height;
    frame.stride = config_.frame_width;
    in_frame_ = true;
    return Result::Success;
}

Result VideoOutputHeadless::endFrame() {
    if (!open_) {
        return Result::NotInitialized;
    }
    if (!in_frame_) {
        return Result::NoFrameInProgress;
    }

    presented_ = back_;
    ++present_count_;
    in_frame_ = false;
    return Result::Success;
}

Pixel VideoOutputHeadless::getPresentedPixel(uint32_t x, uint32_t y) const {
    if (presented_.empty() || x >= config_.frame_width || y >= config_.frame_height) {
        return 0;
    }
    return presented_[static_cast<size_t>(y) * config_.frame_width + x];
}

Pixel VideoOutputHeadless::getWindowPixel(uint32_t wx, uint32_t wy) const {
    if (!open_) {
        return 0;
    }
    return getPresentedPixel(wx / config_.scale, wy / config_.scale);
}

} // namespace headless
} // namespace pal
