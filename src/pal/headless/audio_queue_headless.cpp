// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 chip8vm Contributors
//
// Platform Abstraction Layer - Headless Audio Queue Implementation

#include "pal/headless.h"
#include <algorithm>

namespace pal {
namespace headless {

Result AudioQueueHeadless::open(const AudioConfig& config) {
    if (open_) {
        return Result::AlreadyInitialized;
    }
    if (config.sample_rate == 0 || config.max_queued_frames == 0) {
        return Result::InvalidParameter;
    }

    config_ = config;
    pending_.clear();
    total_frames_queued_ = 0;
    playing_ = false;
    open_ = true;
    return Result::Success;
}

void AudioQueueHeadless::close() {
    pending_.clear();
    playing_ = false;
    open_ = false;
}

Result AudioQueueHeadless::queue(const int16_t* samples, uint32_t count) {
    if (!open_) {
        return Result::NotInitialized;
    }
    if (samples == nullptr && count > 0) {
        return Result::InvalidParameter;
    }
    if (pending_.size() + count > config_.max_queued_frames) {
        return Result::QueueFull;
    }

    pending_.insert(pending_.end(), samples, samples + count);
    total_frames_queued_ += count;
    return Result::Success;
}

uint32_t AudioQueueHeadless::getQueuedFrames() const {
    return static_cast<uint32_t>(pending_.size());
}

void AudioQueueHeadless::clear() {
    pending_.clear();
}

Result AudioQueueHeadless::setPlaying(bool playing) {
    if (!open_) {
        return Result::NotInitialized;
    }
    playing_ = playing;
    return Result::Success;
}

uint32_t AudioQueueHeadless::drainFrames(uint32_t count) {
    const uint32_t drained = std::min(count, getQueuedFrames());
    pending_.erase(pending_.begin(), pending_.begin() + drained);
    return drained;
}

std::vector<int16_t> AudioQueueHeadless::peekQueued() const {
    return std::vector<int16_t>(pending_.begin(), pending_.end());
}

} // namespace headless
} // namespace pal
