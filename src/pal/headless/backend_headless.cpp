// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 chip8vm Contributors
//
// Platform Abstraction Layer - Headless Backend Entry

#include "pal/headless.h"
#include "../backend.h"

namespace pal {
namespace detail {

namespace {

Result startHeadless() {
    return Result::Success;
}

void stopHeadless() {}

std::unique_ptr<IVideoOutput> createVideoOutputHeadless() {
    return std::make_unique<headless::VideoOutputHeadless>();
}

std::unique_ptr<IAudioQueue> createAudioQueueHeadless() {
    return std::make_unique<headless::AudioQueueHeadless>();
}

std::unique_ptr<IHostClock> createHostClockHeadless() {
    return std::make_unique<headless::HostClockHeadless>();
}

std::unique_ptr<IInputSource> createInputSourceHeadless() {
    return std::make_unique<headless::InputSourceHeadless>();
}

} // anonymous namespace

const BackendEntry& headlessBackend() {
    static const BackendEntry entry{
        Backend::Headless,
        startHeadless,
        stopHeadless,
        createVideoOutputHeadless,
        createAudioQueueHeadless,
        createHostClockHeadless,
        createInputSourceHeadless,
    };
    return entry;
}

} // namespace detail
} // namespace pal
