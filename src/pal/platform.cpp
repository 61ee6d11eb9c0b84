// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 chip8vm Contributors
//
// Platform Abstraction Layer - Platform Factory Implementation

#include "pal/platform.h"
#include "backend.h"
#include <atomic>

namespace pal {

namespace {

std::atomic<const detail::BackendEntry*> g_active{nullptr};

const detail::BackendEntry* findBackend(Backend backend) {
    switch (backend) {
        case Backend::Headless:
            return &detail::headlessBackend();
        case Backend::SDL2:
#if defined(PAL_HAS_SDL2)
            return &detail::sdl2Backend();
#else
            return nullptr;
#endif
        case Backend::None:
            break;
    }
    return nullptr;
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════════════════════
// Backend
// ═══════════════════════════════════════════════════════════════════════════

Result Platform::initialize(Backend backend) {
    if (g_active.load() != nullptr) {
        return Result::AlreadyInitialized;
    }
    if (backend == Backend::None) {
        return Result::InvalidParameter;
    }

    const detail::BackendEntry* entry = findBackend(backend);
    if (entry == nullptr) {
        return Result::NotSupported;
    }

    Result started = entry->start();
    if (failed(started)) {
        return started;
    }
    g_active.store(entry);
    return Result::Success;
}

void Platform::shutdown() {
    const detail::BackendEntry* entry = g_active.exchange(nullptr);
    if (entry != nullptr) {
        entry->stop();
    }
}

bool Platform::isInitialized() {
    return g_active.load() != nullptr;
}

Backend Platform::activeBackend() {
    const detail::BackendEntry* entry = g_active.load();
    return entry ? entry->id : Backend::None;
}

const char* Platform::activeBackendName() {
    return toString(activeBackend());
}

bool Platform::isAvailable(Backend backend) {
    return findBackend(backend) != nullptr;
}

// ═══════════════════════════════════════════════════════════════════════════
// Services
// ═══════════════════════════════════════════════════════════════════════════

std::unique_ptr<IVideoOutput> Platform::createVideoOutput() {
    const detail::BackendEntry* entry = g_active.load();
    return entry ? entry->createVideoOutput() : nullptr;
}

std::unique_ptr<IAudioQueue> Platform::createAudioQueue() {
    const detail::BackendEntry* entry = g_active.load();
    return entry ? entry->createAudioQueue() : nullptr;
}

std::unique_ptr<IHostClock> Platform::createHostClock() {
    const detail::BackendEntry* entry = g_active.load();
    return entry ? entry->createHostClock() : nullptr;
}

std::unique_ptr<IInputSource> Platform::createInputSource() {
    const detail::BackendEntry* entry = g_active.load();
    return entry ? entry->createInputSource() : nullptr;
}

} // namespace pal
