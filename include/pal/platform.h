// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 chip8vm Contributors
//
// Platform Abstraction Layer - Platform Factory

#pragma once

#include "pal/types.h"
#include "pal/video_output.h"
#include "pal/audio_queue.h"
#include "pal/host_clock.h"
#include "pal/input_source.h"
#include <memory>

namespace pal {

/// Process-wide backend selection and service factory
///
/// initialize() starts one backend; the create*() calls then hand out
/// services from it. Callers own the services and must release them
/// before shutdown().
class Platform {
public:
    // ═══════════════════════════════════════════════════════════════════════
    // Backend
    // ═══════════════════════════════════════════════════════════════════════

    /// @return Success, AlreadyInitialized, InvalidParameter (None),
    ///         NotSupported (not compiled in), or the backend's start error
    static Result initialize(Backend backend);

    /// Stop the active backend (safe to call if not initialized)
    static void shutdown();

    static bool isInitialized();
    static Backend activeBackend();
    static const char* activeBackendName();

    /// Whether the backend was compiled into this build
    static bool isAvailable(Backend backend);

    // ═══════════════════════════════════════════════════════════════════════
    // Services (nullptr when not initialized)
    // ═══════════════════════════════════════════════════════════════════════

    static std::unique_ptr<IVideoOutput> createVideoOutput();
    static std::unique_ptr<IAudioQueue> createAudioQueue();
    static std::unique_ptr<IHostClock> createHostClock();
    static std::unique_ptr<IInputSource> createInputSource();
};

} // namespace pal
