// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 chip8vm Contributors
//
// Platform Abstraction Layer - Backend Entry Points (internal)

#pragma once

#include "pal/platform.h"
#include <memory>

namespace pal {
namespace detail {

/// Everything Platform needs from one backend
struct BackendEntry {
    Backend id;
    Result (*start)();
    void (*stop)();
    std::unique_ptr<IVideoOutput> (*createVideoOutput)();
    std::unique_ptr<IAudioQueue> (*createAudioQueue)();
    std::unique_ptr<IHostClock> (*createHostClock)();
    std::unique_ptr<IInputSource> (*createInputSource)();
};

const BackendEntry& headlessBackend();

#if defined(PAL_HAS_SDL2)
const BackendEntry& sdl2Backend();
#endif

} // namespace detail
} // namespace pal
