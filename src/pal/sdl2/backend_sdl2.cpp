// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 chip8vm Contributors
//
// Platform Abstraction Layer - SDL2 Backend Entry

#include "services_sdl2.h"
#include "../backend.h"
#include <SDL.h>

namespace pal {
namespace detail {

namespace {

Result startSDL2() {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_AUDIO | SDL_INIT_TIMER | SDL_INIT_EVENTS) != 0) {
        return Result::NotSupported;
    }
    return Result::Success;
}

void stopSDL2() {
    SDL_Quit();
}

} // anonymous namespace

const BackendEntry& sdl2Backend() {
    static const BackendEntry entry{
        Backend::SDL2,
        startSDL2,
        stopSDL2,
        sdl2::createVideoOutput,
        sdl2::createAudioQueue,
        sdl2::createHostClock,
        sdl2::createInputSource,
    };
    return entry;
}

} // namespace detail
} // namespace pal
