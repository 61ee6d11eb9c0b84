// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 chip8vm Contributors
//
// Platform Abstraction Layer - SDL2 Service Factories (internal)

#pragma once

#include "pal/platform.h"
#include <memory>

namespace pal {
namespace sdl2 {

std::unique_ptr<IVideoOutput> createVideoOutput();
std::unique_ptr<IAudioQueue> createAudioQueue();
std::unique_ptr<IHostClock> createHostClock();
std::unique_ptr<IInputSource> createInputSource();

} // namespace sdl2
} // namespace pal
