// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 chip8vm Contributors
//
// Platform Abstraction Layer - SDL2 Host Clock Implementation

#include "services_sdl2.h"
#include <SDL.h>

namespace pal {
namespace sdl2 {

namespace {

/// Performance-counter clock; SDL_Delay for the coarse part of a sleep
class HostClockSDL2 : public IHostClock {
public:
    HostClockSDL2()
        : start_(SDL_GetPerformanceCounter())
        , frequency_(SDL_GetPerformanceFrequency())
    {
        if (frequency_ == 0) {
            frequency_ = 1000000;
        }
    }

    uint64_t nowUs() const override {
        const uint64_t elapsed = SDL_GetPerformanceCounter() - start_;
        // elapsed * 1e6 would overflow after a few hours at GHz counter rates
        return (elapsed / frequency_) * 1000000ULL +
               ((elapsed % frequency_) * 1000000ULL) / frequency_;
    }

    void sleepUs(uint64_t us) override {
        const uint64_t deadline = nowUs() + us;
        if (us >= 2000) {
            // SDL_Delay may overshoot by a scheduler slice; leave the last ms to spin
            SDL_Delay(static_cast<Uint32>(us / 1000 - 1));
        }
        while (nowUs() < deadline) {
            SDL_Delay(0);
        }
    }

private:
    uint64_t start_;
    uint64_t frequency_;
};

} // anonymous namespace

std::unique_ptr<IHostClock> createHostClock() {
    return std::make_unique<HostClockSDL2>();
}

} // namespace sdl2
} // namespace pal
