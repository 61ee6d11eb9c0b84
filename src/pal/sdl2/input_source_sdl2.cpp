// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 chip8vm Contributors
//
// Platform Abstraction Layer - SDL2 Input Source Implementation

#include "services_sdl2.h"
#include <SDL.h>

namespace pal {
namespace sdl2 {

namespace {

/// Drains the SDL event queue, skipping events the interpreter has no use for
class InputSourceSDL2 : public IInputSource {
public:
    bool pollEvent(InputEvent& event) override {
        SDL_Event sdl;
        while (SDL_PollEvent(&sdl)) {
            if (translate(sdl, event)) {
                return true;
            }
        }
        return false;
    }

private:
    static bool translate(const SDL_Event& sdl, InputEvent& event) {
        switch (sdl.type) {
            case SDL_KEYDOWN:
            case SDL_KEYUP:
                event.type = sdl.type == SDL_KEYDOWN ? InputEventType::KeyDown : InputEventType::KeyUp;
                event.scancode = static_cast<uint16_t>(sdl.key.keysym.scancode);
                event.repeat = sdl.key.repeat != 0;
                return true;

            case SDL_WINDOWEVENT:
                if (sdl.window.event != SDL_WINDOWEVENT_CLOSE) {
                    return false;
                }
                [[fallthrough]];
            case SDL_QUIT:
                event.type = InputEventType::Quit;
                event.scancode = 0;
                event.repeat = false;
                return true;

            default:
                return false;
        }
    }
};

} // anonymous namespace

std::unique_ptr<IInputSource> createInputSource() {
    return std::make_unique<InputSourceSDL2>();
}

} // namespace sdl2
} // namespace pal
