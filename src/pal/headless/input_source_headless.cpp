// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 chip8vm Contributors
//
// Platform Abstraction Layer - Headless Input Source Implementation

#include "pal/headless.h"

namespace pal {
namespace headless {

bool InputSourceHeadless::pollEvent(InputEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.empty()) {
        return false;
    }
    event = pending_.front();
    pending_.pop_front();
    return true;
}

void InputSourceHeadless::push(const InputEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(event);
}

void InputSourceHeadless::pushKeyDown(uint16_t scancode, bool repeat) {
    push(InputEvent{InputEventType::KeyDown, scancode, repeat});
}

void InputSourceHeadless::pushKeyUp(uint16_t scancode) {
    push(InputEvent{InputEventType::KeyUp, scancode, false});
}

void InputSourceHeadless::pushKeyTap(uint16_t scancode) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(InputEvent{InputEventType::KeyDown, scancode, false});
    pending_.push_back(InputEvent{InputEventType::KeyUp, scancode, false});
}

void InputSourceHeadless::pushQuit() {
    push(InputEvent{InputEventType::Quit, 0, false});
}

size_t InputSourceHeadless::getPendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

} // namespace headless
} // namespace pal
