// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 chip8vm Contributors
//
// Platform Abstraction Layer - Input Source Interface

#pragma once

#include <cstdint>

namespace pal {

enum class InputEventType {
    None = 0,
    KeyDown,
    KeyUp,
    Quit        // Window closed or the host asked the program to exit
};

/// Physical key positions (USB HID usage IDs, the numbering SDL uses)
namespace scancode {
    constexpr uint16_t A = 4;
    constexpr uint16_t C = 6;
    constexpr uint16_t D = 7;
    constexpr uint16_t E = 8;
    constexpr uint16_t F = 9;
    constexpr uint16_t P = 19;
    constexpr uint16_t Q = 20;
    constexpr uint16_t R = 21;
    constexpr uint16_t S = 22;
    constexpr uint16_t V = 25;
    constexpr uint16_t W = 26;
    constexpr uint16_t X = 27;
    constexpr uint16_t Z = 29;
    constexpr uint16_t Num1 = 30;
    constexpr uint16_t Num2 = 31;
    constexpr uint16_t Num3 = 32;
    constexpr uint16_t Num4 = 33;
    constexpr uint16_t Escape = 41;
    constexpr uint16_t End = 77;
    constexpr uint16_t PageDown = 78;
} // namespace scancode

struct InputEvent {
    InputEventType type = InputEventType::None;
    uint16_t scancode = 0;   // KeyDown/KeyUp only
    bool repeat = false;     // KeyDown generated by key auto-repeat
};

/// Host keyboard and window events
class IInputSource {
public:
    virtual ~IInputSource() = default;

    /// Take the next pending event
    /// @return false once the queue is empty; event is left untouched
    virtual bool pollEvent(InputEvent& event) = 0;
};

constexpr const char* toString(InputEventType type) noexcept {
    switch (type) {
        case InputEventType::None:    return "None";
        case InputEventType::KeyDown: return "KeyDown";
        case InputEventType::KeyUp:   return "KeyUp";
        case InputEventType::Quit:    return "Quit";
    }
    return "Unknown";
}

} // namespace pal
