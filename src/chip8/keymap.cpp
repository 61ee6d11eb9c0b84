/**
 * @file keymap.cpp
 * @brief Host scancode to CHIP-8 keypad mapping.
 *
 * @copyright GPL-2.0-or-later
 */

#include "chip8/keymap.h"

#include "pal/input_source.h"

#include <array>
#include <utility>

namespace chip8 {

namespace {

constexpr std::array<std::pair<uint32_t, uint8_t>, 16> KEY_BINDINGS = {{
    {pal::scancode::Num1, 0x1}, {pal::scancode::Num2, 0x2}, {pal::scancode::Num3, 0x3}, {pal::scancode::Num4, 0xC},
    {pal::scancode::Q,    0x4}, {pal::scancode::W,    0x5}, {pal::scancode::E,    0x6}, {pal::scancode::R,    0xD},
    {pal::scancode::A,    0x7}, {pal::scancode::S,    0x8}, {pal::scancode::D,    0x9}, {pal::scancode::F,    0xE},
    {pal::scancode::Z,    0xA}, {pal::scancode::X,    0x0}, {pal::scancode::C,    0xB}, {pal::scancode::V,    0xF},
}};

} // anonymous namespace

std::optional<uint8_t> keypad_for_scancode(uint32_t scancode) noexcept {
    for (const auto& [code, key] : KEY_BINDINGS) {
        if (code == scancode) {
            return key;
        }
    }
    return std::nullopt;
}

DebugKey debug_key_for_scancode(uint32_t scancode) noexcept {
    switch (scancode) {
        case pal::scancode::P:        return DebugKey::DumpState;
        case pal::scancode::End:      return DebugKey::TogglePause;
        case pal::scancode::PageDown: return DebugKey::SingleStep;
        default:                      return DebugKey::None;
    }
}

} // namespace chip8
