/**
 * @file keymap.h
 * @brief Host scancode to CHIP-8 keypad mapping.
 *
 * The left side of a QWERTY keyboard stands in for the 4x4 keypad:
 * @verbatim
 *   1 2 3 4        1 2 3 C
 *   Q W E R   ->   4 5 6 D
 *   A S D F        7 8 9 E
 *   Z X C V        A 0 B F
 * @endverbatim
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <cstdint>
#include <optional>

namespace chip8 {

/**
 * @brief Keypad key bound to a scancode (SDL numbering), if any.
 */
[[nodiscard]] std::optional<uint8_t> keypad_for_scancode(uint32_t scancode) noexcept;

/**
 * @brief Debug control bound to a scancode.
 */
enum class DebugKey : uint8_t {
    None,
    DumpState,    ///< P
    TogglePause,  ///< End
    SingleStep    ///< PageDown
};

[[nodiscard]] DebugKey debug_key_for_scancode(uint32_t scancode) noexcept;

} // namespace chip8
