/**
 * @file machine_config.h
 * @brief Construction-time configuration of a Machine.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "display.h"
#include "error.h"

#include <cstdint>
#include <optional>

namespace chip8 {

// ─────────────────────────────────────────────────────────────────────────────
// Compatibility Mode
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Instruction-set compatibility mode.
 *
 * Affects exactly two opcode families:
 * - SHR/SHL (8XY6/8XYE): Chip8 shifts VY into VX, Chip48 shifts VX in place
 * - FX55/FX65: Chip8 leaves I = I + X + 1, Chip48 leaves I unchanged
 */
enum class Mode : uint8_t {
    Chip8,   ///< Original COSMAC VIP semantics
    Chip48   ///< HP-48 CHIP-48 semantics
};

[[nodiscard]] inline const char* to_string(Mode mode) noexcept {
    switch (mode) {
        case Mode::Chip8:  return "CHIP-8";
        case Mode::Chip48: return "CHIP-48";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// Machine Configuration
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Parameters fixed for the lifetime of a Machine.
 */
struct MachineConfig {
    Mode mode = Mode::Chip8;                  ///< Compatibility mode
    uint32_t cycles_per_tick = 4;             ///< Instructions per 60 Hz tick
    std::optional<uint64_t> rng_seed;         ///< CXNN source; random when unset
    uint32_t display_width = DISPLAY_WIDTH;   ///< Pixels
    uint32_t display_height = DISPLAY_HEIGHT; ///< Pixels

    /**
     * @brief Legacy CHIP-8 preset.
     */
    [[nodiscard]] static MachineConfig chip8() noexcept {
        return MachineConfig{};
    }

    /**
     * @brief CHIP-48 preset.
     */
    [[nodiscard]] static MachineConfig chip48() noexcept {
        MachineConfig config;
        config.mode = Mode::Chip48;
        return config;
    }

    /**
     * @brief Deterministic preset for tests: fixed seed, legacy mode.
     */
    [[nodiscard]] static MachineConfig deterministic(uint64_t seed = 0) noexcept {
        MachineConfig config;
        config.rng_seed = seed;
        return config;
    }

    /**
     * @brief Check value ranges.
     * @return ConfigValueInvalid naming the offending field
     */
    [[nodiscard]] Result<void> validate() const;
};

} // namespace chip8
