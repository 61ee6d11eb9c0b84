/**
 * @file memory.h
 * @brief CHIP-8 address space: 4 KiB of RAM with the built-in font.
 *
 * Layout:
 * - 0x000-0x1FF: interpreter area (font sprites at 0x050-0x09F)
 * - 0x200-0xFFF: program image and program data
 *
 * The interpreter area is written only by clear()/load_font(). Program
 * stores into it are refused with ErrorCode::MemoryError.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "error.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace chip8 {

// ─────────────────────────────────────────────────────────────────────────────
// Address Space Constants
// ─────────────────────────────────────────────────────────────────────────────

constexpr size_t MEMORY_SIZE = 4096;
constexpr uint16_t ADDRESS_MASK = 0x0FFF;
constexpr uint16_t FONT_ADDRESS = 0x050;
constexpr uint16_t FONT_GLYPH_BYTES = 5;
constexpr uint16_t PROGRAM_START = 0x200;

/// Largest ROM that fits between PROGRAM_START and the end of memory (3584).
constexpr size_t MAX_ROM_SIZE = MEMORY_SIZE - PROGRAM_START;

/// Hex digit sprites 0-F, 5 bytes each (4x5 pixels, high nibble used).
extern const std::array<uint8_t, 16 * FONT_GLYPH_BYTES> FONT_SET;

// ─────────────────────────────────────────────────────────────────────────────
// Memory
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Flat 4 KiB CHIP-8 memory.
 *
 * Reads mask the address to 12 bits, matching the 12-bit address bus.
 *
 * @invariant Bytes below PROGRAM_START change only in clear()/load_font().
 */
class Memory {
public:
    /**
     * @brief Construct zeroed memory with the font installed.
     * @post read(FONT_ADDRESS) == FONT_SET[0]
     */
    Memory() noexcept;

    /**
     * @brief Zero every byte and reinstall the font.
     */
    void clear() noexcept;

    /**
     * @brief Copy FONT_SET to FONT_ADDRESS.
     */
    void load_font() noexcept;

    /**
     * @brief Copy a program image to PROGRAM_START.
     *
     * @param image Raw, headerless ROM bytes
     * @return RomTooLarge if image.size() > MAX_ROM_SIZE; memory is
     *         untouched on failure
     */
    Result<void> load_program(std::span<const uint8_t> image);

    /**
     * @brief Read a byte; address is masked to 12 bits.
     */
    [[nodiscard]] uint8_t read(uint16_t addr) const noexcept {
        return bytes_[addr & ADDRESS_MASK];
    }

    /**
     * @brief Read a big-endian instruction word (high byte at addr).
     */
    [[nodiscard]] uint16_t read_word(uint16_t addr) const noexcept {
        return static_cast<uint16_t>(
            (static_cast<uint16_t>(read(addr)) << 8) |
            read(static_cast<uint16_t>(addr + 1)));
    }

    /**
     * @brief Program store.
     *
     * @return MemoryError if the masked address is in the interpreter area;
     *         the byte is not written
     */
    Result<void> write(uint16_t addr, uint8_t value);

    /**
     * @brief Address of the sprite for a hex digit (low nibble of digit).
     */
    [[nodiscard]] static constexpr uint16_t glyph_address(uint8_t digit) noexcept {
        return static_cast<uint16_t>(FONT_ADDRESS + FONT_GLYPH_BYTES * (digit & 0x0F));
    }

    [[nodiscard]] std::span<const uint8_t> bytes() const noexcept {
        return bytes_;
    }

private:
    std::array<uint8_t, MEMORY_SIZE> bytes_{};
};

} // namespace chip8
