/**
 * @file memory.cpp
 * @brief CHIP-8 memory and font set.
 *
 * @copyright GPL-2.0-or-later
 */

#include "chip8/memory.h"

#include <algorithm>

namespace chip8 {

const std::array<uint8_t, 16 * FONT_GLYPH_BYTES> FONT_SET = {{
    0xF0, 0x90, 0x90, 0x90, 0xF0,  // 0
    0x20, 0x60, 0x20, 0x20, 0x70,  // 1
    0xF0, 0x10, 0xF0, 0x80, 0xF0,  // 2
    0xF0, 0x10, 0xF0, 0x10, 0xF0,  // 3
    0x90, 0x90, 0xF0, 0x10, 0x10,  // 4
    0xF0, 0x80, 0xF0, 0x10, 0xF0,  // 5
    0xF0, 0x80, 0xF0, 0x90, 0xF0,  // 6
    0xF0, 0x10, 0x20, 0x40, 0x40,  // 7
    0xF0, 0x90, 0xF0, 0x90, 0xF0,  // 8
    0xF0, 0x90, 0xF0, 0x10, 0xF0,  // 9
    0xF0, 0x90, 0xF0, 0x90, 0x90,  // A
    0xE0, 0x90, 0xE0, 0x90, 0xE0,  // B
    0xF0, 0x80, 0x80, 0x80, 0xF0,  // C
    0xE0, 0x90, 0x90, 0x90, 0xE0,  // D
    0xF0, 0x80, 0xF0, 0x80, 0xF0,  // E
    0xF0, 0x80, 0xF0, 0x80, 0x80,  // F
}};

Memory::Memory() noexcept {
    load_font();
}

void Memory::clear() noexcept {
    bytes_.fill(0);
    load_font();
}

void Memory::load_font() noexcept {
    std::copy(FONT_SET.begin(), FONT_SET.end(), bytes_.begin() + FONT_ADDRESS);
}

Result<void> Memory::load_program(std::span<const uint8_t> image) {
    if (image.size() > MAX_ROM_SIZE) {
        return make_error(ErrorCode::RomTooLarge,
            format_message("ROM is %zu bytes, maximum is %zu", image.size(), MAX_ROM_SIZE));
    }
    std::copy(image.begin(), image.end(), bytes_.begin() + PROGRAM_START);
    return Ok();
}

Result<void> Memory::write(uint16_t addr, uint8_t value) {
    const uint16_t masked = addr & ADDRESS_MASK;
    if (masked < PROGRAM_START) {
        return make_error(ErrorCode::MemoryError,
            format_message("write to reserved address 0x%03X refused", masked));
    }
    bytes_[masked] = value;
    return Ok();
}

} // namespace chip8
