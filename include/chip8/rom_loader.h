/**
 * @file rom_loader.h
 * @brief Read headerless CHIP-8 program images from disk.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "error.h"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace chip8 {

/**
 * @brief Read a whole ROM file as raw bytes.
 *
 * @return The image; FileNotFound if path does not name a regular file,
 *         FileReadError on I/O failure, RomTooLarge if the file exceeds
 *         MAX_ROM_SIZE bytes
 */
[[nodiscard]] Result<std::vector<uint8_t>> load_rom_file(const std::filesystem::path& path);

} // namespace chip8
