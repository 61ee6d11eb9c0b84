/**
 * @file rom_loader.cpp
 * @brief ROM file reader.
 *
 * @copyright GPL-2.0-or-later
 */

#include "chip8/rom_loader.h"
#include "chip8/logging.h"
#include "chip8/memory.h"

#include <fstream>
#include <system_error>

namespace chip8 {

Result<std::vector<uint8_t>> load_rom_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return make_error(ErrorCode::FileNotFound,
            format_message("ROM not found: %s", path.string().c_str()));
    }

    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return make_error(ErrorCode::FileReadError,
            format_message("cannot stat %s: %s", path.string().c_str(), ec.message().c_str()));
    }
    if (size > MAX_ROM_SIZE) {
        return make_error(ErrorCode::RomTooLarge,
            format_message("ROM %s is %llu bytes, maximum is %zu", path.string().c_str(),
                static_cast<unsigned long long>(size), MAX_ROM_SIZE));
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return make_error(ErrorCode::FileReadError,
            format_message("cannot open %s", path.string().c_str()));
    }

    std::vector<uint8_t> image(static_cast<size_t>(size));
    if (!image.empty() &&
        !in.read(reinterpret_cast<char*>(image.data()), static_cast<std::streamsize>(image.size()))) {
        return make_error(ErrorCode::FileReadError,
            format_message("short read from %s", path.string().c_str()));
    }

    CHIP8_LOG_INFO("ROM", "Read %zu bytes from %s", image.size(), path.string().c_str());
    return Ok(std::move(image));
}

} // namespace chip8
