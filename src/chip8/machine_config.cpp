/**
 * @file machine_config.cpp
 * @brief MachineConfig validation.
 *
 * @copyright GPL-2.0-or-later
 */

#include "chip8/machine_config.h"

namespace chip8 {

namespace {

// VX/VY are 8-bit, so a sprite origin can address at most 256 columns/rows
constexpr uint32_t MAX_DISPLAY_DIMENSION = 256;

} // anonymous namespace

Result<void> MachineConfig::validate() const {
    CHIP8_CHECK(cycles_per_tick > 0, ConfigValueInvalid,
        "cycles_per_tick must be at least 1");
    if (display_width == 0 || display_width > MAX_DISPLAY_DIMENSION) {
        return make_error(ErrorCode::ConfigValueInvalid,
            format_message("display_width %u out of range 1-%u", display_width, MAX_DISPLAY_DIMENSION));
    }
    if (display_height == 0 || display_height > MAX_DISPLAY_DIMENSION) {
        return make_error(ErrorCode::ConfigValueInvalid,
            format_message("display_height %u out of range 1-%u", display_height, MAX_DISPLAY_DIMENSION));
    }
    return Ok();
}

} // namespace chip8
