/**
 * @file frontend_config.h
 * @brief Command line configuration of the interpreter frontend.
 *
 * Usage:
 * @code
 *   auto config = chip8::parse_args(argc, argv);
 *   if (!config) {
 *       std::fprintf(stderr, "%s\n", config.error().message().c_str());
 *       return 2;
 *   }
 *   chip8::Machine vm(config->machine_config());
 * @endcode
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "error.h"
#include "machine_config.h"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace chip8 {

constexpr std::string_view VERSION = "1.0.0";

/// Outer loop rate; timers and rendering run once per frame.
constexpr uint32_t MAIN_LOOP_HZ = 60;

constexpr uint32_t DEFAULT_FREQUENCY_HZ = 500;
constexpr uint32_t MIN_FREQUENCY_HZ = 200;
constexpr uint32_t MAX_FREQUENCY_HZ = 1000;

// ─────────────────────────────────────────────────────────────────────────────
// Value Types
// ─────────────────────────────────────────────────────────────────────────────

struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    [[nodiscard]] constexpr bool operator==(const Rgb&) const noexcept = default;
};

constexpr Rgb DEFAULT_FOREGROUND{0, 255, 102};
constexpr Rgb DEFAULT_BACKGROUND{0, 0, 0};

enum class ScreenSize : uint8_t {
    Small,   ///< 640x320
    Medium,  ///< 768x384
    Large    ///< 1024x512
};

[[nodiscard]] inline const char* to_string(ScreenSize size) noexcept {
    switch (size) {
        case ScreenSize::Small:  return "small";
        case ScreenSize::Medium: return "medium";
        case ScreenSize::Large:  return "large";
    }
    return "unknown";
}

/**
 * @brief Window pixels per CHIP-8 pixel.
 */
[[nodiscard]] constexpr uint32_t pixel_scale(ScreenSize size) noexcept {
    switch (size) {
        case ScreenSize::Small:  return 10;
        case ScreenSize::Medium: return 12;
        case ScreenSize::Large:  return 16;
    }
    return 10;
}

[[nodiscard]] std::optional<ScreenSize> parse_screen_size(std::string_view s) noexcept;

/**
 * @brief Parse "R,G,B" with each component 0-255.
 */
[[nodiscard]] std::optional<Rgb> parse_rgb(std::string_view s) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Frontend Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct FrontendConfig {
    std::string rom_path;
    ScreenSize screen_size = ScreenSize::Small;
    uint32_t frequency_hz = DEFAULT_FREQUENCY_HZ;
    bool debug = false;
    bool chip48 = false;
    Rgb foreground = DEFAULT_FOREGROUND;
    Rgb background = DEFAULT_BACKGROUND;
    bool show_help = false;
    bool show_version = false;

    [[nodiscard]] uint32_t scale() const noexcept { return pixel_scale(screen_size); }

    /**
     * @brief Instructions per 60 Hz frame; each instruction takes 2 cycles.
     */
    [[nodiscard]] uint32_t instructions_per_tick() const noexcept {
        return (frequency_hz / MAIN_LOOP_HZ) / 2;
    }

    /**
     * @brief Engine configuration selected by these options.
     */
    [[nodiscard]] MachineConfig machine_config() const;
};

/**
 * @brief Parse command line arguments (without the program name).
 *
 * Accepts "--opt value" and "--opt=value" for long options.
 *
 * @return InvalidArgument for unknown options, missing values or a
 *         missing ROM path; ConfigValueInvalid for out-of-range values
 */
[[nodiscard]] Result<FrontendConfig> parse_args(std::span<const std::string_view> args);

[[nodiscard]] Result<FrontendConfig> parse_args(int argc, const char* const* argv);

/**
 * @brief Help text including key bindings and debug keys.
 */
[[nodiscard]] std::string usage(std::string_view program);

} // namespace chip8
