/**
 * @file frontend_config.cpp
 * @brief Command line parsing.
 *
 * @copyright GPL-2.0-or-later
 */

#include "chip8/frontend_config.h"

#include <array>
#include <charconv>
#include <vector>

namespace chip8 {

namespace {

template<typename T>
std::optional<T> parse_number(std::string_view s) noexcept {
    T value{};
    const char* first = s.data();
    const char* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || s.empty()) {
        return std::nullopt;
    }
    return value;
}

std::string quoted(std::string_view s) {
    return "'" + std::string(s) + "'";
}

} // anonymous namespace

std::optional<ScreenSize> parse_screen_size(std::string_view s) noexcept {
    if (s == "small") return ScreenSize::Small;
    if (s == "medium") return ScreenSize::Medium;
    if (s == "large") return ScreenSize::Large;
    return std::nullopt;
}

std::optional<Rgb> parse_rgb(std::string_view s) noexcept {
    std::array<uint8_t, 3> parts{};
    size_t index = 0;
    while (true) {
        const size_t comma = s.find(',');
        const std::string_view field = s.substr(0, comma);
        if (index >= parts.size()) {
            return std::nullopt;
        }
        auto value = parse_number<unsigned>(field);
        if (!value.has_value() || *value > 255) {
            return std::nullopt;
        }
        parts[index++] = static_cast<uint8_t>(*value);
        if (comma == std::string_view::npos) {
            break;
        }
        s.remove_prefix(comma + 1);
    }
    if (index != parts.size()) {
        return std::nullopt;
    }
    return Rgb{parts[0], parts[1], parts[2]};
}

MachineConfig FrontendConfig::machine_config() const {
    MachineConfig config = chip48 ? MachineConfig::chip48() : MachineConfig::chip8();
    config.cycles_per_tick = instructions_per_tick();
    return config;
}

Result<FrontendConfig> parse_args(std::span<const std::string_view> args) {
    FrontendConfig config;
    bool have_rom = false;

    for (size_t n = 0; n < args.size(); ++n) {
        std::string_view arg = args[n];
        std::optional<std::string_view> inline_value;

        if (arg.starts_with("--")) {
            const size_t eq = arg.find('=');
            if (eq != std::string_view::npos) {
                inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
            }
        }

        // Fetches the option's value from "=value" or the next argument
        auto take_value = [&]() -> Result<std::string_view> {
            if (inline_value.has_value()) {
                return Ok(*inline_value);
            }
            if (n + 1 >= args.size()) {
                return make_error(ErrorCode::InvalidArgument,
                    "option " + quoted(arg) + " requires a value");
            }
            return Ok(args[++n]);
        };

        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
        } else if (arg == "-V" || arg == "--version") {
            config.show_version = true;
        } else if (arg == "-d" || arg == "--debug") {
            config.debug = true;
        } else if (arg == "-c" || arg == "--chip-48-mode") {
            config.chip48 = true;
        } else if (arg == "-s" || arg == "--screen-size") {
            auto value = take_value();
            if (!value) return Err(value.error());
            auto size = parse_screen_size(*value);
            if (!size.has_value()) {
                return make_error(ErrorCode::ConfigValueInvalid,
                    "--screen-size: " + quoted(*value) + " is not one of small, medium, large");
            }
            config.screen_size = *size;
        } else if (arg == "-f" || arg == "--interpreter-frequency") {
            auto value = take_value();
            if (!value) return Err(value.error());
            auto hz = parse_number<uint32_t>(*value);
            if (!hz.has_value()) {
                return make_error(ErrorCode::ConfigValueInvalid,
                    "--interpreter-frequency: " + quoted(*value) + " is not a number");
            }
            if (*hz < MIN_FREQUENCY_HZ || *hz > MAX_FREQUENCY_HZ) {
                return make_error(ErrorCode::ConfigValueInvalid,
                    format_message("--interpreter-frequency: %u Hz out of range %u-%u",
                        *hz, MIN_FREQUENCY_HZ, MAX_FREQUENCY_HZ));
            }
            config.frequency_hz = *hz;
        } else if (arg == "--foreground-color" || arg == "--background-color") {
            const std::string option(arg);
            auto value = take_value();
            if (!value) return Err(value.error());
            auto rgb = parse_rgb(*value);
            if (!rgb.has_value()) {
                return make_error(ErrorCode::ConfigValueInvalid,
                    option + ": " + quoted(*value) + " is not R,G,B with components 0-255");
            }
            (option == "--foreground-color" ? config.foreground : config.background) = *rgb;
        } else if (arg.size() > 1 && arg.front() == '-') {
            return make_error(ErrorCode::InvalidArgument, "unknown option " + quoted(arg));
        } else {
            if (have_rom) {
                return make_error(ErrorCode::InvalidArgument,
                    "unexpected argument " + quoted(arg) + "; only one ROM may be given");
            }
            config.rom_path = std::string(arg);
            have_rom = true;
        }
    }

    if (!have_rom && !config.show_help && !config.show_version) {
        return make_error(ErrorCode::InvalidArgument, "missing ROM path");
    }
    return Ok(std::move(config));
}

Result<FrontendConfig> parse_args(int argc, const char* const* argv) {
    std::vector<std::string_view> args;
    for (int n = 1; n < argc; ++n) {
        args.emplace_back(argv[n]);
    }
    return parse_args(std::span<const std::string_view>(args));
}

std::string usage(std::string_view program) {
    std::string text = "Usage: " + std::string(program) + " [OPTIONS] <ROM>\n";
    text +=
        "\n"
        "Options:\n"
        "  -s, --screen-size <SIZE>            small (640x320, default), medium (768x384) or large (1024x512)\n"
        "  -f, --interpreter-frequency <HZ>    Emulation speed, 200-1000 Hz (default 500)\n"
        "  -d, --debug                         Enable pausing and step-by-step execution\n"
        "  -c, --chip-48-mode                  Execute shift and load/store opcodes as CHIP-48 does\n"
        "      --foreground-color <R,G,B>      Pixel color (default 0,255,102)\n"
        "      --background-color <R,G,B>      Background color (default 0,0,0)\n"
        "  -h, --help                          Print this help\n"
        "  -V, --version                       Print version\n"
        "\n"
        "Keypad (left side of the keyboard):\n"
        "  |1|2|3|4|      |1|2|3|C|\n"
        "  |Q|W|E|R|  ->  |4|5|6|D|\n"
        "  |A|S|D|F|      |7|8|9|E|\n"
        "  |Z|X|C|V|      |A|0|B|F|\n"
        "\n"
        "Debug keys (with --debug):\n"
        "  P         print machine state\n"
        "  End       pause/resume emulation\n"
        "  PageDown  execute 4 instructions while paused\n";
    return text;
}

} // namespace chip8
