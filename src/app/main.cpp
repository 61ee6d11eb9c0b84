/**
 * @file main.cpp
 * @brief chip8 command line entry point.
 *
 * @copyright GPL-2.0-or-later
 */

#include "chip8/frontend_config.h"
#include "chip8/interpreter.h"
#include "chip8/logging.h"

#include "pal/platform.h"

#include <cstdio>
#include <exception>
#include <string>

namespace {

constexpr int EXIT_USAGE = 2;

pal::Backend select_backend() {
    if (pal::Platform::isAvailable(pal::Backend::SDL2)) {
        return pal::Backend::SDL2;
    }
    return pal::Backend::Headless;
}

int run(int argc, char** argv) {
    const char* program = argc > 0 ? argv[0] : "chip8";

    auto config = chip8::parse_args(argc, argv);
    if (!config.has_value()) {
        std::fprintf(stderr, "error: %s\n\n%s", config.error().message().c_str(),
            chip8::usage(program).c_str());
        return EXIT_USAGE;
    }
    if (config->show_help) {
        std::fputs(chip8::usage(program).c_str(), stdout);
        return 0;
    }
    if (config->show_version) {
        std::printf("chip8 %.*s\n", static_cast<int>(chip8::VERSION.size()), chip8::VERSION.data());
        return 0;
    }

    if (config->debug) {
        chip8::set_log_level(chip8::LogLevel::Debug);
        CHIP8_LOG_INFO("FRONTEND", "Entering debug mode: P dumps state, End pauses/resumes, "
            "PageDown runs 4 instructions while paused");
    }

    auto backend_result = pal::Platform::initialize(select_backend());
    if (pal::failed(backend_result)) {
        std::fprintf(stderr, "error: platform initialization failed: %s\n",
            pal::toString(backend_result));
        return 1;
    }
    if (pal::Platform::activeBackend() == pal::Backend::Headless) {
        CHIP8_LOG_WARN("FRONTEND", "Built without SDL2; running headless");
    }

    int status = 0;
    {
        chip8::Interpreter interpreter(*config);

        auto outcome = interpreter.load_rom_file(config->rom_path);
        if (outcome.has_value()) {
            outcome = interpreter.initialize();
        }
        if (outcome.has_value()) {
            outcome = interpreter.run();
        }
        if (!outcome.has_value()) {
            std::fprintf(stderr, "error: %s\n", outcome.error().format().c_str());
            status = 1;
        }
    }

    pal::Platform::shutdown();
    return status;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "fatal: %s\n", e.what());
        return 1;
    }
}
