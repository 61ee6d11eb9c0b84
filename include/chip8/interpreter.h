/**
 * @file interpreter.h
 * @brief 60 Hz driver loop tying a Machine to the platform layer.
 *
 * Each tick():
 *   1. Polls host events; keypad keys update the held-key set and debug
 *      keys (with --debug) act on the machine
 *   2. Unless paused: lets the timers decay, latches held keys into the
 *      machine and runs cycles_per_tick instructions
 *   3. Redraws the framebuffer if the display changed
 *   4. Queues a square wave while the sound timer runs; stops and
 *      flushes audio otherwise
 *   5. Sleeps out the rest of the 1/60 s frame
 *
 * The pal::Platform must be initialized before initialize() is called;
 * the headless backend lets tests drive tick() with virtual time and
 * injected key events.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "error.h"
#include "frontend_config.h"
#include "input_latch.h"
#include "machine.h"

#include "pal/platform.h"

#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>

namespace chip8 {

constexpr uint32_t AUDIO_SAMPLE_RATE = 44100;
/// Upper bound on queued tone, a quarter second
constexpr uint32_t AUDIO_QUEUE_LIMIT = AUDIO_SAMPLE_RATE / 4;
constexpr int16_t TONE_AMPLITUDE = 1000;
/// Samples per half-period flip of the square wave.
constexpr uint32_t TONE_PERIOD_SAMPLES = 48000 / 256;
/// Frame period rounded up so consecutive frames always clear a timer period
constexpr uint64_t FRAME_US = (1000000 + MAIN_LOOP_HZ - 1) / MAIN_LOOP_HZ;

class Interpreter {
public:
    explicit Interpreter(const FrontendConfig& config);
    ~Interpreter();

    Interpreter(const Interpreter&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;

    /**
     * @brief Create the video, audio, clock and input services.
     * @return PlatformError if the platform is not initialized or a
     *         service fails to start; InvalidState if called twice
     */
    Result<void> initialize();

    /**
     * @brief Release all platform services. Safe to call repeatedly.
     */
    void shutdown();

    [[nodiscard]] bool is_initialized() const noexcept { return initialized_; }

    Result<void> load_rom(std::span<const uint8_t> rom);
    Result<void> load_rom_file(const std::filesystem::path& path);

    /**
     * @brief Run one outer-loop iteration.
     *
     * @return true to keep going, false once the window was closed; the
     *         halting error if the machine faulted during this frame
     */
    Result<bool> tick();

    /**
     * @brief tick() until the window closes or the machine halts.
     */
    Result<void> run();

    // ─────────────────────────────────────────────────────────────────────────
    // Accessors
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] Machine& machine() noexcept { return machine_; }
    [[nodiscard]] const Machine& machine() const noexcept { return machine_; }
    [[nodiscard]] const FrontendConfig& config() const noexcept { return config_; }
    [[nodiscard]] uint64_t frames() const noexcept { return frames_; }

    [[nodiscard]] pal::IVideoOutput* video() noexcept { return video_.get(); }
    [[nodiscard]] pal::IAudioQueue* audio() noexcept { return audio_.get(); }
    [[nodiscard]] pal::IHostClock* clock() noexcept { return clock_.get(); }
    [[nodiscard]] pal::IInputSource* input() noexcept { return input_.get(); }

private:
    void handle_events();
    void handle_debug_key(uint32_t scancode);
    Result<void> render();
    void update_audio();
    void update_title();
    void latch_keys();

    FrontendConfig config_;
    Machine machine_;

    std::unique_ptr<pal::IVideoOutput> video_;
    std::unique_ptr<pal::IAudioQueue> audio_;
    std::unique_ptr<pal::IHostClock> clock_;
    std::unique_ptr<pal::IInputSource> input_;

    std::array<bool, KEY_COUNT> held_{};
    uint64_t tone_phase_ = 0;
    uint64_t frames_ = 0;
    bool quit_requested_ = false;
    bool initialized_ = false;
};

} // namespace chip8
