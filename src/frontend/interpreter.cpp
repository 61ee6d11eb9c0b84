/**
 * @file interpreter.cpp
 * @brief Interpreter driver loop.
 *
 * @copyright GPL-2.0-or-later
 */

#include "chip8/interpreter.h"
#include "chip8/keymap.h"
#include "chip8/logging.h"
#include "chip8/rom_loader.h"

#include <algorithm>
#include <vector>

namespace chip8 {

namespace {

/// Audio frames produced per 60 Hz frame.
constexpr uint32_t FRAMES_PER_TICK = AUDIO_SAMPLE_RATE / MAIN_LOOP_HZ;

/// Keep about two frames of tone queued so playback never starves.
constexpr uint32_t AUDIO_TARGET_QUEUED = 2 * FRAMES_PER_TICK;

constexpr const char* WINDOW_TITLE = "CHIP-8";
constexpr const char* WINDOW_TITLE_PAUSED = "CHIP-8 [paused]";

Result<void> check_pal(pal::Result result, const char* what) {
    if (pal::succeeded(result)) {
        return Ok();
    }
    return make_error(ErrorCode::PlatformError,
        format_message("%s failed: %s", what, pal::toString(result)));
}

constexpr pal::Pixel to_pixel(const Rgb& color) noexcept {
    return pal::packPixel(color.r, color.g, color.b);
}

} // anonymous namespace

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

Interpreter::Interpreter(const FrontendConfig& config)
    : config_(config)
    , machine_(config.machine_config())
{
}

Interpreter::~Interpreter() {
    shutdown();
}

Result<void> Interpreter::initialize() {
    CHIP8_CHECK(!initialized_, InvalidState, "interpreter already initialized");
    CHIP8_CHECK(pal::Platform::isInitialized(), PlatformError, "platform not initialized");

    video_ = pal::Platform::createVideoOutput();
    audio_ = pal::Platform::createAudioQueue();
    clock_ = pal::Platform::createHostClock();
    input_ = pal::Platform::createInputSource();
    if (!video_ || !audio_ || !clock_ || !input_) {
        shutdown();
        return make_error(ErrorCode::PlatformError, "platform service creation failed");
    }

    pal::VideoConfig video_config;
    video_config.title = WINDOW_TITLE;
    video_config.frame_width = machine_.display().width();
    video_config.frame_height = machine_.display().height();
    video_config.scale = config_.scale();

    pal::AudioConfig audio_config;
    audio_config.sample_rate = AUDIO_SAMPLE_RATE;
    audio_config.max_queued_frames = AUDIO_QUEUE_LIMIT;

    auto started = check_pal(video_->open(video_config), "video open");
    if (started) {
        started = check_pal(audio_->open(audio_config), "audio open");
    }
    if (!started) {
        CHIP8_LOG_ERROR("FRONTEND", "%s", started.error().message().c_str());
        shutdown();
        return started;
    }

    uint32_t width = 0;
    uint32_t height = 0;
    video_->getWindowSize(width, height);

    initialized_ = true;
    CHIP8_LOG_INFO("FRONTEND", "Initialized %ux%u window on %s backend (%s, %u instructions/frame)",
        width, height, pal::Platform::activeBackendName(),
        chip8::to_string(machine_.mode()), machine_.config().cycles_per_tick);
    return Ok();
}

void Interpreter::shutdown() {
    if (audio_) {
        audio_->close();
    }
    if (video_) {
        video_->close();
    }
    input_.reset();
    clock_.reset();
    audio_.reset();
    video_.reset();
    initialized_ = false;
}

Result<void> Interpreter::load_rom(std::span<const uint8_t> rom) {
    return machine_.load(rom);
}

Result<void> Interpreter::load_rom_file(const std::filesystem::path& path) {
    auto image = chip8::load_rom_file(path);
    if (!image.has_value()) {
        return Err(image.error());
    }
    return machine_.load(*image);
}

// ─────────────────────────────────────────────────────────────────────────────
// Main Loop
// ─────────────────────────────────────────────────────────────────────────────

Result<bool> Interpreter::tick() {
    CHIP8_CHECK(initialized_, InvalidState, "tick() before initialize()");

    const uint64_t frame_start = clock_->nowUs();

    handle_events();
    if (quit_requested_) {
        return Ok(false);
    }

    if (!machine_.is_paused() && !machine_.is_halted()) {
        machine_.tick_timers(clock_->nowUs());
        latch_keys();

        auto ran = machine_.run_cycles(machine_.config().cycles_per_tick);
        if (!ran.has_value()) {
            // Show the last frame before handing the fault to the caller
            auto drawn = render();
            if (!drawn.has_value()) {
                CHIP8_LOG_WARN("FRONTEND", "%s", drawn.error().message().c_str());
            }
            update_audio();
            return Err(ran.error());
        }
    }

    CHIP8_TRY(render());
    update_audio();
    ++frames_;

    const uint64_t elapsed = clock_->nowUs() - frame_start;
    if (elapsed < FRAME_US) {
        clock_->sleepUs(FRAME_US - elapsed);
    }
    return Ok(true);
}

Result<void> Interpreter::run() {
    while (true) {
        auto keep_going = tick();
        if (!keep_going.has_value()) {
            return Err(keep_going.error());
        }
        if (!*keep_going) {
            CHIP8_LOG_INFO("FRONTEND", "Window closed after %llu frames",
                static_cast<unsigned long long>(frames_));
            return Ok();
        }
    }
}

void Interpreter::handle_events() {
    pal::InputEvent event;
    while (input_->pollEvent(event)) {
        switch (event.type) {
            case pal::InputEventType::Quit:
                quit_requested_ = true;
                break;
            case pal::InputEventType::KeyDown:
                if (auto key = keypad_for_scancode(event.scancode)) {
                    held_[*key] = true;
                }
                break;
            case pal::InputEventType::KeyUp:
                if (auto key = keypad_for_scancode(event.scancode)) {
                    held_[*key] = false;
                } else if (config_.debug) {
                    handle_debug_key(event.scancode);
                }
                break;
            case pal::InputEventType::None:
                break;
        }
    }
}

void Interpreter::latch_keys() {
    for (uint8_t key = 0; key < KEY_COUNT; ++key) {
        machine_.input().set(key, held_[key]);
    }
}

void Interpreter::handle_debug_key(uint32_t scancode) {
    switch (debug_key_for_scancode(scancode)) {
        case DebugKey::DumpState:
            CHIP8_LOG_INFO("FRONTEND", "Machine state:\n%s", machine_.dump_state().to_string().c_str());
            break;

        case DebugKey::TogglePause: {
            auto toggled = machine_.is_paused() ? machine_.resume() : machine_.pause();
            if (!toggled.has_value()) {
                CHIP8_LOG_WARN("FRONTEND", "%s", toggled.error().message().c_str());
            }
            update_title();
            break;
        }

        case DebugKey::SingleStep: {
            if (!machine_.is_paused()) {
                break;
            }
            CHIP8_LOG_INFO("FRONTEND", "Running next cycle");
            latch_keys();
            auto stepped = machine_.single_step();
            if (!stepped.has_value()) {
                CHIP8_LOG_ERROR("FRONTEND", "%s", stepped.error().message().c_str());
            }
            update_title();
            break;
        }

        case DebugKey::None:
            break;
    }
}

void Interpreter::update_title() {
    auto result = video_->setTitle(machine_.is_paused() ? WINDOW_TITLE_PAUSED : WINDOW_TITLE);
    if (pal::failed(result)) {
        CHIP8_LOG_DEBUG("FRONTEND", "setTitle failed: %s", pal::toString(result));
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Output
// ─────────────────────────────────────────────────────────────────────────────

Result<void> Interpreter::render() {
    DisplayBuffer& display = machine_.display();
    if (!display.take_dirty()) {
        return Ok();
    }

    pal::FrameBuffer frame;
    CHIP8_TRY(check_pal(video_->beginFrame(frame), "frame begin"));

    const pal::Pixel on = to_pixel(config_.foreground);
    const pal::Pixel off = to_pixel(config_.background);
    const uint32_t width = std::min(frame.width, display.width());
    const uint32_t height = std::min(frame.height, display.height());
    for (uint32_t y = 0; y < height; ++y) {
        for (uint32_t x = 0; x < width; ++x) {
            frame.at(x, y) = display.pixel(x, y) ? on : off;
        }
    }

    return check_pal(video_->endFrame(), "frame present");
}

void Interpreter::update_audio() {
    if (!machine_.tone_on()) {
        if (audio_->isPlaying()) {
            auto stopped = audio_->setPlaying(false);
            if (pal::failed(stopped)) {
                CHIP8_LOG_DEBUG("FRONTEND", "audio stop failed: %s", pal::toString(stopped));
            }
            audio_->clear();
        }
        return;
    }

    const uint32_t queued = audio_->getQueuedFrames();
    if (queued < AUDIO_TARGET_QUEUED) {
        std::vector<int16_t> wave(AUDIO_TARGET_QUEUED - queued);
        for (auto& sample : wave) {
            sample = ((tone_phase_++ / TONE_PERIOD_SAMPLES) % 2 == 0) ? TONE_AMPLITUDE : -TONE_AMPLITUDE;
        }
        auto queued_result = audio_->queue(wave.data(), static_cast<uint32_t>(wave.size()));
        if (pal::failed(queued_result)) {
            CHIP8_LOG_DEBUG("FRONTEND", "tone dropped: %s", pal::toString(queued_result));
        }
    }

    if (!audio_->isPlaying()) {
        auto started = audio_->setPlaying(true);
        if (pal::failed(started)) {
            CHIP8_LOG_WARN("FRONTEND", "audio start failed: %s", pal::toString(started));
        }
    }
}

} // namespace chip8
