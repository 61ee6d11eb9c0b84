// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 chip8vm Contributors
//
// Platform Abstraction Layer - SDL2 Audio Queue Implementation
//
// Opens the device without a callback and feeds it through SDL_QueueAudio;
// SDL plays silence whenever the queue is empty.

#include "services_sdl2.h"
#include <SDL.h>

namespace pal {
namespace sdl2 {

namespace {

class AudioQueueSDL2 : public IAudioQueue {
public:
    AudioQueueSDL2() = default;
    ~AudioQueueSDL2() override { close(); }

    // ═══════════════════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════════════════

    Result open(const AudioConfig& config) override {
        if (device_ != 0) {
            return Result::AlreadyInitialized;
        }
        if (config.sample_rate == 0 || config.max_queued_frames == 0) {
            return Result::InvalidParameter;
        }

        SDL_AudioSpec want{};
        want.freq = static_cast<int>(config.sample_rate);
        want.format = AUDIO_S16SYS;
        want.channels = 1;
        want.samples = 512;
        want.callback = nullptr;

        // No allowed changes: SDL converts to whatever the device wants
        SDL_AudioSpec have{};
        device_ = SDL_OpenAudioDevice(nullptr, 0, &want, &have, 0);
        if (device_ == 0) {
            return Result::DeviceNotFound;
        }

        config_ = config;
        playing_ = false;
        return Result::Success;
    }

    void close() override {
        if (device_ != 0) {
            SDL_CloseAudioDevice(device_);
            device_ = 0;
        }
        playing_ = false;
    }

    bool isOpen() const override {
        return device_ != 0;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Queue
    // ═══════════════════════════════════════════════════════════════════════

    Result queue(const int16_t* samples, uint32_t count) override {
        if (device_ == 0) {
            return Result::NotInitialized;
        }
        if (samples == nullptr && count > 0) {
            return Result::InvalidParameter;
        }
        if (count == 0) {
            return Result::Success;
        }
        if (getQueuedFrames() + count > config_.max_queued_frames) {
            return Result::QueueFull;
        }

        const Uint32 bytes = count * static_cast<Uint32>(sizeof(int16_t));
        if (SDL_QueueAudio(device_, samples, bytes) != 0) {
            return Result::NotSupported;
        }
        return Result::Success;
    }

    uint32_t getQueuedFrames() const override {
        if (device_ == 0) {
            return 0;
        }
        return SDL_GetQueuedAudioSize(device_) / static_cast<uint32_t>(sizeof(int16_t));
    }

    void clear() override {
        if (device_ != 0) {
            SDL_ClearQueuedAudio(device_);
        }
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Playback
    // ═══════════════════════════════════════════════════════════════════════

    Result setPlaying(bool playing) override {
        if (device_ == 0) {
            return Result::NotInitialized;
        }
        SDL_PauseAudioDevice(device_, playing ? 0 : 1);
        playing_ = playing;
        return Result::Success;
    }

    bool isPlaying() const override {
        return playing_;
    }

    uint32_t getSampleRate() const override {
        return device_ != 0 ? config_.sample_rate : 0;
    }

private:
    SDL_AudioDeviceID device_ = 0;
    AudioConfig config_{};
    bool playing_ = false;
};

} // anonymous namespace

std::unique_ptr<IAudioQueue> createAudioQueue() {
    return std::make_unique<AudioQueueSDL2>();
}

} // namespace sdl2
} // namespace pal
