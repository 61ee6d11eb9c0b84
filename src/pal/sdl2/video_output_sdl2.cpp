// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 chip8vm Contributors
//
// Platform Abstraction Layer - SDL2 Video Output Implementation
//
// The framebuffer is a streaming ARGB8888 texture at emulated resolution;
// SDL_RenderCopy stretches it over the window, which gives each emulated
// pixel a solid scale x scale block.

#include "services_sdl2.h"
#include <SDL.h>

namespace pal {
namespace sdl2 {

namespace {

class VideoOutputSDL2 : public IVideoOutput {
public:
    VideoOutputSDL2() = default;
    ~VideoOutputSDL2() override { close(); }

    // ═══════════════════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════════════════

    Result open(const VideoConfig& config) override {
        if (window_) {
            return Result::AlreadyInitialized;
        }
        if (config.frame_width == 0 || config.frame_height == 0 || config.scale == 0) {
            return Result::InvalidParameter;
        }

        window_ = SDL_CreateWindow(
            config.title ? config.title : "",
            SDL_WINDOWPOS_CENTERED,
            SDL_WINDOWPOS_CENTERED,
            static_cast<int>(config.frame_width * config.scale),
            static_cast<int>(config.frame_height * config.scale),
            SDL_WINDOW_SHOWN);
        if (!window_) {
            return Result::DeviceNotFound;
        }

        renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_ACCELERATED);
        if (!renderer_) {
            // Fall back to the software renderer on hosts without a GPU
            renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_SOFTWARE);
        }
        if (renderer_) {
            texture_ = SDL_CreateTexture(renderer_, SDL_PIXELFORMAT_ARGB8888,
                SDL_TEXTUREACCESS_STREAMING,
                static_cast<int>(config.frame_width), static_cast<int>(config.frame_height));
        }
        if (!texture_) {
            close();
            return Result::DeviceNotFound;
        }

        config_ = config;
        return Result::Success;
    }

    void close() override {
        if (texture_) {
            if (in_frame_) {
                SDL_UnlockTexture(texture_);
            }
            SDL_DestroyTexture(texture_);
            texture_ = nullptr;
        }
        if (renderer_) {
            SDL_DestroyRenderer(renderer_);
            renderer_ = nullptr;
        }
        if (window_) {
            SDL_DestroyWindow(window_);
            window_ = nullptr;
        }
        in_frame_ = false;
    }

    bool isOpen() const override {
        return window_ != nullptr;
    }

    Result setTitle(const char* title) override {
        if (!window_) {
            return Result::NotInitialized;
        }
        if (title == nullptr) {
            return Result::InvalidParameter;
        }
        SDL_SetWindowTitle(window_, title);
        return Result::Success;
    }

    void getWindowSize(uint32_t& width, uint32_t& height) const override {
        width = 0;
        height = 0;
        if (window_) {
            int w = 0;
            int h = 0;
            SDL_GetWindowSize(window_, &w, &h);
            width = static_cast<uint32_t>(w);
            height = static_cast<uint32_t>(h);
        }
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Frames
    // ═══════════════════════════════════════════════════════════════════════

    Result beginFrame(FrameBuffer& frame) override {
        if (!texture_) {
            return Result::NotInitialized;
        }
        if (in_frame_) {
            return Result::FrameInProgress;
        }

        void* pixels = nullptr;
        int pitch = 0;
        if (SDL_LockTexture(texture_, nullptr, &pixels, &pitch) != 0) {
            return Result::NotSupported;
        }

        frame.pixels = static_cast<Pixel*>(pixels);
        frame.width = config_.frame_width;
        frame.height = config_.frame_height;
        frame.stride = static_cast<uint32_t>(pitch) / static_cast<uint32_t>(sizeof(Pixel));
        in_frame_ = true;
        return Result::Success;
    }

    Result endFrame() override {
        if (!texture_) {
            return Result::NotInitialized;
        }
        if (!in_frame_) {
            return Result::NoFrameInProgress;
        }

        SDL_UnlockTexture(texture_);
        in_frame_ = false;

        SDL_RenderClear(renderer_);
        if (SDL_RenderCopy(renderer_, texture_, nullptr, nullptr) != 0) {
            return Result::NotSupported;
        }
        SDL_RenderPresent(renderer_);
        return Result::Success;
    }

    bool isFrameInProgress() const override {
        return in_frame_;
    }

private:
    SDL_Window* window_ = nullptr;
    SDL_Renderer* renderer_ = nullptr;
    SDL_Texture* texture_ = nullptr;
    VideoConfig config_{};
    bool in_frame_ = false;
};

} // anonymous namespace

std::unique_ptr<IVideoOutput> createVideoOutput() {
    return std::make_unique<VideoOutputSDL2>();
}

} // namespace sdl2
} // namespace pal
