// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 chip8vm Contributors
//
// Platform Abstraction Layer - Headless Backend
//
// Services that need no display or audio hardware. Each one exposes a
// test API (event injection, virtual time, presented-frame and queued
// sample readback) so the interpreter loop can be driven deterministically.

#pragma once

#include "pal/audio_queue.h"
#include "pal/host_clock.h"
#include "pal/input_source.h"
#include "pal/video_output.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace pal {
namespace headless {

// ═══════════════════════════════════════════════════════════════════════════
// Video Output
// ═══════════════════════════════════════════════════════════════════════════

/// Framebuffer in memory; endFrame() snapshots it as the presented image
class VideoOutputHeadless : public IVideoOutput {
public:
    VideoOutputHeadless() = default;
    ~VideoOutputHeadless() override { close(); }

    Result open(const VideoConfig& config) override;
    void close() override;
    bool isOpen() const override { return open_; }

    Result setTitle(const char* title) override;
    void getWindowSize(uint32_t& width, uint32_t& height) const override;

    Result beginFrame(FrameBuffer& frame) override;
    Result endFrame() override;
    bool isFrameInProgress() const override { return in_frame_; }

    // ─────────────────────────────────────────────────────────────────────
    // Test API
    // ─────────────────────────────────────────────────────────────────────

    /// Pixel of the last presented frame at framebuffer coordinates;
    /// 0 if nothing was presented or out of range
    Pixel getPresentedPixel(uint32_t x, uint32_t y) const;

    /// Pixel as it appears in the window, at host coordinates
    Pixel getWindowPixel(uint32_t wx, uint32_t wy) const;

    uint64_t getPresentCount() const { return present_count_; }
    const std::string& getTitle() const { return title_; }
    uint32_t getScale() const { return config_.scale; }

private:
    bool open_ = false;
    bool in_frame_ = false;
    VideoConfig config_{};
    std::string title_;
    std::vector<Pixel> back_;
    std::vector<Pixel> presented_;
    uint64_t present_count_ = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// Audio Queue
// ═══════════════════════════════════════════════════════════════════════════

/// Queue with no device behind it; tests drain it to simulate playback
class AudioQueueHeadless : public IAudioQueue {
public:
    AudioQueueHeadless() = default;
    ~AudioQueueHeadless() override { close(); }

    Result open(const AudioConfig& config) override;
    void close() override;
    bool isOpen() const override { return open_; }

    Result queue(const int16_t* samples, uint32_t count) override;
    uint32_t getQueuedFrames() const override;
    void clear() override;

    Result setPlaying(bool playing) override;
    bool isPlaying() const override { return playing_; }
    uint32_t getSampleRate() const override { return open_ ? config_.sample_rate : 0; }

    // ─────────────────────────────────────────────────────────────────────
    // Test API
    // ─────────────────────────────────────────────────────────────────────

    /// Consume up to count frames from the front of the queue
    /// @return Frames consumed
    uint32_t drainFrames(uint32_t count);

    /// Frames accepted by queue() since open()
    uint64_t getTotalFramesQueued() const { return total_frames_queued_; }

    /// Samples still waiting to be played, oldest first
    std::vector<int16_t> peekQueued() const;

private:
    bool open_ = false;
    bool playing_ = false;
    AudioConfig config_{};
    std::deque<int16_t> pending_;
    uint64_t total_frames_queued_ = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// Host Clock
// ═══════════════════════════════════════════════════════════════════════════

/// Virtual time that only moves when a test moves it
///
/// With auto-advance enabled, sleepUs() moves time forward by the
/// requested amount, so a loop paced by the clock runs in virtual real time.
class HostClockHeadless : public IHostClock {
public:
    uint64_t nowUs() const override { return now_us_; }
    void sleepUs(uint64_t us) override;

    // ─────────────────────────────────────────────────────────────────────
    // Test API
    // ─────────────────────────────────────────────────────────────────────

    void setNowUs(uint64_t us) { now_us_ = us; }
    void advanceUs(uint64_t delta_us) { now_us_ += delta_us; }
    void setAutoAdvance(bool enable) { auto_advance_ = enable; }

    /// Sum of all sleepUs() requests
    uint64_t getTotalSleptUs() const { return total_slept_us_; }
    uint64_t getSleepCount() const { return sleep_count_; }

private:
    uint64_t now_us_ = 0;
    bool auto_advance_ = false;
    uint64_t total_slept_us_ = 0;
    uint64_t sleep_count_ = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// Input Source
// ═══════════════════════════════════════════════════════════════════════════

/// FIFO of injected events; injection is safe from any thread
class InputSourceHeadless : public IInputSource {
public:
    bool pollEvent(InputEvent& event) override;

    // ─────────────────────────────────────────────────────────────────────
    // Test API
    // ─────────────────────────────────────────────────────────────────────

    void push(const InputEvent& event);
    void pushKeyDown(uint16_t scancode, bool repeat = false);
    void pushKeyUp(uint16_t scancode);

    /// Press and release in one go
    void pushKeyTap(uint16_t scancode);
    void pushQuit();

    size_t getPendingCount() const;

private:
    mutable std::mutex mutex_;
    std::deque<InputEvent> pending_;
};

} // namespace headless
} // namespace pal
