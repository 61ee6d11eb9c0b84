// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 chip8vm Contributors
//
// SDL2 backend smoke tests. Skipped when SDL2 is not built in or the host
// has no usable video or audio device.

#include <gtest/gtest.h>
#include "pal/platform.h"

#include <vector>

#ifdef PAL_HAS_SDL2

namespace pal {
namespace {

class SDL2BackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        Platform::shutdown();
        if (Platform::initialize(Backend::SDL2) != Result::Success) {
            GTEST_SKIP() << "SDL2 could not initialize on this host";
        }
    }

    void TearDown() override {
        Platform::shutdown();
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Platform
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(SDL2BackendTest, BackendIsActive) {
    EXPECT_EQ(Platform::activeBackend(), Backend::SDL2);
    EXPECT_STREQ(Platform::activeBackendName(), "SDL2");
}

// ═══════════════════════════════════════════════════════════════════════════
// Clock
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(SDL2BackendTest, ClockSleepsAtLeastRequested) {
    auto clock = Platform::createHostClock();
    ASSERT_NE(clock, nullptr);
    const uint64_t before = clock->nowUs();
    clock->sleepUs(5000);
    EXPECT_GE(clock->nowUs() - before, 5000u);
}

// ═══════════════════════════════════════════════════════════════════════════
// Video
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(SDL2BackendTest, FramePresents) {
    auto video = Platform::createVideoOutput();
    ASSERT_NE(video, nullptr);
    if (video->open(VideoConfig{}) != Result::Success) {
        GTEST_SKIP() << "No display available";
    }

    uint32_t w = 0, h = 0;
    video->getWindowSize(w, h);
    EXPECT_EQ(w, 640u);
    EXPECT_EQ(h, 320u);

    FrameBuffer frame;
    ASSERT_EQ(video->beginFrame(frame), Result::Success);
    EXPECT_EQ(frame.width, 64u);
    EXPECT_GE(frame.stride, 64u);
    for (uint32_t y = 0; y < frame.height; ++y) {
        for (uint32_t x = 0; x < frame.width; ++x) {
            frame.at(x, y) = ((x + y) % 2) ? packPixel(0, 255, 102) : packPixel(0, 0, 0);
        }
    }
    EXPECT_EQ(video->endFrame(), Result::Success);
    EXPECT_EQ(video->setTitle("CHIP-8 [paused]"), Result::Success);
    video->close();
}

// ═══════════════════════════════════════════════════════════════════════════
// Audio
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(SDL2BackendTest, AudioQueueAcceptsTone) {
    auto audio = Platform::createAudioQueue();
    ASSERT_NE(audio, nullptr);
    if (audio->open(AudioConfig{}) != Result::Success) {
        GTEST_SKIP() << "No audio device available";
    }

    EXPECT_FALSE(audio->isPlaying());
    std::vector<int16_t> tone(735);
    for (size_t i = 0; i < tone.size(); ++i) {
        tone[i] = ((i / 187) % 2 == 0) ? 1000 : -1000;
    }
    ASSERT_EQ(audio->queue(tone.data(), static_cast<uint32_t>(tone.size())), Result::Success);
    EXPECT_EQ(audio->getQueuedFrames(), 735u);

    audio->clear();
    EXPECT_EQ(audio->getQueuedFrames(), 0u);
    audio->close();
}

// ═══════════════════════════════════════════════════════════════════════════
// Input
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(SDL2BackendTest, InputPollDoesNotBlock) {
    auto input = Platform::createInputSource();
    ASSERT_NE(input, nullptr);
    InputEvent event;
    int polled = 0;
    while (input->pollEvent(event) && polled < 64) {
        ++polled;
    }
    SUCCEED();
}

} // namespace
} // namespace pal

#else

TEST(SDL2BackendTest, NotBuilt) {
    GTEST_SKIP() << "Built without SDL2";
}

#endif
