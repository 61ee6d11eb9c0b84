// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 chip8vm Contributors

#include <gtest/gtest.h>
#include "pal/platform.h"
#include "pal/headless.h"

namespace pal {
namespace {

class PalVideoOutputTest : public ::testing::Test {
protected:
    void SetUp() override {
        Platform::shutdown();
        ASSERT_EQ(Platform::initialize(Backend::Headless), Result::Success);
        video_ = Platform::createVideoOutput();
        ASSERT_NE(video_, nullptr);
    }

    void TearDown() override {
        video_.reset();
        Platform::shutdown();
    }

    headless::VideoOutputHeadless& backend() {
        return static_cast<headless::VideoOutputHeadless&>(*video_);
    }

    void fill(Pixel color) {
        FrameBuffer frame;
        ASSERT_EQ(video_->beginFrame(frame), Result::Success);
        for (uint32_t y = 0; y < frame.height; ++y) {
            for (uint32_t x = 0; x < frame.width; ++x) {
                frame.at(x, y) = color;
            }
        }
        ASSERT_EQ(video_->endFrame(), Result::Success);
    }

    std::unique_ptr<IVideoOutput> video_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(PalVideoOutputTest, DefaultConfigIsNativeChip8AtScale10) {
    ASSERT_EQ(video_->open(VideoConfig{}), Result::Success);
    EXPECT_TRUE(video_->isOpen());

    uint32_t w = 0, h = 0;
    video_->getWindowSize(w, h);
    EXPECT_EQ(w, 640u);
    EXPECT_EQ(h, 320u);
    EXPECT_EQ(backend().getTitle(), "CHIP-8");
}

TEST_F(PalVideoOutputTest, RejectsZeroGeometry) {
    VideoConfig config;
    config.scale = 0;
    EXPECT_EQ(video_->open(config), Result::InvalidParameter);

    config = VideoConfig{};
    config.frame_width = 0;
    EXPECT_EQ(video_->open(config), Result::InvalidParameter);
    EXPECT_FALSE(video_->isOpen());
}

TEST_F(PalVideoOutputTest, OpenTwiceFails) {
    ASSERT_EQ(video_->open(VideoConfig{}), Result::Success);
    EXPECT_EQ(video_->open(VideoConfig{}), Result::AlreadyInitialized);
}

TEST_F(PalVideoOutputTest, CloseIsSafeAndReopenable) {
    video_->close();
    ASSERT_EQ(video_->open(VideoConfig{}), Result::Success);
    video_->close();
    EXPECT_FALSE(video_->isOpen());

    uint32_t w = 1, h = 1;
    video_->getWindowSize(w, h);
    EXPECT_EQ(w, 0u);
    EXPECT_EQ(h, 0u);
    EXPECT_EQ(video_->open(VideoConfig{}), Result::Success);
}

TEST_F(PalVideoOutputTest, SetTitle) {
    EXPECT_EQ(video_->setTitle("x"), Result::NotInitialized);
    ASSERT_EQ(video_->open(VideoConfig{}), Result::Success);
    EXPECT_EQ(video_->setTitle(nullptr), Result::InvalidParameter);
    EXPECT_EQ(video_->setTitle("CHIP-8 [paused]"), Result::Success);
    EXPECT_EQ(backend().getTitle(), "CHIP-8 [paused]");
}

// ═══════════════════════════════════════════════════════════════════════════
// Frames
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(PalVideoOutputTest, FrameCallsNeedOpenOutput) {
    FrameBuffer frame;
    EXPECT_EQ(video_->beginFrame(frame), Result::NotInitialized);
    EXPECT_EQ(video_->endFrame(), Result::NotInitialized);
}

TEST_F(PalVideoOutputTest, FrameBracketing) {
    ASSERT_EQ(video_->open(VideoConfig{}), Result::Success);
    EXPECT_EQ(video_->endFrame(), Result::NoFrameInProgress);

    FrameBuffer frame;
    ASSERT_EQ(video_->beginFrame(frame), Result::Success);
    EXPECT_TRUE(video_->isFrameInProgress());
    EXPECT_EQ(frame.width, 64u);
    EXPECT_EQ(frame.height, 32u);
    EXPECT_GE(frame.stride, frame.width);
    EXPECT_NE(frame.pixels, nullptr);

    FrameBuffer again;
    EXPECT_EQ(video_->beginFrame(again), Result::FrameInProgress);
    EXPECT_EQ(video_->endFrame(), Result::Success);
    EXPECT_FALSE(video_->isFrameInProgress());
}

TEST_F(PalVideoOutputTest, NothingPresentedYet) {
    ASSERT_EQ(video_->open(VideoConfig{}), Result::Success);
    EXPECT_EQ(backend().getPresentCount(), 0u);
    EXPECT_EQ(backend().getPresentedPixel(0, 0), 0u);
}

TEST_F(PalVideoOutputTest, PresentedFrameIsSnapshot) {
    ASSERT_EQ(video_->open(VideoConfig{}), Result::Success);
    fill(packPixel(0, 255, 102));
    EXPECT_EQ(backend().getPresentCount(), 1u);

    // Writing without presenting does not change what is shown
    FrameBuffer frame;
    ASSERT_EQ(video_->beginFrame(frame), Result::Success);
    frame.at(0, 0) = packPixel(255, 0, 0);
    EXPECT_EQ(backend().getPresentedPixel(0, 0), packPixel(0, 255, 102));
    ASSERT_EQ(video_->endFrame(), Result::Success);
    EXPECT_EQ(backend().getPresentedPixel(0, 0), packPixel(255, 0, 0));
    EXPECT_EQ(backend().getPresentCount(), 2u);
}

TEST_F(PalVideoOutputTest, WindowPixelsAreScaledBlocks) {
    VideoConfig config;
    config.scale = 16;
    ASSERT_EQ(video_->open(config), Result::Success);
    fill(packPixel(0, 0, 0));

    FrameBuffer frame;
    ASSERT_EQ(video_->beginFrame(frame), Result::Success);
    frame.at(1, 1) = packPixel(255, 255, 255);
    ASSERT_EQ(video_->endFrame(), Result::Success);

    EXPECT_EQ(backend().getWindowPixel(16, 16), 0xFFFFFFFFu);
    EXPECT_EQ(backend().getWindowPixel(31, 31), 0xFFFFFFFFu);
    EXPECT_EQ(backend().getWindowPixel(15, 16), 0xFF000000u);
    EXPECT_EQ(backend().getWindowPixel(32, 31), 0xFF000000u);
}

TEST_F(PalVideoOutputTest, OutOfRangeReadsAreZero) {
    ASSERT_EQ(video_->open(VideoConfig{}), Result::Success);
    fill(packPixel(1, 2, 3));
    EXPECT_EQ(backend().getPresentedPixel(64, 0), 0u);
    EXPECT_EQ(backend().getPresentedPixel(0, 32), 0u);
    EXPECT_EQ(backend().getWindowPixel(640, 0), 0u);
}

TEST_F(PalVideoOutputTest, CustomFrameSize) {
    VideoConfig config;
    config.frame_width = 128;
    config.frame_height = 64;
    config.scale = 4;
    ASSERT_EQ(video_->open(config), Result::Success);

    FrameBuffer frame;
    ASSERT_EQ(video_->beginFrame(frame), Result::Success);
    EXPECT_EQ(frame.width, 128u);
    EXPECT_EQ(frame.height, 64u);
    ASSERT_EQ(video_->endFrame(), Result::Success);

    uint32_t w = 0, h = 0;
    video_->getWindowSize(w, h);
    EXPECT_EQ(w, 512u);
    EXPECT_EQ(h, 256u);
}

} // namespace
} // namespace pal
