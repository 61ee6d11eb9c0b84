// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 chip8vm Contributors

#include <gtest/gtest.h>
#include "pal/platform.h"
#include "pal/headless.h"

namespace pal {
namespace {

class PalHostClockTest : public ::testing::Test {
protected:
    void SetUp() override {
        Platform::shutdown();
        ASSERT_EQ(Platform::initialize(Backend::Headless), Result::Success);
        clock_ = Platform::createHostClock();
        ASSERT_NE(clock_, nullptr);
    }

    void TearDown() override {
        clock_.reset();
        Platform::shutdown();
    }

    headless::HostClockHeadless& backend() {
        return static_cast<headless::HostClockHeadless&>(*clock_);
    }

    std::unique_ptr<IHostClock> clock_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Virtual Time
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(PalHostClockTest, StartsAtZeroAndStaysThere) {
    EXPECT_EQ(clock_->nowUs(), 0u);
    EXPECT_EQ(clock_->nowUs(), 0u);
}

TEST_F(PalHostClockTest, SetAndAdvance) {
    backend().setNowUs(16666);
    EXPECT_EQ(clock_->nowUs(), 16666u);
    backend().advanceUs(1);
    EXPECT_EQ(clock_->nowUs(), 16667u);
}

TEST_F(PalHostClockTest, ClocksAreIndependent) {
    auto other = Platform::createHostClock();
    ASSERT_NE(other, nullptr);
    backend().advanceUs(500);
    EXPECT_EQ(other->nowUs(), 0u);
}

// ═══════════════════════════════════════════════════════════════════════════
// Sleep
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(PalHostClockTest, SleepRecordsWithoutAdvancing) {
    clock_->sleepUs(16666);
    EXPECT_EQ(backend().getTotalSleptUs(), 16666u);
    EXPECT_EQ(backend().getSleepCount(), 1u);
    EXPECT_EQ(clock_->nowUs(), 0u);
}

TEST_F(PalHostClockTest, AutoAdvanceMovesTimeBySleep) {
    backend().setAutoAdvance(true);
    clock_->sleepUs(16666);
    clock_->sleepUs(16667);
    EXPECT_EQ(clock_->nowUs(), 33333u);
    EXPECT_EQ(backend().getTotalSleptUs(), 33333u);
    EXPECT_EQ(backend().getSleepCount(), 2u);
}

TEST_F(PalHostClockTest, ZeroSleepCounts) {
    clock_->sleepUs(0);
    EXPECT_EQ(backend().getSleepCount(), 1u);
    EXPECT_EQ(backend().getTotalSleptUs(), 0u);
}

} // namespace
} // namespace pal
