// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 chip8vm Contributors

#include <gtest/gtest.h>
#include "pal/platform.h"
#include "pal/headless.h"

#include <thread>
#include <vector>

namespace pal {
namespace {

class PalInputSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        Platform::shutdown();
        ASSERT_EQ(Platform::initialize(Backend::Headless), Result::Success);
        input_ = Platform::createInputSource();
        ASSERT_NE(input_, nullptr);
    }

    void TearDown() override {
        input_.reset();
        Platform::shutdown();
    }

    headless::InputSourceHeadless& backend() {
        return static_cast<headless::InputSourceHeadless&>(*input_);
    }

    std::vector<InputEvent> drain() {
        std::vector<InputEvent> events;
        InputEvent event;
        while (input_->pollEvent(event)) {
            events.push_back(event);
        }
        return events;
    }

    std::unique_ptr<IInputSource> input_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Polling
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(PalInputSourceTest, EmptyPollLeavesEventUntouched) {
    InputEvent event;
    event.type = InputEventType::KeyUp;
    event.scancode = scancode::P;
    EXPECT_FALSE(input_->pollEvent(event));
    EXPECT_EQ(event.type, InputEventType::KeyUp);
    EXPECT_EQ(event.scancode, scancode::P);
}

TEST_F(PalInputSourceTest, EventsArriveInOrder) {
    backend().pushKeyDown(scancode::Q);
    backend().pushKeyDown(scancode::W, true);
    backend().pushKeyUp(scancode::Q);
    backend().pushQuit();
    EXPECT_EQ(backend().getPendingCount(), 4u);

    auto events = drain();
    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events[0].type, InputEventType::KeyDown);
    EXPECT_EQ(events[0].scancode, scancode::Q);
    EXPECT_FALSE(events[0].repeat);
    EXPECT_EQ(events[1].scancode, scancode::W);
    EXPECT_TRUE(events[1].repeat);
    EXPECT_EQ(events[2].type, InputEventType::KeyUp);
    EXPECT_EQ(events[3].type, InputEventType::Quit);
    EXPECT_EQ(backend().getPendingCount(), 0u);
}

TEST_F(PalInputSourceTest, KeyTapIsDownThenUp) {
    backend().pushKeyTap(scancode::End);
    auto events = drain();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].type, InputEventType::KeyDown);
    EXPECT_EQ(events[1].type, InputEventType::KeyUp);
    EXPECT_EQ(events[1].scancode, scancode::End);
}

TEST_F(PalInputSourceTest, ArbitraryEvent) {
    InputEvent custom;
    custom.type = InputEventType::KeyUp;
    custom.scancode = 200;
    backend().push(custom);

    InputEvent out;
    ASSERT_TRUE(input_->pollEvent(out));
    EXPECT_EQ(out.scancode, 200);
}

TEST_F(PalInputSourceTest, InjectionFromAnotherThread) {
    constexpr int COUNT = 1000;
    std::thread producer([this] {
        for (int n = 0; n < COUNT; ++n) {
            backend().pushKeyDown(scancode::A);
        }
    });

    int seen = 0;
    InputEvent event;
    while (seen < COUNT) {
        if (input_->pollEvent(event)) {
            EXPECT_EQ(event.scancode, scancode::A);
            ++seen;
        }
    }
    producer.join();
    EXPECT_EQ(backend().getPendingCount(), 0u);
}

} // namespace
} // namespace pal
