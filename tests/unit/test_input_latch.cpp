/**
 * @file test_input_latch.cpp
 * @brief Unit tests for the 16-key InputLatch.
 */

#include <gtest/gtest.h>
#include <chip8/input_latch.h>

#include <thread>

using namespace chip8;

TEST(InputLatchTest, StartsReleased) {
    InputLatch latch;
    for (uint8_t key = 0; key < KEY_COUNT; ++key) {
        EXPECT_FALSE(latch.is_pressed(key));
    }
    EXPECT_FALSE(latch.any_pressed());
    EXPECT_FALSE(latch.first_pressed().has_value());
    EXPECT_EQ(latch.mask(), 0);
}

TEST(InputLatchTest, PressAndRelease) {
    InputLatch latch;
    latch.press(0xA);
    EXPECT_TRUE(latch.is_pressed(0xA));
    EXPECT_EQ(latch.mask(), 1u << 0xA);
    latch.release(0xA);
    EXPECT_FALSE(latch.is_pressed(0xA));
}

TEST(InputLatchTest, FirstPressedIsLowestKey) {
    InputLatch latch;
    latch.press(0xF);
    latch.press(0x3);
    latch.press(0x9);
    ASSERT_TRUE(latch.first_pressed().has_value());
    EXPECT_EQ(*latch.first_pressed(), 0x3);
    EXPECT_EQ(latch.mask(), (1u << 0x3) | (1u << 0x9) | (1u << 0xF));
}

TEST(InputLatchTest, ReleaseAll) {
    InputLatch latch;
    latch.set(0, true);
    latch.set(15, true);
    latch.release_all();
    EXPECT_FALSE(latch.any_pressed());
}

TEST(InputLatchTest, WriterThreadVisibleToReader) {
    InputLatch latch;
    std::thread writer([&latch] {
        for (uint8_t key = 0; key < KEY_COUNT; ++key) {
            latch.press(key);
        }
    });
    writer.join();
    EXPECT_EQ(latch.mask(), 0xFFFF);
}
