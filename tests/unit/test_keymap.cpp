/**
 * @file test_keymap.cpp
 * @brief Scancode to keypad and debug key bindings.
 */

#include <gtest/gtest.h>
#include <chip8/keymap.h>

#include <pal/input_source.h>

#include <set>

using namespace chip8;

TEST(KeymapTest, KeypadLayout) {
    EXPECT_EQ(keypad_for_scancode(pal::scancode::Num1), 0x1);
    EXPECT_EQ(keypad_for_scancode(pal::scancode::Num4), 0xC);
    EXPECT_EQ(keypad_for_scancode(pal::scancode::Q), 0x4);
    EXPECT_EQ(keypad_for_scancode(pal::scancode::R), 0xD);
    EXPECT_EQ(keypad_for_scancode(pal::scancode::A), 0x7);
    EXPECT_EQ(keypad_for_scancode(pal::scancode::F), 0xE);
    EXPECT_EQ(keypad_for_scancode(pal::scancode::Z), 0xA);
    EXPECT_EQ(keypad_for_scancode(pal::scancode::X), 0x0);
    EXPECT_EQ(keypad_for_scancode(pal::scancode::C), 0xB);
    EXPECT_EQ(keypad_for_scancode(pal::scancode::V), 0xF);
}

TEST(KeymapTest, SixteenDistinctKeys) {
    const uint16_t codes[] = {
        pal::scancode::Num1, pal::scancode::Num2, pal::scancode::Num3, pal::scancode::Num4,
        pal::scancode::Q, pal::scancode::W, pal::scancode::E, pal::scancode::R,
        pal::scancode::A, pal::scancode::S, pal::scancode::D, pal::scancode::F,
        pal::scancode::Z, pal::scancode::X, pal::scancode::C, pal::scancode::V,
    };
    std::set<uint8_t> keys;
    for (uint16_t code : codes) {
        auto key = keypad_for_scancode(code);
        ASSERT_TRUE(key.has_value()) << code;
        keys.insert(*key);
    }
    EXPECT_EQ(keys.size(), 16u);
}

TEST(KeymapTest, UnboundScancodes) {
    EXPECT_FALSE(keypad_for_scancode(pal::scancode::P).has_value());
    EXPECT_FALSE(keypad_for_scancode(pal::scancode::Escape).has_value());
    EXPECT_FALSE(keypad_for_scancode(0).has_value());
}

TEST(KeymapTest, DebugKeys) {
    EXPECT_EQ(debug_key_for_scancode(pal::scancode::P), DebugKey::DumpState);
    EXPECT_EQ(debug_key_for_scancode(pal::scancode::End), DebugKey::TogglePause);
    EXPECT_EQ(debug_key_for_scancode(pal::scancode::PageDown), DebugKey::SingleStep);
    EXPECT_EQ(debug_key_for_scancode(pal::scancode::Q), DebugKey::None);
}
