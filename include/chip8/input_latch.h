/**
 * @file input_latch.h
 * @brief 16-key keypad state written by the host, read by the machine.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <optional>

namespace chip8 {

constexpr uint8_t KEY_COUNT = 16;

/**
 * @brief Keypad snapshot.
 *
 * Single writer (the input poller), single reader (the machine). Each key
 * is an independent atomic so a poller on another thread needs no lock.
 */
class InputLatch {
public:
    InputLatch() noexcept { release_all(); }

    /**
     * @brief Set key state.
     * @pre key < KEY_COUNT
     */
    void set(uint8_t key, bool pressed);

    void press(uint8_t key) { set(key, true); }
    void release(uint8_t key) { set(key, false); }

    void release_all() noexcept;

    /**
     * @brief Key state.
     * @pre key < KEY_COUNT
     */
    [[nodiscard]] bool is_pressed(uint8_t key) const;

    /**
     * @brief Lowest-numbered pressed key, if any.
     */
    [[nodiscard]] std::optional<uint8_t> first_pressed() const noexcept;

    [[nodiscard]] bool any_pressed() const noexcept {
        return first_pressed().has_value();
    }

    /// Bit k set when key k is pressed.
    [[nodiscard]] uint16_t mask() const noexcept;

private:
    std::array<std::atomic<bool>, KEY_COUNT> keys_;
};

} // namespace chip8
