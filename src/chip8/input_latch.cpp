/**
 * @file input_latch.cpp
 * @brief InputLatch implementation.
 *
 * @copyright GPL-2.0-or-later
 */

#include "chip8/input_latch.h"
#include "chip8/gsl.hpp"

namespace chip8 {

void InputLatch::set(uint8_t key, bool pressed) {
    gsl_Expects(key < KEY_COUNT);
    keys_[key].store(pressed, std::memory_order_release);
}

void InputLatch::release_all() noexcept {
    for (auto& k : keys_) {
        k.store(false, std::memory_order_relaxed);
    }
}

bool InputLatch::is_pressed(uint8_t key) const {
    gsl_Expects(key < KEY_COUNT);
    return keys_[key].load(std::memory_order_acquire);
}

std::optional<uint8_t> InputLatch::first_pressed() const noexcept {
    for (uint8_t k = 0; k < KEY_COUNT; ++k) {
        if (keys_[k].load(std::memory_order_acquire)) {
            return k;
        }
    }
    return std::nullopt;
}

uint16_t InputLatch::mask() const noexcept {
    uint16_t m = 0;
    for (uint8_t k = 0; k < KEY_COUNT; ++k) {
        if (keys_[k].load(std::memory_order_acquire)) {
            m = static_cast<uint16_t>(m | (1u << k));
        }
    }
    return m;
}

} // namespace chip8
