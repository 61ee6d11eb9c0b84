/**
 * @file timer.cpp
 * @brief TimerClock implementation.
 *
 * @copyright GPL-2.0-or-later
 */

#include "chip8/timer.h"
#include "chip8/logging.h"

namespace chip8 {

namespace {

constexpr uint64_t MICROS_PER_SECOND = 1000000;

} // anonymous namespace

void TimerClock::reset(uint64_t now_us) noexcept {
    delay_ = 0;
    sound_ = 0;
    last_decrement_us_ = now_us;
    ticks_ = 0;
}

bool TimerClock::tick_if_due(uint64_t now_us) {
    if (now_us < last_decrement_us_) {
        // Host clock restarted underneath us
        last_decrement_us_ = now_us;
        return false;
    }

    // Compare in integer microseconds * 60
    const uint64_t elapsed_us = now_us - last_decrement_us_;
    const uint64_t elapsed_scaled = elapsed_us * TIMER_HZ;
    if (elapsed_scaled < MICROS_PER_SECOND) {
        return false;
    }

    if (elapsed_scaled >= 2 * MICROS_PER_SECOND) {
        CHIP8_LOG_DEBUG("TIMER", "Host fell behind by %llu us, resyncing",
            static_cast<unsigned long long>(elapsed_us - MICROS_PER_SECOND / TIMER_HZ));
    }

    decrement();
    ++ticks_;
    last_decrement_us_ = now_us;
    return true;
}

void TimerClock::decrement() noexcept {
    if (delay_ > 0) {
        --delay_;
    }
    if (sound_ > 0) {
        --sound_;
    }
}

} // namespace chip8
