/**
 * @file timer.h
 * @brief 60 Hz delay and sound timers.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <cstdint>

namespace chip8 {

constexpr uint32_t TIMER_HZ = 60;

/**
 * @brief Delay/sound timer pair decremented at a fixed 60 Hz cadence.
 *
 * The cadence is driven by host time handed in through tick_if_due(),
 * independent of how many instructions ran in between. Two decrements
 * are always at least 1/60 s apart.
 *
 * @invariant Counters never go below zero.
 */
class TimerClock {
public:
    /**
     * @brief Zero both counters and restart the cadence at now_us.
     */
    void reset(uint64_t now_us = 0) noexcept;

    /**
     * @brief Decrement both counters once if 1/60 s has elapsed since the
     *        last decrement (or since reset/resync).
     *
     * At most one decrement happens per call and the next period is
     * measured from now_us, so a caller that fell several periods behind
     * (e.g. the host was suspended) gets one decrement, not a burst.
     *
     * @param now_us Monotonic host time in microseconds
     * @return true if the counters were decremented
     */
    bool tick_if_due(uint64_t now_us);

    /**
     * @brief Restart the cadence at now_us without touching the counters.
     */
    void resync(uint64_t now_us) noexcept { last_decrement_us_ = now_us; }

    /**
     * @brief Decrement both counters once, saturating at zero.
     */
    void decrement() noexcept;

    [[nodiscard]] uint8_t delay() const noexcept { return delay_; }
    [[nodiscard]] uint8_t sound() const noexcept { return sound_; }

    void set_delay(uint8_t value) noexcept { delay_ = value; }
    void set_sound(uint8_t value) noexcept { sound_ = value; }

    /// Tone should play while the sound timer is non-zero.
    [[nodiscard]] bool tone_on() const noexcept { return sound_ > 0; }

    /// Periods elapsed since the last reset.
    [[nodiscard]] uint64_t ticks() const noexcept { return ticks_; }

    /// Host time of the last decrement, reset or resync.
    [[nodiscard]] uint64_t last_decrement_us() const noexcept { return last_decrement_us_; }

private:
    uint8_t delay_ = 0;
    uint8_t sound_ = 0;
    uint64_t last_decrement_us_ = 0;
    uint64_t ticks_ = 0;
};

} // namespace chip8
