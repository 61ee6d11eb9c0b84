// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 chip8vm Contributors
//
// Platform Abstraction Layer - Host Clock Interface

#pragma once

#include <cstdint>

namespace pal {

/// Monotonic time source for frame pacing and the 60 Hz timer cadence
///
/// Time starts at 0 when the clock is created. The interpreter samples
/// nowUs() once per frame and sleeps out the remainder of the frame; the
/// instruction rate comes from instructions per frame, not from this clock.
class IHostClock {
public:
    virtual ~IHostClock() = default;

    /// Microseconds since creation, never decreasing
    virtual uint64_t nowUs() const = 0;

    /// Sleep at least us microseconds
    virtual void sleepUs(uint64_t us) = 0;
};

} // namespace pal
