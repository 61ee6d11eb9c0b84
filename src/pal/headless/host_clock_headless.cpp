// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 chip8vm Contributors
//
// Platform Abstraction Layer - Headless Host Clock Implementation

#include "pal/headless.h"

namespace pal {
namespace headless {

void HostClockHeadless::sleepUs(uint64_t us) {
    // Never blocks
    total_slept_us_ += us;
    ++sleep_count_;
    if (auto_advance_) {
        now_us_ += us;
    }
}

} // namespace headless
} // namespace pal
