// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 chip8vm Contributors
//
// Platform Abstraction Layer - Audio Queue Interface

#pragma once

#include "pal/types.h"
#include <cstdint>

namespace pal {

/// Mono signed 16-bit output stream
struct AudioConfig {
    uint32_t sample_rate = 44100;
    uint32_t max_queued_frames = 11025;   // 250 ms at 44.1 kHz
};

/// Push-model audio output
///
/// The frontend queues samples ahead of playback; the device drains the
/// queue at the sample rate and plays silence when it runs dry. Emulation
/// timing never waits on the device.
class IAudioQueue {
public:
    virtual ~IAudioQueue() = default;

    // ═══════════════════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════════════════

    /// Open the output device. Devices open stopped.
    /// @return Success, InvalidParameter, AlreadyInitialized, DeviceNotFound
    virtual Result open(const AudioConfig& config) = 0;

    /// Close the device and drop queued samples (safe to call if not open)
    virtual void close() = 0;

    virtual bool isOpen() const = 0;

    // ═══════════════════════════════════════════════════════════════════════
    // Queue
    // ═══════════════════════════════════════════════════════════════════════

    /// Append samples. All or nothing: a push that would exceed
    /// max_queued_frames queues nothing.
    /// @return Success, NotInitialized, InvalidParameter (null), QueueFull
    virtual Result queue(const int16_t* samples, uint32_t count) = 0;

    /// Frames queued and not yet played
    virtual uint32_t getQueuedFrames() const = 0;

    /// Drop everything not yet played
    virtual void clear() = 0;

    // ═══════════════════════════════════════════════════════════════════════
    // Playback
    // ═══════════════════════════════════════════════════════════════════════

    /// @return Success, NotInitialized
    virtual Result setPlaying(bool playing) = 0;

    virtual bool isPlaying() const = 0;

    /// Sample rate in use; 0 when closed
    virtual uint32_t getSampleRate() const = 0;
};

} // namespace pal
