// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 chip8vm Contributors
//
// PAL Performance Benchmarks

#include <benchmark/benchmark.h>
#include "pal/platform.h"
#include "pal/headless.h"
#include <vector>

// ═══════════════════════════════════════════════════════════════════════════
// Benchmark Fixtures
// ═══════════════════════════════════════════════════════════════════════════

class PALBenchmark : public benchmark::Fixture {
public:
    void SetUp(const benchmark::State&) override {
        pal::Platform::shutdown();
        // Headless keeps timings independent of the display server
        pal::Platform::initialize(pal::Backend::Headless);
    }

    void TearDown(const benchmark::State&) override {
        pal::Platform::shutdown();
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Video
// ═══════════════════════════════════════════════════════════════════════════

BENCHMARK_F(PALBenchmark, BM_VideoFramePresent)(benchmark::State& state) {
    auto video = pal::Platform::createVideoOutput();
    video->open(pal::VideoConfig{});

    const pal::Pixel on = pal::packPixel(0, 255, 102);
    const pal::Pixel off = pal::packPixel(0, 0, 0);
    pal::FrameBuffer frame;
    for (auto _ : state) {
        video->beginFrame(frame);
        for (uint32_t y = 0; y < frame.height; ++y) {
            for (uint32_t x = 0; x < frame.width; ++x) {
                frame.at(x, y) = ((x ^ y) & 1) ? on : off;
            }
        }
        video->endFrame();
    }

    state.SetItemsProcessed(state.iterations() * 64 * 32);
}

// ═══════════════════════════════════════════════════════════════════════════
// Audio
// ═══════════════════════════════════════════════════════════════════════════

BENCHMARK_F(PALBenchmark, BM_AudioQueueFrameOfTone)(benchmark::State& state) {
    auto audio = pal::Platform::createAudioQueue();
    audio->open(pal::AudioConfig{});
    auto& headless = static_cast<pal::headless::AudioQueueHeadless&>(*audio);

    // One 60 Hz frame of mono audio, drained as a device would
    std::vector<int16_t> samples(735, 1000);
    for (auto _ : state) {
        audio->queue(samples.data(), 735);
        headless.drainFrames(735);
    }

    state.SetItemsProcessed(state.iterations() * 735);
}

// ═══════════════════════════════════════════════════════════════════════════
// Input
// ═══════════════════════════════════════════════════════════════════════════

BENCHMARK_F(PALBenchmark, BM_InputPollKeyTap)(benchmark::State& state) {
    auto input = pal::Platform::createInputSource();
    auto& headless = static_cast<pal::headless::InputSourceHeadless&>(*input);

    pal::InputEvent event;
    for (auto _ : state) {
        headless.pushKeyTap(pal::scancode::Q);
        while (input->pollEvent(event)) {
            benchmark::DoNotOptimize(event);
        }
    }
}
