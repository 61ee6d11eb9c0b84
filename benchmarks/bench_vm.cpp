/**
 * @file bench_vm.cpp
 * @brief Machine and interpreter loop micro-benchmarks.
 */

#include <benchmark/benchmark.h>
#include <chip8/interpreter.h>
#include <chip8/machine.h>
#include <pal/platform.h>

#include <cstdint>
#include <vector>

using namespace chip8;

namespace {

std::vector<uint8_t> assemble(std::initializer_list<uint16_t> words) {
    std::vector<uint8_t> rom;
    for (uint16_t w : words) {
        rom.push_back(static_cast<uint8_t>(w >> 8));
        rom.push_back(static_cast<uint8_t>(w & 0xFF));
    }
    return rom;
}

// Arithmetic loop touching the ALU, skips and index register
const std::vector<uint8_t> ALU_LOOP = assemble({
    0x6001, 0x6102, 0x8014, 0x8115, 0x8016, 0xA300, 0xF01E, 0x3000, 0x1200,
});

// Draw-heavy loop: redraws glyph 8 across the screen
const std::vector<uint8_t> DRAW_LOOP = assemble({
    0x6008, 0xF029, 0xD125, 0x7105, 0x7203, 0x1202,
});

} // anonymous namespace

// ─────────────────────────────────────────────────────────────────────────────
// Decoder
// ─────────────────────────────────────────────────────────────────────────────

static void BM_DecodeAllWords(benchmark::State& state) {
    for (auto _ : state) {
        for (uint32_t word = 0; word <= 0xFFFF; ++word) {
            benchmark::DoNotOptimize(decode(static_cast<uint16_t>(word)));
        }
    }
    state.SetItemsProcessed(state.iterations() * 0x10000);
}
BENCHMARK(BM_DecodeAllWords);

static void BM_Disassemble(benchmark::State& state) {
    const Instruction in = decode(0xD125);
    for (auto _ : state) {
        benchmark::DoNotOptimize(disassemble(in));
    }
}
BENCHMARK(BM_Disassemble);

// ─────────────────────────────────────────────────────────────────────────────
// Execution
// ─────────────────────────────────────────────────────────────────────────────

static void BM_StepAluLoop(benchmark::State& state) {
    Machine vm(MachineConfig::deterministic());
    if (!vm.load(ALU_LOOP)) {
        state.SkipWithError("load failed");
        return;
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(vm.step());
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_StepAluLoop);

static void BM_StepDrawLoop(benchmark::State& state) {
    Machine vm(MachineConfig::deterministic());
    if (!vm.load(DRAW_LOOP)) {
        state.SkipWithError("load failed");
        return;
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(vm.step());
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_StepDrawLoop);

static void BM_RunFrame(benchmark::State& state) {
    MachineConfig config = MachineConfig::deterministic();
    config.cycles_per_tick = static_cast<uint32_t>(state.range(0));
    Machine vm(config);
    if (!vm.load(ALU_LOOP)) {
        state.SkipWithError("load failed");
        return;
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(vm.run_cycles(config.cycles_per_tick));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_RunFrame)->Arg(1)->Arg(4)->Arg(8);

// ─────────────────────────────────────────────────────────────────────────────
// Interpreter Loop
// ─────────────────────────────────────────────────────────────────────────────

static void BM_InterpreterTick(benchmark::State& state) {
    pal::Platform::shutdown();
    pal::Platform::initialize(pal::Backend::Headless);
    {
        FrontendConfig config;
        config.rom_path = "bench.ch8";
        config.screen_size = ScreenSize::Large;
        Interpreter interpreter(config);
        if (!interpreter.load_rom(DRAW_LOOP) || !interpreter.initialize()) {
            state.SkipWithError("interpreter start failed");
        } else {
            for (auto _ : state) {
                benchmark::DoNotOptimize(interpreter.tick());
            }
        }
    }
    pal::Platform::shutdown();
}
BENCHMARK(BM_InterpreterTick);

BENCHMARK_MAIN();
