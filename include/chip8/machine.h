/**
 * @file machine.h
 * @brief CHIP-8 execution engine.
 *
 * Machine owns memory, registers, timers, the display buffer and the
 * input latch of one virtual machine, and advances them one
 * fetch-decode-execute cycle per step().
 *
 * ## State Machine
 * @verbatim
 *   Running       -> [step]                   -> Running
 *   Running       -> [FX0A, no key held]      -> WaitingForKey
 *   WaitingForKey -> [step, key held]         -> Running
 *   Running/Wait  -> [pause]                  -> Paused
 *   Paused        -> [resume]                 -> state before pause
 *   Paused        -> [single_step]            -> Paused
 *   Any           -> [stack overflow/underflow] -> Halted
 *   Any           -> [reset/load]             -> Running
 * @endverbatim
 *
 * ## Thread Safety
 * Not thread-safe, except input() whose keys may be written from an
 * input thread. Everything else must be driven from one control loop.
 *
 * ## Example
 * @code
 *   Machine vm(MachineConfig::chip48());
 *   auto loaded = vm.load(rom_bytes);
 *   if (!loaded) {
 *       CHIP8_LOG_ERROR("VM", "%s", loaded.error().format().c_str());
 *       return;
 *   }
 *   while (vm.state() != MachineState::Halted) {
 *       vm.tick_timers(clock.nowUs());
 *       auto ran = vm.run_cycles(vm.config().cycles_per_tick);
 *       ...
 *   }
 * @endcode
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "display.h"
#include "error.h"
#include "input_latch.h"
#include "instruction.h"
#include "machine_config.h"
#include "memory.h"
#include "registers.h"
#include "timer.h"

#include <array>
#include <cstdint>
#include <optional>
#include <random>
#include <span>
#include <string>
#include <vector>

namespace chip8 {

/// Instructions executed by one debug single step.
constexpr uint32_t DEBUG_STEP_INSTRUCTIONS = 4;

// ─────────────────────────────────────────────────────────────────────────────
// Machine State
// ─────────────────────────────────────────────────────────────────────────────

enum class MachineState {
    Running,        ///< Executing instructions
    Paused,         ///< Suspended by the debugger
    WaitingForKey,  ///< Blocked in FX0A until a key is pressed
    Halted          ///< Fatal error; needs reset() or load()
};

[[nodiscard]] inline const char* to_string(MachineState state) noexcept {
    switch (state) {
        case MachineState::Running:       return "Running";
        case MachineState::Paused:        return "Paused";
        case MachineState::WaitingForKey: return "WaitingForKey";
        case MachineState::Halted:        return "Halted";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// Step Outcome
// ─────────────────────────────────────────────────────────────────────────────

enum class StepStatus {
    Executed,       ///< An instruction completed
    WaitingForKey   ///< Blocked in FX0A; no cycle consumed
};

/**
 * @brief Side effects applied by one step.
 */
struct StepEffects {
    bool display_changed = false;   ///< CLS or DRW ran
    bool collision = false;         ///< DRW turned a lit pixel off
    bool delay_timer_set = false;   ///< FX15
    bool sound_timer_set = false;   ///< FX18
    bool memory_written = false;    ///< FX33/FX55 stored at least one byte
    bool reserved_write = false;    ///< A store below 0x200 was dropped
    bool key_consumed = false;      ///< FX0A completed with a key
    bool unknown_opcode = false;    ///< Word skipped as unknown
};

/**
 * @brief What a step() did, for debugger introspection.
 */
struct StepOutcome {
    StepStatus status = StepStatus::Executed;
    Instruction instruction;   ///< Decoded word at pc
    uint16_t pc = 0;           ///< Address the word was fetched from
    StepEffects effects;

    /// Non-fatal fault the step recovered from (UnknownOpcode, MemoryError)
    std::optional<Error> warning;
};

// ─────────────────────────────────────────────────────────────────────────────
// Snapshot
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Copy of the debugger-visible machine state.
 */
struct MachineSnapshot {
    uint16_t pc = 0;
    uint16_t i = 0;
    std::array<uint8_t, REGISTER_COUNT> v{};
    std::vector<uint16_t> stack;   ///< Bottom to top
    uint8_t sp = 0;
    uint8_t delay_timer = 0;
    uint8_t sound_timer = 0;
    Mode mode = Mode::Chip8;
    MachineState state = MachineState::Running;
    uint64_t cycles = 0;
    uint16_t keys = 0;             ///< Bit k set while keypad key k is held

    /**
     * @brief Multi-line human readable dump.
     */
    [[nodiscard]] std::string to_string() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// Machine
// ─────────────────────────────────────────────────────────────────────────────

class Machine {
public:
    /**
     * @brief Construct a machine in Running state with an empty program.
     * @throws ConfigException if config.validate() fails
     */
    explicit Machine(const MachineConfig& config = MachineConfig{});

    ~Machine() = default;

    // Non-copyable, non-movable (input latch may be shared with a poller)
    Machine(const Machine&) = delete;
    Machine& operator=(const Machine&) = delete;
    Machine(Machine&&) = delete;
    Machine& operator=(Machine&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Program Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Store a ROM image and reset so it runs from PROGRAM_START.
     *
     * @return RomTooLarge if rom.size() > MAX_ROM_SIZE; the machine and
     *         the previously stored image are unchanged on failure
     */
    Result<void> load(std::span<const uint8_t> rom);

    /**
     * @brief Power-cycle the machine.
     *
     * Zeroes memory, reloads the font and the stored ROM image, clears
     * registers, stack, display and timers, and returns to Running.
     * Clears last_error(). The input latch is left alone.
     */
    void reset();

    // ─────────────────────────────────────────────────────────────────────────
    // Execution
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Execute one fetch-decode-execute cycle.
     *
     * In WaitingForKey the latch is polled instead: with no key held the
     * outcome reports StepStatus::WaitingForKey and nothing changes.
     *
     * @return The outcome; InvalidState while Paused or Halted (state is
     *         untouched); StackOverflow/StackUnderflow when the
     *         instruction faults, after which state() == Halted
     */
    Result<StepOutcome> step();

    /**
     * @brief Run up to count steps.
     *
     * Stops early on a key wait. A no-op returning 0 while Paused.
     *
     * @return Instructions executed; the fault if one halts the machine
     */
    Result<uint32_t> run_cycles(uint32_t count);

    /**
     * @brief Let the timer clock decay if a 60 Hz period has elapsed.
     *
     * Timers are frozen while Paused or Halted. The first call after
     * reset() or resume() only re-anchors the 60 Hz cadence at now_us.
     *
     * @return true if the timers were decremented
     */
    bool tick_timers(uint64_t now_us);

    // ─────────────────────────────────────────────────────────────────────────
    // Debug Control
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Suspend execution.
     * @return InvalidState unless Running or WaitingForKey
     */
    Result<void> pause();

    /**
     * @brief Return to the state held before pause().
     * @return InvalidState unless Paused
     */
    Result<void> resume();

    /**
     * @brief Execute instructions while Paused, then stay Paused.
     *
     * Stops early if an instruction starts a key wait.
     *
     * @param count Instructions to run (debug granularity is 4)
     * @return Outcomes of the executed instructions; InvalidState unless
     *         Paused; the fault if one halts the machine
     */
    Result<std::vector<StepOutcome>> single_step(uint32_t count = DEBUG_STEP_INSTRUCTIONS);

    /**
     * @brief Snapshot registers, stack, timers, mode and state.
     */
    [[nodiscard]] MachineSnapshot dump_state() const;

    // ─────────────────────────────────────────────────────────────────────────
    // State Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] MachineState state() const noexcept { return state_; }
    [[nodiscard]] bool is_halted() const noexcept { return state_ == MachineState::Halted; }
    [[nodiscard]] bool is_paused() const noexcept { return state_ == MachineState::Paused; }

    /// Fatal error that halted the machine, if any.
    [[nodiscard]] const std::optional<Error>& last_error() const noexcept { return last_error_; }

    [[nodiscard]] const MachineConfig& config() const noexcept { return config_; }
    [[nodiscard]] Mode mode() const noexcept { return config_.mode; }

    /// Instructions executed since the last reset.
    [[nodiscard]] uint64_t cycles() const noexcept { return cycles_; }

    /// Sound timer is running; drive the tone from this.
    [[nodiscard]] bool tone_on() const noexcept { return timers_.tone_on(); }

    // ─────────────────────────────────────────────────────────────────────────
    // Subsystem Access
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] const Memory& memory() const noexcept { return memory_; }
    [[nodiscard]] const RegisterFile& registers() const noexcept { return regs_; }
    [[nodiscard]] const TimerClock& timers() const noexcept { return timers_; }
    [[nodiscard]] const DisplayBuffer& display() const noexcept { return display_; }
    [[nodiscard]] DisplayBuffer& display() noexcept { return display_; }
    [[nodiscard]] InputLatch& input() noexcept { return input_; }
    [[nodiscard]] const InputLatch& input() const noexcept { return input_; }

private:
    Result<StepOutcome> execute_next();
    Result<StepOutcome> poll_key_wait();
    void store(uint16_t addr, uint8_t value, StepOutcome& out);
    std::unexpected<Error> halt(const Error& error);

    MachineConfig config_;
    Memory memory_;
    RegisterFile regs_;
    TimerClock timers_;
    DisplayBuffer display_;
    InputLatch input_;
    std::mt19937 rng_;

    std::vector<uint8_t> rom_;
    MachineState state_ = MachineState::Running;
    MachineState resume_state_ = MachineState::Running;
    uint8_t wait_register_ = 0;
    bool timer_epoch_stale_ = true;
    uint64_t cycles_ = 0;
    std::optional<Error> last_error_;
};

} // namespace chip8
