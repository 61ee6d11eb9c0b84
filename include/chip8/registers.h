/**
 * @file registers.h
 * @brief CHIP-8 register file and call stack.
 *
 * Encapsulates V0-VF, I, PC and the 16-entry return stack so every
 * Machine instance owns its own processor state.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "error.h"
#include "memory.h"

#include <array>
#include <cstdint>

namespace chip8 {

constexpr size_t REGISTER_COUNT = 16;
constexpr size_t STACK_DEPTH = 16;

// ─────────────────────────────────────────────────────────────────────────────
// Return Stack
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Fixed-depth stack of return addresses.
 *
 * @invariant depth() <= STACK_DEPTH
 */
class ReturnStack {
public:
    /**
     * @brief Push a return address.
     * @return StackOverflow if the stack already holds STACK_DEPTH entries
     */
    Result<void> push(uint16_t addr) {
        if (sp_ >= STACK_DEPTH) {
            return make_error(ErrorCode::StackOverflow,
                format_message("CALL with %zu return addresses on the stack", STACK_DEPTH));
        }
        entries_[sp_++] = addr;
        return Ok();
    }

    /**
     * @brief Pop the most recent return address.
     * @return StackUnderflow if the stack is empty
     */
    Result<uint16_t> pop() {
        if (sp_ == 0) {
            return make_error(ErrorCode::StackUnderflow, "RET with empty stack");
        }
        return Ok(entries_[--sp_]);
    }

    void clear() noexcept {
        entries_.fill(0);
        sp_ = 0;
    }

    [[nodiscard]] uint8_t depth() const noexcept { return sp_; }
    [[nodiscard]] bool empty() const noexcept { return sp_ == 0; }

    /// Entry i counted from the bottom; valid for i < depth().
    [[nodiscard]] uint16_t entry(size_t i) const noexcept { return entries_[i]; }

private:
    std::array<uint16_t, STACK_DEPTH> entries_{};
    uint8_t sp_ = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// Register File
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Processor registers.
 *
 * V registers wrap on overflow; VF doubles as the carry, borrow and
 * collision flag. I is 16 bits wide but only the low 12 address memory.
 */
struct RegisterFile {
    std::array<uint8_t, REGISTER_COUNT> v{};  ///< V0-VF
    uint16_t i = 0;                          ///< Index register
    uint16_t pc = PROGRAM_START;             ///< Program counter
    ReturnStack stack;

    /**
     * @brief Zero all registers, empty the stack, PC = PROGRAM_START.
     */
    void reset() noexcept {
        v.fill(0);
        i = 0;
        pc = PROGRAM_START;
        stack.clear();
    }

    [[nodiscard]] uint8_t vf() const noexcept { return v[0xF]; }
    void set_flag(bool on) noexcept { v[0xF] = on ? 1 : 0; }
};

} // namespace chip8
