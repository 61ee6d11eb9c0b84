/**
 * @file instruction.h
 * @brief Opcode decoder: 16-bit instruction word to tagged operation.
 *
 * decode() is a pure function over the instruction word. The Machine
 * consumes the result through a single switch over Op, so each opcode's
 * semantics live in exactly one place.
 *
 * Operand fields follow the usual CHIP-8 naming:
 * @verbatim
 *   0xABCD
 *     A    - operation group (high nibble)
 *      B   - X register index
 *       C  - Y register index
 *        D - N (4-bit immediate)
 *       CD - NN (8-bit immediate)
 *      BCD - NNN (12-bit address)
 * @endverbatim
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <cstdint>
#include <string>

namespace chip8 {

// ─────────────────────────────────────────────────────────────────────────────
// Operations
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Decoded operation tag.
 */
enum class Op : uint8_t {
    Sys,        ///< 0NNN  machine code routine (ignored)
    Cls,        ///< 00E0  clear display
    Ret,        ///< 00EE  return from subroutine
    Jp,         ///< 1NNN  PC = NNN
    Call,       ///< 2NNN  call subroutine at NNN
    SeImm,      ///< 3XNN  skip if VX == NN
    SneImm,     ///< 4XNN  skip if VX != NN
    SeReg,      ///< 5XY0  skip if VX == VY
    LdImm,      ///< 6XNN  VX = NN
    AddImm,     ///< 7XNN  VX += NN (no carry)
    LdReg,      ///< 8XY0  VX = VY
    Or,         ///< 8XY1  VX |= VY
    And,        ///< 8XY2  VX &= VY
    Xor,        ///< 8XY3  VX ^= VY
    AddReg,     ///< 8XY4  VX += VY, VF = carry
    Sub,        ///< 8XY5  VX -= VY, VF = not borrow
    Shr,        ///< 8XY6  VX >>= 1, VF = shifted-out bit
    Subn,       ///< 8XY7  VX = VY - VX, VF = not borrow
    Shl,        ///< 8XYE  VX <<= 1, VF = shifted-out bit
    SneReg,     ///< 9XY0  skip if VX != VY
    LdI,        ///< ANNN  I = NNN
    JpV0,       ///< BNNN  PC = NNN + V0
    Rnd,        ///< CXNN  VX = random & NN
    Drw,        ///< DXYN  draw N-row sprite at (VX, VY)
    Skp,        ///< EX9E  skip if key VX pressed
    Sknp,       ///< EXA1  skip if key VX not pressed
    LdVxDt,     ///< FX07  VX = delay timer
    LdKey,      ///< FX0A  wait for key, VX = key
    LdDtVx,     ///< FX15  delay timer = VX
    LdStVx,     ///< FX18  sound timer = VX
    AddI,       ///< FX1E  I += VX
    LdFont,     ///< FX29  I = glyph address of digit VX
    Bcd,        ///< FX33  store BCD of VX at I..I+2
    StoreRegs,  ///< FX55  store V0..VX at I
    LoadRegs,   ///< FX65  load V0..VX from I
    Unknown     ///< unrecognized bit pattern
};

[[nodiscard]] const char* op_name(Op op) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Instruction
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Decoded instruction with all operand fields extracted.
 *
 * Fields are extracted for every word regardless of op so the debugger can
 * show them; only the fields named by the op's pattern are meaningful.
 */
struct Instruction {
    Op op = Op::Unknown;
    uint16_t raw = 0;
    uint8_t x = 0;
    uint8_t y = 0;
    uint8_t n = 0;
    uint8_t nn = 0;
    uint16_t nnn = 0;

    [[nodiscard]] constexpr bool operator==(const Instruction&) const noexcept = default;
};

namespace detail {

[[nodiscard]] constexpr Op classify(uint16_t word) noexcept {
    const uint8_t n = word & 0x000F;
    const uint8_t nn = word & 0x00FF;

    switch (word >> 12) {
        case 0x0:
            if (word == 0x00E0) return Op::Cls;
            if (word == 0x00EE) return Op::Ret;
            return Op::Sys;
        case 0x1: return Op::Jp;
        case 0x2: return Op::Call;
        case 0x3: return Op::SeImm;
        case 0x4: return Op::SneImm;
        case 0x5: return n == 0 ? Op::SeReg : Op::Unknown;
        case 0x6: return Op::LdImm;
        case 0x7: return Op::AddImm;
        case 0x8:
            switch (n) {
                case 0x0: return Op::LdReg;
                case 0x1: return Op::Or;
                case 0x2: return Op::And;
                case 0x3: return Op::Xor;
                case 0x4: return Op::AddReg;
                case 0x5: return Op::Sub;
                case 0x6: return Op::Shr;
                case 0x7: return Op::Subn;
                case 0xE: return Op::Shl;
                default:  return Op::Unknown;
            }
        case 0x9: return n == 0 ? Op::SneReg : Op::Unknown;
        case 0xA: return Op::LdI;
        case 0xB: return Op::JpV0;
        case 0xC: return Op::Rnd;
        case 0xD: return Op::Drw;
        case 0xE:
            if (nn == 0x9E) return Op::Skp;
            if (nn == 0xA1) return Op::Sknp;
            return Op::Unknown;
        case 0xF:
            switch (nn) {
                case 0x07: return Op::LdVxDt;
                case 0x0A: return Op::LdKey;
                case 0x15: return Op::LdDtVx;
                case 0x18: return Op::LdStVx;
                case 0x1E: return Op::AddI;
                case 0x29: return Op::LdFont;
                case 0x33: return Op::Bcd;
                case 0x55: return Op::StoreRegs;
                case 0x65: return Op::LoadRegs;
                default:   return Op::Unknown;
            }
    }
    return Op::Unknown;
}

} // namespace detail

/**
 * @brief Decode a big-endian instruction word.
 *
 * Pure: the same word always yields the same Instruction.
 */
[[nodiscard]] constexpr Instruction decode(uint16_t word) noexcept {
    Instruction instr;
    instr.op = detail::classify(word);
    instr.raw = word;
    instr.x = static_cast<uint8_t>((word >> 8) & 0x0F);
    instr.y = static_cast<uint8_t>((word >> 4) & 0x0F);
    instr.n = static_cast<uint8_t>(word & 0x000F);
    instr.nn = static_cast<uint8_t>(word & 0x00FF);
    instr.nnn = static_cast<uint16_t>(word & 0x0FFF);
    return instr;
}

/**
 * @brief Render an instruction as assembly, e.g. "LD V1, 0x7B".
 */
[[nodiscard]] std::string disassemble(const Instruction& instr);

} // namespace chip8
