/**
 * @file instruction.cpp
 * @brief Opcode names and disassembler.
 *
 * @copyright GPL-2.0-or-later
 */

#include "chip8/instruction.h"
#include "chip8/error.h"

namespace chip8 {

const char* op_name(Op op) noexcept {
    switch (op) {
        case Op::Sys:       return "SYS";
        case Op::Cls:       return "CLS";
        case Op::Ret:       return "RET";
        case Op::Jp:        return "JP";
        case Op::Call:      return "CALL";
        case Op::SeImm:     return "SE";
        case Op::SneImm:    return "SNE";
        case Op::SeReg:     return "SE";
        case Op::LdImm:     return "LD";
        case Op::AddImm:    return "ADD";
        case Op::LdReg:     return "LD";
        case Op::Or:        return "OR";
        case Op::And:       return "AND";
        case Op::Xor:       return "XOR";
        case Op::AddReg:    return "ADD";
        case Op::Sub:       return "SUB";
        case Op::Shr:       return "SHR";
        case Op::Subn:      return "SUBN";
        case Op::Shl:       return "SHL";
        case Op::SneReg:    return "SNE";
        case Op::LdI:       return "LD";
        case Op::JpV0:      return "JP";
        case Op::Rnd:       return "RND";
        case Op::Drw:       return "DRW";
        case Op::Skp:       return "SKP";
        case Op::Sknp:      return "SKNP";
        case Op::LdVxDt:    return "LD";
        case Op::LdKey:     return "LD";
        case Op::LdDtVx:    return "LD";
        case Op::LdStVx:    return "LD";
        case Op::AddI:      return "ADD";
        case Op::LdFont:    return "LD";
        case Op::Bcd:       return "LD";
        case Op::StoreRegs: return "LD";
        case Op::LoadRegs:  return "LD";
        case Op::Unknown:   return "???";
    }
    return "???";
}

std::string disassemble(const Instruction& in) {
    const char* m = op_name(in.op);
    const unsigned x = in.x;
    const unsigned y = in.y;

    switch (in.op) {
        case Op::Cls:
        case Op::Ret:
            return m;
        case Op::Sys:
        case Op::Jp:
        case Op::Call:
            return format_message("%s 0x%03X", m, in.nnn);
        case Op::SeImm:
        case Op::SneImm:
        case Op::LdImm:
        case Op::AddImm:
        case Op::Rnd:
            return format_message("%s V%X, 0x%02X", m, x, in.nn);
        case Op::SeReg:
        case Op::SneReg:
        case Op::LdReg:
        case Op::Or:
        case Op::And:
        case Op::Xor:
        case Op::AddReg:
        case Op::Sub:
        case Op::Shr:
        case Op::Subn:
        case Op::Shl:
            return format_message("%s V%X, V%X", m, x, y);
        case Op::LdI:
            return format_message("%s I, 0x%03X", m, in.nnn);
        case Op::JpV0:
            return format_message("%s V0, 0x%03X", m, in.nnn);
        case Op::Drw:
            return format_message("%s V%X, V%X, %u", m, x, y, static_cast<unsigned>(in.n));
        case Op::Skp:
        case Op::Sknp:
            return format_message("%s V%X", m, x);
        case Op::LdVxDt:
            return format_message("%s V%X, DT", m, x);
        case Op::LdKey:
            return format_message("%s V%X, K", m, x);
        case Op::LdDtVx:
            return format_message("%s DT, V%X", m, x);
        case Op::LdStVx:
            return format_message("%s ST, V%X", m, x);
        case Op::AddI:
            return format_message("%s I, V%X", m, x);
        case Op::LdFont:
            return format_message("%s F, V%X", m, x);
        case Op::Bcd:
            return format_message("%s B, V%X", m, x);
        case Op::StoreRegs:
            return format_message("%s [I], V%X", m, x);
        case Op::LoadRegs:
            return format_message("%s V%X, [I]", m, x);
        case Op::Unknown:
            break;
    }
    return format_message("DW 0x%04X", in.raw);
}

} // namespace chip8
