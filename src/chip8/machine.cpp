/**
 * @file machine.cpp
 * @brief Machine state machine and opcode semantics.
 *
 * @copyright GPL-2.0-or-later
 */

#include "chip8/machine.h"
#include "chip8/exceptions.h"
#include "chip8/logging.h"

#include <algorithm>

namespace chip8 {

namespace {

const MachineConfig& checked(const MachineConfig& config) {
    auto valid = config.validate();
    if (!valid.has_value()) {
        throw ConfigException(valid.error().message());
    }
    return config;
}

std::mt19937 make_rng(const std::optional<uint64_t>& seed) {
    if (seed.has_value()) {
        return std::mt19937(static_cast<std::mt19937::result_type>(*seed ^ (*seed >> 32)));
    }
    std::random_device device;
    return std::mt19937(device());
}

constexpr uint16_t pc_mask(uint32_t addr) noexcept {
    return static_cast<uint16_t>(addr & ADDRESS_MASK);
}

} // anonymous namespace

// ─────────────────────────────────────────────────────────────────────────────
// MachineSnapshot
// ─────────────────────────────────────────────────────────────────────────────

std::string MachineSnapshot::to_string() const {
    std::string out = format_message(
        "PC=0x%03X I=0x%03X SP=%u DT=%u ST=%u mode=%s state=%s cycles=%llu keys=0x%04X\n",
        pc, i, static_cast<unsigned>(sp),
        static_cast<unsigned>(delay_timer), static_cast<unsigned>(sound_timer),
        chip8::to_string(mode), chip8::to_string(state),
        static_cast<unsigned long long>(cycles), static_cast<unsigned>(keys));

    for (size_t r = 0; r < REGISTER_COUNT; ++r) {
        out += format_message("V%zX=0x%02X%s", r, static_cast<unsigned>(v[r]),
            (r % 8 == 7) ? "\n" : " ");
    }

    out += "stack:";
    if (stack.empty()) {
        out += " (empty)";
    }
    for (uint16_t addr : stack) {
        out += format_message(" 0x%03X", addr);
    }
    out += '\n';
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
// Construction / Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

Machine::Machine(const MachineConfig& config)
    : config_(checked(config))
    , display_(config_.display_width, config_.display_height)
    , rng_(make_rng(config_.rng_seed))
{
    reset();
    CHIP8_LOG_DEBUG("VM", "Machine created: mode=%s cycles_per_tick=%u display=%ux%u",
        chip8::to_string(config_.mode), config_.cycles_per_tick,
        config_.display_width, config_.display_height);
}

Result<void> Machine::load(std::span<const uint8_t> rom) {
    if (rom.size() > MAX_ROM_SIZE) {
        return make_error(ErrorCode::RomTooLarge,
            format_message("ROM is %zu bytes, maximum is %zu", rom.size(), MAX_ROM_SIZE));
    }
    rom_.assign(rom.begin(), rom.end());
    reset();
    CHIP8_LOG_INFO("VM", "Loaded %zu byte program", rom_.size());
    return Ok();
}

void Machine::reset() {
    memory_.clear();
    // Size was checked when the image was stored
    auto loaded = memory_.load_program(rom_);
    if (!loaded.has_value()) {
        throw IllegalMachineStateException(loaded.error().message());
    }

    regs_.reset();
    display_.clear();
    timers_.reset();
    timer_epoch_stale_ = true;

    if (config_.rng_seed.has_value()) {
        rng_ = make_rng(config_.rng_seed);
    }

    state_ = MachineState::Running;
    resume_state_ = MachineState::Running;
    wait_register_ = 0;
    cycles_ = 0;
    last_error_.reset();
}

// ─────────────────────────────────────────────────────────────────────────────
// Execution
// ─────────────────────────────────────────────────────────────────────────────

Result<StepOutcome> Machine::step() {
    switch (state_) {
        case MachineState::Running:
            return execute_next();
        case MachineState::WaitingForKey:
            return poll_key_wait();
        case MachineState::Paused:
            return make_error(ErrorCode::InvalidState,
                "step() while paused; use single_step()");
        case MachineState::Halted:
            return make_error(ErrorCode::InvalidState,
                "step() on a halted machine; reset() to recover");
    }
    return make_error(ErrorCode::Unknown, "corrupt machine state");
}

Result<uint32_t> Machine::run_cycles(uint32_t count) {
    if (state_ == MachineState::Paused) {
        return Ok(0u);
    }

    uint32_t executed = 0;
    while (executed < count) {
        auto outcome = step();
        if (!outcome.has_value()) {
            return Err(outcome.error());
        }
        if (outcome->status == StepStatus::WaitingForKey) {
            break;
        }
        ++executed;
    }
    return Ok(executed);
}

bool Machine::tick_timers(uint64_t now_us) {
    if (state_ == MachineState::Paused || state_ == MachineState::Halted) {
        return false;
    }
    if (timer_epoch_stale_) {
        timers_.resync(now_us);
        timer_epoch_stale_ = false;
        return false;
    }
    return timers_.tick_if_due(now_us);
}

Result<StepOutcome> Machine::poll_key_wait() {
    StepOutcome out;
    out.pc = regs_.pc;
    out.instruction = decode(memory_.read_word(regs_.pc));

    auto key = input_.first_pressed();
    if (!key.has_value()) {
        out.status = StepStatus::WaitingForKey;
        return Ok(out);
    }

    regs_.v[wait_register_] = *key;
    regs_.pc = pc_mask(regs_.pc + 2u);
    state_ = MachineState::Running;
    out.effects.key_consumed = true;
    ++cycles_;
    CHIP8_LOG_DEBUG("INPUT", "Key 0x%X released wait into V%X",
        static_cast<unsigned>(*key), static_cast<unsigned>(wait_register_));
    return Ok(out);
}

void Machine::store(uint16_t addr, uint8_t value, StepOutcome& out) {
    auto written = memory_.write(addr, value);
    if (!written.has_value()) {
        CHIP8_LOG_WARN("MEM", "%s (PC=0x%03X)", written.error().message().c_str(), out.pc);
        out.effects.reserved_write = true;
        out.warning = written.error();
        return;
    }
    out.effects.memory_written = true;
}

std::unexpected<Error> Machine::halt(const Error& error) {
    state_ = MachineState::Halted;
    last_error_ = error;
    CHIP8_LOG_ERROR("VM", "Halted at PC=0x%03X: %s", regs_.pc, error.message().c_str());
    return Err(error);
}

Result<StepOutcome> Machine::execute_next() {
    StepOutcome out;
    out.pc = regs_.pc;
    const uint16_t word = memory_.read_word(regs_.pc);
    const Instruction in = decode(word);
    out.instruction = in;

    if (CHIP8_LOG_LEVEL_ENABLED(Trace)) {
        CHIP8_LOG_TRACE("CPU", "0x%03X: %04X  %s", out.pc, word, disassemble(in).c_str());
    }

    auto& v = regs_.v;
    uint8_t& vx = v[in.x];
    const uint8_t vy = v[in.y];
    uint16_t next = pc_mask(regs_.pc + 2u);

    switch (in.op) {
        case Op::Sys:
            break;

        case Op::Cls:
            display_.clear();
            out.effects.display_changed = true;
            break;

        case Op::Ret: {
            auto addr = regs_.stack.pop();
            if (!addr.has_value()) {
                return halt(addr.error());
            }
            next = pc_mask(*addr);
            break;
        }

        case Op::Jp:
            next = in.nnn;
            break;

        case Op::Call: {
            auto pushed = regs_.stack.push(next);
            if (!pushed.has_value()) {
                return halt(pushed.error());
            }
            next = in.nnn;
            break;
        }

        case Op::SeImm:
            if (vx == in.nn) next = pc_mask(next + 2u);
            break;

        case Op::SneImm:
            if (vx != in.nn) next = pc_mask(next + 2u);
            break;

        case Op::SeReg:
            if (vx == vy) next = pc_mask(next + 2u);
            break;

        case Op::LdImm:
            vx = in.nn;
            break;

        case Op::AddImm:
            vx = static_cast<uint8_t>(vx + in.nn);
            break;

        case Op::LdReg:
            vx = vy;
            break;

        case Op::Or:
            vx |= vy;
            break;

        case Op::And:
            vx &= vy;
            break;

        case Op::Xor:
            vx ^= vy;
            break;

        // Flag writes come last so VF as an operand sees its old value
        // and VF as the destination ends up holding the flag.
        case Op::AddReg: {
            const unsigned sum = static_cast<unsigned>(vx) + vy;
            vx = static_cast<uint8_t>(sum);
            regs_.set_flag(sum > 0xFF);
            break;
        }

        case Op::Sub: {
            const bool no_borrow = vx >= vy;
            vx = static_cast<uint8_t>(vx - vy);
            regs_.set_flag(no_borrow);
            break;
        }

        case Op::Subn: {
            const bool no_borrow = vy >= vx;
            vx = static_cast<uint8_t>(vy - vx);
            regs_.set_flag(no_borrow);
            break;
        }

        case Op::Shr: {
            const uint8_t src = (config_.mode == Mode::Chip48) ? vx : vy;
            vx = static_cast<uint8_t>(src >> 1);
            regs_.set_flag((src & 0x01) != 0);
            break;
        }

        case Op::Shl: {
            const uint8_t src = (config_.mode == Mode::Chip48) ? vx : vy;
            vx = static_cast<uint8_t>(src << 1);
            regs_.set_flag((src & 0x80) != 0);
            break;
        }

        case Op::SneReg:
            if (vx != vy) next = pc_mask(next + 2u);
            break;

        case Op::LdI:
            regs_.i = in.nnn;
            break;

        case Op::JpV0:
            next = pc_mask(in.nnn + v[0]);
            break;

        case Op::Rnd: {
            std::uniform_int_distribution<int> byte(0, 0xFF);
            vx = static_cast<uint8_t>(byte(rng_) & in.nn);
            break;
        }

        case Op::Drw: {
            std::array<uint8_t, 16> rows{};
            for (uint8_t r = 0; r < in.n; ++r) {
                rows[r] = memory_.read(static_cast<uint16_t>(regs_.i + r));
            }
            const bool collision = display_.draw_sprite(vx, vy,
                std::span<const uint8_t>(rows.data(), in.n));
            regs_.set_flag(collision);
            out.effects.display_changed = true;
            out.effects.collision = collision;
            break;
        }

        case Op::Skp:
            if (input_.is_pressed(static_cast<uint8_t>(vx & 0x0F))) next = pc_mask(next + 2u);
            break;

        case Op::Sknp:
            if (!input_.is_pressed(static_cast<uint8_t>(vx & 0x0F))) next = pc_mask(next + 2u);
            break;

        case Op::LdVxDt:
            vx = timers_.delay();
            break;

        case Op::LdKey: {
            auto key = input_.first_pressed();
            if (!key.has_value()) {
                // PC stays on FX0A until poll_key_wait() sees a key
                wait_register_ = in.x;
                state_ = MachineState::WaitingForKey;
                out.status = StepStatus::WaitingForKey;
                CHIP8_LOG_DEBUG("INPUT", "Waiting for key into V%X", static_cast<unsigned>(in.x));
                return Ok(out);
            }
            vx = *key;
            out.effects.key_consumed = true;
            break;
        }

        case Op::LdDtVx:
            timers_.set_delay(vx);
            out.effects.delay_timer_set = true;
            break;

        case Op::LdStVx:
            timers_.set_sound(vx);
            out.effects.sound_timer_set = true;
            break;

        case Op::AddI: {
            const unsigned sum = static_cast<unsigned>(regs_.i) + vx;
            regs_.i = static_cast<uint16_t>(sum);
            regs_.set_flag(sum > ADDRESS_MASK);
            break;
        }

        case Op::LdFont:
            regs_.i = Memory::glyph_address(vx);
            break;

        case Op::Bcd: {
            const uint8_t value = vx;
            store(regs_.i, static_cast<uint8_t>(value / 100), out);
            store(static_cast<uint16_t>(regs_.i + 1), static_cast<uint8_t>((value / 10) % 10), out);
            store(static_cast<uint16_t>(regs_.i + 2), static_cast<uint8_t>(value % 10), out);
            break;
        }

        case Op::StoreRegs:
            for (uint8_t r = 0; r <= in.x; ++r) {
                store(static_cast<uint16_t>(regs_.i + r), v[r], out);
            }
            if (config_.mode == Mode::Chip8) {
                regs_.i = static_cast<uint16_t>(regs_.i + in.x + 1);
            }
            break;

        case Op::LoadRegs:
            for (uint8_t r = 0; r <= in.x; ++r) {
                v[r] = memory_.read(static_cast<uint16_t>(regs_.i + r));
            }
            if (config_.mode == Mode::Chip8) {
                regs_.i = static_cast<uint16_t>(regs_.i + in.x + 1);
            }
            break;

        case Op::Unknown:
            out.warning = Error(ErrorCode::UnknownOpcode,
                format_message("Unknown instruction 0x%04X at 0x%03X; skipping", word, out.pc));
            CHIP8_LOG_WARN("CPU", "%s", out.warning->message().c_str());
            out.effects.unknown_opcode = true;
            break;
    }

    regs_.pc = next;
    ++cycles_;
    return Ok(out);
}

// ─────────────────────────────────────────────────────────────────────────────
// Debug Control
// ─────────────────────────────────────────────────────────────────────────────

Result<void> Machine::pause() {
    if (state_ != MachineState::Running && state_ != MachineState::WaitingForKey) {
        return make_error(ErrorCode::InvalidState,
            format_message("cannot pause from %s", chip8::to_string(state_)));
    }
    resume_state_ = state_;
    state_ = MachineState::Paused;
    CHIP8_LOG_INFO("VM", "Paused at PC=0x%03X", regs_.pc);
    return Ok();
}

Result<void> Machine::resume() {
    CHIP8_CHECK(state_ == MachineState::Paused, InvalidState, "resume() requires a paused machine");
    state_ = resume_state_;
    timer_epoch_stale_ = true;
    CHIP8_LOG_INFO("VM", "Resumed at PC=0x%03X", regs_.pc);
    return Ok();
}

Result<std::vector<StepOutcome>> Machine::single_step(uint32_t count) {
    CHIP8_CHECK(state_ == MachineState::Paused, InvalidState, "single_step() requires a paused machine");

    std::vector<StepOutcome> outcomes;
    outcomes.reserve(count);

    state_ = resume_state_;
    for (uint32_t n = 0; n < count; ++n) {
        auto outcome = step();
        if (!outcome.has_value()) {
            // Only a fault can fail here, and it has already halted us
            return Err(outcome.error());
        }
        if (outcome->status == StepStatus::WaitingForKey) {
            break;
        }
        CHIP8_LOG_DEBUG("VM", "Executed instr: 0x%04X", outcome->instruction.raw);
        outcomes.push_back(*outcome);
    }

    resume_state_ = state_;
    state_ = MachineState::Paused;
    return Ok(std::move(outcomes));
}

MachineSnapshot Machine::dump_state() const {
    MachineSnapshot snap;
    snap.pc = regs_.pc;
    snap.i = regs_.i;
    snap.v = regs_.v;
    snap.sp = regs_.stack.depth();
    snap.stack.reserve(snap.sp);
    for (size_t n = 0; n < snap.sp; ++n) {
        snap.stack.push_back(regs_.stack.entry(n));
    }
    snap.delay_timer = timers_.delay();
    snap.sound_timer = timers_.sound();
    snap.mode = config_.mode;
    snap.state = state_;
    snap.cycles = cycles_;
    snap.keys = input_.mask();
    return snap;
}

} // namespace chip8
