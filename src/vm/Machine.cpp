//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Machine.cpp
// Purpose: Run loop, trap recording, operand access and opcode dispatch.
// Key invariants: The step limit is checked before every fetch; a trap leaves
//                 ip_ at the faulting instruction.
// Ownership/Lifetime: See Machine.hpp.
// Links: src/vm/Machine.hpp, src/vm/Machine_Ops.cpp
//
//===----------------------------------------------------------------------===//

#include "vm/Machine.hpp"

#include "bytecode/InstrText.hpp"
#include "common/IntegerHelpers.hpp"

#include <string>

namespace pl0::vm
{

using bytecode::Instr;
using bytecode::Opcode;
using bytecode::Operand;
using bytecode::OperandKind;

Machine::Machine(const bytecode::ProgramRegistry &registry, MachineConfig config)
    : registry_(registry), config_(config)
{
    reset();
}

void Machine::reset()
{
    regs_.assign(config_.numRegisters, 0);
    memory_.assign(config_.memorySize, 0);
    dataStack_.clear();
    callStack_.clear();
    labels_.clear();
    program_.reset();
    ip_ = 0;
    trap_.reset();
    stats_ = RunStats{};
}

std::string Machine::currentProgram() const
{
    return program_ ? program_->name : std::string();
}

VMState Machine::run(const std::string &entry, const RunConfig &cfg)
{
    auto program = registry_.find(entry);
    if (!program)
    {
        reset();
        trap_ = Trap{TrapKind::UnknownProgram, "no compiled program named '" + entry + "'",
                     entry, 0, {}};
        state_ = VMState::Trapped;
        return state_;
    }
    return runProgram(std::move(program), cfg);
}

VMState Machine::runProgram(std::shared_ptr<const bytecode::Program> program,
                            const RunConfig &cfg)
{
    reset();
    program_ = std::move(program);
    labels_ = bytecode::buildLabelTable(program_->code);
    run_ = &cfg;
    trace_ = TraceSink(cfg.trace);
    state_ = VMState::Running;

    while (state_ == VMState::Running)
    {
        if (ip_ >= program_->code.size())
        {
            state_ = VMState::Halted;
            break;
        }
        // Exactly maxSteps fetches run; the one after them traps.
        if (stats_.steps >= cfg.maxSteps)
        {
            raise(TrapKind::StepLimitExceeded,
                  "exceeded maxSteps=" + std::to_string(cfg.maxSteps));
            break;
        }
        ++stats_.steps;

        const Instr &in = program_->code[ip_];
        trace_.onStep(program_->name, ip_, in);
        if (!step(in))
            break;
    }

    run_ = nullptr;
    return state_;
}

void Machine::raise(TrapKind kind, std::string message)
{
    Trap t;
    t.kind = kind;
    t.message = std::move(message);
    t.ip = ip_;
    if (program_)
    {
        t.program = program_->name;
        if (ip_ < program_->code.size())
            t.instruction = bytecode::formatInstr(program_->code[ip_]);
    }
    trap_ = std::move(t);
    state_ = VMState::Trapped;
}

//===----------------------------------------------------------------------===//
// Operand access
//===----------------------------------------------------------------------===//

std::optional<size_t> Machine::reg(const Operand &op)
{
    if (op.value < 0 || static_cast<uint64_t>(op.value) >= regs_.size())
    {
        raise(TrapKind::RegisterOutOfRange,
              "register r" + std::to_string(op.value) + " out of range (have " +
                  std::to_string(regs_.size()) + ")");
        return std::nullopt;
    }
    return static_cast<size_t>(op.value);
}

/// @brief Resolve [N] or [rN] to a memory index.
std::optional<size_t> Machine::address(const Operand &op)
{
    Value raw = op.value;
    if (op.kind == OperandKind::RegAddr)
    {
        auto r = reg(op);
        if (!r)
            return std::nullopt;
        raw = regs_[*r];
    }
    if (memory_.empty())
    {
        raise(TrapKind::AddressOutOfRange, "address " + std::to_string(raw) + " with no memory");
        return std::nullopt;
    }
    return common::integer::normalizeIndex(raw, memory_.size());
}

std::optional<size_t> Machine::label(const Operand &op)
{
    auto it = labels_.find(op.symbol);
    if (it == labels_.end())
    {
        raise(TrapKind::UnresolvedLabel,
              "unknown label '" + op.symbol + "' in program '" + program_->name + "'");
        return std::nullopt;
    }
    return it->second;
}

bool Machine::pushCall(CallStackEntry entry)
{
    if (callStack_.size() >= config_.callStackMax)
    {
        raise(TrapKind::CallStackOverflow,
              "call stack limit " + std::to_string(config_.callStackMax) + " reached");
        return false;
    }
    callStack_.push_back(std::move(entry));
    return true;
}

//===----------------------------------------------------------------------===//
// Dispatch
//===----------------------------------------------------------------------===//

bool Machine::step(const Instr &in)
{
    if (in.op > Opcode::LABEL)
    {
        raise(TrapKind::UnknownOpcode,
              "opcode " + std::to_string(static_cast<unsigned>(in.op)) + " is not defined");
        return false;
    }
    if (auto err = bytecode::validateOperands(in))
    {
        raise(TrapKind::MalformedOperand, std::move(*err));
        return false;
    }

    switch (in.op)
    {
        case Opcode::LOAD:
        case Opcode::PEEK:
            return execLoad(in);
        case Opcode::STORE:
        case Opcode::POKE:
            return execStore(in);
        case Opcode::PUSH:
        case Opcode::POP:
            return execStack(in);
        case Opcode::ADD:
        case Opcode::SUB:
        case Opcode::MUL:
        case Opcode::DIV:
            return execArith(in);
        case Opcode::FSIN:
        case Opcode::FCOS:
        case Opcode::FTAN:
        case Opcode::FTANH:
        case Opcode::FSINH:
        case Opcode::FCOSH:
        case Opcode::FLN:
        case Opcode::FLOG10:
        case Opcode::FEXP:
        case Opcode::FSQRT:
            return execMath(in);
        case Opcode::JMP:
        case Opcode::JZ:
        case Opcode::JNZ:
            return execBranch(in);
        case Opcode::CALL:
            return execCall(in);
        case Opcode::PL0CALL:
            return execProgramCall(in);
        case Opcode::RET:
            return execReturn();
        case Opcode::HALT:
            state_ = VMState::Halted;
            ++ip_;
            return true;
        case Opcode::LABEL:
            ++ip_;
            return true;
    }

    raise(TrapKind::UnknownOpcode, "unhandled opcode");
    return false;
}

} // namespace pl0::vm
