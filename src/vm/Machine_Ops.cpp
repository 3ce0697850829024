//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Machine_Ops.cpp
// Purpose: Opcode group handlers for the PL/0 machine.
// Key invariants: Every handler either advances/sets ip_ and returns true, or
//                 raises a trap and returns false without touching ip_.
// Ownership/Lifetime: Providers are borrowed from the active RunConfig.
// Links: src/vm/Machine.hpp, src/provider/ArithmeticProvider.hpp,
//        src/provider/MathProvider.hpp
//
//===----------------------------------------------------------------------===//

#include "vm/Machine.hpp"

#include "common/FixedPoint.hpp"
#include "provider/ArithmeticProvider.hpp"
#include "provider/MathProvider.hpp"

#include <cmath>
#include <exception>
#include <string>

namespace pl0::vm
{

using bytecode::Instr;
using bytecode::Opcode;
using bytecode::OperandKind;

namespace
{

provider::ArithOp arithOpFor(Opcode op)
{
    switch (op)
    {
        case Opcode::SUB:
            return provider::ArithOp::Sub;
        case Opcode::MUL:
            return provider::ArithOp::Mul;
        case Opcode::DIV:
            return provider::ArithOp::Div;
        default:
            return provider::ArithOp::Add;
    }
}

} // namespace

//===----------------------------------------------------------------------===//
// Data movement
//===----------------------------------------------------------------------===//

/// LOAD rX, #imm | LOAD/PEEK rX, [addr] | LOAD/PEEK rX, [rY]
bool Machine::execLoad(const Instr &in)
{
    auto dst = reg(in.operands[0]);
    if (!dst)
        return false;

    const auto &src = in.operands[1];
    if (src.kind == OperandKind::Imm)
    {
        regs_[*dst] = src.value;
    }
    else
    {
        auto a = address(src);
        if (!a)
            return false;
        regs_[*dst] = memory_[*a];
    }
    ++ip_;
    return true;
}

/// STORE/POKE rX, [addr] | STORE/POKE rX, [rY]
bool Machine::execStore(const Instr &in)
{
    auto src = reg(in.operands[0]);
    if (!src)
        return false;
    auto a = address(in.operands[1]);
    if (!a)
        return false;
    memory_[*a] = regs_[*src];
    ++ip_;
    return true;
}

bool Machine::execStack(const Instr &in)
{
    auto r = reg(in.operands[0]);
    if (!r)
        return false;

    if (in.op == Opcode::PUSH)
    {
        if (dataStack_.size() >= config_.dataStackMax)
        {
            raise(TrapKind::StackOverflow,
                  "data stack limit " + std::to_string(config_.dataStackMax) + " reached");
            return false;
        }
        dataStack_.push_back(regs_[*r]);
    }
    else
    {
        if (dataStack_.empty())
        {
            raise(TrapKind::StackUnderflow, "pop from empty data stack");
            return false;
        }
        regs_[*r] = dataStack_.back();
        dataStack_.pop_back();
    }
    ++ip_;
    return true;
}

//===----------------------------------------------------------------------===//
// Arithmetic
//===----------------------------------------------------------------------===//

bool Machine::execArith(const Instr &in)
{
    auto x = reg(in.operands[0]);
    if (!x)
        return false;
    auto y = reg(in.operands[1]);
    if (!y)
        return false;

    const Value a = regs_[*x];
    const Value b = regs_[*y];
    const provider::ArithOp op = arithOpFor(in.op);

    if (op == provider::ArithOp::Div && b == 0)
    {
        raise(TrapKind::DivideByZero, "division by zero");
        return false;
    }

    provider::ArithmeticProvider *alu = run_ ? run_->arithmetic : nullptr;
    if (!alu)
    {
        regs_[*x] = provider::exactArith(op, a, b);
        ++ip_;
        return true;
    }

    provider::ArithmeticResult res;
    try
    {
        res = alu->compute(op, a, b);
    }
    catch (const std::exception &e)
    {
        raise(TrapKind::ProviderError,
              std::string("arithmetic provider failed on ") + provider::arithOpName(op) + ": " +
                  e.what());
        return false;
    }

    if (run_->trackStats)
    {
        OpStats &s = stats_.of(op);
        ++s.calls;
        s.absErrorSum +=
            std::fabs(static_cast<double>(res.prediction) - static_cast<double>(res.exact));
        if (res.usedFallback)
            ++s.fallbacks;
    }

    regs_[*x] = res.result;
    ++ip_;
    return true;
}

/// rX = f(rX) on fixed-point values.
bool Machine::execMath(const Instr &in)
{
    auto x = reg(in.operands[0]);
    if (!x)
        return false;

    auto op = bytecode::mathOpFor(in.op);
    if (!op)
    {
        raise(TrapKind::UnknownOpcode, "opcode has no math operation");
        return false;
    }

    provider::MathProvider *fpu = run_ ? run_->math : nullptr;
    if (!fpu)
    {
        regs_[*x] = common::referenceFixed(*op, regs_[*x], config_.fxScale);
        ++ip_;
        return true;
    }

    provider::MathResult res;
    try
    {
        res = fpu->compute(*op, regs_[*x]);
    }
    catch (const std::exception &e)
    {
        raise(TrapKind::ProviderError,
              std::string("math provider failed on ") + common::mathOpName(*op) + ": " +
                  e.what());
        return false;
    }

    if (res.result > common::fixed::kMaxEncoded || res.result < -common::fixed::kMaxEncoded)
    {
        raise(TrapKind::ProviderError,
              std::string("math provider returned out-of-range value ") +
                  std::to_string(res.result) + " for " + common::mathOpName(*op));
        return false;
    }

    if (run_->trackStats)
    {
        OpStats &s = stats_.of(*op);
        ++s.calls;
        s.absErrorSum += std::fabs(res.predNorm - res.exactNorm);
        if (res.usedFallback)
            ++s.fallbacks;
    }

    regs_[*x] = res.result;
    ++ip_;
    return true;
}

//===----------------------------------------------------------------------===//
// Control flow
//===----------------------------------------------------------------------===//

/// JMP label | JZ rX, label | JNZ rX, label
bool Machine::execBranch(const Instr &in)
{
    if (in.op == Opcode::JMP)
    {
        auto target = label(in.operands[0]);
        if (!target)
            return false;
        ip_ = *target;
        return true;
    }

    auto r = reg(in.operands[0]);
    if (!r)
        return false;
    // Resolve even when the branch falls through.
    auto target = label(in.operands[1]);
    if (!target)
        return false;

    const bool zero = regs_[*r] == 0;
    const bool taken = in.op == Opcode::JZ ? zero : !zero;
    ip_ = taken ? *target : ip_ + 1;
    return true;
}

bool Machine::execCall(const Instr &in)
{
    auto target = label(in.operands[0]);
    if (!target)
        return false;
    if (!pushCall(ReturnAddress{ip_ + 1}))
        return false;
    ip_ = *target;
    return true;
}

/// PL0CALL name: switch to another registered program with its own labels.
bool Machine::execProgramCall(const Instr &in)
{
    const std::string &name = in.operands[0].symbol;
    auto callee = registry_.find(name);
    if (!callee)
    {
        raise(TrapKind::UnknownProgram, "no compiled program named '" + name + "'");
        return false;
    }

    auto caller = program_;
    if (!pushCall(ContextFrame{caller, labels_, ip_ + 1}))
        return false;

    program_ = std::move(callee);
    labels_ = bytecode::buildLabelTable(program_->code);
    ip_ = 0;
    trace_.onEnter(program_->name, caller->name);
    return true;
}

bool Machine::execReturn()
{
    if (callStack_.empty())
    {
        state_ = VMState::Halted;
        return true;
    }

    CallStackEntry top = std::move(callStack_.back());
    callStack_.pop_back();

    if (auto *ret = std::get_if<ReturnAddress>(&top))
    {
        ip_ = ret->ip;
        return true;
    }

    auto &frame = std::get<ContextFrame>(top);
    const std::string callee = program_->name;
    program_ = std::move(frame.program);
    labels_ = std::move(frame.labels);
    ip_ = frame.returnIp;
    trace_.onLeave(callee, program_->name);
    return true;
}

} // namespace pl0::vm
