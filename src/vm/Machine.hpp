//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Machine.hpp
// Purpose: Register/stack machine executing compiled PL/0 programs.
// Key invariants: Register indices are checked against the register count;
//                 memory addresses are normalized by Euclidean modulo; the
//                 data stack never exceeds dataStackMax; labels resolve only
//                 in the active program's label table.
// Ownership: Machine borrows the ProgramRegistry and, per run, the providers.
//            It shares ownership of active and suspended programs so a frame
//            keeps its caller alive even if the registry entry is replaced.
// Lifetime: Reusable; every run starts from zeroed registers, memory and stacks.
// Links: src/bytecode/Program.hpp, src/vm/Trap.hpp, src/provider/*.hpp
//
//===----------------------------------------------------------------------===//
//
// Execution model: fetch the instruction at ip, count the step, then execute.
// Jumps and calls set ip; every other instruction advances it by one. RET with
// an empty call stack, HALT, and running past the last instruction all halt
// the machine. Any execution error traps: the machine records a Trap and stops
// with all state left as it was.

#pragma once

#include "bytecode/Program.hpp"
#include "bytecode/ProgramRegistry.hpp"
#include "vm/MachineConfig.hpp"
#include "vm/RunStats.hpp"
#include "vm/Trace.hpp"
#include "vm/Trap.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pl0::vm
{

/// @brief Machine execution state.
enum class VMState
{
    Ready,   ///< No run started yet.
    Running, ///< Currently executing.
    Halted,  ///< Execution completed normally.
    Trapped  ///< Execution stopped by a trap.
};

/// @brief Call-stack entry pushed by CALL: resume at @ref ip in the same program.
struct ReturnAddress
{
    size_t ip;
};

/// @brief Call-stack entry pushed by PL0CALL: restore the caller's program,
///        label table and resume index.
struct ContextFrame
{
    std::shared_ptr<const bytecode::Program> program;
    bytecode::LabelTable labels;
    size_t returnIp;
};

using CallStackEntry = std::variant<ReturnAddress, ContextFrame>;

class Machine
{
  public:
    using Value = int64_t;

    explicit Machine(const bytecode::ProgramRegistry &registry, MachineConfig config = {});

    /// @brief Run the program registered as @p entry.
    /// @return Halted on completion, Trapped on any execution error.
    VMState run(const std::string &entry, const RunConfig &cfg = {});

    /// @brief Run @p program directly; PL0CALL still resolves through the registry.
    VMState runProgram(std::shared_ptr<const bytecode::Program> program,
                       const RunConfig &cfg = {});

    VMState state() const
    {
        return state_;
    }

    /// @brief Trap that stopped the last run, if any.
    const std::optional<Trap> &trap() const
    {
        return trap_;
    }

    const std::vector<Value> &registers() const
    {
        return regs_;
    }

    const std::vector<Value> &memory() const
    {
        return memory_;
    }

    /// @brief Data stack, bottom first.
    const std::vector<Value> &dataStack() const
    {
        return dataStack_;
    }

    size_t callDepth() const
    {
        return callStack_.size();
    }

    /// @brief Instruction pointer within the active program.
    size_t ip() const
    {
        return ip_;
    }

    /// @brief Name of the active program; empty before the first run.
    std::string currentProgram() const;

    const RunStats &stats() const
    {
        return stats_;
    }

    const MachineConfig &config() const
    {
        return config_;
    }

  private:
    /// @brief Zero registers, memory and stacks and clear the previous trap.
    void reset();

    /// @brief Execute one instruction; returns false after a trap.
    bool step(const bytecode::Instr &in);

    /// @brief Stop with a trap describing the instruction at ip_.
    void raise(TrapKind kind, std::string message);

    //=========================================================================
    // Operand access; each returns std::nullopt after raising a trap.
    //=========================================================================

    std::optional<size_t> reg(const bytecode::Operand &op);
    std::optional<size_t> address(const bytecode::Operand &op);
    std::optional<size_t> label(const bytecode::Operand &op);
    bool pushCall(CallStackEntry entry);

    //=========================================================================
    // Opcode groups
    //=========================================================================

    bool execLoad(const bytecode::Instr &in);
    bool execStore(const bytecode::Instr &in);
    bool execStack(const bytecode::Instr &in);
    bool execArith(const bytecode::Instr &in);
    bool execMath(const bytecode::Instr &in);
    bool execBranch(const bytecode::Instr &in);
    bool execCall(const bytecode::Instr &in);
    bool execProgramCall(const bytecode::Instr &in);
    bool execReturn();

    const bytecode::ProgramRegistry &registry_;
    MachineConfig config_;

    std::vector<Value> regs_;
    std::vector<Value> memory_;
    std::vector<Value> dataStack_;
    std::vector<CallStackEntry> callStack_;

    std::shared_ptr<const bytecode::Program> program_;
    bytecode::LabelTable labels_;
    size_t ip_{0};

    VMState state_{VMState::Ready};
    std::optional<Trap> trap_;
    RunStats stats_;

    // Per-run settings.
    const RunConfig *run_{nullptr};
    TraceSink trace_;
};

} // namespace pl0::vm
