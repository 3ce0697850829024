//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/Instr.hpp
// Purpose: Opcode definitions, operand model and instruction record executed by
//          the PL/0 machine.
// Key invariants: Opcodes form a closed set; every instruction carries between
//                 zero and two operands whose kinds match its opcode signature
//                 when validateOperands() returns no error.
// Ownership: Instructions own their operands (label/program names by value).
// Lifetime: Created once at compile or assembly time; immutable afterwards.
// Links: src/bytecode/InstrText.hpp, src/vm/Machine.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "common/MathReference.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pl0::bytecode
{

/// @brief Machine opcodes grouped by category.
enum class Opcode : uint8_t
{
    //=========================================================================
    // Data movement
    //=========================================================================

    LOAD,  ///< LOAD rX, #imm | LOAD rX, [addr] | LOAD rX, [rY]
    STORE, ///< STORE rX, [addr] | STORE rX, [rY]
    PEEK,  ///< Synonym of the bracketed LOAD form.
    POKE,  ///< Synonym of STORE.

    //=========================================================================
    // Data stack
    //=========================================================================

    PUSH, ///< PUSH rX
    POP,  ///< POP rX

    //=========================================================================
    // Binary arithmetic (rX = rX op rY)
    //=========================================================================

    ADD,
    SUB,
    MUL,
    DIV, ///< Floor division; zero divisor traps.

    //=========================================================================
    // Unary math (rX = f(rX), fixed-point)
    //=========================================================================

    FSIN,
    FCOS,
    FTAN,
    FTANH,
    FSINH,
    FCOSH,
    FLN,
    FLOG10,
    FEXP,
    FSQRT,

    //=========================================================================
    // Control flow
    //=========================================================================

    JMP,     ///< JMP label
    JZ,      ///< JZ rX, label
    JNZ,     ///< JNZ rX, label
    CALL,    ///< CALL label (intra-program)
    PL0CALL, ///< PL0CALL program (cross-program)
    RET,
    HALT,

    //=========================================================================
    // Pseudo
    //=========================================================================

    LABEL, ///< `name:` marker; executes as a no-op.
};

/// @brief Mnemonic of @p op as printed in the text form.
const char *opcodeName(Opcode op);

/// @brief Look up an opcode by upper-case mnemonic; LABEL is never returned.
std::optional<Opcode> opcodeFromName(std::string_view name);

/// @brief Map a unary math opcode to its reference op.
std::optional<common::MathOp> mathOpFor(Opcode op);

/// @brief Map a reference op to its opcode.
Opcode opcodeFor(common::MathOp op);

/// @brief Operand classification.
enum class OperandKind : uint8_t
{
    None,    ///< Absent operand.
    Reg,     ///< rN
    Imm,     ///< #N
    Addr,    ///< [N]
    RegAddr, ///< [rN]
    Symbol,  ///< Label or program name.
};

/// @brief One instruction operand.
struct Operand
{
    OperandKind kind{OperandKind::None};
    int64_t value{0};   ///< Register index, immediate or absolute address.
    std::string symbol; ///< Label or program name for Symbol operands.

    static Operand reg(int64_t index)
    {
        return Operand{OperandKind::Reg, index, {}};
    }

    static Operand imm(int64_t v)
    {
        return Operand{OperandKind::Imm, v, {}};
    }

    static Operand addr(int64_t a)
    {
        return Operand{OperandKind::Addr, a, {}};
    }

    static Operand regAddr(int64_t index)
    {
        return Operand{OperandKind::RegAddr, index, {}};
    }

    static Operand sym(std::string name)
    {
        return Operand{OperandKind::Symbol, 0, std::move(name)};
    }

    bool operator==(const Operand &) const = default;
};

/// @brief Single machine instruction.
struct Instr
{
    Opcode op{Opcode::HALT};
    std::vector<Operand> operands;

    bool operator==(const Instr &) const = default;
};

/// @brief Build an instruction from an opcode and its operands.
Instr makeInstr(Opcode op, std::vector<Operand> operands = {});

/// @brief Build a `name:` label marker.
Instr makeLabel(std::string name);

/// @brief Check operand count and kinds of @p in against its opcode.
/// @return Error text describing the first mismatch, or nullopt when valid.
std::optional<std::string> validateOperands(const Instr &in);

} // namespace pl0::bytecode
