//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements opcode naming and the operand signature table shared by the text
// assembler (which reports mismatches as diagnostics) and the machine (which
// traps with MalformedOperand).
//
//===----------------------------------------------------------------------===//

#include "bytecode/Instr.hpp"

#include <array>

namespace pl0::bytecode
{
namespace
{

constexpr uint8_t kReg = 1u << 0;
constexpr uint8_t kImm = 1u << 1;
constexpr uint8_t kAddr = 1u << 2;
constexpr uint8_t kRegAddr = 1u << 3;
constexpr uint8_t kSym = 1u << 4;
constexpr uint8_t kMem = kAddr | kRegAddr;

struct Signature
{
    uint8_t count;
    std::array<uint8_t, 2> allowed;
};

Signature signatureOf(Opcode op)
{
    switch (op)
    {
        case Opcode::LOAD:
            return {2, {kReg, static_cast<uint8_t>(kImm | kMem)}};
        case Opcode::STORE:
        case Opcode::PEEK:
        case Opcode::POKE:
            return {2, {kReg, kMem}};
        case Opcode::PUSH:
        case Opcode::POP:
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
            return {1, {kReg, 0}};
        case Opcode::ADD:
        case Opcode::SUB:
        case Opcode::MUL:
        case Opcode::DIV:
            return {2, {kReg, kReg}};
        case Opcode::JMP:
        case Opcode::CALL:
        case Opcode::PL0CALL:
        case Opcode::LABEL:
            return {1, {kSym, 0}};
        case Opcode::JZ:
        case Opcode::JNZ:
            return {2, {kReg, kSym}};
        case Opcode::RET:
        case Opcode::HALT:
            return {0, {0, 0}};
    }
    return {0, {0, 0}};
}

uint8_t bitFor(OperandKind kind)
{
    switch (kind)
    {
        case OperandKind::Reg:
            return kReg;
        case OperandKind::Imm:
            return kImm;
        case OperandKind::Addr:
            return kAddr;
        case OperandKind::RegAddr:
            return kRegAddr;
        case OperandKind::Symbol:
            return kSym;
        case OperandKind::None:
            return 0;
    }
    return 0;
}

} // namespace

const char *opcodeName(Opcode op)
{
    switch (op)
    {
        // Data movement
        case Opcode::LOAD:
            return "LOAD";
        case Opcode::STORE:
            return "STORE";
        case Opcode::PEEK:
            return "PEEK";
        case Opcode::POKE:
            return "POKE";

        // Data stack
        case Opcode::PUSH:
            return "PUSH";
        case Opcode::POP:
            return "POP";

        // Binary arithmetic
        case Opcode::ADD:
            return "ADD";
        case Opcode::SUB:
            return "SUB";
        case Opcode::MUL:
            return "MUL";
        case Opcode::DIV:
            return "DIV";

        // Unary math
        case Opcode::FSIN:
            return "FSIN";
        case Opcode::FCOS:
            return "FCOS";
        case Opcode::FTAN:
            return "FTAN";
        case Opcode::FTANH:
            return "FTANH";
        case Opcode::FSINH:
            return "FSINH";
        case Opcode::FCOSH:
            return "FCOSH";
        case Opcode::FLN:
            return "FLN";
        case Opcode::FLOG10:
            return "FLOG10";
        case Opcode::FEXP:
            return "FEXP";
        case Opcode::FSQRT:
            return "FSQRT";

        // Control flow
        case Opcode::JMP:
            return "JMP";
        case Opcode::JZ:
            return "JZ";
        case Opcode::JNZ:
            return "JNZ";
        case Opcode::CALL:
            return "CALL";
        case Opcode::PL0CALL:
            return "PL0CALL";
        case Opcode::RET:
            return "RET";
        case Opcode::HALT:
            return "HALT";

        case Opcode::LABEL:
            return "LABEL";
    }
    return "UNKNOWN";
}

std::optional<Opcode> opcodeFromName(std::string_view name)
{
    for (uint8_t i = 0; i < static_cast<uint8_t>(Opcode::LABEL); ++i)
    {
        const auto op = static_cast<Opcode>(i);
        if (name == opcodeName(op))
            return op;
    }
    return std::nullopt;
}

std::optional<common::MathOp> mathOpFor(Opcode op)
{
    if (op < Opcode::FSIN || op > Opcode::FSQRT)
        return std::nullopt;
    return static_cast<common::MathOp>(static_cast<uint8_t>(op) -
                                       static_cast<uint8_t>(Opcode::FSIN));
}

Opcode opcodeFor(common::MathOp op)
{
    return static_cast<Opcode>(static_cast<uint8_t>(Opcode::FSIN) + static_cast<uint8_t>(op));
}

Instr makeInstr(Opcode op, std::vector<Operand> operands)
{
    return Instr{op, std::move(operands)};
}

Instr makeLabel(std::string name)
{
    return Instr{Opcode::LABEL, {Operand::sym(std::move(name))}};
}

/// @brief Validate operand count and kinds against the opcode signature.
///
/// @details Register indices and addresses are not range-checked here; the
///          machine does that at execution time because the register count
///          and memory size are run configuration.
std::optional<std::string> validateOperands(const Instr &in)
{
    const Signature sig = signatureOf(in.op);
    if (in.operands.size() != sig.count)
    {
        return std::string(opcodeName(in.op)) + " expects " + std::to_string(sig.count) +
               " operand(s), got " + std::to_string(in.operands.size());
    }
    for (size_t i = 0; i < in.operands.size(); ++i)
    {
        const Operand &o = in.operands[i];
        if ((bitFor(o.kind) & sig.allowed[i]) == 0)
            return std::string(opcodeName(in.op)) + ": bad operand " + std::to_string(i + 1);
        if (o.kind == OperandKind::Symbol && o.symbol.empty())
            return std::string(opcodeName(in.op)) + ": empty name operand";
    }
    return std::nullopt;
}

} // namespace pl0::bytecode
