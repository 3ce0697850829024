//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Trap.hpp
// Purpose: Defines trap classification and the trap record for VM errors.
// Key invariants: Every execution error maps to exactly one TrapKind; a trap
//                 stops the machine and leaves its state untouched.
// Ownership/Lifetime: Trap is a plain value owned by the Machine.
// Links: src/vm/Machine.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace pl0::vm
{

/// @brief Categorises execution errors.
enum class TrapKind : int32_t
{
    UnknownOpcode = 0,      ///< Opcode outside the instruction set.
    MalformedOperand = 1,   ///< Operand shape does not match the opcode.
    RegisterOutOfRange = 2, ///< Register index >= register count.
    AddressOutOfRange = 3,  ///< No memory to normalize an address into.
    UnresolvedLabel = 4,    ///< Label missing from the active program.
    StackOverflow = 5,      ///< PUSH onto a full data stack.
    StackUnderflow = 6,     ///< POP from an empty data stack.
    CallStackOverflow = 7,  ///< CALL/PL0CALL beyond the call-stack limit.
    DivideByZero = 8,       ///< DIV with a zero divisor.
    UnknownProgram = 9,     ///< PL0CALL to an unregistered program.
    StepLimitExceeded = 10, ///< Runaway execution.
    ProviderError = 11,     ///< Provider threw or returned an invalid value.
};

/// @brief Convert trap kind to its canonical name.
constexpr std::string_view toString(TrapKind kind) noexcept
{
    switch (kind)
    {
        case TrapKind::UnknownOpcode:
            return "UnknownOpcode";
        case TrapKind::MalformedOperand:
            return "MalformedOperand";
        case TrapKind::RegisterOutOfRange:
            return "RegisterOutOfRange";
        case TrapKind::AddressOutOfRange:
            return "AddressOutOfRange";
        case TrapKind::UnresolvedLabel:
            return "UnresolvedLabel";
        case TrapKind::StackOverflow:
            return "StackOverflow";
        case TrapKind::StackUnderflow:
            return "StackUnderflow";
        case TrapKind::CallStackOverflow:
            return "CallStackOverflow";
        case TrapKind::DivideByZero:
            return "DivideByZero";
        case TrapKind::UnknownProgram:
            return "UnknownProgram";
        case TrapKind::StepLimitExceeded:
            return "StepLimitExceeded";
        case TrapKind::ProviderError:
            return "ProviderError";
    }
    return "UnknownOpcode";
}

/// @brief Record of the error that stopped the machine.
struct Trap
{
    TrapKind kind{TrapKind::UnknownOpcode};
    std::string message;     ///< Human-readable detail.
    std::string program;     ///< Program active when the trap fired.
    size_t ip{0};            ///< Index of the faulting instruction.
    std::string instruction; ///< Faulting instruction in text form.
};

/// @brief Render "Trap @<program>#<ip>: <Kind> (<message>) [<instruction>]".
std::string formatTrap(const Trap &trap);

} // namespace pl0::vm
