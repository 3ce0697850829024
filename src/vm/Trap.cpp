//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Trap.cpp
// Purpose: Formats VM trap records for diagnostics.
// Key invariants: Output is a single line.
// Ownership/Lifetime: Stateless.
// Links: src/vm/Trap.hpp
//
//===----------------------------------------------------------------------===//

#include "vm/Trap.hpp"

namespace pl0::vm
{

std::string formatTrap(const Trap &trap)
{
    const std::string_view program =
        trap.program.empty() ? std::string_view("<unknown>") : std::string_view(trap.program);
    const auto kindStr = toString(trap.kind);

    std::string result;
    result.reserve(32 + program.size() + trap.message.size() + trap.instruction.size());

    result.append("Trap @");
    result.append(program);
    result.push_back('#');
    result.append(std::to_string(trap.ip));
    result.append(": ");
    result.append(kindStr);
    if (!trap.message.empty())
    {
        result.append(" (");
        result.append(trap.message);
        result.push_back(')');
    }
    if (!trap.instruction.empty())
    {
        result.append(" [");
        result.append(trap.instruction);
        result.push_back(']');
    }
    return result;
}

} // namespace pl0::vm
