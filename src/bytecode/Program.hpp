//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/Program.hpp
// Purpose: Compiled program (named instruction sequence) and its label table.
// Key invariants: Label names are local to one program; a label maps to the
//                 index of its LABEL marker within that program's code.
// Ownership/Lifetime: Program owns its instructions; label tables are values
//                     built from a program and discarded on switch.
// Links: src/bytecode/ProgramRegistry.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/Instr.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace pl0::bytecode
{

/// @brief Named, ordered instruction sequence.
struct Program
{
    std::string name;
    std::vector<Instr> code;
};

/// @brief Label name -> instruction index within one program.
using LabelTable = std::unordered_map<std::string, size_t>;

/// @brief Scan @p code for LABEL markers.
/// @details A label defined twice resolves to its last definition.
LabelTable buildLabelTable(const std::vector<Instr> &code);

} // namespace pl0::bytecode
