//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/InstrText.hpp
// Purpose: Text form of instructions: formatting for listings and parsing for
//          hand-written assembly.
// Key invariants: parseInstr(formatInstr(i)) == i for every valid instruction.
// Ownership/Lifetime: Stateless free functions.
// Links: src/bytecode/Instr.hpp
//
//===----------------------------------------------------------------------===//
//
// One instruction per line: mnemonic, then comma-separated operands.  A line
// ending in ':' declares a label at that position; blank lines are skipped.
//
//   LOAD r0, #5        immediate
//   STORE r0, [30]     absolute address
//   PEEK r1, [r0]      register-indirect address
//   JZ r0, label_100   label reference
//   label_100:         label declaration
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/Program.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace pl0::bytecode
{

/// @brief Render one operand ("r0", "#5", "[30]", "[r1]", "label_100").
std::string formatOperand(const Operand &operand);

/// @brief Render one instruction in text form without a trailing newline.
std::string formatInstr(const Instr &in);

/// @brief Parse one non-blank line of text form.
/// @param line Source line; surrounding whitespace is ignored.
/// @param loc Location attached to diagnostics.
/// @return Parsed instruction or a diagnostic (codes P2001-P2004).
support::Expected<Instr> parseInstr(std::string_view line, support::SourceLoc loc = {});

/// @brief Assemble a whole program from text form.
/// @param name Program name.
/// @param text Instruction text, one instruction per line.
/// @param fileId Source identifier used in diagnostic locations.
/// @return Program or the diagnostic of the first bad line.
support::Expected<Program> assembleProgram(std::string name,
                                           std::string_view text,
                                           uint32_t fileId = 0);

/// @brief Write the text form of @p program, one instruction per line.
void disassemble(const Program &program, std::ostream &os);

} // namespace pl0::bytecode
