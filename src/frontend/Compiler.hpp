//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the PL/0 compiler driver:
//   Lexer -> Parser/code generator -> ProgramRegistry
//
// compilePl0 handles one `program ... .` unit. splitPrograms and compileAll
// handle files holding several units, assigning each its own base address
// for variables.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/ProgramRegistry.hpp"
#include "frontend/AST.hpp"
#include "frontend/CompilerOptions.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pl0::frontend
{

/// @brief Aggregated result of compiling one PL/0 program.
struct CompilerResult
{
    /// @brief Diagnostics accumulated during compilation.
    support::DiagnosticEngine diagnostics{};

    /// @brief File identifier used for the compiled source.
    uint32_t fileId{0};

    /// @brief Parsed tree; null when compilation failed.
    std::unique_ptr<ProgramDecl> ast{};

    /// @brief Registered instruction sequence; null when compilation failed.
    std::shared_ptr<const bytecode::Program> program{};

    [[nodiscard]] bool succeeded() const;
};

/// @brief Compile one program and register it under its declared name.
/// @details Nothing is registered when an error is reported. Registering a
///          name that already exists replaces the earlier program.
CompilerResult compilePl0(std::string_view source,
                          const CompilerOptions &options,
                          bytecode::ProgramRegistry &registry,
                          support::SourceManager &sm);

/// @brief One `program <name>; ... .` unit located inside a larger file.
struct ProgramSource
{
    std::string name;   ///< Declared program name.
    size_t offset{0};   ///< Byte offset of the `program` keyword.
    std::string text;   ///< Unit text from `program` up to the next unit.
};

/// @brief Locate every program unit in @p text, in order of appearance.
/// @return The units, or a diagnostic when the text does not tokenize or
///         holds no program.
support::Expected<std::vector<ProgramSource>> splitPrograms(std::string_view text,
                                                            uint32_t fileId = 0);

/// @brief Base-address layout for multi-program files.
struct ProgramLayout
{
    /// @brief Distance from one unit's base address to the next unit's.
    int64_t baseStep{32};

    /// @brief Explicit base addresses by program name; override baseStep.
    std::map<std::string, int64_t> baseMap{};
};

/// @brief Result of compiling every unit of a multi-program file.
struct MultiCompilerResult
{
    support::DiagnosticEngine diagnostics{};
    uint32_t fileId{0};

    /// @brief Registered programs in source order.
    std::vector<std::shared_ptr<const bytecode::Program>> programs{};

    /// @brief Parsed trees in source order.
    std::vector<std::unique_ptr<ProgramDecl>> asts{};

    [[nodiscard]] bool succeeded() const;
};

/// @brief Compile every unit of @p text in order, stopping at the first error.
/// @details Each unit is based layout.baseStep after the previous unit's base
///          (the first at 0) unless its name is listed in layout.baseMap.
///          Diagnostics keep positions relative to the whole file.
MultiCompilerResult compileAll(std::string_view text,
                               const CompilerOptions &options,
                               const ProgramLayout &layout,
                               bytecode::ProgramRegistry &registry,
                               support::SourceManager &sm);

} // namespace pl0::frontend
