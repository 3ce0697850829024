//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares lightweight source location POD for diagnostics and tokens.
// Key invariants: file_id == 0 denotes an unknown file; line/column are 1-based when valid.
// Ownership/Lifetime: Value type with no dynamic ownership.
// Links: src/support/source_manager.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace pl0::support
{

/// @brief Represents an absolute position within a source buffer.
/// @invariant file_id == 0 indicates an unknown file.
/// @ownership Value type with no owned resources.
struct SourceLoc
{
    /// @brief Identifier assigned by SourceManager; 0 denotes an unknown file.
    uint32_t file_id = 0;

    /// @brief One-based line number within the file; 0 when unknown.
    uint32_t line = 0;

    /// @brief One-based column number within the line; 0 when unknown.
    uint32_t column = 0;

    /// @brief Zero-based byte offset from the start of the buffer.
    uint32_t offset = 0;

    /// @brief Check whether the location references a registered file.
    [[nodiscard]] bool isValid() const;

    /// @brief Determine whether a 1-based line number is available.
    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }

    /// @brief Determine whether a 1-based column number is available.
    [[nodiscard]] bool hasColumn() const
    {
        return column != 0;
    }
};

} // namespace pl0::support
