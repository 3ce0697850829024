//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/CompilerOptions.hpp
// Purpose: Options shared by the parser/code generator and compiler driver.
// Key invariants: fxScale > 0; baseAddress lies inside [0, memorySize).
// Ownership/Lifetime: Plain value type.
// Links: src/frontend/Compiler.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "common/FixedPoint.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace pl0::frontend
{

/// @brief Options controlling PL/0 compilation.
struct CompilerOptions
{
    /// @brief Scale used for real literals, pi/tau/e and fx()/int().
    int64_t fxScale{common::fixed::kDefaultScale};

    /// @brief First memory address handed to declared variables.
    int64_t baseAddress{0};

    /// @brief Memory size the program targets; temporaries start at memorySize - 2.
    size_t memorySize{256};

    /// @brief Path used for diagnostics; defaults to "<input>".
    std::string path{"<input>"};
};

} // namespace pl0::frontend
