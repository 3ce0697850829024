//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/pl0run/usage.hpp
// Purpose: Declarations for pl0run help and usage text.
// Key invariants: None.
// Ownership/Lifetime: N/A.
// Links: src/tools/pl0run/main.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

namespace pl0run
{

/// @brief Print usage information for the pl0run command-line tool.
void printUsage();

/// @brief Print version information for pl0run.
void printVersion();

} // namespace pl0run
