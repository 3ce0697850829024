//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/pl0/version.hpp
// Purpose: Project version string shared by the command-line tools.
// Key invariants: Overridable from the build with -DPL0_VERSION_STR=...
// Ownership/Lifetime: N/A.
// Links: src/tools/pl0run/usage.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#ifndef PL0_VERSION_STR
#define PL0_VERSION_STR "0.1.0"
#endif
