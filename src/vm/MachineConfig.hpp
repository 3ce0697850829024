//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/MachineConfig.hpp
// Purpose: Machine geometry, per-run options and compile-time defaults.
// Key invariants: Sizes are fixed for the lifetime of a Machine.
// Ownership/Lifetime: Plain values; RunConfig borrows its providers.
// Links: src/vm/Machine.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/Trace.hpp"

#include <cstddef>
#include <cstdint>

// -----------------------------------------------------------------------------
// Defaults (override with -D)
// -----------------------------------------------------------------------------
#ifndef PL0_DEFAULT_MAX_STEPS
#define PL0_DEFAULT_MAX_STEPS 1000000
#endif

#ifndef PL0_DEFAULT_FX_SCALE
#define PL0_DEFAULT_FX_SCALE 65536
#endif

namespace pl0::provider
{
class ArithmeticProvider;
class MathProvider;
} // namespace pl0::provider

namespace pl0::vm
{

/// @brief Fixed machine geometry.
struct MachineConfig
{
    size_t numRegisters{4};
    size_t memorySize{256};
    size_t dataStackMax{256};
    size_t callStackMax{4096};

    /// @brief Scale of the reference math path when no math provider is attached.
    int64_t fxScale{PL0_DEFAULT_FX_SCALE};
};

/// @brief Options for one execution run.
struct RunConfig
{
    /// @brief Fetches allowed before the run traps with StepLimitExceeded.
    uint64_t maxSteps{PL0_DEFAULT_MAX_STEPS};

    TraceConfig trace{};

    /// @brief Provider for ADD/SUB/MUL/DIV; exact arithmetic when null.
    provider::ArithmeticProvider *arithmetic = nullptr;

    /// @brief Provider for the F* ops; reference math when null.
    provider::MathProvider *math = nullptr;

    /// @brief Accumulate provider statistics into RunStats.
    bool trackStats{true};
};

} // namespace pl0::vm
