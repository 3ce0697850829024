//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/RunStats.hpp
// Purpose: Per-run execution counters and provider statistics.
// Key invariants: Reset at the start of every run; provider counters only
//                 move while the matching provider is attached.
// Ownership/Lifetime: Owned by the Machine.
// Links: src/vm/Machine.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "common/MathReference.hpp"
#include "provider/ArithmeticProvider.hpp"

#include <array>
#include <cstdint>
#include <ostream>

namespace pl0::vm
{

/// @brief Counters for one provider-backed operation.
struct OpStats
{
    uint64_t calls{0};
    uint64_t fallbacks{0};
    double absErrorSum{0.0}; ///< Sum of |prediction - exact|.
};

struct RunStats
{
    uint64_t steps{0};

    /// @brief Indexed by provider::ArithOp; error in integer units.
    std::array<OpStats, provider::kArithOpCount> arith{};

    /// @brief Indexed by common::MathOp; error in normalized units.
    std::array<OpStats, common::kMathOpCount> math{};

    OpStats &of(provider::ArithOp op)
    {
        return arith[static_cast<size_t>(op)];
    }

    const OpStats &of(provider::ArithOp op) const
    {
        return arith[static_cast<size_t>(op)];
    }

    OpStats &of(common::MathOp op)
    {
        return math[static_cast<size_t>(op)];
    }

    const OpStats &of(common::MathOp op) const
    {
        return math[static_cast<size_t>(op)];
    }
};

/// @brief Print the step count and every op with at least one provider call.
void printRunStats(const RunStats &stats, std::ostream &os);

} // namespace pl0::vm
