//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/common/IntegerHelpers.hpp
// Purpose: Provide the machine's integer arithmetic rules (wrapping add/sub/mul,
//          floor division, Euclidean address normalization).
// Key invariants: Helper functions never trigger undefined behaviour on signed
//                 64-bit operands; results follow two's-complement wrap-around.
// Ownership/Lifetime: Header-only utilities with no dynamic ownership.
// Links: src/vm/Machine.cpp, src/provider/ArithmeticProvider.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

namespace pl0::common::integer
{

/// @brief Register and memory cell value type.
using Value = std::int64_t;

/// @brief Two's-complement addition that wraps instead of overflowing.
[[nodiscard]] inline Value wrapAdd(Value a, Value b) noexcept
{
    return static_cast<Value>(static_cast<std::uint64_t>(a) + static_cast<std::uint64_t>(b));
}

/// @brief Two's-complement subtraction that wraps instead of overflowing.
[[nodiscard]] inline Value wrapSub(Value a, Value b) noexcept
{
    return static_cast<Value>(static_cast<std::uint64_t>(a) - static_cast<std::uint64_t>(b));
}

/// @brief Two's-complement multiplication that wraps instead of overflowing.
[[nodiscard]] inline Value wrapMul(Value a, Value b) noexcept
{
    return static_cast<Value>(static_cast<std::uint64_t>(a) * static_cast<std::uint64_t>(b));
}

/// @brief Quotient rounded toward negative infinity.
/// @details Requires @p b != 0.  INT64_MIN / -1 wraps to INT64_MIN.
[[nodiscard]] inline Value floorDiv(Value a, Value b) noexcept
{
    if (b == -1)
        return wrapSub(0, a);
    Value q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0)))
        --q;
    return q;
}

/// @brief Map @p addr into [0, size) using Euclidean modulo.
/// @details Requires @p size > 0.  Negative addresses wrap from the top.
[[nodiscard]] inline std::size_t normalizeIndex(Value addr, std::size_t size) noexcept
{
    const Value m = static_cast<Value>(size);
    Value r = addr % m;
    if (r < 0)
        r += m;
    return static_cast<std::size_t>(r);
}

} // namespace pl0::common::integer
