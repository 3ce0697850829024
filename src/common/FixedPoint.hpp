//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/common/FixedPoint.hpp
// Purpose: Fixed-point codec converting reals to scaled integers and back.
// Key invariants: encode() always returns round(real * scale) clamped to
//                 [-kMaxEncoded, kMaxEncoded]; decode() is encoded / scale.
// Ownership/Lifetime: Stateless free functions.
// Links: src/common/MathReference.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace pl0::common::fixed
{

/// @brief Default scale: Q16.16.
inline constexpr std::int64_t kDefaultScale = 65536;

/// @brief Largest magnitude an encoded value may take (2^31 - 1).
inline constexpr std::int64_t kMaxEncoded = 0x7fffffff;

/// @brief Round half toward positive infinity.
/// @details Matches the rounding used for literals and provider blending so
///          that -2.5 rounds to -2 and 2.5 rounds to 3.
double roundHalfUp(double x);

/// @brief Encode @p real as a scaled integer.
/// @param real Real value; NaN encodes as 0, infinities saturate.
/// @param scale Positive scale factor.
/// @return round(real * scale) clamped to [-kMaxEncoded, kMaxEncoded].
std::int64_t encode(double real, std::int64_t scale = kDefaultScale);

/// @brief Decode a scaled integer back to a real value.
double decode(std::int64_t encoded, std::int64_t scale = kDefaultScale);

} // namespace pl0::common::fixed
