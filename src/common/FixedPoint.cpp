//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the fixed-point codec shared by the code generator (float literals
// and the pi/tau/e constants), the reference math table and the providers.
//
//===----------------------------------------------------------------------===//

#include "common/FixedPoint.hpp"

#include <cmath>

namespace pl0::common::fixed
{

double roundHalfUp(double x)
{
    return std::floor(x + 0.5);
}

/// @brief Encode @p real as round(real * scale), saturating at kMaxEncoded.
///
/// @details The clamp is applied in floating point before converting to an
///          integer so that out-of-range products never reach the conversion.
std::int64_t encode(double real, std::int64_t scale)
{
    if (std::isnan(real))
        return 0;
    const double scaled = roundHalfUp(real * static_cast<double>(scale));
    const double limit = static_cast<double>(kMaxEncoded);
    if (scaled >= limit)
        return kMaxEncoded;
    if (scaled <= -limit)
        return -kMaxEncoded;
    return static_cast<std::int64_t>(scaled);
}

double decode(std::int64_t encoded, std::int64_t scale)
{
    return static_cast<double>(encoded) / static_cast<double>(scale);
}

} // namespace pl0::common::fixed
