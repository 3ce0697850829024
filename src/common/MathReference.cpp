//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the deterministic reference for FSIN..FSQRT.  The domain and range
// table doubles as the normalization table of the unary math provider, so both
// paths agree on what "exact" means.
//
//===----------------------------------------------------------------------===//

#include "common/MathReference.hpp"

#include "common/FixedPoint.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace pl0::common
{
namespace
{

constexpr double kPi = std::numbers::pi;

// Indexed by MathOp.
constexpr std::array<MathOpSpec, kMathOpCount> kSpecs = {{
    {-kPi, kPi, -1.0, 1.0},   // Sin
    {-kPi, kPi, -1.0, 1.0},   // Cos
    {-1.3, 1.3, -8.0, 8.0},   // Tan
    {-3.0, 3.0, -1.0, 1.0},   // Tanh
    {-3.0, 3.0, -8.0, 8.0},   // Sinh
    {-3.0, 3.0, 0.0, 10.0},   // Cosh
    {1e-6, 256.0, -16.0, 16.0}, // Ln
    {1e-6, 256.0, -16.0, 16.0}, // Log10
    {-8.0, 8.0, 0.0, 256.0},  // Exp
    {0.0, 256.0, 0.0, 16.0},  // Sqrt
}};

constexpr std::array<const char *, kMathOpCount> kNames = {
    "FSIN", "FCOS", "FTAN", "FTANH", "FSINH", "FCOSH", "FLN", "FLOG10", "FEXP", "FSQRT",
};

double clamp(double x, double lo, double hi)
{
    return std::max(lo, std::min(hi, x));
}

} // namespace

const char *mathOpName(MathOp op)
{
    return kNames[static_cast<std::size_t>(op)];
}

std::optional<MathOp> mathOpFromName(std::string_view name)
{
    for (MathOp op : kAllMathOps)
    {
        if (name == mathOpName(op))
            return op;
    }
    return std::nullopt;
}

const MathOpSpec &mathOpSpec(MathOp op)
{
    return kSpecs[static_cast<std::size_t>(op)];
}

/// @brief Evaluate the reference function for @p op on a real input.
///
/// @details The input is clamped to the op's domain and the output to its
///          range.  ln and log10 short-circuit to the range floor (-16) for
///          non-positive inputs; sqrt of a non-positive input is 0.
double referenceReal(MathOp op, double x)
{
    const MathOpSpec &s = mathOpSpec(op);
    switch (op)
    {
        case MathOp::Sin:
            return clamp(std::sin(clamp(x, s.inLo, s.inHi)), s.outLo, s.outHi);
        case MathOp::Cos:
            return clamp(std::cos(clamp(x, s.inLo, s.inHi)), s.outLo, s.outHi);
        case MathOp::Tan:
            return clamp(std::tan(clamp(x, s.inLo, s.inHi)), s.outLo, s.outHi);
        case MathOp::Tanh:
            return clamp(std::tanh(clamp(x, s.inLo, s.inHi)), s.outLo, s.outHi);
        case MathOp::Sinh:
            return clamp(std::sinh(clamp(x, s.inLo, s.inHi)), s.outLo, s.outHi);
        case MathOp::Cosh:
            return clamp(std::cosh(clamp(x, s.inLo, s.inHi)), s.outLo, s.outHi);
        case MathOp::Ln:
            if (x <= 0.0)
                return s.outLo;
            return clamp(std::log(clamp(x, s.inLo, s.inHi)), s.outLo, s.outHi);
        case MathOp::Log10:
            if (x <= 0.0)
                return s.outLo;
            return clamp(std::log10(clamp(x, s.inLo, s.inHi)), s.outLo, s.outHi);
        case MathOp::Exp:
            return clamp(std::exp(clamp(x, s.inLo, s.inHi)), s.outLo, s.outHi);
        case MathOp::Sqrt:
        {
            const double c = clamp(x, s.inLo, s.inHi);
            const double y = c <= 0.0 ? 0.0 : std::sqrt(c);
            return clamp(y, s.outLo, s.outHi);
        }
    }
    return 0.0;
}

std::int64_t referenceFixed(MathOp op, std::int64_t xFx, std::int64_t scale)
{
    return fixed::encode(referenceReal(op, fixed::decode(xFx, scale)), scale);
}

double encodeNorm(double x, double lo, double hi)
{
    if (hi <= lo)
        return 0.5;
    return clamp((x - lo) / (hi - lo), 0.0, 1.0);
}

double decodeNorm(double u, double lo, double hi)
{
    return lo + clamp(u, 0.0, 1.0) * (hi - lo);
}

} // namespace pl0::common
