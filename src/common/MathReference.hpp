//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/common/MathReference.hpp
// Purpose: Deterministic fixed-point reference for the ten unary math ops and
//          the per-op domain/range table used for clamping and normalization.
// Key invariants: Inputs are clamped to the op's domain and outputs to its
//                 range before re-encoding; ln/log10 of x <= 0 yield -16.
// Ownership/Lifetime: Stateless; the range table is static storage.
// Links: src/common/FixedPoint.hpp, src/provider/MathProvider.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace pl0::common
{

/// @brief Closed set of unary math intrinsics.
enum class MathOp : std::uint8_t
{
    Sin,   ///< FSIN
    Cos,   ///< FCOS
    Tan,   ///< FTAN
    Tanh,  ///< FTANH
    Sinh,  ///< FSINH
    Cosh,  ///< FCOSH
    Ln,    ///< FLN
    Log10, ///< FLOG10
    Exp,   ///< FEXP
    Sqrt,  ///< FSQRT
};

inline constexpr std::size_t kMathOpCount = 10;

/// @brief Every MathOp in declaration order.
inline constexpr std::array<MathOp, kMathOpCount> kAllMathOps = {
    MathOp::Sin, MathOp::Cos, MathOp::Tan, MathOp::Tanh, MathOp::Sinh,
    MathOp::Cosh, MathOp::Ln, MathOp::Log10, MathOp::Exp, MathOp::Sqrt,
};

/// @brief Input domain and output range of one op.
struct MathOpSpec
{
    double inLo;  ///< Lowest accepted input.
    double inHi;  ///< Highest accepted input.
    double outLo; ///< Lowest produced output.
    double outHi; ///< Highest produced output.
};

/// @brief Instruction mnemonic of @p op ("FSIN", "FLOG10", ...).
const char *mathOpName(MathOp op);

/// @brief Look up an op by mnemonic (case-sensitive, upper case).
std::optional<MathOp> mathOpFromName(std::string_view name);

/// @brief Domain/range table entry for @p op.
const MathOpSpec &mathOpSpec(MathOp op);

/// @brief Reference function on reals: clamp input, apply, clamp output.
double referenceReal(MathOp op, double x);

/// @brief Reference function on fixed-point values.
/// @param op Operation to evaluate.
/// @param xFx Fixed-point input.
/// @param scale Fixed-point scale.
/// @return encode(referenceReal(op, decode(xFx)), scale).
std::int64_t referenceFixed(MathOp op, std::int64_t xFx, std::int64_t scale);

/// @brief Map @p x from [lo, hi] into [0, 1]; 0.5 when the range is empty.
double encodeNorm(double x, double lo, double hi);

/// @brief Map @p u from [0, 1] back to [lo, hi]; @p u is clamped first.
double decodeNorm(double u, double lo, double hi);

} // namespace pl0::common
