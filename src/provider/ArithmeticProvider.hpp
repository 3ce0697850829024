//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: provider/ArithmeticProvider.hpp
// Purpose: Binary arithmetic provider contract used by ADD/SUB/MUL/DIV, the
//          blending provider that mixes a predictor with exact arithmetic,
//          and the built-in linear predictor.
// Key invariants: exact values follow the VM's exact path (wrapping 64-bit
//                 ADD/SUB/MUL, floor DIV, zero divisor yields 0).
// Ownership/Lifetime: BlendingArithmeticProvider owns its predictor. The VM
//                     borrows providers for the duration of a run.
// Links: src/vm/Machine.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <string_view>

namespace pl0::provider
{

/// @brief Operation tag handed to arithmetic providers.
enum class ArithOp : uint8_t
{
    Add,
    Sub,
    Mul,
    Div,
};

inline constexpr size_t kArithOpCount = 4;

/// @brief Mnemonic of @p op ("ADD", "SUB", "MUL", "DIV").
const char *arithOpName(ArithOp op);

/// @brief Exact reference for @p op; division by zero yields 0.
int64_t exactArith(ArithOp op, int64_t a, int64_t b);

/// @brief Everything a provider reports for one operation.
struct ArithmeticResult
{
    int64_t result{0};       ///< Value written to the destination register.
    int64_t exact{0};        ///< Exact reference value.
    int64_t prediction{0};   ///< Raw predictor output.
    int64_t mixed{0};        ///< exact * (1 - mix) + prediction * mix, rounded.
    bool usedFallback{false}; ///< True when @ref result was replaced by @ref exact.
};

/// @brief Capability contract for binary arithmetic.
class ArithmeticProvider
{
  public:
    virtual ~ArithmeticProvider() = default;

    /// @brief Compute @p op on @p a and @p b.
    virtual ArithmeticResult compute(ArithOp op, int64_t a, int64_t b) = 0;
};

/// @brief Approximator wrapped by BlendingArithmeticProvider.
class ArithmeticPredictor
{
  public:
    virtual ~ArithmeticPredictor() = default;

    /// @brief Predict the integer result of @p op.
    virtual int64_t predict(ArithOp op, int64_t a, int64_t b) = 0;
};

/// @brief Built-in predictor architectures.
enum class ArithmeticArchitecture
{
    Linear,
};

/// @brief Rounding applied when decoding a DIV prediction.
enum class DivDecode
{
    Floor,
    Round,
    Trunc,
};

/// @brief Construction parameters for the blending arithmetic provider.
struct ArithmeticProviderOptions
{
    ArithmeticArchitecture architecture{ArithmeticArchitecture::Linear};

    /// @brief Integer <-> [-1, 1] normalization scale.
    int64_t scale{65536};

    /// @brief Blend weight: 1 = prediction only, 0 = exact only.
    double mix{1.0};

    /// @brief Replace results further than fallbackAbsError from exact.
    bool safetyFallback{false};

    /// @brief Largest tolerated |mixed - exact| in integer units.
    double fallbackAbsError{2.0};

    DivDecode divDecode{DivDecode::Floor};
};

/// @brief Single-layer linear model over seven fixed features.
/// @details Features, each divided by scale and clamped to [-1, 1]:
///          a, b, a+b, a-b, a*b, a/b (0 when b is 0), |b| (clamped to [0, 1]).
///          The output y is decoded as clamp(y, -1, 1) * scale and rounded.
///          With analytic weights ADD/SUB/MUL are exact while no feature
///          saturates; DIV uses real division decoded per DivDecode.
class LinearArithmeticPredictor final : public ArithmeticPredictor
{
  public:
    static constexpr size_t kFeatureCount = 7;
    using Features = std::array<double, kFeatureCount>;

    struct Weights
    {
        Features w{};
        double bias{0.0};
    };

    explicit LinearArithmeticPredictor(int64_t scale = 65536,
                                       DivDecode divDecode = DivDecode::Floor);

    /// @brief Select the matching feature for each op with unit weight.
    void initAnalytic();

    void setWeights(ArithOp op, const Weights &weights);

    const Weights &weights(ArithOp op) const
    {
        return weights_[static_cast<size_t>(op)];
    }

    Features features(int64_t a, int64_t b) const;

    int64_t predict(ArithOp op, int64_t a, int64_t b) override;

  private:
    int64_t decode(double y, ArithOp op) const;

    int64_t scale_;
    DivDecode divDecode_;
    std::array<Weights, kArithOpCount> weights_{};
};

/// @brief Mixes a predictor with exact arithmetic and applies the safety fallback.
class BlendingArithmeticProvider final : public ArithmeticProvider
{
  public:
    BlendingArithmeticProvider(std::unique_ptr<ArithmeticPredictor> predictor,
                               const ArithmeticProviderOptions &options);

    ArithmeticResult compute(ArithOp op, int64_t a, int64_t b) override;

    const ArithmeticProviderOptions &options() const
    {
        return options_;
    }

    ArithmeticPredictor &predictor()
    {
        return *predictor_;
    }

  private:
    std::unique_ptr<ArithmeticPredictor> predictor_;
    ArithmeticProviderOptions options_;
};

/// @brief Build the provider selected by @p options.architecture.
std::unique_ptr<ArithmeticProvider> makeArithmeticProvider(
    const ArithmeticProviderOptions &options);

/// @brief Look up an architecture by name ("linear").
support::Expected<ArithmeticArchitecture> parseArithmeticArchitecture(std::string_view name);

/// @brief Look up a DIV decoding rule by name ("floor", "round", "trunc").
support::Expected<DivDecode> parseDivDecode(std::string_view name);

} // namespace pl0::provider
