//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: provider/MathProvider.hpp
// Purpose: Unary math provider contract used by the F* instructions, the
//          blending provider working in each op's normalized [0, 1] space,
//          and the built-in table predictor.
// Key invariants: Normalization ranges are the reference table in
//                 common/MathReference.hpp; the exact comparator is
//                 referenceFixed().
// Ownership/Lifetime: BlendingMathProvider owns its predictor. The VM borrows
//                     providers for the duration of a run.
// Links: src/common/MathReference.hpp, src/vm/Machine.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "common/MathReference.hpp"
#include "support/diag_expected.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace pl0::provider
{

/// @brief Everything a provider reports for one unary operation.
struct MathResult
{
    int64_t result{0};        ///< Fixed-point value written to the register.
    int64_t prediction{0};    ///< Raw prediction decoded to fixed point.
    int64_t exact{0};         ///< Reference value in fixed point.
    bool usedFallback{false}; ///< True when the exact value replaced the blend.
    double outNorm{0.0};      ///< Normalized value actually returned.
    double exactNorm{0.0};    ///< Normalized reference value.
    double predNorm{0.0};     ///< Normalized raw prediction.
};

/// @brief Capability contract for the ten unary math ops.
class MathProvider
{
  public:
    virtual ~MathProvider() = default;

    /// @brief Compute @p op on the fixed-point input @p xFx.
    virtual MathResult compute(common::MathOp op, int64_t xFx) = 0;
};

/// @brief Approximator wrapped by BlendingMathProvider; works in [0, 1].
class MathPredictor
{
  public:
    virtual ~MathPredictor() = default;

    /// @brief Predict the normalized output for normalized input @p inNorm.
    virtual double predictNorm(common::MathOp op, double inNorm) = 0;
};

/// @brief Built-in predictor architectures.
enum class MathArchitecture
{
    Table,
};

/// @brief Construction parameters for the blending math provider.
struct MathProviderOptions
{
    MathArchitecture architecture{MathArchitecture::Table};

    /// @brief Fixed-point scale of register values.
    int64_t scale{65536};

    /// @brief Blend weight in normalized space: 1 = prediction only.
    double mix{1.0};

    bool safetyFallback{true};

    /// @brief Largest tolerated |predNorm - exactNorm|, in normalized units.
    double fallbackAbsError{0.001};

    /// @brief Samples per op for the Table architecture (at least 2).
    size_t tableSize{64};
};

/// @brief Piecewise-linear lookup table sampled from the reference functions.
/// @details Sample i of an op holds the normalized reference output at the
///          normalized input i / (size - 1); predictions interpolate between
///          neighbouring samples.
class TableMathPredictor final : public MathPredictor
{
  public:
    TableMathPredictor(int64_t scale, size_t tableSize);

    /// @brief Replace the samples of @p op; fewer than two samples are ignored.
    void setTable(common::MathOp op, std::vector<double> samples);

    const std::vector<double> &table(common::MathOp op) const
    {
        return tables_[static_cast<size_t>(op)];
    }

    double predictNorm(common::MathOp op, double inNorm) override;

  private:
    std::array<std::vector<double>, common::kMathOpCount> tables_;
};

/// @brief Mixes a predictor with the reference in normalized space.
/// @details mixedNorm = clamp(exactNorm * (1 - mix) + predNorm * mix, 0, 1).
///          With the safety fallback enabled, a prediction further than
///          fallbackAbsError from exactNorm is replaced by exactNorm.
class BlendingMathProvider final : public MathProvider
{
  public:
    BlendingMathProvider(std::unique_ptr<MathPredictor> predictor,
                         const MathProviderOptions &options);

    MathResult compute(common::MathOp op, int64_t xFx) override;

    const MathProviderOptions &options() const
    {
        return options_;
    }

  private:
    std::unique_ptr<MathPredictor> predictor_;
    MathProviderOptions options_;
};

/// @brief Build the provider selected by @p options.architecture.
std::unique_ptr<MathProvider> makeMathProvider(const MathProviderOptions &options);

/// @brief Look up an architecture by name ("table").
support::Expected<MathArchitecture> parseMathArchitecture(std::string_view name);

} // namespace pl0::provider
