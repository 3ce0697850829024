//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the table predictor and the blending provider for the unary
// math instructions.
//
//===----------------------------------------------------------------------===//

#include "provider/MathProvider.hpp"

#include "common/CharUtils.hpp"
#include "common/FixedPoint.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace pl0::provider
{

using common::MathOp;

//===----------------------------------------------------------------------===//
// TableMathPredictor
//===----------------------------------------------------------------------===//

TableMathPredictor::TableMathPredictor(int64_t scale, size_t tableSize)
{
    const size_t n = std::max<size_t>(tableSize, 2);
    for (MathOp op : common::kAllMathOps)
    {
        const common::MathOpSpec &spec = common::mathOpSpec(op);
        std::vector<double> samples(n);
        for (size_t i = 0; i < n; ++i)
        {
            const double inNorm = static_cast<double>(i) / static_cast<double>(n - 1);
            const double x = common::decodeNorm(inNorm, spec.inLo, spec.inHi);
            const int64_t yFx = common::referenceFixed(op, common::fixed::encode(x, scale), scale);
            const double y = common::fixed::decode(yFx, scale);
            samples[i] = common::encodeNorm(y, spec.outLo, spec.outHi);
        }
        tables_[static_cast<size_t>(op)] = std::move(samples);
    }
}

void TableMathPredictor::setTable(MathOp op, std::vector<double> samples)
{
    if (samples.size() < 2)
        return;
    tables_[static_cast<size_t>(op)] = std::move(samples);
}

double TableMathPredictor::predictNorm(MathOp op, double inNorm)
{
    const std::vector<double> &t = tables_[static_cast<size_t>(op)];
    const double u = std::clamp(inNorm, 0.0, 1.0) * static_cast<double>(t.size() - 1);
    const size_t i = std::min(static_cast<size_t>(u), t.size() - 2);
    const double frac = u - static_cast<double>(i);
    return t[i] + (t[i + 1] - t[i]) * frac;
}

//===----------------------------------------------------------------------===//
// BlendingMathProvider
//===----------------------------------------------------------------------===//

BlendingMathProvider::BlendingMathProvider(std::unique_ptr<MathPredictor> predictor,
                                           const MathProviderOptions &options)
    : predictor_(std::move(predictor)), options_(options)
{
}

MathResult BlendingMathProvider::compute(MathOp op, int64_t xFx)
{
    const common::MathOpSpec &spec = common::mathOpSpec(op);
    const int64_t scale = options_.scale;

    const double x = common::fixed::decode(xFx, scale);
    const double inNorm = common::encodeNorm(x, spec.inLo, spec.inHi);

    MathResult r;
    r.predNorm = predictor_->predictNorm(op, inNorm);
    r.exact = common::referenceFixed(op, xFx, scale);
    r.exactNorm =
        common::encodeNorm(common::fixed::decode(r.exact, scale), spec.outLo, spec.outHi);

    const double mix = options_.mix;
    r.outNorm = std::clamp(r.exactNorm * (1.0 - mix) + r.predNorm * mix, 0.0, 1.0);
    if (options_.safetyFallback && std::fabs(r.predNorm - r.exactNorm) > options_.fallbackAbsError)
    {
        r.outNorm = r.exactNorm;
        r.usedFallback = true;
    }

    r.result = common::fixed::encode(common::decodeNorm(r.outNorm, spec.outLo, spec.outHi), scale);
    r.prediction =
        common::fixed::encode(common::decodeNorm(r.predNorm, spec.outLo, spec.outHi), scale);
    return r;
}

//===----------------------------------------------------------------------===//
// Factories
//===----------------------------------------------------------------------===//

std::unique_ptr<MathProvider> makeMathProvider(const MathProviderOptions &options)
{
    switch (options.architecture)
    {
        case MathArchitecture::Table:
            return std::make_unique<BlendingMathProvider>(
                std::make_unique<TableMathPredictor>(options.scale, options.tableSize), options);
    }
    return nullptr;
}

support::Expected<MathArchitecture> parseMathArchitecture(std::string_view name)
{
    if (common::char_utils::toLowercase(name) == "table")
        return MathArchitecture::Table;
    return support::makeError(
        {}, "unknown math architecture '" + std::string(name) + "'; supported: table");
}

} // namespace pl0::provider
