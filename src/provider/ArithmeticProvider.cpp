//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the exact arithmetic reference, the linear predictor and the
// blending provider used for ADD/SUB/MUL/DIV.
//
//===----------------------------------------------------------------------===//

#include "provider/ArithmeticProvider.hpp"

#include "common/CharUtils.hpp"
#include "common/FixedPoint.hpp"
#include "common/IntegerHelpers.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace pl0::provider
{

namespace
{

/// @brief Convert @p x to int64_t, saturating at the representable range.
int64_t saturate(double x)
{
    constexpr double kMax = 9.2233720368547748e18; // 2^63
    if (std::isnan(x))
        return 0;
    if (x >= kMax)
        return std::numeric_limits<int64_t>::max();
    if (x <= -kMax)
        return std::numeric_limits<int64_t>::min();
    return static_cast<int64_t>(x);
}

double clampUnit(double x)
{
    return std::clamp(x, -1.0, 1.0);
}

} // namespace

const char *arithOpName(ArithOp op)
{
    switch (op)
    {
        case ArithOp::Add:
            return "ADD";
        case ArithOp::Sub:
            return "SUB";
        case ArithOp::Mul:
            return "MUL";
        case ArithOp::Div:
            return "DIV";
    }
    return "?";
}

int64_t exactArith(ArithOp op, int64_t a, int64_t b)
{
    namespace integer = common::integer;
    switch (op)
    {
        case ArithOp::Add:
            return integer::wrapAdd(a, b);
        case ArithOp::Sub:
            return integer::wrapSub(a, b);
        case ArithOp::Mul:
            return integer::wrapMul(a, b);
        case ArithOp::Div:
            return b == 0 ? 0 : integer::floorDiv(a, b);
    }
    return 0;
}

//===----------------------------------------------------------------------===//
// LinearArithmeticPredictor
//===----------------------------------------------------------------------===//

LinearArithmeticPredictor::LinearArithmeticPredictor(int64_t scale, DivDecode divDecode)
    : scale_(scale > 0 ? scale : 1), divDecode_(divDecode)
{
    initAnalytic();
}

void LinearArithmeticPredictor::initAnalytic()
{
    // Feature order: a, b, a+b, a-b, a*b, a/b, |b|
    constexpr std::array<size_t, kArithOpCount> kSelected = {2, 3, 4, 5};
    for (size_t op = 0; op < kArithOpCount; ++op)
    {
        weights_[op] = Weights{};
        weights_[op].w[kSelected[op]] = 1.0;
    }
}

void LinearArithmeticPredictor::setWeights(ArithOp op, const Weights &weights)
{
    weights_[static_cast<size_t>(op)] = weights;
}

LinearArithmeticPredictor::Features LinearArithmeticPredictor::features(int64_t a,
                                                                       int64_t b) const
{
    const double s = static_cast<double>(scale_);
    const double da = static_cast<double>(a);
    const double db = static_cast<double>(b);
    return Features{
        clampUnit(da / s),
        clampUnit(db / s),
        clampUnit((da + db) / s),
        clampUnit((da - db) / s),
        clampUnit((da * db) / s),
        b == 0 ? 0.0 : clampUnit((da / db) / s),
        std::clamp(std::fabs(db) / s, 0.0, 1.0),
    };
}

int64_t LinearArithmeticPredictor::decode(double y, ArithOp op) const
{
    const double yy = clampUnit(y) * static_cast<double>(scale_);
    if (op == ArithOp::Div)
    {
        switch (divDecode_)
        {
            case DivDecode::Trunc:
                return saturate(std::trunc(yy));
            case DivDecode::Round:
                return saturate(common::fixed::roundHalfUp(yy));
            case DivDecode::Floor:
                return saturate(std::floor(yy));
        }
    }
    return saturate(common::fixed::roundHalfUp(yy));
}

int64_t LinearArithmeticPredictor::predict(ArithOp op, int64_t a, int64_t b)
{
    const Features x = features(a, b);
    const Weights &net = weights_[static_cast<size_t>(op)];
    double y = net.bias;
    for (size_t i = 0; i < kFeatureCount; ++i)
        y += net.w[i] * x[i];
    return decode(y, op);
}

//===----------------------------------------------------------------------===//
// BlendingArithmeticProvider
//===----------------------------------------------------------------------===//

BlendingArithmeticProvider::BlendingArithmeticProvider(
    std::unique_ptr<ArithmeticPredictor> predictor, const ArithmeticProviderOptions &options)
    : predictor_(std::move(predictor)), options_(options)
{
}

ArithmeticResult BlendingArithmeticProvider::compute(ArithOp op, int64_t a, int64_t b)
{
    ArithmeticResult r;
    r.exact = exactArith(op, a, b);
    r.prediction = predictor_->predict(op, a, b);

    const double mix = options_.mix;
    if (mix == 1.0)
        r.mixed = r.prediction;
    else if (mix == 0.0)
        r.mixed = r.exact;
    else
        r.mixed = saturate(common::fixed::roundHalfUp(
            static_cast<double>(r.exact) * (1.0 - mix) + static_cast<double>(r.prediction) * mix));

    r.result = r.mixed;
    if (options_.safetyFallback &&
        std::fabs(static_cast<double>(r.mixed) - static_cast<double>(r.exact)) >
            options_.fallbackAbsError)
    {
        r.result = r.exact;
        r.usedFallback = true;
    }
    return r;
}

//===----------------------------------------------------------------------===//
// Factories
//===----------------------------------------------------------------------===//

std::unique_ptr<ArithmeticProvider> makeArithmeticProvider(
    const ArithmeticProviderOptions &options)
{
    switch (options.architecture)
    {
        case ArithmeticArchitecture::Linear:
            return std::make_unique<BlendingArithmeticProvider>(
                std::make_unique<LinearArithmeticPredictor>(options.scale, options.divDecode),
                options);
    }
    return nullptr;
}

support::Expected<ArithmeticArchitecture> parseArithmeticArchitecture(std::string_view name)
{
    if (common::char_utils::toLowercase(name) == "linear")
        return ArithmeticArchitecture::Linear;
    return support::makeError(
        {}, "unknown arithmetic architecture '" + std::string(name) + "'; supported: linear");
}

support::Expected<DivDecode> parseDivDecode(std::string_view name)
{
    const std::string lower = common::char_utils::toLowercase(name);
    if (lower == "floor")
        return DivDecode::Floor;
    if (lower == "round")
        return DivDecode::Round;
    if (lower == "trunc")
        return DivDecode::Trunc;
    return support::makeError(
        {}, "unknown DIV decoding '" + std::string(name) + "'; supported: floor, round, trunc");
}

} // namespace pl0::provider
