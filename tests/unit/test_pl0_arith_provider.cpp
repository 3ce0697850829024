// File: tests/unit/test_pl0_arith_provider.cpp
// Purpose: Check the binary arithmetic provider: exact reference, linear
//          predictor decoding, blending and the safety fallback.
// Key invariants: Analytic weights reproduce exact results while no feature
//                 saturates; fallback swaps in the exact value once the
//                 blended result strays beyond the threshold.
// Ownership/Lifetime: Providers own their predictors.
// Links: src/provider/ArithmeticProvider.hpp

#include <gtest/gtest.h>

#include "provider/ArithmeticProvider.hpp"

#include <cstdint>
#include <limits>
#include <memory>

using namespace pl0::provider;

TEST(Pl0ArithProvider, ExactReference)
{
    EXPECT_EQ(exactArith(ArithOp::Add, 2, 3), 5);
    EXPECT_EQ(exactArith(ArithOp::Sub, 2, 7), -5);
    EXPECT_EQ(exactArith(ArithOp::Mul, -6, 7), -42);
    EXPECT_EQ(exactArith(ArithOp::Div, -7, 2), -4);
    EXPECT_EQ(exactArith(ArithOp::Div, 5, 0), 0);
    EXPECT_EQ(exactArith(ArithOp::Add, std::numeric_limits<int64_t>::max(), 1),
              std::numeric_limits<int64_t>::min());
    EXPECT_STREQ(arithOpName(ArithOp::Div), "DIV");
}

TEST(Pl0ArithProvider, AnalyticWeightsAreExactInRange)
{
    LinearArithmeticPredictor predictor;
    EXPECT_EQ(predictor.predict(ArithOp::Add, 2, 3), 5);
    EXPECT_EQ(predictor.predict(ArithOp::Sub, 2, 7), -5);
    EXPECT_EQ(predictor.predict(ArithOp::Mul, 6, 7), 42);
    EXPECT_EQ(predictor.predict(ArithOp::Div, 7, 2), 3);
    EXPECT_EQ(predictor.predict(ArithOp::Div, -7, 2), -4);
    EXPECT_EQ(predictor.predict(ArithOp::Div, 7, 0), 0);
}

TEST(Pl0ArithProvider, DivDecodeModes)
{
    LinearArithmeticPredictor trunc(65536, DivDecode::Trunc);
    LinearArithmeticPredictor round(65536, DivDecode::Round);
    EXPECT_EQ(trunc.predict(ArithOp::Div, -7, 2), -3);
    EXPECT_EQ(round.predict(ArithOp::Div, 7, 2), 4);
    EXPECT_EQ(round.predict(ArithOp::Div, 7, 3), 2);
}

TEST(Pl0ArithProvider, FeaturesClampAndGuardZeroDivisor)
{
    LinearArithmeticPredictor predictor(100);
    auto f = predictor.features(30, 0);
    EXPECT_DOUBLE_EQ(f[0], 0.3);
    EXPECT_DOUBLE_EQ(f[1], 0.0);
    EXPECT_DOUBLE_EQ(f[5], 0.0);
    EXPECT_DOUBLE_EQ(f[6], 0.0);

    auto big = predictor.features(-500, 300);
    EXPECT_DOUBLE_EQ(big[0], -1.0);
    EXPECT_DOUBLE_EQ(big[1], 1.0);
    EXPECT_DOUBLE_EQ(big[6], 1.0);
}

TEST(Pl0ArithProvider, SaturatedPredictionAndCustomWeights)
{
    LinearArithmeticPredictor predictor;
    // 120000 / 65536 saturates the a+b feature at 1.
    EXPECT_EQ(predictor.predict(ArithOp::Add, 60000, 60000), 65536);

    LinearArithmeticPredictor::Weights zero;
    zero.bias = 0.5;
    predictor.setWeights(ArithOp::Add, zero);
    EXPECT_EQ(predictor.predict(ArithOp::Add, 1, 1), 32768);
    EXPECT_DOUBLE_EQ(predictor.weights(ArithOp::Add).bias, 0.5);

    predictor.initAnalytic();
    EXPECT_EQ(predictor.predict(ArithOp::Add, 1, 1), 2);
}

TEST(Pl0ArithProvider, BlendingAndFallback)
{
    ArithmeticProviderOptions options;
    auto provider = makeArithmeticProvider(options);
    ASSERT_NE(provider, nullptr);

    ArithmeticResult pure = provider->compute(ArithOp::Add, 60000, 60000);
    EXPECT_EQ(pure.exact, 120000);
    EXPECT_EQ(pure.prediction, 65536);
    EXPECT_EQ(pure.result, 65536);
    EXPECT_FALSE(pure.usedFallback);

    options.mix = 0.5;
    ArithmeticResult half = makeArithmeticProvider(options)->compute(ArithOp::Add, 60000, 60000);
    EXPECT_EQ(half.mixed, 92768);
    EXPECT_EQ(half.result, 92768);

    options.mix = 0.0;
    ArithmeticResult exact = makeArithmeticProvider(options)->compute(ArithOp::Add, 60000, 60000);
    EXPECT_EQ(exact.result, 120000);

    options.mix = 1.0;
    options.safetyFallback = true;
    options.fallbackAbsError = 2.0;
    auto guarded = makeArithmeticProvider(options);
    ArithmeticResult fixedUp = guarded->compute(ArithOp::Add, 60000, 60000);
    EXPECT_TRUE(fixedUp.usedFallback);
    EXPECT_EQ(fixedUp.result, 120000);
    EXPECT_EQ(fixedUp.mixed, 65536);

    ArithmeticResult inRange = guarded->compute(ArithOp::Mul, 6, 7);
    EXPECT_FALSE(inRange.usedFallback);
    EXPECT_EQ(inRange.result, 42);
}

TEST(Pl0ArithProvider, NameLookups)
{
    auto linear = parseArithmeticArchitecture("Linear");
    ASSERT_TRUE(linear.hasValue());
    EXPECT_EQ(linear.value(), ArithmeticArchitecture::Linear);
    EXPECT_FALSE(parseArithmeticArchitecture("mlp").hasValue());

    auto trunc = parseDivDecode("TRUNC");
    ASSERT_TRUE(trunc.hasValue());
    EXPECT_EQ(trunc.value(), DivDecode::Trunc);
    EXPECT_FALSE(parseDivDecode("ceil").hasValue());
}
