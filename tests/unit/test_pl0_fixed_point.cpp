// File: tests/unit/test_pl0_fixed_point.cpp
// Purpose: Validate fixed-point encoding and the machine's integer rules.
// Key invariants: encode() rounds half up and saturates at kMaxEncoded;
//                 integer ops wrap; division floors; addresses wrap modulo size.
// Ownership/Lifetime: N/A (test).
// Links: src/common/FixedPoint.hpp, src/common/IntegerHelpers.hpp

#include <gtest/gtest.h>

#include "common/FixedPoint.hpp"
#include "common/IntegerHelpers.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

namespace fixed = pl0::common::fixed;
namespace integer = pl0::common::integer;

TEST(Pl0FixedPoint, EncodeRoundsHalfUp)
{
    EXPECT_EQ(fixed::encode(1.0), 65536);
    EXPECT_EQ(fixed::encode(0.5), 32768);
    EXPECT_EQ(fixed::encode(-1.5), -98304);
    EXPECT_EQ(fixed::encode(2.5, 1), 3);
    EXPECT_EQ(fixed::encode(-2.5, 1), -2);
    EXPECT_EQ(fixed::encode(3.14159, 100), 314);
}

TEST(Pl0FixedPoint, EncodeSaturates)
{
    EXPECT_EQ(fixed::encode(1e12), fixed::kMaxEncoded);
    EXPECT_EQ(fixed::encode(-1e12), -fixed::kMaxEncoded);
    EXPECT_EQ(fixed::encode(std::numeric_limits<double>::infinity()), fixed::kMaxEncoded);
    EXPECT_EQ(fixed::encode(std::nan("")), 0);
}

TEST(Pl0FixedPoint, DecodeDividesByScale)
{
    EXPECT_DOUBLE_EQ(fixed::decode(65536), 1.0);
    EXPECT_DOUBLE_EQ(fixed::decode(-32768), -0.5);
    EXPECT_DOUBLE_EQ(fixed::decode(250, 100), 2.5);
}

TEST(Pl0FixedPoint, DecodeRecoversEncodedValueWithinHalfStep)
{
    const double limit = static_cast<double>(fixed::kMaxEncoded) / fixed::kDefaultScale;
    const double halfStep = 0.5 / fixed::kDefaultScale;
    for (double x = -32767.0; x <= 32767.0; x += 0.37)
    {
        ASSERT_LT(std::fabs(x), limit);
        const double back = fixed::decode(fixed::encode(x));
        ASSERT_LE(std::fabs(back - x), halfStep + 1e-9) << "x=" << x;
    }

    // Values a hundredth of a step apart still land on the nearest step.
    for (int i = 0; i <= 100; ++i)
    {
        const double x = 1.0 + i * 0.01 / fixed::kDefaultScale;
        ASSERT_LE(std::fabs(fixed::decode(fixed::encode(x)) - x), halfStep + 1e-12) << i;
    }
}

TEST(Pl0FixedPoint, EncodeClampsJustPastTheRange)
{
    EXPECT_EQ(fixed::encode(32767.0), 32767 * fixed::kDefaultScale);
    EXPECT_EQ(fixed::encode(32768.0), fixed::kMaxEncoded);
    EXPECT_EQ(fixed::encode(-32768.0), -fixed::kMaxEncoded);
    EXPECT_EQ(fixed::encode(-40000.0), -fixed::kMaxEncoded);
    EXPECT_EQ(fixed::encode(-std::numeric_limits<double>::infinity()), -fixed::kMaxEncoded);
    EXPECT_EQ(fixed::encode(std::nan(""), 100), 0);
}

TEST(Pl0IntegerRules, ArithmeticWraps)
{
    const int64_t max = std::numeric_limits<int64_t>::max();
    const int64_t min = std::numeric_limits<int64_t>::min();
    EXPECT_EQ(integer::wrapAdd(max, 1), min);
    EXPECT_EQ(integer::wrapSub(min, 1), max);
    EXPECT_EQ(integer::wrapMul(max, 2), -2);
    EXPECT_EQ(integer::wrapAdd(2, 3), 5);
}

TEST(Pl0IntegerRules, DivisionFloors)
{
    EXPECT_EQ(integer::floorDiv(7, 2), 3);
    EXPECT_EQ(integer::floorDiv(-7, 2), -4);
    EXPECT_EQ(integer::floorDiv(7, -2), -4);
    EXPECT_EQ(integer::floorDiv(-7, -2), 3);
    EXPECT_EQ(integer::floorDiv(-8, 2), -4);
    EXPECT_EQ(integer::floorDiv(std::numeric_limits<int64_t>::min(), -1),
              std::numeric_limits<int64_t>::min());
}

TEST(Pl0IntegerRules, AddressesWrapEuclidean)
{
    EXPECT_EQ(integer::normalizeIndex(5, 256), 5u);
    EXPECT_EQ(integer::normalizeIndex(256, 256), 0u);
    EXPECT_EQ(integer::normalizeIndex(300, 256), 44u);
    EXPECT_EQ(integer::normalizeIndex(-1, 256), 255u);
    EXPECT_EQ(integer::normalizeIndex(-257, 256), 255u);
}
