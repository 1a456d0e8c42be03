// File: tests/unit/test_number.cpp
// Purpose: Unit tests for exact numbers, ranges and fraction approximation.
// Key invariants: Integer and exact fraction arithmetic stays exact; ranges
//                 are ordered.
// Ownership/Lifetime: Standalone unit test executable.
// Links: src/units/Number.hpp, src/units/Value.hpp

#include <gtest/gtest.h>

#include "units/Number.hpp"
#include "units/Value.hpp"

using namespace sous::units;

TEST(Number, FractionIsNormalized)
{
    auto n = Number::fraction(0, 6, 4);
    ASSERT_TRUE(n.has_value());
    ASSERT_EQ(n->kind(), Number::Kind::Fraction);
    EXPECT_EQ(n->asFraction().whole, 1u);
    EXPECT_EQ(n->asFraction().num, 1u);
    EXPECT_EQ(n->asFraction().den, 2u);
    EXPECT_EQ(n->toString(), "1 1/2");
    EXPECT_FALSE(Number::fraction(1, 1, 0).has_value());
}

TEST(Number, AdditionStaysExact)
{
    const Number half = *Number::fraction(0, 1, 2);
    const Number third = *Number::fraction(0, 1, 3);
    const Number sum = half + third;
    ASSERT_EQ(sum.kind(), Number::Kind::Fraction);
    EXPECT_EQ(sum.toString(), "5/6");

    const Number ints = Number::integer(2) + Number::integer(3);
    ASSERT_EQ(ints.kind(), Number::Kind::Integer);
    EXPECT_EQ(ints.asInteger(), 5);

    const Number mixed = Number::integer(1) + half;
    EXPECT_EQ(mixed.toString(), "1 1/2");

    const Number dec = Number::decimal(0.25) + Number::integer(1);
    EXPECT_EQ(dec.kind(), Number::Kind::Decimal);
    EXPECT_EQ(dec.toString(), "1.25");
}

TEST(Number, ScalingByWholeFactorKeepsKind)
{
    EXPECT_EQ(Number::integer(3).scaled(2.0).kind(), Number::Kind::Integer);
    EXPECT_EQ(Number::integer(3).scaled(2.0).asInteger(), 6);
    EXPECT_EQ(Number::fraction(0, 3, 4)->scaled(2.0).toString(), "1 1/2");
    EXPECT_EQ(Number::integer(3).scaled(0.5).toString(), "1.5");
}

TEST(Number, DecimalFormatting)
{
    EXPECT_EQ(formatDecimal(2.0), "2");
    EXPECT_EQ(formatDecimal(0.1), "0.1");
    EXPECT_EQ(formatDecimal(1.23456), "1.235");
    EXPECT_EQ(formatDecimal(-0.0001), "0");
}

TEST(Number, EqualityUsesTolerance)
{
    EXPECT_EQ(Number::decimal(0.5), *Number::fraction(0, 1, 2));
    EXPECT_EQ(Number::decimal(0.1 + 0.2), Number::decimal(0.3));
    EXPECT_FALSE(Number::integer(1) == Number::integer(2));
}

TEST(ApproximateFraction, PrefersSmallDenominators)
{
    auto f = approximateFraction(0.49, 0.05, 4, 100);
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->whole, 0u);
    EXPECT_EQ(f->num, 1u);
    EXPECT_EQ(f->den, 2u);

    auto g = approximateFraction(2.333, 0.05, 8, 100);
    ASSERT_TRUE(g.has_value());
    EXPECT_EQ(g->whole, 2u);
    EXPECT_EQ(g->num, 1u);
    EXPECT_EQ(g->den, 3u);
}

TEST(ApproximateFraction, RejectsWhenInaccurate)
{
    EXPECT_FALSE(approximateFraction(0.1, 0.01, 4, 100).has_value());
    EXPECT_FALSE(approximateFraction(500.0, 0.05, 4, 10).has_value());
    EXPECT_FALSE(approximateFraction(-1.0, 0.05, 4, 10).has_value());
}

TEST(ApproximateFraction, ContinuedFractionForLargeDenominators)
{
    auto f = approximateFraction(1.0 / 7.0, 1e-12, 1'000'000, 10);
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->num, 1u);
    EXPECT_EQ(f->den, 7u);
}

TEST(Value, RangeIsOrderedAndPrinted)
{
    Value v(Range{Number::integer(3), Number::integer(2)});
    ASSERT_EQ(v.kind(), Value::Kind::Range);
    EXPECT_EQ(v.asRange().start.asInteger(), 2);
    EXPECT_EQ(v.toString(), "2-3");
    EXPECT_EQ(v.lowest(), 2.0);
}

TEST(Value, AddMixesNumbersAndRanges)
{
    Value a(Number::integer(1));
    Value b(Range{Number::integer(2), Number::integer(3)});
    auto sum = a.add(b);
    ASSERT_TRUE(sum.has_value());
    EXPECT_EQ(sum->toString(), "3-4");

    Value text(std::string("a pinch"));
    EXPECT_FALSE(a.add(text).has_value());
}

TEST(Value, ScalingLeavesTextAlone)
{
    Value text(std::string("some"));
    EXPECT_EQ(text.scaled(3.0), text);
    Value range(Range{Number::integer(1), Number::integer(2)});
    EXPECT_EQ(range.scaled(2.0).toString(), "2-4");
}

TEST(Number, ClosestFractionWithinDenominatorCap)
{
    auto f = closestFraction(3.14159265358979, 200);
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->whole, 3u);
    EXPECT_EQ(f->num, 16u);
    EXPECT_EQ(f->den, 113u);
    EXPECT_NEAR(f->err, 355.0 / 113.0 - 3.14159265358979, 1e-15);

    auto up = closestFraction(1.9999999999, 1000);
    ASSERT_TRUE(up.has_value());
    EXPECT_EQ(up->whole, 2u);
    EXPECT_EQ(up->num, 0u);
    EXPECT_EQ(up->den, 1u);

    EXPECT_FALSE(closestFraction(-0.5, 10).has_value());
    EXPECT_FALSE(closestFraction(1e30, 10).has_value());
}
