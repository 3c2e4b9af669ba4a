#include <gtest/gtest.h>

#include "domain/Decimal.hpp"

#include <stdexcept>

using ledger::domain::Decimal;

// ============================================================================
// Разбор и вывод
// ============================================================================

TEST(DecimalTest, FromString_Fraction_CanonicalOutput) {
    EXPECT_EQ(Decimal::fromString("0.2").toString(), "0.2");
    EXPECT_EQ(Decimal::fromString("55000.000").toString(), "55000");
    EXPECT_EQ(Decimal::fromString("-0.00000001").toString(), "-0.00000001");
    EXPECT_EQ(Decimal::fromString("+7").toString(), "7");
}

TEST(DecimalTest, TryParse_Garbage_ReturnsNullopt) {
    EXPECT_FALSE(Decimal::tryParse("").has_value());
    EXPECT_FALSE(Decimal::tryParse("abc").has_value());
    EXPECT_FALSE(Decimal::tryParse("1.2.3").has_value());
    EXPECT_FALSE(Decimal::tryParse("-").has_value());
    EXPECT_FALSE(Decimal::tryParse("1e5").has_value());
}

TEST(DecimalTest, FromString_Invalid_Throws) {
    EXPECT_THROW(Decimal::fromString("12,5"), std::invalid_argument);
}

TEST(DecimalTest, TryParse_MoreThanEighteenDigits_RoundsHalfUp) {
    EXPECT_EQ(Decimal::fromString("0.0000000000000000015").toString(), "0.000000000000000002");
    EXPECT_EQ(Decimal::fromString("0.0000000000000000014").toString(), "0.000000000000000001");
}

TEST(DecimalTest, TryParse_HugeInteger_ReturnsNullopt) {
    EXPECT_FALSE(Decimal::tryParse("1000000000000000000000000").has_value());
}

TEST(DecimalTest, ToFixed_RoundsHalfAwayFromZero) {
    EXPECT_EQ(Decimal::fromString("1234.565").toFixed(2), "1234.57");
    EXPECT_EQ(Decimal::fromString("-1.005").toFixed(2), "-1.01");
    EXPECT_EQ(Decimal::fromString("2.5").toFixed(0), "3");
    EXPECT_EQ(Decimal::fromString("0.1").toFixed(4), "0.1000");
}

// ============================================================================
// Арифметика
// ============================================================================

TEST(DecimalTest, Addition_IsExact) {
    EXPECT_EQ(Decimal::fromString("0.1") + Decimal::fromString("0.2"), Decimal::fromString("0.3"));
}

TEST(DecimalTest, WeightedAverage_ExactForSimpleInputs) {
    auto q = Decimal::fromString("0.1");
    auto avg = (q * Decimal::fromInt(50000) + q * Decimal::fromInt(60000)) / (q + q);
    EXPECT_EQ(avg, Decimal::fromInt(55000));
}

TEST(DecimalTest, Division_RoundsAtLastDigit) {
    EXPECT_EQ((Decimal::one() / Decimal::fromInt(3)).toString(), "0.333333333333333333");
    EXPECT_EQ((Decimal::fromInt(2) / Decimal::fromInt(3)).toString(), "0.666666666666666667");
    EXPECT_EQ((Decimal::fromInt(-2) / Decimal::fromInt(3)).toString(), "-0.666666666666666667");
}

TEST(DecimalTest, Division_ByZero_ThrowsDomainError) {
    EXPECT_THROW(Decimal::one() / Decimal::zero(), std::domain_error);
}

TEST(DecimalTest, Multiplication_Overflow_ThrowsOverflowError) {
    auto big = Decimal::fromString("100000000000000000000");
    EXPECT_THROW(big * big, std::overflow_error);
}

TEST(DecimalTest, Addition_Overflow_ThrowsOverflowError) {
    auto big = Decimal::fromString("170000000000000000000");
    EXPECT_THROW(big + big, std::overflow_error);
}

TEST(DecimalTest, Predicates_And_Abs) {
    auto negative = Decimal::fromString("-3.5");
    EXPECT_TRUE(negative.isNegative());
    EXPECT_FALSE(negative.isPositive());
    EXPECT_EQ(negative.abs(), Decimal::fromString("3.5"));
    EXPECT_TRUE(Decimal::zero().isZero());
    EXPECT_EQ(Decimal::fromString("-0").toString(), "0");
}

TEST(DecimalTest, Round_ToPlaces) {
    EXPECT_EQ(Decimal::fromString("12.34567").round(2), Decimal::fromString("12.35"));
    EXPECT_EQ(Decimal::fromString("12.34567").round(18), Decimal::fromString("12.34567"));
}
