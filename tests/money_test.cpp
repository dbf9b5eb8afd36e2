#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "chipledger/errors.hpp"
#include "chipledger/money.hpp"

using namespace chipledger;

// =============================================================================
// to_cents Tests
// =============================================================================

TEST(MoneyTest, ToCents_WholeAndFractionalAmounts_ShouldConvertExactly) {
    EXPECT_EQ(money::to_cents(0.0), 0);
    EXPECT_EQ(money::to_cents(20.0), 2000);
    EXPECT_EQ(money::to_cents(12.34), 1234);
    EXPECT_EQ(money::to_cents(0.1), 10);
    EXPECT_EQ(money::to_cents(20.01), 2001);
}

TEST(MoneyTest, ToCents_ExactHalfCent_ShouldRoundToEven) {
    EXPECT_EQ(money::to_cents(0.125), 12);
    EXPECT_EQ(money::to_cents(0.375), 38);
    EXPECT_EQ(money::to_cents(1.005), 100);
    EXPECT_EQ(money::to_cents(1.015), 102);
    EXPECT_EQ(money::to_cents(29.975), 2998);
    EXPECT_EQ(money::to_cents(50.015), 5002);
}

TEST(MoneyTest, ToCents_NegativeHalfCent_ShouldRoundToEven) {
    EXPECT_EQ(money::to_cents(-0.125), -12);
    EXPECT_EQ(money::to_cents(-0.135), -14);
}

TEST(MoneyTest, ToCents_NonHalfFraction_ShouldRoundToNearest) {
    EXPECT_EQ(money::to_cents(0.126), 13);
    EXPECT_EQ(money::to_cents(0.124), 12);
}

TEST(MoneyTest, ToCents_NonFinite_ShouldThrowInvalidRecord) {
    EXPECT_THROW(money::to_cents(std::nan("")), InvalidRecordError);
    EXPECT_THROW(money::to_cents(std::numeric_limits<double>::infinity()), InvalidRecordError);
}

TEST(MoneyTest, ToCents_HugeValue_ShouldThrowInvalidRecord) {
    EXPECT_THROW(money::to_cents(1e300), InvalidRecordError);
}

TEST(MoneyTest, CheckedAdd_Overflow_ShouldThrowInvalidRecord) {
    Cents max = std::numeric_limits<Cents>::max();
    EXPECT_EQ(money::checked_add(max - 1, 1), max);
    EXPECT_THROW(money::checked_add(max, 1), InvalidRecordError);
    EXPECT_THROW(money::checked_add(std::numeric_limits<Cents>::min(), -1), InvalidRecordError);
}

// =============================================================================
// format_cents Tests
// =============================================================================

TEST(MoneyTest, FormatCents_ShouldRenderTwoDecimals) {
    EXPECT_EQ(money::format_cents(0), "0.00");
    EXPECT_EQ(money::format_cents(5), "0.05");
    EXPECT_EQ(money::format_cents(1234), "12.34");
    EXPECT_EQ(money::format_cents(-150), "-1.50");
}
