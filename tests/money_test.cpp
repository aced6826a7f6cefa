#include <gtest/gtest.h>
#include <limits>
#include "ledgerline/errors.hpp"
#include "ledgerline/money.hpp"

using namespace ledgerline;

TEST(MoneyTest, DivideHalfEven_ShouldRoundTiesToEven) {
    EXPECT_EQ(money::divide_half_even(25, 10), 2);
    EXPECT_EQ(money::divide_half_even(35, 10), 4);
    EXPECT_EQ(money::divide_half_even(26, 10), 3);
    EXPECT_EQ(money::divide_half_even(24, 10), 2);
    EXPECT_EQ(money::divide_half_even(-25, 10), -2);
    EXPECT_EQ(money::divide_half_even(-35, 10), -4);
}

TEST(MoneyTest, DivideHalfEven_NonPositiveDenominator_ShouldThrow) {
    EXPECT_THROW(money::divide_half_even(1, 0), ValidationError);
}

TEST(MoneyTest, ComputeTotals_TwoLineInvoice_ShouldTotal27500) {
    // Given qty 2 @ 100.00 and qty 1 @ 50.00, both at 10% tax
    std::vector<money::Line> lines{{2, 10000, 1000}, {1, 5000, 1000}};

    // When totals are computed
    auto totals = money::compute_totals(lines);

    // Then the grand total is 275.00
    EXPECT_EQ(totals.subtotal, 25000);
    EXPECT_EQ(totals.tax, 2500);
    EXPECT_EQ(totals.grand_total, 27500);
}

TEST(MoneyTest, ComputeTotals_ShouldRoundOnceOverTheDocument) {
    // Given three lines each carrying half a cent of tax
    std::vector<money::Line> lines{{1, 5, 1000}, {1, 5, 1000}, {1, 5, 1000}};

    // When totals are computed
    auto totals = money::compute_totals(lines);

    // Then 16.5 rounds once to 16, not 3 x 5.5 rounded per line
    EXPECT_EQ(totals.subtotal, 15);
    EXPECT_EQ(totals.grand_total, 16);
    EXPECT_EQ(totals.tax, 1);
}

TEST(MoneyTest, ComputeTotals_NegativeInput_ShouldThrow) {
    EXPECT_THROW(money::compute_totals({{-1, 100, 0}}), ValidationError);
    EXPECT_THROW(money::compute_totals({{1, 100, -5}}), ValidationError);
}

TEST(MoneyTest, ComputeTotals_Overflow_ShouldThrow) {
    auto max = std::numeric_limits<int64_t>::max();
    EXPECT_THROW(money::compute_totals({{max, max, 0}}), ValidationError);
}

TEST(MoneyTest, LoyaltyPoints_ShouldFloorMajorUnitsTimesRate) {
    EXPECT_EQ(money::loyalty_points(27500, 10), 0);
    EXPECT_EQ(money::loyalty_points(27500, 1000), 27);
    EXPECT_EQ(money::loyalty_points(1000000, 10), 10);
    EXPECT_EQ(money::loyalty_points(0, 1000), 0);
    EXPECT_EQ(money::loyalty_points(27500, 0), 0);
}

TEST(MoneyTest, ComputeTotals_LargeAmounts_ShouldStayExactWithinInt64) {
    // Given a line whose net times the tax rate exceeds int64
    std::vector<money::Line> lines{{1, 100000000000000001, 1500}};

    // When totals are computed
    auto totals = money::compute_totals(lines);

    // Then tax is exact: 100000000000000001 * 0.15 = 15000000000000000.15
    EXPECT_EQ(totals.subtotal, 100000000000000001);
    EXPECT_EQ(totals.tax, 15000000000000000);
    EXPECT_EQ(totals.grand_total, 115000000000000001);
}

TEST(MoneyTest, ComputeTotals_TieOnOddSubtotal_ShouldRoundToEvenGrandTotal) {
    // 1 * 5 at 10% is 5.5, an exact tie that rounds to 6
    auto totals = money::compute_totals({{1, 5, 1000}});
    EXPECT_EQ(totals.grand_total, 6);
    EXPECT_EQ(totals.tax, 1);
}

TEST(MoneyTest, LoyaltyPoints_LargeSettlement_ShouldNotOverflow) {
    auto max = std::numeric_limits<int64_t>::max();
    EXPECT_EQ(money::loyalty_points(max, 10000), max / 100);
}
