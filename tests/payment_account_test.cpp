#include <gtest/gtest.h>
#include "ledgerline/errors.hpp"
#include "retail_fixture.hpp"

using namespace ledgerline;

namespace {

EngineConfig loyalty_config() {
    auto config = testing_support::test_config();
    config.loyalty_rate_bp = 1000;
    return config;
}

} // anonymous namespace

// =============================================================================
// PaymentAccount Tests
// =============================================================================

class PaymentAccountTest : public RetailFixture {
protected:
    PaymentAccountTest() : RetailFixture(loyalty_config()) {}
};

TEST_F(PaymentAccountTest, Apply_PartialThenFinal_ShouldSettleAndPostLoyaltyOnce) {
    // Given an invoice of 275.00
    invoiced();

    // When 200.00 is paid in cash
    auto partial = payment_account.apply(ctx, "doc-1", 20000, "cash");

    // Then the invoice is partially paid with 75.00 outstanding
    EXPECT_EQ(partial.stage, retail::STAGE_PARTIALLY_PAID);
    EXPECT_EQ(partial.balance(), 7500);
    EXPECT_EQ(loyalty.balance("c1"), 0);

    // When the remaining 75.00 is paid by card
    auto settled = payment_account.apply(ctx, "doc-1", 7500, "card");

    // Then the invoice settles and 27 points are credited
    EXPECT_EQ(settled.stage, retail::STAGE_SETTLED);
    EXPECT_EQ(settled.balance(), 0);
    EXPECT_EQ(settled.loyalty_points, 27);
    EXPECT_EQ(loyalty.balance("c1"), 27);
    EXPECT_EQ(loyalty.transactions("c1").size(), 1u);
    EXPECT_EQ(logs.count("payment_applied"), 2);
}

TEST_F(PaymentAccountTest, Apply_ShouldNumberPayments) {
    invoiced();
    payment_account.apply(ctx, "doc-1", 1000, "cash");
    payment_account.apply(ctx, "doc-1", 2000, "card");

    auto payments = payment_account.payments("doc-1");

    ASSERT_EQ(payments.size(), 2u);
    EXPECT_EQ(payments[0].payment_sequence(), 1u);
    EXPECT_EQ(payments[1].payment_sequence(), 2u);
    EXPECT_EQ(payments[1].balance_after(), 24500);
    EXPECT_EQ(payments[1].method(), "card");
}

TEST_F(PaymentAccountTest, Apply_Overpayment_ShouldThrowMismatchAndLeaveBalance) {
    invoiced();

    EXPECT_THROW(payment_account.apply(ctx, "doc-1", 27501, "cash"), PaymentMismatchError);

    EXPECT_EQ(docs.get("doc-1").balance(), 27500);
    EXPECT_EQ(logs.count("payment_rejected"), 1);
}

TEST_F(PaymentAccountTest, Apply_NonPositiveAmount_ShouldThrowMismatch) {
    invoiced();
    EXPECT_THROW(payment_account.apply(ctx, "doc-1", 0, "cash"), PaymentMismatchError);
    EXPECT_THROW(payment_account.apply(ctx, "doc-1", -100, "cash"), PaymentMismatchError);
}

TEST_F(PaymentAccountTest, Apply_WithoutMethod_ShouldThrowValidation) {
    invoiced();
    EXPECT_THROW(payment_account.apply(ctx, "doc-1", 1000, ""), ValidationError);
}

TEST_F(PaymentAccountTest, Apply_BeforeInvoice_ShouldThrowInvalidTransition) {
    sales_order();
    EXPECT_THROW(payment_account.apply(ctx, "doc-1", 1000, "cash"), InvalidStateTransitionError);
}

TEST_F(PaymentAccountTest, Apply_AfterSettlement_ShouldThrowInvalidTransition) {
    invoiced();
    payment_account.apply(ctx, "doc-1", 27500, "cash");

    EXPECT_THROW(payment_account.apply(ctx, "doc-1", 1, "cash"), InvalidStateTransitionError);
    EXPECT_EQ(loyalty.balance("c1"), 27);
}

TEST_F(PaymentAccountTest, Apply_UnknownInvoice_ShouldThrowNotFound) {
    EXPECT_THROW(payment_account.apply(ctx, "missing", 1000, "cash"), NotFoundError);
}

TEST_F(PaymentAccountTest, Apply_AfterDiscount_ShouldSettleOnDiscountedBalance) {
    // Given an invoice discounted by 25.00
    invoiced();
    docs.apply_discount(ctx, "doc-1", 2500, "promo");

    // When the remaining 250.00 is paid
    auto settled = payment_account.apply(ctx, "doc-1", 25000, "card");

    // Then points follow the settled amount
    EXPECT_EQ(settled.stage, retail::STAGE_SETTLED);
    EXPECT_EQ(settled.loyalty_points, 25);
    EXPECT_EQ(loyalty.balance("c1"), 25);
}

TEST_F(PaymentAccountTest, PostLoyalty_Repeated_ShouldCreditOnce) {
    invoiced();
    payment_account.apply(ctx, "doc-1", 27500, "cash");

    EXPECT_EQ(payment_account.post_loyalty(ctx, "doc-1"), 0);
    EXPECT_EQ(payment_account.post_loyalty(ctx, "doc-1"), 0);

    EXPECT_EQ(loyalty.balance("c1"), 27);
    EXPECT_EQ(logs.count("loyalty_posted"), 1);
}

TEST_F(PaymentAccountTest, PostLoyalty_UnsettledInvoice_ShouldDoNothing) {
    invoiced();
    EXPECT_EQ(payment_account.post_loyalty(ctx, "doc-1"), 0);
    EXPECT_EQ(loyalty.balance("c1"), 0);
}

TEST_F(PaymentAccountTest, LoyaltyLedger_ShouldAccumulateAcrossInvoices) {
    invoiced("doc-1");
    invoiced("doc-2");
    payment_account.apply(ctx, "doc-1", 27500, "cash");
    payment_account.apply(ctx, "doc-2", 27500, "cash");

    EXPECT_EQ(loyalty.balance("c1"), 54);
    auto transactions = loyalty.transactions("c1");
    ASSERT_EQ(transactions.size(), 2u);
    EXPECT_EQ(transactions[0].invoice_id(), "doc-1");
    EXPECT_EQ(transactions[1].balance_after(), 54);
}
