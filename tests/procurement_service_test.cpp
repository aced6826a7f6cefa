#include <gtest/gtest.h>
#include "ledgerline/errors.hpp"
#include "ledgerline/helpers.hpp"
#include "retail_fixture.hpp"

using namespace ledgerline;

namespace {

constexpr int64_t EXPECTED_SECONDS = 1700000000;
constexpr int64_t DAY = 86400;

google::protobuf::Timestamp at(int64_t seconds) {
    google::protobuf::Timestamp ts;
    ts.set_seconds(seconds);
    return ts;
}

retail::PurchaseItem item(const std::string& variant_id, int64_t ordered, int64_t unit_cost) {
    retail::PurchaseItem item;
    item.set_variant_id(variant_id);
    item.set_ordered(ordered);
    item.set_unit_cost(unit_cost);
    return item;
}

retail::GrnLine grn_line(const std::string& variant_id, int64_t quantity) {
    retail::GrnLine line;
    line.set_variant_id(variant_id);
    line.set_quantity(quantity);
    return line;
}

procurement::GoodsReceipt receipt(const std::string& grn_id, const std::string& bill,
                                  int64_t received_seconds, std::vector<retail::GrnLine> lines) {
    return {grn_id, bill, at(received_seconds), std::move(lines)};
}

/**
 * Store that forwards to another store but rejects purchase order appends
 * with a version conflict once armed.
 */
class ConflictingPurchaseStore : public EventStore {
public:
    explicit ConflictingPurchaseStore(EventStore& inner) : inner_(inner) {}

    void arm() { armed_ = true; }
    int rejected() const { return rejected_; }

    EventBook load(const std::string& domain, const std::string& root) const override {
        return inner_.load(domain, root);
    }

    uint32_t version(const std::string& domain, const std::string& root) const override {
        return inner_.version(domain, root);
    }

    uint32_t append(const std::string& domain, const std::string& root, uint32_t expected_version,
                    const std::vector<google::protobuf::Any>& events) override {
        if (armed_ && domain == "purchase_order") {
            ++rejected_;
            throw ConcurrencyConflictError("purchase order " + root + " moved", expected_version,
                                           expected_version + 1);
        }
        return inner_.append(domain, root, expected_version, events);
    }

    void snapshot(const std::string& domain, const std::string& root, uint32_t sequence,
                  const google::protobuf::Any& state) override {
        inner_.snapshot(domain, root, sequence, state);
    }

    std::vector<EventPage> read(const std::string& domain, const std::string& root,
                                uint32_t after_sequence, uint32_t limit) const override {
        return inner_.read(domain, root, after_sequence, limit);
    }

    std::vector<std::string> roots(const std::string& domain) const override {
        return inner_.roots(domain);
    }

private:
    EventStore& inner_;
    bool armed_ = false;
    int rejected_ = 0;
};

} // anonymous namespace

// =============================================================================
// ProcurementService Tests
// =============================================================================

class ProcurementServiceTest : public RetailFixture {
protected:
    procurement::PurchaseState approved_order(const std::string& po_id = "po-1",
                                              const std::string& supplier_id = "acme") {
        orders.request(ctx, po_id, supplier_id, "b1", at(EXPECTED_SECONDS),
                       {item("shirt", 10, 4000), item("cap", 5, 2000)});
        return orders.approve(ctx, po_id);
    }
};

TEST_F(ProcurementServiceTest, Request_ShouldOpenOrder) {
    orders.request(ctx, "po-1", "acme", "b1", at(EXPECTED_SECONDS), {item("shirt", 10, 4000)});

    auto state = orders.get("po-1");
    EXPECT_EQ(state.status, retail::PURCHASE_STATUS_REQUESTED);
    EXPECT_EQ(state.supplier_id, "acme");
    ASSERT_NE(state.line("shirt"), nullptr);
    EXPECT_EQ(state.line("shirt")->outstanding(), 10);
}

TEST_F(ProcurementServiceTest, Request_InvalidItems_ShouldThrowValidation) {
    EXPECT_THROW(orders.request(ctx, "po-1", "acme", "b1", at(EXPECTED_SECONDS), {}), ValidationError);
    EXPECT_THROW(orders.request(ctx, "po-1", "acme", "b1", at(EXPECTED_SECONDS), {item("shirt", 0, 4000)}),
                 ValidationError);
    EXPECT_THROW(orders.request(ctx, "po-1", "acme", "b1", at(EXPECTED_SECONDS),
                                {item("shirt", 1, 4000), item("shirt", 2, 4000)}),
                 ValidationError);
    EXPECT_THROW(orders.get("po-1"), NotFoundError);
}

TEST_F(ProcurementServiceTest, Receive_BeforeApproval_ShouldThrowInvalidTransition) {
    orders.request(ctx, "po-1", "acme", "b1", at(EXPECTED_SECONDS), {item("shirt", 10, 4000)});

    EXPECT_THROW(orders.receive(ctx, "po-1", receipt("grn-1", "bill-1", EXPECTED_SECONDS, {grn_line("shirt", 1)})),
                 InvalidStateTransitionError);
    EXPECT_EQ(ledger.record("shirt", "b1").on_hand, 20);
}

TEST_F(ProcurementServiceTest, Receive_MoreThanOutstanding_ShouldRejectWholeReceipt) {
    // Given an approved order for 10 shirts
    approved_order();

    // When a GRN brings 12
    EXPECT_THROW(orders.receive(ctx, "po-1", receipt("grn-1", "bill-1", EXPECTED_SECONDS, {grn_line("shirt", 12)})),
                 ValidationError);

    // Then nothing is received and stock is untouched
    auto state = orders.get("po-1");
    EXPECT_EQ(state.line("shirt")->received, 0);
    EXPECT_EQ(state.status, retail::PURCHASE_STATUS_APPROVED);
    EXPECT_EQ(ledger.record("shirt", "b1").on_hand, 20);
    EXPECT_EQ(logs.count("receipt_rejected"), 1);
}

TEST_F(ProcurementServiceTest, Receive_SplitLinesOverOutstanding_ShouldRejectWholeReceipt) {
    approved_order();

    EXPECT_THROW(orders.receive(ctx, "po-1", receipt("grn-1", "bill-1", EXPECTED_SECONDS,
                                                     {grn_line("shirt", 6), grn_line("shirt", 6)})),
                 ValidationError);
    EXPECT_EQ(ledger.record("shirt", "b1").on_hand, 20);
}

TEST_F(ProcurementServiceTest, Receive_UnorderedVariant_ShouldThrowValidation) {
    approved_order();

    EXPECT_THROW(orders.receive(ctx, "po-1", receipt("grn-1", "bill-1", EXPECTED_SECONDS, {grn_line("hat", 1)})),
                 ValidationError);
}

TEST_F(ProcurementServiceTest, Receive_PartialThenRest_ShouldCloseOrder) {
    // Given an approved order for 10 shirts and 5 caps
    approved_order();

    // When 6 shirts arrive
    auto partial = orders.receive(ctx, "po-1",
        receipt("grn-1", "bill-1", EXPECTED_SECONDS, {grn_line("shirt", 6)}));

    // Then the order is partially received and the branch is replenished
    EXPECT_EQ(partial.status, retail::PURCHASE_STATUS_PARTIALLY_RECEIVED);
    EXPECT_EQ(partial.line("shirt")->outstanding(), 4);
    EXPECT_EQ(ledger.record("shirt", "b1").on_hand, 26);

    // When the rest arrives
    auto closed = orders.receive(ctx, "po-1",
        receipt("grn-2", "bill-2", EXPECTED_SECONDS, {grn_line("shirt", 4), grn_line("cap", 5)}));

    // Then the order closes
    EXPECT_EQ(closed.status, retail::PURCHASE_STATUS_CLOSED);
    EXPECT_TRUE(closed.fully_received());
    EXPECT_EQ(ledger.record("shirt", "b1").on_hand, 30);
    EXPECT_EQ(ledger.record("cap", "b1").on_hand, 15);
    EXPECT_EQ(logs.count("goods_received"), 2);
}

TEST_F(ProcurementServiceTest, Receive_RepeatedGrnOrBill_ShouldThrowValidation) {
    approved_order();
    orders.receive(ctx, "po-1", receipt("grn-1", "bill-1", EXPECTED_SECONDS, {grn_line("shirt", 2)}));

    EXPECT_THROW(orders.receive(ctx, "po-1", receipt("grn-1", "bill-9", EXPECTED_SECONDS, {grn_line("shirt", 2)})),
                 ValidationError);
    EXPECT_THROW(orders.receive(ctx, "po-1", receipt("grn-9", "bill-1", EXPECTED_SECONDS, {grn_line("shirt", 2)})),
                 ValidationError);

    EXPECT_EQ(orders.get("po-1").line("shirt")->received, 2);
    EXPECT_EQ(ledger.record("shirt", "b1").on_hand, 22);
}

TEST_F(ProcurementServiceTest, Receive_AppendFails_ShouldReverseReplenishment) {
    // Given an approved order whose stream keeps conflicting once goods arrive
    ConflictingPurchaseStore conflicting(store);
    procurement::ProcurementService flaky_orders(conflicting, ledger, config);
    flaky_orders.request(ctx, "po-1", "acme", "b1", at(EXPECTED_SECONDS),
                         {item("shirt", 10, 4000), item("cap", 5, 2000)});
    flaky_orders.approve(ctx, "po-1");
    conflicting.arm();

    // When a GRN is received
    EXPECT_THROW(flaky_orders.receive(ctx, "po-1",
                     receipt("grn-1", "bill-1", EXPECTED_SECONDS, {grn_line("shirt", 6), grn_line("cap", 5)})),
                 ConcurrencyConflictError);

    // Then the replenishments are reversed and the order is unchanged
    EXPECT_EQ(conflicting.rejected(), config.max_conflict_retries);
    EXPECT_EQ(ledger.record("shirt", "b1").on_hand, 20);
    EXPECT_EQ(ledger.record("cap", "b1").on_hand, 10);
    EXPECT_EQ(logs.count("receipt_failed"), 1);
    EXPECT_EQ(logs.count("compensation_failed"), 0);

    auto state = orders.get("po-1");
    EXPECT_EQ(state.status, retail::PURCHASE_STATUS_APPROVED);
    EXPECT_EQ(state.line("shirt")->received, 0);
    EXPECT_FALSE(ratings.rating("acme").has_value());
}

TEST_F(ProcurementServiceTest, Close_PartiallyReceived_ShouldShortClose) {
    approved_order();
    orders.receive(ctx, "po-1", receipt("grn-1", "bill-1", EXPECTED_SECONDS, {grn_line("shirt", 6)}));

    auto state = orders.close(ctx, "po-1", "supplier out of stock");

    EXPECT_EQ(state.status, retail::PURCHASE_STATUS_CLOSED);
    EXPECT_EQ(state.line("shirt")->outstanding(), 4);
    EXPECT_THROW(orders.receive(ctx, "po-1", receipt("grn-2", "bill-2", EXPECTED_SECONDS, {grn_line("shirt", 4)})),
                 InvalidStateTransitionError);
}

TEST_F(ProcurementServiceTest, Close_ApprovedOrder_ShouldThrowInvalidTransition) {
    approved_order();
    EXPECT_THROW(orders.close(ctx, "po-1", "early"), InvalidStateTransitionError);
}

TEST_F(ProcurementServiceTest, Cancel_ShouldOnlyApplyBeforeReceipt) {
    approved_order("po-1");
    EXPECT_EQ(orders.cancel(ctx, "po-1", "not needed").status, retail::PURCHASE_STATUS_CANCELLED);

    approved_order("po-2");
    orders.receive(ctx, "po-2", receipt("grn-1", "bill-1", EXPECTED_SECONDS, {grn_line("cap", 1)}));
    EXPECT_THROW(orders.cancel(ctx, "po-2", "too late"), InvalidStateTransitionError);
}

TEST_F(ProcurementServiceTest, PurchaseOrders_ShouldListEveryOrder) {
    approved_order("po-1");
    approved_order("po-2");

    auto ids = orders.purchase_orders();

    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(orders.history("po-1").size(), 2u);
}

// =============================================================================
// VendorRatings Tests
// =============================================================================

TEST_F(ProcurementServiceTest, Ratings_ShouldScoreTimelinessAndFillRate) {
    // Given one late partial delivery and one on-time delivery completing the order
    orders.request(ctx, "po-1", "acme", "b1", at(EXPECTED_SECONDS), {item("shirt", 10, 4000)});
    orders.approve(ctx, "po-1");
    orders.receive(ctx, "po-1",
        receipt("grn-1", "bill-1", EXPECTED_SECONDS + 3 * DAY, {grn_line("shirt", 6)}));
    orders.receive(ctx, "po-1",
        receipt("grn-2", "bill-2", EXPECTED_SECONDS - DAY, {grn_line("shirt", 4)}));

    // When the supplier is rated
    auto rating = ratings.rating("acme");

    // Then both deliveries count
    ASSERT_TRUE(rating.has_value());
    EXPECT_EQ(rating->deliveries, 2);
    EXPECT_EQ(rating->on_time_deliveries, 1);
    EXPECT_EQ(rating->average_fill_rate_bp, 8000);
    EXPECT_DOUBLE_EQ(rating->average_days_late, 1.5);
    EXPECT_DOUBLE_EQ(rating->score, 65.0);
}

TEST_F(ProcurementServiceTest, Ratings_RejectedReceipt_ShouldNotCount) {
    approved_order();
    EXPECT_THROW(orders.receive(ctx, "po-1", receipt("grn-1", "bill-1", EXPECTED_SECONDS, {grn_line("shirt", 12)})),
                 ValidationError);

    EXPECT_FALSE(ratings.rating("acme").has_value());
}

TEST_F(ProcurementServiceTest, Ratings_ShouldBeKeptPerSupplier) {
    approved_order("po-1", "acme");
    approved_order("po-2", "globex");
    orders.receive(ctx, "po-1", receipt("grn-1", "bill-1", EXPECTED_SECONDS, {grn_line("shirt", 10)}));
    orders.receive(ctx, "po-2", receipt("grn-2", "bill-2", EXPECTED_SECONDS + 2 * DAY, {grn_line("cap", 5)}));

    auto all = ratings.all();

    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].supplier_id, "acme");
    EXPECT_EQ(all[0].on_time_deliveries, 1);
    EXPECT_EQ(all[1].supplier_id, "globex");
    EXPECT_DOUBLE_EQ(all[1].average_days_late, 2.0);
}
