#include <gtest/gtest.h>
#include <vector>
#include "alert_evaluator.hpp"
#include "ledgerline/event_store.hpp"
#include "stock_ledger.hpp"
#include "test_support.hpp"

using namespace ledgerline;
using ledgerline::testing_support::LogCapture;
using ledgerline::testing_support::test_config;

namespace {

class RecordingPublisher : public alerts::AlertPublisher {
public:
    void publish(const RequestContext&, const retail::LowStockAlert& alert) override {
        published.push_back(alert);
    }
    std::vector<retail::LowStockAlert> published;
};

} // anonymous namespace

class AlertEvaluatorTest : public ::testing::Test {
protected:
    AlertEvaluatorTest()
        : config(test_config()),
          ledger(store, config),
          evaluator(publisher, AlertBasis::OnHand),
          ctx(logs.context()) {
        ledger.add_observer(&evaluator);
    }

    LogCapture logs;
    InMemoryEventStore store;
    EngineConfig config;
    stock::StockLedger ledger;
    RecordingPublisher publisher;
    alerts::AlertEvaluator evaluator;
    RequestContext ctx;
};

TEST_F(AlertEvaluatorTest, ReserveThenDeduct_ShouldFireExactlyOnce) {
    // Given 50 on hand with a threshold of 10
    ledger.replenish(ctx, "V", "B", 50, "grn-1");
    evaluator.set_threshold("V", "B", 10);

    // When 45 are reserved
    auto reserved = ledger.reserve(ctx, "V", "B", 45, "so-1");

    // Then the record is not low
    EXPECT_EQ(reserved.reserved, 45);
    EXPECT_FALSE(evaluator.is_low(reserved));
    EXPECT_TRUE(publisher.published.empty());

    // When the 45 are deducted
    auto deducted = ledger.deduct(ctx, "so-1");

    // Then one low-stock alert fires
    EXPECT_EQ(deducted[0].on_hand, 5);
    EXPECT_EQ(deducted[0].reserved, 0);
    ASSERT_EQ(publisher.published.size(), 1u);
    EXPECT_TRUE(publisher.published[0].low());
    EXPECT_EQ(publisher.published[0].on_hand(), 5);
    EXPECT_EQ(publisher.published[0].threshold(), 10);
    EXPECT_FALSE(publisher.published[0].movement_id().empty());
}

TEST_F(AlertEvaluatorTest, StayingLow_ShouldNotRepeatAlert) {
    // Given a record that dropped below its threshold
    ledger.replenish(ctx, "V", "B", 20, "grn-1");
    evaluator.set_threshold("V", "B", 10);
    ledger.adjust(ctx, "V", "B", -15, "damaged");
    ASSERT_EQ(publisher.published.size(), 1u);

    // When it moves while remaining low
    ledger.replenish(ctx, "V", "B", 2, "grn-2");
    ledger.adjust(ctx, "V", "B", -1, "count");

    // Then no further alert fires
    EXPECT_EQ(publisher.published.size(), 1u);
}

TEST_F(AlertEvaluatorTest, Recovery_ShouldFireNotLowAlert) {
    // Given a record that dropped below its threshold
    ledger.replenish(ctx, "V", "B", 20, "grn-1");
    evaluator.set_threshold("V", "B", 10);
    ledger.adjust(ctx, "V", "B", -15, "damaged");

    // When it is replenished above the threshold
    ledger.replenish(ctx, "V", "B", 20, "grn-2");

    // Then a recovery alert follows the low alert
    ASSERT_EQ(publisher.published.size(), 2u);
    EXPECT_TRUE(publisher.published[0].low());
    EXPECT_FALSE(publisher.published[1].low());
}

TEST_F(AlertEvaluatorTest, NoThreshold_ShouldNeverAlert) {
    ledger.replenish(ctx, "V", "B", 1, "grn-1");
    EXPECT_TRUE(publisher.published.empty());
    EXPECT_FALSE(evaluator.threshold("V", "B").has_value());
}

TEST_F(AlertEvaluatorTest, AvailableBasis_ShouldCountReservations) {
    // Given a record with 50 on hand and 45 reserved
    stock::StockRecord record;
    record.on_hand = 50;
    record.reserved = 45;

    // Then it is low against available but not against on_hand
    EXPECT_TRUE(alerts::AlertEvaluator::is_low(record, 10, AlertBasis::Available));
    EXPECT_FALSE(alerts::AlertEvaluator::is_low(record, 10, AlertBasis::OnHand));
}

TEST_F(AlertEvaluatorTest, CurrentAlerts_ShouldListLowRecords) {
    // Given one low and one healthy record
    evaluator.load_thresholds({{"V", "B", 10}, {"W", "B", 10}});
    ledger.replenish(ctx, "V", "B", 3, "grn-1");
    ledger.replenish(ctx, "W", "B", 30, "grn-1");

    // When I list current alerts
    auto current = evaluator.current_alerts(ledger);

    // Then only V is listed
    ASSERT_EQ(current.size(), 1u);
    EXPECT_EQ(current[0].variant_id(), "V");
}

TEST_F(AlertEvaluatorTest, SetThreshold_Negative_ShouldThrowValidation) {
    EXPECT_THROW(evaluator.set_threshold("V", "B", -1), ValidationError);
}

TEST_F(AlertEvaluatorTest, LoggingPublisher_ShouldLogLowStock) {
    alerts::LoggingAlertPublisher logging;
    retail::LowStockAlert alert;
    alert.set_low(true);
    logging.publish(ctx, alert);
    EXPECT_EQ(logs.count("low_stock"), 1);
}
