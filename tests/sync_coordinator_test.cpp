#include <gtest/gtest.h>
#include <algorithm>
#include "ledgerline/errors.hpp"
#include "ledgerline/event_store.hpp"
#include "stock_ledger.hpp"
#include "sync_channel.hpp"
#include "sync_coordinator.hpp"
#include "test_support.hpp"

using namespace ledgerline;
using ledgerline::testing_support::LogCapture;
using ledgerline::testing_support::principal;
using ledgerline::testing_support::test_config;

namespace {

EngineConfig replica_config(const std::string& node_id, const std::string& branch) {
    auto config = test_config();
    config.node_id = node_id;
    config.local_branches = {branch};
    return config;
}

retail::MovementDelivery delivery(const retail::StockMovement& movement, const std::string& role) {
    retail::MovementDelivery delivery;
    *delivery.mutable_principal() = principal("node-" + role, role);
    delivery.set_correlation_id("corr-sync");
    *delivery.mutable_movement() = movement;
    return delivery;
}

} // anonymous namespace

// =============================================================================
// Two replicas: north owns branch N, south owns branch S
// =============================================================================

class SyncCoordinatorTest : public ::testing::Test {
protected:
    SyncCoordinatorTest()
        : north_config(replica_config("north", "N")),
          south_config(replica_config("south", "S")),
          north_ledger(north_store, north_config),
          south_ledger(south_store, south_config),
          north(north_ledger, north_store, channel, north_config, {"south"}),
          south(south_ledger, south_store, channel, south_config, {"north"}),
          ctx(logs.context()) {}

    LogCapture logs;
    branch_sync::InProcessSyncChannel channel;
    InMemoryEventStore north_store;
    InMemoryEventStore south_store;
    EngineConfig north_config;
    EngineConfig south_config;
    stock::StockLedger north_ledger;
    stock::StockLedger south_ledger;
    branch_sync::SyncCoordinator north;
    branch_sync::SyncCoordinator south;
    RequestContext ctx;
};

TEST_F(SyncCoordinatorTest, PublishAndReceive_ShouldReplicateMovements) {
    // Given two movements at north's branch
    north_ledger.replenish(ctx, "v1", "N", 10, "grn-1");
    north_ledger.reserve(ctx, "v1", "N", 4, "so-1");

    // When north publishes and south consumes its queue
    EXPECT_EQ(north.publish_pending(ctx), 2u);
    size_t applied = 0;
    for (const auto& movement : channel.drain("south")) {
        applied += south.receive(ctx, movement);
    }

    // Then south's view of branch N matches north's
    EXPECT_EQ(applied, 2u);
    auto replica = south_ledger.record("v1", "N");
    EXPECT_EQ(replica.on_hand, 10);
    EXPECT_EQ(replica.reserved, 4);
    EXPECT_EQ(south.applied_through("N"), 2u);
    EXPECT_EQ(north.published_through("N"), 2u);
}

TEST_F(SyncCoordinatorTest, Redelivery_ShouldBeIgnored) {
    // Given a movement already applied at south
    north_ledger.replenish(ctx, "v1", "N", 10, "grn-1");
    north.publish_pending(ctx);
    auto queued = channel.drain("south");
    ASSERT_EQ(queued.size(), 1u);
    south.receive(ctx, queued[0]);

    // When it is delivered again
    auto applied = south.receive(ctx, queued[0]);

    // Then nothing changes
    EXPECT_EQ(applied, 0u);
    EXPECT_EQ(south_ledger.record("v1", "N").on_hand, 10);
    EXPECT_EQ(logs.count("duplicate_dropped"), 1);
}

TEST_F(SyncCoordinatorTest, OutOfOrderDelivery_ShouldBufferUntilGapFills) {
    // Given three movements at N
    north_ledger.replenish(ctx, "v1", "N", 10, "grn-1");
    north_ledger.adjust(ctx, "v1", "N", -2, "damaged");
    north_ledger.reserve(ctx, "v1", "N", 3, "so-1");
    north.publish_pending(ctx);
    auto queued = channel.drain("south");
    ASSERT_EQ(queued.size(), 3u);

    // When they arrive as 3, 2, 1
    EXPECT_EQ(south.receive(ctx, queued[2]), 0u);
    EXPECT_EQ(south.receive(ctx, queued[1]), 0u);
    EXPECT_EQ(south.buffered("N"), 2u);
    EXPECT_EQ(south_ledger.record("v1", "N").version, 0u);

    // Then the first one releases the whole run in order
    EXPECT_EQ(south.receive(ctx, queued[0]), 3u);
    EXPECT_EQ(south.buffered("N"), 0u);
    auto replica = south_ledger.record("v1", "N");
    EXPECT_EQ(replica.on_hand, 8);
    EXPECT_EQ(replica.reserved, 3);
}

TEST_F(SyncCoordinatorTest, UnreachablePeer_ShouldNotBlockLocalWrites) {
    // Given south is unreachable
    channel.set_reachable("south", false);

    // When north commits and tries to publish
    auto record = north_ledger.replenish(ctx, "v1", "N", 10, "grn-1");
    EXPECT_EQ(north.publish_pending(ctx), 0u);

    // Then the local write succeeded and nothing was published
    EXPECT_EQ(record.on_hand, 10);
    EXPECT_EQ(north.published_through("N"), 0u);

    // When south comes back
    channel.set_reachable("south", true);

    // Then the pending movement is delivered
    EXPECT_EQ(north.publish_pending(ctx), 1u);
    EXPECT_EQ(channel.pending("south"), 1u);
}

TEST_F(SyncCoordinatorTest, Cursors_ShouldSurviveRestart) {
    // Given north published two movements
    north_ledger.replenish(ctx, "v1", "N", 10, "grn-1");
    north_ledger.replenish(ctx, "v1", "N", 5, "grn-2");
    north.publish_pending(ctx);
    channel.drain("south");

    // When a new coordinator starts over the same store
    branch_sync::SyncCoordinator restarted(north_ledger, north_store, channel, north_config, {"south"});

    // Then it resumes after the persisted cursor
    EXPECT_EQ(restarted.published_through("N"), 2u);
    EXPECT_EQ(restarted.publish_pending(ctx), 0u);
    north_ledger.replenish(ctx, "v1", "N", 1, "grn-3");
    EXPECT_EQ(restarted.publish_pending(ctx), 1u);
}

TEST_F(SyncCoordinatorTest, OwnBranchMovement_ShouldBeIgnored) {
    north_ledger.replenish(ctx, "v1", "N", 10, "grn-1");
    auto journal = north_ledger.movements("N", 0);
    ASSERT_EQ(journal.size(), 1u);

    EXPECT_EQ(north.receive(ctx, journal[0]), 0u);
    EXPECT_EQ(north_ledger.record("v1", "N").on_hand, 10);
}

TEST_F(SyncCoordinatorTest, ConcurrentBranches_ShouldMergeAdditively) {
    // Given both replicas write to their own branch
    north_ledger.replenish(ctx, "v1", "N", 7, "grn-n");
    south_ledger.replenish(ctx, "v1", "S", 9, "grn-s");

    // When both publish and consume
    north.publish_pending(ctx);
    south.publish_pending(ctx);
    for (const auto& m : channel.drain("south")) south.receive(ctx, m);
    for (const auto& m : channel.drain("north")) north.receive(ctx, m);

    // Then each replica sees both branches
    EXPECT_EQ(north_ledger.record("v1", "S").on_hand, 9);
    EXPECT_EQ(south_ledger.record("v1", "N").on_hand, 7);
}

TEST_F(SyncCoordinatorTest, Accept_FromReplica_ShouldApplyMovement) {
    // Given a movement queued for south
    north_ledger.replenish(ctx, "v1", "N", 10, "grn-1");
    north.publish_pending(ctx);
    auto queued = channel.drain("south");
    ASSERT_EQ(queued.size(), 1u);

    // When a replica delivers it over the network
    auto applied = south.accept(logs.logger(), delivery(queued[0], branch_sync::REPLICA_ROLE));

    // Then south applies it
    EXPECT_EQ(applied, 1u);
    EXPECT_EQ(south_ledger.record("v1", "N").on_hand, 10);
    EXPECT_EQ(south.applied_through("N"), 1u);
}

TEST_F(SyncCoordinatorTest, Accept_WithoutPrincipal_ShouldThrowUnauthenticated) {
    north_ledger.replenish(ctx, "v1", "N", 10, "grn-1");
    north.publish_pending(ctx);
    auto queued = channel.drain("south");
    ASSERT_EQ(queued.size(), 1u);

    retail::MovementDelivery anonymous;
    *anonymous.mutable_movement() = queued[0];

    EXPECT_THROW(south.accept(logs.logger(), anonymous), UnauthenticatedError);
    EXPECT_EQ(south.applied_through("N"), 0u);
    EXPECT_EQ(logs.count("delivery_rejected"), 1);
}

TEST_F(SyncCoordinatorTest, Accept_FromCashier_ShouldThrowPermissionDenied) {
    // Given a movement a cashier tries to inject
    north_ledger.replenish(ctx, "v1", "N", 10, "grn-1");
    north.publish_pending(ctx);
    auto queued = channel.drain("south");
    ASSERT_EQ(queued.size(), 1u);

    // When it is delivered
    EXPECT_THROW(south.accept(logs.logger(), delivery(queued[0], "cashier")), PermissionDeniedError);

    // Then south's ledger is untouched
    EXPECT_EQ(south_ledger.record("v1", "N").on_hand, 0);
    EXPECT_EQ(south.applied_through("N"), 0u);
}
