#include <gtest/gtest.h>
#include "ledgerline/errors.hpp"
#include "ledgerline/event_store.hpp"
#include "ledgerline/helpers.hpp"
#include "retail/stock.pb.h"

using namespace ledgerline;

// =============================================================================
// InMemoryEventStore Tests
// =============================================================================

class EventStoreTest : public ::testing::Test {
protected:
    google::protobuf::Any movement(int64_t delta) {
        retail::StockMovement m;
        m.set_kind(retail::MOVEMENT_KIND_REPLENISH);
        m.set_delta(delta);
        return helpers::pack_any(m);
    }

    InMemoryEventStore store;
};

TEST_F(EventStoreTest, Append_EmptyStream_ShouldNumberPagesFromOne) {
    // Given an empty stream
    // When I append two events at version 0
    auto version = store.append("stock", "v1@b1", 0, {movement(5), movement(3)});

    // Then the stream is at version 2 with consecutive sequences
    EXPECT_EQ(version, 2u);
    auto book = store.load("stock", "v1@b1");
    ASSERT_EQ(book.pages_size(), 2);
    EXPECT_EQ(book.pages(0).sequence(), 1u);
    EXPECT_EQ(book.pages(1).sequence(), 2u);
    EXPECT_EQ(book.cover().domain(), "stock");
    EXPECT_EQ(book.cover().root(), "v1@b1");
}

TEST_F(EventStoreTest, Append_StaleVersion_ShouldThrowConflict) {
    // Given a stream at version 1
    store.append("stock", "v1@b1", 0, {movement(5)});

    // When I append expecting version 0
    // Then a ConcurrencyConflictError reports both versions
    try {
        store.append("stock", "v1@b1", 0, {movement(1)});
        FAIL() << "expected ConcurrencyConflictError";
    } catch (const ConcurrencyConflictError& e) {
        EXPECT_EQ(e.expected_version(), 0u);
        EXPECT_EQ(e.actual_version(), 1u);
        EXPECT_TRUE(e.is_retryable());
        EXPECT_EQ(e.status_code(), grpc::StatusCode::ABORTED);
    }
    EXPECT_EQ(store.version("stock", "v1@b1"), 1u);
}

TEST_F(EventStoreTest, Load_AfterSnapshot_ShouldReturnOnlyLaterPages) {
    // Given three events and a snapshot at sequence 2
    store.append("stock", "v1@b1", 0, {movement(1), movement(2), movement(3)});
    retail::StockRecordSnapshot snap;
    snap.set_on_hand(3);
    store.snapshot("stock", "v1@b1", 2, helpers::pack_any(snap));

    // When I load the stream
    auto book = store.load("stock", "v1@b1");

    // Then the snapshot is returned with the one page after it
    ASSERT_TRUE(book.has_snapshot());
    EXPECT_EQ(book.snapshot().sequence(), 2u);
    ASSERT_EQ(book.pages_size(), 1);
    EXPECT_EQ(book.pages(0).sequence(), 3u);
    EXPECT_EQ(helpers::stream_version(book), 3u);

    // And read() still returns the full history
    EXPECT_EQ(store.read("stock", "v1@b1", 0).size(), 3u);
}

TEST_F(EventStoreTest, Snapshot_AheadOfStream_ShouldThrowValidation) {
    store.append("stock", "v1@b1", 0, {movement(1)});
    EXPECT_THROW(store.snapshot("stock", "v1@b1", 5, movement(0)), ValidationError);
}

TEST_F(EventStoreTest, Read_WithLimit_ShouldPageThroughHistory) {
    // Given five events
    store.append("journal", "b1", 0, {movement(1), movement(2), movement(3), movement(4), movement(5)});

    // When I read two after sequence 2
    auto pages = store.read("journal", "b1", 2, 2);

    // Then sequences 3 and 4 come back
    ASSERT_EQ(pages.size(), 2u);
    EXPECT_EQ(pages[0].sequence(), 3u);
    EXPECT_EQ(pages[1].sequence(), 4u);
}

TEST_F(EventStoreTest, Roots_ShouldListStreamsWithEvents) {
    store.append("stock", "a@b1", 0, {movement(1)});
    store.append("stock", "b@b1", 0, {movement(1)});
    store.append("document", "d1", 0, {movement(1)});

    auto roots = store.roots("stock");
    EXPECT_EQ(roots.size(), 2u);
    EXPECT_TRUE(store.roots("unknown").empty());
}

TEST_F(EventStoreTest, Version_UnknownStream_ShouldBeZero) {
    EXPECT_EQ(store.version("stock", "missing"), 0u);
    auto book = store.load("stock", "missing");
    EXPECT_EQ(book.pages_size(), 0);
    EXPECT_EQ(helpers::stream_version(book), 0u);
}
