#include <gtest/gtest.h>
#include <chrono>
#include "ledgerline/errors.hpp"
#include "ledgerline/retry.hpp"
#include "test_support.hpp"

using namespace ledgerline;
using ledgerline::testing_support::LogCapture;

// =============================================================================
// retry_on_conflict Tests
// =============================================================================

class RetryTest : public ::testing::Test {
protected:
    RetryTest() : ctx(logs.context()) {}

    LogCapture logs;
    RequestContext ctx;
};

TEST_F(RetryTest, BackoffFor_ShouldDoubleThenCap) {
    RetryPolicy policy{100, std::chrono::milliseconds(2)};

    EXPECT_EQ(backoff_for(policy, 1), std::chrono::milliseconds(2));
    EXPECT_EQ(backoff_for(policy, 3), std::chrono::milliseconds(8));
    EXPECT_EQ(backoff_for(policy, MAX_BACKOFF_DOUBLINGS + 1), std::chrono::milliseconds(2048));
    EXPECT_EQ(backoff_for(policy, 64), std::chrono::milliseconds(2048));
}

TEST_F(RetryTest, RetryOnConflict_ManyConflicts_ShouldEventuallySucceed) {
    // Given more conflicts than the backoff has doublings
    RetryPolicy policy{50, std::chrono::milliseconds(0)};
    int calls = 0;

    // When every attempt but the last conflicts
    int result = retry_on_conflict(policy, ctx, "test", [&]() {
        if (++calls < 45) throw ConcurrencyConflictError("stale", 1, 2);
        return 7;
    });

    // Then the round trip is retried until it lands
    EXPECT_EQ(result, 7);
    EXPECT_EQ(calls, 45);
    EXPECT_EQ(logs.count("conflict_retry"), 44);
}

TEST_F(RetryTest, RetryOnConflict_Exhausted_ShouldRethrow) {
    RetryPolicy policy{3, std::chrono::milliseconds(0)};
    int calls = 0;

    EXPECT_THROW(retry_on_conflict(policy, ctx, "test", [&]() -> int {
        ++calls;
        throw ConcurrencyConflictError("stale", 1, 2);
    }), ConcurrencyConflictError);

    EXPECT_EQ(calls, 3);
    EXPECT_EQ(logs.count("conflict_retries_exhausted"), 1);
}

TEST_F(RetryTest, RetryOnConflict_OtherError_ShouldNotRetry) {
    RetryPolicy policy{3, std::chrono::milliseconds(0)};
    int calls = 0;

    EXPECT_THROW(retry_on_conflict(policy, ctx, "test", [&]() -> int {
        ++calls;
        throw ValidationError("bad");
    }), ValidationError);

    EXPECT_EQ(calls, 1);
}
