#pragma once

#include <algorithm>
#include <chrono>
#include <string>
#include <thread>
#include "context.hpp"
#include "errors.hpp"

namespace ledgerline {

struct RetryPolicy {
    int max_attempts = 5;
    std::chrono::milliseconds initial_backoff{2};
};

// Backoff stops doubling after this many retries.
constexpr int MAX_BACKOFF_DOUBLINGS = 10;

/**
 * Delay before retry number `attempt` (1-based): initial_backoff doubled
 * per earlier attempt, capped at MAX_BACKOFF_DOUBLINGS doublings.
 */
inline std::chrono::milliseconds backoff_for(const RetryPolicy& policy, int attempt) {
    int doublings = std::min(std::max(attempt - 1, 0), MAX_BACKOFF_DOUBLINGS);
    return policy.initial_backoff * (int64_t{1} << doublings);
}

/**
 * Run fn, retrying on ConcurrencyConflictError with exponential backoff.
 * fn must perform a complete load-validate-append round trip so that each
 * attempt re-reads the current version. Other errors propagate immediately.
 */
template<typename Fn>
auto retry_on_conflict(const RetryPolicy& policy, const RequestContext& ctx,
                       const std::string& domain, Fn&& fn) -> decltype(fn()) {
    for (int attempt = 1;; ++attempt) {
        try {
            return fn();
        } catch (const ConcurrencyConflictError& e) {
            if (attempt >= policy.max_attempts) {
                ctx.log_error(domain, "conflict_retries_exhausted",
                    {{"attempts", attempt}, {"error", e.what()}});
                throw;
            }
            ctx.log_warn(domain, "conflict_retry",
                {{"attempt", attempt}, {"expected_version", e.expected_version()},
                 {"actual_version", e.actual_version()}});
            std::this_thread::sleep_for(backoff_for(policy, attempt));
        }
    }
}

} // namespace ledgerline
