#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "ledgerline/config.hpp"
#include "ledgerline/context.hpp"
#include "ledgerline/event_store.hpp"
#include "ledgerline/key_locks.hpp"
#include "ledgerline/retry.hpp"
#include "stock_logic.hpp"

namespace stock {

/**
 * Notified synchronously after every committed stock movement.
 */
class StockObserver {
public:
    virtual ~StockObserver() = default;

    virtual void on_stock_changed(const ledgerline::RequestContext& ctx,
                                  const StockRecord& before,
                                  const StockRecord& after,
                                  const retail::StockMovement& movement) = 0;
};

struct ExpiredReservation {
    std::string reference;
    std::string variant_id;
    std::string branch_id;
    int64_t quantity = 0;
    google::protobuf::Timestamp expires_at;
};

/**
 * Authoritative on-hand and reserved quantities per (variant, branch).
 *
 * Each record is an event stream of StockMovements. Every mutation is one
 * load-fold-validate-append round trip conditioned on the record version,
 * retried on conflict. Operations touching several records (release and
 * deduct of a multi-record reference, transfer) compensate committed
 * movements when a later record fails.
 */
class StockLedger {
public:
    StockLedger(ledgerline::EventStore& store, const ledgerline::EngineConfig& config);

    /**
     * Register an observer. Call during setup, before concurrent use.
     */
    void add_observer(StockObserver* observer);

    /**
     * Hold quantity for reference. A reference already active or already
     * consumed on this record is a no-op returning the current record.
     *
     * @throws InsufficientStockError if available < quantity
     */
    StockRecord reserve(const ledgerline::RequestContext& ctx,
                        const std::string& variant_id, const std::string& branch_id,
                        int64_t quantity, const std::string& reference,
                        const google::protobuf::Timestamp& expires_at = {});

    /**
     * Release every active reservation held under reference.
     * @throws NotFoundError if none is active
     */
    std::vector<StockRecord> release(const ledgerline::RequestContext& ctx, const std::string& reference);

    /**
     * Convert every active reservation under reference into a permanent decrement.
     * @throws NotFoundError if none is active
     */
    std::vector<StockRecord> deduct(const ledgerline::RequestContext& ctx, const std::string& reference);

    /**
     * Re-hold a released reference. Compensation only.
     */
    StockRecord restore(const ledgerline::RequestContext& ctx,
                        const std::string& variant_id, const std::string& branch_id,
                        const std::string& reference, int64_t quantity,
                        const google::protobuf::Timestamp& expires_at = {});

    /**
     * Reverse a deduction. Compensation only.
     */
    StockRecord reinstate(const ledgerline::RequestContext& ctx,
                          const std::string& variant_id, const std::string& branch_id,
                          const std::string& reference, int64_t quantity,
                          const google::protobuf::Timestamp& expires_at = {});

    StockRecord replenish(const ledgerline::RequestContext& ctx,
                          const std::string& variant_id, const std::string& branch_id,
                          int64_t quantity, const std::string& reference);

    /**
     * @throws InsufficientStockError if on_hand + delta < reserved
     */
    StockRecord adjust(const ledgerline::RequestContext& ctx,
                       const std::string& variant_id, const std::string& branch_id,
                       int64_t delta, const std::string& reason);

    /**
     * Move stock between branches as a pair of adjustments.
     * @return (source, destination) after the transfer
     */
    std::pair<StockRecord, StockRecord> transfer(const ledgerline::RequestContext& ctx,
                                                 const std::string& variant_id,
                                                 const std::string& from_branch_id,
                                                 const std::string& to_branch_id,
                                                 int64_t quantity, const std::string& reference);

    /**
     * Apply a movement committed by another replica. Keyed by movement id:
     * redelivery is a no-op.
     * @return true if the movement was applied now
     */
    bool apply_remote(const ledgerline::RequestContext& ctx, const retail::StockMovement& movement);

    StockRecord record(const std::string& variant_id, const std::string& branch_id) const;

    std::vector<StockRecord> records() const;

    /**
     * Branch journal after a sequence, in branch-local commit order. limit 0 = all.
     */
    std::vector<retail::StockMovement> movements(const std::string& branch_id,
                                                 uint64_t after_sequence, uint32_t limit = 0) const;

    std::vector<ExpiredReservation> expired_reservations(const google::protobuf::Timestamp& now) const;

    /**
     * Records that ever held a reservation under reference.
     */
    std::vector<std::pair<std::string, std::string>> reservation_holders(const std::string& reference) const;

private:
    using Decision = std::function<std::optional<retail::StockMovement>(const StockRecord&)>;

    struct Outcome {
        StockRecord before;
        StockRecord after;
        std::optional<retail::StockMovement> movement;
    };

    Outcome commit(const ledgerline::RequestContext& ctx, const std::string& variant_id,
                   const std::string& branch_id, const Decision& decide);

    void after_commit(const ledgerline::RequestContext& ctx, const Outcome& outcome);
    uint64_t journal(const ledgerline::RequestContext& ctx, retail::StockMovement movement);
    void index_reservation(const ledgerline::RequestContext& ctx, const std::string& reference,
                           const std::string& variant_id, const std::string& branch_id);
    void compensate(const ledgerline::RequestContext& ctx, const std::string& operation,
                    const std::vector<std::function<void()>>& undo);

    ledgerline::EventStore& store_;
    ledgerline::RetryPolicy policy_;
    uint32_t snapshot_interval_;
    // Held from the record append through the journal append so the branch
    // journal lists each record's movements in commit order.
    ledgerline::KeyLocks commit_locks_;
    ledgerline::KeyLocks journal_locks_;
    std::mutex observers_mutex_;
    std::vector<StockObserver*> observers_;
};

}  // namespace stock
