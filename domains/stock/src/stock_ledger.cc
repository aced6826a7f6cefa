#include "stock_ledger.hpp"
#include "ledgerline/errors.hpp"
#include "ledgerline/helpers.hpp"
#include "ledgerline/validation.hpp"

#include <algorithm>

namespace stock {

using namespace ledgerline;

namespace {

using OptionalMovement = std::optional<retail::StockMovement>;

nlohmann::json describe(const StockRecord& record) {
    return {{"variant_id", record.variant_id}, {"branch_id", record.branch_id},
            {"on_hand", record.on_hand}, {"reserved", record.reserved},
            {"version", record.version}};
}

} // anonymous namespace

StockLedger::StockLedger(EventStore& store, const EngineConfig& config)
    : store_(store),
      policy_(config.retry_policy()),
      snapshot_interval_(config.snapshot_interval) {}

void StockLedger::add_observer(StockObserver* observer) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.push_back(observer);
}

StockRecord StockLedger::record(const std::string& variant_id, const std::string& branch_id) const {
    auto book = store_.load(STOCK_DOMAIN, record_key(variant_id, branch_id));
    return StockLogic::rebuild_state(book, variant_id, branch_id);
}

std::vector<StockRecord> StockLedger::records() const {
    std::vector<StockRecord> result;
    for (const auto& root : store_.roots(STOCK_DOMAIN)) {
        result.push_back(StockLogic::rebuild_state(store_.load(STOCK_DOMAIN, root), "", ""));
    }
    return result;
}

StockLedger::Outcome StockLedger::commit(const RequestContext& ctx, const std::string& variant_id,
                                         const std::string& branch_id, const Decision& decide) {
    validation::require_not_empty(variant_id, "variant_id");
    validation::require_not_empty(branch_id, "branch_id");
    const auto key = record_key(variant_id, branch_id);

    std::unique_lock<std::mutex> order_lock(commit_locks_.for_key(key), std::defer_lock);
    auto outcome = retry_on_conflict(policy_, ctx, STOCK_DOMAIN, [&]() {
        Outcome result;
        result.before = record(variant_id, branch_id);
        result.movement = decide(result.before);
        if (!result.movement) {
            result.after = result.before;
            return result;
        }

        auto& movement = *result.movement;
        if (movement.id().empty()) movement.set_id(helpers::new_id());
        movement.set_variant_id(variant_id);
        movement.set_branch_id(branch_id);
        if (!movement.has_timestamp()) *movement.mutable_timestamp() = helpers::now();
        if (!movement.has_audit()) *movement.mutable_audit() = ctx.audit();

        result.after = StockLogic::apply(result.before, movement);
        order_lock.lock();
        try {
            result.after.version = store_.append(STOCK_DOMAIN, key, result.before.version,
                                                 {helpers::pack_any(movement)});
        } catch (const ConcurrencyConflictError&) {
            order_lock.unlock();
            throw;
        }
        return result;
    });

    if (outcome.movement) {
        if (!outcome.movement->remote()) {
            outcome.movement->set_sequence(journal(ctx, *outcome.movement));
        }
        order_lock.unlock();
        after_commit(ctx, outcome);
    }
    return outcome;
}

uint64_t StockLedger::journal(const RequestContext& ctx, retail::StockMovement movement) {
    const auto branch = movement.branch_id();
    std::lock_guard<std::mutex> lock(journal_locks_.for_key(branch));
    try {
        return retry_on_conflict(policy_, ctx, JOURNAL_DOMAIN, [&]() -> uint64_t {
            uint32_t version = store_.version(JOURNAL_DOMAIN, branch);
            movement.set_sequence(version + 1);
            return store_.append(JOURNAL_DOMAIN, branch, version, {helpers::pack_any(movement)});
        });
    } catch (const ConcurrencyConflictError& e) {
        ctx.log_error(JOURNAL_DOMAIN, "journal_append_failed",
            {{"movement_id", movement.id()}, {"branch_id", branch}, {"error", e.what()}});
        throw;
    }
}

void StockLedger::after_commit(const RequestContext& ctx, const Outcome& outcome) {
    const auto& movement = *outcome.movement;
    const auto& after = outcome.after;

    if (after.version % snapshot_interval_ == 0) {
        store_.snapshot(STOCK_DOMAIN, record_key(after.variant_id, after.branch_id), after.version,
                        helpers::pack_any(StockLogic::to_snapshot(after)));
    }

    auto fields = describe(after);
    fields["movement_id"] = movement.id();
    fields["kind"] = retail::MovementKind_Name(movement.kind());
    fields["delta"] = movement.delta();
    fields["reference"] = movement.reference();
    fields["sequence"] = movement.sequence();
    fields["remote"] = movement.remote();
    ctx.log_info(STOCK_DOMAIN, "movement_committed", fields);

    std::vector<StockObserver*> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        observers = observers_;
    }
    for (auto* observer : observers) {
        try {
            observer->on_stock_changed(ctx, outcome.before, after, movement);
        } catch (const std::exception& e) {
            // The movement is committed; an observer failure does not undo it.
            ctx.log_error(STOCK_DOMAIN, "observer_failed",
                {{"movement_id", movement.id()}, {"error", e.what()}});
        }
    }
}

void StockLedger::index_reservation(const RequestContext& ctx, const std::string& reference,
                                    const std::string& variant_id, const std::string& branch_id) {
    retry_on_conflict(policy_, ctx, RESERVATION_DOMAIN, [&]() {
        auto book = store_.load(RESERVATION_DOMAIN, reference);
        for (const auto& page : book.pages()) {
            retail::ReservationIndexed entry;
            if (page.event().UnpackTo(&entry) &&
                entry.variant_id() == variant_id && entry.branch_id() == branch_id) {
                return;
            }
        }
        retail::ReservationIndexed entry;
        entry.set_reference(reference);
        entry.set_variant_id(variant_id);
        entry.set_branch_id(branch_id);
        store_.append(RESERVATION_DOMAIN, reference, helpers::stream_version(book),
                      {helpers::pack_any(entry)});
    });
}

std::vector<std::pair<std::string, std::string>> StockLedger::reservation_holders(
    const std::string& reference) const {
    std::vector<std::pair<std::string, std::string>> holders;
    for (const auto& page : store_.read(RESERVATION_DOMAIN, reference, 0)) {
        retail::ReservationIndexed entry;
        if (!page.event().UnpackTo(&entry)) continue;
        std::pair<std::string, std::string> holder{entry.variant_id(), entry.branch_id()};
        if (std::find(holders.begin(), holders.end(), holder) == holders.end()) {
            holders.push_back(std::move(holder));
        }
    }
    return holders;
}

void StockLedger::compensate(const RequestContext& ctx, const std::string& operation,
                             const std::vector<std::function<void()>>& undo) {
    if (undo.empty()) return;
    ctx.log_warn(STOCK_DOMAIN, "compensating", {{"operation", operation}, {"steps", undo.size()}});
    for (auto it = undo.rbegin(); it != undo.rend(); ++it) {
        try {
            (*it)();
        } catch (const LedgerError& e) {
            ctx.log_error(STOCK_DOMAIN, "compensation_failed",
                {{"operation", operation}, {"error", e.what()}});
        }
    }
}

StockRecord StockLedger::reserve(const RequestContext& ctx,
                                 const std::string& variant_id, const std::string& branch_id,
                                 int64_t quantity, const std::string& reference,
                                 const google::protobuf::Timestamp& expires_at) {
    validation::require_positive(quantity, "quantity");
    validation::require_not_empty(reference, "reference");
    validation::require_not_empty(variant_id, "variant_id");
    validation::require_not_empty(branch_id, "branch_id");

    index_reservation(ctx, reference, variant_id, branch_id);
    try {
        auto outcome = commit(ctx, variant_id, branch_id, [&](const StockRecord& state) -> OptionalMovement {
            if (state.holds(reference) || state.consumed(reference)) return std::nullopt;
            return StockLogic::handle_reserve(state, quantity, reference, expires_at);
        });
        if (!outcome.movement) {
            ctx.log_info(STOCK_DOMAIN, "reserve_replayed", {{"reference", reference}});
        }
        return outcome.after;
    } catch (const InsufficientStockError& e) {
        ctx.log_warn(STOCK_DOMAIN, "reserve_rejected",
            {{"reference", reference}, {"variant_id", variant_id}, {"branch_id", branch_id},
             {"requested", e.requested()}, {"available", e.available()}});
        throw;
    }
}

std::vector<StockRecord> StockLedger::release(const RequestContext& ctx, const std::string& reference) {
    validation::require_not_empty(reference, "reference");

    std::vector<StockRecord> released;
    std::vector<std::function<void()>> undo;
    try {
        for (const auto& holder : reservation_holders(reference)) {
            const std::string variant_id = holder.first;
            const std::string branch_id = holder.second;
            auto outcome = commit(ctx, variant_id, branch_id, [&](const StockRecord& state) -> OptionalMovement {
                if (!state.holds(reference)) return std::nullopt;
                return StockLogic::handle_release(state, reference);
            });
            if (!outcome.movement) continue;

            int64_t quantity = -outcome.movement->delta();
            auto expires_at = outcome.before.reservations.at(reference).expires_at;
            undo.push_back([this, &ctx, variant_id, branch_id, reference, quantity, expires_at]() {
                restore(ctx, variant_id, branch_id, reference, quantity, expires_at);
            });
            released.push_back(outcome.after);
        }
    } catch (const LedgerError&) {
        compensate(ctx, "release", undo);
        throw;
    }

    if (released.empty()) {
        throw NotFoundError("No active reservation for reference " + reference);
    }
    return released;
}

std::vector<StockRecord> StockLedger::deduct(const RequestContext& ctx, const std::string& reference) {
    validation::require_not_empty(reference, "reference");

    std::vector<StockRecord> deducted;
    std::vector<std::function<void()>> undo;
    try {
        for (const auto& holder : reservation_holders(reference)) {
            const std::string variant_id = holder.first;
            const std::string branch_id = holder.second;
            auto outcome = commit(ctx, variant_id, branch_id, [&](const StockRecord& state) -> OptionalMovement {
                if (!state.holds(reference)) return std::nullopt;
                return StockLogic::handle_deduct(state, reference);
            });
            if (!outcome.movement) continue;

            int64_t quantity = -outcome.movement->delta();
            auto expires_at = outcome.before.reservations.at(reference).expires_at;
            undo.push_back([this, &ctx, variant_id, branch_id, reference, quantity, expires_at]() {
                reinstate(ctx, variant_id, branch_id, reference, quantity, expires_at);
            });
            deducted.push_back(outcome.after);
        }
    } catch (const LedgerError&) {
        compensate(ctx, "deduct", undo);
        throw;
    }

    if (deducted.empty()) {
        ctx.log_warn(STOCK_DOMAIN, "deduct_rejected", {{"reference", reference}});
        throw NotFoundError("No active reservation for reference " + reference);
    }
    return deducted;
}

StockRecord StockLedger::restore(const RequestContext& ctx,
                                 const std::string& variant_id, const std::string& branch_id,
                                 const std::string& reference, int64_t quantity,
                                 const google::protobuf::Timestamp& expires_at) {
    return commit(ctx, variant_id, branch_id, [&](const StockRecord& state) -> OptionalMovement {
        return StockLogic::handle_reserve(state, quantity, reference, expires_at);
    }).after;
}

StockRecord StockLedger::reinstate(const RequestContext& ctx,
                                   const std::string& variant_id, const std::string& branch_id,
                                   const std::string& reference, int64_t quantity,
                                   const google::protobuf::Timestamp& expires_at) {
    return commit(ctx, variant_id, branch_id, [&](const StockRecord& state) -> OptionalMovement {
        return StockLogic::handle_reinstate(state, reference, quantity, expires_at);
    }).after;
}

StockRecord StockLedger::replenish(const RequestContext& ctx,
                                   const std::string& variant_id, const std::string& branch_id,
                                   int64_t quantity, const std::string& reference) {
    return commit(ctx, variant_id, branch_id, [&](const StockRecord& state) -> OptionalMovement {
        return StockLogic::handle_replenish(state, quantity, reference);
    }).after;
}

StockRecord StockLedger::adjust(const RequestContext& ctx,
                                const std::string& variant_id, const std::string& branch_id,
                                int64_t delta, const std::string& reason) {
    try {
        return commit(ctx, variant_id, branch_id, [&](const StockRecord& state) -> OptionalMovement {
            return StockLogic::handle_adjust(state, delta, reason);
        }).after;
    } catch (const InsufficientStockError& e) {
        ctx.log_warn(STOCK_DOMAIN, "adjust_rejected",
            {{"variant_id", variant_id}, {"branch_id", branch_id}, {"delta", delta}, {"error", e.what()}});
        throw;
    }
}

std::pair<StockRecord, StockRecord> StockLedger::transfer(const RequestContext& ctx,
                                                          const std::string& variant_id,
                                                          const std::string& from_branch_id,
                                                          const std::string& to_branch_id,
                                                          int64_t quantity, const std::string& reference) {
    validation::require_positive(quantity, "quantity");
    validation::require_not_empty(reference, "reference");
    validation::require_not_empty(from_branch_id, "from_branch_id");
    validation::require_not_empty(to_branch_id, "to_branch_id");
    if (from_branch_id == to_branch_id) {
        throw ValidationError("Transfer source and destination must differ");
    }

    auto source = commit(ctx, variant_id, from_branch_id, [&](const StockRecord& state) -> OptionalMovement {
        auto movement = StockLogic::handle_adjust(state, -quantity, "transfer to " + to_branch_id);
        movement.set_reference(reference);
        return movement;
    });

    try {
        auto destination = commit(ctx, variant_id, to_branch_id, [&](const StockRecord& state) -> OptionalMovement {
            auto movement = StockLogic::handle_adjust(state, quantity, "transfer from " + from_branch_id);
            movement.set_reference(reference);
            return movement;
        });
        ctx.log_info(STOCK_DOMAIN, "transfer_completed",
            {{"reference", reference}, {"variant_id", variant_id}, {"from", from_branch_id},
             {"to", to_branch_id}, {"quantity", quantity}});
        return {source.after, destination.after};
    } catch (const LedgerError&) {
        compensate(ctx, "transfer", {[&]() {
            commit(ctx, variant_id, from_branch_id, [&](const StockRecord& state) -> OptionalMovement {
                auto movement = StockLogic::handle_adjust(state, quantity, "transfer " + reference + " reversed");
                movement.set_reference(reference);
                return movement;
            });
        }});
        throw;
    }
}

bool StockLedger::apply_remote(const RequestContext& ctx, const retail::StockMovement& movement) {
    validation::require_not_empty(movement.id(), "movement id");

    auto outcome = commit(ctx, movement.variant_id(), movement.branch_id(),
        [&](const StockRecord& state) -> OptionalMovement {
            if (state.movement_ids.count(movement.id()) > 0) return std::nullopt;
            retail::StockMovement remote = movement;
            remote.set_remote(true);
            return remote;
        });
    return outcome.movement.has_value();
}

std::vector<retail::StockMovement> StockLedger::movements(const std::string& branch_id,
                                                          uint64_t after_sequence, uint32_t limit) const {
    std::vector<retail::StockMovement> result;
    for (const auto& page : store_.read(JOURNAL_DOMAIN, branch_id,
                                        static_cast<uint32_t>(after_sequence), limit)) {
        retail::StockMovement movement;
        if (page.event().UnpackTo(&movement)) {
            result.push_back(std::move(movement));
        }
    }
    return result;
}

std::vector<ExpiredReservation> StockLedger::expired_reservations(const google::protobuf::Timestamp& now) const {
    std::vector<ExpiredReservation> expired;
    for (const auto& record : records()) {
        for (const auto& [ref, reservation] : record.reservations) {
            if (!helpers::is_set(reservation.expires_at)) continue;
            if (helpers::before(now, reservation.expires_at)) continue;
            expired.push_back({ref, record.variant_id, record.branch_id,
                               reservation.quantity, reservation.expires_at});
        }
    }
    return expired;
}

}  // namespace stock
