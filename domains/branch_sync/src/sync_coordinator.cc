#include "sync_coordinator.hpp"
#include "ledgerline/command_router.hpp"
#include "ledgerline/helpers.hpp"
#include "ledgerline/validation.hpp"

#include <algorithm>

namespace branch_sync {

using namespace ledgerline;

SyncCoordinator::SyncCoordinator(stock::StockLedger& ledger, EventStore& store,
                                 SyncChannel& channel, const EngineConfig& config,
                                 std::vector<std::string> peers)
    : ledger_(ledger),
      store_(store),
      channel_(channel),
      policy_(config.retry_policy()),
      outbound_root_(config.node_id + "/out"),
      inbound_root_(config.node_id + "/in"),
      local_branches_(config.local_branches.begin(), config.local_branches.end()),
      peers_(std::move(peers)) {
    published_ = load_cursors(outbound_root_);
    applied_ = load_cursors(inbound_root_);
}

bool SyncCoordinator::is_local(const std::string& branch_id) const {
    return local_branches_.count(branch_id) > 0;
}

std::vector<std::string> SyncCoordinator::outbound_branches() const {
    if (local_branches_.empty()) {
        return store_.roots(stock::JOURNAL_DOMAIN);
    }
    return {local_branches_.begin(), local_branches_.end()};
}

SyncCoordinator::Cursors SyncCoordinator::load_cursors(const std::string& root) const {
    Cursors cursors;
    for (const auto& page : store_.read(SYNC_DOMAIN, root, 0)) {
        retail::SyncCursorAdvanced advanced;
        if (!page.event().UnpackTo(&advanced)) continue;
        auto& cursor = cursors[advanced.branch_id()];
        cursor = std::max(cursor, advanced.sequence());
    }
    return cursors;
}

void SyncCoordinator::save_cursor(const RequestContext& ctx, const std::string& root,
                                  const std::string& branch_id, uint64_t sequence) {
    retail::SyncCursorAdvanced advanced;
    advanced.set_branch_id(branch_id);
    advanced.set_sequence(sequence);
    retry_on_conflict(policy_, ctx, SYNC_DOMAIN, [&]() {
        store_.append(SYNC_DOMAIN, root, store_.version(SYNC_DOMAIN, root),
                      {helpers::pack_any(advanced)});
    });
}

size_t SyncCoordinator::publish_pending(const RequestContext& ctx) {
    std::lock_guard<std::mutex> lock(publish_mutex_);
    size_t delivered = 0;

    for (const auto& branch : outbound_branches()) {
        const uint64_t start = published_[branch];
        uint64_t cursor = start;
        for (const auto& movement : ledger_.movements(branch, cursor)) {
            try {
                for (const auto& peer : peers_) {
                    channel_.publish(peer, movement);
                }
            } catch (const PeerUnavailableError& e) {
                ctx.log_warn(SYNC_DOMAIN, "publish_deferred",
                    {{"branch_id", branch}, {"sequence", movement.sequence()}, {"error", e.what()}});
                break;
            }
            cursor = movement.sequence();
            ++delivered;
        }

        if (cursor != start) {
            save_cursor(ctx, outbound_root_, branch, cursor);
            published_[branch] = cursor;
            ctx.log_info(SYNC_DOMAIN, "published",
                {{"branch_id", branch}, {"from", start}, {"through", cursor}});
        }
    }
    return delivered;
}

size_t SyncCoordinator::receive(const RequestContext& ctx, const retail::StockMovement& movement) {
    validation::require_not_empty(movement.id(), "movement id");
    validation::require_not_empty(movement.branch_id(), "branch_id");
    validation::require_positive(movement.sequence(), "sequence");

    const auto& branch = movement.branch_id();
    if (is_local(branch)) {
        ctx.log_warn(SYNC_DOMAIN, "own_branch_movement_ignored",
            {{"branch_id", branch}, {"movement_id", movement.id()}});
        return 0;
    }

    std::lock_guard<std::mutex> lock(receive_mutex_);
    uint64_t& applied = applied_[branch];
    if (movement.sequence() <= applied) {
        ctx.log_info(SYNC_DOMAIN, "duplicate_dropped",
            {{"branch_id", branch}, {"sequence", movement.sequence()}, {"movement_id", movement.id()}});
        return 0;
    }
    if (movement.sequence() > applied + 1) {
        pending_[branch].emplace(movement.sequence(), movement);
        ctx.log_info(SYNC_DOMAIN, "buffered_out_of_order",
            {{"branch_id", branch}, {"sequence", movement.sequence()}, {"expected", applied + 1}});
        return 0;
    }

    ledger_.apply_remote(ctx, movement);
    applied = movement.sequence();
    size_t count = 1 + drain_buffer(ctx, branch);
    save_cursor(ctx, inbound_root_, branch, applied_[branch]);
    return count;
}

size_t SyncCoordinator::accept(Logger& logger, const retail::MovementDelivery& delivery) {
    try {
        require_principal(delivery.has_principal() ? &delivery.principal() : nullptr);
        require_role(delivery.principal(), {REPLICA_ROLE, "admin"}, "deliver stock movements");
    } catch (const LedgerError& e) {
        logger.warn(SYNC_DOMAIN, "delivery_rejected",
            {{"actor", delivery.principal().user_id()}, {"movement_id", delivery.movement().id()},
             {"error", e.what()}});
        throw;
    }
    RequestContext ctx(logger, delivery.principal(), delivery.correlation_id());
    return receive(ctx, delivery.movement());
}

size_t SyncCoordinator::drain_buffer(const RequestContext& ctx, const std::string& branch_id) {
    auto found = pending_.find(branch_id);
    if (found == pending_.end()) return 0;

    auto& buffer = found->second;
    uint64_t& applied = applied_[branch_id];
    size_t count = 0;
    while (!buffer.empty()) {
        auto next = buffer.begin();
        if (next->first <= applied) {
            buffer.erase(next);
            continue;
        }
        if (next->first != applied + 1) break;
        ledger_.apply_remote(ctx, next->second);
        applied = next->first;
        buffer.erase(next);
        ++count;
    }
    return count;
}

uint64_t SyncCoordinator::published_through(const std::string& branch_id) const {
    std::lock_guard<std::mutex> lock(publish_mutex_);
    auto it = published_.find(branch_id);
    return it == published_.end() ? 0 : it->second;
}

uint64_t SyncCoordinator::applied_through(const std::string& branch_id) const {
    std::lock_guard<std::mutex> lock(receive_mutex_);
    auto it = applied_.find(branch_id);
    return it == applied_.end() ? 0 : it->second;
}

size_t SyncCoordinator::buffered(const std::string& branch_id) const {
    std::lock_guard<std::mutex> lock(receive_mutex_);
    auto it = pending_.find(branch_id);
    return it == pending_.end() ? 0 : it->second.size();
}

}  // namespace branch_sync
