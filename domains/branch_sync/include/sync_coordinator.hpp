#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "ledgerline/config.hpp"
#include "ledgerline/context.hpp"
#include "ledgerline/event_store.hpp"
#include "ledgerline/logging.hpp"
#include "ledgerline/retry.hpp"
#include "stock_ledger.hpp"
#include "sync_channel.hpp"

namespace branch_sync {

constexpr const char* SYNC_DOMAIN = "sync";

// Role carried by peer replicas delivering movements.
constexpr const char* REPLICA_ROLE = "replica";

/**
 * Propagates ledger movements between branch replicas.
 *
 * Outbound: the journal of each locally-owned branch is published to every
 * peer in sequence order. The cursor is persisted after each successful
 * delivery, so a failure redelivers from the last acknowledged movement.
 *
 * Inbound: movements are applied per origin branch in sequence order.
 * Movements ahead of a gap are buffered, duplicates are dropped, and the
 * ledger deduplicates by movement id as a second guard.
 */
class SyncCoordinator {
public:
    SyncCoordinator(stock::StockLedger& ledger, ledgerline::EventStore& store,
                    SyncChannel& channel, const ledgerline::EngineConfig& config,
                    std::vector<std::string> peers);

    /**
     * Publish journal entries past the cursor. Never called on the ledger
     * write path.
     * @return number of movements delivered to all peers
     */
    size_t publish_pending(const ledgerline::RequestContext& ctx);

    /**
     * Accept one movement from a peer.
     * @return number of movements applied to the ledger as a result
     */
    size_t receive(const ledgerline::RequestContext& ctx, const retail::StockMovement& movement);

    /**
     * Accept a delivery from the network after checking its sender.
     * @throws UnauthenticatedError if the delivery carries no principal
     * @throws PermissionDeniedError unless the sender is a replica or an admin
     */
    size_t accept(ledgerline::Logger& logger, const retail::MovementDelivery& delivery);

    uint64_t published_through(const std::string& branch_id) const;
    uint64_t applied_through(const std::string& branch_id) const;
    size_t buffered(const std::string& branch_id) const;

private:
    using Cursors = std::map<std::string, uint64_t>;

    bool is_local(const std::string& branch_id) const;
    std::vector<std::string> outbound_branches() const;
    Cursors load_cursors(const std::string& root) const;
    void save_cursor(const ledgerline::RequestContext& ctx, const std::string& root,
                     const std::string& branch_id, uint64_t sequence);
    size_t drain_buffer(const ledgerline::RequestContext& ctx, const std::string& branch_id);

    stock::StockLedger& ledger_;
    ledgerline::EventStore& store_;
    SyncChannel& channel_;
    ledgerline::RetryPolicy policy_;
    std::string outbound_root_;
    std::string inbound_root_;
    std::set<std::string> local_branches_;
    std::vector<std::string> peers_;

    mutable std::mutex publish_mutex_;
    Cursors published_;

    mutable std::mutex receive_mutex_;
    Cursors applied_;
    std::map<std::string, std::map<uint64_t, retail::StockMovement>> pending_;
};

}  // namespace branch_sync
