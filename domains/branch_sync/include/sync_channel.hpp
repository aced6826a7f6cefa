#pragma once

#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "ledgerline/errors.hpp"
#include "retail/stock.pb.h"

namespace branch_sync {

/**
 * A peer could not accept a delivery. The publisher keeps its cursor and
 * retries on the next pass.
 */
class PeerUnavailableError : public ledgerline::LedgerError {
public:
    explicit PeerUnavailableError(const std::string& message)
        : ledgerline::LedgerError(message) {}

    grpc::StatusCode status_code() const override { return grpc::StatusCode::UNAVAILABLE; }
    bool is_retryable() const override { return true; }
};

/**
 * Ordered per-origin-branch delivery of stock movements to peer replicas,
 * at least once.
 */
class SyncChannel {
public:
    virtual ~SyncChannel() = default;

    /**
     * @throws PeerUnavailableError if the peer cannot be reached
     */
    virtual void publish(const std::string& peer, const retail::StockMovement& movement) = 0;
};

/**
 * Store-and-forward channel with one FIFO queue per destination.
 */
class InProcessSyncChannel : public SyncChannel {
public:
    void publish(const std::string& peer, const retail::StockMovement& movement) override;

    /**
     * Remove and return everything queued for a peer, oldest first.
     */
    std::vector<retail::StockMovement> drain(const std::string& peer);

    size_t pending(const std::string& peer) const;

    void set_reachable(const std::string& peer, bool reachable);

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::deque<retail::StockMovement>> queues_;
    std::set<std::string> unreachable_;
};

}  // namespace branch_sync
