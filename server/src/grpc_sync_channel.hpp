#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "ledgerline/service.grpc.pb.h"
#include "sync_channel.hpp"

namespace ledgerline {

/**
 * SyncChannel that pushes each movement to a peer's ReceiveMovement RPC.
 * Peers are addressed as host:port. Any failed call surfaces as
 * PeerUnavailableError so the coordinator keeps its cursor and retries.
 */
class GrpcSyncChannel : public branch_sync::SyncChannel {
public:
    GrpcSyncChannel(std::string node_id, std::chrono::milliseconds deadline);

    void publish(const std::string& peer, const retail::StockMovement& movement) override;

private:
    LedgerCommandService::Stub& stub_for(const std::string& peer);

    std::string node_id_;
    std::chrono::milliseconds deadline_;
    std::mutex mutex_;
    std::map<std::string, std::unique_ptr<LedgerCommandService::Stub>> stubs_;
};

}  // namespace ledgerline
