#include "grpc_sync_channel.hpp"
#include "sync_coordinator.hpp"
#include <grpcpp/grpcpp.h>

namespace ledgerline {

GrpcSyncChannel::GrpcSyncChannel(std::string node_id, std::chrono::milliseconds deadline)
    : node_id_(std::move(node_id)), deadline_(deadline) {}

LedgerCommandService::Stub& GrpcSyncChannel::stub_for(const std::string& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& stub = stubs_[peer];
    if (!stub) {
        auto channel = grpc::CreateChannel(peer, grpc::InsecureChannelCredentials());
        stub = LedgerCommandService::NewStub(channel);
    }
    return *stub;
}

void GrpcSyncChannel::publish(const std::string& peer, const retail::StockMovement& movement) {
    retail::MovementDelivery delivery;
    delivery.mutable_principal()->set_user_id(node_id_);
    delivery.mutable_principal()->set_username(node_id_);
    delivery.mutable_principal()->set_role(branch_sync::REPLICA_ROLE);
    delivery.set_correlation_id(node_id_ + "/" + movement.id());
    *delivery.mutable_movement() = movement;

    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + deadline_);
    retail::DeliveryAck ack;
    auto status = stub_for(peer).ReceiveMovement(&context, delivery, &ack);
    if (!status.ok()) {
        throw branch_sync::PeerUnavailableError("Peer " + peer + " refused movement " + movement.id() +
                                                ": " + status.error_message());
    }
}

}  // namespace ledgerline
