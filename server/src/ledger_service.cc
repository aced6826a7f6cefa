#include "command_dispatcher.hpp"
#include "history_reader.hpp"
#include "ledgerline/errors.hpp"
#include "ledgerline/logging.hpp"
#include "ledgerline/service.grpc.pb.h"
#include "sync_coordinator.hpp"
#include <grpcpp/grpcpp.h>

namespace ledgerline {

class LedgerService final : public LedgerCommandService::Service {
public:
    LedgerService(dispatch::CommandDispatcher& dispatcher, const dispatch::HistoryReader& history,
                  branch_sync::SyncCoordinator& coordinator, Logger& logger)
        : dispatcher_(dispatcher), history_(history), coordinator_(coordinator), logger_(logger) {}

    grpc::Status Handle(grpc::ServerContext* /*context*/,
                        const CommandEnvelope* request,
                        CommandResult* response) override {
        try {
            *response = dispatcher_.dispatch(*request);
            return grpc::Status::OK;
        } catch (const LedgerError& e) {
            return e.to_grpc_status();
        } catch (const std::exception& e) {
            logger_.error("server", "handle_failed",
                {{"correlation_id", request->correlation_id()}, {"error", e.what()}});
            return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
        }
    }

    grpc::Status History(grpc::ServerContext* /*context*/,
                         const HistoryQuery* request,
                         EventBook* response) override {
        try {
            *response = history_.read(*request);
            return grpc::Status::OK;
        } catch (const LedgerError& e) {
            return e.to_grpc_status();
        } catch (const std::exception& e) {
            logger_.error("server", "history_failed",
                {{"domain", request->domain()}, {"root", request->root()}, {"error", e.what()}});
            return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
        }
    }

    grpc::Status ReceiveMovement(grpc::ServerContext* /*context*/,
                                 const retail::MovementDelivery* request,
                                 retail::DeliveryAck* response) override {
        try {
            response->set_applied(static_cast<uint32_t>(coordinator_.accept(logger_, *request)));
            return grpc::Status::OK;
        } catch (const LedgerError& e) {
            return e.to_grpc_status();
        } catch (const std::exception& e) {
            logger_.error("server", "receive_movement_failed",
                {{"movement_id", request->movement().id()}, {"error", e.what()}});
            return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
        }
    }

private:
    dispatch::CommandDispatcher& dispatcher_;
    const dispatch::HistoryReader& history_;
    branch_sync::SyncCoordinator& coordinator_;
    Logger& logger_;
};

std::unique_ptr<LedgerCommandService::Service> create_ledger_service(
    dispatch::CommandDispatcher& dispatcher, const dispatch::HistoryReader& history,
    branch_sync::SyncCoordinator& coordinator, Logger& logger) {
    return std::make_unique<LedgerService>(dispatcher, history, coordinator, logger);
}

}  // namespace ledgerline
