#include "alert_evaluator.hpp"
#include "catalog.hpp"
#include "command_dispatcher.hpp"
#include "document_service.hpp"
#include "grpc_sync_channel.hpp"
#include "history_reader.hpp"
#include "ledgerline/config.hpp"
#include "ledgerline/context.hpp"
#include "ledgerline/errors.hpp"
#include "ledgerline/event_store.hpp"
#include "ledgerline/logging.hpp"
#include "ledgerline/periodic_task.hpp"
#include "ledgerline/service.grpc.pb.h"
#include "payment_account.hpp"
#include "procurement_service.hpp"
#include "reservation_sweeper.hpp"
#include "stock_ledger.hpp"
#include "sync_coordinator.hpp"
#include "vendor_ratings.hpp"
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace ledgerline {
std::unique_ptr<LedgerCommandService::Service> create_ledger_service(
    dispatch::CommandDispatcher& dispatcher, const dispatch::HistoryReader& history,
    branch_sync::SyncCoordinator& coordinator, Logger& logger);
}

namespace {

/**
 * Seed the catalog and customer directory from LEDGERLINE_MASTER_DATA, a JSON
 * file of the form {"variants": [...], "customers": [...]}.
 */
void load_master_data(const std::string& path, documents::InMemoryCatalog& catalog,
                      documents::InMemoryCustomerDirectory& customers) {
    std::ifstream in(path);
    if (!in) {
        throw ledgerline::ValidationError("cannot open master data file: " + path);
    }
    auto doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw ledgerline::ValidationError("master data file is not a JSON object: " + path);
    }
    try {
        for (const auto& entry : doc.value("variants", nlohmann::json::array())) {
            documents::Variant variant;
            variant.variant_id = entry.at("variant_id").get<std::string>();
            variant.product_id = entry.value("product_id", "");
            variant.sku = entry.value("sku", "");
            variant.unit_price = entry.at("unit_price").get<int64_t>();
            variant.tax_rate_bp = entry.value("tax_rate_bp", 0);
            variant.is_set = entry.value("is_set", false);
            catalog.add_variant(variant);
        }
        for (const auto& customer : doc.value("customers", nlohmann::json::array())) {
            customers.add(customer.get<std::string>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw ledgerline::ValidationError("master data " + path + ": " + e.what());
    }
}

} // anonymous namespace

int main() {
    ledgerline::Logger bootstrap(std::cout);

    ledgerline::EngineConfig config;
    try {
        config.from_env();
    } catch (const ledgerline::LedgerError& e) {
        bootstrap.error("server", "invalid_configuration", {{"error", e.what()}});
        return 1;
    }
    ledgerline::Logger logger(std::cout, ledgerline::Logger::parse_level(config.log_level));

    ledgerline::InMemoryEventStore store;
    stock::StockLedger ledger(store, config);

    alerts::LoggingAlertPublisher publisher;
    alerts::AlertEvaluator evaluator(publisher, config.alert_basis);
    evaluator.load_thresholds(config.thresholds);
    ledger.add_observer(&evaluator);

    documents::InMemoryCatalog catalog;
    documents::InMemoryCustomerDirectory customers;
    if (const char* path = std::getenv("LEDGERLINE_MASTER_DATA")) {
        try {
            load_master_data(path, catalog, customers);
        } catch (const ledgerline::LedgerError& e) {
            logger.error("server", "invalid_master_data", {{"error", e.what()}});
            return 1;
        }
    }

    documents::DocumentService document_service(store, ledger, catalog, customers, config);
    payments::LoyaltyLedger loyalty(store, config);
    payments::PaymentAccount payment_account(document_service, loyalty, store);
    procurement::ProcurementService purchase_orders(store, ledger, config);
    procurement::VendorRatings ratings(store);

    dispatch::CommandDispatcher dispatcher(
        dispatch::Workflows{ledger, evaluator, document_service, payment_account, loyalty, purchase_orders, ratings},
        logger);

    documents::ReservationSweeper sweeper(document_service, ledger, logger, config);

    dispatch::HistoryReader history(store, logger);

    ledgerline::GrpcSyncChannel channel(config.node_id, std::chrono::milliseconds(config.sync_interval_ms * 4));
    branch_sync::SyncCoordinator coordinator(ledger, store, channel, config, config.peers);
    ledgerline::PeriodicTask sync_pump(logger, "sync_pump",
        std::chrono::milliseconds(config.sync_interval_ms), [&]() {
            auto ctx = ledgerline::RequestContext::system(logger, "sync");
            coordinator.publish_pending(ctx);
        });

    std::string server_address = "0.0.0.0:" + std::to_string(config.port);

    grpc::EnableDefaultHealthCheckService(true);

    auto service = ledgerline::create_ledger_service(dispatcher, history, coordinator, logger);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(service.get());

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        logger.error("server", "listen_failed", {{"address", server_address}});
        return 1;
    }

    sweeper.start();
    sync_pump.start();

    logger.info("server", "ledger_server_started",
        {{"port", config.port}, {"node_id", config.node_id}, {"commands", dispatcher.router().types().size()},
         {"peers", config.peers}});

    server->Wait();

    sync_pump.stop();
    sweeper.stop();
    return 0;
}
