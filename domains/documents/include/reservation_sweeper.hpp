#pragma once

#include <memory>
#include <string>
#include <google/protobuf/timestamp.pb.h>
#include "ledgerline/config.hpp"
#include "ledgerline/context.hpp"
#include "ledgerline/logging.hpp"
#include "ledgerline/periodic_task.hpp"
#include "document_service.hpp"
#include "stock_ledger.hpp"

namespace documents {

/**
 * Releases expired, undeducted reservations. A reservation held by a sales
 * order cancels that order; any other expired reference is released in the
 * ledger directly.
 */
class ReservationSweeper {
public:
    ReservationSweeper(DocumentService& documents, stock::StockLedger& ledger,
                       ledgerline::Logger& logger, const ledgerline::EngineConfig& config);

    /**
     * One pass over reservations expired at now.
     * @return number of references released
     */
    size_t sweep(const ledgerline::RequestContext& ctx, const google::protobuf::Timestamp& now);

    void start();
    void stop();

private:
    DocumentService& documents_;
    stock::StockLedger& ledger_;
    ledgerline::Logger& logger_;
    std::unique_ptr<ledgerline::PeriodicTask> task_;
};

}  // namespace documents
