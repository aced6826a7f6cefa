#pragma once

#include "ledgerline/command_router.hpp"
#include "ledgerline/logging.hpp"
#include "retail/commands.pb.h"
#include "alert_evaluator.hpp"
#include "document_service.hpp"
#include "payment_account.hpp"
#include "procurement_service.hpp"
#include "stock_ledger.hpp"
#include "vendor_ratings.hpp"

namespace dispatch {

namespace roles {
    constexpr const char* ADMIN = "admin";
    constexpr const char* SALES = "sales";
    constexpr const char* CASHIER = "cashier";
    constexpr const char* INVENTORY = "inventory";
}

struct Workflows {
    stock::StockLedger& ledger;
    alerts::AlertEvaluator& alert_evaluator;
    documents::DocumentService& document_service;
    payments::PaymentAccount& payment_account;
    payments::LoyaltyLedger& loyalty_ledger;
    procurement::ProcurementService& purchase_orders;
    const procurement::VendorRatings& vendor_ratings;
};

retail::StockRecordView to_view(const stock::StockRecord& record);
retail::DocumentView to_view(const documents::DocumentState& state);
retail::PurchaseOrderView to_view(const procurement::PurchaseState& state);
retail::VendorRatingView to_view(const procurement::VendorRating& rating);

/**
 * Entry point for every retail command: authorizes the principal, routes
 * the command to its workflow and returns the resulting view.
 */
class CommandDispatcher {
public:
    CommandDispatcher(Workflows workflows, ledgerline::Logger& logger);

    ledgerline::CommandResult dispatch(const ledgerline::CommandEnvelope& envelope) const;

    const ledgerline::CommandRouter& router() const { return router_; }

private:
    void register_documents();
    void register_ledger();
    void register_procurement();

    Workflows workflows_;
    ledgerline::Logger& logger_;
    ledgerline::CommandRouter router_;
};

}  // namespace dispatch
