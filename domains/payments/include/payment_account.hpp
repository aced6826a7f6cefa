#pragma once

#include <string>
#include <vector>
#include "ledgerline/config.hpp"
#include "ledgerline/context.hpp"
#include "ledgerline/event_store.hpp"
#include "ledgerline/retry.hpp"
#include "document_service.hpp"
#include "payment_logic.hpp"

namespace payments {

/**
 * Customer loyalty points, one stream per customer. A settled invoice posts
 * at most once.
 */
class LoyaltyLedger {
public:
    LoyaltyLedger(ledgerline::EventStore& store, const ledgerline::EngineConfig& config);

    /**
     * Post points for an invoice. Zero points, or an invoice already posted,
     * change nothing.
     * @return the customer's balance afterwards
     */
    int64_t post(const ledgerline::RequestContext& ctx, const std::string& customer_id,
                 const std::string& invoice_id, int64_t points);

    int64_t balance(const std::string& customer_id) const;

    std::vector<retail::LoyaltyPosted> transactions(const std::string& customer_id) const;

private:
    ledgerline::EventStore& store_;
    ledgerline::RetryPolicy policy_;
};

/**
 * Applies payments against invoice balances. Full settlement moves the
 * invoice to Settled and posts loyalty points.
 */
class PaymentAccount {
public:
    PaymentAccount(documents::DocumentService& documents, LoyaltyLedger& loyalty,
                   ledgerline::EventStore& store);

    documents::DocumentState apply(const ledgerline::RequestContext& ctx, const std::string& invoice_id,
                                   int64_t amount, const std::string& method);

    /**
     * Payments of an invoice in submission order.
     */
    std::vector<retail::PaymentApplied> payments(const std::string& invoice_id) const;

    /**
     * Post loyalty for a settled invoice if it has not been posted yet.
     * @return points posted now
     */
    int64_t post_loyalty(const ledgerline::RequestContext& ctx, const std::string& invoice_id);

private:
    documents::DocumentService& documents_;
    LoyaltyLedger& loyalty_;
    ledgerline::EventStore& store_;
};

}  // namespace payments
