#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "ledgerline/types.pb.h"
#include "retail/documents.pb.h"
#include "document_logic.hpp"

namespace payments {

constexpr const char* PAYMENT_DOMAIN = "payments";
constexpr const char* LOYALTY_DOMAIN = "loyalty";

class PaymentLogic {
public:
    /**
     * @throws InvalidStateTransitionError unless the invoice is Invoiced or PartiallyPaid
     * @throws PaymentMismatchError if amount <= 0 or amount > balance
     */
    static retail::PaymentApplied handle_apply(
        const documents::DocumentState& state, int64_t amount, const std::string& method,
        const google::protobuf::Timestamp& paid_at, const ledgerline::Audit& audit);
};

/**
 * Folded loyalty account of one customer.
 */
struct LoyaltyAccount {
    std::string customer_id;
    int64_t balance = 0;
    std::vector<retail::LoyaltyPosted> transactions;
    uint32_t version = 0;

    bool posted_for(const std::string& invoice_id) const;
};

class LoyaltyLogic {
public:
    static LoyaltyAccount rebuild_state(const ledgerline::EventBook& event_book);

    static retail::LoyaltyPosted handle_post(
        const LoyaltyAccount& state, const std::string& customer_id, const std::string& invoice_id,
        int64_t points, const ledgerline::Audit& audit);
};

}  // namespace payments
