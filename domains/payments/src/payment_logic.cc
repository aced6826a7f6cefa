#include "payment_logic.hpp"
#include "ledgerline/errors.hpp"
#include "ledgerline/helpers.hpp"
#include "ledgerline/validation.hpp"

namespace payments {

using namespace ledgerline;

retail::PaymentApplied PaymentLogic::handle_apply(
    const documents::DocumentState& state, int64_t amount, const std::string& method,
    const google::protobuf::Timestamp& paid_at, const Audit& audit) {
    if (!state.exists()) {
        throw NotFoundError("Invoice does not exist");
    }
    validation::require_status_in(state.stage, {retail::STAGE_INVOICED, retail::STAGE_PARTIALLY_PAID},
        "Payments apply to open invoices only, document is " + retail::Stage_Name(state.stage));
    validation::require_not_empty(method, "payment method");
    if (amount <= 0) {
        throw PaymentMismatchError("Payment amount must be positive");
    }
    if (amount > state.balance()) {
        throw PaymentMismatchError("Payment " + std::to_string(amount) + " exceeds balance " +
                                   std::to_string(state.balance()));
    }

    int64_t balance_after = state.balance() - amount;
    retail::Stage next = balance_after == 0 ? retail::STAGE_SETTLED : retail::STAGE_PARTIALLY_PAID;

    retail::PaymentApplied event;
    event.set_payment_sequence(state.payment_count + 1);
    event.set_amount(amount);
    event.set_method(method);
    *event.mutable_paid_at() = paid_at;
    event.set_balance_after(balance_after);
    if (next != state.stage) {
        auto* transition = event.mutable_transition();
        transition->set_from_stage(state.stage);
        transition->set_to_stage(next);
        *transition->mutable_audit() = audit;
    }
    return event;
}

bool LoyaltyAccount::posted_for(const std::string& invoice_id) const {
    for (const auto& transaction : transactions) {
        if (transaction.invoice_id() == invoice_id) return true;
    }
    return false;
}

LoyaltyAccount LoyaltyLogic::rebuild_state(const EventBook& event_book) {
    LoyaltyAccount state;
    for (const auto& page : event_book.pages()) {
        if (!helpers::type_url_matches(page.event().type_url(), "retail.LoyaltyPosted")) continue;
        retail::LoyaltyPosted posted;
        page.event().UnpackTo(&posted);
        state.customer_id = posted.customer_id();
        state.balance += posted.points();
        state.transactions.push_back(std::move(posted));
    }
    state.version = helpers::stream_version(event_book);
    return state;
}

retail::LoyaltyPosted LoyaltyLogic::handle_post(
    const LoyaltyAccount& state, const std::string& customer_id, const std::string& invoice_id,
    int64_t points, const Audit& audit) {
    validation::require_not_empty(customer_id, "customer_id");
    validation::require_not_empty(invoice_id, "invoice_id");
    validation::require_positive(points, "points");
    if (state.posted_for(invoice_id)) {
        throw ValidationError("Loyalty already posted for invoice " + invoice_id);
    }

    retail::LoyaltyPosted event;
    event.set_customer_id(customer_id);
    event.set_invoice_id(invoice_id);
    event.set_points(points);
    event.set_balance_after(state.balance + points);
    *event.mutable_audit() = audit;
    return event;
}

}  // namespace payments
