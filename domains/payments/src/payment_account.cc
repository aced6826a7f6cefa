#include "payment_account.hpp"
#include "ledgerline/errors.hpp"
#include "ledgerline/helpers.hpp"

namespace payments {

using namespace ledgerline;

LoyaltyLedger::LoyaltyLedger(EventStore& store, const EngineConfig& config)
    : store_(store), policy_(config.retry_policy()) {}

int64_t LoyaltyLedger::post(const RequestContext& ctx, const std::string& customer_id,
                            const std::string& invoice_id, int64_t points) {
    return retry_on_conflict(policy_, ctx, LOYALTY_DOMAIN, [&]() {
        auto account = LoyaltyLogic::rebuild_state(store_.load(LOYALTY_DOMAIN, customer_id));
        if (points <= 0 || account.posted_for(invoice_id)) {
            return account.balance;
        }
        auto event = LoyaltyLogic::handle_post(account, customer_id, invoice_id, points, ctx.audit());
        store_.append(LOYALTY_DOMAIN, customer_id, account.version, {helpers::pack_any(event)});
        ctx.log_info(LOYALTY_DOMAIN, "loyalty_posted",
            {{"customer_id", customer_id}, {"invoice_id", invoice_id},
             {"points", points}, {"balance", event.balance_after()}});
        return event.balance_after();
    });
}

int64_t LoyaltyLedger::balance(const std::string& customer_id) const {
    return LoyaltyLogic::rebuild_state(store_.load(LOYALTY_DOMAIN, customer_id)).balance;
}

std::vector<retail::LoyaltyPosted> LoyaltyLedger::transactions(const std::string& customer_id) const {
    return LoyaltyLogic::rebuild_state(store_.load(LOYALTY_DOMAIN, customer_id)).transactions;
}

PaymentAccount::PaymentAccount(documents::DocumentService& documents, LoyaltyLedger& loyalty,
                               EventStore& store)
    : documents_(documents), loyalty_(loyalty), store_(store) {}

documents::DocumentState PaymentAccount::apply(const RequestContext& ctx, const std::string& invoice_id,
                                               int64_t amount, const std::string& method) {
    documents::DocumentState state;
    try {
        state = documents_.transition(ctx, invoice_id, [&](const documents::DocumentState& current) {
            auto payment = helpers::pack_any(
                PaymentLogic::handle_apply(current, amount, method, helpers::now(), ctx.audit()));
            std::vector<google::protobuf::Any> events{payment};
            auto after = documents::DocumentLogic::apply(current, payment);
            if (after.stage == retail::STAGE_SETTLED) {
                events.push_back(helpers::pack_any(
                    documents::DocumentLogic::handle_settle(after, documents_.loyalty_rate_bp(), ctx.audit())));
            }
            return events;
        });
    } catch (const PaymentMismatchError& e) {
        ctx.log_warn(PAYMENT_DOMAIN, "payment_rejected",
            {{"invoice_id", invoice_id}, {"amount", amount}, {"error", e.what()}});
        throw;
    }

    ctx.log_info(PAYMENT_DOMAIN, "payment_applied",
        {{"invoice_id", invoice_id}, {"amount", amount}, {"method", method},
         {"balance", state.balance()}, {"stage", retail::Stage_Name(state.stage)}});

    if (state.stage == retail::STAGE_SETTLED) {
        post_loyalty(ctx, invoice_id);
    }
    return state;
}

int64_t PaymentAccount::post_loyalty(const RequestContext& ctx, const std::string& invoice_id) {
    auto state = documents_.get(invoice_id);
    if (state.stage != retail::STAGE_SETTLED || state.loyalty_points <= 0) {
        return 0;
    }
    for (const auto& posted : loyalty_.transactions(state.customer_id)) {
        if (posted.invoice_id() == invoice_id) return 0;
    }
    try {
        loyalty_.post(ctx, state.customer_id, invoice_id, state.loyalty_points);
    } catch (const LedgerError& e) {
        ctx.log_error(LOYALTY_DOMAIN, "loyalty_post_failed",
            {{"invoice_id", invoice_id}, {"customer_id", state.customer_id}, {"error", e.what()}});
        throw;
    }
    return state.loyalty_points;
}

std::vector<retail::PaymentApplied> PaymentAccount::payments(const std::string& invoice_id) const {
    std::vector<retail::PaymentApplied> result;
    for (const auto& page : store_.read(documents::DOCUMENT_DOMAIN, invoice_id, 0)) {
        if (!helpers::type_url_matches(page.event().type_url(), "retail.PaymentApplied")) continue;
        retail::PaymentApplied payment;
        page.event().UnpackTo(&payment);
        result.push_back(std::move(payment));
    }
    return result;
}

}  // namespace payments
