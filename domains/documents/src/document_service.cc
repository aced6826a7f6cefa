#include "document_service.hpp"
#include "ledgerline/errors.hpp"
#include "ledgerline/helpers.hpp"
#include "ledgerline/validation.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace documents {

using namespace ledgerline;

namespace {

using Events = std::vector<google::protobuf::Any>;

std::string day_key(const google::protobuf::Timestamp& at) {
    auto iso = helpers::iso8601(at);
    return iso.substr(0, 4) + iso.substr(5, 2) + iso.substr(8, 2);
}

} // anonymous namespace

DocumentService::DocumentService(EventStore& store, stock::StockLedger& ledger,
                                 const Catalog& catalog, const CustomerDirectory& customers,
                                 const EngineConfig& config)
    : store_(store),
      ledger_(ledger),
      catalog_(catalog),
      customers_(customers),
      policy_(config.retry_policy()),
      reservation_ttl_seconds_(config.reservation_ttl_seconds),
      loyalty_rate_bp_(config.loyalty_rate_bp) {}

DocumentState DocumentService::load(const std::string& document_id) const {
    return DocumentLogic::rebuild_state(store_.load(DOCUMENT_DOMAIN, document_id));
}

DocumentState DocumentService::get(const std::string& document_id) const {
    auto state = load(document_id);
    if (!state.exists()) {
        throw NotFoundError("Document " + document_id + " not found");
    }
    return state;
}

std::vector<EventPage> DocumentService::history(const std::string& document_id) const {
    return store_.read(DOCUMENT_DOMAIN, document_id, 0);
}

DocumentState DocumentService::append_locked(const RequestContext& ctx, const std::string& document_id,
                                             const Decide& decide) {
    return retry_on_conflict(policy_, ctx, DOCUMENT_DOMAIN, [&]() {
        auto state = load(document_id);
        auto events = decide(state);
        if (events.empty()) return state;

        auto version = store_.append(DOCUMENT_DOMAIN, document_id, state.version, events);
        for (const auto& event : events) {
            state = DocumentLogic::apply(std::move(state), event);
        }
        state.version = version;
        return state;
    });
}

DocumentState DocumentService::transition(const RequestContext& ctx, const std::string& document_id,
                                          const Decide& decide) {
    std::lock_guard<std::mutex> lock(transition_locks_.for_key(document_id));
    return append_locked(ctx, document_id, decide);
}

void DocumentService::log_transition(const RequestContext& ctx, const std::string& action,
                                     const DocumentState& state) const {
    ctx.log_info(DOCUMENT_DOMAIN, "document_" + action,
        {{"document_id", state.document_id}, {"stage", retail::Stage_Name(state.stage)},
         {"version", state.version}});
}

std::vector<retail::LineItem> DocumentService::price_lines(const std::vector<QuoteRequest>& lines) const {
    std::vector<retail::LineItem> items;
    for (const auto& request : lines) {
        validation::require_not_empty(request.variant_id, "variant_id");
        validation::require_positive(request.quantity, "quantity");
        auto variant = catalog_.find_variant(request.variant_id);
        if (!variant) {
            throw NotFoundError("Variant " + request.variant_id + " not found");
        }
        retail::LineItem item;
        item.set_variant_id(variant->variant_id);
        item.set_quantity(request.quantity);
        item.set_unit_price(variant->unit_price);
        item.set_tax_rate_bp(variant->tax_rate_bp);
        items.push_back(std::move(item));
    }
    return items;
}

std::string DocumentService::next_invoice_number(const RequestContext& ctx, const std::string& document_id) {
    const auto day = day_key(helpers::now());
    retail::InvoiceNumberReserved reserved;
    reserved.set_document_id(document_id);

    uint32_t sequence = retry_on_conflict(policy_, ctx, INVOICE_NUMBER_DOMAIN, [&]() {
        return store_.append(INVOICE_NUMBER_DOMAIN, day, store_.version(INVOICE_NUMBER_DOMAIN, day),
                             {helpers::pack_any(reserved)});
    });

    std::ostringstream number;
    number << "INV-" << day << "-" << std::setw(4) << std::setfill('0') << sequence;
    return number.str();
}

DocumentState DocumentService::create_quotation(const RequestContext& ctx, const std::string& document_id,
                                                const std::string& customer_id, const std::string& branch_id,
                                                const std::vector<QuoteRequest>& lines) {
    const auto id = document_id.empty() ? helpers::new_id() : document_id;
    auto items = price_lines(lines);

    auto state = transition(ctx, id, [&](const DocumentState& current) {
        return Events{helpers::pack_any(
            DocumentLogic::handle_create(current, id, customer_id, branch_id, items, ctx.audit()))};
    });
    log_transition(ctx, "drafted", state);
    return state;
}

DocumentState DocumentService::revise(const RequestContext& ctx, const std::string& document_id,
                                      const std::vector<QuoteRequest>& lines) {
    auto items = price_lines(lines);
    auto state = transition(ctx, document_id, [&](const DocumentState& current) {
        return Events{helpers::pack_any(DocumentLogic::handle_revise(current, items, ctx.audit()))};
    });
    log_transition(ctx, "revised", state);
    return state;
}

DocumentState DocumentService::approve(const RequestContext& ctx, const std::string& document_id) {
    auto state = transition(ctx, document_id, [&](const DocumentState& current) {
        bool known = current.exists() && customers_.exists(current.customer_id);
        return Events{helpers::pack_any(DocumentLogic::handle_approve(current, known, ctx.audit()))};
    });
    log_transition(ctx, "approved", state);
    return state;
}

DocumentState DocumentService::convert(const RequestContext& ctx, const std::string& document_id) {
    std::lock_guard<std::mutex> lock(transition_locks_.for_key(document_id));
    auto state = load(document_id);

    google::protobuf::Timestamp expires_at;
    if (reservation_ttl_seconds_ > 0) {
        expires_at = helpers::to_timestamp(std::chrono::system_clock::now() +
                                           std::chrono::seconds(reservation_ttl_seconds_));
    }
    // A fresh reference per attempt, so a retry after a failed attempt is not
    // mistaken for a replay of the released reservation.
    const auto reservation_id = document_id + "/" + helpers::new_id().substr(0, 12);
    DocumentLogic::handle_convert(state, reservation_id, expires_at, ctx.audit());

    bool reserved_any = false;
    try {
        for (const auto& line : DocumentLogic::merged_lines(state)) {
            ledger_.reserve(ctx, line.variant_id, state.branch_id, line.quantity, reservation_id, expires_at);
            reserved_any = true;
        }
        auto converted = append_locked(ctx, document_id, [&](const DocumentState& current) {
            return Events{helpers::pack_any(
                DocumentLogic::handle_convert(current, reservation_id, expires_at, ctx.audit()))};
        });
        log_transition(ctx, "converted", converted);
        return converted;
    } catch (const LedgerError& e) {
        ctx.log_warn(DOCUMENT_DOMAIN, "convert_rejected",
            {{"document_id", document_id}, {"error", e.what()}});
        if (reserved_any) {
            try {
                ledger_.release(ctx, reservation_id);
            } catch (const LedgerError& undo) {
                ctx.log_error(DOCUMENT_DOMAIN, "compensation_failed",
                    {{"document_id", document_id}, {"reservation_id", reservation_id}, {"error", undo.what()}});
            }
        }
        throw;
    }
}

DocumentState DocumentService::invoice(const RequestContext& ctx, const std::string& document_id) {
    std::lock_guard<std::mutex> lock(transition_locks_.for_key(document_id));
    auto state = load(document_id);
    if (!state.exists()) {
        throw NotFoundError("Document " + document_id + " not found");
    }
    validation::require_status(state.stage, retail::STAGE_CONVERTED,
        "Only sales orders can be invoiced, document is " + retail::Stage_Name(state.stage));

    const auto number = next_invoice_number(ctx, document_id);
    const auto lines = DocumentLogic::merged_lines(state);
    auto deducted = ledger_.deduct(ctx, state.reservation_id);

    try {
        auto invoiced = append_locked(ctx, document_id, [&](const DocumentState& current) {
            auto issued = helpers::pack_any(DocumentLogic::handle_invoice(current, number, ctx.audit()));
            Events events{issued};
            auto after = DocumentLogic::apply(current, issued);
            if (after.stage == retail::STAGE_SETTLED) {
                events.push_back(helpers::pack_any(DocumentLogic::handle_settle(after, loyalty_rate_bp_, ctx.audit())));
            }
            return events;
        });
        ctx.log_info(DOCUMENT_DOMAIN, "document_invoiced",
            {{"document_id", document_id}, {"invoice_number", invoiced.invoice_number},
             {"grand_total", invoiced.grand_total}, {"version", invoiced.version}});
        return invoiced;
    } catch (const LedgerError& e) {
        ctx.log_warn(DOCUMENT_DOMAIN, "invoice_rejected", {{"document_id", document_id}, {"error", e.what()}});
        for (const auto& record : deducted) {
            for (const auto& line : lines) {
                if (line.variant_id != record.variant_id) continue;
                try {
                    ledger_.reinstate(ctx, record.variant_id, record.branch_id, state.reservation_id,
                                      line.quantity, state.reservation_expires_at);
                } catch (const LedgerError& undo) {
                    ctx.log_error(DOCUMENT_DOMAIN, "compensation_failed",
                        {{"document_id", document_id}, {"variant_id", record.variant_id}, {"error", undo.what()}});
                }
            }
        }
        throw;
    }
}

DocumentState DocumentService::cancel(const RequestContext& ctx, const std::string& document_id,
                                      const std::string& reason) {
    std::lock_guard<std::mutex> lock(transition_locks_.for_key(document_id));
    auto state = load(document_id);
    DocumentLogic::handle_cancel(state, reason, ctx.audit());

    bool released = false;
    if (state.stage == retail::STAGE_CONVERTED) {
        try {
            ledger_.release(ctx, state.reservation_id);
            released = true;
        } catch (const NotFoundError&) {
            ctx.log_warn(DOCUMENT_DOMAIN, "reservation_already_released",
                {{"document_id", document_id}, {"reservation_id", state.reservation_id}});
        }
    }

    try {
        auto cancelled = append_locked(ctx, document_id, [&](const DocumentState& current) {
            return Events{helpers::pack_any(DocumentLogic::handle_cancel(current, reason, ctx.audit()))};
        });
        log_transition(ctx, "cancelled", cancelled);
        return cancelled;
    } catch (const LedgerError& e) {
        ctx.log_warn(DOCUMENT_DOMAIN, "cancel_rejected", {{"document_id", document_id}, {"error", e.what()}});
        if (released) {
            for (const auto& line : DocumentLogic::merged_lines(state)) {
                try {
                    ledger_.restore(ctx, line.variant_id, state.branch_id, state.reservation_id,
                                    line.quantity, state.reservation_expires_at);
                } catch (const LedgerError& undo) {
                    ctx.log_error(DOCUMENT_DOMAIN, "compensation_failed",
                        {{"document_id", document_id}, {"variant_id", line.variant_id}, {"error", undo.what()}});
                }
            }
        }
        throw;
    }
}

DocumentState DocumentService::apply_discount(const RequestContext& ctx, const std::string& document_id,
                                              int64_t amount, const std::string& note) {
    auto state = transition(ctx, document_id, [&](const DocumentState& current) {
        auto discount = helpers::pack_any(DocumentLogic::handle_discount(current, amount, note, ctx.audit()));
        Events events{discount};
        auto after = DocumentLogic::apply(current, discount);
        if (after.stage == retail::STAGE_SETTLED) {
            events.push_back(helpers::pack_any(DocumentLogic::handle_settle(after, loyalty_rate_bp_, ctx.audit())));
        }
        return events;
    });
    ctx.log_info(DOCUMENT_DOMAIN, "discount_applied",
        {{"document_id", document_id}, {"amount", amount}, {"balance", state.balance()},
         {"stage", retail::Stage_Name(state.stage)}});
    return state;
}

}  // namespace documents
