#include "document_logic.hpp"
#include "ledgerline/errors.hpp"
#include "ledgerline/helpers.hpp"
#include "ledgerline/money.hpp"
#include "ledgerline/state_router.hpp"
#include "ledgerline/validation.hpp"

#include <algorithm>

namespace documents {

using namespace ledgerline;

namespace {

retail::Transition make_transition(retail::Stage from, retail::Stage to, const Audit& audit) {
    retail::Transition transition;
    transition.set_from_stage(from);
    transition.set_to_stage(to);
    *transition.mutable_audit() = audit;
    return transition;
}

std::string stage_name(retail::Stage stage) {
    return retail::Stage_Name(stage);
}

void require_exists(const DocumentState& state) {
    if (!state.exists()) {
        throw NotFoundError("Document does not exist");
    }
}

void require_valid_lines(const std::vector<retail::LineItem>& lines) {
    for (const auto& line : lines) {
        validation::require_not_empty(line.variant_id(), "line variant_id");
        validation::require_positive(line.quantity(), "line quantity");
        validation::require_non_negative(line.unit_price(), "line unit_price");
        validation::require_non_negative(line.tax_rate_bp(), "line tax_rate_bp");
    }
}

const StateRouter<DocumentState>& router() {
    static const StateRouter<DocumentState> instance = [] {
        StateRouter<DocumentState> r;
        r.on<retail::QuotationDrafted>([](DocumentState& s, const retail::QuotationDrafted& e) {
            s.document_id = e.document_id();
            s.customer_id = e.customer_id();
            s.branch_id = e.branch_id();
            s.lines.assign(e.lines().begin(), e.lines().end());
            s.stage = e.transition().to_stage();
        });
        r.on<retail::QuotationRevised>([](DocumentState& s, const retail::QuotationRevised& e) {
            s.lines.assign(e.lines().begin(), e.lines().end());
        });
        r.on<retail::QuotationApproved>([](DocumentState& s, const retail::QuotationApproved& e) {
            s.stage = e.transition().to_stage();
        });
        r.on<retail::SalesOrderConverted>([](DocumentState& s, const retail::SalesOrderConverted& e) {
            s.reservation_id = e.reservation_id();
            s.reservation_expires_at = e.reservation_expires_at();
            s.stage = e.transition().to_stage();
        });
        r.on<retail::InvoiceIssued>([](DocumentState& s, const retail::InvoiceIssued& e) {
            s.invoice_number = e.invoice_number();
            s.subtotal = e.subtotal();
            s.tax = e.tax();
            s.grand_total = e.grand_total();
            s.stage = e.transition().to_stage();
        });
        r.on<retail::DiscountApplied>([](DocumentState& s, const retail::DiscountApplied& e) {
            s.discount += e.amount();
            if (e.has_transition()) s.stage = e.transition().to_stage();
        });
        r.on<retail::PaymentApplied>([](DocumentState& s, const retail::PaymentApplied& e) {
            s.paid += e.amount();
            s.payment_count = e.payment_sequence();
            if (e.has_transition()) s.stage = e.transition().to_stage();
        });
        r.on<retail::DocumentSettled>([](DocumentState& s, const retail::DocumentSettled& e) {
            s.loyalty_points = e.loyalty_points();
        });
        r.on<retail::DocumentCancelled>([](DocumentState& s, const retail::DocumentCancelled& e) {
            s.stage = e.transition().to_stage();
        });
        return r;
    }();
    return instance;
}

} // anonymous namespace

DocumentState DocumentLogic::rebuild_state(const EventBook& event_book) {
    auto state = router().fold(event_book, DocumentState{});
    state.version = helpers::stream_version(event_book);
    return state;
}

DocumentState DocumentLogic::apply(DocumentState state, const google::protobuf::Any& event) {
    router().apply(state, event);
    return state;
}

retail::QuotationDrafted DocumentLogic::handle_create(
    const DocumentState& state, const std::string& document_id,
    const std::string& customer_id, const std::string& branch_id,
    const std::vector<retail::LineItem>& lines, const Audit& audit) {
    if (state.exists()) {
        throw InvalidStateTransitionError("Document " + document_id + " already exists");
    }
    validation::require_not_empty(document_id, "document_id");
    validation::require_not_empty(customer_id, "customer_id");
    validation::require_not_empty(branch_id, "branch_id");
    require_valid_lines(lines);

    retail::QuotationDrafted event;
    event.set_document_id(document_id);
    event.set_customer_id(customer_id);
    event.set_branch_id(branch_id);
    for (const auto& line : lines) {
        *event.add_lines() = line;
    }
    *event.mutable_transition() = make_transition(retail::STAGE_UNSPECIFIED, retail::STAGE_DRAFT, audit);
    return event;
}

retail::QuotationRevised DocumentLogic::handle_revise(
    const DocumentState& state, const std::vector<retail::LineItem>& lines, const Audit& audit) {
    require_exists(state);
    validation::require_status(state.stage, retail::STAGE_DRAFT,
        "Only draft quotations can be revised, document is " + stage_name(state.stage));
    require_valid_lines(lines);

    retail::QuotationRevised event;
    for (const auto& line : lines) {
        *event.add_lines() = line;
    }
    *event.mutable_audit() = audit;
    return event;
}

retail::QuotationApproved DocumentLogic::handle_approve(
    const DocumentState& state, bool customer_exists, const Audit& audit) {
    require_exists(state);
    validation::require_status(state.stage, retail::STAGE_DRAFT,
        "Only draft quotations can be approved, document is " + stage_name(state.stage));
    validation::require_not_empty(state.lines, "quotation lines");
    if (!customer_exists) {
        throw NotFoundError("Customer " + state.customer_id + " not found");
    }

    retail::QuotationApproved event;
    *event.mutable_transition() = make_transition(state.stage, retail::STAGE_APPROVED, audit);
    return event;
}

retail::SalesOrderConverted DocumentLogic::handle_convert(
    const DocumentState& state, const std::string& reservation_id,
    const google::protobuf::Timestamp& expires_at, const Audit& audit) {
    require_exists(state);
    validation::require_status(state.stage, retail::STAGE_APPROVED,
        "Only approved quotations can be converted, document is " + stage_name(state.stage));
    validation::require_not_empty(reservation_id, "reservation_id");

    retail::SalesOrderConverted event;
    event.set_reservation_id(reservation_id);
    if (helpers::is_set(expires_at)) {
        *event.mutable_reservation_expires_at() = expires_at;
    }
    *event.mutable_transition() = make_transition(state.stage, retail::STAGE_CONVERTED, audit);
    return event;
}

retail::InvoiceIssued DocumentLogic::handle_invoice(
    const DocumentState& state, const std::string& invoice_number, const Audit& audit) {
    require_exists(state);
    validation::require_status(state.stage, retail::STAGE_CONVERTED,
        "Only sales orders can be invoiced, document is " + stage_name(state.stage));
    validation::require_not_empty(invoice_number, "invoice_number");

    std::vector<money::Line> lines;
    for (const auto& line : state.lines) {
        lines.push_back({line.quantity(), line.unit_price(), line.tax_rate_bp()});
    }
    auto totals = money::compute_totals(lines);

    retail::InvoiceIssued event;
    event.set_invoice_number(invoice_number);
    event.set_subtotal(totals.subtotal);
    event.set_tax(totals.tax);
    event.set_grand_total(totals.grand_total);
    // Nothing is owed on a zero total invoice.
    retail::Stage next = totals.grand_total == 0 ? retail::STAGE_SETTLED : retail::STAGE_INVOICED;
    *event.mutable_transition() = make_transition(state.stage, next, audit);
    return event;
}

retail::DocumentCancelled DocumentLogic::handle_cancel(
    const DocumentState& state, const std::string& reason, const Audit& audit) {
    require_exists(state);
    validation::require_status_in(state.stage,
        {retail::STAGE_DRAFT, retail::STAGE_APPROVED, retail::STAGE_CONVERTED},
        "Document in stage " + stage_name(state.stage) + " cannot be cancelled");

    retail::DocumentCancelled event;
    event.set_reason(reason);
    *event.mutable_transition() = make_transition(state.stage, retail::STAGE_CANCELLED, audit);
    return event;
}

retail::DiscountApplied DocumentLogic::handle_discount(
    const DocumentState& state, int64_t amount, const std::string& note, const Audit& audit) {
    require_exists(state);
    validation::require_status(state.stage, retail::STAGE_INVOICED,
        "Discounts apply to unpaid invoices only, document is " + stage_name(state.stage));
    if (state.discounted()) {
        throw InvalidStateTransitionError("Invoice " + state.document_id + " is already discounted");
    }
    validation::require_positive(amount, "discount");
    if (amount > state.grand_total) {
        throw ValidationError("Discount " + std::to_string(amount) + " exceeds grand total " +
                              std::to_string(state.grand_total));
    }

    retail::DiscountApplied event;
    event.set_amount(amount);
    event.set_note(note);
    if (amount == state.grand_total) {
        *event.mutable_transition() = make_transition(state.stage, retail::STAGE_SETTLED, audit);
    }
    return event;
}

retail::DocumentSettled DocumentLogic::handle_settle(
    const DocumentState& state, int32_t loyalty_rate_bp, const Audit& audit) {
    require_exists(state);
    if (state.balance() != 0) {
        throw InvalidStateTransitionError("Invoice " + state.document_id + " still has a balance of " +
                                          std::to_string(state.balance()));
    }

    int64_t settled = state.grand_total - state.discount;
    retail::DocumentSettled event;
    event.set_settled_amount(settled);
    event.set_loyalty_points(money::loyalty_points(settled, loyalty_rate_bp));
    *event.mutable_audit() = audit;
    return event;
}

std::vector<ReservedLine> DocumentLogic::merged_lines(const DocumentState& state) {
    std::vector<ReservedLine> merged;
    for (const auto& line : state.lines) {
        auto it = std::find_if(merged.begin(), merged.end(),
            [&](const ReservedLine& r) { return r.variant_id == line.variant_id(); });
        if (it == merged.end()) {
            merged.push_back({line.variant_id(), line.quantity()});
        } else {
            it->quantity += line.quantity();
        }
    }
    return merged;
}

}  // namespace documents
