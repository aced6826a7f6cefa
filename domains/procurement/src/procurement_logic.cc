#include "procurement_logic.hpp"
#include "ledgerline/errors.hpp"
#include "ledgerline/helpers.hpp"
#include "ledgerline/state_router.hpp"
#include "ledgerline/validation.hpp"

#include <algorithm>
#include <map>

namespace procurement {

using namespace ledgerline;

namespace {

constexpr int64_t SECONDS_PER_DAY = 86400;

std::string status_name(retail::PurchaseStatus status) {
    return retail::PurchaseStatus_Name(status);
}

void require_exists(const PurchaseState& state) {
    if (!state.exists()) {
        throw NotFoundError("Purchase order does not exist");
    }
}

const StateRouter<PurchaseState>& router() {
    static const StateRouter<PurchaseState> instance = [] {
        StateRouter<PurchaseState> r;
        r.on<retail::PurchaseRequested>([](PurchaseState& s, const retail::PurchaseRequested& e) {
            s.po_id = e.po_id();
            s.supplier_id = e.supplier_id();
            s.branch_id = e.branch_id();
            s.expected_at = e.expected_at();
            s.lines.clear();
            for (const auto& item : e.items()) {
                s.lines.push_back({item.variant_id(), item.ordered(), 0, item.unit_cost()});
            }
            s.status = retail::PURCHASE_STATUS_REQUESTED;
        });
        r.on<retail::PurchaseApproved>([](PurchaseState& s, const retail::PurchaseApproved&) {
            s.status = retail::PURCHASE_STATUS_APPROVED;
        });
        r.on<retail::GoodsReceived>([](PurchaseState& s, const retail::GoodsReceived& e) {
            for (const auto& received : e.lines()) {
                for (auto& line : s.lines) {
                    if (line.variant_id == received.variant_id()) line.received += received.quantity();
                }
            }
            s.grn_ids.push_back(e.grn_id());
            s.bill_numbers.insert(e.bill_number());
            s.status = e.status_after();
        });
        r.on<retail::PurchaseClosed>([](PurchaseState& s, const retail::PurchaseClosed&) {
            s.status = retail::PURCHASE_STATUS_CLOSED;
        });
        r.on<retail::PurchaseCancelled>([](PurchaseState& s, const retail::PurchaseCancelled&) {
            s.status = retail::PURCHASE_STATUS_CANCELLED;
        });
        return r;
    }();
    return instance;
}

} // anonymous namespace

bool PurchaseState::has_grn(const std::string& grn_id) const {
    return std::find(grn_ids.begin(), grn_ids.end(), grn_id) != grn_ids.end();
}

const PurchaseLine* PurchaseState::line(const std::string& variant_id) const {
    for (const auto& candidate : lines) {
        if (candidate.variant_id == variant_id) return &candidate;
    }
    return nullptr;
}

bool PurchaseState::fully_received() const {
    return std::all_of(lines.begin(), lines.end(),
                       [](const PurchaseLine& l) { return l.outstanding() == 0; });
}

int32_t PurchaseState::fill_rate_bp() const {
    int64_t ordered = 0;
    int64_t received = 0;
    for (const auto& l : lines) {
        ordered += l.ordered;
        received += l.received;
    }
    if (ordered == 0) return 0;
    return static_cast<int32_t>(received * 10000 / ordered);
}

PurchaseState ProcurementLogic::rebuild_state(const EventBook& event_book) {
    auto state = router().fold(event_book, PurchaseState{});
    state.version = helpers::stream_version(event_book);
    return state;
}

PurchaseState ProcurementLogic::apply(PurchaseState state, const google::protobuf::Any& event) {
    router().apply(state, event);
    return state;
}

retail::PurchaseRequested ProcurementLogic::handle_request(
    const PurchaseState& state, const std::string& po_id, const std::string& supplier_id,
    const std::string& branch_id, const google::protobuf::Timestamp& expected_at,
    const std::vector<retail::PurchaseItem>& items, const Audit& audit) {
    if (state.exists()) {
        throw InvalidStateTransitionError("Purchase order " + po_id + " already exists");
    }
    validation::require_not_empty(po_id, "po_id");
    validation::require_not_empty(supplier_id, "supplier_id");
    validation::require_not_empty(branch_id, "branch_id");
    validation::require_not_empty(items, "purchase items");

    std::vector<std::string> seen;
    for (const auto& item : items) {
        validation::require_not_empty(item.variant_id(), "item variant_id");
        validation::require_positive(item.ordered(), "item ordered quantity");
        validation::require_non_negative(item.unit_cost(), "item unit_cost");
        if (std::find(seen.begin(), seen.end(), item.variant_id()) != seen.end()) {
            throw ValidationError("Variant " + item.variant_id() + " is listed twice");
        }
        seen.push_back(item.variant_id());
    }

    retail::PurchaseRequested event;
    event.set_po_id(po_id);
    event.set_supplier_id(supplier_id);
    event.set_branch_id(branch_id);
    if (helpers::is_set(expected_at)) {
        *event.mutable_expected_at() = expected_at;
    }
    for (const auto& item : items) {
        *event.add_items() = item;
    }
    *event.mutable_audit() = audit;
    return event;
}

retail::PurchaseApproved ProcurementLogic::handle_approve(const PurchaseState& state, const Audit& audit) {
    require_exists(state);
    validation::require_status(state.status, retail::PURCHASE_STATUS_REQUESTED,
        "Only requested purchase orders can be approved, order is " + status_name(state.status));

    retail::PurchaseApproved event;
    *event.mutable_audit() = audit;
    return event;
}

retail::GoodsReceived ProcurementLogic::handle_receive(
    const PurchaseState& state, const std::string& grn_id, const std::string& bill_number,
    const google::protobuf::Timestamp& received_at, const std::vector<retail::GrnLine>& lines,
    const Audit& audit) {
    require_exists(state);
    validation::require_status_in(state.status,
        {retail::PURCHASE_STATUS_APPROVED, retail::PURCHASE_STATUS_PARTIALLY_RECEIVED},
        "Goods can only be received against approved orders, order is " + status_name(state.status));
    validation::require_not_empty(grn_id, "grn_id");
    validation::require_not_empty(bill_number, "bill_number");
    validation::require_not_empty(lines, "goods receipt lines");
    if (state.has_grn(grn_id)) {
        throw ValidationError("Goods receipt " + grn_id + " already recorded on " + state.po_id);
    }
    if (state.bill_numbers.count(bill_number) > 0) {
        throw ValidationError("Bill number " + bill_number + " already recorded on " + state.po_id);
    }

    std::map<std::string, int64_t> totals;
    for (const auto& line : lines) {
        validation::require_positive(line.quantity(), "receipt quantity");
        if (state.line(line.variant_id()) == nullptr) {
            throw ValidationError("Variant " + line.variant_id() + " is not on " + state.po_id);
        }
        totals[line.variant_id()] += line.quantity();
    }

    bool complete = true;
    for (const auto& ordered : state.lines) {
        auto it = totals.find(ordered.variant_id);
        int64_t receiving = it == totals.end() ? 0 : it->second;
        if (receiving > ordered.outstanding()) {
            throw ValidationError("Receipt of " + std::to_string(receiving) + " " + ordered.variant_id +
                                  " exceeds outstanding " + std::to_string(ordered.outstanding()));
        }
        if (receiving < ordered.outstanding()) complete = false;
    }

    retail::GoodsReceived event;
    event.set_grn_id(grn_id);
    event.set_bill_number(bill_number);
    *event.mutable_received_at() = helpers::is_set(received_at) ? received_at : helpers::now();
    for (const auto& line : lines) {
        *event.add_lines() = line;
    }
    event.set_status_after(complete ? retail::PURCHASE_STATUS_CLOSED : retail::PURCHASE_STATUS_PARTIALLY_RECEIVED);
    *event.mutable_audit() = audit;
    return event;
}

retail::DeliveryRated ProcurementLogic::rate_delivery(
    const PurchaseState& state, const retail::GoodsReceived& receipt, const Audit& audit) {
    int64_t days_late = 0;
    if (helpers::is_set(state.expected_at)) {
        int64_t late_seconds = receipt.received_at().seconds() - state.expected_at.seconds();
        days_late = std::max<int64_t>(0, late_seconds / SECONDS_PER_DAY);
    }

    retail::DeliveryRated event;
    event.set_po_id(state.po_id);
    event.set_grn_id(receipt.grn_id());
    event.set_days_late(days_late);
    event.set_fill_rate_bp(state.fill_rate_bp());
    *event.mutable_audit() = audit;
    return event;
}

retail::PurchaseClosed ProcurementLogic::handle_close(
    const PurchaseState& state, const std::string& reason, const Audit& audit) {
    require_exists(state);
    validation::require_status(state.status, retail::PURCHASE_STATUS_PARTIALLY_RECEIVED,
        "Only partially received orders can be short-closed, order is " + status_name(state.status));

    retail::PurchaseClosed event;
    event.set_reason(reason);
    *event.mutable_audit() = audit;
    return event;
}

retail::PurchaseCancelled ProcurementLogic::handle_cancel(
    const PurchaseState& state, const std::string& reason, const Audit& audit) {
    require_exists(state);
    validation::require_status_in(state.status,
        {retail::PURCHASE_STATUS_REQUESTED, retail::PURCHASE_STATUS_APPROVED},
        "Purchase order in status " + status_name(state.status) + " cannot be cancelled");

    retail::PurchaseCancelled event;
    event.set_reason(reason);
    *event.mutable_audit() = audit;
    return event;
}

}  // namespace procurement
