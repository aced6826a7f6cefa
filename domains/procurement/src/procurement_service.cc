#include "procurement_service.hpp"
#include "ledgerline/errors.hpp"
#include "ledgerline/helpers.hpp"

#include <map>
#include <mutex>

namespace procurement {

using namespace ledgerline;

namespace {

using Events = std::vector<google::protobuf::Any>;

std::string receipt_reference(const std::string& po_id, const std::string& grn_id) {
    return po_id + "/" + grn_id;
}

} // anonymous namespace

ProcurementService::ProcurementService(EventStore& store, stock::StockLedger& ledger,
                                       const EngineConfig& config)
    : store_(store), ledger_(ledger), policy_(config.retry_policy()) {}

template<typename Decide>
PurchaseState ProcurementService::transition(const RequestContext& ctx, const std::string& po_id,
                                             const Decide& decide) {
    std::lock_guard<std::mutex> lock(order_locks_.for_key(po_id));
    return retry_on_conflict(policy_, ctx, PURCHASE_DOMAIN, [&]() {
        auto state = ProcurementLogic::rebuild_state(store_.load(PURCHASE_DOMAIN, po_id));
        Events events{helpers::pack_any(decide(state))};
        auto version = store_.append(PURCHASE_DOMAIN, po_id, state.version, events);
        state = ProcurementLogic::apply(std::move(state), events.front());
        state.version = version;
        return state;
    });
}

PurchaseState ProcurementService::request(const RequestContext& ctx, const std::string& po_id,
                                          const std::string& supplier_id, const std::string& branch_id,
                                          const google::protobuf::Timestamp& expected_at,
                                          const std::vector<retail::PurchaseItem>& items) {
    auto state = transition(ctx, po_id, [&](const PurchaseState& current) {
        return ProcurementLogic::handle_request(current, po_id, supplier_id, branch_id, expected_at,
                                                items, ctx.audit());
    });
    ctx.log_info(PURCHASE_DOMAIN, "purchase_requested",
        {{"po_id", po_id}, {"supplier_id", supplier_id}, {"branch_id", branch_id},
         {"lines", items.size()}});
    return state;
}

PurchaseState ProcurementService::approve(const RequestContext& ctx, const std::string& po_id) {
    auto state = transition(ctx, po_id, [&](const PurchaseState& current) {
        return ProcurementLogic::handle_approve(current, ctx.audit());
    });
    ctx.log_info(PURCHASE_DOMAIN, "purchase_approved", {{"po_id", po_id}});
    return state;
}

PurchaseState ProcurementService::receive(const RequestContext& ctx, const std::string& po_id,
                                          const GoodsReceipt& receipt) {
    std::lock_guard<std::mutex> lock(order_locks_.for_key(po_id));
    auto state = ProcurementLogic::rebuild_state(store_.load(PURCHASE_DOMAIN, po_id));
    try {
        ProcurementLogic::handle_receive(state, receipt.grn_id, receipt.bill_number,
                                         receipt.received_at, receipt.lines, ctx.audit());
    } catch (const LedgerError& e) {
        ctx.log_warn(PURCHASE_DOMAIN, "receipt_rejected",
            {{"po_id", po_id}, {"grn_id", receipt.grn_id}, {"error", e.what()}});
        throw;
    }

    std::map<std::string, int64_t> quantities;
    for (const auto& line : receipt.lines) {
        quantities[line.variant_id()] += line.quantity();
    }

    const auto reference = receipt_reference(po_id, receipt.grn_id);
    std::vector<std::pair<std::string, int64_t>> posted;
    try {
        for (const auto& entry : quantities) {
            ledger_.replenish(ctx, entry.first, state.branch_id, entry.second, reference);
            posted.emplace_back(entry.first, entry.second);
        }

        auto received = retry_on_conflict(policy_, ctx, PURCHASE_DOMAIN, [&]() {
            auto current = ProcurementLogic::rebuild_state(store_.load(PURCHASE_DOMAIN, po_id));
            auto goods = ProcurementLogic::handle_receive(current, receipt.grn_id, receipt.bill_number,
                                                          receipt.received_at, receipt.lines, ctx.audit());
            auto after = ProcurementLogic::apply(current, helpers::pack_any(goods));
            auto rating = ProcurementLogic::rate_delivery(after, goods, ctx.audit());
            Events events{helpers::pack_any(goods), helpers::pack_any(rating)};
            after.version = store_.append(PURCHASE_DOMAIN, po_id, current.version, events);
            ctx.log_info(PURCHASE_DOMAIN, "goods_received",
                {{"po_id", po_id}, {"grn_id", receipt.grn_id}, {"bill_number", receipt.bill_number},
                 {"status", retail::PurchaseStatus_Name(after.status)},
                 {"days_late", rating.days_late()}, {"fill_rate_bp", rating.fill_rate_bp()}});
            return after;
        });
        return received;
    } catch (const LedgerError& e) {
        ctx.log_warn(PURCHASE_DOMAIN, "receipt_failed",
            {{"po_id", po_id}, {"grn_id", receipt.grn_id}, {"error", e.what()}});
        for (const auto& entry : posted) {
            try {
                ledger_.adjust(ctx, entry.first, state.branch_id, -entry.second, "reversal of " + reference);
            } catch (const LedgerError& undo) {
                ctx.log_error(PURCHASE_DOMAIN, "compensation_failed",
                    {{"po_id", po_id}, {"variant_id", entry.first}, {"quantity", entry.second},
                     {"error", undo.what()}});
            }
        }
        throw;
    }
}

PurchaseState ProcurementService::close(const RequestContext& ctx, const std::string& po_id,
                                        const std::string& reason) {
    auto state = transition(ctx, po_id, [&](const PurchaseState& current) {
        return ProcurementLogic::handle_close(current, reason, ctx.audit());
    });
    ctx.log_info(PURCHASE_DOMAIN, "purchase_closed", {{"po_id", po_id}, {"reason", reason}});
    return state;
}

PurchaseState ProcurementService::cancel(const RequestContext& ctx, const std::string& po_id,
                                         const std::string& reason) {
    auto state = transition(ctx, po_id, [&](const PurchaseState& current) {
        return ProcurementLogic::handle_cancel(current, reason, ctx.audit());
    });
    ctx.log_info(PURCHASE_DOMAIN, "purchase_cancelled", {{"po_id", po_id}, {"reason", reason}});
    return state;
}

PurchaseState ProcurementService::get(const std::string& po_id) const {
    auto state = ProcurementLogic::rebuild_state(store_.load(PURCHASE_DOMAIN, po_id));
    if (!state.exists()) {
        throw NotFoundError("Purchase order " + po_id + " not found");
    }
    return state;
}

std::vector<EventPage> ProcurementService::history(const std::string& po_id) const {
    return store_.read(PURCHASE_DOMAIN, po_id, 0);
}

std::vector<std::string> ProcurementService::purchase_orders() const {
    return store_.roots(PURCHASE_DOMAIN);
}

}  // namespace procurement
