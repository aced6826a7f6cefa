#include "command_dispatcher.hpp"
#include "ledgerline/errors.hpp"
#include "ledgerline/helpers.hpp"

namespace dispatch {

using namespace ledgerline;
using google::protobuf::Any;

namespace {

std::vector<documents::QuoteRequest> quote_requests(
    const google::protobuf::RepeatedPtrField<retail::QuoteLine>& lines) {
    std::vector<documents::QuoteRequest> requests;
    for (const auto& line : lines) {
        requests.push_back({line.variant_id(), line.quantity()});
    }
    return requests;
}

Any record_list(const std::vector<stock::StockRecord>& records) {
    retail::StockRecordList list;
    for (const auto& record : records) {
        *list.add_records() = to_view(record);
    }
    return helpers::pack_any(list);
}

} // anonymous namespace

retail::StockRecordView to_view(const stock::StockRecord& record) {
    retail::StockRecordView view;
    view.set_variant_id(record.variant_id);
    view.set_branch_id(record.branch_id);
    view.set_on_hand(record.on_hand);
    view.set_reserved(record.reserved);
    view.set_available(record.available());
    view.set_version(record.version);
    return view;
}

retail::DocumentView to_view(const documents::DocumentState& state) {
    retail::DocumentView view;
    view.set_document_id(state.document_id);
    view.set_customer_id(state.customer_id);
    view.set_branch_id(state.branch_id);
    view.set_stage(state.stage);
    for (const auto& line : state.lines) {
        *view.add_lines() = line;
    }
    view.set_subtotal(state.subtotal);
    view.set_tax(state.tax);
    view.set_grand_total(state.grand_total);
    view.set_discount(state.discount);
    view.set_paid(state.paid);
    view.set_balance(state.balance());
    view.set_reservation_id(state.reservation_id);
    view.set_invoice_number(state.invoice_number);
    view.set_loyalty_points(state.loyalty_points);
    view.set_version(state.version);
    return view;
}

retail::PurchaseOrderView to_view(const procurement::PurchaseState& state) {
    retail::PurchaseOrderView view;
    view.set_po_id(state.po_id);
    view.set_supplier_id(state.supplier_id);
    view.set_branch_id(state.branch_id);
    view.set_status(state.status);
    for (const auto& line : state.lines) {
        auto* out = view.add_lines();
        out->set_variant_id(line.variant_id);
        out->set_ordered(line.ordered);
        out->set_received(line.received);
        out->set_unit_cost(line.unit_cost);
    }
    for (const auto& grn_id : state.grn_ids) {
        view.add_grn_ids(grn_id);
    }
    view.set_version(state.version);
    return view;
}

retail::VendorRatingView to_view(const procurement::VendorRating& rating) {
    retail::VendorRatingView view;
    view.set_supplier_id(rating.supplier_id);
    view.set_deliveries(rating.deliveries);
    view.set_on_time_deliveries(rating.on_time_deliveries);
    view.set_average_fill_rate_bp(rating.average_fill_rate_bp);
    view.set_average_days_late(rating.average_days_late);
    view.set_score(rating.score);
    return view;
}

CommandDispatcher::CommandDispatcher(Workflows workflows, Logger& logger)
    : workflows_(workflows), logger_(logger) {
    register_documents();
    register_ledger();
    register_procurement();
}

CommandResult CommandDispatcher::dispatch(const CommandEnvelope& envelope) const {
    try {
        return router_.dispatch(logger_, envelope);
    } catch (const LedgerError& e) {
        logger_.warn("dispatch", "command_rejected",
            {{"command", helpers::type_name_from_url(envelope.command().type_url())},
             {"correlation_id", envelope.correlation_id()},
             {"actor", envelope.principal().user_id()},
             {"code", static_cast<int>(e.status_code())}, {"error", e.what()}});
        throw;
    }
}

void CommandDispatcher::register_documents() {
    auto& docs = workflows_.document_service;
    auto& pay = workflows_.payment_account;
    auto& loyalty = workflows_.loyalty_ledger;

    router_
        .on<retail::CreateQuotation>({roles::ADMIN, roles::SALES, roles::CASHIER},
            [&docs](const RequestContext& ctx, const retail::CreateQuotation& cmd) {
                return helpers::pack_any(to_view(docs.create_quotation(
                    ctx, cmd.document_id(), cmd.customer_id(), cmd.branch_id(), quote_requests(cmd.lines()))));
            })
        .on<retail::ReviseQuotation>({roles::ADMIN, roles::SALES, roles::CASHIER},
            [&docs](const RequestContext& ctx, const retail::ReviseQuotation& cmd) {
                return helpers::pack_any(to_view(docs.revise(ctx, cmd.document_id(), quote_requests(cmd.lines()))));
            })
        .on<retail::ApproveQuotation>({roles::ADMIN},
            [&docs](const RequestContext& ctx, const retail::ApproveQuotation& cmd) {
                return helpers::pack_any(to_view(docs.approve(ctx, cmd.document_id())));
            })
        .on<retail::ConvertToSalesOrder>({roles::ADMIN, roles::CASHIER},
            [&docs](const RequestContext& ctx, const retail::ConvertToSalesOrder& cmd) {
                return helpers::pack_any(to_view(docs.convert(ctx, cmd.document_id())));
            })
        .on<retail::IssueInvoice>({roles::ADMIN, roles::CASHIER},
            [&docs](const RequestContext& ctx, const retail::IssueInvoice& cmd) {
                return helpers::pack_any(to_view(docs.invoice(ctx, cmd.document_id())));
            })
        .on<retail::CancelDocument>({roles::ADMIN, roles::CASHIER},
            [&docs](const RequestContext& ctx, const retail::CancelDocument& cmd) {
                return helpers::pack_any(to_view(docs.cancel(ctx, cmd.document_id(), cmd.reason())));
            })
        .on<retail::ApplyDiscount>({roles::ADMIN, roles::CASHIER},
            [&docs, &pay](const RequestContext& ctx, const retail::ApplyDiscount& cmd) {
                auto state = docs.apply_discount(ctx, cmd.document_id(), cmd.amount(), cmd.note());
                if (state.stage == retail::STAGE_SETTLED) {
                    pay.post_loyalty(ctx, cmd.document_id());
                }
                return helpers::pack_any(to_view(state));
            })
        .on<retail::ApplyPayment>({roles::ADMIN, roles::CASHIER},
            [&pay](const RequestContext& ctx, const retail::ApplyPayment& cmd) {
                return helpers::pack_any(to_view(pay.apply(ctx, cmd.invoice_id(), cmd.amount(), cmd.method())));
            })
        .on<retail::GetDocument>({roles::ADMIN, roles::SALES, roles::CASHIER},
            [&docs](const RequestContext&, const retail::GetDocument& cmd) {
                return helpers::pack_any(to_view(docs.get(cmd.document_id())));
            })
        .on<retail::GetLoyaltyBalance>({roles::ADMIN, roles::SALES, roles::CASHIER},
            [&loyalty](const RequestContext&, const retail::GetLoyaltyBalance& cmd) {
                retail::LoyaltyBalanceView view;
                view.set_customer_id(cmd.customer_id());
                view.set_balance(loyalty.balance(cmd.customer_id()));
                return helpers::pack_any(view);
            });
}

void CommandDispatcher::register_ledger() {
    auto& ledger = workflows_.ledger;
    auto& evaluator = workflows_.alert_evaluator;

    router_
        .on<retail::ReserveStock>({roles::ADMIN},
            [&ledger](const RequestContext& ctx, const retail::ReserveStock& cmd) {
                return helpers::pack_any(to_view(ledger.reserve(
                    ctx, cmd.variant_id(), cmd.branch_id(), cmd.quantity(), cmd.reference(), cmd.expires_at())));
            })
        .on<retail::ReleaseStock>({roles::ADMIN},
            [&ledger](const RequestContext& ctx, const retail::ReleaseStock& cmd) {
                return record_list(ledger.release(ctx, cmd.reference()));
            })
        .on<retail::DeductStock>({roles::ADMIN},
            [&ledger](const RequestContext& ctx, const retail::DeductStock& cmd) {
                return record_list(ledger.deduct(ctx, cmd.reference()));
            })
        .on<retail::ReplenishStock>({roles::ADMIN, roles::INVENTORY},
            [&ledger](const RequestContext& ctx, const retail::ReplenishStock& cmd) {
                return helpers::pack_any(to_view(ledger.replenish(
                    ctx, cmd.variant_id(), cmd.branch_id(), cmd.quantity(), cmd.reference())));
            })
        .on<retail::AdjustStock>({roles::ADMIN, roles::INVENTORY},
            [&ledger](const RequestContext& ctx, const retail::AdjustStock& cmd) {
                return helpers::pack_any(to_view(ledger.adjust(
                    ctx, cmd.variant_id(), cmd.branch_id(), cmd.delta(), cmd.reason())));
            })
        .on<retail::TransferStock>({roles::ADMIN, roles::INVENTORY},
            [&ledger](const RequestContext& ctx, const retail::TransferStock& cmd) {
                auto moved = ledger.transfer(ctx, cmd.variant_id(), cmd.from_branch_id(), cmd.to_branch_id(),
                                             cmd.quantity(), cmd.reference());
                retail::TransferView view;
                *view.mutable_source() = to_view(moved.first);
                *view.mutable_destination() = to_view(moved.second);
                return helpers::pack_any(view);
            })
        .on<retail::SetThreshold>({roles::ADMIN, roles::INVENTORY},
            [&ledger, &evaluator](const RequestContext& ctx, const retail::SetThreshold& cmd) {
                evaluator.set_threshold(cmd.variant_id(), cmd.branch_id(), cmd.threshold());
                ctx.log_info("alerts", "threshold_set",
                    {{"variant_id", cmd.variant_id()}, {"branch_id", cmd.branch_id()},
                     {"threshold", cmd.threshold()}});
                return helpers::pack_any(to_view(ledger.record(cmd.variant_id(), cmd.branch_id())));
            })
        .on<retail::ListLowStock>({roles::ADMIN, roles::INVENTORY},
            [&ledger, &evaluator](const RequestContext&, const retail::ListLowStock&) {
                retail::LowStockList list;
                for (const auto& alert : evaluator.current_alerts(ledger)) {
                    *list.add_alerts() = alert;
                }
                return helpers::pack_any(list);
            })
        .on<retail::GetStockRecord>({roles::ADMIN, roles::SALES, roles::CASHIER, roles::INVENTORY},
            [&ledger](const RequestContext&, const retail::GetStockRecord& cmd) {
                return helpers::pack_any(to_view(ledger.record(cmd.variant_id(), cmd.branch_id())));
            });
}

void CommandDispatcher::register_procurement() {
    auto& orders = workflows_.purchase_orders;
    const auto& ratings = workflows_.vendor_ratings;

    router_
        .on<retail::RequestPurchase>({roles::ADMIN, roles::INVENTORY},
            [&orders](const RequestContext& ctx, const retail::RequestPurchase& cmd) {
                std::vector<retail::PurchaseItem> items(cmd.items().begin(), cmd.items().end());
                return helpers::pack_any(to_view(orders.request(
                    ctx, cmd.po_id(), cmd.supplier_id(), cmd.branch_id(), cmd.expected_at(), items)));
            })
        .on<retail::ApprovePurchase>({roles::ADMIN, roles::INVENTORY},
            [&orders](const RequestContext& ctx, const retail::ApprovePurchase& cmd) {
                return helpers::pack_any(to_view(orders.approve(ctx, cmd.po_id())));
            })
        .on<retail::ReceiveGoods>({roles::ADMIN, roles::INVENTORY},
            [&orders](const RequestContext& ctx, const retail::ReceiveGoods& cmd) {
                procurement::GoodsReceipt receipt;
                receipt.grn_id = cmd.grn_id();
                receipt.bill_number = cmd.bill_number();
                receipt.received_at = cmd.received_at();
                receipt.lines.assign(cmd.lines().begin(), cmd.lines().end());
                return helpers::pack_any(to_view(orders.receive(ctx, cmd.po_id(), receipt)));
            })
        .on<retail::ClosePurchase>({roles::ADMIN, roles::INVENTORY},
            [&orders](const RequestContext& ctx, const retail::ClosePurchase& cmd) {
                return helpers::pack_any(to_view(orders.close(ctx, cmd.po_id(), cmd.reason())));
            })
        .on<retail::CancelPurchase>({roles::ADMIN, roles::INVENTORY},
            [&orders](const RequestContext& ctx, const retail::CancelPurchase& cmd) {
                return helpers::pack_any(to_view(orders.cancel(ctx, cmd.po_id(), cmd.reason())));
            })
        .on<retail::GetPurchaseOrder>({roles::ADMIN, roles::INVENTORY},
            [&orders](const RequestContext&, const retail::GetPurchaseOrder& cmd) {
                return helpers::pack_any(to_view(orders.get(cmd.po_id())));
            })
        .on<retail::GetVendorRating>({roles::ADMIN, roles::INVENTORY},
            [&ratings](const RequestContext&, const retail::GetVendorRating& cmd) {
                auto rating = ratings.rating(cmd.supplier_id());
                if (!rating) {
                    throw NotFoundError("No deliveries rated for supplier " + cmd.supplier_id());
                }
                return helpers::pack_any(to_view(*rating));
            });
}

}  // namespace dispatch
