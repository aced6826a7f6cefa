#pragma once

#include <string>
#include <vector>
#include <google/protobuf/timestamp.pb.h>
#include "ledgerline/config.hpp"
#include "ledgerline/context.hpp"
#include "ledgerline/event_store.hpp"
#include "ledgerline/key_locks.hpp"
#include "ledgerline/retry.hpp"
#include "procurement_logic.hpp"
#include "stock_ledger.hpp"

namespace procurement {

struct GoodsReceipt {
    std::string grn_id;
    std::string bill_number;
    google::protobuf::Timestamp received_at;
    std::vector<retail::GrnLine> lines;
};

/**
 * Purchase order lifecycle: Requested -> Approved -> PartiallyReceived -> Closed.
 *
 * Receiving goods replenishes the order's branch before the receipt is
 * recorded; the replenishments are reversed if recording fails.
 */
class ProcurementService {
public:
    ProcurementService(ledgerline::EventStore& store, stock::StockLedger& ledger,
                       const ledgerline::EngineConfig& config);

    PurchaseState request(const ledgerline::RequestContext& ctx, const std::string& po_id,
                          const std::string& supplier_id, const std::string& branch_id,
                          const google::protobuf::Timestamp& expected_at,
                          const std::vector<retail::PurchaseItem>& items);

    PurchaseState approve(const ledgerline::RequestContext& ctx, const std::string& po_id);

    /**
     * @throws ValidationError if the receipt exceeds any outstanding quantity,
     *         repeats a GRN id or bill number, or names a variant not ordered
     */
    PurchaseState receive(const ledgerline::RequestContext& ctx, const std::string& po_id,
                          const GoodsReceipt& receipt);

    /**
     * Short-close a partially received order.
     */
    PurchaseState close(const ledgerline::RequestContext& ctx, const std::string& po_id,
                        const std::string& reason);

    PurchaseState cancel(const ledgerline::RequestContext& ctx, const std::string& po_id,
                         const std::string& reason);

    /**
     * @throws NotFoundError if the order does not exist
     */
    PurchaseState get(const std::string& po_id) const;

    std::vector<ledgerline::EventPage> history(const std::string& po_id) const;

    /**
     * Ids of every purchase order stream.
     */
    std::vector<std::string> purchase_orders() const;

private:
    template<typename Decide>
    PurchaseState transition(const ledgerline::RequestContext& ctx, const std::string& po_id,
                             const Decide& decide);

    ledgerline::EventStore& store_;
    stock::StockLedger& ledger_;
    ledgerline::RetryPolicy policy_;
    ledgerline::KeyLocks order_locks_;
};

}  // namespace procurement
