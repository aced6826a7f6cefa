#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>
#include <google/protobuf/timestamp.pb.h>
#include "ledgerline/types.pb.h"
#include "retail/procurement.pb.h"

namespace procurement {

constexpr const char* PURCHASE_DOMAIN = "purchase_order";

struct PurchaseLine {
    std::string variant_id;
    int64_t ordered = 0;
    int64_t received = 0;
    int64_t unit_cost = 0;

    int64_t outstanding() const { return ordered - received; }
};

struct PurchaseState {
    std::string po_id;
    std::string supplier_id;
    std::string branch_id;
    retail::PurchaseStatus status = retail::PURCHASE_STATUS_UNSPECIFIED;
    google::protobuf::Timestamp expected_at;
    std::vector<PurchaseLine> lines;
    std::vector<std::string> grn_ids;
    std::set<std::string> bill_numbers;
    uint32_t version = 0;

    bool exists() const { return status != retail::PURCHASE_STATUS_UNSPECIFIED; }
    bool has_grn(const std::string& grn_id) const;
    const PurchaseLine* line(const std::string& variant_id) const;
    bool fully_received() const;

    /**
     * Cumulative received / ordered, in basis points.
     */
    int32_t fill_rate_bp() const;
};

class ProcurementLogic {
public:
    static PurchaseState rebuild_state(const ledgerline::EventBook& event_book);

    static retail::PurchaseRequested handle_request(
        const PurchaseState& state, const std::string& po_id, const std::string& supplier_id,
        const std::string& branch_id, const google::protobuf::Timestamp& expected_at,
        const std::vector<retail::PurchaseItem>& items, const ledgerline::Audit& audit);

    static retail::PurchaseApproved handle_approve(const PurchaseState& state, const ledgerline::Audit& audit);

    /**
     * Lines naming the same variant are summed. The whole receipt is rejected
     * if any variant would exceed its outstanding quantity.
     */
    static retail::GoodsReceived handle_receive(
        const PurchaseState& state, const std::string& grn_id, const std::string& bill_number,
        const google::protobuf::Timestamp& received_at, const std::vector<retail::GrnLine>& lines,
        const ledgerline::Audit& audit);

    /**
     * Rating of a receipt already folded into state.
     */
    static retail::DeliveryRated rate_delivery(
        const PurchaseState& state, const retail::GoodsReceived& receipt, const ledgerline::Audit& audit);

    static retail::PurchaseClosed handle_close(
        const PurchaseState& state, const std::string& reason, const ledgerline::Audit& audit);

    static retail::PurchaseCancelled handle_cancel(
        const PurchaseState& state, const std::string& reason, const ledgerline::Audit& audit);

    static PurchaseState apply(PurchaseState state, const google::protobuf::Any& event);
};

}  // namespace procurement
