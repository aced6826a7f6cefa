#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <google/protobuf/timestamp.pb.h>
#include "ledgerline/types.pb.h"
#include "retail/documents.pb.h"

namespace documents {

constexpr const char* DOCUMENT_DOMAIN = "document";
constexpr const char* INVOICE_NUMBER_DOMAIN = "invoice_number";

/**
 * Folded quotation / sales order / invoice.
 */
struct DocumentState {
    std::string document_id;
    std::string customer_id;
    std::string branch_id;
    retail::Stage stage = retail::STAGE_UNSPECIFIED;
    std::vector<retail::LineItem> lines;
    int64_t subtotal = 0;
    int64_t tax = 0;
    int64_t grand_total = 0;
    int64_t discount = 0;
    int64_t paid = 0;
    uint32_t payment_count = 0;
    std::string reservation_id;
    google::protobuf::Timestamp reservation_expires_at;
    std::string invoice_number;
    int64_t loyalty_points = 0;
    uint32_t version = 0;

    bool exists() const { return stage != retail::STAGE_UNSPECIFIED; }
    bool discounted() const { return discount > 0; }
    int64_t balance() const { return grand_total - discount - paid; }
};

/**
 * A line merged by variant, as reserved in the ledger.
 */
struct ReservedLine {
    std::string variant_id;
    int64_t quantity = 0;
};

class DocumentLogic {
public:
    static DocumentState rebuild_state(const ledgerline::EventBook& event_book);

    static retail::QuotationDrafted handle_create(
        const DocumentState& state, const std::string& document_id,
        const std::string& customer_id, const std::string& branch_id,
        const std::vector<retail::LineItem>& lines, const ledgerline::Audit& audit);

    static retail::QuotationRevised handle_revise(
        const DocumentState& state, const std::vector<retail::LineItem>& lines,
        const ledgerline::Audit& audit);

    static retail::QuotationApproved handle_approve(
        const DocumentState& state, bool customer_exists, const ledgerline::Audit& audit);

    static retail::SalesOrderConverted handle_convert(
        const DocumentState& state, const std::string& reservation_id,
        const google::protobuf::Timestamp& expires_at, const ledgerline::Audit& audit);

    static retail::InvoiceIssued handle_invoice(
        const DocumentState& state, const std::string& invoice_number, const ledgerline::Audit& audit);

    static retail::DocumentCancelled handle_cancel(
        const DocumentState& state, const std::string& reason, const ledgerline::Audit& audit);

    static retail::DiscountApplied handle_discount(
        const DocumentState& state, int64_t amount, const std::string& note,
        const ledgerline::Audit& audit);

    /**
     * Requires a zero balance. Points are floor(settled amount * loyalty rate).
     */
    static retail::DocumentSettled handle_settle(
        const DocumentState& state, int32_t loyalty_rate_bp, const ledgerline::Audit& audit);

    /**
     * Lines summed per variant in first-seen order.
     */
    static std::vector<ReservedLine> merged_lines(const DocumentState& state);

    static DocumentState apply(DocumentState state, const google::protobuf::Any& event);
};

}  // namespace documents
