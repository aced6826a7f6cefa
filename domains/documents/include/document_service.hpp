#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include <google/protobuf/any.pb.h>
#include "ledgerline/config.hpp"
#include "ledgerline/context.hpp"
#include "ledgerline/event_store.hpp"
#include "ledgerline/key_locks.hpp"
#include "ledgerline/retry.hpp"
#include "catalog.hpp"
#include "document_logic.hpp"
#include "stock_ledger.hpp"

namespace documents {

struct QuoteRequest {
    std::string variant_id;
    int64_t quantity = 0;
};

/**
 * Quotation -> SalesOrder -> Invoice workflow.
 *
 * Transitions on one document are serialized by a per-document lock and
 * guarded by the stream version. Transitions with ledger effects commit the
 * ledger first and compensate it if the document append then fails.
 */
class DocumentService {
public:
    using Decide = std::function<std::vector<google::protobuf::Any>(const DocumentState&)>;

    DocumentService(ledgerline::EventStore& store, stock::StockLedger& ledger,
                    const Catalog& catalog, const CustomerDirectory& customers,
                    const ledgerline::EngineConfig& config);

    /**
     * Draft a quotation, snapshotting current price and tax per line.
     * An empty document_id is replaced with a generated one.
     */
    DocumentState create_quotation(const ledgerline::RequestContext& ctx, const std::string& document_id,
                                   const std::string& customer_id, const std::string& branch_id,
                                   const std::vector<QuoteRequest>& lines);

    DocumentState revise(const ledgerline::RequestContext& ctx, const std::string& document_id,
                         const std::vector<QuoteRequest>& lines);

    DocumentState approve(const ledgerline::RequestContext& ctx, const std::string& document_id);

    /**
     * Reserve every line, all or nothing.
     */
    DocumentState convert(const ledgerline::RequestContext& ctx, const std::string& document_id);

    /**
     * Deduct the reservation and fix the tax-inclusive totals.
     */
    DocumentState invoice(const ledgerline::RequestContext& ctx, const std::string& document_id);

    DocumentState cancel(const ledgerline::RequestContext& ctx, const std::string& document_id,
                         const std::string& reason);

    DocumentState apply_discount(const ledgerline::RequestContext& ctx, const std::string& document_id,
                                 int64_t amount, const std::string& note);

    /**
     * @throws NotFoundError if the document does not exist
     */
    DocumentState get(const std::string& document_id) const;

    std::vector<ledgerline::EventPage> history(const std::string& document_id) const;

    /**
     * Load, decide and append under the document's transition lock,
     * retrying the whole round trip on a version conflict.
     */
    DocumentState transition(const ledgerline::RequestContext& ctx, const std::string& document_id,
                             const Decide& decide);

    int32_t loyalty_rate_bp() const { return loyalty_rate_bp_; }

private:
    DocumentState load(const std::string& document_id) const;
    DocumentState append_locked(const ledgerline::RequestContext& ctx, const std::string& document_id,
                                const Decide& decide);
    std::vector<retail::LineItem> price_lines(const std::vector<QuoteRequest>& lines) const;
    std::string next_invoice_number(const ledgerline::RequestContext& ctx, const std::string& document_id);
    void log_transition(const ledgerline::RequestContext& ctx, const std::string& action,
                        const DocumentState& state) const;

    ledgerline::EventStore& store_;
    stock::StockLedger& ledger_;
    const Catalog& catalog_;
    const CustomerDirectory& customers_;
    ledgerline::RetryPolicy policy_;
    int64_t reservation_ttl_seconds_;
    int32_t loyalty_rate_bp_;
    ledgerline::KeyLocks transition_locks_;
};

}  // namespace documents
