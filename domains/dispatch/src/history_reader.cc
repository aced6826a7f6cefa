#include "history_reader.hpp"
#include "command_dispatcher.hpp"
#include "document_logic.hpp"
#include "ledgerline/command_router.hpp"
#include "ledgerline/errors.hpp"
#include "payment_logic.hpp"
#include "procurement_logic.hpp"
#include "stock_logic.hpp"
#include "sync_coordinator.hpp"

namespace dispatch {

using namespace ledgerline;

HistoryReader::HistoryReader(const EventStore& store, Logger& logger)
    : store_(store), logger_(logger) {
    const std::vector<std::string> counter{roles::ADMIN, roles::SALES, roles::CASHIER};
    const std::vector<std::string> warehouse{roles::ADMIN, roles::INVENTORY};
    const std::vector<std::string> admin_only{roles::ADMIN};

    readers_[documents::DOCUMENT_DOMAIN] = counter;
    readers_[payments::LOYALTY_DOMAIN] = counter;
    readers_[stock::STOCK_DOMAIN] = warehouse;
    readers_[stock::RESERVATION_DOMAIN] = warehouse;
    readers_[stock::JOURNAL_DOMAIN] = warehouse;
    readers_[procurement::PURCHASE_DOMAIN] = warehouse;
    readers_[documents::INVOICE_NUMBER_DOMAIN] = admin_only;
    readers_[branch_sync::SYNC_DOMAIN] = admin_only;
}

EventBook HistoryReader::read(const HistoryQuery& query) const {
    try {
        return authorized_read(query);
    } catch (const LedgerError& e) {
        logger_.warn("dispatch", "history_rejected",
            {{"domain", query.domain()}, {"root", query.root()},
             {"correlation_id", query.correlation_id()},
             {"actor", query.principal().user_id()},
             {"code", static_cast<int>(e.status_code())}, {"error", e.what()}});
        throw;
    }
}

EventBook HistoryReader::authorized_read(const HistoryQuery& query) const {
    require_principal(query.has_principal() ? &query.principal() : nullptr);
    if (query.domain().empty() || query.root().empty()) {
        throw ValidationError("History needs domain and root");
    }
    auto it = readers_.find(query.domain());
    if (it == readers_.end()) {
        throw ValidationError("Unknown history domain: " + query.domain());
    }
    require_role(query.principal(), it->second, "read " + query.domain() + " history");

    EventBook book;
    book.mutable_cover()->set_domain(query.domain());
    book.mutable_cover()->set_root(query.root());
    book.mutable_cover()->set_correlation_id(query.correlation_id());
    for (auto& page : store_.read(query.domain(), query.root(), query.after_sequence(), query.limit())) {
        *book.add_pages() = std::move(page);
    }
    return book;
}

std::vector<std::string> HistoryReader::domains() const {
    std::vector<std::string> names;
    for (const auto& entry : readers_) {
        names.push_back(entry.first);
    }
    return names;
}

}  // namespace dispatch
