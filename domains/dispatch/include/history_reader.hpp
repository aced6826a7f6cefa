#pragma once

#include <map>
#include <string>
#include <vector>
#include "ledgerline/event_store.hpp"
#include "ledgerline/logging.hpp"
#include "ledgerline/types.pb.h"

namespace dispatch {

/**
 * Read access to raw event streams, gated by the caller's role per domain.
 *
 * Document and loyalty streams are open to the sales counter, stock and
 * purchase order streams to inventory, and internal streams (invoice
 * numbering, sync bookkeeping) to admins only.
 */
class HistoryReader {
public:
    HistoryReader(const ledgerline::EventStore& store, ledgerline::Logger& logger);

    /**
     * @throws UnauthenticatedError if the query carries no principal
     * @throws ValidationError if domain or root is missing, or the domain is unknown
     * @throws PermissionDeniedError if the role may not read the domain
     */
    ledgerline::EventBook read(const ledgerline::HistoryQuery& query) const;

    std::vector<std::string> domains() const;

private:
    ledgerline::EventBook authorized_read(const ledgerline::HistoryQuery& query) const;

    const ledgerline::EventStore& store_;
    ledgerline::Logger& logger_;
    std::map<std::string, std::vector<std::string>> readers_;
};

}  // namespace dispatch
