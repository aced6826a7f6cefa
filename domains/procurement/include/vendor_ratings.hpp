#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "ledgerline/event_store.hpp"

namespace procurement {

struct VendorRating {
    std::string supplier_id;
    int64_t deliveries = 0;
    int64_t on_time_deliveries = 0;
    int32_t average_fill_rate_bp = 0;
    double average_days_late = 0.0;
    // 0-100: half on-time ratio, half average fill rate.
    double score = 0.0;
};

/**
 * Supplier performance derived from the DeliveryRated events recorded with
 * each goods receipt.
 */
class VendorRatings {
public:
    explicit VendorRatings(const ledgerline::EventStore& store);

    std::optional<VendorRating> rating(const std::string& supplier_id) const;

    std::vector<VendorRating> all() const;

private:
    std::map<std::string, VendorRating> compute() const;

    const ledgerline::EventStore& store_;
};

}  // namespace procurement
