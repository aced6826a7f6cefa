#include "vendor_ratings.hpp"
#include "ledgerline/helpers.hpp"
#include "procurement_logic.hpp"

namespace procurement {

using namespace ledgerline;

namespace {

struct Tally {
    int64_t deliveries = 0;
    int64_t on_time = 0;
    int64_t fill_rate_sum = 0;
    int64_t days_late_sum = 0;
};

VendorRating summarize(const std::string& supplier_id, const Tally& tally) {
    VendorRating rating;
    rating.supplier_id = supplier_id;
    rating.deliveries = tally.deliveries;
    rating.on_time_deliveries = tally.on_time;
    if (tally.deliveries == 0) return rating;

    rating.average_fill_rate_bp = static_cast<int32_t>(tally.fill_rate_sum / tally.deliveries);
    rating.average_days_late = static_cast<double>(tally.days_late_sum) / tally.deliveries;
    double on_time_ratio = static_cast<double>(tally.on_time) / tally.deliveries;
    double fill_ratio = static_cast<double>(tally.fill_rate_sum) / tally.deliveries / 10000.0;
    rating.score = 50.0 * on_time_ratio + 50.0 * fill_ratio;
    return rating;
}

} // anonymous namespace

VendorRatings::VendorRatings(const EventStore& store) : store_(store) {}

std::map<std::string, VendorRating> VendorRatings::compute() const {
    std::map<std::string, Tally> tallies;
    for (const auto& po_id : store_.roots(PURCHASE_DOMAIN)) {
        std::string supplier_id;
        for (const auto& page : store_.read(PURCHASE_DOMAIN, po_id, 0)) {
            const auto& url = page.event().type_url();
            if (helpers::type_url_matches(url, "retail.PurchaseRequested")) {
                retail::PurchaseRequested requested;
                page.event().UnpackTo(&requested);
                supplier_id = requested.supplier_id();
            } else if (helpers::type_url_matches(url, "retail.DeliveryRated") && !supplier_id.empty()) {
                retail::DeliveryRated rated;
                page.event().UnpackTo(&rated);
                auto& tally = tallies[supplier_id];
                tally.deliveries += 1;
                if (rated.days_late() == 0) tally.on_time += 1;
                tally.fill_rate_sum += rated.fill_rate_bp();
                tally.days_late_sum += rated.days_late();
            }
        }
    }

    std::map<std::string, VendorRating> ratings;
    for (const auto& entry : tallies) {
        ratings[entry.first] = summarize(entry.first, entry.second);
    }
    return ratings;
}

std::optional<VendorRating> VendorRatings::rating(const std::string& supplier_id) const {
    auto ratings = compute();
    auto it = ratings.find(supplier_id);
    if (it == ratings.end()) return std::nullopt;
    return it->second;
}

std::vector<VendorRating> VendorRatings::all() const {
    std::vector<VendorRating> result;
    for (auto& entry : compute()) {
        result.push_back(std::move(entry.second));
    }
    return result;
}

}  // namespace procurement
