#include "catalog.hpp"
#include "ledgerline/errors.hpp"
#include "ledgerline/helpers.hpp"
#include "ledgerline/validation.hpp"

#include <algorithm>
#include <mutex>

namespace documents {

using namespace ledgerline;

void InMemoryCatalog::add_variant(const Variant& variant) {
    validation::require_not_empty(variant.variant_id, "variant_id");
    validation::require_non_negative(variant.unit_price, "unit_price");
    validation::require_non_negative(variant.tax_rate_bp, "tax_rate_bp");

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (entries_.count(variant.variant_id) > 0) {
        throw ValidationError("Variant " + variant.variant_id + " already exists");
    }
    Entry entry;
    entry.variant = variant;
    entry.prices.push_back({google::protobuf::Timestamp(), variant.unit_price});
    entries_.emplace(variant.variant_id, std::move(entry));
}

void InMemoryCatalog::reprice(const std::string& variant_id, int64_t unit_price,
                              const google::protobuf::Timestamp& effective_at) {
    validation::require_non_negative(unit_price, "unit_price");

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(variant_id);
    if (it == entries_.end()) {
        throw NotFoundError("Variant " + variant_id + " not found");
    }
    auto& prices = it->second.prices;
    auto pos = std::upper_bound(prices.begin(), prices.end(), effective_at,
        [](const google::protobuf::Timestamp& at, const PriceRecord& record) {
            return helpers::before(at, record.effective_at);
        });
    prices.insert(pos, {effective_at, unit_price});
}

std::optional<Variant> InMemoryCatalog::price_at(const std::string& variant_id,
                                                 const google::protobuf::Timestamp& at) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(variant_id);
    if (it == entries_.end()) return std::nullopt;

    Variant variant = it->second.variant;
    for (const auto& record : it->second.prices) {
        if (helpers::before(at, record.effective_at)) break;
        variant.unit_price = record.unit_price;
    }
    return variant;
}

std::optional<Variant> InMemoryCatalog::find_variant(const std::string& variant_id) const {
    return price_at(variant_id, helpers::now());
}

void InMemoryCustomerDirectory::add(const std::string& customer_id) {
    validation::require_not_empty(customer_id, "customer_id");
    std::unique_lock<std::shared_mutex> lock(mutex_);
    customers_.insert(customer_id);
}

bool InMemoryCustomerDirectory::exists(const std::string& customer_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return customers_.count(customer_id) > 0;
}

}  // namespace documents
