#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>
#include <google/protobuf/timestamp.pb.h>

namespace documents {

struct Variant {
    std::string variant_id;
    std::string product_id;
    std::string sku;
    int64_t unit_price = 0;
    int32_t tax_rate_bp = 0;
    bool is_set = false;
};

/**
 * Read-only product catalog collaborator.
 */
class Catalog {
public:
    virtual ~Catalog() = default;

    /**
     * Variant with the price in effect now.
     */
    virtual std::optional<Variant> find_variant(const std::string& variant_id) const = 0;
};

/**
 * Catalog held in memory. Prices are never overwritten: a reprice appends a
 * record effective from a point in time, and lookups resolve the record in
 * effect at the requested time.
 */
class InMemoryCatalog : public Catalog {
public:
    /**
     * @throws ValidationError on a missing id, negative price or tax, or a duplicate variant
     */
    void add_variant(const Variant& variant);

    /**
     * @throws NotFoundError if the variant is unknown
     */
    void reprice(const std::string& variant_id, int64_t unit_price,
                 const google::protobuf::Timestamp& effective_at);

    std::optional<Variant> price_at(const std::string& variant_id,
                                    const google::protobuf::Timestamp& at) const;

    std::optional<Variant> find_variant(const std::string& variant_id) const override;

private:
    struct PriceRecord {
        google::protobuf::Timestamp effective_at;
        int64_t unit_price = 0;
    };

    struct Entry {
        Variant variant;
        std::vector<PriceRecord> prices;
    };

    mutable std::shared_mutex mutex_;
    std::map<std::string, Entry> entries_;
};

/**
 * Customer master-data collaborator.
 */
class CustomerDirectory {
public:
    virtual ~CustomerDirectory() = default;
    virtual bool exists(const std::string& customer_id) const = 0;
};

class InMemoryCustomerDirectory : public CustomerDirectory {
public:
    void add(const std::string& customer_id);
    bool exists(const std::string& customer_id) const override;

private:
    mutable std::shared_mutex mutex_;
    std::set<std::string> customers_;
};

}  // namespace documents
