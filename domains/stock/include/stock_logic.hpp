#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <unordered_set>
#include <google/protobuf/timestamp.pb.h>
#include "ledgerline/types.pb.h"
#include "retail/stock.pb.h"

namespace stock {

constexpr const char* STOCK_DOMAIN = "stock";
constexpr const char* RESERVATION_DOMAIN = "reservation";
constexpr const char* JOURNAL_DOMAIN = "journal";

/**
 * Stream root of the record for (variant, branch).
 */
inline std::string record_key(const std::string& variant_id, const std::string& branch_id) {
    return variant_id + "@" + branch_id;
}

struct Reservation {
    std::string reference;
    int64_t quantity = 0;
    google::protobuf::Timestamp expires_at;
};

/**
 * Folded view of one (variant, branch) stock stream.
 * Invariant: 0 <= reserved <= on_hand, reserved == sum of reservations.
 */
struct StockRecord {
    std::string variant_id;
    std::string branch_id;
    int64_t on_hand = 0;
    int64_t reserved = 0;
    uint32_t version = 0;
    std::map<std::string, Reservation> reservations;
    // Refs whose reservation was released or deducted on this record.
    std::set<std::string> consumed_refs;
    std::unordered_set<std::string> movement_ids;

    int64_t available() const { return on_hand - reserved; }
    bool holds(const std::string& reference) const { return reservations.count(reference) > 0; }
    bool consumed(const std::string& reference) const { return consumed_refs.count(reference) > 0; }
};

class StockLogic {
public:
    static StockRecord rebuild_state(const ledgerline::EventBook& event_book,
                                     const std::string& variant_id, const std::string& branch_id);

    static retail::StockMovement handle_reserve(
        const StockRecord& state, int64_t quantity, const std::string& reference,
        const google::protobuf::Timestamp& expires_at);

    static retail::StockMovement handle_release(const StockRecord& state, const std::string& reference);

    static retail::StockMovement handle_deduct(const StockRecord& state, const std::string& reference);

    static retail::StockMovement handle_reinstate(
        const StockRecord& state, const std::string& reference, int64_t quantity,
        const google::protobuf::Timestamp& expires_at = {});

    static retail::StockMovement handle_replenish(
        const StockRecord& state, int64_t quantity, const std::string& reference);

    static retail::StockMovement handle_adjust(
        const StockRecord& state, int64_t delta, const std::string& reason);

    /**
     * Fold one movement into a record. Unknown kinds leave the record unchanged.
     */
    static StockRecord apply(StockRecord state, const retail::StockMovement& movement);

    static retail::StockRecordSnapshot to_snapshot(const StockRecord& state);

private:
    static StockRecord from_snapshot(const retail::StockRecordSnapshot& snapshot);
};

}  // namespace stock
