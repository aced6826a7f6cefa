#pragma once

#include <cstdint>
#include <string>
#include <chrono>
#include <google/protobuf/any.pb.h>
#include <google/protobuf/timestamp.pb.h>
#include "ledgerline/types.pb.h"

namespace ledgerline {

/**
 * Helper functions for working with ledgerline types.
 */
namespace helpers {

constexpr const char* TYPE_URL_PREFIX = "type.googleapis.com/";

/**
 * Extract the type name from a type URL.
 */
inline std::string type_name_from_url(const std::string& type_url) {
    auto pos = type_url.rfind('/');
    return pos != std::string::npos ? type_url.substr(pos + 1) : type_url;
}

/**
 * Check if a type URL matches the given fully qualified type name.
 * @param type_url Full type URL (e.g., "type.googleapis.com/retail.PaymentApplied")
 * @param type_name Fully qualified type name (e.g., "retail.PaymentApplied")
 */
inline bool type_url_matches(const std::string& type_url, const std::string& type_name) {
    return type_url == std::string(TYPE_URL_PREFIX) + type_name;
}

/**
 * Version of a stream: sequence of its last event, or of its snapshot when
 * no pages follow it, or 0 for an empty stream.
 */
inline uint32_t stream_version(const EventBook& book) {
    if (book.pages_size() > 0) {
        return book.pages(book.pages_size() - 1).sequence();
    }
    return book.has_snapshot() ? book.snapshot().sequence() : 0;
}

/**
 * Get the current timestamp as a protobuf Timestamp.
 */
google::protobuf::Timestamp now();

/**
 * Convert between protobuf timestamps and system_clock time points.
 */
google::protobuf::Timestamp to_timestamp(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point to_time_point(const google::protobuf::Timestamp& ts);

/**
 * A timestamp is "set" when it is not the epoch default.
 */
inline bool is_set(const google::protobuf::Timestamp& ts) {
    return ts.seconds() != 0 || ts.nanos() != 0;
}

/**
 * Strict ordering on timestamps.
 */
inline bool before(const google::protobuf::Timestamp& a, const google::protobuf::Timestamp& b) {
    return a.seconds() < b.seconds() || (a.seconds() == b.seconds() && a.nanos() < b.nanos());
}

/**
 * Format a timestamp as ISO-8601 UTC (seconds precision).
 */
std::string iso8601(const google::protobuf::Timestamp& ts);

/**
 * Random 128-bit identifier rendered as 32 hex characters.
 */
std::string new_id();

/**
 * Pack a protobuf message into an Any.
 */
template<typename T>
google::protobuf::Any pack_any(const T& message) {
    google::protobuf::Any any;
    any.PackFrom(message, TYPE_URL_PREFIX);
    return any;
}

} // namespace helpers
} // namespace ledgerline
