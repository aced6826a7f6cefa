#include "ledgerline/helpers.hpp"

#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace ledgerline {
namespace helpers {

google::protobuf::Timestamp now() {
    return to_timestamp(std::chrono::system_clock::now());
}

google::protobuf::Timestamp to_timestamp(std::chrono::system_clock::time_point tp) {
    auto duration = tp.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(duration - seconds);

    google::protobuf::Timestamp ts;
    ts.set_seconds(seconds.count());
    ts.set_nanos(static_cast<int32_t>(nanos.count()));
    return ts;
}

std::chrono::system_clock::time_point to_time_point(const google::protobuf::Timestamp& ts) {
    auto since_epoch = std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos());
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
}

std::string iso8601(const google::protobuf::Timestamp& ts) {
    std::time_t t = static_cast<std::time_t>(ts.seconds());
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::stringstream ss;
    ss << std::put_time(&tm, "%FT%TZ");
    return ss.str();
}

std::string new_id() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    static const char hex_chars[] = "0123456789abcdef";

    std::string hex;
    hex.reserve(32);
    for (int word = 0; word < 2; ++word) {
        uint64_t bits = engine();
        for (int i = 0; i < 16; ++i) {
            hex.push_back(hex_chars[bits & 0x0f]);
            bits >>= 4;
        }
    }
    return hex;
}

} // namespace helpers
} // namespace ledgerline
