#pragma once

#include <array>
#include <functional>
#include <mutex>
#include <string>

namespace ledgerline {

/**
 * Fixed set of mutexes selected by key hash. Two keys may share a stripe;
 * a stripe is never held while acquiring another one.
 */
class KeyLocks {
public:
    static constexpr size_t STRIPES = 64;

    std::mutex& for_key(const std::string& key) {
        return stripes_[std::hash<std::string>{}(key) % STRIPES];
    }

private:
    std::array<std::mutex, STRIPES> stripes_;
};

} // namespace ledgerline
