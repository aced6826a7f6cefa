#include "ledgerline/logging.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace ledgerline {

namespace {

const char* level_name(Logger::Level level) {
    switch (level) {
        case Logger::Level::Debug: return "debug";
        case Logger::Level::Info: return "info";
        case Logger::Level::Warn: return "warn";
        case Logger::Level::Error: return "error";
    }
    return "info";
}

} // anonymous namespace

std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&time_t, &tm);
    std::stringstream ss;
    ss << std::put_time(&tm, "%FT%TZ");
    return ss.str();
}

void Logger::log(Level level, const std::string& domain, const std::string& message,
                 const nlohmann::json& fields) {
    if (level < min_level_) return;

    nlohmann::json log_entry = {
        {"level", level_name(level)},
        {"message", message},
        {"domain", domain},
        {"timestamp", now_iso8601()}
    };
    if (fields.is_object()) {
        for (auto& [key, value] : fields.items()) {
            log_entry[key] = value;
        }
    }

    auto line = log_entry.dump();
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << std::endl;
}

Logger::Level Logger::parse_level(const std::string& name) {
    if (name == "debug") return Level::Debug;
    if (name == "warn") return Level::Warn;
    if (name == "error") return Level::Error;
    return Level::Info;
}

} // namespace ledgerline
