#pragma once

#include <mutex>
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>

namespace ledgerline {

std::string now_iso8601();

/**
 * JSON-lines logger. One instance is created by the process entry point and
 * handed to every component that logs; there is no global logger.
 */
class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    explicit Logger(std::ostream& out, Level min_level = Level::Info)
        : out_(out), min_level_(min_level) {}

    void log(Level level, const std::string& domain, const std::string& message,
             const nlohmann::json& fields = {});

    void info(const std::string& domain, const std::string& message,
              const nlohmann::json& fields = {}) {
        log(Level::Info, domain, message, fields);
    }

    void warn(const std::string& domain, const std::string& message,
              const nlohmann::json& fields = {}) {
        log(Level::Warn, domain, message, fields);
    }

    void error(const std::string& domain, const std::string& message,
               const nlohmann::json& fields = {}) {
        log(Level::Error, domain, message, fields);
    }

    static Level parse_level(const std::string& name);

private:
    std::ostream& out_;
    Level min_level_;
    std::mutex mutex_;
};

} // namespace ledgerline
