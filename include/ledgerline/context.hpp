#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "ledgerline/types.pb.h"
#include "helpers.hpp"
#include "logging.hpp"

namespace ledgerline {

/**
 * Per-request scope handed to every workflow operation: who is acting,
 * the correlation id, and where to log. Log entries written through the
 * context carry the correlation id and actor.
 */
class RequestContext {
public:
    RequestContext(Logger& logger, Principal principal, std::string correlation_id = "")
        : logger_(logger),
          principal_(std::move(principal)),
          correlation_id_(correlation_id.empty() ? helpers::new_id() : std::move(correlation_id)) {}

    /**
     * Context for work the engine performs on its own behalf (sweeps, sync).
     */
    static RequestContext system(Logger& logger, const std::string& component) {
        Principal principal;
        principal.set_user_id("system:" + component);
        principal.set_username(component);
        principal.set_role("system");
        return RequestContext(logger, std::move(principal));
    }

    const Principal& principal() const { return principal_; }
    const std::string& correlation_id() const { return correlation_id_; }
    Logger& logger() const { return logger_; }

    Audit audit() const {
        Audit audit;
        audit.set_actor_id(principal_.user_id());
        audit.set_actor_role(principal_.role());
        audit.set_correlation_id(correlation_id_);
        *audit.mutable_at() = helpers::now();
        return audit;
    }

    void log_info(const std::string& domain, const std::string& message,
                  nlohmann::json fields = nlohmann::json::object()) const {
        logger_.info(domain, message, scoped(std::move(fields)));
    }

    void log_warn(const std::string& domain, const std::string& message,
                  nlohmann::json fields = nlohmann::json::object()) const {
        logger_.warn(domain, message, scoped(std::move(fields)));
    }

    void log_error(const std::string& domain, const std::string& message,
                   nlohmann::json fields = nlohmann::json::object()) const {
        logger_.error(domain, message, scoped(std::move(fields)));
    }

private:
    nlohmann::json scoped(nlohmann::json fields) const {
        fields["correlation_id"] = correlation_id_;
        fields["actor"] = principal_.user_id();
        return fields;
    }

    Logger& logger_;
    Principal principal_;
    std::string correlation_id_;
};

} // namespace ledgerline
