#pragma once

#include <algorithm>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include <google/protobuf/any.pb.h>
#include "ledgerline/types.pb.h"
#include "context.hpp"
#include "errors.hpp"
#include "helpers.hpp"

namespace ledgerline {

/**
 * @throws UnauthenticatedError if no principal or an empty user id was supplied
 */
inline void require_principal(const Principal* principal) {
    if (principal == nullptr || principal->user_id().empty()) {
        throw UnauthenticatedError("Request requires an authenticated principal");
    }
}

/**
 * @throws PermissionDeniedError if the principal's role is not in roles
 */
inline void require_role(const Principal& principal, const std::vector<std::string>& roles,
                         const std::string& action) {
    if (std::find(roles.begin(), roles.end(), principal.role()) == roles.end()) {
        throw PermissionDeniedError("Role '" + principal.role() + "' may not " + action);
    }
}

/**
 * Command dispatcher keyed by command message type.
 *
 * Every route names the roles allowed to send it. The principal is checked
 * before the handler runs, so a rejected command has no side effects.
 */
class CommandRouter {
public:
    using Handler = std::function<google::protobuf::Any(const RequestContext&, const google::protobuf::Any&)>;

    /**
     * Register a handler for a command type.
     */
    template<typename Command>
    CommandRouter& on(std::vector<std::string> roles,
                      std::function<google::protobuf::Any(const RequestContext&, const Command&)> handler) {
        Route route;
        route.roles = std::move(roles);
        route.handler = [handler](const RequestContext& ctx, const google::protobuf::Any& any) {
            Command command;
            if (!any.UnpackTo(&command)) {
                throw ValidationError("Malformed command " + any.type_url());
            }
            return handler(ctx, command);
        };
        routes_[std::string(Command::descriptor()->full_name())] = std::move(route);
        return *this;
    }

    /**
     * Authorize and run the command carried by the envelope.
     *
     * @throws UnauthenticatedError if the envelope carries no principal
     * @throws PermissionDeniedError if the principal's role may not send the command
     * @throws ValidationError if the command type is unknown
     */
    CommandResult dispatch(Logger& logger, const CommandEnvelope& envelope) const {
        require_principal(envelope.has_principal() ? &envelope.principal() : nullptr);
        if (!envelope.has_command() || envelope.command().type_url().empty()) {
            throw ValidationError("Envelope carries no command");
        }

        const auto type_name = helpers::type_name_from_url(envelope.command().type_url());
        auto it = routes_.find(type_name);
        if (it == routes_.end()) {
            throw ValidationError("Unknown command type: " + type_name);
        }

        require_role(envelope.principal(), it->second.roles, "send " + type_name);

        RequestContext ctx(logger, envelope.principal(), envelope.correlation_id());
        CommandResult result;
        *result.mutable_view() = it->second.handler(ctx, envelope.command());
        return result;
    }

    /**
     * Registered command type names.
     */
    std::vector<std::string> types() const {
        std::vector<std::string> result;
        for (const auto& [name, _] : routes_) {
            result.push_back(name);
        }
        return result;
    }

private:
    struct Route {
        std::vector<std::string> roles;
        Handler handler;
    };

    std::map<std::string, Route> routes_;
};

} // namespace ledgerline
