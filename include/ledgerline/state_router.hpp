#pragma once

#include <functional>
#include <map>
#include <string>
#include <google/protobuf/any.pb.h>
#include "ledgerline/types.pb.h"
#include "helpers.hpp"

namespace ledgerline {

/**
 * Folds an event stream into state by dispatching each page to the
 * applier registered for its message type. Unregistered types are skipped.
 */
template<typename State>
class StateRouter {
public:
    using Applier = std::function<void(State&, const google::protobuf::Any&)>;

    /**
     * Register an event applier.
     */
    template<typename Event>
    StateRouter& on(std::function<void(State&, const Event&)> applier) {
        appliers_[std::string(Event::descriptor()->full_name())] = [applier](State& state, const google::protobuf::Any& any) {
            Event event;
            any.UnpackTo(&event);
            applier(state, event);
        };
        return *this;
    }

    /**
     * Apply every page of the book on top of state.
     */
    State fold(const EventBook& book, State state) const {
        for (const auto& page : book.pages()) {
            if (!page.has_event()) continue;
            apply(state, page.event());
        }
        return state;
    }

    void apply(State& state, const google::protobuf::Any& event) const {
        auto it = appliers_.find(helpers::type_name_from_url(event.type_url()));
        if (it != appliers_.end()) {
            it->second(state, event);
        }
    }

private:
    std::map<std::string, Applier> appliers_;
};

} // namespace ledgerline
