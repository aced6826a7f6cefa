#include "stock_logic.hpp"
#include "ledgerline/errors.hpp"
#include "ledgerline/helpers.hpp"
#include "ledgerline/validation.hpp"

namespace stock {

using namespace ledgerline;

StockRecord StockLogic::rebuild_state(const EventBook& event_book,
                                      const std::string& variant_id, const std::string& branch_id) {
    StockRecord state;
    state.variant_id = variant_id;
    state.branch_id = branch_id;

    if (event_book.has_snapshot() && event_book.snapshot().has_state()) {
        const auto& snap = event_book.snapshot().state();
        if (helpers::type_url_matches(snap.type_url(), "retail.StockRecordSnapshot")) {
            retail::StockRecordSnapshot snap_state;
            snap.UnpackTo(&snap_state);
            state = from_snapshot(snap_state);
        }
    }

    for (const auto& page : event_book.pages()) {
        if (!page.has_event()) continue;
        if (helpers::type_url_matches(page.event().type_url(), "retail.StockMovement")) {
            retail::StockMovement movement;
            page.event().UnpackTo(&movement);
            state = apply(std::move(state), movement);
        }
    }

    state.version = helpers::stream_version(event_book);
    return state;
}

retail::StockMovement StockLogic::handle_reserve(
    const StockRecord& state, int64_t quantity, const std::string& reference,
    const google::protobuf::Timestamp& expires_at) {
    validation::require_positive(quantity, "quantity");
    validation::require_not_empty(reference, "reference");
    if (state.holds(reference)) {
        throw ValidationError("Reservation " + reference + " already held on " +
                              record_key(state.variant_id, state.branch_id));
    }
    if (state.available() < quantity) {
        throw InsufficientStockError(
            "Insufficient stock for " + state.variant_id + " at " + state.branch_id +
            ": requested " + std::to_string(quantity) + ", available " + std::to_string(state.available()),
            quantity, state.available());
    }

    retail::StockMovement movement;
    movement.set_kind(retail::MOVEMENT_KIND_RESERVE);
    movement.set_delta(quantity);
    movement.set_reference(reference);
    if (helpers::is_set(expires_at)) {
        *movement.mutable_expires_at() = expires_at;
    }
    return movement;
}

retail::StockMovement StockLogic::handle_release(const StockRecord& state, const std::string& reference) {
    auto it = state.reservations.find(reference);
    if (it == state.reservations.end()) {
        throw NotFoundError("No active reservation " + reference + " on " +
                            record_key(state.variant_id, state.branch_id));
    }

    retail::StockMovement movement;
    movement.set_kind(retail::MOVEMENT_KIND_RELEASE);
    movement.set_delta(-it->second.quantity);
    movement.set_reference(reference);
    return movement;
}

retail::StockMovement StockLogic::handle_deduct(const StockRecord& state, const std::string& reference) {
    auto it = state.reservations.find(reference);
    if (it == state.reservations.end()) {
        throw NotFoundError("No active reservation " + reference + " on " +
                            record_key(state.variant_id, state.branch_id));
    }

    retail::StockMovement movement;
    movement.set_kind(retail::MOVEMENT_KIND_DEDUCT);
    movement.set_delta(-it->second.quantity);
    movement.set_reference(reference);
    return movement;
}

retail::StockMovement StockLogic::handle_reinstate(
    const StockRecord& state, const std::string& reference, int64_t quantity,
    const google::protobuf::Timestamp& expires_at) {
    validation::require_positive(quantity, "quantity");
    if (state.holds(reference)) {
        throw ValidationError("Reservation " + reference + " is still active");
    }

    retail::StockMovement movement;
    movement.set_kind(retail::MOVEMENT_KIND_REINSTATE);
    movement.set_delta(quantity);
    movement.set_reference(reference);
    if (helpers::is_set(expires_at)) {
        *movement.mutable_expires_at() = expires_at;
    }
    return movement;
}

retail::StockMovement StockLogic::handle_replenish(
    const StockRecord& /*state*/, int64_t quantity, const std::string& reference) {
    validation::require_positive(quantity, "quantity");

    retail::StockMovement movement;
    movement.set_kind(retail::MOVEMENT_KIND_REPLENISH);
    movement.set_delta(quantity);
    movement.set_reference(reference);
    return movement;
}

retail::StockMovement StockLogic::handle_adjust(
    const StockRecord& state, int64_t delta, const std::string& reason) {
    if (delta == 0) throw ValidationError("Adjustment delta must not be zero");
    validation::require_not_empty(reason, "reason");
    if (state.on_hand + delta < state.reserved) {
        throw InsufficientStockError(
            "Adjustment of " + std::to_string(delta) + " would leave on_hand below reserved for " +
            state.variant_id + " at " + state.branch_id,
            -delta, state.available());
    }

    retail::StockMovement movement;
    movement.set_kind(retail::MOVEMENT_KIND_ADJUSTMENT);
    movement.set_delta(delta);
    movement.set_reason(reason);
    return movement;
}

StockRecord StockLogic::apply(StockRecord state, const retail::StockMovement& movement) {
    if (state.variant_id.empty()) state.variant_id = movement.variant_id();
    if (state.branch_id.empty()) state.branch_id = movement.branch_id();
    if (!movement.id().empty()) state.movement_ids.insert(movement.id());

    const auto& ref = movement.reference();
    switch (movement.kind()) {
        case retail::MOVEMENT_KIND_RESERVE: {
            state.reserved += movement.delta();
            auto& reservation = state.reservations[ref];
            reservation.reference = ref;
            reservation.quantity += movement.delta();
            reservation.expires_at = movement.expires_at();
            state.consumed_refs.erase(ref);
            break;
        }
        case retail::MOVEMENT_KIND_RELEASE:
            state.reserved += movement.delta();
            state.reservations.erase(ref);
            state.consumed_refs.insert(ref);
            break;
        case retail::MOVEMENT_KIND_DEDUCT:
            state.on_hand += movement.delta();
            state.reserved += movement.delta();
            state.reservations.erase(ref);
            state.consumed_refs.insert(ref);
            break;
        case retail::MOVEMENT_KIND_REINSTATE: {
            state.on_hand += movement.delta();
            state.reserved += movement.delta();
            auto& reservation = state.reservations[ref];
            reservation.reference = ref;
            reservation.quantity += movement.delta();
            reservation.expires_at = movement.expires_at();
            state.consumed_refs.erase(ref);
            break;
        }
        case retail::MOVEMENT_KIND_REPLENISH:
        case retail::MOVEMENT_KIND_ADJUSTMENT:
            state.on_hand += movement.delta();
            break;
        default:
            break;
    }
    return state;
}

retail::StockRecordSnapshot StockLogic::to_snapshot(const StockRecord& state) {
    retail::StockRecordSnapshot snap;
    snap.set_variant_id(state.variant_id);
    snap.set_branch_id(state.branch_id);
    snap.set_on_hand(state.on_hand);
    snap.set_reserved(state.reserved);
    for (const auto& [ref, reservation] : state.reservations) {
        auto* entry = snap.add_reservations();
        entry->set_reference(ref);
        entry->set_quantity(reservation.quantity);
        *entry->mutable_expires_at() = reservation.expires_at;
    }
    for (const auto& ref : state.consumed_refs) {
        snap.add_consumed_refs(ref);
    }
    for (const auto& id : state.movement_ids) {
        snap.add_movement_ids(id);
    }
    return snap;
}

StockRecord StockLogic::from_snapshot(const retail::StockRecordSnapshot& snapshot) {
    StockRecord state;
    state.variant_id = snapshot.variant_id();
    state.branch_id = snapshot.branch_id();
    state.on_hand = snapshot.on_hand();
    state.reserved = snapshot.reserved();
    for (const auto& entry : snapshot.reservations()) {
        state.reservations[entry.reference()] = {entry.reference(), entry.quantity(), entry.expires_at()};
    }
    state.consumed_refs.insert(snapshot.consumed_refs().begin(), snapshot.consumed_refs().end());
    state.movement_ids.insert(snapshot.movement_ids().begin(), snapshot.movement_ids().end());
    return state;
}

}  // namespace stock
