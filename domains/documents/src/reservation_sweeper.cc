#include "reservation_sweeper.hpp"
#include "ledgerline/errors.hpp"
#include "ledgerline/helpers.hpp"

#include <chrono>
#include <set>

namespace documents {

using namespace ledgerline;

namespace {

constexpr const char* SWEEPER = "reservation_sweeper";

} // anonymous namespace

ReservationSweeper::ReservationSweeper(DocumentService& documents, stock::StockLedger& ledger,
                                       Logger& logger, const EngineConfig& config)
    : documents_(documents), ledger_(ledger), logger_(logger) {
    task_ = std::make_unique<PeriodicTask>(logger_, SWEEPER,
        std::chrono::milliseconds(config.sweep_interval_ms), [this]() {
            auto ctx = RequestContext::system(logger_, SWEEPER);
            sweep(ctx, helpers::now());
        });
}

size_t ReservationSweeper::sweep(const RequestContext& ctx, const google::protobuf::Timestamp& now) {
    std::set<std::string> references;
    for (const auto& expired : ledger_.expired_reservations(now)) {
        references.insert(expired.reference);
    }

    size_t released = 0;
    for (const auto& reference : references) {
        const auto document_id = reference.substr(0, reference.find('/'));
        try {
            auto state = documents_.get(document_id);
            if (state.stage == retail::STAGE_CONVERTED && state.reservation_id == reference) {
                documents_.cancel(ctx, document_id, "reservation expired");
                ++released;
                continue;
            }
        } catch (const NotFoundError&) {
            // Not a document reservation.
        } catch (const LedgerError& e) {
            ctx.log_warn(SWEEPER, "sweep_cancel_failed",
                {{"reference", reference}, {"document_id", document_id}, {"error", e.what()}});
            continue;
        }

        try {
            ledger_.release(ctx, reference);
            ++released;
        } catch (const LedgerError& e) {
            ctx.log_warn(SWEEPER, "sweep_release_failed", {{"reference", reference}, {"error", e.what()}});
        }
    }

    if (released > 0) {
        ctx.log_info(SWEEPER, "expired_reservations_released", {{"count", released}});
    }
    return released;
}

void ReservationSweeper::start() {
    task_->start();
}

void ReservationSweeper::stop() {
    task_->stop();
}

}  // namespace documents
