#include "alert_evaluator.hpp"
#include "ledgerline/helpers.hpp"
#include "ledgerline/validation.hpp"

#include <mutex>

namespace alerts {

using namespace ledgerline;

namespace {

constexpr const char* ALERTS_DOMAIN = "alerts";

retail::LowStockAlert make_alert(const stock::StockRecord& record, int64_t threshold, bool low) {
    retail::LowStockAlert alert;
    alert.set_variant_id(record.variant_id);
    alert.set_branch_id(record.branch_id);
    alert.set_on_hand(record.on_hand);
    alert.set_reserved(record.reserved);
    alert.set_threshold(threshold);
    alert.set_low(low);
    *alert.mutable_at() = helpers::now();
    return alert;
}

} // anonymous namespace

void LoggingAlertPublisher::publish(const RequestContext& ctx, const retail::LowStockAlert& alert) {
    ctx.log_warn(ALERTS_DOMAIN, alert.low() ? "low_stock" : "stock_recovered",
        {{"variant_id", alert.variant_id()}, {"branch_id", alert.branch_id()},
         {"on_hand", alert.on_hand()}, {"reserved", alert.reserved()},
         {"threshold", alert.threshold()}, {"movement_id", alert.movement_id()}});
}

AlertEvaluator::AlertEvaluator(AlertPublisher& publisher, AlertBasis basis)
    : publisher_(publisher), basis_(basis) {}

void AlertEvaluator::set_threshold(const std::string& variant_id, const std::string& branch_id,
                                   int64_t threshold) {
    validation::require_not_empty(variant_id, "variant_id");
    validation::require_not_empty(branch_id, "branch_id");
    validation::require_non_negative(threshold, "threshold");

    std::unique_lock<std::shared_mutex> lock(mutex_);
    thresholds_[stock::record_key(variant_id, branch_id)] = threshold;
}

void AlertEvaluator::load_thresholds(const std::vector<ThresholdSetting>& settings) {
    for (const auto& setting : settings) {
        set_threshold(setting.variant_id, setting.branch_id, setting.threshold);
    }
}

std::optional<int64_t> AlertEvaluator::threshold(const std::string& variant_id,
                                                 const std::string& branch_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = thresholds_.find(stock::record_key(variant_id, branch_id));
    if (it == thresholds_.end()) return std::nullopt;
    return it->second;
}

bool AlertEvaluator::is_low(const stock::StockRecord& record, int64_t threshold, AlertBasis basis) {
    int64_t level = basis == AlertBasis::Available ? record.available() : record.on_hand;
    return level < threshold;
}

bool AlertEvaluator::is_low(const stock::StockRecord& record) const {
    auto limit = threshold(record.variant_id, record.branch_id);
    return limit && is_low(record, *limit, basis_);
}

void AlertEvaluator::on_stock_changed(const RequestContext& ctx,
                                      const stock::StockRecord& before,
                                      const stock::StockRecord& after,
                                      const retail::StockMovement& movement) {
    auto limit = threshold(after.variant_id, after.branch_id);
    if (!limit) return;

    bool was_low = is_low(before, *limit, basis_);
    bool now_low = is_low(after, *limit, basis_);
    if (was_low == now_low) return;

    auto alert = make_alert(after, *limit, now_low);
    alert.set_movement_id(movement.id());
    publisher_.publish(ctx, alert);
}

std::vector<retail::LowStockAlert> AlertEvaluator::current_alerts(const stock::StockLedger& ledger) const {
    std::vector<retail::LowStockAlert> result;
    for (const auto& record : ledger.records()) {
        auto limit = threshold(record.variant_id, record.branch_id);
        if (limit && is_low(record, *limit, basis_)) {
            result.push_back(make_alert(record, *limit, true));
        }
    }
    return result;
}

}  // namespace alerts
