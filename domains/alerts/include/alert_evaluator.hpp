#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "ledgerline/config.hpp"
#include "ledgerline/context.hpp"
#include "retail/stock.pb.h"
#include "stock_ledger.hpp"

namespace alerts {

/**
 * Notification collaborator. Receives one event per low-stock edge.
 */
class AlertPublisher {
public:
    virtual ~AlertPublisher() = default;
    virtual void publish(const ledgerline::RequestContext& ctx, const retail::LowStockAlert& alert) = 0;
};

/**
 * Writes alerts to the request's log.
 */
class LoggingAlertPublisher : public AlertPublisher {
public:
    void publish(const ledgerline::RequestContext& ctx, const retail::LowStockAlert& alert) override;
};

/**
 * Compares stock records against per-(variant, branch) thresholds after
 * every ledger mutation and publishes on low/not-low transitions only.
 */
class AlertEvaluator : public stock::StockObserver {
public:
    AlertEvaluator(AlertPublisher& publisher, ledgerline::AlertBasis basis);

    void set_threshold(const std::string& variant_id, const std::string& branch_id, int64_t threshold);
    void load_thresholds(const std::vector<ledgerline::ThresholdSetting>& settings);
    std::optional<int64_t> threshold(const std::string& variant_id, const std::string& branch_id) const;

    static bool is_low(const stock::StockRecord& record, int64_t threshold, ledgerline::AlertBasis basis);

    /**
     * False when no threshold is configured for the record.
     */
    bool is_low(const stock::StockRecord& record) const;

    void on_stock_changed(const ledgerline::RequestContext& ctx,
                          const stock::StockRecord& before,
                          const stock::StockRecord& after,
                          const retail::StockMovement& movement) override;

    /**
     * Every record currently below its threshold.
     */
    std::vector<retail::LowStockAlert> current_alerts(const stock::StockLedger& ledger) const;

private:
    AlertPublisher& publisher_;
    ledgerline::AlertBasis basis_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, int64_t> thresholds_;
};

}  // namespace alerts
