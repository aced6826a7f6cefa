#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "retry.hpp"

namespace ledgerline {

/**
 * Which quantity low-stock alerts compare against the threshold.
 */
enum class AlertBasis {
    OnHand,     // on_hand < threshold
    Available   // on_hand - reserved < threshold
};

struct ThresholdSetting {
    std::string variant_id;
    std::string branch_id;
    int64_t threshold = 0;
};

/**
 * Engine configuration. Defaults are usable as-is; from_env() and
 * from_json() overlay values onto an existing config.
 */
struct EngineConfig {
    int max_conflict_retries = 5;
    int retry_backoff_ms = 2;
    int32_t loyalty_rate_bp = 10;
    int64_t reservation_ttl_seconds = 0;
    int64_t sweep_interval_ms = 1000;
    uint32_t snapshot_interval = 50;
    AlertBasis alert_basis = AlertBasis::OnHand;
    int port = 50061;
    std::string node_id = "local";
    std::vector<std::string> local_branches;
    std::vector<std::string> peers;
    int64_t sync_interval_ms = 500;
    std::vector<ThresholdSetting> thresholds;
    std::string log_level = "info";

    RetryPolicy retry_policy() const {
        return RetryPolicy{max_conflict_retries, std::chrono::milliseconds(retry_backoff_ms)};
    }

    /**
     * Overlay LEDGERLINE_* (and PORT) environment variables.
     * @throws ValidationError on malformed values
     */
    EngineConfig& from_env();

    /**
     * Overlay keys present in a JSON object.
     * @throws ValidationError on malformed values
     */
    EngineConfig& from_json(const nlohmann::json& doc);

    /**
     * Read a JSON config file and overlay it.
     * @throws ValidationError if the file cannot be read or parsed
     */
    EngineConfig& from_file(const std::string& path);

    /**
     * Check cross-field constraints.
     * @throws ValidationError
     */
    void validate() const;

    static AlertBasis parse_alert_basis(const std::string& value);
};

} // namespace ledgerline
