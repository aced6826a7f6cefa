#include "ledgerline/config.hpp"
#include "ledgerline/errors.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace ledgerline {

namespace {

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

int64_t parse_integer(const std::string& name, const std::string& text) {
    try {
        size_t used = 0;
        long long value = std::stoll(text, &used);
        if (used != text.size()) {
            throw ValidationError(name + " is not an integer: " + text);
        }
        return value;
    } catch (const std::invalid_argument&) {
        throw ValidationError(name + " is not an integer: " + text);
    } catch (const std::out_of_range&) {
        throw ValidationError(name + " is out of range: " + text);
    }
}

std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto first = item.find_first_not_of(" \t");
        auto last = item.find_last_not_of(" \t");
        if (first == std::string::npos) continue;
        items.push_back(item.substr(first, last - first + 1));
    }
    return items;
}

template<typename T>
T json_value(const nlohmann::json& doc, const char* key) {
    try {
        return doc.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError(std::string("config key '") + key + "': " + e.what());
    }
}

} // anonymous namespace

AlertBasis EngineConfig::parse_alert_basis(const std::string& value) {
    if (value == "on_hand") return AlertBasis::OnHand;
    if (value == "available") return AlertBasis::Available;
    throw ValidationError("alert_basis must be 'on_hand' or 'available', got '" + value + "'");
}

EngineConfig& EngineConfig::from_env() {
    if (auto v = env("LEDGERLINE_MAX_CONFLICT_RETRIES")) {
        max_conflict_retries = static_cast<int>(parse_integer("LEDGERLINE_MAX_CONFLICT_RETRIES", v));
    }
    if (auto v = env("LEDGERLINE_RETRY_BACKOFF_MS")) {
        retry_backoff_ms = static_cast<int>(parse_integer("LEDGERLINE_RETRY_BACKOFF_MS", v));
    }
    if (auto v = env("LEDGERLINE_LOYALTY_RATE_BP")) {
        loyalty_rate_bp = static_cast<int32_t>(parse_integer("LEDGERLINE_LOYALTY_RATE_BP", v));
    }
    if (auto v = env("LEDGERLINE_RESERVATION_TTL_SECONDS")) {
        reservation_ttl_seconds = parse_integer("LEDGERLINE_RESERVATION_TTL_SECONDS", v);
    }
    if (auto v = env("LEDGERLINE_SWEEP_INTERVAL_MS")) {
        sweep_interval_ms = parse_integer("LEDGERLINE_SWEEP_INTERVAL_MS", v);
    }
    if (auto v = env("LEDGERLINE_SNAPSHOT_INTERVAL")) {
        snapshot_interval = static_cast<uint32_t>(parse_integer("LEDGERLINE_SNAPSHOT_INTERVAL", v));
    }
    if (auto v = env("LEDGERLINE_ALERT_BASIS")) {
        alert_basis = parse_alert_basis(v);
    }
    if (auto v = env("PORT")) {
        port = static_cast<int>(parse_integer("PORT", v));
    }
    if (auto v = env("LEDGERLINE_NODE_ID")) {
        node_id = v;
    }
    if (auto v = env("LEDGERLINE_LOCAL_BRANCHES")) {
        local_branches = split_list(v);
    }
    if (auto v = env("LEDGERLINE_PEERS")) {
        peers = split_list(v);
    }
    if (auto v = env("LEDGERLINE_SYNC_INTERVAL_MS")) {
        sync_interval_ms = parse_integer("LEDGERLINE_SYNC_INTERVAL_MS", v);
    }
    if (auto v = env("LEDGERLINE_LOG_LEVEL")) {
        log_level = v;
    }
    if (auto v = env("LEDGERLINE_CONFIG")) {
        from_file(v);
    }
    validate();
    return *this;
}

EngineConfig& EngineConfig::from_json(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw ValidationError("config document must be a JSON object");
    }
    if (doc.contains("max_conflict_retries")) max_conflict_retries = json_value<int>(doc, "max_conflict_retries");
    if (doc.contains("retry_backoff_ms")) retry_backoff_ms = json_value<int>(doc, "retry_backoff_ms");
    if (doc.contains("loyalty_rate_bp")) loyalty_rate_bp = json_value<int32_t>(doc, "loyalty_rate_bp");
    if (doc.contains("reservation_ttl_seconds")) reservation_ttl_seconds = json_value<int64_t>(doc, "reservation_ttl_seconds");
    if (doc.contains("sweep_interval_ms")) sweep_interval_ms = json_value<int64_t>(doc, "sweep_interval_ms");
    if (doc.contains("snapshot_interval")) snapshot_interval = json_value<uint32_t>(doc, "snapshot_interval");
    if (doc.contains("alert_basis")) alert_basis = parse_alert_basis(json_value<std::string>(doc, "alert_basis"));
    if (doc.contains("port")) port = json_value<int>(doc, "port");
    if (doc.contains("node_id")) node_id = json_value<std::string>(doc, "node_id");
    if (doc.contains("local_branches")) local_branches = json_value<std::vector<std::string>>(doc, "local_branches");
    if (doc.contains("peers")) peers = json_value<std::vector<std::string>>(doc, "peers");
    if (doc.contains("sync_interval_ms")) sync_interval_ms = json_value<int64_t>(doc, "sync_interval_ms");
    if (doc.contains("log_level")) log_level = json_value<std::string>(doc, "log_level");

    if (doc.contains("thresholds")) {
        const auto& list = doc.at("thresholds");
        if (!list.is_array()) {
            throw ValidationError("config key 'thresholds' must be an array");
        }
        thresholds.clear();
        for (const auto& entry : list) {
            ThresholdSetting setting;
            setting.variant_id = json_value<std::string>(entry, "variant_id");
            setting.branch_id = json_value<std::string>(entry, "branch_id");
            setting.threshold = json_value<int64_t>(entry, "threshold");
            thresholds.push_back(std::move(setting));
        }
    }
    validate();
    return *this;
}

EngineConfig& EngineConfig::from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ValidationError("cannot open config file: " + path);
    }
    nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        throw ValidationError("config file is not valid JSON: " + path);
    }
    return from_json(doc);
}

void EngineConfig::validate() const {
    if (max_conflict_retries < 1) throw ValidationError("max_conflict_retries must be at least 1");
    if (max_conflict_retries > 1000) throw ValidationError("max_conflict_retries must be at most 1000");
    if (retry_backoff_ms < 0) throw ValidationError("retry_backoff_ms must be non-negative");
    if (loyalty_rate_bp < 0) throw ValidationError("loyalty_rate_bp must be non-negative");
    if (reservation_ttl_seconds < 0) throw ValidationError("reservation_ttl_seconds must be non-negative");
    if (sweep_interval_ms <= 0) throw ValidationError("sweep_interval_ms must be positive");
    if (sync_interval_ms <= 0) throw ValidationError("sync_interval_ms must be positive");
    if (snapshot_interval == 0) throw ValidationError("snapshot_interval must be positive");
    if (port <= 0 || port > 65535) throw ValidationError("port must be in 1..65535");
    if (node_id.empty()) throw ValidationError("node_id must not be empty");
    for (const auto& t : thresholds) {
        if (t.variant_id.empty() || t.branch_id.empty()) {
            throw ValidationError("threshold entries need variant_id and branch_id");
        }
        if (t.threshold < 0) throw ValidationError("threshold must be non-negative");
    }
}

} // namespace ledgerline
