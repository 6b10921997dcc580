#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

using FeatureMap = std::map<std::string, double>;

struct Candle {
    int64_t timestamp_ms = 0;   // bucket start, UTC
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
    std::optional<double> vwap;
    std::optional<int64_t> trade_count;
    std::string source = "provider";
    bool is_adjusted = true;

    bool operator==(const Candle& other) const;
    bool operator!=(const Candle& other) const { return !(*this == other); }
};

struct SymbolInfo {
    int64_t id = 0;
    std::string ticker;
    std::string exchange;
    std::string asset_type = "equity";
    std::string currency = "USD";
    int64_t first_seen_ms = 0;
    int64_t last_seen_ms = 0;
};

struct Quote {
    double bid = 0.0;
    double ask = 0.0;

    // ((ask - bid) / mid) * 10'000
    std::optional<double> spread_bps() const;
};

struct Signal {
    int64_t id = 0;
    std::string symbol;
    std::string timeframe;
    int64_t fired_at_ms = 0;
    std::string detector_id;
    std::string detector_version;
    std::string side = "long";  // "long" | "short"
    std::string source_system;
    double price_at_signal = 0.0;
    std::optional<double> bid;
    std::optional<double> ask;
    std::optional<double> spread_bps;
    std::optional<double> rel_volume;
    std::string session;        // "pre" | "regular" | "post"
    std::optional<int64_t> data_freshness_ms;
    double score = 0.0;
    FeatureMap features;
    int features_version = 1;

    std::string natural_key() const;
};

struct Horizon {
    std::string timeframe;
    int bars = 0;

    std::string to_string() const;
    bool operator==(const Horizon& other) const {
        return timeframe == other.timeframe && bars == other.bars;
    }
};

// Which barrier counts when a target and the stop are crossed in the same bar.
enum class TiePolicy {
    StopFirst,
    TargetFirst
};

std::string tie_policy_name(TiePolicy policy);
TiePolicy tie_policy_from_string(const std::string& text);

struct Outcome {
    int64_t signal_id = 0;
    std::string horizon_tf;
    int horizon_bars = 0;
    int label_version = 1;

    double ret_close = 0.0;
    double max_run_up = 0.0;
    double max_drawdown = 0.0;

    bool hit_tp1 = false;
    bool hit_tp2 = false;
    bool hit_tp3 = false;
    bool hit_stop = false;
    std::optional<int64_t> t_to_tp1_ms;
    std::optional<int64_t> t_to_tp2_ms;
    std::optional<int64_t> t_to_tp3_ms;
    std::optional<int64_t> t_to_stop_ms;

    int64_t computed_at_ms = 0;
};

struct Baseline {
    std::string symbol;
    std::string timeframe;
    int64_t timestamp_ms = 0;
    int label_version = 1;
    double close = 0.0;
    FeatureMap features;
    int features_version = 1;
};

enum class DetectorKind {
    Rule,
    Model
};

std::string kind_name(DetectorKind kind);
DetectorKind detector_kind_from_string(const std::string& text);

struct DetectorInfo {
    std::string id;
    std::string version;
    DetectorKind kind = DetectorKind::Rule;
    std::string description;
    nlohmann::json params = nlohmann::json::object();

    std::string key() const { return id + "@" + version; }
};

struct IngestionLogEntry {
    std::string source;
    std::string symbol;
    std::string timeframe;
    int bars_written = 0;
    int64_t lag_ms = 0;
    std::string errors;
    int64_t created_at_ms = 0;
};
