#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <cstdlib>

struct Config {
    // Redis
    std::string redis_url;
    std::string stream_signals;
    std::string stream_summary;

    // Postgres
    std::string pg_dsn;

    // Market data provider
    std::string provider_base_url;
    std::string provider_api_key;
    int request_timeout_ms;
    int retry_backoff_ms_min;
    int retry_backoff_ms_max;
    int provider_max_retries;

    // Ingestion
    std::vector<std::string> symbols;
    std::string base_timeframe;
    std::vector<std::string> derived_timeframes;
    int backfill_minutes;
    int history_limit;
    int max_concurrency;
    int cycle_seconds;

    // Breakout detector
    std::string breakout_id;
    std::string breakout_version;
    int breakout_lookback;
    double breakout_volume_mult;
    bool breakout_momentum_filter;
    std::vector<std::string> breakout_confirm_timeframes;
    bool breakout_extended_score;

    // Model detector (disabled when no weights file)
    std::string model_weights_file;
    std::string model_detector_id;
    std::string model_detector_version;
    double model_min_probability;

    int detector_timeout_ms;

    // Labeling
    std::vector<Horizon> horizons;
    std::vector<double> targets;
    double stop_pct;
    TiePolicy tie_policy;
    int label_version;
    int label_interval_seconds;
    int label_lookback_days;

    // Baselines
    double baseline_rate;
    int baseline_min_spacing_bars;
    uint64_t baseline_seed;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

    // "15m:20,1h:8"
    static std::vector<Horizon> parse_horizons(const std::string& text);
    // "0.02,0.05,0.10"
    static std::vector<double> parse_targets(const std::string& text);

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static double get_env_double(const char* name, double default_val);
    static bool get_env_bool(const char* name, bool default_val);
};
