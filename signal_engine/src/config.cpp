#include "config.hpp"
#include "errors.hpp"
#include "timeframe.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val || !*val) return default_val;
    try {
        size_t pos = 0;
        int parsed = std::stoi(val, &pos);
        if (pos != std::string(val).size()) {
            throw std::invalid_argument(val);
        }
        return parsed;
    } catch (const std::exception&) {
        throw ConfigValidationError(std::string("Invalid integer for ") + name + ": " + val);
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val || !*val) return default_val;
    try {
        size_t pos = 0;
        double parsed = std::stod(val, &pos);
        if (pos != std::string(val).size()) {
            throw std::invalid_argument(val);
        }
        return parsed;
    } catch (const std::exception&) {
        throw ConfigValidationError(std::string("Invalid number for ") + name + ": " + val);
    }
}

bool Config::get_env_bool(const char* name, bool default_val) {
    const char* val = std::getenv(name);
    if (!val || !*val) return default_val;
    std::string v(val);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw ConfigValidationError(std::string("Invalid boolean for ") + name + ": " + val);
}

std::vector<Horizon> Config::parse_horizons(const std::string& text) {
    std::vector<Horizon> horizons;
    for (const auto& item : util::split(text, ',')) {
        auto colon = item.find(':');
        if (colon == std::string::npos) {
            throw ConfigValidationError("Horizon must be tf:bars, got '" + item + "'");
        }
        Horizon h;
        h.timeframe = item.substr(0, colon);
        if (!timeframe::is_valid(h.timeframe)) {
            throw ConfigValidationError("Unsupported horizon timeframe: " + h.timeframe);
        }
        try {
            h.bars = std::stoi(item.substr(colon + 1));
        } catch (const std::exception&) {
            throw ConfigValidationError("Invalid horizon bars in '" + item + "'");
        }
        if (h.bars < 1) {
            throw ConfigValidationError("Horizon bars must be >= 1 in '" + item + "'");
        }
        if (std::find(horizons.begin(), horizons.end(), h) != horizons.end()) {
            throw ConfigValidationError("Duplicate horizon: " + item);
        }
        horizons.push_back(h);
    }
    return horizons;
}

std::vector<double> Config::parse_targets(const std::string& text) {
    std::vector<double> targets;
    for (const auto& item : util::split(text, ',')) {
        double t = 0.0;
        try {
            t = std::stod(item);
        } catch (const std::exception&) {
            throw ConfigValidationError("Invalid target: " + item);
        }
        if (t <= 0.0) {
            throw ConfigValidationError("Targets must be positive: " + item);
        }
        if (!targets.empty() && t <= targets.back()) {
            throw ConfigValidationError("Targets must be strictly ascending");
        }
        targets.push_back(t);
    }
    if (targets.size() > 3) {
        throw ConfigValidationError("At most 3 targets are supported");
    }
    return targets;
}

Config Config::from_env() {
    Config cfg;

    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_signals = get_env("STREAM_SIGNALS", "oracore.signals");
    cfg.stream_summary = get_env("STREAM_SUMMARY", "oracore.cycles");

    cfg.pg_dsn = get_env("PG_DSN");

    cfg.provider_base_url = get_env("PROVIDER_BASE_URL", "https://api.polygon.io");
    cfg.provider_api_key = get_env("PROVIDER_API_KEY");
    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 10000);
    cfg.retry_backoff_ms_min = get_env_int("RETRY_BACKOFF_MS_MIN", 250);
    cfg.retry_backoff_ms_max = get_env_int("RETRY_BACKOFF_MS_MAX", 2000);
    cfg.provider_max_retries = get_env_int("PROVIDER_MAX_RETRIES", 3);

    cfg.symbols = util::split(get_env("SYMBOLS", "AAPL,MSFT,NVDA"), ',');
    cfg.base_timeframe = get_env("BASE_TIMEFRAME", "1m");
    cfg.derived_timeframes = util::split(get_env("DERIVED_TIMEFRAMES", "5m,15m,1h"), ',');
    cfg.backfill_minutes = get_env_int("BACKFILL_MINUTES", 120);
    cfg.history_limit = get_env_int("HISTORY_LIMIT", 400);
    cfg.max_concurrency = get_env_int("MAX_CONCURRENCY", 4);
    cfg.cycle_seconds = get_env_int("CYCLE_SECONDS", 60);

    cfg.breakout_id = get_env("BREAKOUT_ID", "breakout");
    cfg.breakout_version = get_env("BREAKOUT_VERSION", "1");
    cfg.breakout_lookback = get_env_int("BREAKOUT_LOOKBACK", 20);
    cfg.breakout_volume_mult = get_env_double("BREAKOUT_VOLUME_MULT", 1.5);
    cfg.breakout_momentum_filter = get_env_bool("BREAKOUT_MOMENTUM_FILTER", false);
    cfg.breakout_confirm_timeframes = util::split(get_env("BREAKOUT_CONFIRM_TIMEFRAMES"), ',');
    cfg.breakout_extended_score = get_env_bool("BREAKOUT_EXTENDED_SCORE", false);

    cfg.model_weights_file = get_env("MODEL_WEIGHTS_FILE");
    cfg.model_detector_id = get_env("MODEL_DETECTOR_ID", "model");
    cfg.model_detector_version = get_env("MODEL_DETECTOR_VERSION", "1");
    cfg.model_min_probability = get_env_double("MODEL_MIN_PROBABILITY", 0.75);

    cfg.detector_timeout_ms = get_env_int("DETECTOR_TIMEOUT_MS", 250);

    cfg.horizons = parse_horizons(get_env("HORIZONS", "15m:20,1h:8"));
    cfg.targets = parse_targets(get_env("TARGETS", "0.02,0.05,0.10"));
    cfg.stop_pct = get_env_double("STOP_PCT", 0.02);
    try {
        cfg.tie_policy = tie_policy_from_string(get_env("TIE_POLICY", "stop_first"));
    } catch (const std::invalid_argument& e) {
        throw ConfigValidationError(e.what());
    }
    cfg.label_version = get_env_int("LABEL_VERSION", 1);
    cfg.label_interval_seconds = get_env_int("LABEL_INTERVAL_SECONDS", 300);
    cfg.label_lookback_days = get_env_int("LABEL_LOOKBACK_DAYS", 30);

    cfg.baseline_rate = get_env_double("BASELINE_RATE", 0.02);
    cfg.baseline_min_spacing_bars = get_env_int("BASELINE_MIN_SPACING_BARS", 30);
    cfg.baseline_seed = static_cast<uint64_t>(get_env_int("BASELINE_SEED", 1337));

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);

    cfg.service_name = get_env("SERVICE_NAME", "signal_engine");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (pg_dsn.empty()) {
        throw ConfigValidationError("PG_DSN is required");
    }
    if (symbols.empty()) {
        throw ConfigValidationError("SYMBOLS must list at least one ticker");
    }
    if (!timeframe::is_valid(base_timeframe)) {
        throw ConfigValidationError("Unsupported BASE_TIMEFRAME: " + base_timeframe);
    }
    int64_t base_width = timeframe::duration_ms(base_timeframe);
    for (const auto& tf : derived_timeframes) {
        if (!timeframe::is_valid(tf)) {
            throw ConfigValidationError("Unsupported derived timeframe: " + tf);
        }
        int64_t width = timeframe::duration_ms(tf);
        if (width <= base_width || width % base_width != 0) {
            throw ConfigValidationError("Derived timeframe " + tf +
                                        " is not a multiple of " + base_timeframe);
        }
    }
    if (horizons.empty()) {
        throw ConfigValidationError("HORIZONS must define at least one horizon");
    }
    for (const auto& h : horizons) {
        bool ingested = h.timeframe == base_timeframe ||
                        std::find(derived_timeframes.begin(), derived_timeframes.end(),
                                  h.timeframe) != derived_timeframes.end();
        if (!ingested) {
            throw ConfigValidationError("Horizon " + h.to_string() + " uses " + h.timeframe +
                                        ", which is neither BASE_TIMEFRAME nor a derived "
                                        "timeframe");
        }
    }
    for (const auto& tf : breakout_confirm_timeframes) {
        bool ingested = tf == base_timeframe ||
                        std::find(derived_timeframes.begin(), derived_timeframes.end(), tf) !=
                            derived_timeframes.end();
        if (!ingested) {
            throw ConfigValidationError("BREAKOUT_CONFIRM_TIMEFRAMES lists " + tf +
                                        ", which is not an ingested timeframe");
        }
    }
    if (stop_pct <= 0.0 || stop_pct >= 1.0) {
        throw ConfigValidationError("STOP_PCT must be in (0, 1)");
    }
    if (label_version < 1) {
        throw ConfigValidationError("LABEL_VERSION must be >= 1");
    }
    if (baseline_rate < 0.0 || baseline_rate > 1.0) {
        throw ConfigValidationError("BASELINE_RATE must be in [0, 1]");
    }
    if (baseline_min_spacing_bars < 0) {
        throw ConfigValidationError("BASELINE_MIN_SPACING_BARS must be >= 0");
    }
    if (max_concurrency < 1 || history_limit < 1 || cycle_seconds < 1) {
        throw ConfigValidationError("MAX_CONCURRENCY, HISTORY_LIMIT and CYCLE_SECONDS must be >= 1");
    }
    if (retry_backoff_ms_min < 0 || retry_backoff_ms_max < retry_backoff_ms_min) {
        throw ConfigValidationError("Retry backoff bounds are inconsistent");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Symbols: {} on {} (+{} derived)", symbols.size(), base_timeframe,
                 derived_timeframes.size());
    spdlog::info("  Breakout: {}@{} lookback={} vol_mult={} momentum={} confirm={} extended={}",
                 breakout_id, breakout_version, breakout_lookback, breakout_volume_mult,
                 breakout_momentum_filter, breakout_confirm_timeframes.size(),
                 breakout_extended_score);
    spdlog::info("  Labels: v{} horizons={} stop={} tie={}", label_version, horizons.size(),
                 stop_pct, tie_policy_name(tie_policy));
    spdlog::info("  Database: {}", util::redact_dsn(pg_dsn));
}
