#pragma once

#include "store.hpp"
#include "indicators.hpp"
#include <map>
#include <mutex>
#include <string>

struct BaselineSettings {
    double rate = 0.02;
    int min_spacing_bars = 30;
    uint64_t seed = 1337;
    int label_version = 1;
};

// Negative samples drawn from bars where no detector fired, carrying the same
// indicator feature snapshot as signals.
class BaselineSampler {
public:
    BaselineSampler(SignalStore& signals, BaselineStore& baselines, BaselineSettings settings);

    // Deterministic in (seed, symbol, timeframe, timestamp).
    bool draw(const std::string& symbol, const std::string& timeframe,
              int64_t timestamp_ms) const;

    // Online path: called for every closed bar after detectors ran on it.
    bool offer(const std::string& symbol, const std::string& timeframe,
               const Candle& bar, const IndicatorSnapshot& snapshot);

    // Offline path: replays stored bars in (after_ms, until_ms] through a fresh
    // indicator state. Spacing is checked against every stored sample of the
    // stream, so a rerun over the same range writes nothing. Returns the number
    // of baselines written.
    int sample_history(CandleStore& candles, const std::string& symbol,
                       const std::string& timeframe, int64_t after_ms, int64_t until_ms,
                       const IndicatorSettings& indicator_settings);

    const BaselineSettings& settings() const { return settings_; }

private:
    SignalStore& signals_;
    BaselineStore& baselines_;
    BaselineSettings settings_;

    std::mutex mutex_;
    std::map<std::string, std::optional<int64_t>> last_baseline_;  // loaded lazily

    int64_t spacing_ms(const std::string& timeframe) const;
    bool write(const std::string& symbol, const std::string& timeframe,
               const Candle& bar, const IndicatorSnapshot& snapshot);
};
