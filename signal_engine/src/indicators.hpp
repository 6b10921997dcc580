#pragma once

#include "types.hpp"
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// 2: sma9, macd_hist_prev, trend_sma*_pct, vol_spike10, bb_width percentiles
constexpr int kFeaturesVersion = 2;

struct IndicatorSettings {
    int rsi_period = 14;
    int macd_fast = 12;
    int macd_slow = 26;
    int macd_signal = 9;
    int atr_period = 14;
    int bb_period = 20;
    double bb_stddev = 2.0;
    int stoch_period = 14;
    int rel_volume_window = 20;
    int volume_spike_window = 10;
    int bb_width_history = 60;   // bars of Bollinger width kept for percentiles
    // Lookbacks for prior-bar max high / mean volume (breakout inputs)
    std::vector<int> lookbacks = {10, 20};
};

// Mean and population stddev over the last N values.
class RollingWindow {
public:
    explicit RollingWindow(size_t period);
    void push(double value);
    bool full() const { return values_.size() == period_; }
    size_t size() const { return values_.size(); }
    std::optional<double> mean() const;
    std::optional<double> stddev() const;

private:
    size_t period_;
    std::deque<double> values_;
    double sum_ = 0.0;
    double sum_sq_ = 0.0;
};

// Max/min over the last N values via monotonic deques.
class RollingExtremes {
public:
    explicit RollingExtremes(size_t period);
    void push(double value);
    bool full() const { return count_ >= period_; }
    std::optional<double> max() const;
    std::optional<double> min() const;

private:
    size_t period_;
    size_t count_ = 0;
    std::deque<std::pair<size_t, double>> max_q_;
    std::deque<std::pair<size_t, double>> min_q_;
};

// Linear-interpolated percentile (0..100) of unsorted values; nullopt if empty.
std::optional<double> percentile(std::vector<double> values, double pct);

// EMA seeded with the SMA of its first `period` values.
class Ema {
public:
    explicit Ema(int period);
    void push(double value);
    std::optional<double> value() const { return value_; }

private:
    int period_;
    double alpha_;
    int seen_ = 0;
    double seed_sum_ = 0.0;
    std::optional<double> value_;
};

// Wilder smoothing: seed with SMA, then avg += (x - avg) / period.
class WilderAverage {
public:
    explicit WilderAverage(int period);
    void push(double value);
    std::optional<double> value() const { return value_; }

private:
    int period_;
    int seen_ = 0;
    double seed_sum_ = 0.0;
    std::optional<double> value_;
};

struct IndicatorSnapshot {
    int64_t timestamp_ms = 0;
    int64_t bars_seen = 0;
    double close = 0.0;
    double volume = 0.0;

    std::optional<double> rsi;
    std::optional<double> macd;
    std::optional<double> macd_signal;
    std::optional<double> macd_hist;
    std::optional<double> macd_hist_prev;
    std::optional<double> sma9, sma20, sma50, sma200;
    std::optional<double> ema20, ema50, ema200;
    std::optional<double> pct_from_sma20, pct_from_sma50, pct_from_sma200;
    // Bar-over-bar change of the SMA, in percent
    std::optional<double> trend_sma20_pct, trend_sma50_pct, trend_sma200_pct;
    std::optional<double> atr;
    std::optional<double> atr_pct;
    std::optional<double> bb_width;
    std::optional<double> bb_pct;
    // 3rd and 75th percentile of bb_width over the recent history, current bar included
    std::optional<double> bb_width_p3, bb_width_p75;
    std::optional<double> stoch_rsi;
    std::optional<double> obv;
    std::optional<double> rel_volume;
    std::optional<double> vol_spike10;
    std::optional<double> vwap;
    std::optional<double> vwap_dist;

    // Keyed by lookback; computed over the preceding bars only.
    std::map<int, std::optional<double>> prior_high;
    std::map<int, std::optional<double>> prior_avg_volume;

    // Flat feature map; null indicators are omitted.
    FeatureMap to_features() const;
    static std::vector<std::string> feature_names(const IndicatorSettings& settings);
};

// Incremental indicator state for one (symbol, timeframe) stream.
class IndicatorState {
public:
    explicit IndicatorState(const IndicatorSettings& settings);

    // Bars must arrive in strictly increasing timestamp order.
    std::optional<IndicatorSnapshot> update(const Candle& bar);
    const std::optional<IndicatorSnapshot>& latest() const { return latest_; }
    std::optional<int64_t> last_timestamp() const { return last_ts_; }

private:
    IndicatorSettings settings_;
    std::optional<int64_t> last_ts_;
    std::optional<double> prev_close_;
    std::optional<IndicatorSnapshot> latest_;
    int64_t bars_seen_ = 0;

    WilderAverage avg_gain_;
    WilderAverage avg_loss_;
    Ema macd_fast_;
    Ema macd_slow_;
    Ema macd_signal_;
    RollingWindow sma9_, sma20_, sma50_, sma200_;
    std::optional<double> prev_sma20_, prev_sma50_, prev_sma200_;
    std::optional<double> prev_macd_hist_;
    Ema ema20_, ema50_, ema200_;
    WilderAverage atr_;
    RollingWindow bb_;
    std::deque<double> bb_widths_;
    RollingExtremes rsi_range_;
    RollingWindow volume_window_;
    RollingWindow spike_window_;
    double obv_ = 0.0;

    int64_t session_day_ = -1;
    double session_pv_ = 0.0;
    double session_volume_ = 0.0;

    std::map<int, RollingExtremes> prior_highs_;
    std::map<int, RollingWindow> prior_volumes_;
};

// One IndicatorState per (symbol, timeframe). Each stream must have a single
// writer; the engine only guards the stream table.
class IndicatorEngine {
public:
    explicit IndicatorEngine(IndicatorSettings settings = IndicatorSettings());

    std::optional<IndicatorSnapshot> update(const std::string& symbol,
                                            const std::string& timeframe,
                                            const Candle& bar);
    std::optional<IndicatorSnapshot> latest(const std::string& symbol,
                                            const std::string& timeframe) const;
    std::optional<int64_t> last_timestamp(const std::string& symbol,
                                          const std::string& timeframe) const;
    void reset(const std::string& symbol, const std::string& timeframe);
    size_t stream_count() const;

    const IndicatorSettings& settings() const { return settings_; }

private:
    IndicatorSettings settings_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<IndicatorState>> streams_;

    static std::string make_key(const std::string& symbol, const std::string& timeframe);
    std::shared_ptr<IndicatorState> find_stream(const std::string& key) const;
};
