#include "indicators.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

RollingWindow::RollingWindow(size_t period) : period_(period) {}

void RollingWindow::push(double value) {
    values_.push_back(value);
    sum_ += value;
    sum_sq_ += value * value;
    if (values_.size() > period_) {
        double old = values_.front();
        values_.pop_front();
        sum_ -= old;
        sum_sq_ -= old * old;
    }
}

std::optional<double> RollingWindow::mean() const {
    if (!full()) return std::nullopt;
    return sum_ / static_cast<double>(period_);
}

std::optional<double> RollingWindow::stddev() const {
    if (!full()) return std::nullopt;
    double n = static_cast<double>(period_);
    double mu = sum_ / n;
    double var = sum_sq_ / n - mu * mu;
    return std::sqrt(std::max(var, 0.0));
}

RollingExtremes::RollingExtremes(size_t period) : period_(period) {}

void RollingExtremes::push(double value) {
    size_t idx = count_++;

    while (!max_q_.empty() && max_q_.back().second <= value) max_q_.pop_back();
    max_q_.emplace_back(idx, value);
    while (!min_q_.empty() && min_q_.back().second >= value) min_q_.pop_back();
    min_q_.emplace_back(idx, value);

    // Evict entries that fell out of the window
    while (max_q_.front().first + period_ <= idx) max_q_.pop_front();
    while (min_q_.front().first + period_ <= idx) min_q_.pop_front();
}

std::optional<double> RollingExtremes::max() const {
    if (!full()) return std::nullopt;
    return max_q_.front().second;
}

std::optional<double> RollingExtremes::min() const {
    if (!full()) return std::nullopt;
    return min_q_.front().second;
}

std::optional<double> percentile(std::vector<double> values, double pct) {
    if (values.empty()) return std::nullopt;
    std::sort(values.begin(), values.end());
    double k = (values.size() - 1) * pct / 100.0;
    size_t lo = static_cast<size_t>(std::floor(k));
    size_t hi = static_cast<size_t>(std::ceil(k));
    if (lo == hi) return values[lo];
    return values[lo] * (hi - k) + values[hi] * (k - lo);
}

Ema::Ema(int period) : period_(period), alpha_(2.0 / (period + 1.0)) {}

void Ema::push(double value) {
    if (value_) {
        value_ = alpha_ * value + (1.0 - alpha_) * *value_;
        return;
    }
    seed_sum_ += value;
    if (++seen_ == period_) {
        value_ = seed_sum_ / period_;
    }
}

WilderAverage::WilderAverage(int period) : period_(period) {}

void WilderAverage::push(double value) {
    if (value_) {
        value_ = *value_ + (value - *value_) / period_;
        return;
    }
    seed_sum_ += value;
    if (++seen_ == period_) {
        value_ = seed_sum_ / period_;
    }
}

namespace {

void put(FeatureMap& features, const std::string& name, const std::optional<double>& value) {
    if (value) features[name] = *value;
}

std::optional<double> pct_from(double close, const std::optional<double>& ma) {
    if (!ma || *ma == 0.0) return std::nullopt;
    return 100.0 * (close / *ma - 1.0);
}

std::optional<double> trend_pct(const std::optional<double>& now,
                                const std::optional<double>& before) {
    if (!now || !before || *before == 0.0) return std::nullopt;
    return 100.0 * (*now / *before - 1.0);
}

// Percentiles need some history before they mean anything
constexpr size_t kMinPercentileSamples = 10;

} // namespace

FeatureMap IndicatorSnapshot::to_features() const {
    FeatureMap features;
    features["close"] = close;
    features["volume"] = volume;
    put(features, "rsi", rsi);
    put(features, "macd", macd);
    put(features, "macd_signal", macd_signal);
    put(features, "macd_hist", macd_hist);
    put(features, "macd_hist_prev", macd_hist_prev);
    put(features, "sma9", sma9);
    put(features, "sma20", sma20);
    put(features, "sma50", sma50);
    put(features, "sma200", sma200);
    put(features, "ema20", ema20);
    put(features, "ema50", ema50);
    put(features, "ema200", ema200);
    put(features, "pct_from_sma20", pct_from_sma20);
    put(features, "pct_from_sma50", pct_from_sma50);
    put(features, "pct_from_sma200", pct_from_sma200);
    put(features, "trend_sma20_pct", trend_sma20_pct);
    put(features, "trend_sma50_pct", trend_sma50_pct);
    put(features, "trend_sma200_pct", trend_sma200_pct);
    put(features, "atr", atr);
    put(features, "atr_pct", atr_pct);
    put(features, "bb_width", bb_width);
    put(features, "bb_pct", bb_pct);
    put(features, "bb_width_p3", bb_width_p3);
    put(features, "bb_width_p75", bb_width_p75);
    put(features, "stoch_rsi", stoch_rsi);
    put(features, "obv", obv);
    put(features, "rel_volume", rel_volume);
    put(features, "vol_spike10", vol_spike10);
    put(features, "vwap", vwap);
    put(features, "vwap_dist", vwap_dist);
    for (const auto& [n, value] : prior_high) {
        put(features, "hhv_" + std::to_string(n), value);
    }
    for (const auto& [n, value] : prior_avg_volume) {
        put(features, "avg_volume_" + std::to_string(n), value);
    }
    return features;
}

std::vector<std::string> IndicatorSnapshot::feature_names(const IndicatorSettings& settings) {
    std::vector<std::string> names = {
        "close", "volume", "rsi", "macd", "macd_signal", "macd_hist", "macd_hist_prev",
        "sma9", "sma20", "sma50", "sma200", "ema20", "ema50", "ema200",
        "pct_from_sma20", "pct_from_sma50", "pct_from_sma200",
        "trend_sma20_pct", "trend_sma50_pct", "trend_sma200_pct",
        "atr", "atr_pct", "bb_width", "bb_pct", "bb_width_p3", "bb_width_p75",
        "stoch_rsi", "obv", "rel_volume", "vol_spike10", "vwap", "vwap_dist"
    };
    for (int n : settings.lookbacks) {
        names.push_back("hhv_" + std::to_string(n));
        names.push_back("avg_volume_" + std::to_string(n));
    }
    return names;
}

IndicatorState::IndicatorState(const IndicatorSettings& settings)
    : settings_(settings)
    , avg_gain_(settings.rsi_period)
    , avg_loss_(settings.rsi_period)
    , macd_fast_(settings.macd_fast)
    , macd_slow_(settings.macd_slow)
    , macd_signal_(settings.macd_signal)
    , sma9_(9), sma20_(20), sma50_(50), sma200_(200)
    , ema20_(20), ema50_(50), ema200_(200)
    , atr_(settings.atr_period)
    , bb_(settings.bb_period)
    , rsi_range_(settings.stoch_period)
    , volume_window_(settings.rel_volume_window)
    , spike_window_(settings.volume_spike_window)
{
    for (int n : settings_.lookbacks) {
        prior_highs_.emplace(n, RollingExtremes(n));
        prior_volumes_.emplace(n, RollingWindow(n));
    }
}

std::optional<IndicatorSnapshot> IndicatorState::update(const Candle& bar) {
    if (last_ts_ && bar.timestamp_ms <= *last_ts_) {
        if (bar.timestamp_ms == *last_ts_) {
            spdlog::debug("Bar {} already applied, skipping", bar.timestamp_ms);
        } else {
            spdlog::warn("Out-of-order bar {} (last {}), skipping", bar.timestamp_ms, *last_ts_);
        }
        return std::nullopt;
    }

    IndicatorSnapshot snap;
    snap.timestamp_ms = bar.timestamp_ms;
    snap.close = bar.close;
    snap.volume = bar.volume;

    // Trailing windows are read before the current bar enters them
    for (auto& [n, extremes] : prior_highs_) {
        snap.prior_high[n] = extremes.max();
        extremes.push(bar.high);
    }
    for (auto& [n, window] : prior_volumes_) {
        snap.prior_avg_volume[n] = window.mean();
        window.push(bar.volume);
    }

    auto trailing_volume = volume_window_.mean();
    if (trailing_volume && *trailing_volume > 0.0) {
        snap.rel_volume = bar.volume / *trailing_volume;
    }
    volume_window_.push(bar.volume);

    auto spike_base = spike_window_.mean();
    if (spike_base && *spike_base > 0.0) {
        snap.vol_spike10 = bar.volume / *spike_base;
    }
    spike_window_.push(bar.volume);

    // RSI (Wilder) and Stochastic RSI
    if (prev_close_) {
        double change = bar.close - *prev_close_;
        avg_gain_.push(std::max(change, 0.0));
        avg_loss_.push(std::max(-change, 0.0));
    }
    if (avg_gain_.value() && avg_loss_.value()) {
        double gain = *avg_gain_.value();
        double loss = *avg_loss_.value();
        if (loss == 0.0) {
            snap.rsi = gain == 0.0 ? 50.0 : 100.0;
        } else {
            snap.rsi = 100.0 - 100.0 / (1.0 + gain / loss);
        }
        rsi_range_.push(*snap.rsi);
        if (rsi_range_.full()) {
            double lo = *rsi_range_.min();
            double hi = *rsi_range_.max();
            snap.stoch_rsi = hi == lo ? 0.0 : (*snap.rsi - lo) / (hi - lo);
        }
    }

    // MACD
    macd_fast_.push(bar.close);
    macd_slow_.push(bar.close);
    if (macd_fast_.value() && macd_slow_.value()) {
        snap.macd = *macd_fast_.value() - *macd_slow_.value();
        macd_signal_.push(*snap.macd);
        snap.macd_signal = macd_signal_.value();
        if (snap.macd_signal) {
            snap.macd_hist = *snap.macd - *snap.macd_signal;
        }
    }
    snap.macd_hist_prev = prev_macd_hist_;
    prev_macd_hist_ = snap.macd_hist;

    // Moving averages
    sma9_.push(bar.close);
    sma20_.push(bar.close);
    sma50_.push(bar.close);
    sma200_.push(bar.close);
    snap.sma9 = sma9_.mean();
    snap.sma20 = sma20_.mean();
    snap.sma50 = sma50_.mean();
    snap.sma200 = sma200_.mean();
    snap.trend_sma20_pct = trend_pct(snap.sma20, prev_sma20_);
    snap.trend_sma50_pct = trend_pct(snap.sma50, prev_sma50_);
    snap.trend_sma200_pct = trend_pct(snap.sma200, prev_sma200_);
    prev_sma20_ = snap.sma20;
    prev_sma50_ = snap.sma50;
    prev_sma200_ = snap.sma200;
    snap.pct_from_sma20 = pct_from(bar.close, snap.sma20);
    snap.pct_from_sma50 = pct_from(bar.close, snap.sma50);
    snap.pct_from_sma200 = pct_from(bar.close, snap.sma200);

    ema20_.push(bar.close);
    ema50_.push(bar.close);
    ema200_.push(bar.close);
    snap.ema20 = ema20_.value();
    snap.ema50 = ema50_.value();
    snap.ema200 = ema200_.value();

    // ATR (Wilder)
    double tr = bar.high - bar.low;
    if (prev_close_) {
        tr = std::max({tr, std::fabs(bar.high - *prev_close_), std::fabs(bar.low - *prev_close_)});
    }
    atr_.push(tr);
    snap.atr = atr_.value();
    if (snap.atr && bar.close != 0.0) {
        snap.atr_pct = 100.0 * *snap.atr / bar.close;
    }

    // Bollinger Bands
    bb_.push(bar.close);
    if (bb_.full()) {
        double mid = *bb_.mean();
        double sd = *bb_.stddev();
        double upper = mid + settings_.bb_stddev * sd;
        double lower = mid - settings_.bb_stddev * sd;
        if (mid != 0.0) {
            snap.bb_width = 100.0 * (upper - lower) / mid;
        }
        if (upper != lower) {
            snap.bb_pct = (bar.close - lower) / (upper - lower);
        }
    }
    if (snap.bb_width) {
        bb_widths_.push_back(*snap.bb_width);
        if (bb_widths_.size() > static_cast<size_t>(settings_.bb_width_history)) {
            bb_widths_.pop_front();
        }
    }
    if (snap.bb_width && bb_widths_.size() >= kMinPercentileSamples) {
        std::vector<double> widths(bb_widths_.begin(), bb_widths_.end());
        snap.bb_width_p3 = percentile(widths, 3.0);
        snap.bb_width_p75 = percentile(std::move(widths), 75.0);
    }

    // OBV
    if (prev_close_) {
        if (bar.close > *prev_close_) obv_ += bar.volume;
        else if (bar.close < *prev_close_) obv_ -= bar.volume;
    }
    snap.obv = obv_;

    // Session VWAP, reset on each UTC day
    int64_t day = bar.timestamp_ms / (24LL * 60 * 60 * 1000);
    if (day != session_day_) {
        session_day_ = day;
        session_pv_ = 0.0;
        session_volume_ = 0.0;
    }
    double price = bar.vwap ? *bar.vwap : (bar.high + bar.low + bar.close) / 3.0;
    session_pv_ += price * bar.volume;
    session_volume_ += bar.volume;
    if (session_volume_ > 0.0) {
        snap.vwap = session_pv_ / session_volume_;
        if (*snap.vwap != 0.0) {
            snap.vwap_dist = (bar.close - *snap.vwap) / *snap.vwap;
        }
    }

    prev_close_ = bar.close;
    last_ts_ = bar.timestamp_ms;
    snap.bars_seen = ++bars_seen_;
    latest_ = snap;
    return snap;
}

IndicatorEngine::IndicatorEngine(IndicatorSettings settings)
    : settings_(std::move(settings)) {}

std::string IndicatorEngine::make_key(const std::string& symbol, const std::string& timeframe) {
    return symbol + ":" + timeframe;
}

std::shared_ptr<IndicatorState> IndicatorEngine::find_stream(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.find(key);
    if (it == streams_.end()) return nullptr;
    return it->second;
}

std::optional<IndicatorSnapshot> IndicatorEngine::update(const std::string& symbol,
                                                         const std::string& timeframe,
                                                         const Candle& bar) {
    std::shared_ptr<IndicatorState> state;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = streams_[make_key(symbol, timeframe)];
        if (!slot) {
            slot = std::make_shared<IndicatorState>(settings_);
        }
        state = slot;
    }
    return state->update(bar);
}

std::optional<IndicatorSnapshot> IndicatorEngine::latest(const std::string& symbol,
                                                         const std::string& timeframe) const {
    auto state = find_stream(make_key(symbol, timeframe));
    if (!state) return std::nullopt;
    return state->latest();
}

std::optional<int64_t> IndicatorEngine::last_timestamp(const std::string& symbol,
                                                       const std::string& timeframe) const {
    auto state = find_stream(make_key(symbol, timeframe));
    if (!state) return std::nullopt;
    return state->last_timestamp();
}

void IndicatorEngine::reset(const std::string& symbol, const std::string& timeframe) {
    std::lock_guard<std::mutex> lock(mutex_);
    streams_.erase(make_key(symbol, timeframe));
}

size_t IndicatorEngine::stream_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return streams_.size();
}
