#include "baseline_sampler.hpp"
#include "errors.hpp"
#include "timeframe.hpp"
#include "util.hpp"
#include <cstdlib>
#include <set>
#include <spdlog/spdlog.h>

BaselineSampler::BaselineSampler(SignalStore& signals, BaselineStore& baselines,
                                 BaselineSettings settings)
    : signals_(signals)
    , baselines_(baselines)
    , settings_(settings)
{
    if (settings_.rate < 0.0 || settings_.rate > 1.0) {
        throw ConfigValidationError("Baseline rate must be in [0, 1]");
    }
    if (settings_.min_spacing_bars < 0) {
        throw ConfigValidationError("Baseline min spacing must be >= 0");
    }
}

bool BaselineSampler::draw(const std::string& symbol, const std::string& timeframe,
                           int64_t timestamp_ms) const {
    if (settings_.rate <= 0.0) return false;
    if (settings_.rate >= 1.0) return true;

    uint64_t h = util::stable_hash(std::to_string(settings_.seed) + "|" + symbol + "|" +
                                   timeframe + "|" + std::to_string(timestamp_ms));
    // Top 53 bits as a uniform value in [0, 1)
    double u = static_cast<double>(h >> 11) / static_cast<double>(1ULL << 53);
    return u < settings_.rate;
}

int64_t BaselineSampler::spacing_ms(const std::string& timeframe) const {
    return static_cast<int64_t>(settings_.min_spacing_bars) * timeframe::duration_ms(timeframe);
}

bool BaselineSampler::write(const std::string& symbol, const std::string& timeframe,
                            const Candle& bar, const IndicatorSnapshot& snapshot) {
    if (signals_.has_signal_at(symbol, timeframe, bar.timestamp_ms)) {
        spdlog::debug("Baseline {}:{} at {} skipped: signal fired on this bar", symbol,
                      timeframe, bar.timestamp_ms);
        return false;
    }

    Baseline b;
    b.symbol = symbol;
    b.timeframe = timeframe;
    b.timestamp_ms = bar.timestamp_ms;
    b.label_version = settings_.label_version;
    b.close = bar.close;
    b.features = snapshot.to_features();
    b.features["score"] = 0.0;
    b.features_version = kFeaturesVersion;
    return baselines_.insert_baseline(b);
}

bool BaselineSampler::offer(const std::string& symbol, const std::string& timeframe,
                            const Candle& bar, const IndicatorSnapshot& snapshot) {
    if (!draw(symbol, timeframe, bar.timestamp_ms)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const std::string stream = symbol + ":" + timeframe;

    auto it = last_baseline_.find(stream);
    if (it == last_baseline_.end()) {
        it = last_baseline_.emplace(stream, baselines_.latest_baseline_ts(
            symbol, timeframe, settings_.label_version)).first;
    }
    if (it->second && std::llabs(bar.timestamp_ms - *it->second) < spacing_ms(timeframe)) {
        spdlog::debug("Baseline {} at {} skipped: within {} bars of previous", stream,
                      bar.timestamp_ms, settings_.min_spacing_bars);
        return false;
    }

    if (!write(symbol, timeframe, bar, snapshot)) {
        return false;
    }
    if (!it->second || *it->second < bar.timestamp_ms) {
        it->second = bar.timestamp_ms;
    }
    return true;
}

int BaselineSampler::sample_history(CandleStore& candles, const std::string& symbol,
                                    const std::string& timeframe, int64_t after_ms,
                                    int64_t until_ms,
                                    const IndicatorSettings& indicator_settings) {
    std::set<int64_t> taken;
    for (const auto& b : baselines_.query_baselines(symbol, timeframe, settings_.label_version)) {
        taken.insert(b.timestamp_ms);
    }

    IndicatorState state(indicator_settings);
    int64_t spacing = spacing_ms(timeframe);
    int written = 0;

    for (const auto& bar : candles.bars_between(symbol, timeframe, after_ms, until_ms)) {
        auto snapshot = state.update(bar);
        if (!snapshot || !draw(symbol, timeframe, bar.timestamp_ms)) continue;

        // Nearest stored sample on either side
        auto near = taken.lower_bound(bar.timestamp_ms - spacing + 1);
        if (near != taken.end() && *near < bar.timestamp_ms + spacing) continue;

        if (write(symbol, timeframe, bar, *snapshot)) {
            taken.insert(bar.timestamp_ms);
            written++;
        }
    }

    if (!taken.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& last = last_baseline_[symbol + ":" + timeframe];
        if (!last || *last < *taken.rbegin()) {
            last = *taken.rbegin();
        }
    }

    spdlog::info("Baseline backfill {}:{}: {} samples written", symbol, timeframe, written);
    return written;
}
