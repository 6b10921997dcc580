#include "detectors.hpp"
#include "errors.hpp"
#include "timeframe.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

DetectorInfo BreakoutDetector::describe(const std::string& id, const std::string& version,
                                        const BreakoutParams& params) {
    DetectorInfo info;
    info.id = id;
    info.version = version;
    info.kind = DetectorKind::Rule;
    info.description = "Close above prior " + std::to_string(params.lookback) +
                       "-bar high on volume expansion";
    info.params = {
        {"lookback", params.lookback},
        {"volume_multiplier", params.volume_multiplier},
        {"momentum_filter", params.momentum_filter},
        {"confirm_timeframes", params.confirm_timeframes},
        {"extended_score", params.extended_score}
    };
    if (params.momentum_filter) {
        info.description += ", momentum filtered";
    }
    return info;
}

BreakoutDetector::BreakoutDetector(const std::string& id, const std::string& version,
                                   const BreakoutParams& params)
    : Detector(describe(id, version, params))
    , params_(params)
{
    if (params_.lookback < 1) {
        throw ConfigValidationError("Breakout lookback must be >= 1");
    }
    if (params_.volume_multiplier <= 0.0) {
        throw ConfigValidationError("Breakout volume multiplier must be > 0");
    }
    for (const auto& tf : params_.confirm_timeframes) {
        if (!timeframe::is_valid(tf)) {
            throw ConfigValidationError("Unsupported breakout confirmation timeframe: " + tf);
        }
    }
}

bool BreakoutDetector::momentum_ok(const IndicatorSnapshot& snap) {
    if (!snap.rsi || !snap.macd_hist || !snap.macd_hist_prev || !snap.vwap_dist ||
        !snap.pct_from_sma20 || !snap.pct_from_sma50 || !snap.bb_width ||
        !snap.bb_width_p3 || !snap.bb_width_p75) {
        return false;
    }

    bool rsi_ok = *snap.rsi >= 55.0 && *snap.rsi <= 85.0;
    bool macd_ok = *snap.macd_hist > 0.0 && *snap.macd_hist > *snap.macd_hist_prev;
    double vwap_pct = *snap.vwap_dist * 100.0;
    bool vwap_ok = vwap_pct >= -1.0 && vwap_pct <= 5.0;
    bool sma_ok = *snap.pct_from_sma20 >= 2.0 && *snap.pct_from_sma20 <= 12.0 &&
                  *snap.pct_from_sma50 >= 0.0;
    bool bb_ok = *snap.bb_width >= *snap.bb_width_p3 && *snap.bb_width <= *snap.bb_width_p75;

    return rsi_ok && macd_ok && vwap_ok && sma_ok && bb_ok;
}

int BreakoutDetector::mtf_confirmation(const std::vector<std::string>& timeframes,
                                       const std::map<std::string, IndicatorSnapshot>& context) {
    if (timeframes.empty()) return 0;
    for (size_t i = 0; i < timeframes.size(); ++i) {
        auto it = context.find(timeframes[i]);
        if (it == context.end()) return 0;
        const IndicatorSnapshot& snap = it->second;
        if (!snap.sma20 || snap.close <= *snap.sma20) return 0;
        if (i == 0 && (!snap.sma50 || snap.close <= *snap.sma50)) return 0;
    }
    return 1;
}

double BreakoutDetector::momentum_score(const IndicatorSnapshot& snap) {
    std::vector<double> bits;
    if (snap.rsi) {
        bits.push_back(std::min(std::max((*snap.rsi - 50.0) / 35.0, 0.0), 1.0));
    }
    bits.push_back(snap.macd_hist && *snap.macd_hist > 0.0 ? 1.0 : 0.0);
    if (snap.bb_pct) {
        bits.push_back(*snap.bb_pct >= 0.3 && *snap.bb_pct <= 0.8 ? 1.0 : 0.0);
    }
    double sum = 0.0;
    for (double b : bits) sum += b;
    return sum / bits.size() * 20.0;
}

double BreakoutDetector::risk_score(const IndicatorSnapshot& snap) {
    if (!snap.atr_pct) return 0.0;
    return (1.0 - std::min(*snap.atr_pct / 5.0, 1.0)) * 5.0;
}

bool BreakoutDetector::advance(const std::string& stream, int64_t timestamp_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = disarm_.find(stream);
    if (it == disarm_.end()) return false;

    Disarm& d = it->second;
    // Re-evaluating the firing bar itself is allowed; the store deduplicates it.
    if (timestamp_ms <= d.fired_at_ms) return false;

    // Bars, not elapsed time: a session gap does not shorten the window.
    if (timestamp_ms > d.last_bar_ms) {
        d.last_bar_ms = timestamp_ms;
        d.bars_since++;
    }
    return d.bars_since <= params_.lookback;
}

std::optional<SignalCandidate> BreakoutDetector::evaluate(const DetectorInput& input) {
    std::string stream = input.symbol + ":" + input.timeframe;
    bool disarmed = advance(stream, input.bar.timestamp_ms);

    auto high_it = input.indicators.prior_high.find(params_.lookback);
    auto vol_it = input.indicators.prior_avg_volume.find(params_.lookback);
    if (high_it == input.indicators.prior_high.end() ||
        vol_it == input.indicators.prior_avg_volume.end() ||
        !high_it->second || !vol_it->second) {
        return std::nullopt;  // not evaluable yet
    }

    double hhv = *high_it->second;
    double avg_volume = *vol_it->second;
    const Candle& bar = input.bar;

    bool price_ok = bar.close > hhv;
    bool volume_ok = avg_volume > 0.0 && bar.volume > params_.volume_multiplier * avg_volume;
    if (!price_ok || !volume_ok) {
        return std::nullopt;
    }

    if (params_.momentum_filter && !momentum_ok(input.indicators)) {
        spdlog::debug("{} on {} at {}: momentum filter not met", info().key(), stream,
                      bar.timestamp_ms);
        return std::nullopt;
    }

    if (disarmed) {
        spdlog::debug("{} suppressed on {} at {}: breakout already signaled within {} bars",
                      info().key(), stream, bar.timestamp_ms, params_.lookback);
        return std::nullopt;
    }

    double breakout = hhv > 0.0 ? bar.close / hhv - 1.0 : 0.0;
    double vol_ratio = bar.volume / avg_volume;
    double breakout_score = std::min(breakout / 0.02, 1.0) * 40.0;
    double volume_score = std::min(std::max(vol_ratio / params_.volume_multiplier - 1.0, 0.0), 1.0) * 25.0;

    SignalCandidate candidate;
    candidate.side = "long";
    candidate.score = breakout_score + volume_score;
    candidate.extra_features = {
        {"breakout_pct", breakout * 100.0},
        {"breakout_level", hhv},
        {"volume_ratio", vol_ratio}
    };

    if (!params_.confirm_timeframes.empty()) {
        int mtf = mtf_confirmation(params_.confirm_timeframes, input.context);
        candidate.extra_features["mtf_confirmation"] = mtf;
        if (params_.extended_score) {
            candidate.score += mtf * 10.0;
        }
    }
    if (params_.extended_score) {
        candidate.score += momentum_score(input.indicators) + risk_score(input.indicators);
    }
    return candidate;
}

void BreakoutDetector::on_recorded(const std::string& symbol, const std::string& timeframe,
                                   int64_t fired_at_ms, int bars_since) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = disarm_.find(symbol + ":" + timeframe);
    if (it != disarm_.end() && it->second.fired_at_ms >= fired_at_ms) return;

    Disarm d;
    d.fired_at_ms = fired_at_ms;
    d.last_bar_ms = fired_at_ms;
    d.bars_since = bars_since;
    disarm_[symbol + ":" + timeframe] = d;
}

DetectorInfo ModelDetector::describe(const std::string& id, const std::string& version,
                                     const ScoringModel& model, const ModelParams& params) {
    DetectorInfo info;
    info.id = id;
    info.version = version;
    info.kind = DetectorKind::Model;
    info.description = "Scoring model " + model.name + "@" + model.version;
    info.params = {
        {"model", model.name},
        {"model_version", model.version},
        {"features", model.feature_names},
        {"min_probability", params.min_probability},
        {"side", params.side}
    };
    return info;
}

ModelDetector::ModelDetector(const std::string& id, const std::string& version,
                             ScoringModel model, const ModelParams& params)
    : Detector(describe(id, version, model, params))
    , model_(std::move(model))
    , params_(params)
{
    if (!model_.score) {
        throw ConfigValidationError("Model detector " + id + " has no scoring function");
    }
    if (model_.feature_names.empty()) {
        throw ConfigValidationError("Model detector " + id + " has an empty feature vector");
    }
    if (params_.min_probability <= 0.0 || params_.min_probability > 1.0) {
        throw ConfigValidationError("Model min probability must be in (0, 1]");
    }
    if (params_.side != "long" && params_.side != "short") {
        throw ConfigValidationError("Model side must be long or short");
    }
}

std::optional<SignalCandidate> ModelDetector::evaluate(const DetectorInput& input) {
    FeatureMap features = input.indicators.to_features();

    std::vector<double> x;
    x.reserve(model_.feature_names.size());
    for (const auto& name : model_.feature_names) {
        auto it = features.find(name);
        if (it == features.end()) {
            return std::nullopt;  // a required input is still null
        }
        x.push_back(it->second);
    }

    ModelScore result = model_.score(x);
    if (result.probability < params_.min_probability) {
        return std::nullopt;
    }

    SignalCandidate candidate;
    candidate.side = params_.side;
    candidate.score = result.probability;
    candidate.extra_features = {
        {"model_probability", result.probability},
        {"model_target_return", result.target_return}
    };
    return candidate;
}
