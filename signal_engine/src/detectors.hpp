#pragma once

#include "types.hpp"
#include "indicators.hpp"
#include "scoring_model.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>

struct DetectorInput {
    std::string symbol;
    std::string timeframe;
    Candle bar;
    IndicatorSnapshot indicators;
    // Latest closed-bar snapshots of the symbol's other timeframes, for the
    // timeframes detectors ask for via context_timeframes().
    std::map<std::string, IndicatorSnapshot> context;
};

struct SignalCandidate {
    std::string side = "long";
    double score = 0.0;
    FeatureMap extra_features;  // merged over the indicator snapshot
};

// One evaluation contract for rule and model detectors: given a closed bar and
// its indicator snapshot, produce zero or one candidate. Inputs that are still
// warming up (null) make the detector not evaluable for that bar.
class Detector {
public:
    explicit Detector(DetectorInfo info) : info_(std::move(info)) {}
    virtual ~Detector() = default;

    const DetectorInfo& info() const { return info_; }

    virtual std::optional<SignalCandidate> evaluate(const DetectorInput& input) = 0;

    // Called once a signal of this detector is persisted (or found persisted).
    // bars_since counts stream bars already seen after fired_at (0 when live).
    virtual void on_recorded(const std::string& symbol, const std::string& timeframe,
                             int64_t fired_at_ms, int bars_since = 0) {}

    // Prior-bar lookbacks the indicator engine must track for this detector.
    virtual std::vector<int> required_lookbacks() const { return {}; }

    // Other timeframes whose latest snapshot must be passed in DetectorInput::context.
    virtual std::vector<std::string> context_timeframes() const { return {}; }

private:
    DetectorInfo info_;
};

struct BreakoutParams {
    int lookback = 10;
    double volume_multiplier = 1.5;

    // Optional filters. All are part of the persisted params, so switching one
    // on means minting a new detector version.

    // RSI in [55, 85], MACD histogram positive and rising, VWAP distance in
    // [-1, 5]%, SMA20 distance in [2, 12]% with price at or above SMA50, and
    // Bollinger width between its 3rd and 75th percentile.
    bool momentum_filter = false;
    // Trend alignment on other timeframes: close above SMA20 on each, and also
    // above SMA50 on the first one listed. Scored, never a gate.
    std::vector<std::string> confirm_timeframes;
    // Adds momentum (20), multi-timeframe (10) and volatility risk (5) points.
    bool extended_score = false;
};

// close > max(high of the preceding N bars) and volume > k * mean(volume of the
// preceding N bars). After firing at bar F the stream stays disarmed for the
// next N bars: those bars' trailing windows still contain F, so they belong to
// the same breakout.
class BreakoutDetector : public Detector {
public:
    BreakoutDetector(const std::string& id, const std::string& version,
                     const BreakoutParams& params);

    std::optional<SignalCandidate> evaluate(const DetectorInput& input) override;
    void on_recorded(const std::string& symbol, const std::string& timeframe,
                     int64_t fired_at_ms, int bars_since = 0) override;
    std::vector<int> required_lookbacks() const override { return {params_.lookback}; }
    std::vector<std::string> context_timeframes() const override {
        return params_.confirm_timeframes;
    }

    static DetectorInfo describe(const std::string& id, const std::string& version,
                                 const BreakoutParams& params);

    static bool momentum_ok(const IndicatorSnapshot& snap);
    // 1 when every confirmation timeframe is aligned, 0 otherwise (missing data included).
    static int mtf_confirmation(const std::vector<std::string>& timeframes,
                                const std::map<std::string, IndicatorSnapshot>& context);
    static double momentum_score(const IndicatorSnapshot& snap);
    static double risk_score(const IndicatorSnapshot& snap);

private:
    struct Disarm {
        int64_t fired_at_ms = 0;
        int64_t last_bar_ms = 0;
        int bars_since = 0;
    };

    BreakoutParams params_;
    std::mutex mutex_;
    std::map<std::string, Disarm> disarm_;  // "symbol:tf"

    // Counts the bar against the stream's last firing; true while disarmed.
    bool advance(const std::string& stream, int64_t timestamp_ms);
};

struct ModelParams {
    double min_probability = 0.75;
    std::string side = "long";
};

// Feeds a fixed, ordered feature vector to an injected scoring function.
class ModelDetector : public Detector {
public:
    ModelDetector(const std::string& id, const std::string& version,
                  ScoringModel model, const ModelParams& params);

    std::optional<SignalCandidate> evaluate(const DetectorInput& input) override;

    static DetectorInfo describe(const std::string& id, const std::string& version,
                                 const ScoringModel& model, const ModelParams& params);

private:
    ScoringModel model_;
    ModelParams params_;
};
