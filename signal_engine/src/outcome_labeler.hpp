#pragma once

#include "store.hpp"
#include "run_summary.hpp"
#include <atomic>
#include <string>
#include <vector>

struct LabelerSettings {
    std::vector<Horizon> horizons;
    std::vector<double> targets = {0.02, 0.05, 0.10};  // up to three, ascending
    double stop_pct = 0.02;
    TiePolicy tie_policy = TiePolicy::StopFirst;
    int label_version = 1;
    int64_t lookback_ms = 30LL * 86400000;  // signals older than this are not swept
};

enum class LabelStatus {
    Computed,
    AlreadyLabeled,
    Pending,
    DataGap
};

// Forward outcome labels from candles that open at or after the signal bar
// closes and no later than the horizon end. Reads nothing else from the store.
class OutcomeLabeler {
public:
    OutcomeLabeler(CandleStore& candles, SignalStore& signals, OutcomeStore& outcomes,
                   LabelerSettings settings);

    // Expected bar timestamps: the first `bars` aligned horizon buckets that
    // start at or after the close of the signal bar.
    static std::vector<int64_t> expected_timestamps(int64_t fired_at_ms,
                                                    const std::string& signal_timeframe,
                                                    const Horizon& horizon);

    // Pure: identical inputs give identical numbers. `bars` must be exactly the
    // expected horizon bars, ascending.
    static Outcome compute_outcome(const Signal& signal, const Horizon& horizon,
                                   const std::vector<Candle>& bars,
                                   const LabelerSettings& settings);

    LabelStatus label_signal(const Signal& signal, const Horizon& horizon, int64_t now_ms);

    LabelSweepSummary run_sweep(int64_t now_ms, const std::atomic<bool>* cancel = nullptr);

    const LabelerSettings& settings() const { return settings_; }

private:
    CandleStore& candles_;
    SignalStore& signals_;
    OutcomeStore& outcomes_;
    LabelerSettings settings_;

    std::vector<Candle> load_window(const Signal& signal, const Horizon& horizon,
                                    int64_t now_ms);
};
