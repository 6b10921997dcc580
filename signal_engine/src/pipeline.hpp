#pragma once

#include "bar_aggregator.hpp"
#include "baseline_sampler.hpp"
#include "detector_runner.hpp"
#include "indicators.hpp"
#include "market_data_client.hpp"
#include "run_summary.hpp"
#include "store.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct PipelineSettings {
    std::vector<std::string> symbols;
    std::string base_timeframe = "1m";
    std::vector<std::string> derived_timeframes;
    int backfill_minutes = 120;   // fetch window for a stream with no stored bars
    int history_limit = 400;      // bars replayed into indicators on warm-up
    int max_concurrency = 4;
    int max_retries = 3;
    int backoff_ms_min = 250;
    int backoff_ms_max = 2000;
    bool fetch_quotes = true;
};

using SignalCallback = std::function<void(const Signal&)>;

// Per-cycle ingest for every symbol: fetch closed base bars, persist, roll up
// derived timeframes, update indicators, run detectors and offer baselines.
// A symbol and all of its streams are owned by exactly one worker per cycle.
class SignalPipeline {
public:
    SignalPipeline(PipelineSettings settings,
                   MarketDataProvider& provider,
                   CandleStore& candles,
                   IndicatorEngine& indicators,
                   DetectorRunner& runner,
                   BaselineSampler* baselines = nullptr);

    CycleSummary run_cycle(int64_t now_ms);

    void set_signal_callback(SignalCallback callback) { on_signal_ = std::move(callback); }
    const PipelineSettings& settings() const { return settings_; }

private:
    struct SymbolWorker {
        std::string symbol;
        bool warmed = false;
        std::vector<BarAggregator> aggregators;
    };

    PipelineSettings settings_;
    MarketDataProvider& provider_;
    CandleStore& candles_;
    IndicatorEngine& indicators_;
    DetectorRunner& runner_;
    BaselineSampler* baselines_;
    SignalCallback on_signal_;

    std::vector<std::unique_ptr<SymbolWorker>> workers_;
    std::mutex cycle_mutex_;

    CycleSummary process_symbol(SymbolWorker& worker, int64_t now_ms);
    void warm_up(SymbolWorker& worker, int64_t now_ms);
    std::vector<Candle> fetch_with_retry(const std::string& symbol, int64_t from_ms,
                                         int64_t to_ms);
    void process_bar(const std::string& symbol, const std::string& timeframe,
                     const Candle& bar, const std::optional<Quote>& quote,
                     int64_t now_ms, CycleSummary& summary);
};
