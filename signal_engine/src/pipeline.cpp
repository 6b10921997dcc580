#include "pipeline.hpp"
#include "errors.hpp"
#include "timeframe.hpp"
#include "util.hpp"
#include <algorithm>
#include <atomic>
#include <thread>
#include <spdlog/spdlog.h>

SignalPipeline::SignalPipeline(PipelineSettings settings,
                               MarketDataProvider& provider,
                               CandleStore& candles,
                               IndicatorEngine& indicators,
                               DetectorRunner& runner,
                               BaselineSampler* baselines)
    : settings_(std::move(settings))
    , provider_(provider)
    , candles_(candles)
    , indicators_(indicators)
    , runner_(runner)
    , baselines_(baselines)
{
    if (!timeframe::is_valid(settings_.base_timeframe)) {
        throw ConfigValidationError("Unsupported base timeframe: " + settings_.base_timeframe);
    }

    for (const auto& symbol : settings_.symbols) {
        auto worker = std::make_unique<SymbolWorker>();
        worker->symbol = symbol;
        for (const auto& tf : settings_.derived_timeframes) {
            try {
                worker->aggregators.emplace_back(settings_.base_timeframe, tf);
            } catch (const std::invalid_argument& e) {
                throw ConfigValidationError(e.what());
            }
        }
        workers_.push_back(std::move(worker));
    }
}

std::vector<Candle> SignalPipeline::fetch_with_retry(const std::string& symbol,
                                                     int64_t from_ms, int64_t to_ms) {
    for (int attempt = 0; ; ++attempt) {
        try {
            return provider_.fetch_bars(symbol, settings_.base_timeframe, from_ms, to_ms);
        } catch (const ProviderRejectedError&) {
            throw;
        } catch (const ProviderError& e) {
            if (attempt >= settings_.max_retries) {
                throw;
            }
            int cap = std::min(settings_.backoff_ms_max,
                               settings_.backoff_ms_min * (1 << std::min(attempt, 10)));
            int delay = util::random_jitter(settings_.backoff_ms_min, std::max(cap, settings_.backoff_ms_min));
            spdlog::warn("Fetch {} failed (attempt {}/{}): {}; retrying in {}ms", symbol,
                         attempt + 1, settings_.max_retries + 1, e.what(), delay);
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }
    }
}

void SignalPipeline::warm_up(SymbolWorker& worker, int64_t now_ms) {
    const std::string& symbol = worker.symbol;
    const std::string& base_tf = settings_.base_timeframe;

    std::vector<std::string> streams = {base_tf};
    streams.insert(streams.end(), settings_.derived_timeframes.begin(),
                   settings_.derived_timeframes.end());

    // Indicators resume from stored history without re-evaluating detectors.
    for (const auto& tf : streams) {
        indicators_.reset(symbol, tf);
        auto history = candles_.recent_bars(symbol, tf, now_ms, settings_.history_limit);
        for (const auto& bar : history) {
            indicators_.update(symbol, tf, bar);
        }
        runner_.prime(symbol, tf, history);
        spdlog::debug("Warmed {}:{} with {} bars", symbol, tf, history.size());
    }

    // Derived buckets resume after the last stored one; pending source bars are
    // reloaded so a bucket spanning the restart still closes.
    for (auto& agg : worker.aggregators) {
        int64_t width = timeframe::duration_ms(agg.target_timeframe());
        auto last_derived = candles_.latest_timestamp(symbol, agg.target_timeframe());

        std::vector<Candle> source;
        if (last_derived) {
            agg.resume_after(*last_derived);
            source = candles_.bars_between(symbol, base_tf, *last_derived + width - 1, now_ms);
        } else {
            source = candles_.recent_bars(symbol, base_tf, now_ms, settings_.history_limit);
            if (!source.empty()) {
                agg.start_at(source.front().timestamp_ms);
            }
        }
        for (const auto& bar : source) {
            agg.add_bar(bar);
        }
    }

    worker.warmed = true;
}

void SignalPipeline::process_bar(const std::string& symbol, const std::string& timeframe,
                                 const Candle& bar, const std::optional<Quote>& quote,
                                 int64_t now_ms, CycleSummary& summary) {
    auto snapshot = indicators_.update(symbol, timeframe, bar);
    if (!snapshot) {
        return;
    }
    summary.bars_evaluated++;

    DetectorInput input{symbol, timeframe, bar, *snapshot, {}};
    // Coarser streams are aggregated after the base bar, so their latest
    // snapshot always belongs to a closed bar.
    for (const auto& tf : runner_.context_timeframes()) {
        if (tf == timeframe) continue;
        if (auto ctx = indicators_.latest(symbol, tf)) {
            input.context[tf] = *ctx;
        }
    }
    auto result = runner_.run(input, quote, now_ms);

    summary.signals_emitted += static_cast<int>(result.created.size());
    summary.signals_duplicate += result.duplicates;
    summary.detector_failures += static_cast<int>(result.failures.size());
    for (const auto& f : result.failures) {
        summary.skipped.push_back({f.detector + " " + f.symbol + ":" + f.timeframe + " @" +
                                   util::to_iso8601(f.timestamp_ms), f.reason});
    }

    for (const auto& signal : result.created) {
        if (on_signal_) {
            try {
                on_signal_(signal);
            } catch (const std::exception& e) {
                spdlog::error("Signal callback failed for #{}: {}", signal.id, e.what());
            }
        }
    }

    if (baselines_ && baselines_->offer(symbol, timeframe, bar, *snapshot)) {
        summary.baselines_written++;
    }
}

CycleSummary SignalPipeline::process_symbol(SymbolWorker& worker, int64_t now_ms) {
    CycleSummary summary;
    const std::string& symbol = worker.symbol;
    const std::string& base_tf = settings_.base_timeframe;
    int64_t width = timeframe::duration_ms(base_tf);

    if (!worker.warmed) {
        warm_up(worker, now_ms);
    }

    auto latest = candles_.latest_timestamp(symbol, base_tf);
    int64_t from_ms = latest ? *latest + width
                             : timeframe::floor_ms(now_ms - settings_.backfill_minutes * 60000LL,
                                                   base_tf);

    IngestionLogEntry log_entry;
    log_entry.source = "provider";
    log_entry.symbol = symbol;
    log_entry.timeframe = base_tf;
    log_entry.created_at_ms = now_ms;

    std::vector<Candle> fetched;
    try {
        fetched = fetch_with_retry(symbol, from_ms, now_ms);
    } catch (const ProviderError& e) {
        spdlog::error("Giving up on {} this cycle: {}", symbol, e.what());
        summary.symbols_failed++;
        summary.skipped.push_back({symbol, e.what()});
        log_entry.errors = e.what();
        candles_.log_ingestion(log_entry);
        return summary;
    }

    // Only closed bars past what this stream has already consumed.
    auto last_seen = indicators_.last_timestamp(symbol, base_tf);
    std::vector<Candle> closed;
    for (const auto& bar : fetched) {
        if (bar.timestamp_ms + width > now_ms) continue;
        if (bar.timestamp_ms < from_ms) continue;
        if (last_seen && bar.timestamp_ms <= *last_seen) continue;
        if (!closed.empty() && bar.timestamp_ms <= closed.back().timestamp_ms) continue;
        closed.push_back(bar);
    }

    std::optional<Quote> quote;
    if (settings_.fetch_quotes && !closed.empty()) {
        try {
            quote = provider_.fetch_quote(symbol);
        } catch (const ProviderError& e) {
            spdlog::warn("No quote for {}: {}", symbol, e.what());
        }
    }
    int64_t fresh_end = closed.empty() ? 0 : closed.back().timestamp_ms + width;

    for (const auto& bar : closed) {
        candles_.put_bar(symbol, base_tf, bar);
        summary.bars_ingested++;

        bool fresh = bar.timestamp_ms + width == fresh_end;
        process_bar(symbol, base_tf, bar, fresh ? quote : std::nullopt, now_ms, summary);

        for (auto& agg : worker.aggregators) {
            if (!agg.started()) {
                agg.start_at(bar.timestamp_ms);
            }
            agg.add_bar(bar);
            for (const auto& derived : agg.get_completed_bars()) {
                candles_.put_bar(symbol, agg.target_timeframe(), derived);
                summary.bars_aggregated++;
                bool derived_fresh = timeframe::bar_end_ms(derived.timestamp_ms,
                                                           agg.target_timeframe()) == fresh_end;
                process_bar(symbol, agg.target_timeframe(), derived,
                            derived_fresh ? quote : std::nullopt, now_ms, summary);
            }
        }
    }

    log_entry.bars_written = summary.bars_ingested;
    log_entry.lag_ms = closed.empty() ? 0 : now_ms - fresh_end;
    candles_.log_ingestion(log_entry);

    summary.symbols_processed++;
    spdlog::debug("{}: {} bars, {} derived, {} signals", symbol, summary.bars_ingested,
                  summary.bars_aggregated, summary.signals_emitted);
    return summary;
}

CycleSummary SignalPipeline::run_cycle(int64_t now_ms) {
    std::lock_guard<std::mutex> lock(cycle_mutex_);

    CycleSummary total;
    total.started_at_ms = util::current_timestamp_ms();

    std::vector<CycleSummary> results(workers_.size());
    std::atomic<size_t> next{0};

    auto work = [&]() {
        for (size_t i = next++; i < workers_.size(); i = next++) {
            SymbolWorker& worker = *workers_[i];
            try {
                results[i] = process_symbol(worker, now_ms);
            } catch (const std::exception& e) {
                spdlog::error("Symbol {} failed: {}", worker.symbol, e.what());
                results[i] = CycleSummary();
                results[i].symbols_failed = 1;
                results[i].skipped.push_back({worker.symbol, e.what()});
                // Rebuild stream state from the store next cycle.
                worker.warmed = false;
                for (auto& agg : worker.aggregators) {
                    agg = BarAggregator(settings_.base_timeframe, agg.target_timeframe());
                }
            }
        }
    };

    size_t pool_size = std::min(static_cast<size_t>(std::max(settings_.max_concurrency, 1)),
                                workers_.size());
    std::vector<std::thread> pool;
    for (size_t t = 1; t < pool_size; ++t) {
        pool.emplace_back(work);
    }
    work();
    for (auto& th : pool) {
        th.join();
    }

    for (const auto& r : results) {
        total.merge(r);
    }
    total.finished_at_ms = util::current_timestamp_ms();

    spdlog::info("Cycle complete: {} symbols ({} failed), {} bars, {} derived, {} signals, "
                 "{} baselines", total.symbols_processed, total.symbols_failed,
                 total.bars_ingested, total.bars_aggregated, total.signals_emitted,
                 total.baselines_written);
    return total;
}
