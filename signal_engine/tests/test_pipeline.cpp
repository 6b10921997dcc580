#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/pipeline.hpp"
#include "../src/memory_store.hpp"
#include "../src/outcome_labeler.hpp"
#include "../src/errors.hpp"
#include <atomic>
#include <mutex>
#include <set>

using Catch::Approx;

namespace {

constexpr int64_t kOpen = 1704205800000;  // 2024-01-02 14:30 UTC (09:30 New York)
constexpr int64_t kMinute = 60000;

// Serves canned bars per symbol; symbols listed in `failing` or `rejected`
// always error.
class ScriptedProvider : public MarketDataProvider {
public:
    std::map<std::string, std::vector<Candle>> bars;
    std::set<std::string> failing;
    std::set<std::string> rejected;
    std::optional<Quote> quote;
    std::atomic<int> bar_requests{0};

    std::vector<Candle> fetch_bars(const std::string& symbol, const std::string& timeframe,
                                   int64_t from_ms, int64_t to_ms) override {
        bar_requests++;
        if (failing.count(symbol)) {
            throw ProviderError("HTTP 503 from provider", 503);
        }
        if (rejected.count(symbol)) {
            throw ProviderRejectedError("HTTP 401 from provider", 401);
        }
        std::vector<Candle> out;
        auto it = bars.find(symbol);
        if (it == bars.end()) return out;
        for (const auto& c : it->second) {
            if (c.timestamp_ms >= from_ms && c.timestamp_ms <= to_ms) {
                out.push_back(c);
            }
        }
        return out;
    }

    std::optional<Quote> fetch_quote(const std::string& symbol) override {
        return quote;
    }
};

// close = 100 + 0.05 i, high = close + 0.02, volume 1000 except a 3x spike at 09:45
std::vector<Candle> opening_session(int count) {
    std::vector<Candle> out;
    for (int i = 0; i < count; ++i) {
        Candle c;
        c.timestamp_ms = kOpen + i * kMinute;
        c.close = 100.0 + 0.05 * i;
        c.open = c.close - 0.01;
        c.high = c.close + 0.02;
        c.low = c.close - 0.04;
        c.volume = i == 15 ? 3000.0 : 1000.0;
        out.push_back(c);
    }
    return out;
}

PipelineSettings settings_for(std::vector<std::string> symbols) {
    PipelineSettings settings;
    settings.symbols = std::move(symbols);
    settings.base_timeframe = "1m";
    settings.derived_timeframes = {"5m"};
    settings.backfill_minutes = 120;
    settings.max_concurrency = 2;
    settings.max_retries = 0;
    settings.backoff_ms_min = 1;
    settings.backoff_ms_max = 1;
    return settings;
}

DetectorRegistry breakout_registry() {
    BreakoutParams params;
    params.lookback = 10;
    params.volume_multiplier = 1.5;
    DetectorRegistry registry;
    registry.add(std::make_shared<BreakoutDetector>("breakout", "1", params));
    return registry;
}

// Records the context snapshots it is handed; never fires.
class ContextRecorder : public Detector {
public:
    struct Seen {
        std::string timeframe;
        int64_t bar_ms;
        std::map<std::string, int64_t> context_ms;
    };

    ContextRecorder() : Detector(info_for()) {}

    std::vector<std::string> context_timeframes() const override { return {"5m"}; }

    std::optional<SignalCandidate> evaluate(const DetectorInput& input) override {
        Seen seen{input.timeframe, input.bar.timestamp_ms, {}};
        for (const auto& kv : input.context) {
            seen.context_ms[kv.first] = kv.second.timestamp_ms;
        }
        std::lock_guard<std::mutex> lock(mutex);
        calls.push_back(seen);
        return std::nullopt;
    }

    std::mutex mutex;
    std::vector<Seen> calls;

private:
    static DetectorInfo info_for() {
        DetectorInfo info;
        info.id = "context_recorder";
        info.version = "1";
        info.kind = DetectorKind::Rule;
        return info;
    }
};

} // namespace

TEST_CASE("Opening breakout end to end", "[pipeline]") {
    MemoryStore store;
    ScriptedProvider provider;
    provider.bars["AAPL"] = opening_session(21);
    provider.quote = Quote{100.99, 101.01};

    DetectorRegistry registry = breakout_registry();
    registry.persist(store);
    IndicatorEngine indicators;
    DetectorRunner runner(registry, store, 0, "signal_engine");
    SignalPipeline pipeline(settings_for({"AAPL"}), provider, store, indicators, runner);

    std::vector<Signal> published;
    pipeline.set_signal_callback([&published](const Signal& s) { published.push_back(s); });

    int64_t now = kOpen + 21 * kMinute;
    auto summary = pipeline.run_cycle(now);

    REQUIRE(summary.status() == RunStatus::Success);
    REQUIRE(summary.symbols_processed == 1);
    REQUIRE(summary.bars_ingested == 21);
    REQUIRE(summary.bars_aggregated == 4);
    REQUIRE(summary.signals_emitted == 1);

    auto signals = store.query_signals(SignalQuery());
    REQUIRE(signals.size() == 1);
    const Signal& s = signals[0];
    REQUIRE(s.symbol == "AAPL");
    REQUIRE(s.timeframe == "1m");
    REQUIRE(s.fired_at_ms == kOpen + 15 * kMinute);
    REQUIRE(s.detector_id == "breakout");
    REQUIRE(s.price_at_signal == Approx(100.75));
    REQUIRE(s.session == "regular");
    REQUIRE(*s.data_freshness_ms == 5 * kMinute);
    REQUIRE(s.features.at("volume_ratio") == Approx(3.0));
    REQUIRE(s.features.at("breakout_level") == Approx(100.72));
    // The quote belongs to the newest bar, not to the 09:45 one
    REQUIRE_FALSE(s.bid.has_value());

    REQUIRE(published.size() == 1);
    REQUIRE(published[0].id == s.id);

    auto log = store.ingestion_log();
    REQUIRE(log.size() == 1);
    REQUIRE(log[0].bars_written == 21);
    REQUIRE(log[0].lag_ms == 0);

    SECTION("Derived bars are persisted") {
        auto five = store.bars_between("AAPL", "5m", kOpen - 1, now);
        REQUIRE(five.size() == 4);
        REQUIRE(five[0].timestamp_ms == kOpen);
        REQUIRE(five[0].volume == 5000.0);
        REQUIRE(five[3].timestamp_ms == kOpen + 15 * kMinute);
        REQUIRE(five[3].volume == 7000.0);
    }

    SECTION("A repeat cycle adds nothing") {
        auto again = pipeline.run_cycle(now + 10000);
        REQUIRE(again.bars_ingested == 0);
        REQUIRE(again.signals_emitted == 0);
        REQUIRE(store.signal_count() == 1);
    }

    SECTION("New bars continue from the stored tail") {
        provider.bars["AAPL"] = opening_session(26);
        auto next = pipeline.run_cycle(kOpen + 26 * kMinute);
        REQUIRE(next.bars_ingested == 5);
        REQUIRE(next.bars_aggregated == 1);
        REQUIRE(next.signals_emitted == 0);
        REQUIRE(store.signal_count() == 1);
    }

    SECTION("A restarted engine resumes without duplicates") {
        DetectorRegistry fresh_registry = breakout_registry();
        fresh_registry.persist(store);
        IndicatorEngine fresh_indicators;
        DetectorRunner fresh_runner(fresh_registry, store, 0, "signal_engine");
        SignalPipeline restarted(settings_for({"AAPL"}), provider, store, fresh_indicators,
                                 fresh_runner);

        provider.bars["AAPL"] = opening_session(26);
        auto resumed = restarted.run_cycle(kOpen + 26 * kMinute);
        REQUIRE(resumed.bars_ingested == 5);
        REQUIRE(resumed.signals_emitted == 0);
        REQUIRE(resumed.signals_duplicate == 0);
        REQUIRE(store.signal_count() == 1);
        REQUIRE(store.bars_between("AAPL", "5m", kOpen - 1, kOpen + 26 * kMinute).size() == 5);
    }

    SECTION("The signal is labeled once its horizon has closed") {
        provider.bars["AAPL"] = opening_session(26);
        pipeline.run_cycle(kOpen + 26 * kMinute);

        LabelerSettings label_settings;
        label_settings.horizons = {Horizon{"1m", 5}, Horizon{"5m", 3}};
        OutcomeLabeler labeler(store, store, store, label_settings);
        auto sweep = labeler.run_sweep(kOpen + 26 * kMinute);
        REQUIRE(sweep.outcomes_computed == 1);
        REQUIRE(sweep.pending == 1);

        auto outcomes = store.query_outcomes(s.id);
        REQUIRE(outcomes.size() == 1);
        // Bars 16..20 close at 100.80..101.00
        REQUIRE(outcomes[0].ret_close == Approx((101.0 - 100.75) / 100.75));
        REQUIRE(outcomes[0].max_run_up == Approx((101.02 - 100.75) / 100.75));
        REQUIRE_FALSE(outcomes[0].hit_stop);
    }
}

TEST_CASE("Only closed bars are ingested", "[pipeline]") {
    MemoryStore store;
    ScriptedProvider provider;
    provider.bars["AAPL"] = opening_session(21);

    DetectorRegistry registry = breakout_registry();
    IndicatorEngine indicators;
    DetectorRunner runner(registry, store, 0, "signal_engine");
    SignalPipeline pipeline(settings_for({"AAPL"}), provider, store, indicators, runner);

    // 14:50 is still forming at 14:50:30
    auto summary = pipeline.run_cycle(kOpen + 20 * kMinute + 30000);
    REQUIRE(summary.bars_ingested == 20);
    REQUIRE(*store.latest_timestamp("AAPL", "1m") == kOpen + 19 * kMinute);
}

TEST_CASE("Provider failure makes the cycle partial", "[pipeline]") {
    MemoryStore store;
    ScriptedProvider provider;
    provider.bars["AAPL"] = opening_session(21);
    provider.failing.insert("MSFT");

    DetectorRegistry registry = breakout_registry();
    IndicatorEngine indicators;
    DetectorRunner runner(registry, store, 0, "signal_engine");
    auto settings = settings_for({"AAPL", "MSFT"});
    settings.max_retries = 2;
    SignalPipeline pipeline(settings, provider, store, indicators, runner);

    auto summary = pipeline.run_cycle(kOpen + 21 * kMinute);

    REQUIRE(summary.symbols_processed == 1);
    REQUIRE(summary.symbols_failed == 1);
    REQUIRE(summary.signals_emitted == 1);
    REQUIRE(summary.status() == RunStatus::Partial);
    REQUIRE(exit_code(summary.status()) == 2);
    REQUIRE(summary.skipped.size() == 1);
    REQUIRE(summary.skipped[0].item == "MSFT");
    // One attempt for AAPL, three for MSFT
    REQUIRE(provider.bar_requests.load() == 4);

    auto json = summary.to_json();
    REQUIRE(json["type"] == "cycle");
    REQUIRE(json["status"] == "partial");
    REQUIRE(json["skipped"].size() == 1);

    bool logged_error = false;
    for (const auto& entry : store.ingestion_log()) {
        if (entry.symbol == "MSFT" && !entry.errors.empty()) logged_error = true;
    }
    REQUIRE(logged_error);
}

TEST_CASE("Rejected requests are not retried", "[pipeline]") {
    MemoryStore store;
    ScriptedProvider provider;
    provider.rejected.insert("AAPL");

    DetectorRegistry registry = breakout_registry();
    IndicatorEngine indicators;
    DetectorRunner runner(registry, store, 0, "signal_engine");
    auto settings = settings_for({"AAPL"});
    settings.max_retries = 3;
    SignalPipeline pipeline(settings, provider, store, indicators, runner);

    auto summary = pipeline.run_cycle(kOpen + 21 * kMinute);

    REQUIRE(summary.symbols_failed == 1);
    REQUIRE(provider.bar_requests.load() == 1);
    REQUIRE(summary.skipped[0].item == "AAPL");
}

TEST_CASE("Detectors see only closed bars of other timeframes", "[pipeline]") {
    MemoryStore store;
    ScriptedProvider provider;
    provider.bars["AAPL"] = opening_session(21);

    auto recorder = std::make_shared<ContextRecorder>();
    DetectorRegistry registry;
    registry.add(recorder);
    IndicatorEngine indicators;
    DetectorRunner runner(registry, store, 0, "signal_engine");
    SignalPipeline pipeline(settings_for({"AAPL"}), provider, store, indicators, runner);

    pipeline.run_cycle(kOpen + 21 * kMinute);

    int with_context = 0;
    for (const auto& seen : recorder->calls) {
        if (seen.timeframe == "5m") {
            REQUIRE(seen.context_ms.empty());
            continue;
        }
        auto it = seen.context_ms.find("5m");
        if (it == seen.context_ms.end()) continue;
        with_context++;
        // The 5m bar closed no later than the 1m bar being evaluated
        REQUIRE(it->second + 5 * kMinute <= seen.bar_ms + kMinute);
    }
    REQUIRE(with_context > 0);
}

TEST_CASE("Run status exit codes", "[pipeline]") {
    REQUIRE(exit_code(RunStatus::Success) == 0);
    REQUIRE(exit_code(RunStatus::Partial) == 2);
    REQUIRE(exit_code(RunStatus::Fatal) == 1);

    CycleSummary a;
    a.symbols_processed = 2;
    a.signals_emitted = 1;
    CycleSummary b;
    b.detector_failures = 1;
    b.skipped.push_back({"breakout@1 AAPL:1m", "timed out"});
    a.merge(b);
    REQUIRE(a.symbols_processed == 2);
    REQUIRE(a.detector_failures == 1);
    REQUIRE(a.skipped.size() == 1);
    REQUIRE(a.status() == RunStatus::Partial);
}

TEST_CASE("Pipeline rejects bad timeframes", "[pipeline]") {
    MemoryStore store;
    ScriptedProvider provider;
    DetectorRegistry registry = breakout_registry();
    IndicatorEngine indicators;
    DetectorRunner runner(registry, store, 0, "signal_engine");

    auto bad_base = settings_for({"AAPL"});
    bad_base.base_timeframe = "2m";
    REQUIRE_THROWS_AS(SignalPipeline(bad_base, provider, store, indicators, runner),
                      ConfigValidationError);

    auto bad_derived = settings_for({"AAPL"});
    bad_derived.base_timeframe = "5m";
    bad_derived.derived_timeframes = {"1m"};
    REQUIRE_THROWS_AS(SignalPipeline(bad_derived, provider, store, indicators, runner),
                      ConfigValidationError);
}
