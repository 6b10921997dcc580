#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/outcome_labeler.hpp"
#include "../src/memory_store.hpp"
#include "../src/errors.hpp"
#include <atomic>

using Catch::Approx;

namespace {

constexpr int64_t kBase = 1704205800000;  // 2024-01-02 14:30 UTC
constexpr int64_t kMinute = 60000;
constexpr int64_t kLater = kBase + 24LL * 60 * kMinute;

Candle bar_at(int i, double high, double low, double close) {
    Candle c;
    c.timestamp_ms = kBase + i * kMinute;
    c.open = close;
    c.high = high;
    c.low = low;
    c.close = close;
    c.volume = 1000.0;
    return c;
}

Signal recorded_signal(MemoryStore& store, const std::string& side = "long") {
    Signal s;
    s.symbol = "AAPL";
    s.timeframe = "1m";
    s.fired_at_ms = kBase;
    s.detector_id = "breakout";
    s.detector_version = "1";
    s.side = side;
    s.price_at_signal = 100.0;
    return store.record(s).signal;
}

LabelerSettings one_minute_settings(int bars = 5) {
    LabelerSettings settings;
    settings.horizons = {Horizon{"1m", bars}};
    settings.targets = {0.02, 0.05, 0.10};
    settings.stop_pct = 0.02;
    return settings;
}

// Five quiet bars after the signal bar
void put_quiet_window(MemoryStore& store) {
    store.put_bar("AAPL", "1m", bar_at(1, 100.8, 99.6, 100.2));
    store.put_bar("AAPL", "1m", bar_at(2, 101.0, 99.8, 100.6));
    store.put_bar("AAPL", "1m", bar_at(3, 100.9, 100.1, 100.4));
    store.put_bar("AAPL", "1m", bar_at(4, 100.7, 99.5, 99.9));
    store.put_bar("AAPL", "1m", bar_at(5, 100.5, 99.7, 100.3));
}

} // namespace

TEST_CASE("Expected horizon timestamps", "[labeler]") {
    SECTION("Same timeframe starts at the next bar") {
        auto ts = OutcomeLabeler::expected_timestamps(kBase, "1m", Horizon{"1m", 3});
        REQUIRE(ts == std::vector<int64_t>{kBase + kMinute, kBase + 2 * kMinute,
                                           kBase + 3 * kMinute});
    }

    SECTION("Coarser horizon starts at the next aligned bucket") {
        int64_t fired = kBase + 7 * kMinute;  // 14:37
        auto ts = OutcomeLabeler::expected_timestamps(fired, "1m", Horizon{"15m", 2});
        REQUIRE(ts.size() == 2);
        REQUIRE(ts[0] == kBase + 15 * kMinute);
        REQUIRE(ts[1] == kBase + 30 * kMinute);
    }

    SECTION("Finer horizon starts where the signal bar closes") {
        int64_t fired = kBase + 30 * kMinute;  // 15:00, a 1h bar closing at 16:00
        auto ts = OutcomeLabeler::expected_timestamps(fired, "1h", Horizon{"15m", 3});
        REQUIRE(ts == std::vector<int64_t>{kBase + 90 * kMinute, kBase + 105 * kMinute,
                                           kBase + 120 * kMinute});
    }
}

TEST_CASE("Finer horizon never reads inside the signal bar", "[labeler]") {
    constexpr int64_t kHour = 60 * kMinute;
    const int64_t fired = kBase + 30 * kMinute;  // 15:00 UTC, aligned to 1h

    MemoryStore store;
    Signal s;
    s.symbol = "AAPL";
    s.timeframe = "1h";
    s.fired_at_ms = fired;
    s.detector_id = "breakout";
    s.detector_version = "1";
    s.price_at_signal = 100.0;
    Signal signal = store.record(s).signal;

    auto quarter = [&](int64_t ts, double low) {
        Candle c;
        c.timestamp_ms = ts;
        c.open = 100.0;
        c.high = 100.5;
        c.low = low;
        c.close = 100.2;
        c.volume = 1000.0;
        store.put_bar("AAPL", "15m", c);
    };
    // 15:15 sits inside the signal's own hour and would hit any stop
    for (int i = 0; i < 4; ++i) {
        quarter(fired + i * 15 * kMinute, i == 1 ? 90.0 : 99.8);
    }
    for (int i = 0; i < 4; ++i) {
        quarter(fired + kHour + i * 15 * kMinute, 99.9);
    }

    LabelerSettings settings;
    settings.horizons = {Horizon{"15m", 4}};
    settings.stop_pct = 0.02;
    OutcomeLabeler labeler(store, store, store, settings);

    SECTION("Pending until the horizon after the signal bar has closed") {
        REQUIRE(labeler.label_signal(signal, Horizon{"15m", 4}, fired + 2 * kHour - 1) ==
                LabelStatus::Pending);
    }

    SECTION("Labels only bars after the signal bar") {
        REQUIRE(labeler.label_signal(signal, Horizon{"15m", 4}, fired + 2 * kHour) ==
                LabelStatus::Computed);
        const Outcome o = store.query_outcomes(signal.id)[0];
        REQUIRE_FALSE(o.hit_stop);
        REQUIRE(o.max_drawdown == Approx(-0.001));
        REQUIRE(o.max_run_up == Approx(0.005));
    }
}

TEST_CASE("Outcome labeling", "[labeler]") {
    MemoryStore store;
    Signal signal = recorded_signal(store);
    OutcomeLabeler labeler(store, store, store, one_minute_settings());
    Horizon horizon{"1m", 5};

    SECTION("Only bars inside the horizon are read") {
        // Extremes on the signal bar and right after the horizon must not leak in
        store.put_bar("AAPL", "1m", bar_at(0, 200.0, 1.0, 100.0));
        put_quiet_window(store);
        store.put_bar("AAPL", "1m", bar_at(6, 300.0, 1.0, 250.0));

        REQUIRE(labeler.label_signal(signal, horizon, kLater) == LabelStatus::Computed);
        auto outcomes = store.query_outcomes(signal.id);
        REQUIRE(outcomes.size() == 1);

        const Outcome& o = outcomes[0];
        REQUIRE(o.horizon_tf == "1m");
        REQUIRE(o.horizon_bars == 5);
        REQUIRE(o.ret_close == Approx(0.003));
        REQUIRE(o.max_run_up == Approx(0.01));
        REQUIRE(o.max_drawdown == Approx(-0.005));
        REQUIRE_FALSE(o.hit_tp1);
        REQUIRE_FALSE(o.hit_stop);
        REQUIRE_FALSE(o.t_to_tp1_ms.has_value());
        REQUIRE(o.computed_at_ms == kLater);
    }

    SECTION("Incomplete horizon is pending and writes nothing") {
        store.put_bar("AAPL", "1m", bar_at(1, 100.8, 99.6, 100.2));
        store.put_bar("AAPL", "1m", bar_at(2, 101.0, 99.8, 100.6));
        store.put_bar("AAPL", "1m", bar_at(3, 100.9, 100.1, 100.4));

        REQUIRE(labeler.label_signal(signal, horizon, kLater) == LabelStatus::Pending);
        REQUIRE(store.outcome_count() == 0);

        store.put_bar("AAPL", "1m", bar_at(4, 100.7, 99.5, 99.9));
        store.put_bar("AAPL", "1m", bar_at(5, 100.5, 99.7, 100.3));
        REQUIRE(labeler.label_signal(signal, horizon, kLater) == LabelStatus::Computed);
    }

    SECTION("Horizon is pending until its last bar has closed") {
        put_quiet_window(store);
        int64_t horizon_end = kBase + 6 * kMinute;
        REQUIRE(labeler.label_signal(signal, horizon, horizon_end - 1) == LabelStatus::Pending);
        REQUIRE(labeler.label_signal(signal, horizon, horizon_end) == LabelStatus::Computed);
    }

    SECTION("Missing bar is a data gap, never filled") {
        store.put_bar("AAPL", "1m", bar_at(1, 100.8, 99.6, 100.2));
        store.put_bar("AAPL", "1m", bar_at(2, 101.0, 99.8, 100.6));
        store.put_bar("AAPL", "1m", bar_at(4, 100.7, 99.5, 99.9));
        store.put_bar("AAPL", "1m", bar_at(5, 100.5, 99.7, 100.3));

        REQUIRE(labeler.label_signal(signal, horizon, kLater) == LabelStatus::DataGap);
        REQUIRE(store.outcome_count() == 0);
    }

    SECTION("Existing label is not recomputed") {
        put_quiet_window(store);
        REQUIRE(labeler.label_signal(signal, horizon, kLater) == LabelStatus::Computed);

        // A later correction to the candles does not touch the stored label
        store.put_bar("AAPL", "1m", bar_at(5, 150.0, 99.7, 140.0));
        REQUIRE(labeler.label_signal(signal, horizon, kLater + kMinute) ==
                LabelStatus::AlreadyLabeled);
        REQUIRE(store.query_outcomes(signal.id)[0].ret_close == Approx(0.003));
    }

    SECTION("A new label version is labeled independently") {
        put_quiet_window(store);
        REQUIRE(labeler.label_signal(signal, horizon, kLater) == LabelStatus::Computed);

        LabelerSettings v2 = one_minute_settings();
        v2.label_version = 2;
        v2.stop_pct = 0.0045;
        OutcomeLabeler relabeler(store, store, store, v2);
        REQUIRE(relabeler.label_signal(signal, horizon, kLater) == LabelStatus::Computed);

        auto outcomes = store.query_outcomes(signal.id);
        REQUIRE(outcomes.size() == 2);
        REQUIRE(outcomes[0].label_version == 1);
        REQUIRE_FALSE(outcomes[0].hit_stop);
        REQUIRE(outcomes[1].label_version == 2);
        REQUIRE(outcomes[1].hit_stop);
        REQUIRE(*outcomes[1].t_to_stop_ms == 4 * kMinute);
    }
}

TEST_CASE("Barrier ordering", "[labeler]") {
    Signal signal;
    signal.id = 7;
    signal.fired_at_ms = kBase;
    signal.price_at_signal = 100.0;
    Horizon horizon{"1m", 3};

    SECTION("Stop wins a same-bar tie by default") {
        std::vector<Candle> bars = {bar_at(1, 102.5, 97.5, 100.0), bar_at(2, 101.0, 99.0, 100.0),
                                    bar_at(3, 101.0, 99.0, 100.0)};
        auto settings = one_minute_settings(3);
        REQUIRE(settings.tie_policy == TiePolicy::StopFirst);

        Outcome o = OutcomeLabeler::compute_outcome(signal, horizon, bars, settings);
        REQUIRE(o.hit_stop);
        REQUIRE(*o.t_to_stop_ms == kMinute);
        REQUIRE_FALSE(o.hit_tp1);

        settings.tie_policy = TiePolicy::TargetFirst;
        Outcome t = OutcomeLabeler::compute_outcome(signal, horizon, bars, settings);
        REQUIRE(t.hit_tp1);
        REQUIRE(*t.t_to_tp1_ms == kMinute);
        REQUIRE(t.hit_stop);
    }

    SECTION("Targets after the stop do not count") {
        std::vector<Candle> bars = {bar_at(1, 100.5, 97.9, 98.5), bar_at(2, 101.0, 98.0, 100.5),
                                    bar_at(3, 106.0, 100.0, 105.5)};
        Outcome o = OutcomeLabeler::compute_outcome(signal, horizon, bars,
                                                    one_minute_settings(3));
        REQUIRE(o.hit_stop);
        REQUIRE_FALSE(o.hit_tp1);
        REQUIRE_FALSE(o.hit_tp2);
        // Path statistics still cover the whole horizon
        REQUIRE(o.max_run_up == Approx(0.06));
        REQUIRE(o.ret_close == Approx(0.055));
    }

    SECTION("Targets record time to first touch") {
        std::vector<Candle> bars = {bar_at(1, 102.3, 99.5, 101.5), bar_at(2, 104.0, 101.0, 103.0),
                                    bar_at(3, 105.2, 103.0, 104.0)};
        Outcome o = OutcomeLabeler::compute_outcome(signal, horizon, bars,
                                                    one_minute_settings(3));
        REQUIRE(o.hit_tp1);
        REQUIRE(*o.t_to_tp1_ms == kMinute);
        REQUIRE(o.hit_tp2);
        REQUIRE(*o.t_to_tp2_ms == 3 * kMinute);
        REQUIRE_FALSE(o.hit_tp3);
        REQUIRE_FALSE(o.hit_stop);
    }

    SECTION("Short signals mirror the barriers") {
        signal.side = "short";
        std::vector<Candle> bars = {bar_at(1, 101.0, 99.0, 99.5), bar_at(2, 100.0, 97.9, 98.2),
                                    bar_at(3, 99.0, 98.0, 98.5)};
        Outcome o = OutcomeLabeler::compute_outcome(signal, horizon, bars,
                                                    one_minute_settings(3));
        REQUIRE(o.hit_tp1);
        REQUIRE(*o.t_to_tp1_ms == 2 * kMinute);
        REQUIRE_FALSE(o.hit_stop);
        REQUIRE(o.ret_close == Approx(-0.015));
        REQUIRE(o.max_drawdown == Approx(-0.021));
    }

    SECTION("Identical inputs give identical outcomes") {
        std::vector<Candle> bars = {bar_at(1, 102.5, 97.5, 100.0), bar_at(2, 103.0, 99.0, 101.0),
                                    bar_at(3, 101.0, 96.0, 97.0)};
        auto settings = one_minute_settings(3);
        Outcome a = OutcomeLabeler::compute_outcome(signal, horizon, bars, settings);
        Outcome b = OutcomeLabeler::compute_outcome(signal, horizon, bars, settings);
        REQUIRE(a.ret_close == b.ret_close);
        REQUIRE(a.max_run_up == b.max_run_up);
        REQUIRE(a.max_drawdown == b.max_drawdown);
        REQUIRE(a.hit_stop == b.hit_stop);
        REQUIRE(a.t_to_stop_ms == b.t_to_stop_ms);
        REQUIRE(a.hit_tp1 == b.hit_tp1);
    }

    SECTION("Entry price must be positive") {
        signal.price_at_signal = 0.0;
        std::vector<Candle> bars = {bar_at(1, 101.0, 99.0, 100.0)};
        REQUIRE_THROWS_AS(OutcomeLabeler::compute_outcome(signal, Horizon{"1m", 1}, bars,
                                                          one_minute_settings(1)),
                          std::invalid_argument);
    }
}

TEST_CASE("Label sweep", "[labeler]") {
    MemoryStore store;
    Signal signal = recorded_signal(store);

    LabelerSettings settings = one_minute_settings();
    settings.horizons = {Horizon{"1m", 5}, Horizon{"1m", 30}};
    OutcomeLabeler labeler(store, store, store, settings);
    put_quiet_window(store);

    SECTION("Labels what it can and defers the rest") {
        auto summary = labeler.run_sweep(kBase + 10 * kMinute);
        REQUIRE(summary.signals_scanned == 1);
        REQUIRE(summary.outcomes_computed == 1);
        REQUIRE(summary.pending == 1);
        REQUIRE(summary.status() == RunStatus::Success);

        auto second = labeler.run_sweep(kBase + 11 * kMinute);
        REQUIRE(second.outcomes_computed == 0);
        REQUIRE(second.already_labeled == 1);
        REQUIRE(second.pending == 1);
    }

    SECTION("Signals older than the lookback are not swept") {
        auto summary = labeler.run_sweep(kBase + settings.lookback_ms + kMinute);
        REQUIRE(summary.signals_scanned == 0);
    }

    SECTION("Cancellation stops the sweep") {
        std::atomic<bool> cancel{true};
        auto summary = labeler.run_sweep(kBase + 10 * kMinute, &cancel);
        REQUIRE(summary.cancelled);
        REQUIRE(summary.signals_scanned == 0);
        REQUIRE(store.outcome_count() == 0);
    }

    SECTION("Summary serializes for the event stream") {
        auto json = labeler.run_sweep(kBase + 10 * kMinute).to_json();
        REQUIRE(json["type"] == "label_sweep");
        REQUIRE(json["status"] == "success");
        REQUIRE(json["outcomes_computed"] == 1);
    }
}

TEST_CASE("Labeler rejects invalid horizons", "[labeler]") {
    MemoryStore store;
    LabelerSettings bad = one_minute_settings();
    bad.horizons = {Horizon{"2m", 5}};
    REQUIRE_THROWS_AS(OutcomeLabeler(store, store, store, bad), ConfigValidationError);

    bad.horizons = {Horizon{"1m", 0}};
    REQUIRE_THROWS_AS(OutcomeLabeler(store, store, store, bad), ConfigValidationError);
}
