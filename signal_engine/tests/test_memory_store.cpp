#include <catch2/catch_test_macros.hpp>
#include "../src/memory_store.hpp"
#include "../src/errors.hpp"

namespace {

constexpr int64_t kBase = 1704205800000;  // 2024-01-02 14:30 UTC
constexpr int64_t kMinute = 60000;

Candle bar_at(int i, double close) {
    Candle c;
    c.timestamp_ms = kBase + i * kMinute;
    c.open = close;
    c.high = close;
    c.low = close;
    c.close = close;
    c.volume = 100.0;
    return c;
}

Signal signal_at(const std::string& symbol, int i, const std::string& detector = "breakout") {
    Signal s;
    s.symbol = symbol;
    s.timeframe = "1m";
    s.fired_at_ms = kBase + i * kMinute;
    s.detector_id = detector;
    s.detector_version = "1";
    s.price_at_signal = 100.0 + i;
    return s;
}

} // namespace

TEST_CASE("Candle storage", "[store]") {
    MemoryStore store;
    for (int i = 0; i < 10; ++i) {
        store.put_bar("AAPL", "1m", bar_at(i, 100.0 + i));
    }

    SECTION("Upsert replaces by key") {
        store.put_bar("AAPL", "1m", bar_at(3, 42.0));
        REQUIRE(store.candle_count() == 10);
        auto bars = store.bars_between("AAPL", "1m", kBase + 2 * kMinute, kBase + 3 * kMinute);
        REQUIRE(bars.size() == 1);
        REQUIRE(bars[0].close == 42.0);
    }

    SECTION("Range excludes the lower bound") {
        auto bars = store.bars_between("AAPL", "1m", kBase, kBase + 4 * kMinute);
        REQUIRE(bars.size() == 4);
        REQUIRE(bars.front().timestamp_ms == kBase + kMinute);
        REQUIRE(bars.back().timestamp_ms == kBase + 4 * kMinute);
    }

    SECTION("Recent bars are the newest ones, ascending") {
        auto bars = store.recent_bars("AAPL", "1m", kBase + 7 * kMinute, 3);
        REQUIRE(bars.size() == 3);
        REQUIRE(bars[0].timestamp_ms == kBase + 5 * kMinute);
        REQUIRE(bars[2].timestamp_ms == kBase + 7 * kMinute);
    }

    SECTION("Streams are keyed by symbol and timeframe") {
        REQUIRE(*store.latest_timestamp("AAPL", "1m") == kBase + 9 * kMinute);
        REQUIRE_FALSE(store.latest_timestamp("AAPL", "5m").has_value());
        REQUIRE(store.bars_between("MSFT", "1m", 0, kBase + kMinute * 100).empty());
    }

    SECTION("Symbols are registered on first write") {
        auto info = store.get_symbol("AAPL");
        REQUIRE(info.has_value());
        REQUIRE(info->ticker == "AAPL");
        REQUIRE(info->last_seen_ms == kBase + 9 * kMinute);
        REQUIRE_FALSE(store.get_symbol("MSFT").has_value());
    }
}

TEST_CASE("Signal log", "[store]") {
    MemoryStore store;

    SECTION("Natural key deduplicates") {
        auto first = store.record(signal_at("AAPL", 1));
        REQUIRE(first.created);
        REQUIRE(first.signal.id > 0);

        Signal changed = signal_at("AAPL", 1);
        changed.score = 99.0;
        auto second = store.record(changed);
        REQUIRE_FALSE(second.created);
        REQUIRE(second.signal.id == first.signal.id);
        REQUIRE(second.signal.score == 0.0);
        REQUIRE(store.signal_count() == 1);

        auto other_detector = store.record(signal_at("AAPL", 1, "model"));
        REQUIRE(other_detector.created);
    }

    SECTION("Queries filter and order by fired time") {
        store.record(signal_at("AAPL", 5));
        store.record(signal_at("MSFT", 2));
        store.record(signal_at("AAPL", 1));
        store.record(signal_at("AAPL", 9));

        SignalQuery by_symbol;
        by_symbol.symbol = "AAPL";
        auto aapl = store.query_signals(by_symbol);
        REQUIRE(aapl.size() == 3);
        REQUIRE(aapl[0].fired_at_ms == kBase + kMinute);
        REQUIRE(aapl[2].fired_at_ms == kBase + 9 * kMinute);

        SignalQuery since;
        since.since_ms = kBase + 2 * kMinute;
        since.limit = 2;
        auto recent = store.query_signals(since);
        REQUIRE(recent.size() == 2);
        REQUIRE(recent[0].symbol == "MSFT");

        SignalQuery unlimited;
        unlimited.limit = 0;
        REQUIRE(store.query_signals(unlimited).size() == 4);
    }

    SECTION("Latest signal per detector stream") {
        store.record(signal_at("AAPL", 3));
        store.record(signal_at("AAPL", 7));
        store.record(signal_at("AAPL", 8, "model"));

        auto latest = store.latest_signal("AAPL", "1m", "breakout", "1");
        REQUIRE(latest.has_value());
        REQUIRE(latest->fired_at_ms == kBase + 7 * kMinute);
        REQUIRE(store.has_signal_at("AAPL", "1m", kBase + 8 * kMinute));
        REQUIRE_FALSE(store.has_signal_at("AAPL", "1m", kBase + 4 * kMinute));
        REQUIRE_FALSE(store.latest_signal("AAPL", "1m", "breakout", "2").has_value());
    }

    SECTION("Detector versions are immutable") {
        DetectorInfo info;
        info.id = "breakout";
        info.version = "1";
        info.params = {{"lookback", 20}};
        store.register_detector(info);
        REQUIRE_NOTHROW(store.register_detector(info));

        info.params = {{"lookback", 10}};
        REQUIRE_THROWS_AS(store.register_detector(info), ConfigValidationError);

        info.version = "2";
        REQUIRE_NOTHROW(store.register_detector(info));
    }
}

TEST_CASE("Outcome and baseline writes are insert-only", "[store]") {
    MemoryStore store;

    Outcome o;
    o.signal_id = 1;
    o.horizon_tf = "15m";
    o.horizon_bars = 20;
    o.ret_close = 0.01;
    REQUIRE(store.insert_outcome(o));

    Outcome again = o;
    again.ret_close = 0.5;
    REQUIRE_FALSE(store.insert_outcome(again));
    REQUIRE(store.query_outcomes(1)[0].ret_close == 0.01);
    REQUIRE(store.has_outcome(1, Horizon{"15m", 20}, 1));
    REQUIRE_FALSE(store.has_outcome(1, Horizon{"15m", 20}, 2));

    Baseline b;
    b.symbol = "AAPL";
    b.timeframe = "1m";
    b.timestamp_ms = kBase;
    REQUIRE(store.insert_baseline(b));
    REQUIRE_FALSE(store.insert_baseline(b));
    REQUIRE(*store.latest_baseline_ts("AAPL", "1m", 1) == kBase);
    REQUIRE_FALSE(store.latest_baseline_ts("AAPL", "1m", 2).has_value());
}
