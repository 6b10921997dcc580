#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/bar_aggregator.hpp"

using Catch::Approx;

namespace {

constexpr int64_t kBase = 1704205800000;  // 2024-01-02 14:30 UTC
constexpr int64_t kMinute = 60000;

Candle minute_bar(int i, double open, double high, double low, double close, double volume) {
    Candle c;
    c.timestamp_ms = kBase + i * kMinute;
    c.open = open;
    c.high = high;
    c.low = low;
    c.close = close;
    c.volume = volume;
    return c;
}

} // namespace

TEST_CASE("Bar aggregation", "[aggregator]") {
    BarAggregator agg("1m", "5m");

    SECTION("Empty aggregator emits nothing") {
        REQUIRE(agg.get_completed_bars().empty());
        REQUIRE_FALSE(agg.get_current_bar().has_value());
    }

    SECTION("Open bucket is not emitted") {
        agg.add_bar(minute_bar(0, 100, 101, 99, 100.5, 1000));
        agg.add_bar(minute_bar(1, 100.5, 102, 100, 101, 500));

        REQUIRE(agg.get_completed_bars().empty());
        auto current = agg.get_current_bar();
        REQUIRE(current.has_value());
        REQUIRE(current->open == 100.0);
        REQUIRE(current->close == 101.0);
    }

    SECTION("Full bucket computes OHLCV") {
        agg.add_bar(minute_bar(0, 100, 101, 99, 100.5, 1000));
        agg.add_bar(minute_bar(1, 100.5, 104, 100, 103, 500));
        agg.add_bar(minute_bar(2, 103, 103.5, 97, 98, 400));
        agg.add_bar(minute_bar(3, 98, 99, 97.5, 98.5, 300));
        agg.add_bar(minute_bar(4, 98.5, 100, 98, 99.5, 800));

        auto bars = agg.get_completed_bars();
        REQUIRE(bars.size() == 1);
        REQUIRE(bars[0].timestamp_ms == kBase);
        REQUIRE(bars[0].open == 100.0);
        REQUIRE(bars[0].high == 104.0);
        REQUIRE(bars[0].low == 97.0);
        REQUIRE(bars[0].close == 99.5);
        REQUIRE(bars[0].volume == 3000.0);
        REQUIRE(bars[0].source == "aggregate:1m");

        // Emitted once
        REQUIRE(agg.get_completed_bars().empty());
    }

    SECTION("Missing minutes are not fabricated") {
        agg.add_bar(minute_bar(0, 100, 101, 99, 100, 1000));
        agg.add_bar(minute_bar(3, 100, 102, 99, 101, 1000));
        // Next bucket's bar closes the first one
        agg.add_bar(minute_bar(6, 101, 101, 100, 100, 1000));

        auto bars = agg.get_completed_bars();
        REQUIRE(bars.size() == 1);
        REQUIRE(bars[0].volume == 2000.0);
        REQUIRE(bars[0].close == 101.0);
    }

    SECTION("Skipped bucket produces no bar") {
        agg.add_bar(minute_bar(0, 100, 101, 99, 100, 1000));
        agg.add_bar(minute_bar(12, 100, 101, 99, 100, 1000));
        auto bars = agg.get_completed_bars();
        REQUIRE(bars.size() == 1);
        REQUIRE(bars[0].timestamp_ms == kBase);
    }

    SECTION("VWAP is volume weighted") {
        Candle a = minute_bar(0, 100, 101, 99, 100, 1000);
        a.vwap = 100.0;
        Candle b = minute_bar(1, 100, 103, 99, 102, 3000);
        b.vwap = 102.0;
        agg.add_bar(a);
        agg.add_bar(b);
        auto current = agg.get_current_bar();
        REQUIRE(current->vwap.has_value());
        REQUIRE(*current->vwap == Approx(101.5));
    }

    SECTION("Leading partial bucket is skipped") {
        agg.start_at(kBase + 2 * kMinute);
        REQUIRE(agg.started());
        REQUIRE_FALSE(agg.add_bar(minute_bar(2, 100, 101, 99, 100, 1000)));
        REQUIRE_FALSE(agg.add_bar(minute_bar(4, 100, 101, 99, 100, 1000)));
        for (int i = 5; i <= 10; ++i) {
            REQUIRE(agg.add_bar(minute_bar(i, 100, 101, 99, 100, 1000)));
        }
        auto bars = agg.get_completed_bars();
        REQUIRE(bars.size() == 1);
        REQUIRE(bars[0].timestamp_ms == kBase + 5 * kMinute);
        REQUIRE(bars[0].volume == 5000.0);
    }

    SECTION("Resumed aggregator drops bars of emitted buckets") {
        agg.resume_after(kBase);
        REQUIRE_FALSE(agg.add_bar(minute_bar(3, 100, 101, 99, 100, 1000)));
        REQUIRE(agg.add_bar(minute_bar(5, 100, 101, 99, 100, 1000)));
    }
}

TEST_CASE("Aggregator rejects incompatible timeframes", "[aggregator]") {
    REQUIRE_THROWS_AS(BarAggregator("5m", "1m"), std::invalid_argument);
    REQUIRE_THROWS_AS(BarAggregator("4h", "5h"), std::invalid_argument);
    REQUIRE_NOTHROW(BarAggregator("1m", "1d"));
}
