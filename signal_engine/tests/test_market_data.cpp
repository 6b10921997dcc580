#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/market_data_client.hpp"
#include "../src/scoring_model.hpp"
#include "../src/errors.hpp"
#include <cstdio>
#include <fstream>

using Catch::Approx;

TEST_CASE("Aggregate parsing", "[market_data]") {
    SECTION("Maps provider fields onto candles, ascending") {
        auto response = nlohmann::json::parse(R"({
            "ticker": "AAPL",
            "adjusted": true,
            "results": [
                {"t": 1704205860000, "o": 100.1, "h": 100.4, "l": 100.0, "c": 100.3,
                 "v": 1200, "vw": 100.2, "n": 57},
                {"t": 1704205800000, "o": 100.0, "h": 100.2, "l": 99.9, "c": 100.1,
                 "v": 1000}
            ]
        })");

        auto bars = PolygonClient::parse_aggregates(response);
        REQUIRE(bars.size() == 2);
        REQUIRE(bars[0].timestamp_ms == 1704205800000);
        REQUIRE(bars[0].close == 100.1);
        REQUIRE_FALSE(bars[0].vwap.has_value());
        REQUIRE_FALSE(bars[0].trade_count.has_value());
        REQUIRE(bars[1].volume == 1200.0);
        REQUIRE(*bars[1].vwap == 100.2);
        REQUIRE(*bars[1].trade_count == 57);
        REQUIRE(bars[1].source == "polygon");
        REQUIRE(bars[1].is_adjusted);
    }

    SECTION("No results is an empty series") {
        auto response = nlohmann::json::parse(R"({"ticker": "AAPL", "resultsCount": 0})");
        REQUIRE(PolygonClient::parse_aggregates(response).empty());
    }

    SECTION("Missing fields are rejected") {
        auto response = nlohmann::json::parse(R"({"results": [{"t": 1704205800000, "o": 1}]})");
        REQUIRE_THROWS_AS(PolygonClient::parse_aggregates(response), nlohmann::json::exception);
    }
}

TEST_CASE("Timeframe to aggregate range", "[market_data]") {
    REQUIRE(PolygonClient::multiplier_timespan("1m") == std::make_pair(1, std::string("minute")));
    REQUIRE(PolygonClient::multiplier_timespan("15m") == std::make_pair(15, std::string("minute")));
    REQUIRE(PolygonClient::multiplier_timespan("4h") == std::make_pair(4, std::string("hour")));
    REQUIRE(PolygonClient::multiplier_timespan("1d") == std::make_pair(1, std::string("day")));
    REQUIRE_THROWS_AS(PolygonClient::multiplier_timespan("1w"), std::invalid_argument);
}

TEST_CASE("HTTP status classification", "[market_data]") {
    REQUIRE_NOTHROW(PolygonClient::check_status(200, "/v2/aggs"));

    SECTION("Throttling and server errors are retryable") {
        for (long status : {429L, 500L, 503L}) {
            try {
                PolygonClient::check_status(status, "/v2/aggs");
                FAIL("expected a ProviderError");
            } catch (const ProviderRejectedError&) {
                FAIL("HTTP " << status << " must stay retryable");
            } catch (const ProviderError& e) {
                REQUIRE(e.http_status() == status);
            }
        }
    }

    SECTION("Other client errors are rejections") {
        for (long status : {400L, 401L, 403L, 404L}) {
            REQUIRE_THROWS_AS(PolygonClient::check_status(status, "/v2/aggs"),
                              ProviderRejectedError);
        }
    }
}

TEST_CASE("Quote spread", "[market_data]") {
    Quote q{99.95, 100.05};
    REQUIRE(*q.spread_bps() == Approx(10.0));

    Quote crossed{100.05, 99.95};
    REQUIRE_FALSE(crossed.spread_bps().has_value());

    Quote empty;
    REQUIRE_FALSE(empty.spread_bps().has_value());
}

TEST_CASE("Linear model artifacts", "[market_data]") {
    const std::string path = "oracore_test_model.json";

    SECTION("Loads and scores") {
        {
            std::ofstream out(path);
            out << R"({"name": "momentum_v3", "version": "3", "features": ["rsi", "rel_volume"],
                       "probability": {"bias": 0.0, "weights": [0.0, 0.0]},
                       "target_return": {"bias": 0.01, "weights": [0.0, 0.002]}})";
        }
        ScoringModel model = load_linear_model(path);
        REQUIRE(model.name == "momentum_v3");
        REQUIRE(model.version == "3");
        REQUIRE(model.feature_names == std::vector<std::string>{"rsi", "rel_volume"});

        ModelScore s = model.score({55.0, 2.0});
        REQUIRE(s.probability == Approx(0.5));
        REQUIRE(s.target_return == Approx(0.014));
    }

    SECTION("Weight count must match the feature vector") {
        {
            std::ofstream out(path);
            out << R"({"name": "momentum_v3", "version": "3", "features": ["rsi"],
                       "probability": {"bias": 0.0, "weights": [0.1, 0.2]}})";
        }
        REQUIRE_THROWS_AS(load_linear_model(path), ConfigValidationError);
    }

    SECTION("Missing file is a configuration error") {
        REQUIRE_THROWS_AS(load_linear_model("does/not/exist.json"), ConfigValidationError);
    }

    std::remove(path.c_str());
}
