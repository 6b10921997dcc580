#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Source of raw bars and quotes. Implementations must return bars ascending
// and never fabricate missing periods.
class MarketDataProvider {
public:
    virtual ~MarketDataProvider() = default;

    // Bars with from_ms <= ts <= to_ms. Throws ProviderError.
    virtual std::vector<Candle> fetch_bars(const std::string& symbol, const std::string& timeframe,
                                           int64_t from_ms, int64_t to_ms) = 0;

    // Latest NBBO when available.
    virtual std::optional<Quote> fetch_quote(const std::string& symbol) = 0;
};

// Polygon-style aggregates REST API over libcurl.
class PolygonClient : public MarketDataProvider {
public:
    PolygonClient(const std::string& base_url, const std::string& api_key, int timeout_ms = 10000);

    std::vector<Candle> fetch_bars(const std::string& symbol, const std::string& timeframe,
                                   int64_t from_ms, int64_t to_ms) override;
    std::optional<Quote> fetch_quote(const std::string& symbol) override;

    // "15m" -> (15, "minute")
    static std::pair<int, std::string> multiplier_timespan(const std::string& timeframe);
    static std::vector<Candle> parse_aggregates(const nlohmann::json& response);

    // 429 and 5xx throw ProviderError, other 4xx ProviderRejectedError.
    static void check_status(long status, const std::string& endpoint);

private:
    std::string base_url_;
    std::string api_key_;
    int timeout_ms_;

    nlohmann::json make_request(const std::string& endpoint);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
