#include "market_data_client.hpp"
#include "errors.hpp"
#include "timeframe.hpp"
#include <algorithm>
#include <curl/curl.h>
#include <memory>
#include <spdlog/spdlog.h>

PolygonClient::PolygonClient(const std::string& base_url, const std::string& api_key,
                             int timeout_ms)
    : base_url_(base_url)
    , api_key_(api_key)
    , timeout_ms_(timeout_ms)
{
    if (api_key_.empty()) {
        spdlog::warn("PROVIDER_API_KEY is empty; requests will be rejected");
    }
}

size_t PolygonClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

std::pair<int, std::string> PolygonClient::multiplier_timespan(const std::string& timeframe) {
    if (timeframe == "1m") return {1, "minute"};
    if (timeframe == "5m") return {5, "minute"};
    if (timeframe == "15m") return {15, "minute"};
    if (timeframe == "30m") return {30, "minute"};
    if (timeframe == "1h") return {1, "hour"};
    if (timeframe == "4h") return {4, "hour"};
    if (timeframe == "5h") return {5, "hour"};
    if (timeframe == "1d") return {1, "day"};
    throw std::invalid_argument("Unsupported timeframe: " + timeframe);
}

void PolygonClient::check_status(long status, const std::string& endpoint) {
    if (status == 429 || status >= 500) {
        throw ProviderError("Provider returned HTTP " + std::to_string(status),
                            static_cast<int>(status));
    }
    if (status >= 400) {
        throw ProviderRejectedError("Provider rejected " + endpoint + " with HTTP " +
                                    std::to_string(status), static_cast<int>(status));
    }
}

nlohmann::json PolygonClient::make_request(const std::string& endpoint) {
    // One handle per request: fetches run concurrently from the symbol workers.
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        throw ProviderError("Failed to initialize CURL");
    }

    std::string response_string;
    std::string url = base_url_ + endpoint;
    url += (endpoint.find('?') == std::string::npos ? "?" : "&");
    url += "apiKey=" + api_key_;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_string);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw ProviderError(std::string("Request failed: ") + curl_easy_strerror(res));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    check_status(status, endpoint);

    try {
        return nlohmann::json::parse(response_string);
    } catch (const std::exception& e) {
        throw ProviderError(std::string("Failed to parse provider response: ") + e.what());
    }
}

std::vector<Candle> PolygonClient::parse_aggregates(const nlohmann::json& response) {
    std::vector<Candle> bars;
    if (!response.contains("results") || !response["results"].is_array()) {
        return bars;
    }

    for (const auto& agg : response["results"]) {
        Candle c;
        c.timestamp_ms = agg.at("t").get<int64_t>();
        c.open = agg.at("o").get<double>();
        c.high = agg.at("h").get<double>();
        c.low = agg.at("l").get<double>();
        c.close = agg.at("c").get<double>();
        c.volume = agg.at("v").get<double>();
        if (agg.contains("vw") && agg["vw"].is_number()) {
            c.vwap = agg["vw"].get<double>();
        }
        if (agg.contains("n") && agg["n"].is_number()) {
            c.trade_count = agg["n"].get<int64_t>();
        }
        c.source = "polygon";
        c.is_adjusted = response.value("adjusted", true);
        bars.push_back(c);
    }

    std::sort(bars.begin(), bars.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp_ms < b.timestamp_ms;
    });
    return bars;
}

std::vector<Candle> PolygonClient::fetch_bars(const std::string& symbol,
                                              const std::string& timeframe,
                                              int64_t from_ms, int64_t to_ms) {
    auto [multiplier, timespan] = multiplier_timespan(timeframe);
    std::string endpoint = "/v2/aggs/ticker/" + symbol + "/range/" +
                           std::to_string(multiplier) + "/" + timespan + "/" +
                           std::to_string(from_ms) + "/" + std::to_string(to_ms) +
                           "?adjusted=true&sort=asc&limit=50000";

    auto response = make_request(endpoint);
    std::vector<Candle> bars;
    try {
        bars = parse_aggregates(response);
    } catch (const nlohmann::json::exception& e) {
        throw ProviderError("Malformed aggregates for " + symbol + ": " + e.what());
    }

    // Daily aggregates are stamped at exchange midnight; buckets here are UTC.
    for (auto& c : bars) {
        c.timestamp_ms = timeframe::floor_ms(c.timestamp_ms, timeframe);
    }

    spdlog::debug("Fetched {} {} bars for {}", bars.size(), timeframe, symbol);
    return bars;
}

std::optional<Quote> PolygonClient::fetch_quote(const std::string& symbol) {
    auto response = make_request("/v2/last/nbbo/" + symbol);
    if (!response.contains("results") || !response["results"].is_object()) {
        return std::nullopt;
    }

    const auto& r = response["results"];
    if (!r.contains("p") || !r.contains("P")) {
        return std::nullopt;
    }
    Quote q;
    q.bid = r["p"].get<double>();
    q.ask = r["P"].get<double>();
    return q;
}
