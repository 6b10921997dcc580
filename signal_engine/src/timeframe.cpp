#include "timeframe.hpp"
#include <map>
#include <stdexcept>

namespace timeframe {

namespace {

const std::map<std::string, int64_t>& durations() {
    static const std::map<std::string, int64_t> table = {
        {"1m", 60LL * 1000},
        {"5m", 5LL * 60 * 1000},
        {"15m", 15LL * 60 * 1000},
        {"30m", 30LL * 60 * 1000},
        {"1h", 60LL * 60 * 1000},
        {"4h", 4LL * 60 * 60 * 1000},
        {"5h", 5LL * 60 * 60 * 1000},
        {"1d", 24LL * 60 * 60 * 1000},
    };
    return table;
}

} // namespace

bool is_valid(const std::string& tf) {
    return durations().count(tf) > 0;
}

int64_t duration_ms(const std::string& tf) {
    auto it = durations().find(tf);
    if (it == durations().end()) {
        throw std::invalid_argument("Unsupported timeframe: " + tf);
    }
    return it->second;
}

int64_t floor_ms(int64_t timestamp_ms, const std::string& tf) {
    int64_t width = duration_ms(tf);
    int64_t floored = (timestamp_ms / width) * width;
    if (timestamp_ms < 0 && floored != timestamp_ms) {
        floored -= width;
    }
    return floored;
}

int64_t bar_end_ms(int64_t timestamp_ms, const std::string& tf) {
    return floor_ms(timestamp_ms, tf) + duration_ms(tf);
}

std::vector<std::string> all() {
    return {"1m", "5m", "15m", "30m", "1h", "4h", "5h", "1d"};
}

} // namespace timeframe
