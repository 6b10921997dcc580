#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace timeframe {
    // Supported: 1m 5m 15m 30m 1h 4h 5h 1d
    bool is_valid(const std::string& tf);
    int64_t duration_ms(const std::string& tf);   // throws std::invalid_argument
    int64_t floor_ms(int64_t timestamp_ms, const std::string& tf);
    int64_t bar_end_ms(int64_t timestamp_ms, const std::string& tf);
    std::vector<std::string> all();
}
