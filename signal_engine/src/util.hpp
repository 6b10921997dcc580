#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <random>

namespace util {
    std::string current_iso8601();
    std::string to_iso8601(int64_t timestamp_ms);
    int64_t parse_timestamp_ms(const std::string& text);
    std::vector<std::string> split(const std::string& str, char delim);
    int64_t current_timestamp_ms();
    int random_jitter(int min_ms, int max_ms);
    std::string redact_dsn(const std::string& dsn);
    uint64_t stable_hash(const std::string& text);
}
