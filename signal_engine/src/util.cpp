#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <ctime>
#include <cctype>
#include <stdexcept>

namespace util {

std::string current_iso8601() {
    return to_iso8601(current_timestamp_ms());
}

std::string to_iso8601(int64_t timestamp_ms) {
    std::time_t secs = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm tm_utc{};
    gmtime_r(&secs, &tm_utc);
    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%FT%TZ");
    return ss.str();
}

// Accepts epoch milliseconds or "YYYY-MM-DDTHH:MM:SS[Z]" (UTC).
int64_t parse_timestamp_ms(const std::string& text) {
    if (text.empty()) {
        throw std::invalid_argument("empty timestamp");
    }
    if (std::all_of(text.begin(), text.end(), ::isdigit)) {
        return std::stoll(text);
    }

    std::tm tm_utc{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        throw std::invalid_argument("invalid timestamp: " + text);
    }
    return static_cast<int64_t>(timegm(&tm_utc)) * 1000;
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, delim)) {
        // Trim whitespace
        token.erase(0, token.find_first_not_of(" \t\n\r"));
        token.erase(token.find_last_not_of(" \t\n\r") + 1);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

int random_jitter(int min_ms, int max_ms) {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(min_ms, max_ms);
    return dis(gen);
}

std::string redact_dsn(const std::string& dsn) {
    auto scheme_end = dsn.find("://");
    auto at = dsn.find('@');
    if (scheme_end == std::string::npos || at == std::string::npos || at < scheme_end) {
        return dsn;
    }
    auto colon = dsn.find(':', scheme_end + 3);
    if (colon == std::string::npos || colon > at) {
        return dsn;
    }
    return dsn.substr(0, colon + 1) + "***" + dsn.substr(at);
}

// FNV-1a, stable across platforms and runs.
uint64_t stable_hash(const std::string& text) {
    uint64_t hash = 1469598103934665603ULL;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

} // namespace util
