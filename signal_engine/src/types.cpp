#include "types.hpp"
#include <stdexcept>

bool Candle::operator==(const Candle& other) const {
    return timestamp_ms == other.timestamp_ms &&
           open == other.open &&
           high == other.high &&
           low == other.low &&
           close == other.close &&
           volume == other.volume &&
           vwap == other.vwap &&
           trade_count == other.trade_count &&
           source == other.source &&
           is_adjusted == other.is_adjusted;
}

std::optional<double> Quote::spread_bps() const {
    if (bid <= 0.0 || ask <= 0.0 || ask < bid) {
        return std::nullopt;
    }
    double mid = (ask + bid) / 2.0;
    return ((ask - bid) / mid) * 10000.0;
}

std::string Signal::natural_key() const {
    return symbol + "|" + timeframe + "|" + std::to_string(fired_at_ms) + "|" +
           detector_id + "|" + detector_version;
}

std::string Horizon::to_string() const {
    return timeframe + ":" + std::to_string(bars);
}

std::string tie_policy_name(TiePolicy policy) {
    return policy == TiePolicy::TargetFirst ? "target_first" : "stop_first";
}

TiePolicy tie_policy_from_string(const std::string& text) {
    if (text == "stop_first") return TiePolicy::StopFirst;
    if (text == "target_first") return TiePolicy::TargetFirst;
    throw std::invalid_argument("Unknown tie policy: " + text);
}

std::string kind_name(DetectorKind kind) {
    return kind == DetectorKind::Model ? "model" : "rule";
}

DetectorKind detector_kind_from_string(const std::string& text) {
    if (text == "rule") return DetectorKind::Rule;
    if (text == "model") return DetectorKind::Model;
    throw std::invalid_argument("Unknown detector kind: " + text);
}
