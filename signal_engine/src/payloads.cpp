#include "payloads.hpp"
#include "timeframe.hpp"
#include "util.hpp"

namespace {

template <typename T>
nlohmann::json nullable(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

nlohmann::json signal_to_json(const Signal& signal) {
    nlohmann::json features = nlohmann::json::object();
    for (const auto& [name, value] : signal.features) {
        features[name] = value;
    }

    return {
        {"type", "signal"},
        {"id", signal.id},
        {"symbol", signal.symbol},
        {"timeframe", signal.timeframe},
        {"fired_at", util::to_iso8601(signal.fired_at_ms)},
        {"fired_at_ms", signal.fired_at_ms},
        {"detector_id", signal.detector_id},
        {"detector_version", signal.detector_version},
        {"side", signal.side},
        {"source_system", signal.source_system},
        {"price_at_signal", signal.price_at_signal},
        {"bid", nullable(signal.bid)},
        {"ask", nullable(signal.ask)},
        {"spread_bps", nullable(signal.spread_bps)},
        {"rel_volume", nullable(signal.rel_volume)},
        {"session", signal.session},
        {"data_freshness_ms", nullable(signal.data_freshness_ms)},
        {"score", signal.score},
        {"features", features},
        {"features_version", signal.features_version}
    };
}

nlohmann::json outcome_to_json(const Outcome& outcome) {
    return {
        {"signal_id", outcome.signal_id},
        {"horizon_tf", outcome.horizon_tf},
        {"horizon_bars", outcome.horizon_bars},
        {"label_version", outcome.label_version},
        {"ret_close", outcome.ret_close},
        {"max_run_up", outcome.max_run_up},
        {"max_drawdown", outcome.max_drawdown},
        {"hit_tp1", outcome.hit_tp1},
        {"hit_tp2", outcome.hit_tp2},
        {"hit_tp3", outcome.hit_tp3},
        {"hit_stop", outcome.hit_stop},
        {"t_to_tp1_ms", nullable(outcome.t_to_tp1_ms)},
        {"t_to_tp2_ms", nullable(outcome.t_to_tp2_ms)},
        {"t_to_tp3_ms", nullable(outcome.t_to_tp3_ms)},
        {"t_to_stop_ms", nullable(outcome.t_to_stop_ms)},
        {"computed_at", util::to_iso8601(outcome.computed_at_ms)}
    };
}

SignalQuery parse_signal_query(const std::map<std::string, std::string>& params) {
    SignalQuery query;

    auto it = params.find("symbol");
    if (it != params.end() && !it->second.empty()) {
        query.symbol = it->second;
    }
    it = params.find("timeframe");
    if (it != params.end() && !it->second.empty()) {
        if (!timeframe::is_valid(it->second)) {
            throw std::invalid_argument("unsupported timeframe: " + it->second);
        }
        query.timeframe = it->second;
    }
    it = params.find("since");
    if (it != params.end() && !it->second.empty()) {
        query.since_ms = util::parse_timestamp_ms(it->second);
    }
    it = params.find("limit");
    if (it != params.end() && !it->second.empty()) {
        int limit = std::stoi(it->second);
        if (limit < 1 || limit > 10000) {
            throw std::invalid_argument("limit must be in [1, 10000]");
        }
        query.limit = limit;
    }
    return query;
}
