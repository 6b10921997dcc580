#include "outcome_labeler.hpp"
#include "errors.hpp"
#include "timeframe.hpp"
#include "util.hpp"
#include <algorithm>
#include <limits>
#include <spdlog/spdlog.h>

namespace {

constexpr int64_t kNotCrossed = std::numeric_limits<int64_t>::max();

// Index of the first bar crossing the level, or kNotCrossed.
int64_t first_cross(const std::vector<Candle>& bars, double level, bool upward) {
    for (size_t i = 0; i < bars.size(); ++i) {
        bool crossed = upward ? bars[i].high >= level : bars[i].low <= level;
        if (crossed) return static_cast<int64_t>(i);
    }
    return kNotCrossed;
}

} // namespace

OutcomeLabeler::OutcomeLabeler(CandleStore& candles, SignalStore& signals,
                               OutcomeStore& outcomes, LabelerSettings settings)
    : candles_(candles)
    , signals_(signals)
    , outcomes_(outcomes)
    , settings_(std::move(settings))
{
    if (settings_.targets.size() > 3) {
        throw ConfigValidationError("At most 3 targets are supported");
    }
    for (const auto& h : settings_.horizons) {
        if (!timeframe::is_valid(h.timeframe) || h.bars < 1) {
            throw ConfigValidationError("Invalid horizon " + h.to_string());
        }
    }
}

std::vector<int64_t> OutcomeLabeler::expected_timestamps(int64_t fired_at_ms,
                                                         const std::string& signal_timeframe,
                                                         const Horizon& horizon) {
    int64_t width = timeframe::duration_ms(horizon.timeframe);
    int64_t signal_close = timeframe::bar_end_ms(fired_at_ms, signal_timeframe);
    int64_t first = timeframe::floor_ms(signal_close, horizon.timeframe);
    if (first < signal_close) first += width;

    std::vector<int64_t> out;
    out.reserve(horizon.bars);
    for (int k = 0; k < horizon.bars; ++k) {
        out.push_back(first + k * width);
    }
    return out;
}

Outcome OutcomeLabeler::compute_outcome(const Signal& signal, const Horizon& horizon,
                                        const std::vector<Candle>& bars,
                                        const LabelerSettings& settings) {
    if (bars.empty()) {
        throw DataGapError("No bars for horizon " + horizon.to_string());
    }
    double entry = signal.price_at_signal;
    if (entry <= 0.0) {
        throw std::invalid_argument("Signal " + std::to_string(signal.id) +
                                    " has no positive entry price");
    }

    Outcome o;
    o.signal_id = signal.id;
    o.horizon_tf = horizon.timeframe;
    o.horizon_bars = horizon.bars;
    o.label_version = settings.label_version;

    double max_high = bars.front().high;
    double min_low = bars.front().low;
    for (const auto& b : bars) {
        max_high = std::max(max_high, b.high);
        min_low = std::min(min_low, b.low);
    }
    o.ret_close = (bars.back().close - entry) / entry;
    o.max_run_up = (max_high - entry) / entry;
    o.max_drawdown = (min_low - entry) / entry;

    bool is_short = signal.side == "short";
    double stop_level = is_short ? entry * (1.0 + settings.stop_pct)
                                 : entry * (1.0 - settings.stop_pct);
    int64_t stop_idx = first_cross(bars, stop_level, is_short);
    if (stop_idx != kNotCrossed) {
        o.hit_stop = true;
        o.t_to_stop_ms = bars[stop_idx].timestamp_ms - signal.fired_at_ms;
    }

    bool* hits[] = {&o.hit_tp1, &o.hit_tp2, &o.hit_tp3};
    std::optional<int64_t>* times[] = {&o.t_to_tp1_ms, &o.t_to_tp2_ms, &o.t_to_tp3_ms};

    for (size_t i = 0; i < settings.targets.size(); ++i) {
        double level = is_short ? entry * (1.0 - settings.targets[i])
                                : entry * (1.0 + settings.targets[i]);
        int64_t idx = first_cross(bars, level, !is_short);
        if (idx == kNotCrossed) continue;

        // The stop ends the trade: later targets never count, same-bar ties
        // follow the configured policy.
        bool counts = idx < stop_idx ||
                      (idx == stop_idx && settings.tie_policy == TiePolicy::TargetFirst);
        if (counts) {
            *hits[i] = true;
            *times[i] = bars[idx].timestamp_ms - signal.fired_at_ms;
        }
    }

    return o;
}

std::vector<Candle> OutcomeLabeler::load_window(const Signal& signal, const Horizon& horizon,
                                                int64_t now_ms) {
    auto expected = expected_timestamps(signal.fired_at_ms, signal.timeframe, horizon);
    auto latest = candles_.latest_timestamp(signal.symbol, horizon.timeframe);
    if (!latest || *latest < expected.back() ||
        now_ms < timeframe::bar_end_ms(expected.back(), horizon.timeframe)) {
        throw LabelPendingError("horizon ends at " +
                                util::to_iso8601(timeframe::bar_end_ms(expected.back(),
                                                                       horizon.timeframe)));
    }

    // Finer horizon bars inside the signal bar predate the entry price
    auto bars = candles_.bars_between(signal.symbol, horizon.timeframe,
                                      expected.front() - 1, expected.back());
    if (bars.size() != expected.size()) {
        throw DataGapError("expected " + std::to_string(expected.size()) + " bars, found " +
                           std::to_string(bars.size()));
    }
    for (size_t i = 0; i < bars.size(); ++i) {
        if (bars[i].timestamp_ms != expected[i]) {
            throw DataGapError("missing bar at " + util::to_iso8601(expected[i]));
        }
    }
    return bars;
}

LabelStatus OutcomeLabeler::label_signal(const Signal& signal, const Horizon& horizon,
                                         int64_t now_ms) {
    if (outcomes_.has_outcome(signal.id, horizon, settings_.label_version)) {
        return LabelStatus::AlreadyLabeled;
    }

    std::vector<Candle> bars;
    try {
        bars = load_window(signal, horizon, now_ms);
    } catch (const LabelPendingError& e) {
        spdlog::debug("Signal #{} {} pending: {}", signal.id, horizon.to_string(), e.what());
        return LabelStatus::Pending;
    } catch (const DataGapError& e) {
        spdlog::warn("Data gap labeling signal #{} {}:{} horizon {}: {}", signal.id,
                     signal.symbol, signal.timeframe, horizon.to_string(), e.what());
        return LabelStatus::DataGap;
    }

    Outcome outcome = compute_outcome(signal, horizon, bars, settings_);
    outcome.computed_at_ms = now_ms;

    if (!outcomes_.insert_outcome(outcome)) {
        return LabelStatus::AlreadyLabeled;
    }
    spdlog::debug("Labeled signal #{} {} v{}: ret={:.4f} run_up={:.4f} dd={:.4f} stop={}",
                  signal.id, horizon.to_string(), settings_.label_version, outcome.ret_close,
                  outcome.max_run_up, outcome.max_drawdown, outcome.hit_stop);
    return LabelStatus::Computed;
}

LabelSweepSummary OutcomeLabeler::run_sweep(int64_t now_ms, const std::atomic<bool>* cancel) {
    LabelSweepSummary summary;
    summary.started_at_ms = util::current_timestamp_ms();

    SignalQuery query;
    query.since_ms = now_ms - settings_.lookback_ms;
    query.limit = 0;
    auto signals = signals_.query_signals(query);

    for (const auto& signal : signals) {
        if (cancel && cancel->load()) {
            spdlog::info("Label sweep cancelled after {} signals", summary.signals_scanned);
            summary.cancelled = true;
            break;
        }
        summary.signals_scanned++;

        for (const auto& horizon : settings_.horizons) {
            std::string item = "signal #" + std::to_string(signal.id) + " " + horizon.to_string();
            try {
                switch (label_signal(signal, horizon, now_ms)) {
                    case LabelStatus::Computed:
                        summary.outcomes_computed++;
                        break;
                    case LabelStatus::AlreadyLabeled:
                        summary.already_labeled++;
                        break;
                    case LabelStatus::Pending:
                        summary.pending++;
                        break;
                    case LabelStatus::DataGap:
                        summary.data_gaps++;
                        summary.skipped.push_back({item, "data gap"});
                        break;
                }
            } catch (const std::exception& e) {
                spdlog::error("Failed to label {}: {}", item, e.what());
                summary.failed++;
                summary.skipped.push_back({item, e.what()});
            }
        }
    }

    summary.finished_at_ms = util::current_timestamp_ms();
    spdlog::info("Label sweep: {} signals, {} computed, {} pending, {} gaps, {} failed",
                 summary.signals_scanned, summary.outcomes_computed, summary.pending,
                 summary.data_gaps, summary.failed);
    return summary;
}
