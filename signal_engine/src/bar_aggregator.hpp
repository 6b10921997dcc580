#pragma once

#include "types.hpp"
#include <map>
#include <string>
#include <vector>
#include <optional>

// Rolls finer bars (e.g. 1m) up into a coarser timeframe (e.g. 15m).
// Only closed buckets are emitted; missing periods stay missing.
class BarAggregator {
public:
    BarAggregator(const std::string& source_tf, const std::string& target_tf);

    // Adds or replaces a source bar. Returns false if it belongs to a bucket
    // that was already emitted.
    bool add_bar(const Candle& bar);

    // Emits every bucket whose end has elapsed relative to the latest source bar.
    std::vector<Candle> get_completed_bars();

    // Bucket currently being filled, if any. Never persisted.
    std::optional<Candle> get_current_bar() const;

    // Marks everything up to and including this bucket start as already emitted
    // (used when resuming from stored bars).
    void resume_after(int64_t bucket_start_ms);

    // Skips a leading partial bucket: bars before the first bucket starting at
    // or after this timestamp are ignored.
    void start_at(int64_t timestamp_ms);
    bool started() const { return start_ms_.has_value() || last_emitted_bucket_.has_value(); }

    const std::string& source_timeframe() const { return source_tf_; }
    const std::string& target_timeframe() const { return target_tf_; }

private:
    std::string source_tf_;
    std::string target_tf_;
    int64_t source_width_ms_;
    int64_t target_width_ms_;

    std::map<int64_t, Candle> pending_;   // source bars by timestamp
    int64_t latest_source_end_ms_ = 0;
    std::optional<int64_t> last_emitted_bucket_;
    std::optional<int64_t> start_ms_;

    int64_t bucket_start(int64_t timestamp_ms) const;
    bool is_bucket_closed(int64_t start_ms) const;
    Candle synthesize_bar(int64_t start_ms, const std::vector<Candle>& bucket) const;
};
