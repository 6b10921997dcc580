#include "bar_aggregator.hpp"
#include "timeframe.hpp"
#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

BarAggregator::BarAggregator(const std::string& source_tf, const std::string& target_tf)
    : source_tf_(source_tf)
    , target_tf_(target_tf)
    , source_width_ms_(timeframe::duration_ms(source_tf))
    , target_width_ms_(timeframe::duration_ms(target_tf))
{
    if (target_width_ms_ <= source_width_ms_ || target_width_ms_ % source_width_ms_ != 0) {
        throw std::invalid_argument("Cannot aggregate " + source_tf + " into " + target_tf);
    }
}

int64_t BarAggregator::bucket_start(int64_t timestamp_ms) const {
    return timeframe::floor_ms(timestamp_ms, target_tf_);
}

bool BarAggregator::is_bucket_closed(int64_t start_ms) const {
    return latest_source_end_ms_ >= start_ms + target_width_ms_;
}

bool BarAggregator::add_bar(const Candle& bar) {
    if (start_ms_ && bar.timestamp_ms < *start_ms_) {
        return false;
    }
    int64_t bucket = bucket_start(bar.timestamp_ms);
    if (last_emitted_bucket_ && bucket <= *last_emitted_bucket_) {
        spdlog::warn("Late {} bar at {} for already emitted {} bucket, dropped",
                     source_tf_, bar.timestamp_ms, target_tf_);
        return false;
    }

    pending_[bar.timestamp_ms] = bar;
    latest_source_end_ms_ = std::max(latest_source_end_ms_, bar.timestamp_ms + source_width_ms_);
    return true;
}

std::vector<Candle> BarAggregator::get_completed_bars() {
    std::vector<Candle> completed;

    while (!pending_.empty()) {
        int64_t start = bucket_start(pending_.begin()->first);
        if (!is_bucket_closed(start)) break;

        // pending_ is ordered by timestamp, so the bucket is a contiguous prefix
        std::vector<Candle> bucket;
        auto it = pending_.begin();
        while (it != pending_.end() && it->first < start + target_width_ms_) {
            bucket.push_back(it->second);
            it = pending_.erase(it);
        }

        completed.push_back(synthesize_bar(start, bucket));
        last_emitted_bucket_ = start;
    }

    return completed;
}

std::optional<Candle> BarAggregator::get_current_bar() const {
    if (pending_.empty()) return std::nullopt;

    int64_t start = bucket_start(pending_.begin()->first);
    std::vector<Candle> bucket;
    for (const auto& [ts, bar] : pending_) {
        if (ts >= start + target_width_ms_) break;
        bucket.push_back(bar);
    }
    return synthesize_bar(start, bucket);
}

void BarAggregator::resume_after(int64_t bucket_start_ms) {
    last_emitted_bucket_ = bucket_start(bucket_start_ms);
    int64_t cutoff = *last_emitted_bucket_ + target_width_ms_;
    while (!pending_.empty() && pending_.begin()->first < cutoff) {
        pending_.erase(pending_.begin());
    }
}

void BarAggregator::start_at(int64_t timestamp_ms) {
    int64_t bucket = bucket_start(timestamp_ms);
    start_ms_ = bucket == timestamp_ms ? bucket : bucket + target_width_ms_;
}

Candle BarAggregator::synthesize_bar(int64_t start_ms, const std::vector<Candle>& bucket) const {
    Candle bar;
    bar.timestamp_ms = start_ms;
    bar.source = "aggregate:" + source_tf_;

    bar.open = bucket.front().open;
    bar.close = bucket.back().close;
    bar.high = bucket.front().high;
    bar.low = bucket.front().low;
    bar.is_adjusted = bucket.front().is_adjusted;

    double vwap_volume = 0.0;
    double vwap_weighted = 0.0;
    double vwap_sum = 0.0;
    int vwap_count = 0;
    bool any_trade_count = false;
    int64_t trades = 0;

    for (const auto& src : bucket) {
        bar.high = std::max(bar.high, src.high);
        bar.low = std::min(bar.low, src.low);
        bar.volume += src.volume;

        if (src.vwap) {
            vwap_weighted += *src.vwap * src.volume;
            vwap_volume += src.volume;
            vwap_sum += *src.vwap;
            vwap_count++;
        }
        if (src.trade_count) {
            any_trade_count = true;
            trades += *src.trade_count;
        }
    }

    if (vwap_count > 0) {
        bar.vwap = vwap_volume > 0.0 ? vwap_weighted / vwap_volume : vwap_sum / vwap_count;
    }
    if (any_trade_count) {
        bar.trade_count = trades;
    }

    return bar;
}
