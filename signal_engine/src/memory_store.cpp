#include "memory_store.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>

void MemoryStore::put_bar(const std::string& symbol, const std::string& timeframe,
                          const Candle& bar) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto sym = symbols_.find(symbol);
    if (sym == symbols_.end()) {
        SymbolInfo info;
        info.id = next_symbol_id_++;
        info.ticker = symbol;
        info.first_seen_ms = util::current_timestamp_ms();
        info.last_seen_ms = bar.timestamp_ms;
        symbols_[symbol] = info;
    } else {
        sym->second.last_seen_ms = std::max(sym->second.last_seen_ms, bar.timestamp_ms);
    }

    candles_[{symbol, timeframe}][bar.timestamp_ms] = bar;
}

std::vector<Candle> MemoryStore::bars_between(const std::string& symbol,
                                              const std::string& timeframe,
                                              int64_t after_ms, int64_t until_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Candle> out;

    auto it = candles_.find({symbol, timeframe});
    if (it == candles_.end() || until_ms <= after_ms) return out;

    auto& series = it->second;
    for (auto bar = series.upper_bound(after_ms);
         bar != series.end() && bar->first <= until_ms; ++bar) {
        out.push_back(bar->second);
    }
    return out;
}

std::vector<Candle> MemoryStore::recent_bars(const std::string& symbol,
                                             const std::string& timeframe,
                                             int64_t until_ms, int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Candle> out;

    auto it = candles_.find({symbol, timeframe});
    if (it == candles_.end() || limit <= 0) return out;

    auto& series = it->second;
    auto end = series.upper_bound(until_ms);
    auto begin = end;
    for (int i = 0; i < limit && begin != series.begin(); ++i) {
        --begin;
    }
    for (auto bar = begin; bar != end; ++bar) {
        out.push_back(bar->second);
    }
    return out;
}

std::optional<int64_t> MemoryStore::latest_timestamp(const std::string& symbol,
                                                     const std::string& timeframe) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = candles_.find({symbol, timeframe});
    if (it == candles_.end() || it->second.empty()) return std::nullopt;
    return it->second.rbegin()->first;
}

std::optional<SymbolInfo> MemoryStore::get_symbol(const std::string& ticker) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = symbols_.find(ticker);
    if (it == symbols_.end()) return std::nullopt;
    return it->second;
}

void MemoryStore::log_ingestion(const IngestionLogEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    ingestion_log_.push_back(entry);
}

void MemoryStore::register_detector(const DetectorInfo& info) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = detectors_.find(info.key());
    if (it == detectors_.end()) {
        detectors_[info.key()] = info;
        return;
    }
    if (it->second.kind != info.kind || it->second.params != info.params) {
        throw ConfigValidationError(
            "Detector " + info.key() + " already registered with different parameters; "
            "mint a new version");
    }
}

RecordResult MemoryStore::record(const Signal& signal) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto key = signal.natural_key();
    auto existing = signal_keys_.find(key);
    if (existing != signal_keys_.end()) {
        return RecordResult{signals_.at(existing->second), false};
    }

    Signal stored = signal;
    stored.id = next_signal_id_++;
    signals_[stored.id] = stored;
    signal_keys_[key] = stored.id;
    return RecordResult{stored, true};
}

std::vector<Signal> MemoryStore::query_signals(const SignalQuery& query) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Signal> out;

    for (const auto& [id, sig] : signals_) {
        if (query.symbol && sig.symbol != *query.symbol) continue;
        if (query.timeframe && sig.timeframe != *query.timeframe) continue;
        if (query.since_ms && sig.fired_at_ms < *query.since_ms) continue;
        out.push_back(sig);
    }

    std::stable_sort(out.begin(), out.end(), [](const Signal& a, const Signal& b) {
        return a.fired_at_ms < b.fired_at_ms;
    });
    if (query.limit > 0 && static_cast<int>(out.size()) > query.limit) {
        out.resize(query.limit);
    }
    return out;
}

std::optional<Signal> MemoryStore::get_signal(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = signals_.find(id);
    if (it == signals_.end()) return std::nullopt;
    return it->second;
}

std::optional<Signal> MemoryStore::latest_signal(const std::string& symbol,
                                                 const std::string& timeframe,
                                                 const std::string& detector_id,
                                                 const std::string& detector_version) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<Signal> latest;

    for (const auto& [id, sig] : signals_) {
        if (sig.symbol != symbol || sig.timeframe != timeframe ||
            sig.detector_id != detector_id || sig.detector_version != detector_version) {
            continue;
        }
        if (!latest || sig.fired_at_ms > latest->fired_at_ms) {
            latest = sig;
        }
    }
    return latest;
}

bool MemoryStore::has_signal_at(const std::string& symbol, const std::string& timeframe,
                                int64_t timestamp_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, sig] : signals_) {
        if (sig.symbol == symbol && sig.timeframe == timeframe &&
            sig.fired_at_ms == timestamp_ms) {
            return true;
        }
    }
    return false;
}

bool MemoryStore::insert_outcome(const Outcome& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    OutcomeKey key{outcome.signal_id, outcome.horizon_tf, outcome.horizon_bars,
                   outcome.label_version};
    return outcomes_.emplace(key, outcome).second;
}

bool MemoryStore::has_outcome(int64_t signal_id, const Horizon& horizon, int label_version) {
    std::lock_guard<std::mutex> lock(mutex_);
    OutcomeKey key{signal_id, horizon.timeframe, horizon.bars, label_version};
    return outcomes_.count(key) > 0;
}

std::vector<Outcome> MemoryStore::query_outcomes(int64_t signal_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Outcome> out;
    for (const auto& [key, outcome] : outcomes_) {
        if (outcome.signal_id == signal_id) {
            out.push_back(outcome);
        }
    }
    return out;
}

bool MemoryStore::insert_baseline(const Baseline& baseline) {
    std::lock_guard<std::mutex> lock(mutex_);
    BaselineKey key{baseline.symbol, baseline.timeframe, baseline.timestamp_ms,
                    baseline.label_version};
    return baselines_.emplace(key, baseline).second;
}

std::optional<int64_t> MemoryStore::latest_baseline_ts(const std::string& symbol,
                                                       const std::string& timeframe,
                                                       int label_version) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<int64_t> latest;
    for (const auto& [key, baseline] : baselines_) {
        if (baseline.symbol == symbol && baseline.timeframe == timeframe &&
            baseline.label_version == label_version) {
            if (!latest || baseline.timestamp_ms > *latest) {
                latest = baseline.timestamp_ms;
            }
        }
    }
    return latest;
}

std::vector<Baseline> MemoryStore::query_baselines(const std::string& symbol,
                                                   const std::string& timeframe,
                                                   int label_version) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Baseline> out;
    for (const auto& [key, baseline] : baselines_) {
        if (baseline.symbol == symbol && baseline.timeframe == timeframe &&
            baseline.label_version == label_version) {
            out.push_back(baseline);
        }
    }
    std::sort(out.begin(), out.end(), [](const Baseline& a, const Baseline& b) {
        return a.timestamp_ms < b.timestamp_ms;
    });
    return out;
}

size_t MemoryStore::candle_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& [key, series] : candles_) {
        total += series.size();
    }
    return total;
}

size_t MemoryStore::signal_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return signals_.size();
}

size_t MemoryStore::outcome_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_.size();
}

std::vector<IngestionLogEntry> MemoryStore::ingestion_log() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ingestion_log_;
}
