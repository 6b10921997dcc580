#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

// Durable OHLCV storage keyed by (symbol, timeframe, timestamp).
// Writes are idempotent upserts; the last applied write for a key wins.
class CandleStore {
public:
    virtual ~CandleStore() = default;

    virtual void put_bar(const std::string& symbol, const std::string& timeframe,
                         const Candle& bar) = 0;

    // Ascending bars with after_ms < ts <= until_ms.
    virtual std::vector<Candle> bars_between(const std::string& symbol,
                                             const std::string& timeframe,
                                             int64_t after_ms, int64_t until_ms) = 0;

    // Newest `limit` bars with ts <= until_ms, returned ascending.
    virtual std::vector<Candle> recent_bars(const std::string& symbol,
                                            const std::string& timeframe,
                                            int64_t until_ms, int limit) = 0;

    virtual std::optional<int64_t> latest_timestamp(const std::string& symbol,
                                                    const std::string& timeframe) = 0;

    virtual std::optional<SymbolInfo> get_symbol(const std::string& ticker) = 0;

    virtual void log_ingestion(const IngestionLogEntry& entry) = 0;
};

struct SignalQuery {
    std::optional<std::string> symbol;
    std::optional<std::string> timeframe;
    std::optional<int64_t> since_ms;
    int limit = 1000;  // <= 0 for no limit
};

struct RecordResult {
    Signal signal;  // stored row, new or pre-existing
    bool created = false;
};

// Append-only signal log. There is no update path for stored rows.
class SignalStore {
public:
    virtual ~SignalStore() = default;

    // Throws ConfigValidationError if (id, version) exists with other kind/params.
    virtual void register_detector(const DetectorInfo& info) = 0;

    virtual RecordResult record(const Signal& signal) = 0;

    // Ascending by fired_at.
    virtual std::vector<Signal> query_signals(const SignalQuery& query) = 0;
    virtual std::optional<Signal> get_signal(int64_t id) = 0;
    virtual std::optional<Signal> latest_signal(const std::string& symbol,
                                                const std::string& timeframe,
                                                const std::string& detector_id,
                                                const std::string& detector_version) = 0;
    virtual bool has_signal_at(const std::string& symbol, const std::string& timeframe,
                               int64_t timestamp_ms) = 0;
};

class OutcomeStore {
public:
    virtual ~OutcomeStore() = default;

    // Atomic insert. Returns false when the key already exists (no overwrite).
    virtual bool insert_outcome(const Outcome& outcome) = 0;
    virtual bool has_outcome(int64_t signal_id, const Horizon& horizon,
                             int label_version) = 0;
    virtual std::vector<Outcome> query_outcomes(int64_t signal_id) = 0;
};

class BaselineStore {
public:
    virtual ~BaselineStore() = default;

    virtual bool insert_baseline(const Baseline& baseline) = 0;
    virtual std::optional<int64_t> latest_baseline_ts(const std::string& symbol,
                                                      const std::string& timeframe,
                                                      int label_version) = 0;
    virtual std::vector<Baseline> query_baselines(const std::string& symbol,
                                                  const std::string& timeframe,
                                                  int label_version) = 0;
};
