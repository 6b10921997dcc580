#pragma once

#include "store.hpp"
#include <map>
#include <mutex>
#include <tuple>

// In-process implementation of every store interface. Same key semantics as
// PostgresStore; used by tests and by dry runs without a database.
class MemoryStore : public CandleStore,
                    public SignalStore,
                    public OutcomeStore,
                    public BaselineStore {
public:
    MemoryStore() = default;

    // CandleStore
    void put_bar(const std::string& symbol, const std::string& timeframe,
                 const Candle& bar) override;
    std::vector<Candle> bars_between(const std::string& symbol, const std::string& timeframe,
                                     int64_t after_ms, int64_t until_ms) override;
    std::vector<Candle> recent_bars(const std::string& symbol, const std::string& timeframe,
                                    int64_t until_ms, int limit) override;
    std::optional<int64_t> latest_timestamp(const std::string& symbol,
                                            const std::string& timeframe) override;
    std::optional<SymbolInfo> get_symbol(const std::string& ticker) override;
    void log_ingestion(const IngestionLogEntry& entry) override;

    // SignalStore
    void register_detector(const DetectorInfo& info) override;
    RecordResult record(const Signal& signal) override;
    std::vector<Signal> query_signals(const SignalQuery& query) override;
    std::optional<Signal> get_signal(int64_t id) override;
    std::optional<Signal> latest_signal(const std::string& symbol, const std::string& timeframe,
                                        const std::string& detector_id,
                                        const std::string& detector_version) override;
    bool has_signal_at(const std::string& symbol, const std::string& timeframe,
                       int64_t timestamp_ms) override;

    // OutcomeStore
    bool insert_outcome(const Outcome& outcome) override;
    bool has_outcome(int64_t signal_id, const Horizon& horizon, int label_version) override;
    std::vector<Outcome> query_outcomes(int64_t signal_id) override;

    // BaselineStore
    bool insert_baseline(const Baseline& baseline) override;
    std::optional<int64_t> latest_baseline_ts(const std::string& symbol,
                                              const std::string& timeframe,
                                              int label_version) override;
    std::vector<Baseline> query_baselines(const std::string& symbol,
                                          const std::string& timeframe,
                                          int label_version) override;

    // Inspection helpers
    size_t candle_count() const;
    size_t signal_count() const;
    size_t outcome_count() const;
    std::vector<IngestionLogEntry> ingestion_log() const;

private:
    using StreamKey = std::pair<std::string, std::string>;
    using OutcomeKey = std::tuple<int64_t, std::string, int, int>;
    using BaselineKey = std::tuple<std::string, std::string, int64_t, int>;

    mutable std::mutex mutex_;

    std::map<std::string, SymbolInfo> symbols_;
    std::map<StreamKey, std::map<int64_t, Candle>> candles_;
    std::vector<IngestionLogEntry> ingestion_log_;

    std::map<std::string, DetectorInfo> detectors_;
    std::map<int64_t, Signal> signals_;
    std::map<std::string, int64_t> signal_keys_;
    int64_t next_signal_id_ = 1;
    int64_t next_symbol_id_ = 1;

    std::map<OutcomeKey, Outcome> outcomes_;
    std::map<BaselineKey, Baseline> baselines_;
};
