#pragma once

#include "store.hpp"
#include <map>
#include <mutex>
#include <string>
#include <pqxx/pqxx>

// Postgres implementation of every store interface. One connection per
// operation, one transaction per write.
class PostgresStore : public CandleStore,
                      public SignalStore,
                      public OutcomeStore,
                      public BaselineStore {
public:
    explicit PostgresStore(const std::string& dsn);

    void init_schema();
    bool ping();

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

private:
    std::string dsn_;
    std::mutex symbol_mutex_;
    std::map<std::string, int64_t> symbol_ids_;

    pqxx::connection make_connection();
    int64_t upsert_symbol(pqxx::work& txn, const std::string& ticker, int64_t seen_ms);
    std::optional<int64_t> lookup_symbol_id(const std::string& ticker);

    static Candle row_to_candle(const pqxx::row& row);
    static Signal row_to_signal(const pqxx::row& row);
    static Outcome row_to_outcome(const pqxx::row& row);
};
