#include "pg_store.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace {

// Epoch milliseconds <-> TIMESTAMPTZ
std::string ts_param(int n) {
    return "to_timestamp($" + std::to_string(n) + "::double precision / 1000.0)";
}

std::string epoch_ms(const std::string& column) {
    return "(EXTRACT(EPOCH FROM " + column + ") * 1000)::BIGINT";
}

template <typename T>
std::optional<T> opt(const pqxx::field& f) {
    if (f.is_null()) return std::nullopt;
    return f.as<T>();
}

const std::string kCandleColumns =
    epoch_ms("c.ts") + ", c.open, c.high, c.low, c.close, c.volume, c.vwap, "
    "c.trade_count, c.source, c.is_adjusted";

const std::string kSignalSelect =
    "SELECT s.id, sy.ticker, s.timeframe, " + epoch_ms("s.fired_at") + ", s.side, "
    "s.detector_id, s.detector_version, s.source_system, s.price_at_signal, s.bid, s.ask, "
    "s.spread_bps, s.rel_volume, s.session, s.data_freshness_ms, s.score, s.features::text, "
    "s.features_version "
    "FROM signals s JOIN symbols sy ON sy.id = s.symbol_id ";

const std::string kOutcomeColumns =
    "signal_id, horizon_tf, horizon_bars, label_version, ret_close, max_run_up, "
    "max_drawdown, hit_tp1, hit_tp2, hit_tp3, hit_stop, t_to_tp1_ms, t_to_tp2_ms, "
    "t_to_tp3_ms, t_to_stop_ms, " + epoch_ms("computed_at");

FeatureMap parse_features(const pqxx::field& f) {
    FeatureMap features;
    if (f.is_null()) return features;
    auto j = nlohmann::json::parse(f.c_str());
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.value().is_number()) {
            features[it.key()] = it.value().get<double>();
        }
    }
    return features;
}

std::string dump_features(const FeatureMap& features) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [name, value] : features) {
        j[name] = value;
    }
    return j.dump();
}

} // namespace

PostgresStore::PostgresStore(const std::string& dsn) : dsn_(dsn) {}

pqxx::connection PostgresStore::make_connection() {
    return pqxx::connection(dsn_);
}

void PostgresStore::init_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS symbols (
                id BIGSERIAL PRIMARY KEY,
                ticker TEXT NOT NULL,
                exchange TEXT NOT NULL DEFAULT '',
                asset_type TEXT NOT NULL DEFAULT 'equity',
                currency TEXT NOT NULL DEFAULT 'USD',
                first_seen TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                last_seen TIMESTAMPTZ,
                UNIQUE (ticker, exchange)
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS candles (
                symbol_id BIGINT NOT NULL REFERENCES symbols(id),
                timeframe TEXT NOT NULL
                    CHECK (timeframe IN ('1m','5m','15m','30m','1h','4h','5h','1d')),
                ts TIMESTAMPTZ NOT NULL,
                open DOUBLE PRECISION NOT NULL,
                high DOUBLE PRECISION NOT NULL,
                low DOUBLE PRECISION NOT NULL,
                close DOUBLE PRECISION NOT NULL,
                volume DOUBLE PRECISION NOT NULL,
                vwap DOUBLE PRECISION,
                trade_count BIGINT,
                source TEXT NOT NULL DEFAULT 'provider',
                is_adjusted BOOLEAN NOT NULL DEFAULT TRUE,
                PRIMARY KEY (symbol_id, timeframe, ts)
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS detectors (
                id TEXT NOT NULL,
                version TEXT NOT NULL,
                kind TEXT NOT NULL CHECK (kind IN ('rule','model')),
                description TEXT,
                params JSONB NOT NULL DEFAULT '{}'::jsonb,
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                PRIMARY KEY (id, version)
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS signals (
                id BIGSERIAL PRIMARY KEY,
                symbol_id BIGINT NOT NULL REFERENCES symbols(id),
                timeframe TEXT NOT NULL,
                fired_at TIMESTAMPTZ NOT NULL,
                side TEXT NOT NULL CHECK (side IN ('long','short')),
                detector_id TEXT NOT NULL,
                detector_version TEXT NOT NULL,
                source_system TEXT NOT NULL,
                price_at_signal DOUBLE PRECISION NOT NULL,
                bid DOUBLE PRECISION,
                ask DOUBLE PRECISION,
                spread_bps DOUBLE PRECISION,
                rel_volume DOUBLE PRECISION,
                session TEXT,
                data_freshness_ms BIGINT,
                score DOUBLE PRECISION NOT NULL DEFAULT 0,
                features JSONB,
                features_version INTEGER NOT NULL DEFAULT 1,
                FOREIGN KEY (detector_id, detector_version) REFERENCES detectors(id, version),
                UNIQUE (symbol_id, timeframe, fired_at, detector_id, detector_version)
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS outcomes (
                signal_id BIGINT NOT NULL REFERENCES signals(id),
                horizon_tf TEXT NOT NULL,
                horizon_bars INTEGER NOT NULL,
                label_version INTEGER NOT NULL,
                ret_close DOUBLE PRECISION NOT NULL,
                max_run_up DOUBLE PRECISION NOT NULL,
                max_drawdown DOUBLE PRECISION NOT NULL,
                hit_tp1 BOOLEAN NOT NULL,
                hit_tp2 BOOLEAN NOT NULL,
                hit_tp3 BOOLEAN NOT NULL,
                hit_stop BOOLEAN NOT NULL,
                t_to_tp1_ms BIGINT,
                t_to_tp2_ms BIGINT,
                t_to_tp3_ms BIGINT,
                t_to_stop_ms BIGINT,
                computed_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                PRIMARY KEY (signal_id, horizon_tf, horizon_bars, label_version)
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS baselines (
                symbol_id BIGINT NOT NULL REFERENCES symbols(id),
                timeframe TEXT NOT NULL,
                ts TIMESTAMPTZ NOT NULL,
                label_version INTEGER NOT NULL,
                close DOUBLE PRECISION NOT NULL,
                features JSONB,
                features_version INTEGER NOT NULL DEFAULT 1,
                is_negative BOOLEAN NOT NULL DEFAULT TRUE,
                PRIMARY KEY (symbol_id, timeframe, ts, label_version)
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS ingestion_log (
                id BIGSERIAL PRIMARY KEY,
                source TEXT,
                symbol_id BIGINT,
                timeframe TEXT,
                bars_written INTEGER,
                lag_ms BIGINT,
                errors TEXT,
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        txn.exec("CREATE INDEX IF NOT EXISTS idx_candles_symbol_tf_ts "
                 "ON candles (symbol_id, timeframe, ts DESC)");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_signals_symbol_tf_fired "
                 "ON signals (symbol_id, timeframe, fired_at DESC)");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_signals_fired ON signals (fired_at)");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_ingestion_log_created "
                 "ON ingestion_log (created_at DESC)");

        txn.commit();
        spdlog::info("Database schema initialized");

    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        throw;
    }
}

bool PostgresStore::ping() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec("SELECT 1");
        txn.commit();
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("Postgres ping failed: {}", e.what());
        return false;
    }
}

int64_t PostgresStore::upsert_symbol(pqxx::work& txn, const std::string& ticker,
                                     int64_t seen_ms) {
    // GREATEST ignores NULL, so last_seen never moves backwards
    auto result = txn.exec_params(
        "INSERT INTO symbols (ticker, exchange, last_seen) "
        "VALUES ($1, '', " + ts_param(2) + ") "
        "ON CONFLICT (ticker, exchange) DO UPDATE SET "
        "last_seen = GREATEST(symbols.last_seen, EXCLUDED.last_seen) "
        "RETURNING id",
        ticker, seen_ms
    );
    return result[0][0].as<int64_t>();
}

std::optional<int64_t> PostgresStore::lookup_symbol_id(const std::string& ticker) {
    {
        std::lock_guard<std::mutex> lock(symbol_mutex_);
        auto it = symbol_ids_.find(ticker);
        if (it != symbol_ids_.end()) return it->second;
    }

    auto conn = make_connection();
    pqxx::work txn(conn);
    auto result = txn.exec_params(
        "SELECT id FROM symbols WHERE ticker = $1 AND exchange = ''", ticker);
    txn.commit();
    if (result.empty()) return std::nullopt;

    int64_t id = result[0][0].as<int64_t>();
    std::lock_guard<std::mutex> lock(symbol_mutex_);
    symbol_ids_[ticker] = id;
    return id;
}

Candle PostgresStore::row_to_candle(const pqxx::row& row) {
    Candle c;
    c.timestamp_ms = row[0].as<int64_t>();
    c.open = row[1].as<double>();
    c.high = row[2].as<double>();
    c.low = row[3].as<double>();
    c.close = row[4].as<double>();
    c.volume = row[5].as<double>();
    c.vwap = opt<double>(row[6]);
    c.trade_count = opt<int64_t>(row[7]);
    c.source = row[8].as<std::string>();
    c.is_adjusted = row[9].as<bool>();
    return c;
}

void PostgresStore::put_bar(const std::string& symbol, const std::string& timeframe,
                            const Candle& bar) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        int64_t symbol_id = upsert_symbol(txn, symbol, bar.timestamp_ms);
        txn.exec_params(
            "INSERT INTO candles (symbol_id, timeframe, ts, open, high, low, close, volume, "
            "vwap, trade_count, source, is_adjusted) "
            "VALUES ($1, $2, " + ts_param(3) + ", $4, $5, $6, $7, $8, $9, $10, $11, $12) "
            "ON CONFLICT (symbol_id, timeframe, ts) DO UPDATE SET "
            "open = EXCLUDED.open, high = EXCLUDED.high, low = EXCLUDED.low, "
            "close = EXCLUDED.close, volume = EXCLUDED.volume, vwap = EXCLUDED.vwap, "
            "trade_count = EXCLUDED.trade_count, source = EXCLUDED.source, "
            "is_adjusted = EXCLUDED.is_adjusted",
            symbol_id, timeframe, bar.timestamp_ms, bar.open, bar.high, bar.low, bar.close,
            bar.volume, bar.vwap, bar.trade_count, bar.source, bar.is_adjusted
        );

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to save {} {} bar: {}", symbol, timeframe, e.what());
        throw;
    }
}

std::vector<Candle> PostgresStore::bars_between(const std::string& symbol,
                                                const std::string& timeframe,
                                                int64_t after_ms, int64_t until_ms) {
    std::vector<Candle> bars;
    auto symbol_id = lookup_symbol_id(symbol);
    if (!symbol_id) return bars;

    auto conn = make_connection();
    pqxx::work txn(conn);
    auto result = txn.exec_params(
        "SELECT " + kCandleColumns + " FROM candles c "
        "WHERE c.symbol_id = $1 AND c.timeframe = $2 "
        "AND c.ts > " + ts_param(3) + " AND c.ts <= " + ts_param(4) + " "
        "ORDER BY c.ts ASC",
        *symbol_id, timeframe, after_ms, until_ms
    );
    txn.commit();

    for (const auto& row : result) {
        bars.push_back(row_to_candle(row));
    }
    return bars;
}

std::vector<Candle> PostgresStore::recent_bars(const std::string& symbol,
                                               const std::string& timeframe,
                                               int64_t until_ms, int limit) {
    std::vector<Candle> bars;
    auto symbol_id = lookup_symbol_id(symbol);
    if (!symbol_id || limit <= 0) return bars;

    auto conn = make_connection();
    pqxx::work txn(conn);
    auto result = txn.exec_params(
        "SELECT " + kCandleColumns + " FROM candles c "
        "WHERE c.symbol_id = $1 AND c.timeframe = $2 AND c.ts <= " + ts_param(3) + " "
        "ORDER BY c.ts DESC LIMIT $4",
        *symbol_id, timeframe, until_ms, limit
    );
    txn.commit();

    for (const auto& row : result) {
        bars.push_back(row_to_candle(row));
    }
    std::reverse(bars.begin(), bars.end());
    return bars;
}

std::optional<int64_t> PostgresStore::latest_timestamp(const std::string& symbol,
                                                       const std::string& timeframe) {
    auto symbol_id = lookup_symbol_id(symbol);
    if (!symbol_id) return std::nullopt;

    auto conn = make_connection();
    pqxx::work txn(conn);
    auto result = txn.exec_params(
        "SELECT " + epoch_ms("MAX(ts)") + " FROM candles "
        "WHERE symbol_id = $1 AND timeframe = $2",
        *symbol_id, timeframe
    );
    txn.commit();
    return opt<int64_t>(result[0][0]);
}

std::optional<SymbolInfo> PostgresStore::get_symbol(const std::string& ticker) {
    auto conn = make_connection();
    pqxx::work txn(conn);
    auto result = txn.exec_params(
        "SELECT id, ticker, exchange, asset_type, currency, " + epoch_ms("first_seen") + ", " +
        epoch_ms("last_seen") + " FROM symbols WHERE ticker = $1 AND exchange = ''",
        ticker
    );
    txn.commit();
    if (result.empty()) return std::nullopt;

    const auto& row = result[0];
    SymbolInfo info;
    info.id = row[0].as<int64_t>();
    info.ticker = row[1].as<std::string>();
    info.exchange = row[2].as<std::string>();
    info.asset_type = row[3].as<std::string>();
    info.currency = row[4].as<std::string>();
    info.first_seen_ms = row[5].as<int64_t>();
    info.last_seen_ms = opt<int64_t>(row[6]).value_or(0);
    return info;
}

void PostgresStore::log_ingestion(const IngestionLogEntry& entry) {
    try {
        auto symbol_id = lookup_symbol_id(entry.symbol);
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec_params(
            "INSERT INTO ingestion_log (source, symbol_id, timeframe, bars_written, lag_ms, "
            "errors) VALUES ($1, $2, $3, $4, $5, $6)",
            entry.source, symbol_id, entry.timeframe, entry.bars_written, entry.lag_ms,
            entry.errors.empty() ? std::optional<std::string>() : entry.errors
        );
        txn.commit();
    } catch (const std::exception& e) {
        spdlog::error("Failed to write ingestion log for {}: {}", entry.symbol, e.what());
    }
}

void PostgresStore::register_detector(const DetectorInfo& info) {
    auto conn = make_connection();
    pqxx::work txn(conn);

    auto existing = txn.exec_params(
        "SELECT kind, params::text FROM detectors WHERE id = $1 AND version = $2",
        info.id, info.version
    );
    if (!existing.empty()) {
        auto kind = existing[0][0].as<std::string>();
        auto params = nlohmann::json::parse(existing[0][1].c_str());
        if (kind != kind_name(info.kind) || params != info.params) {
            throw ConfigValidationError(
                "Detector " + info.key() + " already registered with different parameters; "
                "mint a new version");
        }
        txn.commit();
        return;
    }

    txn.exec_params(
        "INSERT INTO detectors (id, version, kind, description, params) "
        "VALUES ($1, $2, $3, $4, $5::jsonb) ON CONFLICT (id, version) DO NOTHING",
        info.id, info.version, kind_name(info.kind), info.description, info.params.dump()
    );
    txn.commit();
    spdlog::info("Detector {} persisted", info.key());
}

Signal PostgresStore::row_to_signal(const pqxx::row& row) {
    Signal s;
    s.id = row[0].as<int64_t>();
    s.symbol = row[1].as<std::string>();
    s.timeframe = row[2].as<std::string>();
    s.fired_at_ms = row[3].as<int64_t>();
    s.side = row[4].as<std::string>();
    s.detector_id = row[5].as<std::string>();
    s.detector_version = row[6].as<std::string>();
    s.source_system = row[7].as<std::string>();
    s.price_at_signal = row[8].as<double>();
    s.bid = opt<double>(row[9]);
    s.ask = opt<double>(row[10]);
    s.spread_bps = opt<double>(row[11]);
    s.rel_volume = opt<double>(row[12]);
    s.session = opt<std::string>(row[13]).value_or("");
    s.data_freshness_ms = opt<int64_t>(row[14]);
    s.score = row[15].as<double>();
    s.features = parse_features(row[16]);
    s.features_version = row[17].as<int>();
    return s;
}

RecordResult PostgresStore::record(const Signal& signal) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        int64_t symbol_id = upsert_symbol(txn, signal.symbol, signal.fired_at_ms);
        auto inserted = txn.exec_params(
            "INSERT INTO signals (symbol_id, timeframe, fired_at, side, detector_id, "
            "detector_version, source_system, price_at_signal, bid, ask, spread_bps, "
            "rel_volume, session, data_freshness_ms, score, features, features_version) "
            "VALUES ($1, $2, " + ts_param(3) + ", $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, "
            "$14, $15, $16::jsonb, $17) "
            "ON CONFLICT (symbol_id, timeframe, fired_at, detector_id, detector_version) "
            "DO NOTHING RETURNING id",
            symbol_id, signal.timeframe, signal.fired_at_ms, signal.side, signal.detector_id,
            signal.detector_version, signal.source_system, signal.price_at_signal,
            signal.bid, signal.ask, signal.spread_bps, signal.rel_volume, signal.session,
            signal.data_freshness_ms, signal.score, dump_features(signal.features),
            signal.features_version
        );

        if (!inserted.empty()) {
            txn.commit();
            Signal stored = signal;
            stored.id = inserted[0][0].as<int64_t>();
            return RecordResult{stored, true};
        }

        // Collision: return the row that won
        auto existing = txn.exec_params(
            kSignalSelect +
            "WHERE s.symbol_id = $1 AND s.timeframe = $2 AND s.fired_at = " + ts_param(3) +
            " AND s.detector_id = $4 AND s.detector_version = $5",
            symbol_id, signal.timeframe, signal.fired_at_ms, signal.detector_id,
            signal.detector_version
        );
        txn.commit();
        if (existing.empty()) {
            throw std::runtime_error("Signal " + signal.natural_key() +
                                      " collided but could not be read back");
        }
        return RecordResult{row_to_signal(existing[0]), false};

    } catch (const std::exception& e) {
        spdlog::error("Failed to record signal {}: {}", signal.natural_key(), e.what());
        throw;
    }
}

std::vector<Signal> PostgresStore::query_signals(const SignalQuery& query) {
    auto conn = make_connection();
    pqxx::work txn(conn);

    // LIMIT NULL is LIMIT ALL
    std::optional<int> limit;
    if (query.limit > 0) limit = query.limit;

    auto result = txn.exec_params(
        kSignalSelect +
        "WHERE ($1::text IS NULL OR sy.ticker = $1) "
        "AND ($2::text IS NULL OR s.timeframe = $2) "
        "AND ($3::bigint IS NULL OR s.fired_at >= " + ts_param(3) + ") "
        "ORDER BY s.fired_at ASC, s.id ASC LIMIT $4",
        query.symbol, query.timeframe, query.since_ms, limit
    );
    txn.commit();

    std::vector<Signal> signals;
    for (const auto& row : result) {
        signals.push_back(row_to_signal(row));
    }
    return signals;
}

std::optional<Signal> PostgresStore::get_signal(int64_t id) {
    auto conn = make_connection();
    pqxx::work txn(conn);
    auto result = txn.exec_params(kSignalSelect + "WHERE s.id = $1", id);
    txn.commit();
    if (result.empty()) return std::nullopt;
    return row_to_signal(result[0]);
}

std::optional<Signal> PostgresStore::latest_signal(const std::string& symbol,
                                                   const std::string& timeframe,
                                                   const std::string& detector_id,
                                                   const std::string& detector_version) {
    auto conn = make_connection();
    pqxx::work txn(conn);
    auto result = txn.exec_params(
        kSignalSelect +
        "WHERE sy.ticker = $1 AND s.timeframe = $2 AND s.detector_id = $3 "
        "AND s.detector_version = $4 ORDER BY s.fired_at DESC LIMIT 1",
        symbol, timeframe, detector_id, detector_version
    );
    txn.commit();
    if (result.empty()) return std::nullopt;
    return row_to_signal(result[0]);
}

bool PostgresStore::has_signal_at(const std::string& symbol, const std::string& timeframe,
                                  int64_t timestamp_ms) {
    auto conn = make_connection();
    pqxx::work txn(conn);
    auto result = txn.exec_params(
        "SELECT 1 FROM signals s JOIN symbols sy ON sy.id = s.symbol_id "
        "WHERE sy.ticker = $1 AND s.timeframe = $2 AND s.fired_at = " + ts_param(3) +
        " LIMIT 1",
        symbol, timeframe, timestamp_ms
    );
    txn.commit();
    return !result.empty();
}

Outcome PostgresStore::row_to_outcome(const pqxx::row& row) {
    Outcome o;
    o.signal_id = row[0].as<int64_t>();
    o.horizon_tf = row[1].as<std::string>();
    o.horizon_bars = row[2].as<int>();
    o.label_version = row[3].as<int>();
    o.ret_close = row[4].as<double>();
    o.max_run_up = row[5].as<double>();
    o.max_drawdown = row[6].as<double>();
    o.hit_tp1 = row[7].as<bool>();
    o.hit_tp2 = row[8].as<bool>();
    o.hit_tp3 = row[9].as<bool>();
    o.hit_stop = row[10].as<bool>();
    o.t_to_tp1_ms = opt<int64_t>(row[11]);
    o.t_to_tp2_ms = opt<int64_t>(row[12]);
    o.t_to_tp3_ms = opt<int64_t>(row[13]);
    o.t_to_stop_ms = opt<int64_t>(row[14]);
    o.computed_at_ms = row[15].as<int64_t>();
    return o;
}

bool PostgresStore::insert_outcome(const Outcome& outcome) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        auto result = txn.exec_params(
            "INSERT INTO outcomes (signal_id, horizon_tf, horizon_bars, label_version, "
            "ret_close, max_run_up, max_drawdown, hit_tp1, hit_tp2, hit_tp3, hit_stop, "
            "t_to_tp1_ms, t_to_tp2_ms, t_to_tp3_ms, t_to_stop_ms, computed_at) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15, " +
            ts_param(16) + ") "
            "ON CONFLICT (signal_id, horizon_tf, horizon_bars, label_version) DO NOTHING "
            "RETURNING signal_id",
            outcome.signal_id, outcome.horizon_tf, outcome.horizon_bars, outcome.label_version,
            outcome.ret_close, outcome.max_run_up, outcome.max_drawdown,
            outcome.hit_tp1, outcome.hit_tp2, outcome.hit_tp3, outcome.hit_stop,
            outcome.t_to_tp1_ms, outcome.t_to_tp2_ms, outcome.t_to_tp3_ms,
            outcome.t_to_stop_ms, outcome.computed_at_ms
        );
        txn.commit();
        return !result.empty();

    } catch (const std::exception& e) {
        spdlog::error("Failed to insert outcome for signal #{}: {}", outcome.signal_id,
                      e.what());
        throw;
    }
}

bool PostgresStore::has_outcome(int64_t signal_id, const Horizon& horizon, int label_version) {
    auto conn = make_connection();
    pqxx::work txn(conn);
    auto result = txn.exec_params(
        "SELECT 1 FROM outcomes WHERE signal_id = $1 AND horizon_tf = $2 "
        "AND horizon_bars = $3 AND label_version = $4",
        signal_id, horizon.timeframe, horizon.bars, label_version
    );
    txn.commit();
    return !result.empty();
}

std::vector<Outcome> PostgresStore::query_outcomes(int64_t signal_id) {
    auto conn = make_connection();
    pqxx::work txn(conn);
    auto result = txn.exec_params(
        "SELECT " + kOutcomeColumns + " FROM outcomes WHERE signal_id = $1 "
        "ORDER BY label_version, horizon_tf, horizon_bars",
        signal_id
    );
    txn.commit();

    std::vector<Outcome> outcomes;
    for (const auto& row : result) {
        outcomes.push_back(row_to_outcome(row));
    }
    return outcomes;
}

bool PostgresStore::insert_baseline(const Baseline& baseline) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        int64_t symbol_id = upsert_symbol(txn, baseline.symbol, baseline.timestamp_ms);
        auto result = txn.exec_params(
            "INSERT INTO baselines (symbol_id, timeframe, ts, label_version, close, features, "
            "features_version) VALUES ($1, $2, " + ts_param(3) + ", $4, $5, $6::jsonb, $7) "
            "ON CONFLICT (symbol_id, timeframe, ts, label_version) DO NOTHING "
            "RETURNING symbol_id",
            symbol_id, baseline.timeframe, baseline.timestamp_ms, baseline.label_version,
            baseline.close, dump_features(baseline.features), baseline.features_version
        );
        txn.commit();
        return !result.empty();

    } catch (const std::exception& e) {
        spdlog::error("Failed to insert baseline {}:{}: {}", baseline.symbol,
                      baseline.timeframe, e.what());
        throw;
    }
}

std::optional<int64_t> PostgresStore::latest_baseline_ts(const std::string& symbol,
                                                         const std::string& timeframe,
                                                         int label_version) {
    auto symbol_id = lookup_symbol_id(symbol);
    if (!symbol_id) return std::nullopt;

    auto conn = make_connection();
    pqxx::work txn(conn);
    auto result = txn.exec_params(
        "SELECT " + epoch_ms("MAX(ts)") + " FROM baselines "
        "WHERE symbol_id = $1 AND timeframe = $2 AND label_version = $3",
        *symbol_id, timeframe, label_version
    );
    txn.commit();
    return opt<int64_t>(result[0][0]);
}

std::vector<Baseline> PostgresStore::query_baselines(const std::string& symbol,
                                                     const std::string& timeframe,
                                                     int label_version) {
    std::vector<Baseline> baselines;
    auto symbol_id = lookup_symbol_id(symbol);
    if (!symbol_id) return baselines;

    auto conn = make_connection();
    pqxx::work txn(conn);
    auto result = txn.exec_params(
        "SELECT " + epoch_ms("ts") + ", close, features::text, features_version "
        "FROM baselines WHERE symbol_id = $1 AND timeframe = $2 AND label_version = $3 "
        "ORDER BY ts ASC",
        *symbol_id, timeframe, label_version
    );
    txn.commit();

    for (const auto& row : result) {
        Baseline b;
        b.symbol = symbol;
        b.timeframe = timeframe;
        b.timestamp_ms = row[0].as<int64_t>();
        b.label_version = label_version;
        b.close = row[1].as<double>();
        b.features = parse_features(row[2]);
        b.features_version = row[3].as<int>();
        baselines.push_back(b);
    }
    return baselines;
}
