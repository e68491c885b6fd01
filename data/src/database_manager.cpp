#include "database_manager.hpp"
#include "logging.hpp"
#include "utils.hpp" // For timestampToString/stringToTimestamp
#include <memory>
#include <stdexcept>

namespace data
{

    namespace
    {

        struct StatementFinalizer
        {
            void operator()(sqlite3_stmt *stmt) const { sqlite3_finalize(stmt); }
        };
        using Statement = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

        // Null on failure, with the SQLite error logged
        Statement prepare(sqlite3 *db, const char *sql, const char *what)
        {
            sqlite3_stmt *raw = nullptr;
            int rc = sqlite3_prepare_v2(db, sql, -1, &raw, nullptr);
            Statement stmt(raw);
            if (rc != SQLITE_OK)
            {
                core::logging::getLogger()->error("Failed to prepare {} statement [{}]: {}", what, rc, sqlite3_errmsg(db));
                stmt.reset();
            }
            return stmt;
        }

        // Parameters 1..8 of the candle INSERT
        void bindCandle(sqlite3_stmt *stmt, const std::string &symbol, const std::string &interval,
                        const std::string &timestamp, const core::Candle &candle)
        {
            sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, interval.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 3, timestamp.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(stmt, 4, candle.open);
            sqlite3_bind_double(stmt, 5, candle.high);
            sqlite3_bind_double(stmt, 6, candle.low);
            sqlite3_bind_double(stmt, 7, candle.close);
            sqlite3_bind_int64(stmt, 8, candle.volume);
        }

        // Columns: timestamp, open, high, low, close, volume
        core::Candle readCandle(sqlite3_stmt *stmt, const char *timestamp_text)
        {
            core::Candle candle;
            candle.timestamp = core::utils::stringToTimestamp(timestamp_text);
            candle.open = sqlite3_column_double(stmt, 1);
            candle.high = sqlite3_column_double(stmt, 2);
            candle.low = sqlite3_column_double(stmt, 3);
            candle.close = sqlite3_column_double(stmt, 4);
            candle.volume = sqlite3_column_int64(stmt, 5);
            return candle;
        }

        // Timestamps are ISO-8601 UTC text, so text order is chronological order
        const char *const kCreateCandlesTable = R"(
            CREATE TABLE IF NOT EXISTS historical_candles (
                symbol TEXT NOT NULL,
                interval TEXT NOT NULL,
                timestamp TEXT NOT NULL,
                open REAL,
                high REAL,
                low REAL,
                close REAL NOT NULL,
                volume INTEGER,
                PRIMARY KEY (symbol, interval, timestamp)
            );
        )";

        const char *const kCreateCandlesIndex = R"(
            CREATE INDEX IF NOT EXISTS idx_candles_timestamp
            ON historical_candles (symbol, interval, timestamp);
        )";

        const char *const kInsertCandle = R"(
            INSERT OR IGNORE INTO historical_candles
            (symbol, interval, timestamp, open, high, low, close, volume)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?);
        )";

        const char *const kSelectCandles = R"(
            SELECT timestamp, open, high, low, close, volume
            FROM historical_candles
            WHERE symbol = ? AND interval = ? AND timestamp >= ? AND timestamp <= ?
            ORDER BY timestamp ASC;
        )";

    } // end anonymous namespace

    DatabaseManager::DatabaseManager(const std::string &db_path)
        : database_path_(db_path)
    {
        core::logging::getLogger()->debug("DatabaseManager (SQLite) created for path: {}", db_path);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect();
    }

    bool DatabaseManager::connect()
    {
        auto logger = core::logging::getLogger();
        if (isConnected())
        {
            logger->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        logger->info("Connecting to SQLite database: {}", database_path_);
        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Cannot open SQLite database '{}': {}", database_path_,
                          db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
            sqlite3_close(db_); // A handle may be allocated even on failure
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        return true;
    }

    void DatabaseManager::disconnect()
    {
        if (!connected_)
        {
            return;
        }
        core::logging::getLogger()->info("Disconnecting from SQLite database: {}", database_path_);
        if (sqlite3_close(db_) != SQLITE_OK)
        {
            // Usually unfinalized prepared statements
            core::logging::getLogger()->error("Error disconnecting from SQLite database: {}", sqlite3_errmsg(db_));
        }
        db_ = nullptr;
        connected_ = false;
    }

    bool DatabaseManager::isConnected() const
    {
        return connected_ && (db_ != nullptr);
    }

    bool DatabaseManager::executeSQL(const std::string &sql)
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot execute SQL: Not connected to database.");
            return false;
        }

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("SQL error: {}", error_msg ? error_msg : sqlite3_errstr(rc));
            sqlite3_free(error_msg);
            return false;
        }
        return true;
    }

    bool DatabaseManager::initializeSchema()
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot initialize schema: Not connected to database.");
            return false;
        }

        bool success = executeSQL(kCreateCandlesTable) && executeSQL(kCreateCandlesIndex);
        if (!success)
        {
            core::logging::getLogger()->error("SQLite schema initialization failed for {}.", database_path_);
        }
        return success;
    }

    bool DatabaseManager::saveCandles(const core::TimeSeries<core::Candle> &candles,
                                      const std::string &symbol,
                                      const std::string &interval)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save candles: Not connected to database.");
            return false;
        }
        if (candles.empty())
        {
            return true;
        }

        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            return false;
        }

        bool success = true;
        int inserted = 0;
        {
            // Finalized at scope exit, before COMMIT/ROLLBACK
            Statement stmt = prepare(db_, kInsertCandle, "candle INSERT");
            success = static_cast<bool>(stmt);

            for (auto it = candles.begin(); success && it != candles.end(); ++it)
            {
                bindCandle(stmt.get(), symbol, interval, core::utils::timestampToString(it->timestamp), *it);
                int rc = sqlite3_step(stmt.get());
                if (rc != SQLITE_DONE)
                {
                    logger->error("Candle insert failed for {} [{}]: {}", symbol, rc, sqlite3_errmsg(db_));
                    success = false;
                    break;
                }
                inserted += sqlite3_changes(db_); // 0 when ignored as a duplicate
                rc = sqlite3_reset(stmt.get());
                if (rc != SQLITE_OK)
                {
                    logger->error("Failed to reset candle INSERT [{}]: {}", rc, sqlite3_errmsg(db_));
                    success = false;
                }
            }
        }

        if (success && executeSQL("COMMIT;"))
        {
            logger->info("Saved {} new candles for {} ({}); {} duplicates ignored.",
                         inserted, symbol, interval, candles.size() - static_cast<std::size_t>(inserted));
            return true;
        }

        if (!executeSQL("ROLLBACK;"))
        {
            logger->error("ROLLBACK failed after candle save error for {} ({}).", symbol, interval);
        }
        logger->warn("Candle save for {} ({}) rolled back.", symbol, interval);
        return false;
    }

    core::TimeSeries<core::Candle> DatabaseManager::queryCandles(
        const std::string &symbol,
        const std::string &interval,
        core::Timestamp start_time,
        core::Timestamp end_time)
    {
        auto logger = core::logging::getLogger();
        core::TimeSeries<core::Candle> candles;
        if (!isConnected())
        {
            logger->error("Cannot query candles: Not connected to database.");
            return candles;
        }

        Statement stmt = prepare(db_, kSelectCandles, "candle SELECT");
        if (!stmt)
        {
            return candles;
        }

        const std::string start_str = core::utils::timestampToString(start_time);
        const std::string end_str = core::utils::timestampToString(end_time);
        sqlite3_bind_text(stmt.get(), 1, symbol.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 2, interval.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 3, start_str.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 4, end_str.c_str(), -1, SQLITE_TRANSIENT);

        int rc;
        int row = 0;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
        {
            ++row;
            const unsigned char *ts_text = sqlite3_column_text(stmt.get(), 0);
            if (!ts_text)
            {
                logger->warn("Skipping row {} of {} with NULL timestamp.", row, symbol);
                continue;
            }
            try
            {
                candles.push_back(readCandle(stmt.get(), reinterpret_cast<const char *>(ts_text)));
            }
            catch (const std::runtime_error &e)
            {
                logger->error("Skipping row {} of {} with unparsable timestamp: {}", row, symbol, e.what());
            }
        }

        if (rc != SQLITE_DONE)
        {
            logger->error("Error stepping through candle query [{}]: {}", rc, sqlite3_errmsg(db_));
        }
        logger->debug("Loaded {} {} candles for {} between {} and {}.", candles.size(), interval, symbol, start_str, end_str);
        return candles;
    }

    core::MarketData DatabaseManager::loadMarketData(const std::vector<std::string> &symbols,
                                                     const std::string &interval,
                                                     core::Timestamp start_time,
                                                     core::Timestamp end_time)
    {
        auto logger = core::logging::getLogger();
        core::MarketData market_data;
        for (const auto &symbol : symbols)
        {
            auto candles = queryCandles(symbol, interval, start_time, end_time);
            if (candles.empty())
            {
                logger->warn("No {} candles found for {} in the requested range.", interval, symbol);
                continue;
            }
            market_data.addSeries(symbol, candles);
        }
        logger->info("Loaded market data: {} symbols, {} rows.", market_data.symbols().size(), market_data.size());
        return market_data;
    }

} // namespace data
