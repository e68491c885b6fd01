#pragma once

#include <string>
#include <vector>

#include <sqlite3.h> // Standard C header

#include "datatypes.hpp"
#include "market_data.hpp"

namespace data {

class DatabaseManager {
public:
    // db_path may be ":memory:" for a private in-memory database
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager();

    // Owns the sqlite3 handle
    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    // Creates historical_candles and its index if missing
    bool initializeSchema();

    bool executeSQL(const std::string& sql);

    // INSERT OR IGNORE in one transaction; existing (symbol, interval, timestamp) rows are kept
    bool saveCandles(const core::TimeSeries<core::Candle>& candles,
                     const std::string& symbol,
                     const std::string& interval);

    // Bars in [start_time, end_time], ascending
    core::TimeSeries<core::Candle> queryCandles(
        const std::string& symbol,
        const std::string& interval,
        core::Timestamp start_time,
        core::Timestamp end_time);

    // Builds a MarketData table from several symbols. Symbols without rows are logged and left out.
    core::MarketData loadMarketData(const std::vector<std::string>& symbols,
                                    const std::string& interval,
                                    core::Timestamp start_time,
                                    core::Timestamp end_time);

    const std::string& getPath() const { return database_path_; }

private:
    std::string database_path_;
    sqlite3* db_ = nullptr; // SQLite database connection handle
    bool connected_ = false;
};

} // namespace data
