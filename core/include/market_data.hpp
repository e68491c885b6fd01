#pragma once

#include "datatypes.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace core {

    // Historical bars indexed by (timestamp, symbol). Each symbol's series is
    // kept sorted by timestamp.
    class MarketData {
    public:
        MarketData() = default;

        // Inserts or replaces the bar at candle.timestamp for this symbol
        void addCandle(const std::string& symbol, const Candle& candle);
        void addSeries(const std::string& symbol, const TimeSeries<Candle>& series);

        bool empty() const { return series_.empty(); }
        bool hasSymbol(const std::string& symbol) const;
        // Total number of (timestamp, symbol) rows
        std::size_t size() const;

        std::vector<std::string> symbols() const;
        // Sorted, unique union of all bar timestamps
        std::vector<Timestamp> timestamps() const;

        std::optional<Candle> candleAt(const std::string& symbol, Timestamp ts) const;

        // All bars of `symbol` with timestamp <= ts. Empty for unknown symbols.
        TimeSeries<Candle> history(const std::string& symbol, Timestamp ts) const;
        const TimeSeries<Candle>& series(const std::string& symbol) const;

    private:
        std::map<std::string, TimeSeries<Candle>> series_;
    };

} // namespace core
