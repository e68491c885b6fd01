#include "market_data.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <set>

namespace core {

    namespace {

        bool timestampLess(const Candle& candle, const Timestamp& ts) {
            return candle.timestamp < ts;
        }

    } // end anonymous namespace

    void MarketData::addCandle(const std::string& symbol, const Candle& candle) {
        if (symbol.empty()) {
            throw DataLoadException("Market data row has an empty symbol.");
        }
        if (!std::isfinite(candle.close) || candle.close <= 0.0) {
            throw DataLoadException(fmt::format("Invalid close price {} for {} at {}.",
                                                candle.close, symbol, utils::timestampToString(candle.timestamp)));
        }

        auto& bars = series_[symbol];
        auto it = std::lower_bound(bars.begin(), bars.end(), candle.timestamp, timestampLess);
        if (it != bars.end() && it->timestamp == candle.timestamp) {
            *it = candle; // Later row wins
        } else {
            bars.insert(it, candle);
        }
    }

    void MarketData::addSeries(const std::string& symbol, const TimeSeries<Candle>& series) {
        for (const auto& candle : series) {
            addCandle(symbol, candle);
        }
    }

    bool MarketData::hasSymbol(const std::string& symbol) const {
        return series_.find(symbol) != series_.end();
    }

    std::size_t MarketData::size() const {
        std::size_t total = 0;
        for (const auto& pair : series_) {
            total += pair.second.size();
        }
        return total;
    }

    std::vector<std::string> MarketData::symbols() const {
        std::vector<std::string> out;
        out.reserve(series_.size());
        for (const auto& pair : series_) {
            out.push_back(pair.first);
        }
        return out;
    }

    std::vector<Timestamp> MarketData::timestamps() const {
        std::set<Timestamp> unique_ts;
        for (const auto& pair : series_) {
            for (const auto& candle : pair.second) {
                unique_ts.insert(candle.timestamp);
            }
        }
        return std::vector<Timestamp>(unique_ts.begin(), unique_ts.end());
    }

    std::optional<Candle> MarketData::candleAt(const std::string& symbol, Timestamp ts) const {
        auto it_series = series_.find(symbol);
        if (it_series == series_.end()) {
            return std::nullopt;
        }
        const auto& bars = it_series->second;
        auto it = std::lower_bound(bars.begin(), bars.end(), ts, timestampLess);
        if (it == bars.end() || it->timestamp != ts) {
            return std::nullopt;
        }
        return *it;
    }

    TimeSeries<Candle> MarketData::history(const std::string& symbol, Timestamp ts) const {
        auto it_series = series_.find(symbol);
        if (it_series == series_.end()) {
            return {};
        }
        const auto& bars = it_series->second;
        auto end = std::upper_bound(bars.begin(), bars.end(), ts,
                                    [](const Timestamp& t, const Candle& c) { return t < c.timestamp; });
        return TimeSeries<Candle>(bars.begin(), end);
    }

    const TimeSeries<Candle>& MarketData::series(const std::string& symbol) const {
        auto it = series_.find(symbol);
        if (it == series_.end()) {
            throw DataLoadException("No market data for symbol: " + symbol);
        }
        return it->second;
    }

} // namespace core
