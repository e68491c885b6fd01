#pragma once

#include <string>
#include <vector>

#include "datatypes.hpp"
#include "market_data.hpp"
#include "backtest_config.hpp"

namespace test_helpers {

    // Midnight UTC, `n` days after 2023-01-02
    core::Timestamp day(int n);

    // Bar on day(n) with open = close, high = close + 1, low = close - 1
    core::Candle bar(int n, double close);

    // One bar per close, starting at day(0)
    core::TimeSeries<core::Candle> series(const std::vector<double>& closes);

    void addCloses(core::MarketData& data, const std::string& symbol, const std::vector<double>& closes);
    core::MarketData marketFromCloses(const std::string& symbol, const std::vector<double>& closes);

    // No commission, no slippage, no risk-free rate
    backtester::BacktestConfig frictionlessConfig(double initial_capital);

    // Fresh directory under the system temp dir, removed first if present
    std::string scratchDir(const std::string& name);

} // namespace test_helpers
