#pragma once

#include <deque>
#include <vector>
#include <nlohmann/json.hpp>

#include "datatypes.hpp"

namespace backtester {

    using json = nlohmann::json;

    // --- Backtest Metrics Struct ---
    struct BacktestMetrics {
        double initial_value = 0.0;
        double final_value = 0.0;
        double total_return = 0.0;      // Fractions, not percent
        double annual_return = 0.0;
        double annual_volatility = 0.0;
        double sharpe_ratio = 0.0;
        double max_drawdown = 0.0;      // <= 0
        int total_trades = 0;
        int winning_trades = 0;
        int losing_trades = 0;
        double win_rate = 0.0;
        double avg_win = 0.0;
        double avg_loss = 0.0;
        double profit_factor = 0.0;
        double total_commission = 0.0;

        json toJson() const;

        // Helper method to log calculated metrics
        void logMetrics() const;
    };

    constexpr double kTradingDaysPerYear = 252.0;

    class MetricsCalculator {
    public:
        // Reduces a finished run to its metrics. Degenerate inputs (no returns,
        // zero variance, no trades, no losing trades) give 0 for the dependent value.
        static BacktestMetrics calculate(double initial_capital,
                                         double final_value,
                                         double risk_free_rate,
                                         const std::vector<double>& equity_curve,
                                         const std::vector<double>& returns,
                                         const std::vector<core::Trade>& trades,
                                         const std::deque<core::Order>& orders);

        static double mean(const std::vector<double>& values);
        // Sample standard deviation (n - 1); 0 for fewer than two values
        static double sampleStdDev(const std::vector<double>& values);
        // Most negative (equity - running peak) / running peak; 0 for an empty curve
        static double maxDrawdown(const std::vector<double>& equity_curve);
    };

} // namespace backtester
