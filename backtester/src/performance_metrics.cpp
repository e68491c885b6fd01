#include "performance_metrics.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace backtester {

    json BacktestMetrics::toJson() const {
        return json{
            {"initial_value", initial_value},
            {"final_value", final_value},
            {"total_return", total_return},
            {"annual_return", annual_return},
            {"annual_volatility", annual_volatility},
            {"sharpe_ratio", sharpe_ratio},
            {"max_drawdown", max_drawdown},
            {"total_trades", total_trades},
            {"winning_trades", winning_trades},
            {"losing_trades", losing_trades},
            {"win_rate", win_rate},
            {"avg_win", avg_win},
            {"avg_loss", avg_loss},
            {"profit_factor", profit_factor},
            {"total_commission", total_commission}
        };
    }

    void BacktestMetrics::logMetrics() const {
        auto logger = core::logging::getLogger();
        logger->info("--- Backtest Metrics ---");
        logger->info("Initial Value: {:.2f}", initial_value);
        logger->info("Final Value: {:.2f}", final_value);
        logger->info("Total Return: {:.2f}%", total_return * 100.0);
        logger->info("Annual Return: {:.2f}%", annual_return * 100.0);
        logger->info("Annual Volatility: {:.2f}%", annual_volatility * 100.0);
        logger->info("Sharpe Ratio: {:.2f}", sharpe_ratio);
        logger->info("Max Drawdown: {:.2f}%", max_drawdown * 100.0);
        logger->info("Total Trades: {} (Won: {}, Lost: {})", total_trades, winning_trades, losing_trades);
        logger->info("Win Rate: {:.2f}%", win_rate * 100.0);
        logger->info("Avg Win PnL: {:.2f}", avg_win);
        logger->info("Avg Loss PnL: {:.2f}", avg_loss);
        logger->info("Profit Factor: {:.2f}", profit_factor);
        logger->info("Total Commission: {:.2f}", total_commission);
        logger->info("------------------------");
    }

    double MetricsCalculator::mean(const std::vector<double>& values) {
        if (values.empty()) return 0.0;
        return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
    }

    double MetricsCalculator::sampleStdDev(const std::vector<double>& values) {
        if (values.size() < 2) return 0.0;
        double m = mean(values);
        double sq_sum = 0.0;
        for (double v : values) {
            sq_sum += (v - m) * (v - m);
        }
        return std::sqrt(sq_sum / static_cast<double>(values.size() - 1));
    }

    double MetricsCalculator::maxDrawdown(const std::vector<double>& equity_curve) {
        if (equity_curve.empty()) return 0.0;
        double peak = equity_curve.front();
        double max_drawdown = 0.0;
        for (double equity : equity_curve) {
            peak = std::max(peak, equity);
            if (peak > 0.0) {
                max_drawdown = std::min(max_drawdown, (equity - peak) / peak);
            }
        }
        return max_drawdown;
    }

    BacktestMetrics MetricsCalculator::calculate(double initial_capital,
                                                 double final_value,
                                                 double risk_free_rate,
                                                 const std::vector<double>& equity_curve,
                                                 const std::vector<double>& returns,
                                                 const std::vector<core::Trade>& trades,
                                                 const std::deque<core::Order>& orders)
    {
        BacktestMetrics metrics;
        metrics.initial_value = initial_capital;
        metrics.final_value = final_value;

        // --- Returns ---
        metrics.total_return = (initial_capital > 0.0) ? final_value / initial_capital - 1.0 : 0.0;

        const auto n_days = returns.size();
        if (n_days > 0) {
            if (metrics.total_return <= -1.0) {
                metrics.annual_return = -1.0;
            } else {
                metrics.annual_return = std::pow(1.0 + metrics.total_return,
                                                 kTradingDaysPerYear / static_cast<double>(n_days)) - 1.0;
            }
        }

        // --- Volatility and Sharpe ---
        const double std_dev = sampleStdDev(returns);
        metrics.annual_volatility = std_dev * std::sqrt(kTradingDaysPerYear);
        if (!returns.empty() && std_dev > 0.0) {
            double excess_mean = mean(returns) - risk_free_rate / kTradingDaysPerYear;
            metrics.sharpe_ratio = excess_mean / std_dev * std::sqrt(kTradingDaysPerYear);
        }

        metrics.max_drawdown = maxDrawdown(equity_curve);

        // --- Trade-Based Metrics ---
        metrics.total_trades = static_cast<int>(trades.size());
        double gross_profit = 0.0;
        double gross_loss = 0.0;
        for (const auto& trade : trades) {
            if (trade.pnl > 0.0) {
                metrics.winning_trades++;
                gross_profit += trade.pnl;
            } else {
                metrics.losing_trades++;
                gross_loss += trade.pnl;
            }
        }

        if (metrics.total_trades > 0) {
            metrics.win_rate = static_cast<double>(metrics.winning_trades) / metrics.total_trades;
        }
        metrics.avg_win = (metrics.winning_trades > 0) ? gross_profit / metrics.winning_trades : 0.0;
        metrics.avg_loss = (metrics.losing_trades > 0) ? gross_loss / metrics.losing_trades : 0.0;
        if (metrics.losing_trades > 0 && gross_loss != 0.0) {
            metrics.profit_factor = std::abs(gross_profit / gross_loss);
        }

        for (const auto& order : orders) {
            if (order.status == core::OrderStatus::Filled) {
                metrics.total_commission += order.commission;
            }
        }

        return metrics;
    }

} // namespace backtester
