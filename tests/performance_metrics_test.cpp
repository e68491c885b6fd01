#include "performance_metrics.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <deque>
#include <vector>

using backtester::MetricsCalculator;

namespace {

    core::Trade tradeWithPnl(double pnl) {
        core::Trade trade;
        trade.symbol = "X";
        trade.pnl = pnl;
        return trade;
    }

    core::Order orderWithCommission(core::OrderStatus status, double commission) {
        core::Order order;
        order.status = status;
        order.commission = commission;
        return order;
    }

} // namespace

TEST(MetricsCalculatorTest, SampleStdDevUsesBesselCorrection) {
    EXPECT_DOUBLE_EQ(MetricsCalculator::sampleStdDev({}), 0.0);
    EXPECT_DOUBLE_EQ(MetricsCalculator::sampleStdDev({0.5}), 0.0);
    // Population std of this set is 2; sample std is sqrt(32 / 7)
    EXPECT_NEAR(MetricsCalculator::sampleStdDev({2, 4, 4, 4, 5, 5, 7, 9}), std::sqrt(32.0 / 7.0), 1e-12);
}

TEST(MetricsCalculatorTest, MaxDrawdownTracksRunningPeak) {
    EXPECT_DOUBLE_EQ(MetricsCalculator::maxDrawdown({}), 0.0);
    EXPECT_DOUBLE_EQ(MetricsCalculator::maxDrawdown({100, 110, 120}), 0.0);
    EXPECT_NEAR(MetricsCalculator::maxDrawdown({100, 120, 90, 110, 60, 130}), -0.5, 1e-12);
    // Initial decline counts against the first value
    EXPECT_NEAR(MetricsCalculator::maxDrawdown({100, 80}), -0.2, 1e-12);
}

TEST(MetricsCalculatorTest, NoReturnsGivesZeroedRiskMetrics) {
    auto metrics = MetricsCalculator::calculate(1000.0, 1000.0, 0.02, {}, {}, {}, {});
    EXPECT_DOUBLE_EQ(metrics.total_return, 0.0);
    EXPECT_DOUBLE_EQ(metrics.annual_return, 0.0);
    EXPECT_DOUBLE_EQ(metrics.annual_volatility, 0.0);
    EXPECT_DOUBLE_EQ(metrics.sharpe_ratio, 0.0);
    EXPECT_DOUBLE_EQ(metrics.max_drawdown, 0.0);
    EXPECT_EQ(metrics.total_trades, 0);
    EXPECT_DOUBLE_EQ(metrics.win_rate, 0.0);
}

TEST(MetricsCalculatorTest, ConstantReturnsHaveNoSharpe) {
    std::vector<double> returns(10, 0.125);
    auto metrics = MetricsCalculator::calculate(1000.0, 1000.0 * std::pow(1.125, 10), 0.0, {}, returns, {}, {});
    EXPECT_DOUBLE_EQ(metrics.annual_volatility, 0.0);
    EXPECT_DOUBLE_EQ(metrics.sharpe_ratio, 0.0);
}

TEST(MetricsCalculatorTest, AnnualisesOverTradingDays) {
    std::vector<double> equity{100.0, 102.0, 101.0, 104.0};
    std::vector<double> returns{0.02, 101.0 / 102.0 - 1.0, 104.0 / 101.0 - 1.0};
    auto metrics = MetricsCalculator::calculate(100.0, 104.0, 0.02, equity, returns, {}, {});

    EXPECT_NEAR(metrics.total_return, 0.04, 1e-12);
    EXPECT_NEAR(metrics.annual_return, std::pow(1.04, 252.0 / 3.0) - 1.0, 1e-6);

    double sd = MetricsCalculator::sampleStdDev(returns);
    EXPECT_NEAR(metrics.annual_volatility, sd * std::sqrt(252.0), 1e-12);
    double expected_sharpe = (MetricsCalculator::mean(returns) - 0.02 / 252.0) / sd * std::sqrt(252.0);
    EXPECT_NEAR(metrics.sharpe_ratio, expected_sharpe, 1e-9);
    EXPECT_NEAR(metrics.max_drawdown, 101.0 / 102.0 - 1.0, 1e-12);
}

TEST(MetricsCalculatorTest, TotalLossClampsAnnualReturn) {
    std::vector<double> returns{-0.5, -1.0};
    auto metrics = MetricsCalculator::calculate(100.0, 0.0, 0.0, {100.0, 50.0, 0.0}, returns, {}, {});
    EXPECT_DOUBLE_EQ(metrics.total_return, -1.0);
    EXPECT_DOUBLE_EQ(metrics.annual_return, -1.0);
    EXPECT_TRUE(std::isfinite(metrics.sharpe_ratio));
    EXPECT_DOUBLE_EQ(metrics.max_drawdown, -1.0);
}

TEST(MetricsCalculatorTest, TradeStatistics) {
    std::vector<core::Trade> trades{tradeWithPnl(30.0), tradeWithPnl(-10.0), tradeWithPnl(10.0), tradeWithPnl(0.0)};
    auto metrics = MetricsCalculator::calculate(1000.0, 1030.0, 0.0, {}, {}, trades, {});

    EXPECT_EQ(metrics.total_trades, 4);
    EXPECT_EQ(metrics.winning_trades, 2);
    EXPECT_EQ(metrics.losing_trades, 2); // Break-even counts as a loss
    EXPECT_DOUBLE_EQ(metrics.win_rate, 0.5);
    EXPECT_DOUBLE_EQ(metrics.avg_win, 20.0);
    EXPECT_DOUBLE_EQ(metrics.avg_loss, -5.0);
    EXPECT_DOUBLE_EQ(metrics.profit_factor, 4.0);
}

TEST(MetricsCalculatorTest, ProfitFactorZeroWithoutLosses) {
    auto metrics = MetricsCalculator::calculate(1000.0, 1050.0, 0.0, {}, {}, {tradeWithPnl(50.0)}, {});
    EXPECT_DOUBLE_EQ(metrics.profit_factor, 0.0);
    EXPECT_DOUBLE_EQ(metrics.avg_loss, 0.0);
    EXPECT_DOUBLE_EQ(metrics.win_rate, 1.0);

    // A lone break-even trade is a loss of size zero
    auto flat = MetricsCalculator::calculate(1000.0, 1000.0, 0.0, {}, {}, {tradeWithPnl(0.0)}, {});
    EXPECT_EQ(flat.losing_trades, 1);
    EXPECT_DOUBLE_EQ(flat.profit_factor, 0.0);
}

TEST(MetricsCalculatorTest, CommissionCountsFilledOrdersOnly) {
    std::deque<core::Order> orders{
        orderWithCommission(core::OrderStatus::Filled, 1.5),
        orderWithCommission(core::OrderStatus::Rejected, 9.0),
        orderWithCommission(core::OrderStatus::Filled, 2.5),
        orderWithCommission(core::OrderStatus::Pending, 4.0),
    };
    auto metrics = MetricsCalculator::calculate(1000.0, 1000.0, 0.0, {}, {}, {}, orders);
    EXPECT_DOUBLE_EQ(metrics.total_commission, 4.0);
}

TEST(BacktestMetricsTest, JsonCarriesEveryField) {
    backtester::BacktestMetrics metrics;
    metrics.final_value = 123.0;
    metrics.total_trades = 7;
    auto j = metrics.toJson();

    EXPECT_EQ(j.size(), 15u);
    EXPECT_DOUBLE_EQ(j.at("final_value").get<double>(), 123.0);
    EXPECT_EQ(j.at("total_trades").get<int>(), 7);
    for (const char* key : {"initial_value", "total_return", "annual_return", "annual_volatility",
                            "sharpe_ratio", "max_drawdown", "winning_trades", "losing_trades",
                            "win_rate", "avg_win", "avg_loss", "profit_factor", "total_commission"}) {
        EXPECT_TRUE(j.contains(key)) << key;
    }
}
