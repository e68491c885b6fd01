#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "datatypes.hpp"
#include "market_data.hpp"
#include "interfaces.hpp"          // strategy_engine::IStrategy
#include "backtest_config.hpp"
#include "portfolio.hpp"
#include "performance_metrics.hpp"

namespace backtester {

    // Event-driven simulator: one instance per run, single threaded.
    class BacktestEngine {
    public:
        // Throws core::ConfigException for an invalid config
        explicit BacktestEngine(BacktestConfig config = BacktestConfig{});

        // Discards all simulation state and restores the initial capital
        void reset();

        // Appends a PENDING order stamped with the engine clock. Cash is checked
        // at fill time. The reference stays valid until reset().
        // Throws core::OrderValidationException for a structurally invalid order.
        core::Order& placeOrder(const std::string& symbol,
                                core::OrderSide side,
                                double quantity,
                                core::OrderType order_type = core::OrderType::Market,
                                std::optional<double> limit_price = std::nullopt,
                                std::optional<double> stop_price = std::nullopt);
        core::Order& placeOrder(const core::OrderRequest& request);

        // Tries to fill a PENDING order at `current_price`. Returns true only
        // on a fill; an untriggered order stays PENDING, an unaffordable BUY or
        // a SELL with nothing held becomes REJECTED.
        bool executeOrder(core::Order& order, double current_price);

        // PENDING -> CANCELLED; false for any other status
        bool cancelOrder(core::Order& order);

        void updatePositions(const std::map<std::string, double>& prices);

        // Walks every timestamp of `data` in order, trading `symbols` with `strategy`.
        // Throws core::BacktestException when the strategy itself throws.
        BacktestMetrics runBacktest(const strategy_engine::IStrategy& strategy,
                                    const core::MarketData& data,
                                    const std::vector<std::string>& symbols);

        BacktestMetrics calculateMetrics() const;

        // Writes trades.csv, portfolio_history.csv and metrics.json into output_dir
        void exportResults(const std::string& output_dir) const;

        // --- Getters ---
        double getPortfolioValue() const { return portfolio_.getPortfolioValue(); }
        double getCash() const { return portfolio_.getCash(); }
        const core::PositionMap& getPositions() const { return portfolio_.getPositions(); }
        const std::deque<core::Order>& getOrders() const { return orders_; }
        const std::vector<core::Trade>& getTrades() const { return portfolio_.getTradeLog(); }
        const std::vector<double>& getEquityCurve() const { return portfolio_.getEquityCurve(); }
        const std::vector<double>& getReturns() const { return portfolio_.getReturns(); }
        const std::vector<core::PortfolioSnapshot>& getPortfolioHistory() const { return portfolio_.getHistory(); }
        std::optional<core::Timestamp> getCurrentTime() const { return current_time_; }
        const BacktestConfig& getConfig() const { return config_; }
        const Portfolio& getPortfolio() const { return portfolio_; }

    private:
        BacktestConfig config_;
        Portfolio portfolio_;
        std::deque<core::Order> orders_; // All orders ever placed, in placement order
        std::uint64_t next_order_id_ = 1;
        std::optional<core::Timestamp> current_time_;

        // --- Private Helper Methods ---
        // Fill reference price if the order's trigger condition holds at current_price
        std::optional<double> triggerPrice(core::Order& order, double current_price) const;
        void executePendingOrders(const std::map<std::string, double>& current_prices);
        core::Timestamp clock() const { return current_time_.value_or(core::Timestamp{}); }
    };

} // namespace backtester
