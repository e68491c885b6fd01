#include "backtest_engine.hpp"
#include "results_writer.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "exceptions.hpp"

#include <algorithm>
#include <cmath>
#include <utility>
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h> // fmt::join

namespace backtester {

    namespace {

        BacktestConfig validated(BacktestConfig config) {
            config.validate();
            return config;
        }

    } // end anonymous namespace

    BacktestEngine::BacktestEngine(BacktestConfig config)
        : config_(validated(std::move(config))), portfolio_(config_.initial_capital)
    {
        core::logging::getLogger()->debug("BacktestEngine initialized with capital: {}", config_.initial_capital);
    }

    void BacktestEngine::reset() {
        portfolio_.reset();
        orders_.clear();
        next_order_id_ = 1;
        current_time_.reset();
    }

    core::Order& BacktestEngine::placeOrder(const std::string& symbol,
                                            core::OrderSide side,
                                            double quantity,
                                            core::OrderType order_type,
                                            std::optional<double> limit_price,
                                            std::optional<double> stop_price)
    {
        return placeOrder(core::OrderRequest(symbol, side, quantity, order_type, limit_price, stop_price));
    }

    core::Order& BacktestEngine::placeOrder(const core::OrderRequest& request) {
        core::Order order;
        order.id = next_order_id_++;
        order.symbol = request.symbol;
        order.side = request.side;
        order.order_type = request.order_type;
        order.quantity = request.quantity;
        order.limit_price = request.limit_price;
        order.stop_price = request.stop_price;
        order.timestamp = clock();
        order.status = core::OrderStatus::Pending;
        orders_.push_back(order);

        core::logging::getLogger()->debug("Order #{} placed: {} {} {} x {}",
                                          order.id,
                                          core::utils::toString(order.order_type),
                                          core::utils::toString(order.side),
                                          order.symbol,
                                          order.quantity);
        return orders_.back();
    }

    std::optional<double> BacktestEngine::triggerPrice(core::Order& order, double current_price) const {
        const bool is_buy = order.side == core::OrderSide::Buy;
        switch (order.order_type) {
            case core::OrderType::Market:
                return current_price;

            case core::OrderType::Limit: {
                double limit = *order.limit_price;
                bool hit = is_buy ? current_price <= limit : current_price >= limit;
                if (hit) return limit;
                return std::nullopt;
            }

            case core::OrderType::Stop: {
                double stop = *order.stop_price;
                bool hit = is_buy ? current_price >= stop : current_price <= stop;
                if (hit) return current_price;
                return std::nullopt;
            }

            case core::OrderType::StopLimit: {
                if (!order.stop_triggered) {
                    double stop = *order.stop_price;
                    order.stop_triggered = is_buy ? current_price >= stop : current_price <= stop;
                    if (order.stop_triggered) {
                        core::logging::getLogger()->debug("Order #{} stop armed at {:.2f}", order.id, current_price);
                    }
                }
                if (!order.stop_triggered) return std::nullopt;
                double limit = *order.limit_price;
                bool hit = is_buy ? current_price <= limit : current_price >= limit;
                if (hit) return limit;
                return std::nullopt;
            }
        }
        return std::nullopt;
    }

    bool BacktestEngine::executeOrder(core::Order& order, double current_price) {
        auto logger = core::logging::getLogger();

        if (!order.isPending()) {
            logger->debug("Order #{} is {}, not executing.", order.id, core::utils::toString(order.status));
            return false;
        }
        if (!std::isfinite(current_price) || current_price <= 0.0) {
            logger->warn("Order #{}: invalid price {} for {}, skipping.", order.id, current_price, order.symbol);
            return false;
        }

        auto base_price = triggerPrice(order, current_price);
        if (!base_price) {
            return false; // Not triggered yet
        }

        const bool is_buy = order.side == core::OrderSide::Buy;
        double fill_quantity = order.quantity;

        if (!is_buy) {
            double held = portfolio_.getPositionQuantity(order.symbol);
            if (held <= 0.0) {
                logger->warn("Order #{} rejected: no position to sell in {}.", order.id, order.symbol);
                order.status = core::OrderStatus::Rejected;
                return false;
            }
            if (fill_quantity > held) {
                logger->warn("Order #{}: sell quantity {} exceeds held {} in {}, capping.",
                             order.id, fill_quantity, held, order.symbol);
                fill_quantity = held;
            }
        }

        double execution_price = *base_price * (is_buy ? (1.0 + config_.slippage_rate)
                                                       : (1.0 - config_.slippage_rate));
        double commission = execution_price * fill_quantity * config_.commission_rate;

        if (is_buy && !portfolio_.canAfford(fill_quantity, execution_price, commission)) {
            logger->warn("Order #{} rejected: insufficient cash for {} x {} @ {:.2f}. Have: {:.2f}, Need: {:.2f}.",
                         order.id, fill_quantity, order.symbol, execution_price,
                         portfolio_.getCash(), fill_quantity * execution_price + commission);
            order.status = core::OrderStatus::Rejected;
            return false;
        }

        order.status = core::OrderStatus::Filled;
        order.filled_price = execution_price;
        order.filled_quantity = fill_quantity;
        order.commission = commission;
        order.slippage = std::abs(execution_price - current_price);

        if (is_buy) {
            portfolio_.applyBuyFill(clock(), order.symbol, fill_quantity, execution_price, commission);
        } else {
            portfolio_.applySellFill(clock(), order.symbol, fill_quantity, execution_price, commission);
        }
        return true;
    }

    bool BacktestEngine::cancelOrder(core::Order& order) {
        if (!order.isPending()) return false;
        order.status = core::OrderStatus::Cancelled;
        core::logging::getLogger()->debug("Order #{} cancelled.", order.id);
        return true;
    }

    void BacktestEngine::updatePositions(const std::map<std::string, double>& prices) {
        portfolio_.markToMarket(prices);
    }

    void BacktestEngine::executePendingOrders(const std::map<std::string, double>& current_prices) {
        // FIFO over placement order; orders placed later in this step are not reached yet
        for (auto& order : orders_) {
            if (!order.isPending()) continue;
            auto price_it = current_prices.find(order.symbol);
            if (price_it == current_prices.end()) continue;
            executeOrder(order, price_it->second);
        }
    }

    BacktestMetrics BacktestEngine::runBacktest(const strategy_engine::IStrategy& strategy,
                                                const core::MarketData& data,
                                                const std::vector<std::string>& symbols)
    {
        auto logger = core::logging::getLogger();
        const auto timestamps = data.timestamps();

        logger->info("========================================================");
        logger->info("Starting Backtest Run: Strategy '{}'", strategy.getName());
        logger->info("========================================================");
        logger->info("Initial Capital: {:.2f}", config_.initial_capital);
        logger->info("Symbols: {}", fmt::join(symbols, ", "));
        if (!timestamps.empty()) {
            logger->info("Period: {} to {} ({} bars)",
                         core::utils::timestampToString(timestamps.front()),
                         core::utils::timestampToString(timestamps.back()),
                         timestamps.size());
        } else {
            logger->warn("Market data is empty; the backtest has nothing to simulate.");
        }

        reset();

        for (std::size_t i = 0; i < timestamps.size(); ++i) {
            const core::Timestamp timestamp = timestamps[i];
            current_time_ = timestamp;

            // --- 1. Current prices (symbols without a bar here are skipped) ---
            std::map<std::string, double> current_prices;
            for (const auto& symbol : symbols) {
                auto candle = data.candleAt(symbol, timestamp);
                if (candle) {
                    current_prices[symbol] = candle->close;
                }
            }

            // --- 2. Mark to market ---
            updatePositions(current_prices);

            // --- 3. Pending orders ---
            executePendingOrders(current_prices);

            // --- 4. Strategy ---
            std::vector<core::OrderRequest> requests;
            try {
                requests = strategy.generateSignals(data, timestamp, portfolio_.getPositions(), portfolio_.getCash());
            } catch (const std::exception& e) {
                logger->error("Strategy '{}' failed at {}: {}", strategy.getName(),
                              core::utils::timestampToString(timestamp), e.what());
                throw core::BacktestException(fmt::format("Strategy '{}' failed at {}: {}",
                                                          strategy.getName(),
                                                          core::utils::timestampToString(timestamp),
                                                          e.what()));
            }
            for (const auto& request : requests) {
                placeOrder(request);
            }

            // --- 5. Record Portfolio Value for this Timestamp ---
            portfolio_.recordTimestampValue(timestamp);

            if ((i + 1) % static_cast<std::size_t>(config_.progress_log_interval) == 0) {
                logger->info("Progress: {}/{} | Portfolio: {:.2f} | Trades: {}",
                             i + 1, timestamps.size(), portfolio_.getPortfolioValue(), portfolio_.getTradeLog().size());
            }
        }

        BacktestMetrics metrics = calculateMetrics();

        logger->info("========================================================");
        logger->info("Backtest Run Completed for Strategy '{}'", strategy.getName());
        logger->info("========================================================");
        logger->info("Final Portfolio Value: {:.2f}", metrics.final_value);
        logger->info("Total Return: {:.2f}%", metrics.total_return * 100.0);
        logger->info("Sharpe Ratio: {:.2f}", metrics.sharpe_ratio);
        logger->info("Max Drawdown: {:.2f}%", metrics.max_drawdown * 100.0);
        logger->info("Total Trades: {}", metrics.total_trades);

        return metrics;
    }

    BacktestMetrics BacktestEngine::calculateMetrics() const {
        return MetricsCalculator::calculate(config_.initial_capital,
                                            portfolio_.getPortfolioValue(),
                                            config_.risk_free_rate,
                                            portfolio_.getEquityCurve(),
                                            portfolio_.getReturns(),
                                            portfolio_.getTradeLog(),
                                            orders_);
    }

    void BacktestEngine::exportResults(const std::string& output_dir) const {
        ResultsWriter writer(output_dir);
        writer.writeTrades(getTrades());
        writer.writePortfolioHistory(getPortfolioHistory());
        writer.writeMetrics(calculateMetrics());
        core::logging::getLogger()->info("Results exported to {}", writer.getOutputDir());
    }

} // namespace backtester
