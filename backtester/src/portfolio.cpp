#include "portfolio.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <stdexcept> // For invalid_argument
#include <cmath>

namespace backtester {

    Portfolio::Portfolio(double initial_capital)
        : initial_capital_(initial_capital), cash_(initial_capital) {
        if (!std::isfinite(initial_capital) || initial_capital <= 0) {
            throw std::invalid_argument("Initial capital must be positive.");
        }
    }

    void Portfolio::reset() {
        cash_ = initial_capital_;
        positions_.clear();
        trade_log_.clear();
        equity_curve_.clear();
        returns_.clear();
        history_.clear();
    }

    double Portfolio::getCash() const {
        return cash_;
    }

    std::optional<core::Position> Portfolio::getPosition(const std::string& symbol) const {
        auto it = positions_.find(symbol);
        if (it == positions_.end()) return std::nullopt;
        return it->second;
    }

    double Portfolio::getPositionQuantity(const std::string& symbol) const {
        auto it = positions_.find(symbol);
        return (it != positions_.end()) ? it->second.quantity : 0.0;
    }

    double Portfolio::getPortfolioValue() const {
        double total_position_value = 0.0;
        for (const auto& pair : positions_) {
            total_position_value += pair.second.marketValue();
        }
        return cash_ + total_position_value;
    }

    const std::vector<core::Trade>& Portfolio::getTradeLog() const {
        return trade_log_;
    }

    bool Portfolio::canAfford(double quantity, double price, double commission) const {
        return quantity * price + commission <= cash_;
    }

    void Portfolio::applyBuyFill(core::Timestamp timestamp,
                                 const std::string& symbol,
                                 double quantity,
                                 double price,
                                 double commission)
    {
        auto logger = core::logging::getLogger();

        auto it = positions_.find(symbol);
        if (it == positions_.end()) {
            core::Position position;
            position.symbol = symbol;
            position.quantity = quantity;
            position.entry_price = price;
            position.current_price = price;
            position.entry_time = timestamp;
            positions_.emplace(symbol, position);
            logger->debug("Opened position {}: Qty={}, Price={:.2f}", symbol, quantity, price);
        } else {
            core::Position& position = it->second;
            double total_quantity = position.quantity + quantity;
            position.entry_price = (position.quantity * position.entry_price + quantity * price) / total_quantity;
            position.quantity = total_quantity;
            position.unrealized_pnl = (position.current_price - position.entry_price) * position.quantity;
            logger->debug("Added to position {}: Qty={}, AvgPrice={:.2f}", symbol, position.quantity, position.entry_price);
        }

        double cost = quantity * price + commission;
        cash_ -= cost;

        logger->info("Trade Executed: Time={}, Sym={}, Side=BUY, Qty={}, Price={:.2f}, Comm={:.2f}, Cost={:.2f}, NewCash={:.2f}, NewPosQty={}",
                     core::utils::timestampToString(timestamp),
                     symbol,
                     quantity,
                     price,
                     commission,
                     cost,
                     cash_,
                     getPositionQuantity(symbol));
    }

    const core::Trade& Portfolio::applySellFill(core::Timestamp timestamp,
                                                const std::string& symbol,
                                                double quantity,
                                                double price,
                                                double commission)
    {
        auto logger = core::logging::getLogger();

        auto it = positions_.find(symbol);
        if (it == positions_.end()) {
            throw std::logic_error("applySellFill called for " + symbol + " without an open position.");
        }
        core::Position& position = it->second;

        double pnl = (price - position.entry_price) * quantity - commission;

        core::Trade trade;
        trade.symbol = symbol;
        trade.side = core::OrderSide::Sell;
        trade.entry_time = position.entry_time;
        trade.exit_time = timestamp;
        trade.entry_price = position.entry_price;
        trade.exit_price = price;
        trade.quantity = quantity;
        trade.pnl = pnl;
        trade.pnl_percent = (position.entry_price != 0.0) ? (price / position.entry_price - 1.0) * 100.0 : 0.0;
        trade.commission = commission;
        trade.duration = timestamp - position.entry_time;
        trade_log_.push_back(trade);

        position.quantity -= quantity;
        position.realized_pnl += pnl;
        position.unrealized_pnl = (position.current_price - position.entry_price) * position.quantity;

        double proceeds = quantity * price - commission;
        cash_ += proceeds;

        logger->info("Trade Executed: Time={}, Sym={}, Side=SELL, Qty={}, Price={:.2f}, Comm={:.2f}, Proceeds={:.2f}, NewCash={:.2f}, NewPosQty={}",
                     core::utils::timestampToString(timestamp),
                     symbol,
                     quantity,
                     price,
                     commission,
                     proceeds,
                     cash_,
                     position.quantity);
        logger->debug("Round Trip Trade Logged: PnL = {:.2f}", pnl);

        // Remove instrument once flat
        if (position.quantity <= 0.0) {
            positions_.erase(it);
        }
        return trade_log_.back();
    }

    void Portfolio::markToMarket(const std::map<std::string, double>& prices) {
        for (auto& pair : positions_) {
            auto price_it = prices.find(pair.first);
            if (price_it == prices.end()) continue;
            core::Position& position = pair.second;
            position.current_price = price_it->second;
            position.unrealized_pnl = (position.current_price - position.entry_price) * position.quantity;
        }
    }

    void Portfolio::recordTimestampValue(core::Timestamp timestamp) {
        double value = getPortfolioValue();
        if (!equity_curve_.empty()) {
            double previous = equity_curve_.back();
            returns_.push_back(previous != 0.0 ? value / previous - 1.0 : 0.0);
        }
        equity_curve_.push_back(value);

        core::PortfolioSnapshot snapshot;
        snapshot.timestamp = timestamp;
        snapshot.cash = cash_;
        snapshot.portfolio_value = value;
        snapshot.positions = positions_.size();
        snapshot.num_trades = trade_log_.size();
        history_.push_back(snapshot);
    }

} // namespace backtester
