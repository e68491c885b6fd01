#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>

#include "datatypes.hpp" // core::Position, core::Trade, core::PortfolioSnapshot

namespace backtester {

    // Cash, open positions and the recorded history of one simulation.
    // Owned by a single engine instance; nothing here is shared or static.
    class Portfolio {
    public:
        explicit Portfolio(double initial_capital);

        // Back to initial capital with no positions, trades or history
        void reset();

        // --- Getters ---
        double getInitialCapital() const { return initial_capital_; }
        double getCash() const;
        const core::PositionMap& getPositions() const { return positions_; }
        std::optional<core::Position> getPosition(const std::string& symbol) const;
        double getPositionQuantity(const std::string& symbol) const;
        // cash + sum(quantity * current_price)
        double getPortfolioValue() const;
        const std::vector<core::Trade>& getTradeLog() const;
        const std::vector<double>& getEquityCurve() const { return equity_curve_; }
        const std::vector<double>& getReturns() const { return returns_; }
        const std::vector<core::PortfolioSnapshot>& getHistory() const { return history_; }

        // --- Modifiers ---
        bool canAfford(double quantity, double price, double commission) const;

        // Opens or averages into a position and deducts cost plus commission.
        // Affordability is the caller's check.
        void applyBuyFill(core::Timestamp timestamp,
                          const std::string& symbol,
                          double quantity,
                          double price,
                          double commission);

        // Closes `quantity` (<= held) of an open position and records the Trade.
        // Throws std::logic_error when the symbol is not held.
        const core::Trade& applySellFill(core::Timestamp timestamp,
                                         const std::string& symbol,
                                         double quantity,
                                         double price,
                                         double commission);

        // Sets current_price / unrealized_pnl for positions with a new price
        void markToMarket(const std::map<std::string, double>& prices);

        // Appends the current value to the equity curve, the step return and a snapshot
        void recordTimestampValue(core::Timestamp timestamp);

    private:
        double initial_capital_;
        double cash_;
        core::PositionMap positions_;
        std::vector<core::Trade> trade_log_;
        std::vector<double> equity_curve_;
        std::vector<double> returns_;
        std::vector<core::PortfolioSnapshot> history_;
    };

} // namespace backtester
