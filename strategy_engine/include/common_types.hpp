#pragma once
#include "datatypes.hpp"
#include <string>

namespace strategy_engine {

    // --- Strategy parameter sets (defaults match the stock configurations) ---

    struct MovingAverageCrossoverParams {
        int fast_period = 20;
        int slow_period = 50;
        double position_size = 0.1; // Fraction of available cash per entry
    };

    struct MeanReversionParams {
        int period = 20;
        double num_std = 2.0;
        double position_size = 0.1;
        double stop_loss_pct = 0.05;
    };

    struct MomentumParams {
        int rsi_period = 14;
        double oversold = 30.0;
        double overbought = 70.0;
        double position_size = 0.1;
    };

    struct TrendFollowingParams {
        int adx_period = 14;
        double adx_threshold = 25.0;
        int ma_period = 20;
        double position_size = 0.15;
    };

    struct PairsTradingParams {
        std::string symbol1;
        std::string symbol2;
        int lookback_period = 30;
        double entry_threshold = 2.0; // |z| above this opens the spread trade
        double exit_threshold = 0.5;  // |z| below this closes both legs
        double position_size = 0.1;
    };

    // Shared helpers for the concrete strategies
    inline bool isHeld(const core::PositionMap& positions, const std::string& symbol) {
        auto it = positions.find(symbol);
        return it != positions.end() && it->second.quantity > 0.0;
    }

    inline double heldQuantity(const core::PositionMap& positions, const std::string& symbol) {
        auto it = positions.find(symbol);
        return it != positions.end() ? it->second.quantity : 0.0;
    }

} // namespace strategy_engine
