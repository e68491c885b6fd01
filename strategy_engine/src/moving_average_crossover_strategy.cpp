#include "moving_average_crossover_strategy.hpp"
#include "sma_indicator.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <stdexcept>

namespace strategy_engine {

MovingAverageCrossoverStrategy::MovingAverageCrossoverStrategy(MovingAverageCrossoverParams params,
                                                               std::string name)
    : params_(params), name_(std::move(name))
{
    if (params_.fast_period <= 0 || params_.slow_period <= 0) {
        throw std::invalid_argument("Moving average periods must be positive.");
    }
    if (params_.fast_period >= params_.slow_period) {
        throw std::invalid_argument("Fast period must be shorter than slow period.");
    }
    if (params_.position_size <= 0.0 || params_.position_size > 1.0) {
        throw std::invalid_argument("Position size must be in (0, 1].");
    }
    core::logging::getLogger()->debug("Strategy '{}' created: fast={}, slow={}, size={}",
                                      name_, params_.fast_period, params_.slow_period, params_.position_size);
}

std::vector<core::OrderRequest> MovingAverageCrossoverStrategy::generateSignals(
    const core::MarketData& data,
    core::Timestamp timestamp,
    const core::PositionMap& positions,
    double cash) const
{
    auto logger = core::logging::getLogger();
    std::vector<core::OrderRequest> signals;

    for (const std::string& symbol : data.symbols()) {
        auto history = data.history(symbol, timestamp);

        indicators::SmaIndicator fast(params_.fast_period);
        indicators::SmaIndicator slow(params_.slow_period);

        // A cross needs the slow average at this bar and the one before it
        if (history.size() < static_cast<size_t>(slow.getLookback()) + 2) {
            continue;
        }

        fast.calculate(history);
        slow.calculate(history);
        const auto& fast_ma = fast.getResult();
        const auto& slow_ma = slow.getResult();
        if (fast_ma.size() < 2 || slow_ma.size() < 2) {
            continue;
        }

        double current_fast = fast_ma.back();
        double current_slow = slow_ma.back();
        double prev_fast = fast_ma[fast_ma.size() - 2];
        double prev_slow = slow_ma[slow_ma.size() - 2];
        double current_price = history.back().close;

        bool bullish_cross = (prev_fast <= prev_slow) && (current_fast > current_slow);
        bool bearish_cross = (prev_fast >= prev_slow) && (current_fast < current_slow);

        if (bullish_cross && !isHeld(positions, symbol)) {
            double quantity = (cash * params_.position_size) / current_price;
            if (quantity > 0.0) {
                logger->debug("{}: bullish cross on {} at {} ({:.4f} > {:.4f})", name_, symbol,
                              core::utils::timestampToString(timestamp), current_fast, current_slow);
                signals.emplace_back(symbol, core::OrderSide::Buy, quantity);
            }
        } else if (bearish_cross && isHeld(positions, symbol)) {
            logger->debug("{}: bearish cross on {} at {}", name_, symbol, core::utils::timestampToString(timestamp));
            signals.emplace_back(symbol, core::OrderSide::Sell, heldQuantity(positions, symbol));
        }
    }

    return signals;
}

} // namespace strategy_engine
