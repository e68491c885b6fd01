#include "momentum_strategy.hpp"
#include "rsi_indicator.hpp"
#include "logging.hpp"
#include <stdexcept>

namespace strategy_engine {

MomentumStrategy::MomentumStrategy(MomentumParams params, std::string name)
    : params_(params), name_(std::move(name))
{
    if (params_.rsi_period < 2) {
        throw std::invalid_argument("RSI period must be at least 2.");
    }
    if (params_.oversold < 0.0 || params_.overbought > 100.0 || params_.oversold >= params_.overbought) {
        throw std::invalid_argument("RSI thresholds must satisfy 0 <= oversold < overbought <= 100.");
    }
    if (params_.position_size <= 0.0 || params_.position_size > 1.0) {
        throw std::invalid_argument("Position size must be in (0, 1].");
    }
}

std::vector<core::OrderRequest> MomentumStrategy::generateSignals(
    const core::MarketData& data,
    core::Timestamp timestamp,
    const core::PositionMap& positions,
    double cash) const
{
    std::vector<core::OrderRequest> signals;

    for (const std::string& symbol : data.symbols()) {
        auto history = data.history(symbol, timestamp);

        indicators::RsiIndicator rsi_indicator(params_.rsi_period);
        // Two RSI readings are needed to detect a crossing
        if (history.size() < static_cast<size_t>(rsi_indicator.getLookback()) + 2) {
            continue;
        }
        rsi_indicator.calculate(history);
        const auto& rsi = rsi_indicator.getResult();
        if (rsi.size() < 2) {
            continue;
        }

        double current_rsi = rsi.back();
        double prev_rsi = rsi[rsi.size() - 2];
        double current_price = history.back().close;
        bool held = isHeld(positions, symbol);

        if (!held && prev_rsi <= params_.oversold && current_rsi > params_.oversold) {
            double quantity = (cash * params_.position_size) / current_price;
            if (quantity > 0.0) {
                core::logging::getLogger()->debug("{}: RSI on {} left oversold ({:.2f} -> {:.2f})",
                                                  name_, symbol, prev_rsi, current_rsi);
                signals.emplace_back(symbol, core::OrderSide::Buy, quantity);
            }
        } else if (held && prev_rsi >= params_.overbought && current_rsi < params_.overbought) {
            core::logging::getLogger()->debug("{}: RSI on {} left overbought ({:.2f} -> {:.2f})",
                                              name_, symbol, prev_rsi, current_rsi);
            signals.emplace_back(symbol, core::OrderSide::Sell, heldQuantity(positions, symbol));
        }
    }

    return signals;
}

} // namespace strategy_engine
