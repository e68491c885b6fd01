#include "mean_reversion_strategy.hpp"
#include "bollinger_bands_indicator.hpp"
#include "logging.hpp"
#include <stdexcept>

namespace strategy_engine {

MeanReversionStrategy::MeanReversionStrategy(MeanReversionParams params, std::string name)
    : params_(params), name_(std::move(name))
{
    if (params_.period < 2) {
        throw std::invalid_argument("Mean reversion period must be at least 2.");
    }
    if (params_.num_std <= 0.0) {
        throw std::invalid_argument("Band width (num_std) must be positive.");
    }
    if (params_.position_size <= 0.0 || params_.position_size > 1.0) {
        throw std::invalid_argument("Position size must be in (0, 1].");
    }
    if (params_.stop_loss_pct <= 0.0) {
        throw std::invalid_argument("Stop loss percentage must be positive.");
    }
}

std::vector<core::OrderRequest> MeanReversionStrategy::generateSignals(
    const core::MarketData& data,
    core::Timestamp timestamp,
    const core::PositionMap& positions,
    double cash) const
{
    std::vector<core::OrderRequest> signals;

    for (const std::string& symbol : data.symbols()) {
        auto history = data.history(symbol, timestamp);
        if (history.size() < static_cast<size_t>(params_.period)) {
            continue;
        }

        indicators::BollingerBandsIndicator bands(params_.period, params_.num_std);
        bands.calculate(history);
        if (bands.getLowerBand().empty()) {
            continue;
        }

        double current_price = history.back().close;
        double upper = bands.getUpperBand().back();
        double lower = bands.getLowerBand().back();

        bool held = isHeld(positions, symbol);

        if (!held && current_price <= lower) {
            double quantity = (cash * params_.position_size) / current_price;
            if (quantity > 0.0) {
                core::logging::getLogger()->debug("{}: {} touched lower band ({:.4f} <= {:.4f})",
                                                  name_, symbol, current_price, lower);
                signals.emplace_back(symbol, core::OrderSide::Buy, quantity);
            }
        } else if (held) {
            const core::Position& pos = positions.at(symbol);
            double pnl_pct = (pos.entry_price > 0.0) ? (current_price / pos.entry_price) - 1.0 : 0.0;
            if (current_price >= upper || pnl_pct <= -params_.stop_loss_pct) {
                core::logging::getLogger()->debug("{}: exit {} (price {:.4f}, upper {:.4f}, pnl {:.2f}%)",
                                                  name_, symbol, current_price, upper, pnl_pct * 100.0);
                signals.emplace_back(symbol, core::OrderSide::Sell, pos.quantity);
            }
        }
    }

    return signals;
}

} // namespace strategy_engine
