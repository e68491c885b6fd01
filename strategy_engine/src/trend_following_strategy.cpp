#include "trend_following_strategy.hpp"
#include "adx_indicator.hpp"
#include "sma_indicator.hpp"
#include "logging.hpp"
#include <optional>
#include <string>
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace strategy_engine {

TrendFollowingStrategy::TrendFollowingStrategy(TrendFollowingParams params, std::string name)
    : params_(params), name_(std::move(name))
{
    if (params_.adx_period < 2) {
        throw std::invalid_argument("ADX period must be at least 2.");
    }
    if (params_.ma_period <= 0) {
        throw std::invalid_argument("Moving average period must be positive.");
    }
    if (params_.adx_threshold < 0.0 || params_.adx_threshold > 100.0) {
        throw std::invalid_argument("ADX threshold must be within [0, 100].");
    }
    if (params_.position_size <= 0.0 || params_.position_size > 1.0) {
        throw std::invalid_argument("Position size must be in (0, 1].");
    }
}

std::vector<core::OrderRequest> TrendFollowingStrategy::generateSignals(
    const core::MarketData& data,
    core::Timestamp timestamp,
    const core::PositionMap& positions,
    double cash) const
{
    auto logger = core::logging::getLogger();
    std::vector<core::OrderRequest> signals;

    const size_t min_bars = static_cast<size_t>(params_.adx_period) * 2;

    for (const std::string& symbol : data.symbols()) {
        auto history = data.history(symbol, timestamp);
        if (history.size() < min_bars) {
            continue;
        }

        indicators::AdxIndicator adx_indicator(params_.adx_period);
        adx_indicator.calculate(history);
        if (adx_indicator.getResult().empty()) {
            continue;
        }

        // Without a full MA window only the weak-trend exit can fire
        indicators::SmaIndicator ma_indicator(params_.ma_period);
        ma_indicator.calculate(history);
        std::optional<double> current_ma;
        if (!ma_indicator.getResult().empty()) {
            current_ma = ma_indicator.getResult().back();
        }

        double current_adx = adx_indicator.getResult().back();
        double current_price = history.back().close;
        bool held = isHeld(positions, symbol);

        logger->trace("{}: {} ADX={:.2f} MA={} close={:.4f}", name_, symbol, current_adx,
                      current_ma ? fmt::format("{:.4f}", *current_ma) : std::string("n/a"), current_price);

        if (current_adx > params_.adx_threshold) {
            if (!current_ma) {
                continue;
            }
            if (current_price > *current_ma && !held) {
                double quantity = (cash * params_.position_size) / current_price;
                if (quantity > 0.0) {
                    signals.emplace_back(symbol, core::OrderSide::Buy, quantity);
                }
            } else if (current_price < *current_ma && held) {
                signals.emplace_back(symbol, core::OrderSide::Sell, heldQuantity(positions, symbol));
            }
        } else if (current_adx < params_.adx_threshold && held) {
            logger->debug("{}: trend on {} weakened (ADX {:.2f}), exiting", name_, symbol, current_adx);
            signals.emplace_back(symbol, core::OrderSide::Sell, heldQuantity(positions, symbol));
        }
    }

    return signals;
}

} // namespace strategy_engine
