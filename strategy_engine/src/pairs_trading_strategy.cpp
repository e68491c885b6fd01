#include "pairs_trading_strategy.hpp"
#include "sma_indicator.hpp"
#include "stddev_indicator.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>

namespace strategy_engine {

namespace {

    // Spread bars (close1 - close2) on the timestamps both legs share
    core::TimeSeries<core::Candle> alignedSpread(const core::TimeSeries<core::Candle>& leg1,
                                                 const core::TimeSeries<core::Candle>& leg2) {
        std::map<core::Timestamp, double> closes2;
        for (const auto& candle : leg2) {
            closes2[candle.timestamp] = candle.close;
        }

        core::TimeSeries<core::Candle> spread;
        spread.reserve(leg1.size());
        for (const auto& candle : leg1) {
            auto it = closes2.find(candle.timestamp);
            if (it == closes2.end()) {
                continue;
            }
            core::Candle bar;
            bar.timestamp = candle.timestamp;
            bar.close = candle.close - it->second;
            bar.open = bar.high = bar.low = bar.close;
            spread.push_back(bar);
        }
        return spread;
    }

} // end anonymous namespace

PairsTradingStrategy::PairsTradingStrategy(PairsTradingParams params, std::string name)
    : params_(std::move(params)), name_(std::move(name))
{
    if (params_.symbol1.empty() || params_.symbol2.empty()) {
        throw std::invalid_argument("Pairs trading requires two symbols.");
    }
    if (params_.symbol1 == params_.symbol2) {
        throw std::invalid_argument("Pairs trading symbols must differ.");
    }
    if (params_.lookback_period < 2) {
        throw std::invalid_argument("Pairs lookback period must be at least 2.");
    }
    if (params_.exit_threshold < 0.0 || params_.entry_threshold <= params_.exit_threshold) {
        throw std::invalid_argument("Pairs thresholds must satisfy 0 <= exit < entry.");
    }
    if (params_.position_size <= 0.0 || params_.position_size > 1.0) {
        throw std::invalid_argument("Position size must be in (0, 1].");
    }
}

std::optional<double> PairsTradingStrategy::spreadZScore(const core::MarketData& data,
                                                         core::Timestamp timestamp) const {
    auto history1 = data.history(params_.symbol1, timestamp);
    auto history2 = data.history(params_.symbol2, timestamp);
    size_t lookback = static_cast<size_t>(params_.lookback_period);
    if (history1.size() < lookback || history2.size() < lookback) {
        return std::nullopt;
    }

    auto spread = alignedSpread(history1, history2);
    if (spread.size() < lookback) {
        return std::nullopt;
    }

    indicators::SmaIndicator mean_indicator(params_.lookback_period);
    indicators::StdDevIndicator std_indicator(params_.lookback_period);
    mean_indicator.calculate(spread);
    std_indicator.calculate(spread);
    if (mean_indicator.getResult().empty() || std_indicator.getResult().empty()) {
        return std::nullopt;
    }

    double spread_std = std_indicator.getResult().back();
    if (!(spread_std > 1e-12)) {
        return std::nullopt;
    }
    return (spread.back().close - mean_indicator.getResult().back()) / spread_std;
}

std::vector<core::OrderRequest> PairsTradingStrategy::generateSignals(
    const core::MarketData& data,
    core::Timestamp timestamp,
    const core::PositionMap& positions,
    double cash) const
{
    std::vector<core::OrderRequest> signals;

    auto z = spreadZScore(data, timestamp);
    if (!z) {
        return signals;
    }
    double z_score = *z;

    const std::string& symbol1 = params_.symbol1;
    const std::string& symbol2 = params_.symbol2;
    bool held1 = isHeld(positions, symbol1);
    bool held2 = isHeld(positions, symbol2);

    if (std::abs(z_score) > params_.entry_threshold) {
        // Latest closes of both legs at or before the timestamp
        double price1 = data.history(symbol1, timestamp).back().close;
        double price2 = data.history(symbol2, timestamp).back().close;
        double quantity = (cash * params_.position_size) / (price1 + price2);

        core::logging::getLogger()->debug("{}: spread z-score {:.3f} beyond entry threshold {:.3f}",
                                          name_, z_score, params_.entry_threshold);

        if (z_score > 0) {
            // Spread too wide: reduce symbol1, hold symbol2
            if (held1 && quantity > 0.0) {
                double sell_qty = std::min(quantity, heldQuantity(positions, symbol1));
                signals.emplace_back(symbol1, core::OrderSide::Sell, sell_qty);
            }
            if (!held2 && quantity > 0.0) {
                signals.emplace_back(symbol2, core::OrderSide::Buy, quantity);
            }
        } else {
            // Spread too narrow: hold symbol1, drop symbol2
            if (!held1 && quantity > 0.0) {
                signals.emplace_back(symbol1, core::OrderSide::Buy, quantity);
            }
            if (held2) {
                signals.emplace_back(symbol2, core::OrderSide::Sell, heldQuantity(positions, symbol2));
            }
        }
    } else if (std::abs(z_score) < params_.exit_threshold) {
        if (held1) {
            signals.emplace_back(symbol1, core::OrderSide::Sell, heldQuantity(positions, symbol1));
        }
        if (held2) {
            signals.emplace_back(symbol2, core::OrderSide::Sell, heldQuantity(positions, symbol2));
        }
    }

    return signals;
}

} // namespace strategy_engine
