#include "rsi_indicator.hpp"
#include "talib_close_series.hpp"
#include "exceptions.hpp"
#include <limits>
#include <stdexcept>
#include <vector>
#include <spdlog/fmt/fmt.h>

namespace indicators {

RsiIndicator::RsiIndicator(int period) : period_(period), lookback_(0) {
    if (period_ < 2) {
        throw std::invalid_argument("RSI period must be at least 2.");
    }
    // The first bar contributes a zero move, so the first value sits at period - 1
    lookback_ = TA_MA_Lookback(period_, TA_MAType_SMA);
    if (lookback_ < 0) {
        throw core::IndicatorCalculationException(
            fmt::format("TA_MA_Lookback returned an unexpected value: {}", lookback_));
    }
    name_ = fmt::format("RSI({})", period_);
}

std::string RsiIndicator::getName() const {
    return name_;
}

int RsiIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& RsiIndicator::getResult() const {
    return results_;
}

void RsiIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    results_.clear();
    if (input.size() <= static_cast<size_t>(lookback_)) {
        return;
    }

    const std::vector<double> closes = closePrices(input);
    std::vector<double> gains(closes.size(), 0.0);
    std::vector<double> losses(closes.size(), 0.0);
    for (size_t i = 1; i < closes.size(); ++i) {
        double change = closes[i] - closes[i - 1];
        if (change > 0.0) {
            gains[i] = change;
        } else if (change < 0.0) {
            losses[i] = -change;
        }
    }

    // Simple rolling means of gains and losses
    const std::vector<double> avg_gain = detail::rollingMean(name_, gains, period_);
    const std::vector<double> avg_loss = detail::rollingMean(name_, losses, period_);
    if (avg_gain.empty() || avg_gain.size() != avg_loss.size()) {
        return;
    }

    results_.reserve(avg_gain.size());
    for (size_t k = 0; k < avg_gain.size(); ++k) {
        if (avg_gain[k] == 0.0 && avg_loss[k] == 0.0) {
            // No movement in the window: undefined, compares false against any threshold
            results_.push_back(std::numeric_limits<double>::quiet_NaN());
        } else if (avg_loss[k] == 0.0) {
            results_.push_back(100.0);
        } else {
            double rs = avg_gain[k] / avg_loss[k];
            results_.push_back(100.0 - 100.0 / (1.0 + rs));
        }
    }
    core::logging::getLogger()->trace("Calculated {} values for {}", results_.size(), name_);
}

} // namespace indicators
