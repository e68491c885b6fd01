#include "adx_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "talib_close_series.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

AdxIndicator::AdxIndicator(int period) : period_(period), lookback_(0) {
    if (period_ < 2) {
        throw std::invalid_argument("ADX period must be at least 2.");
    }
    // One window for TR/DM averages, a second for the DX average
    int ma_lookback = TA_MA_Lookback(period_, TA_MAType_SMA);
    if (ma_lookback < 0) {
        throw core::IndicatorCalculationException(
            fmt::format("TA_MA_Lookback returned an unexpected value: {}", ma_lookback));
    }
    lookback_ = 2 * ma_lookback;
    name_ = fmt::format("ADX({})", period_);
}

std::string AdxIndicator::getName() const {
    return name_;
}

int AdxIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& AdxIndicator::getResult() const {
    return results_;
}

void AdxIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    results_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        return;
    }

    // The first bar has no previous close: its range is high - low and it carries no movement
    const size_t n = input.size();
    std::vector<double> true_range(n, 0.0);
    std::vector<double> plus_dm(n, 0.0);
    std::vector<double> minus_dm(n, 0.0);
    true_range[0] = input[0].high - input[0].low;
    for (size_t i = 1; i < n; ++i) {
        const core::Candle& bar = input[i];
        const core::Candle& prev = input[i - 1];
        true_range[i] = std::max({bar.high - bar.low,
                                  std::abs(bar.high - prev.close),
                                  std::abs(bar.low - prev.close)});
        double up_move = bar.high - prev.high;
        double down_move = prev.low - bar.low;
        if (up_move > down_move && up_move > 0.0) {
            plus_dm[i] = up_move;
        }
        if (down_move > up_move && down_move > 0.0) {
            minus_dm[i] = down_move;
        }
    }

    const std::vector<double> atr = detail::rollingMean(name_, true_range, period_);
    const std::vector<double> plus_avg = detail::rollingMean(name_, plus_dm, period_);
    const std::vector<double> minus_avg = detail::rollingMean(name_, minus_dm, period_);
    if (atr.empty() || atr.size() != plus_avg.size() || atr.size() != minus_avg.size()) {
        return;
    }

    // DX is undefined without range or without directional movement. Undefined
    // entries go into the average as 0 and mark every window holding them.
    std::vector<double> dx(atr.size(), 0.0);
    std::vector<bool> dx_defined(atr.size(), false);
    for (size_t k = 0; k < atr.size(); ++k) {
        if (atr[k] <= 0.0) {
            continue;
        }
        double plus_di = 100.0 * plus_avg[k] / atr[k];
        double minus_di = 100.0 * minus_avg[k] / atr[k];
        double di_sum = plus_di + minus_di;
        if (di_sum <= 0.0) {
            continue;
        }
        dx[k] = 100.0 * std::abs(plus_di - minus_di) / di_sum;
        dx_defined[k] = true;
    }

    results_ = detail::rollingMean(name_, dx, period_);
    for (size_t j = 0; j < results_.size(); ++j) {
        for (size_t k = j; k < j + static_cast<size_t>(period_); ++k) {
            if (!dx_defined[k]) {
                results_[j] = std::numeric_limits<double>::quiet_NaN();
                break;
            }
        }
    }
    logger->trace("Calculated {} values for {}", results_.size(), name_);
}

} // namespace indicators
