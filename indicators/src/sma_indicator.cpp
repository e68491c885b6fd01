#include "sma_indicator.hpp"
#include "exceptions.hpp"
#include "talib_close_series.hpp"
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

SmaIndicator::SmaIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
        throw std::invalid_argument("SMA period must be positive.");
    }
    lookback_ = TA_MA_Lookback(period_, TA_MAType_SMA);
    if (lookback_ < 0) {
        throw core::IndicatorCalculationException(
            fmt::format("TA_MA_Lookback returned an unexpected value: {}", lookback_));
    }
    name_ = fmt::format("SMA({})", period_);
}

std::string SmaIndicator::getName() const {
    return name_;
}

int SmaIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& SmaIndicator::getResult() const {
    return results_;
}

void SmaIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    detail::computeOnCloses(name_, lookback_, input, results_,
        [this](int end_idx, const double* in, int* out_beg, int* out_nb, double* out) {
            return TA_MA(0, end_idx, in, period_, TA_MAType_SMA, out_beg, out_nb, out);
        });
}

} // namespace indicators
