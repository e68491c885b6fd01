#include "stddev_indicator.hpp"
#include "exceptions.hpp"
#include "talib_close_series.hpp"
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

namespace {
    constexpr double kOneDeviation = 1.0; // optInNbDev: report the raw deviation
}

StdDevIndicator::StdDevIndicator(int period) : period_(period), lookback_(0) {
    if (period_ < 2) {
        throw std::invalid_argument("StdDev period must be at least 2.");
    }
    lookback_ = TA_STDDEV_Lookback(period_, kOneDeviation);
    if (lookback_ < 0) {
        throw core::IndicatorCalculationException(
            fmt::format("TA_STDDEV_Lookback returned an unexpected value: {}", lookback_));
    }
    name_ = fmt::format("STDDEV({})", period_);
}

std::string StdDevIndicator::getName() const {
    return name_;
}

int StdDevIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& StdDevIndicator::getResult() const {
    return results_;
}

void StdDevIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    detail::computeOnCloses(name_, lookback_, input, results_,
        [this](int end_idx, const double* in, int* out_beg, int* out_nb, double* out) {
            return TA_STDDEV(0, end_idx, in, period_, kOneDeviation, out_beg, out_nb, out);
        });
    const double scale = detail::sampleDeviationScale(period_);
    for (double& value : results_) {
        value *= scale;
    }
}

} // namespace indicators
