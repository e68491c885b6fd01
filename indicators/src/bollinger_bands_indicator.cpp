#include "bollinger_bands_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "talib_close_series.hpp"
#include "ta_libc.h"
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

BollingerBandsIndicator::BollingerBandsIndicator(int period, double num_std)
    : period_(period), num_std_(num_std), lookback_(0)
{
    if (period_ < 2) {
        throw std::invalid_argument("Bollinger Bands period must be at least 2.");
    }
    if (num_std_ <= 0.0) {
        throw std::invalid_argument("Bollinger Bands width must be positive.");
    }

    lookback_ = TA_BBANDS_Lookback(period_, num_std_, num_std_, TA_MAType_SMA);
    if (lookback_ < 0) {
        throw core::IndicatorCalculationException(
            fmt::format("TA_BBANDS_Lookback returned an unexpected value: {}", lookback_));
    }
    name_ = fmt::format("BBANDS({},{})", period_, num_std_);
}

std::string BollingerBandsIndicator::getName() const {
    return name_;
}

int BollingerBandsIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& BollingerBandsIndicator::getResult() const {
    return middle_;
}

void BollingerBandsIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    upper_.clear();
    middle_.clear();
    lower_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        return;
    }

    std::vector<double> close_prices = closePrices(input);
    int output_size = static_cast<int>(close_prices.size()) - lookback_;
    upper_.resize(output_size);
    middle_.resize(output_size);
    lower_.resize(output_size);

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_BBANDS(
        0,
        static_cast<int>(close_prices.size()) - 1,
        close_prices.data(),
        period_,
        num_std_,        // optInNbDevUp
        num_std_,        // optInNbDevDn
        TA_MAType_SMA,
        &out_begin_idx,
        &out_nb_element,
        upper_.data(),
        middle_.data(),
        lower_.data()
    );

    if (ret_code != TA_SUCCESS) {
        logger->error("TA-Lib TA_BBANDS calculation failed for {} with error code: {}", name_, static_cast<int>(ret_code));
        upper_.clear();
        middle_.clear();
        lower_.clear();
        return;
    }

    if (out_nb_element != output_size) {
        upper_.resize(out_nb_element);
        middle_.resize(out_nb_element);
        lower_.resize(out_nb_element);
    }

    // TA_BBANDS offsets use the population deviation; widen them to the sample one
    const double scale = detail::sampleDeviationScale(period_);
    for (size_t i = 0; i < middle_.size(); ++i) {
        upper_[i] = middle_[i] + (upper_[i] - middle_[i]) * scale;
        lower_[i] = middle_[i] - (middle_[i] - lower_[i]) * scale;
    }
    logger->trace("Calculated {} band points for {}", middle_.size(), name_);
}

} // namespace indicators
