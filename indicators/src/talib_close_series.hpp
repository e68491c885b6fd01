#pragma once

#include "indicators.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <cmath>
#include <string>
#include <vector>

namespace indicators {
namespace detail {

    // Runs a single-output TA-Lib function over the close column of `input`.
    // `ta_call(end_idx, in, &out_beg, &out_nb, out)` wraps the TA_* call with
    // its indicator-specific options bound. `results` ends up holding
    // input.size() - lookback values, or nothing when the input does not cover
    // the lookback or TA-Lib reports an error.
    template <typename TaCall>
    void computeOnCloses(const std::string& name,
                         int lookback,
                         const core::TimeSeries<core::Candle>& input,
                         core::TimeSeries<double>& results,
                         TaCall ta_call)
    {
        auto logger = core::logging::getLogger();
        results.clear();

        if (input.size() <= static_cast<size_t>(lookback)) {
            logger->trace("{}: {} bars do not cover lookback {}.", name, input.size(), lookback);
            return;
        }

        const std::vector<double> close_prices = closePrices(input);
        results.resize(close_prices.size() - static_cast<size_t>(lookback));

        int out_begin_idx = 0;
        int out_nb_element = 0;
        TA_RetCode ret_code = ta_call(static_cast<int>(close_prices.size()) - 1,
                                      close_prices.data(),
                                      &out_begin_idx,
                                      &out_nb_element,
                                      results.data());

        if (ret_code != TA_SUCCESS) {
            logger->error("TA-Lib calculation failed for {} with error code: {}", name, static_cast<int>(ret_code));
            results.clear();
            return;
        }
        if (out_begin_idx != lookback) {
            logger->warn("{}: TA-Lib began output at {} instead of lookback {}.", name, out_begin_idx, lookback);
        }
        results.resize(static_cast<size_t>(out_nb_element));
        logger->trace("Calculated {} values for {}", results.size(), name);
    }

    // Simple moving average of an arbitrary series through TA_MA. Element k of
    // the result covers values[k .. k + period - 1]. Empty when the series is
    // shorter than the period or TA-Lib fails.
    inline std::vector<double> rollingMean(const std::string& name,
                                           const std::vector<double>& values,
                                           int period)
    {
        std::vector<double> means;
        if (period <= 0 || values.size() < static_cast<size_t>(period)) {
            return means;
        }
        means.resize(values.size() - static_cast<size_t>(period) + 1);

        int out_begin_idx = 0;
        int out_nb_element = 0;
        TA_RetCode ret_code = TA_MA(0, static_cast<int>(values.size()) - 1, values.data(), period, TA_MAType_SMA,
                                    &out_begin_idx, &out_nb_element, means.data());
        if (ret_code != TA_SUCCESS) {
            core::logging::getLogger()->error("TA-Lib TA_MA failed inside {} with error code: {}",
                                              name, static_cast<int>(ret_code));
            means.clear();
            return means;
        }
        means.resize(static_cast<size_t>(out_nb_element));
        return means;
    }

    // Ratio turning TA-Lib's population deviation into the sample (n - 1) one
    inline double sampleDeviationScale(int period) {
        return std::sqrt(static_cast<double>(period) / static_cast<double>(period - 1));
    }

} // namespace detail
} // namespace indicators
