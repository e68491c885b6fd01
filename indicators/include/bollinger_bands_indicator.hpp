#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// SMA middle band with upper/lower bands num_std sample standard
// deviations away. getResult() returns the middle band.
class BollingerBandsIndicator : public IIndicator {
public:
    BollingerBandsIndicator(int period, double num_std);

    ~BollingerBandsIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override;

    const core::TimeSeries<double>& getUpperBand() const { return upper_; }
    const core::TimeSeries<double>& getMiddleBand() const { return middle_; }
    const core::TimeSeries<double>& getLowerBand() const { return lower_; }

private:
    const int period_;
    const double num_std_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> upper_;
    core::TimeSeries<double> middle_;
    core::TimeSeries<double> lower_;
};

} // namespace indicators
