#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace backtester {

    using json = nlohmann::json;

    struct BacktestConfig {
        double initial_capital = 100000.0;
        double commission_rate = 0.001;   // Fraction of trade value
        double slippage_rate = 0.0005;    // Fraction of price, against the trader
        double risk_free_rate = 0.02;     // Annual, used by the Sharpe ratio
        int progress_log_interval = 50;   // Bars between progress log lines

        // Throws core::ConfigException when a value is out of range
        void validate() const;

        // Missing keys keep their defaults; wrong types throw core::ConfigException.
        // The result is validated.
        static BacktestConfig fromJson(const json& config);
        json toJson() const;
    };

    // Reads and parses a JSON document, throwing core::ConfigException on failure
    json loadJsonFile(const std::string& path);

} // namespace backtester
