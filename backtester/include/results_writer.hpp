#pragma once

#include <string>
#include <vector>

#include "datatypes.hpp"
#include "performance_metrics.hpp"

namespace backtester {

    // Persists a finished run as trades.csv, portfolio_history.csv and metrics.json.
    // Every write throws core::BacktestException on I/O failure.
    class ResultsWriter {
    public:
        // Creates output_dir (and parents) if missing
        explicit ResultsWriter(std::string output_dir);

        void writeTrades(const std::vector<core::Trade>& trades) const;
        void writePortfolioHistory(const std::vector<core::PortfolioSnapshot>& history) const;
        void writeMetrics(const BacktestMetrics& metrics) const;

        const std::string& getOutputDir() const { return output_dir_; }

        static constexpr const char* kTradesFile = "trades.csv";
        static constexpr const char* kHistoryFile = "portfolio_history.csv";
        static constexpr const char* kMetricsFile = "metrics.json";

    private:
        std::string output_dir_;

        std::string pathFor(const char* filename) const;
    };

} // namespace backtester
