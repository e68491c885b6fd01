#include "results_writer.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <utility>
#include <spdlog/fmt/fmt.h>

namespace backtester {

    namespace fs = std::filesystem;

    namespace {

        std::ofstream openForWrite(const std::string& path) {
            std::ofstream ofs(path, std::ios::out | std::ios::trunc);
            if (!ofs.is_open()) {
                throw core::BacktestException(fmt::format("Failed to open '{}' for writing.", path));
            }
            return ofs;
        }

        void checkStream(const std::ofstream& ofs, const std::string& path) {
            if (!ofs) {
                throw core::BacktestException(fmt::format("Failed while writing '{}'.", path));
            }
        }

    } // end anonymous namespace

    ResultsWriter::ResultsWriter(std::string output_dir)
        : output_dir_(std::move(output_dir))
    {
        std::error_code ec;
        fs::create_directories(output_dir_, ec);
        if (ec) {
            throw core::BacktestException(fmt::format("Failed to create output directory '{}': {}",
                                                      output_dir_, ec.message()));
        }
    }

    std::string ResultsWriter::pathFor(const char* filename) const {
        return (fs::path(output_dir_) / filename).string();
    }

    void ResultsWriter::writeTrades(const std::vector<core::Trade>& trades) const {
        const std::string path = pathFor(kTradesFile);
        auto ofs = openForWrite(path);

        ofs << "symbol,side,entry_time,exit_time,entry_price,exit_price,quantity,pnl,pnl_percent,"
               "commission,duration_seconds,duration_days\n";
        for (const auto& trade : trades) {
            const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(trade.duration).count();
            ofs << fmt::format("{},{},{},{},{:.6f},{:.6f},{:.6f},{:.6f},{:.6f},{:.6f},{},{:.6f}\n",
                               trade.symbol,
                               core::utils::toString(trade.side),
                               core::utils::timestampToString(trade.entry_time),
                               core::utils::timestampToString(trade.exit_time),
                               trade.entry_price,
                               trade.exit_price,
                               trade.quantity,
                               trade.pnl,
                               trade.pnl_percent,
                               trade.commission,
                               seconds,
                               core::utils::durationToDays(trade.duration));
        }
        checkStream(ofs, path);
        core::logging::getLogger()->debug("Wrote {} trades to {}", trades.size(), path);
    }

    void ResultsWriter::writePortfolioHistory(const std::vector<core::PortfolioSnapshot>& history) const {
        const std::string path = pathFor(kHistoryFile);
        auto ofs = openForWrite(path);

        ofs << "timestamp,cash,portfolio_value,positions,num_trades\n";
        for (const auto& snapshot : history) {
            ofs << fmt::format("{},{:.6f},{:.6f},{},{}\n",
                               core::utils::timestampToString(snapshot.timestamp),
                               snapshot.cash,
                               snapshot.portfolio_value,
                               snapshot.positions,
                               snapshot.num_trades);
        }
        checkStream(ofs, path);
        core::logging::getLogger()->debug("Wrote {} history rows to {}", history.size(), path);
    }

    void ResultsWriter::writeMetrics(const BacktestMetrics& metrics) const {
        const std::string path = pathFor(kMetricsFile);
        auto ofs = openForWrite(path);
        ofs << metrics.toJson().dump(2) << '\n';
        checkStream(ofs, path);
    }

} // namespace backtester
