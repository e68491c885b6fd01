#include "results_writer.hpp"
#include "backtest_engine.hpp"
#include "lambda_strategy.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using test_helpers::day;

namespace {

    std::vector<std::string> readLines(const fs::path& path) {
        std::ifstream in(path);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }

} // namespace

TEST(ResultsWriterTest, CreatesNestedOutputDirectory) {
    fs::path root = test_helpers::scratchDir("writer_nested");
    fs::path nested = root / "a" / "b";
    backtester::ResultsWriter writer(nested.string());
    EXPECT_TRUE(fs::is_directory(nested));
    EXPECT_EQ(writer.getOutputDir(), nested.string());
}

TEST(ResultsWriterTest, TradesCsvHasHeaderAndOneRowPerTrade) {
    fs::path dir = test_helpers::scratchDir("writer_trades");
    backtester::ResultsWriter writer(dir.string());

    core::Trade trade;
    trade.symbol = "AAPL";
    trade.entry_time = day(0);
    trade.exit_time = day(2);
    trade.entry_price = 100.0;
    trade.exit_price = 110.0;
    trade.quantity = 5.0;
    trade.pnl = 49.5;
    trade.pnl_percent = 10.0;
    trade.commission = 0.5;
    trade.duration = trade.exit_time - trade.entry_time;
    writer.writeTrades({trade});

    auto lines = readLines(dir / backtester::ResultsWriter::kTradesFile);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "symbol,side,entry_time,exit_time,entry_price,exit_price,quantity,pnl,pnl_percent,"
                        "commission,duration_seconds,duration_days");
    EXPECT_EQ(lines[1], "AAPL,SELL,2023-01-02T00:00:00Z,2023-01-04T00:00:00Z,100.000000,110.000000,5.000000,"
                        "49.500000,10.000000,0.500000,172800,2.000000");
}

TEST(ResultsWriterTest, EmptyTradeLogStillWritesHeader) {
    fs::path dir = test_helpers::scratchDir("writer_empty");
    backtester::ResultsWriter writer(dir.string());
    writer.writeTrades({});
    EXPECT_EQ(readLines(dir / backtester::ResultsWriter::kTradesFile).size(), 1u);
}

TEST(ResultsWriterTest, ExportWritesAllThreeFiles) {
    fs::path dir = test_helpers::scratchDir("writer_export");
    backtester::BacktestEngine engine(test_helpers::frictionlessConfig(10000.0));
    auto data = test_helpers::marketFromCloses("X", {100, 100, 110, 105});

    strategy_engine::LambdaStrategy strategy("round_trip",
        [](const core::MarketData&, core::Timestamp ts, const core::PositionMap&, double) {
            std::vector<core::OrderRequest> out;
            if (ts == day(0)) out.emplace_back("X", core::OrderSide::Buy, 10);
            if (ts == day(1)) out.emplace_back("X", core::OrderSide::Sell, 10);
            return out;
        });
    auto metrics = engine.runBacktest(strategy, data, {"X"});
    engine.exportResults(dir.string());

    auto trades = readLines(dir / backtester::ResultsWriter::kTradesFile);
    EXPECT_EQ(trades.size(), 2u);

    auto history = readLines(dir / backtester::ResultsWriter::kHistoryFile);
    ASSERT_EQ(history.size(), 5u);
    EXPECT_EQ(history[0], "timestamp,cash,portfolio_value,positions,num_trades");
    EXPECT_EQ(history[3], "2023-01-04T00:00:00Z,10100.000000,10100.000000,0,1");

    std::ifstream metrics_in(dir / backtester::ResultsWriter::kMetricsFile);
    auto written = nlohmann::json::parse(metrics_in);
    EXPECT_EQ(written, metrics.toJson());
    EXPECT_DOUBLE_EQ(written.at("final_value").get<double>(), 10100.0);
}

TEST(ResultsWriterTest, UnwritableDirectoryThrows) {
    fs::path dir = test_helpers::scratchDir("writer_blocked");
    fs::create_directories(dir);
    fs::path blocker = dir / "file";
    {
        std::ofstream out(blocker);
        out << "x";
    }
    EXPECT_THROW(backtester::ResultsWriter((blocker / "sub").string()), core::BacktestException);
}
