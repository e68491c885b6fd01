#include "backtest_config.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using backtester::BacktestConfig;

TEST(BacktestConfigTest, DefaultsAreValid) {
    BacktestConfig config;
    EXPECT_DOUBLE_EQ(config.initial_capital, 100000.0);
    EXPECT_DOUBLE_EQ(config.commission_rate, 0.001);
    EXPECT_DOUBLE_EQ(config.slippage_rate, 0.0005);
    EXPECT_DOUBLE_EQ(config.risk_free_rate, 0.02);
    EXPECT_NO_THROW(config.validate());
}

TEST(BacktestConfigTest, FromJsonOverridesPresentKeysOnly) {
    auto config = BacktestConfig::fromJson({{"initial_capital", 5000}, {"slippage_rate", 0.0}});
    EXPECT_DOUBLE_EQ(config.initial_capital, 5000.0);
    EXPECT_DOUBLE_EQ(config.slippage_rate, 0.0);
    EXPECT_DOUBLE_EQ(config.commission_rate, 0.001);
    EXPECT_EQ(config.progress_log_interval, 50);

    auto round_trip = BacktestConfig::fromJson(config.toJson());
    EXPECT_EQ(round_trip.toJson(), config.toJson());
}

TEST(BacktestConfigTest, WrongTypesThrow) {
    EXPECT_THROW(BacktestConfig::fromJson({{"initial_capital", "lots"}}), core::ConfigException);
    EXPECT_THROW(BacktestConfig::fromJson({{"progress_log_interval", 2.5}}), core::ConfigException);
    EXPECT_THROW(BacktestConfig::fromJson(nlohmann::json::array()), core::ConfigException);
}

TEST(BacktestConfigTest, OutOfRangeValuesThrow) {
    EXPECT_THROW(BacktestConfig::fromJson({{"initial_capital", 0}}), core::ConfigException);
    EXPECT_THROW(BacktestConfig::fromJson({{"commission_rate", -0.01}}), core::ConfigException);
    EXPECT_THROW(BacktestConfig::fromJson({{"slippage_rate", 1.0}}), core::ConfigException);
    EXPECT_THROW(BacktestConfig::fromJson({{"progress_log_interval", 0}}), core::ConfigException);
}

TEST(LoadJsonFileTest, ParsesDocument) {
    std::filesystem::path dir = test_helpers::scratchDir("load_json");
    std::filesystem::create_directories(dir);
    std::filesystem::path file = dir / "run.json";
    {
        std::ofstream out(file);
        out << R"({"engine": {"initial_capital": 2500}})";
    }
    auto doc = backtester::loadJsonFile(file.string());
    EXPECT_DOUBLE_EQ(BacktestConfig::fromJson(doc.at("engine")).initial_capital, 2500.0);
}

TEST(LoadJsonFileTest, MissingOrMalformedFileThrows) {
    std::filesystem::path dir = test_helpers::scratchDir("load_json_bad");
    std::filesystem::create_directories(dir);
    EXPECT_THROW(backtester::loadJsonFile((dir / "absent.json").string()), core::ConfigException);

    std::filesystem::path broken = dir / "broken.json";
    {
        std::ofstream out(broken);
        out << "{ not json";
    }
    EXPECT_THROW(backtester::loadJsonFile(broken.string()), core::ConfigException);
}
