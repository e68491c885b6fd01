// cli/src/main.cpp

#include <iostream>
#include <string>
#include <vector>
#include <exception>
#include <cstdlib>     // For std::getenv
#include <memory>
#include <chrono>

// Project includes
#include "logging.hpp"
#include "exceptions.hpp"
#include "datatypes.hpp"
#include "utils.hpp"
#include "market_data.hpp"
#include "database_manager.hpp"
#include "synthetic_data_generator.hpp"
#include "strategy_factory.hpp"
#include "backtest_config.hpp"
#include "backtest_engine.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <spdlog/fmt/fmt.h>
#include <nlohmann/json.hpp>

namespace {

    using json = nlohmann::json;

    const char* kDefaultRunConfig = "config/backtest_run.json";

    std::string requireString(const json& section, const char* key) {
        if (!section.contains(key) || !section[key].is_string()) {
            throw core::ConfigException(fmt::format("Run config 'data.{}' (string) is required.", key));
        }
        return section[key].get<std::string>();
    }

    std::vector<std::string> requireSymbols(const json& section) {
        if (!section.contains("symbols") || !section["symbols"].is_array() || section["symbols"].empty()) {
            throw core::ConfigException("Run config 'data.symbols' must be a non-empty array of strings.");
        }
        std::vector<std::string> symbols;
        for (const auto& symbol : section["symbols"]) {
            if (!symbol.is_string()) {
                throw core::ConfigException("Run config 'data.symbols' must contain only strings.");
            }
            symbols.push_back(symbol.get<std::string>());
        }
        return symbols;
    }

    // Reads the "data" section and produces the bars to simulate
    core::MarketData loadMarketData(const json& data_config, const std::vector<std::string>& symbols) {
        auto logger = core::logging::getLogger();

        const std::string source = data_config.value("source", std::string("synthetic"));
        const core::Timestamp start = core::utils::stringToTimestamp(requireString(data_config, "start_date"));
        const core::Timestamp end = core::utils::stringToTimestamp(requireString(data_config, "end_date"));
        if (end < start) {
            throw core::ConfigException("Run config 'data.end_date' precedes 'data.start_date'.");
        }

        if (source == "synthetic") {
            data::SyntheticDataParams params;
            params.seed = data_config.value("seed", params.seed);
            params.start_price = data_config.value("start_price", params.start_price);
            params.daily_drift = data_config.value("daily_drift", params.daily_drift);
            params.daily_volatility = data_config.value("daily_volatility", params.daily_volatility);
            data::SyntheticDataGenerator generator(params);
            return generator.generate(symbols, start, end);
        }

        if (source == "sqlite") {
            const std::string db_path = requireString(data_config, "db_path");
            const std::string interval = data_config.value("interval", std::string("day"));
            logger->info("Using SQLite database path: {}", db_path);

            data::DatabaseManager db_manager(db_path);
            if (!db_manager.connect()) {
                throw core::DataLoadException("DB connection failed: " + db_path);
            }
            if (!db_manager.initializeSchema()) {
                throw core::DataLoadException("DB schema initialization check failed: " + db_path);
            }
            // End of day inclusive
            auto market_data = db_manager.loadMarketData(symbols, interval, start, end + std::chrono::hours(24) - std::chrono::seconds(1));
            db_manager.disconnect();
            return market_data;
        }

        throw core::ConfigException("Unknown data source: " + source + " (expected 'synthetic' or 'sqlite')");
    }

} // end anonymous namespace

int main(int argc, char* argv[]) {
    // Define logger pointer early in the main scope
    std::shared_ptr<spdlog::logger> logger = nullptr;

    try {
        // --- Initialize Logging ---
        spdlog::level::level_enum console_level = spdlog::level::info;
        if (const char* level_env = std::getenv("BACKTEST_LOG_LEVEL")) {
            console_level = core::logging::level_from_string(level_env);
        }
        core::logging::initialize("hedgefund_backtester", console_level, spdlog::level::debug);
        logger = core::logging::getLogger();
        logger->info("Backtest CLI starting...");

        const std::string run_config_path = (argc > 1) ? argv[1] : kDefaultRunConfig;
        if (argc > 2) {
            logger->warn("Ignoring {} extra argument(s); usage: {} [run_config.json]", argc - 2, argv[0]);
        }

        // 1. Load Run Config from JSON
        const json run_config = backtester::loadJsonFile(run_config_path);
        if (!run_config.is_object()) {
            throw core::ConfigException("Run config must be a JSON object: " + run_config_path);
        }

        const backtester::BacktestConfig engine_config =
            backtester::BacktestConfig::fromJson(run_config.value("engine", json::object()));
        logger->info("Engine config: {}", engine_config.toJson().dump());

        if (!run_config.contains("strategy")) {
            throw core::ConfigException("Run config has no 'strategy' section.");
        }
        // Either an inline strategy object or a path to a strategy file
        json strategy_config = run_config["strategy"];
        if (strategy_config.is_string()) {
            strategy_config = backtester::loadJsonFile(strategy_config.get<std::string>());
        }
        auto strategy = strategy_engine::StrategyFactory::createStrategy(strategy_config);
        logger->info("Strategy '{}' loaded successfully.", strategy->getName());

        if (!run_config.contains("data") || !run_config["data"].is_object()) {
            throw core::ConfigException("Run config has no 'data' section.");
        }
        const json& data_config = run_config["data"];
        const std::vector<std::string> symbols = requireSymbols(data_config);

        // 2. Load Market Data
        core::MarketData market_data = loadMarketData(data_config, symbols);
        if (market_data.empty()) {
            throw core::DataLoadException("No market data available for the requested symbols and period.");
        }

        // 3. Create and Run Backtest
        backtester::BacktestEngine engine(engine_config);
        backtester::BacktestMetrics metrics = engine.runBacktest(*strategy, market_data, symbols);
        metrics.logMetrics();

        // 4. Export
        const std::string output_dir = run_config.value("output_dir", std::string("backtest_results"));
        engine.exportResults(output_dir);

        logger->info("Backtest CLI finished.");

    // --- Exception Handling ---
    } catch (const core::BacktestPlatformException& ex) {
        std::cerr << "Platform Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Platform Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }

    return 0;
}
