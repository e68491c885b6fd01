#include "strategy_factory.hpp"
#include "moving_average_crossover_strategy.hpp"
#include "mean_reversion_strategy.hpp"
#include "momentum_strategy.hpp"
#include "trend_following_strategy.hpp"
#include "pairs_trading_strategy.hpp"
#include "common_types.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>

#include <stdexcept>
#include <string>
#include <memory>

namespace strategy_engine {

    using json = nlohmann::json;

    namespace { // File-local parameter readers

        int readInt(const json& params, const char* key, int default_value) {
            if (!params.contains(key)) return default_value;
            const auto& value = params[key];
            if (!value.is_number_integer()) {
                throw core::StrategyException(fmt::format("Parameter '{}' must be an integer.", key));
            }
            return value.get<int>();
        }

        double readDouble(const json& params, const char* key, double default_value) {
            if (!params.contains(key)) return default_value;
            const auto& value = params[key];
            if (!value.is_number()) {
                throw core::StrategyException(fmt::format("Parameter '{}' must be a number.", key));
            }
            return value.get<double>();
        }

        std::string readString(const json& params, const char* key) {
            if (!params.contains(key) || !params[key].is_string()) {
                throw core::StrategyException(fmt::format("Parameter '{}' (string) is required.", key));
            }
            return params[key].get<std::string>();
        }

        std::string strategyName(const json& config, const std::string& type) {
            if (config.contains("name")) {
                if (!config["name"].is_string() || config["name"].get<std::string>().empty()) {
                    throw core::StrategyException("Strategy 'name' must be a non-empty string.");
                }
                return config["name"].get<std::string>();
            }
            return type;
        }

    } // end anonymous namespace

    std::unique_ptr<IStrategy> StrategyFactory::createStrategy(const json& config) {
        auto logger = core::logging::getLogger();

        if (!config.is_object() || !config.contains("type") || !config["type"].is_string()) {
            throw core::StrategyException("Strategy config must be an object with a 'type' (string).");
        }
        const std::string type = config["type"].get<std::string>();
        const std::string name = strategyName(config, type);

        json params = json::object();
        if (config.contains("parameters")) {
            if (!config["parameters"].is_object()) {
                throw core::StrategyException("Strategy 'parameters' must be an object.");
            }
            params = config["parameters"];
        }

        logger->info("Creating strategy '{}' of type {}", name, type);

        // Constructors reject out-of-range values with std::invalid_argument
        try {
            if (type == "MovingAverageCrossover") {
                MovingAverageCrossoverParams p;
                p.fast_period = readInt(params, "fast_period", p.fast_period);
                p.slow_period = readInt(params, "slow_period", p.slow_period);
                p.position_size = readDouble(params, "position_size", p.position_size);
                return std::make_unique<MovingAverageCrossoverStrategy>(p, name);
            } else if (type == "MeanReversion") {
                MeanReversionParams p;
                p.period = readInt(params, "period", p.period);
                p.num_std = readDouble(params, "num_std", p.num_std);
                p.position_size = readDouble(params, "position_size", p.position_size);
                p.stop_loss_pct = readDouble(params, "stop_loss_pct", p.stop_loss_pct);
                return std::make_unique<MeanReversionStrategy>(p, name);
            } else if (type == "Momentum") {
                MomentumParams p;
                p.rsi_period = readInt(params, "rsi_period", p.rsi_period);
                p.oversold = readDouble(params, "oversold", p.oversold);
                p.overbought = readDouble(params, "overbought", p.overbought);
                p.position_size = readDouble(params, "position_size", p.position_size);
                return std::make_unique<MomentumStrategy>(p, name);
            } else if (type == "TrendFollowing") {
                TrendFollowingParams p;
                p.adx_period = readInt(params, "adx_period", p.adx_period);
                p.adx_threshold = readDouble(params, "adx_threshold", p.adx_threshold);
                p.ma_period = readInt(params, "ma_period", p.ma_period);
                p.position_size = readDouble(params, "position_size", p.position_size);
                return std::make_unique<TrendFollowingStrategy>(p, name);
            } else if (type == "PairsTrading") {
                PairsTradingParams p;
                p.symbol1 = readString(params, "symbol1");
                p.symbol2 = readString(params, "symbol2");
                p.lookback_period = readInt(params, "lookback_period", p.lookback_period);
                p.entry_threshold = readDouble(params, "entry_threshold", p.entry_threshold);
                p.exit_threshold = readDouble(params, "exit_threshold", p.exit_threshold);
                p.position_size = readDouble(params, "position_size", p.position_size);
                return std::make_unique<PairsTradingStrategy>(p, name);
            }
        } catch (const std::invalid_argument& e) {
            throw core::StrategyException(fmt::format("Invalid parameters for strategy '{}': {}", name, e.what()));
        }

        throw core::StrategyException("Unknown strategy type: " + type);
    }

    std::vector<std::string> StrategyFactory::availableTypes() {
        return {"MovingAverageCrossover", "MeanReversion", "Momentum", "TrendFollowing", "PairsTrading"};
    }

} // namespace strategy_engine
