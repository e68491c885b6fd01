#include "backtest_config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <fstream>

namespace backtester {

    namespace {

        double readNumber(const json& config, const char* key, double default_value) {
            if (!config.contains(key)) return default_value;
            if (!config[key].is_number()) {
                throw core::ConfigException(fmt::format("Config key '{}' must be a number.", key));
            }
            return config[key].get<double>();
        }

    } // end anonymous namespace

    void BacktestConfig::validate() const {
        if (!std::isfinite(initial_capital) || initial_capital <= 0.0) {
            throw core::ConfigException(fmt::format("Initial capital must be positive, got {}.", initial_capital));
        }
        if (!std::isfinite(commission_rate) || commission_rate < 0.0) {
            throw core::ConfigException(fmt::format("Commission rate must be non-negative, got {}.", commission_rate));
        }
        if (!std::isfinite(slippage_rate) || slippage_rate < 0.0 || slippage_rate >= 1.0) {
            throw core::ConfigException(fmt::format("Slippage rate must be within [0, 1), got {}.", slippage_rate));
        }
        if (!std::isfinite(risk_free_rate)) {
            throw core::ConfigException("Risk-free rate must be finite.");
        }
        if (progress_log_interval <= 0) {
            throw core::ConfigException("Progress log interval must be positive.");
        }
    }

    BacktestConfig BacktestConfig::fromJson(const json& config) {
        if (!config.is_object()) {
            throw core::ConfigException("Engine config must be a JSON object.");
        }
        BacktestConfig cfg;
        cfg.initial_capital = readNumber(config, "initial_capital", cfg.initial_capital);
        cfg.commission_rate = readNumber(config, "commission_rate", cfg.commission_rate);
        cfg.slippage_rate = readNumber(config, "slippage_rate", cfg.slippage_rate);
        cfg.risk_free_rate = readNumber(config, "risk_free_rate", cfg.risk_free_rate);
        if (config.contains("progress_log_interval")) {
            if (!config["progress_log_interval"].is_number_integer()) {
                throw core::ConfigException("Config key 'progress_log_interval' must be an integer.");
            }
            cfg.progress_log_interval = config["progress_log_interval"].get<int>();
        }
        cfg.validate();
        return cfg;
    }

    json BacktestConfig::toJson() const {
        return json{
            {"initial_capital", initial_capital},
            {"commission_rate", commission_rate},
            {"slippage_rate", slippage_rate},
            {"risk_free_rate", risk_free_rate},
            {"progress_log_interval", progress_log_interval}
        };
    }

    json loadJsonFile(const std::string& path) {
        core::logging::getLogger()->info("Loading JSON config from: {}", path);
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw core::ConfigException(fmt::format("Failed to open config file: {}", path));
        }
        try {
            return json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw core::ConfigException(fmt::format("Failed to parse config file '{}': {}", path, e.what()));
        }
    }

} // namespace backtester
