#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class BacktestPlatformException : public std::runtime_error {
    public:
        explicit BacktestPlatformException(const std::string& message)
            : std::runtime_error(message) {}

        explicit BacktestPlatformException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigException : public BacktestPlatformException {
    public: using BacktestPlatformException::BacktestPlatformException; };

    class DataLoadException : public BacktestPlatformException {
    public: using BacktestPlatformException::BacktestPlatformException; };

    class IndicatorCalculationException : public BacktestPlatformException {
    public: using BacktestPlatformException::BacktestPlatformException; };

    class StrategyException : public BacktestPlatformException {
    public: using BacktestPlatformException::BacktestPlatformException; };

    class OrderValidationException : public BacktestPlatformException {
    public: using BacktestPlatformException::BacktestPlatformException; };

    class BacktestException : public BacktestPlatformException {
    public: using BacktestPlatformException::BacktestPlatformException; };

} // namespace core
