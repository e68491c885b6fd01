#include "logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/chrono.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <memory>
#include <system_error>
#include <vector>

namespace core {
namespace logging {

    namespace {

        std::shared_ptr<spdlog::logger> global_logger;

        const char* const kLoggerName = "Backtest";
        const char* const kLogPattern = "[%Y-%m-%d %H:%M:%S.%e%z] [%^%l%$] [%n] %v";
        const char* const kLogDirectory = "logs";
        constexpr std::size_t kMaxFileSize = 10 * 1024 * 1024;
        constexpr std::size_t kMaxFiles = 5;

        // "logs" if it exists or can be created, else the working directory
        std::filesystem::path resolveLogDirectory() {
            std::filesystem::path dir(kLogDirectory);
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
            if (ec) {
                std::cerr << "[Logging] Cannot use log directory '" << dir.string() << "': "
                          << ec.message() << ". Falling back to '.'" << std::endl;
                return std::filesystem::path(".");
            }
            return dir;
        }

        // <base>_<YYYYmmdd_HHMMSS>Z.log, stamped in UTC
        std::string logFileName(const std::string& base) {
            std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm utc_tm{};
            #ifdef _WIN32
                gmtime_s(&utc_tm, &now);
            #else
                gmtime_r(&now, &utc_tm);
            #endif
            return fmt::format("{}_{:%Y%m%d_%H%M%S}Z.log", base, utc_tm);
        }

        std::shared_ptr<spdlog::logger> makeConsoleOnlyLogger(spdlog::level::level_enum level) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern(kLogPattern);
            auto logger = std::make_shared<spdlog::logger>(kLoggerName, console_sink);
            logger->set_level(level);
            return logger;
        }

    } // end anonymous namespace

    void initialize(const std::string& base_log_filename,
                    spdlog::level::level_enum console_level,
                    spdlog::level::level_enum file_level)
    {
        if (const char* env_level = std::getenv("SPDLOG_LEVEL")) {
            console_level = file_level = level_from_string(env_level);
            std::cout << "[Logging] SPDLOG_LEVEL overrides log levels: " << env_level << std::endl;
        }

        try {
            const std::string log_file_path = (resolveLogDirectory() / logFileName(base_log_filename)).string();

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(console_level);
            console_sink->set_pattern(kLogPattern);

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file_path, kMaxFileSize, kMaxFiles, true);
            file_sink->set_level(file_level);
            file_sink->set_pattern(kLogPattern);

            std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
            auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
            logger->set_level(std::min(console_level, file_level));
            logger->flush_on(spdlog::level::err);

            // Re-initialization replaces the registered logger
            spdlog::drop(kLoggerName);
            spdlog::register_logger(logger);
            spdlog::set_default_logger(logger);
            global_logger = logger;

            global_logger->info("Logging initialized. Console: {}, File: {} -> {}",
                                spdlog::level::to_string_view(console_level),
                                spdlog::level::to_string_view(file_level),
                                log_file_path);
        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        } catch (const std::exception& ex) {
            std::cerr << "Log initialization failed (std::exception): " << ex.what() << std::endl;
        }
    }

    std::shared_ptr<spdlog::logger>& getLogger() {
        if (!global_logger) {
            global_logger = makeConsoleOnlyLogger(spdlog::level::warn);
        }
        return global_logger;
    }

    spdlog::level::level_enum level_from_string(const std::string& level_str) {
        std::string lower = level_str;
        std::transform(lower.begin(), lower.end(), lower.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "trace") return spdlog::level::trace;
        if (lower == "debug") return spdlog::level::debug;
        if (lower == "info") return spdlog::level::info;
        if (lower == "warn" || lower == "warning") return spdlog::level::warn;
        if (lower == "error" || lower == "err") return spdlog::level::err;
        if (lower == "critical" || lower == "crit") return spdlog::level::critical;
        if (lower == "off") return spdlog::level::off;

        std::cerr << "[Logging] Unrecognized log level '" << level_str << "', using info." << std::endl;
        return spdlog::level::info;
    }

} // namespace logging
} // namespace core
