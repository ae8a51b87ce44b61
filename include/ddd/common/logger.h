/**
 * @file logger.h
 * @brief Structured Logging Wrapper
 *
 * Wraps spdlog with standardized configuration. Library code logs through
 * the default spdlog logger; applications and test runners call
 * Logger::initialize() once at startup.
 */

#pragma once

#include "ddd/common/config_manager.h"
#include "ddd/utils/string_utils.h"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <iostream>
#include <string>
#include <memory>
#include <vector>

namespace ddd::common {

/**
 * @brief Logger initialization and configuration
 */
class Logger {
public:
    /**
     * @brief Map a level name to a spdlog level (unknown names map to info)
     */
    static spdlog::level::level_enum parseLevel(const std::string& levelName) {
        const std::string level = utils::toLower(utils::trim(levelName));
        if (level == "trace") {
            return spdlog::level::trace;
        } else if (level == "debug") {
            return spdlog::level::debug;
        } else if (level == "warn") {
            return spdlog::level::warn;
        } else if (level == "error") {
            return spdlog::level::err;
        } else if (level == "critical") {
            return spdlog::level::critical;
        } else if (level == "off") {
            return spdlog::level::off;
        }
        return spdlog::level::info;
    }

    /**
     * @brief Initialize the default logger
     * @param loggerName Logger name shown in every line
     * @param logLevel Log level (trace, debug, info, warn, error, critical, off)
     * @param logToFile Enable file logging
     * @param logFile Log file path
     */
    static void initialize(
        const std::string& loggerName,
        const std::string& logLevel = "info",
        bool logToFile = false,
        const std::string& logFile = ""
    ) {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            sinks.push_back(consoleSink);

            if (logToFile && !logFile.empty()) {
                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logFile, 1024 * 1024 * 10, 3  // 10MB, 3 files
                );
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
                sinks.push_back(fileSink);
            }

            auto logger = std::make_shared<spdlog::logger>(loggerName, sinks.begin(), sinks.end());
            logger->set_level(parseLevel(logLevel));

            spdlog::set_default_logger(logger);
            spdlog::flush_on(spdlog::level::warn);

            spdlog::debug("Logger initialized: name={}, level={}, file={}",
                          loggerName, logLevel, logToFile ? logFile : "none");

        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        }
    }

    /**
     * @brief Initialize from DDD_LOG_LEVEL, DDD_LOG_TO_FILE and DDD_LOG_FILE
     */
    static void initializeFromConfig(const std::string& loggerName) {
        auto& config = ConfigManager::getInstance();
        initialize(loggerName,
                   config.getString(ConfigManager::LOG_LEVEL, "info"),
                   config.getBool(ConfigManager::LOG_TO_FILE, false),
                   config.getString(ConfigManager::LOG_FILE, ""));
    }

    /**
     * @brief Set log level at runtime
     */
    static void setLevel(const std::string& level) {
        spdlog::set_level(parseLevel(level));
        spdlog::info("Log level changed to: {}", level);
    }

    /**
     * @brief Flush the default logger
     */
    static void flush() {
        spdlog::default_logger()->flush();
    }
};

} // namespace ddd::common
