/**
 * @file logger.h
 * @brief Structured Logging Wrapper
 *
 * Wraps spdlog with the sink and pattern configuration used by the
 * pdftrust command line tool. Library code only calls spdlog::* and never
 * configures sinks itself.
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace pdftrust::common {

/**
 * @brief Logger initialization and configuration
 */
class Logger {
public:
    /**
     * @brief Initialize the default logger
     * @param name Logger name shown in every line (e.g., "pdftrust-verify")
     * @param logLevel Log level (trace, debug, info, warn, error, critical)
     * @param logToFile Enable rotating file sink
     * @param logFile Log file path
     */
    static void initialize(
        const std::string& name,
        const std::string& logLevel = "info",
        bool logToFile = false,
        const std::string& logFile = ""
    ) {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            // Diagnostics go to stderr so stdout stays clean for JSON reports
            auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            sinks.push_back(consoleSink);

            if (logToFile && !logFile.empty()) {
                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logFile, 1024 * 1024 * 10, 3  // 10MB, 3 files
                );
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
                sinks.push_back(fileSink);
            }

            auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
            logger->set_level(parseLevel(logLevel));

            spdlog::set_default_logger(logger);
            spdlog::flush_on(spdlog::level::warn);

            spdlog::debug("Logger initialized: name={}, level={}, file={}",
                          name, logLevel, logToFile ? logFile : "none");

        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        }
    }

    /**
     * @brief Set log level at runtime
     */
    static void setLevel(const std::string& level) {
        spdlog::set_level(parseLevel(level));
    }

    /**
     * @brief Flush the default logger
     */
    static void flush() {
        spdlog::default_logger()->flush();
    }

    /// Unknown names map to info
    static spdlog::level::level_enum parseLevel(const std::string& level) {
        if (level == "trace") return spdlog::level::trace;
        if (level == "debug") return spdlog::level::debug;
        if (level == "info") return spdlog::level::info;
        if (level == "warn") return spdlog::level::warn;
        if (level == "error") return spdlog::level::err;
        if (level == "critical") return spdlog::level::critical;
        if (level == "off") return spdlog::level::off;
        return spdlog::level::info;
    }
};

} // namespace pdftrust::common
