/*
 * Named spdlog loggers shared across the application
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

/**
 * Logger setup options
 */
struct LoggingOptions {
    std::string log_file;                    // Empty disables the file sink
    spdlog::level::level_enum level{spdlog::level::info};
    bool console{true};
};

/**
 * Creates and hands out the application's named loggers
 *
 * Loggers:
 * - core_logger: providers, factory and configuration
 * - metrics_logger: aggregator and metrics decorator
 * - dispatch_logger: batch dispatcher
 */
class Logger {
public:
    /**
     * Create (or recreate) all named loggers with shared sinks
     * @return Error message if the log file could not be opened
     */
    static std::optional<std::string> setup_loggers(const LoggingOptions& options);

    /**
     * Get a logger by name
     * @return Logger or nullptr if setup_loggers() has not registered it
     */
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    static const std::vector<std::string>& logger_names();
};

#endif // LOGGER_HPP
