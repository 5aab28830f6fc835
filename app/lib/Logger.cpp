/*
 * Logger implementation
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "Logger.hpp"

#include <filesystem>
#include <optional>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

const std::vector<std::string>& Logger::logger_names()
{
    static const std::vector<std::string> names = {
        "core_logger",
        "metrics_logger",
        "dispatch_logger",
    };
    return names;
}

std::optional<std::string> Logger::setup_loggers(const LoggingOptions& options)
{
    std::vector<spdlog::sink_ptr> sinks;
    std::optional<std::string> error;

    if (options.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    if (!options.log_file.empty()) {
        try {
            const auto parent = std::filesystem::path(options.log_file).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.log_file, false));
        } catch (const std::exception& ex) {
            error = std::string("Failed to open log file '") + options.log_file + "': " + ex.what();
        }
    }

    for (const auto& name : logger_names()) {
        spdlog::drop(name);
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(options.level);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }

    return error;
}

std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}
