/*
 * fleetmux command-line entry point
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "AppConfig.hpp"
#include "BatchDispatcher.hpp"
#include "CancellationToken.hpp"
#include "HttpTransport.hpp"
#include "Logger.hpp"
#include "MetricsAggregator.hpp"
#include "ProviderFactory.hpp"
#include "ReportWriter.hpp"
#include "ToolCallCriterion.hpp"
#include "ToolCallJob.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <exception>

namespace {

CancellationToken g_run_token;

void handle_sigint(int)
{
    g_run_token.cancel();
}

void print_usage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " <config.json>\n";
}

} // namespace

int main(int argc, char** argv)
{
    if (argc != 2) {
        print_usage(argv[0]);
        return 2;
    }

    AppConfig config;
    try {
        config = AppConfig::load_from_file(argv[1]);
    } catch (const std::exception& ex) {
        std::cerr << "Failed to load configuration: " << ex.what() << "\n";
        return 1;
    }

    LoggingOptions logging;
    logging.log_file = config.log_file;
    logging.level = config.debug ? spdlog::level::debug : spdlog::level::info;
    if (auto error = Logger::setup_loggers(logging)) {
        std::cerr << *error << "\n";
    }
    auto logger = Logger::get_logger("core_logger");

    CurlGlobal curl_global;
    std::signal(SIGINT, handle_sigint);

    MetricsAggregatorPtr aggregator;
    if (config.metrics) {
        aggregator = std::make_shared<MetricsAggregator>(
            config.metrics_file, std::chrono::seconds(config.metrics_save_interval_seconds));
    }

    ChatProviderPtr provider = ProviderFactory::create_provider_from_config(config, aggregator);
    if (!provider) {
        if (logger) {
            logger->error("No provider could be created from {}", argv[1]);
        }
        return 1;
    }

    if (logger) {
        logger->info("Total models: {}", config.models.size());
        logger->info("Parallel hosts (batch size): {}", config.hosts.size());
        logger->info("Total iterations: {}", config.iterations);
        logger->info("Total requests to be made: {}", config.models.size() * static_cast<std::size_t>(config.iterations));
    }

    DispatchOptions options;
    options.iterations = config.iterations;
    options.job_timeout_ms = config.request_timeout_ms();

    BatchDispatcher dispatcher(config.hosts,
                               ToolCallJob(provider),
                               ToolCallCriterion(),
                               make_unload_reset(provider, config.hosts, config.models),
                               options);
    DispatchReport report = dispatcher.run(config.models, g_run_token);

    std::cout << ReportWriter::format_summary(report);

    int exit_code = 0;
    if (auto error = ReportWriter::write_json_file(config.responses_file, ReportWriter::responses_to_json(report))) {
        if (logger) {
            logger->error("Failed to save responses: {}", *error);
        }
        exit_code = 1;
    } else if (logger) {
        logger->info("Saved all responses to {}", config.responses_file);
    }
    if (auto error = ReportWriter::write_json_file(config.report_file, ReportWriter::summary_to_json(report))) {
        if (logger) {
            logger->error("Failed to save report: {}", *error);
        }
        exit_code = 1;
    } else if (logger) {
        logger->info("Saved report to {}", config.report_file);
    }

    auto close_status = provider->close();
    if (!close_status.success && logger) {
        logger->warn("Provider close failed: {}", close_status.error_message);
    }

    if (aggregator) {
        if (auto error = aggregator->close()) {
            if (logger) {
                logger->error("Final metrics save failed: {}", *error);
            }
            exit_code = 1;
        }
    }

    if (report.cancelled) {
        if (logger) {
            logger->warn("Run was interrupted");
        }
        return 130;
    }
    return exit_code;
}
