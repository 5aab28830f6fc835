/*
 * Application configuration: hosts, models and run settings
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef APP_CONFIG_HPP
#define APP_CONFIG_HPP

#include <string>
#include <vector>

/**
 * Canonical host type keys
 */
inline constexpr const char* kHostTypeOllama = "ollama";
inline constexpr const char* kHostTypeLlamaCpp = "llama.cpp";

/**
 * Lower-case, trim and collapse known aliases of a host type
 *
 * "" and "ollama" become "ollama"; "llama.cpp" and "llamacpp" become
 * "llama.cpp". Unknown types are returned lower-cased and trimmed.
 */
std::string normalize_host_type(const std::string& host_type);

/**
 * A single backend host that can serve language models
 */
struct Host {
    std::string name;
    std::string url;                         // e.g., "http://10.0.0.5:11434"
    std::string type;                        // As declared in configuration
    std::vector<std::string> models;
    std::string system_prompt;

    /**
     * Name if set, otherwise the URL
     */
    std::string identifier() const { return name.empty() ? url : name; }
};

/**
 * Settings consumed by the dispatcher, providers and metrics
 */
struct AppConfig {
    static constexpr int kDefaultTimeoutSeconds = 600;
    static constexpr int kDefaultSaveIntervalSeconds = 60;

    std::vector<Host> hosts;
    std::vector<std::string> models;         // Job identities to exercise
    int iterations{1};
    bool metrics{false};
    bool debug{false};
    int timeout_seconds{kDefaultTimeoutSeconds};
    std::string metrics_file{"reports/data/model_performance_metrics.json"};
    int metrics_save_interval_seconds{kDefaultSaveIntervalSeconds};
    std::string report_file{"reports/model_tools_report.json"};
    std::string responses_file{"reports/responses.json"};
    std::string log_file{"logs/fleetmux.log"};

    /**
     * Per-request timeout in milliseconds, falling back to the default
     * when the configured value is not positive
     */
    long request_timeout_ms() const;

    /**
     * Load and validate a configuration file
     * @throws std::runtime_error on unreadable, malformed or invalid input
     */
    static AppConfig load_from_file(const std::string& path);

    /**
     * Parse and validate a configuration document
     * @throws std::runtime_error on malformed or invalid input
     */
    static AppConfig parse(const std::string& json_text);
};

#endif // APP_CONFIG_HPP
