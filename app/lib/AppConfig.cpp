/*
 * Application configuration implementation
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "AppConfig.hpp"
#include "Logger.hpp"
#include "ProviderUtils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

namespace {

using ProviderUtils::trim;

int int_setting(const Json::Value& root, const char* field, int fallback)
{
    const Json::Value& value = root[field];
    if (value.isNull()) {
        return fallback;
    }
    if (!value.isInt()) {
        throw std::runtime_error(std::string("Configuration field '") + field + "' must be an integer");
    }
    return value.asInt();
}

bool bool_setting(const Json::Value& root, const char* field, bool fallback)
{
    const Json::Value& value = root[field];
    if (value.isNull()) {
        return fallback;
    }
    if (!value.isBool()) {
        throw std::runtime_error(std::string("Configuration field '") + field + "' must be a boolean");
    }
    return value.asBool();
}

std::string string_setting(const Json::Value& root, const char* field, const std::string& fallback)
{
    const Json::Value& value = root[field];
    if (value.isNull()) {
        return fallback;
    }
    if (!value.isString()) {
        throw std::runtime_error(std::string("Configuration field '") + field + "' must be a string");
    }
    return value.asString();
}

std::vector<std::string> read_string_array(const Json::Value& value, const std::string& field)
{
    std::vector<std::string> out;
    if (value.isNull()) {
        return out;
    }
    if (!value.isArray()) {
        throw std::runtime_error("Configuration field '" + field + "' must be an array of strings");
    }
    for (const auto& item : value) {
        if (!item.isString()) {
            throw std::runtime_error("Configuration field '" + field + "' must be an array of strings");
        }
        out.push_back(item.asString());
    }
    return out;
}

Host parse_host(const Json::Value& node, Json::ArrayIndex index)
{
    if (!node.isObject()) {
        throw std::runtime_error("Host entry " + std::to_string(index) + " must be an object");
    }

    Host host;
    host.name = string_setting(node, "name", "");
    host.url = trim(string_setting(node, "url", ""));
    host.type = string_setting(node, "type", "");
    host.models = read_string_array(node["models"], "hosts[].models");
    host.system_prompt = string_setting(node, "systemprompt", "");

    while (!host.url.empty() && host.url.back() == '/') {
        host.url.pop_back();
    }
    if (host.url.empty()) {
        throw std::runtime_error("Host entry " + std::to_string(index) + " is missing a url");
    }
    return host;
}

} // namespace

std::string normalize_host_type(const std::string& host_type)
{
    std::string normalized = trim(host_type);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (normalized.empty() || normalized == "ollama") {
        return kHostTypeOllama;
    }
    if (normalized == "llama.cpp" || normalized == "llamacpp") {
        return kHostTypeLlamaCpp;
    }
    return normalized;
}

long AppConfig::request_timeout_ms() const
{
    const int seconds = timeout_seconds > 0 ? timeout_seconds : kDefaultTimeoutSeconds;
    return static_cast<long>(seconds) * 1000L;
}

AppConfig AppConfig::load_from_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open configuration file: " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    AppConfig config = parse(buffer.str());

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Loaded configuration from {} ({} hosts, {} models, {} iterations)",
                     path, config.hosts.size(), config.models.size(), config.iterations);
    }
    return config;
}

AppConfig AppConfig::parse(const std::string& json_text)
{
    Json::CharReaderBuilder reader_builder;
    Json::Value root;
    std::istringstream stream(json_text);
    std::string errors;

    if (!Json::parseFromStream(reader_builder, stream, &root, &errors)) {
        throw std::runtime_error("Failed to parse configuration: " + errors);
    }
    if (!root.isObject()) {
        throw std::runtime_error("Configuration root must be a JSON object");
    }

    AppConfig config;

    const Json::Value& hosts = root["hosts"];
    if (!hosts.isArray() || hosts.empty()) {
        throw std::runtime_error("Configuration must list at least one host");
    }
    for (Json::ArrayIndex i = 0; i < hosts.size(); ++i) {
        config.hosts.push_back(parse_host(hosts[i], i));
    }

    config.models = read_string_array(root["models"], "models");
    if (config.models.empty()) {
        throw std::runtime_error("Configuration must list at least one model");
    }

    config.iterations = int_setting(root, "iterations", 1);
    if (config.iterations < 0) {
        throw std::runtime_error("Configuration field 'iterations' must not be negative");
    }

    config.metrics = bool_setting(root, "metrics", false);
    config.debug = bool_setting(root, "debug", false);
    config.timeout_seconds = int_setting(root, "timeout", kDefaultTimeoutSeconds);
    config.metrics_file = string_setting(root, "metricsFile", config.metrics_file);
    config.metrics_save_interval_seconds =
        int_setting(root, "metricsSaveIntervalSeconds", kDefaultSaveIntervalSeconds);
    if (config.metrics_save_interval_seconds <= 0) {
        config.metrics_save_interval_seconds = kDefaultSaveIntervalSeconds;
    }
    config.report_file = string_setting(root, "reportFile", config.report_file);
    config.responses_file = string_setting(root, "responsesFile", config.responses_file);
    config.log_file = string_setting(root, "logFile", config.log_file);

    return config;
}
