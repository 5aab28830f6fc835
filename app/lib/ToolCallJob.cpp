/*
 * Tool-calling job implementation
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "ToolCallJob.hpp"
#include "Logger.hpp"
#include "ProviderUtils.hpp"

#include <memory>

ToolCallJob::ToolCallJob(ChatProviderPtr provider, ToolCallJobOptions options)
    : provider_(std::move(provider))
    , options_(std::move(options))
{}

ToolCallJobOptions ToolCallJob::default_options()
{
    ToolCallJobOptions options;
    options.tool.name = "get_current_weather";
    options.tool.description = "Get the current weather for a given location";

    Json::Value location(Json::objectValue);
    location["type"] = "string";
    location["description"] = "The city and state, e.g. San Francisco, CA";

    Json::Value parameters(Json::objectValue);
    parameters["type"] = "object";
    parameters["properties"]["location"] = location;
    parameters["required"].append("location");
    options.tool.parameters = parameters;
    return options;
}

JobExecution ToolCallJob::operator()(const DispatchJob& job,
                                     const Host& host,
                                     int worker_id,
                                     const CancellationToken& cancel) const
{
    if (!provider_) {
        return JobExecution::transport_error("no provider configured");
    }

    StreamRequest request;
    request.host = host;
    request.model = job.name;
    request.history.push_back({"user", options_.prompt});
    request.system_prompt = host.system_prompt;
    request.tools.push_back(options_.tool);
    request.disable_streaming = options_.disable_streaming;
    request.timeout_ms = job.timeout_ms;
    request.cancel = cancel;

    std::string content;
    Json::Value tool_calls(Json::arrayValue);
    std::string model = job.name;

    StreamCallbacks callbacks;
    callbacks.on_chunk = [&content](const ChatMessage& msg) -> std::optional<std::string> {
        content += msg.content;
        return std::nullopt;
    };
    callbacks.on_complete = [&tool_calls, &model](const StreamMetadata& meta) -> std::optional<std::string> {
        tool_calls = meta.tool_calls;
        if (!meta.model.empty()) {
            model = meta.model;
        }
        return std::nullopt;
    };

    if (auto logger = Logger::get_logger("dispatch_logger")) {
        logger->debug("[Worker {} | Host {}] Sending tool-call request for {}", worker_id, host.identifier(), job.name);
    }

    auto status = provider_->stream(request, callbacks);
    if (!status.success) {
        if (status.error_code == ProviderErrorCode::Http && status.http_status > 0) {
            Json::Value error(Json::objectValue);
            error["error"] = status.error_message;
            return JobExecution::response(status.http_status, ProviderUtils::to_compact_json(error));
        }
        return JobExecution::transport_error(status.error_message);
    }

    Json::Value payload(Json::objectValue);
    payload["model"] = model;
    payload["content"] = content;
    payload["tool_calls"] = tool_calls.isArray() ? tool_calls : Json::Value(Json::arrayValue);
    return JobExecution::response(200, ProviderUtils::to_compact_json(payload));
}

ResetHook make_unload_reset(ChatProviderPtr provider,
                            std::vector<Host> hosts,
                            std::vector<std::string> models)
{
    return [provider = std::move(provider), hosts = std::move(hosts), models = std::move(models)]
        (const CancellationToken& cancel) {
        if (!provider) {
            return;
        }
        auto logger = Logger::get_logger("dispatch_logger");
        if (logger) {
            logger->info("Unloading {} model(s) from {} host(s)", models.size(), hosts.size());
        }
        for (const auto& host : hosts) {
            for (const auto& model : models) {
                if (cancel.is_cancelled()) {
                    return;
                }
                auto status = provider->unload_model(host, model, cancel);
                if (!status.success && logger) {
                    logger->warn("Unload of {} on {} failed: {}", model, host.identifier(), status.error_message);
                }
            }
        }
    };
}
