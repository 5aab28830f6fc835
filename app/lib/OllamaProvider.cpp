/*
 * Ollama provider implementation
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "OllamaProvider.hpp"
#include "Logger.hpp"
#include "ProviderUtils.hpp"

#include <optional>

using ProviderUtils::parse_json;
using ProviderUtils::to_compact_json;
using ProviderUtils::trim;

namespace {

// Missing, fractional or out-of-range numbers read as 0
int64_t int64_field(const Json::Value& node, const char* key)
{
    const Json::Value& value = node[key];
    return value.isInt64() ? value.asInt64() : 0;
}

int int_field(const Json::Value& node, const char* key)
{
    const Json::Value& value = node[key];
    return value.isInt() ? value.asInt() : 0;
}

std::string string_field(const Json::Value& node, const char* key)
{
    if (!node.isObject()) {
        return {};
    }
    const Json::Value& value = node[key];
    return value.isString() ? value.asString() : std::string();
}

const Json::Value& message_of(const Json::Value& chunk)
{
    static const Json::Value empty(Json::objectValue);
    const Json::Value& message = chunk["message"];
    return message.isObject() ? message : empty;
}

Json::Value tool_calls_of(const Json::Value& message)
{
    const Json::Value& calls = message["tool_calls"];
    return calls.isArray() ? calls : Json::Value(Json::arrayValue);
}

} // namespace

OllamaProvider::OllamaProvider(OllamaConfig config, HttpClient http_client)
    : config_(std::move(config))
    , http_client_(std::move(http_client))
{}

HttpResponse OllamaProvider::make_request(const Host& host,
                                          const std::string& endpoint,
                                          const std::string& method,
                                          const std::string& body,
                                          long timeout_ms,
                                          const CancellationToken& cancel,
                                          HttpBodySink on_data) const
{
    HttpRequest request;
    request.url = ProviderUtils::join_url(host.url, endpoint);
    request.method = method;
    request.body = body;
    request.timeout_ms = timeout_ms > 0 ? timeout_ms : config_.timeout_ms;
    request.cancel = cancel;
    request.on_data = std::move(on_data);
    if (method == "POST") {
        request.headers.emplace_back("Content-Type", "application/json");
    }

    if (http_client_) {
        return http_client_(request);
    }
    return curl_http_client(request);
}

void OllamaProvider::log_tools(const std::vector<ToolDefinition>& tools) const
{
    if (!config_.debug) {
        return;
    }
    auto logger = Logger::get_logger("core_logger");
    if (!logger) {
        return;
    }
    if (tools.empty()) {
        logger->debug("Tools: false");
        return;
    }
    std::string names;
    for (const auto& tool : tools) {
        if (tool.name.empty()) {
            continue;
        }
        if (!names.empty()) {
            names += ", ";
        }
        names += tool.name;
    }
    logger->debug("Tools: true ({})", names);
}

ModelListResult OllamaProvider::list_loaded_models(const Host& host, const CancellationToken& cancel)
{
    ModelListResult result;

    auto response = make_request(host, kPsEndpoint, "GET", "", config_.timeout_ms, cancel);
    result.status = ProviderUtils::status_from_http(response, "ollama: /api/ps");
    if (!result.status.success) {
        return result;
    }

    std::string errors;
    auto root = parse_json(response.body, &errors);
    if (!root || !root->isObject()) {
        result.status = ProviderStatus::error(ProviderErrorCode::Protocol,
                                              "ollama: /api/ps returned invalid JSON: " + errors);
        return result;
    }

    for (const auto& model : (*root)["models"]) {
        const std::string name = string_field(model, "name");
        if (!name.empty()) {
            result.models.push_back(name);
        }
    }
    return result;
}

ProviderStatus OllamaProvider::ensure_model_ready(const Host& host,
                                                  const std::string& model,
                                                  const CancellationToken& cancel)
{
    log_tools({});

    Json::Value payload(Json::objectValue);
    payload["model"] = model;
    payload["prompt"] = ".";
    payload["stream"] = false;

    auto response = make_request(host, kGenerateEndpoint, "POST", to_compact_json(payload),
                                 config_.timeout_ms, cancel);
    auto status = ProviderUtils::status_from_http(response, "ollama: /api/generate");

    if (auto logger = Logger::get_logger("core_logger")) {
        if (status.success) {
            logger->debug("OllamaProvider warmed model {} on {}", model, host.identifier());
        } else {
            logger->warn("OllamaProvider could not warm model {} on {}: {}",
                         model, host.identifier(), status.error_message);
        }
    }
    return status;
}

ProviderStatus OllamaProvider::unload_model(const Host& host,
                                            const std::string& model,
                                            const CancellationToken& cancel)
{
    Json::Value payload(Json::objectValue);
    payload["model"] = model;
    payload["keep_alive"] = 0;

    auto response = make_request(host, kGenerateEndpoint, "POST", to_compact_json(payload),
                                 config_.timeout_ms, cancel);
    return ProviderUtils::status_from_http(response, "ollama: unload " + model);
}

ProviderStatus OllamaProvider::close()
{
    if (!closed_.exchange(true)) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->debug("OllamaProvider closed");
        }
    }
    return ProviderStatus::ok();
}

Json::Value OllamaProvider::build_chat_payload(const StreamRequest& request) const
{
    Json::Value payload(Json::objectValue);
    payload["model"] = request.model;
    payload["messages"] = ProviderUtils::messages_to_json(request.system_prompt, request.history);
    payload["stream"] = !request.disable_streaming;

    if (!request.tools.empty()) {
        payload["tools"] = ProviderUtils::tools_to_json(request.tools);
    }
    if (request.json_mode) {
        payload["format"] = "json";
    }
    return payload;
}

StreamMetadata OllamaProvider::metadata_from_chunk(const Json::Value& chunk,
                                                   const std::string& fallback_model) const
{
    StreamMetadata meta;
    meta.model = string_field(chunk, "model");
    if (meta.model.empty()) {
        meta.model = fallback_model;
    }
    meta.created_at = std::chrono::system_clock::now();
    meta.done = chunk["done"].isBool() && chunk["done"].asBool();
    meta.total_duration = int64_field(chunk, "total_duration");
    meta.load_duration = int64_field(chunk, "load_duration");
    meta.prompt_eval_count = int_field(chunk, "prompt_eval_count");
    meta.prompt_eval_duration = int64_field(chunk, "prompt_eval_duration");
    meta.eval_count = int_field(chunk, "eval_count");
    meta.eval_duration = int64_field(chunk, "eval_duration");
    return meta;
}

ProviderStatus OllamaProvider::handle_single_response(const StreamRequest& request,
                                                      const HttpResponse& response,
                                                      const StreamCallbacks& callbacks) const
{
    if (response.transport_ok() && !response.success() &&
        ProviderUtils::is_no_tool_capability_response(response.body)) {
        if (callbacks.on_chunk) {
            if (auto err = callbacks.on_chunk({"assistant", "This model does not have tool capabilities."})) {
                return ProviderStatus::error(ProviderErrorCode::Callback, *err);
            }
        }
        if (callbacks.on_complete) {
            StreamMetadata meta;
            meta.model = request.model;
            meta.created_at = std::chrono::system_clock::now();
            meta.done = true;
            if (auto err = callbacks.on_complete(meta)) {
                return ProviderStatus::error(ProviderErrorCode::Callback, *err);
            }
        }
        return ProviderStatus::ok();
    }

    auto status = ProviderUtils::status_from_http(response, "ollama: /api/chat");
    if (!status.success) {
        return status;
    }

    std::string errors;
    auto root = parse_json(response.body, &errors);
    if (!root || !root->isObject()) {
        return ProviderStatus::error(ProviderErrorCode::Protocol,
                                     "ollama: /api/chat returned invalid JSON: " + errors);
    }

    const Json::Value& message = message_of(*root);
    const std::string content = string_field(message, "content");
    std::string role = string_field(message, "role");
    if (role.empty()) {
        role = "assistant";
    }

    if (callbacks.on_chunk && !trim(content).empty()) {
        if (auto err = callbacks.on_chunk({role, content})) {
            return ProviderStatus::error(ProviderErrorCode::Callback, *err);
        }
    }

    if (callbacks.on_complete) {
        StreamMetadata meta = metadata_from_chunk(*root, request.model);
        meta.done = true;
        meta.tool_calls = tool_calls_of(message);
        if (auto err = callbacks.on_complete(meta)) {
            return ProviderStatus::error(ProviderErrorCode::Callback, *err);
        }
    }
    return ProviderStatus::ok();
}

ProviderStatus OllamaProvider::stream(const StreamRequest& request, const StreamCallbacks& callbacks)
{
    log_tools(request.tools);

    const std::string body = to_compact_json(build_chat_payload(request));
    const long timeout_ms = request.timeout_ms > 0 ? request.timeout_ms : config_.timeout_ms;

    if (request.disable_streaming) {
        auto response = make_request(request.host, kChatEndpoint, "POST", body, timeout_ms, request.cancel);
        return handle_single_response(request, response, callbacks);
    }

    LineSplitter splitter;
    std::optional<std::string> callback_error;
    std::string protocol_error;
    bool established = false;
    bool done = false;
    Json::Value final_chunk(Json::objectValue);
    Json::Value tool_calls(Json::arrayValue);

    auto on_line = [&](const std::string& line) -> bool {
        const std::string trimmed = trim(line);
        if (trimmed.empty() || done) {
            return true;
        }

        std::string errors;
        auto chunk = parse_json(trimmed, &errors);
        if (!chunk || !chunk->isObject()) {
            protocol_error = "ollama: invalid stream chunk: " + errors;
            return false;
        }
        established = true;

        const Json::Value& message = message_of(*chunk);
        for (const auto& call : tool_calls_of(message)) {
            tool_calls.append(call);
        }

        const std::string content = string_field(message, "content");
        if (callbacks.on_chunk && !content.empty()) {
            std::string role = string_field(message, "role");
            if (role.empty()) {
                role = "assistant";
            }
            if (auto err = callbacks.on_chunk({role, content})) {
                callback_error = *err;
                return false;
            }
        }

        if ((*chunk)["done"].isBool() && (*chunk)["done"].asBool()) {
            final_chunk = *chunk;
            done = true;
        }
        return true;
    };

    auto response = make_request(request.host, kChatEndpoint, "POST", body, timeout_ms, request.cancel,
                                 [&](const std::string& data) { return splitter.feed(data, on_line); });

    // Reports a stream that broke after the backend started answering: the
    // caller still gets one on_complete with whatever metadata arrived.
    auto fail_established = [&](ProviderStatus status) {
        if (established && callbacks.on_complete) {
            StreamMetadata meta = metadata_from_chunk(final_chunk, request.model);
            meta.done = false;
            meta.tool_calls = tool_calls;
            if (auto err = callbacks.on_complete(meta)) {
                if (auto logger = Logger::get_logger("core_logger")) {
                    logger->debug("OllamaProvider on_complete after failed stream: {}", *err);
                }
            }
        }
        return status;
    };

    if (callback_error) {
        return ProviderStatus::error(ProviderErrorCode::Callback, *callback_error);
    }
    if (!protocol_error.empty()) {
        return fail_established(ProviderStatus::error(ProviderErrorCode::Protocol, protocol_error));
    }
    if (!response.success()) {
        return fail_established(ProviderUtils::status_from_http(response, "ollama: /api/chat"));
    }

    splitter.finish(on_line);
    if (callback_error) {
        return ProviderStatus::error(ProviderErrorCode::Callback, *callback_error);
    }
    if (!protocol_error.empty()) {
        return fail_established(ProviderStatus::error(ProviderErrorCode::Protocol, protocol_error));
    }
    if (!done) {
        return fail_established(ProviderStatus::error(ProviderErrorCode::Protocol,
                                                      "ollama: stream ended without a final chunk"));
    }

    if (callbacks.on_complete) {
        StreamMetadata meta = metadata_from_chunk(final_chunk, request.model);
        meta.tool_calls = tool_calls;
        if (auto err = callbacks.on_complete(meta)) {
            return ProviderStatus::error(ProviderErrorCode::Callback, *err);
        }
    }
    return ProviderStatus::ok();
}
