/*
 * llama.cpp provider implementation
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "LlamaCppProvider.hpp"
#include "Logger.hpp"
#include "ProviderUtils.hpp"

#include <chrono>
#include <cmath>
#include <limits>
#include <thread>

using ProviderUtils::parse_json;
using ProviderUtils::to_compact_json;
using ProviderUtils::to_lower;
using ProviderUtils::trim;

namespace {

std::string string_field(const Json::Value& node, const char* key)
{
    if (!node.isObject()) {
        return {};
    }
    const Json::Value& value = node[key];
    return value.isString() ? value.asString() : std::string();
}

double number_field(const Json::Value& node, const char* key)
{
    if (!node.isObject()) {
        return 0.0;
    }
    const Json::Value& value = node[key];
    return value.isNumeric() ? value.asDouble() : 0.0;
}

int count_field(const Json::Value& node, const char* key)
{
    if (!node.isObject()) {
        return 0;
    }
    const Json::Value& value = node[key];
    return value.isInt() ? value.asInt() : 0;
}

// Negative, non-finite or unrepresentable durations read as 0
int64_t ms_to_ns(double ms)
{
    const double ns = ms * 1e6;
    if (!std::isfinite(ns) || ns <= 0.0 ||
        ns >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
        return 0;
    }
    return static_cast<int64_t>(ns);
}

// Status is either a plain string or {"value": "..."}
std::string status_value(const Json::Value& status)
{
    if (status.isString()) {
        return trim(status.asString());
    }
    return trim(string_field(status, "value"));
}

LlamaCppModel model_from_json(const Json::Value& node)
{
    LlamaCppModel model;
    if (node.isString()) {
        model.name = node.asString();
        return model;
    }
    model.id = string_field(node, "id");
    model.name = string_field(node, "name");
    model.model = string_field(node, "model");
    model.path = string_field(node, "path");
    if (node.isObject()) {
        model.status = status_value(node["status"]);
    }
    return model;
}

bool is_already_loaded_error(int status_code, const std::string& body)
{
    if (status_code != 400) {
        return false;
    }
    if (to_lower(body).find("already loaded") != std::string::npos) {
        return true;
    }
    if (auto parsed = parse_json(body); parsed && parsed->isObject()) {
        const std::string message = string_field((*parsed)["error"], "message");
        return to_lower(message).find("already loaded") != std::string::npos;
    }
    return false;
}

// Drop empty non-assistant turns and default missing roles to "user"
std::vector<ChatMessage> sanitize_messages(const std::vector<ChatMessage>& messages)
{
    std::vector<ChatMessage> sanitized;
    sanitized.reserve(messages.size());
    for (const auto& msg : messages) {
        std::string role = trim(msg.role);
        std::string content = trim(msg.content);
        if (role.empty()) {
            role = "user";
        }
        if (role != "assistant" && content.empty()) {
            continue;
        }
        sanitized.push_back({std::move(role), std::move(content)});
    }
    return sanitized;
}

const Json::Value& first_choice(const Json::Value& root)
{
    static const Json::Value empty(Json::objectValue);
    const Json::Value& choices = root["choices"];
    if (!choices.isArray() || choices.empty() || !choices[0].isObject()) {
        return empty;
    }
    return choices[0];
}

const Json::Value& object_field(const Json::Value& node, const char* key)
{
    static const Json::Value empty(Json::objectValue);
    if (!node.isObject()) {
        return empty;
    }
    const Json::Value& value = node[key];
    return value.isObject() ? value : empty;
}

void append_tool_calls(Json::Value& out, const Json::Value& message)
{
    const Json::Value& calls = message["tool_calls"];
    if (!calls.isArray()) {
        return;
    }
    for (const auto& call : calls) {
        out.append(call);
    }
}

void apply_timings(StreamMetadata& meta, const Json::Value& timings)
{
    if (!timings.isObject()) {
        return;
    }
    const double prompt_ms = number_field(timings, "prompt_ms");
    const double predicted_ms = number_field(timings, "predicted_ms");
    meta.total_duration = ms_to_ns(prompt_ms + predicted_ms);
    meta.load_duration = 0;
    meta.prompt_eval_count = count_field(timings, "prompt_n");
    meta.prompt_eval_duration = ms_to_ns(prompt_ms);
    meta.eval_count = count_field(timings, "predicted_n");
    meta.eval_duration = ms_to_ns(predicted_ms);
}

} // namespace

std::string LlamaCppModel::display_name() const
{
    for (const auto* candidate : {&id, &name, &model, &path}) {
        std::string trimmed = trim(*candidate);
        if (!trimmed.empty()) {
            return trimmed;
        }
    }
    return {};
}

LlamaCppProvider::LlamaCppProvider(LlamaCppConfig config, HttpClient http_client)
    : config_(std::move(config))
    , http_client_(std::move(http_client))
{}

HttpResponse LlamaCppProvider::make_request(const Host& host,
                                            const std::string& endpoint,
                                            const std::string& method,
                                            const std::string& body,
                                            long timeout_ms,
                                            const CancellationToken& cancel,
                                            bool event_stream,
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
    if (event_stream) {
        request.headers.emplace_back("Accept", "text/event-stream");
    }

    if (config_.debug) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->debug("FLEETMUX->LLM [{}] {} {} {}", host.identifier(), method, request.url, body);
        }
    }

    if (http_client_) {
        return http_client_(request);
    }
    return curl_http_client(request);
}

std::optional<std::vector<LlamaCppModel>> LlamaCppProvider::parse_models(const std::string& body)
{
    auto root = parse_json(body);
    if (!root) {
        return std::nullopt;
    }

    const Json::Value* list = nullptr;
    if (root->isObject()) {
        if ((*root)["models"].isArray() && !(*root)["models"].empty()) {
            list = &(*root)["models"];
        } else if ((*root)["data"].isArray() && !(*root)["data"].empty()) {
            list = &(*root)["data"];
        }
    } else if (root->isArray() && !root->empty()) {
        list = &(*root);
    }

    if (!list) {
        return std::nullopt;
    }

    std::vector<LlamaCppModel> models;
    for (const auto& node : *list) {
        models.push_back(model_from_json(node));
    }
    return models;
}

ProviderStatus LlamaCppProvider::fetch_models(const Host& host,
                                              const CancellationToken& cancel,
                                              std::vector<LlamaCppModel>& models) const
{
    auto response = make_request(host, kModelsEndpoint, "GET", "", config_.timeout_ms, cancel);
    auto status = ProviderUtils::status_from_http(response, "llama.cpp: /models");
    if (!status.success) {
        return status;
    }

    auto parsed = parse_models(response.body);
    if (!parsed) {
        return ProviderStatus::error(ProviderErrorCode::Protocol, "llama.cpp: unrecognized /models response");
    }
    models = std::move(*parsed);
    return ProviderStatus::ok();
}

ModelListResult LlamaCppProvider::list_loaded_models(const Host& host, const CancellationToken& cancel)
{
    ModelListResult result;
    std::vector<LlamaCppModel> models;
    result.status = fetch_models(host, cancel, models);
    if (!result.status.success) {
        return result;
    }

    for (const auto& model : models) {
        if (to_lower(model.status) != "loaded") {
            continue;
        }
        std::string name = model.display_name();
        if (!name.empty()) {
            result.models.push_back(std::move(name));
        }
    }
    return result;
}

ProviderStatus LlamaCppProvider::wait_for_model_loaded(const Host& host,
                                                       const std::string& model,
                                                       const CancellationToken& cancel) const
{
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.timeout_ms);
    const auto interval = std::chrono::milliseconds(config_.load_poll_interval_ms);

    while (true) {
        std::vector<LlamaCppModel> models;
        auto status = fetch_models(host, cancel, models);
        if (!status.success) {
            return status;
        }
        for (const auto& item : models) {
            if (to_lower(item.display_name()) == to_lower(model) && to_lower(item.status) == "loaded") {
                return ProviderStatus::ok();
            }
        }

        if (cancel.is_cancelled()) {
            return ProviderStatus::error(ProviderErrorCode::Cancelled,
                                         "llama.cpp: waiting for model " + model + " cancelled");
        }
        if (std::chrono::steady_clock::now() + interval > deadline) {
            return ProviderStatus::error(ProviderErrorCode::Transport,
                                         "llama.cpp: model " + model + " did not load before timeout");
        }
        std::this_thread::sleep_for(interval);
    }
}

ProviderStatus LlamaCppProvider::ensure_model_ready(const Host& host,
                                                    const std::string& model,
                                                    const CancellationToken& cancel)
{
    Json::Value payload(Json::objectValue);
    payload["model"] = model;

    auto response = make_request(host, kLoadEndpoint, "POST", to_compact_json(payload),
                                 config_.timeout_ms, cancel);
    if (!response.transport_ok()) {
        return ProviderUtils::status_from_http(response, "llama.cpp: /models/load");
    }

    if (response.status_code == 404 || response.status_code == 405) {
        // Router endpoints not available; the server loads on first request.
        return ProviderStatus::ok();
    }
    if (response.status_code >= 400 && !is_already_loaded_error(response.status_code, response.body)) {
        return ProviderUtils::status_from_http(response, "llama.cpp: /models/load");
    }
    return wait_for_model_loaded(host, model, cancel);
}

ProviderStatus LlamaCppProvider::unload_model(const Host& host,
                                              const std::string& model,
                                              const CancellationToken& cancel)
{
    Json::Value payload(Json::objectValue);
    payload["model"] = model;

    auto response = make_request(host, kUnloadEndpoint, "POST", to_compact_json(payload),
                                 config_.timeout_ms, cancel);
    if (response.transport_ok() && (response.status_code == 404 || response.status_code == 405)) {
        return ProviderStatus::ok();
    }
    return ProviderUtils::status_from_http(response, "llama.cpp: /models/unload");
}

ProviderStatus LlamaCppProvider::close()
{
    if (!closed_.exchange(true)) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->debug("LlamaCppProvider closed");
        }
    }
    return ProviderStatus::ok();
}

Json::Value LlamaCppProvider::build_chat_payload(const StreamRequest& request) const
{
    std::vector<ChatMessage> messages;
    if (!request.system_prompt.empty()) {
        messages.push_back({"system", request.system_prompt});
    }
    messages.insert(messages.end(), request.history.begin(), request.history.end());

    Json::Value payload(Json::objectValue);
    payload["model"] = request.model;
    payload["messages"] = ProviderUtils::messages_to_json("", sanitize_messages(messages));
    payload["stream"] = !request.disable_streaming;

    if (request.json_mode) {
        Json::Value format(Json::objectValue);
        format["type"] = "json_object";
        payload["response_format"] = format;
    }
    if (!request.tools.empty()) {
        payload["tools"] = ProviderUtils::tools_to_json(request.tools);
        payload["tool_choice"] = "auto";
    }
    return payload;
}

ProviderStatus LlamaCppProvider::handle_single_response(const StreamRequest& request,
                                                        const HttpResponse& response,
                                                        const StreamCallbacks& callbacks) const
{
    std::string errors;
    auto root = parse_json(response.body, &errors);
    if (!root || !root->isObject()) {
        return ProviderStatus::error(ProviderErrorCode::Protocol,
                                     "llama.cpp: chat response was not valid JSON: " + errors);
    }
    if (!(*root)["choices"].isArray() || (*root)["choices"].empty()) {
        return ProviderStatus::error(ProviderErrorCode::Protocol,
                                     "llama.cpp: chat response contained no choices");
    }

    const Json::Value& message = object_field(first_choice(*root), "message");
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
        StreamMetadata meta;
        meta.model = string_field(*root, "model");
        if (meta.model.empty()) {
            meta.model = request.model;
        }
        meta.created_at = std::chrono::system_clock::now();
        meta.done = true;
        apply_timings(meta, (*root)["timings"]);
        append_tool_calls(meta.tool_calls, message);
        if (auto err = callbacks.on_complete(meta)) {
            return ProviderStatus::error(ProviderErrorCode::Callback, *err);
        }
    }
    return ProviderStatus::ok();
}

ProviderStatus LlamaCppProvider::handle_streaming(const StreamRequest& request,
                                                  const std::string& body,
                                                  long timeout_ms,
                                                  const StreamCallbacks& callbacks) const
{
    LineSplitter splitter;
    std::optional<std::string> callback_error;
    std::string protocol_error;
    bool established = false;
    bool finished = false;
    std::string final_model;
    Json::Value timings;
    Json::Value tool_calls(Json::arrayValue);

    auto on_line = [&](const std::string& line) -> bool {
        const std::string trimmed = trim(line);
        if (finished || trimmed.rfind("data:", 0) != 0) {
            return true;
        }
        const std::string data = trim(trimmed.substr(5));
        if (data == "[DONE]") {
            finished = true;
            return true;
        }

        std::string errors;
        auto chunk = parse_json(data, &errors);
        if (!chunk || !chunk->isObject()) {
            protocol_error = "llama.cpp: invalid stream chunk: " + errors;
            return false;
        }
        established = true;

        const std::string model = string_field(*chunk, "model");
        if (!model.empty()) {
            final_model = model;
        }
        if ((*chunk)["timings"].isObject()) {
            timings = (*chunk)["timings"];
        }

        const Json::Value& choice = first_choice(*chunk);
        const Json::Value& delta = object_field(choice, "delta");
        const Json::Value& message = object_field(choice, "message");
        append_tool_calls(tool_calls, delta);
        append_tool_calls(tool_calls, message);

        std::string content = string_field(delta, "content");
        std::string role = string_field(delta, "role");
        if (content.empty() && !string_field(message, "content").empty()) {
            content = string_field(message, "content");
            role = string_field(message, "role");
        }
        if (role.empty()) {
            role = "assistant";
        }
        if (callbacks.on_chunk && !trim(content).empty()) {
            if (auto err = callbacks.on_chunk({role, content})) {
                callback_error = *err;
                return false;
            }
        }
        return true;
    };

    auto response = make_request(request.host, kChatEndpoint, "POST", body, timeout_ms, request.cancel,
                                 true, [&](const std::string& data) { return splitter.feed(data, on_line); });
    if (response.success()) {
        splitter.finish(on_line);
    }

    auto build_metadata = [&](bool done) {
        StreamMetadata meta;
        meta.model = final_model.empty() ? request.model : final_model;
        meta.created_at = std::chrono::system_clock::now();
        meta.done = done;
        apply_timings(meta, timings);
        meta.tool_calls = tool_calls;
        return meta;
    };

    if (callback_error) {
        return ProviderStatus::error(ProviderErrorCode::Callback, *callback_error);
    }

    ProviderStatus failure = ProviderStatus::ok();
    if (!protocol_error.empty()) {
        failure = ProviderStatus::error(ProviderErrorCode::Protocol, protocol_error);
    } else if (!response.success()) {
        failure = ProviderUtils::status_from_http(response, "llama.cpp: /v1/chat/completions");
    }

    if (!failure.success) {
        if (established && callbacks.on_complete) {
            if (auto err = callbacks.on_complete(build_metadata(false))) {
                if (auto logger = Logger::get_logger("core_logger")) {
                    logger->debug("LlamaCppProvider on_complete after failed stream: {}", *err);
                }
            }
        }
        return failure;
    }

    if (callbacks.on_complete) {
        if (auto err = callbacks.on_complete(build_metadata(true))) {
            return ProviderStatus::error(ProviderErrorCode::Callback, *err);
        }
    }
    return ProviderStatus::ok();
}

ProviderStatus LlamaCppProvider::stream(const StreamRequest& request, const StreamCallbacks& callbacks)
{
    if (!trim(request.model).empty()) {
        auto ready = ensure_model_ready(request.host, request.model, request.cancel);
        if (!ready.success) {
            return ready;
        }
    }

    const std::string body = to_compact_json(build_chat_payload(request));
    const long timeout_ms = request.timeout_ms > 0 ? request.timeout_ms : config_.timeout_ms;

    if (!request.disable_streaming) {
        return handle_streaming(request, body, timeout_ms, callbacks);
    }

    auto response = make_request(request.host, kChatEndpoint, "POST", body, timeout_ms, request.cancel);
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

    auto status = ProviderUtils::status_from_http(response, "llama.cpp: /v1/chat/completions");
    if (!status.success) {
        return status;
    }
    return handle_single_response(request, response, callbacks);
}
