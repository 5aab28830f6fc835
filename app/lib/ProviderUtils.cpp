/*
 * Provider helper implementation
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "ProviderUtils.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>

namespace ProviderUtils {

std::string to_compact_json(const Json::Value& value)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

std::optional<Json::Value> parse_json(const std::string& text, std::string* errors)
{
    Json::CharReaderBuilder reader_builder;
    reader_builder["failIfExtra"] = true;
    std::unique_ptr<Json::CharReader> reader(reader_builder.newCharReader());
    Json::Value root;
    std::string parse_errors;

    if (!reader->parse(text.data(), text.data() + text.size(), &root, &parse_errors)) {
        if (errors) {
            *errors = parse_errors;
        }
        return std::nullopt;
    }
    return root;
}

std::string trim(const std::string& input)
{
    const auto first = std::find_if_not(input.begin(), input.end(),
                                        [](unsigned char c) { return std::isspace(c); });
    const auto last = std::find_if_not(input.rbegin(), input.rend(),
                                       [](unsigned char c) { return std::isspace(c); }).base();
    if (first >= last) {
        return {};
    }
    return std::string(first, last);
}

std::string to_lower(std::string input)
{
    std::transform(input.begin(), input.end(), input.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return input;
}

ProviderStatus status_from_http(const HttpResponse& response, const std::string& what)
{
    if (response.cancelled) {
        return ProviderStatus::error(ProviderErrorCode::Cancelled, what + ": request cancelled");
    }
    if (!response.transport_ok()) {
        return ProviderStatus::error(ProviderErrorCode::Transport, what + ": " + response.error);
    }
    if (!response.success()) {
        return ProviderStatus::error(ProviderErrorCode::Http,
                                     what + " returned status " + std::to_string(response.status_code) +
                                     ": " + trim(response.body),
                                     response.status_code);
    }
    return ProviderStatus::ok();
}

Json::Value messages_to_json(const std::string& system_prompt,
                             const std::vector<ChatMessage>& history)
{
    Json::Value messages(Json::arrayValue);
    if (!system_prompt.empty()) {
        Json::Value system(Json::objectValue);
        system["role"] = "system";
        system["content"] = system_prompt;
        messages.append(system);
    }
    for (const auto& msg : history) {
        Json::Value entry(Json::objectValue);
        entry["role"] = msg.role.empty() ? std::string("user") : msg.role;
        entry["content"] = msg.content;
        messages.append(entry);
    }
    return messages;
}

Json::Value tools_to_json(const std::vector<ToolDefinition>& tools)
{
    Json::Value out(Json::arrayValue);
    for (const auto& tool : tools) {
        Json::Value function(Json::objectValue);
        function["name"] = tool.name;
        function["description"] = tool.description;
        function["parameters"] = tool.parameters;

        Json::Value entry(Json::objectValue);
        entry["type"] = "function";
        entry["function"] = function;
        out.append(entry);
    }
    return out;
}

bool is_no_tool_capability_response(const std::string& body)
{
    auto mentions_tool_support = [](const std::string& text) {
        return !text.empty() && text.find("tool") != std::string::npos &&
               (text.find("support") != std::string::npos || text.find("capab") != std::string::npos);
    };

    const std::string text = to_lower(trim(body));
    if (mentions_tool_support(text)) {
        return true;
    }

    if (auto parsed = parse_json(body); parsed && parsed->isObject()) {
        auto string_field = [&](const char* key) {
            const Json::Value& value = (*parsed)[key];
            return value.isString() ? value.asString() : std::string();
        };
        const std::string combined = to_lower(trim(string_field("error") + " " + string_field("message")));
        return mentions_tool_support(combined);
    }
    return false;
}

std::string join_url(const std::string& base_url, const std::string& endpoint)
{
    std::string url = base_url;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url + endpoint;
}

} // namespace ProviderUtils
