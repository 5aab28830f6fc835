/*
 * Helpers shared by the backend provider implementations
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef PROVIDER_UTILS_HPP
#define PROVIDER_UTILS_HPP

#include "HttpTransport.hpp"
#include "IChatProvider.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ProviderUtils {

/**
 * Serialize without indentation, suitable for request bodies and NDJSON
 */
std::string to_compact_json(const Json::Value& value);

/**
 * Parse a JSON document
 * @param errors Receives parser diagnostics on failure (may be null)
 */
std::optional<Json::Value> parse_json(const std::string& text, std::string* errors = nullptr);

std::string trim(const std::string& input);

std::string to_lower(std::string input);

/**
 * Convert a failed transport or HTTP exchange into a provider status
 * @param what Short description of the call, e.g. "ollama: /api/chat"
 */
ProviderStatus status_from_http(const HttpResponse& response, const std::string& what);

/**
 * System prompt (if any) followed by the history as a JSON messages array
 */
Json::Value messages_to_json(const std::string& system_prompt,
                             const std::vector<ChatMessage>& history);

/**
 * Tool definitions in the OpenAI/Ollama "function" tool format
 */
Json::Value tools_to_json(const std::vector<ToolDefinition>& tools);

/**
 * Whether an error body says the model cannot use tools
 */
bool is_no_tool_capability_response(const std::string& body);

/**
 * Join base URL and endpoint path, dropping a trailing slash from the base
 */
std::string join_url(const std::string& base_url, const std::string& endpoint);

} // namespace ProviderUtils

#endif // PROVIDER_UTILS_HPP
