/*
 * Tool-call success criterion implementation
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "ToolCallCriterion.hpp"
#include "Logger.hpp"
#include "ProviderUtils.hpp"

#include <regex>

namespace {

const std::regex& embedded_object_pattern()
{
    // ECMAScript '.' stops at line terminators, so each match stays on one line.
    static const std::regex pattern(R"(\{.*\})");
    return pattern;
}

} // namespace

ToolCallCriterion::ToolCallCriterion(ToolCallExpectation expectation)
    : expectation_(std::move(expectation))
{}

bool ToolCallCriterion::matches_arguments(const Json::Value& arguments) const
{
    if (arguments.isString()) {
        auto decoded = ProviderUtils::parse_json(arguments.asString());
        return decoded && decoded->isObject() && matches_arguments(*decoded);
    }
    if (!arguments.isObject()) {
        return false;
    }
    const Json::Value& value = arguments[expectation_.argument];
    return value.isString() && value.asString() == expectation_.expected_value;
}

bool ToolCallCriterion::matches_tool_calls(const Json::Value& tool_calls) const
{
    if (!tool_calls.isArray() || tool_calls.empty() || !tool_calls[0].isObject()) {
        return false;
    }
    const Json::Value& function = tool_calls[0]["function"];
    if (!function.isObject()) {
        return false;
    }
    const Json::Value& name = function["name"];
    return name.isString() && name.asString() == expectation_.tool_name &&
           matches_arguments(function["arguments"]);
}

bool ToolCallCriterion::matches_embedded(const std::string& content) const
{
    const auto& pattern = embedded_object_pattern();
    for (auto it = std::sregex_iterator(content.begin(), content.end(), pattern);
         it != std::sregex_iterator(); ++it) {
        auto embedded = ProviderUtils::parse_json(it->str());
        if (!embedded || !embedded->isObject()) {
            continue;
        }
        const Json::Value& name = (*embedded)["name"];
        if (name.isString() && name.asString() == expectation_.tool_name &&
            matches_arguments((*embedded)["arguments"])) {
            return true;
        }
    }
    return false;
}

bool ToolCallCriterion::operator()(const std::string& payload) const
{
    auto root = ProviderUtils::parse_json(payload);
    if (!root || !root->isObject()) {
        if (auto logger = Logger::get_logger("dispatch_logger")) {
            logger->debug("Tool-call criterion: payload is not a JSON object");
        }
        return false;
    }

    if (matches_tool_calls((*root)["tool_calls"])) {
        return true;
    }

    const Json::Value& content = (*root)["content"];
    if (content.isString() && !content.asString().empty() && matches_embedded(content.asString())) {
        return true;
    }
    return false;
}
