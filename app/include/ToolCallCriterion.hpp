/*
 * Success criterion for tool-calling responses
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef TOOL_CALL_CRITERION_HPP
#define TOOL_CALL_CRITERION_HPP

#include <string>

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

/**
 * The tool invocation a response must contain to count as a success
 */
struct ToolCallExpectation {
    std::string tool_name{"get_current_weather"};
    std::string argument{"location"};
    std::string expected_value{"Portland, OR"};
};

/**
 * Classifies a response payload as a correct tool call
 *
 * A payload succeeds when it parses as JSON and either its first structured
 * tool call targets the expected tool with the expected argument value, or
 * its "content" text embeds a JSON object of the form
 * {"name": ..., "arguments": {...}} that does.
 *
 * Embedded objects are located with a greedy brace match on each line, so
 * two objects on the same line are read as one span and fail to parse.
 */
class ToolCallCriterion {
public:
    explicit ToolCallCriterion(ToolCallExpectation expectation = {});

    bool operator()(const std::string& payload) const;

    /**
     * Check tool_calls[0].function against the expectation
     */
    bool matches_tool_calls(const Json::Value& tool_calls) const;

    /**
     * Check JSON fragments embedded in free text against the expectation
     */
    bool matches_embedded(const std::string& content) const;

    const ToolCallExpectation& expectation() const { return expectation_; }

private:
    bool matches_arguments(const Json::Value& arguments) const;

    ToolCallExpectation expectation_;
};

#endif // TOOL_CALL_CRITERION_HPP
