/*
 * Tool-calling request executed once per dispatched job
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef TOOL_CALL_JOB_HPP
#define TOOL_CALL_JOB_HPP

#include "BatchDispatcher.hpp"
#include "IChatProvider.hpp"

#include <string>
#include <vector>

struct ToolCallJobOptions {
    std::string prompt{"What is the weather in Portland, OR?"};
    ToolDefinition tool;
    bool disable_streaming{true};
};

/**
 * Job executor that asks a model to call a tool
 *
 * The job name is the model. The reply is folded into a payload of the
 * form {"model": ..., "content": ..., "tool_calls": [...]} for the
 * success criterion. Backend failures become executions carrying the
 * HTTP status or a transport error, so the dispatcher records them.
 */
class ToolCallJob {
public:
    explicit ToolCallJob(ChatProviderPtr provider, ToolCallJobOptions options = default_options());

    JobExecution operator()(const DispatchJob& job,
                            const Host& host,
                            int worker_id,
                            const CancellationToken& cancel) const;

    /**
     * get_current_weather(location) with the weather prompt
     */
    static ToolCallJobOptions default_options();

private:
    ChatProviderPtr provider_;
    ToolCallJobOptions options_;
};

/**
 * Reset hook that unloads every model from every host
 *
 * Failures are logged and do not stop the remaining unloads.
 */
ResetHook make_unload_reset(ChatProviderPtr provider,
                            std::vector<Host> hosts,
                            std::vector<std::string> models);

#endif // TOOL_CALL_JOB_HPP
