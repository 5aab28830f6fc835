/*
 * Streaming chat provider abstraction for heterogeneous backend hosts
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef I_CHAT_PROVIDER_HPP
#define I_CHAT_PROVIDER_HPP

#include "AppConfig.hpp"
#include "CancellationToken.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

/**
 * Error categories reported by providers
 */
enum class ProviderErrorCode : int {
    None          = 0,
    Transport     = 1,   // Connection, DNS, timeout or other curl failure
    Http          = 2,   // Backend answered with a non-success status
    Protocol      = 3,   // Backend answered with a body we could not use
    Cancelled     = 4,   // Caller cancelled the operation
    NoProvider    = 5,   // No provider registered for the host type
    Callback      = 6,   // A caller callback aborted the stream
};

/**
 * Outcome of a provider operation
 */
struct ProviderStatus {
    bool success{true};
    ProviderErrorCode error_code{ProviderErrorCode::None};
    int http_status{0};
    std::string error_message;

    static ProviderStatus ok() { return {}; }

    static ProviderStatus error(ProviderErrorCode code, std::string message, int http_status = 0)
    {
        ProviderStatus status;
        status.success = false;
        status.error_code = code;
        status.http_status = http_status;
        status.error_message = std::move(message);
        return status;
    }
};

/**
 * Result of listing the models loaded on a host
 */
struct ModelListResult {
    ProviderStatus status;
    std::vector<std::string> models;
};

/**
 * A single message in a chat conversation
 */
struct ChatMessage {
    std::string role;
    std::string content;
};

/**
 * Function tool exposed to the model
 */
struct ToolDefinition {
    std::string name;
    std::string description;
    Json::Value parameters{Json::objectValue};   // JSON schema of the arguments
};

/**
 * Inputs necessary to start a chat stream
 */
struct StreamRequest {
    Host host;
    std::string model;
    std::vector<ChatMessage> history;
    std::string system_prompt;
    std::vector<ToolDefinition> tools;
    bool json_mode{false};
    bool disable_streaming{false};
    long timeout_ms{0};                      // 0 uses the provider default
    CancellationToken cancel;
};

/**
 * Timing and token metrics returned by a provider when a stream completes
 */
struct StreamMetadata {
    std::string model;
    std::chrono::system_clock::time_point created_at{};
    bool done{false};
    int64_t total_duration{0};               // nanoseconds
    int64_t load_duration{0};                // nanoseconds
    int prompt_eval_count{0};
    int64_t prompt_eval_duration{0};         // nanoseconds
    int eval_count{0};
    int64_t eval_duration{0};                // nanoseconds
    Json::Value tool_calls{Json::arrayValue};
};

/**
 * Callbacks invoked as a provider yields output
 *
 * Returning an error message aborts the stream; the provider then returns
 * ProviderErrorCode::Callback with that message.
 */
struct StreamCallbacks {
    std::function<std::optional<std::string>(const ChatMessage&)> on_chunk;
    std::function<std::optional<std::string>(const StreamMetadata&)> on_complete;
};

/**
 * Abstract interface for chat providers
 *
 * Implementations adapt one backend type (Ollama, llama.cpp) and are shared
 * between threads: every method must be safe to call concurrently.
 *
 * Ordering guarantee for stream(): all on_chunk calls happen before the
 * single on_complete call. on_complete fires once per stream that was
 * established, unless the call fails before the backend answers.
 */
class IChatProvider {
public:
    virtual ~IChatProvider() = default;

    /**
     * Unique identifier for this provider (e.g., "ollama", "llama.cpp", "multiplex")
     */
    virtual std::string id() const = 0;

    /**
     * Models currently loaded in memory on the host
     */
    virtual ModelListResult list_loaded_models(const Host& host,
                                               const CancellationToken& cancel) = 0;

    /**
     * Load or warm a model; no-op when it is already ready
     */
    virtual ProviderStatus ensure_model_ready(const Host& host,
                                              const std::string& model,
                                              const CancellationToken& cancel) = 0;

    /**
     * Run one chat exchange and forward output to the callbacks
     */
    virtual ProviderStatus stream(const StreamRequest& request,
                                  const StreamCallbacks& callbacks) = 0;

    /**
     * Release a warmed model from the host's memory
     */
    virtual ProviderStatus unload_model(const Host& host,
                                        const std::string& model,
                                        const CancellationToken& cancel) = 0;

    /**
     * Release held resources. Idempotent.
     */
    virtual ProviderStatus close() = 0;
};

/**
 * Type alias for provider pointers
 */
using ChatProviderPtr = std::shared_ptr<IChatProvider>;

#endif // I_CHAT_PROVIDER_HPP
