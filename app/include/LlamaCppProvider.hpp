/*
 * Chat provider for llama.cpp server hosts
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef LLAMA_CPP_PROVIDER_HPP
#define LLAMA_CPP_PROVIDER_HPP

#include "HttpTransport.hpp"
#include "IChatProvider.hpp"

#include <atomic>
#include <optional>
#include <string>
#include <vector>

/**
 * Configuration for llama.cpp provider
 */
struct LlamaCppConfig {
    long timeout_ms{600000};                 // Default per-request timeout
    long load_poll_interval_ms{200};         // Poll period while waiting for a model to load
    bool debug{false};
};

/**
 * A model entry reported by the llama.cpp router's /models endpoint
 */
struct LlamaCppModel {
    std::string id;
    std::string name;
    std::string model;
    std::string path;
    std::string status;                      // e.g., "loaded", "loading", "unloaded"

    /**
     * First non-empty of id, name, model, path
     */
    std::string display_name() const;
};

/**
 * Provider that talks to llama.cpp's OpenAI-compatible server
 *
 * Model lifecycle uses the router endpoints (/models, /models/load,
 * /models/unload) when the server exposes them; servers without a router
 * answer 404 and rely on loading the model on first request.
 */
class LlamaCppProvider : public IChatProvider {
public:
    /**
     * Construct provider with configuration
     * @param config Configuration for the provider
     * @param http_client Optional HTTP client for testing
     */
    explicit LlamaCppProvider(LlamaCppConfig config = {},
                              HttpClient http_client = nullptr);

    ~LlamaCppProvider() override = default;

    // IChatProvider interface
    std::string id() const override { return "llama.cpp"; }
    ModelListResult list_loaded_models(const Host& host,
                                       const CancellationToken& cancel) override;
    ProviderStatus ensure_model_ready(const Host& host,
                                      const std::string& model,
                                      const CancellationToken& cancel) override;
    ProviderStatus stream(const StreamRequest& request,
                          const StreamCallbacks& callbacks) override;
    ProviderStatus unload_model(const Host& host,
                                const std::string& model,
                                const CancellationToken& cancel) override;
    ProviderStatus close() override;

    /**
     * Parse any of the /models response shapes the router has used
     * @return Models, or std::nullopt when the shape is unrecognized
     */
    static std::optional<std::vector<LlamaCppModel>> parse_models(const std::string& body);

private:
    static constexpr const char* kChatEndpoint = "/v1/chat/completions";
    static constexpr const char* kModelsEndpoint = "/models";
    static constexpr const char* kLoadEndpoint = "/models/load";
    static constexpr const char* kUnloadEndpoint = "/models/unload";

    HttpResponse make_request(const Host& host,
                              const std::string& endpoint,
                              const std::string& method,
                              const std::string& body,
                              long timeout_ms,
                              const CancellationToken& cancel,
                              bool event_stream = false,
                              HttpBodySink on_data = nullptr) const;
    ProviderStatus fetch_models(const Host& host,
                                const CancellationToken& cancel,
                                std::vector<LlamaCppModel>& models) const;
    ProviderStatus wait_for_model_loaded(const Host& host,
                                         const std::string& model,
                                         const CancellationToken& cancel) const;
    Json::Value build_chat_payload(const StreamRequest& request) const;
    ProviderStatus handle_single_response(const StreamRequest& request,
                                          const HttpResponse& response,
                                          const StreamCallbacks& callbacks) const;
    ProviderStatus handle_streaming(const StreamRequest& request,
                                    const std::string& body,
                                    long timeout_ms,
                                    const StreamCallbacks& callbacks) const;

    LlamaCppConfig config_;
    HttpClient http_client_;
    std::atomic<bool> closed_{false};
};

#endif // LLAMA_CPP_PROVIDER_HPP
