/*
 * Chat provider for Ollama hosts
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef OLLAMA_PROVIDER_HPP
#define OLLAMA_PROVIDER_HPP

#include "HttpTransport.hpp"
#include "IChatProvider.hpp"

#include <atomic>
#include <string>

/**
 * Configuration for Ollama provider
 */
struct OllamaConfig {
    long timeout_ms{600000};                 // Default per-request timeout
    bool debug{false};                       // Log tool definitions
};

/**
 * Provider that talks to Ollama's HTTP API
 *
 * Endpoints:
 * - GET  /api/ps        loaded models
 * - POST /api/generate  warm-up ("." prompt) and unload (keep_alive 0)
 * - POST /api/chat      chat, streamed as newline-delimited JSON
 */
class OllamaProvider : public IChatProvider {
public:
    /**
     * Construct provider with configuration
     * @param config Configuration for the provider
     * @param http_client Optional HTTP client for testing
     */
    explicit OllamaProvider(OllamaConfig config = {},
                            HttpClient http_client = nullptr);

    ~OllamaProvider() override = default;

    // IChatProvider interface
    std::string id() const override { return "ollama"; }
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

    const OllamaConfig& config() const { return config_; }

private:
    static constexpr const char* kChatEndpoint = "/api/chat";
    static constexpr const char* kGenerateEndpoint = "/api/generate";
    static constexpr const char* kPsEndpoint = "/api/ps";

    HttpResponse make_request(const Host& host,
                              const std::string& endpoint,
                              const std::string& method,
                              const std::string& body,
                              long timeout_ms,
                              const CancellationToken& cancel,
                              HttpBodySink on_data = nullptr) const;
    Json::Value build_chat_payload(const StreamRequest& request) const;
    StreamMetadata metadata_from_chunk(const Json::Value& chunk, const std::string& fallback_model) const;
    ProviderStatus handle_single_response(const StreamRequest& request,
                                          const HttpResponse& response,
                                          const StreamCallbacks& callbacks) const;
    void log_tools(const std::vector<ToolDefinition>& tools) const;

    OllamaConfig config_;
    HttpClient http_client_;
    std::atomic<bool> closed_{false};
};

#endif // OLLAMA_PROVIDER_HPP
