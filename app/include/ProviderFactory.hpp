#pragma once

#include "AppConfig.hpp"
#include "HttpTransport.hpp"
#include "IChatProvider.hpp"
#include "MetricsAggregator.hpp"
#include "ProviderMultiplexer.hpp"
#include <memory>
#include <string>

/**
 * Factory for creating chat providers based on configuration
 */
class ProviderFactory {
public:
    /**
     * Create the provider graph for the configured hosts
     *
     * Hosts sharing one type get that type's adapter directly; mixed fleets
     * get a multiplexer. With metrics enabled and an aggregator supplied the
     * result is wrapped in a MetricsProvider.
     *
     * @param config Application configuration
     * @param aggregator Metrics destination, may be null
     * @param http_client Optional HTTP client for testing
     * @return Provider instance, or nullptr if no host is configured
     */
    static ChatProviderPtr create_provider_from_config(const AppConfig& config,
                                                       MetricsAggregatorPtr aggregator,
                                                       HttpClient http_client = nullptr);

    /**
     * Create a multiplexer with one adapter per known host type in the config
     */
    static std::shared_ptr<ProviderMultiplexer> create_multiplexer(const AppConfig& config,
                                                                   HttpClient http_client = nullptr);

    /**
     * Create the adapter for a normalized host type
     * @return Provider, or nullptr for an unknown type
     */
    static ChatProviderPtr create_provider_for_type(const std::string& host_type,
                                                    const AppConfig& config,
                                                    HttpClient http_client = nullptr);

    /**
     * Create an Ollama provider
     */
    static ChatProviderPtr create_ollama_provider(long timeout_ms, bool debug,
                                                  HttpClient http_client = nullptr);

    /**
     * Create a llama.cpp provider
     */
    static ChatProviderPtr create_llamacpp_provider(long timeout_ms, bool debug,
                                                    HttpClient http_client = nullptr);
};
