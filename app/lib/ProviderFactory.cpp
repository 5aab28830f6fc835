#include "ProviderFactory.hpp"
#include "LlamaCppProvider.hpp"
#include "Logger.hpp"
#include "MetricsProvider.hpp"
#include "OllamaProvider.hpp"
#include <set>

ChatProviderPtr ProviderFactory::create_provider_from_config(const AppConfig& config,
                                                             MetricsAggregatorPtr aggregator,
                                                             HttpClient http_client)
{
    if (config.hosts.empty()) {
        return nullptr;
    }

    std::set<std::string> types;
    for (const auto& host : config.hosts) {
        types.insert(normalize_host_type(host.type));
    }

    ChatProviderPtr provider;
    if (types.size() == 1) {
        provider = create_provider_for_type(*types.begin(), config, http_client);
    }
    if (!provider) {
        // Mixed fleet, or a single unknown type that should fail per call
        // with a NoProvider error rather than at startup.
        provider = create_multiplexer(config, http_client);
    }

    if (config.metrics && aggregator) {
        provider = std::make_shared<MetricsProvider>(std::move(provider), std::move(aggregator));
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Using provider {} for {} host(s) (metrics: {})",
                     provider->id(), config.hosts.size(), config.metrics ? "on" : "off");
    }
    return provider;
}

std::shared_ptr<ProviderMultiplexer> ProviderFactory::create_multiplexer(const AppConfig& config,
                                                                         HttpClient http_client)
{
    auto multiplexer = std::make_shared<ProviderMultiplexer>();

    std::set<std::string> types;
    for (const auto& host : config.hosts) {
        types.insert(normalize_host_type(host.type));
    }

    for (const auto& type : types) {
        auto provider = create_provider_for_type(type, config, http_client);
        if (!provider) {
            if (auto logger = Logger::get_logger("core_logger")) {
                logger->warn("Unsupported host type \"{}\"; requests to those hosts will fail", type);
            }
            continue;
        }
        multiplexer->register_provider(type, std::move(provider));
    }
    return multiplexer;
}

ChatProviderPtr ProviderFactory::create_provider_for_type(const std::string& host_type,
                                                          const AppConfig& config,
                                                          HttpClient http_client)
{
    const std::string type = normalize_host_type(host_type);
    if (type == kHostTypeOllama) {
        return create_ollama_provider(config.request_timeout_ms(), config.debug, std::move(http_client));
    }
    if (type == kHostTypeLlamaCpp) {
        return create_llamacpp_provider(config.request_timeout_ms(), config.debug, std::move(http_client));
    }
    return nullptr;
}

ChatProviderPtr ProviderFactory::create_ollama_provider(long timeout_ms, bool debug, HttpClient http_client)
{
    OllamaConfig config;
    config.timeout_ms = timeout_ms;
    config.debug = debug;
    return std::make_shared<OllamaProvider>(config, std::move(http_client));
}

ChatProviderPtr ProviderFactory::create_llamacpp_provider(long timeout_ms, bool debug, HttpClient http_client)
{
    LlamaCppConfig config;
    config.timeout_ms = timeout_ms;
    config.debug = debug;
    return std::make_shared<LlamaCppProvider>(config, std::move(http_client));
}
