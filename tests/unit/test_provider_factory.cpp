/*
 * Unit tests for provider construction from configuration
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <catch2/catch_test_macros.hpp>
#include "LlamaCppProvider.hpp"
#include "MetricsProvider.hpp"
#include "OllamaProvider.hpp"
#include "ProviderFactory.hpp"
#include "TestHelpers.hpp"

#include <memory>

namespace {

AppConfig config_with_types(const std::vector<std::string>& types)
{
    AppConfig config;
    int index = 0;
    for (const auto& type : types) {
        config.hosts.push_back(make_host("host-" + std::to_string(++index), type));
    }
    config.models = {"llama3.2:1b"};
    config.timeout_seconds = 45;
    return config;
}

} // namespace

// =============================================================================
// Provider selection Tests
// =============================================================================

TEST_CASE("ProviderFactory returns null without hosts") {
    AppConfig config;
    REQUIRE(ProviderFactory::create_provider_from_config(config, nullptr) == nullptr);
}

TEST_CASE("ProviderFactory uses the adapter directly for a single host type") {
    auto ollama = ProviderFactory::create_provider_from_config(config_with_types({"", "Ollama"}), nullptr);
    REQUIRE(ollama->id() == "ollama");
    auto ollama_impl = std::dynamic_pointer_cast<OllamaProvider>(ollama);
    REQUIRE(ollama_impl != nullptr);
    REQUIRE(ollama_impl->config().timeout_ms == 45000);

    auto llama = ProviderFactory::create_provider_from_config(config_with_types({"llamacpp"}), nullptr);
    REQUIRE(llama->id() == "llama.cpp");
    REQUIRE(std::dynamic_pointer_cast<LlamaCppProvider>(llama) != nullptr);
}

TEST_CASE("ProviderFactory multiplexes a mixed fleet") {
    auto provider = ProviderFactory::create_provider_from_config(config_with_types({"ollama", "llama.cpp"}), nullptr);

    REQUIRE(provider->id() == "multiplex");
    auto multiplexer = std::dynamic_pointer_cast<ProviderMultiplexer>(provider);
    REQUIRE(multiplexer != nullptr);
    REQUIRE(multiplexer->registered_types() == std::vector<std::string>{"llama.cpp", "ollama"});
}

TEST_CASE("ProviderFactory defers unknown host types to call time") {
    FakeHttp http;
    auto provider = ProviderFactory::create_provider_from_config(config_with_types({"vllm"}), nullptr,
                                                                 http.client());
    REQUIRE(provider->id() == "multiplex");

    StreamRequest request;
    request.host = make_host("host-1", "vllm");
    request.model = "llama3.2:1b";
    auto status = provider->stream(request, {});

    REQUIRE_FALSE(status.success);
    REQUIRE(status.error_code == ProviderErrorCode::NoProvider);
    REQUIRE(http.requests().empty());
}

TEST_CASE("ProviderFactory wraps with metrics only when enabled with an aggregator") {
    TempDir dir;
    auto aggregator = std::make_shared<MetricsAggregator>((dir.path() / "metrics.json").string(),
                                                          std::chrono::milliseconds(0));
    auto config = config_with_types({"ollama"});

    auto plain = ProviderFactory::create_provider_from_config(config, aggregator);
    REQUIRE(std::dynamic_pointer_cast<MetricsProvider>(plain) == nullptr);

    config.metrics = true;
    auto without_aggregator = ProviderFactory::create_provider_from_config(config, nullptr);
    REQUIRE(std::dynamic_pointer_cast<MetricsProvider>(without_aggregator) == nullptr);

    auto measured = ProviderFactory::create_provider_from_config(config, aggregator);
    auto metrics = std::dynamic_pointer_cast<MetricsProvider>(measured);
    REQUIRE(metrics != nullptr);
    REQUIRE(metrics->id() == "ollama");
    REQUIRE(metrics->aggregator() == aggregator);
}
