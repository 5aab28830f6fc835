/*
 * Unit tests for the host-type multiplexer
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <catch2/catch_test_macros.hpp>
#include "ProviderMultiplexer.hpp"
#include "TestHelpers.hpp"

#include <memory>

namespace {

StreamRequest request_for(const Host& host)
{
    StreamRequest request;
    request.host = host;
    request.model = "llama3.2:1b";
    return request;
}

} // namespace

// =============================================================================
// Routing Tests
// =============================================================================

TEST_CASE("ProviderMultiplexer routes by normalized host type") {
    auto ollama = std::make_shared<FakeChatProvider>("ollama");
    auto llama = std::make_shared<FakeChatProvider>("llama.cpp");
    ProviderMultiplexer multiplexer;
    multiplexer.register_provider("ollama", ollama);
    multiplexer.register_provider("llama.cpp", llama);

    REQUIRE(multiplexer.stream(request_for(make_host("a", " LlamaCpp ")), {}).success);
    REQUIRE(multiplexer.stream(request_for(make_host("b", "Ollama")), {}).success);
    REQUIRE(multiplexer.stream(request_for(make_host("c", "llama.cpp")), {}).success);

    REQUIRE(llama->stream_calls.load() == 2);
    REQUIRE(ollama->stream_calls.load() == 1);
}

TEST_CASE("ProviderMultiplexer falls back to ollama for an empty host type") {
    auto ollama = std::make_shared<FakeChatProvider>("ollama");
    ProviderMultiplexer multiplexer;
    multiplexer.register_provider("ollama", ollama);

    CancellationToken cancel;
    auto result = multiplexer.list_loaded_models(make_host("a", ""), cancel);

    REQUIRE(result.status.success);
    REQUIRE(ollama->list_calls.load() == 1);
}

TEST_CASE("ProviderMultiplexer reports the unregistered host type") {
    auto ollama = std::make_shared<FakeChatProvider>("ollama");
    ProviderMultiplexer multiplexer;
    multiplexer.register_provider("ollama", ollama);

    auto status = multiplexer.stream(request_for(make_host("a", "VLLM")), {});

    REQUIRE_FALSE(status.success);
    REQUIRE(status.error_code == ProviderErrorCode::NoProvider);
    REQUIRE(status.error_message == "no provider registered for host type \"vllm\"");
    REQUIRE(ollama->stream_calls.load() == 0);
}

TEST_CASE("ProviderMultiplexer does not fall back for an unknown type") {
    auto ollama = std::make_shared<FakeChatProvider>("ollama");
    ProviderMultiplexer multiplexer;
    multiplexer.register_provider("ollama", ollama);

    CancellationToken cancel;
    auto status = multiplexer.unload_model(make_host("a", "llama.cpp"), "m", cancel);

    REQUIRE(status.error_code == ProviderErrorCode::NoProvider);
    REQUIRE(status.error_message.find("llama.cpp") != std::string::npos);
    REQUIRE(ollama->unload_calls.load() == 0);
}

TEST_CASE("ProviderMultiplexer fails an empty type when ollama is not registered") {
    ProviderMultiplexer multiplexer;
    multiplexer.register_provider("llama.cpp", std::make_shared<FakeChatProvider>("llama.cpp"));

    CancellationToken cancel;
    auto result = multiplexer.list_loaded_models(make_host("a", ""), cancel);
    auto ready = multiplexer.ensure_model_ready(make_host("a", ""), "m", cancel);

    REQUIRE(result.status.error_code == ProviderErrorCode::NoProvider);
    REQUIRE(result.models.empty());
    REQUIRE(ready.error_code == ProviderErrorCode::NoProvider);
}

TEST_CASE("ProviderMultiplexer registry lookups use the normalized key") {
    ProviderMultiplexer multiplexer;
    auto llama = std::make_shared<FakeChatProvider>("llama.cpp");
    multiplexer.register_provider("LLAMACPP", llama);
    multiplexer.register_provider("ollama", nullptr);

    REQUIRE(multiplexer.get_provider("llama.cpp") == llama);
    REQUIRE(multiplexer.get_provider("ollama") == nullptr);
    REQUIRE(multiplexer.registered_types() == std::vector<std::string>{"llama.cpp"});

    multiplexer.unregister_provider("llamacpp");
    REQUIRE(multiplexer.registered_types().empty());
}

// =============================================================================
// Close Tests
// =============================================================================

TEST_CASE("ProviderMultiplexer closes a shared provider exactly once") {
    auto shared = std::make_shared<FakeChatProvider>("shared");
    ProviderMultiplexer multiplexer;
    multiplexer.register_provider("ollama", shared);
    multiplexer.register_provider("llama.cpp", shared);

    REQUIRE(multiplexer.close().success);
    REQUIRE(shared->close_calls.load() == 1);
}

TEST_CASE("ProviderMultiplexer close returns the first error and closes the rest") {
    auto failing = std::make_shared<FakeChatProvider>("failing");
    failing->close_status = ProviderStatus::error(ProviderErrorCode::Transport, "close failed");
    auto healthy = std::make_shared<FakeChatProvider>("healthy");

    ProviderMultiplexer multiplexer;
    multiplexer.register_provider("llama.cpp", failing);
    multiplexer.register_provider("ollama", healthy);

    auto status = multiplexer.close();

    REQUIRE_FALSE(status.success);
    REQUIRE(status.error_message == "close failed");
    REQUIRE(failing->close_calls.load() == 1);
    REQUIRE(healthy->close_calls.load() == 1);
}
