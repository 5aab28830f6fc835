/*
 * Unit tests for the metrics-recording provider decorator
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <catch2/catch_test_macros.hpp>
#include "MetricsAggregator.hpp"
#include "MetricsProvider.hpp"
#include "TestHelpers.hpp"

#include <memory>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

StreamRequest make_request(const std::string& model)
{
    StreamRequest request;
    request.host = make_host("host-01");
    request.model = model;
    request.history = {{"user", "hi"}};
    return request;
}

} // namespace

TEST_CASE("MetricsProvider forwards chunks and metadata unchanged") {
    TempDir temp_dir;
    auto aggregator = std::make_shared<MetricsAggregator>((temp_dir.path() / "m.json").string(), 0ms);
    auto inner = std::make_shared<FakeChatProvider>();
    inner->metadata.eval_count = 12;
    inner->metadata.prompt_eval_count = 40;

    MetricsProvider provider(inner, aggregator);

    std::string text;
    StreamMetadata seen;
    StreamCallbacks callbacks;
    callbacks.on_chunk = [&text](const ChatMessage& msg) -> std::optional<std::string> {
        text += msg.content;
        return std::nullopt;
    };
    callbacks.on_complete = [&seen](const StreamMetadata& meta) -> std::optional<std::string> {
        seen = meta;
        return std::nullopt;
    };

    auto status = provider.stream(make_request("llama3.2:1b"), callbacks);

    REQUIRE(status.success);
    REQUIRE(text == "Hello world");
    REQUIRE(seen.model == "llama3.2:1b");
    REQUIRE(seen.eval_count == 12);
    REQUIRE(seen.prompt_eval_count == 40);
    REQUIRE(provider.id() == "fake");
}

TEST_CASE("MetricsProvider records time to first chunk") {
    TempDir temp_dir;
    auto aggregator = std::make_shared<MetricsAggregator>((temp_dir.path() / "m.json").string(), 0ms);
    auto inner = std::make_shared<FakeChatProvider>();
    inner->chunk_delay = 25ms;

    MetricsProvider provider(inner, aggregator);
    REQUIRE(provider.stream(make_request("llama3.2:1b"), {}).success);

    auto metrics = aggregator->metrics_for("llama3.2:1b");
    REQUIRE(metrics.has_value());
    REQUIRE(metrics->overall_stats.total_requests == 1);
    REQUIRE(metrics->overall_stats.ttft_ms.mean >= 25.0);
}

TEST_CASE("MetricsProvider records zero TTFT when no chunk arrives") {
    TempDir temp_dir;
    auto aggregator = std::make_shared<MetricsAggregator>((temp_dir.path() / "m.json").string(), 0ms);
    auto inner = std::make_shared<FakeChatProvider>();
    inner->chunks.clear();

    MetricsProvider provider(inner, aggregator);
    REQUIRE(provider.stream(make_request("qwen3:1.7b"), {}).success);

    auto metrics = aggregator->metrics_for("qwen3:1.7b");
    REQUIRE(metrics.has_value());
    REQUIRE(metrics->overall_stats.ttft_ms.mean == 0.0);
}

TEST_CASE("MetricsProvider without aggregator still forwards") {
    auto inner = std::make_shared<FakeChatProvider>();
    MetricsProvider provider(inner, nullptr);

    bool completed = false;
    StreamCallbacks callbacks;
    callbacks.on_complete = [&completed](const StreamMetadata&) -> std::optional<std::string> {
        completed = true;
        return std::nullopt;
    };

    REQUIRE(provider.stream(make_request("llama3.2:1b"), callbacks).success);
    REQUIRE(completed);
}

TEST_CASE("MetricsProvider does not double count when wrapped twice") {
    TempDir temp_dir;
    auto aggregator = std::make_shared<MetricsAggregator>((temp_dir.path() / "m.json").string(), 0ms);
    auto inner = std::make_shared<FakeChatProvider>();

    auto once = std::make_shared<MetricsProvider>(inner, aggregator);
    MetricsProvider twice(once, aggregator);

    REQUIRE(twice.inner() == inner);
    REQUIRE(twice.stream(make_request("llama3.2:1b"), {}).success);
    REQUIRE(aggregator->metrics_for("llama3.2:1b")->overall_stats.total_requests == 1);
}

TEST_CASE("MetricsProvider returns the inner status and skips recording on failure") {
    TempDir temp_dir;
    auto aggregator = std::make_shared<MetricsAggregator>((temp_dir.path() / "m.json").string(), 0ms);
    auto inner = std::make_shared<FakeChatProvider>();
    inner->stream_status = ProviderStatus::error(ProviderErrorCode::Http, "boom", 500);

    MetricsProvider provider(inner, aggregator);
    auto status = provider.stream(make_request("llama3.2:1b"), {});

    REQUIRE_FALSE(status.success);
    REQUIRE(status.error_code == ProviderErrorCode::Http);
    REQUIRE(status.http_status == 500);
    REQUIRE_FALSE(aggregator->metrics_for("llama3.2:1b").has_value());
}

TEST_CASE("MetricsProvider records before forwarding a failing on_complete") {
    TempDir temp_dir;
    auto aggregator = std::make_shared<MetricsAggregator>((temp_dir.path() / "m.json").string(), 0ms);
    auto inner = std::make_shared<FakeChatProvider>();
    MetricsProvider provider(inner, aggregator);

    StreamCallbacks callbacks;
    callbacks.on_complete = [](const StreamMetadata&) -> std::optional<std::string> {
        return std::string("caller rejected metadata");
    };

    auto status = provider.stream(make_request("llama3.2:1b"), callbacks);

    REQUIRE_FALSE(status.success);
    REQUIRE(status.error_code == ProviderErrorCode::Callback);
    REQUIRE(status.error_message == "caller rejected metadata");
    REQUIRE(aggregator->metrics_for("llama3.2:1b")->overall_stats.total_requests == 1);
}

TEST_CASE("MetricsProvider passes other operations through") {
    auto inner = std::make_shared<FakeChatProvider>();
    MetricsProvider provider(inner, nullptr);
    const Host host = make_host("host-01");
    CancellationToken cancel;

    auto models = provider.list_loaded_models(host, cancel);
    REQUIRE(models.status.success);
    REQUIRE(models.models == std::vector<std::string>{"loaded-model"});
    REQUIRE(provider.ensure_model_ready(host, "m", cancel).success);
    REQUIRE(provider.unload_model(host, "m", cancel).success);
    REQUIRE(provider.close().success);

    REQUIRE(inner->list_calls.load() == 1);
    REQUIRE(inner->ready_calls.load() == 1);
    REQUIRE(inner->unload_calls.load() == 1);
    REQUIRE(inner->close_calls.load() == 1);
}

TEST_CASE("MetricsProvider serves concurrent streams") {
    TempDir temp_dir;
    auto aggregator = std::make_shared<MetricsAggregator>((temp_dir.path() / "m.json").string(), 0ms);
    auto inner = std::make_shared<FakeChatProvider>();
    auto provider = std::make_shared<MetricsProvider>(inner, aggregator);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([provider]() {
            for (int i = 0; i < 25; ++i) {
                StreamRequest request;
                request.host = make_host("host-01");
                request.model = "shared";
                if (!provider->stream(request, {}).success) {
                    return;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(aggregator->metrics_for("shared")->overall_stats.total_requests == 100);
}
