/*
 * Metrics-recording provider decorator implementation
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "MetricsProvider.hpp"
#include "Logger.hpp"

#include <chrono>
#include <memory>
#include <optional>

namespace {

ChatProviderPtr unwrap(ChatProviderPtr provider)
{
    while (auto wrapped = std::dynamic_pointer_cast<MetricsProvider>(provider)) {
        provider = wrapped->inner();
    }
    return provider;
}

ProviderStatus no_inner_provider()
{
    return ProviderStatus::error(ProviderErrorCode::NoProvider, "metrics: no inner provider");
}

} // namespace

MetricsProvider::MetricsProvider(ChatProviderPtr inner, MetricsAggregatorPtr aggregator)
    : inner_(unwrap(std::move(inner)))
    , aggregator_(std::move(aggregator))
{}

std::string MetricsProvider::id() const
{
    return inner_ ? inner_->id() : std::string("metrics");
}

ModelListResult MetricsProvider::list_loaded_models(const Host& host, const CancellationToken& cancel)
{
    if (!inner_) {
        ModelListResult result;
        result.status = no_inner_provider();
        return result;
    }
    return inner_->list_loaded_models(host, cancel);
}

ProviderStatus MetricsProvider::ensure_model_ready(const Host& host,
                                                   const std::string& model,
                                                   const CancellationToken& cancel)
{
    if (!inner_) {
        return no_inner_provider();
    }
    return inner_->ensure_model_ready(host, model, cancel);
}

ProviderStatus MetricsProvider::stream(const StreamRequest& request, const StreamCallbacks& callbacks)
{
    if (!inner_) {
        return no_inner_provider();
    }

    using Clock = std::chrono::steady_clock;
    struct CallState {
        Clock::time_point start;
        std::optional<Clock::time_point> first_chunk;
    };
    auto state = std::make_shared<CallState>();
    state->start = Clock::now();

    StreamCallbacks wrapped;
    wrapped.on_chunk = [state, on_chunk = callbacks.on_chunk](const ChatMessage& msg)
        -> std::optional<std::string> {
        if (!state->first_chunk) {
            state->first_chunk = Clock::now();
        }
        if (on_chunk) {
            return on_chunk(msg);
        }
        return std::nullopt;
    };
    wrapped.on_complete = [state, aggregator = aggregator_, on_complete = callbacks.on_complete]
        (const StreamMetadata& meta) -> std::optional<std::string> {
        int64_t ttft_ms = 0;
        if (state->first_chunk) {
            ttft_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                *state->first_chunk - state->start).count();
        }
        if (aggregator) {
            aggregator->record(meta, ttft_ms);
        } else if (auto logger = Logger::get_logger("metrics_logger")) {
            logger->debug("No aggregator configured, skipping metrics for {}", meta.model);
        }
        if (on_complete) {
            return on_complete(meta);
        }
        return std::nullopt;
    };

    return inner_->stream(request, wrapped);
}

ProviderStatus MetricsProvider::unload_model(const Host& host,
                                             const std::string& model,
                                             const CancellationToken& cancel)
{
    if (!inner_) {
        return no_inner_provider();
    }
    return inner_->unload_model(host, model, cancel);
}

ProviderStatus MetricsProvider::close()
{
    if (!inner_) {
        return ProviderStatus::ok();
    }
    return inner_->close();
}
