/*
 * Metrics-recording provider decorator
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef METRICS_PROVIDER_HPP
#define METRICS_PROVIDER_HPP

#include "IChatProvider.hpp"
#include "MetricsAggregator.hpp"

#include <string>

/**
 * Wraps a provider and records every completed stream into an aggregator
 *
 * Time to first token is measured from the start of stream() to the first
 * chunk. Chunks, metadata and statuses are forwarded unchanged. Wrapping a
 * MetricsProvider wraps its inner provider instead, so nothing is counted
 * twice.
 */
class MetricsProvider : public IChatProvider {
public:
    /**
     * @param inner Provider to decorate
     * @param aggregator Destination for measurements; null disables recording
     */
    MetricsProvider(ChatProviderPtr inner, MetricsAggregatorPtr aggregator);
    ~MetricsProvider() override = default;

    const ChatProviderPtr& inner() const { return inner_; }
    const MetricsAggregatorPtr& aggregator() const { return aggregator_; }

    // IChatProvider interface
    std::string id() const override;
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

private:
    ChatProviderPtr inner_;
    MetricsAggregatorPtr aggregator_;
};

#endif // METRICS_PROVIDER_HPP
