/*
 * Host-type multiplexer for chat providers
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef PROVIDER_MULTIPLEXER_HPP
#define PROVIDER_MULTIPLEXER_HPP

#include "IChatProvider.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * Routes provider calls by the target host's declared type
 *
 * This is the single choke point that maps a host to its backend adapter.
 * Host types are normalized before lookup, so "llamacpp" and "llama.cpp"
 * resolve to the same provider. A host without a type is routed to the
 * Ollama provider when one is registered.
 */
class ProviderMultiplexer : public IChatProvider {
public:
    ProviderMultiplexer() = default;
    ~ProviderMultiplexer() override = default;

    /**
     * Register a provider for a host type
     * @param host_type Declared host type (normalized before storing)
     * @param provider The provider to register; null is ignored
     */
    void register_provider(const std::string& host_type, ChatProviderPtr provider);

    /**
     * Remove the provider for a host type
     */
    void unregister_provider(const std::string& host_type);

    /**
     * Get the provider registered for a host type
     * @return Provider or nullptr if not found
     */
    ChatProviderPtr get_provider(const std::string& host_type) const;

    /**
     * Normalized host types with a registered provider
     */
    std::vector<std::string> registered_types() const;

    // IChatProvider interface
    std::string id() const override { return "multiplex"; }
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

    /**
     * Close every distinct registered provider exactly once
     * @return The first error encountered; later providers are still closed
     */
    ProviderStatus close() override;

private:
    ChatProviderPtr resolve(const Host& host, ProviderStatus& status) const;
    static ProviderStatus create_no_provider_error(const std::string& host_type);

    mutable std::mutex mutex_;
    std::map<std::string, ChatProviderPtr> providers_;
};

#endif // PROVIDER_MULTIPLEXER_HPP
