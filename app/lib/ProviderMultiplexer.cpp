/*
 * Provider multiplexer implementation
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "ProviderMultiplexer.hpp"
#include "Logger.hpp"

#include <set>

void ProviderMultiplexer::register_provider(const std::string& host_type, ChatProviderPtr provider)
{
    if (!provider) {
        return;
    }

    const std::string key = normalize_host_type(host_type);
    const std::string provider_id = provider->id();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        providers_[key] = std::move(provider);
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Registered provider {} for host type {}", provider_id, key);
    }
}

void ProviderMultiplexer::unregister_provider(const std::string& host_type)
{
    const std::string key = normalize_host_type(host_type);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(key);
    if (it != providers_.end()) {
        providers_.erase(it);

        if (auto logger = Logger::get_logger("core_logger")) {
            logger->info("Unregistered provider for host type {}", key);
        }
    }
}

ChatProviderPtr ProviderMultiplexer::get_provider(const std::string& host_type) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(normalize_host_type(host_type));
    if (it != providers_.end()) {
        return it->second;
    }
    return nullptr;
}

std::vector<std::string> ProviderMultiplexer::registered_types() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(providers_.size());
    for (const auto& [type, provider] : providers_) {
        result.push_back(type);
    }
    return result;
}

ProviderStatus ProviderMultiplexer::create_no_provider_error(const std::string& host_type)
{
    return ProviderStatus::error(ProviderErrorCode::NoProvider,
                                 "no provider registered for host type \"" + host_type + "\"");
}

ChatProviderPtr ProviderMultiplexer::resolve(const Host& host, ProviderStatus& status) const
{
    if (auto provider = get_provider(host.type)) {
        status = ProviderStatus::ok();
        return provider;
    }

    // An empty type normalizes to ollama, so the fallback is already tried.
    status = create_no_provider_error(normalize_host_type(host.type));
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->warn("Host {}: {}", host.identifier(), status.error_message);
    }
    return nullptr;
}

ModelListResult ProviderMultiplexer::list_loaded_models(const Host& host, const CancellationToken& cancel)
{
    ProviderStatus status;
    auto provider = resolve(host, status);
    if (!provider) {
        ModelListResult result;
        result.status = status;
        return result;
    }
    return provider->list_loaded_models(host, cancel);
}

ProviderStatus ProviderMultiplexer::ensure_model_ready(const Host& host,
                                                       const std::string& model,
                                                       const CancellationToken& cancel)
{
    ProviderStatus status;
    auto provider = resolve(host, status);
    if (!provider) {
        return status;
    }
    return provider->ensure_model_ready(host, model, cancel);
}

ProviderStatus ProviderMultiplexer::stream(const StreamRequest& request, const StreamCallbacks& callbacks)
{
    ProviderStatus status;
    auto provider = resolve(request.host, status);
    if (!provider) {
        return status;
    }
    return provider->stream(request, callbacks);
}

ProviderStatus ProviderMultiplexer::unload_model(const Host& host,
                                                 const std::string& model,
                                                 const CancellationToken& cancel)
{
    ProviderStatus status;
    auto provider = resolve(host, status);
    if (!provider) {
        return status;
    }
    return provider->unload_model(host, model, cancel);
}

ProviderStatus ProviderMultiplexer::close()
{
    std::vector<ChatProviderPtr> distinct;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::set<IChatProvider*> seen;
        for (const auto& [type, provider] : providers_) {
            if (seen.insert(provider.get()).second) {
                distinct.push_back(provider);
            }
        }
    }

    ProviderStatus first_error = ProviderStatus::ok();
    for (const auto& provider : distinct) {
        auto status = provider->close();
        if (!status.success) {
            if (auto logger = Logger::get_logger("core_logger")) {
                logger->warn("Closing provider {} failed: {}", provider->id(), status.error_message);
            }
            if (first_error.success) {
                first_error = status;
            }
        }
    }
    return first_error;
}
