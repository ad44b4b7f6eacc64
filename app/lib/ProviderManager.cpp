/*
 * Provider manager implementation
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "ProviderManager.hpp"
#include "Logger.hpp"
#include "ProviderFactory.hpp"
#include "TransportFactory.hpp"

namespace {

ProviderResult configuration_error(const std::string& profile, std::string message)
{
    ProviderResult result = ProviderResult::failure(ErrorKind::Configuration, std::move(message));
    result.provider_id = profile;
    return result;
}

} // namespace

ProviderManager::ProviderManager(AssistantConfiguration configuration,
                                 TransportPtr transport,
                                 RetryPolicy retry_policy)
    : configuration_(std::move(configuration))
    , transport_(std::move(transport))
    , retry_policy_(retry_policy)
{
    if (!transport_) {
        transport_ = TransportFactory::create(configuration_.host_environment());
    }
    active_profile_ = configuration_.selected_profile();

    if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
        logger->info("Provider manager ready: {} profiles, active '{}', transport {}",
                     configuration_.profiles.size(), active_profile_, transport_->name());
    }
}

std::vector<std::string> ProviderManager::visible_profiles() const
{
    return configuration_.visible_profiles();
}

bool ProviderManager::set_active_profile(const std::string& name)
{
    if (!configuration_.find_profile(name)) {
        if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
            logger->warn("Cannot set active profile: {} not found", name);
        }
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    active_profile_ = name;
    if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
        logger->info("Set active profile: {}", name);
    }
    return true;
}

std::string ProviderManager::active_profile() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return active_profile_;
}

ProviderPtr ProviderManager::provider_for(const std::string& profile)
{
    const ProviderSettings* settings = configuration_.find_profile(profile);
    if (!settings) {
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(profile);
    if (it != providers_.end()) {
        return it->second;
    }

    ProviderPtr provider = ProviderFactory::create(settings->handler, transport_, retry_policy_);
    if (provider) {
        providers_.emplace(profile, provider);
        if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
            logger->debug("Created {} adapter for profile {}", settings->handler, profile);
        }
    }
    return provider;
}

std::optional<ProviderResult> ProviderManager::resolve(const std::string& profile,
                                                       const ProviderSettings*& settings,
                                                       ProviderPtr& provider)
{
    if (profile.empty()) {
        return configuration_error(profile, "No provider specified in configuration");
    }

    settings = configuration_.find_profile(profile);
    provider = settings ? provider_for(profile) : nullptr;
    if (!settings || !provider) {
        if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
            logger->warn("Unsupported provider {}", profile);
        }
        return configuration_error(profile, "Unsupported provider " + profile);
    }
    return std::nullopt;
}

ProviderResult ProviderManager::query(const std::vector<ChatMessage>& messages,
                                      const QueryOptions& options)
{
    return query(active_profile(), messages, options);
}

ProviderResult ProviderManager::query(const std::string& profile,
                                      const std::vector<ChatMessage>& messages,
                                      const QueryOptions& options)
{
    const ProviderSettings* settings = nullptr;
    ProviderPtr provider;
    if (auto failure = resolve(profile, settings, provider)) {
        return *failure;
    }
    return provider->query(messages, *settings, options);
}

PendingQueryPtr ProviderManager::query_async(const std::vector<ChatMessage>& messages,
                                             const QueryOptions& options)
{
    return query_async(active_profile(), messages, options);
}

PendingQueryPtr ProviderManager::query_async(const std::string& profile,
                                             const std::vector<ChatMessage>& messages,
                                             const QueryOptions& options)
{
    const ProviderSettings* settings = nullptr;
    ProviderPtr provider;
    if (auto failure = resolve(profile, settings, provider)) {
        return std::make_shared<PendingQuery>(std::move(*failure));
    }
    return provider->query_async(messages, *settings, options);
}
