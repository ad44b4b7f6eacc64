/*
 * Profile selection and dispatch for configured providers
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef PROVIDER_MANAGER_HPP
#define PROVIDER_MANAGER_HPP

#include "Configuration.hpp"
#include "IProvider.hpp"
#include "RequestExecutor.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * Entry point for hosts
 *
 * Owns the configuration and the transport, and lazily creates one adapter
 * per profile so every profile keeps its own token cache. Failures to
 * resolve a profile are reported as ErrorKind::Configuration before any
 * network activity.
 */
class ProviderManager {
public:
    /**
     * @param configuration Loaded configuration
     * @param transport Transport for every adapter; nullptr selects one from the host environment
     * @param retry_policy Connection retry policy for every adapter
     */
    explicit ProviderManager(AssistantConfiguration configuration,
                             TransportPtr transport = nullptr,
                             RetryPolicy retry_policy = {});
    ~ProviderManager() = default;

    const AssistantConfiguration& configuration() const { return configuration_; }
    const TransportPtr& transport() const { return transport_; }

    /**
     * Profiles a host should offer for selection
     */
    std::vector<std::string> visible_profiles() const;

    /**
     * Set the active profile
     * @return false if no such profile is configured
     */
    bool set_active_profile(const std::string& name);

    std::string active_profile() const;

    /**
     * Adapter of a profile (created on first use)
     * @return Adapter or nullptr when the profile or its handler is unknown
     */
    ProviderPtr provider_for(const std::string& profile);

    /**
     * Query the active profile
     */
    ProviderResult query(const std::vector<ChatMessage>& messages,
                         const QueryOptions& options = {});

    ProviderResult query(const std::string& profile,
                         const std::vector<ChatMessage>& messages,
                         const QueryOptions& options = {});

    PendingQueryPtr query_async(const std::vector<ChatMessage>& messages,
                                const QueryOptions& options = {});

    PendingQueryPtr query_async(const std::string& profile,
                                const std::vector<ChatMessage>& messages,
                                const QueryOptions& options = {});

private:
    /**
     * Settings and adapter for a profile, or the configuration failure
     */
    std::optional<ProviderResult> resolve(const std::string& profile,
                                          const ProviderSettings*& settings,
                                          ProviderPtr& provider);

    AssistantConfiguration configuration_;
    TransportPtr transport_;
    RetryPolicy retry_policy_;

    mutable std::mutex mutex_;
    std::string active_profile_;
    std::unordered_map<std::string, ProviderPtr> providers_;
};

#endif // PROVIDER_MANAGER_HPP
