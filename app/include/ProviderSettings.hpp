/*
 * Per-profile provider configuration
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef PROVIDER_SETTINGS_HPP
#define PROVIDER_SETTINGS_HPP

#include "JsonSupport.hpp"
#include <optional>
#include <string>

/**
 * Settings of one configured profile (e.g. "openai", "openai_grok")
 *
 * Owned by the configuration layer; adapters only read it.
 */
struct ProviderSettings {
    std::string name;                        // Profile name
    std::string handler;                     // Adapter id resolved for the profile
    std::string base_url;
    std::string auth_url;                    // Token endpoint (client-credentials providers)
    std::string api_key;                     // API key or client secret
    std::string model;
    std::optional<int> max_tokens;           // Legacy top-level placement
    std::optional<double> temperature;       // Legacy top-level placement
    bool enable_web_search{false};
    bool is_default{false};
    bool visible{true};
    Json::Value additional_parameters{Json::objectValue};

    /**
     * Additional parameter or nullptr
     */
    const Json::Value* parameter(const std::string& key) const;

    /**
     * max_tokens from additional parameters, else the top-level value
     */
    std::optional<int> resolved_max_tokens() const;

    /**
     * temperature from additional parameters, else the top-level value
     */
    std::optional<double> resolved_temperature() const;

    /**
     * additional_parameters.stream == true
     */
    bool stream_requested() const;
};

#endif // PROVIDER_SETTINGS_HPP
