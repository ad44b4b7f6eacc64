/*
 * JSON configuration loading and profile resolution
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef CONFIGURATION_HPP
#define CONFIGURATION_HPP

#include "ProviderSettings.hpp"
#include "TransportFactory.hpp"

#include <optional>
#include <string>
#include <vector>

/**
 * "transport" section
 */
struct TransportSettings {
    TransportMode mode{TransportMode::Auto};
    std::string curl_path{"curl"};
    std::string temp_dir;
    std::optional<bool> verify_tls;          // Unset: follow host detection
};

/**
 * Whole configuration document
 */
struct AssistantConfiguration {
    std::string provider;                    // Explicitly selected profile (may be empty)
    TransportSettings transport;
    std::vector<ProviderSettings> profiles;  // Sorted by profile name

    const ProviderSettings* find_profile(const std::string& name) const;

    /**
     * The explicit provider, else the first profile marked default, else empty
     */
    std::string selected_profile() const;

    /**
     * Names of profiles with visible == true
     */
    std::vector<std::string> visible_profiles() const;

    /**
     * Host environment with the transport section applied
     */
    HostEnvironment host_environment(HostEnvironment detected = HostEnvironment::detect()) const;
};

struct ConfigurationLoadResult {
    bool success{false};
    AssistantConfiguration configuration;
    std::string error_message;
};

ConfigurationLoadResult load_configuration_from_string(const std::string& text);
ConfigurationLoadResult load_configuration_from_file(const std::string& path);

/**
 * Adapter id for a profile
 *
 * The explicit handler wins; otherwise a profile named after a known
 * handler uses it; otherwise the prefix before the first '_'
 * ("openai_grok" -> "openai").
 */
std::string resolve_handler(const std::string& profile_name, const std::string& explicit_handler = {});

#endif // CONFIGURATION_HPP
