/*
 * Transport selection from host capabilities
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef TRANSPORT_FACTORY_HPP
#define TRANSPORT_FACTORY_HPP

#include "ITransport.hpp"
#include <filesystem>
#include <string>

enum class TransportMode {
    Auto,       // Decide from host detection
    Native,     // Always libcurl in-process
    Process,    // Always the curl executable
};

/**
 * What the host tells us about itself
 */
struct HostEnvironment {
    TransportMode mode{TransportMode::Auto};
    bool native_tls_reliable{true};
    bool verify_tls{true};
    std::string curl_executable{"curl"};
    std::filesystem::path temp_dir;

    /**
     * Inspect the running system
     *
     * Kindle firmware ships a TLS stack that fails against current
     * provider endpoints; it is recognised by /etc/prettyversion.txt.
     */
    static HostEnvironment detect();
};

TransportMode parse_transport_mode(const std::string& text);

class TransportFactory {
public:
    /**
     * Create the transport appropriate for the host
     */
    static TransportPtr create(const HostEnvironment& environment);

    /**
     * Whether create() would pick the process transport
     */
    static bool use_process_transport(const HostEnvironment& environment);
};

#endif // TRANSPORT_FACTORY_HPP
