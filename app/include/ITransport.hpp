/*
 * Transport abstraction: one HTTP POST, one outcome
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef I_TRANSPORT_HPP
#define I_TRANSPORT_HPP

#include "CancellationToken.hpp"
#include "HttpTypes.hpp"
#include <memory>
#include <string>

/**
 * Executes a single HTTP POST
 *
 * Implementations:
 * - CurlTransport: in-process libcurl client (default)
 * - ProcessTransport: shells out to the curl executable on hosts whose
 *   TLS stack is unreliable
 *
 * Contract:
 * - status >= 400 yields HttpError with the raw body, never ConnectionError
 * - socket/TLS/process failures yield ConnectionError with a description
 * - a cancelled token yields Cancelled and aborts the transfer in flight
 * - on_data, when set, sees the body of a 2xx response as it arrives;
 *   the full body is still returned in the outcome
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * Short identifier used in logs ("curl", "process")
     */
    virtual std::string name() const = 0;

    virtual RequestOutcome send(const HttpRequest& request,
                                const TimeoutPolicy& timeouts,
                                const CancellationToken& cancel,
                                const DataSink& on_data = nullptr) = 0;
};

using TransportPtr = std::shared_ptr<ITransport>;

#endif // I_TRANSPORT_HPP
