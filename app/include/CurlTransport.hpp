/*
 * Native HTTPS transport on libcurl
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef CURL_TRANSPORT_HPP
#define CURL_TRANSPORT_HPP

#include "ITransport.hpp"

/**
 * In-process transport using the libcurl easy interface
 *
 * Each send() owns its own easy handle, so concurrent sends from different
 * threads are safe. Cancellation is polled from the transfer progress
 * callback and aborts the connection.
 */
class CurlTransport : public ITransport {
public:
    struct Options {
        bool verify_tls{true};
        std::string user_agent{"parley/1.0"};
    };

    CurlTransport();
    explicit CurlTransport(Options options);
    ~CurlTransport() override = default;

    std::string name() const override { return "curl"; }

    RequestOutcome send(const HttpRequest& request,
                        const TimeoutPolicy& timeouts,
                        const CancellationToken& cancel,
                        const DataSink& on_data = nullptr) override;

private:
    Options options_;
};

#endif // CURL_TRANSPORT_HPP
