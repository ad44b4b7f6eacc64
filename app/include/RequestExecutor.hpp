/*
 * Timeout, retry and cancellation policy around a transport
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef REQUEST_EXECUTOR_HPP
#define REQUEST_EXECUTOR_HPP

#include "ITransport.hpp"
#include <chrono>

/**
 * Bounded retry for connection-level failures
 */
struct RetryPolicy {
    int max_retries{2};
    std::chrono::milliseconds retry_delay{3000};
};

/**
 * Runs one request through a transport
 *
 * - ConnectionError is retried up to max_retries times with a fixed delay,
 *   unless response bytes were already handed to the data sink
 * - HttpError is returned immediately; adapters decode it
 * - Cancellation is checked before each attempt and interrupts the retry delay
 */
class RequestExecutor {
public:
    explicit RequestExecutor(TransportPtr transport, RetryPolicy policy = {});

    RequestOutcome execute(const HttpRequest& request,
                           const TimeoutPolicy& timeouts,
                           const CancellationToken& cancel,
                           const DataSink& on_data = nullptr) const;

    const RetryPolicy& retry_policy() const { return policy_; }
    const TransportPtr& transport() const { return transport_; }

private:
    TransportPtr transport_;
    RetryPolicy policy_;
};

#endif // REQUEST_EXECUTOR_HPP
