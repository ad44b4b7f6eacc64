/*
 * Request executor implementation
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "RequestExecutor.hpp"
#include "Logger.hpp"
#include "Redaction.hpp"

#include <stdexcept>

RequestExecutor::RequestExecutor(TransportPtr transport, RetryPolicy policy)
    : transport_(std::move(transport))
    , policy_(policy)
{
    if (!transport_) {
        throw std::invalid_argument("RequestExecutor requires a transport");
    }
    if (policy_.max_retries < 0) {
        policy_.max_retries = 0;
    }
}

RequestOutcome RequestExecutor::execute(const HttpRequest& request,
                                        const TimeoutPolicy& timeouts,
                                        const CancellationToken& cancel,
                                        const DataSink& on_data) const
{
    bool delivered_data = false;
    DataSink tracking_sink;
    if (on_data) {
        tracking_sink = [&delivered_data, &on_data](const char* data, std::size_t length) {
            delivered_data = true;
            on_data(data, length);
        };
    }

    int attempt = 0;
    RequestOutcome outcome;

    while (true) {
        if (cancel.is_cancelled()) {
            return RequestOutcome::cancelled();
        }

        if (auto logger = Logger::get_logger(Logger::kNetLogger)) {
            logger->debug("RequestExecutor attempt {} via {}: {}", attempt + 1,
                          transport_->name(), Redaction::describe_request(request));
        }

        outcome = transport_->send(request, timeouts, cancel, tracking_sink);

        // Only connection failures are retried
        if (outcome.kind != OutcomeKind::ConnectionError) {
            break;
        }
        if (delivered_data || attempt >= policy_.max_retries) {
            break;
        }

        ++attempt;
        if (auto logger = Logger::get_logger(Logger::kNetLogger)) {
            logger->debug("RequestExecutor retry {} after {}ms: {}", attempt,
                          policy_.retry_delay.count(), outcome.detail);
        }
        if (cancel.wait_for(policy_.retry_delay)) {
            return RequestOutcome::cancelled();
        }
    }

    if (outcome.kind == OutcomeKind::ConnectionError) {
        if (auto logger = Logger::get_logger(Logger::kNetLogger)) {
            logger->error("Request to {} failed after {} attempt(s): {}",
                          Redaction::redact_url(request.url), attempt + 1, outcome.detail);
        }
    }
    return outcome;
}
