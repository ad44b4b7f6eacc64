/*
 * Value types exchanged between adapters, the executor and transports
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef HTTP_TYPES_HPP
#define HTTP_TYPES_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

using HttpHeader = std::pair<std::string, std::string>;
using HttpHeaders = std::vector<HttpHeader>;

/**
 * A single HTTP POST
 */
struct HttpRequest {
    std::string url;
    HttpHeaders headers;
    std::string body;

    /**
     * Value of the first header with this name (case-insensitive), or empty
     */
    std::string header(const std::string& name) const;

    /**
     * Replace or add a header (case-insensitive name match)
     */
    void set_header(const std::string& name, const std::string& value);
};

/**
 * Connect and whole-transfer budgets for one attempt
 */
struct TimeoutPolicy {
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds overall_timeout{std::chrono::seconds(90)};

    static constexpr std::size_t kLargePayloadBytes = 10000;

    static TimeoutPolicy standard();
    static TimeoutPolicy extended();
    static TimeoutPolicy with_tools();
    static TimeoutPolicy for_payload(std::size_t body_bytes);
};

enum class OutcomeKind {
    Success,
    HttpError,
    ConnectionError,
    Cancelled,
};

/**
 * Result of one request: exactly one kind holds
 *
 * Success and HttpError carry the status code and raw body; ConnectionError
 * carries a low-level description in detail; Cancelled carries nothing.
 */
struct RequestOutcome {
    OutcomeKind kind{OutcomeKind::ConnectionError};
    int status_code{0};
    std::string body;
    std::string detail;

    static RequestOutcome success(int status_code, std::string body);
    static RequestOutcome http_error(int status_code, std::string body);
    static RequestOutcome connection_error(std::string detail);
    static RequestOutcome cancelled();

    /**
     * Success for status < 400, HttpError otherwise
     */
    static RequestOutcome from_status(int status_code, std::string body);

    bool is_success() const { return kind == OutcomeKind::Success; }
};

const char* to_string(OutcomeKind kind);

/**
 * Receives raw response bytes of a 2xx response as they arrive
 */
using DataSink = std::function<void(const char* data, std::size_t length)>;

#endif // HTTP_TYPES_HPP
