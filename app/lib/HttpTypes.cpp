/*
 * Request/outcome value types
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "HttpTypes.hpp"

#include <algorithm>
#include <cctype>

namespace {

bool iequals(const std::string& a, const std::string& b)
{
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace

std::string HttpRequest::header(const std::string& name) const
{
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return value;
        }
    }
    return {};
}

void HttpRequest::set_header(const std::string& name, const std::string& value)
{
    for (auto& [key, existing] : headers) {
        if (iequals(key, name)) {
            existing = value;
            return;
        }
    }
    headers.emplace_back(name, value);
}

TimeoutPolicy TimeoutPolicy::standard()
{
    return TimeoutPolicy{};
}

TimeoutPolicy TimeoutPolicy::extended()
{
    TimeoutPolicy policy;
    policy.connect_timeout = std::chrono::seconds(500);
    policy.overall_timeout = std::chrono::seconds(500);
    return policy;
}

TimeoutPolicy TimeoutPolicy::with_tools()
{
    TimeoutPolicy policy;
    policy.connect_timeout = std::chrono::seconds(60);
    policy.overall_timeout = std::chrono::seconds(180);
    return policy;
}

TimeoutPolicy TimeoutPolicy::for_payload(std::size_t body_bytes)
{
    return body_bytes > kLargePayloadBytes ? extended() : standard();
}

RequestOutcome RequestOutcome::success(int status_code, std::string body)
{
    RequestOutcome outcome;
    outcome.kind = OutcomeKind::Success;
    outcome.status_code = status_code;
    outcome.body = std::move(body);
    return outcome;
}

RequestOutcome RequestOutcome::http_error(int status_code, std::string body)
{
    RequestOutcome outcome;
    outcome.kind = OutcomeKind::HttpError;
    outcome.status_code = status_code;
    outcome.body = std::move(body);
    return outcome;
}

RequestOutcome RequestOutcome::connection_error(std::string detail)
{
    RequestOutcome outcome;
    outcome.kind = OutcomeKind::ConnectionError;
    outcome.detail = std::move(detail);
    return outcome;
}

RequestOutcome RequestOutcome::cancelled()
{
    RequestOutcome outcome;
    outcome.kind = OutcomeKind::Cancelled;
    return outcome;
}

RequestOutcome RequestOutcome::from_status(int status_code, std::string body)
{
    if (status_code >= 400) {
        return http_error(status_code, std::move(body));
    }
    return success(status_code, std::move(body));
}

const char* to_string(OutcomeKind kind)
{
    switch (kind) {
        case OutcomeKind::Success: return "success";
        case OutcomeKind::HttpError: return "http-error";
        case OutcomeKind::ConnectionError: return "connection-error";
        case OutcomeKind::Cancelled: return "cancelled";
    }
    return "unknown";
}
