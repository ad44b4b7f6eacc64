/*
 * Credential redaction for diagnostics
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef REDACTION_HPP
#define REDACTION_HPP

#include "HttpTypes.hpp"
#include <string>
#include <vector>

/**
 * Everything that reaches a log sink about a request goes through these
 * helpers. Secrets live in headers (Authorization, x-api-key, ...) and in
 * query parameters (Gemini's ?key=...).
 */
namespace Redaction {

constexpr const char* kMask = "***";

/**
 * Mask credential-bearing query parameter values
 */
std::string redact_url(const std::string& url);

/**
 * Copy of headers with credential-bearing values masked
 *
 * Authorization-style headers keep their scheme word ("Bearer ***").
 */
HttpHeaders redact_headers(const HttpHeaders& headers);

/**
 * Single-line description safe to log: method, redacted URL, redacted headers, body size
 */
std::string describe_request(const HttpRequest& request);

/**
 * Remove every literal occurrence of the given secrets from text
 */
std::string redact_secrets(std::string text, const std::vector<std::string>& secrets);

/**
 * Secret material carried by a request (header credentials and query keys)
 */
std::vector<std::string> collect_secrets(const HttpRequest& request);

} // namespace Redaction

#endif // REDACTION_HPP
