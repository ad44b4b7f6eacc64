/*
 * Credential redaction
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "Redaction.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>

namespace {

constexpr std::array<const char*, 6> kSecretQueryParams = {
    "key", "api_key", "apikey", "access_token", "token", "client_secret"
};

constexpr std::array<const char*, 2> kSchemeHeaders = {
    "authorization", "proxy-authorization"
};

constexpr std::array<const char*, 4> kSecretHeaders = {
    "x-api-key", "api-key", "x-goog-api-key", "cookie"
};

std::string to_lower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

template <std::size_t N>
bool contains(const std::array<const char*, N>& names, const std::string& lowered)
{
    return std::any_of(names.begin(), names.end(),
                       [&](const char* name) { return lowered == name; });
}

std::string mask_scheme_value(const std::string& value)
{
    const auto space = value.find(' ');
    if (space == std::string::npos) {
        return Redaction::kMask;
    }
    return value.substr(0, space) + " " + Redaction::kMask;
}

// Query parameter values: everything between '=' and the next '&' or '#'.
template <typename Fn>
void for_each_query_param(const std::string& url, Fn&& fn)
{
    const auto query_start = url.find('?');
    if (query_start == std::string::npos) {
        return;
    }
    std::size_t pos = query_start + 1;
    while (pos < url.size() && url[pos] != '#') {
        std::size_t end = url.find_first_of("&#", pos);
        if (end == std::string::npos) {
            end = url.size();
        }
        const auto eq = url.find('=', pos);
        if (eq != std::string::npos && eq < end) {
            fn(url.substr(pos, eq - pos), eq + 1, end);
        }
        if (end >= url.size() || url[end] == '#') {
            break;
        }
        pos = end + 1;
    }
}

} // namespace

namespace Redaction {

std::string redact_url(const std::string& url)
{
    std::vector<std::pair<std::size_t, std::size_t>> spans;
    for_each_query_param(url, [&](const std::string& name, std::size_t value_begin, std::size_t value_end) {
        if (contains(kSecretQueryParams, to_lower(name)) && value_end > value_begin) {
            spans.emplace_back(value_begin, value_end);
        }
    });

    std::string result = url;
    // Replace right-to-left so earlier offsets stay valid.
    for (auto it = spans.rbegin(); it != spans.rend(); ++it) {
        result.replace(it->first, it->second - it->first, kMask);
    }
    return result;
}

HttpHeaders redact_headers(const HttpHeaders& headers)
{
    HttpHeaders redacted;
    redacted.reserve(headers.size());
    for (const auto& [name, value] : headers) {
        const std::string lowered = to_lower(name);
        if (contains(kSchemeHeaders, lowered)) {
            redacted.emplace_back(name, mask_scheme_value(value));
        } else if (contains(kSecretHeaders, lowered)) {
            redacted.emplace_back(name, kMask);
        } else {
            redacted.emplace_back(name, value);
        }
    }
    return redacted;
}

std::string describe_request(const HttpRequest& request)
{
    std::ostringstream out;
    out << "POST " << redact_url(request.url) << " headers=[";
    bool first = true;
    for (const auto& [name, value] : redact_headers(request.headers)) {
        if (!first) {
            out << ", ";
        }
        first = false;
        out << name << ": " << value;
    }
    out << "] body_bytes=" << request.body.size();
    return out.str();
}

std::string redact_secrets(std::string text, const std::vector<std::string>& secrets)
{
    for (const auto& secret : secrets) {
        if (secret.empty()) {
            continue;
        }
        std::size_t pos = 0;
        while ((pos = text.find(secret, pos)) != std::string::npos) {
            text.replace(pos, secret.size(), kMask);
            pos += std::char_traits<char>::length(kMask);
        }
    }
    return text;
}

std::vector<std::string> collect_secrets(const HttpRequest& request)
{
    std::vector<std::string> secrets;
    for (const auto& [name, value] : request.headers) {
        const std::string lowered = to_lower(name);
        if (contains(kSchemeHeaders, lowered)) {
            const auto space = value.find(' ');
            secrets.push_back(space == std::string::npos ? value : value.substr(space + 1));
        } else if (contains(kSecretHeaders, lowered)) {
            secrets.push_back(value);
        }
    }
    for_each_query_param(request.url, [&](const std::string& name, std::size_t value_begin, std::size_t value_end) {
        if (contains(kSecretQueryParams, to_lower(name)) && value_end > value_begin) {
            secrets.push_back(request.url.substr(value_begin, value_end - value_begin));
        }
    });
    return secrets;
}

} // namespace Redaction
