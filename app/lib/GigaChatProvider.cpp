/*
 * GigaChat provider implementation
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "GigaChatProvider.hpp"
#include "Logger.hpp"

namespace {

constexpr std::chrono::seconds kAuthConnectTimeout{20};
constexpr std::chrono::seconds kAuthOverallTimeout{45};
constexpr std::chrono::seconds kChatConnectTimeout{45};
constexpr std::chrono::seconds kChatOverallTimeout{90};

std::string auth_failure_detail(const RequestOutcome& outcome)
{
    switch (outcome.kind) {
        case OutcomeKind::HttpError: {
            std::string detail = "Auth request failed (HTTP " + std::to_string(outcome.status_code) + ")";
            Json::Value root;
            if (JsonSupport::parse(outcome.body, root) && root.isObject()) {
                const std::string message = JsonSupport::string_member(root, "message");
                if (!message.empty()) {
                    detail += ": " + message;
                }
            }
            return detail;
        }
        case OutcomeKind::ConnectionError:
            return "Auth request failed: " + outcome.detail;
        case OutcomeKind::Cancelled:
            return "Request cancelled";
        case OutcomeKind::Success:
            break;
    }
    return {};
}

} // namespace

GigaChatProvider::GigaChatProvider(TransportPtr transport, RetryPolicy retry_policy,
                                   TokenCache::Clock clock)
    : ChatCompletionsProvider(std::move(transport), retry_policy)
    , token_cache_(std::make_unique<TokenCache>(
          [this](const CancellationToken& cancel) { return exchange_token(cancel); },
          std::move(clock)))
{}

ProviderCapability GigaChatProvider::capabilities() const
{
    return ProviderCapability::RemoteInference | ProviderCapability::Streaming |
           ProviderCapability::TokenExchange;
}

std::optional<std::string> GigaChatProvider::validate_settings(const ProviderSettings& settings) const
{
    const std::string label = settings.name.empty() ? id() : settings.name;
    if (settings.api_key.empty()) {
        return "No API key found for provider " + label;
    }
    if (settings.base_url.empty()) {
        return "No base_url configured for provider " + label;
    }
    if (settings.auth_url.empty()) {
        return "No auth_url configured for provider " + label;
    }
    return std::nullopt;
}

TokenExchangeResult GigaChatProvider::exchange_token(const CancellationToken& cancel) const
{
    Credentials credentials;
    {
        std::lock_guard<std::mutex> lock(credentials_mutex_);
        credentials = credentials_;
    }

    HttpRequest request;
    request.url = credentials.auth_url;
    request.body = "scope=" + credentials.scope;
    request.set_header("Content-Type", "application/x-www-form-urlencoded");
    request.set_header("Accept", "application/json");
    request.set_header("Authorization", "Basic " + credentials.key);
    request.set_header("RqUID", kEmptyRequestId);

    TimeoutPolicy timeouts;
    timeouts.connect_timeout = kAuthConnectTimeout;
    timeouts.overall_timeout = kAuthOverallTimeout;

    const RequestOutcome outcome = executor()->execute(request, timeouts, cancel);
    if (outcome.is_success()) {
        return parse_token_response(outcome.body);
    }

    TokenExchangeResult failure;
    if (outcome.kind == OutcomeKind::Cancelled) {
        failure.cancelled = true;
        failure.error_message = "Request cancelled";
        return failure;
    }

    if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
        logger->warn("{}: token exchange failed: {}", id(), to_string(outcome.kind));
    }
    failure.error_message = auth_failure_detail(outcome);
    return failure;
}

std::optional<ProviderResult> GigaChatProvider::authorize(HttpRequest& request,
                                                          const ProviderSettings& settings,
                                                          const CancellationToken& cancel)
{
    Credentials wanted;
    wanted.auth_url = settings.auth_url;
    wanted.key = settings.api_key;
    wanted.scope = kDefaultScope;
    if (const auto* scope = settings.parameter("scope"); scope && scope->isString()) {
        wanted.scope = scope->asString();
    }

    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(credentials_mutex_);
        if (!(credentials_ == wanted)) {
            changed = !credentials_.key.empty();
            credentials_ = wanted;
        }
    }
    if (changed) {
        token_cache_->invalidate();
    }

    const TokenResult token = token_cache_->get_token(cancel);
    if (token.cancelled) {
        return ProviderResult::failure(ErrorKind::Cancelled, "Request cancelled");
    }
    if (!token.success) {
        return ProviderResult::failure(ErrorKind::Connection,
                                       "Error obtaining access token: " + token.error_message);
    }

    request.set_header("Authorization", "Bearer " + token.access_token);
    return std::nullopt;
}

void GigaChatProvider::apply_parameters(Json::Value& body, const ProviderSettings& settings,
                                        bool stream) const
{
    body["stream"] = stream;

    const Json::Value* interval = settings.parameter("update_interval");
    body["update_interval"] = interval ? *interval : Json::Value(kDefaultUpdateInterval);

    if (auto max_tokens = settings.resolved_max_tokens()) {
        body["max_tokens"] = *max_tokens;
    }
    if (auto temperature = settings.resolved_temperature()) {
        body["temperature"] = *temperature;
    }
}

void GigaChatProvider::apply_headers(HttpRequest& request, const ProviderSettings& /*settings*/) const
{
    request.set_header("RqUID", kEmptyRequestId);
}

TimeoutPolicy GigaChatProvider::timeouts_for(const HttpRequest& request,
                                             const ProviderSettings& /*settings*/) const
{
    if (request.body.size() > TimeoutPolicy::kLargePayloadBytes) {
        return TimeoutPolicy::extended();
    }
    TimeoutPolicy timeouts;
    timeouts.connect_timeout = kChatConnectTimeout;
    timeouts.overall_timeout = kChatOverallTimeout;
    return timeouts;
}

void GigaChatProvider::observe_outcome(const RequestOutcome& outcome) const
{
    // A rejected token is dropped so the next query exchanges again
    if (outcome.kind == OutcomeKind::HttpError && outcome.status_code == 401) {
        token_cache_->invalidate();
    }
}
