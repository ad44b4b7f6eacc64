/*
 * GigaChat provider with OAuth client-credentials tokens
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef GIGACHAT_PROVIDER_HPP
#define GIGACHAT_PROVIDER_HPP

#include "ChatCompletionsProvider.hpp"
#include "TokenCache.hpp"

#include <memory>
#include <mutex>

/**
 * Provider for the GigaChat chat completions API
 *
 * The configured api_key is the Basic authorization key of the
 * client-credentials exchange at auth_url. The resulting bearer token is
 * cached per adapter instance and refreshed on expiry.
 */
class GigaChatProvider : public ChatCompletionsProvider {
public:
    explicit GigaChatProvider(TransportPtr transport, RetryPolicy retry_policy = {},
                              TokenCache::Clock clock = nullptr);

    static constexpr const char* kEmptyRequestId = "00000000-0000-0000-0000-000000000000";
    static constexpr const char* kDefaultScope = "GIGACHAT_API_PERS";
    static constexpr int kDefaultUpdateInterval = 3;

    std::string id() const override { return "gigachat"; }
    std::string display_name() const override { return "GigaChat"; }
    ProviderCapability capabilities() const override;
    std::optional<std::string> validate_settings(const ProviderSettings& settings) const override;

    /**
     * Cache diagnostics
     */
    const TokenCache& token_cache() const { return *token_cache_; }

protected:
    std::optional<ProviderResult> authorize(HttpRequest& request,
                                            const ProviderSettings& settings,
                                            const CancellationToken& cancel) override;
    void apply_parameters(Json::Value& body, const ProviderSettings& settings,
                          bool stream) const override;
    void apply_headers(HttpRequest& request, const ProviderSettings& settings) const override;
    TimeoutPolicy timeouts_for(const HttpRequest& request,
                               const ProviderSettings& settings) const override;
    void observe_outcome(const RequestOutcome& outcome) const override;

private:
    struct Credentials {
        std::string auth_url;
        std::string key;
        std::string scope;

        bool operator==(const Credentials& other) const {
            return auth_url == other.auth_url && key == other.key && scope == other.scope;
        }
    };

    TokenExchangeResult exchange_token(const CancellationToken& cancel) const;

    mutable std::mutex credentials_mutex_;
    Credentials credentials_;
    std::unique_ptr<TokenCache> token_cache_;
};

#endif // GIGACHAT_PROVIDER_HPP
