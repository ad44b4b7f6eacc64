/*
 * Anthropic Messages API provider
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef ANTHROPIC_PROVIDER_HPP
#define ANTHROPIC_PROVIDER_HPP

#include "HttpProviderBase.hpp"

/**
 * Provider for the Anthropic Messages API
 *
 * All system messages are joined into the top-level "system" field; the
 * remaining messages are sent as user/assistant turns.
 */
class AnthropicProvider : public HttpProviderBase {
public:
    using HttpProviderBase::HttpProviderBase;

    static constexpr const char* kDefaultVersion = "2023-06-01";
    static constexpr int kDefaultMaxTokens = 4096;

    std::string id() const override { return "anthropic"; }
    std::string display_name() const override { return "Anthropic"; }
    ProviderCapability capabilities() const override;

protected:
    PreparedRequest build_request(const std::vector<ChatMessage>& messages,
                                  const ProviderSettings& settings) const override;
    std::optional<ProviderResult> authorize(HttpRequest& request,
                                            const ProviderSettings& settings,
                                            const CancellationToken& cancel) override;
    std::string decode_error(const Json::Value& root) const override;
    std::optional<std::string> extract_text(const Json::Value& root,
                                            const ProviderSettings& settings) const override;
    std::optional<std::string> decode_stream_event(const Json::Value& event) const override;
};

#endif // ANTHROPIC_PROVIDER_HPP
