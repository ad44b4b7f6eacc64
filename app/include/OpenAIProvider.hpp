/*
 * OpenAI provider (Chat Completions and Responses API)
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef OPENAI_PROVIDER_HPP
#define OPENAI_PROVIDER_HPP

#include "ChatCompletionsProvider.hpp"
#include <string>

/**
 * Provider for OpenAI and OpenAI-hosted compatible endpoints
 *
 * The wire format follows the configured URL: endpoints containing
 * "/responses" use the Responses API ({input, instructions}), anything
 * else uses Chat Completions ({messages}).
 *
 * WARNING: This provider sends data to remote servers.
 */
class OpenAIProvider : public ChatCompletionsProvider {
public:
    using ChatCompletionsProvider::ChatCompletionsProvider;

    // IProvider interface
    std::string id() const override { return "openai"; }
    std::string display_name() const override { return "OpenAI"; }
    ProviderCapability capabilities() const override;

    /**
     * True when the URL selects the Responses API
     */
    static bool uses_responses_api(const std::string& url);

protected:
    PreparedRequest build_request(const std::vector<ChatMessage>& messages,
                                  const ProviderSettings& settings) const override;
    std::optional<std::string> extract_text(const Json::Value& root,
                                            const ProviderSettings& settings) const override;
    std::optional<std::string> decode_stream_event(const Json::Value& event) const override;

private:
    PreparedRequest build_responses_request(const std::vector<ChatMessage>& messages,
                                            const ProviderSettings& settings) const;
    static std::optional<std::string> extract_output_text(const Json::Value& root);
};

#endif // OPENAI_PROVIDER_HPP
