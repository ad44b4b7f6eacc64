/*
 * OpenAI-compatible chat completions adapter base
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef CHAT_COMPLETIONS_PROVIDER_HPP
#define CHAT_COMPLETIONS_PROVIDER_HPP

#include "HttpProviderBase.hpp"

#include <initializer_list>

/**
 * Adapter for endpoints that accept {model, messages, ...} and answer with
 * {"choices":[{"message":{"content":...}}]}
 *
 * Subclasses narrow the parameter pass-through and add headers.
 */
class ChatCompletionsProvider : public HttpProviderBase {
public:
    using HttpProviderBase::HttpProviderBase;

    ProviderCapability capabilities() const override;

protected:
    PreparedRequest build_request(const std::vector<ChatMessage>& messages,
                                  const ProviderSettings& settings) const override;

    /**
     * Bearer <api_key>
     */
    std::optional<ProviderResult> authorize(HttpRequest& request,
                                            const ProviderSettings& settings,
                                            const CancellationToken& cancel) override;

    /**
     * choices[0].message.content, then choices[0].text
     */
    std::optional<std::string> extract_text(const Json::Value& root,
                                            const ProviderSettings& settings) const override;

    /**
     * Wire messages; internal-only fields are never copied
     */
    virtual Json::Value build_messages(const std::vector<ChatMessage>& messages) const;

    /**
     * Body fields besides model and messages
     *
     * Default: top-level max_tokens/temperature, then every additional
     * parameter verbatim.
     */
    virtual void apply_parameters(Json::Value& body, const ProviderSettings& settings,
                                  bool stream) const;

    /**
     * Extra request headers
     */
    virtual void apply_headers(HttpRequest& request, const ProviderSettings& settings) const;

    virtual TimeoutPolicy timeouts_for(const HttpRequest& request,
                                       const ProviderSettings& settings) const;

    /**
     * Copy only the listed additional parameters
     */
    static void copy_parameters(Json::Value& body, const ProviderSettings& settings,
                                std::initializer_list<const char*> allowed);
};

#endif // CHAT_COMPLETIONS_PROVIDER_HPP
