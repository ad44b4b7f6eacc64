/*
 * Google Gemini generateContent provider
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef GEMINI_PROVIDER_HPP
#define GEMINI_PROVIDER_HPP

#include "HttpProviderBase.hpp"

/**
 * Provider for Gemini's generateContent endpoint
 *
 * The API key travels in the URL query (?key=...), so every log line
 * about these requests relies on URL redaction.
 */
class GeminiProvider : public HttpProviderBase {
public:
    using HttpProviderBase::HttpProviderBase;

    std::string id() const override { return "gemini"; }
    std::string display_name() const override { return "Gemini"; }

    /**
     * <base_url><model>:generateContent (no key)
     */
    static std::string endpoint_for(const ProviderSettings& settings);

protected:
    PreparedRequest build_request(const std::vector<ChatMessage>& messages,
                                  const ProviderSettings& settings) const override;
    std::optional<ProviderResult> authorize(HttpRequest& request,
                                            const ProviderSettings& settings,
                                            const CancellationToken& cancel) override;
    std::string decode_error(const Json::Value& root) const override;
    std::optional<std::string> extract_text(const Json::Value& root,
                                            const ProviderSettings& settings) const override;
};

#endif // GEMINI_PROVIDER_HPP
