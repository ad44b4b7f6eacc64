/*
 * OpenRouter chat completions provider
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef OPENROUTER_PROVIDER_HPP
#define OPENROUTER_PROVIDER_HPP

#include "ChatCompletionsProvider.hpp"

/**
 * Provider for OpenRouter
 *
 * Reasoning tokens are excluded from the answer unless the profile's
 * reasoning settings say otherwise.
 */
class OpenRouterProvider : public ChatCompletionsProvider {
public:
    using ChatCompletionsProvider::ChatCompletionsProvider;

    std::string id() const override { return "openrouter"; }
    std::string display_name() const override { return "OpenRouter"; }

protected:
    void apply_parameters(Json::Value& body, const ProviderSettings& settings,
                          bool stream) const override;
    void apply_headers(HttpRequest& request, const ProviderSettings& settings) const override;
};

#endif // OPENROUTER_PROVIDER_HPP
