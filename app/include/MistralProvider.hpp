/*
 * Mistral chat completions provider
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef MISTRAL_PROVIDER_HPP
#define MISTRAL_PROVIDER_HPP

#include "ChatCompletionsProvider.hpp"

/**
 * Provider for the Mistral chat completions API
 */
class MistralProvider : public ChatCompletionsProvider {
public:
    using ChatCompletionsProvider::ChatCompletionsProvider;

    std::string id() const override { return "mistral"; }
    std::string display_name() const override { return "Mistral"; }
    ProviderCapability capabilities() const override;

protected:
    void apply_parameters(Json::Value& body, const ProviderSettings& settings,
                          bool stream) const override;
    std::string decode_error(const Json::Value& root) const override;
};

#endif // MISTRAL_PROVIDER_HPP
