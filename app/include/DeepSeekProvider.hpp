/*
 * DeepSeek chat completions provider
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef DEEPSEEK_PROVIDER_HPP
#define DEEPSEEK_PROVIDER_HPP

#include "ChatCompletionsProvider.hpp"

class DeepSeekProvider : public ChatCompletionsProvider {
public:
    using ChatCompletionsProvider::ChatCompletionsProvider;

    std::string id() const override { return "deepseek"; }
    std::string display_name() const override { return "DeepSeek"; }
    ProviderCapability capabilities() const override;

protected:
    void apply_parameters(Json::Value& body, const ProviderSettings& settings,
                          bool stream) const override;
};

#endif // DEEPSEEK_PROVIDER_HPP
