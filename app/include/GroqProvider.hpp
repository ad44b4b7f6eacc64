/*
 * Groq chat completions provider
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef GROQ_PROVIDER_HPP
#define GROQ_PROVIDER_HPP

#include "ChatCompletionsProvider.hpp"

/**
 * Provider for Groq's OpenAI-compatible endpoint
 *
 * Only parameters Groq accepts are passed through; messages keep their
 * reasoning annotations.
 */
class GroqProvider : public ChatCompletionsProvider {
public:
    using ChatCompletionsProvider::ChatCompletionsProvider;

    std::string id() const override { return "groq"; }
    std::string display_name() const override { return "Groq"; }

protected:
    Json::Value build_messages(const std::vector<ChatMessage>& messages) const override;
    void apply_parameters(Json::Value& body, const ProviderSettings& settings,
                          bool stream) const override;
};

#endif // GROQ_PROVIDER_HPP
