/*
 * Groq provider implementation
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "GroqProvider.hpp"

Json::Value GroqProvider::build_messages(const std::vector<ChatMessage>& messages) const
{
    Json::Value wire(Json::arrayValue);
    for (const auto& message : messages) {
        Json::Value entry = message.to_json();
        if (!message.reasoning.isNull()) {
            entry["reasoning"] = message.reasoning;
        }
        wire.append(entry);
    }
    return wire;
}

void GroqProvider::apply_parameters(Json::Value& body, const ProviderSettings& settings,
                                    bool stream) const
{
    copy_parameters(body, settings, {"temperature", "top_p", "max_completion_tokens", "max_tokens",
                                     "reasoning_effort", "reasoning_format", "search_settings"});
    if (!body.isMember("max_tokens") && settings.max_tokens) {
        body["max_tokens"] = *settings.max_tokens;
    }
    if (!body.isMember("temperature") && settings.temperature) {
        body["temperature"] = *settings.temperature;
    }
    if (stream) {
        body["stream"] = true;
    }
}
