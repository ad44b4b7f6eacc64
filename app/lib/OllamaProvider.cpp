/*
 * Ollama provider implementation
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "OllamaProvider.hpp"

std::optional<std::string> OllamaProvider::validate_settings(const ProviderSettings& settings) const
{
    const std::string label = settings.name.empty() ? id() : settings.name;
    if (settings.base_url.empty()) {
        return "No base_url configured for provider " + label;
    }
    if (settings.model.empty()) {
        return "No model configured for provider " + label;
    }
    return std::nullopt;
}

std::string OllamaProvider::endpoint_for(const std::string& base_url)
{
    if (base_url.find("/api/") != std::string::npos) {
        return base_url;
    }
    std::string url = base_url;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url + kChatEndpoint;
}

HttpProviderBase::PreparedRequest OllamaProvider::build_request(
    const std::vector<ChatMessage>& messages,
    const ProviderSettings& settings) const
{
    Json::Value body(Json::objectValue);
    body["model"] = settings.model;
    body["stream"] = false;

    Json::Value wire(Json::arrayValue);
    for (const auto& message : messages) {
        wire.append(message.to_json());
    }
    body["messages"] = wire;

    Json::Value options(Json::objectValue);
    if (auto temperature = settings.resolved_temperature()) {
        options["temperature"] = *temperature;
    }
    if (auto max_tokens = settings.resolved_max_tokens()) {
        options["num_predict"] = *max_tokens;
    }
    if (!options.empty()) {
        body["options"] = options;
    }

    PreparedRequest prepared;
    prepared.request = json_request(endpoint_for(settings.base_url), body, false);
    prepared.timeouts = TimeoutPolicy::for_payload(prepared.request.body.size());
    return prepared;
}

std::optional<ProviderResult> OllamaProvider::authorize(HttpRequest& request,
                                                        const ProviderSettings& settings,
                                                        const CancellationToken& /*cancel*/)
{
    if (!settings.api_key.empty()) {
        request.set_header("Authorization", "Bearer " + settings.api_key);
    }
    return std::nullopt;
}

std::optional<std::string> OllamaProvider::extract_text(const Json::Value& root,
                                                        const ProviderSettings& /*settings*/) const
{
    if (!root.isObject()) {
        return std::nullopt;
    }
    const Json::Value& message = root["message"];
    if (message.isObject() && message["content"].isString()) {
        return message["content"].asString();
    }
    if (root["response"].isString()) {
        return root["response"].asString();
    }
    const Json::Value& choices = root["choices"];
    if (choices.isArray() && !choices.empty() && choices[0u].isObject()) {
        const Json::Value& choice_message = choices[0u]["message"];
        if (choice_message.isObject() && choice_message["content"].isString()) {
            return choice_message["content"].asString();
        }
    }
    return std::nullopt;
}
