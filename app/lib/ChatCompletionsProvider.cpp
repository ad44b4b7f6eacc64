/*
 * OpenAI-compatible chat completions adapter base
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "ChatCompletionsProvider.hpp"

ProviderCapability ChatCompletionsProvider::capabilities() const
{
    return ProviderCapability::RemoteInference | ProviderCapability::Streaming;
}

Json::Value ChatCompletionsProvider::build_messages(const std::vector<ChatMessage>& messages) const
{
    Json::Value wire(Json::arrayValue);
    for (const auto& message : messages) {
        wire.append(message.to_json());
    }
    return wire;
}

void ChatCompletionsProvider::apply_parameters(Json::Value& body, const ProviderSettings& settings,
                                               bool stream) const
{
    if (settings.max_tokens) {
        body["max_tokens"] = *settings.max_tokens;
    }
    if (settings.temperature) {
        body["temperature"] = *settings.temperature;
    }
    if (settings.additional_parameters.isObject()) {
        for (const auto& key : settings.additional_parameters.getMemberNames()) {
            body[key] = settings.additional_parameters[key];
        }
    }
    if (!stream && body.isMember("stream")) {
        body.removeMember("stream");
    }
}

void ChatCompletionsProvider::copy_parameters(Json::Value& body, const ProviderSettings& settings,
                                              std::initializer_list<const char*> allowed)
{
    for (const char* key : allowed) {
        if (const auto* value = settings.parameter(key)) {
            body[key] = *value;
        }
    }
}

void ChatCompletionsProvider::apply_headers(HttpRequest& /*request*/,
                                            const ProviderSettings& /*settings*/) const
{}

TimeoutPolicy ChatCompletionsProvider::timeouts_for(const HttpRequest& request,
                                                    const ProviderSettings& /*settings*/) const
{
    return TimeoutPolicy::for_payload(request.body.size());
}

HttpProviderBase::PreparedRequest ChatCompletionsProvider::build_request(
    const std::vector<ChatMessage>& messages,
    const ProviderSettings& settings) const
{
    const bool stream = streaming_requested(settings);

    Json::Value body(Json::objectValue);
    body["model"] = settings.model;
    body["messages"] = build_messages(messages);
    apply_parameters(body, settings, stream);
    if (stream) {
        body["stream"] = true;
    }

    PreparedRequest prepared;
    prepared.request = json_request(settings.base_url, body, stream);
    apply_headers(prepared.request, settings);
    prepared.timeouts = timeouts_for(prepared.request, settings);
    prepared.stream = stream;
    return prepared;
}

std::optional<ProviderResult> ChatCompletionsProvider::authorize(HttpRequest& request,
                                                                 const ProviderSettings& settings,
                                                                 const CancellationToken& /*cancel*/)
{
    request.set_header("Authorization", "Bearer " + settings.api_key);
    return std::nullopt;
}

std::optional<std::string> ChatCompletionsProvider::extract_text(const Json::Value& root,
                                                                 const ProviderSettings& /*settings*/) const
{
    if (!root.isObject()) {
        return std::nullopt;
    }
    const Json::Value& choices = root["choices"];
    if (!choices.isArray() || choices.empty() || !choices[0u].isObject()) {
        return std::nullopt;
    }

    const Json::Value& first = choices[0u];
    const Json::Value& message = first["message"];
    if (message.isObject() && message["content"].isString()) {
        return message["content"].asString();
    }
    if (first["text"].isString()) {
        return first["text"].asString();
    }
    return std::nullopt;
}
