/*
 * Anthropic Messages API provider implementation
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "AnthropicProvider.hpp"

ProviderCapability AnthropicProvider::capabilities() const
{
    return ProviderCapability::RemoteInference | ProviderCapability::Streaming;
}

HttpProviderBase::PreparedRequest AnthropicProvider::build_request(
    const std::vector<ChatMessage>& messages,
    const ProviderSettings& settings) const
{
    const bool stream = streaming_requested(settings);

    std::string system;
    Json::Value turns(Json::arrayValue);
    for (const auto& message : messages) {
        if (message.role == MessageRole::System) {
            if (!system.empty()) {
                system += "\n\n";
            }
            system += message.content;
            continue;
        }
        Json::Value turn(Json::objectValue);
        turn["role"] = message.role == MessageRole::Assistant ? "assistant" : "user";
        turn["content"] = message.content;
        turns.append(turn);
    }

    Json::Value body(Json::objectValue);
    body["model"] = settings.model;
    body["messages"] = turns;
    if (!system.empty()) {
        body["system"] = system;
    }
    body["max_tokens"] = settings.resolved_max_tokens().value_or(kDefaultMaxTokens);
    if (auto temperature = settings.resolved_temperature()) {
        body["temperature"] = *temperature;
    }
    for (const char* key : {"tools", "tool_choice", "top_p", "top_k", "stop_sequences", "thinking"}) {
        if (const auto* value = settings.parameter(key)) {
            body[key] = *value;
        }
    }
    if (stream) {
        body["stream"] = true;
    }

    PreparedRequest prepared;
    prepared.request = json_request(settings.base_url, body, stream);

    std::string version = kDefaultVersion;
    if (const auto* configured = settings.parameter("anthropic_version"); configured && configured->isString()) {
        version = configured->asString();
    }
    prepared.request.set_header("anthropic-version", version);
    prepared.timeouts = TimeoutPolicy::for_payload(prepared.request.body.size());
    prepared.stream = stream;
    return prepared;
}

std::optional<ProviderResult> AnthropicProvider::authorize(HttpRequest& request,
                                                           const ProviderSettings& settings,
                                                           const CancellationToken& /*cancel*/)
{
    request.set_header("x-api-key", settings.api_key);
    return std::nullopt;
}

std::string AnthropicProvider::decode_error(const Json::Value& root) const
{
    std::string decoded = HttpProviderBase::decode_error(root);
    if (!decoded.empty() || !root.isObject()) {
        return decoded;
    }

    // Validation failures: {"type": "...", "detail": ...}
    if (root.isMember("detail") && root["type"].isString()) {
        const Json::Value& detail = root["detail"];
        const std::string text = detail.isString() ? detail.asString()
                                                   : JsonSupport::to_compact_string(detail);
        return "(" + root["type"].asString() + ") - " + text;
    }
    return {};
}

std::optional<std::string> AnthropicProvider::extract_text(const Json::Value& root,
                                                           const ProviderSettings& /*settings*/) const
{
    if (!root.isObject()) {
        return std::nullopt;
    }

    const Json::Value& content = root["content"];
    if (content.isArray() && !content.empty()) {
        if (content[0u].isObject() && content[0u]["text"].isString()) {
            return content[0u]["text"].asString();
        }
        for (const auto& block : content) {
            if (block.isObject() && block["type"].asString() == "text" && block["text"].isString()) {
                return block["text"].asString();
            }
        }
    }

    if (root["completion"].isString()) {
        return root["completion"].asString();
    }
    return std::nullopt;
}

std::optional<std::string> AnthropicProvider::decode_stream_event(const Json::Value& event) const
{
    if (!event.isObject() || event["type"].asString() != "content_block_delta") {
        return std::nullopt;
    }
    const Json::Value& delta = event["delta"];
    if (delta.isObject() && delta["text"].isString()) {
        return delta["text"].asString();
    }
    return std::nullopt;
}
