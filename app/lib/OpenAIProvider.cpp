/*
 * OpenAI provider implementation
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "OpenAIProvider.hpp"

#include <set>

namespace {

// Chat Completions parameters the Responses API rejects
const std::set<std::string> kDroppedResponsesParameters = {
    "messages", "n", "logprobs", "logit_bias", "presence_penalty", "frequency_penalty"
};

bool non_empty_string(const Json::Value& value)
{
    return value.isString() && !value.asString().empty();
}

} // namespace

ProviderCapability OpenAIProvider::capabilities() const
{
    return ProviderCapability::RemoteInference | ProviderCapability::Streaming |
           ProviderCapability::WebSearch;
}

bool OpenAIProvider::uses_responses_api(const std::string& url)
{
    return url.find("/responses") != std::string::npos;
}

HttpProviderBase::PreparedRequest OpenAIProvider::build_request(
    const std::vector<ChatMessage>& messages,
    const ProviderSettings& settings) const
{
    if (uses_responses_api(settings.base_url)) {
        return build_responses_request(messages, settings);
    }
    return ChatCompletionsProvider::build_request(messages, settings);
}

HttpProviderBase::PreparedRequest OpenAIProvider::build_responses_request(
    const std::vector<ChatMessage>& messages,
    const ProviderSettings& settings) const
{
    const bool stream = streaming_requested(settings);

    Json::Value body(Json::objectValue);
    body["model"] = settings.model;

    Json::Value input(Json::arrayValue);
    for (const auto& message : messages) {
        if (message.role == MessageRole::System) {
            continue;
        }
        Json::Value item(Json::objectValue);
        item["role"] = to_string(message.role);
        item["content"] = message.content;
        input.append(item);
    }
    if (input.empty() && !messages.empty()) {
        body["input"] = messages.back().content;
    } else {
        body["input"] = input;
    }

    if (!messages.empty() && messages.front().role == MessageRole::System) {
        body["instructions"] = messages.front().content;
    }

    const Json::Value& parameters = settings.additional_parameters;
    if (parameters.isObject()) {
        for (const auto& key : parameters.getMemberNames()) {
            if (key == "max_tokens") {
                body["max_output_tokens"] = parameters[key];
            } else if (kDroppedResponsesParameters.count(key) == 0) {
                body[key] = parameters[key];
            }
        }
    }
    if (!body.isMember("max_output_tokens") && settings.max_tokens) {
        body["max_output_tokens"] = *settings.max_tokens;
    }
    if (!body.isMember("temperature") && settings.temperature) {
        body["temperature"] = *settings.temperature;
    }

    if (settings.enable_web_search) {
        if (!body["tools"].isArray()) {
            body["tools"] = Json::Value(Json::arrayValue);
        }
        bool has_web_search = false;
        for (const auto& tool : body["tools"]) {
            if (tool.isObject() && tool["type"].asString() == "web_search") {
                has_web_search = true;
                break;
            }
        }
        if (!has_web_search) {
            Json::Value tool(Json::objectValue);
            tool["type"] = "web_search";
            body["tools"].append(tool);
        }
    }

    if (stream) {
        body["stream"] = true;
    } else {
        body.removeMember("stream");
    }

    PreparedRequest prepared;
    prepared.request = json_request(settings.base_url, body, stream);
    prepared.stream = stream;
    if (prepared.request.body.size() > TimeoutPolicy::kLargePayloadBytes) {
        prepared.timeouts = TimeoutPolicy::extended();
    } else if (settings.enable_web_search) {
        prepared.timeouts = TimeoutPolicy::with_tools();
    } else {
        prepared.timeouts = TimeoutPolicy::standard();
    }
    return prepared;
}

std::optional<std::string> OpenAIProvider::extract_output_text(const Json::Value& root)
{
    if (non_empty_string(root["output_text"])) {
        return root["output_text"].asString();
    }

    const Json::Value& output = root["output"];
    if (!output.isArray()) {
        return std::nullopt;
    }
    for (const auto& item : output) {
        if (!item.isObject()) {
            continue;
        }
        if (non_empty_string(item["text"])) {
            return item["text"].asString();
        }
        const Json::Value& content = item["content"];
        if (!content.isArray()) {
            continue;
        }
        for (const auto& part : content) {
            if (part.isObject() && non_empty_string(part["text"])) {
                return part["text"].asString();
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> OpenAIProvider::extract_text(const Json::Value& root,
                                                        const ProviderSettings& settings) const
{
    if (!root.isObject()) {
        return std::nullopt;
    }
    if (uses_responses_api(settings.base_url)) {
        return extract_output_text(root);
    }
    return ChatCompletionsProvider::extract_text(root, settings);
}

std::optional<std::string> OpenAIProvider::decode_stream_event(const Json::Value& event) const
{
    // Responses API: {"type":"response.output_text.delta","delta":"..."}
    if (event.isObject() && event["type"].asString() == "response.output_text.delta") {
        if (event["delta"].isString()) {
            return event["delta"].asString();
        }
        return std::nullopt;
    }
    return ChatCompletionsProvider::decode_stream_event(event);
}
