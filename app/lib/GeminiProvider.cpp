/*
 * Google Gemini provider implementation
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "GeminiProvider.hpp"

#include <curl/curl.h>
#include <memory>

namespace {

const char* const kHarmCategories[] = {
    "HARM_CATEGORY_SEXUALLY_EXPLICIT",
    "HARM_CATEGORY_HATE_SPEECH",
    "HARM_CATEGORY_HARASSMENT",
    "HARM_CATEGORY_DANGEROUS_CONTENT",
};

Json::Value text_parts(const std::string& text)
{
    Json::Value part(Json::objectValue);
    part["text"] = text;
    Json::Value parts(Json::arrayValue);
    parts.append(part);
    return parts;
}

std::string escape_query_value(const std::string& value)
{
    std::unique_ptr<char, decltype(&curl_free)> escaped(
        curl_easy_escape(nullptr, value.c_str(), static_cast<int>(value.size())), &curl_free);
    return escaped ? std::string(escaped.get()) : value;
}

} // namespace

std::string GeminiProvider::endpoint_for(const ProviderSettings& settings)
{
    std::string url = settings.base_url;
    if (!url.empty() && url.back() != '/') {
        url += '/';
    }
    return url + settings.model + ":generateContent";
}

HttpProviderBase::PreparedRequest GeminiProvider::build_request(
    const std::vector<ChatMessage>& messages,
    const ProviderSettings& settings) const
{
    Json::Value body(Json::objectValue);
    Json::Value contents(Json::arrayValue);
    bool instruction_taken = false;

    for (const auto& message : messages) {
        if (message.role == MessageRole::System && !instruction_taken) {
            Json::Value instruction(Json::objectValue);
            instruction["parts"] = text_parts(message.content);
            body["systemInstruction"] = instruction;
            instruction_taken = true;
            continue;
        }
        Json::Value entry(Json::objectValue);
        entry["role"] = message.role == MessageRole::Assistant ? "model" : "user";
        entry["parts"] = text_parts(message.content);
        contents.append(entry);
    }
    body["contents"] = contents;

    Json::Value generation(Json::objectValue);
    if (auto temperature = settings.resolved_temperature()) {
        generation["temperature"] = *temperature;
    }
    if (auto max_tokens = settings.resolved_max_tokens()) {
        generation["maxOutputTokens"] = *max_tokens;
    }
    if (const auto* budget = settings.parameter("thinking_budget"); budget && budget->isNumeric()) {
        generation["thinkingConfig"]["thinkingBudget"] = budget->asInt();
    }
    if (!generation.empty()) {
        body["generationConfig"] = generation;
    }

    Json::Value safety(Json::arrayValue);
    for (const char* category : kHarmCategories) {
        Json::Value rule(Json::objectValue);
        rule["category"] = category;
        rule["threshold"] = "BLOCK_NONE";
        safety.append(rule);
    }
    body["safety_settings"] = safety;

    PreparedRequest prepared;
    prepared.request = json_request(endpoint_for(settings), body, false);
    prepared.timeouts = TimeoutPolicy::for_payload(prepared.request.body.size());
    return prepared;
}

std::optional<ProviderResult> GeminiProvider::authorize(HttpRequest& request,
                                                        const ProviderSettings& settings,
                                                        const CancellationToken& /*cancel*/)
{
    request.url += (request.url.find('?') == std::string::npos ? "?key=" : "&key=");
    request.url += escape_query_value(settings.api_key);
    return std::nullopt;
}

std::string GeminiProvider::decode_error(const Json::Value& root) const
{
    if (!root.isObject()) {
        return {};
    }

    const Json::Value& error = root["error"];
    if (error.isObject()) {
        std::string text = format_error_parts(JsonSupport::scalar_to_string(error["code"]),
                                              JsonSupport::string_member(error, "message"),
                                              JsonSupport::string_member(error, "status"));
        return text.empty() ? JsonSupport::to_compact_string(error) : text;
    }
    if (!error.isNull()) {
        return HttpProviderBase::decode_error(root);
    }

    // A blocked prompt answers 200 with feedback and no candidates
    const Json::Value& candidates = root["candidates"];
    const Json::Value& feedback = root["promptFeedback"];
    if ((!candidates.isArray() || candidates.empty()) && feedback.isObject() &&
        feedback["blockReason"].isString()) {
        return "prompt blocked (" + feedback["blockReason"].asString() + ")";
    }
    return {};
}

std::optional<std::string> GeminiProvider::extract_text(const Json::Value& root,
                                                        const ProviderSettings& /*settings*/) const
{
    if (!root.isObject()) {
        return std::nullopt;
    }

    const Json::Value& candidates = root["candidates"];
    if (candidates.isArray() && !candidates.empty() && candidates[0u].isObject()) {
        const Json::Value& content = candidates[0u]["content"];
        if (content.isObject() && content["parts"].isArray()) {
            for (const auto& part : content["parts"]) {
                if (part.isObject() && part["text"].isString()) {
                    return part["text"].asString();
                }
            }
        }
    }

    if (root["output"].isString()) {
        return root["output"].asString();
    }

    const Json::Value& answers = root["answers"];
    if (answers.isArray() && !answers.empty() && answers[0u].isObject() &&
        answers[0u]["content"].isString()) {
        return answers[0u]["content"].asString();
    }
    return std::nullopt;
}
