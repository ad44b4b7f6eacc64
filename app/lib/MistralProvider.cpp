/*
 * Mistral provider implementation
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "MistralProvider.hpp"

ProviderCapability MistralProvider::capabilities() const
{
    return ProviderCapability::RemoteInference;
}

void MistralProvider::apply_parameters(Json::Value& body, const ProviderSettings& settings,
                                       bool /*stream*/) const
{
    if (auto max_tokens = settings.resolved_max_tokens()) {
        body["max_tokens"] = *max_tokens;
    }
    if (auto temperature = settings.resolved_temperature()) {
        body["temperature"] = *temperature;
    }
}

std::string MistralProvider::decode_error(const Json::Value& root) const
{
    std::string decoded = ChatCompletionsProvider::decode_error(root);
    if (!decoded.empty() || !root.isObject()) {
        return decoded;
    }

    // {"object":"error","message":"...","type":"...","code":...}
    if (root["message"].isString() && !root.isMember("choices")) {
        return format_error_parts(JsonSupport::scalar_to_string(root["code"]),
                                  root["message"].asString(),
                                  JsonSupport::string_member(root, "type"));
    }
    return {};
}
