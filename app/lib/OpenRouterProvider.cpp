/*
 * OpenRouter provider implementation
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "OpenRouterProvider.hpp"

namespace {

constexpr const char* kDefaultTitle = "Parley";

} // namespace

void OpenRouterProvider::apply_parameters(Json::Value& body, const ProviderSettings& settings,
                                          bool stream) const
{
    if (auto max_tokens = settings.resolved_max_tokens()) {
        body["max_tokens"] = *max_tokens;
    }
    if (auto temperature = settings.resolved_temperature()) {
        body["temperature"] = *temperature;
    }
    body["stream"] = stream;

    if (const auto* reasoning = settings.parameter("reasoning"); reasoning && reasoning->isObject()) {
        Json::Value copy = *reasoning;
        if (!copy.isMember("exclude")) {
            copy["exclude"] = true;
        }
        body["reasoning"] = copy;
    }
}

void OpenRouterProvider::apply_headers(HttpRequest& request, const ProviderSettings& settings) const
{
    if (const auto* referer = settings.parameter("http_referer"); referer && referer->isString()) {
        request.set_header("HTTP-Referer", referer->asString());
    }
    std::string title = kDefaultTitle;
    if (const auto* configured = settings.parameter("app_title"); configured && configured->isString()) {
        title = configured->asString();
    }
    request.set_header("X-Title", title);
}
