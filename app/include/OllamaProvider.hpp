/*
 * Ollama chat provider
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef OLLAMA_PROVIDER_HPP
#define OLLAMA_PROVIDER_HPP

#include "HttpProviderBase.hpp"
#include <string>

/**
 * Provider for Ollama servers (local or hosted)
 *
 * base_url is the server root (e.g. "http://localhost:11434"); the chat
 * endpoint is appended unless the URL already names an /api/ path.
 * An API key is optional and sent as a bearer token when present.
 */
class OllamaProvider : public HttpProviderBase {
public:
    using HttpProviderBase::HttpProviderBase;

    // IProvider interface
    std::string id() const override { return "ollama"; }
    std::string display_name() const override { return "Ollama"; }
    std::optional<std::string> validate_settings(const ProviderSettings& settings) const override;

    static std::string endpoint_for(const std::string& base_url);

protected:
    PreparedRequest build_request(const std::vector<ChatMessage>& messages,
                                  const ProviderSettings& settings) const override;
    std::optional<ProviderResult> authorize(HttpRequest& request,
                                            const ProviderSettings& settings,
                                            const CancellationToken& cancel) override;
    std::optional<std::string> extract_text(const Json::Value& root,
                                            const ProviderSettings& settings) const override;

private:
    static constexpr const char* kChatEndpoint = "/api/chat";
};

#endif // OLLAMA_PROVIDER_HPP
