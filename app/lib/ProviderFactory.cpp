#include "ProviderFactory.hpp"
#include "AnthropicProvider.hpp"
#include "DeepSeekProvider.hpp"
#include "GeminiProvider.hpp"
#include "GigaChatProvider.hpp"
#include "GroqProvider.hpp"
#include "MistralProvider.hpp"
#include "OllamaProvider.hpp"
#include "OpenAIProvider.hpp"
#include "OpenRouterProvider.hpp"

#include <algorithm>

const std::vector<std::string>& ProviderFactory::known_handlers()
{
    static const std::vector<std::string> handlers = {
        "anthropic", "deepseek", "gemini", "gigachat", "groq",
        "mistral", "ollama", "openai", "openrouter"
    };
    return handlers;
}

bool ProviderFactory::is_known_handler(const std::string& handler)
{
    const auto& handlers = known_handlers();
    return std::find(handlers.begin(), handlers.end(), handler) != handlers.end();
}

ProviderPtr ProviderFactory::create(const std::string& handler,
                                    TransportPtr transport,
                                    RetryPolicy retry_policy)
{
    if (!transport) {
        return nullptr;
    }

    if (handler == "openai") {
        return std::make_shared<OpenAIProvider>(std::move(transport), retry_policy);
    }
    if (handler == "anthropic") {
        return std::make_shared<AnthropicProvider>(std::move(transport), retry_policy);
    }
    if (handler == "gemini") {
        return std::make_shared<GeminiProvider>(std::move(transport), retry_policy);
    }
    if (handler == "gigachat") {
        return std::make_shared<GigaChatProvider>(std::move(transport), retry_policy);
    }
    if (handler == "groq") {
        return std::make_shared<GroqProvider>(std::move(transport), retry_policy);
    }
    if (handler == "mistral") {
        return std::make_shared<MistralProvider>(std::move(transport), retry_policy);
    }
    if (handler == "openrouter") {
        return std::make_shared<OpenRouterProvider>(std::move(transport), retry_policy);
    }
    if (handler == "deepseek") {
        return std::make_shared<DeepSeekProvider>(std::move(transport), retry_policy);
    }
    if (handler == "ollama") {
        return std::make_shared<OllamaProvider>(std::move(transport), retry_policy);
    }
    return nullptr;
}
