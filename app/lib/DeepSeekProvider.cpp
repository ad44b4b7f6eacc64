#include "DeepSeekProvider.hpp"

ProviderCapability DeepSeekProvider::capabilities() const
{
    return ProviderCapability::RemoteInference;
}

void DeepSeekProvider::apply_parameters(Json::Value& body, const ProviderSettings& settings,
                                        bool /*stream*/) const
{
    if (auto max_tokens = settings.resolved_max_tokens()) {
        body["max_tokens"] = *max_tokens;
    }
    if (auto temperature = settings.resolved_temperature()) {
        body["temperature"] = *temperature;
    }
}
