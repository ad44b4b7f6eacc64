#include "ProviderSettings.hpp"

const Json::Value* ProviderSettings::parameter(const std::string& key) const
{
    if (!additional_parameters.isObject() || !additional_parameters.isMember(key)) {
        return nullptr;
    }
    const Json::Value& value = additional_parameters[key];
    return value.isNull() ? nullptr : &value;
}

std::optional<int> ProviderSettings::resolved_max_tokens() const
{
    if (const auto* value = parameter("max_tokens"); value && value->isNumeric()) {
        return value->asInt();
    }
    return max_tokens;
}

std::optional<double> ProviderSettings::resolved_temperature() const
{
    if (const auto* value = parameter("temperature"); value && value->isNumeric()) {
        return value->asDouble();
    }
    return temperature;
}

bool ProviderSettings::stream_requested() const
{
    const auto* value = parameter("stream");
    return value && value->isBool() && value->asBool();
}
