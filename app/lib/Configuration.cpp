/*
 * Configuration loader implementation
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "Configuration.hpp"
#include "Logger.hpp"
#include "ProviderFactory.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {

std::string read_string(const Json::Value& object, const char* key, const std::string& context)
{
    const Json::Value& value = object[key];
    if (value.isNull()) {
        return {};
    }
    if (!value.isString()) {
        throw std::runtime_error(context + "." + key + " must be a string");
    }
    return value.asString();
}

std::optional<bool> read_bool(const Json::Value& object, const char* key, const std::string& context)
{
    const Json::Value& value = object[key];
    if (value.isNull()) {
        return std::nullopt;
    }
    if (!value.isBool()) {
        throw std::runtime_error(context + "." + key + " must be true or false");
    }
    return value.asBool();
}

std::optional<double> read_number(const Json::Value& object, const char* key, const std::string& context)
{
    const Json::Value& value = object[key];
    if (value.isNull()) {
        return std::nullopt;
    }
    if (!value.isNumeric()) {
        throw std::runtime_error(context + "." + key + " must be a number");
    }
    return value.asDouble();
}

TransportSettings parse_transport(const Json::Value& section)
{
    TransportSettings transport;
    if (section.isNull()) {
        return transport;
    }
    if (!section.isObject()) {
        throw std::runtime_error("transport must be an object");
    }

    const std::string mode = read_string(section, "mode", "transport");
    if (!mode.empty() && mode != "auto" && mode != "native" && mode != "process") {
        throw std::runtime_error("transport.mode must be one of auto, native, process");
    }
    transport.mode = parse_transport_mode(mode);

    const std::string curl_path = read_string(section, "curl_path", "transport");
    if (!curl_path.empty()) {
        transport.curl_path = curl_path;
    }
    transport.temp_dir = read_string(section, "temp_dir", "transport");
    transport.verify_tls = read_bool(section, "verify_tls", "transport");
    return transport;
}

ProviderSettings parse_profile(const std::string& name, const Json::Value& object)
{
    const std::string context = "provider_settings." + name;
    if (!object.isObject()) {
        throw std::runtime_error(context + " must be an object");
    }

    ProviderSettings settings;
    settings.name = name;
    settings.handler = resolve_handler(name, read_string(object, "handler", context));
    settings.base_url = read_string(object, "base_url", context);
    settings.auth_url = read_string(object, "auth_url", context);
    settings.api_key = read_string(object, "api_key", context);
    settings.model = read_string(object, "model", context);

    if (auto max_tokens = read_number(object, "max_tokens", context)) {
        settings.max_tokens = static_cast<int>(*max_tokens);
    }
    settings.temperature = read_number(object, "temperature", context);
    settings.enable_web_search = read_bool(object, "enable_web_search", context).value_or(false);
    settings.is_default = read_bool(object, "default", context).value_or(false);
    settings.visible = read_bool(object, "visible", context).value_or(true);

    const Json::Value& parameters = object["additional_parameters"];
    if (!parameters.isNull()) {
        if (!parameters.isObject()) {
            throw std::runtime_error(context + ".additional_parameters must be an object");
        }
        settings.additional_parameters = parameters;
    }
    return settings;
}

} // namespace

std::string resolve_handler(const std::string& profile_name, const std::string& explicit_handler)
{
    if (!explicit_handler.empty()) {
        return explicit_handler;
    }
    if (ProviderFactory::is_known_handler(profile_name)) {
        return profile_name;
    }
    const auto underscore = profile_name.find('_');
    if (underscore != std::string::npos && underscore > 0) {
        return profile_name.substr(0, underscore);
    }
    return profile_name;
}

const ProviderSettings* AssistantConfiguration::find_profile(const std::string& name) const
{
    for (const auto& profile : profiles) {
        if (profile.name == name) {
            return &profile;
        }
    }
    return nullptr;
}

std::string AssistantConfiguration::selected_profile() const
{
    if (!provider.empty()) {
        return provider;
    }
    for (const auto& profile : profiles) {
        if (profile.is_default) {
            return profile.name;
        }
    }
    return {};
}

std::vector<std::string> AssistantConfiguration::visible_profiles() const
{
    std::vector<std::string> names;
    for (const auto& profile : profiles) {
        if (profile.visible) {
            names.push_back(profile.name);
        }
    }
    return names;
}

HostEnvironment AssistantConfiguration::host_environment(HostEnvironment detected) const
{
    detected.mode = transport.mode;
    detected.curl_executable = transport.curl_path;
    if (!transport.temp_dir.empty()) {
        detected.temp_dir = transport.temp_dir;
    }
    if (transport.verify_tls) {
        detected.verify_tls = *transport.verify_tls;
    }
    return detected;
}

ConfigurationLoadResult load_configuration_from_string(const std::string& text)
{
    ConfigurationLoadResult result;

    Json::Value root;
    std::string errors;
    if (!JsonSupport::parse(text, root, &errors)) {
        result.error_message = "Configuration is not valid JSON: " + errors;
        return result;
    }
    if (!root.isObject()) {
        result.error_message = "Configuration must be a JSON object";
        return result;
    }

    try {
        AssistantConfiguration configuration;
        configuration.provider = read_string(root, "provider", "configuration");
        configuration.transport = parse_transport(root["transport"]);

        const Json::Value& profiles = root["provider_settings"];
        if (!profiles.isNull() && !profiles.isObject()) {
            throw std::runtime_error("provider_settings must be an object");
        }
        if (profiles.isObject()) {
            for (const auto& name : profiles.getMemberNames()) {
                configuration.profiles.push_back(parse_profile(name, profiles[name]));
            }
        }

        result.configuration = std::move(configuration);
        result.success = true;
    } catch (const std::exception& e) {
        result.error_message = std::string("Invalid configuration: ") + e.what();
    }
    return result;
}

ConfigurationLoadResult load_configuration_from_file(const std::string& path)
{
    std::ifstream input(path);
    if (!input) {
        ConfigurationLoadResult result;
        result.error_message = "Cannot open configuration file " + path;
        return result;
    }

    std::ostringstream contents;
    contents << input.rdbuf();
    ConfigurationLoadResult result = load_configuration_from_string(contents.str());
    if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
        if (result.success) {
            logger->debug("Loaded configuration from {} ({} profiles)", path,
                          result.configuration.profiles.size());
        } else {
            logger->error("Failed to load configuration {}: {}", path, result.error_message);
        }
    }
    return result;
}
