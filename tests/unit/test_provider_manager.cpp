/*
 * Unit tests for the provider manager
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <catch2/catch_test_macros.hpp>
#include "ProviderManager.hpp"
#include "TestHelpers.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>

namespace {

AssistantConfiguration sample_configuration()
{
    auto loaded = load_configuration_from_string(R"({
        "provider_settings": {
            "deepseek": {
                "base_url": "https://api.deepseek.com/chat/completions",
                "api_key": "ds-key",
                "model": "deepseek-chat",
                "default": true
            },
            "anthropic": {
                "base_url": "https://api.anthropic.com/v1/messages",
                "api_key": "ant-key",
                "model": "claude-sonnet"
            },
            "unknownvendor": {
                "base_url": "https://example.com",
                "api_key": "k",
                "model": "m"
            },
            "hidden_openai": {
                "handler": "openai",
                "base_url": "https://api.openai.com/v1/chat/completions",
                "api_key": "sk",
                "model": "gpt",
                "visible": false
            }
        }
    })");
    if (!loaded.success) {
        throw std::runtime_error(loaded.error_message);
    }
    return loaded.configuration;
}

std::vector<ChatMessage> question()
{
    return {ChatMessage(MessageRole::User, "2+2?")};
}

} // namespace

// =============================================================================
// Profile selection
// =============================================================================

TEST_CASE("ProviderManager starts on the default profile") {
    ProviderManager manager(sample_configuration(), std::make_shared<FakeTransport>());

    REQUIRE(manager.active_profile() == "deepseek");
    REQUIRE(manager.transport()->name() == "fake");
}

TEST_CASE("ProviderManager hides invisible profiles") {
    ProviderManager manager(sample_configuration(), std::make_shared<FakeTransport>());

    auto visible = manager.visible_profiles();
    REQUIRE(std::find(visible.begin(), visible.end(), "hidden_openai") == visible.end());
    REQUIRE(std::find(visible.begin(), visible.end(), "anthropic") != visible.end());
}

TEST_CASE("ProviderManager switches between configured profiles") {
    ProviderManager manager(sample_configuration(), std::make_shared<FakeTransport>());

    REQUIRE(manager.set_active_profile("anthropic"));
    REQUIRE(manager.active_profile() == "anthropic");

    REQUIRE_FALSE(manager.set_active_profile("nonexistent"));
    REQUIRE(manager.active_profile() == "anthropic");
}

TEST_CASE("ProviderManager reuses one adapter per profile") {
    ProviderManager manager(sample_configuration(), std::make_shared<FakeTransport>());

    auto first = manager.provider_for("anthropic");
    auto second = manager.provider_for("anthropic");

    REQUIRE(first != nullptr);
    REQUIRE(first == second);
    REQUIRE(first->id() == "anthropic");
    REQUIRE(manager.provider_for("hidden_openai")->id() == "openai");
    REQUIRE(manager.provider_for("unknownvendor") == nullptr);
}

// =============================================================================
// Dispatch
// =============================================================================

TEST_CASE("ProviderManager routes queries to the active profile") {
    auto transport = std::make_shared<FakeTransport>();
    transport->push_json(200, R"({"choices":[{"message":{"content":"4"}}]})");
    ProviderManager manager(sample_configuration(), transport, fast_retries(0));

    auto result = manager.query(question());

    REQUIRE(result.success);
    REQUIRE(result.text == "4");
    REQUIRE(result.provider_id == "deepseek");
    REQUIRE(transport->last_request().url == "https://api.deepseek.com/chat/completions");
}

TEST_CASE("ProviderManager reports unknown profiles and handlers") {
    auto transport = std::make_shared<FakeTransport>();
    ProviderManager manager(sample_configuration(), transport);

    auto missing = manager.query("nonexistent", question());
    REQUIRE(missing.error_kind == ErrorKind::Configuration);
    REQUIRE(missing.error_message == "Unsupported provider nonexistent");

    auto unknown = manager.query("unknownvendor", question());
    REQUIRE(unknown.error_kind == ErrorKind::Configuration);
    REQUIRE(unknown.error_message == "Unsupported provider unknownvendor");

    REQUIRE(transport->calls() == 0);
}

TEST_CASE("ProviderManager without a selected profile") {
    auto configuration = sample_configuration();
    for (auto& profile : configuration.profiles) {
        profile.is_default = false;
    }
    ProviderManager manager(configuration, std::make_shared<FakeTransport>());

    auto result = manager.query(question());

    REQUIRE(result.error_kind == ErrorKind::Configuration);
    REQUIRE(result.error_message == "No provider specified in configuration");
}

TEST_CASE("ProviderManager dispatches background queries") {
    auto transport = std::make_shared<FakeTransport>();
    transport->push_json(200, R"({"content":[{"type":"text","text":"four"}]})");
    ProviderManager manager(sample_configuration(), transport, fast_retries(0));

    auto pending = manager.query_async("anthropic", question());
    auto result = pending->wait();

    REQUIRE(result.success);
    REQUIRE(result.text == "four");
    REQUIRE(result.provider_id == "anthropic");

    auto failed = manager.query_async("nonexistent", question());
    REQUIRE(failed->ready());
    REQUIRE(failed->wait().error_kind == ErrorKind::Configuration);
}
