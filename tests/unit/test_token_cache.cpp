/*
 * Unit tests for the bearer-token cache
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <catch2/catch_test_macros.hpp>
#include "CancellationToken.hpp"
#include "TokenCache.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

const auto kStart = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));

TokenExchangeResult token(const std::string& value, std::optional<std::int64_t> expires_in = std::nullopt)
{
    TokenExchangeResult result;
    result.success = true;
    result.access_token = value;
    result.expires_in = expires_in;
    return result;
}

} // namespace

// =============================================================================
// Exchange response parsing
// =============================================================================

TEST_CASE("parse_token_response reads access_token and expiry fields") {
    auto parsed = parse_token_response(R"({"access_token":"abc","expires_at":1700000600000})");

    REQUIRE(parsed.success);
    REQUIRE(parsed.access_token == "abc");
    REQUIRE(parsed.expires_at == 1700000600000LL);
    REQUIRE_FALSE(parsed.expires_in.has_value());
}

TEST_CASE("parse_token_response reports missing tokens and invalid JSON") {
    auto missing = parse_token_response(R"({"expires_in":60})");
    REQUIRE_FALSE(missing.success);
    REQUIRE(missing.error_message == "Auth response missing access_token");

    auto invalid = parse_token_response("<html>bad gateway</html>");
    REQUIRE_FALSE(invalid.success);
    REQUIRE(invalid.error_message.find("Failed to parse auth response") == 0);
}

TEST_CASE("normalize_epoch accepts seconds and milliseconds") {
    const auto from_seconds = normalize_epoch(1700000600);
    const auto from_millis = normalize_epoch(1700000600000LL);

    REQUIRE(from_seconds == from_millis);
    REQUIRE(from_seconds == kStart + 600s);
}

// =============================================================================
// State machine
// =============================================================================

TEST_CASE("TokenCache exchanges once and then serves the cached token") {
    int exchanges = 0;
    auto current = kStart;
    TokenCache cache([&](const CancellationToken&) { ++exchanges; return token("tok-1", 600); }, [&] { return current; });

    REQUIRE(cache.state() == TokenState::NoToken);

    auto first = cache.get_token();
    auto second = cache.get_token();

    REQUIRE(first.success);
    REQUIRE(first.access_token == "tok-1");
    REQUIRE(second.access_token == "tok-1");
    REQUIRE(exchanges == 1);
    REQUIRE(cache.state() == TokenState::Valid);
}

TEST_CASE("TokenCache never returns an expired token") {
    int exchanges = 0;
    auto current = kStart;
    TokenCache cache([&](const CancellationToken&) {
        ++exchanges;
        return token("tok-" + std::to_string(exchanges), 60);
    }, [&] { return current; });

    REQUIRE(cache.get_token().access_token == "tok-1");

    current += 60s;
    REQUIRE(cache.state() == TokenState::Expired);

    auto refreshed = cache.get_token();
    REQUIRE(refreshed.access_token == "tok-2");
    REQUIRE(cache.exchange_count() == 2);
}

TEST_CASE("TokenCache normalizes millisecond expires_at values") {
    auto current = kStart;
    TokenCache cache([](const CancellationToken&) {
        TokenExchangeResult result = token("ms-token");
        result.expires_at = 1700000600000LL;
        return result;
    }, [&] { return current; });

    REQUIRE(cache.get_token().success);
    REQUIRE(cache.expires_at() == kStart + 600s);

    current += 599s;
    REQUIRE(cache.state() == TokenState::Valid);
    current += 1s;
    REQUIRE(cache.state() == TokenState::Expired);
}

TEST_CASE("TokenCache applies the default lifetime when no expiry is given") {
    auto current = kStart;
    TokenCache cache([](const CancellationToken&) { return token("no-expiry"); }, [&] { return current; });

    REQUIRE(cache.get_token().success);
    REQUIRE(cache.expires_at() == kStart + TokenCache::kDefaultLifetime);
}

TEST_CASE("TokenCache rejects a token that is already expired") {
    auto current = kStart;
    TokenCache cache([](const CancellationToken&) {
        TokenExchangeResult result = token("stale");
        result.expires_at = 1600000000;
        return result;
    }, [&] { return current; });

    auto result = cache.get_token();

    REQUIRE_FALSE(result.success);
    REQUIRE(cache.state() == TokenState::NoToken);
}

TEST_CASE("TokenCache propagates exchange failures and retries on the next call") {
    int exchanges = 0;
    TokenCache cache([&](const CancellationToken&) -> TokenExchangeResult {
        ++exchanges;
        if (exchanges == 1) {
            TokenExchangeResult failure;
            failure.error_message = "Auth request failed (HTTP 401)";
            return failure;
        }
        return token("second-try", 600);
    });

    auto failed = cache.get_token();
    REQUIRE_FALSE(failed.success);
    REQUIRE(failed.error_message == "Auth request failed (HTTP 401)");
    REQUIRE(cache.state() == TokenState::NoToken);

    auto recovered = cache.get_token();
    REQUIRE(recovered.success);
    REQUIRE(recovered.access_token == "second-try");
}

TEST_CASE("TokenCache converts a throwing exchange into an error") {
    TokenCache cache([](const CancellationToken&) -> TokenExchangeResult { throw std::runtime_error("socket closed"); });

    auto result = cache.get_token();

    REQUIRE_FALSE(result.success);
    REQUIRE(result.error_message == "socket closed");
}

TEST_CASE("TokenCache releases the exchange slot when the exchange throws a non-standard exception") {
    int exchanges = 0;
    TokenCache cache([&](const CancellationToken&) -> TokenExchangeResult {
        ++exchanges;
        if (exchanges == 1) {
            throw 42;
        }
        return token("after-throw", 600);
    });

    REQUIRE_THROWS(cache.get_token());
    REQUIRE(cache.state() == TokenState::NoToken);

    auto result = std::async(std::launch::async, [&cache] { return cache.get_token(); });
    REQUIRE(result.wait_for(2s) == std::future_status::ready);
    auto recovered = result.get();
    REQUIRE(recovered.success);
    REQUIRE(recovered.access_token == "after-throw");
}

TEST_CASE("TokenCache does not exchange when the caller is already cancelled") {
    int exchanges = 0;
    TokenCache cache([&](const CancellationToken&) { ++exchanges; return token("tok", 600); });

    CancellationToken cancel;
    cancel.cancel();
    auto result = cache.get_token(cancel);

    REQUIRE_FALSE(result.success);
    REQUIRE(result.cancelled);
    REQUIRE(exchanges == 0);
    REQUIRE(cache.state() == TokenState::NoToken);
}

TEST_CASE("TokenCache reports a cancelled exchange and retries on the next call") {
    int exchanges = 0;
    TokenCache cache([&](const CancellationToken&) -> TokenExchangeResult {
        ++exchanges;
        if (exchanges == 1) {
            TokenExchangeResult aborted;
            aborted.cancelled = true;
            aborted.error_message = "Request cancelled";
            return aborted;
        }
        return token("second", 600);
    });

    auto aborted = cache.get_token();
    REQUIRE_FALSE(aborted.success);
    REQUIRE(aborted.cancelled);
    REQUIRE(cache.state() == TokenState::NoToken);

    auto retried = cache.get_token();
    REQUIRE(retried.success);
    REQUIRE(retried.access_token == "second");
}

TEST_CASE("TokenCache invalidate forces a new exchange") {
    int exchanges = 0;
    TokenCache cache([&](const CancellationToken&) { ++exchanges; return token("tok", 600); });

    cache.get_token();
    cache.invalidate();
    REQUIRE(cache.state() == TokenState::NoToken);
    cache.get_token();

    REQUIRE(exchanges == 2);
}

// =============================================================================
// Concurrency
// =============================================================================

TEST_CASE("Concurrent get_token calls share a single exchange") {
    std::atomic<int> exchanges{0};
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();

    TokenCache cache([&](const CancellationToken&) {
        ++exchanges;
        released.wait();
        return token("shared-token", 600);
    });

    std::vector<std::future<TokenResult>> callers;
    for (int i = 0; i < 8; ++i) {
        callers.push_back(std::async(std::launch::async, [&cache] { return cache.get_token(); }));
    }

    std::this_thread::sleep_for(100ms);
    REQUIRE(cache.state() == TokenState::Exchanging);
    release.set_value();

    for (auto& caller : callers) {
        auto result = caller.get();
        REQUIRE(result.success);
        REQUIRE(result.access_token == "shared-token");
    }
    REQUIRE(exchanges.load() == 1);
    REQUIRE(cache.exchange_count() == 1);
}

TEST_CASE("A waiting caller returns on its own cancellation") {
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();

    TokenCache cache([&](const CancellationToken&) {
        released.wait();
        return token("slow-token", 600);
    });

    auto owner = std::async(std::launch::async, [&cache] { return cache.get_token(); });
    std::this_thread::sleep_for(50ms);
    REQUIRE(cache.state() == TokenState::Exchanging);

    CancellationToken cancel;
    auto waiter = std::async(std::launch::async, [&cache, cancel] { return cache.get_token(cancel); });
    std::this_thread::sleep_for(50ms);
    cancel.cancel();

    REQUIRE(waiter.wait_for(2s) == std::future_status::ready);
    auto abandoned = waiter.get();
    REQUIRE_FALSE(abandoned.success);
    REQUIRE(abandoned.cancelled);

    release.set_value();
    REQUIRE(owner.get().access_token == "slow-token");
}

TEST_CASE("A waiter starts its own exchange when the shared one is cancelled") {
    std::atomic<int> exchanges{0};
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();

    TokenCache cache([&](const CancellationToken& cancel) -> TokenExchangeResult {
        const int attempt = ++exchanges;
        if (attempt == 1) {
            released.wait();
            TokenExchangeResult aborted;
            aborted.cancelled = cancel.is_cancelled();
            aborted.error_message = "Request cancelled";
            return aborted;
        }
        return token("fresh-token", 600);
    });

    CancellationToken owner_cancel;
    auto owner = std::async(std::launch::async, [&cache, owner_cancel] { return cache.get_token(owner_cancel); });
    std::this_thread::sleep_for(50ms);

    auto waiter = std::async(std::launch::async, [&cache] { return cache.get_token(); });
    std::this_thread::sleep_for(50ms);

    owner_cancel.cancel();
    release.set_value();

    REQUIRE(owner.get().cancelled);
    auto result = waiter.get();
    REQUIRE(result.success);
    REQUIRE(result.access_token == "fresh-token");
    REQUIRE(exchanges.load() == 2);
}
