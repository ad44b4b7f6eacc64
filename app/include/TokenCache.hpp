/*
 * Bearer-token cache with single-flight refresh
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef TOKEN_CACHE_HPP
#define TOKEN_CACHE_HPP

#include "CancellationToken.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

/**
 * What a credential exchange produced
 *
 * expires_at is a raw epoch value (seconds or milliseconds); expires_in is
 * relative seconds. When both are absent the cache applies its default
 * lifetime.
 */
struct TokenExchangeResult {
    bool success{false};
    std::string access_token;
    std::optional<std::int64_t> expires_at;
    std::optional<std::int64_t> expires_in;
    std::string error_message;
    bool cancelled{false};                   // The exchange request was cancelled
};

struct TokenResult {
    bool success{false};
    std::string access_token;
    std::string error_message;
    bool cancelled{false};
};

enum class TokenState {
    NoToken,
    Exchanging,
    Valid,
    Expired,
};

const char* to_string(TokenState state);

/**
 * Parse a client-credentials exchange response body
 */
TokenExchangeResult parse_token_response(const std::string& body);

/**
 * Interpret a raw epoch expiry; values of 10^11 and above are milliseconds
 */
std::chrono::system_clock::time_point normalize_epoch(std::int64_t raw);

/**
 * Per-provider-instance token cache
 *
 * NoToken -> Exchanging -> Valid -> Expired -> Exchanging -> ...
 *
 * At most one exchange runs at a time. Callers arriving while an exchange
 * is in flight wait for it and share its result, success or failure. A
 * token is returned only while now < expires_at.
 *
 * The exchanging caller passes its cancellation token to the exchange
 * function. A waiting caller returns as soon as its own token is cancelled;
 * when the exchange it waited on was cancelled by someone else it starts a
 * new one.
 */
class TokenCache {
public:
    using ExchangeFn = std::function<TokenExchangeResult(const CancellationToken& cancel)>;
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static constexpr std::chrono::seconds kDefaultLifetime{30 * 60};

    explicit TokenCache(ExchangeFn exchange,
                        Clock clock = nullptr,
                        std::chrono::seconds default_lifetime = kDefaultLifetime);

    TokenCache(const TokenCache&) = delete;
    TokenCache& operator=(const TokenCache&) = delete;

    TokenResult get_token(const CancellationToken& cancel = {});

    /**
     * Forget the cached token; the next get_token() exchanges again
     */
    void invalidate();

    TokenState state() const;
    int exchange_count() const;
    std::optional<std::chrono::system_clock::time_point> expires_at() const;

private:
    class ExchangeGuard;

    std::chrono::system_clock::time_point now() const;
    TokenState state_locked() const;
    TokenResult complete_exchange(TokenExchangeResult exchanged);

    ExchangeFn exchange_;
    Clock clock_;
    std::chrono::seconds default_lifetime_;

    mutable std::mutex mutex_;
    std::condition_variable exchange_done_;
    bool exchanging_{false};
    std::uint64_t generation_{0};
    TokenResult last_exchange_;
    std::string access_token_;
    std::optional<std::chrono::system_clock::time_point> expires_at_;
    int exchange_count_{0};
};

#endif // TOKEN_CACHE_HPP
