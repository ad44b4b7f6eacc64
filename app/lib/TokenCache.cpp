/*
 * Token cache implementation
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "TokenCache.hpp"
#include "JsonSupport.hpp"
#include "Logger.hpp"

namespace {

constexpr std::int64_t kMillisecondThreshold = 100000000000LL;
constexpr std::chrono::milliseconds kWaitSlice{20};

TokenResult cancelled_result()
{
    return TokenResult{false, {}, "Request cancelled", true};
}

std::optional<std::int64_t> integral_member(const Json::Value& root, const char* key)
{
    if (!root.isMember(key)) {
        return std::nullopt;
    }
    const Json::Value& value = root[key];
    if (value.isIntegral()) {
        return value.asInt64();
    }
    if (value.isDouble()) {
        return static_cast<std::int64_t>(value.asDouble());
    }
    if (value.isString()) {
        try {
            return std::stoll(value.asString());
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

} // namespace

/**
 * Settles the in-flight exchange when the exchange function leaves by an
 * exception that is not a std::exception, so waiters are released
 */
class TokenCache::ExchangeGuard {
public:
    explicit ExchangeGuard(TokenCache& cache) : cache_(cache) {}

    ~ExchangeGuard()
    {
        if (!released_) {
            TokenExchangeResult abandoned;
            abandoned.error_message = "Credential exchange failed";
            cache_.complete_exchange(std::move(abandoned));
        }
    }

    ExchangeGuard(const ExchangeGuard&) = delete;
    ExchangeGuard& operator=(const ExchangeGuard&) = delete;

    void release() { released_ = true; }

private:
    TokenCache& cache_;
    bool released_{false};
};

const char* to_string(TokenState state)
{
    switch (state) {
        case TokenState::NoToken: return "no-token";
        case TokenState::Exchanging: return "exchanging";
        case TokenState::Valid: return "valid";
        case TokenState::Expired: return "expired";
    }
    return "unknown";
}

std::chrono::system_clock::time_point normalize_epoch(std::int64_t raw)
{
    if (raw >= kMillisecondThreshold) {
        return std::chrono::system_clock::time_point(std::chrono::milliseconds(raw));
    }
    return std::chrono::system_clock::time_point(std::chrono::seconds(raw));
}

TokenExchangeResult parse_token_response(const std::string& body)
{
    TokenExchangeResult result;

    Json::Value root;
    std::string errors;
    if (!JsonSupport::parse(body, root, &errors) || !root.isObject()) {
        result.error_message = "Failed to parse auth response: " + body;
        return result;
    }

    result.access_token = JsonSupport::string_member(root, "access_token");
    if (result.access_token.empty()) {
        result.error_message = "Auth response missing access_token";
        return result;
    }

    result.expires_at = integral_member(root, "expires_at");
    result.expires_in = integral_member(root, "expires_in");
    result.success = true;
    return result;
}

TokenCache::TokenCache(ExchangeFn exchange, Clock clock, std::chrono::seconds default_lifetime)
    : exchange_(std::move(exchange))
    , clock_(std::move(clock))
    , default_lifetime_(default_lifetime)
{}

std::chrono::system_clock::time_point TokenCache::now() const
{
    return clock_ ? clock_() : std::chrono::system_clock::now();
}

TokenState TokenCache::state_locked() const
{
    if (exchanging_) {
        return TokenState::Exchanging;
    }
    if (access_token_.empty() || !expires_at_) {
        return TokenState::NoToken;
    }
    return now() < *expires_at_ ? TokenState::Valid : TokenState::Expired;
}

TokenState TokenCache::state() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_locked();
}

int TokenCache::exchange_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return exchange_count_;
}

std::optional<std::chrono::system_clock::time_point> TokenCache::expires_at() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return expires_at_;
}

void TokenCache::invalidate()
{
    std::lock_guard<std::mutex> lock(mutex_);
    access_token_.clear();
    expires_at_.reset();
}

TokenResult TokenCache::get_token(const CancellationToken& cancel)
{
    std::unique_lock<std::mutex> lock(mutex_);

    for (;;) {
        if (cancel.is_cancelled()) {
            return cancelled_result();
        }
        if (state_locked() == TokenState::Valid) {
            return TokenResult{true, access_token_, {}, false};
        }
        if (!exchanging_) {
            break;
        }

        const std::uint64_t awaited = generation_;
        while (generation_ == awaited) {
            if (cancel.is_cancelled()) {
                return cancelled_result();
            }
            exchange_done_.wait_for(lock, kWaitSlice);
        }
        // The exchange we waited on was cancelled by its owner; start our own
        if (!last_exchange_.cancelled) {
            return last_exchange_;
        }
    }

    if (!exchange_) {
        return TokenResult{false, {}, "No credential exchange configured", false};
    }

    exchanging_ = true;
    ++exchange_count_;
    lock.unlock();

    ExchangeGuard guard(*this);
    TokenExchangeResult exchanged;
    try {
        exchanged = exchange_(cancel);
    } catch (const std::exception& ex) {
        exchanged = TokenExchangeResult{};
        exchanged.error_message = ex.what();
    }
    guard.release();
    return complete_exchange(std::move(exchanged));
}

TokenResult TokenCache::complete_exchange(TokenExchangeResult exchanged)
{
    std::unique_lock<std::mutex> lock(mutex_);
    TokenResult result;
    const auto issued = now();
    std::chrono::system_clock::time_point expiry = issued + default_lifetime_;
    if (exchanged.success && exchanged.expires_at) {
        expiry = normalize_epoch(*exchanged.expires_at);
    } else if (exchanged.success && exchanged.expires_in) {
        expiry = issued + std::chrono::seconds(*exchanged.expires_in);
    }
    if (exchanged.success && expiry <= issued) {
        exchanged.success = false;
        exchanged.error_message = "Auth response carried an already expired token";
    }

    if (exchanged.success && !exchanged.access_token.empty()) {
        access_token_ = exchanged.access_token;
        expires_at_ = expiry;
        result = TokenResult{true, access_token_, {}, false};

        if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
            logger->debug("TokenCache obtained token valid for {}s",
                          std::chrono::duration_cast<std::chrono::seconds>(expiry - issued).count());
        }
    } else if (exchanged.cancelled) {
        access_token_.clear();
        expires_at_.reset();
        result = cancelled_result();
        if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
            logger->debug("TokenCache exchange cancelled");
        }
    } else {
        access_token_.clear();
        expires_at_.reset();
        result = TokenResult{false, {},
                             exchanged.error_message.empty() ? "Credential exchange failed"
                                                             : exchanged.error_message,
                             false};
        if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
            logger->warn("TokenCache exchange failed: {}", result.error_message);
        }
    }

    exchanging_ = false;
    last_exchange_ = result;
    ++generation_;
    lock.unlock();
    exchange_done_.notify_all();
    return result;
}
