/*
 * Cooperative cancellation shared between a caller and in-flight requests
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef CANCELLATION_TOKEN_HPP
#define CANCELLATION_TOKEN_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

/**
 * Copyable cancellation handle
 *
 * Copies share one flag. cancel() is idempotent and wakes every thread
 * blocked in wait_for(). A default-constructed token is never cancelled
 * unless cancel() is called on it or one of its copies.
 */
class CancellationToken {
public:
    CancellationToken();

    void cancel() const;
    bool is_cancelled() const;

    /**
     * Sleep up to timeout, returning early on cancellation
     * @return true if the token was cancelled
     */
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::condition_variable cv;
    };

    std::shared_ptr<State> state_;
};

#endif // CANCELLATION_TOKEN_HPP
